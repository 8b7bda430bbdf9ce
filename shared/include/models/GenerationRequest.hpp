#pragma once
#include <string>
#include "models/ImageTypes.hpp"

namespace alphapunch {

// One submitted edit. Copied into the worker task and never modified.
struct GenerationRequest
{
    Bytes image;
    std::string mimeType {"image/png"};
    std::string prompt;
    bool highQuality {false};
};

}
