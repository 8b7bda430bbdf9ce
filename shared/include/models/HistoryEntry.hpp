/**
 * @file HistoryEntry.hpp
 * Record of one completed generation kept for quick recall.
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "models/ImageTypes.hpp"

namespace alphapunch {

struct HistoryEntry
{
    std::string id;
    std::int64_t timestamp {0};     // ms since epoch
    Bytes original;
    std::string originalMimeType {"image/png"};
    std::optional<Dimensions> originalDims; // resize target when regenerating from this entry
    Bytes generated;                // post-processed PNG with alpha
    std::string promptUsed;
    Bytes thumbnail;                // equals generated unless thumbnails are enabled
};

}
