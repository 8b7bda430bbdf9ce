/**
 * @file ImageTypes.hpp
 * Plain value types shared by the pixel pipeline and the orchestrator.
 */
#pragma once
#include <vector>

namespace alphapunch {

// Encoded image bytes (PNG, JPEG, WebP, ...) exactly as read or produced.
using Bytes = std::vector<unsigned char>;

struct Dimensions
{
    int width {0};
    int height {0};

    Dimensions() = default;
    Dimensions(int w, int h) : width(w), height(h) {}

    bool operator==(const Dimensions& o) const { return width == o.width && height == o.height; }
    bool operator!=(const Dimensions& o) const { return !(*this == o); }
};

}
