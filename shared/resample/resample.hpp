#pragma once
#include <optional>
#include "models/ImageTypes.hpp"

namespace cv { class Mat; }

namespace alphapunch {

/**
 * @brief Scales an RGBA buffer to @p target and encodes it as PNG.
 *
 * No scaling happens when @p target is absent or already matches the buffer.
 * All four channels are interpolated the same way, so soft alpha edges stay soft.
 *
 * @throws DecodeError if the buffer is empty or a dimension is zero.
 * @throws EncodeError if PNG encoding fails.
 */
Bytes resampleToPng(const cv::Mat& rgba, const std::optional<Dimensions>& target);

// Scaling step of resampleToPng without the encode.
cv::Mat resampleRgba(const cv::Mat& rgba, const std::optional<Dimensions>& target);

}
