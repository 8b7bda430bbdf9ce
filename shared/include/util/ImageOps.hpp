#pragma once
#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include "models/ImageTypes.hpp"

namespace alphapunch {
namespace util {

// Decode any format OpenCV reads into an 8-bit RGBA buffer (CV_8UC4, R,G,B,A order).
// Images without alpha come out upright per their EXIF orientation.
// Throws DecodeError on empty or malformed input.
cv::Mat decodeRgba(const Bytes& data);

// Encode an RGBA buffer as PNG. Throws EncodeError.
Bytes encodePng(const cv::Mat& rgba);

// Displayed size of an encoded image (EXIF orientation applied), or nullopt
// if it cannot be decoded.
std::optional<Dimensions> probeSize(const Bytes& data);

// MIME type guessed from magic bytes; "application/octet-stream" when unknown.
std::string sniffMimeType(const Bytes& data);

// File extension (with dot) matching a MIME type, ".png" when unknown.
std::string extensionForMime(const std::string& mimeType);

// Downsize a PNG so its longer side is at most maxSide. Returns the input
// unchanged when it already fits or cannot be decoded.
Bytes makeThumbnail(const Bytes& png, int maxSide);

// Whole-file helpers. readFile returns an empty buffer on failure.
Bytes readFile(const std::string& path);
bool writeFile(const std::string& path, const Bytes& data);

// True when ALPHAPUNCH_DEBUG is set to a non-empty value.
bool debugEnabled();

}
}
