#include "util/ImageOps.hpp"
#include "util/Errors.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>

namespace alphapunch {
namespace util {

namespace {

    bool startsWith(const Bytes& d, std::size_t offset, const char* magic)
    {
        std::size_t n = std::strlen(magic);
        if (d.size() < offset + n) return false;
        return std::memcmp(d.data() + offset, magic, n) == 0;
    }

    // Bring any decoded depth down to 8 bits per channel.
    cv::Mat to8Bit(const cv::Mat& img)
    {
        if (img.depth() == CV_8U) return img;
        cv::Mat out;
        switch (img.depth())
        {
        case CV_16U: img.convertTo(out, CV_8U, 1.0 / 257.0); break;
        case CV_32F:
        case CV_64F: img.convertTo(out, CV_8U, 255.0); break;
        default: img.convertTo(out, CV_8U); break;
        }
        return out;
    }

    // IMREAD_UNCHANGED keeps alpha but skips EXIF orientation; kOriented applies it.
    const int kOriented = cv::IMREAD_ANYCOLOR | cv::IMREAD_ANYDEPTH;

    cv::Mat imdecodeBytes(const Bytes& data, int flags)
    {
        return cv::imdecode(cv::Mat(1, static_cast<int>(data.size()), CV_8U, const_cast<unsigned char*>(data.data())),
                            flags);
    }

}

cv::Mat decodeRgba(const Bytes& data)
{
    if (data.empty()) throw DecodeError("Image data is empty");

    cv::Mat img;
    try
    {
        img = imdecodeBytes(data, cv::IMREAD_UNCHANGED);
        // Without alpha there is nothing to lose, so decode again upright.
        if (!img.empty() && img.channels() != 4) img = imdecodeBytes(data, kOriented);
    }
    catch (const cv::Exception& e)
    {
        throw DecodeError(std::string("Failed to decode image: ") + e.what());
    }
    if (img.empty() || img.cols <= 0 || img.rows <= 0) throw DecodeError("Failed to decode image");

    img = to8Bit(img);
    cv::Mat rgba;
    switch (img.channels())
    {
    case 1: cv::cvtColor(img, rgba, cv::COLOR_GRAY2RGBA); break;
    case 3: cv::cvtColor(img, rgba, cv::COLOR_BGR2RGBA); break;
    case 4: cv::cvtColor(img, rgba, cv::COLOR_BGRA2RGBA); break;
    default: throw DecodeError("Unsupported channel count: " + std::to_string(img.channels()));
    }
    return rgba;
}

Bytes encodePng(const cv::Mat& rgba)
{
    if (rgba.empty() || rgba.type() != CV_8UC4) throw EncodeError("PNG encoder expects a non-empty RGBA buffer");

    Bytes out;
    try
    {
        cv::Mat bgra; cv::cvtColor(rgba, bgra, cv::COLOR_RGBA2BGRA);
        if (!cv::imencode(".png", bgra, out)) throw EncodeError("PNG encoder rejected the image");
    }
    catch (const cv::Exception& e)
    {
        throw EncodeError(std::string("Failed to encode PNG: ") + e.what());
    }
    if (out.empty()) throw EncodeError("PNG encoder produced no data");
    return out;
}

std::optional<Dimensions> probeSize(const Bytes& data)
{
    if (data.empty()) return std::nullopt;
    cv::Mat img;
    try
    {
        img = imdecodeBytes(data, kOriented);
    }
    catch (const cv::Exception& e)
    {
        std::cerr << "[probeSize] " << e.what() << "\n";
        return std::nullopt;
    }
    if (img.empty()) return std::nullopt;
    return Dimensions(img.cols, img.rows);
}

std::string sniffMimeType(const Bytes& data)
{
    if (startsWith(data, 0, "\x89PNG\r\n\x1a\n")) return "image/png";
    if (data.size() >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF) return "image/jpeg";
    if (startsWith(data, 0, "RIFF") && startsWith(data, 8, "WEBP")) return "image/webp";
    if (startsWith(data, 0, "GIF87a") || startsWith(data, 0, "GIF89a")) return "image/gif";
    if (startsWith(data, 0, "BM")) return "image/bmp";
    if (startsWith(data, 0, "II*") || (startsWith(data, 0, "MM") && data.size() >= 4 && data[2] == 0 && data[3] == '*'))
        return "image/tiff";
    return "application/octet-stream";
}

std::string extensionForMime(const std::string& mimeType)
{
    if (mimeType == "image/jpeg") return ".jpg";
    if (mimeType == "image/webp") return ".webp";
    if (mimeType == "image/gif") return ".gif";
    if (mimeType == "image/bmp") return ".bmp";
    if (mimeType == "image/tiff") return ".tif";
    return ".png";
}

Bytes makeThumbnail(const Bytes& png, int maxSide)
{
    if (maxSide <= 0) return png;
    cv::Mat rgba;
    try
    {
        rgba = decodeRgba(png);
    }
    catch (const DecodeError& e)
    {
        std::cerr << "[makeThumbnail] " << e.what() << ", keeping full image\n";
        return png;
    }
    int longest = std::max(rgba.cols, rgba.rows);
    if (longest <= maxSide) return png;

    double scale = static_cast<double>(maxSide) / longest;
    int w = std::max(1, static_cast<int>(rgba.cols * scale + 0.5));
    int h = std::max(1, static_cast<int>(rgba.rows * scale + 0.5));
    try
    {
        cv::Mat small; cv::resize(rgba, small, cv::Size(w, h), 0, 0, cv::INTER_AREA);
        return encodePng(small);
    }
    catch (const cv::Exception& e)
    {
        std::cerr << "[makeThumbnail] " << e.what() << ", keeping full image\n";
        return png;
    }
    catch (const EncodeError& e)
    {
        std::cerr << "[makeThumbnail] " << e.what() << ", keeping full image\n";
        return png;
    }
}

Bytes readFile(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) return Bytes();
    return Bytes(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

bool writeFile(const std::string& path, const Bytes& data)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) return false;
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return static_cast<bool>(out);
}

bool debugEnabled()
{
    static const bool enabled = []
    {
        const char* v = std::getenv("ALPHAPUNCH_DEBUG");
        return v != nullptr && *v != '\0';
    }();
    return enabled;
}

}
}
