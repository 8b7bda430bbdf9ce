#include "resample.hpp"
#include "util/Errors.hpp"
#include "util/ImageOps.hpp"

#include <opencv2/imgproc.hpp>
#include <iostream>
#include <string>

namespace alphapunch {

namespace {

    bool needsResize(const cv::Mat& rgba, const std::optional<Dimensions>& target)
    {
        return target && (target->width != rgba.cols || target->height != rgba.rows);
    }

}

cv::Mat resampleRgba(const cv::Mat& rgba, const std::optional<Dimensions>& target)
{
    if (rgba.empty() || rgba.cols <= 0 || rgba.rows <= 0) throw DecodeError("Cannot resample an empty image");
    if (!needsResize(rgba, target)) return rgba;
    if (target->width <= 0 || target->height <= 0)
        throw DecodeError("Invalid target size " + std::to_string(target->width) + "x" + std::to_string(target->height));

    // Area averaging when shrinking, bilinear when enlarging.
    bool shrinking = target->width < rgba.cols && target->height < rgba.rows;
    int interp = shrinking ? cv::INTER_AREA : cv::INTER_LINEAR;

    cv::Mat out;
    try
    {
        cv::resize(rgba, out, cv::Size(target->width, target->height), 0, 0, interp);
    }
    catch (const cv::Exception& e)
    {
        throw DecodeError(std::string("Failed to resize image: ") + e.what());
    }
    if (util::debugEnabled())
        std::cout << "[resample] " << rgba.cols << "x" << rgba.rows << " -> " << out.cols << "x" << out.rows << std::endl;
    return out;
}

Bytes resampleToPng(const cv::Mat& rgba, const std::optional<Dimensions>& target)
{
    return util::encodePng(resampleRgba(rgba, target));
}

}
