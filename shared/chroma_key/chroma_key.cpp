#include "chroma_key.hpp"
#include "util/Errors.hpp"

#include <opencv2/core.hpp>
#include <string>

namespace alphapunch {

std::size_t extractChromaKey(cv::Mat& rgba, const KeyColorPolicy& policy)
{
    if (rgba.type() != CV_8UC4)
        throw DecodeError("Chroma key expects an 8-bit RGBA buffer, got type " + std::to_string(rgba.type()));

    std::size_t keyed = 0;
    for (int y = 0; y < rgba.rows; ++y)
    {
        cv::Vec4b* row = rgba.ptr<cv::Vec4b>(y);
        for (int x = 0; x < rgba.cols; ++x)
        {
            cv::Vec4b& px = row[x];
            if (isKeyColor(px[0], px[1], px[2], policy))
            {
                px[3] = 0;
                ++keyed;
            }
        }
    }
    return keyed;
}

cv::Mat applyChromaKey(const cv::Mat& rgba, const KeyColorPolicy& policy)
{
    cv::Mat out = rgba.clone();
    extractChromaKey(out, policy);
    return out;
}

}
