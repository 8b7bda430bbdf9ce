/*========================  chroma_key.hpp  ========================

   Green-screen to alpha on a decoded RGBA buffer.
   --------------------------------------------------------------------
   • a pixel is key when green dominates red AND blue by more than the
     margin, and green itself exceeds the floor
   • key pixels get alpha 0, their RGB is left untouched
   • everything else is left byte-identical

=====================================================================*/
#pragma once
#include <cstddef>
#include "models/KeyColorPolicy.hpp"

namespace cv { class Mat; }

namespace alphapunch {

// True if (r,g,b) is the key color under @p policy.
inline bool isKeyColor(int r, int g, int b, const KeyColorPolicy& policy)
{
    return g > r + policy.dominanceMargin &&
           g > b + policy.dominanceMargin &&
           g > policy.minGreenValue;
}

/**
 * @brief Zeroes alpha on every key-colored pixel, in place.
 *
 * @param rgba   CV_8UC4 buffer in R,G,B,A order. Throws DecodeError otherwise.
 * @param policy Classification thresholds.
 * @return Number of pixels classified as key.
 */
std::size_t extractChromaKey(cv::Mat& rgba, const KeyColorPolicy& policy = KeyColorPolicy());

// Same as extractChromaKey but leaves @p rgba alone and returns the result.
cv::Mat applyChromaKey(const cv::Mat& rgba, const KeyColorPolicy& policy = KeyColorPolicy());

}
