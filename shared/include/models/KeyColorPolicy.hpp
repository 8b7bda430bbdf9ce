/**
 * @file KeyColorPolicy.hpp
 * Thresholds deciding which pixels count as the flat green key color.
 */
#pragma once

namespace alphapunch {

struct KeyColorPolicy
{
    int minGreenValue {40};    // green must exceed this
    int dominanceMargin {10};  // green must beat red and blue by more than this

    KeyColorPolicy() = default;
    KeyColorPolicy(int minGreen, int margin) : minGreenValue(minGreen), dominanceMargin(margin) {}
};

}
