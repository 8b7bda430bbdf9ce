/**
 * @file OrchestratorSettings.hpp
 * Run-wide configuration for GenerationOrchestrator.
 */
#pragma once
#include <cstddef>
#include "models/KeyColorPolicy.hpp"

namespace alphapunch {

struct OrchestratorSettings
{
    KeyColorPolicy policy;
    std::size_t historyCapacity {10};
    int thumbnailMaxSide {0}; // 0 = thumbnail is the generated image itself
    bool matchSourceSize {true}; // resize results back to the source's native size

    OrchestratorSettings() = default;
    explicit OrchestratorSettings(const KeyColorPolicy& p) : policy(p) {}
    OrchestratorSettings(const KeyColorPolicy& p, std::size_t capacity, int thumbSide = 0)
        : policy(p), historyCapacity(capacity), thumbnailMaxSide(thumbSide) {}
};

}
