/**
 * @file AnalysisService.hpp
 * Seam to the best-effort scene description call.
 */
#pragma once
#include <string>
#include "models/ImageTypes.hpp"

namespace alphapunch {

class AnalysisService
{
public:
    virtual ~AnalysisService() = default;

    // Short description of the scene. May throw; callers log and ignore.
    virtual std::string analyze(const Bytes& image, const std::string& mimeType) = 0;
};

}
