/**
 * @file ApplicationState.hpp
 * Everything a front end needs to render the current workflow.
 * Owned by GenerationOrchestrator; callers only ever see copies.
 */
#pragma once
#include <optional>
#include <string>
#include "models/AppStatus.hpp"
#include "models/ImageTypes.hpp"

namespace alphapunch {

struct SourceImage
{
    Bytes data;
    std::string mimeType {"image/png"};
    std::optional<Dimensions> dims; // displayed size, absent if it could not be read
};

struct ApplicationState
{
    AppStatus status {AppStatus::Idle};
    std::optional<SourceImage> source;
    std::optional<Bytes> generated;
    std::optional<std::string> error;
    std::optional<std::string> analysis;
};

}
