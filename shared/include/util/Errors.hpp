/**
 * @file Errors.hpp
 * Failure kinds of the edit -> extract -> resample chain.
 * what() is shown to the user as-is, so keep messages readable.
 */
#pragma once
#include <stdexcept>
#include <string>

namespace alphapunch {

class PipelineError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Malformed or empty input buffer.
class DecodeError : public PipelineError
{
public:
    using PipelineError::PipelineError;
};

// Buffer could not be serialized.
class EncodeError : public PipelineError
{
public:
    using PipelineError::PipelineError;
};

// External edit call failed or returned unusable data.
class EditServiceError : public PipelineError
{
public:
    using PipelineError::PipelineError;
};

// Scene analysis failed. Logged and dropped, never shown as an error state.
class AnalysisServiceError : public PipelineError
{
public:
    using PipelineError::PipelineError;
};

}
