/**
 * @file AppStatus.hpp
 * Phases of the generation workflow. Exactly one is active at a time.
 */
#pragma once

namespace alphapunch {

enum class AppStatus
{
    Idle = 0,
    Processing = 1,
    Success = 2,
    Error = 3,
};

inline const char* toString(AppStatus s)
{
    switch (s)
    {
    case AppStatus::Idle: return "Idle";
    case AppStatus::Processing: return "Processing";
    case AppStatus::Success: return "Success";
    case AppStatus::Error: return "Error";
    }
    return "Unknown";
}

}
