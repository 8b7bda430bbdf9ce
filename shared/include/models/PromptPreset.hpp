/**
 * @file PromptPreset.hpp
 * Built-in edit prompts. Each asks the model to paint the regions that
 * should become transparent with pure #00FF00.
 */
#pragma once
#include <string>
#include <vector>

namespace alphapunch {

struct PromptPreset
{
    std::string id;
    std::string label;
    std::string description;
    std::string text;
};

// Presets in display order; the first one is the default.
const std::vector<PromptPreset>& builtinPresets();

// nullptr if no preset has this id.
const PromptPreset* findPreset(const std::string& id);

}
