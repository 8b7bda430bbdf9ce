#include "models/PromptPreset.hpp"

#include <algorithm>

namespace alphapunch {

const std::vector<PromptPreset>& builtinPresets()
{
    static const std::vector<PromptPreset> presets = {
        {
            "window-punch",
            "Punched Windows",
            "Make window views transparent.",
            "Edit this image: Locate all window glass. Replace ONLY the view seen through the windows "
            "with solid pure green #00FF00. Do not change the window frames, curtains, or any interior items.",
        },
        {
            "remove-bg",
            "Punched Background",
            "Transparent background around subject.",
            "Edit this image: Identify the main subject in the foreground. Replace the entire background "
            "behind them with solid pure green #00FF00. Keep the subject exactly as they are.",
        },
    };
    return presets;
}

const PromptPreset* findPreset(const std::string& id)
{
    const auto& presets = builtinPresets();
    auto it = std::find_if(presets.begin(), presets.end(), [&id](const PromptPreset& p) { return p.id == id; });
    return it == presets.end() ? nullptr : &*it;
}

}
