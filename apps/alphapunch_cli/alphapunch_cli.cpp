// Command-line front end: punch the key color out of an edited image.
// Build via CMake target: alphapunch_cli

#include "GenerationOrchestrator.hpp"
#include "models/PromptPreset.hpp"
#include "script_services.hpp"
#include "util/ArgParse.hpp"
#include "util/ImageOps.hpp"

#include <climits>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace alphapunch;

// Reads the value after a numeric flag, reporting why it was rejected.
static bool readInt(const std::string& flag, const char* text, int lo, int hi, int& out)
{
    switch (util::parseIntArg(text, lo, hi, out))
    {
    case util::IntArgError::None: return true;
    case util::IntArgError::NotANumber:
        std::cerr << "Bad number for " << flag << ": " << text << "\n";
        return false;
    case util::IntArgError::OutOfRange:
        std::cerr << flag << " must be between " << lo << " and " << hi << ", got " << text << "\n";
        return false;
    }
    return false;
}

static void usage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " --input <src> --output <out.png> [options]\n"
              << "  --preset <id>      window-punch (default) | remove-bg\n"
              << "  --prompt <text>    custom edit prompt (overrides --preset)\n"
              << "  --pro              use the high quality model tier\n"
              << "  --edited <file>    already-edited key-color image; skips the edit script\n"
              << "  --min-green <n>    key color green floor (default 40)\n"
              << "  --margin <n>       key color dominance margin (default 10)\n"
              << "  --no-resize        keep the edited image's own size\n"
              << "  --thumb <n>        also write a thumbnail with longest side n\n";
}

int main(int argc, char** argv)
{
    std::string inputPath, outputPath, editedPath, prompt;
    std::string presetId = builtinPresets().front().id;
    bool pro = false, noResize = false;
    KeyColorPolicy policy;
    int thumbSide = 0;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;
        if (arg == "--input" && hasValue) inputPath = argv[++i];
        else if (arg == "--output" && hasValue) outputPath = argv[++i];
        else if (arg == "--edited" && hasValue) editedPath = argv[++i];
        else if (arg == "--prompt" && hasValue) prompt = argv[++i];
        else if (arg == "--preset" && hasValue) presetId = argv[++i];
        else if (arg == "--min-green" && hasValue) { if (!readInt(arg, argv[++i], 0, 255, policy.minGreenValue)) return 1; }
        else if (arg == "--margin" && hasValue) { if (!readInt(arg, argv[++i], 0, 255, policy.dominanceMargin)) return 1; }
        else if (arg == "--thumb" && hasValue) { if (!readInt(arg, argv[++i], 0, INT_MAX, thumbSide)) return 1; }
        else if (arg == "--pro") pro = true;
        else if (arg == "--no-resize") noResize = true;
        else { std::cerr << "Unknown or incomplete option: " << arg << "\n"; usage(argv[0]); return 1; }
    }
    if (inputPath.empty() || outputPath.empty()) { usage(argv[0]); return 1; }

    if (prompt.empty())
    {
        const PromptPreset* preset = findPreset(presetId);
        if (!preset) { std::cerr << "Unknown preset: " << presetId << "\n"; return 1; }
        prompt = preset->text;
    }

    Bytes source = util::readFile(inputPath);
    if (source.empty()) { std::cerr << "Cannot open input " << inputPath << "\n"; return 1; }

    std::shared_ptr<EditService> edit;
    if (!editedPath.empty()) edit = std::make_shared<FileEditService>(editedPath);
    else edit = std::make_shared<ScriptEditService>();

    std::shared_ptr<AnalysisService> analysis;
    auto analyzer = std::make_shared<ScriptAnalysisService>();
    if (std::filesystem::exists(analyzer->scriptPath())) analysis = analyzer;

    OrchestratorSettings settings(policy, HistoryCache::kDefaultCapacity, thumbSide);
    settings.matchSourceSize = !noResize;
    GenerationOrchestrator app(edit, analysis, settings);

    app.selectSource(source, util::sniffMimeType(source));
    if (util::debugEnabled())
    {
        ApplicationState s = app.state();
        if (s.source && s.source->dims)
            std::cout << "[alphapunch] source is " << s.source->dims->width << "x" << s.source->dims->height << std::endl;
    }

    if (!app.generate(prompt, pro)) { std::cerr << "Nothing to generate\n"; return 1; }
    app.waitForIdle();

    ApplicationState state = app.state();
    if (state.analysis) std::cout << "Scene: " << *state.analysis << "\n";
    if (state.status != AppStatus::Success || !state.generated)
    {
        std::cerr << "Error: " << state.error.value_or("Failed to process image.") << "\n";
        return 1;
    }

    if (!util::writeFile(outputPath, *state.generated)) { std::cerr << "Cannot write " << outputPath << "\n"; return 1; }
    std::cout << "Saved to " << outputPath << "\n";

    if (thumbSide > 0)
    {
        std::vector<HistoryEntry> history = app.history();
        std::filesystem::path out(outputPath);
        std::string thumbPath = (out.parent_path() / (out.stem().string() + "_thumb.png")).string();
        if (!history.empty() && util::writeFile(thumbPath, history.front().thumbnail))
            std::cout << "Saved thumbnail to " << thumbPath << "\n";
    }
    return 0;
}
