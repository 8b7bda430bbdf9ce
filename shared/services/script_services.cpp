#include "script_services.hpp"
#include "util/Errors.hpp"
#include "util/ImageOps.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <initializer_list>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace alphapunch {

namespace {

    std::string envOr(const char* name, const char* fallback)
    {
        const char* v = std::getenv(name);
        return (v && *v) ? std::string(v) : std::string(fallback);
    }

    // Unique scratch path in the system temp dir.
    fs::path scratchPath(const std::string& tag, const std::string& ext)
    {
        static std::atomic<unsigned long> counter {0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        return fs::temp_directory_path() /
               ("alphapunch_" + tag + "_" + std::to_string(stamp) + "_" + std::to_string(++counter) + ext);
    }

    // Removes the listed files when it goes out of scope.
    class ScratchFiles
    {
    public:
        explicit ScratchFiles(std::initializer_list<fs::path> paths) : paths_(paths) {}
        ~ScratchFiles()
        {
            for (const auto& p : paths_)
            {
                std::error_code ec;
                fs::remove(p, ec);
            }
        }
        ScratchFiles(const ScratchFiles&) = delete;
        ScratchFiles& operator=(const ScratchFiles&) = delete;

    private:
        std::vector<fs::path> paths_;
    };

    std::string quoted(const std::string& s) { return "\"" + s + "\""; }

}

std::string defaultEditScript() { return envOr("ALPHAPUNCH_EDIT_SCRIPT", "scripts/edit_image.py"); }
std::string defaultAnalyzeScript() { return envOr("ALPHAPUNCH_ANALYZE_SCRIPT", "scripts/analyze_scene.py"); }

ScriptEditService::ScriptEditService(std::string scriptPath, std::string interpreter)
    : scriptPath_(std::move(scriptPath)), interpreter_(std::move(interpreter))
{
}

Bytes ScriptEditService::edit(const Bytes& image, const std::string& mimeType,
                              const std::string& prompt, bool highQuality)
{
    if (!fs::exists(scriptPath_)) throw EditServiceError("Edit script not found at '" + scriptPath_ + "'");

    fs::path in = scratchPath("in", util::extensionForMime(mimeType));
    fs::path out = scratchPath("out", ".png");
    fs::path promptFile = scratchPath("prompt", ".txt");
    ScratchFiles cleanup {in, out, promptFile};

    if (!util::writeFile(in.string(), image)) throw EditServiceError("Cannot write " + in.string());
    if (!util::writeFile(promptFile.string(), Bytes(prompt.begin(), prompt.end())))
        throw EditServiceError("Cannot write " + promptFile.string());

    std::string cmd = interpreter_ + " " + quoted(scriptPath_) +
        " --input " + quoted(in.string()) +
        " --output " + quoted(out.string()) +
        " --prompt-file " + quoted(promptFile.string()) +
        (highQuality ? std::string(" --pro") : std::string());
    int rc = std::system(cmd.c_str());
    if (rc != 0) throw EditServiceError("Edit script failed (rc=" + std::to_string(rc) + ")");

    Bytes result = util::readFile(out.string());
    if (result.empty()) throw EditServiceError("Edit script produced no image");
    return result;
}

ScriptAnalysisService::ScriptAnalysisService(std::string scriptPath, std::string interpreter)
    : scriptPath_(std::move(scriptPath)), interpreter_(std::move(interpreter))
{
}

std::string ScriptAnalysisService::analyze(const Bytes& image, const std::string& mimeType)
{
    if (!fs::exists(scriptPath_)) throw AnalysisServiceError("Analysis script not found at '" + scriptPath_ + "'");

    fs::path in = scratchPath("scene", util::extensionForMime(mimeType));
    fs::path out = scratchPath("scene", ".txt");
    ScratchFiles cleanup {in, out};

    if (!util::writeFile(in.string(), image)) throw AnalysisServiceError("Cannot write " + in.string());

    std::string cmd = interpreter_ + " " + quoted(scriptPath_) +
        " --input " + quoted(in.string()) +
        " --output " + quoted(out.string());
    int rc = std::system(cmd.c_str());
    if (rc != 0) throw AnalysisServiceError("Analysis script failed (rc=" + std::to_string(rc) + ")");

    Bytes text = util::readFile(out.string());
    if (text.empty()) throw AnalysisServiceError("Analysis script produced no text");
    std::string s(text.begin(), text.end());
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
    return s;
}

Bytes FileEditService::edit(const Bytes&, const std::string&, const std::string&, bool)
{
    Bytes data = util::readFile(path_);
    if (data.empty()) throw EditServiceError("Cannot read edited image '" + path_ + "'");
    return data;
}

}
