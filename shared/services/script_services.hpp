#pragma once
#include <string>
#include <utility>
#include "services/AnalysisService.hpp"
#include "services/EditService.hpp"

namespace alphapunch {

// Script locations: ALPHAPUNCH_EDIT_SCRIPT / ALPHAPUNCH_ANALYZE_SCRIPT, else scripts/*.py.
std::string defaultEditScript();
std::string defaultAnalyzeScript();

// Runs an external edit script:
//   <interpreter> "<script>" --input "<in>" --output "<out>" --prompt-file "<txt>" [--pro]
// The script writes the key-colored image to --output. Throws EditServiceError on
// non-zero exit or missing output.
class ScriptEditService : public EditService
{
public:
    explicit ScriptEditService(std::string scriptPath = defaultEditScript(), std::string interpreter = "python3");

    Bytes edit(const Bytes& image, const std::string& mimeType,
               const std::string& prompt, bool highQuality) override;

    const std::string& scriptPath() const { return scriptPath_; }

private:
    std::string scriptPath_;
    std::string interpreter_;
};

// Runs an external analysis script:
//   <interpreter> "<script>" --input "<in>" --output "<txt>"
class ScriptAnalysisService : public AnalysisService
{
public:
    explicit ScriptAnalysisService(std::string scriptPath = defaultAnalyzeScript(), std::string interpreter = "python3");

    std::string analyze(const Bytes& image, const std::string& mimeType) override;

    const std::string& scriptPath() const { return scriptPath_; }

private:
    std::string scriptPath_;
    std::string interpreter_;
};

// Returns an image that was already edited elsewhere (offline runs, tests).
class FileEditService : public EditService
{
public:
    explicit FileEditService(std::string path) : path_(std::move(path)) {}

    Bytes edit(const Bytes& image, const std::string& mimeType,
               const std::string& prompt, bool highQuality) override;

private:
    std::string path_;
};

}
