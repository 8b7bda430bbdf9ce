#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "HistoryCache.hpp"
#include "models/ApplicationState.hpp"
#include "models/GenerationRequest.hpp"
#include "models/OrchestratorSettings.hpp"

namespace alphapunch {

class EditService;
class AnalysisService;

/**
 * @class GenerationOrchestrator
 * @brief Owns the application state and drives one edit at a time.
 *
 * Flow of a generation:
 * - generate() moves to Processing and starts the edit on a worker task
 * - the worker runs edit service -> chroma key -> resample to the source size
 * - the result is applied only if no newer source or generation superseded it
 *
 * All state lives behind one mutex. External calls run outside it.
 */
class GenerationOrchestrator
{
public:
    using StateListener = std::function<void(const ApplicationState&)>;

    /**
     * @param edit     Required edit collaborator.
     * @param analysis Optional scene analysis collaborator (may be null).
     * @param settings Key color policy, history size, thumbnail size.
     */
    GenerationOrchestrator(std::shared_ptr<EditService> edit,
                           std::shared_ptr<AnalysisService> analysis,
                           OrchestratorSettings settings = OrchestratorSettings());
    ~GenerationOrchestrator();

    GenerationOrchestrator(const GenerationOrchestrator&) = delete;
    GenerationOrchestrator& operator=(const GenerationOrchestrator&) = delete;

    /**
     * @brief Makes @p image the current source and resets to Idle.
     *
     * Clears the generated image, error and analysis, records the native size
     * as the resize target, and starts a best-effort analysis. Any generation
     * still in flight becomes stale.
     */
    void selectSource(Bytes image, std::string mimeType);

    /**
     * @brief Starts a generation for the current source.
     * @return false (and nothing changes) if there is no source or one is already Processing.
     */
    bool generate(const std::string& prompt, bool highQuality = false);

    /**
     * @brief Shows a past result. No external call is made.
     * @return false if @p id is not in the history.
     */
    bool selectHistory(const std::string& id);

    ApplicationState state() const;
    std::vector<HistoryEntry> history() const;

    // Called after every applied transition, outside the state lock, possibly from a
    // worker thread. Calls never overlap. A snapshot older than one already
    // delivered is skipped, so the last call always matches state().
    void setStateListener(StateListener listener);

    // Blocks until every task started so far has finished.
    void waitForIdle();

private:
    void runGeneration(std::uint64_t token, GenerationRequest request, std::optional<Dimensions> target);
    void runAnalysis(std::uint64_t sourceSeq, Bytes image, std::string mimeType);
    Bytes postProcess(const Bytes& edited, const std::optional<Dimensions>& target) const;

    void launch(std::function<void()> task);
    void notify(const ApplicationState& snapshot, std::uint64_t version);

    std::shared_ptr<EditService> edit_;
    std::shared_ptr<AnalysisService> analysis_;
    const OrchestratorSettings settings_;

    mutable std::mutex mutex_;
    ApplicationState state_;
    HistoryCache history_;
    std::uint64_t generationToken_ {0};
    std::uint64_t sourceSeq_ {0};
    std::uint64_t version_ {0};
    StateListener listener_;

    std::recursive_mutex notifyMutex_;
    std::uint64_t lastNotified_ {0};

    std::mutex tasksMutex_;
    std::vector<std::future<void>> tasks_;
};

}
