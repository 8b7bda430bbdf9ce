#include "GenerationOrchestrator.hpp"

#include "chroma_key.hpp"
#include "resample.hpp"
#include "services/AnalysisService.hpp"
#include "services/EditService.hpp"
#include "util/Errors.hpp"
#include "util/ImageOps.hpp"

#include <opencv2/core.hpp>
#include <algorithm>
#include <chrono>
#include <iterator>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace alphapunch {

namespace {

    std::int64_t nowMs()
    {
        using namespace std::chrono;
        return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    }

}

GenerationOrchestrator::GenerationOrchestrator(std::shared_ptr<EditService> edit,
                                               std::shared_ptr<AnalysisService> analysis,
                                               OrchestratorSettings settings)
    : edit_(std::move(edit)),
      analysis_(std::move(analysis)),
      settings_(settings),
      history_(settings.historyCapacity)
{
    if (!edit_) throw std::invalid_argument("GenerationOrchestrator needs an edit service");
}

GenerationOrchestrator::~GenerationOrchestrator()
{
    std::vector<std::future<void>> pending;
    {
        std::lock_guard<std::mutex> lock(tasksMutex_);
        pending.swap(tasks_);
    }
    for (auto& f : pending) f.wait();
}

void GenerationOrchestrator::selectSource(Bytes image, std::string mimeType)
{
    std::optional<Dimensions> dims = util::probeSize(image);
    if (!dims) std::cerr << "[selectSource] cannot read image size; results will keep the model's size\n";

    std::uint64_t seq = 0;
    ApplicationState snapshot;
    std::uint64_t version = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        seq = ++sourceSeq_;
        ++generationToken_; // anything in flight now belongs to the old source
        state_.status = AppStatus::Idle;
        state_.source = SourceImage{image, mimeType, dims};
        state_.generated.reset();
        state_.error.reset();
        state_.analysis.reset();
        snapshot = state_;
        version = ++version_;
    }
    notify(snapshot, version);

    if (!analysis_) return;
    launch([this, seq, image = std::move(image), mimeType = std::move(mimeType)]() mutable
    {
        runAnalysis(seq, std::move(image), std::move(mimeType));
    });
}

bool GenerationOrchestrator::generate(const std::string& prompt, bool highQuality)
{
    GenerationRequest request;
    std::optional<Dimensions> target;
    std::uint64_t token = 0;
    ApplicationState snapshot;
    std::uint64_t version = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!state_.source)
        {
            if (util::debugEnabled()) std::cout << "[generate] no source image, ignoring" << std::endl;
            return false;
        }
        if (state_.status == AppStatus::Processing)
        {
            if (util::debugEnabled()) std::cout << "[generate] already processing, ignoring" << std::endl;
            return false;
        }
        request.image = state_.source->data;
        request.mimeType = state_.source->mimeType;
        request.prompt = prompt;
        request.highQuality = highQuality;
        if (settings_.matchSourceSize) target = state_.source->dims;
        token = ++generationToken_;

        state_.status = AppStatus::Processing;
        state_.error.reset();
        state_.generated.reset();
        snapshot = state_;
        version = ++version_;
    }
    notify(snapshot, version);

    launch([this, token, request = std::move(request), target]() mutable
    {
        runGeneration(token, std::move(request), target);
    });
    return true;
}

bool GenerationOrchestrator::selectHistory(const std::string& id)
{
    ApplicationState snapshot;
    std::uint64_t version = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::optional<HistoryEntry> entry = history_.select(id);
        if (!entry)
        {
            if (util::debugEnabled()) std::cout << "[selectHistory] unknown id " << id << std::endl;
            return false;
        }
        ++sourceSeq_;
        ++generationToken_;
        state_.status = AppStatus::Success;
        state_.source = SourceImage{std::move(entry->original), entry->originalMimeType, entry->originalDims};
        state_.generated = std::move(entry->generated);
        state_.error.reset();
        state_.analysis.reset();
        snapshot = state_;
        version = ++version_;
    }
    notify(snapshot, version);
    return true;
}

ApplicationState GenerationOrchestrator::state() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::vector<HistoryEntry> GenerationOrchestrator::history() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.list();
}

void GenerationOrchestrator::setStateListener(StateListener listener)
{
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

void GenerationOrchestrator::waitForIdle()
{
    for (;;)
    {
        std::vector<std::future<void>> pending;
        {
            std::lock_guard<std::mutex> lock(tasksMutex_);
            if (tasks_.empty()) return;
            pending.swap(tasks_);
        }
        for (auto& f : pending) f.get();
    }
}

void GenerationOrchestrator::runGeneration(std::uint64_t token, GenerationRequest request,
                                           std::optional<Dimensions> target)
{
    Bytes result;
    Bytes thumbnail;
    std::string failure;
    bool ok = false;
    try
    {
        Bytes edited = edit_->edit(request.image, request.mimeType, request.prompt, request.highQuality);
        if (edited.empty()) throw EditServiceError("Edit service returned no image data");
        result = postProcess(edited, target);
        thumbnail = settings_.thumbnailMaxSide > 0 ? util::makeThumbnail(result, settings_.thumbnailMaxSide) : result;
        ok = true;
    }
    catch (const std::exception& e)
    {
        failure = e.what();
        if (failure.empty()) failure = "Failed to process image.";
        std::cerr << "[generate] " << failure << "\n";
    }
    catch (...)
    {
        failure = "Failed to process image.";
        std::cerr << "[generate] unknown exception from the edit pipeline\n";
    }

    ApplicationState snapshot;
    std::uint64_t version = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (token != generationToken_)
        {
            if (util::debugEnabled()) std::cout << "[generate] dropping stale result #" << token << std::endl;
            return;
        }
        if (ok)
        {
            HistoryEntry entry;
            entry.timestamp = nowMs();
            entry.id = history_.nextId(entry.timestamp);
            entry.original = std::move(request.image);
            entry.originalMimeType = std::move(request.mimeType);
            entry.originalDims = target;
            entry.generated = result;
            entry.promptUsed = std::move(request.prompt);
            entry.thumbnail = std::move(thumbnail);
            history_.push(std::move(entry));

            state_.status = AppStatus::Success;
            state_.generated = std::move(result);
        }
        else
        {
            state_.status = AppStatus::Error;
            state_.error = failure;
            state_.generated.reset();
        }
        snapshot = state_;
        version = ++version_;
    }
    notify(snapshot, version);
}

void GenerationOrchestrator::runAnalysis(std::uint64_t sourceSeq, Bytes image, std::string mimeType)
{
    std::string text;
    try
    {
        text = analysis_->analyze(image, mimeType);
    }
    catch (const std::exception& e)
    {
        std::cerr << "[analysis] failed: " << e.what() << "\n";
        return;
    }
    catch (...)
    {
        std::cerr << "[analysis] failed: unknown exception\n";
        return;
    }

    ApplicationState snapshot;
    std::uint64_t version = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sourceSeq != sourceSeq_)
        {
            if (util::debugEnabled()) std::cout << "[analysis] source changed, dropping result" << std::endl;
            return;
        }
        state_.analysis = std::move(text);
        snapshot = state_;
        version = ++version_;
    }
    notify(snapshot, version);
}

Bytes GenerationOrchestrator::postProcess(const Bytes& edited, const std::optional<Dimensions>& target) const
{
    cv::Mat rgba = util::decodeRgba(edited);
    std::size_t keyed = extractChromaKey(rgba, settings_.policy);
    if (util::debugEnabled())
        std::cout << "[generate] keyed " << keyed << "/" << rgba.total() << " pixels" << std::endl;
    return resampleToPng(rgba, target);
}

void GenerationOrchestrator::launch(std::function<void()> task)
{
    std::vector<std::future<void>> finished;
    {
        std::lock_guard<std::mutex> lock(tasksMutex_);
        auto running = [](std::future<void>& f)
        {
            return f.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
        };
        auto firstDone = std::partition(tasks_.begin(), tasks_.end(), running);
        std::move(firstDone, tasks_.end(), std::back_inserter(finished));
        tasks_.erase(firstDone, tasks_.end());
        tasks_.push_back(std::async(std::launch::async, std::move(task)));
    }
    for (auto& f : finished) f.get();
}

void GenerationOrchestrator::notify(const ApplicationState& snapshot, std::uint64_t version)
{
    std::lock_guard<std::recursive_mutex> order(notifyMutex_);
    if (version <= lastNotified_)
    {
        if (util::debugEnabled()) std::cout << "[notify] skipping superseded state #" << version << std::endl;
        return;
    }
    lastNotified_ = version;

    StateListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = listener_;
    }
    if (listener) listener(snapshot);
}

}
