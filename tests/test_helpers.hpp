#pragma once

#include <opencv2/core.hpp>
#include <atomic>
#include <future>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "models/ImageTypes.hpp"
#include "services/AnalysisService.hpp"
#include "services/EditService.hpp"

namespace alphapunch {
namespace test_support {

// w x h RGBA buffer filled with one color.
cv::Mat solidRgba(int w, int h, const cv::Vec4b& color);

// PNG bytes of a solid w x h image.
Bytes solidPng(int w, int h, const cv::Vec4b& color);

// Always returns the same bytes.
class FixedEditService : public EditService
{
public:
    explicit FixedEditService(Bytes result) : result_(std::move(result)) {}
    Bytes edit(const Bytes&, const std::string&, const std::string& prompt, bool highQuality) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_;
        lastPrompt_ = prompt;
        lastHighQuality_ = highQuality;
        return result_;
    }
    int calls() const { std::lock_guard<std::mutex> lock(mutex_); return calls_; }
    std::string lastPrompt() const { std::lock_guard<std::mutex> lock(mutex_); return lastPrompt_; }
    bool lastHighQuality() const { std::lock_guard<std::mutex> lock(mutex_); return lastHighQuality_; }

private:
    Bytes result_;
    mutable std::mutex mutex_;
    int calls_ {0};
    std::string lastPrompt_;
    bool lastHighQuality_ {false};
};

// Always throws with the given message.
class FailingEditService : public EditService
{
public:
    explicit FailingEditService(std::string message) : message_(std::move(message)) {}
    Bytes edit(const Bytes&, const std::string&, const std::string&, bool) override;

private:
    std::string message_;
};

// Blocks every call until release() and then returns the same bytes.
class GatedEditService : public EditService
{
public:
    explicit GatedEditService(Bytes result) : result_(std::move(result)), gate_(open_.get_future().share()) {}
    Bytes edit(const Bytes&, const std::string&, const std::string&, bool) override
    {
        ++started_;
        gate_.wait();
        return result_;
    }
    void release() { open_.set_value(); }
    int started() const { return started_; }

private:
    Bytes result_;
    std::promise<void> open_;
    std::shared_future<void> gate_;
    std::atomic<int> started_ {0};
};

// Reports the input size as "<n> bytes", optionally blocking until release().
class EchoAnalysisService : public AnalysisService
{
public:
    explicit EchoAnalysisService(bool gated = false) : gated_(gated), gate_(open_.get_future().share()) {}
    std::string analyze(const Bytes& image, const std::string&) override
    {
        if (gated_) gate_.wait();
        return std::to_string(image.size()) + " bytes";
    }
    void release() { open_.set_value(); }

private:
    bool gated_;
    std::promise<void> open_;
    std::shared_future<void> gate_;
};

class FailingAnalysisService : public AnalysisService
{
public:
    std::string analyze(const Bytes&, const std::string&) override;
};

}
}
