#include "hemascan/analyzer.hpp"

#include "hemascan/errors.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <utility>

namespace hemascan {

FrameThrottle::FrameThrottle(int min_interval_ms, int frame_skip)
    : min_interval_ms_(min_interval_ms < 0 ? 0 : min_interval_ms), frame_skip_(frame_skip < 1 ? 1 : frame_skip)
{
}

bool FrameThrottle::admit(std::int64_t now_ms)
{
    ++frame_counter_;
    if (frame_counter_ % static_cast<std::uint64_t>(frame_skip_) != 0) {
        return false;
    }
    if (admitted_any_ && now_ms - last_admitted_ms_ < min_interval_ms_) {
        return false;
    }
    admitted_any_ = true;
    last_admitted_ms_ = now_ms;
    return true;
}

void FrameThrottle::reset()
{
    frame_counter_ = 0;
    last_admitted_ms_ = 0;
    admitted_any_ = false;
}

SerialWorker::SerialWorker()
{
    thread_ = std::thread([this] {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lk(m_);
                cv_.wait(lk, [this] { return stop_ || task_; });
                if (!task_) return;
                task = std::move(task_);
                task_ = nullptr;
            }
            try {
                task();
            } catch (const std::exception &ex) {
                std::cerr << "[ANALYZER] Worker task failed: " << ex.what() << std::endl;
            }
            {
                std::lock_guard<std::mutex> lk(m_);
                busy_.store(false);
            }
            idle_cv_.notify_all();
        }
    });
}

SerialWorker::~SerialWorker()
{
    {
        std::lock_guard<std::mutex> lk(m_);
        stop_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

bool SerialWorker::tryPost(std::function<void()> task)
{
    {
        std::lock_guard<std::mutex> lk(m_);
        if (stop_) throw std::runtime_error("SerialWorker stopped");
        if (busy_.load()) return false;
        busy_.store(true);
        task_ = std::move(task);
    }
    cv_.notify_one();
    return true;
}

void SerialWorker::waitIdle()
{
    std::unique_lock<std::mutex> lk(m_);
    idle_cv_.wait(lk, [this] { return !busy_.load(); });
}

FrameAnalyzer::FrameAnalyzer(const ColorFeatureExtractor &extractor, const RiskInferenceEngine &engine,
                             RegionOfInterest roi, FrameThrottle throttle, PreviewCallback on_preview)
    : extractor_(extractor),
      engine_(engine),
      roi_(roi),
      on_preview_(std::move(on_preview)),
      throttle_(throttle)
{
    if (!roi_.isValid()) {
        throw InvalidRoiError("Analyzer region of interest is empty");
    }
}

FrameAnalyzer::~FrameAnalyzer()
{
    detach();
}

bool FrameAnalyzer::accept(std::int64_t now_ms)
{
    if (!attached_.load()) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(throttle_mutex_);
        if (!throttle_.admit(now_ms)) {
            return false;
        }
    }
    if (worker_.busy()) {
        dropped_.fetch_add(1);
        return false;
    }
    return true;
}

bool FrameAnalyzer::submit(CapturedFrame frame)
{
    std::int64_t now_ms = currentSteadyMillis();
    if (!accept(now_ms)) {
        return false;
    }
    auto shared = std::make_shared<CapturedFrame>(std::move(frame));
    bool posted = worker_.tryPost([this, shared]() {
        Raster raster;
        try {
            raster = decodeFrame(*shared);
        } catch (const std::exception &ex) {
            failed_.fetch_add(1);
            std::cerr << "[ANALYZER] Skipping frame: " << ex.what() << std::endl;
            return;
        }
        analyze(std::move(raster));
    });
    if (!posted) {
        dropped_.fetch_add(1);
    }
    return posted;
}

bool FrameAnalyzer::submit(Raster raster, std::int64_t now_ms)
{
    if (!accept(now_ms)) {
        return false;
    }
    auto shared = std::make_shared<Raster>(std::move(raster));
    bool posted = worker_.tryPost([this, shared]() { analyze(std::move(*shared)); });
    if (!posted) {
        dropped_.fetch_add(1);
    }
    return posted;
}

void FrameAnalyzer::analyze(Raster &&raster)
{
    PreviewResult preview;
    try {
        ExtractedRegion region = extractor_.extract(std::move(raster), this->region());
        InferenceOutcome outcome = engine_.analyze(region.scaled, region.features);
        preview.features = region.features;
        preview.risk_score = outcome.risk_score;
        preview.risk_level = classify(outcome.risk_score).level;
        preview.confidence = outcome.confidence;
        preview.model_used = outcome.model_used;
    } catch (const std::exception &ex) {
        failed_.fetch_add(1);
        std::cerr << "[ANALYZER] Frame analysis failed: " << ex.what() << std::endl;
        return;
    }

    if (!attached_.load()) {
        return;
    }
    if (on_preview_) {
        on_preview_(preview);
    }
}

void FrameAnalyzer::setRegion(const RegionOfInterest &roi)
{
    if (!roi.isValid()) {
        throw InvalidRoiError("Analyzer region of interest is empty");
    }
    std::lock_guard<std::mutex> lock(roi_mutex_);
    roi_ = roi;
}

RegionOfInterest FrameAnalyzer::region() const
{
    std::lock_guard<std::mutex> lock(roi_mutex_);
    return roi_;
}

void FrameAnalyzer::detach()
{
    attached_.store(false);
}

} // namespace hemascan
