#pragma once

#include "hemascan/classifier.hpp"
#include "hemascan/common.hpp"
#include "hemascan/features.hpp"
#include "hemascan/inference.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace hemascan {

/*! Frame rate limiter: lets through every frame_skip-th frame, and only when
 *  min_interval_ms has passed since the last frame it let through.
 */
class FrameThrottle {
public:
    static constexpr int kDefaultMinIntervalMs = 500;
    static constexpr int kDefaultFrameSkip = 3;

    explicit FrameThrottle(int min_interval_ms = kDefaultMinIntervalMs, int frame_skip = kDefaultFrameSkip);

    //! Counts the frame and reports whether it should be analysed.
    bool admit(std::int64_t now_ms);
    void reset();

private:
    std::int64_t min_interval_ms_;
    int frame_skip_;
    std::uint64_t frame_counter_ = 0;
    std::int64_t last_admitted_ms_ = 0;
    bool admitted_any_ = false;
};

/*! Single background thread running at most one task at a time.
 *  tryPost() refuses work while a task is queued or running.
 */
class SerialWorker {
public:
    SerialWorker();
    ~SerialWorker();

    SerialWorker(const SerialWorker &) = delete;
    SerialWorker &operator=(const SerialWorker &) = delete;

    bool tryPost(std::function<void()> task);
    bool busy() const { return busy_.load(); }
    //! Block until no task is queued or running.
    void waitIdle();

private:
    std::thread thread_;
    std::function<void()> task_;
    std::mutex m_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::atomic<bool> busy_{false};
    bool stop_ = false;
};

struct PreviewResult {
    ColorFeatures features;
    double risk_score = 0.0;
    RiskLevel risk_level = RiskLevel::GREEN;
    double confidence = 0.0;
    bool model_used = false;
};

/*! Live camera analysis. Frames are throttled, then handed to the worker;
 *  frames arriving while the worker is busy are dropped.
 */
class FrameAnalyzer {
public:
    using PreviewCallback = std::function<void(const PreviewResult &)>;

    FrameAnalyzer(const ColorFeatureExtractor &extractor, const RiskInferenceEngine &engine, RegionOfInterest roi,
                  FrameThrottle throttle, PreviewCallback on_preview);
    ~FrameAnalyzer();

    //! Returns true if the frame was accepted for analysis.
    bool submit(CapturedFrame frame);
    bool submit(Raster raster, std::int64_t now_ms);

    //! Applies from the next analysed frame. \throws InvalidRoiError if empty.
    void setRegion(const RegionOfInterest &roi);
    RegionOfInterest region() const;

    //! The consumer is gone. An in-flight analysis finishes but its result is discarded.
    void detach();
    bool attached() const { return attached_.load(); }

    void waitIdle() { worker_.waitIdle(); }

    std::uint64_t droppedFrames() const { return dropped_.load(); }
    std::uint64_t failedFrames() const { return failed_.load(); }

private:
    bool accept(std::int64_t now_ms);
    void analyze(Raster &&raster);

    const ColorFeatureExtractor &extractor_;
    const RiskInferenceEngine &engine_;
    mutable std::mutex roi_mutex_;
    RegionOfInterest roi_;
    PreviewCallback on_preview_;

    std::mutex throttle_mutex_;
    FrameThrottle throttle_;
    std::atomic<bool> attached_{true};
    std::atomic<std::uint64_t> dropped_{0};
    std::atomic<std::uint64_t> failed_{0};
    SerialWorker worker_;
};

} // namespace hemascan
