#pragma once

#include "hemascan/features.hpp"
#include "hemascan/model.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core/mat.hpp>

namespace hemascan {

/*! Loaded model handle held by the engine. run() may throw; release() frees native resources. */
struct InferenceBackend {
    std::string name;
    int input_size = ColorFeatureExtractor::kDefaultInputSize;
    std::function<BackendOutput(const std::vector<float> &nchw, int input_size)> run;
    std::function<void()> release;
};

//! Wrap a loaded CnnModel as an engine backend.
InferenceBackend makeCnnBackend(std::shared_ptr<CnnModel> model);

//! Try to load the model at path. Any failure is logged and yields std::nullopt.
std::optional<InferenceBackend> loadModelBackend(const std::string &path);

struct RiskEstimate {
    double risk_score = 0.0;
    double confidence = 0.0;
};

struct InferenceOutcome {
    double risk_score = 0.0;
    double confidence = 0.0;
    std::int64_t inference_time_ms = 0;
    bool model_used = false;
};

constexpr double kHeuristicConfidence = 0.65;

//! Deterministic score used when no model is available.
RiskEstimate heuristicRisk(const ColorFeatures &features);

//! RGB 8-bit image to NCHW float tensor, (c - 127.5) / 127.5 per channel.
std::vector<float> normalizeToTensor(const cv::Mat &rgb);

class RiskInferenceEngine {
public:
    RiskInferenceEngine() = default;
    explicit RiskInferenceEngine(std::optional<InferenceBackend> backend);
    ~RiskInferenceEngine();

    RiskInferenceEngine(const RiskInferenceEngine &) = delete;
    RiskInferenceEngine &operator=(const RiskInferenceEngine &) = delete;

    bool isBackendAvailable() const { return backend_.has_value(); }

    /*! Risk score and confidence for one scaled crop, both in [0,1].
     *  A backend failure falls through to the heuristic for this call only.
     */
    InferenceOutcome analyze(const cv::Mat &scaled, const ColorFeatures &features) const;

    //! Drop the backend; later calls use the heuristic.
    void release();

private:
    std::optional<RiskEstimate> runModel(const cv::Mat &scaled) const;

    std::optional<InferenceBackend> backend_;
};

} // namespace hemascan
