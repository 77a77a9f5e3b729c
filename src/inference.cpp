#include "hemascan/inference.hpp"
#include "hemascan/common.hpp"

#include <chrono>
#include <cmath>
#include <iostream>
#include <stdexcept>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace hemascan {

namespace {

constexpr double kImageMean = 127.5;
constexpr double kImageStd = 127.5;

} // namespace

InferenceBackend makeCnnBackend(std::shared_ptr<CnnModel> model)
{
    if (!model || !model->isLoaded()) {
        throw std::invalid_argument("CNN backend requires a loaded model");
    }
    InferenceBackend backend;
    backend.name = std::string(CnnModel::runtimeName()) + ":" + model->path();
    // Dynamic spatial dims report 0.
    if (model->inputSize() > 0) {
        backend.input_size = model->inputSize();
    }
    backend.run = [model](const std::vector<float> &nchw, int input_size) {
        return model->infer(nchw, input_size);
    };
    backend.release = [model]() { model->release(); };
    return backend;
}

std::optional<InferenceBackend> loadModelBackend(const std::string &path)
{
    if (path.empty()) {
        std::cout << "[MODEL] No model configured, using heuristic analysis" << std::endl;
        return std::nullopt;
    }
    try {
        auto model = std::make_shared<CnnModel>(path);
        model->load();
        return makeCnnBackend(std::move(model));
    } catch (const std::exception &ex) {
        std::cerr << "[MODEL] Model unavailable (" << ex.what() << "), using heuristic analysis" << std::endl;
        return std::nullopt;
    }
}

RiskEstimate heuristicRisk(const ColorFeatures &features)
{
    double risk = features.pallor_index;

    if (features.saturation < 0.20) {
        risk += 0.15;
    }
    if (features.redRatio() < 0.35) {
        risk += 0.10;
    }
    // Bright but washed out.
    if (features.brightness > 0.7 && features.saturation < 0.25) {
        risk += 0.10;
    }

    return RiskEstimate{clampUnit(risk), kHeuristicConfidence};
}

std::vector<float> normalizeToTensor(const cv::Mat &rgb)
{
    if (rgb.empty() || rgb.type() != CV_8UC3) {
        throw std::invalid_argument("Tensor input must be a non-empty RGB image");
    }
    cv::Mat scaled;
    rgb.convertTo(scaled, CV_32FC3, 1.0 / kImageStd, -kImageMean / kImageStd);

    std::vector<cv::Mat> channels(3);
    cv::split(scaled, channels);

    const std::size_t plane = static_cast<std::size_t>(rgb.rows) * rgb.cols;
    std::vector<float> tensor(3 * plane);
    for (int c = 0; c < 3; ++c) {
        const cv::Mat &channel = channels[c];
        for (int y = 0; y < channel.rows; ++y) {
            const float *row = channel.ptr<float>(y);
            std::copy(row, row + channel.cols, tensor.begin() + c * plane + static_cast<std::size_t>(y) * channel.cols);
        }
    }
    return tensor;
}

RiskInferenceEngine::RiskInferenceEngine(std::optional<InferenceBackend> backend) : backend_(std::move(backend))
{
    if (backend_ && !backend_->run) {
        backend_.reset();
    }
}

RiskInferenceEngine::~RiskInferenceEngine()
{
    release();
}

void RiskInferenceEngine::release()
{
    if (backend_) {
        if (backend_->release) {
            backend_->release();
        }
        backend_.reset();
    }
}

std::optional<RiskEstimate> RiskInferenceEngine::runModel(const cv::Mat &scaled) const
{
    try {
        cv::Mat input = scaled;
        if (scaled.cols != backend_->input_size || scaled.rows != backend_->input_size) {
            cv::resize(scaled, input, cv::Size(backend_->input_size, backend_->input_size), 0, 0, cv::INTER_LINEAR);
        }
        BackendOutput out = backend_->run(normalizeToTensor(input), backend_->input_size);
        if (!std::isfinite(out.risk_score) || !std::isfinite(out.confidence)) {
            std::cerr << "[MODEL] Non-finite model output, using heuristic for this frame" << std::endl;
            return std::nullopt;
        }
        return RiskEstimate{clampUnit(out.risk_score), clampUnit(out.confidence)};
    } catch (const std::exception &ex) {
        std::cerr << "[MODEL] Inference failed (" << ex.what() << "), using heuristic for this frame" << std::endl;
        return std::nullopt;
    }
}

InferenceOutcome RiskInferenceEngine::analyze(const cv::Mat &scaled, const ColorFeatures &features) const
{
    const auto start = std::chrono::steady_clock::now();

    InferenceOutcome outcome;
    std::optional<RiskEstimate> estimate;
    if (backend_) {
        estimate = runModel(scaled);
        outcome.model_used = estimate.has_value();
    }
    if (!estimate) {
        estimate = heuristicRisk(features);
    }
    outcome.risk_score = estimate->risk_score;
    outcome.confidence = estimate->confidence;

    outcome.inference_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                    std::chrono::steady_clock::now() - start)
                                    .count();
    return outcome;
}

} // namespace hemascan
