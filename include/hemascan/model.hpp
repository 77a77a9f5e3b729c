#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace hemascan {

struct BackendOutput {
    float risk_score = 0.0f;
    float confidence = 0.0f;
};

/*! Pre-packaged anemia model consumed through ONNX Runtime or RKNN, whichever the build enables.
 *  Input is an NCHW float tensor [1, 3, S, S] normalised to [-1, 1].
 *  The first two output floats are (risk score, confidence).
 */
class CnnModel {
public:
    explicit CnnModel(std::string model_path);
    ~CnnModel();

    CnnModel(const CnnModel &) = delete;
    CnnModel &operator=(const CnnModel &) = delete;

    //! \throws std::runtime_error if the file is missing, unreadable, or no runtime is compiled in.
    bool load();
    bool release();

    bool isLoaded() const noexcept { return loaded_; }
    const std::string &path() const noexcept { return model_path_; }

    //! Spatial input size the model declares (square), or 0 if not loaded.
    int inputSize() const;

    //! \throws std::runtime_error on any runtime failure.
    BackendOutput infer(const std::vector<float> &nchw, int input_size) const;

    static const char *runtimeName();

private:
    struct Impl;

    std::string model_path_;
    bool loaded_ = false;
    std::unique_ptr<Impl> impl_;
};

} // namespace hemascan
