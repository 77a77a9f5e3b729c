#include "hemascan/model.hpp"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

#ifdef HEMASCAN_HAS_RKNN
#include <rknn_api.h>
#endif

#ifdef HEMASCAN_HAS_ONNXRUNTIME
#include <onnxruntime_cxx_api.h>
#endif

namespace hemascan {

struct CnnModel::Impl {
#if defined(HEMASCAN_HAS_RKNN)
    Impl() = default;
    std::vector<std::uint8_t> model_blob;
    rknn_context ctx = 0;
    rknn_input_output_num io_num{};
    std::vector<rknn_tensor_attr> input_attrs;
    std::vector<rknn_tensor_attr> output_attrs;
    rknn_tensor_format input_format = RKNN_TENSOR_NCHW;
#elif defined(HEMASCAN_HAS_ONNXRUNTIME)
    Impl() : env(ORT_LOGGING_LEVEL_WARNING, "hemascan") {}
    Ort::Env env;
    Ort::SessionOptions session_options;
    std::unique_ptr<Ort::Session> session;
    std::vector<std::string> input_names;
    std::vector<const char *> input_name_ptrs;
    std::vector<std::string> output_names;
    std::vector<const char *> output_name_ptrs;
#endif
    std::vector<int64_t> input_shape;
    bool ready = false;
};

namespace {

constexpr int64_t kDefaultInputSize = 224;

#if defined(HEMASCAN_HAS_RKNN)
std::vector<std::uint8_t> loadBinaryFile(const std::string &path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open model file: " + path);
    }
    file.seekg(0, std::ios::end);
    std::streampos size = file.tellg();
    file.seekg(0, std::ios::beg);
    if (size <= 0) {
        throw std::runtime_error("Model file is empty: " + path);
    }
    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(size));
    file.read(reinterpret_cast<char *>(buffer.data()), size);
    if (!file) {
        throw std::runtime_error("Failed to read model file: " + path);
    }
    return buffer;
}

std::vector<int64_t> normalizeInputShape(const rknn_tensor_attr &attr)
{
    std::vector<int64_t> dims(attr.dims, attr.dims + attr.n_dims);
    if (dims.size() == 4 && attr.fmt == RKNN_TENSOR_NHWC) {
        return {dims[0], dims[3], dims[1], dims[2]};
    }
    if (dims.size() != 4) {
        return {1, 3, kDefaultInputSize, kDefaultInputSize};
    }
    return dims;
}
#endif

} // namespace

CnnModel::CnnModel(std::string model_path) : model_path_(std::move(model_path)) {}

CnnModel::~CnnModel()
{
    release();
}

const char *CnnModel::runtimeName()
{
#if defined(HEMASCAN_HAS_RKNN)
    return "rknn";
#elif defined(HEMASCAN_HAS_ONNXRUNTIME)
    return "onnxruntime";
#else
    return "none";
#endif
}

bool CnnModel::load()
{
    std::string model_path = model_path_;
    if (model_path.empty()) {
        throw std::runtime_error("Model path is empty");
    }
    if (model_path[0] != '/') {
        model_path = (std::filesystem::current_path() / model_path).string();
    }
    if (!std::filesystem::exists(model_path)) {
        throw std::runtime_error("Model file not found: " + model_path);
    }

    impl_ = std::make_unique<Impl>();

#if defined(HEMASCAN_HAS_RKNN)
    impl_->model_blob = loadBinaryFile(model_path);

    if (rknn_init(&impl_->ctx,
                  impl_->model_blob.data(),
                  static_cast<unsigned int>(impl_->model_blob.size()),
                  0,
                  nullptr) != RKNN_SUCC) {
        throw std::runtime_error("Failed to initialize RKNN context");
    }

    if (rknn_query(impl_->ctx, RKNN_QUERY_IN_OUT_NUM, &impl_->io_num, sizeof(impl_->io_num)) != RKNN_SUCC) {
        throw std::runtime_error("Failed to query RKNN IO information");
    }

    impl_->input_attrs.resize(impl_->io_num.n_input);
    for (std::uint32_t i = 0; i < impl_->io_num.n_input; ++i) {
        rknn_tensor_attr attr{};
        attr.index = i;
        if (rknn_query(impl_->ctx, RKNN_QUERY_INPUT_ATTR, &attr, sizeof(attr)) != RKNN_SUCC) {
            throw std::runtime_error("Failed to query RKNN input attribute");
        }
        impl_->input_attrs[i] = attr;
    }

    impl_->output_attrs.resize(impl_->io_num.n_output);
    for (std::uint32_t i = 0; i < impl_->io_num.n_output; ++i) {
        rknn_tensor_attr attr{};
        attr.index = i;
        if (rknn_query(impl_->ctx, RKNN_QUERY_OUTPUT_ATTR, &attr, sizeof(attr)) != RKNN_SUCC) {
            throw std::runtime_error("Failed to query RKNN output attribute");
        }
        impl_->output_attrs[i] = attr;
    }

    if (!impl_->input_attrs.empty()) {
        impl_->input_shape = normalizeInputShape(impl_->input_attrs.front());
        impl_->input_format = impl_->input_attrs.front().fmt;
    } else {
        impl_->input_shape = {1, 3, kDefaultInputSize, kDefaultInputSize};
    }
    impl_->ready = true;
#elif defined(HEMASCAN_HAS_ONNXRUNTIME)
    impl_->session_options.SetIntraOpNumThreads(1);
    impl_->session_options.SetGraphOptimizationLevel(ORT_ENABLE_EXTENDED);
    impl_->session = std::make_unique<Ort::Session>(impl_->env, model_path.c_str(), impl_->session_options);

    Ort::AllocatorWithDefaultOptions allocator;
    for (std::size_t i = 0; i < impl_->session->GetInputCount(); ++i) {
        impl_->input_names.emplace_back(impl_->session->GetInputNameAllocated(i, allocator).get());
    }
    for (std::size_t i = 0; i < impl_->session->GetOutputCount(); ++i) {
        impl_->output_names.emplace_back(impl_->session->GetOutputNameAllocated(i, allocator).get());
    }
    for (const auto &n : impl_->input_names) {
        impl_->input_name_ptrs.push_back(n.c_str());
    }
    for (const auto &n : impl_->output_names) {
        impl_->output_name_ptrs.push_back(n.c_str());
    }
    if (impl_->input_names.empty() || impl_->output_names.empty()) {
        throw std::runtime_error("Model declares no inputs or outputs: " + model_path);
    }

    std::vector<int64_t> s = impl_->session->GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
    if (s.size() == 4) {
        if (s[0] <= 0) s[0] = 1;
        if (s[1] <= 0) s[1] = 3;
        if (s[2] <= 0) s[2] = kDefaultInputSize;
        if (s[3] <= 0) s[3] = kDefaultInputSize;
    } else {
        s = {1, 3, kDefaultInputSize, kDefaultInputSize};
    }
    impl_->input_shape = std::move(s);
    impl_->ready = true;
#else
    impl_.reset();
    throw std::runtime_error("Neither RKNN nor ONNX Runtime support was compiled in");
#endif

    loaded_ = impl_->ready;
    std::cout << "[MODEL] Loaded " << runtimeName() << " model: " << model_path << std::endl;
    return loaded_;
}

bool CnnModel::release()
{
    if (impl_) {
#if defined(HEMASCAN_HAS_RKNN)
        if (impl_->ctx) {
            rknn_destroy(impl_->ctx);
            impl_->ctx = 0;
        }
        impl_->model_blob.clear();
        impl_->input_attrs.clear();
        impl_->output_attrs.clear();
#elif defined(HEMASCAN_HAS_ONNXRUNTIME)
        impl_->input_name_ptrs.clear();
        impl_->output_name_ptrs.clear();
        impl_->session.reset();
#endif
        impl_.reset();
        std::cout << "[MODEL] Released model resources: " << model_path_ << std::endl;
    }
    loaded_ = false;
    return loaded_;
}

int CnnModel::inputSize() const
{
    if (!loaded_ || !impl_ || impl_->input_shape.size() < 4) {
        return 0;
    }
    return static_cast<int>(impl_->input_shape[3]);
}

BackendOutput CnnModel::infer(const std::vector<float> &nchw, int input_size) const
{
    if (!loaded_ || !impl_ || !impl_->ready) {
        throw std::runtime_error("Model is not loaded");
    }
    const int target_h = static_cast<int>(impl_->input_shape[2]);
    const int target_w = static_cast<int>(impl_->input_shape[3]);
    if (target_h != input_size || target_w != input_size ||
        nchw.size() != static_cast<std::size_t>(3 * target_h * target_w)) {
        throw std::runtime_error("Input tensor does not match model shape " + std::to_string(target_w) + "x" +
                                 std::to_string(target_h));
    }

#if defined(HEMASCAN_HAS_RKNN)
    rknn_input input{};
    input.index = 0;
    input.type = RKNN_TENSOR_FLOAT32;
    input.size = static_cast<uint32_t>(nchw.size() * sizeof(float));
    input.pass_through = 0;

    std::vector<float> buffer;
    if (impl_->input_format == RKNN_TENSOR_NHWC) {
        const int plane = target_h * target_w;
        buffer.resize(nchw.size());
        for (int p = 0; p < plane; ++p) {
            for (int c = 0; c < 3; ++c) {
                buffer[p * 3 + c] = nchw[c * plane + p];
            }
        }
        input.fmt = RKNN_TENSOR_NHWC;
    } else {
        buffer = nchw;
        input.fmt = RKNN_TENSOR_NCHW;
    }
    input.buf = buffer.data();

    if (rknn_inputs_set(impl_->ctx, 1, &input) != RKNN_SUCC) {
        throw std::runtime_error("rknn_inputs_set failed");
    }
    if (rknn_run(impl_->ctx, nullptr) != RKNN_SUCC) {
        throw std::runtime_error("rknn_run failed");
    }

    std::vector<rknn_output> outputs(impl_->io_num.n_output);
    for (auto &out : outputs) {
        out.want_float = 1;
        out.is_prealloc = 0;
        out.buf = nullptr;
    }
    if (rknn_outputs_get(impl_->ctx, outputs.size(), outputs.data(), nullptr) != RKNN_SUCC) {
        throw std::runtime_error("rknn_outputs_get failed");
    }

    BackendOutput result;
    bool valid = !outputs.empty() && outputs.front().buf && outputs.front().size >= 2 * sizeof(float);
    if (valid) {
        const float *out = static_cast<const float *>(outputs.front().buf);
        result.risk_score = out[0];
        result.confidence = out[1];
    }
    rknn_outputs_release(impl_->ctx, outputs.size(), outputs.data());
    if (!valid) {
        throw std::runtime_error("Model produced fewer than two outputs");
    }
    return result;
#elif defined(HEMASCAN_HAS_ONNXRUNTIME)
    Ort::MemoryInfo mem_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
    Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
        mem_info,
        const_cast<float *>(nchw.data()),
        nchw.size(),
        impl_->input_shape.data(),
        impl_->input_shape.size());

    auto outputs = impl_->session->Run(
        Ort::RunOptions{nullptr},
        impl_->input_name_ptrs.data(),
        &input_tensor,
        1,
        impl_->output_name_ptrs.data(),
        impl_->output_name_ptrs.size());

    if (outputs.empty() || !outputs.front().IsTensor()) {
        throw std::runtime_error("Model produced no tensor output");
    }
    if (outputs.front().GetTensorTypeAndShapeInfo().GetElementCount() < 2) {
        throw std::runtime_error("Model produced fewer than two outputs");
    }
    const float *out = outputs.front().GetTensorData<float>();
    return BackendOutput{out[0], out[1]};
#else
    (void)nchw;
    throw std::runtime_error("No inference runtime compiled in");
#endif
}

} // namespace hemascan
