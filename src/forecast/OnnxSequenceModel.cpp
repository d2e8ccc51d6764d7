#include "stratus/forecast/OnnxSequenceModel.hpp"
#include "stratus/core/Errors.hpp"
#include "stratus/core/Log.hpp"

#include <array>
#include <cmath>
#include <fstream>

namespace stratus {

namespace {

constexpr std::size_t DEFAULT_WIDTH = 4;

// Fixed last dimension, or the default when the graph leaves it dynamic.
std::size_t lastDim(const std::vector<int64_t>& shape) {
    if (shape.empty() || shape.back() <= 0) return DEFAULT_WIDTH;
    return static_cast<std::size_t>(shape.back());
}

}

OnnxSequenceModel::OnnxSequenceModel(
    std::unique_ptr<Ort::Env> e,
    std::unique_ptr<Ort::Session> s,
    std::string p
) : env(std::move(e)),
    session(std::move(s)),
    path(std::move(p)) {
    if (!env || !session) {
        throw ModelLoadError("ONNX session not initialized: " + path);
    }
    if (session->GetInputCount() != 1 || session->GetOutputCount() < 1) {
        throw ModelLoadError("ONNX model must have one input and at least one output: " + path);
    }

    Ort::AllocatorWithDefaultOptions alloc;
    input_name = session->GetInputNameAllocated(0, alloc).get();
    output_name = session->GetOutputNameAllocated(0, alloc).get();

    Ort::TypeInfo in_info = session->GetInputTypeInfo(0);
    auto in_tensor = in_info.GetTensorTypeAndShapeInfo();
    if (in_tensor.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
        throw ModelLoadError("ONNX model input is not float32: " + path);
    }
    const std::vector<int64_t> in_shape = in_tensor.GetShape();
    if (in_shape.size() != 3) {
        throw ModelLoadError("ONNX model input must be [batch, time, features]: " + path);
    }
    n_input = lastDim(in_shape);

    Ort::TypeInfo out_info = session->GetOutputTypeInfo(0);
    n_output = lastDim(out_info.GetTensorTypeAndShapeInfo().GetShape());
}

std::shared_ptr<const OnnxSequenceModel> OnnxSequenceModel::load(const std::string& path) {
    if (!std::ifstream(path).good()) {
        throw ModelLoadError("cannot open model artifact: " + path);
    }

    try {
        auto env = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "stratus");
        Ort::SessionOptions opts;
        opts.SetIntraOpNumThreads(1);
        opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_BASIC);
        auto session = std::make_unique<Ort::Session>(*env, path.c_str(), opts);

        auto model = std::make_shared<const OnnxSequenceModel>(
            std::move(env), std::move(session), path);
        STRATUS_LOG_INFO("SEQ", "loaded ONNX model %s (input '%s' x%zu, output '%s' x%zu)",
                         path.c_str(), model->inputName().c_str(), model->inputSize(),
                         model->outputName().c_str(), model->outputSize());
        return model;
    } catch (const Ort::Exception& e) {
        throw ModelLoadError("cannot load ONNX model " + path + ": " + e.what());
    }
}

std::vector<double> OnnxSequenceModel::predict(
    const std::vector<std::vector<double>>& sequence
) const {
    if (sequence.empty()) {
        throw ModelInferenceError("empty input sequence");
    }

    std::vector<float> data;
    data.reserve(sequence.size() * n_input);
    for (const auto& row : sequence) {
        if (row.size() != n_input) {
            throw ModelInferenceError(
                "input width " + std::to_string(row.size()) +
                " does not match model input " + std::to_string(n_input));
        }
        for (double v : row) data.push_back(static_cast<float>(v));
    }

    const std::array<int64_t, 3> shape = {
        1, static_cast<int64_t>(sequence.size()), static_cast<int64_t>(n_input)};

    std::vector<double> out;
    std::lock_guard<std::mutex> lock(mutex);
    try {
        Ort::MemoryInfo mem_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
        Ort::Value input = Ort::Value::CreateTensor<float>(
            mem_info, data.data(), data.size(), shape.data(), shape.size());

        const char* input_names[] = {input_name.c_str()};
        const char* output_names[] = {output_name.c_str()};
        auto outputs = session->Run(Ort::RunOptions{nullptr},
                                    input_names, &input, 1,
                                    output_names, 1);

        const std::size_t count = outputs[0].GetTensorTypeAndShapeInfo().GetElementCount();
        if (count < n_output) {
            throw ModelInferenceError(
                "model returned " + std::to_string(count) +
                " values, expected " + std::to_string(n_output));
        }
        const float* y = outputs[0].GetTensorData<float>();
        out.assign(y + (count - n_output), y + count);
    } catch (const Ort::Exception& e) {
        throw ModelInferenceError(std::string("ONNX inference failed: ") + e.what());
    }

    for (double v : out) {
        if (!std::isfinite(v)) {
            throw ModelInferenceError("non-finite model output");
        }
    }
    return out;
}

}
