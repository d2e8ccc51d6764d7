#pragma once

#include "stratus/forecast/SequenceModel.hpp"

#include <onnxruntime_cxx_api.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace stratus {

// Trained sequence model exported to ONNX. The graph takes one float
// tensor [1, T, inputSize()] and returns at least outputSize() floats;
// the last outputSize() values are the next step.
class OnnxSequenceModel : public SequenceModel {
public:
    // Throws ModelLoadError when the file is missing or not a usable graph.
    static std::shared_ptr<const OnnxSequenceModel> load(const std::string& path);

    std::vector<double> predict(const std::vector<std::vector<double>>& sequence) const override;

    std::size_t inputSize() const override { return n_input; }
    std::size_t outputSize() const override { return n_output; }
    const std::string& source() const override { return path; }

    const std::string& inputName() const { return input_name; }
    const std::string& outputName() const { return output_name; }

    OnnxSequenceModel(
        std::unique_ptr<Ort::Env> env,
        std::unique_ptr<Ort::Session> session,
        std::string path
    );

private:
    std::unique_ptr<Ort::Env> env;
    std::unique_ptr<Ort::Session> session;
    std::string path;
    std::string input_name;
    std::string output_name;
    std::size_t n_input = 0;
    std::size_t n_output = 0;
    mutable std::mutex mutex;
};

}
