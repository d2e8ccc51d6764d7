#pragma once

#include "stratus/forecast/SequenceModel.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace stratus {

// Weights of one LSTM layer, gate order i, f, g, o (rows 0..4H).
// Matrices are row-major.
struct LstmLayer {
    std::size_t input_size = 0;
    std::size_t hidden_size = 0;
    std::vector<double> weight_ih;   // 4H x input
    std::vector<double> weight_hh;   // 4H x H
    std::vector<double> bias_ih;     // 4H
    std::vector<double> bias_hh;     // 4H
};

struct DenseLayer {
    std::size_t input_size = 0;
    std::size_t output_size = 0;
    std::vector<double> weight;      // out x in
    std::vector<double> bias;        // out
};

// Stacked LSTM with a linear head applied to the last hidden state, run
// in-process. Stand-in used when no ONNX artifact is configured.
class LstmModel : public SequenceModel {
public:
    static constexpr std::size_t INPUT = 4;
    static constexpr std::size_t HIDDEN = 64;
    static constexpr std::size_t LAYERS = 2;
    static constexpr std::size_t OUTPUT = 4;

    // Throws ModelLoadError on inconsistent shapes.
    LstmModel(std::vector<LstmLayer> layers, DenseLayer head, std::string source);

    // Deterministic stand-in weights, uniform(-1/sqrt(H), 1/sqrt(H)).
    static std::shared_ptr<const LstmModel> seeded(
        uint64_t seed,
        std::size_t input = INPUT,
        std::size_t hidden = HIDDEN,
        std::size_t num_layers = LAYERS,
        std::size_t output = OUTPUT);

    // Throws ModelInferenceError on a shape mismatch or non-finite output.
    std::vector<double> predict(const std::vector<std::vector<double>>& sequence) const override;

    std::size_t inputSize() const override { return layers.front().input_size; }
    std::size_t hiddenSize() const { return layers.front().hidden_size; }
    std::size_t numLayers() const { return layers.size(); }
    std::size_t outputSize() const override { return head.output_size; }
    const std::string& source() const override { return origin; }

private:
    std::vector<LstmLayer> layers;
    DenseLayer head;
    std::string origin;
};

}
