#include "stratus/forecast/LstmModel.hpp"
#include "stratus/core/Errors.hpp"

#include <cmath>
#include <random>

namespace stratus {

namespace {

inline double sigmoid(double z) { return 1.0 / (1.0 + std::exp(-z)); }

void expectSize(const std::vector<double>& v, std::size_t n, const std::string& what) {
    if (v.size() != n) {
        throw ModelLoadError(what + ": expected " + std::to_string(n) +
                             " values, got " + std::to_string(v.size()));
    }
}

// y += W x, W is rows x cols row-major.
void gemv(const std::vector<double>& w,
          const std::vector<double>& x,
          std::size_t rows,
          std::size_t cols,
          std::vector<double>& y) {
    for (std::size_t r = 0; r < rows; ++r) {
        const double* wr = w.data() + r * cols;
        double acc = 0.0;
        for (std::size_t c = 0; c < cols; ++c) {
            acc += wr[c] * x[c];
        }
        y[r] += acc;
    }
}

}

LstmModel::LstmModel(
    std::vector<LstmLayer> lstm,
    DenseLayer fc,
    std::string source
) : layers(std::move(lstm)),
    head(std::move(fc)),
    origin(std::move(source)) {
    if (layers.empty()) {
        throw ModelLoadError("model has no LSTM layers");
    }
    for (std::size_t l = 0; l < layers.size(); ++l) {
        const LstmLayer& L = layers[l];
        const std::string tag = "layer " + std::to_string(l);
        if (L.hidden_size == 0 || L.input_size == 0) {
            throw ModelLoadError(tag + ": zero-sized layer");
        }
        if (l > 0 && L.input_size != layers[l - 1].hidden_size) {
            throw ModelLoadError(tag + ": input width does not match previous hidden width");
        }
        const std::size_t G = 4 * L.hidden_size;
        expectSize(L.weight_ih, G * L.input_size, tag + " weight_ih");
        expectSize(L.weight_hh, G * L.hidden_size, tag + " weight_hh");
        expectSize(L.bias_ih, G, tag + " bias_ih");
        expectSize(L.bias_hh, G, tag + " bias_hh");
    }
    if (head.input_size != layers.back().hidden_size || head.output_size == 0) {
        throw ModelLoadError("linear head does not match the last hidden width");
    }
    expectSize(head.weight, head.output_size * head.input_size, "fc weight");
    expectSize(head.bias, head.output_size, "fc bias");
}

std::shared_ptr<const LstmModel> LstmModel::seeded(
    uint64_t seed,
    std::size_t input,
    std::size_t hidden,
    std::size_t num_layers,
    std::size_t output
) {
    std::mt19937_64 rng(seed);
    const double k = 1.0 / std::sqrt(static_cast<double>(hidden));
    std::uniform_real_distribution<double> dist(-k, k);

    auto fill = [&](std::size_t n) {
        std::vector<double> v(n);
        for (auto& x : v) x = dist(rng);
        return v;
    };

    std::vector<LstmLayer> lstm;
    for (std::size_t l = 0; l < num_layers; ++l) {
        LstmLayer L;
        L.input_size = (l == 0) ? input : hidden;
        L.hidden_size = hidden;
        L.weight_ih = fill(4 * hidden * L.input_size);
        L.weight_hh = fill(4 * hidden * hidden);
        L.bias_ih = fill(4 * hidden);
        L.bias_hh = fill(4 * hidden);
        lstm.push_back(std::move(L));
    }

    DenseLayer fc;
    fc.input_size = hidden;
    fc.output_size = output;
    fc.weight = fill(output * hidden);
    fc.bias = fill(output);

    return std::make_shared<const LstmModel>(
        std::move(lstm), std::move(fc), "seeded:" + std::to_string(seed));
}

std::vector<double> LstmModel::predict(
    const std::vector<std::vector<double>>& sequence
) const {
    if (sequence.empty()) {
        throw ModelInferenceError("empty input sequence");
    }

    std::vector<std::vector<double>> xs = sequence;
    for (const auto& x : xs) {
        if (x.size() != inputSize()) {
            throw ModelInferenceError(
                "input width " + std::to_string(x.size()) +
                " does not match model input " + std::to_string(inputSize()));
        }
    }

    for (const LstmLayer& L : layers) {
        const std::size_t H = L.hidden_size;
        std::vector<double> h(H, 0.0);
        std::vector<double> c(H, 0.0);
        std::vector<double> gates(4 * H);
        std::vector<std::vector<double>> out;
        out.reserve(xs.size());

        for (const auto& x : xs) {
            for (std::size_t g = 0; g < 4 * H; ++g) {
                gates[g] = L.bias_ih[g] + L.bias_hh[g];
            }
            gemv(L.weight_ih, x, 4 * H, L.input_size, gates);
            gemv(L.weight_hh, h, 4 * H, H, gates);

            for (std::size_t k = 0; k < H; ++k) {
                const double i = sigmoid(gates[k]);
                const double f = sigmoid(gates[H + k]);
                const double g = std::tanh(gates[2 * H + k]);
                const double o = sigmoid(gates[3 * H + k]);
                c[k] = f * c[k] + i * g;
                h[k] = o * std::tanh(c[k]);
            }
            out.push_back(h);
        }
        xs = std::move(out);
    }

    std::vector<double> y = head.bias;
    gemv(head.weight, xs.back(), head.output_size, head.input_size, y);

    for (double v : y) {
        if (!std::isfinite(v)) {
            throw ModelInferenceError("non-finite model output");
        }
    }
    return y;
}

}
