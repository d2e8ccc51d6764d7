#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace stratus {

// Forecast called with fewer samples than the minimum history.
class InsufficientHistoryError : public std::runtime_error {
public:
    InsufficientHistoryError(std::size_t have, std::size_t need)
        : std::runtime_error(
              "insufficient history: " + std::to_string(have) +
              " samples, need at least " + std::to_string(need)),
          have_(have),
          need_(need) {}

    std::size_t have() const { return have_; }
    std::size_t need() const { return need_; }

private:
    std::size_t have_;
    std::size_t need_;
};

// Input cannot be coerced into a rectangular numeric table.
class FeatureExtractionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Raised inside a forecaster; always recovered through the fallback estimator.
class ModelInferenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ModelLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}
