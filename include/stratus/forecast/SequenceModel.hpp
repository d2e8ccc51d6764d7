#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace stratus {

// One step of a sequence model: a window of standardized metric rows in,
// the next standardized row out. Implementations are immutable after
// construction and may be shared across threads.
class SequenceModel {
public:
    virtual ~SequenceModel() = default;

    // sequence: T rows of inputSize() values. Returns outputSize() values.
    // Throws ModelInferenceError.
    virtual std::vector<double> predict(const std::vector<std::vector<double>>& sequence) const = 0;

    virtual std::size_t inputSize() const = 0;
    virtual std::size_t outputSize() const = 0;

    // Artifact path or stand-in tag, reported by health().
    virtual const std::string& source() const = 0;
};

}
