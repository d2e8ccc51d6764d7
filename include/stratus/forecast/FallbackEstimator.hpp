#pragma once

#include "stratus/core/Types.hpp"
#include "stratus/features/FeatureMatrix.hpp"
#include "stratus/forecast/NoiseSource.hpp"

#include <array>
#include <cstddef>

namespace stratus {

// Baseline-plus-jitter forecast used whenever a model cannot proceed.
class FallbackEstimator {
public:
    static constexpr std::array<double, 4> DEFAULT_BASELINE = {20.0, 30.0, 15.0, 1000.0};

    FallbackEstimator(double noise_factor = 0.1, std::size_t lookback = 24);

    // Column means of the last min(lookback, rows) rows, or the defaults
    // for an empty matrix.
    std::array<double, 4> baseline(const FeatureMatrix& features) const;

    // Points for offsets first_offset+1 .. first_offset+count.
    ForecastSet estimate(const FeatureMatrix& features,
                         int first_offset,
                         int count,
                         const Timestamp& as_of,
                         NoiseSource& noise) const;

private:
    double noise_factor;
    std::size_t lookback;
};

}
