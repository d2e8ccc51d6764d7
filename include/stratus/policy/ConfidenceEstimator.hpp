#pragma once

#include "stratus/features/FeatureMatrix.hpp"

namespace stratus {

// Forecast confidence from the stability and amount of recent history.
class ConfidenceEstimator {
public:
    static constexpr std::size_t RECENT_ROWS = 24;
    static constexpr double FULL_HISTORY_ROWS = 168.0;   // one week hourly
    static constexpr double SHORT_HISTORY = 0.5;
    static constexpr double FLOOR = 0.1;
    static constexpr double CEILING = 0.95;

    static double estimate(const FeatureMatrix& features);
};

}
