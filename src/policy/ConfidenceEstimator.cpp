#include "stratus/policy/ConfidenceEstimator.hpp"
#include "stratus/core/Stats.hpp"

#include <algorithm>
#include <cmath>

namespace stratus {

double ConfidenceEstimator::estimate(const FeatureMatrix& features) {
    if (features.rows() < RECENT_ROWS || features.cols() < FeatureMatrix::BASE_COLUMNS) {
        return SHORT_HISTORY;
    }

    const double cv_cpu = stats::cv(features.tail(FeatureMatrix::CPU, RECENT_ROWS));
    const double cv_mem = stats::cv(features.tail(FeatureMatrix::MEMORY, RECENT_ROWS));

    const double stability = 1.0 / (1.0 + cv_cpu + cv_mem);
    const double data = std::min(1.0, static_cast<double>(features.rows()) / FULL_HISTORY_ROWS);

    const double confidence = 0.7 * stability + 0.3 * data;
    // A mean of exactly -1e-8 zeroes the CV denominator.
    if (!std::isfinite(confidence)) {
        return FLOOR;
    }
    return std::clamp(confidence, FLOOR, CEILING);
}

}
