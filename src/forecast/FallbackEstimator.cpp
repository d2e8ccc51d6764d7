#include "stratus/forecast/FallbackEstimator.hpp"
#include "stratus/core/Log.hpp"
#include "stratus/core/Stats.hpp"

namespace stratus {

FallbackEstimator::FallbackEstimator(
    double noise,
    std::size_t lb
) : noise_factor(noise),
    lookback(lb) {}

std::array<double, 4> FallbackEstimator::baseline(
    const FeatureMatrix& features
) const {
    if (features.empty() || features.cols() < FeatureMatrix::BASE_COLUMNS) {
        return DEFAULT_BASELINE;
    }

    std::array<double, 4> base{};
    for (std::size_t c = 0; c < FeatureMatrix::BASE_COLUMNS; ++c) {
        base[c] = stats::mean(features.tail(c, lookback));
    }
    return base;
}

ForecastSet FallbackEstimator::estimate(
    const FeatureMatrix& features,
    int first_offset,
    int count,
    const Timestamp& as_of,
    NoiseSource& noise
) const {
    ForecastSet out;
    if (count <= 0) return out;

    const std::array<double, 4> base = baseline(features);
    out.reserve(static_cast<std::size_t>(count));

    for (int i = 0; i < count; ++i) {
        // Field order matters for reproducibility: one draw per field.
        const double cpu  = base[0] * (1.0 + noise.gaussian(0.0, noise_factor));
        const double mem  = base[1] * (1.0 + noise.gaussian(0.0, noise_factor));
        const double disk = base[2] * (1.0 + noise.gaussian(0.0, noise_factor));
        const double net  = base[3] * (1.0 + noise.gaussian(0.0, noise_factor));

        out.push_back(make_point(first_offset + i + 1, as_of, cpu, mem, disk, net));
    }

    STRATUS_LOG_DEBUG("FALLBACK", "estimated %d points from offset %d (base cpu=%.2f mem=%.2f)",
                      count, first_offset + 1, base[0], base[1]);
    return out;
}

}
