#pragma once

#include "stratus/core/Types.hpp"
#include "stratus/features/FeatureMatrix.hpp"
#include "stratus/forecast/NoiseSource.hpp"

#include <string>

namespace stratus {

// Per-call inputs shared by both forecasters.
struct ForecastContext {
    std::string resource_id;
    Timestamp as_of;
    NoiseSource& noise;
};

// Output of a single forecaster plus how much of it came from the fallback.
struct ForecastRun {
    ForecastSet points;
    int fallback_points = 0;
    bool cache_hit = false;

    bool modelUsed() const {
        return fallback_points < static_cast<int>(points.size());
    }
};

class Forecaster {
public:
    virtual ~Forecaster() = default;

    virtual std::string name() const = 0;

    // Always returns exactly `horizon` points; model failures are recovered
    // by the fallback estimator.
    virtual ForecastRun forecast(const FeatureMatrix& features,
                                 int horizon,
                                 ForecastContext& ctx) const = 0;
};

}
