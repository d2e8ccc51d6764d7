#pragma once

#include "stratus/forecast/FallbackEstimator.hpp"
#include "stratus/forecast/Forecaster.hpp"
#include "stratus/forecast/SequenceModel.hpp"

#include <memory>

namespace stratus {

// Autoregressive rollout of a sequence model over a standardized context
// window. A failing step keeps the points already produced and hands the
// rest of the horizon to the fallback estimator.
class SequenceForecaster : public Forecaster {
public:
    SequenceForecaster(std::shared_ptr<const SequenceModel> model,
                       std::size_t window,
                       FallbackEstimator fallback);

    std::string name() const override { return "sequence"; }

    ForecastRun forecast(const FeatureMatrix& features,
                         int horizon,
                         ForecastContext& ctx) const override;

private:
    std::shared_ptr<const SequenceModel> model;
    std::size_t window;
    FallbackEstimator fallback;
};

}
