#pragma once

#include "stratus/forecast/FallbackEstimator.hpp"
#include "stratus/forecast/ForestCache.hpp"
#include "stratus/forecast/Forecaster.hpp"
#include "stratus/forecast/RegressionForest.hpp"

#include <array>
#include <memory>

namespace stratus {

struct EnsembleSettings {
    std::size_t min_rows = 10;
    std::size_t min_samples = 5;
    std::size_t max_window = 12;
    ForestParams forest;
};

// Window-statistics regression forest, fit fresh from each call's history.
class EnsembleForecaster : public Forecaster {
public:
    static constexpr std::size_t DESCRIPTOR_WIDTH = 6;
    using Descriptor = std::array<double, DESCRIPTOR_WIDTH>;

    EnsembleForecaster(EnsembleSettings settings,
                       FallbackEstimator fallback,
                       std::shared_ptr<ForestCache> cache = nullptr);

    std::string name() const override { return "ensemble"; }

    ForecastRun forecast(const FeatureMatrix& features,
                         int horizon,
                         ForecastContext& ctx) const override;

    // mean/stdev/max of cpu and memory over the window rows.
    static Descriptor describe(const std::vector<std::vector<double>>& window);

    // min(max_window, rows / 2)
    std::size_t windowSize(std::size_t rows) const;

private:
    std::shared_ptr<const RegressionForest> train(const FeatureMatrix& features,
                                                  std::size_t window,
                                                  ForecastContext& ctx,
                                                  bool& cache_hit) const;

    EnsembleSettings settings;
    FallbackEstimator fallback;
    std::shared_ptr<ForestCache> cache;
};

}
