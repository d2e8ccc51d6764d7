#include "stratus/forecast/EnsembleForecaster.hpp"
#include "stratus/core/Errors.hpp"
#include "stratus/core/Log.hpp"
#include "stratus/core/Stats.hpp"

#include <algorithm>
#include <cmath>

namespace stratus {

EnsembleForecaster::EnsembleForecaster(
    EnsembleSettings s,
    FallbackEstimator fb,
    std::shared_ptr<ForestCache> c
) : settings(s),
    fallback(fb),
    cache(std::move(c)) {}

std::size_t EnsembleForecaster::windowSize(std::size_t rows) const {
    return std::min(settings.max_window, rows / 2);
}

EnsembleForecaster::Descriptor EnsembleForecaster::describe(
    const std::vector<std::vector<double>>& window
) {
    std::vector<double> cpu;
    std::vector<double> mem;
    cpu.reserve(window.size());
    mem.reserve(window.size());
    for (const auto& r : window) {
        cpu.push_back(r[FeatureMatrix::CPU]);
        mem.push_back(r[FeatureMatrix::MEMORY]);
    }

    return {
        stats::mean(cpu),
        stats::stdev(cpu),
        stats::mean(mem),
        stats::stdev(mem),
        stats::max(cpu),
        stats::max(mem)
    };
}

std::shared_ptr<const RegressionForest> EnsembleForecaster::train(
    const FeatureMatrix& features,
    std::size_t window,
    ForecastContext& ctx,
    bool& cache_hit
) const {
    std::string key;
    if (cache) {
        key = ForestCache::key(ctx.resource_id, features);
        if (auto hit = cache->find(key)) {
            cache_hit = true;
            STRATUS_LOG_DEBUG("CACHE", "%s: forest hit %.12s",
                              ctx.resource_id.c_str(), key.c_str());
            return hit;
        }
    }

    const std::vector<std::vector<double>> base = features.baseTail(features.rows());

    std::vector<std::vector<double>> X;
    std::vector<std::vector<double>> Y;
    X.reserve(base.size() - window);
    Y.reserve(base.size() - window);

    for (std::size_t i = window; i < base.size(); ++i) {
        const std::vector<std::vector<double>> w(
            base.begin() + static_cast<std::ptrdiff_t>(i - window),
            base.begin() + static_cast<std::ptrdiff_t>(i));
        const Descriptor d = describe(w);
        X.emplace_back(d.begin(), d.end());
        Y.push_back(base[i]);
    }

    auto forest = std::make_shared<const RegressionForest>(
        RegressionForest::fit(X, Y, settings.forest));

    STRATUS_LOG_DEBUG("ENSEMBLE", "%s: fit %zu trees on %zu samples (window %zu)",
                      ctx.resource_id.c_str(), forest->treeCount(), X.size(), window);

    if (cache) {
        cache->insert(key, forest);
    }
    return forest;
}

ForecastRun EnsembleForecaster::forecast(
    const FeatureMatrix& features,
    int horizon,
    ForecastContext& ctx
) const {
    ForecastRun run;
    if (horizon <= 0) return run;

    const std::size_t n = features.rows();
    const std::size_t window = windowSize(n);
    const std::size_t samples = n > window ? n - window : 0;

    if (n < settings.min_rows || samples < settings.min_samples || window == 0 ||
        features.cols() < FeatureMatrix::BASE_COLUMNS) {
        STRATUS_LOG_INFO("ENSEMBLE", "%s: %zu rows / %zu samples below minimum, using fallback",
                         ctx.resource_id.c_str(), n, samples);
        run.points = fallback.estimate(features, 0, horizon, ctx.as_of, ctx.noise);
        run.fallback_points = horizon;
        return run;
    }

    run.points.reserve(static_cast<std::size_t>(horizon));

    try {
        const auto forest = train(features, window, ctx, run.cache_hit);

        std::vector<std::vector<double>> current = features.baseTail(window);
        for (int h = 0; h < horizon; ++h) {
            const Descriptor d = describe(current);
            std::vector<double> pred = forest->predict(std::vector<double>(d.begin(), d.end()));
            if (pred.size() < FeatureMatrix::BASE_COLUMNS) {
                throw ModelInferenceError("forest produced too few outputs");
            }
            pred.resize(FeatureMatrix::BASE_COLUMNS);
            for (double v : pred) {
                if (!std::isfinite(v)) {
                    throw ModelInferenceError("non-finite prediction at step " + std::to_string(h + 1));
                }
            }

            run.points.push_back(make_point(h + 1, ctx.as_of, pred[0], pred[1], pred[2], pred[3]));

            current.erase(current.begin());
            current.push_back(std::move(pred));
        }
    } catch (const ModelInferenceError& e) {
        const int produced = static_cast<int>(run.points.size());
        STRATUS_LOG_WARN("ENSEMBLE", "%s: %s; fallback for %d of %d points",
                         ctx.resource_id.c_str(), e.what(), horizon - produced, horizon);

        ForecastSet rest = fallback.estimate(features, produced, horizon - produced,
                                             ctx.as_of, ctx.noise);
        run.fallback_points = horizon - produced;
        run.points.insert(run.points.end(), rest.begin(), rest.end());
    }

    return run;
}

}
