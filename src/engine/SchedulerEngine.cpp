#include "stratus/engine/SchedulerEngine.hpp"
#include "stratus/core/Errors.hpp"
#include "stratus/core/Log.hpp"
#include "stratus/features/FeatureExtractor.hpp"
#include "stratus/forecast/LstmModel.hpp"
#include "stratus/forecast/OnnxSequenceModel.hpp"
#include "stratus/policy/ConfidenceEstimator.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>

#include <stdexcept>

namespace stratus {

namespace {

std::shared_ptr<const SequenceModel> loadModel(const EngineConfig& cfg) {
    if (!cfg.model_path.empty()) {
        return OnnxSequenceModel::load(cfg.model_path);
    }
    STRATUS_LOG_INFO("ENGINE", "no model artifact configured, using seeded weights (seed %llu)",
                     static_cast<unsigned long long>(cfg.model_seed));
    return LstmModel::seeded(cfg.model_seed);
}

EnsembleSettings ensembleSettings(const EngineConfig& cfg) {
    EnsembleSettings s;
    s.min_rows = cfg.ensemble_min_rows;
    s.min_samples = cfg.ensemble_min_samples;
    s.max_window = cfg.ensemble_max_window;
    s.forest.n_trees = cfg.forest_trees;
    s.forest.seed = cfg.forest_seed;
    return s;
}

std::shared_ptr<ForestCache> makeCache(const EngineConfig& cfg) {
    if (cfg.forest_cache_capacity == 0) return nullptr;
    return std::make_shared<ForestCache>(cfg.forest_cache_capacity);
}

// Second jitter stream so the two forecasters draw independently.
constexpr uint64_t ENSEMBLE_STREAM = 0x9e3779b97f4a7c15ULL;

}

SchedulerEngine::SchedulerEngine(EngineConfig c)
    : SchedulerEngine(c, loadModel(c)) {}

SchedulerEngine::SchedulerEngine(
    EngineConfig c,
    std::shared_ptr<const SequenceModel> m
) : cfg(std::move(c)),
    model(std::move(m)),
    cache(makeCache(cfg)),
    sequence(model, cfg.sequence_window,
             FallbackEstimator(cfg.fallback_noise, cfg.fallback_lookback)),
    ensemble(ensembleSettings(cfg),
             FallbackEstimator(cfg.fallback_noise, cfg.fallback_lookback),
             cache),
    combiner(cfg.sequence_weight, cfg.ensemble_weight),
    policy(cfg.policy) {
    cfg.validate();
    if (!model) {
        throw ModelLoadError("sequence model is null");
    }
}

ForecastResult SchedulerEngine::forecast(const ForecastRequest& req) const {
    const int horizon = req.horizon == 0 ? cfg.default_horizon : req.horizon;
    if (horizon < 1) {
        throw std::invalid_argument("horizon must be >= 1, got " + std::to_string(horizon));
    }
    if (req.history.size() < cfg.min_history) {
        throw InsufficientHistoryError(req.history.size(), cfg.min_history);
    }

    const FeatureMatrix features = FeatureExtractor::extract(req.history);

    const uint64_t seed = req.seed.value_or(cfg.default_seed);
    const Timestamp as_of = req.as_of.value_or(
        boost::posix_time::second_clock::universal_time());

    SeededNoise seq_noise(seed);
    SeededNoise ens_noise(seed ^ ENSEMBLE_STREAM);
    ForecastContext seq_ctx{req.resource_id, as_of, seq_noise};
    ForecastContext ens_ctx{req.resource_id, as_of, ens_noise};

    const Forecaster& primary = sequence;
    const Forecaster& secondary = ensemble;
    const ForecastRun seq_run = primary.forecast(features, horizon, seq_ctx);
    const ForecastRun ens_run = secondary.forecast(features, horizon, ens_ctx);

    ForecastResult out;
    out.resource_id = req.resource_id;
    out.horizon = horizon;
    out.predictions = combiner.combine(seq_run.points, ens_run.points);
    out.confidence = ConfidenceEstimator::estimate(features);
    out.model_info.sequence_used = seq_run.modelUsed();
    out.model_info.ensemble_used = ens_run.modelUsed();
    out.model_info.ensemble = !seq_run.points.empty() && !ens_run.points.empty();
    out.model_info.sequence_fallback_points = seq_run.fallback_points;
    out.model_info.ensemble_fallback_points = ens_run.fallback_points;
    out.model_info.ensemble_cache_hit = ens_run.cache_hit;
    out.generated_at = boost::posix_time::microsec_clock::universal_time();

    STRATUS_LOG_INFO("ENGINE", "%s: forecast %d points from %zu samples, confidence %.3f "
                     "(fallback seq=%d ens=%d)",
                     req.resource_id.c_str(), horizon, req.history.size(), out.confidence,
                     seq_run.fallback_points, ens_run.fallback_points);
    return out;
}

ForecastResult SchedulerEngine::forecast(
    const std::string& resource_id,
    const std::vector<MetricSample>& history,
    int horizon
) const {
    if (horizon < 1) {
        throw std::invalid_argument("horizon must be >= 1, got " + std::to_string(horizon));
    }
    ForecastRequest req;
    req.resource_id = resource_id;
    req.history = history;
    req.horizon = horizon;
    return forecast(req);
}

Decision SchedulerEngine::decide(
    const std::string& resource_id,
    const CurrentMetrics& current,
    const ForecastSet& predictions
) const noexcept {
    return policy.decide(resource_id, current, predictions);
}

HealthStatus SchedulerEngine::health() const {
    HealthStatus h;
    h.status = "healthy";
    h.model_source = model->source();
    h.version = ENGINE_VERSION;
    h.cached_forests = cache ? cache->size() : 0;
    h.timestamp = boost::posix_time::second_clock::universal_time();
    return h;
}

}
