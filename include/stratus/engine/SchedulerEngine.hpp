#pragma once

#include "stratus/config/EngineConfig.hpp"
#include "stratus/core/Types.hpp"
#include "stratus/forecast/EnsembleForecaster.hpp"
#include "stratus/forecast/ForecastCombiner.hpp"
#include "stratus/forecast/ForestCache.hpp"
#include "stratus/forecast/SequenceForecaster.hpp"
#include "stratus/forecast/SequenceModel.hpp"
#include "stratus/policy/DecisionPolicy.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stratus {

inline constexpr const char* ENGINE_VERSION = "1.0.0";

struct ForecastRequest {
    std::string resource_id;
    std::vector<MetricSample> history;
    int horizon = 0;                    // 0 = config default
    std::optional<uint64_t> seed;       // jitter seed, default from config
    std::optional<Timestamp> as_of;     // forecast origin, default now (UTC)
};

struct HealthStatus {
    std::string status;
    std::string model_source;
    std::string version;
    std::size_t cached_forests = 0;
    Timestamp timestamp;
};

// Stateless forecasting and scaling-decision facade. All methods are const
// and safe to call concurrently.
class SchedulerEngine {
public:
    // Loads cfg.model_path (ONNX) when set, else seeded stand-in weights.
    // Throws ModelLoadError / ConfigError.
    explicit SchedulerEngine(EngineConfig cfg);
    SchedulerEngine(EngineConfig cfg, std::shared_ptr<const SequenceModel> model);

    // Throws InsufficientHistoryError, FeatureExtractionError,
    // std::invalid_argument (horizon < 1).
    ForecastResult forecast(const ForecastRequest& req) const;

    ForecastResult forecast(const std::string& resource_id,
                            const std::vector<MetricSample>& history,
                            int horizon = 24) const;

    // Never throws.
    Decision decide(const std::string& resource_id,
                    const CurrentMetrics& current,
                    const ForecastSet& predictions) const noexcept;

    HealthStatus health() const;

    const EngineConfig& config() const { return cfg; }

private:
    EngineConfig cfg;
    std::shared_ptr<const SequenceModel> model;
    std::shared_ptr<ForestCache> cache;
    SequenceForecaster sequence;
    EnsembleForecaster ensemble;
    ForecastCombiner combiner;
    DecisionPolicy policy;
};

}
