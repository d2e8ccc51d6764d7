#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace stratus {

struct PolicyThresholds {
    int window = 6;                     // forecast points considered

    double peak_scale_up = 85.0;        // max cpu or memory
    double sustained_scale_up = 70.0;   // avg cpu or memory
    double idle_cpu_avg = 20.0;
    double idle_memory_avg = 30.0;
    double idle_cpu_peak = 40.0;
    double volatility_stdev = 20.0;

    double conf_default = 0.8;
    double conf_peak = 0.9;
    double conf_sustained = 0.7;
    double conf_idle = 0.6;
    double conf_volatile = 0.5;
    double conf_failed = 0.1;
};

struct EngineConfig {
    int default_horizon = 24;
    std::size_t min_history = 24;

    // Sequence forecaster
    std::size_t sequence_window = 24;
    std::string model_path;             // empty = seeded stand-in weights
    uint64_t model_seed = 42;

    // Ensemble forecaster
    std::size_t ensemble_min_rows = 10;
    std::size_t ensemble_min_samples = 5;
    std::size_t ensemble_max_window = 12;
    int forest_trees = 100;
    uint64_t forest_seed = 42;
    std::size_t forest_cache_capacity = 0;   // 0 disables the cache

    // Combiner
    double sequence_weight = 0.6;
    double ensemble_weight = 0.4;

    // Fallback
    double fallback_noise = 0.1;
    std::size_t fallback_lookback = 24;

    // Jitter seed used when a request does not carry one.
    uint64_t default_seed = 0;

    PolicyThresholds policy;

    std::string log_level = "info";

    // Overlay keys found in a JSON file. Throws ConfigError.
    static EngineConfig load(const std::string& path);
    void mergeJson(const std::string& text);

    // STRATUS_LOG_LEVEL, STRATUS_MODEL_PATH, STRATUS_SEED.
    void applyEnv();

    // Throws ConfigError when a value is out of range.
    void validate() const;
};

}
