#include "stratus/config/EngineConfig.hpp"
#include "stratus/core/Errors.hpp"
#include "stratus/core/Log.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <type_traits>

using json = nlohmann::json;

namespace stratus {

namespace {

template <typename T>
void read(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    if (std::is_unsigned<T>::value && it->is_number() && it->get<double>() < 0.0) {
        throw ConfigError(std::string("config key '") + key + "' must be non-negative");
    }
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("config key '") + key + "': " + e.what());
    }
}

void readPolicy(const json& j, PolicyThresholds& p) {
    read(j, "window", p.window);
    read(j, "peak_scale_up", p.peak_scale_up);
    read(j, "sustained_scale_up", p.sustained_scale_up);
    read(j, "idle_cpu_avg", p.idle_cpu_avg);
    read(j, "idle_memory_avg", p.idle_memory_avg);
    read(j, "idle_cpu_peak", p.idle_cpu_peak);
    read(j, "volatility_stdev", p.volatility_stdev);
    read(j, "conf_default", p.conf_default);
    read(j, "conf_peak", p.conf_peak);
    read(j, "conf_sustained", p.conf_sustained);
    read(j, "conf_idle", p.conf_idle);
    read(j, "conf_volatile", p.conf_volatile);
    read(j, "conf_failed", p.conf_failed);
}

}

EngineConfig EngineConfig::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw ConfigError("cannot open config file: " + path);
    }
    std::stringstream ss;
    ss << f.rdbuf();

    EngineConfig cfg;
    cfg.mergeJson(ss.str());
    STRATUS_LOG_INFO("CONFIG", "loaded %s", path.c_str());
    return cfg;
}

void EngineConfig::mergeJson(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("config parse error: ") + e.what());
    }
    if (!j.is_object()) {
        throw ConfigError("config root must be a JSON object");
    }

    read(j, "default_horizon", default_horizon);
    read(j, "min_history", min_history);
    read(j, "sequence_window", sequence_window);
    read(j, "model_path", model_path);
    read(j, "model_seed", model_seed);
    read(j, "ensemble_min_rows", ensemble_min_rows);
    read(j, "ensemble_min_samples", ensemble_min_samples);
    read(j, "ensemble_max_window", ensemble_max_window);
    read(j, "forest_trees", forest_trees);
    read(j, "forest_seed", forest_seed);
    read(j, "forest_cache_capacity", forest_cache_capacity);
    read(j, "sequence_weight", sequence_weight);
    read(j, "ensemble_weight", ensemble_weight);
    read(j, "fallback_noise", fallback_noise);
    read(j, "fallback_lookback", fallback_lookback);
    read(j, "default_seed", default_seed);
    read(j, "log_level", log_level);

    auto it = j.find("policy");
    if (it != j.end() && it->is_object()) {
        readPolicy(*it, policy);
    }

    validate();
}

void EngineConfig::applyEnv() {
    if (const char* lvl = std::getenv("STRATUS_LOG_LEVEL")) {
        log_level = lvl;
    }
    if (const char* path = std::getenv("STRATUS_MODEL_PATH")) {
        model_path = path;
    }
    if (const char* seed = std::getenv("STRATUS_SEED")) {
        char* end = nullptr;
        unsigned long long v = std::strtoull(seed, &end, 10);
        if (end == seed || *end != '\0') {
            throw ConfigError(std::string("STRATUS_SEED is not an integer: ") + seed);
        }
        default_seed = static_cast<uint64_t>(v);
    }
}

void EngineConfig::validate() const {
    if (default_horizon < 1) {
        throw ConfigError("default_horizon must be >= 1");
    }
    if (min_history == 0) {
        throw ConfigError("min_history must be >= 1");
    }
    if (sequence_window == 0) {
        throw ConfigError("sequence_window must be >= 1");
    }
    if (ensemble_min_rows == 0 || ensemble_min_samples == 0) {
        throw ConfigError("ensemble_min_rows and ensemble_min_samples must be >= 1");
    }
    if (ensemble_max_window == 0) {
        throw ConfigError("ensemble_max_window must be >= 1");
    }
    if (forest_trees < 1) {
        throw ConfigError("forest_trees must be >= 1");
    }
    if (fallback_lookback == 0) {
        throw ConfigError("fallback_lookback must be >= 1");
    }
    if (sequence_weight < 0.0 || ensemble_weight < 0.0) {
        throw ConfigError("blend weights must be non-negative");
    }
    // Keeps blended percentages inside [0, 100].
    if (sequence_weight + ensemble_weight > 1.0 + 1e-9) {
        throw ConfigError("blend weights must sum to at most 1");
    }
    if (fallback_noise < 0.0) {
        throw ConfigError("fallback_noise must be non-negative");
    }
    if (policy.window < 0) {
        throw ConfigError("policy.window must be non-negative");
    }
}

}
