#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <boost/date_time/posix_time/posix_time_types.hpp>

namespace stratus {

using Timestamp = boost::posix_time::ptime;

// One monitoring sample. Any field may be missing.
struct MetricSample {
    std::optional<Timestamp> timestamp;
    std::optional<double> cpu_percent;
    std::optional<double> memory_percent;
    std::optional<double> disk_percent;
    std::optional<double> network_in_bytes;
    std::optional<double> network_out_bytes;
};

struct ForecastPoint {
    int offset_hours = 0;
    Timestamp timestamp;
    double cpu_percent = 0.0;
    double memory_percent = 0.0;
    double disk_percent = 0.0;
    double network_usage = 0.0;
};

using ForecastSet = std::vector<ForecastPoint>;

enum class Action : uint8_t {
    MAINTAIN,
    SCALE_UP,
    SCALE_DOWN,
    OPTIMIZE
};

inline const char* action_str(Action a) noexcept {
    switch (a) {
        case Action::MAINTAIN:   return "maintain";
        case Action::SCALE_UP:   return "scale_up";
        case Action::SCALE_DOWN: return "scale_down";
        case Action::OPTIMIZE:   return "optimize";
        default: return "unknown";
    }
}

struct AggregateMetrics {
    double avg_cpu = 0.0;
    double avg_memory = 0.0;
    double max_cpu = 0.0;
    double max_memory = 0.0;
};

struct Decision {
    std::string resource_id;
    Action action = Action::MAINTAIN;
    double confidence = 0.0;
    // Empty when the policy failed closed.
    std::optional<AggregateMetrics> aggregate;
    std::string reasoning;
};

struct ModelInfo {
    bool sequence_used = false;
    bool ensemble_used = false;
    bool ensemble = false;
    int sequence_fallback_points = 0;
    int ensemble_fallback_points = 0;
    bool ensemble_cache_hit = false;
};

struct ForecastResult {
    std::string resource_id;
    int horizon = 0;
    ForecastSet predictions;
    double confidence = 0.0;
    ModelInfo model_info;
    Timestamp generated_at;
};

using CurrentMetrics = std::map<std::string, double>;

// Clamp to the ForecastPoint invariants.
ForecastPoint make_point(int offset_hours,
                         const Timestamp& as_of,
                         double cpu,
                         double memory,
                         double disk,
                         double network);

}
