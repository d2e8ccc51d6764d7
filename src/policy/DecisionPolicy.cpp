#include "stratus/policy/DecisionPolicy.hpp"
#include "stratus/core/Log.hpp"
#include "stratus/core/Stats.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

namespace stratus {

namespace {

double currentValue(const CurrentMetrics& current, const char* key) {
    auto it = current.find(key);
    if (it == current.end()) return 0.0;
    if (!std::isfinite(it->second)) {
        throw std::invalid_argument(std::string("non-finite current metric ") + key);
    }
    return it->second;
}

template <typename... Args>
std::string format(const char* fmt, Args... args) {
    const int len = std::snprintf(nullptr, 0, fmt, args...);
    if (len <= 0) return std::string();
    std::string out(static_cast<std::size_t>(len), '\0');
    std::snprintf(&out[0], out.size() + 1, fmt, args...);
    return out;
}

}

DecisionPolicy::DecisionPolicy(PolicyThresholds thresholds)
    : limits(thresholds) {}

Decision DecisionPolicy::decide(
    const std::string& resource_id,
    const CurrentMetrics& current,
    const ForecastSet& predictions
) const noexcept {
    try {
        return evaluate(resource_id, current, predictions);
    } catch (const std::exception& e) {
        STRATUS_LOG_ERROR("POLICY", "%s: decision failed: %s", resource_id.c_str(), e.what());

        Decision d;
        d.resource_id = resource_id;
        d.action = Action::MAINTAIN;
        d.confidence = limits.conf_failed;
        d.reasoning = std::string("decision analysis failed: ") + e.what();
        return d;
    }
}

Decision DecisionPolicy::evaluate(
    const std::string& resource_id,
    const CurrentMetrics& current,
    const ForecastSet& predictions
) const {
    const double now_cpu = currentValue(current, "cpu_usage_percent");
    const double now_mem = currentValue(current, "memory_usage_percent");

    const std::size_t n = std::min(predictions.size(),
                                   static_cast<std::size_t>(std::max(limits.window, 0)));
    std::vector<double> cpu;
    std::vector<double> mem;
    cpu.reserve(n);
    mem.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        const ForecastPoint& p = predictions[i];
        if (!std::isfinite(p.cpu_percent) || !std::isfinite(p.memory_percent)) {
            throw std::invalid_argument("non-finite forecast value at point " + std::to_string(i));
        }
        cpu.push_back(p.cpu_percent);
        mem.push_back(p.memory_percent);
    }

    AggregateMetrics agg;
    agg.avg_cpu = stats::mean(cpu);
    agg.avg_memory = stats::mean(mem);
    agg.max_cpu = stats::max(cpu);
    agg.max_memory = stats::max(mem);
    const double cpu_std = stats::stdev(cpu);
    const double mem_std = stats::stdev(mem);

    Decision d;
    d.resource_id = resource_id;
    d.aggregate = agg;

    // ---- Rule 1: default ----
    d.action = Action::MAINTAIN;
    d.confidence = limits.conf_default;
    d.reasoning = "resource usage normal, keeping current configuration";

    // No forecast points: zero aggregates are not evidence of idle load.
    if (n == 0) {
        d.aggregate.reset();
        d.confidence = limits.conf_failed;
        d.reasoning = format(
            "no forecast points available, keeping current configuration"
            "; current CPU %.1f%%, memory %.1f%%", now_cpu, now_mem);
        STRATUS_LOG_WARN("POLICY", "%s: empty forecast window", resource_id.c_str());
        return d;
    }

    // ---- Rules 2-4: load level ----
    if (agg.max_cpu > limits.peak_scale_up || agg.max_memory > limits.peak_scale_up) {
        d.action = Action::SCALE_UP;
        d.confidence = limits.conf_peak;
        d.reasoning = format(
            "forecast CPU or memory exceeds %.0f%% within the next %zu hours "
            "(CPU: %.1f%%, memory: %.1f%%), scale up recommended",
            limits.peak_scale_up, n, agg.max_cpu, agg.max_memory);
    } else if (agg.avg_cpu > limits.sustained_scale_up || agg.avg_memory > limits.sustained_scale_up) {
        d.action = Action::SCALE_UP;
        d.confidence = limits.conf_sustained;
        d.reasoning = format(
            "forecast average load over the next %zu hours is high "
            "(CPU: %.1f%%, memory: %.1f%%), moderate scale up recommended",
            n, agg.avg_cpu, agg.avg_memory);
    } else if (agg.avg_cpu < limits.idle_cpu_avg &&
               agg.avg_memory < limits.idle_memory_avg &&
               agg.max_cpu < limits.idle_cpu_peak) {
        d.action = Action::SCALE_DOWN;
        d.confidence = limits.conf_idle;
        d.reasoning = format(
            "forecast load over the next %zu hours is low "
            "(CPU: %.1f%%, memory: %.1f%%), consider scaling down to save cost",
            n, agg.avg_cpu, agg.avg_memory);
    }

    // ---- Rule 5: volatility, checked last ----
    if (cpu_std > limits.volatility_stdev || mem_std > limits.volatility_stdev) {
        d.action = Action::OPTIMIZE;
        d.confidence = limits.conf_volatile;
        d.reasoning = format(
            "forecast load is volatile (CPU stdev: %.1f, memory stdev: %.1f), "
            "optimize scheduling strategy",
            cpu_std, mem_std);
    }

    d.reasoning += format("; current CPU %.1f%%, memory %.1f%%", now_cpu, now_mem);

    STRATUS_LOG_INFO("POLICY", "%s: %s (confidence %.2f)",
                     resource_id.c_str(), action_str(d.action), d.confidence);
    return d;
}

}
