#include "stratus/forecast/ForecastCombiner.hpp"
#include "stratus/core/Log.hpp"

#include <algorithm>

namespace stratus {

ForecastCombiner::ForecastCombiner(
    double sequence_weight,
    double ensemble_weight
) : w_seq(sequence_weight),
    w_ens(ensemble_weight) {}

ForecastSet ForecastCombiner::combine(
    const ForecastSet& sequence,
    const ForecastSet& ensemble
) const {
    if (sequence.empty()) return ensemble;
    if (ensemble.empty()) return sequence;

    if (sequence.size() != ensemble.size()) {
        STRATUS_LOG_WARN("COMBINE", "length mismatch (sequence=%zu ensemble=%zu), truncating",
                         sequence.size(), ensemble.size());
    }

    const std::size_t n = std::min(sequence.size(), ensemble.size());
    ForecastSet out;
    out.reserve(n);

    for (std::size_t i = 0; i < n; ++i) {
        const ForecastPoint& s = sequence[i];
        const ForecastPoint& e = ensemble[i];

        ForecastPoint p;
        p.offset_hours = s.offset_hours;
        p.timestamp = s.timestamp;
        p.cpu_percent = w_seq * s.cpu_percent + w_ens * e.cpu_percent;
        p.memory_percent = w_seq * s.memory_percent + w_ens * e.memory_percent;
        p.disk_percent = w_seq * s.disk_percent + w_ens * e.disk_percent;
        p.network_usage = w_seq * s.network_usage + w_ens * e.network_usage;
        out.push_back(p);
    }
    return out;
}

}
