#pragma once

#include "stratus/config/EngineConfig.hpp"
#include "stratus/core/Types.hpp"

#include <string>

namespace stratus {

// Ordered scaling rules over the first few forecast points:
//   1. maintain
//   2. peak cpu/memory above threshold       -> scale_up
//   3. else sustained average above threshold -> scale_up
//   4. else idle cpu and memory               -> scale_down
//   5. volatile cpu or memory                 -> optimize (overrides 2-4)
class DecisionPolicy {
public:
    explicit DecisionPolicy(PolicyThresholds thresholds = PolicyThresholds{});

    // Never throws. Internal errors yield a low-confidence maintain.
    Decision decide(const std::string& resource_id,
                    const CurrentMetrics& current,
                    const ForecastSet& predictions) const noexcept;

    const PolicyThresholds& thresholds() const { return limits; }

private:
    Decision evaluate(const std::string& resource_id,
                      const CurrentMetrics& current,
                      const ForecastSet& predictions) const;

    PolicyThresholds limits;
};

}
