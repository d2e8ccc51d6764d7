#pragma once

#include "stratus/core/Types.hpp"

namespace stratus {

class ForecastCombiner {
public:
    ForecastCombiner(double sequence_weight = 0.6, double ensemble_weight = 0.4);

    // Weighted blend over the common prefix. An empty side yields the other
    // side unchanged. Timestamps come from the sequence forecast.
    ForecastSet combine(const ForecastSet& sequence,
                        const ForecastSet& ensemble) const;

private:
    double w_seq;
    double w_ens;
};

}
