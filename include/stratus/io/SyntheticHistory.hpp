#pragma once

#include "stratus/core/Types.hpp"

#include <cstdint>
#include <vector>

namespace stratus::io {

// Hourly mock monitoring history for demos and smoke tests.
//   cpu 20..80, memory 30..80, disk 10..40,
//   network in 1000..6000, network out 800..4800
class SyntheticHistory {
public:
    // days * 24 samples, the first stamped `start`, oldest first.
    static std::vector<MetricSample> generate(int days, const Timestamp& start, uint64_t seed);
};

}
