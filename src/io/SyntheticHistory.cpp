#include "stratus/io/SyntheticHistory.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>

#include <random>
#include <stdexcept>
#include <string>

namespace stratus::io {

std::vector<MetricSample> SyntheticHistory::generate(
    int days,
    const Timestamp& start,
    uint64_t seed
) {
    if (days < 1) {
        throw std::invalid_argument("days must be >= 1, got " + std::to_string(days));
    }
    if (start.is_special()) {
        throw std::invalid_argument("synthetic history needs a concrete start time");
    }

    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    const int count = days * 24;
    std::vector<MetricSample> out;
    out.reserve(count);
    for (int i = 0; i < count; ++i) {
        MetricSample s;
        s.timestamp = start + boost::posix_time::hours(i);
        s.cpu_percent = 20.0 + unit(rng) * 60.0;
        s.memory_percent = 30.0 + unit(rng) * 50.0;
        s.disk_percent = 10.0 + unit(rng) * 30.0;
        s.network_in_bytes = 1000.0 + unit(rng) * 5000.0;
        s.network_out_bytes = 800.0 + unit(rng) * 4000.0;
        out.push_back(s);
    }
    return out;
}

}
