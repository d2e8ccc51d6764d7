#include "stratus/core/Types.hpp"

#include <algorithm>

namespace stratus {

ForecastPoint make_point(int offset_hours,
                         const Timestamp& as_of,
                         double cpu,
                         double memory,
                         double disk,
                         double network) {
    ForecastPoint p;
    p.offset_hours = offset_hours;
    p.timestamp = as_of.is_special()
        ? as_of
        : as_of + boost::posix_time::hours(offset_hours);
    p.cpu_percent = std::clamp(cpu, 0.0, 100.0);
    p.memory_percent = std::clamp(memory, 0.0, 100.0);
    p.disk_percent = std::clamp(disk, 0.0, 100.0);
    p.network_usage = std::max(0.0, network);
    return p;
}

}
