#pragma once

#include "stratus/core/Types.hpp"
#include "stratus/features/FeatureMatrix.hpp"

#include <vector>

namespace stratus {

// Column names, in matrix order.
namespace columns {
inline constexpr const char* CPU = "cpu_usage_percent";
inline constexpr const char* MEMORY = "memory_usage_percent";
inline constexpr const char* DISK = "disk_usage_percent";
inline constexpr const char* NETWORK_IN = "network_in_bytes";
inline constexpr const char* HOUR = "hour";
inline constexpr const char* DAY_OF_WEEK = "day_of_week";
inline constexpr const char* DAY_OF_MONTH = "day_of_month";
inline constexpr const char* CPU_MA3 = "cpu_usage_percent_ma3";
inline constexpr const char* CPU_MA12 = "cpu_usage_percent_ma12";
inline constexpr const char* MEMORY_MA3 = "memory_usage_percent_ma3";
inline constexpr const char* MEMORY_MA12 = "memory_usage_percent_ma12";
}

class FeatureExtractor {
public:
    static constexpr std::size_t SHORT_WINDOW = 3;
    static constexpr std::size_t LONG_WINDOW = 12;

    // Throws FeatureExtractionError on empty or non-finite input.
    static FeatureMatrix extract(const std::vector<MetricSample>& samples);

    // Trailing mean over `window` rows. Leading rows without a full window
    // take the first defined value; a series shorter than the window is 0.
    static std::vector<double> movingAverage(const std::vector<double>& x,
                                             std::size_t window);
};

}
