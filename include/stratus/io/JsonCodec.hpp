#pragma once

#include "stratus/core/Types.hpp"
#include "stratus/engine/SchedulerEngine.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace stratus::io {

using json = nlohmann::json;

// ISO-8601 ("2024-05-01T13:00:00", optional fraction, "Z" or +hh:mm offset,
// or a space instead of 'T'). Result is UTC. Throws FeatureExtractionError.
Timestamp parseTimestamp(const std::string& text);
std::string formatTimestamp(const Timestamp& ts);

// Null or absent keys are missing values; numeric strings are accepted.
// Throws FeatureExtractionError for any other value type.
MetricSample sampleFromJson(const json& j, std::size_t index = 0);

// Array of samples, or an object holding them under "historical_data".
std::vector<MetricSample> historyFromJson(const json& j);

CurrentMetrics currentFromJson(const json& j);

// Array of points, or an object holding them under "predictions".
ForecastSet predictionsFromJson(const json& j);

json toJson(const MetricSample& s);
json toJson(const ForecastPoint& p);
json toJson(const ForecastSet& points);
json toJson(const ForecastResult& r);
json toJson(const Decision& d);
json toJson(const HealthStatus& h);

// Reads and parses a JSON file. Throws std::runtime_error.
json readFile(const std::string& path);

}
