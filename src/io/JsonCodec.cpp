#include "stratus/io/JsonCodec.hpp"
#include "stratus/core/Errors.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>

#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace stratus::io {

namespace pt = boost::posix_time;

namespace {

constexpr const char* K_TIMESTAMP = "timestamp";
constexpr const char* K_CPU = "cpu_usage_percent";
constexpr const char* K_MEMORY = "memory_usage_percent";
constexpr const char* K_DISK = "disk_usage_percent";
constexpr const char* K_NET_IN = "network_in_bytes";
constexpr const char* K_NET_OUT = "network_out_bytes";
constexpr const char* K_NETWORK = "network_usage";

std::string trim(const std::string& s) {
    std::size_t a = 0;
    std::size_t b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    return s.substr(a, b - a);
}

std::optional<double> numberField(const json& obj, const char* key, std::size_t index) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return std::nullopt;

    if (it->is_number()) {
        return it->get<double>();
    }
    if (it->is_string()) {
        const std::string s = trim(it->get<std::string>());
        if (s.empty()) return std::nullopt;
        std::size_t used = 0;
        double v = 0.0;
        try {
            v = std::stod(s, &used);
        } catch (const std::exception&) {
            used = 0;
        }
        if (used == s.size()) return v;
    }
    throw FeatureExtractionError(
        std::string("sample ") + std::to_string(index) + ": '" + key +
        "' is not numeric: " + it->dump());
}

// "+08:00", "-0530", "+02"
pt::time_duration parseOffset(const std::string& off, const std::string& whole) {
    const int sign = off[0] == '-' ? -1 : 1;
    std::string digits;
    for (std::size_t i = 1; i < off.size(); ++i) {
        if (off[i] == ':') continue;
        if (!std::isdigit(static_cast<unsigned char>(off[i]))) {
            throw FeatureExtractionError("bad UTC offset in timestamp: " + whole);
        }
        digits += off[i];
    }
    if (digits.size() != 2 && digits.size() != 4) {
        throw FeatureExtractionError("bad UTC offset in timestamp: " + whole);
    }
    const int hh = std::stoi(digits.substr(0, 2));
    const int mm = digits.size() == 4 ? std::stoi(digits.substr(2, 2)) : 0;
    pt::time_duration d = pt::hours(hh) + pt::minutes(mm);
    return sign < 0 ? d.invert_sign() : d;
}

}

Timestamp parseTimestamp(const std::string& text) {
    std::string s = trim(text);
    if (s.size() < 10) {
        throw FeatureExtractionError("unparsable timestamp: '" + text + "'");
    }
    if (s.size() > 10 && s[10] == ' ') s[10] = 'T';

    pt::time_duration offset(0, 0, 0);
    if (s.back() == 'Z' || s.back() == 'z') {
        s.pop_back();
    } else if (s.size() > 19) {
        const std::size_t pos = s.find_last_of("+-");
        if (pos != std::string::npos && pos > 10) {
            offset = parseOffset(s.substr(pos), text);
            s.erase(pos);
        }
    }
    if (s.size() == 10) s += "T00:00:00";

    Timestamp t;
    try {
        t = pt::from_iso_extended_string(s);
    } catch (const std::exception& e) {
        throw FeatureExtractionError("unparsable timestamp: '" + text + "' (" + e.what() + ")");
    }
    if (t.is_special()) {
        throw FeatureExtractionError("unparsable timestamp: '" + text + "'");
    }
    return t - offset;
}

std::string formatTimestamp(const Timestamp& ts) {
    if (ts.is_special()) return "";
    return pt::to_iso_extended_string(ts);
}

MetricSample sampleFromJson(const json& j, std::size_t index) {
    if (!j.is_object()) {
        throw FeatureExtractionError("sample " + std::to_string(index) + " is not an object");
    }

    MetricSample s;
    auto ts = j.find(K_TIMESTAMP);
    if (ts != j.end() && !ts->is_null()) {
        if (!ts->is_string()) {
            throw FeatureExtractionError("sample " + std::to_string(index) + ": timestamp is not a string");
        }
        s.timestamp = parseTimestamp(ts->get<std::string>());
    }
    s.cpu_percent = numberField(j, K_CPU, index);
    s.memory_percent = numberField(j, K_MEMORY, index);
    s.disk_percent = numberField(j, K_DISK, index);
    s.network_in_bytes = numberField(j, K_NET_IN, index);
    s.network_out_bytes = numberField(j, K_NET_OUT, index);
    return s;
}

std::vector<MetricSample> historyFromJson(const json& j) {
    const json* arr = &j;
    if (j.is_object() && j.contains("historical_data")) {
        arr = &j.at("historical_data");
    }
    if (!arr->is_array()) {
        throw FeatureExtractionError("history must be a JSON array of samples");
    }

    std::vector<MetricSample> out;
    out.reserve(arr->size());
    for (std::size_t i = 0; i < arr->size(); ++i) {
        out.push_back(sampleFromJson((*arr)[i], i));
    }
    return out;
}

CurrentMetrics currentFromJson(const json& j) {
    if (!j.is_object()) {
        throw FeatureExtractionError("current metrics must be a JSON object");
    }
    CurrentMetrics out;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.value().is_number()) {
            out[it.key()] = it.value().get<double>();
        }
    }
    return out;
}

ForecastSet predictionsFromJson(const json& j) {
    const json* arr = &j;
    if (j.is_object() && j.contains("predictions")) {
        arr = &j.at("predictions");
    }
    if (!arr->is_array()) {
        throw FeatureExtractionError("predictions must be a JSON array");
    }

    ForecastSet out;
    out.reserve(arr->size());
    for (std::size_t i = 0; i < arr->size(); ++i) {
        const json& p = (*arr)[i];
        if (!p.is_object()) {
            throw FeatureExtractionError("prediction " + std::to_string(i) + " is not an object");
        }
        ForecastPoint fp;
        fp.offset_hours = p.value("offset_hours", static_cast<int>(i) + 1);
        auto ts = p.find(K_TIMESTAMP);
        if (ts != p.end() && ts->is_string()) {
            fp.timestamp = parseTimestamp(ts->get<std::string>());
        }
        fp.cpu_percent = numberField(p, K_CPU, i).value_or(0.0);
        fp.memory_percent = numberField(p, K_MEMORY, i).value_or(0.0);
        fp.disk_percent = numberField(p, K_DISK, i).value_or(0.0);
        fp.network_usage = numberField(p, K_NETWORK, i).value_or(0.0);
        out.push_back(fp);
    }
    return out;
}

json toJson(const MetricSample& s) {
    json j = json::object();
    if (s.timestamp) j[K_TIMESTAMP] = formatTimestamp(*s.timestamp);
    if (s.cpu_percent) j[K_CPU] = *s.cpu_percent;
    if (s.memory_percent) j[K_MEMORY] = *s.memory_percent;
    if (s.disk_percent) j[K_DISK] = *s.disk_percent;
    if (s.network_in_bytes) j[K_NET_IN] = *s.network_in_bytes;
    if (s.network_out_bytes) j[K_NET_OUT] = *s.network_out_bytes;
    return j;
}

json toJson(const ForecastPoint& p) {
    return {
        {K_TIMESTAMP, formatTimestamp(p.timestamp)},
        {"offset_hours", p.offset_hours},
        {K_CPU, p.cpu_percent},
        {K_MEMORY, p.memory_percent},
        {K_DISK, p.disk_percent},
        {K_NETWORK, p.network_usage}
    };
}

json toJson(const ForecastSet& points) {
    json arr = json::array();
    for (const auto& p : points) arr.push_back(toJson(p));
    return arr;
}

json toJson(const ForecastResult& r) {
    return {
        {"resource_id", r.resource_id},
        {"prediction_horizon", r.horizon},
        {"predictions", toJson(r.predictions)},
        {"confidence", r.confidence},
        {"model_info", {
            {"sequence_used", r.model_info.sequence_used},
            {"ensemble_used", r.model_info.ensemble_used},
            {"ensemble", r.model_info.ensemble},
            {"sequence_fallback_points", r.model_info.sequence_fallback_points},
            {"ensemble_fallback_points", r.model_info.ensemble_fallback_points},
            {"ensemble_cache_hit", r.model_info.ensemble_cache_hit}
        }},
        {"generated_at", formatTimestamp(r.generated_at)}
    };
}

json toJson(const Decision& d) {
    json metrics = json::object();
    if (d.aggregate) {
        metrics["avg_cpu"] = d.aggregate->avg_cpu;
        metrics["avg_memory"] = d.aggregate->avg_memory;
        metrics["max_cpu"] = d.aggregate->max_cpu;
        metrics["max_memory"] = d.aggregate->max_memory;
    }
    return {
        {"resource_id", d.resource_id},
        {"action", action_str(d.action)},
        {"confidence", d.confidence},
        {"predicted_metrics", metrics},
        {"reasoning", d.reasoning}
    };
}

json toJson(const HealthStatus& h) {
    return {
        {"status", h.status},
        {"model_source", h.model_source},
        {"version", h.version},
        {"cached_forests", h.cached_forests},
        {"timestamp", formatTimestamp(h.timestamp)}
    };
}

json readFile(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("cannot open " + path);
    }
    std::stringstream ss;
    ss << f.rdbuf();
    try {
        return json::parse(ss.str());
    } catch (const json::parse_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

}
