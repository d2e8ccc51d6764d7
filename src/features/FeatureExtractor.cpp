#include "stratus/features/FeatureExtractor.hpp"
#include "stratus/core/Errors.hpp"
#include "stratus/core/Log.hpp"

#include <boost/date_time/gregorian/gregorian_types.hpp>

#include <array>
#include <cmath>
#include <string>

namespace stratus {

namespace {

using Field = std::optional<double> MetricSample::*;

// Missing values take the previous sample's value, or 0 before the first one.
std::vector<double> fillColumn(
    const std::vector<MetricSample>& samples,
    Field field,
    const char* name
) {
    std::vector<double> out(samples.size(), 0.0);
    double last = 0.0;

    for (std::size_t i = 0; i < samples.size(); ++i) {
        const std::optional<double>& v = samples[i].*field;
        if (v) {
            if (!std::isfinite(*v)) {
                throw FeatureExtractionError(
                    std::string("non-finite ") + name +
                    " at sample " + std::to_string(i));
            }
            last = *v;
        }
        out[i] = last;
    }
    return out;
}

struct CalendarFields {
    double hour;
    double day_of_week;
    double day_of_month;
};

CalendarFields calendar(const Timestamp& ts, std::size_t index) {
    if (ts.is_special()) {
        throw FeatureExtractionError(
            "invalid timestamp at sample " + std::to_string(index));
    }
    const boost::gregorian::date d = ts.date();
    // Monday = 0 ... Sunday = 6
    const int dow = (d.day_of_week().as_number() + 6) % 7;

    return {
        static_cast<double>(ts.time_of_day().hours()),
        static_cast<double>(dow),
        static_cast<double>(d.day())
    };
}

}

std::vector<double> FeatureExtractor::movingAverage(
    const std::vector<double>& x,
    std::size_t window
) {
    std::vector<double> out(x.size(), 0.0);
    if (window == 0 || x.size() < window) {
        return out;
    }

    double sum = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        sum += x[i];
        if (i >= window) {
            sum -= x[i - window];
        }
        if (i + 1 >= window) {
            out[i] = sum / static_cast<double>(window);
        }
    }

    // Leading rows take the first full-window value.
    const double first = out[window - 1];
    for (std::size_t i = 0; i + 1 < window; ++i) {
        out[i] = first;
    }
    return out;
}

FeatureMatrix FeatureExtractor::extract(const std::vector<MetricSample>& samples) {
    if (samples.empty()) {
        throw FeatureExtractionError("no samples to extract features from");
    }

    const std::size_t n = samples.size();

    const std::vector<double> cpu =
        fillColumn(samples, &MetricSample::cpu_percent, columns::CPU);
    const std::vector<double> mem =
        fillColumn(samples, &MetricSample::memory_percent, columns::MEMORY);
    const std::vector<double> disk =
        fillColumn(samples, &MetricSample::disk_percent, columns::DISK);
    const std::vector<double> net =
        fillColumn(samples, &MetricSample::network_in_bytes, columns::NETWORK_IN);

    bool has_time = false;
    for (const auto& s : samples) {
        if (s.timestamp) {
            has_time = true;
            break;
        }
    }

    std::vector<std::string> names = {
        columns::CPU, columns::MEMORY, columns::DISK, columns::NETWORK_IN
    };

    std::vector<CalendarFields> cal;
    if (has_time) {
        names.push_back(columns::HOUR);
        names.push_back(columns::DAY_OF_WEEK);
        names.push_back(columns::DAY_OF_MONTH);

        cal.resize(n, CalendarFields{0.0, 0.0, 0.0});
        CalendarFields last{0.0, 0.0, 0.0};
        for (std::size_t i = 0; i < n; ++i) {
            if (samples[i].timestamp) {
                last = calendar(*samples[i].timestamp, i);
            }
            cal[i] = last;
        }
    }

    names.push_back(columns::CPU_MA3);
    names.push_back(columns::CPU_MA12);
    names.push_back(columns::MEMORY_MA3);
    names.push_back(columns::MEMORY_MA12);

    const std::array<std::vector<double>, 4> ma = {
        movingAverage(cpu, SHORT_WINDOW),
        movingAverage(cpu, LONG_WINDOW),
        movingAverage(mem, SHORT_WINDOW),
        movingAverage(mem, LONG_WINDOW)
    };

    std::vector<std::vector<double>> rows;
    rows.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        std::vector<double> r = {cpu[i], mem[i], disk[i], net[i]};
        if (has_time) {
            r.push_back(cal[i].hour);
            r.push_back(cal[i].day_of_week);
            r.push_back(cal[i].day_of_month);
        }
        for (const auto& col : ma) {
            r.push_back(col[i]);
        }
        rows.push_back(std::move(r));
    }

    STRATUS_LOG_DEBUG("FEATURES", "extracted %zu rows x %zu columns (time=%s)",
                      n, names.size(), has_time ? "yes" : "no");

    return FeatureMatrix(std::move(names), std::move(rows));
}

}
