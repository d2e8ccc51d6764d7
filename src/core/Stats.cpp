#include "stratus/core/Stats.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace stratus::stats {

double mean(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    return std::accumulate(v.begin(), v.end(), 0.0) /
           static_cast<double>(v.size());
}

double stdev(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    const double m = mean(v);
    double acc = 0.0;
    for (double x : v) {
        acc += (x - m) * (x - m);
    }
    return std::sqrt(acc / static_cast<double>(v.size()));
}

double max(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    return *std::max_element(v.begin(), v.end());
}

double cv(const std::vector<double>& v, double eps) {
    return stdev(v) / (mean(v) + eps);
}

}
