#pragma once

#include <vector>

namespace stratus::stats {

// All reductions return 0.0 for an empty input.
double mean(const std::vector<double>& v);

// Population standard deviation (divides by N).
double stdev(const std::vector<double>& v);

double max(const std::vector<double>& v);

// Coefficient of variation with a small epsilon in the denominator.
double cv(const std::vector<double>& v, double eps = 1e-8);

}
