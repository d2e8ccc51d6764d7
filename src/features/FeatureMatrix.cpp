#include "stratus/features/FeatureMatrix.hpp"
#include "stratus/core/Errors.hpp"

#include <algorithm>
#include <stdexcept>

namespace stratus {

FeatureMatrix::FeatureMatrix(
    std::vector<std::string> names,
    std::vector<std::vector<double>> rows
) : columns(std::move(names)),
    data(std::move(rows)) {
    for (std::size_t r = 0; r < data.size(); ++r) {
        if (data[r].size() != columns.size()) {
            throw FeatureExtractionError(
                "row " + std::to_string(r) + " has " +
                std::to_string(data[r].size()) + " values, expected " +
                std::to_string(columns.size()));
        }
    }
}

std::size_t FeatureMatrix::indexOf(const std::string& name) const {
    auto it = std::find(columns.begin(), columns.end(), name);
    if (it == columns.end()) {
        throw std::out_of_range("unknown feature column: " + name);
    }
    return static_cast<std::size_t>(it - columns.begin());
}

bool FeatureMatrix::has(const std::string& name) const {
    return std::find(columns.begin(), columns.end(), name) != columns.end();
}

std::vector<double> FeatureMatrix::tail(std::size_t c, std::size_t n) const {
    const std::size_t start = data.size() > n ? data.size() - n : 0;
    std::vector<double> out;
    out.reserve(data.size() - start);
    for (std::size_t r = start; r < data.size(); ++r) {
        out.push_back(data[r][c]);
    }
    return out;
}

std::vector<std::vector<double>> FeatureMatrix::baseTail(std::size_t n) const {
    if (columns.size() < BASE_COLUMNS) {
        throw FeatureExtractionError("feature matrix lacks the base metric columns");
    }
    const std::size_t start = data.size() > n ? data.size() - n : 0;
    std::vector<std::vector<double>> out;
    out.reserve(data.size() - start);
    for (std::size_t r = start; r < data.size(); ++r) {
        out.emplace_back(data[r].begin(), data[r].begin() + BASE_COLUMNS);
    }
    return out;
}

}
