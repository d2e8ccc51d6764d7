#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace stratus {

// Row-major numeric table. Every row has cols() entries.
class FeatureMatrix {
public:
    // The first four columns are always the raw resource metrics.
    static constexpr std::size_t CPU = 0;
    static constexpr std::size_t MEMORY = 1;
    static constexpr std::size_t DISK = 2;
    static constexpr std::size_t NETWORK = 3;
    static constexpr std::size_t BASE_COLUMNS = 4;

    FeatureMatrix() = default;

    // Throws FeatureExtractionError when a row width differs from names.size().
    FeatureMatrix(std::vector<std::string> names,
                  std::vector<std::vector<double>> rows);

    std::size_t rows() const { return data.size(); }
    std::size_t cols() const { return columns.size(); }
    bool empty() const { return data.empty(); }

    const std::vector<double>& row(std::size_t r) const { return data[r]; }
    double at(std::size_t r, std::size_t c) const { return data[r][c]; }

    const std::vector<std::string>& names() const { return columns; }

    // Throws std::out_of_range for an unknown column.
    std::size_t indexOf(const std::string& name) const;
    bool has(const std::string& name) const;

    // Last n values of column c (fewer when the matrix is shorter).
    std::vector<double> tail(std::size_t c, std::size_t n) const;

    // Last n rows restricted to the four base columns.
    std::vector<std::vector<double>> baseTail(std::size_t n) const;

private:
    std::vector<std::string> columns;
    std::vector<std::vector<double>> data;
};

}
