#pragma once

#include "stratus/features/FeatureMatrix.hpp"
#include "stratus/forecast/RegressionForest.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace stratus {

// Trained forests keyed by resource and a SHA-256 of the raw metric
// columns. Oldest insertion is evicted first.
class ForestCache {
public:
    explicit ForestCache(std::size_t capacity);

    // Hex SHA-256 over the resource id and the four base columns.
    static std::string key(const std::string& resource_id,
                           const FeatureMatrix& features);

    std::shared_ptr<const RegressionForest> find(const std::string& key) const;
    void insert(const std::string& key,
                std::shared_ptr<const RegressionForest> forest);

    std::size_t size() const;
    std::size_t capacity() const { return max_entries; }

private:
    std::size_t max_entries;

    mutable std::mutex mtx;
    std::unordered_map<std::string, std::shared_ptr<const RegressionForest>> map;
    std::deque<std::string> order;
};

}
