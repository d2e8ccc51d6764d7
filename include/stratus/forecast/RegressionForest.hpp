#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace stratus {

struct ForestParams {
    int n_trees = 100;
    uint64_t seed = 42;
    std::size_t min_samples_split = 2;
    std::size_t min_samples_leaf = 1;
    std::size_t max_depth = 0;      // 0 = grow until pure
    bool bootstrap = true;
};

// Bagged multi-output CART regressor, squared-error splits over every
// feature. Immutable once fit.
class RegressionForest {
public:
    struct Node {
        int f = -1;
        double t = 0.0;
        int l = -1;
        int r = -1;
        bool leaf = true;
        std::vector<double> value;
    };
    struct Tree {
        std::vector<Node> n;
    };

    // X: samples x features, Y: samples x outputs.
    // Throws ModelInferenceError on empty or ragged input.
    static RegressionForest fit(const std::vector<std::vector<double>>& X,
                                const std::vector<std::vector<double>>& Y,
                                const ForestParams& params);

    // Mean of the leaf values reached in every tree.
    std::vector<double> predict(const std::vector<double>& x) const;

    std::size_t treeCount() const { return trees.size(); }
    std::size_t featureCount() const { return n_features; }
    std::size_t outputCount() const { return n_outputs; }

private:
    std::vector<Tree> trees;
    std::size_t n_features = 0;
    std::size_t n_outputs = 0;
};

}
