#include "stratus/forecast/RegressionForest.hpp"
#include "stratus/core/Errors.hpp"

#include <algorithm>
#include <random>
#include <string>

namespace stratus {

namespace {

using Matrix = std::vector<std::vector<double>>;

constexpr double MIN_GAIN = 1e-12;

class TreeBuilder {
public:
    TreeBuilder(const Matrix& x, const Matrix& y, const ForestParams& p)
        : X(x), Y(y), params(p), n_out(y.front().size()) {}

    RegressionForest::Tree build(std::vector<std::size_t> idx) {
        RegressionForest::Tree tree;
        samples = std::move(idx);
        grow(0, samples.size(), 0, tree);
        return tree;
    }

private:
    struct Split {
        int feature = -1;
        double threshold = 0.0;
        double gain = 0.0;
    };

    int grow(std::size_t lo, std::size_t hi, std::size_t depth, RegressionForest::Tree& tree) {
        const int id = static_cast<int>(tree.n.size());
        tree.n.emplace_back();

        const std::size_t count = hi - lo;
        std::vector<double> sum(n_out, 0.0);
        std::vector<double> sumsq(n_out, 0.0);
        for (std::size_t k = lo; k < hi; ++k) {
            const auto& y = Y[samples[k]];
            for (std::size_t o = 0; o < n_out; ++o) {
                sum[o] += y[o];
                sumsq[o] += y[o] * y[o];
            }
        }

        std::vector<double> mean(n_out);
        double sse = 0.0;
        for (std::size_t o = 0; o < n_out; ++o) {
            mean[o] = sum[o] / static_cast<double>(count);
            sse += sumsq[o] - sum[o] * sum[o] / static_cast<double>(count);
        }
        tree.n[id].value = mean;

        const bool depth_capped = params.max_depth > 0 && depth >= params.max_depth;
        if (count < params.min_samples_split ||
            count < 2 * params.min_samples_leaf ||
            depth_capped ||
            sse <= MIN_GAIN) {
            return id;
        }

        const Split best = findSplit(lo, hi, sum, sumsq, sse);
        if (best.feature < 0) {
            return id;
        }

        auto first = samples.begin() + static_cast<std::ptrdiff_t>(lo);
        auto last = samples.begin() + static_cast<std::ptrdiff_t>(hi);
        auto mid_it = std::stable_partition(first, last, [&](std::size_t s) {
            return X[s][best.feature] <= best.threshold;
        });
        const std::size_t mid = static_cast<std::size_t>(mid_it - samples.begin());
        if (mid == lo || mid == hi) {
            return id;
        }

        const int l = grow(lo, mid, depth + 1, tree);
        const int r = grow(mid, hi, depth + 1, tree);

        RegressionForest::Node& node = tree.n[id];
        node.f = best.feature;
        node.t = best.threshold;
        node.l = l;
        node.r = r;
        node.leaf = false;
        return id;
    }

    Split findSplit(std::size_t lo,
                    std::size_t hi,
                    const std::vector<double>& sum,
                    const std::vector<double>& sumsq,
                    double sse) const {
        Split best;
        const std::size_t count = hi - lo;
        const std::size_t n_feat = X.front().size();

        std::vector<std::size_t> order(samples.begin() + static_cast<std::ptrdiff_t>(lo),
                                       samples.begin() + static_cast<std::ptrdiff_t>(hi));
        std::vector<double> lsum(n_out);
        std::vector<double> lsq(n_out);

        for (std::size_t f = 0; f < n_feat; ++f) {
            std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
                return X[a][f] < X[b][f];
            });
            std::fill(lsum.begin(), lsum.end(), 0.0);
            std::fill(lsq.begin(), lsq.end(), 0.0);

            for (std::size_t k = 1; k < count; ++k) {
                const auto& y = Y[order[k - 1]];
                for (std::size_t o = 0; o < n_out; ++o) {
                    lsum[o] += y[o];
                    lsq[o] += y[o] * y[o];
                }

                const double xa = X[order[k - 1]][f];
                const double xb = X[order[k]][f];
                if (xa == xb) continue;
                if (k < params.min_samples_leaf || count - k < params.min_samples_leaf) continue;

                const double nl = static_cast<double>(k);
                const double nr = static_cast<double>(count - k);
                double child = 0.0;
                for (std::size_t o = 0; o < n_out; ++o) {
                    const double rs = sum[o] - lsum[o];
                    const double rq = sumsq[o] - lsq[o];
                    child += (lsq[o] - lsum[o] * lsum[o] / nl) + (rq - rs * rs / nr);
                }

                const double gain = sse - child;
                if (gain > best.gain + MIN_GAIN) {
                    best.feature = static_cast<int>(f);
                    best.threshold = 0.5 * (xa + xb);
                    best.gain = gain;
                }
            }
        }
        return best;
    }

    const Matrix& X;
    const Matrix& Y;
    const ForestParams& params;
    std::size_t n_out;
    std::vector<std::size_t> samples;
};

}

RegressionForest RegressionForest::fit(
    const Matrix& X,
    const Matrix& Y,
    const ForestParams& params
) {
    if (X.empty() || X.size() != Y.size()) {
        throw ModelInferenceError("forest fit: sample and label counts differ or are zero");
    }
    const std::size_t n_feat = X.front().size();
    const std::size_t n_out = Y.front().size();
    if (n_feat == 0 || n_out == 0) {
        throw ModelInferenceError("forest fit: zero-width features or labels");
    }
    for (std::size_t i = 0; i < X.size(); ++i) {
        if (X[i].size() != n_feat || Y[i].size() != n_out) {
            throw ModelInferenceError("forest fit: ragged row " + std::to_string(i));
        }
    }
    if (params.n_trees < 1) {
        throw ModelInferenceError("forest fit: n_trees must be >= 1");
    }

    RegressionForest forest;
    forest.n_features = n_feat;
    forest.n_outputs = n_out;
    forest.trees.reserve(static_cast<std::size_t>(params.n_trees));

    const std::size_t n = X.size();
    std::mt19937_64 rng(params.seed);
    std::uniform_int_distribution<std::size_t> pick(0, n - 1);

    for (int t = 0; t < params.n_trees; ++t) {
        std::vector<std::size_t> idx(n);
        if (params.bootstrap) {
            for (auto& i : idx) i = pick(rng);
        } else {
            for (std::size_t i = 0; i < n; ++i) idx[i] = i;
        }
        TreeBuilder builder(X, Y, params);
        forest.trees.push_back(builder.build(std::move(idx)));
    }
    return forest;
}

std::vector<double> RegressionForest::predict(const std::vector<double>& x) const {
    if (trees.empty()) {
        throw ModelInferenceError("forest predict: model is not fit");
    }
    if (x.size() != n_features) {
        throw ModelInferenceError(
            "forest predict: expected " + std::to_string(n_features) +
            " features, got " + std::to_string(x.size()));
    }

    std::vector<double> acc(n_outputs, 0.0);
    for (const auto& t : trees) {
        int i = 0;
        while (!t.n[i].leaf) {
            const auto& nd = t.n[i];
            i = (x[nd.f] <= nd.t) ? nd.l : nd.r;
        }
        for (std::size_t o = 0; o < n_outputs; ++o) {
            acc[o] += t.n[i].value[o];
        }
    }

    const double Z = static_cast<double>(trees.size());
    for (auto& v : acc) v /= Z;
    return acc;
}

}
