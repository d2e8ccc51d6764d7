// =============================================================================
// src/forecast_test.cpp - Forecaster component tests
// =============================================================================
// Fallback estimator, LSTM stand-in, ONNX loading, regression forest, forest
// cache, both forecasters and the combiner. No engine wiring here.
// =============================================================================

#include <cmath>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <boost/date_time/posix_time/posix_time.hpp>

#include "stratus/core/Errors.hpp"
#include "stratus/core/Log.hpp"
#include "stratus/features/FeatureExtractor.hpp"
#include "stratus/forecast/EnsembleForecaster.hpp"
#include "stratus/forecast/FallbackEstimator.hpp"
#include "stratus/forecast/ForecastCombiner.hpp"
#include "stratus/forecast/ForestCache.hpp"
#include "stratus/forecast/LstmModel.hpp"
#include "stratus/forecast/OnnxSequenceModel.hpp"
#include "stratus/forecast/NoiseSource.hpp"
#include "stratus/forecast/RegressionForest.hpp"
#include "stratus/forecast/SequenceForecaster.hpp"
#include "stratus/forecast/SequenceModel.hpp"

using namespace stratus;
namespace pt = boost::posix_time;

namespace {

const pt::ptime AS_OF = pt::time_from_string("2024-05-08 12:00:00");

// Returns the same draw every time.
class FixedNoise : public NoiseSource {
public:
    explicit FixedNoise(double v) : value(v) {}
    double gaussian(double, double) override { return value; }
private:
    double value;
};

// Emits a fixed standardized step, then fails on every call from fail_at on.
class FlakyModel : public SequenceModel {
public:
    FlakyModel(std::vector<double> step, int fail_at)
        : step(std::move(step)), fail_at(fail_at) {}

    std::vector<double> predict(const std::vector<std::vector<double>>& sequence) const override {
        ++calls;
        if (sequence.size() != 24) throw ModelInferenceError("unexpected window length");
        if (calls >= fail_at) throw ModelInferenceError("inference failed");
        return step;
    }

    std::size_t inputSize() const override { return 4; }
    std::size_t outputSize() const override { return 4; }
    const std::string& source() const override { return tag; }

    int callCount() const { return calls; }

private:
    std::vector<double> step;
    int fail_at;
    mutable int calls = 0;
    std::string tag = "flaky";
};

std::vector<MetricSample> history(int n) {
    std::vector<MetricSample> out;
    for (int i = 0; i < n; ++i) {
        MetricSample s;
        s.timestamp = AS_OF - pt::hours(n - i);
        s.cpu_percent = 50.0 + 20.0 * std::sin(i * 0.26);
        s.memory_percent = 45.0 + 10.0 * std::cos(i * 0.26);
        s.disk_percent = 25.0 + (i % 5);
        s.network_in_bytes = 3000.0 + 100.0 * (i % 7);
        out.push_back(s);
    }
    return out;
}

FeatureMatrix constantMatrix(std::size_t rows, double cpu, double mem, double disk, double net) {
    std::vector<std::vector<double>> data(rows, std::vector<double>{cpu, mem, disk, net});
    return FeatureMatrix({"cpu", "mem", "disk", "net"}, std::move(data));
}

bool inBounds(const ForecastSet& points) {
    for (const auto& p : points) {
        if (p.cpu_percent < 0.0 || p.cpu_percent > 100.0) return false;
        if (p.memory_percent < 0.0 || p.memory_percent > 100.0) return false;
        if (p.disk_percent < 0.0 || p.disk_percent > 100.0) return false;
        if (p.network_usage < 0.0) return false;
    }
    return true;
}

bool sameValues(const ForecastSet& a, const ForecastSet& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i].cpu_percent != b[i].cpu_percent ||
            a[i].memory_percent != b[i].memory_percent ||
            a[i].disk_percent != b[i].disk_percent ||
            a[i].network_usage != b[i].network_usage) {
            return false;
        }
    }
    return true;
}

bool offsetsAreSequential(const ForecastSet& points) {
    for (std::size_t i = 0; i < points.size(); ++i) {
        if (points[i].offset_hours != static_cast<int>(i) + 1) return false;
        if (points[i].timestamp != AS_OF + pt::hours(static_cast<long>(i) + 1)) return false;
    }
    return true;
}

}

class ForecastTest {
public:
    int run_all_tests() {
        std::cout << "\n╔══════════════════════════════════════════════════════════════════╗\n";
        std::cout << "║           STRATUS FORECASTERS - UNIT TESTS                       ║\n";
        std::cout << "╚══════════════════════════════════════════════════════════════════╝\n\n";

        test_fallback_estimator();
        test_seeded_noise();
        test_lstm_model();
        test_onnx_model();
        test_regression_forest();
        test_forest_cache();
        test_sequence_forecaster();
        test_sequence_partial_failure();
        test_ensemble_forecaster();
        test_combiner();

        print_summary();
        return tests_failed_;
    }

private:
    int tests_passed_ = 0;
    int tests_failed_ = 0;

    void test_pass(const char* name) {
        std::cout << "  ✓ " << name << "\n";
        tests_passed_++;
    }

    void test_fail(const char* name, const char* reason) {
        std::cout << "  ✗ " << name << " - " << reason << "\n";
        tests_failed_++;
    }

    void check(bool ok, const char* name, const char* reason) {
        if (ok) test_pass(name);
        else test_fail(name, reason);
    }

    // =========================================================================
    // TESTS
    // =========================================================================

    void test_fallback_estimator() {
        std::cout << "Testing Fallback Estimator...\n";

        FallbackEstimator fb(0.1, 24);
        ZeroNoise quiet;

        const FeatureMatrix m = constantMatrix(30, 60.0, 40.0, 20.0, 2500.0);
        const ForecastSet pts = fb.estimate(m, 0, 5, AS_OF, quiet);
        check(pts.size() == 5, "requested point count", "wrong count");
        check(pts[0].cpu_percent == 60.0 && pts[4].memory_percent == 40.0 &&
              pts[2].network_usage == 2500.0,
              "baseline is recent column mean", "wrong baseline");
        check(offsetsAreSequential(pts), "offsets and timestamps", "wrong offsets");

        const ForecastSet later = fb.estimate(m, 3, 2, AS_OF, quiet);
        check(later[0].offset_hours == 4 && later[1].offset_hours == 5,
              "offsets continue after first_offset", "wrong offsets");

        const ForecastSet defaults = fb.estimate(FeatureMatrix(), 0, 1, AS_OF, quiet);
        check(defaults[0].cpu_percent == 20.0 && defaults[0].memory_percent == 30.0 &&
              defaults[0].disk_percent == 15.0 && defaults[0].network_usage == 1000.0,
              "defaults for empty history", "wrong defaults");

        // Recent window only: 24 rows of 80 after 6 rows of 0.
        std::vector<std::vector<double>> rows(6, std::vector<double>{0, 0, 0, 0});
        rows.insert(rows.end(), 24, std::vector<double>{80, 80, 80, 80});
        const FeatureMatrix shifted({"cpu", "mem", "disk", "net"}, rows);
        check(fb.baseline(shifted)[0] == 80.0, "lookback limits the baseline", "older rows used");

        FixedNoise up(0.5);
        const FeatureMatrix hot = constantMatrix(24, 95.0, 90.0, 99.0, 100.0);
        const ForecastSet clamped = fb.estimate(hot, 0, 3, AS_OF, up);
        check(clamped[0].cpu_percent == 100.0 && clamped[0].disk_percent == 100.0,
              "percentages clamped to 100", "value above 100");

        FixedNoise down(-3.0);
        const ForecastSet floor = fb.estimate(hot, 0, 3, AS_OF, down);
        check(floor[0].cpu_percent == 0.0 && floor[0].network_usage == 0.0,
              "values clamped at zero", "negative value");

        check(fb.estimate(m, 0, 0, AS_OF, quiet).empty(), "zero count is empty", "points returned");
        std::cout << "\n";
    }

    void test_seeded_noise() {
        std::cout << "Testing Seeded Noise...\n";

        SeededNoise a(7);
        SeededNoise b(7);
        SeededNoise c(8);
        bool same = true;
        bool differs = false;
        for (int i = 0; i < 16; ++i) {
            const double x = a.gaussian(0.0, 1.0);
            same = same && x == b.gaussian(0.0, 1.0);
            differs = differs || x != c.gaussian(0.0, 1.0);
        }
        check(same, "same seed same draws", "draws differ");
        check(differs, "different seed different draws", "draws identical");
        check(a.gaussian(3.0, 0.0) == 3.0, "zero stddev returns mean", "jitter applied");
        std::cout << "\n";
    }

    void test_lstm_model() {
        std::cout << "Testing LSTM Model...\n";

        const auto model = LstmModel::seeded(42);
        check(model->inputSize() == 4 && model->hiddenSize() == 64 &&
              model->numLayers() == 2 && model->outputSize() == 4,
              "default architecture 4-64x2-4", "wrong shape");
        check(model->source() == "seeded:42", "seeded source tag", "wrong source");

        std::vector<std::vector<double>> seq(24, std::vector<double>{0.1, -0.2, 0.3, 0.0});
        const std::vector<double> out = model->predict(seq);
        bool finite = out.size() == 4;
        for (double v : out) finite = finite && std::isfinite(v);
        check(finite, "prediction is finite", "bad output");

        const auto again = LstmModel::seeded(42);
        check(again->predict(seq) == out, "seeded weights are reproducible", "outputs differ");

        try {
            std::vector<std::vector<double>> bad(24, std::vector<double>{0.1, 0.2, 0.3});
            (void)model->predict(bad);
            test_fail("width mismatch throws", "no exception");
        } catch (const ModelInferenceError&) {
            test_pass("width mismatch throws");
        }
        std::cout << "\n";
    }

    void test_onnx_model() {
        std::cout << "Testing ONNX Model Loading...\n";

        try {
            (void)OnnxSequenceModel::load("/nonexistent/stratus-model.onnx");
            test_fail("missing artifact rejected", "no exception");
        } catch (const ModelLoadError&) {
            test_pass("missing artifact rejected");
        }

        const std::string junk = "stratus_forecast_test_junk.onnx";
        {
            std::ofstream f(junk, std::ios::binary);
            f << "this is not a serialized onnx graph";
        }
        try {
            (void)OnnxSequenceModel::load(junk);
            test_fail("corrupt artifact rejected", "no exception");
        } catch (const ModelLoadError& e) {
            check(std::string(e.what()).find(junk) != std::string::npos,
                  "corrupt artifact rejected", "path missing from message");
        }
        std::remove(junk.c_str());
        std::cout << "\n";
    }

    void test_regression_forest() {
        std::cout << "Testing Regression Forest...\n";

        std::vector<std::vector<double>> X;
        std::vector<std::vector<double>> Y;
        for (int i = 0; i < 40; ++i) {
            X.push_back({static_cast<double>(i), static_cast<double>(i % 3)});
            Y.push_back({2.0 * i, 100.0 - i});
        }

        ForestParams exact;
        exact.n_trees = 1;
        exact.bootstrap = false;
        const RegressionForest tree = RegressionForest::fit(X, Y, exact);
        const std::vector<double> p = tree.predict({17.0, 2.0});
        check(p.size() == 2 && p[0] == 34.0 && p[1] == 83.0,
              "unbagged tree reproduces training rows", "wrong leaf value");

        ForestParams bagged;
        bagged.n_trees = 25;
        const RegressionForest forest = RegressionForest::fit(X, Y, bagged);
        check(forest.treeCount() == 25 && forest.featureCount() == 2 && forest.outputCount() == 2,
              "forest dimensions", "wrong dimensions");
        const std::vector<double> q = forest.predict({20.0, 2.0});
        check(std::fabs(q[0] - 40.0) < 6.0 && std::fabs(q[1] - 80.0) < 3.0,
              "bagged prediction near target", "prediction far off");

        const RegressionForest twin = RegressionForest::fit(X, Y, bagged);
        check(twin.predict({20.0, 2.0}) == q, "same seed same forest", "forests differ");

        try {
            (void)RegressionForest::fit({}, {}, bagged);
            test_fail("empty training set rejected", "no exception");
        } catch (const ModelInferenceError&) {
            test_pass("empty training set rejected");
        }

        try {
            (void)forest.predict({1.0});
            test_fail("feature width checked", "no exception");
        } catch (const ModelInferenceError&) {
            test_pass("feature width checked");
        }
        std::cout << "\n";
    }

    void test_forest_cache() {
        std::cout << "Testing Forest Cache...\n";

        const FeatureMatrix a = constantMatrix(30, 50.0, 40.0, 20.0, 1000.0);
        const FeatureMatrix b = constantMatrix(30, 51.0, 40.0, 20.0, 1000.0);

        const std::string ka = ForestCache::key("web-1", a);
        check(ka.size() == 64, "sha-256 hex key", "wrong key length");
        check(ka == ForestCache::key("web-1", a), "key is stable", "key changed");
        check(ka != ForestCache::key("web-2", a), "resource id is part of the key", "keys collide");
        check(ka != ForestCache::key("web-1", b), "history is part of the key", "keys collide");

        ForestCache cache(1);
        auto forest = std::make_shared<const RegressionForest>(RegressionForest::fit(
            {{1.0}, {2.0}}, {{1.0}, {2.0}}, ForestParams{}));
        cache.insert("k1", forest);
        check(cache.find("k1") == forest && cache.size() == 1, "insert then find", "missing entry");
        cache.insert("k2", forest);
        check(!cache.find("k1") && cache.find("k2") && cache.size() == 1,
              "oldest entry evicted at capacity", "eviction wrong");
        std::cout << "\n";
    }

    void test_sequence_forecaster() {
        std::cout << "Testing Sequence Forecaster...\n";

        const FeatureMatrix m = FeatureExtractor::extract(history(48));
        SequenceForecaster seq(LstmModel::seeded(42), 24, FallbackEstimator());

        SeededNoise noise(1);
        ForecastContext ctx{"db-1", AS_OF, noise};
        const ForecastRun run = seq.forecast(m, 24, ctx);
        check(run.points.size() == 24, "exact horizon", "wrong point count");
        check(run.fallback_points == 0 && run.modelUsed(), "model path used", "fell back");
        check(inBounds(run.points), "points within bounds", "out of range value");
        check(offsetsAreSequential(run.points), "offsets and timestamps", "wrong offsets");

        // Shorter history than the window is left-padded.
        const FeatureMatrix shortm = FeatureExtractor::extract(history(10));
        const ForecastRun padded = seq.forecast(shortm, 6, ctx);
        check(padded.points.size() == 6 && padded.fallback_points == 0,
              "short history padded", "short history failed");

        // Three-input model cannot consume the four metrics.
        SequenceForecaster broken(LstmModel::seeded(42, 3), 24, FallbackEstimator());
        const ForecastRun fb = broken.forecast(m, 12, ctx);
        check(fb.points.size() == 12 && fb.fallback_points == 12 && !fb.modelUsed(),
              "shape mismatch recovered by fallback", "no fallback");
        check(inBounds(fb.points) && offsetsAreSequential(fb.points),
              "fallback points well formed", "bad fallback points");

        SequenceForecaster none(nullptr, 24, FallbackEstimator());
        check(none.forecast(m, 3, ctx).fallback_points == 3, "missing model recovered", "no fallback");
        std::cout << "\n";
    }

    void test_sequence_partial_failure() {
        std::cout << "Testing Sequence Failure Mid-Rollout...\n";

        // Constant columns standardize with scale 1, so a step of
        // {1, -2, 0.5, 100} lands at {51, 38, 20.5, 1100}.
        const FeatureMatrix m = constantMatrix(48, 50.0, 40.0, 20.0, 1000.0);
        auto model = std::make_shared<const FlakyModel>(std::vector<double>{1.0, -2.0, 0.5, 100.0}, 6);
        SequenceForecaster seq(model, 24, FallbackEstimator());

        ZeroNoise quiet;
        ForecastContext ctx{"db-1", AS_OF, quiet};
        const ForecastRun run = seq.forecast(m, 12, ctx);

        check(model->callCount() == 6, "rollout stops at the failing step", "wrong call count");
        check(run.points.size() == 12, "horizon kept", "wrong point count");
        check(run.fallback_points == 7 && run.modelUsed(), "only the remainder falls back", "wrong fallback count");

        bool model_points = run.points.size() == 12;
        for (std::size_t i = 0; model_points && i < 5; ++i) {
            const ForecastPoint& p = run.points[i];
            model_points = p.cpu_percent == 51.0 && p.memory_percent == 38.0 &&
                           p.disk_percent == 20.5 && p.network_usage == 1100.0;
        }
        check(model_points, "points 1-5 come from the model", "model points lost");

        bool fallback_points = run.points.size() == 12;
        for (std::size_t i = 5; fallback_points && i < 12; ++i) {
            const ForecastPoint& p = run.points[i];
            fallback_points = p.cpu_percent == 50.0 && p.memory_percent == 40.0 &&
                              p.disk_percent == 20.0 && p.network_usage == 1000.0;
        }
        check(fallback_points, "points 6-12 come from the fallback", "wrong fallback values");
        check(offsetsAreSequential(run.points) && run.points[5].offset_hours == 6 &&
              run.points[11].offset_hours == 12,
              "offsets run 1..12 across the switch", "wrong offsets");
        std::cout << "\n";
    }

    void test_ensemble_forecaster() {
        std::cout << "Testing Ensemble Forecaster...\n";

        EnsembleSettings settings;
        settings.forest.n_trees = 20;
        EnsembleForecaster ens(settings, FallbackEstimator());

        check(ens.windowSize(48) == 12 && ens.windowSize(14) == 7, "window size", "wrong window");

        const EnsembleForecaster::Descriptor d = EnsembleForecaster::describe(
            {{10, 20, 0, 0}, {30, 40, 0, 0}});
        check(d[0] == 20.0 && d[1] == 10.0 && d[2] == 30.0 && d[3] == 10.0 &&
              d[4] == 30.0 && d[5] == 40.0,
              "window descriptor", "wrong descriptor");

        const FeatureMatrix m = FeatureExtractor::extract(history(48));
        SeededNoise noise(3);
        ForecastContext ctx{"db-1", AS_OF, noise};
        const ForecastRun run = ens.forecast(m, 24, ctx);
        check(run.points.size() == 24 && run.fallback_points == 0, "forest path used", "fell back");
        check(inBounds(run.points) && offsetsAreSequential(run.points),
              "points well formed", "bad points");

        const ForecastRun twice = ens.forecast(m, 24, ctx);
        check(sameValues(run.points, twice.points), "refit is deterministic", "forecasts differ");

        const FeatureMatrix tiny = FeatureExtractor::extract(history(9));
        const ForecastRun small = ens.forecast(tiny, 4, ctx);
        check(small.points.size() == 4 && small.fallback_points == 4,
              "too few rows uses fallback", "forest used");

        auto cache = std::make_shared<ForestCache>(4);
        EnsembleForecaster cached(settings, FallbackEstimator(), cache);
        const ForecastRun first = cached.forecast(m, 24, ctx);
        const ForecastRun second = cached.forecast(m, 24, ctx);
        check(!first.cache_hit && second.cache_hit && cache->size() == 1,
              "second call hits the cache", "no cache hit");
        check(sameValues(first.points, run.points) && sameValues(second.points, run.points),
              "cached forest gives identical forecast", "forecasts differ");
        std::cout << "\n";
    }

    void test_combiner() {
        std::cout << "Testing Forecast Combiner...\n";

        ZeroNoise quiet;
        FallbackEstimator fb;
        const ForecastSet seq = fb.estimate(constantMatrix(24, 50, 60, 10, 1000), 0, 4, AS_OF, quiet);
        const ForecastSet ens = fb.estimate(constantMatrix(24, 100, 10, 20, 2000), 0, 4, AS_OF, quiet);

        ForecastCombiner combiner;
        const ForecastSet out = combiner.combine(seq, ens);
        check(out.size() == 4, "common length", "wrong length");
        check(std::fabs(out[0].cpu_percent - 70.0) < 1e-9 &&
              std::fabs(out[0].memory_percent - 40.0) < 1e-9 &&
              std::fabs(out[0].disk_percent - 14.0) < 1e-9 &&
              std::fabs(out[0].network_usage - 1400.0) < 1e-9,
              "0.6 / 0.4 blend", "wrong blend");
        check(out[3].timestamp == seq[3].timestamp && out[3].offset_hours == 4,
              "timestamps from sequence side", "wrong timestamp");

        check(sameValues(combiner.combine({}, ens), ens), "empty sequence side", "wrong result");
        check(sameValues(combiner.combine(seq, {}), seq), "empty ensemble side", "wrong result");

        const ForecastSet shorter(ens.begin(), ens.begin() + 2);
        check(combiner.combine(seq, shorter).size() == 2, "length mismatch truncates", "not truncated");
        std::cout << "\n";
    }

    void print_summary() {
        std::cout << "╔══════════════════════════════════════════════════════════════════╗\n";
        std::cout << "║                         TEST SUMMARY                             ║\n";
        std::cout << "╠══════════════════════════════════════════════════════════════════╣\n";
        std::cout << "║  Passed: " << std::setw(3) << tests_passed_
                  << "                                                      ║\n";
        std::cout << "║  Failed: " << std::setw(3) << tests_failed_
                  << "                                                      ║\n";
        std::cout << "╚══════════════════════════════════════════════════════════════════╝\n";

        if (tests_failed_ == 0) {
            std::cout << "\n✓ ALL TESTS PASSED\n\n";
        } else {
            std::cout << "\n✗ SOME TESTS FAILED\n\n";
        }
    }
};

int main() {
    stratus::log::setLevel(stratus::log::Level::ERROR);

    ForecastTest tester;
    return tester.run_all_tests() == 0 ? 0 : 1;
}
