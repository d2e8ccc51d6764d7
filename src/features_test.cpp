// =============================================================================
// src/features_test.cpp - Feature extraction and statistics tests
// =============================================================================

#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <vector>

#include <boost/date_time/posix_time/posix_time.hpp>

#include "stratus/core/Errors.hpp"
#include "stratus/core/Log.hpp"
#include "stratus/core/Stats.hpp"
#include "stratus/features/FeatureExtractor.hpp"

using namespace stratus;
namespace pt = boost::posix_time;

namespace {

// Monday 2024-05-06 00:00 UTC
const pt::ptime MONDAY = pt::time_from_string("2024-05-06 00:00:00");

std::vector<MetricSample> hourly(int n, bool with_time) {
    std::vector<MetricSample> out;
    for (int i = 0; i < n; ++i) {
        MetricSample s;
        if (with_time) s.timestamp = MONDAY + pt::hours(i);
        s.cpu_percent = 10.0 + i;
        s.memory_percent = 40.0;
        s.disk_percent = 20.0;
        s.network_in_bytes = 1500.0;
        out.push_back(s);
    }
    return out;
}

bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) <= eps;
}

}

class FeaturesTest {
public:
    int run_all_tests() {
        std::cout << "\n╔══════════════════════════════════════════════════════════════════╗\n";
        std::cout << "║           STRATUS FEATURES - UNIT TESTS                          ║\n";
        std::cout << "╚══════════════════════════════════════════════════════════════════╝\n\n";

        test_stats();
        test_moving_average();
        test_matrix();
        test_columns_with_timestamps();
        test_columns_without_timestamps();
        test_missing_values();
        test_bad_input();

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

    void test_stats() {
        std::cout << "Testing Statistics...\n";

        const std::vector<double> v = {2, 4, 4, 4, 5, 5, 7, 9};
        check(near(stats::mean(v), 5.0), "mean", "expected 5");
        check(near(stats::stdev(v), 2.0), "population stdev", "expected 2");
        check(near(stats::max(v), 9.0), "max", "expected 9");

        const std::vector<double> none;
        check(stats::mean(none) == 0.0 && stats::stdev(none) == 0.0 && stats::max(none) == 0.0,
              "empty input reduces to zero", "non-zero result");

        const std::vector<double> flat(10, 50.0);
        check(near(stats::cv(flat), 0.0), "cv of constant series is zero", "non-zero cv");
        std::cout << "\n";
    }

    void test_moving_average() {
        std::cout << "Testing Moving Average...\n";

        const std::vector<double> x = {1, 2, 3, 4, 5};
        const std::vector<double> ma = FeatureExtractor::movingAverage(x, 3);
        check(ma.size() == 5, "output length matches input", "wrong length");
        check(near(ma[2], 2.0) && near(ma[3], 3.0) && near(ma[4], 4.0),
              "trailing means", "wrong full-window values");
        check(near(ma[0], 2.0) && near(ma[1], 2.0),
              "leading rows take first full-window value", "leading rows not backfilled");

        const std::vector<double> short_ma = FeatureExtractor::movingAverage(x, 12);
        bool zeros = true;
        for (double v : short_ma) zeros = zeros && v == 0.0;
        check(zeros, "series shorter than window is zero", "non-zero values");
        std::cout << "\n";
    }

    void test_matrix() {
        std::cout << "Testing Feature Matrix...\n";

        try {
            FeatureMatrix m({"a", "b"}, {{1.0, 2.0}, {3.0}});
            test_fail("ragged rows rejected", "no exception");
        } catch (const FeatureExtractionError&) {
            test_pass("ragged rows rejected");
        }

        FeatureMatrix m({"a", "b", "c", "d", "e"},
                        {{1, 2, 3, 4, 5}, {6, 7, 8, 9, 10}, {11, 12, 13, 14, 15}});
        const std::vector<double> t = m.tail(1, 2);
        check(t.size() == 2 && t[0] == 7.0 && t[1] == 12.0, "tail of column", "wrong tail");
        check(m.tail(0, 10).size() == 3, "tail longer than matrix", "wrong size");

        const auto base = m.baseTail(2);
        check(base.size() == 2 && base[0].size() == 4 && base[1][3] == 14.0,
              "base tail drops extra columns", "wrong base rows");

        check(m.indexOf("e") == 4 && m.has("c") && !m.has("z"), "column lookup", "wrong index");
        try {
            (void)m.indexOf("z");
            test_fail("unknown column throws", "no exception");
        } catch (const std::out_of_range&) {
            test_pass("unknown column throws");
        }
        std::cout << "\n";
    }

    void test_columns_with_timestamps() {
        std::cout << "Testing Extraction With Timestamps...\n";

        const FeatureMatrix m = FeatureExtractor::extract(hourly(30, true));
        check(m.rows() == 30, "one row per sample", "wrong row count");
        check(m.cols() == 11, "eleven columns", "wrong column count");
        check(m.names()[0] == columns::CPU && m.names()[3] == columns::NETWORK_IN,
              "raw metrics lead the column order", "wrong leading columns");

        const std::size_t hour = m.indexOf(columns::HOUR);
        const std::size_t dow = m.indexOf(columns::DAY_OF_WEEK);
        const std::size_t dom = m.indexOf(columns::DAY_OF_MONTH);
        check(m.at(13, hour) == 13.0, "hour of day", "wrong hour");
        check(m.at(0, dow) == 0.0, "monday is day zero", "wrong day of week");
        check(m.at(25, dow) == 1.0 && m.at(25, dom) == 7.0,
              "calendar advances past midnight", "wrong calendar fields");

        const std::size_t ma3 = m.indexOf(columns::CPU_MA3);
        const std::size_t ma12 = m.indexOf(columns::CPU_MA12);
        // cpu = 10 + i
        check(near(m.at(5, ma3), 14.0), "cpu ma3", "wrong short average");
        check(near(m.at(20, ma12), 24.5), "cpu ma12", "wrong long average");
        check(near(m.at(0, ma12), 15.5), "cpu ma12 leading rows", "wrong backfill");
        check(near(m.at(10, m.indexOf(columns::MEMORY_MA12)), 40.0),
              "memory ma12", "wrong memory average");
        std::cout << "\n";
    }

    void test_columns_without_timestamps() {
        std::cout << "Testing Extraction Without Timestamps...\n";

        const FeatureMatrix m = FeatureExtractor::extract(hourly(24, false));
        check(m.cols() == 8, "calendar columns omitted", "wrong column count");
        check(!m.has(columns::HOUR) && m.has(columns::MEMORY_MA3),
              "moving averages kept", "wrong columns");
        std::cout << "\n";
    }

    void test_missing_values() {
        std::cout << "Testing Missing Values...\n";

        std::vector<MetricSample> s = hourly(4, true);
        s[0].disk_percent.reset();
        s[2].cpu_percent.reset();
        s[3].timestamp.reset();

        const FeatureMatrix m = FeatureExtractor::extract(s);
        check(m.at(0, FeatureMatrix::DISK) == 0.0, "leading gap is zero", "not zero");
        check(m.at(2, FeatureMatrix::CPU) == m.at(1, FeatureMatrix::CPU),
              "gap takes previous value", "not forward filled");
        check(m.at(3, m.indexOf(columns::HOUR)) == 2.0,
              "missing timestamp takes previous calendar", "calendar not forward filled");
        std::cout << "\n";
    }

    void test_bad_input() {
        std::cout << "Testing Bad Input...\n";

        try {
            (void)FeatureExtractor::extract({});
            test_fail("empty history rejected", "no exception");
        } catch (const FeatureExtractionError&) {
            test_pass("empty history rejected");
        }

        std::vector<MetricSample> s = hourly(5, true);
        s[3].memory_percent = std::numeric_limits<double>::quiet_NaN();
        try {
            (void)FeatureExtractor::extract(s);
            test_fail("NaN rejected", "no exception");
        } catch (const FeatureExtractionError&) {
            test_pass("NaN rejected");
        }

        s = hourly(5, true);
        s[1].timestamp = pt::ptime(pt::not_a_date_time);
        try {
            (void)FeatureExtractor::extract(s);
            test_fail("invalid timestamp rejected", "no exception");
        } catch (const FeatureExtractionError&) {
            test_pass("invalid timestamp rejected");
        }
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
    stratus::log::setLevel(stratus::log::Level::WARN);

    FeaturesTest tester;
    return tester.run_all_tests() == 0 ? 0 : 1;
}
