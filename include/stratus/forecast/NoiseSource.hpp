#pragma once

#include <cstdint>
#include <random>

namespace stratus {

// Source of Gaussian jitter for the fallback estimator.
class NoiseSource {
public:
    virtual ~NoiseSource() = default;
    virtual double gaussian(double mean, double stddev) = 0;
};

// Per-call seeded source. Not shared between calls.
class SeededNoise : public NoiseSource {
public:
    explicit SeededNoise(uint64_t seed) : rng(seed) {}

    double gaussian(double mean, double stddev) override {
        if (stddev <= 0.0) return mean;
        std::normal_distribution<double> dist(mean, stddev);
        return dist(rng);
    }

private:
    std::mt19937_64 rng;
};

// Always returns the mean. Used to pin the fallback to its baseline.
class ZeroNoise : public NoiseSource {
public:
    double gaussian(double mean, double) override { return mean; }
};

}
