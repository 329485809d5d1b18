#include <gtest/gtest.h>
#include "weighting/entropy_weighting.hpp"

#include <cmath>
#include <stdexcept>

using namespace hdfm;

namespace {

SignalVectors makeVectors(std::vector<double> topology,
                          std::vector<double> probability,
                          std::vector<bool> exploited,
                          std::vector<double> severity) {
    SignalVectors v;
    v.topology = std::move(topology);
    v.exploit_probability = std::move(probability);
    v.exploited = std::move(exploited);
    v.severity = std::move(severity);
    return v;
}

} // namespace

// ─── Discretization ───────────────────────────────────────────

TEST(WeightingTest, EqualWidthBins) {
    EXPECT_EQ(EntropyWeighting::binOf(0.0, 10), 0);
    EXPECT_EQ(EntropyWeighting::binOf(0.05, 10), 0);
    EXPECT_EQ(EntropyWeighting::binOf(0.15, 10), 1);
    EXPECT_EQ(EntropyWeighting::binOf(0.95, 10), 9);
    EXPECT_EQ(EntropyWeighting::binOf(1.0, 10), 9);    // last bin closed
    EXPECT_EQ(EntropyWeighting::binOf(1.5, 10), 9);    // clamped
    EXPECT_EQ(EntropyWeighting::binOf(-0.3, 10), 0);
    EXPECT_EQ(EntropyWeighting::binOf(0.5, 2), 1);
    EXPECT_EQ(EntropyWeighting::binOf(0.49, 2), 0);
}

TEST(WeightingTest, BooleanHistogramHasTwoBins) {
    auto h = EntropyWeighting::histogram(std::vector<bool>{true, false, false});
    ASSERT_EQ(h.size(), 2);
    EXPECT_EQ(h[0], 2);
    EXPECT_EQ(h[1], 1);
}

// ─── Shannon entropy ──────────────────────────────────────────

TEST(WeightingTest, ShannonEntropyKnownValues) {
    EXPECT_DOUBLE_EQ(EntropyWeighting::shannonEntropy({5, 0, 0}), 0.0);
    EXPECT_DOUBLE_EQ(EntropyWeighting::shannonEntropy({3, 3}), 1.0);
    EXPECT_DOUBLE_EQ(EntropyWeighting::shannonEntropy({1, 1, 1, 1}), 2.0);
    EXPECT_NEAR(EntropyWeighting::shannonEntropy({2, 1}),
                -(2.0 / 3) * std::log2(2.0 / 3) - (1.0 / 3) * std::log2(1.0 / 3), 1e-12);
    EXPECT_DOUBLE_EQ(EntropyWeighting::shannonEntropy({}), 0.0);
}

TEST(WeightingTest, UniformDistributionReachesMaximum) {
    std::vector<double> spread;
    for (int i = 0; i < 10; i++) spread.push_back(0.05 + 0.1 * i);
    std::vector<bool> half(10, false);
    for (int i = 0; i < 5; i++) half[i] = true;

    EntropyWeighting weighting;
    auto report = weighting.compute(makeVectors(spread, spread, half, spread));
    for (size_t c = 0; c < kSignalCategoryCount; c++) {
        EXPECT_NEAR(report.normalized_entropy[c], 1.0, 1e-12);
        EXPECT_NEAR(report.weights.get(static_cast<SignalCategory>(c)), 0.25, 1e-12);
    }
    EXPECT_FALSE(report.weights.equal_fallback);
}

// ─── Weight sets ──────────────────────────────────────────────

TEST(WeightingTest, WeightsAreNonNegativeAndSumToOne) {
    auto v = makeVectors({0.9, 0.5, 0.5, 0.1, 0.3},
                         {0.01, 0.02, 0.50, 0.97, 0.33},
                         {false, false, true, false, false},
                         {0.98, 0.75, 0.75, 0.53, 0.0});
    auto report = EntropyWeighting().compute(v);

    for (size_t c = 0; c < kSignalCategoryCount; c++) {
        EXPECT_GE(report.weights.get(static_cast<SignalCategory>(c)), 0.0);
        EXPECT_GE(report.normalized_entropy[c], 0.0);
        EXPECT_LE(report.normalized_entropy[c], 1.0);
    }
    EXPECT_NEAR(report.weights.sum(), 1.0, 1e-12);
}

TEST(WeightingTest, ConstantFlagIsDownWeighted) {
    // Nothing is exploited, probabilities vary widely
    auto v = makeVectors({0.2, 0.4, 0.6, 0.8},
                         {0.05, 0.35, 0.65, 0.95},
                         {false, false, false, false},
                         {0.5, 0.5, 0.9, 0.9});
    auto report = EntropyWeighting().compute(v);
    EXPECT_DOUBLE_EQ(report.entropy[static_cast<size_t>(SignalCategory::ExploitedFlag)], 0.0);
    EXPECT_DOUBLE_EQ(report.weights.exploited_flag, 0.0);
    EXPECT_GT(report.weights.exploit_probability, report.weights.severity);
    EXPECT_NEAR(report.weights.sum(), 1.0, 1e-12);
}

TEST(WeightingTest, DegenerateCategoriesGetZeroWeight) {
    // Identical severity and probability everywhere
    auto v = makeVectors({0.1, 0.5, 0.9},
                         {0.3, 0.3, 0.3},
                         {true, false, false},
                         {0.7, 0.7, 0.7});
    auto report = EntropyWeighting().compute(v);
    EXPECT_DOUBLE_EQ(report.entropy[static_cast<size_t>(SignalCategory::Severity)], 0.0);
    EXPECT_DOUBLE_EQ(report.entropy[static_cast<size_t>(SignalCategory::ExploitProbability)], 0.0);
    EXPECT_DOUBLE_EQ(report.weights.severity, 0.0);
    EXPECT_DOUBLE_EQ(report.weights.exploit_probability, 0.0);
    EXPECT_GT(report.weights.topology, 0.0);
    EXPECT_GT(report.weights.exploited_flag, 0.0);
    EXPECT_FALSE(report.weights.equal_fallback);
    EXPECT_NEAR(report.weights.sum(), 1.0, 1e-12);
}

TEST(WeightingTest, AllConstantFallsBackToEqual) {
    auto v = makeVectors({0.5, 0.5, 0.5}, {0.2, 0.2, 0.2},
                         {false, false, false}, {0.8, 0.8, 0.8});
    auto report = EntropyWeighting().compute(v);
    EXPECT_TRUE(report.weights.equal_fallback);
    EXPECT_DOUBLE_EQ(report.weights.topology, 0.25);
    EXPECT_DOUBLE_EQ(report.weights.exploit_probability, 0.25);
    EXPECT_DOUBLE_EQ(report.weights.exploited_flag, 0.25);
    EXPECT_DOUBLE_EQ(report.weights.severity, 0.25);
}

TEST(WeightingTest, SingleComponentFallsBackToEqual) {
    auto report = EntropyWeighting().compute(makeVectors({0.5}, {0.9}, {true}, {1.0}));
    EXPECT_TRUE(report.weights.equal_fallback);
    EXPECT_NEAR(report.weights.sum(), 1.0, 1e-12);
}

TEST(WeightingTest, BinCountChangesResolution) {
    // 0.1 and 0.2 share a bin at 2 bins but not at 10
    auto v = makeVectors({0.1, 0.2}, {0.1, 0.2}, {false, true}, {0.1, 0.2});
    auto fine = EntropyWeighting().compute(v);
    EXPECT_GT(fine.weights.topology, 0.0);

    EntropyConfig coarse_cfg;
    coarse_cfg.bins = 2;
    auto coarse = EntropyWeighting(coarse_cfg).compute(v);
    EXPECT_DOUBLE_EQ(coarse.weights.topology, 0.0);
    EXPECT_DOUBLE_EQ(coarse.weights.exploited_flag, 1.0);
}

TEST(WeightingTest, InvalidInputRejected) {
    EntropyConfig bad;
    bad.bins = 1;
    EXPECT_THROW(EntropyWeighting weighting(bad), std::invalid_argument);

    auto v = makeVectors({0.1, 0.2}, {0.1}, {false, true}, {0.1, 0.2});
    EXPECT_THROW(EntropyWeighting().compute(v), std::invalid_argument);
}

TEST(WeightingTest, CategoryNames) {
    EXPECT_STREQ(signalCategoryName(SignalCategory::Topology), "topology");
    EXPECT_STREQ(signalCategoryName(SignalCategory::ExploitedFlag), "exploited_flag");
}
