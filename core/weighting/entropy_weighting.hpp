#pragma once

#include <array>
#include <cstddef>
#include <vector>

namespace hdfm {

// ─── Signal Categories ────────────────────────────────────────

enum class SignalCategory {
    Topology = 0,
    ExploitProbability = 1,
    ExploitedFlag = 2,
    Severity = 3
};

constexpr size_t kSignalCategoryCount = 4;

const char* signalCategoryName(SignalCategory category);

// ─── Weight Set ───────────────────────────────────────────────
// One non-negative weight per category, summing to 1 for a run.

struct WeightSet {
    double topology = 0.25;
    double exploit_probability = 0.25;
    double exploited_flag = 0.25;
    double severity = 0.25;
    bool equal_fallback = false;   // every category was degenerate

    double get(SignalCategory category) const;
    void set(SignalCategory category, double value);
    double sum() const {
        return topology + exploit_probability + exploited_flag + severity;
    }

    static WeightSet equal() {
        WeightSet w;
        w.equal_fallback = true;
        return w;
    }
};

// ─── Signal Vectors ───────────────────────────────────────────
// Per-component values across the whole inventory, all in [0,1].

struct SignalVectors {
    std::vector<double> topology;
    std::vector<double> exploit_probability;
    std::vector<bool> exploited;
    std::vector<double> severity;

    size_t size() const { return topology.size(); }
};

struct EntropyConfig {
    int bins = 10;   // equal-width bins over [0,1] for numeric signals

    void validate() const;
};

struct EntropyReport {
    std::array<double, kSignalCategoryCount> entropy{};             // bits
    std::array<double, kSignalCategoryCount> normalized_entropy{};  // [0,1]
    WeightSet weights;
};

// ─── Entropy Weighting ────────────────────────────────────────
// Weights each category by how much its distribution varies across the
// inventory. Stateless; recomputed in full on every run.

class EntropyWeighting {
public:
    explicit EntropyWeighting(EntropyConfig config = {});

    /// Throws std::invalid_argument if vectors differ in length.
    EntropyReport compute(const SignalVectors& signals) const;

    /// Bin index for a value in [0,1]; values are clamped and 1.0 maps
    /// to the last bin.
    static size_t binOf(double value, int bins);

    static std::vector<size_t> histogram(const std::vector<double>& values, int bins);
    static std::vector<size_t> histogram(const std::vector<bool>& values);

    /// Shannon entropy in bits over nonzero bins.
    static double shannonEntropy(const std::vector<size_t>& counts);

    const EntropyConfig& config() const { return config_; }

private:
    EntropyConfig config_;
};

} // namespace hdfm
