#include "weighting/entropy_weighting.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace hdfm {

const char* signalCategoryName(SignalCategory category) {
    switch (category) {
        case SignalCategory::Topology:           return "topology";
        case SignalCategory::ExploitProbability: return "exploit_probability";
        case SignalCategory::ExploitedFlag:      return "exploited_flag";
        case SignalCategory::Severity:           return "severity";
    }
    return "unknown";
}

double WeightSet::get(SignalCategory category) const {
    switch (category) {
        case SignalCategory::Topology:           return topology;
        case SignalCategory::ExploitProbability: return exploit_probability;
        case SignalCategory::ExploitedFlag:      return exploited_flag;
        case SignalCategory::Severity:           return severity;
    }
    return 0.0;
}

void WeightSet::set(SignalCategory category, double value) {
    switch (category) {
        case SignalCategory::Topology:           topology = value; break;
        case SignalCategory::ExploitProbability: exploit_probability = value; break;
        case SignalCategory::ExploitedFlag:      exploited_flag = value; break;
        case SignalCategory::Severity:           severity = value; break;
    }
}

void EntropyConfig::validate() const {
    if (bins < 2) throw std::invalid_argument("Entropy bin count must be at least 2");
}

EntropyWeighting::EntropyWeighting(EntropyConfig config)
    : config_(config) {
    config_.validate();
}

// ─── Discretization ───────────────────────────────────────────

size_t EntropyWeighting::binOf(double value, int bins) {
    double v = std::clamp(value, 0.0, 1.0);
    auto b = static_cast<size_t>(std::floor(v * bins));
    return std::min(b, static_cast<size_t>(bins - 1));
}

std::vector<size_t> EntropyWeighting::histogram(const std::vector<double>& values, int bins) {
    std::vector<size_t> counts(static_cast<size_t>(bins), 0);
    for (double v : values) counts[binOf(v, bins)]++;
    return counts;
}

std::vector<size_t> EntropyWeighting::histogram(const std::vector<bool>& values) {
    std::vector<size_t> counts(2, 0);
    for (bool v : values) counts[v ? 1 : 0]++;
    return counts;
}

double EntropyWeighting::shannonEntropy(const std::vector<size_t>& counts) {
    size_t total = 0;
    for (size_t c : counts) total += c;
    if (total == 0) return 0.0;

    double h = 0.0;
    for (size_t c : counts) {
        if (c == 0) continue;
        double p = static_cast<double>(c) / static_cast<double>(total);
        h -= p * std::log2(p);
    }
    // A single occupied bin yields -1·log2(1) = -0.0
    return h > 0.0 ? h : 0.0;
}

// ─── Weights ──────────────────────────────────────────────────

EntropyReport EntropyWeighting::compute(const SignalVectors& signals) const {
    const size_t n = signals.size();
    if (signals.exploit_probability.size() != n || signals.exploited.size() != n ||
        signals.severity.size() != n) {
        throw std::invalid_argument("Signal vectors must have one entry per component");
    }

    EntropyReport report;
    const int bins = config_.bins;
    const double numeric_max = std::log2(static_cast<double>(bins));

    std::array<std::vector<size_t>, kSignalCategoryCount> hist = {
        histogram(signals.topology, bins),
        histogram(signals.exploit_probability, bins),
        histogram(signals.exploited),
        histogram(signals.severity, bins)
    };

    double total = 0.0;
    for (size_t c = 0; c < kSignalCategoryCount; c++) {
        double max_h = (c == static_cast<size_t>(SignalCategory::ExploitedFlag))
            ? 1.0 : numeric_max;
        report.entropy[c] = shannonEntropy(hist[c]);
        report.normalized_entropy[c] = std::min(report.entropy[c] / max_h, 1.0);
        total += report.normalized_entropy[c];
    }

    if (total <= 0.0) {
        report.weights = WeightSet::equal();
        spdlog::debug("entropy: all categories degenerate over {} components, equal weights", n);
        return report;
    }

    for (size_t c = 0; c < kSignalCategoryCount; c++) {
        report.weights.set(static_cast<SignalCategory>(c), report.normalized_entropy[c] / total);
    }
    report.weights.equal_fallback = false;

    spdlog::debug("entropy weights ({} bins): topology={:.4f} epss={:.4f} exploited={:.4f} severity={:.4f}",
                  bins, report.weights.topology, report.weights.exploit_probability,
                  report.weights.exploited_flag, report.weights.severity);
    return report;
}

} // namespace hdfm
