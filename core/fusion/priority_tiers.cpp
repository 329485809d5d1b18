#include "fusion/priority_tiers.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace hdfm {

void TierConfig::validate() const {
    auto in_range = [](double p) { return p >= 0.0 && p <= 100.0; };
    if (!in_range(critical_percentile) || !in_range(high_percentile))
        throw std::invalid_argument("Tier percentiles must lie in [0,100]");
    if (high_percentile > critical_percentile)
        throw std::invalid_argument("High percentile must not exceed critical percentile");
    if (!std::isfinite(critical_floor) || !std::isfinite(high_floor))
        throw std::invalid_argument("Tier floors must be finite");
    if (high_floor > critical_floor)
        throw std::invalid_argument("High floor must not exceed critical floor");
}

PriorityClassifier::PriorityClassifier(TierConfig config)
    : config_(config) {
    config_.validate();
}

double PriorityClassifier::percentile(std::vector<double> values, double p) {
    if (values.empty()) return 0.0;
    std::sort(values.begin(), values.end());

    double pos = (p / 100.0) * static_cast<double>(values.size() - 1);
    auto lo = static_cast<size_t>(std::floor(pos));
    auto hi = static_cast<size_t>(std::ceil(pos));
    return values[lo] + (values[hi] - values[lo]) * (pos - static_cast<double>(lo));
}

TierThresholds PriorityClassifier::thresholds(const std::vector<ScoreRecord>& records) const {
    std::vector<double> positive;
    for (const auto& r : records) {
        if (r.composite > 0.0) positive.push_back(r.composite);
    }

    TierThresholds t;
    if (positive.empty()) {
        t.critical = config_.critical_floor;
        t.high = config_.high_floor;
        return t;
    }
    t.critical = std::max(percentile(positive, config_.critical_percentile), config_.critical_floor);
    t.high = std::max(percentile(positive, config_.high_percentile), config_.high_floor);
    return t;
}

Priority PriorityClassifier::classify(double composite, const TierThresholds& t) const {
    if (composite <= 0.0) return Priority::Low;
    if (composite >= t.critical) return Priority::Critical;
    if (composite >= t.high) return Priority::High;
    return Priority::Medium;
}

TierThresholds PriorityClassifier::assign(std::vector<ScoreRecord>& records) const {
    TierThresholds t = thresholds(records);
    for (auto& r : records) {
        r.priority = classify(r.composite, t);
    }
    return t;
}

} // namespace hdfm
