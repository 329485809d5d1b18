#pragma once

#include "fusion/score_record.hpp"

#include <vector>

namespace hdfm {

/// Percentile cut points over positive composites, with static floors so a
/// low-risk inventory never promotes its top items to Critical.
struct TierConfig {
    double critical_percentile = 90.0;
    double high_percentile = 70.0;
    double critical_floor = 0.7;
    double high_floor = 0.4;

    void validate() const;
};

struct TierThresholds {
    double critical = 0.0;
    double high = 0.0;
};

class PriorityClassifier {
public:
    explicit PriorityClassifier(TierConfig config = {});

    /// Thresholds derived from the strictly positive composites.
    TierThresholds thresholds(const std::vector<ScoreRecord>& records) const;

    Priority classify(double composite, const TierThresholds& t) const;

    /// Fill in `priority` for every record, returning the thresholds used.
    TierThresholds assign(std::vector<ScoreRecord>& records) const;

    /// Linear interpolation between order statistics, p in [0,100].
    static double percentile(std::vector<double> values, double p);

private:
    TierConfig config_;
};

} // namespace hdfm
