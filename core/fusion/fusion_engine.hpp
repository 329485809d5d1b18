#pragma once

#include "fusion/score_record.hpp"
#include "weighting/entropy_weighting.hpp"

#include <optional>
#include <vector>

namespace hdfm {

struct FusionConfig {
    double severity_scale = 10.0;   // known maximum of the severity scale
    // Exploited records precede non-exploited ones regardless of composite.
    // When false the flag only breaks composite ties.
    bool exploited_overrides_composite = true;

    void validate() const;
};

// ─── Fusion Engine ────────────────────────────────────────────
// Weighted sum of the four normalized categories, then a total order:
// composite desc, exploited first, raw severity desc, advisory id asc.

class FusionEngine {
public:
    explicit FusionEngine(FusionConfig config = {});

    /// NaN severity → nullopt, so it ranks and reports as unscored.
    static std::optional<double> sanitizeSeverity(const std::optional<double>& raw);

    /// Severity mapped to [0,1] by the configured scale; absent → 0.
    double normalizeSeverity(const std::optional<double>& raw) const;

    /// Composite score for one pair under the given weights.
    double composite(const FusionInput& input, const WeightSet& weights) const;

    /// Score, filter out all-zero pairs, sort and assign 1-based ranks.
    std::vector<ScoreRecord> rank(const std::vector<FusionInput>& inputs,
                                  const WeightSet& weights) const;

    /// Strict ordering used by rank(); true when `a` sorts before `b`.
    bool outranks(const ScoreRecord& a, const ScoreRecord& b) const;

    const FusionConfig& config() const { return config_; }

private:
    FusionConfig config_;
};

} // namespace hdfm
