#include "fusion/fusion_engine.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace hdfm {

void FusionConfig::validate() const {
    if (!(severity_scale > 0.0))
        throw std::invalid_argument("Severity scale must be positive");
}

FusionEngine::FusionEngine(FusionConfig config)
    : config_(config) {
    config_.validate();
}

std::optional<double> FusionEngine::sanitizeSeverity(const std::optional<double>& raw) {
    if (!raw || std::isnan(*raw)) return std::nullopt;
    return raw;
}

double FusionEngine::normalizeSeverity(const std::optional<double>& raw) const {
    if (!raw || std::isnan(*raw)) return 0.0;
    return std::clamp(*raw / config_.severity_scale, 0.0, 1.0);
}

double FusionEngine::composite(const FusionInput& input, const WeightSet& weights) const {
    double score =
        weights.topology * input.topology +
        weights.exploit_probability * input.exploit_probability +
        weights.exploited_flag * (input.exploited ? 1.0 : 0.0) +
        weights.severity * normalizeSeverity(input.raw_severity);
    return std::clamp(score, 0.0, 1.0);
}

bool FusionEngine::outranks(const ScoreRecord& a, const ScoreRecord& b) const {
    if (config_.exploited_overrides_composite && a.exploited != b.exploited)
        return a.exploited;
    if (a.composite != b.composite) return a.composite > b.composite;
    if (a.exploited != b.exploited) return a.exploited;

    // Absent severity sorts below any scored one
    double sa = a.raw_severity ? *a.raw_severity : -1.0;
    double sb = b.raw_severity ? *b.raw_severity : -1.0;
    if (sa != sb) return sa > sb;

    if (a.vulnerability_id != b.vulnerability_id)
        return a.vulnerability_id < b.vulnerability_id;
    return a.component_id < b.component_id;
}

std::vector<ScoreRecord> FusionEngine::rank(const std::vector<FusionInput>& inputs,
                                            const WeightSet& weights) const {
    std::vector<ScoreRecord> records;
    records.reserve(inputs.size());

    size_t skipped = 0;
    for (const FusionInput& in : inputs) {
        double sev = normalizeSeverity(in.raw_severity);
        if (in.topology <= 0.0 && in.exploit_probability <= 0.0 &&
            !in.exploited && sev <= 0.0) {
            skipped++;
            continue;
        }

        ScoreRecord r;
        r.component_id = in.component_id;
        r.vulnerability_id = in.vulnerability_id;
        r.composite = composite(in, weights);
        r.topology = in.topology;
        r.exploit_probability = in.exploit_probability;
        r.exploited = in.exploited;
        r.raw_severity = sanitizeSeverity(in.raw_severity);
        r.normalized_severity = sev;
        records.push_back(std::move(r));
    }

    std::sort(records.begin(), records.end(),
              [this](const ScoreRecord& a, const ScoreRecord& b) {
                  return outranks(a, b);
              });

    for (size_t i = 0; i < records.size(); i++) {
        records[i].rank = i + 1;
    }

    if (skipped > 0) {
        spdlog::debug("fusion: skipped {} pairs with no nonzero signal", skipped);
    }
    return records;
}

} // namespace hdfm
