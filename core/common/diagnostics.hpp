#pragma once

#include <algorithm>
#include <string>
#include <vector>

namespace hdfm {

// ─── Non-fatal findings ───────────────────────────────────────
// Reported alongside a completed run. Nothing here aborts scoring.

enum class MissingField {
    ExploitProbability,  // feed had no probability for the advisory
    Severity,            // vulnerability carries no base severity
    FeedFailure          // lookup failed or timed out upstream
};

enum class DegenerateInput {
    NoVulnerabilities,   // nothing to rank, weighting skipped
    SingleComponent,     // entropy undefined, equal weights used
    ConstantSignals      // every category constant, equal weights used
};

struct IncompleteSignal {
    std::string advisory_id;
    std::string component_id;  // empty for feed-level failures
    MissingField field = MissingField::ExploitProbability;
    std::string detail;
};

struct Diagnostics {
    std::vector<IncompleteSignal> incomplete;
    std::vector<DegenerateInput> notices;

    bool has(DegenerateInput notice) const {
        return std::find(notices.begin(), notices.end(), notice) != notices.end();
    }

    void notice(DegenerateInput n) {
        if (!has(n)) notices.push_back(n);
    }

    /// Distinct advisory ids with at least one incomplete field, sorted.
    std::vector<std::string> incompleteAdvisories() const {
        std::vector<std::string> ids;
        for (const auto& s : incomplete) ids.push_back(s.advisory_id);
        std::sort(ids.begin(), ids.end());
        ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
        return ids;
    }
};

inline const char* missingFieldName(MissingField f) {
    switch (f) {
        case MissingField::ExploitProbability: return "exploit_probability";
        case MissingField::Severity:           return "severity";
        case MissingField::FeedFailure:        return "feed_failure";
    }
    return "unknown";
}

inline const char* degenerateInputName(DegenerateInput d) {
    switch (d) {
        case DegenerateInput::NoVulnerabilities: return "no_vulnerabilities";
        case DegenerateInput::SingleComponent:   return "single_component";
        case DegenerateInput::ConstantSignals:   return "constant_signals";
    }
    return "unknown";
}

} // namespace hdfm
