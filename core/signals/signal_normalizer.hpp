#pragma once

#include "common/diagnostics.hpp"
#include "graph/component_graph.hpp"
#include "signals/threat_signal.hpp"

#include <optional>
#include <string>
#include <vector>

namespace hdfm {

// ─── Component Threat ─────────────────────────────────────────
// Worst-case view of every advisory attached to one component.

struct ComponentThreat {
    std::string component_id;
    double exploit_probability = 0.0;   // max over advisories, absent → 0
    bool exploited = false;             // OR over advisories
    bool data_incomplete = false;       // some advisory lacked a probability
    size_t vulnerability_count = 0;
};

struct NormalizedSignals {
    std::vector<ComponentThreat> components;   // indexed like the graph arena
    std::vector<IncompleteSignal> incomplete;
};

// ─── Signal Normalizer ────────────────────────────────────────

class SignalNormalizer {
public:
    /// Aggregate per-advisory signals onto components.
    /// Throws IntegrityError when a vulnerability names an unknown component.
    NormalizedSignals normalize(const ComponentGraph& graph,
                                const std::vector<Vulnerability>& vulnerabilities,
                                const ThreatSignalMap& signals) const;

    /// Probability clamped into [0,1]; NaN or missing → nullopt.
    static std::optional<double> sanitize(const std::optional<double>& probability);

    /// Signal for an advisory, or an all-absent signal when the feed has none.
    static ThreatSignal lookup(const ThreatSignalMap& signals, const std::string& advisory_id);
};

} // namespace hdfm
