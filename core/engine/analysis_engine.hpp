#pragma once

#include "common/diagnostics.hpp"
#include "engine/engine_config.hpp"
#include "fusion/priority_tiers.hpp"
#include "fusion/score_record.hpp"
#include "graph/component.hpp"
#include "graph/topology.hpp"
#include "signals/signal_collector.hpp"
#include "signals/signal_normalizer.hpp"
#include "signals/threat_signal.hpp"
#include "weighting/entropy_weighting.hpp"

#include <optional>
#include <string>
#include <vector>

namespace hdfm {

// ─── Inventory ────────────────────────────────────────────────
// Fully assembled input of one run, as handed over by the SBOM parser,
// the vulnerability lookup and the threat-feed clients.

struct Inventory {
    std::vector<Component> components;
    std::vector<DependencyEdge> edges;
    std::vector<std::string> roots;          // empty → components without parents
    std::vector<Vulnerability> vulnerabilities;
    ThreatSignalMap signals;                 // keyed by advisory id
    std::vector<FeedFailure> feed_failures;  // lookups that did not complete
};

struct AnalysisSummary {
    size_t total_components = 0;
    size_t total_vulnerabilities = 0;   // distinct advisories
    size_t scored_pairs = 0;
    size_t critical_findings = 0;
    size_t hub_components = 0;
    int max_depth = 0;                  // deepest reachable component
};

// ─── Analysis Result ──────────────────────────────────────────
// Ranking plus everything needed to explain it.

struct AnalysisResult {
    std::vector<ScoreRecord> ranking;
    std::optional<WeightSet> weights;        // absent when nothing was scored
    std::optional<EntropyReport> entropy;
    std::vector<TopologyScore> topology;     // per component, inventory order
    std::vector<ComponentThreat> threats;    // per component, inventory order
    TierThresholds thresholds;
    AnalysisSummary summary;
    Diagnostics diagnostics;
};

// ─── Analysis Engine ──────────────────────────────────────────
// Graph builder → signal normalizer → entropy weighting → fusion.
// Pure and single-threaded; independent runs share no state.

class AnalysisEngine {
public:
    explicit AnalysisEngine(EngineConfig config = {});

    /// Run the full pipeline. Throws IntegrityError on inconsistent input;
    /// degenerate and incomplete data are reported in the diagnostics.
    AnalysisResult run(const Inventory& inventory) const;

    const EngineConfig& config() const { return config_; }

    /// Merge duplicate advisories and verify every referenced component.
    static std::vector<Vulnerability> consolidate(const ComponentGraph& graph,
                                                  const std::vector<Vulnerability>& vulnerabilities);

private:
    EngineConfig config_;
};

/// Best-ranked record per component, in rank order.
std::vector<ScoreRecord> topFindingPerComponent(const std::vector<ScoreRecord>& ranking);

} // namespace hdfm
