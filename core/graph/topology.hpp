#pragma once

#include "graph/component_graph.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace hdfm {

// ─── Topology Config ───────────────────────────────────────────
// Convex combination between depth-inverse and centrality.
// Weights are normalized by their sum, so only the ratio matters.

struct TopologyConfig {
    double depth_weight = 0.5;
    double centrality_weight = 0.5;
    double hub_threshold = 0.7;   // TCS above this counts as a hub

    void validate() const;
};

// ─── Topology Score ────────────────────────────────────────────

struct TopologyScore {
    std::string component_id;
    int depth = 0;                   // edges from nearest root
    bool reachable = true;           // false → depth is max observed + 1
    size_t ancestor_count = 0;       // transitive dependents, self excluded
    double normalized_depth = 0.0;   // [0,1]
    double centrality = 0.0;         // [0,1]
    double tcs = 0.0;                // Topological Criticality Score
};

// ─── Topology Analyzer ─────────────────────────────────────────
// Computes depth, blast-radius centrality and TCS for every component.
// Terminates on cyclic graphs; cycle members share one ancestor set.

class TopologyAnalyzer {
public:
    explicit TopologyAnalyzer(TopologyConfig config = {});

    /// Score every component, indexed like the graph arena.
    /// Empty `roots` means every component without an incoming edge.
    /// Throws IntegrityError for a root absent from the graph.
    std::vector<TopologyScore> analyze(const ComponentGraph& graph,
                                       const std::vector<std::string>& roots) const;

    /// Resolve root ids to indices, falling back to source components.
    std::vector<ComponentGraph::Index> resolveRoots(
        const ComponentGraph& graph, const std::vector<std::string>& roots) const;

    /// Multi-source BFS depth. -1 marks unreachable components.
    std::vector<int> computeDepths(const ComponentGraph& graph,
                                   const std::vector<ComponentGraph::Index>& roots) const;

    /// Number of other components that transitively depend on each one.
    std::vector<size_t> computeAncestorCounts(const ComponentGraph& graph) const;

    /// Depth-inverse / centrality convex combination.
    double combine(double normalized_depth, double centrality) const;

    const TopologyConfig& config() const { return config_; }

private:
    TopologyConfig config_;
};

} // namespace hdfm
