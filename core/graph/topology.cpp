#include "graph/topology.hpp"
#include "common/integrity_error.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <deque>
#include <stdexcept>

namespace hdfm {

void TopologyConfig::validate() const {
    if (depth_weight < 0.0 || centrality_weight < 0.0)
        throw std::invalid_argument("Topology weights must be non-negative");
    if (depth_weight + centrality_weight <= 0.0)
        throw std::invalid_argument("Topology weights must not both be zero");
}

TopologyAnalyzer::TopologyAnalyzer(TopologyConfig config)
    : config_(config) {
    config_.validate();
}

std::vector<ComponentGraph::Index> TopologyAnalyzer::resolveRoots(
    const ComponentGraph& graph, const std::vector<std::string>& roots) const {

    if (roots.empty()) return graph.sourceIndices();

    std::vector<ComponentGraph::Index> resolved;
    for (const auto& id : roots) {
        auto idx = graph.indexOf(id);
        if (!idx) throw IntegrityError::missingComponent(id, "roots");
        if (std::find(resolved.begin(), resolved.end(), *idx) == resolved.end())
            resolved.push_back(*idx);
    }
    return resolved;
}

// ─── Depth ─────────────────────────────────────────────────────

std::vector<int> TopologyAnalyzer::computeDepths(
    const ComponentGraph& graph,
    const std::vector<ComponentGraph::Index>& roots) const {

    std::vector<int> depth(graph.componentCount(), -1);
    std::deque<ComponentGraph::Index> queue;

    for (auto r : roots) {
        depth[r] = 0;
        queue.push_back(r);
    }

    // First visit wins, so each node keeps its shortest distance
    while (!queue.empty()) {
        auto current = queue.front();
        queue.pop_front();
        for (auto child : graph.children(current)) {
            if (depth[child] >= 0) continue;
            depth[child] = depth[current] + 1;
            queue.push_back(child);
        }
    }
    return depth;
}

// ─── Centrality ────────────────────────────────────────────────

std::vector<size_t> TopologyAnalyzer::computeAncestorCounts(
    const ComponentGraph& graph) const {

    const size_t n = graph.componentCount();
    std::vector<size_t> counts(n, 0);
    std::vector<char> visited(n, 0);
    std::vector<ComponentGraph::Index> stack;

    for (ComponentGraph::Index target = 0; target < n; target++) {
        std::fill(visited.begin(), visited.end(), 0);
        stack.assign(graph.parents(target).begin(), graph.parents(target).end());

        // Reverse reachability. A cycle leads back to `target` itself, so
        // every member of a cycle collects the same set.
        size_t count = 0;
        while (!stack.empty()) {
            auto current = stack.back();
            stack.pop_back();
            if (visited[current]) continue;
            visited[current] = 1;
            if (current != target) count++;
            for (auto p : graph.parents(current)) {
                if (!visited[p]) stack.push_back(p);
            }
        }
        counts[target] = count;
    }
    return counts;
}

double TopologyAnalyzer::combine(double normalized_depth, double centrality) const {
    double total = config_.depth_weight + config_.centrality_weight;
    return (config_.depth_weight * (1.0 - normalized_depth) +
            config_.centrality_weight * centrality) / total;
}

// ─── Analyze ───────────────────────────────────────────────────

std::vector<TopologyScore> TopologyAnalyzer::analyze(
    const ComponentGraph& graph, const std::vector<std::string>& roots) const {

    const size_t n = graph.componentCount();
    std::vector<TopologyScore> scores(n);
    if (n == 0) return scores;

    auto root_indices = resolveRoots(graph, roots);
    auto depths = computeDepths(graph, root_indices);
    auto ancestors = computeAncestorCounts(graph);

    int max_reachable = 0;
    bool any_unreachable = false;
    for (int d : depths) {
        if (d < 0) any_unreachable = true;
        else max_reachable = std::max(max_reachable, d);
    }
    const int unreachable_depth = max_reachable + 1;
    const int max_depth = any_unreachable ? unreachable_depth : max_reachable;

    spdlog::debug("topology: {} components, {} edges, {} roots, max depth {}{}",
                  n, graph.edgeCount(), root_indices.size(), max_reachable,
                  any_unreachable ? " (unreachable present)" : "");

    for (ComponentGraph::Index i = 0; i < n; i++) {
        TopologyScore& s = scores[i];
        s.component_id = graph.component(i).id;
        s.reachable = depths[i] >= 0;
        s.depth = s.reachable ? depths[i] : unreachable_depth;
        s.normalized_depth = max_depth > 0
            ? static_cast<double>(s.depth) / max_depth : 0.0;
        s.ancestor_count = ancestors[i];
        s.centrality = n > 1
            ? static_cast<double>(ancestors[i]) / static_cast<double>(n - 1) : 0.0;
        s.tcs = combine(s.normalized_depth, s.centrality);
    }
    return scores;
}

} // namespace hdfm
