#pragma once

#include "graph/component.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace hdfm {

// ─── ComponentGraph ────────────────────────────────────────────
// Dependency graph of one inventory. Components live in an arena and
// are addressed by a stable index; edges are stored as index pairs in
// both directions. Cycles are allowed. The graph is built once per run
// and not mutated afterwards.

class ComponentGraph {
public:
    using Index = std::size_t;

    ComponentGraph() = default;

    /// Build a graph from flat lists. Throws IntegrityError on duplicate
    /// components or edges with unknown endpoints.
    static ComponentGraph build(const std::vector<Component>& components,
                                const std::vector<DependencyEdge>& edges);

    // ── Component operations ──
    Index addComponent(const Component& component);
    const Component& component(Index index) const { return components_.at(index); }
    std::optional<Index> indexOf(const std::string& id) const;
    bool contains(const std::string& id) const { return index_.count(id) > 0; }
    size_t componentCount() const { return components_.size(); }

    // ── Edge operations ──
    /// Returns false when the edge already exists (duplicates collapse).
    bool addEdge(const std::string& parent, const std::string& child);
    size_t edgeCount() const { return edge_keys_.size(); }

    // ── Adjacency queries ──
    const std::vector<Index>& children(Index index) const { return outgoing_.at(index); }
    const std::vector<Index>& parents(Index index) const { return incoming_.at(index); }

    /// Components with no incoming edge, in insertion order.
    std::vector<Index> sourceIndices() const;

    // ── Iteration ──
    void forEachComponent(const std::function<void(Index, const Component&)>& fn) const;
    void forEachEdge(const std::function<void(Index, Index)>& fn) const;

private:
    static uint64_t edgeKey(Index parent, Index child) {
        return (static_cast<uint64_t>(parent) << 32) | static_cast<uint64_t>(child);
    }

    std::vector<Component> components_;
    std::unordered_map<std::string, Index> index_;

    // Adjacency lists: index → neighbor indices in insertion order
    std::vector<std::vector<Index>> outgoing_;
    std::vector<std::vector<Index>> incoming_;
    std::unordered_set<uint64_t> edge_keys_;
};

} // namespace hdfm
