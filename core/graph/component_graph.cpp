#include "graph/component_graph.hpp"
#include "common/integrity_error.hpp"

#include <stdexcept>

namespace hdfm {

ComponentGraph ComponentGraph::build(const std::vector<Component>& components,
                                     const std::vector<DependencyEdge>& edges) {
    ComponentGraph graph;
    for (const Component& c : components) {
        graph.addComponent(c);
    }
    for (const DependencyEdge& e : edges) {
        graph.addEdge(e.parent, e.child);
    }
    return graph;
}

// ─── Component operations ──────────────────────────────────────

ComponentGraph::Index ComponentGraph::addComponent(const Component& component) {
    if (index_.count(component.id)) {
        throw IntegrityError(component.id, "inventory",
                             "Duplicate component id: '" + component.id + "'");
    }
    Index idx = components_.size();
    components_.push_back(component);
    index_.emplace(component.id, idx);
    outgoing_.emplace_back();
    incoming_.emplace_back();
    return idx;
}

std::optional<ComponentGraph::Index> ComponentGraph::indexOf(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

// ─── Edge operations ───────────────────────────────────────────

bool ComponentGraph::addEdge(const std::string& parent, const std::string& child) {
    const std::string ref = "edge:" + parent + "->" + child;
    auto p = indexOf(parent);
    if (!p) throw IntegrityError::missingComponent(parent, ref);
    auto c = indexOf(child);
    if (!c) throw IntegrityError::missingComponent(child, ref);
    if (*p == *c) {
        throw std::invalid_argument("Self-loop dependency on '" + parent + "'");
    }

    if (!edge_keys_.insert(edgeKey(*p, *c)).second) return false;
    outgoing_[*p].push_back(*c);
    incoming_[*c].push_back(*p);
    return true;
}

// ─── Adjacency queries ────────────────────────────────────────

std::vector<ComponentGraph::Index> ComponentGraph::sourceIndices() const {
    std::vector<Index> sources;
    for (Index i = 0; i < components_.size(); i++) {
        if (incoming_[i].empty()) sources.push_back(i);
    }
    return sources;
}

// ─── Iteration ─────────────────────────────────────────────────

void ComponentGraph::forEachComponent(
    const std::function<void(Index, const Component&)>& fn) const {
    for (Index i = 0; i < components_.size(); i++) {
        fn(i, components_[i]);
    }
}

void ComponentGraph::forEachEdge(const std::function<void(Index, Index)>& fn) const {
    for (Index p = 0; p < outgoing_.size(); p++) {
        for (Index c : outgoing_[p]) {
            fn(p, c);
        }
    }
}

} // namespace hdfm
