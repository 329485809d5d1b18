#pragma once

#include <string>

namespace hdfm {

/// A software component from the inventory.
/// Identity is the package URL, unique within one inventory.
struct Component {
    std::string id;         // package URL
    std::string name;
    std::string version;
    std::string ecosystem;

    Component() = default;
    Component(std::string id, std::string name = "", std::string version = "",
              std::string ecosystem = "")
        : id(std::move(id)), name(std::move(name)),
          version(std::move(version)), ecosystem(std::move(ecosystem)) {}
};

/// A directed dependency: parent depends on child.
struct DependencyEdge {
    std::string parent;
    std::string child;

    DependencyEdge() = default;
    DependencyEdge(std::string parent, std::string child)
        : parent(std::move(parent)), child(std::move(child)) {}
};

} // namespace hdfm
