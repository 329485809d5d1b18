#pragma once

#include <stdexcept>
#include <string>

namespace hdfm {

/// Raised when an edge, root or vulnerability references a component that
/// is not part of the inventory. Aborts the whole run.
class IntegrityError : public std::runtime_error {
public:
    IntegrityError(std::string component_id, std::string referenced_by,
                   const std::string& message)
        : std::runtime_error(message),
          component_id_(std::move(component_id)),
          referenced_by_(std::move(referenced_by)) {}

    const std::string& componentId() const { return component_id_; }
    const std::string& referencedBy() const { return referenced_by_; }

    static IntegrityError missingComponent(const std::string& component_id,
                                           const std::string& referenced_by) {
        return IntegrityError(component_id, referenced_by,
                              "Component not found: '" + component_id +
                              "' (referenced by " + referenced_by + ")");
    }

private:
    std::string component_id_;
    std::string referenced_by_;
};

} // namespace hdfm
