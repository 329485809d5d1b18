#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hdfm {

/// A known vulnerability and the components it affects.
struct Vulnerability {
    std::string id;                        // advisory id
    std::optional<double> severity;        // base severity, absent if unscored
    std::vector<std::string> component_ids;

    Vulnerability() = default;
    Vulnerability(std::string id, std::optional<double> severity,
                  std::vector<std::string> component_ids)
        : id(std::move(id)), severity(severity),
          component_ids(std::move(component_ids)) {}
};

/// Threat-feed data for one advisory. An absent probability means the
/// feed had no record; it is never an implicit zero.
struct ThreatSignal {
    std::optional<double> exploit_probability;
    bool exploited = false;   // listed as exploited in the wild

    ThreatSignal() = default;
    ThreatSignal(std::optional<double> probability, bool exploited)
        : exploit_probability(probability), exploited(exploited) {}
};

/// Signals keyed by advisory id. Ordered for deterministic iteration.
using ThreatSignalMap = std::map<std::string, ThreatSignal>;

} // namespace hdfm
