#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace hdfm {

enum class Priority { Low, Medium, High, Critical };

inline const char* priorityName(Priority p) {
    switch (p) {
        case Priority::Critical: return "CRITICAL";
        case Priority::High:     return "HIGH";
        case Priority::Medium:   return "MEDIUM";
        case Priority::Low:      return "LOW";
    }
    return "LOW";
}

/// Signal values for one (component, vulnerability) pair, before fusion.
struct FusionInput {
    std::string component_id;
    std::string vulnerability_id;
    double topology = 0.0;                 // component TCS
    double exploit_probability = 0.0;      // absent → 0
    bool exploited = false;
    std::optional<double> raw_severity;
};

/// Output of a run for one (component, vulnerability) pair.
struct ScoreRecord {
    std::string component_id;
    std::string vulnerability_id;
    double composite = 0.0;                // [0,1]
    size_t rank = 0;                       // 1-based
    Priority priority = Priority::Low;

    // Inputs kept for auditability
    double topology = 0.0;
    double exploit_probability = 0.0;
    bool exploited = false;
    std::optional<double> raw_severity;
    double normalized_severity = 0.0;
};

} // namespace hdfm
