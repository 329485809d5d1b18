#pragma once

#include "signals/threat_signal.hpp"

#include <chrono>
#include <map>
#include <string>
#include <unordered_set>

namespace hdfm {

// ─── Threat Feed ──────────────────────────────────────────────
// Source of exploit probability and exploited-in-the-wild data, keyed by
// advisory id. Network clients live outside this library; they implement
// this interface, honor the timeout they are given, and throw on failure.

class ThreatFeed {
public:
    virtual ~ThreatFeed() = default;

    /// Signal for one advisory. Must be safe to call from several threads.
    virtual ThreatSignal lookup(const std::string& advisory_id,
                                std::chrono::milliseconds timeout) const = 0;

    /// Human-readable name of this feed.
    virtual std::string name() const = 0;
};

// ─── Static Threat Feed ───────────────────────────────────────
// In-memory probability table plus a synced exploited-advisory catalog.
// Read-only after construction, so concurrent lookups are safe.

class StaticThreatFeed : public ThreatFeed {
public:
    StaticThreatFeed() = default;
    StaticThreatFeed(std::map<std::string, double> probabilities,
                     std::unordered_set<std::string> exploited)
        : probabilities_(std::move(probabilities)), exploited_(std::move(exploited)) {}

    void setProbability(const std::string& advisory_id, double probability) {
        probabilities_[advisory_id] = probability;
    }
    void markExploited(const std::string& advisory_id) { exploited_.insert(advisory_id); }

    ThreatSignal lookup(const std::string& advisory_id,
                        std::chrono::milliseconds timeout) const override;
    std::string name() const override { return "static"; }

    size_t probabilityCount() const { return probabilities_.size(); }
    size_t exploitedCount() const { return exploited_.size(); }

private:
    std::map<std::string, double> probabilities_;
    std::unordered_set<std::string> exploited_;
};

} // namespace hdfm
