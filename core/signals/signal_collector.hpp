#pragma once

#include "signals/threat_feed.hpp"
#include "signals/threat_signal.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace hdfm {

/// Collection limits for one batch of feed lookups.
struct CollectorConfig {
    int max_in_flight = 8;                                   // concurrent lookups
    std::chrono::milliseconds per_item_timeout{5000};

    void validate() const;
};

struct FeedFailure {
    std::string advisory_id;
    std::string reason;
};

struct CollectionReport {
    ThreatSignalMap signals;             // successful lookups only
    std::vector<FeedFailure> failures;   // sorted by advisory id
    double elapsed_seconds = 0.0;
};

// ─── Signal Collector ─────────────────────────────────────────
// Fans lookups out over a capped worker pool. A failed or slow item is
// reported and left absent; the batch always completes.
// The timeout is handed to the feed and checked once lookup() returns, so a
// feed that ignores it still holds up its worker until it answers.

class SignalCollector {
public:
    explicit SignalCollector(CollectorConfig config = {});

    CollectionReport collect(const ThreatFeed& feed,
                             const std::vector<std::string>& advisory_ids) const;

    const CollectorConfig& config() const { return config_; }

private:
    CollectorConfig config_;
};

} // namespace hdfm
