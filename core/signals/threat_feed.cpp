#include "signals/threat_feed.hpp"

namespace hdfm {

ThreatSignal StaticThreatFeed::lookup(const std::string& advisory_id,
                                      std::chrono::milliseconds /*timeout*/) const {
    ThreatSignal signal;
    auto it = probabilities_.find(advisory_id);
    if (it != probabilities_.end()) signal.exploit_probability = it->second;
    signal.exploited = exploited_.count(advisory_id) > 0;
    return signal;
}

} // namespace hdfm
