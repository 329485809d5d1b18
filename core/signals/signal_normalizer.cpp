#include "signals/signal_normalizer.hpp"
#include "common/integrity_error.hpp"

#include <algorithm>
#include <cmath>

namespace hdfm {

std::optional<double> SignalNormalizer::sanitize(const std::optional<double>& probability) {
    if (!probability || std::isnan(*probability)) return std::nullopt;
    return std::clamp(*probability, 0.0, 1.0);
}

ThreatSignal SignalNormalizer::lookup(const ThreatSignalMap& signals,
                                      const std::string& advisory_id) {
    auto it = signals.find(advisory_id);
    if (it == signals.end()) return ThreatSignal{};
    return ThreatSignal(sanitize(it->second.exploit_probability), it->second.exploited);
}

NormalizedSignals SignalNormalizer::normalize(
    const ComponentGraph& graph,
    const std::vector<Vulnerability>& vulnerabilities,
    const ThreatSignalMap& signals) const {

    NormalizedSignals out;
    out.components.resize(graph.componentCount());
    graph.forEachComponent([&](ComponentGraph::Index i, const Component& c) {
        out.components[i].component_id = c.id;
    });

    for (const Vulnerability& v : vulnerabilities) {
        ThreatSignal signal = lookup(signals, v.id);

        for (const std::string& cid : v.component_ids) {
            auto idx = graph.indexOf(cid);
            if (!idx) throw IntegrityError::missingComponent(cid, v.id);

            ComponentThreat& agg = out.components[*idx];
            agg.vulnerability_count++;
            agg.exploited = agg.exploited || signal.exploited;

            if (signal.exploit_probability) {
                agg.exploit_probability =
                    std::max(agg.exploit_probability, *signal.exploit_probability);
            } else {
                agg.data_incomplete = true;
                out.incomplete.push_back({v.id, cid, MissingField::ExploitProbability,
                                          "no exploit probability from feed"});
            }
        }
    }
    return out;
}

} // namespace hdfm
