#include "engine/analysis_engine.hpp"
#include "common/integrity_error.hpp"
#include "graph/component_graph.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <unordered_set>

namespace hdfm {

AnalysisEngine::AnalysisEngine(EngineConfig config)
    : config_(config) {
    config_.validate();
}

std::vector<Vulnerability> AnalysisEngine::consolidate(
    const ComponentGraph& graph, const std::vector<Vulnerability>& vulnerabilities) {

    std::map<std::string, Vulnerability> merged;
    for (Vulnerability v : vulnerabilities) {
        v.severity = FusionEngine::sanitizeSeverity(v.severity);
        if (v.component_ids.empty()) {
            throw IntegrityError("", v.id,
                                 "Vulnerability '" + v.id + "' references no component");
        }
        for (const auto& cid : v.component_ids) {
            if (!graph.contains(cid)) throw IntegrityError::missingComponent(cid, v.id);
        }

        auto it = merged.find(v.id);
        if (it == merged.end()) {
            std::string id = v.id;
            merged.emplace(std::move(id), std::move(v));
            continue;
        }
        Vulnerability& m = it->second;
        m.component_ids.insert(m.component_ids.end(),
                               v.component_ids.begin(), v.component_ids.end());
        if (v.severity && (!m.severity || *v.severity > *m.severity)) {
            m.severity = v.severity;
        }
    }

    std::vector<Vulnerability> out;
    out.reserve(merged.size());
    for (auto& [id, v] : merged) {
        std::sort(v.component_ids.begin(), v.component_ids.end());
        v.component_ids.erase(std::unique(v.component_ids.begin(), v.component_ids.end()),
                              v.component_ids.end());
        out.push_back(std::move(v));
    }
    return out;
}

AnalysisResult AnalysisEngine::run(const Inventory& inventory) const {
    AnalysisResult result;

    ComponentGraph graph;
    std::vector<Vulnerability> vulns;
    try {
        graph = ComponentGraph::build(inventory.components, inventory.edges);
        vulns = consolidate(graph, inventory.vulnerabilities);
        result.topology = TopologyAnalyzer(config_.topology).analyze(graph, inventory.roots);
    } catch (const IntegrityError& e) {
        spdlog::error("analysis aborted: {}", e.what());
        throw;
    }

    // ── Threat signals ──
    NormalizedSignals normalized = SignalNormalizer().normalize(graph, vulns, inventory.signals);
    result.threats = normalized.components;
    Diagnostics& diag = result.diagnostics;
    diag.incomplete = std::move(normalized.incomplete);

    for (const Vulnerability& v : vulns) {
        if (v.severity) continue;
        for (const auto& cid : v.component_ids) {
            diag.incomplete.push_back({v.id, cid, MissingField::Severity, "no base severity"});
        }
    }
    for (const FeedFailure& f : inventory.feed_failures) {
        diag.incomplete.push_back({f.advisory_id, "", MissingField::FeedFailure, f.reason});
    }

    // ── Summary basics ──
    AnalysisSummary& summary = result.summary;
    summary.total_components = graph.componentCount();
    summary.total_vulnerabilities = vulns.size();
    for (const auto& t : result.topology) {
        if (t.reachable) summary.max_depth = std::max(summary.max_depth, t.depth);
        if (t.tcs > config_.topology.hub_threshold) summary.hub_components++;
    }

    if (vulns.empty()) {
        diag.notice(DegenerateInput::NoVulnerabilities);
        spdlog::info("analysis: {} components, no vulnerabilities, nothing to rank",
                     summary.total_components);
        return result;
    }
    if (graph.componentCount() == 1) diag.notice(DegenerateInput::SingleComponent);

    // ── Entropy weighting ──
    FusionEngine fusion(config_.fusion);
    const size_t n = graph.componentCount();

    SignalVectors vectors;
    vectors.topology.resize(n);
    vectors.exploit_probability.resize(n);
    vectors.exploited.resize(n);
    vectors.severity.assign(n, 0.0);
    for (size_t i = 0; i < n; i++) {
        vectors.topology[i] = result.topology[i].tcs;
        vectors.exploit_probability[i] = result.threats[i].exploit_probability;
        vectors.exploited[i] = result.threats[i].exploited;
    }
    for (const Vulnerability& v : vulns) {
        double sev = fusion.normalizeSeverity(v.severity);
        for (const auto& cid : v.component_ids) {
            auto idx = *graph.indexOf(cid);
            vectors.severity[idx] = std::max(vectors.severity[idx], sev);
        }
    }

    EntropyReport entropy = EntropyWeighting(config_.entropy).compute(vectors);
    if (entropy.weights.equal_fallback && n > 1) diag.notice(DegenerateInput::ConstantSignals);
    result.weights = entropy.weights;
    result.entropy = entropy;

    // ── Fusion ──
    std::vector<FusionInput> inputs;
    for (const Vulnerability& v : vulns) {
        ThreatSignal signal = SignalNormalizer::lookup(inventory.signals, v.id);
        for (const auto& cid : v.component_ids) {
            FusionInput in;
            in.component_id = cid;
            in.vulnerability_id = v.id;
            in.topology = vectors.topology[*graph.indexOf(cid)];
            in.exploit_probability = signal.exploit_probability.value_or(0.0);
            in.exploited = signal.exploited;
            in.raw_severity = v.severity;
            inputs.push_back(std::move(in));
        }
    }

    result.ranking = fusion.rank(inputs, entropy.weights);
    result.thresholds = PriorityClassifier(config_.tiers).assign(result.ranking);

    summary.scored_pairs = result.ranking.size();
    summary.critical_findings = static_cast<size_t>(std::count_if(
        result.ranking.begin(), result.ranking.end(),
        [](const ScoreRecord& r) { return r.priority == Priority::Critical; }));

    if (!diag.incomplete.empty()) {
        spdlog::warn("analysis: {} incomplete signal entries across {} advisories",
                     diag.incomplete.size(), diag.incompleteAdvisories().size());
    }
    spdlog::info("analysis: {} components, {} advisories, {} ranked, {} critical",
                 summary.total_components, summary.total_vulnerabilities,
                 summary.scored_pairs, summary.critical_findings);
    return result;
}

std::vector<ScoreRecord> topFindingPerComponent(const std::vector<ScoreRecord>& ranking) {
    std::vector<ScoreRecord> top;
    std::unordered_set<std::string> seen;
    for (const auto& r : ranking) {
        if (seen.insert(r.component_id).second) top.push_back(r);
    }
    return top;
}

} // namespace hdfm
