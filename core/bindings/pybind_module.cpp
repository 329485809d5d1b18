// PyBind11 bindings for the HDFM scoring core.
// Exposes the inventory model, scoring configuration and AnalysisEngine to
// the Python orchestration layer.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DHDFM_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>

#include "common/diagnostics.hpp"
#include "common/integrity_error.hpp"
#include "engine/analysis_engine.hpp"
#include "signals/signal_collector.hpp"
#include "signals/threat_feed.hpp"

namespace py = pybind11;

PYBIND11_MODULE(hdfm_bindings, m) {
    m.doc() = "HDFM vulnerability prioritization core";

    py::register_exception<hdfm::IntegrityError>(m, "IntegrityError", PyExc_ValueError);

    // ── Inventory model ──
    py::class_<hdfm::Component>(m, "Component")
        .def(py::init<>())
        .def(py::init<std::string, std::string, std::string, std::string>(),
             py::arg("id"), py::arg("name") = "", py::arg("version") = "",
             py::arg("ecosystem") = "")
        .def_readwrite("id", &hdfm::Component::id)
        .def_readwrite("name", &hdfm::Component::name)
        .def_readwrite("version", &hdfm::Component::version)
        .def_readwrite("ecosystem", &hdfm::Component::ecosystem);

    py::class_<hdfm::DependencyEdge>(m, "DependencyEdge")
        .def(py::init<>())
        .def(py::init<std::string, std::string>(), py::arg("parent"), py::arg("child"))
        .def_readwrite("parent", &hdfm::DependencyEdge::parent)
        .def_readwrite("child", &hdfm::DependencyEdge::child);

    py::class_<hdfm::Vulnerability>(m, "Vulnerability")
        .def(py::init<>())
        .def(py::init<std::string, std::optional<double>, std::vector<std::string>>(),
             py::arg("id"), py::arg("severity"), py::arg("component_ids"))
        .def_readwrite("id", &hdfm::Vulnerability::id)
        .def_readwrite("severity", &hdfm::Vulnerability::severity)
        .def_readwrite("component_ids", &hdfm::Vulnerability::component_ids);

    py::class_<hdfm::ThreatSignal>(m, "ThreatSignal")
        .def(py::init<>())
        .def(py::init<std::optional<double>, bool>(),
             py::arg("exploit_probability"), py::arg("exploited") = false)
        .def_readwrite("exploit_probability", &hdfm::ThreatSignal::exploit_probability)
        .def_readwrite("exploited", &hdfm::ThreatSignal::exploited);

    py::class_<hdfm::FeedFailure>(m, "FeedFailure")
        .def(py::init<>())
        .def_readwrite("advisory_id", &hdfm::FeedFailure::advisory_id)
        .def_readwrite("reason", &hdfm::FeedFailure::reason);

    py::class_<hdfm::Inventory>(m, "Inventory")
        .def(py::init<>())
        .def_readwrite("components", &hdfm::Inventory::components)
        .def_readwrite("edges", &hdfm::Inventory::edges)
        .def_readwrite("roots", &hdfm::Inventory::roots)
        .def_readwrite("vulnerabilities", &hdfm::Inventory::vulnerabilities)
        .def_readwrite("signals", &hdfm::Inventory::signals)
        .def_readwrite("feed_failures", &hdfm::Inventory::feed_failures);

    // ── Configuration ──
    py::class_<hdfm::TopologyConfig>(m, "TopologyConfig")
        .def(py::init<>())
        .def_readwrite("depth_weight", &hdfm::TopologyConfig::depth_weight)
        .def_readwrite("centrality_weight", &hdfm::TopologyConfig::centrality_weight)
        .def_readwrite("hub_threshold", &hdfm::TopologyConfig::hub_threshold);

    py::class_<hdfm::EntropyConfig>(m, "EntropyConfig")
        .def(py::init<>())
        .def_readwrite("bins", &hdfm::EntropyConfig::bins);

    py::class_<hdfm::FusionConfig>(m, "FusionConfig")
        .def(py::init<>())
        .def_readwrite("severity_scale", &hdfm::FusionConfig::severity_scale)
        .def_readwrite("exploited_overrides_composite",
                       &hdfm::FusionConfig::exploited_overrides_composite);

    py::class_<hdfm::TierConfig>(m, "TierConfig")
        .def(py::init<>())
        .def_readwrite("critical_percentile", &hdfm::TierConfig::critical_percentile)
        .def_readwrite("high_percentile", &hdfm::TierConfig::high_percentile)
        .def_readwrite("critical_floor", &hdfm::TierConfig::critical_floor)
        .def_readwrite("high_floor", &hdfm::TierConfig::high_floor);

    py::class_<hdfm::EngineConfig>(m, "EngineConfig")
        .def(py::init<>())
        .def_readwrite("topology", &hdfm::EngineConfig::topology)
        .def_readwrite("entropy", &hdfm::EngineConfig::entropy)
        .def_readwrite("fusion", &hdfm::EngineConfig::fusion)
        .def_readwrite("tiers", &hdfm::EngineConfig::tiers)
        .def("validate", &hdfm::EngineConfig::validate);

    py::class_<hdfm::CollectorConfig>(m, "CollectorConfig")
        .def(py::init<>())
        .def_readwrite("max_in_flight", &hdfm::CollectorConfig::max_in_flight)
        .def_readwrite("per_item_timeout", &hdfm::CollectorConfig::per_item_timeout);

    // ── Results ──
    py::enum_<hdfm::Priority>(m, "Priority")
        .value("LOW", hdfm::Priority::Low)
        .value("MEDIUM", hdfm::Priority::Medium)
        .value("HIGH", hdfm::Priority::High)
        .value("CRITICAL", hdfm::Priority::Critical);

    py::enum_<hdfm::MissingField>(m, "MissingField")
        .value("EXPLOIT_PROBABILITY", hdfm::MissingField::ExploitProbability)
        .value("SEVERITY", hdfm::MissingField::Severity)
        .value("FEED_FAILURE", hdfm::MissingField::FeedFailure);

    py::enum_<hdfm::DegenerateInput>(m, "DegenerateInput")
        .value("NO_VULNERABILITIES", hdfm::DegenerateInput::NoVulnerabilities)
        .value("SINGLE_COMPONENT", hdfm::DegenerateInput::SingleComponent)
        .value("CONSTANT_SIGNALS", hdfm::DegenerateInput::ConstantSignals);

    py::class_<hdfm::ScoreRecord>(m, "ScoreRecord")
        .def(py::init<>())
        .def_readonly("component_id", &hdfm::ScoreRecord::component_id)
        .def_readonly("vulnerability_id", &hdfm::ScoreRecord::vulnerability_id)
        .def_readonly("composite", &hdfm::ScoreRecord::composite)
        .def_readonly("rank", &hdfm::ScoreRecord::rank)
        .def_readonly("priority", &hdfm::ScoreRecord::priority)
        .def_readonly("topology", &hdfm::ScoreRecord::topology)
        .def_readonly("exploit_probability", &hdfm::ScoreRecord::exploit_probability)
        .def_readonly("exploited", &hdfm::ScoreRecord::exploited)
        .def_readonly("raw_severity", &hdfm::ScoreRecord::raw_severity)
        .def_readonly("normalized_severity", &hdfm::ScoreRecord::normalized_severity);

    py::class_<hdfm::WeightSet>(m, "WeightSet")
        .def(py::init<>())
        .def_readonly("topology", &hdfm::WeightSet::topology)
        .def_readonly("exploit_probability", &hdfm::WeightSet::exploit_probability)
        .def_readonly("exploited_flag", &hdfm::WeightSet::exploited_flag)
        .def_readonly("severity", &hdfm::WeightSet::severity)
        .def_readonly("equal_fallback", &hdfm::WeightSet::equal_fallback)
        .def("sum", &hdfm::WeightSet::sum);

    py::class_<hdfm::EntropyReport>(m, "EntropyReport")
        .def_readonly("entropy", &hdfm::EntropyReport::entropy)
        .def_readonly("normalized_entropy", &hdfm::EntropyReport::normalized_entropy)
        .def_readonly("weights", &hdfm::EntropyReport::weights);

    py::class_<hdfm::TopologyScore>(m, "TopologyScore")
        .def_readonly("component_id", &hdfm::TopologyScore::component_id)
        .def_readonly("depth", &hdfm::TopologyScore::depth)
        .def_readonly("reachable", &hdfm::TopologyScore::reachable)
        .def_readonly("ancestor_count", &hdfm::TopologyScore::ancestor_count)
        .def_readonly("normalized_depth", &hdfm::TopologyScore::normalized_depth)
        .def_readonly("centrality", &hdfm::TopologyScore::centrality)
        .def_readonly("tcs", &hdfm::TopologyScore::tcs);

    py::class_<hdfm::ComponentThreat>(m, "ComponentThreat")
        .def_readonly("component_id", &hdfm::ComponentThreat::component_id)
        .def_readonly("exploit_probability", &hdfm::ComponentThreat::exploit_probability)
        .def_readonly("exploited", &hdfm::ComponentThreat::exploited)
        .def_readonly("data_incomplete", &hdfm::ComponentThreat::data_incomplete)
        .def_readonly("vulnerability_count", &hdfm::ComponentThreat::vulnerability_count);

    py::class_<hdfm::IncompleteSignal>(m, "IncompleteSignal")
        .def_readonly("advisory_id", &hdfm::IncompleteSignal::advisory_id)
        .def_readonly("component_id", &hdfm::IncompleteSignal::component_id)
        .def_readonly("field", &hdfm::IncompleteSignal::field)
        .def_readonly("detail", &hdfm::IncompleteSignal::detail);

    py::class_<hdfm::Diagnostics>(m, "Diagnostics")
        .def_readonly("incomplete", &hdfm::Diagnostics::incomplete)
        .def_readonly("notices", &hdfm::Diagnostics::notices)
        .def("has", &hdfm::Diagnostics::has)
        .def("incomplete_advisories", &hdfm::Diagnostics::incompleteAdvisories);

    py::class_<hdfm::TierThresholds>(m, "TierThresholds")
        .def_readonly("critical", &hdfm::TierThresholds::critical)
        .def_readonly("high", &hdfm::TierThresholds::high);

    py::class_<hdfm::AnalysisSummary>(m, "AnalysisSummary")
        .def_readonly("total_components", &hdfm::AnalysisSummary::total_components)
        .def_readonly("total_vulnerabilities", &hdfm::AnalysisSummary::total_vulnerabilities)
        .def_readonly("scored_pairs", &hdfm::AnalysisSummary::scored_pairs)
        .def_readonly("critical_findings", &hdfm::AnalysisSummary::critical_findings)
        .def_readonly("hub_components", &hdfm::AnalysisSummary::hub_components)
        .def_readonly("max_depth", &hdfm::AnalysisSummary::max_depth);

    py::class_<hdfm::AnalysisResult>(m, "AnalysisResult")
        .def_readonly("ranking", &hdfm::AnalysisResult::ranking)
        .def_readonly("weights", &hdfm::AnalysisResult::weights)
        .def_readonly("entropy", &hdfm::AnalysisResult::entropy)
        .def_readonly("topology", &hdfm::AnalysisResult::topology)
        .def_readonly("threats", &hdfm::AnalysisResult::threats)
        .def_readonly("thresholds", &hdfm::AnalysisResult::thresholds)
        .def_readonly("summary", &hdfm::AnalysisResult::summary)
        .def_readonly("diagnostics", &hdfm::AnalysisResult::diagnostics);

    // ── Engine ──
    py::class_<hdfm::AnalysisEngine>(m, "AnalysisEngine")
        .def(py::init<hdfm::EngineConfig>(), py::arg("config") = hdfm::EngineConfig{})
        .def("run", &hdfm::AnalysisEngine::run, py::arg("inventory"),
             py::call_guard<py::gil_scoped_release>());

    // ── Feeds ──
    py::class_<hdfm::StaticThreatFeed>(m, "StaticThreatFeed")
        .def(py::init<>())
        .def("set_probability", &hdfm::StaticThreatFeed::setProbability)
        .def("mark_exploited", &hdfm::StaticThreatFeed::markExploited);

    py::class_<hdfm::CollectionReport>(m, "CollectionReport")
        .def_readonly("signals", &hdfm::CollectionReport::signals)
        .def_readonly("failures", &hdfm::CollectionReport::failures)
        .def_readonly("elapsed_seconds", &hdfm::CollectionReport::elapsed_seconds);

    m.def("collect_signals", [](const hdfm::StaticThreatFeed& feed,
                                const std::vector<std::string>& advisory_ids,
                                const hdfm::CollectorConfig& config) {
        return hdfm::SignalCollector(config).collect(feed, advisory_ids);
    }, py::arg("feed"), py::arg("advisory_ids"),
       py::arg("config") = hdfm::CollectorConfig{});

    m.def("top_finding_per_component", &hdfm::topFindingPerComponent);
}
