#include <gtest/gtest.h>
#include "signals/signal_normalizer.hpp"
#include "signals/threat_feed.hpp"
#include "common/integrity_error.hpp"

#include <cmath>
#include <limits>

using namespace hdfm;

namespace {

ComponentGraph threeComponents() {
    return ComponentGraph::build({Component("a"), Component("b"), Component("c")},
                                 {{"a", "b"}, {"b", "c"}});
}

} // namespace

// ─── Aggregation ──────────────────────────────────────────────

TEST(SignalTest, MaxProbabilityAndExploitedOr) {
    auto g = threeComponents();
    std::vector<Vulnerability> vulns = {
        {"CVE-1", 5.0, {"b"}},
        {"CVE-2", 7.0, {"b"}},
        {"CVE-3", 9.0, {"b"}},
    };
    ThreatSignalMap signals = {
        {"CVE-1", {0.30, false}},
        {"CVE-2", {0.75, false}},
        {"CVE-3", {0.10, true}},
    };

    auto out = SignalNormalizer().normalize(g, vulns, signals);
    const ComponentThreat& b = out.components[1];
    EXPECT_EQ(b.component_id, "b");
    EXPECT_DOUBLE_EQ(b.exploit_probability, 0.75);
    EXPECT_TRUE(b.exploited);
    EXPECT_EQ(b.vulnerability_count, 3);
    EXPECT_FALSE(b.data_incomplete);
    EXPECT_TRUE(out.incomplete.empty());

    EXPECT_DOUBLE_EQ(out.components[0].exploit_probability, 0.0);
    EXPECT_FALSE(out.components[0].exploited);
    EXPECT_EQ(out.components[0].vulnerability_count, 0);
}

TEST(SignalTest, SharedAdvisoryAppliesToEveryComponent) {
    auto g = threeComponents();
    std::vector<Vulnerability> vulns = {{"CVE-9", 8.0, {"a", "c"}}};
    ThreatSignalMap signals = {{"CVE-9", {0.6, true}}};

    auto out = SignalNormalizer().normalize(g, vulns, signals);
    EXPECT_DOUBLE_EQ(out.components[0].exploit_probability, 0.6);
    EXPECT_DOUBLE_EQ(out.components[2].exploit_probability, 0.6);
    EXPECT_TRUE(out.components[0].exploited);
    EXPECT_TRUE(out.components[2].exploited);
    EXPECT_FALSE(out.components[1].exploited);
}

// ─── Missing data ─────────────────────────────────────────────

TEST(SignalTest, MissingProbabilityIsZeroAndFlagged) {
    auto g = threeComponents();
    std::vector<Vulnerability> vulns = {
        {"CVE-known", 5.0, {"b"}},
        {"CVE-unknown", 5.0, {"b"}},
        {"CVE-nofeed", 5.0, {"c"}},
    };
    ThreatSignalMap signals = {
        {"CVE-known", {0.4, false}},
        {"CVE-unknown", {std::nullopt, true}},
    };

    auto out = SignalNormalizer().normalize(g, vulns, signals);
    EXPECT_DOUBLE_EQ(out.components[1].exploit_probability, 0.4);
    EXPECT_TRUE(out.components[1].exploited);
    EXPECT_TRUE(out.components[1].data_incomplete);

    EXPECT_DOUBLE_EQ(out.components[2].exploit_probability, 0.0);
    EXPECT_FALSE(out.components[2].exploited);
    EXPECT_TRUE(out.components[2].data_incomplete);

    ASSERT_EQ(out.incomplete.size(), 2);
    EXPECT_EQ(out.incomplete[0].advisory_id, "CVE-unknown");
    EXPECT_EQ(out.incomplete[0].component_id, "b");
    EXPECT_EQ(out.incomplete[0].field, MissingField::ExploitProbability);
    EXPECT_EQ(out.incomplete[1].advisory_id, "CVE-nofeed");
}

TEST(SignalTest, SanitizeClampsAndRejectsNaN) {
    EXPECT_FALSE(SignalNormalizer::sanitize(std::nullopt).has_value());
    EXPECT_FALSE(SignalNormalizer::sanitize(std::numeric_limits<double>::quiet_NaN()).has_value());
    EXPECT_DOUBLE_EQ(*SignalNormalizer::sanitize(1.7), 1.0);
    EXPECT_DOUBLE_EQ(*SignalNormalizer::sanitize(-0.2), 0.0);
    EXPECT_DOUBLE_EQ(*SignalNormalizer::sanitize(0.42), 0.42);
}

TEST(SignalTest, UnknownComponentIsIntegrityError) {
    auto g = threeComponents();
    std::vector<Vulnerability> vulns = {{"CVE-1", 5.0, {"ghost"}}};
    try {
        SignalNormalizer().normalize(g, vulns, {});
        FAIL() << "expected IntegrityError";
    } catch (const IntegrityError& e) {
        EXPECT_EQ(e.componentId(), "ghost");
        EXPECT_EQ(e.referencedBy(), "CVE-1");
    }
}

// ─── Static feed ──────────────────────────────────────────────

TEST(SignalTest, StaticFeedLookup) {
    StaticThreatFeed feed({{"CVE-1", 0.9}}, {"CVE-2"});
    feed.setProbability("CVE-3", 0.05);

    auto s1 = feed.lookup("CVE-1", std::chrono::milliseconds(100));
    ASSERT_TRUE(s1.exploit_probability.has_value());
    EXPECT_DOUBLE_EQ(*s1.exploit_probability, 0.9);
    EXPECT_FALSE(s1.exploited);

    auto s2 = feed.lookup("CVE-2", std::chrono::milliseconds(100));
    EXPECT_FALSE(s2.exploit_probability.has_value());
    EXPECT_TRUE(s2.exploited);

    auto none = feed.lookup("CVE-404", std::chrono::milliseconds(100));
    EXPECT_FALSE(none.exploit_probability.has_value());
    EXPECT_FALSE(none.exploited);

    EXPECT_EQ(feed.probabilityCount(), 2);
    EXPECT_EQ(feed.exploitedCount(), 1);
}
