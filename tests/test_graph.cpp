#include <gtest/gtest.h>
#include "graph/component_graph.hpp"
#include "common/integrity_error.hpp"

#include <stdexcept>

using namespace hdfm;

namespace {

std::vector<Component> makeComponents(std::initializer_list<const char*> ids) {
    std::vector<Component> out;
    for (const char* id : ids) out.emplace_back(id);
    return out;
}

} // namespace

// ─── Component operations ─────────────────────────────────────

TEST(GraphTest, AddAndLookupComponent) {
    ComponentGraph g;
    auto idx = g.addComponent(Component("pkg:npm/lodash@4.17.21", "lodash", "4.17.21", "npm"));
    ASSERT_EQ(g.componentCount(), 1);
    ASSERT_TRUE(g.indexOf("pkg:npm/lodash@4.17.21").has_value());
    EXPECT_EQ(*g.indexOf("pkg:npm/lodash@4.17.21"), idx);
    EXPECT_EQ(g.component(idx).name, "lodash");
    EXPECT_EQ(g.component(idx).ecosystem, "npm");
    EXPECT_FALSE(g.indexOf("pkg:npm/missing@1.0.0").has_value());
}

TEST(GraphTest, DuplicateComponentIsIntegrityError) {
    ComponentGraph g;
    g.addComponent(Component("a"));
    EXPECT_THROW(g.addComponent(Component("a")), IntegrityError);
}

// ─── Edge operations ──────────────────────────────────────────

TEST(GraphTest, DuplicateEdgesCollapse) {
    ComponentGraph g = ComponentGraph::build(makeComponents({"a", "b"}),
                                             {{"a", "b"}, {"a", "b"}});
    EXPECT_EQ(g.edgeCount(), 1);
    EXPECT_FALSE(g.addEdge("a", "b"));
    EXPECT_EQ(g.children(*g.indexOf("a")).size(), 1);
    EXPECT_EQ(g.parents(*g.indexOf("b")).size(), 1);
}

TEST(GraphTest, SelfLoopRejected) {
    ComponentGraph g = ComponentGraph::build(makeComponents({"a"}), {});
    EXPECT_THROW(g.addEdge("a", "a"), std::invalid_argument);
    EXPECT_EQ(g.edgeCount(), 0);
}

TEST(GraphTest, UnknownEdgeEndpointReportsComponent) {
    try {
        ComponentGraph::build(makeComponents({"a"}), {{"a", "ghost"}});
        FAIL() << "expected IntegrityError";
    } catch (const IntegrityError& e) {
        EXPECT_EQ(e.componentId(), "ghost");
        EXPECT_EQ(e.referencedBy(), "edge:a->ghost");
    }
}

// ─── Adjacency queries ────────────────────────────────────────

TEST(GraphTest, AdjacencyQueries) {
    ComponentGraph g = ComponentGraph::build(makeComponents({"app", "web", "db", "util"}),
                                             {{"app", "web"}, {"app", "db"},
                                              {"web", "util"}, {"db", "util"}});
    auto app = *g.indexOf("app");
    auto util = *g.indexOf("util");
    EXPECT_EQ(g.children(app).size(), 2);
    EXPECT_EQ(g.parents(util).size(), 2);
    EXPECT_TRUE(g.parents(app).empty());
    EXPECT_TRUE(g.children(util).empty());
}

TEST(GraphTest, SourceIndicesIgnoreCycles) {
    // x → y → z → y: only x has no parent
    ComponentGraph g = ComponentGraph::build(makeComponents({"x", "y", "z", "lone"}),
                                             {{"x", "y"}, {"y", "z"}, {"z", "y"}});
    auto sources = g.sourceIndices();
    ASSERT_EQ(sources.size(), 2);
    EXPECT_EQ(g.component(sources[0]).id, "x");
    EXPECT_EQ(g.component(sources[1]).id, "lone");
}

TEST(GraphTest, ForEachEdgeVisitsEveryEdge) {
    ComponentGraph g = ComponentGraph::build(makeComponents({"a", "b", "c"}),
                                             {{"a", "b"}, {"b", "c"}, {"c", "a"}});
    int count = 0;
    g.forEachEdge([&](ComponentGraph::Index p, ComponentGraph::Index c) {
        EXPECT_NE(p, c);
        count++;
    });
    EXPECT_EQ(count, 3);

    std::vector<std::string> ids;
    g.forEachComponent([&](ComponentGraph::Index, const Component& c) { ids.push_back(c.id); });
    EXPECT_EQ(ids, (std::vector<std::string>{"a", "b", "c"}));
}
