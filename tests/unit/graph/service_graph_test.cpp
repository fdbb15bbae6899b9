/// @file service_graph_test.cpp
/// @brief Tests for the service call graph

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "graph/service_graph.h"

namespace skyrca::graph {
namespace {

using snapshot::CallEdge;
using snapshot::ServiceNode;

ServiceNode Node(const std::string& id, const std::string& name = "") {
    ServiceNode node;
    node.id = id;
    node.name = name.empty() ? id + "-svc" : name;
    return node;
}

std::vector<ServiceNode> Nodes(const std::vector<std::string>& ids) {
    std::vector<ServiceNode> nodes;
    for (const auto& id : ids) {
        nodes.push_back(Node(id));
    }
    return nodes;
}

class ServiceGraphTest : public ::testing::Test {
protected:
    void SetUp() override {
        // gateway -> orders -> payments -> db
        //         \-> users ---------------^
        graph_ = ServiceGraph::Build(
            Nodes({"gateway", "orders", "users", "payments", "db"}),
            {{"gateway", "orders"}, {"gateway", "users"}, {"orders", "payments"},
             {"payments", "db"}, {"users", "db"}});
    }

    ServiceGraph graph_;
};

TEST_F(ServiceGraphTest, Adjacency) {
    EXPECT_EQ(graph_.NodeCount(), 5u);
    EXPECT_EQ(graph_.EdgeCount(), 5u);

    EXPECT_EQ(graph_.Downstream("gateway"), (std::vector<std::string>{"orders", "users"}));
    EXPECT_EQ(graph_.Upstream("db"), (std::vector<std::string>{"payments", "users"}));
    EXPECT_EQ(graph_.FanIn("db"), 2u);
    EXPECT_EQ(graph_.FanOut("gateway"), 2u);
    EXPECT_EQ(graph_.FanIn("gateway"), 0u);
    EXPECT_TRUE(graph_.Upstream("missing").empty());
    EXPECT_EQ(graph_.FanOut("missing"), 0u);
}

TEST_F(ServiceGraphTest, ReachableUpstreamUsesShortestHops) {
    auto upstream = graph_.ReachableUpstream("db", 5);

    EXPECT_EQ(upstream.size(), 4u);
    EXPECT_EQ(upstream.at("payments"), 1u);
    EXPECT_EQ(upstream.at("users"), 1u);
    EXPECT_EQ(upstream.at("orders"), 2u);
    EXPECT_EQ(upstream.at("gateway"), 2u);
    EXPECT_EQ(upstream.count("db"), 0u);
}

TEST_F(ServiceGraphTest, ReachableRespectsDepth) {
    EXPECT_TRUE(graph_.ReachableDownstream("gateway", 0).empty());

    auto one_hop = graph_.ReachableDownstream("gateway", 1);
    EXPECT_EQ(one_hop.size(), 2u);
    EXPECT_EQ(one_hop.count("payments"), 0u);

    auto all = graph_.ReachableDownstream("gateway", 10);
    EXPECT_EQ(all.size(), 4u);
    EXPECT_EQ(all.at("db"), 2u);
    EXPECT_EQ(all.at("payments"), 2u);
}

TEST_F(ServiceGraphTest, ResolveIdByIdOrName) {
    EXPECT_EQ(graph_.ResolveId("orders"), "orders");
    EXPECT_EQ(graph_.ResolveId("orders-svc"), "orders");
    EXPECT_FALSE(graph_.ResolveId("unknown").has_value());

    const auto* node = graph_.FindNode("users");
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->name, "users-svc");
    EXPECT_EQ(graph_.FindNode("users-svc"), nullptr);
}

TEST(ServiceGraphCycleTest, TraversalTerminatesAtEveryDepth) {
    // a -> b -> c -> a, plus c -> d
    auto graph = ServiceGraph::Build(Nodes({"a", "b", "c", "d"}),
                                     {{"a", "b"}, {"b", "c"}, {"c", "a"}, {"c", "d"}});

    for (size_t depth = 0; depth <= 8; ++depth) {
        auto upstream = graph.ReachableUpstream("a", depth);
        auto downstream = graph.ReachableDownstream("a", depth);

        EXPECT_EQ(upstream.count("a"), 0u) << "depth " << depth;
        EXPECT_EQ(downstream.count("a"), 0u) << "depth " << depth;
        EXPECT_LE(upstream.size(), 2u) << "depth " << depth;
        EXPECT_LE(downstream.size(), 3u) << "depth " << depth;
        for (const auto& [id, hops] : upstream) {
            EXPECT_GE(hops, 1u);
            EXPECT_LE(hops, depth);
        }
    }

    auto upstream = graph.ReachableUpstream("a", 8);
    EXPECT_EQ(upstream.at("c"), 1u);
    EXPECT_EQ(upstream.at("b"), 2u);
}

TEST(ServiceGraphBuildTest, DropsBadInputWithWarnings) {
    std::vector<ServiceNode> nodes = {Node("a"), Node("b"), Node("a", "duplicate")};
    std::vector<CallEdge> edges = {
        {"a", "b"},
        {"a", "b"},        // duplicate edge merges
        {"b-svc", "a"},    // resolved by name
        {"a", "a"},        // self-call
        {"a", "ghost"},    // unknown target
    };

    auto graph = ServiceGraph::Build(nodes, edges);

    EXPECT_EQ(graph.NodeCount(), 2u);
    EXPECT_EQ(graph.EdgeCount(), 2u);
    EXPECT_EQ(graph.FindNode("a")->name, "a-svc");
    EXPECT_EQ(graph.Downstream("b"), (std::vector<std::string>{"a"}));
    EXPECT_EQ(graph.Warnings().size(), 3u);
}

TEST(ServiceGraphBuildTest, EmptyGraph) {
    ServiceGraph graph = ServiceGraph::FromTopology({});

    EXPECT_EQ(graph.NodeCount(), 0u);
    EXPECT_EQ(graph.Stats().edges, 0u);
    EXPECT_TRUE(graph.NodeIds().empty());
    EXPECT_TRUE(graph.ReachableUpstream("x", 5).empty());
}

}  // namespace
}  // namespace skyrca::graph
