/**
 * @file test_graph_generator.cpp
 * @brief Unit tests for the synthetic topology generators.
 */

#include "builder/graph_generator.hpp"

#include <gtest/gtest.h>
#include <random>

using namespace taskgraph;

static const CostModel BASE_COST{.duration = 2.0, .cpu_units = 1.0, .memory_mb = 64.0};

// ─── Linear Chain ────────────────────────────

TEST(GraphGeneratorTest, LinearChainShape) {
    auto g = GraphGenerator::linear_chain(5, BASE_COST);
    EXPECT_EQ(g.node_count(), 5u);
    EXPECT_EQ(g.edge_count(), 4u);
    EXPECT_EQ(g.root_nodes(), (std::vector<TaskId>{"chain_0"}));
    EXPECT_EQ(g.leaf_nodes(), (std::vector<TaskId>{"chain_4"}));
    EXPECT_TRUE(g.validate().is_valid);
}

TEST(GraphGeneratorTest, LinearChainCriticalPath) {
    auto g = GraphGenerator::linear_chain(5, BASE_COST);
    auto path = g.calculate_critical_path();
    ASSERT_TRUE(path);
    EXPECT_EQ(path->nodes.size(), 5u);
    EXPECT_DOUBLE_EQ(path->total_duration, 10.0);
}

TEST(GraphGeneratorTest, EmptyChain) {
    auto g = GraphGenerator::linear_chain(0, BASE_COST);
    EXPECT_EQ(g.node_count(), 0u);
}

// ─── Fan-out / Fan-in ────────────────────────

TEST(GraphGeneratorTest, FanOutFanInShape) {
    auto g = GraphGenerator::fan_out_fan_in(4, BASE_COST);
    EXPECT_EQ(g.node_count(), 6u);
    EXPECT_EQ(g.edge_count(), 8u);
    EXPECT_EQ(g.successors("fan_src").size(), 4u);
    EXPECT_EQ(g.predecessors("fan_sink").size(), 4u);
    EXPECT_EQ(g.find_node("fan_sink")->node_type, "aggregation");

    auto levels = g.calculate_node_levels();
    ASSERT_TRUE(levels);
    EXPECT_EQ(levels->at("fan_branch_3"), 1);
    EXPECT_EQ(levels->at("fan_sink"), 2);
}

// ─── Diamond ─────────────────────────────────

TEST(GraphGeneratorTest, DiamondShape) {
    auto g = GraphGenerator::diamond(3, 2, BASE_COST);
    // Each level: hub + merge + width branches.
    EXPECT_EQ(g.node_count(), 3u * 4u);
    // Each level: 2 · width edges, plus one merge → hub link between levels.
    EXPECT_EQ(g.edge_count(), 3u * 4u + 2u);
    EXPECT_TRUE(g.has_edge("merge_0", "hub_1"));
    EXPECT_EQ(g.root_nodes(), (std::vector<TaskId>{"hub_0"}));
    EXPECT_EQ(g.leaf_nodes(), (std::vector<TaskId>{"merge_2"}));
    EXPECT_FALSE(g.has_cycle());
}

// ─── Random DAG ──────────────────────────────

TEST(GraphGeneratorTest, RandomDagIsAcyclic) {
    std::mt19937 rng(42);
    CostModel lo{.duration = 1.0};
    CostModel hi{.duration = 9.0};

    auto g = GraphGenerator::random_dag(40, 0.2, lo, hi, rng);
    EXPECT_EQ(g.node_count(), 40u);
    EXPECT_FALSE(g.has_cycle());
    EXPECT_TRUE(g.topological_sort());
    EXPECT_TRUE(g.validate().is_valid);

    for (const auto& [_, node] : g.nodes()) {
        EXPECT_GE(node.cost_model.duration, 1.0);
        EXPECT_LE(node.cost_model.duration, 9.0);
    }
}

TEST(GraphGeneratorTest, RandomDagEdgeExtremes) {
    std::mt19937 rng(1);
    auto none = GraphGenerator::random_dag(10, 0.0, BASE_COST, BASE_COST, rng);
    EXPECT_EQ(none.edge_count(), 0u);

    auto full = GraphGenerator::random_dag(10, 1.0, BASE_COST, BASE_COST, rng);
    EXPECT_EQ(full.edge_count(), 45u);
}

TEST(GraphGeneratorTest, RandomDagIsReproducible) {
    std::mt19937 a(7);
    std::mt19937 b(7);
    auto g1 = GraphGenerator::random_dag(25, 0.3, BASE_COST, BASE_COST, a);
    auto g2 = GraphGenerator::random_dag(25, 0.3, BASE_COST, BASE_COST, b);
    EXPECT_EQ(g1.edges(), g2.edges());
}
