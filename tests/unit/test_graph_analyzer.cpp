/**
 * @file test_graph_analyzer.cpp
 * @brief Unit tests for GraphAnalyzer scoring and structural analyses.
 */

#include "analysis/graph_analyzer.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <vector>

using namespace taskgraph;

namespace {

TaskNode make_node(const std::string& id, double duration = 1.0) {
    CostModel cost;
    cost.duration = duration;
    return TaskNode(id, "Task " + id, "generic", 5, cost);
}

void link(TaskGraph& g, const std::string& from, const std::string& to,
          EdgeType type = EdgeType::Dependency) {
    ASSERT_TRUE(g.add_edge(TaskEdge{.source_id = from, .target_id = to, .edge_type = type}));
}

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::vector<std::string>& lines) : lines_(lines) {}
    void write(std::string_view json_line) override { lines_.emplace_back(json_line); }
    void flush() override {}

private:
    std::vector<std::string>& lines_;
};

}  // namespace

class GraphAnalyzerTest : public ::testing::Test {
protected:
    /// A(5) → B(10) → C(3)
    void build_chain() {
        ASSERT_TRUE(graph.add_node(make_node("A", 5.0)));
        ASSERT_TRUE(graph.add_node(make_node("B", 10.0)));
        ASSERT_TRUE(graph.add_node(make_node("C", 3.0)));
        link(graph, "A", "B");
        link(graph, "B", "C");
    }

    /// R → A → B → L plus a weak back edge B ⇢ A.
    void build_weak_cycle() {
        for (const auto* id : {"R", "A", "B", "L"}) ASSERT_TRUE(graph.add_node(make_node(id)));
        link(graph, "R", "A");
        link(graph, "A", "B");
        link(graph, "B", "L");
        link(graph, "B", "A", EdgeType::Weak);
    }

    /// s1..s5 all feed X.
    void build_star() {
        ASSERT_TRUE(graph.add_node(make_node("X")));
        for (int i = 1; i <= 5; ++i) {
            auto id = "s" + std::to_string(i);
            ASSERT_TRUE(graph.add_node(make_node(id)));
            link(graph, id, "X");
        }
    }

    TaskGraph graph{"analysis"};
};

// ─── Cycles ──────────────────────────────────

TEST_F(GraphAnalyzerTest, AcyclicGraphHasNoCycles) {
    build_chain();
    GraphAnalyzer analyzer(graph);
    EXPECT_TRUE(analyzer.find_all_cycles().empty());
    EXPECT_TRUE(analyzer.find_cycle_nodes().empty());
}

TEST_F(GraphAnalyzerTest, WeakCycleIsReportedClosed) {
    build_weak_cycle();
    GraphAnalyzer analyzer(graph);

    const auto& cycles = analyzer.find_all_cycles();
    ASSERT_EQ(cycles.size(), 1u);
    EXPECT_EQ(cycles[0], (Cycle{"A", "B", "A"}));
    EXPECT_EQ(analyzer.find_cycle_nodes(), (std::set<TaskId>{"A", "B"}));
}

TEST_F(GraphAnalyzerTest, CycleCacheFollowsGraphVersion) {
    build_chain();
    GraphAnalyzer analyzer(graph);
    ASSERT_TRUE(analyzer.find_all_cycles().empty());

    ASSERT_TRUE(graph.add_edge(TaskEdge{.source_id = "C", .target_id = "A", .edge_type = EdgeType::Weak}));
    EXPECT_EQ(analyzer.find_all_cycles().size(), 1u);

    ASSERT_TRUE(graph.remove_edge("C", "A"));
    EXPECT_TRUE(analyzer.find_all_cycles().empty());
}

// ─── Bottlenecks ─────────────────────────────

TEST_F(GraphAnalyzerTest, StarConvergesIntoHub) {
    // Scenario 3
    build_star();
    GraphAnalyzer analyzer(graph);

    auto bottlenecks = analyzer.find_bottlenecks(3);
    ASSERT_EQ(bottlenecks.size(), 1u);
    EXPECT_EQ(bottlenecks[0].node_id, "X");
    EXPECT_EQ(bottlenecks[0].type, "convergence");
    EXPECT_EQ(bottlenecks[0].fan_in, 5u);
    EXPECT_EQ(bottlenecks[0].fan_out, 0u);
    EXPECT_EQ(bottlenecks[0].score, 5u);
}

TEST_F(GraphAnalyzerTest, FanOutIsDivergence) {
    ASSERT_TRUE(graph.add_node(make_node("hub")));
    for (int i = 0; i < 4; ++i) {
        auto id = "t" + std::to_string(i);
        ASSERT_TRUE(graph.add_node(make_node(id)));
        link(graph, "hub", id);
    }
    GraphAnalyzer analyzer(graph);

    auto bottlenecks = analyzer.find_bottlenecks();
    ASSERT_EQ(bottlenecks.size(), 1u);
    EXPECT_EQ(bottlenecks[0].type, "divergence");
    EXPECT_EQ(bottlenecks[0].fan_out, 4u);
}

TEST_F(GraphAnalyzerTest, BottlenecksSortedByScore) {
    build_star();
    ASSERT_TRUE(graph.add_node(make_node("Y")));
    for (int i = 1; i <= 3; ++i) link(graph, "s" + std::to_string(i), "Y");

    GraphAnalyzer analyzer(graph);
    auto bottlenecks = analyzer.find_bottlenecks(3);
    ASSERT_EQ(bottlenecks.size(), 2u);
    EXPECT_EQ(bottlenecks[0].node_id, "X");
    EXPECT_EQ(bottlenecks[1].node_id, "Y");
}

// ─── Criticality ─────────────────────────────

TEST_F(GraphAnalyzerTest, CriticalNodesFollowCriticalPath) {
    build_chain();
    GraphAnalyzer analyzer(graph);
    EXPECT_EQ(analyzer.find_critical_nodes(), (std::vector<TaskId>{"A", "B", "C"}));
}

TEST_F(GraphAnalyzerTest, CriticalNodesEmptyWhenUnordered) {
    build_weak_cycle();
    GraphAnalyzer analyzer(graph);
    EXPECT_TRUE(analyzer.find_critical_nodes().empty());
}

TEST_F(GraphAnalyzerTest, CriticalityBlendsPathFanOutAndCost) {
    build_chain();
    GraphAnalyzer analyzer(graph);
    auto crit = analyzer.calculate_node_criticality();

    ASSERT_EQ(crit.size(), 3u);
    // total_cost = duration · 0.01 here, so B (the most expensive) is 1.0.
    EXPECT_NEAR(crit.at("A"), 0.4 + 0.3 + 0.3 * 0.05 / 0.1, 1e-9);
    EXPECT_NEAR(crit.at("B"), 1.0, 1e-9);
    EXPECT_NEAR(crit.at("C"), 0.4 + 0.3 * 0.03 / 0.1, 1e-9);
    for (const auto& [_, score] : crit) {
        EXPECT_GE(score, 0.0);
        EXPECT_LE(score, 1.0);
    }
}

// ─── Influence ───────────────────────────────

TEST_F(GraphAnalyzerTest, InfluenceAccumulatesDownstream) {
    build_chain();
    GraphAnalyzer analyzer(graph);
    const auto& scores = analyzer.calculate_influence_scores();

    ASSERT_EQ(scores.size(), 3u);
    EXPECT_DOUBLE_EQ(scores.at("C"), 1.0);
    EXPECT_LT(scores.at("A"), scores.at("B"));
    EXPECT_LT(scores.at("B"), scores.at("C"));
    EXPECT_DOUBLE_EQ(graph.find_node("C")->influence_score, 1.0);

    auto top = analyzer.find_most_influential_nodes(1);
    ASSERT_EQ(top.size(), 1u);
    EXPECT_EQ(top[0].first, "C");
}

TEST_F(GraphAnalyzerTest, InfluenceOfIsolatedNodesIsUniform) {
    for (const auto* id : {"a", "b", "c"}) ASSERT_TRUE(graph.add_node(make_node(id)));
    GraphAnalyzer analyzer(graph);
    for (const auto& [_, score] : analyzer.calculate_influence_scores()) {
        EXPECT_DOUBLE_EQ(score, 1.0);
    }
}

TEST_F(GraphAnalyzerTest, InfluenceRecomputedAfterMutation) {
    build_chain();
    GraphAnalyzer analyzer(graph);
    ASSERT_EQ(analyzer.calculate_influence_scores().size(), 3u);

    ASSERT_TRUE(graph.add_node(make_node("D")));
    EXPECT_EQ(analyzer.calculate_influence_scores().size(), 4u);
}

// ─── Parallelization ─────────────────────────

TEST_F(GraphAnalyzerTest, ParallelStagesGroupRootsOfIndependentChains) {
    // Scenario 4
    for (const auto* id : {"a1", "a2", "a3", "b1", "b2", "b3"}) {
        ASSERT_TRUE(graph.add_node(make_node(id)));
    }
    link(graph, "a1", "a2");
    link(graph, "a2", "a3");
    link(graph, "b1", "b2");
    link(graph, "b2", "b3");

    GraphAnalyzer analyzer(graph);
    auto stages = analyzer.find_parallel_stages();
    ASSERT_EQ(stages.size(), 3u);
    EXPECT_EQ(stages.at(0), (std::vector<TaskId>{"a1", "b1"}));
    EXPECT_EQ(stages.at(2), (std::vector<TaskId>{"a3", "b3"}));

    EXPECT_NEAR(analyzer.calculate_parallelization_index(), 1.0 / 3.0, 1e-9);

    auto factors = analyzer.calculate_parallelization_factor();
    EXPECT_NEAR(factors.at("a2"), 1.0 / 6.0, 1e-9);
    EXPECT_NEAR(graph.find_node("b3")->parallelization_factor, 1.0 / 6.0, 1e-9);
}

TEST_F(GraphAnalyzerTest, IndependentNodesAreFullyParallel) {
    for (const auto* id : {"a", "b", "c", "d"}) ASSERT_TRUE(graph.add_node(make_node(id)));
    GraphAnalyzer analyzer(graph);
    EXPECT_DOUBLE_EQ(analyzer.calculate_parallelization_index(), 1.0);
}

TEST_F(GraphAnalyzerTest, ParallelizationIndexStaysInUnitRange) {
    build_star();
    link(graph, "s1", "s2");
    GraphAnalyzer analyzer(graph);
    double index = analyzer.calculate_parallelization_index();
    EXPECT_GT(index, 0.0);
    EXPECT_LE(index, 1.0);
}

TEST_F(GraphAnalyzerTest, UnorderedGraphHasNoStages) {
    build_weak_cycle();
    GraphAnalyzer analyzer(graph);
    EXPECT_TRUE(analyzer.find_parallel_stages().empty());
    EXPECT_DOUBLE_EQ(analyzer.calculate_parallelization_index(), 0.0);
}

// ─── Health ──────────────────────────────────

TEST_F(GraphAnalyzerTest, EmptyGraphIsHealthy) {
    // Scenario 5
    GraphAnalyzer analyzer(graph);
    EXPECT_DOUBLE_EQ(analyzer.calculate_parallelization_index(), 0.0);

    auto health = analyzer.calculate_graph_health();
    EXPECT_DOUBLE_EQ(health.score, 100.0);
    EXPECT_EQ(health.status, "healthy");
    EXPECT_TRUE(health.issues.empty());
}

TEST_F(GraphAnalyzerTest, SingleNodeIsHealthy) {
    ASSERT_TRUE(graph.add_node(make_node("only")));
    GraphAnalyzer analyzer(graph);
    auto health = analyzer.calculate_graph_health();
    EXPECT_DOUBLE_EQ(health.score, 100.0);
    EXPECT_EQ(health.isolated_count, 1u);
    EXPECT_TRUE(health.issues.empty());
}

TEST_F(GraphAnalyzerTest, IsolatedNodesPenalized) {
    for (const auto* id : {"a", "b", "c"}) ASSERT_TRUE(graph.add_node(make_node(id)));
    GraphAnalyzer analyzer(graph);
    auto health = analyzer.calculate_graph_health();
    EXPECT_DOUBLE_EQ(health.score, 85.0);
    EXPECT_EQ(health.status, "healthy");
    EXPECT_EQ(health.issues, (std::vector<std::string>{"Contains 3 isolated nodes"}));
}

TEST_F(GraphAnalyzerTest, BottleneckPenalizedAtHealthThreshold) {
    build_star();
    GraphAnalyzer analyzer(graph);
    auto health = analyzer.calculate_graph_health();
    EXPECT_DOUBLE_EQ(health.score, 90.0);
    EXPECT_EQ(health.bottleneck_count, 1u);
    EXPECT_EQ(health.issues, (std::vector<std::string>{"Contains 1 bottlenecks"}));
}

TEST_F(GraphAnalyzerTest, WeakCycleMakesGraphUnhealthy) {
    build_weak_cycle();
    GraphAnalyzer analyzer(graph);
    auto health = analyzer.calculate_graph_health();

    EXPECT_DOUBLE_EQ(health.score, 40.0);
    EXPECT_EQ(health.status, "unhealthy");
    EXPECT_EQ(health.cycle_count, 1u);
    EXPECT_EQ(health.issues, (std::vector<std::string>{
        "Contains 1 cycles", "Low parallelization potential"}));
}

TEST_F(GraphAnalyzerTest, AddingCycleNeverRaisesHealth) {
    build_chain();
    GraphAnalyzer analyzer(graph);
    double before = analyzer.calculate_graph_health().score;

    ASSERT_TRUE(graph.add_edge(TaskEdge{.source_id = "C", .target_id = "A", .edge_type = EdgeType::Weak}));
    auto after = analyzer.calculate_graph_health();
    EXPECT_LT(after.score, before);
    EXPECT_GE(after.score, 0.0);
    EXPECT_LE(after.score, 100.0);
}

// ─── Quality & Resources ─────────────────────

TEST_F(GraphAnalyzerTest, QualityOfChain) {
    build_chain();
    GraphAnalyzer analyzer(graph);
    auto q = analyzer.check_graph_quality();

    ASSERT_TRUE(q.has_value());
    EXPECT_EQ(q->node_count, 3u);
    EXPECT_EQ(q->edge_count, 2u);
    EXPECT_NEAR(q->avg_fan_in, 2.0 / 3.0, 1e-9);
    EXPECT_EQ(q->max_fan_out, 1u);
    EXPECT_EQ(q->root_count, 1u);
    EXPECT_EQ(q->leaf_count, 1u);
    EXPECT_TRUE(q->is_balanced);
    EXPECT_NEAR(q->density, 2.0 / 6.0, 1e-9);
}

TEST_F(GraphAnalyzerTest, QualityAbsentForEmptyGraph) {
    GraphAnalyzer analyzer(graph);
    EXPECT_FALSE(analyzer.check_graph_quality().has_value());
}

TEST_F(GraphAnalyzerTest, StarIsUnbalanced) {
    build_star();
    GraphAnalyzer analyzer(graph);
    auto q = analyzer.check_graph_quality();
    ASSERT_TRUE(q.has_value());
    EXPECT_EQ(q->root_count, 5u);
    EXPECT_FALSE(q->is_balanced);
}

TEST_F(GraphAnalyzerTest, TotalCostOfFanOut) {
    ASSERT_TRUE(graph.add_node(make_node("src", 1.0)));
    ASSERT_TRUE(graph.add_node(make_node("left", 4.0)));
    ASSERT_TRUE(graph.add_node(make_node("right", 4.0)));
    ASSERT_TRUE(graph.add_node(make_node("sink", 1.0)));
    link(graph, "src", "left");
    link(graph, "src", "right");
    link(graph, "left", "sink");
    link(graph, "right", "sink");

    GraphAnalyzer analyzer(graph);
    auto costs = analyzer.calculate_total_cost();
    EXPECT_DOUBLE_EQ(costs.total_duration_sequential, 10.0);
    EXPECT_DOUBLE_EQ(costs.critical_path_duration, 6.0);
    EXPECT_DOUBLE_EQ(costs.efficiency_ratio, 0.6);
    EXPECT_DOUBLE_EQ(costs.total_cpu_units, 4.0);
    EXPECT_DOUBLE_EQ(costs.total_memory_mb, 512.0);
}

TEST_F(GraphAnalyzerTest, HotspotsRankedByTotalCost) {
    build_chain();
    GraphAnalyzer analyzer(graph);
    auto hotspots = analyzer.find_resource_hotspots(2);
    ASSERT_EQ(hotspots.size(), 2u);
    EXPECT_EQ(hotspots[0].node_id, "B");
    EXPECT_EQ(hotspots[1].node_id, "A");
}

// ─── Redundancy ──────────────────────────────

TEST_F(GraphAnalyzerTest, RedundancyOfChainAndDiamond) {
    build_chain();
    GraphAnalyzer analyzer(graph);
    EXPECT_DOUBLE_EQ(analyzer.calculate_redundancy_score(), 0.5);

    ASSERT_TRUE(graph.add_node(make_node("B2")));
    link(graph, "A", "B2");
    link(graph, "B2", "C");
    EXPECT_DOUBLE_EQ(analyzer.calculate_redundancy_score(), 1.0);
}

TEST_F(GraphAnalyzerTest, RedundancyZeroForTrivialGraphs) {
    GraphAnalyzer analyzer(graph);
    EXPECT_DOUBLE_EQ(analyzer.calculate_redundancy_score(), 0.0);
    ASSERT_TRUE(graph.add_node(make_node("a")));
    EXPECT_DOUBLE_EQ(analyzer.calculate_redundancy_score(), 0.0);
}

TEST_F(GraphAnalyzerTest, RedundancyEnumeratesWeakCycle) {
    build_weak_cycle();
    GraphAnalyzer analyzer(graph);
    EXPECT_DOUBLE_EQ(analyzer.calculate_redundancy_score(), 0.5);
}

TEST_F(GraphAnalyzerTest, RedundancyEnumerationIsBounded) {
    build_weak_cycle();

    std::vector<std::string> lines;
    Logger logger(std::make_unique<CaptureSink>(lines), LogLevel::Warn);

    GraphAnalyzer gated(graph, AnalyzerConfig{.redundancy_max_nodes = 3}, &logger);
    EXPECT_DOUBLE_EQ(gated.calculate_redundancy_score(), 0.0);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("exceeds enumeration limit"), std::string::npos);

    GraphAnalyzer capped(graph, AnalyzerConfig{.redundancy_max_paths = 1}, &logger);
    EXPECT_DOUBLE_EQ(capped.calculate_redundancy_score(), 0.0);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[1].find("truncated"), std::string::npos);
}

// ─── Report ──────────────────────────────────

TEST_F(GraphAnalyzerTest, ReportCollectsEveryAnalysis) {
    build_chain();
    GraphAnalyzer analyzer(graph, AnalyzerConfig{.top_n = 2});
    auto report = analyzer.get_analysis_report();

    EXPECT_EQ(report.graph_id, "analysis");
    EXPECT_EQ(report.stats.node_count, 3u);
    EXPECT_TRUE(report.quality.has_value());
    EXPECT_EQ(report.critical_nodes, (std::vector<TaskId>{"A", "B", "C"}));
    EXPECT_EQ(report.influential_nodes.size(), 2u);
    EXPECT_EQ(report.resource_hotspots.size(), 2u);
    EXPECT_EQ(report.parallel_stages.size(), 3u);
    EXPECT_DOUBLE_EQ(report.parallelization_index, report.health.parallelization_index);
    EXPECT_DOUBLE_EQ(report.redundancy_score, 0.5);
    EXPECT_DOUBLE_EQ(report.costs.critical_path_duration, 18.0);
    EXPECT_TRUE(report.cycles.empty());
    EXPECT_TRUE(report.bottlenecks.empty());
}

TEST_F(GraphAnalyzerTest, ReportOnEmptyGraph) {
    GraphAnalyzer analyzer(graph);
    auto report = analyzer.get_analysis_report();
    EXPECT_FALSE(report.quality.has_value());
    EXPECT_DOUBLE_EQ(report.health.score, 100.0);
    EXPECT_TRUE(report.critical_nodes.empty());
    EXPECT_DOUBLE_EQ(report.redundancy_score, 0.0);
}

TEST_F(GraphAnalyzerTest, LogsCycleSearch) {
    build_chain();
    std::vector<std::string> lines;
    Logger logger(std::make_unique<CaptureSink>(lines), LogLevel::Info);

    GraphAnalyzer analyzer(graph, {}, &logger);
    (void)analyzer.find_all_cycles();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("Found 0 cycles in graph analysis"), std::string::npos);

    // Served from cache: no second log line.
    (void)analyzer.find_all_cycles();
    EXPECT_EQ(lines.size(), 1u);

    analyzer.clear_cache();
    (void)analyzer.find_all_cycles();
    EXPECT_EQ(lines.size(), 2u);
}
