/**
 * @file test_types.cpp
 * @brief Unit tests for core types.
 */

#include "core/types.hpp"

#include <gtest/gtest.h>

using namespace taskgraph;

TEST(CostModelTest, Defaults) {
    CostModel cost;
    EXPECT_DOUBLE_EQ(cost.duration, 1.0);
    EXPECT_DOUBLE_EQ(cost.monetary_cost, 0.0);
    EXPECT_DOUBLE_EQ(cost.cpu_units, 1.0);
    EXPECT_DOUBLE_EQ(cost.memory_mb, 128.0);
    EXPECT_EQ(cost.io_operations, 0u);
    EXPECT_DOUBLE_EQ(cost.network_bandwidth, 0.0);
}

TEST(CostModelTest, TotalCostBlendsDuration) {
    CostModel cost{.duration = 10.0, .monetary_cost = 2.5};
    EXPECT_DOUBLE_EQ(cost.total_cost(), 2.5 + 10.0 * 0.01);
}

TEST(CostModelTest, Equality) {
    CostModel a{.duration = 3.0};
    CostModel b{.duration = 3.0};
    CostModel c{.duration = 4.0};
    EXPECT_EQ(a, b);
    EXPECT_FALSE(a == c);
}

TEST(NodeStatusTest, StringRoundTrip) {
    EXPECT_EQ(to_string(NodeStatus::Pending), "pending");
    EXPECT_EQ(to_string(NodeStatus::Blocked), "blocked");
    EXPECT_EQ(parse_node_status("cancelled"), NodeStatus::Cancelled);
    EXPECT_FALSE(parse_node_status("done").has_value());
}

TEST(EdgeTypeTest, StringRoundTrip) {
    EXPECT_EQ(to_string(EdgeType::DataFlow), "data_flow");
    EXPECT_EQ(parse_edge_type("weak"), EdgeType::Weak);
    EXPECT_FALSE(parse_edge_type("dataflow").has_value());
}

TEST(EdgeTypeTest, CycleSignificance) {
    EXPECT_TRUE(is_cycle_significant(EdgeType::Dependency));
    EXPECT_TRUE(is_cycle_significant(EdgeType::Constraint));
    EXPECT_FALSE(is_cycle_significant(EdgeType::DataFlow));
    EXPECT_FALSE(is_cycle_significant(EdgeType::Conditional));
    EXPECT_FALSE(is_cycle_significant(EdgeType::Weak));
}

TEST(TimestampTest, FormatsUtcWithMicroseconds) {
    auto ts = std::chrono::system_clock::from_time_t(0) + std::chrono::microseconds{123};
    EXPECT_EQ(format_timestamp(ts), "1970-01-01T00:00:00.000123Z");
}

TEST(TimestampTest, ParseIsInverseOfFormat) {
    auto ts = std::chrono::system_clock::from_time_t(1'700'000'000)
            + std::chrono::microseconds{456'789};
    auto parsed = parse_timestamp(format_timestamp(ts));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, ts);
}

TEST(TimestampTest, ParseWithoutFraction) {
    auto parsed = parse_timestamp("2026-10-19T12:00:00Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(format_timestamp(*parsed), "2026-10-19T12:00:00.000000Z");
}

TEST(TimestampTest, RejectsGarbage) {
    EXPECT_FALSE(parse_timestamp("yesterday").has_value());
    EXPECT_FALSE(parse_timestamp("2026-10-19T12:00:00Zjunk").has_value());
}
