/**
 * @file types.hpp
 * @brief Fundamental types used throughout the TaskGraph engine.
 *
 * Defines TaskId, Metadata, CostModel, NodeStatus, EdgeType and other shared
 * vocabulary types. All types are designed for value semantics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace taskgraph {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using TaskId = std::string;
using GraphId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Metadata = std::map<std::string, std::string>;

// ─────────────────────────────────────────────
// Cost Model
// ─────────────────────────────────────────────

/**
 * @brief Estimated resource requirements of a single task.
 *
 * Durations are in seconds. Analyzers compare tasks through total_cost(),
 * which blends money and time into one scalar.
 */
struct CostModel {
    double duration{1.0};               ///< Estimated execution time (s)
    double monetary_cost{0.0};          ///< Estimated monetary cost
    double cpu_units{1.0};              ///< CPU units required
    double memory_mb{128.0};            ///< Working memory (MB)
    uint64_t io_operations{0};          ///< Estimated I/O operations
    double network_bandwidth{0.0};      ///< Network bandwidth (Mbps)

    static constexpr double kDurationCostFactor = 0.01;

    [[nodiscard]] constexpr double total_cost() const noexcept {
        return monetary_cost + duration * kDurationCostFactor;
    }

    bool operator==(const CostModel&) const = default;
};

// ─────────────────────────────────────────────
// Node Status
// ─────────────────────────────────────────────

enum class NodeStatus : uint8_t {
    Pending,       ///< Waiting for dependencies
    Ready,         ///< All dependencies met, awaiting execution
    Running,       ///< Currently executing
    Completed,     ///< Finished successfully
    Failed,        ///< Execution failed
    Cancelled,     ///< Cancelled before completion
    Blocked        ///< Dependencies cannot be met
};

[[nodiscard]] constexpr std::string_view to_string(NodeStatus status) noexcept {
    switch (status) {
        case NodeStatus::Pending:   return "pending";
        case NodeStatus::Ready:     return "ready";
        case NodeStatus::Running:   return "running";
        case NodeStatus::Completed: return "completed";
        case NodeStatus::Failed:    return "failed";
        case NodeStatus::Cancelled: return "cancelled";
        case NodeStatus::Blocked:   return "blocked";
    }
    return "unknown";
}

[[nodiscard]] std::optional<NodeStatus> parse_node_status(std::string_view text) noexcept;

// ─────────────────────────────────────────────
// Edge Type
// ─────────────────────────────────────────────

enum class EdgeType : uint8_t {
    Dependency,    ///< A must complete before B
    Constraint,    ///< Timing or resource constraint
    DataFlow,      ///< Data flows from A to B
    Conditional,   ///< Dependency that applies conditionally
    Weak           ///< Preferred but not required ordering
};

[[nodiscard]] constexpr std::string_view to_string(EdgeType type) noexcept {
    switch (type) {
        case EdgeType::Dependency:  return "dependency";
        case EdgeType::Constraint:  return "constraint";
        case EdgeType::DataFlow:    return "data_flow";
        case EdgeType::Conditional: return "conditional";
        case EdgeType::Weak:        return "weak";
    }
    return "unknown";
}

[[nodiscard]] std::optional<EdgeType> parse_edge_type(std::string_view text) noexcept;

/// Dependency and Constraint edges are checked for acyclicity on insertion.
[[nodiscard]] constexpr bool is_cycle_significant(EdgeType type) noexcept {
    return type == EdgeType::Dependency || type == EdgeType::Constraint;
}

/**
 * @brief Which edge insertions trigger the acyclicity check.
 *
 * SignificantEdges checks only Dependency/Constraint insertions, but the
 * check itself scans the whole adjacency, so a cycle made purely of
 * DataFlow/Conditional/Weak edges is tolerated until a significant edge is
 * inserted. AllEdges rejects any insertion that would close a cycle.
 */
enum class CyclePolicy : uint8_t {
    SignificantEdges,
    AllEdges
};

[[nodiscard]] constexpr std::string_view to_string(CyclePolicy policy) noexcept {
    switch (policy) {
        case CyclePolicy::SignificantEdges: return "significant";
        case CyclePolicy::AllEdges:         return "all";
    }
    return "unknown";
}

[[nodiscard]] std::optional<CyclePolicy> parse_cycle_policy(std::string_view text) noexcept;

// ─────────────────────────────────────────────
// Timestamps
// ─────────────────────────────────────────────

/// ISO-8601 UTC with microsecond precision, e.g. 2026-10-19T12:00:00.000123Z
[[nodiscard]] std::string format_timestamp(Timestamp ts);

/// Inverse of format_timestamp. Fractional seconds are optional.
[[nodiscard]] std::optional<Timestamp> parse_timestamp(std::string_view text);

}  // namespace taskgraph
