/**
 * @file task_edge.hpp
 * @brief Directed edge (dependency or constraint) between two task nodes.
 */

#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>

namespace taskgraph {

/**
 * @brief Edge in the task graph.
 *
 * Only Dependency and Constraint edges gate execution order for the cycle
 * checker; the remaining types describe softer relationships.
 */
struct TaskEdge {
    TaskId source_id;
    TaskId target_id;
    EdgeType edge_type = EdgeType::Dependency;
    double weight = 1.0;
    Metadata constraints;
    Metadata metadata;

    [[nodiscard]] bool is_dependency() const noexcept { return edge_type == EdgeType::Dependency; }
    [[nodiscard]] bool is_conditional() const noexcept { return edge_type == EdgeType::Conditional; }
    [[nodiscard]] bool is_weak() const noexcept { return edge_type == EdgeType::Weak; }
    [[nodiscard]] bool is_cycle_significant() const noexcept {
        return taskgraph::is_cycle_significant(edge_type);
    }

    [[nodiscard]] std::optional<std::string> constraint(const std::string& key) const;
    void set_constraint(const std::string& key, std::string value);

    /// True when a `max_delay` or `min_delay` constraint is present.
    [[nodiscard]] bool has_timing_constraint() const;

    bool operator==(const TaskEdge&) const = default;
};

}  // namespace taskgraph
