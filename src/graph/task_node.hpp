/**
 * @file task_node.hpp
 * @brief A single task node in the dependency graph.
 *
 * A TaskNode carries identity, status, cost estimates and metadata. Its
 * dependency and dependent sets mirror the edges touching it and are owned
 * by TaskGraph; the node only exposes them read-only.
 */

#pragma once

#include "core/types.hpp"

#include <optional>
#include <set>
#include <string>

namespace taskgraph {

class TaskGraph;

/**
 * @brief Task node with execution tracking and analysis annotations.
 */
class TaskNode {
public:
    TaskNode() = default;
    TaskNode(TaskId node_id, std::string node_name,
             std::string type = "generic", int node_priority = 5,
             CostModel cost = {}, Metadata meta = {});

    // ── Identity & description ────────────────
    TaskId id;
    std::string name;
    std::string node_type = "generic";
    int priority = 5;
    NodeStatus status = NodeStatus::Pending;
    CostModel cost_model;
    Metadata metadata;

    // ── Execution tracking ────────────────────
    std::optional<Timestamp> start_time;
    std::optional<Timestamp> end_time;
    std::optional<double> actual_duration;      ///< Seconds
    std::optional<std::string> error_message;

    // ── Analysis annotations (written by TaskGraph / GraphAnalyzer) ──
    std::optional<int> level;
    bool on_critical_path = false;
    double influence_score = 0.0;
    double parallelization_factor = 1.0;

    // ── Status transitions ────────────────────
    void mark_ready() noexcept;
    void mark_running();
    void mark_completed(std::optional<double> duration = std::nullopt);
    void mark_failed(std::string message);
    void mark_cancelled() noexcept;
    void mark_blocked() noexcept;

    [[nodiscard]] bool is_terminal() const noexcept;
    [[nodiscard]] bool can_execute() const noexcept;

    // ── Metadata ──────────────────────────────
    [[nodiscard]] std::optional<std::string> get_metadata(const std::string& key) const;
    void set_metadata(const std::string& key, std::string value);
    void update_metadata(const Metadata& updates);

    // ── Graph neighbourhood (maintained by TaskGraph) ──
    [[nodiscard]] const std::set<TaskId>& dependencies() const noexcept { return dependencies_; }
    [[nodiscard]] const std::set<TaskId>& dependents() const noexcept { return dependents_; }

private:
    friend class TaskGraph;

    std::set<TaskId> dependencies_;   ///< Incoming edges (predecessors)
    std::set<TaskId> dependents_;     ///< Outgoing edges (successors)
};

}  // namespace taskgraph
