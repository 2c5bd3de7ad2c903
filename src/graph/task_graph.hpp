/**
 * @file task_graph.hpp
 * @brief Directed Acyclic Graph of task nodes and typed edges.
 *
 * TaskGraph owns the nodes, the edge list, and the forward/reverse adjacency
 * indices, and keeps all four consistent across every mutation. Edge
 * insertion is transactional: a rejected edge leaves the graph exactly as it
 * was. Provides topological ordering (Kahn), DFS cycle detection, level
 * computation and the critical-path method.
 *
 * Not thread-safe: callers sharing a graph across threads must serialize
 * both mutation and analysis externally.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/task_edge.hpp"
#include "graph/task_node.hpp"

#include <cstdint>
#include <map>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace taskgraph {

class GraphBuilder;

struct CriticalPath {
    std::vector<TaskId> nodes;
    double total_duration = 0.0;
};

struct ValidationReport {
    bool is_valid = true;
    std::vector<std::string> errors;
};

struct GraphStats {
    GraphId graph_id;
    size_t node_count = 0;
    size_t edge_count = 0;
    size_t root_count = 0;
    size_t leaf_count = 0;
    bool is_acyclic = true;
};

class TaskGraph {
public:
    explicit TaskGraph(GraphId graph_id = "default",
                       Metadata metadata = {},
                       CyclePolicy policy = CyclePolicy::SignificantEdges);

    // ── Node Operations ───────────────────────
    Result<void> add_node(TaskNode node);
    Result<void> remove_node(const TaskId& id);

    /// Mutable access for status transitions. The node id must not be changed.
    [[nodiscard]] TaskNode* find_node(const TaskId& id);
    [[nodiscard]] const TaskNode* find_node(const TaskId& id) const;
    [[nodiscard]] bool has_node(const TaskId& id) const;
    [[nodiscard]] const std::map<TaskId, TaskNode>& nodes() const noexcept { return nodes_; }

    /// Replace a node's cost estimate; invalidates the cached critical path.
    Result<void> set_cost_model(const TaskId& id, const CostModel& cost);

    // ── Edge Operations ───────────────────────
    Result<void> add_edge(TaskEdge edge);
    Result<void> remove_edge(const TaskId& source_id, const TaskId& target_id);

    [[nodiscard]] const std::vector<TaskEdge>& edges() const noexcept { return edges_; }
    [[nodiscard]] std::vector<TaskEdge> edges_from(const TaskId& id) const;
    [[nodiscard]] std::vector<TaskEdge> edges_to(const TaskId& id) const;
    [[nodiscard]] bool has_edge(const TaskId& source_id, const TaskId& target_id) const;
    [[nodiscard]] const std::set<TaskId>& successors(const TaskId& id) const;
    [[nodiscard]] const std::set<TaskId>& predecessors(const TaskId& id) const;

    // ── Structure ─────────────────────────────
    [[nodiscard]] bool has_cycle() const;
    [[nodiscard]] bool is_acyclic() const { return !has_cycle(); }
    [[nodiscard]] Result<std::vector<TaskId>> topological_sort() const;
    [[nodiscard]] std::vector<TaskId> root_nodes() const;
    [[nodiscard]] std::vector<TaskId> leaf_nodes() const;

    // ── Derived Metrics (annotate nodes) ──────
    Result<std::map<TaskId, int>> calculate_node_levels();
    Result<CriticalPath> calculate_critical_path();

    // ── Validation & Stats ────────────────────
    [[nodiscard]] ValidationReport validate() const;
    [[nodiscard]] GraphStats get_stats() const;

    [[nodiscard]] const GraphId& id() const noexcept { return graph_id_; }
    [[nodiscard]] const Metadata& metadata() const noexcept { return metadata_; }
    void set_metadata(const std::string& key, std::string value);
    [[nodiscard]] CyclePolicy cycle_policy() const noexcept { return policy_; }
    [[nodiscard]] size_t node_count() const noexcept { return nodes_.size(); }
    [[nodiscard]] size_t edge_count() const noexcept { return edges_.size(); }

    /// Incremented on every structural mutation; tags all derived caches.
    [[nodiscard]] uint64_t version() const noexcept { return version_; }

private:
    // Snapshot loading and graph merging replay edges that were validated
    // when first inserted.
    friend class GraphBuilder;
    friend Result<TaskGraph> graph_from_json(const nlohmann::json& j, CyclePolicy policy);

    /// Insert an edge from a previously validated snapshot (no cycle check).
    Result<void> restore_edge(TaskEdge edge);

    Result<void> insert_edge(TaskEdge edge, bool check_cycles);
    Result<void> check_edge_endpoints(const TaskEdge& edge) const;
    void invalidate_cache() noexcept;

    GraphId graph_id_;
    Metadata metadata_;
    CyclePolicy policy_;

    std::map<TaskId, TaskNode> nodes_;
    std::vector<TaskEdge> edges_;
    std::map<TaskId, std::set<TaskId>> adj_list_;       // forward edges
    std::map<TaskId, std::set<TaskId>> reverse_adj_;    // backward edges

    uint64_t version_ = 0;
    mutable std::optional<std::pair<uint64_t, std::vector<TaskId>>> topo_cache_;
    std::optional<std::pair<uint64_t, CriticalPath>> critical_path_cache_;
};

}  // namespace taskgraph
