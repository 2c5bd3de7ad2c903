/**
 * @file task_graph.cpp
 * @brief TaskGraph mutation and core graph algorithms.
 *
 * Implements transactional edge insertion, iterative DFS cycle detection,
 * Kahn's algorithm for topological ordering, level assignment and the
 * critical-path method. All algorithms operate on the internal adjacency
 * indices with O(V+E) complexity (cycle-checked insertion is O(V+E) per
 * edge because the check scans the whole graph).
 */

#include "graph/task_graph.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <queue>
#include <stack>
#include <unordered_map>

namespace taskgraph {

namespace {

const std::set<TaskId>& empty_set() {
    static const std::set<TaskId> kEmpty;
    return kEmpty;
}

/**
 * @brief Tentative commit of one edge across the four edge-bearing
 *        structures, rolled back on destruction unless committed.
 *
 * Only entries this insertion actually created are removed on rollback, so
 * a rejected duplicate of an existing edge leaves the original in place.
 */
class EdgeInsertion {
public:
    EdgeInsertion(std::vector<TaskEdge>& edges,
                  std::set<TaskId>& forward,
                  std::set<TaskId>& backward,
                  std::set<TaskId>& source_dependents,
                  std::set<TaskId>& target_dependencies)
        : edges_(edges)
        , forward_(forward)
        , backward_(backward)
        , source_dependents_(source_dependents)
        , target_dependencies_(target_dependencies) {}

    EdgeInsertion(const EdgeInsertion&) = delete;
    EdgeInsertion& operator=(const EdgeInsertion&) = delete;

    ~EdgeInsertion() {
        if (!committed_) rollback();
    }

    void apply(TaskEdge edge) {
        source_id_ = edge.source_id;
        target_id_ = edge.target_id;

        edges_.push_back(std::move(edge));
        edge_pushed_ = true;
        forward_inserted_ = forward_.insert(target_id_).second;
        backward_inserted_ = backward_.insert(source_id_).second;
        dependents_inserted_ = source_dependents_.insert(target_id_).second;
        dependencies_inserted_ = target_dependencies_.insert(source_id_).second;
    }

    void commit() noexcept { committed_ = true; }

private:
    void rollback() noexcept {
        if (dependencies_inserted_) target_dependencies_.erase(source_id_);
        if (dependents_inserted_) source_dependents_.erase(target_id_);
        if (backward_inserted_) backward_.erase(source_id_);
        if (forward_inserted_) forward_.erase(target_id_);
        if (edge_pushed_) edges_.pop_back();
    }

    std::vector<TaskEdge>& edges_;
    std::set<TaskId>& forward_;
    std::set<TaskId>& backward_;
    std::set<TaskId>& source_dependents_;
    std::set<TaskId>& target_dependencies_;

    TaskId source_id_;
    TaskId target_id_;
    bool edge_pushed_ = false;
    bool forward_inserted_ = false;
    bool backward_inserted_ = false;
    bool dependents_inserted_ = false;
    bool dependencies_inserted_ = false;
    bool committed_ = false;
};

}  // anonymous namespace

TaskGraph::TaskGraph(GraphId graph_id, Metadata metadata, CyclePolicy policy)
    : graph_id_(std::move(graph_id)), metadata_(std::move(metadata)), policy_(policy) {}

// ─────────────────────────────────────────────
// Node Operations
// ─────────────────────────────────────────────

Result<void> TaskGraph::add_node(TaskNode node) {
    if (nodes_.contains(node.id)) {
        return Error{ErrorCode::DuplicateNode,
                     std::format("Node {} already exists in graph", node.id)};
    }

    // Neighbourhood is derived from edges only.
    node.dependencies_.clear();
    node.dependents_.clear();

    TaskId id = node.id;
    adj_list_[id];
    reverse_adj_[id];
    nodes_.emplace(id, std::move(node));
    invalidate_cache();
    return {};
}

Result<void> TaskGraph::remove_node(const TaskId& id) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return Error{ErrorCode::NotFound, std::format("Node {} not found in graph", id)};
    }

    std::erase_if(edges_, [&id](const TaskEdge& e) {
        return e.source_id == id || e.target_id == id;
    });

    for (const auto& succ : adj_list_.at(id)) {
        reverse_adj_.at(succ).erase(id);
        nodes_.at(succ).dependencies_.erase(id);
    }
    for (const auto& pred : reverse_adj_.at(id)) {
        adj_list_.at(pred).erase(id);
        nodes_.at(pred).dependents_.erase(id);
    }

    adj_list_.erase(id);
    reverse_adj_.erase(id);
    nodes_.erase(it);
    invalidate_cache();
    return {};
}

TaskNode* TaskGraph::find_node(const TaskId& id) {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

const TaskNode* TaskGraph::find_node(const TaskId& id) const {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

bool TaskGraph::has_node(const TaskId& id) const {
    return nodes_.contains(id);
}

Result<void> TaskGraph::set_cost_model(const TaskId& id, const CostModel& cost) {
    auto* node = find_node(id);
    if (node == nullptr) {
        return Error{ErrorCode::NotFound, std::format("Node {} not found in graph", id)};
    }
    node->cost_model = cost;
    invalidate_cache();
    return {};
}

// ─────────────────────────────────────────────
// Edge Operations
// ─────────────────────────────────────────────

Result<void> TaskGraph::add_edge(TaskEdge edge) {
    return insert_edge(std::move(edge), true);
}

Result<void> TaskGraph::restore_edge(TaskEdge edge) {
    return insert_edge(std::move(edge), false);
}

Result<void> TaskGraph::check_edge_endpoints(const TaskEdge& edge) const {
    if (!nodes_.contains(edge.source_id)) {
        return Error{ErrorCode::NotFound,
                     std::format("Source node {} not found", edge.source_id)};
    }
    if (!nodes_.contains(edge.target_id)) {
        return Error{ErrorCode::NotFound,
                     std::format("Target node {} not found", edge.target_id)};
    }
    if (edge.source_id == edge.target_id) {
        return Error{ErrorCode::SelfLoop,
                     std::format("Self-loop on {} not allowed in DAG", edge.source_id)};
    }
    return {};
}

Result<void> TaskGraph::insert_edge(TaskEdge edge, bool check_cycles) {
    if (auto endpoints = check_edge_endpoints(edge); !endpoints) {
        return endpoints;
    }

    const TaskId source_id = edge.source_id;
    const TaskId target_id = edge.target_id;
    const bool needs_check = check_cycles
        && (policy_ == CyclePolicy::AllEdges || edge.is_cycle_significant());

    EdgeInsertion insertion(edges_,
                            adj_list_.at(source_id),
                            reverse_adj_.at(target_id),
                            nodes_.at(source_id).dependents_,
                            nodes_.at(target_id).dependencies_);
    insertion.apply(std::move(edge));

    if (needs_check && has_cycle()) {
        return Error{ErrorCode::Cycle,
                     std::format("Adding edge {} -> {} creates cycle", source_id, target_id)};
    }

    insertion.commit();
    invalidate_cache();
    return {};
}

Result<void> TaskGraph::remove_edge(const TaskId& source_id, const TaskId& target_id) {
    auto removed = std::erase_if(edges_, [&](const TaskEdge& e) {
        return e.source_id == source_id && e.target_id == target_id;
    });
    if (removed == 0) {
        return Error{ErrorCode::NotFound,
                     std::format("Edge {} -> {} not found", source_id, target_id)};
    }

    adj_list_.at(source_id).erase(target_id);
    reverse_adj_.at(target_id).erase(source_id);
    nodes_.at(source_id).dependents_.erase(target_id);
    nodes_.at(target_id).dependencies_.erase(source_id);

    invalidate_cache();
    return {};
}

std::vector<TaskEdge> TaskGraph::edges_from(const TaskId& id) const {
    std::vector<TaskEdge> result;
    std::copy_if(edges_.begin(), edges_.end(), std::back_inserter(result),
                 [&id](const TaskEdge& e) { return e.source_id == id; });
    return result;
}

std::vector<TaskEdge> TaskGraph::edges_to(const TaskId& id) const {
    std::vector<TaskEdge> result;
    std::copy_if(edges_.begin(), edges_.end(), std::back_inserter(result),
                 [&id](const TaskEdge& e) { return e.target_id == id; });
    return result;
}

bool TaskGraph::has_edge(const TaskId& source_id, const TaskId& target_id) const {
    return std::any_of(edges_.begin(), edges_.end(), [&](const TaskEdge& e) {
        return e.source_id == source_id && e.target_id == target_id;
    });
}

const std::set<TaskId>& TaskGraph::successors(const TaskId& id) const {
    auto it = adj_list_.find(id);
    return it == adj_list_.end() ? empty_set() : it->second;
}

const std::set<TaskId>& TaskGraph::predecessors(const TaskId& id) const {
    auto it = reverse_adj_.find(id);
    return it == reverse_adj_.end() ? empty_set() : it->second;
}

// ─────────────────────────────────────────────
// Cycle Detection (iterative DFS, three colours)
// ─────────────────────────────────────────────

bool TaskGraph::has_cycle() const {
    enum class Color : uint8_t { White, Gray, Black };
    std::unordered_map<TaskId, Color> color;
    color.reserve(nodes_.size());

    struct Frame {
        const TaskId* node;
        std::set<TaskId>::const_iterator next;
        std::set<TaskId>::const_iterator end;
    };

    for (const auto& [start_id, _] : nodes_) {
        if (color[start_id] != Color::White) continue;

        std::stack<Frame> dfs_stack;
        const auto& start_out = successors(start_id);
        dfs_stack.push({&start_id, start_out.begin(), start_out.end()});
        color[start_id] = Color::Gray;

        while (!dfs_stack.empty()) {
            auto& frame = dfs_stack.top();

            if (frame.next == frame.end) {
                color[*frame.node] = Color::Black;
                dfs_stack.pop();
                continue;
            }

            const TaskId& neighbor = *frame.next;
            ++frame.next;

            auto& neighbor_color = color[neighbor];
            if (neighbor_color == Color::Gray) {
                return true;
            }
            if (neighbor_color == Color::White) {
                neighbor_color = Color::Gray;
                const auto& out = successors(neighbor);
                dfs_stack.push({&neighbor, out.begin(), out.end()});
            }
        }
    }

    return false;
}

// ─────────────────────────────────────────────
// Topological Ordering (Kahn's Algorithm)
// ─────────────────────────────────────────────

Result<std::vector<TaskId>> TaskGraph::topological_sort() const {
    if (topo_cache_ && topo_cache_->first == version_) {
        return topo_cache_->second;
    }

    std::unordered_map<TaskId, size_t> in_degree;
    in_degree.reserve(nodes_.size());

    // Seeded in ascending id order so the result is reproducible.
    std::queue<TaskId> zero_in;
    for (const auto& [id, _] : nodes_) {
        auto degree = predecessors(id).size();
        in_degree[id] = degree;
        if (degree == 0) {
            zero_in.push(id);
        }
    }

    std::vector<TaskId> order;
    order.reserve(nodes_.size());

    while (!zero_in.empty()) {
        auto current = zero_in.front();
        zero_in.pop();

        for (const auto& neighbor : successors(current)) {
            if (--in_degree[neighbor] == 0) {
                zero_in.push(neighbor);
            }
        }
        order.push_back(std::move(current));
    }

    if (order.size() != nodes_.size()) {
        return Error{ErrorCode::Validation,
                     "Graph contains cycle, cannot perform topological sort"};
    }

    topo_cache_.emplace(version_, order);
    return order;
}

std::vector<TaskId> TaskGraph::root_nodes() const {
    std::vector<TaskId> roots;
    for (const auto& [id, node] : nodes_) {
        if (node.dependencies_.empty()) roots.push_back(id);
    }
    return roots;
}

std::vector<TaskId> TaskGraph::leaf_nodes() const {
    std::vector<TaskId> leaves;
    for (const auto& [id, node] : nodes_) {
        if (node.dependents_.empty()) leaves.push_back(id);
    }
    return leaves;
}

// ─────────────────────────────────────────────
// Levels & Critical Path
// ─────────────────────────────────────────────

Result<std::map<TaskId, int>> TaskGraph::calculate_node_levels() {
    auto order = topological_sort();
    if (!order) return order.error();

    std::map<TaskId, int> levels;
    for (const auto& id : *order) {
        int level = 0;
        for (const auto& dep : predecessors(id)) {
            level = std::max(level, levels.at(dep) + 1);
        }
        levels[id] = level;
        nodes_.at(id).level = level;
    }

    return levels;
}

Result<CriticalPath> TaskGraph::calculate_critical_path() {
    if (critical_path_cache_ && critical_path_cache_->first == version_) {
        // Costs can change through find_node without a version bump, so the
        // total and the flags are rebuilt from the current nodes.
        auto& cached = critical_path_cache_->second;
        cached.total_duration = 0.0;
        for (auto& [_, node] : nodes_) {
            node.on_critical_path = false;
        }
        for (const auto& id : cached.nodes) {
            auto& node = nodes_.at(id);
            node.on_critical_path = true;
            cached.total_duration += node.cost_model.duration;
        }
        return cached;
    }

    auto order = topological_sort();
    if (!order) return order.error();

    // Forward pass: earliest start of each node and the predecessor that
    // determines it. Predecessor sets iterate in ascending id order and only
    // a strictly later finish replaces the current best, so ties go to the
    // lowest id.
    std::unordered_map<TaskId, double> earliest_start;
    std::unordered_map<TaskId, const TaskId*> predecessor;
    earliest_start.reserve(nodes_.size());
    predecessor.reserve(nodes_.size());

    for (const auto& id : *order) {
        double start = 0.0;
        const TaskId* best_pred = nullptr;
        for (const auto& dep : predecessors(id)) {
            double finish = earliest_start.at(dep) + nodes_.at(dep).cost_model.duration;
            if (best_pred == nullptr || finish > start) {
                start = finish;
                best_pred = &dep;
            }
        }
        earliest_start[id] = start;
        predecessor[id] = best_pred;
    }

    const TaskId* end_node = nullptr;
    double max_finish = 0.0;
    for (const auto& [id, node] : nodes_) {
        double finish = earliest_start.at(id) + node.cost_model.duration;
        if (end_node == nullptr || finish > max_finish) {
            max_finish = finish;
            end_node = &id;
        }
    }

    CriticalPath path;
    path.total_duration = end_node ? max_finish : 0.0;

    for (auto& [_, node] : nodes_) {
        node.on_critical_path = false;
    }
    for (const TaskId* current = end_node; current != nullptr; current = predecessor.at(*current)) {
        path.nodes.push_back(*current);
        nodes_.at(*current).on_critical_path = true;
    }
    std::reverse(path.nodes.begin(), path.nodes.end());

    critical_path_cache_.emplace(version_, path);
    return path;
}

// ─────────────────────────────────────────────
// Validation & Stats
// ─────────────────────────────────────────────

ValidationReport TaskGraph::validate() const {
    ValidationReport report;
    auto& errors = report.errors;

    if (has_cycle()) {
        errors.emplace_back("Graph contains cycles");
    }

    std::map<TaskId, std::set<TaskId>> expected_out;
    std::map<TaskId, std::set<TaskId>> expected_in;
    for (const auto& edge : edges_) {
        if (!nodes_.contains(edge.source_id)) {
            errors.push_back("Edge references non-existent source node: " + edge.source_id);
        }
        if (!nodes_.contains(edge.target_id)) {
            errors.push_back("Edge references non-existent target node: " + edge.target_id);
        }
        expected_out[edge.source_id].insert(edge.target_id);
        expected_in[edge.target_id].insert(edge.source_id);
    }

    auto expected = [](const std::map<TaskId, std::set<TaskId>>& index,
                       const TaskId& id) -> const std::set<TaskId>& {
        auto it = index.find(id);
        return it == index.end() ? empty_set() : it->second;
    };

    for (const auto& [id, node] : nodes_) {
        const auto& want_in = expected(expected_in, id);
        const auto& want_out = expected(expected_out, id);

        for (const auto& dep : node.dependencies_) {
            if (!nodes_.contains(dep)) {
                errors.push_back(std::format(
                    "Node {} references non-existent dependency: {}", id, dep));
            }
        }
        if (node.dependencies_ != want_in) {
            errors.push_back(std::format("Node {} dependency set does not match its incoming edges", id));
        }
        if (node.dependents_ != want_out) {
            errors.push_back(std::format("Node {} dependent set does not match its outgoing edges", id));
        }
        if (predecessors(id) != want_in) {
            errors.push_back(std::format("Reverse adjacency of {} does not match edge list", id));
        }
        if (successors(id) != want_out) {
            errors.push_back(std::format("Adjacency of {} does not match edge list", id));
        }
    }

    report.is_valid = errors.empty();
    return report;
}

GraphStats TaskGraph::get_stats() const {
    return GraphStats{
        .graph_id = graph_id_,
        .node_count = nodes_.size(),
        .edge_count = edges_.size(),
        .root_count = root_nodes().size(),
        .leaf_count = leaf_nodes().size(),
        .is_acyclic = is_acyclic()
    };
}

void TaskGraph::set_metadata(const std::string& key, std::string value) {
    metadata_[key] = std::move(value);
}

void TaskGraph::invalidate_cache() noexcept {
    ++version_;
    topo_cache_.reset();
    critical_path_cache_.reset();
}

}  // namespace taskgraph
