/**
 * @file graph_builder.cpp
 * @brief GraphBuilder implementation and built-in lookup tables.
 */

#include "builder/graph_builder.hpp"

#include <format>

namespace taskgraph {

namespace {

CostModel make_cost(double duration, double cpu_units, double memory_mb, uint64_t io_operations) {
    CostModel cost;
    cost.duration = duration;
    cost.cpu_units = cpu_units;
    cost.memory_mb = memory_mb;
    cost.io_operations = io_operations;
    return cost;
}

std::map<std::string, CostModel> default_cost_models() {
    return {
        {"data_fetch",     make_cost(2.0,  1.0, 256.0,  100)},
        {"computation",    make_cost(5.0,  4.0, 512.0,  10)},
        {"aggregation",    make_cost(1.0,  1.0, 128.0,  20)},
        {"visualization",  make_cost(3.0,  2.0, 256.0,  50)},
        {"data_io",        make_cost(2.5,  1.0, 256.0,  200)},
        {"transformation", make_cost(4.0,  2.0, 512.0,  50)},
        {"validation",     make_cost(2.0,  1.0, 128.0,  30)},
        {"model_io",       make_cost(10.0, 2.0, 1024.0, 500)},
        {"preprocessing",  make_cost(3.0,  2.0, 512.0,  20)},
        {"inference",      make_cost(15.0, 8.0, 2048.0, 10)},
        {"postprocessing", make_cost(2.0,  1.0, 256.0,  20)},
        {"pipeline",       make_cost(20.0, 4.0, 1024.0, 100)},
        {"generic",        make_cost(1.0,  1.0, 128.0,  10)},
    };
}

std::map<std::string, std::vector<std::string>> default_dependency_patterns() {
    return {
        {"compute_sentiment",  {"fetch_data"}},
        {"aggregate_results",  {"compute_sentiment"}},
        {"generate_plot",      {"aggregate_results"}},
        {"transform_data",     {"load_data"}},
        {"validate_data",      {"transform_data"}},
        {"save_data",          {"validate_data"}},
        {"preprocess_input",   {"load_model"}},
        {"run_inference",      {"preprocess_input", "load_model"}},
        {"postprocess_output", {"run_inference"}},
    };
}

std::string step_type(const WorkflowStep& step) {
    if (auto it = step.metadata.find("task_type"); it != step.metadata.end()) {
        return it->second;
    }
    return "generic";
}

}  // anonymous namespace

NodeStatus status_from_task_state(std::string_view state) noexcept {
    if (state == "running")   return NodeStatus::Running;
    if (state == "done")      return NodeStatus::Completed;
    if (state == "error")     return NodeStatus::Failed;
    if (state == "cancelled") return NodeStatus::Cancelled;
    return NodeStatus::Pending;
}

GraphBuilder::GraphBuilder(Logger* logger)
    : cost_models_(default_cost_models())
    , dependency_patterns_(default_dependency_patterns())
    , logger_(logger) {}

void GraphBuilder::log(LogLevel level, std::string_view message) const {
    if (logger_ != nullptr) {
        logger_->log(level, message);
    }
}

void GraphBuilder::apply_config(const BuilderConfig& config) {
    for (const auto& [type, cost] : config.cost_models) {
        add_cost_model(type, cost);
    }
    for (const auto& [name, deps] : config.dependency_patterns) {
        add_dependency_pattern(name, deps);
    }
}

// ─────────────────────────────────────────────
// Task lists
// ─────────────────────────────────────────────

Result<TaskGraph> GraphBuilder::from_task(const TaskSpec& task, const GraphId& graph_id) const {
    return from_tasks({task}, graph_id, false);
}

Result<TaskGraph> GraphBuilder::from_tasks(const std::vector<TaskSpec>& tasks,
                                           const GraphId& graph_id,
                                           bool detect_dependencies) const {
    TaskGraph graph(graph_id, {{"source", "pipeline"},
                               {"task_count", std::to_string(tasks.size())}});

    for (const auto& task : tasks) {
        TaskNode node(task.id, task.name, task.task_type, task.priority,
                      cost_model_for(task.task_type), {{"context", task.context}});
        node.status = status_from_task_state(task.state);
        node.start_time = task.started_at;
        node.end_time = task.completed_at;

        if (auto added = graph.add_node(std::move(node)); !added) {
            return added.error();
        }
    }

    if (detect_dependencies) {
        for (size_t i = 1; i < tasks.size(); ++i) {
            auto edge = graph.add_edge(TaskEdge{.source_id = tasks[i - 1].id,
                                                .target_id = tasks[i].id});
            if (!edge) return edge.error();
        }
    }

    log(LogLevel::Info, std::format("Converted {} tasks to graph {} with {} edges",
                                    tasks.size(), graph_id, graph.edge_count()));
    return graph;
}

// ─────────────────────────────────────────────
// Workflows
// ─────────────────────────────────────────────

Result<TaskGraph> GraphBuilder::add_workflow_nodes(TaskGraph graph,
                                                   const std::vector<WorkflowStep>& steps,
                                                   std::vector<TaskId>& node_ids) const {
    node_ids.clear();
    node_ids.reserve(steps.size());

    for (size_t idx = 0; idx < steps.size(); ++idx) {
        const auto& step = steps[idx];
        std::string name = step.task.empty() ? std::format("task_{}", idx) : step.task;
        std::string type = step_type(step);
        TaskId id = std::format("{}_{}", name, idx);

        TaskNode node(id, name, type, step.priority, cost_model_for(type), step.metadata);
        if (auto added = graph.add_node(std::move(node)); !added) {
            return added.error();
        }
        node_ids.push_back(std::move(id));
    }

    return graph;
}

Result<TaskGraph> GraphBuilder::from_workflow(const std::vector<WorkflowStep>& steps,
                                              const GraphId& graph_id) const {
    std::vector<TaskId> node_ids;
    auto built = add_workflow_nodes(
        TaskGraph(graph_id, {{"source", "workflow"}, {"task_count", std::to_string(steps.size())}}),
        steps, node_ids);
    if (!built) return built;

    TaskGraph graph = std::move(built).value();

    for (size_t idx = 0; idx < steps.size(); ++idx) {
        auto pattern = dependency_patterns_.find(graph.find_node(node_ids[idx])->name);
        if (pattern == dependency_patterns_.end()) continue;

        for (const auto& dep_name : pattern->second) {
            for (size_t prev = 0; prev < idx; ++prev) {
                if (graph.find_node(node_ids[prev])->name != dep_name) continue;

                auto edge = graph.add_edge(TaskEdge{.source_id = node_ids[prev],
                                                    .target_id = node_ids[idx]});
                if (edge) continue;
                if (edge.error().code == ErrorCode::Cycle) {
                    log(LogLevel::Warn, std::format("Skipping edge {} -> {} (cycle detected)",
                                                    node_ids[prev], node_ids[idx]));
                    continue;
                }
                return edge.error();
            }
        }
    }

    log(LogLevel::Info, std::format("Converted workflow with {} tasks to graph {}",
                                    steps.size(), graph_id));
    return graph;
}

Result<TaskGraph> GraphBuilder::sequential(const std::vector<WorkflowStep>& steps,
                                           const GraphId& graph_id) const {
    std::vector<TaskId> node_ids;
    auto built = add_workflow_nodes(
        TaskGraph(graph_id, {{"source", "workflow"}, {"mode", "sequential"}}),
        steps, node_ids);
    if (!built) return built;

    TaskGraph graph = std::move(built).value();

    for (size_t i = 1; i < node_ids.size(); ++i) {
        auto edge = graph.add_edge(TaskEdge{.source_id = node_ids[i - 1],
                                            .target_id = node_ids[i]});
        if (!edge) return edge.error();
    }

    log(LogLevel::Info, std::format("Created sequential graph {} with {} nodes",
                                    graph_id, node_ids.size()));
    return graph;
}

// ─────────────────────────────────────────────
// Merge
// ─────────────────────────────────────────────

Result<TaskGraph> GraphBuilder::merge_graphs(const std::vector<const TaskGraph*>& graphs,
                                             const GraphId& merged_graph_id) const {
    std::string source_ids;
    for (const auto* graph : graphs) {
        if (!source_ids.empty()) source_ids += ',';
        source_ids += graph->id();
    }

    TaskGraph merged(merged_graph_id, {{"source", "merged"}, {"source_graphs", source_ids}});

    for (const auto* graph : graphs) {
        for (const auto& [id, node] : graph->nodes()) {
            TaskNode copy(std::format("{}_{}", graph->id(), id), node.name, node.node_type,
                          node.priority, node.cost_model, node.metadata);
            copy.status = node.status;
            copy.set_metadata("source_graph", graph->id());

            if (auto added = merged.add_node(std::move(copy)); !added) {
                return added.error();
            }
        }
    }

    // Source graphs are already consistent, so their edges are restored as-is.
    for (const auto* graph : graphs) {
        for (const auto& edge : graph->edges()) {
            TaskEdge copy = edge;
            copy.source_id = std::format("{}_{}", graph->id(), edge.source_id);
            copy.target_id = std::format("{}_{}", graph->id(), edge.target_id);

            if (auto restored = merged.restore_edge(std::move(copy)); !restored) {
                return restored.error();
            }
        }
    }

    log(LogLevel::Info, std::format("Merged {} graphs into {}", graphs.size(), merged_graph_id));
    return merged;
}

// ─────────────────────────────────────────────
// Tables
// ─────────────────────────────────────────────

void GraphBuilder::add_cost_model(const std::string& task_type, const CostModel& cost) {
    cost_models_[task_type] = cost;
    log(LogLevel::Info, "Registered cost model for task type: " + task_type);
}

void GraphBuilder::add_dependency_pattern(const std::string& task_name,
                                          std::vector<std::string> dependencies) {
    log(LogLevel::Info, std::format("Registered dependency pattern for {} ({} prerequisites)",
                                    task_name, dependencies.size()));
    dependency_patterns_[task_name] = std::move(dependencies);
}

CostModel GraphBuilder::cost_model_for(const std::string& task_type) const {
    if (auto it = cost_models_.find(task_type); it != cost_models_.end()) {
        return it->second;
    }
    if (auto it = cost_models_.find("generic"); it != cost_models_.end()) {
        return it->second;
    }
    return CostModel{};
}

}  // namespace taskgraph
