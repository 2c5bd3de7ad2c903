/**
 * @file graph_builder.hpp
 * @brief Builds TaskGraphs from task lists and declared workflows.
 *
 * The builder owns two lookup tables: a cost model per task type and a
 * list of prerequisite task names per task name. It only talks to
 * TaskGraph through add_node / add_edge.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/task_graph.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace taskgraph {

/**
 * @brief A task produced by an upstream pipeline.
 *
 * `state` uses the pipeline vocabulary: queued, running, done, error,
 * cancelled. Anything else maps to Pending.
 */
struct TaskSpec {
    TaskId id;
    std::string name;
    std::string task_type = "generic";
    int priority = 5;
    std::string state = "queued";
    std::string context;
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> completed_at;
};

/**
 * @brief One step of a planned workflow.
 *
 * The `task_type` metadata key selects the cost model.
 */
struct WorkflowStep {
    std::string task;
    int priority = 5;
    Metadata metadata;
};

[[nodiscard]] NodeStatus status_from_task_state(std::string_view state) noexcept;

class GraphBuilder {
public:
    explicit GraphBuilder(Logger* logger = nullptr);

    /// Overlay cost models and dependency patterns from configuration.
    void apply_config(const BuilderConfig& config);

    // ── Conversions ───────────────────────────
    Result<TaskGraph> from_task(const TaskSpec& task,
                                const GraphId& graph_id = "task_graph") const;

    /// Nodes in list order; with detect_dependencies, a chain in that order.
    Result<TaskGraph> from_tasks(const std::vector<TaskSpec>& tasks,
                                 const GraphId& graph_id = "task_pipeline",
                                 bool detect_dependencies = true) const;

    /**
     * @brief Build a graph whose edges come from the dependency patterns.
     *
     * Node ids are `<task>_<index>`. A step depends on every earlier step
     * whose task name appears in its pattern. An edge that would close a
     * cycle is skipped with a warning instead of failing the build.
     */
    Result<TaskGraph> from_workflow(const std::vector<WorkflowStep>& steps,
                                    const GraphId& graph_id = "workflow") const;

    /// Same node ids as from_workflow, but chained in list order.
    Result<TaskGraph> sequential(const std::vector<WorkflowStep>& steps,
                                 const GraphId& graph_id = "sequential") const;

    /// Node ids are prefixed `<graph_id>_`; each node records `source_graph`.
    Result<TaskGraph> merge_graphs(const std::vector<const TaskGraph*>& graphs,
                                   const GraphId& merged_graph_id = "merged_graph") const;

    // ── Tables ────────────────────────────────
    void add_cost_model(const std::string& task_type, const CostModel& cost);
    void add_dependency_pattern(const std::string& task_name, std::vector<std::string> dependencies);

    /// Falls back to the "generic" model for unknown types.
    [[nodiscard]] CostModel cost_model_for(const std::string& task_type) const;
    [[nodiscard]] const std::map<std::string, CostModel>& cost_models() const noexcept { return cost_models_; }
    [[nodiscard]] const std::map<std::string, std::vector<std::string>>& dependency_patterns() const noexcept {
        return dependency_patterns_;
    }

private:
    Result<TaskGraph> add_workflow_nodes(TaskGraph graph,
                                         const std::vector<WorkflowStep>& steps,
                                         std::vector<TaskId>& node_ids) const;
    void log(LogLevel level, std::string_view message) const;

    std::map<std::string, CostModel> cost_models_;
    std::map<std::string, std::vector<std::string>> dependency_patterns_;
    Logger* logger_;
};

}  // namespace taskgraph
