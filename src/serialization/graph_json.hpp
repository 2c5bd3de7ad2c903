/**
 * @file graph_json.hpp
 * @brief JSON (de)serialization of task graphs and analysis reports.
 *
 * Node and edge conversions follow nlohmann's ADL convention, so a
 * TaskNode or TaskEdge converts with `nlohmann::json j = node;`. Graphs go
 * through graph_to_json / graph_from_json because reconstruction has to
 * replay edges through TaskGraph to rebuild the adjacency indices.
 */

#pragma once

#include "analysis/graph_analyzer.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/task_edge.hpp"
#include "graph/task_graph.hpp"
#include "graph/task_node.hpp"

#include <nlohmann/json.hpp>

namespace taskgraph {

void to_json(nlohmann::json& j, const CostModel& cost);
void from_json(const nlohmann::json& j, CostModel& cost);

void to_json(nlohmann::json& j, const TaskEdge& edge);
void from_json(const nlohmann::json& j, TaskEdge& edge);

/// Includes the derived `dependencies` / `dependents` lists; from_json ignores them.
void to_json(nlohmann::json& j, const TaskNode& node);
void from_json(const nlohmann::json& j, TaskNode& node);

[[nodiscard]] nlohmann::json graph_to_json(const TaskGraph& graph);

/**
 * @brief Rebuild a graph from graph_to_json output.
 *
 * Edges are restored without a cycle check, exactly as they were stored.
 * Malformed documents yield ErrorCode::Parse; an edge naming a node that is
 * not in the document yields ErrorCode::NotFound.
 */
[[nodiscard]] Result<TaskGraph> graph_from_json(const nlohmann::json& j,
                                                CyclePolicy policy = CyclePolicy::SignificantEdges);

/// Parse text first, then graph_from_json.
[[nodiscard]] Result<TaskGraph> graph_from_string(std::string_view text,
                                                  CyclePolicy policy = CyclePolicy::SignificantEdges);

[[nodiscard]] nlohmann::json report_to_json(const AnalysisReport& report);

}  // namespace taskgraph
