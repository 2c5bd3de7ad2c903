/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 */

#pragma once

#include "analysis/graph_analyzer.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "graph/task_graph.hpp"

#include <memory>
#include <mutex>
#include <optional>

namespace taskgraph {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_node_event(const TaskId& id, NodeStatus status,
                           std::optional<double> duration_s = std::nullopt);
    void record_graph_stats(const GraphStats& stats);
    void record_health(const GraphId& graph_id, const HealthReport& health);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace taskgraph
