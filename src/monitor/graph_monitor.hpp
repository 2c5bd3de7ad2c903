/**
 * @file graph_monitor.hpp
 * @brief Live execution tracking over a TaskGraph.
 *
 * External execution events (start / complete / fail) are forwarded into
 * node status transitions; the monitor keeps running counters and an event
 * log, and reads health back through GraphAnalyzer. It never touches the
 * graph's adjacency.
 */

#pragma once

#include "analysis/graph_analyzer.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "graph/task_graph.hpp"
#include "telemetry/metrics_collector.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace taskgraph {

enum class NodeEventKind : uint8_t {
    Started,
    Completed,
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(NodeEventKind kind) noexcept {
    switch (kind) {
        case NodeEventKind::Started:   return "started";
        case NodeEventKind::Completed: return "completed";
        case NodeEventKind::Failed:    return "failed";
    }
    return "unknown";
}

struct NodeEvent {
    GraphId graph_id;
    TaskId node_id;
    std::string node_name;
    NodeEventKind kind = NodeEventKind::Started;
    Timestamp timestamp;
    std::optional<double> duration;
    std::optional<std::string> error;
};

struct LiveStats {
    GraphId graph_id;
    size_t total_nodes = 0;
    size_t completed = 0;
    size_t failed = 0;
    size_t running = 0;
    size_t pending = 0;
    double total_duration = 0.0;
    double progress_percent = 0.0;
};

struct MonitorHealthReport {
    GraphId graph_id;
    double health_score = 100.0;
    std::string status = "healthy";
    std::vector<std::string> issues;
    double execution_progress = 0.0;
    size_t nodes_failed = 0;
    Timestamp timestamp;
};

struct MetaMetrics {
    GraphId graph_id;
    std::optional<QualityReport> quality;
    CostSummary costs;
    LiveStats live_stats;
    MonitorHealthReport health;
    double parallelization_index = 0.0;
};

/// Invoked after each recorded node event.
using NodeEventCallback = std::function<void(const NodeEvent&)>;

class GraphMonitor {
public:
    explicit GraphMonitor(TaskGraph& graph,
                          AnalyzerConfig analyzer_config = {},
                          Logger* logger = nullptr,
                          MetricsCollector* metrics = nullptr);

    void set_event_callback(NodeEventCallback callback);

    // ── Node status updates ───────────────────
    // Unknown node ids are logged as warnings and otherwise ignored.
    void on_node_start(const TaskId& node_id);
    void on_node_complete(const TaskId& node_id, std::optional<double> duration = std::nullopt);
    void on_node_fail(const TaskId& node_id, const std::string& error_message);

    /// Sets the status directly, without touching counters or timestamps.
    void update_node_status(const TaskId& node_id, NodeStatus status);

    // ── Live metrics ──────────────────────────
    [[nodiscard]] LiveStats get_live_stats() const;
    [[nodiscard]] double get_progress() const;

    /// Seconds since start_monitoring(), up to stop_monitoring() if called.
    [[nodiscard]] std::optional<double> get_execution_time() const;

    MonitorHealthReport get_health_report();
    MetaMetrics get_meta_metrics();

    // ── Execution control ─────────────────────
    void start_monitoring();
    void stop_monitoring();
    void reset();

    [[nodiscard]] const std::vector<NodeEvent>& events() const noexcept { return events_; }

private:
    void record(NodeEvent event);
    void reset_counters() noexcept;
    void log(LogLevel level, std::string_view message) const;

    TaskGraph& graph_;
    GraphAnalyzer analyzer_;
    Logger* logger_;
    MetricsCollector* metrics_;
    NodeEventCallback callback_;

    std::optional<Timestamp> execution_start_;
    std::optional<Timestamp> execution_end_;
    std::vector<NodeEvent> events_;

    size_t nodes_completed_ = 0;
    size_t nodes_failed_ = 0;
    size_t nodes_running_ = 0;
    double total_duration_ = 0.0;
};

}  // namespace taskgraph
