/**
 * @file graph_monitor.cpp
 * @brief GraphMonitor implementation.
 */

#include "monitor/graph_monitor.hpp"

#include <chrono>
#include <format>

namespace taskgraph {

GraphMonitor::GraphMonitor(TaskGraph& graph,
                           AnalyzerConfig analyzer_config,
                           Logger* logger,
                           MetricsCollector* metrics)
    : graph_(graph)
    , analyzer_(graph, analyzer_config, logger)
    , logger_(logger)
    , metrics_(metrics) {}

void GraphMonitor::set_event_callback(NodeEventCallback callback) {
    callback_ = std::move(callback);
}

void GraphMonitor::log(LogLevel level, std::string_view message) const {
    if (logger_ != nullptr) {
        logger_->log(level, message);
    }
}

void GraphMonitor::record(NodeEvent event) {
    events_.push_back(std::move(event));
    const auto& recorded = events_.back();

    if (metrics_ != nullptr) {
        if (auto* node = graph_.find_node(recorded.node_id)) {
            metrics_->record_node_event(recorded.node_id, node->status, recorded.duration);
        }
    }
    if (callback_) {
        callback_(recorded);
    }
}

// ─────────────────────────────────────────────
// Node Status Updates
// ─────────────────────────────────────────────

void GraphMonitor::on_node_start(const TaskId& node_id) {
    auto* node = graph_.find_node(node_id);
    if (node == nullptr) {
        log(LogLevel::Warn, std::format("Node {} not found in graph", node_id));
        return;
    }

    node->mark_running();
    ++nodes_running_;

    record(NodeEvent{
        .graph_id = graph_.id(),
        .node_id = node_id,
        .node_name = node->name,
        .kind = NodeEventKind::Started,
        .timestamp = std::chrono::system_clock::now(),
        .duration = std::nullopt,
        .error = std::nullopt
    });
    log(LogLevel::Info, std::format("Node {} started", node_id));
}

void GraphMonitor::on_node_complete(const TaskId& node_id, std::optional<double> duration) {
    auto* node = graph_.find_node(node_id);
    if (node == nullptr) {
        log(LogLevel::Warn, std::format("Node {} not found in graph", node_id));
        return;
    }

    node->mark_completed(duration);
    ++nodes_completed_;
    if (nodes_running_ > 0) --nodes_running_;
    if (duration) {
        total_duration_ += *duration;
    }

    record(NodeEvent{
        .graph_id = graph_.id(),
        .node_id = node_id,
        .node_name = node->name,
        .kind = NodeEventKind::Completed,
        .timestamp = std::chrono::system_clock::now(),
        .duration = duration,
        .error = std::nullopt
    });
    log(LogLevel::Info, duration
        ? std::format("Node {} completed in {:.3f}s", node_id, *duration)
        : std::format("Node {} completed", node_id));
}

void GraphMonitor::on_node_fail(const TaskId& node_id, const std::string& error_message) {
    auto* node = graph_.find_node(node_id);
    if (node == nullptr) {
        log(LogLevel::Warn, std::format("Node {} not found in graph", node_id));
        return;
    }

    node->mark_failed(error_message);
    ++nodes_failed_;
    if (nodes_running_ > 0) --nodes_running_;

    record(NodeEvent{
        .graph_id = graph_.id(),
        .node_id = node_id,
        .node_name = node->name,
        .kind = NodeEventKind::Failed,
        .timestamp = std::chrono::system_clock::now(),
        .duration = std::nullopt,
        .error = error_message
    });
    log(LogLevel::Error, std::format("Node {} failed: {}", node_id, error_message));
}

void GraphMonitor::update_node_status(const TaskId& node_id, NodeStatus status) {
    auto* node = graph_.find_node(node_id);
    if (node == nullptr) {
        log(LogLevel::Warn, std::format("Node {} not found in graph", node_id));
        return;
    }

    auto old_status = node->status;
    node->status = status;
    log(LogLevel::Info, std::format("Node {} status: {} -> {}",
                                    node_id, to_string(old_status), to_string(status)));
}

// ─────────────────────────────────────────────
// Live Metrics
// ─────────────────────────────────────────────

LiveStats GraphMonitor::get_live_stats() const {
    LiveStats stats;
    stats.graph_id = graph_.id();
    stats.total_nodes = graph_.node_count();
    stats.completed = nodes_completed_;
    stats.failed = nodes_failed_;
    stats.running = nodes_running_;

    size_t accounted = nodes_completed_ + nodes_failed_ + nodes_running_;
    stats.pending = stats.total_nodes > accounted ? stats.total_nodes - accounted : 0;
    stats.total_duration = total_duration_;
    stats.progress_percent = get_progress();
    return stats;
}

double GraphMonitor::get_progress() const {
    auto total = graph_.node_count();
    if (total == 0) return 0.0;
    return static_cast<double>(nodes_completed_) / static_cast<double>(total) * 100.0;
}

std::optional<double> GraphMonitor::get_execution_time() const {
    if (!execution_start_) return std::nullopt;
    auto end = execution_end_.value_or(std::chrono::system_clock::now());
    return std::chrono::duration<double>(end - *execution_start_).count();
}

MonitorHealthReport GraphMonitor::get_health_report() {
    auto health = analyzer_.calculate_graph_health();
    auto live = get_live_stats();

    if (metrics_ != nullptr) {
        metrics_->record_health(graph_.id(), health);
    }

    return MonitorHealthReport{
        .graph_id = graph_.id(),
        .health_score = health.score,
        .status = health.status,
        .issues = health.issues,
        .execution_progress = live.progress_percent,
        .nodes_failed = live.failed,
        .timestamp = std::chrono::system_clock::now()
    };
}

MetaMetrics GraphMonitor::get_meta_metrics() {
    MetaMetrics meta;
    meta.graph_id = graph_.id();
    meta.quality = analyzer_.check_graph_quality();
    meta.costs = analyzer_.calculate_total_cost();
    meta.live_stats = get_live_stats();
    meta.health = get_health_report();
    meta.parallelization_index = analyzer_.calculate_parallelization_index();
    return meta;
}

// ─────────────────────────────────────────────
// Execution Control
// ─────────────────────────────────────────────

void GraphMonitor::reset_counters() noexcept {
    nodes_completed_ = 0;
    nodes_failed_ = 0;
    nodes_running_ = 0;
    total_duration_ = 0.0;
}

void GraphMonitor::start_monitoring() {
    execution_start_ = std::chrono::system_clock::now();
    execution_end_.reset();
    reset_counters();
    events_.clear();
    log(LogLevel::Info, "Started monitoring graph " + graph_.id());
}

void GraphMonitor::stop_monitoring() {
    execution_end_ = std::chrono::system_clock::now();
    log(LogLevel::Info, "Stopped monitoring graph " + graph_.id());
}

void GraphMonitor::reset() {
    execution_start_.reset();
    execution_end_.reset();
    events_.clear();
    reset_counters();
    log(LogLevel::Info, "Monitor state reset");
}

}  // namespace taskgraph
