/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <sstream>

namespace taskgraph {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_node_event(const TaskId& id, NodeStatus status,
                                         std::optional<double> duration_s) {
    std::ostringstream oss;
    oss << R"({"event":"node_status_change")"
        << R"(,"node":")" << json_escape(id) << "\""
        << R"(,"status":")" << to_string(status) << "\"";
    if (duration_s) {
        oss << R"(,"duration_s":)" << *duration_s;
    }
    oss << "}";
    emit(oss.str());
}

void MetricsCollector::record_graph_stats(const GraphStats& stats) {
    std::ostringstream oss;
    oss << R"({"event":"graph_stats")"
        << R"(,"graph":")" << json_escape(stats.graph_id) << "\""
        << R"(,"nodes":)" << stats.node_count
        << R"(,"edges":)" << stats.edge_count
        << R"(,"roots":)" << stats.root_count
        << R"(,"leaves":)" << stats.leaf_count
        << R"(,"acyclic":)" << (stats.is_acyclic ? "true" : "false")
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_health(const GraphId& graph_id, const HealthReport& health) {
    std::ostringstream oss;
    oss << R"({"event":"graph_health")"
        << R"(,"graph":")" << json_escape(graph_id) << "\""
        << R"(,"score":)" << health.score
        << R"(,"status":")" << health.status << "\""
        << R"(,"issues":[)";
    for (size_t i = 0; i < health.issues.size(); ++i) {
        if (i > 0) oss << ',';
        oss << '"' << json_escape(health.issues[i]) << '"';
    }
    oss << "]}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << json_escape(event) << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace taskgraph
