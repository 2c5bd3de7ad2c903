/**
 * @file task_node.cpp
 * @brief TaskNode status transitions and metadata access.
 */

#include "graph/task_node.hpp"

#include <chrono>

namespace taskgraph {

namespace {

double seconds_between(Timestamp start, Timestamp end) {
    return std::chrono::duration<double>(end - start).count();
}

}  // anonymous namespace

TaskNode::TaskNode(TaskId node_id, std::string node_name,
                   std::string type, int node_priority,
                   CostModel cost, Metadata meta)
    : id(std::move(node_id))
    , name(std::move(node_name))
    , node_type(std::move(type))
    , priority(node_priority)
    , cost_model(cost)
    , metadata(std::move(meta)) {}

// ─────────────────────────────────────────────
// Status Transitions
// ─────────────────────────────────────────────

void TaskNode::mark_ready() noexcept {
    status = NodeStatus::Ready;
}

void TaskNode::mark_running() {
    status = NodeStatus::Running;
    start_time = std::chrono::system_clock::now();
}

void TaskNode::mark_completed(std::optional<double> duration) {
    status = NodeStatus::Completed;
    end_time = std::chrono::system_clock::now();
    if (duration) {
        actual_duration = *duration;
    } else if (start_time) {
        actual_duration = seconds_between(*start_time, *end_time);
    }
}

void TaskNode::mark_failed(std::string message) {
    status = NodeStatus::Failed;
    end_time = std::chrono::system_clock::now();
    error_message = std::move(message);
    if (start_time) {
        actual_duration = seconds_between(*start_time, *end_time);
    }
}

void TaskNode::mark_cancelled() noexcept {
    status = NodeStatus::Cancelled;
}

void TaskNode::mark_blocked() noexcept {
    status = NodeStatus::Blocked;
}

bool TaskNode::is_terminal() const noexcept {
    return status == NodeStatus::Completed
        || status == NodeStatus::Failed
        || status == NodeStatus::Cancelled;
}

bool TaskNode::can_execute() const noexcept {
    return status == NodeStatus::Ready;
}

// ─────────────────────────────────────────────
// Metadata
// ─────────────────────────────────────────────

std::optional<std::string> TaskNode::get_metadata(const std::string& key) const {
    if (auto it = metadata.find(key); it != metadata.end()) return it->second;
    return std::nullopt;
}

void TaskNode::set_metadata(const std::string& key, std::string value) {
    metadata[key] = std::move(value);
}

void TaskNode::update_metadata(const Metadata& updates) {
    for (const auto& [key, value] : updates) {
        metadata[key] = value;
    }
}

}  // namespace taskgraph
