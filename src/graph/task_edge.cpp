/**
 * @file task_edge.cpp
 * @brief TaskEdge constraint helpers.
 */

#include "graph/task_edge.hpp"

namespace taskgraph {

std::optional<std::string> TaskEdge::constraint(const std::string& key) const {
    if (auto it = constraints.find(key); it != constraints.end()) return it->second;
    return std::nullopt;
}

void TaskEdge::set_constraint(const std::string& key, std::string value) {
    constraints[key] = std::move(value);
}

bool TaskEdge::has_timing_constraint() const {
    return constraints.contains("max_delay") || constraints.contains("min_delay");
}

}  // namespace taskgraph
