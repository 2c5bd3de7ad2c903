/**
 * @file graph_json.cpp
 * @brief nlohmann/json conversions for the graph model.
 */

#include "serialization/graph_json.hpp"

#include <format>
#include <stdexcept>

namespace taskgraph {

namespace {

template <typename T>
nlohmann::json optional_to_json(const std::optional<T>& value) {
    if (value.has_value()) return nlohmann::json(value.value());
    return nullptr;
}

nlohmann::json timestamp_to_json(const std::optional<Timestamp>& ts) {
    if (ts.has_value()) return format_timestamp(ts.value());
    return nullptr;
}

std::optional<Timestamp> timestamp_from_json(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    auto text = j.at(key).get<std::string>();
    auto ts = parse_timestamp(text);
    if (!ts) {
        throw std::invalid_argument(std::format("Invalid timestamp '{}' in field {}", text, key));
    }
    return ts;
}

template <typename T>
std::optional<T> optional_from_json(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return j.at(key).get<T>();
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// CostModel
// ─────────────────────────────────────────────

void to_json(nlohmann::json& j, const CostModel& cost) {
    j["duration"] = cost.duration;
    j["monetary_cost"] = cost.monetary_cost;
    j["cpu_units"] = cost.cpu_units;
    j["memory_mb"] = cost.memory_mb;
    j["io_operations"] = cost.io_operations;
    j["network_bandwidth"] = cost.network_bandwidth;
}

void from_json(const nlohmann::json& j, CostModel& cost) {
    CostModel defaults;
    cost.duration = j.value("duration", defaults.duration);
    cost.monetary_cost = j.value("monetary_cost", defaults.monetary_cost);
    cost.cpu_units = j.value("cpu_units", defaults.cpu_units);
    cost.memory_mb = j.value("memory_mb", defaults.memory_mb);
    cost.io_operations = j.value("io_operations", defaults.io_operations);
    cost.network_bandwidth = j.value("network_bandwidth", defaults.network_bandwidth);
}

// ─────────────────────────────────────────────
// TaskEdge
// ─────────────────────────────────────────────

void to_json(nlohmann::json& j, const TaskEdge& edge) {
    j["source_id"] = edge.source_id;
    j["target_id"] = edge.target_id;
    j["edge_type"] = to_string(edge.edge_type);
    j["weight"] = edge.weight;
    j["constraints"] = edge.constraints;
    j["metadata"] = edge.metadata;
}

void from_json(const nlohmann::json& j, TaskEdge& edge) {
    edge.source_id = j.at("source_id").get<TaskId>();
    edge.target_id = j.at("target_id").get<TaskId>();

    auto type_text = j.value("edge_type", std::string{"dependency"});
    auto type = parse_edge_type(type_text);
    if (!type) {
        throw std::invalid_argument("Unknown edge type: " + type_text);
    }
    edge.edge_type = *type;
    edge.weight = j.value("weight", 1.0);
    edge.constraints = j.value("constraints", Metadata{});
    edge.metadata = j.value("metadata", Metadata{});
}

// ─────────────────────────────────────────────
// TaskNode
// ─────────────────────────────────────────────

void to_json(nlohmann::json& j, const TaskNode& node) {
    j["id"] = node.id;
    j["name"] = node.name;
    j["type"] = node.node_type;
    j["priority"] = node.priority;
    j["status"] = to_string(node.status);
    j["cost_model"] = node.cost_model;
    j["metadata"] = node.metadata;
    j["dependencies"] = node.dependencies();
    j["dependents"] = node.dependents();
    j["level"] = optional_to_json(node.level);
    j["on_critical_path"] = node.on_critical_path;
    j["influence_score"] = node.influence_score;
    j["parallelization_factor"] = node.parallelization_factor;
    j["start_time"] = timestamp_to_json(node.start_time);
    j["end_time"] = timestamp_to_json(node.end_time);
    j["actual_duration"] = optional_to_json(node.actual_duration);
    j["error_message"] = optional_to_json(node.error_message);
}

void from_json(const nlohmann::json& j, TaskNode& node) {
    node.id = j.at("id").get<TaskId>();
    node.name = j.value("name", node.id);
    node.node_type = j.value("type", std::string{"generic"});
    node.priority = j.value("priority", 5);

    auto status_text = j.value("status", std::string{"pending"});
    auto status = parse_node_status(status_text);
    if (!status) {
        throw std::invalid_argument("Unknown node status: " + status_text);
    }
    node.status = *status;

    node.cost_model = j.contains("cost_model") ? j.at("cost_model").get<CostModel>() : CostModel{};
    node.metadata = j.value("metadata", Metadata{});
    node.level = optional_from_json<int>(j, "level");
    node.on_critical_path = j.value("on_critical_path", false);
    node.influence_score = j.value("influence_score", 0.0);
    node.parallelization_factor = j.value("parallelization_factor", 1.0);
    node.start_time = timestamp_from_json(j, "start_time");
    node.end_time = timestamp_from_json(j, "end_time");
    node.actual_duration = optional_from_json<double>(j, "actual_duration");
    node.error_message = optional_from_json<std::string>(j, "error_message");
}

// ─────────────────────────────────────────────
// TaskGraph
// ─────────────────────────────────────────────

nlohmann::json graph_to_json(const TaskGraph& graph) {
    nlohmann::json j;
    j["graph_id"] = graph.id();
    j["metadata"] = graph.metadata();

    auto nodes = nlohmann::json::object();
    for (const auto& [id, node] : graph.nodes()) {
        nodes[id] = node;
    }
    j["nodes"] = std::move(nodes);

    auto edges = nlohmann::json::array();
    for (const auto& edge : graph.edges()) {
        edges.push_back(edge);
    }
    j["edges"] = std::move(edges);

    j["node_count"] = graph.node_count();
    j["edge_count"] = graph.edge_count();
    return j;
}

Result<TaskGraph> graph_from_json(const nlohmann::json& j, CyclePolicy policy) {
    if (!j.is_object()) {
        return make_error<TaskGraph>(ErrorCode::Parse, "Graph document must be a JSON object");
    }

    try {
        TaskGraph graph(j.value("graph_id", std::string{"default"}),
                        j.value("metadata", Metadata{}),
                        policy);

        if (j.contains("nodes")) {
            const auto& nodes = j.at("nodes");
            if (!nodes.is_object()) {
                return make_error<TaskGraph>(ErrorCode::Parse, "'nodes' must be an object keyed by id");
            }
            for (auto it = nodes.begin(); it != nodes.end(); ++it) {
                const std::string& key = it.key();
                auto node = it.value().get<TaskNode>();
                if (node.id != key) {
                    return make_error<TaskGraph>(ErrorCode::Parse, std::format(
                        "Node key '{}' does not match node id '{}'", key, node.id));
                }
                if (auto added = graph.add_node(std::move(node)); !added) {
                    return added.error();
                }
            }
        }

        if (j.contains("edges")) {
            const auto& edges = j.at("edges");
            if (!edges.is_array()) {
                return make_error<TaskGraph>(ErrorCode::Parse, "'edges' must be an array");
            }
            for (const auto& value : edges) {
                if (auto restored = graph.restore_edge(value.get<TaskEdge>()); !restored) {
                    return restored.error();
                }
            }
        }

        return graph;
    } catch (const nlohmann::json::exception& e) {
        return make_error<TaskGraph>(ErrorCode::Parse, std::format("Malformed graph JSON: {}", e.what()));
    } catch (const std::invalid_argument& e) {
        return make_error<TaskGraph>(ErrorCode::Parse, e.what());
    }
}

Result<TaskGraph> graph_from_string(std::string_view text, CyclePolicy policy) {
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return make_error<TaskGraph>(ErrorCode::Parse, "Graph document is not valid JSON");
    }
    return graph_from_json(parsed, policy);
}

// ─────────────────────────────────────────────
// AnalysisReport
// ─────────────────────────────────────────────

nlohmann::json report_to_json(const AnalysisReport& report) {
    nlohmann::json j;
    j["graph_id"] = report.graph_id;

    j["stats"] = {
        {"node_count", report.stats.node_count},
        {"edge_count", report.stats.edge_count},
        {"root_count", report.stats.root_count},
        {"leaf_count", report.stats.leaf_count},
        {"is_acyclic", report.stats.is_acyclic}
    };

    j["health"] = {
        {"score", report.health.score},
        {"status", report.health.status},
        {"issues", report.health.issues},
        {"parallelization_index", report.health.parallelization_index},
        {"cycle_count", report.health.cycle_count},
        {"bottleneck_count", report.health.bottleneck_count},
        {"isolated_count", report.health.isolated_count}
    };

    if (report.quality) {
        const auto& q = *report.quality;
        j["quality"] = {
            {"node_count", q.node_count},
            {"edge_count", q.edge_count},
            {"avg_fan_in", q.avg_fan_in},
            {"avg_fan_out", q.avg_fan_out},
            {"max_fan_in", q.max_fan_in},
            {"max_fan_out", q.max_fan_out},
            {"root_count", q.root_count},
            {"leaf_count", q.leaf_count},
            {"is_balanced", q.is_balanced},
            {"density", q.density}
        };
    } else {
        j["quality"] = nullptr;
    }

    j["costs"] = {
        {"total_duration_sequential", report.costs.total_duration_sequential},
        {"critical_path_duration", report.costs.critical_path_duration},
        {"total_cost", report.costs.total_cost},
        {"total_cpu_units", report.costs.total_cpu_units},
        {"total_memory_mb", report.costs.total_memory_mb},
        {"total_io_operations", report.costs.total_io_operations},
        {"efficiency_ratio", report.costs.efficiency_ratio}
    };

    auto bottlenecks = nlohmann::json::array();
    for (const auto& b : report.bottlenecks) {
        bottlenecks.push_back({
            {"node_id", b.node_id},
            {"node_name", b.node_name},
            {"fan_in", b.fan_in},
            {"fan_out", b.fan_out},
            {"score", b.score},
            {"type", b.type}
        });
    }
    j["bottlenecks"] = std::move(bottlenecks);

    j["critical_nodes"] = report.critical_nodes;

    auto influential = nlohmann::json::array();
    for (const auto& [id, score] : report.influential_nodes) {
        influential.push_back({{"node_id", id}, {"score", score}});
    }
    j["influential_nodes"] = std::move(influential);

    auto hotspots = nlohmann::json::array();
    for (const auto& h : report.resource_hotspots) {
        hotspots.push_back({
            {"node_id", h.node_id},
            {"node_name", h.node_name},
            {"duration", h.duration},
            {"cost", h.cost},
            {"cpu_units", h.cpu_units},
            {"memory_mb", h.memory_mb},
            {"total_cost", h.total_cost}
        });
    }
    j["resource_hotspots"] = std::move(hotspots);

    // JSON object keys must be strings.
    auto stages = nlohmann::json::object();
    for (const auto& [level, ids] : report.parallel_stages) {
        stages[std::to_string(level)] = ids;
    }
    j["parallel_stages"] = std::move(stages);

    j["parallelization_index"] = report.parallelization_index;
    j["redundancy_score"] = report.redundancy_score;
    j["cycles"] = report.cycles;
    return j;
}

}  // namespace taskgraph
