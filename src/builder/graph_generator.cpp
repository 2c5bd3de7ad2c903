/**
 * @file graph_generator.cpp
 * @brief Synthetic topology generators.
 */

#include "builder/graph_generator.hpp"

#include <format>
#include <stdexcept>

namespace taskgraph {

namespace {

void add_or_throw(TaskGraph& graph, TaskNode node) {
    if (auto added = graph.add_node(std::move(node)); !added) {
        throw std::logic_error("generator: " + added.error().message);
    }
}

// Generated topologies are acyclic by construction; a rejection is a bug here.
void connect(TaskGraph& graph, const TaskId& from, const TaskId& to) {
    if (auto edge = graph.add_edge(TaskEdge{.source_id = from, .target_id = to}); !edge) {
        throw std::logic_error("generator: " + edge.error().message);
    }
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Linear Chain: T0 → T1 → T2 → ... → Tn-1
// ─────────────────────────────────────────────

TaskGraph GraphGenerator::linear_chain(size_t num_tasks, const CostModel& base_cost) {
    TaskGraph graph("linear_chain");

    TaskId prev_id;
    for (size_t i = 0; i < num_tasks; ++i) {
        auto id = std::format("chain_{}", i);
        add_or_throw(graph, TaskNode(id, std::format("Chain Task {}", i), "generic", 5, base_cost));
        if (i > 0) {
            connect(graph, prev_id, id);
        }
        prev_id = id;
    }

    return graph;
}

// ─────────────────────────────────────────────
// Fan-out / Fan-in:
//          fan_src
//       /    |    \.
//     b_0   b_1   b_2 ... b_{width-1}
//       \    |    /
//          fan_sink
// ─────────────────────────────────────────────

TaskGraph GraphGenerator::fan_out_fan_in(size_t width, const CostModel& base_cost) {
    TaskGraph graph("fan_out_fan_in");

    add_or_throw(graph, TaskNode("fan_src", "Fan-Out Source", "generic", 5, base_cost));
    add_or_throw(graph, TaskNode("fan_sink", "Fan-In Sink", "aggregation", 5, base_cost));

    for (size_t i = 0; i < width; ++i) {
        auto branch_id = std::format("fan_branch_{}", i);
        add_or_throw(graph, TaskNode(branch_id, std::format("Branch {}", i), "generic", 5, base_cost));
        connect(graph, "fan_src", branch_id);
        connect(graph, branch_id, "fan_sink");
    }

    return graph;
}

// ─────────────────────────────────────────────
// Diamond: repeated fan-out/fan-in at each depth level.
//
//   hub_0 → {diamond_0_*} → merge_0 → hub_1 → {diamond_1_*} → merge_1 ...
// ─────────────────────────────────────────────

TaskGraph GraphGenerator::diamond(size_t depth, size_t width, const CostModel& base_cost) {
    TaskGraph graph("diamond");

    TaskId prev_merge;
    for (size_t d = 0; d < depth; ++d) {
        auto hub_id = std::format("hub_{}", d);
        add_or_throw(graph, TaskNode(hub_id, std::format("Hub {}", d), "generic", 5, base_cost));
        if (d > 0) {
            connect(graph, prev_merge, hub_id);
        }

        auto merge_id = std::format("merge_{}", d);
        add_or_throw(graph, TaskNode(merge_id, std::format("Merge {}", d), "aggregation", 5, base_cost));

        for (size_t w = 0; w < width; ++w) {
            auto branch_id = std::format("diamond_{}_{}", d, w);
            add_or_throw(graph, TaskNode(branch_id, std::format("Diamond D{} B{}", d, w),
                                         "generic", 5, base_cost));
            connect(graph, hub_id, branch_id);
            connect(graph, branch_id, merge_id);
        }

        prev_merge = merge_id;
    }

    return graph;
}

// ─────────────────────────────────────────────
// Random DAG:
// Erdős–Rényi-style edges, only from lower to higher index.
// ─────────────────────────────────────────────

TaskGraph GraphGenerator::random_dag(size_t num_tasks,
                                     double edge_probability,
                                     const CostModel& min_cost,
                                     const CostModel& max_cost,
                                     std::mt19937& rng) {
    TaskGraph graph("random_dag");

    auto rand_real = [&](double lo, double hi) -> double {
        if (hi <= lo) return lo;
        std::uniform_real_distribution<double> dist(lo, hi);
        return dist(rng);
    };

    auto rand_uint64 = [&](uint64_t lo, uint64_t hi) -> uint64_t {
        if (hi <= lo) return lo;
        std::uniform_int_distribution<uint64_t> dist(lo, hi);
        return dist(rng);
    };

    std::vector<TaskId> task_ids;
    task_ids.reserve(num_tasks);

    for (size_t i = 0; i < num_tasks; ++i) {
        CostModel cost{
            .duration = rand_real(min_cost.duration, max_cost.duration),
            .monetary_cost = rand_real(min_cost.monetary_cost, max_cost.monetary_cost),
            .cpu_units = rand_real(min_cost.cpu_units, max_cost.cpu_units),
            .memory_mb = rand_real(min_cost.memory_mb, max_cost.memory_mb),
            .io_operations = rand_uint64(min_cost.io_operations, max_cost.io_operations),
            .network_bandwidth = rand_real(min_cost.network_bandwidth, max_cost.network_bandwidth)
        };

        auto id = std::format("rand_{}", i);
        add_or_throw(graph, TaskNode(id, std::format("Random Task {}", i), "generic", 5, cost));
        task_ids.push_back(std::move(id));
    }

    std::uniform_real_distribution<double> edge_dist(0.0, 1.0);
    for (size_t i = 0; i < num_tasks; ++i) {
        for (size_t j = i + 1; j < num_tasks; ++j) {
            if (edge_dist(rng) < edge_probability) {
                connect(graph, task_ids[i], task_ids[j]);
            }
        }
    }

    return graph;
}

}  // namespace taskgraph
