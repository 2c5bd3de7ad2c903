/**
 * @file graph_generator.hpp
 * @brief Synthetic graph topologies for tests, benchmarks and demos.
 */

#pragma once

#include "graph/task_graph.hpp"

#include <random>

namespace taskgraph {

/**
 * @brief Factory for synthetic task graphs with various topologies.
 *
 * Every generator adds edges only from earlier to later nodes, so the
 * result is always acyclic.
 */
class GraphGenerator {
public:
    /// Linear chain: T0 → T1 → ... → Tn-1
    static TaskGraph linear_chain(size_t num_tasks, const CostModel& base_cost);

    /// Fan-out / fan-in: src → {branch_0 .. branch_{w-1}} → sink
    static TaskGraph fan_out_fan_in(size_t width, const CostModel& base_cost);

    /// Repeated fan-out/fan-in, one diamond per depth level
    static TaskGraph diamond(size_t depth, size_t width, const CostModel& base_cost);

    /// Random DAG; each forward pair (i < j) is connected with the given probability
    static TaskGraph random_dag(size_t num_tasks,
                                double edge_probability,
                                const CostModel& min_cost,
                                const CostModel& max_cost,
                                std::mt19937& rng);
};

}  // namespace taskgraph
