/**
 * @file graph_analyzer.hpp
 * @brief Analysis algorithms layered on a TaskGraph.
 *
 * Cycle enumeration, bottleneck and criticality scoring, PageRank-style
 * influence, parallel-stage grouping, cost aggregation, path redundancy and
 * a composite health score. Results that are expensive to recompute are
 * memoized and tagged with the graph's mutation version, so a cache entry
 * is only ever served for the graph state it was computed from.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "graph/task_graph.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace taskgraph {

using Cycle = std::vector<TaskId>;

struct Bottleneck {
    TaskId node_id;
    std::string node_name;
    size_t fan_in = 0;
    size_t fan_out = 0;
    size_t score = 0;
    std::string type;               ///< "convergence" or "divergence"
};

struct HealthReport {
    double score = 100.0;
    std::string status = "healthy"; ///< "healthy", "degraded", "unhealthy"
    std::vector<std::string> issues;
    double parallelization_index = 0.0;
    size_t cycle_count = 0;
    size_t bottleneck_count = 0;
    size_t isolated_count = 0;
};

struct QualityReport {
    size_t node_count = 0;
    size_t edge_count = 0;
    double avg_fan_in = 0.0;
    double avg_fan_out = 0.0;
    size_t max_fan_in = 0;
    size_t max_fan_out = 0;
    size_t root_count = 0;
    size_t leaf_count = 0;
    bool is_balanced = true;
    double density = 0.0;
};

struct CostSummary {
    double total_duration_sequential = 0.0;
    double critical_path_duration = 0.0;
    double total_cost = 0.0;
    double total_cpu_units = 0.0;
    double total_memory_mb = 0.0;
    uint64_t total_io_operations = 0;
    double efficiency_ratio = 0.0;  ///< critical path / sequential duration
};

struct ResourceHotspot {
    TaskId node_id;
    std::string node_name;
    double duration = 0.0;
    double cost = 0.0;
    double cpu_units = 0.0;
    double memory_mb = 0.0;
    double total_cost = 0.0;
};

/**
 * @brief Everything the analyzer knows about a graph, in one value.
 */
struct AnalysisReport {
    GraphId graph_id;
    GraphStats stats;
    HealthReport health;
    std::optional<QualityReport> quality;   ///< Empty for an empty graph
    CostSummary costs;
    std::vector<Bottleneck> bottlenecks;
    std::vector<TaskId> critical_nodes;
    std::vector<std::pair<TaskId, double>> influential_nodes;
    std::vector<ResourceHotspot> resource_hotspots;
    std::map<int, std::vector<TaskId>> parallel_stages;
    double parallelization_index = 0.0;
    double redundancy_score = 0.0;
    std::vector<Cycle> cycles;
};

class GraphAnalyzer {
public:
    explicit GraphAnalyzer(TaskGraph& graph,
                           AnalyzerConfig config = {},
                           Logger* logger = nullptr);

    // ── Cycles ────────────────────────────────
    const std::vector<Cycle>& find_all_cycles();
    std::set<TaskId> find_cycle_nodes();

    // ── Bottlenecks & Criticality ─────────────
    [[nodiscard]] std::vector<Bottleneck> find_bottlenecks(size_t threshold) const;
    [[nodiscard]] std::vector<Bottleneck> find_bottlenecks() const;
    std::vector<TaskId> find_critical_nodes();
    std::map<TaskId, double> calculate_node_criticality();

    // ── Influence ─────────────────────────────
    const std::map<TaskId, double>& calculate_influence_scores();
    std::vector<std::pair<TaskId, double>> find_most_influential_nodes(size_t top_n);

    // ── Parallelization ───────────────────────
    double calculate_parallelization_index();
    std::map<int, std::vector<TaskId>> find_parallel_stages();
    std::map<TaskId, double> calculate_parallelization_factor();

    // ── Health & Quality ──────────────────────
    HealthReport calculate_graph_health();
    [[nodiscard]] std::optional<QualityReport> check_graph_quality() const;

    // ── Resources ─────────────────────────────
    CostSummary calculate_total_cost();
    [[nodiscard]] std::vector<ResourceHotspot> find_resource_hotspots(size_t top_n) const;

    // ── Redundancy ────────────────────────────
    /**
     * @brief Ratio of root-to-leaf paths to 2 × |roots| × |leaves|, capped at 1.
     *
     * Acyclic graphs are counted exactly by dynamic programming over the
     * topological order. If the graph cannot be ordered (a cycle made of
     * non-significant edges), simple paths are enumerated exhaustively,
     * which is exponential in the worst case: the enumeration only runs
     * for graphs of at most `redundancy_max_nodes` nodes and stops after
     * `redundancy_max_paths` partial paths.
     */
    double calculate_redundancy_score();

    // ── Aggregate ─────────────────────────────
    AnalysisReport get_analysis_report();

    void clear_cache() noexcept;

    [[nodiscard]] const AnalyzerConfig& config() const noexcept { return config_; }

private:
    template <typename T>
    struct Memo {
        uint64_t version;
        T value;
    };

    template <typename T>
    [[nodiscard]] bool is_fresh(const std::optional<Memo<T>>& memo) const noexcept {
        return memo && memo->version == graph_.version();
    }

    double count_paths_exhaustive(const TaskId& root, uint64_t& budget) const;
    void log(LogLevel level, std::string_view message) const;

    TaskGraph& graph_;
    AnalyzerConfig config_;
    Logger* logger_;

    std::optional<Memo<std::vector<Cycle>>> cycles_cache_;
    std::optional<Memo<std::map<TaskId, double>>> influence_cache_;
};

}  // namespace taskgraph
