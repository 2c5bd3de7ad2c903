/**
 * @file graph_analyzer.cpp
 * @brief GraphAnalyzer implementation.
 *
 * Scores:
 *   criticality(v) = 0.4 · onCriticalPath(v)
 *                  + 0.3 · dependents(v) / max dependents
 *                  + 0.3 · total_cost(v) / max total_cost
 *
 *   influence: rank_{k+1}(v) = (1 − d) / n + d · Σ_{u → v} rank_k(u) / outdeg(u)
 *
 *   health = 100 − 50 · [cycles] − min(10 · bottlenecks, 30)
 *                − 10 · [parallelization < 0.3] − min(5 · isolated, 20)
 */

#include "analysis/graph_analyzer.hpp"

#include <algorithm>
#include <format>
#include <stack>
#include <unordered_map>
#include <unordered_set>

namespace taskgraph {

namespace {

constexpr double kCriticalPathWeight = 0.4;
constexpr double kDependentsWeight = 0.3;
constexpr double kCostWeight = 0.3;

constexpr double kCyclePenalty = 50.0;
constexpr double kBottleneckPenalty = 10.0;
constexpr double kBottleneckPenaltyCap = 30.0;
constexpr double kLowParallelismPenalty = 10.0;
constexpr double kLowParallelismThreshold = 0.3;
constexpr double kIsolatedPenalty = 5.0;
constexpr double kIsolatedPenaltyCap = 20.0;

constexpr double kHealthyScore = 80.0;
constexpr double kDegradedScore = 50.0;

}  // anonymous namespace

GraphAnalyzer::GraphAnalyzer(TaskGraph& graph, AnalyzerConfig config, Logger* logger)
    : graph_(graph), config_(config), logger_(logger) {}

void GraphAnalyzer::log(LogLevel level, std::string_view message) const {
    if (logger_ != nullptr) {
        logger_->log(level, message);
    }
}

// ─────────────────────────────────────────────
// Cycle Analysis
// ─────────────────────────────────────────────

const std::vector<Cycle>& GraphAnalyzer::find_all_cycles() {
    if (is_fresh(cycles_cache_)) {
        return cycles_cache_->value;
    }

    std::vector<Cycle> cycles;
    std::unordered_set<TaskId> visited;
    std::vector<const TaskId*> path;                      // ordered recursion stack
    std::unordered_map<TaskId, size_t> path_position;     // node -> index in path

    struct Frame {
        const TaskId* node;
        std::set<TaskId>::const_iterator next;
        std::set<TaskId>::const_iterator end;
    };

    auto enter = [&](std::stack<Frame>& dfs_stack, const TaskId& id) {
        visited.insert(id);
        path_position[id] = path.size();
        path.push_back(&id);
        const auto& out = graph_.successors(id);
        dfs_stack.push({&id, out.begin(), out.end()});
    };

    for (const auto& [start_id, _] : graph_.nodes()) {
        if (visited.contains(start_id)) continue;

        std::stack<Frame> dfs_stack;
        enter(dfs_stack, start_id);

        while (!dfs_stack.empty()) {
            auto& frame = dfs_stack.top();

            if (frame.next == frame.end) {
                path_position.erase(*frame.node);
                path.pop_back();
                dfs_stack.pop();
                continue;
            }

            const TaskId& neighbor = *frame.next;
            ++frame.next;

            if (!visited.contains(neighbor)) {
                enter(dfs_stack, neighbor);
            } else if (auto pos = path_position.find(neighbor); pos != path_position.end()) {
                Cycle cycle;
                for (size_t i = pos->second; i < path.size(); ++i) {
                    cycle.push_back(*path[i]);
                }
                cycle.push_back(neighbor);
                cycles.push_back(std::move(cycle));
            }
        }
    }

    log(LogLevel::Info, std::format("Found {} cycles in graph {}", cycles.size(), graph_.id()));
    cycles_cache_.emplace(Memo<std::vector<Cycle>>{graph_.version(), std::move(cycles)});
    return cycles_cache_->value;
}

std::set<TaskId> GraphAnalyzer::find_cycle_nodes() {
    std::set<TaskId> members;
    for (const auto& cycle : find_all_cycles()) {
        members.insert(cycle.begin(), cycle.end());
    }
    return members;
}

// ─────────────────────────────────────────────
// Bottlenecks & Criticality
// ─────────────────────────────────────────────

std::vector<Bottleneck> GraphAnalyzer::find_bottlenecks(size_t threshold) const {
    std::vector<Bottleneck> bottlenecks;

    for (const auto& [id, node] : graph_.nodes()) {
        size_t fan_in = node.dependencies().size();
        size_t fan_out = node.dependents().size();

        if (fan_in >= threshold || fan_out >= threshold) {
            bottlenecks.push_back(Bottleneck{
                .node_id = id,
                .node_name = node.name,
                .fan_in = fan_in,
                .fan_out = fan_out,
                .score = fan_in + fan_out,
                .type = fan_in >= threshold ? "convergence" : "divergence"
            });
        }
    }

    std::stable_sort(bottlenecks.begin(), bottlenecks.end(),
                     [](const Bottleneck& a, const Bottleneck& b) { return a.score > b.score; });

    log(LogLevel::Debug, std::format("Found {} bottlenecks (threshold {})",
                                     bottlenecks.size(), threshold));
    return bottlenecks;
}

std::vector<Bottleneck> GraphAnalyzer::find_bottlenecks() const {
    return find_bottlenecks(config_.bottleneck_threshold);
}

std::vector<TaskId> GraphAnalyzer::find_critical_nodes() {
    auto path = graph_.calculate_critical_path();
    if (!path) {
        log(LogLevel::Warn, "Critical path unavailable: " + path.error().message);
        return {};
    }
    return path->nodes;
}

std::map<TaskId, double> GraphAnalyzer::calculate_node_criticality() {
    std::map<TaskId, double> criticality;
    if (graph_.node_count() == 0) return criticality;

    auto critical = find_critical_nodes();
    std::set<TaskId> critical_set(critical.begin(), critical.end());

    size_t max_dependents = 0;
    double max_cost = 0.0;
    for (const auto& [_, node] : graph_.nodes()) {
        max_dependents = std::max(max_dependents, node.dependents().size());
        max_cost = std::max(max_cost, node.cost_model.total_cost());
    }
    if (max_dependents == 0) max_dependents = 1;
    if (max_cost == 0.0) max_cost = 1.0;

    for (const auto& [id, node] : graph_.nodes()) {
        double score = 0.0;
        if (critical_set.contains(id)) {
            score += kCriticalPathWeight;
        }
        score += kDependentsWeight * static_cast<double>(node.dependents().size())
                 / static_cast<double>(max_dependents);
        score += kCostWeight * node.cost_model.total_cost() / max_cost;

        criticality[id] = std::min(score, 1.0);
    }

    return criticality;
}

// ─────────────────────────────────────────────
// Influence Ranking (PageRank power iteration)
// ─────────────────────────────────────────────

const std::map<TaskId, double>& GraphAnalyzer::calculate_influence_scores() {
    if (is_fresh(influence_cache_)) {
        return influence_cache_->value;
    }

    std::map<TaskId, double> scores;
    const size_t n = graph_.node_count();

    if (n > 0) {
        const double uniform = 1.0 / static_cast<double>(n);
        const double damping = config_.damping;
        const double teleport = (1.0 - damping) / static_cast<double>(n);

        for (const auto& [id, _] : graph_.nodes()) {
            scores[id] = uniform;
        }

        for (uint32_t iter = 0; iter < config_.influence_iterations; ++iter) {
            std::map<TaskId, double> next;
            for (const auto& [id, _] : graph_.nodes()) {
                double rank_sum = 0.0;
                for (const auto& source : graph_.predecessors(id)) {
                    auto out_degree = graph_.successors(source).size();
                    if (out_degree > 0) {
                        rank_sum += scores.at(source) / static_cast<double>(out_degree);
                    }
                }
                next[id] = teleport + damping * rank_sum;
            }
            scores = std::move(next);
        }

        double max_score = 0.0;
        for (const auto& [_, score] : scores) {
            max_score = std::max(max_score, score);
        }
        if (max_score > 0.0) {
            for (auto& [_, score] : scores) {
                score /= max_score;
            }
        }

        for (const auto& [id, score] : scores) {
            graph_.find_node(id)->influence_score = score;
        }
    }

    log(LogLevel::Info, std::format("Calculated influence scores for {} nodes", n));
    influence_cache_.emplace(Memo<std::map<TaskId, double>>{graph_.version(), std::move(scores)});
    return influence_cache_->value;
}

std::vector<std::pair<TaskId, double>> GraphAnalyzer::find_most_influential_nodes(size_t top_n) {
    const auto& scores = calculate_influence_scores();
    std::vector<std::pair<TaskId, double>> ranked(scores.begin(), scores.end());

    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (ranked.size() > top_n) {
        ranked.resize(top_n);
    }
    return ranked;
}

// ─────────────────────────────────────────────
// Parallelization Analysis
// ─────────────────────────────────────────────

double GraphAnalyzer::calculate_parallelization_index() {
    const size_t n = graph_.node_count();
    if (n == 0) return 0.0;

    auto levels = graph_.calculate_node_levels();
    if (!levels) {
        log(LogLevel::Warn, "Parallelization index unavailable: " + levels.error().message);
        return 0.0;
    }

    int max_level = 0;
    for (const auto& [_, level] : *levels) {
        max_level = std::max(max_level, level);
    }

    // Average nodes per level, relative to the total node count.
    double level_count = static_cast<double>(max_level + 1);
    double avg_parallel = static_cast<double>(n) / level_count;
    double index = avg_parallel / static_cast<double>(n);

    return std::min(index, 1.0);
}

std::map<int, std::vector<TaskId>> GraphAnalyzer::find_parallel_stages() {
    std::map<int, std::vector<TaskId>> stages;

    auto levels = graph_.calculate_node_levels();
    if (!levels) {
        log(LogLevel::Warn, "Parallel stages unavailable: " + levels.error().message);
        return stages;
    }

    for (const auto& [id, level] : *levels) {
        stages[level].push_back(id);
    }

    log(LogLevel::Debug, std::format("Found {} parallel stages", stages.size()));
    return stages;
}

std::map<TaskId, double> GraphAnalyzer::calculate_parallelization_factor() {
    std::map<TaskId, double> factors;
    const size_t n = graph_.node_count();

    for (const auto& [level, ids] : find_parallel_stages()) {
        double factor = n > 1
            ? static_cast<double>(ids.size() - 1) / static_cast<double>(n)
            : 0.0;
        for (const auto& id : ids) {
            factors[id] = factor;
            graph_.find_node(id)->parallelization_factor = factor;
        }
    }

    return factors;
}

// ─────────────────────────────────────────────
// Health & Quality
// ─────────────────────────────────────────────

HealthReport GraphAnalyzer::calculate_graph_health() {
    HealthReport report;
    double score = 100.0;

    const auto& cycles = find_all_cycles();
    report.cycle_count = cycles.size();
    if (!cycles.empty()) {
        score -= kCyclePenalty;
        report.issues.push_back(std::format("Contains {} cycles", cycles.size()));
    }

    auto bottlenecks = find_bottlenecks(config_.health_bottleneck_threshold);
    report.bottleneck_count = bottlenecks.size();
    if (!bottlenecks.empty()) {
        score -= std::min(kBottleneckPenalty * static_cast<double>(bottlenecks.size()),
                          kBottleneckPenaltyCap);
        report.issues.push_back(std::format("Contains {} bottlenecks", bottlenecks.size()));
    }

    report.parallelization_index = calculate_parallelization_index();
    if (graph_.node_count() > 0 && report.parallelization_index < kLowParallelismThreshold) {
        score -= kLowParallelismPenalty;
        report.issues.emplace_back("Low parallelization potential");
    }

    size_t isolated = 0;
    for (const auto& [_, node] : graph_.nodes()) {
        if (node.dependencies().empty() && node.dependents().empty()) ++isolated;
    }
    report.isolated_count = isolated;
    // A single isolated node is a trivial graph, not a defect.
    if (isolated > 1) {
        score -= std::min(kIsolatedPenalty * static_cast<double>(isolated), kIsolatedPenaltyCap);
        report.issues.push_back(std::format("Contains {} isolated nodes", isolated));
    }

    report.score = std::max(score, 0.0);
    if (report.score >= kHealthyScore) {
        report.status = "healthy";
    } else if (report.score >= kDegradedScore) {
        report.status = "degraded";
    } else {
        report.status = "unhealthy";
    }

    log(LogLevel::Info, std::format("Graph {} health {:.1f} ({})",
                                    graph_.id(), report.score, report.status));
    return report;
}

std::optional<QualityReport> GraphAnalyzer::check_graph_quality() const {
    const auto& nodes = graph_.nodes();
    if (nodes.empty()) return std::nullopt;

    QualityReport q;
    q.node_count = nodes.size();
    q.edge_count = graph_.edge_count();

    size_t sum_in = 0;
    size_t sum_out = 0;
    for (const auto& [_, node] : nodes) {
        sum_in += node.dependencies().size();
        sum_out += node.dependents().size();
        q.max_fan_in = std::max(q.max_fan_in, node.dependencies().size());
        q.max_fan_out = std::max(q.max_fan_out, node.dependents().size());
    }

    auto n = static_cast<double>(q.node_count);
    q.avg_fan_in = static_cast<double>(sum_in) / n;
    q.avg_fan_out = static_cast<double>(sum_out) / n;
    q.root_count = graph_.root_nodes().size();
    q.leaf_count = graph_.leaf_nodes().size();
    q.is_balanced = (q.root_count > q.leaf_count ? q.root_count - q.leaf_count
                                                 : q.leaf_count - q.root_count) <= 2;
    q.density = q.node_count > 1
        ? static_cast<double>(q.edge_count) / (n * (n - 1.0))
        : 0.0;

    return q;
}

// ─────────────────────────────────────────────
// Resource Analysis
// ─────────────────────────────────────────────

CostSummary GraphAnalyzer::calculate_total_cost() {
    CostSummary summary;

    for (const auto& [_, node] : graph_.nodes()) {
        const auto& cm = node.cost_model;
        summary.total_duration_sequential += cm.duration;
        summary.total_cost += cm.monetary_cost;
        summary.total_cpu_units += cm.cpu_units;
        summary.total_memory_mb += cm.memory_mb;
        summary.total_io_operations += cm.io_operations;
    }

    if (auto path = graph_.calculate_critical_path(); path) {
        summary.critical_path_duration = path->total_duration;
    } else {
        log(LogLevel::Warn, "Critical path unavailable: " + path.error().message);
    }

    summary.efficiency_ratio = summary.total_duration_sequential > 0.0
        ? summary.critical_path_duration / summary.total_duration_sequential
        : 0.0;

    return summary;
}

std::vector<ResourceHotspot> GraphAnalyzer::find_resource_hotspots(size_t top_n) const {
    std::vector<ResourceHotspot> hotspots;
    hotspots.reserve(graph_.node_count());

    for (const auto& [id, node] : graph_.nodes()) {
        const auto& cm = node.cost_model;
        hotspots.push_back(ResourceHotspot{
            .node_id = id,
            .node_name = node.name,
            .duration = cm.duration,
            .cost = cm.monetary_cost,
            .cpu_units = cm.cpu_units,
            .memory_mb = cm.memory_mb,
            .total_cost = cm.total_cost()
        });
    }

    std::stable_sort(hotspots.begin(), hotspots.end(),
                     [](const ResourceHotspot& a, const ResourceHotspot& b) {
                         return a.total_cost > b.total_cost;
                     });
    if (hotspots.size() > top_n) {
        hotspots.resize(top_n);
    }
    return hotspots;
}

// ─────────────────────────────────────────────
// Redundancy Analysis
// ─────────────────────────────────────────────

double GraphAnalyzer::calculate_redundancy_score() {
    if (graph_.node_count() < 2) return 0.0;

    auto roots = graph_.root_nodes();
    auto leaves = graph_.leaf_nodes();
    if (roots.empty() || leaves.empty()) return 0.0;

    double total_paths = 0.0;

    if (auto order = graph_.topological_sort(); order) {
        // paths[v] = number of distinct paths root → v
        for (const auto& root : roots) {
            std::unordered_map<TaskId, double> paths;
            paths[root] = 1.0;
            for (const auto& id : *order) {
                auto it = paths.find(id);
                if (it == paths.end()) continue;
                double count = it->second;
                for (const auto& succ : graph_.successors(id)) {
                    paths[succ] += count;
                }
            }
            for (const auto& leaf : leaves) {
                if (auto it = paths.find(leaf); it != paths.end()) {
                    total_paths += it->second;
                }
            }
        }
    } else {
        if (graph_.node_count() > config_.redundancy_max_nodes) {
            log(LogLevel::Warn, std::format(
                "Redundancy skipped: cyclic graph with {} nodes exceeds enumeration limit {}",
                graph_.node_count(), config_.redundancy_max_nodes));
            return 0.0;
        }
        uint64_t budget = config_.redundancy_max_paths;
        for (const auto& root : roots) {
            total_paths += count_paths_exhaustive(root, budget);
        }
        if (budget == 0) {
            log(LogLevel::Warn, std::format(
                "Redundancy path enumeration truncated after {} partial paths",
                config_.redundancy_max_paths));
        }
    }

    double possible = 2.0 * static_cast<double>(roots.size()) * static_cast<double>(leaves.size());
    return std::min(total_paths / possible, 1.0);
}

double GraphAnalyzer::count_paths_exhaustive(const TaskId& root, uint64_t& budget) const {
    struct Frame {
        const TaskId* node;
        std::set<TaskId>::const_iterator next;
        std::set<TaskId>::const_iterator end;
    };

    double count = 0.0;
    std::unordered_set<TaskId> on_path;
    std::stack<Frame> dfs_stack;

    auto enter = [&](const TaskId& id) {
        const auto& out = graph_.successors(id);
        if (out.empty()) {
            count += 1.0;   // reached a leaf
        }
        on_path.insert(id);
        dfs_stack.push({&id, out.begin(), out.end()});
    };

    enter(root);
    while (!dfs_stack.empty()) {
        auto& frame = dfs_stack.top();
        if (frame.next == frame.end) {
            on_path.erase(*frame.node);
            dfs_stack.pop();
            continue;
        }

        const TaskId& neighbor = *frame.next;
        ++frame.next;
        if (on_path.contains(neighbor)) continue;

        if (budget == 0) break;
        --budget;
        enter(neighbor);
    }

    return count;
}

// ─────────────────────────────────────────────
// Comprehensive Analysis
// ─────────────────────────────────────────────

AnalysisReport GraphAnalyzer::get_analysis_report() {
    log(LogLevel::Info, "Generating analysis report for graph " + graph_.id());

    AnalysisReport report;
    report.graph_id = graph_.id();
    report.stats = graph_.get_stats();
    report.health = calculate_graph_health();
    report.quality = check_graph_quality();
    report.costs = calculate_total_cost();
    report.bottlenecks = find_bottlenecks();
    report.critical_nodes = find_critical_nodes();
    report.influential_nodes = find_most_influential_nodes(config_.top_n);
    report.resource_hotspots = find_resource_hotspots(config_.top_n);
    report.parallel_stages = find_parallel_stages();
    report.parallelization_index = report.health.parallelization_index;
    report.redundancy_score = calculate_redundancy_score();
    report.cycles = find_all_cycles();

    return report;
}

void GraphAnalyzer::clear_cache() noexcept {
    cycles_cache_.reset();
    influence_cache_.reset();
}

}  // namespace taskgraph
