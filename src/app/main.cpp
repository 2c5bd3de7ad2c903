/**
 * @file main.cpp
 * @brief taskgraph_cli entry point.
 *
 * Wires the modules into one analysis pipeline:
 *   Config → Logger → Graph (JSON file or demo builder) → Analyzer → Exporter
 */

#include "analysis/graph_analyzer.hpp"
#include "builder/graph_builder.hpp"
#include "builder/graph_generator.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "exporter/graph_exporter.hpp"
#include "graph/task_graph.hpp"
#include "monitor/graph_monitor.hpp"
#include "serialization/graph_json.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

using namespace taskgraph;

namespace {

void print_banner() {
    std::cerr << R"(
  ╔═══════════════════════════════════════════╗
  ║           TaskGraph Engine v1.0.0         ║
  ║   Task Dependency Analysis & Reporting    ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::filesystem::path graph_path;
    std::filesystem::path output_path;
    std::string format;
    std::string log_dir;
    std::string log_level;
    bool include_analysis = true;
    bool analysis_flag_set = false;
    bool demo_mode = false;
};

void print_usage() {
    std::cout << "Usage: taskgraph_cli [OPTIONS]\n"
              << "  --config <path>     Configuration file (default: config/default.toml)\n"
              << "  --graph <path>      Graph document (JSON) to analyze\n"
              << "  --format <fmt>      Output format: json, dot, markdown\n"
              << "  --output <path>     Write output to a file instead of stdout\n"
              << "  --no-analysis       Omit the analysis report from the output\n"
              << "  --log-dir <path>    Log output directory (default: stderr)\n"
              << "  --log-level <lvl>   debug, info, warn, error\n"
              << "  --demo              Build, monitor and report a demo workflow\n"
              << "  --help, -h          Show this help message\n";
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--graph" && i + 1 < argc) {
            args.graph_path = argv[++i];
        } else if (arg == "--format" && i + 1 < argc) {
            args.format = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--no-analysis") {
            args.include_analysis = false;
            args.analysis_flag_set = true;
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
            std::exit(2);
        }
    }
    return args;
}

Result<TaskGraph> load_graph(const std::filesystem::path& path, CyclePolicy policy) {
    std::ifstream file(path);
    if (!file) {
        return make_error<TaskGraph>(ErrorCode::Io, "Cannot open graph file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return graph_from_string(buffer.str(), policy);
}

/**
 * @brief Build a model-serving workflow, replay a short execution through
 *        the monitor, and merge it with a synthetic diamond stage.
 */
Result<TaskGraph> build_demo(const Config& config, Logger& logger, MetricsCollector& metrics) {
    logger.info("=== Demo Mode ===");

    GraphBuilder builder(&logger);
    builder.apply_config(config.builder);

    std::vector<WorkflowStep> steps = {
        {.task = "load_model", .priority = 8, .metadata = {{"task_type", "model_io"}}},
        {.task = "preprocess_input", .priority = 7, .metadata = {{"task_type", "preprocessing"}}},
        {.task = "run_inference", .priority = 9, .metadata = {{"task_type", "inference"}}},
        {.task = "postprocess_output", .priority = 6, .metadata = {{"task_type", "postprocessing"}}},
    };

    auto serving = builder.from_workflow(steps, "serving");
    if (!serving) return serving;

    GraphMonitor monitor(*serving, config.analyzer, &logger, &metrics);
    monitor.start_monitoring();
    monitor.on_node_start("load_model_0");
    monitor.on_node_complete("load_model_0", 9.5);
    monitor.on_node_start("preprocess_input_1");
    monitor.on_node_complete("preprocess_input_1", 2.75);
    monitor.on_node_start("run_inference_2");
    monitor.stop_monitoring();

    auto live = monitor.get_live_stats();
    logger.info(std::format("Serving progress: {:.1f}% ({} completed, {} running, {} pending)",
                            live.progress_percent, live.completed, live.running, live.pending));

    CostModel stage_cost;
    stage_cost.duration = 2.0;
    auto batch = GraphGenerator::diamond(2, 3, stage_cost);

    return builder.merge_graphs({&*serving, &batch}, "demo");
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    print_banner();

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (!args.log_level.empty()) config.telemetry.log_level = args.log_level;
    if (!args.format.empty()) config.exporter.format = args.format;
    if (args.analysis_flag_set) config.exporter.include_analysis = args.include_analysis;

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "taskgraph",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StderrSink>();
    }
    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);
    Logger logger(std::move(log_sink), level);
    logger.info("TaskGraph engine starting...");
    logger.info("Cycle policy: " + std::string{to_string(config.graph.cycle_policy)});
    logger.info("Export format: " + config.exporter.format);

    auto format = parse_export_format(config.exporter.format);
    if (!format) {
        logger.error("Unsupported export format: " + config.exporter.format);
        return 2;
    }
    auto policy = config.graph.cycle_policy;

    // ── Initialize Telemetry ─────────────────
    std::unique_ptr<ILogSink> metrics_sink;
    if (!config.telemetry.log_dir.empty()) {
        metrics_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "taskgraph_metrics",
                                                      config.telemetry.max_file_size_mb,
                                                      config.telemetry.rotate_count);
    } else {
        metrics_sink = std::make_unique<NullSink>();
    }
    MetricsCollector metrics(std::move(metrics_sink));

    // ── Obtain Graph ─────────────────────────
    Result<TaskGraph> graph_result = args.demo_mode
        ? build_demo(config, logger, metrics)
        : args.graph_path.empty()
            ? make_error<TaskGraph>(ErrorCode::Config, "No input graph; pass --graph <path> or --demo")
            : load_graph(args.graph_path, policy);

    if (!graph_result) {
        logger.error(std::format("Cannot obtain graph ({}): {}",
                                 to_string(graph_result.error().code),
                                 graph_result.error().message));
        logger.flush();
        return 1;
    }
    TaskGraph& graph = *graph_result;

    auto stats = graph.get_stats();
    metrics.record_graph_stats(stats);
    logger.info(std::format("Graph {}: {} nodes, {} edges, {} roots, {} leaves",
                            stats.graph_id, stats.node_count, stats.edge_count,
                            stats.root_count, stats.leaf_count));

    auto validation = graph.validate();
    for (const auto& problem : validation.errors) {
        logger.warn("Validation: " + problem);
    }

    // ── Analyze & Export ─────────────────────
    GraphAnalyzer analyzer(graph, config.analyzer, &logger);
    auto health = analyzer.calculate_graph_health();
    metrics.record_health(graph.id(), health);

    GraphExporter exporter(graph, config.analyzer, &logger);
    if (!args.output_path.empty()) {
        auto saved = exporter.save_to_file(args.output_path, *format, config.exporter.include_analysis);
        if (!saved) {
            logger.error("Export failed: " + saved.error().message);
            logger.flush();
            return 1;
        }
    } else {
        std::cout << exporter.export_as(*format, config.exporter.include_analysis) << std::endl;
    }

    metrics.flush();
    logger.info(std::format("Done. Health {:.1f} ({})", health.score, health.status));
    logger.flush();
    return 0;
}
