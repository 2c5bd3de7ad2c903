/**
 * @file config.hpp
 * @brief Engine configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "core/result.hpp"
#include "core/types.hpp"

namespace taskgraph {

struct GraphConfig {
    CyclePolicy cycle_policy = CyclePolicy::SignificantEdges;
};

struct AnalyzerConfig {
    uint32_t bottleneck_threshold = 3;
    uint32_t health_bottleneck_threshold = 5;
    uint32_t influence_iterations = 20;
    double damping = 0.85;
    uint32_t top_n = 5;
    uint32_t redundancy_max_nodes = 64;         ///< Gate for exhaustive path enumeration
    uint64_t redundancy_max_paths = 100000;     ///< Cap on enumerated paths
};

struct BuilderConfig {
    std::map<std::string, CostModel> cost_models;                       ///< Overrides by task type
    std::map<std::string, std::vector<std::string>> dependency_patterns; ///< Overrides by task name
};

struct ExportConfig {
    std::string format = "json";                ///< "json", "dot", "markdown"
    bool include_analysis = true;
};

struct TelemetryConfig {
    std::filesystem::path log_dir;              ///< Empty = stdout
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level engine configuration.
 */
struct Config {
    GraphConfig graph;
    AnalyzerConfig analyzer;
    BuilderConfig builder;
    ExportConfig exporter;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace taskgraph
