/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <string_view>
#include <utility>

namespace taskgraph {

namespace {

CostModel read_cost_model(const toml::table& tbl) {
    CostModel defaults;
    CostModel model;
    model.duration = tbl["duration"].value_or(defaults.duration);
    model.monetary_cost = tbl["monetary_cost"].value_or(defaults.monetary_cost);
    model.cpu_units = tbl["cpu_units"].value_or(defaults.cpu_units);
    model.memory_mb = tbl["memory_mb"].value_or(defaults.memory_mb);
    model.io_operations = static_cast<uint64_t>(
        tbl["io_operations"].value_or(int64_t{0}));
    model.network_bandwidth = tbl["network_bandwidth"].value_or(defaults.network_bandwidth);
    return model;
}

/// Read a non-negative integer key; negative values are rejected instead of wrapping.
template <typename T>
Result<void> read_count(toml::node_view<toml::node> section, std::string_view section_name,
                        std::string_view key, T& out) {
    auto value = section[key].value_or(static_cast<int64_t>(out));
    if (value < 0) {
        return Error{ErrorCode::Config, std::string{section_name} + "." + std::string{key}
                                            + " must not be negative"};
    }
    out = static_cast<T>(value);
    return {};
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::Config, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [graph]
        if (auto graph = tbl["graph"]; graph.is_table()) {
            auto name = graph["cycle_policy"].value_or(std::string{"significant"});
            auto policy = parse_cycle_policy(name);
            if (!policy) {
                return Error{ErrorCode::Config, "Unknown graph.cycle_policy: " + name};
            }
            config.graph.cycle_policy = *policy;
        }

        // [analyzer]
        if (auto analyzer = tbl["analyzer"]; analyzer.is_table()) {
            auto& a = config.analyzer;
            for (auto [key, field] : {
                     std::pair{"bottleneck_threshold", &a.bottleneck_threshold},
                     std::pair{"health_bottleneck_threshold", &a.health_bottleneck_threshold},
                     std::pair{"influence_iterations", &a.influence_iterations},
                     std::pair{"top_n", &a.top_n},
                     std::pair{"redundancy_max_nodes", &a.redundancy_max_nodes},
                 }) {
                if (auto read = read_count(analyzer, "analyzer", key, *field); !read) {
                    return read.error();
                }
            }
            if (auto read = read_count(analyzer, "analyzer", "redundancy_max_paths",
                                       a.redundancy_max_paths); !read) {
                return read.error();
            }
            a.damping = analyzer["damping"].value_or(0.85);

            if (a.damping < 0.0 || a.damping > 1.0) {
                return Error{ErrorCode::Config, "analyzer.damping must be within [0, 1]"};
            }
        }

        // [builder]
        if (auto builder = tbl["builder"]; builder.is_table()) {
            // [builder.cost_models.<type>]
            if (auto* models = builder["cost_models"].as_table()) {
                for (const auto& [type, node] : *models) {
                    if (auto* model_tbl = node.as_table()) {
                        config.builder.cost_models[std::string{type.str()}] =
                            read_cost_model(*model_tbl);
                    }
                }
            }

            // [builder.dependency_patterns]
            if (auto* patterns = builder["dependency_patterns"].as_table()) {
                for (const auto& [name, node] : *patterns) {
                    std::vector<std::string> deps;
                    if (auto* arr = node.as_array()) {
                        for (const auto& dep : *arr) {
                            if (auto value = dep.value<std::string>()) {
                                deps.push_back(*value);
                            }
                        }
                    }
                    config.builder.dependency_patterns[std::string{name.str()}] = std::move(deps);
                }
            }
        }

        // [export]
        if (auto exporter = tbl["export"]; exporter.is_table()) {
            config.exporter.format = exporter["format"].value_or(std::string{"json"});
            config.exporter.include_analysis = exporter["include_analysis"].value_or(true);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            auto& t = config.telemetry;
            for (auto [key, field] : {
                     std::pair{"max_file_size_mb", &t.max_file_size_mb},
                     std::pair{"rotate_count", &t.rotate_count},
                 }) {
                if (auto read = read_count(telemetry, "telemetry", key, *field); !read) {
                    return read.error();
                }
            }
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Parse,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace taskgraph
