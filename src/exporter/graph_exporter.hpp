/**
 * @file graph_exporter.hpp
 * @brief Renders a TaskGraph as JSON, GraphViz DOT or Markdown.
 */

#pragma once

#include "analysis/graph_analyzer.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "graph/task_graph.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace taskgraph {

enum class ExportFormat : uint8_t {
    Json,
    Dot,
    Markdown
};

[[nodiscard]] constexpr std::string_view to_string(ExportFormat format) noexcept {
    switch (format) {
        case ExportFormat::Json:     return "json";
        case ExportFormat::Dot:      return "dot";
        case ExportFormat::Markdown: return "markdown";
    }
    return "unknown";
}

/// Accepts json, dot, markdown and md, case-insensitively.
[[nodiscard]] std::optional<ExportFormat> parse_export_format(std::string_view text);

/**
 * @brief Read-only renderer over a graph.
 *
 * The analyzer used for `include_analysis` is created lazily on first use.
 * Exporting with analysis runs the critical-path pass, which annotates
 * nodes, so the graph is held by non-const reference.
 */
class GraphExporter {
public:
    explicit GraphExporter(TaskGraph& graph,
                           AnalyzerConfig analyzer_config = {},
                           Logger* logger = nullptr);

    [[nodiscard]] std::string export_json(bool include_analysis = false, int indent = 2);
    [[nodiscard]] std::string export_dot(bool include_labels = true) const;
    [[nodiscard]] std::string export_markdown(bool include_analysis = false);

    /// DOT ignores include_analysis.
    [[nodiscard]] std::string export_as(ExportFormat format, bool include_analysis = false);

    /// Creates missing parent directories. Io on write failure.
    Result<void> save_to_file(const std::filesystem::path& path,
                              ExportFormat format,
                              bool include_analysis = false);

    /// Validation error for an unknown format name.
    Result<void> save_to_file(const std::filesystem::path& path,
                              std::string_view format,
                              bool include_analysis = false);

private:
    GraphAnalyzer& analyzer();

    TaskGraph& graph_;
    AnalyzerConfig analyzer_config_;
    Logger* logger_;
    std::optional<GraphAnalyzer> analyzer_;
};

}  // namespace taskgraph
