/**
 * @file graph_exporter.cpp
 * @brief GraphExporter implementation.
 */

#include "exporter/graph_exporter.hpp"
#include "serialization/graph_json.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>
#include <sstream>
#include <system_error>

namespace taskgraph {

namespace {

constexpr size_t kMarkdownBottleneckLimit = 3;

std::string_view status_color(NodeStatus status) noexcept {
    switch (status) {
        case NodeStatus::Pending:   return "lightgray";
        case NodeStatus::Ready:     return "lightblue";
        case NodeStatus::Running:   return "yellow";
        case NodeStatus::Completed: return "lightgreen";
        case NodeStatus::Failed:    return "red";
        case NodeStatus::Cancelled: return "orange";
        case NodeStatus::Blocked:   return "pink";
    }
    return "white";
}

std::string_view edge_style(EdgeType type) noexcept {
    switch (type) {
        case EdgeType::Dependency:  return "solid";
        case EdgeType::Constraint:  return "dashed";
        case EdgeType::DataFlow:    return "dotted";
        case EdgeType::Conditional: return "dashed";
        case EdgeType::Weak:        return "dotted";
    }
    return "solid";
}

std::string dot_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

std::string upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

}  // anonymous namespace

std::optional<ExportFormat> parse_export_format(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "json") return ExportFormat::Json;
    if (lower == "dot") return ExportFormat::Dot;
    if (lower == "markdown" || lower == "md") return ExportFormat::Markdown;
    return std::nullopt;
}

GraphExporter::GraphExporter(TaskGraph& graph, AnalyzerConfig analyzer_config, Logger* logger)
    : graph_(graph), analyzer_config_(analyzer_config), logger_(logger) {}

GraphAnalyzer& GraphExporter::analyzer() {
    if (!analyzer_) {
        analyzer_.emplace(graph_, analyzer_config_, logger_);
    }
    return *analyzer_;
}

// ─────────────────────────────────────────────
// JSON
// ─────────────────────────────────────────────

std::string GraphExporter::export_json(bool include_analysis, int indent) {
    auto document = graph_to_json(graph_);
    if (include_analysis) {
        document["analysis"] = report_to_json(analyzer().get_analysis_report());
    }
    return document.dump(indent);
}

// ─────────────────────────────────────────────
// DOT (GraphViz)
// ─────────────────────────────────────────────

std::string GraphExporter::export_dot(bool include_labels) const {
    std::ostringstream out;
    out << "digraph TaskGraph {\n"
        << "  label=\"" << dot_escape(graph_.id()) << "\";\n"
        << "  rankdir=TB;\n"
        << "  node [shape=box];\n"
        << "\n";

    for (const auto& [id, node] : graph_.nodes()) {
        std::string label = dot_escape(node.name);
        if (include_labels) {
            label += std::format("\\n[{}]\\nPri: {}\\n{}s",
                                 dot_escape(node.node_type), node.priority,
                                 node.cost_model.duration);
        }
        out << std::format("  \"{}\" [label=\"{}\", fillcolor={}, style=\"{}\"];\n",
                           dot_escape(id), label, status_color(node.status),
                           node.on_critical_path ? "filled,bold" : "filled");
    }

    out << "\n";

    for (const auto& edge : graph_.edges()) {
        out << std::format("  \"{}\" -> \"{}\" [style={}",
                           dot_escape(edge.source_id), dot_escape(edge.target_id),
                           edge_style(edge.edge_type));
        if (edge.weight != 1.0) {
            out << std::format(", label=\"{}\"", edge.weight);
        }
        out << "];\n";
    }

    out << "}";
    return out.str();
}

// ─────────────────────────────────────────────
// Markdown
// ─────────────────────────────────────────────

std::string GraphExporter::export_markdown(bool include_analysis) {
    std::ostringstream out;
    out << "# TaskGraph: " << graph_.id() << "\n\n";

    auto stats = graph_.get_stats();
    out << "## Statistics\n"
        << "- **Nodes**: " << stats.node_count << "\n"
        << "- **Edges**: " << stats.edge_count << "\n"
        << "- **Root Nodes**: " << stats.root_count << "\n"
        << "- **Leaf Nodes**: " << stats.leaf_count << "\n"
        << "- **Is Acyclic**: " << (stats.is_acyclic ? "true" : "false") << "\n\n";

    out << "## Nodes\n\n"
        << "| Node ID | Name | Type | Priority | Status | Duration |\n"
        << "|---------|------|------|----------|--------|----------|\n";
    for (const auto& [id, node] : graph_.nodes()) {
        out << std::format("| {} | {} | {} | {} | {} | {}s |\n",
                           id, node.name, node.node_type, node.priority,
                           to_string(node.status), node.cost_model.duration);
    }
    out << "\n";

    out << "## Edges\n\n"
        << "| Source | Target | Type | Weight |\n"
        << "|--------|--------|------|--------|\n";
    for (const auto& edge : graph_.edges()) {
        out << std::format("| {} | {} | {} | {} |\n",
                           edge.source_id, edge.target_id,
                           to_string(edge.edge_type), edge.weight);
    }
    out << "\n";

    out << "## Critical Path\n";
    if (auto path = graph_.calculate_critical_path(); path) {
        out << std::format("**Duration**: {:.2f}s\n\n", path->total_duration) << "```\n";
        for (size_t i = 0; i < path->nodes.size(); ++i) {
            if (i > 0) out << " -> ";
            out << path->nodes[i];
        }
        out << "\n```\n\n";
    } else {
        out << "_Unavailable: " << path.error().message << "_\n\n";
    }

    if (include_analysis) {
        auto report = analyzer().get_analysis_report();

        out << "## Analysis\n\n";

        out << std::format("### Health: {} ({:.1f}/100)\n",
                           upper(report.health.status), report.health.score);
        if (!report.health.issues.empty()) {
            out << "**Issues:**\n";
            for (const auto& issue : report.health.issues) {
                out << "- " << issue << "\n";
            }
        }
        out << "\n";

        const auto& costs = report.costs;
        out << "### Resource Costs\n"
            << std::format("- **Sequential Duration**: {:.2f}s\n", costs.total_duration_sequential)
            << std::format("- **Critical Path Duration**: {:.2f}s\n", costs.critical_path_duration)
            << std::format("- **Total Cost**: ${:.2f}\n", costs.total_cost)
            << std::format("- **Efficiency Ratio**: {:.2f}%\n", costs.efficiency_ratio * 100.0)
            << "\n";

        if (!report.bottlenecks.empty()) {
            out << "### Bottlenecks\n";
            auto shown = std::min(report.bottlenecks.size(), kMarkdownBottleneckLimit);
            for (size_t i = 0; i < shown; ++i) {
                const auto& b = report.bottlenecks[i];
                out << std::format("- **{}**: {} (fan-in: {}, fan-out: {})\n",
                                   b.node_name, b.type, b.fan_in, b.fan_out);
            }
            out << "\n";
        }
    }

    return out.str();
}

std::string GraphExporter::export_as(ExportFormat format, bool include_analysis) {
    switch (format) {
        case ExportFormat::Json:     return export_json(include_analysis);
        case ExportFormat::Dot:      return export_dot();
        case ExportFormat::Markdown: return export_markdown(include_analysis);
    }
    return {};
}

// ─────────────────────────────────────────────
// Files
// ─────────────────────────────────────────────

Result<void> GraphExporter::save_to_file(const std::filesystem::path& path,
                                         ExportFormat format,
                                         bool include_analysis) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::Io, std::format("Cannot create directory {}: {}",
                                                    path.parent_path().string(), ec.message())};
        }
    }

    auto content = export_as(format, include_analysis);

    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file) {
        return Error{ErrorCode::Io, "Cannot open file for writing: " + path.string()};
    }
    file << content;
    file.close();
    if (!file) {
        return Error{ErrorCode::Io, "Failed writing file: " + path.string()};
    }

    if (logger_ != nullptr) {
        logger_->info(std::format("Exported graph {} to {} ({} format)",
                                  graph_.id(), path.string(), to_string(format)));
    }
    return {};
}

Result<void> GraphExporter::save_to_file(const std::filesystem::path& path,
                                         std::string_view format,
                                         bool include_analysis) {
    auto parsed = parse_export_format(format);
    if (!parsed) {
        return Error{ErrorCode::Validation,
                     std::format("Unsupported format: {}. Supported: json, dot, markdown, md", format)};
    }
    return save_to_file(path, *parsed, include_analysis);
}

}  // namespace taskgraph
