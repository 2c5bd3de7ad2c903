/**
 * @file test_graph_exporter.cpp
 * @brief Unit tests for JSON, DOT and Markdown rendering.
 */

#include "exporter/graph_exporter.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace taskgraph;

class GraphExporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        CostModel fetch_cost{.duration = 2.0, .monetary_cost = 1.5};
        CostModel parse_cost{.duration = 3.5};
        ASSERT_TRUE(graph.add_node(TaskNode("fetch", "Fetch \"raw\"", "data_fetch", 7, fetch_cost)));
        ASSERT_TRUE(graph.add_node(TaskNode("parse", "Parse", "computation", 5, parse_cost)));
        ASSERT_TRUE(graph.add_node(TaskNode("store", "Store")));
        ASSERT_TRUE(graph.add_edge(TaskEdge{.source_id = "fetch", .target_id = "parse"}));
        ASSERT_TRUE(graph.add_edge(TaskEdge{.source_id = "parse", .target_id = "store",
                                            .edge_type = EdgeType::DataFlow, .weight = 0.5}));

        out_dir = std::filesystem::temp_directory_path() / "taskgraph_test_export";
        std::filesystem::remove_all(out_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(out_dir);
    }

    static std::string read_file(const std::filesystem::path& path) {
        std::ifstream in(path);
        std::ostringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    TaskGraph graph{"etl"};
    std::filesystem::path out_dir;
};

// ─── Formats ─────────────────────────────────

TEST(ExportFormatTest, Parse) {
    EXPECT_EQ(parse_export_format("json"), ExportFormat::Json);
    EXPECT_EQ(parse_export_format("DOT"), ExportFormat::Dot);
    EXPECT_EQ(parse_export_format("Markdown"), ExportFormat::Markdown);
    EXPECT_EQ(parse_export_format("md"), ExportFormat::Markdown);
    EXPECT_FALSE(parse_export_format("yaml").has_value());
    EXPECT_EQ(to_string(ExportFormat::Markdown), "markdown");
}

// ─── JSON ────────────────────────────────────

TEST_F(GraphExporterTest, JsonWithoutAnalysis) {
    GraphExporter exporter(graph);
    auto j = nlohmann::json::parse(exporter.export_json());
    EXPECT_EQ(j.at("graph_id"), "etl");
    EXPECT_EQ(j.at("node_count"), 3);
    EXPECT_FALSE(j.contains("analysis"));
}

TEST_F(GraphExporterTest, JsonWithAnalysis) {
    GraphExporter exporter(graph);
    auto j = nlohmann::json::parse(exporter.export_json(true));
    ASSERT_TRUE(j.contains("analysis"));
    EXPECT_EQ(j.at("analysis").at("critical_nodes"),
              nlohmann::json::array({"fetch", "parse", "store"}));
    EXPECT_EQ(j.at("analysis").at("health").at("status"), "healthy");
}

TEST_F(GraphExporterTest, JsonIndentation) {
    GraphExporter exporter(graph);
    EXPECT_EQ(exporter.export_json(false, -1).find('\n'), std::string::npos);
    EXPECT_NE(exporter.export_json(false, 4).find("\n    \"edge_count\""), std::string::npos);
}

// ─── DOT ─────────────────────────────────────

TEST_F(GraphExporterTest, DotStructure) {
    GraphExporter exporter(graph);
    auto dot = exporter.export_dot();

    EXPECT_EQ(dot.rfind("digraph TaskGraph {\n  label=\"etl\";\n  rankdir=TB;\n", 0), 0u);
    EXPECT_EQ(dot.back(), '}');
    EXPECT_NE(dot.find("  \"fetch\" [label=\"Fetch \\\"raw\\\"\\n[data_fetch]\\nPri: 7\\n2s\", "
                       "fillcolor=lightgray, style=\"filled\"];"),
              std::string::npos);
    EXPECT_NE(dot.find("  \"fetch\" -> \"parse\" [style=solid];"), std::string::npos);
    EXPECT_NE(dot.find("  \"parse\" -> \"store\" [style=dotted, label=\"0.5\"];"), std::string::npos);
}

TEST_F(GraphExporterTest, DotWithoutLabels) {
    GraphExporter exporter(graph);
    auto dot = exporter.export_dot(false);
    EXPECT_NE(dot.find("  \"parse\" [label=\"Parse\", "), std::string::npos);
    EXPECT_EQ(dot.find("Pri:"), std::string::npos);
}

TEST_F(GraphExporterTest, DotMarksCriticalPathAndStatus) {
    ASSERT_TRUE(graph.calculate_critical_path());
    graph.find_node("fetch")->mark_running();
    graph.find_node("fetch")->mark_completed(2.0);

    GraphExporter exporter(graph);
    auto dot = exporter.export_dot();
    EXPECT_NE(dot.find("fillcolor=lightgreen, style=\"filled,bold\""), std::string::npos);
}

// ─── Markdown ────────────────────────────────

TEST_F(GraphExporterTest, MarkdownSections) {
    GraphExporter exporter(graph);
    auto md = exporter.export_markdown();

    EXPECT_EQ(md.rfind("# TaskGraph: etl\n\n## Statistics\n", 0), 0u);
    EXPECT_NE(md.find("- **Nodes**: 3\n"), std::string::npos);
    EXPECT_NE(md.find("- **Is Acyclic**: true\n"), std::string::npos);
    EXPECT_NE(md.find("| parse | Parse | computation | 5 | pending | 3.5s |"), std::string::npos);
    EXPECT_NE(md.find("| parse | store | data_flow | 0.5 |"), std::string::npos);
    EXPECT_NE(md.find("**Duration**: 6.50s"), std::string::npos);
    EXPECT_NE(md.find("```\nfetch -> parse -> store\n```"), std::string::npos);
    EXPECT_EQ(md.find("## Analysis"), std::string::npos);
}

TEST_F(GraphExporterTest, MarkdownWithAnalysis) {
    GraphExporter exporter(graph);
    auto md = exporter.export_markdown(true);

    EXPECT_NE(md.find("### Health: HEALTHY (100.0/100)"), std::string::npos);
    EXPECT_NE(md.find("- **Sequential Duration**: 6.50s"), std::string::npos);
    EXPECT_NE(md.find("- **Total Cost**: $1.50"), std::string::npos);
    EXPECT_NE(md.find("- **Efficiency Ratio**: 100.00%"), std::string::npos);
    EXPECT_EQ(md.find("### Bottlenecks"), std::string::npos);
}

TEST_F(GraphExporterTest, MarkdownListsTopBottlenecks) {
    ASSERT_TRUE(graph.add_node(TaskNode("hub", "Hub")));
    for (int i = 0; i < 4; ++i) {
        auto id = "leaf_" + std::to_string(i);
        ASSERT_TRUE(graph.add_node(TaskNode(id, id)));
        ASSERT_TRUE(graph.add_edge(TaskEdge{.source_id = "hub", .target_id = id}));
    }

    GraphExporter exporter(graph);
    auto md = exporter.export_markdown(true);
    EXPECT_NE(md.find("### Bottlenecks\n- **Hub**: divergence (fan-in: 0, fan-out: 4)"),
              std::string::npos);
}

TEST_F(GraphExporterTest, MarkdownReportsUnorderedGraph) {
    ASSERT_TRUE(graph.add_edge(TaskEdge{.source_id = "store", .target_id = "fetch",
                                        .edge_type = EdgeType::Weak}));
    GraphExporter exporter(graph);
    auto md = exporter.export_markdown(true);
    EXPECT_NE(md.find("- **Is Acyclic**: false"), std::string::npos);
    EXPECT_NE(md.find("_Unavailable: "), std::string::npos);
    EXPECT_NE(md.find("- Contains 1 cycles"), std::string::npos);
}

// ─── Files ───────────────────────────────────

TEST_F(GraphExporterTest, SaveCreatesDirectories) {
    GraphExporter exporter(graph);
    auto path = out_dir / "nested" / "graph.dot";

    ASSERT_TRUE(exporter.save_to_file(path, ExportFormat::Dot));
    EXPECT_EQ(read_file(path), exporter.export_dot());
}

TEST_F(GraphExporterTest, SaveByFormatName) {
    GraphExporter exporter(graph);
    auto path = out_dir / "graph.md";

    ASSERT_TRUE(exporter.save_to_file(path, "md", true));
    EXPECT_NE(read_file(path).find("## Analysis"), std::string::npos);
}

TEST_F(GraphExporterTest, SaveRejectsUnknownFormat) {
    GraphExporter exporter(graph);
    auto result = exporter.save_to_file(out_dir / "graph.yaml", "yaml");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::Validation);
    EXPECT_FALSE(std::filesystem::exists(out_dir / "graph.yaml"));
}

TEST_F(GraphExporterTest, SaveIntoUnwritablePathIsIoError) {
    GraphExporter exporter(graph);
    std::filesystem::create_directories(out_dir);
    {
        std::ofstream blocker(out_dir / "file");
        blocker << "x";
    }

    auto result = exporter.save_to_file(out_dir / "file" / "graph.json", ExportFormat::Json);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::Io);
}
