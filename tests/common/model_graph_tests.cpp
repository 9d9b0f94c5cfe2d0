/**
 * @file model_graph_tests.cpp
 * @brief Unit tests for ModelGraph and ValidationReport.
 */
#include <gtest/gtest.h>
#include "xdslc/common/conversion_exceptions.hpp"
#include "xdslc/common/model_graph.hpp"

using namespace xdslc;

namespace
{

NodeRecord make_node(const std::string& id, NodeKind kind,
                     std::vector<std::string> states,
                     std::vector<std::string> parents = {})
{
    NodeRecord node;
    node.id = id;
    node.kind = kind;
    node.states = std::move(states);
    node.parents = std::move(parents);
    return node;
}

DiagnosticItem make_item(DiagnosticSeverity severity, DiagnosticCategory category,
                         const std::string& message, int line = 0)
{
    DiagnosticItem item;
    item.severity = severity;
    item.category = category;
    item.message = message;
    item.line = line;
    return item;
}

} // namespace

// ============================================================================
// Node storage
// ============================================================================

TEST(ModelGraphTests, AddNode_IndicesFollowDeclarationOrder)
{
    ModelGraph graph;
    EXPECT_EQ(graph.add_node(make_node("A", NodeKind::Chance, {"t", "f"})), 0u);
    EXPECT_EQ(graph.add_node(make_node("B", NodeKind::Decision, {"x", "y"})), 1u);
    EXPECT_EQ(graph.node_count(), 2u);
    EXPECT_EQ(graph.node(1).id, "B");
    EXPECT_EQ(graph.find_node("A"), std::optional<NodeIdx>{0});
    EXPECT_FALSE(graph.find_node("Z").has_value());
}

TEST(ModelGraphTests, AddNode_DuplicateIdResolvesToFirst)
{
    ModelGraph graph;
    graph.add_node(make_node("A", NodeKind::Chance, {"t", "f"}));
    graph.add_node(make_node("A", NodeKind::Decision, {"x"}));
    EXPECT_EQ(graph.node_count(), 2u);
    EXPECT_EQ(graph.find_node("A"), std::optional<NodeIdx>{0});
}

TEST(ModelGraphTests, Node_OutOfRangeThrows)
{
    ModelGraph graph;
    try
    {
        graph.node(0);
        FAIL() << "Expected ConversionError";
    }
    catch (const ConversionError& e)
    {
        EXPECT_EQ(e.code(), ConversionErrorCode::InvariantViolation);
    }
}

TEST(ModelGraphTests, FindTable_FirstRecordWins)
{
    ModelGraph graph;
    graph.add_table(TableRecord{"A", {0.5, 0.5}, 3});
    graph.add_table(TableRecord{"A", {1.0}, 9});
    const TableRecord* table = graph.find_table("A");
    ASSERT_NE(table, nullptr);
    EXPECT_EQ(table->line, 3);
    EXPECT_EQ(graph.find_table("B"), nullptr);
}

// ============================================================================
// Expected table sizes
// ============================================================================

TEST(ModelGraphTests, ExpectedSize_ChanceIsParentsTimesOwnStates)
{
    ModelGraph graph;
    graph.add_node(make_node("X", NodeKind::Chance, {"a", "b"}));
    graph.add_node(make_node("Y", NodeKind::Chance, {"a", "b", "c"}));
    graph.add_node(make_node("Z", NodeKind::Chance, {"p", "q"}, {"X", "Y"}));
    EXPECT_EQ(graph.expected_table_size(0), std::optional<size_t>{2});
    EXPECT_EQ(graph.expected_table_size(2), std::optional<size_t>{12});
}

TEST(ModelGraphTests, ExpectedSize_UtilityHasNoOwnAxis)
{
    ModelGraph graph;
    graph.add_node(make_node("D", NodeKind::Decision, {"a", "b", "c"}));
    graph.add_node(make_node("U", NodeKind::Utility, {}, {"D"}));
    graph.add_node(make_node("V", NodeKind::Utility, {}));
    EXPECT_EQ(graph.expected_table_size(1), std::optional<size_t>{3});
    EXPECT_EQ(graph.expected_table_size(2), std::optional<size_t>{1});
}

TEST(ModelGraphTests, ExpectedSize_UnresolvedOrUtilityParentIsUnknown)
{
    ModelGraph graph;
    graph.add_node(make_node("U", NodeKind::Utility, {}));
    graph.add_node(make_node("A", NodeKind::Chance, {"t", "f"}, {"Missing"}));
    graph.add_node(make_node("B", NodeKind::Chance, {"t", "f"}, {"U"}));
    EXPECT_FALSE(graph.expected_table_size(1).has_value());
    EXPECT_FALSE(graph.expected_table_size(2).has_value());
}

// ============================================================================
// ValidationReport
// ============================================================================

TEST(ValidationReportTests, Add_RoutesBySeverity)
{
    ValidationReport report;
    EXPECT_TRUE(report.is_valid());

    report.add(make_item(DiagnosticSeverity::Warning, DiagnosticCategory::DuplicateArc, "w"));
    EXPECT_TRUE(report.is_valid());
    EXPECT_TRUE(report.has_warnings());

    report.add(make_item(DiagnosticSeverity::Error, DiagnosticCategory::CyclicGraph, "e"));
    EXPECT_FALSE(report.is_valid());
    EXPECT_EQ(report.errors().size(), 1u);
    EXPECT_EQ(report.warnings().size(), 1u);

    auto all = report.all_items();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].category, DiagnosticCategory::CyclicGraph);
    EXPECT_EQ(all[1].category, DiagnosticCategory::DuplicateArc);
}

TEST(ValidationReportTests, PromoteWarnings_BlocksEmission)
{
    ValidationReport report;
    report.add(make_item(DiagnosticSeverity::Warning, DiagnosticCategory::DuplicateArc, "w"));
    report.promote_warnings();
    EXPECT_FALSE(report.has_warnings());
    ASSERT_EQ(report.errors().size(), 1u);
    EXPECT_EQ(report.errors()[0].severity, DiagnosticSeverity::Error);
    EXPECT_EQ(report.count(DiagnosticCategory::DuplicateArc), 1u);
}

TEST(ValidationReportTests, Format_IncludesCategoryAndLine)
{
    EXPECT_EQ(format_item(make_item(DiagnosticSeverity::Error,
                                    DiagnosticCategory::MissingTable, "Node 'A' has no table", 7)),
              "[MissingTable] Node 'A' has no table (line 7)");
    EXPECT_EQ(format_item(make_item(DiagnosticSeverity::Error,
                                    DiagnosticCategory::MissingNodesSection, "No nodes")),
              "[MissingNodesSection] No nodes");

    ValidationReport report;
    report.add(make_item(DiagnosticSeverity::Warning, DiagnosticCategory::DuplicateArc, "w", 2));
    report.add(make_item(DiagnosticSeverity::Error, DiagnosticCategory::DanglingArc, "e", 1));
    EXPECT_EQ(report.to_string(),
              "error: [DanglingArc] e (line 1)\nwarning: [DuplicateArc] w (line 2)\n");
}
