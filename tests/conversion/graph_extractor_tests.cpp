/**
 * @file graph_extractor_tests.cpp
 * @brief Unit tests for GraphExtractor
 */
#include <gtest/gtest.h>
#include "xdslc/conversion/graph_extractor.hpp"
#include "xdslc/document/document_loader.hpp"
#include "test_documents.hpp"

using namespace xdslc;

namespace
{

ModelGraph extract(std::string_view text)
{
    return GraphExtractor{}.extract(load_document(text));
}

size_t count_issues(const ModelGraph& graph, DiagnosticCategory category)
{
    size_t n = 0;
    for (const auto& issue : graph.issues())
    {
        if (issue.category == category)
        {
            ++n;
        }
    }
    return n;
}

} // namespace

// ============================================================================
// Nodes, states and parents
// ============================================================================

TEST(GraphExtractorTests, Extract_ThreeNodeNetwork)
{
    ModelGraph graph = extract(xdslc_test::kThreeNodeNetwork);
    EXPECT_TRUE(graph.issues().empty());
    EXPECT_TRUE(graph.has_nodes_section());
    EXPECT_EQ(graph.network_id(), "Network1");
    ASSERT_EQ(graph.node_count(), 3u);

    const NodeRecord& b = graph.node(1);
    EXPECT_EQ(b.id, "B");
    EXPECT_EQ(b.kind, NodeKind::Chance);
    EXPECT_EQ(b.states, (std::vector<std::string>{"true", "false"}));
    EXPECT_EQ(b.parents, (std::vector<std::string>{"A"}));

    ASSERT_EQ(graph.arcs().size(), 2u);
    EXPECT_EQ(graph.arcs()[0], (ArcRecord{"A", "B"}));
    EXPECT_EQ(graph.arcs()[1], (ArcRecord{"A", "C"}));

    const TableRecord* table = graph.find_table("B");
    ASSERT_NE(table, nullptr);
    EXPECT_EQ(table->values, (std::vector<double>{0.9, 0.1, 0.2, 0.8}));
}

TEST(GraphExtractorTests, Extract_NodeKinds)
{
    ModelGraph graph = extract(xdslc_test::kInfluenceDiagram);
    ASSERT_EQ(graph.node_count(), 4u);
    EXPECT_EQ(graph.node(0).kind, NodeKind::Chance);
    EXPECT_EQ(graph.node(2).kind, NodeKind::Decision);
    EXPECT_EQ(graph.node(3).kind, NodeKind::Utility);
    EXPECT_TRUE(graph.node(3).states.empty());
    EXPECT_EQ(graph.node(3).parents, (std::vector<std::string>{"Weather", "Umbrella"}));

    // Decision nodes carry no table.
    EXPECT_EQ(graph.find_table("Umbrella"), nullptr);
    const TableRecord* utilities = graph.find_table("Satisfaction");
    ASSERT_NE(utilities, nullptr);
    EXPECT_EQ(utilities->values, (std::vector<double>{20, 100, 70, 0}));
}

TEST(GraphExtractorTests, Extract_ParentOrderIsPreserved)
{
    ModelGraph graph = extract(xdslc_test::kTwoParentNetwork);
    EXPECT_EQ(graph.node(2).parents, (std::vector<std::string>{"X", "Y"}));
}

TEST(GraphExtractorTests, Extract_RepeatedParentIsListedOnce)
{
    ModelGraph graph = extract(R"(<smile id="n"><nodes>
        <cpt id="A"><state id="t"/><state id="f"/><probabilities>0.5 0.5</probabilities></cpt>
        <cpt id="B"><state id="t"/><state id="f"/><parents>A A</parents>
          <probabilities>0.9 0.1 0.2 0.8</probabilities></cpt>
      </nodes></smile>)");
    EXPECT_EQ(graph.node(1).parents, (std::vector<std::string>{"A"}));
    EXPECT_EQ(graph.arcs().size(), 2u);
}

// ============================================================================
// Display metadata
// ============================================================================

TEST(GraphExtractorTests, Display_NameAndPosition)
{
    ModelGraph graph = extract(xdslc_test::kThreeNodeNetwork);
    const DisplayInfo& display = graph.node(0).display;
    EXPECT_EQ(display.name, "Alpha");
    ASSERT_TRUE(display.position.has_value());
    EXPECT_EQ(display.position.value(), (std::array<int, 4>{10, 20, 60, 50}));

    EXPECT_TRUE(graph.node(1).display.name.empty());
    EXPECT_FALSE(graph.node(1).display.position.has_value());
}

TEST(GraphExtractorTests, Display_NodesInsideSubmodels)
{
    ModelGraph graph = extract(xdslc_test::kInfluenceDiagram);
    const DisplayInfo& display = graph.node(3).display;
    EXPECT_EQ(display.name, "How happy");
    ASSERT_TRUE(display.position.has_value());
    EXPECT_EQ(display.position.value()[2], 160);
}

TEST(GraphExtractorTests, Display_UnrepresentablePositionIsDropped)
{
    ModelGraph graph = extract(R"(<smile><nodes>
        <cpt id="A"><state id="t"/><state id="f"/><probabilities>0.5 0.5</probabilities></cpt>
        <cpt id="B"><state id="t"/><state id="f"/><probabilities>0.5 0.5</probabilities></cpt>
        <cpt id="C"><state id="t"/><state id="f"/><probabilities>0.5 0.5</probabilities></cpt>
      </nodes>
      <extensions><genie>
        <node id="A"><name>Far</name><position>1e20 -5e30 3 4</position></node>
        <node id="B"><position>1.5 2 3 4</position></node>
        <node id="C"><position>-2147483648 0 2147483647 4</position></node>
      </genie></extensions></smile>)");
    EXPECT_TRUE(graph.issues().empty());
    EXPECT_EQ(graph.node(0).display.name, "Far");
    EXPECT_FALSE(graph.node(0).display.position.has_value());
    EXPECT_FALSE(graph.node(1).display.position.has_value());
    ASSERT_TRUE(graph.node(2).display.position.has_value());
    EXPECT_EQ(graph.node(2).display.position.value()[0], std::numeric_limits<int>::min());
    EXPECT_EQ(graph.node(2).display.position.value()[2], std::numeric_limits<int>::max());
}

// ============================================================================
// MAU elements
// ============================================================================

TEST(GraphExtractorTests, Mau_RecordedSeparately)
{
    ModelGraph graph = extract(xdslc_test::kMauNetwork);
    EXPECT_EQ(graph.node_count(), 3u);
    EXPECT_FALSE(graph.find_node("Total").has_value());
    ASSERT_EQ(graph.maus().size(), 1u);
    EXPECT_EQ(graph.maus()[0].id, "Total");
    EXPECT_EQ(graph.maus()[0].parents, (std::vector<std::string>{"U1", "U2"}));
    EXPECT_EQ(graph.maus()[0].weights, (std::vector<double>{0.5, 2}));
}

// ============================================================================
// Extraction issues
// ============================================================================

TEST(GraphExtractorTests, Issue_MissingNodesSection)
{
    ModelGraph graph = extract("<smile id=\"empty\"><extensions/></smile>");
    EXPECT_FALSE(graph.has_nodes_section());
    EXPECT_EQ(graph.node_count(), 0u);
}

TEST(GraphExtractorTests, Issue_UnknownKindIsSkipped)
{
    ModelGraph graph = extract(R"(<smile><nodes>
        <cpt id="A"><state id="t"/><state id="f"/><probabilities>0.5 0.5</probabilities></cpt>
        <equation id="E"><definition>E=A</definition></equation>
        <noisymax id="N"><state id="t"/><state id="f"/></noisymax>
      </nodes></smile>)");
    EXPECT_EQ(graph.node_count(), 1u);
    EXPECT_EQ(count_issues(graph, DiagnosticCategory::UnknownNodeKind), 2u);
    EXPECT_EQ(graph.issues()[0].involved_nodes, (std::vector<std::string>{"E"}));
}

TEST(GraphExtractorTests, Issue_MissingIds)
{
    ModelGraph graph = extract(R"(<smile><nodes>
        <cpt><state id="t"/><probabilities>1</probabilities></cpt>
        <cpt id="A"><state id="t"/><state/><probabilities>1</probabilities></cpt>
      </nodes></smile>)");
    EXPECT_EQ(count_issues(graph, DiagnosticCategory::MissingNodeId), 2u);
    ASSERT_EQ(graph.node_count(), 1u);
    EXPECT_EQ(graph.node(0).states, (std::vector<std::string>{"t"}));
}

TEST(GraphExtractorTests, Issue_MalformedTableValue)
{
    ModelGraph graph = extract(R"(<smile><nodes>
        <cpt id="A"><state id="t"/><state id="f"/><probabilities>0.5 abc</probabilities></cpt>
      </nodes></smile>)");
    ASSERT_EQ(count_issues(graph, DiagnosticCategory::MalformedTableValue), 1u);
    EXPECT_NE(graph.issues()[0].message.find("'abc'"), std::string::npos);
    EXPECT_EQ(graph.find_table("A")->values, (std::vector<double>{0.5}));
}

TEST(GraphExtractorTests, Issue_TemporalConstructs)
{
    ModelGraph graph = extract(xdslc_test::kTemporalNetwork);
    EXPECT_EQ(count_issues(graph, DiagnosticCategory::UnsupportedTemporalConstruct), 2u);
    EXPECT_FALSE(graph.find_node("A").has_value());
    EXPECT_TRUE(graph.find_node("S").has_value());
}
