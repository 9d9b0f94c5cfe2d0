/**
 * @file script_sink_tests.cpp
 * @brief Unit tests for ScriptSink and quote_python()
 */
#include <gtest/gtest.h>
#include "xdslc/emission/script_sink.hpp"

using namespace xdslc;

namespace
{

NodeRecord make_node(const std::string& id, NodeKind kind, std::vector<std::string> states)
{
    NodeRecord node;
    node.id = id;
    node.kind = kind;
    node.states = std::move(states);
    return node;
}

} // namespace

// ============================================================================
// quote_python
// ============================================================================

TEST(ScriptSinkTests, Quote_PlainText)
{
    EXPECT_EQ(quote_python("Rain"), "'Rain'");
    EXPECT_EQ(quote_python(""), "''");
}

TEST(ScriptSinkTests, Quote_EscapesSpecialCharacters)
{
    EXPECT_EQ(quote_python("it's"), "'it\\'s'");
    EXPECT_EQ(quote_python("a\\b"), "'a\\\\b'");
    EXPECT_EQ(quote_python("line1\nline2"), "'line1\\nline2'");
    EXPECT_EQ(quote_python("tab\there"), "'tab\\there'");
    EXPECT_EQ(quote_python(std::string("bell\x07", 5)), "'bell\\x07'");
}

TEST(ScriptSinkTests, Quote_KeepsDoubleQuotesAndNonAscii)
{
    EXPECT_EQ(quote_python("say \"hi\""), "'say \"hi\"'");
    EXPECT_EQ(quote_python("caf\xc3\xa9"), "'caf\xc3\xa9'");
}

// ============================================================================
// Directives
// ============================================================================

TEST(ScriptSinkTests, Sink_HeaderWithAndWithoutComments)
{
    ScriptSink commented;
    commented.begin_network("net");
    EXPECT_EQ(commented.str(),
              "# Influence diagram 'net' converted from XDSL\n"
              "import pyAgrum as gum\n"
              "\n"
              "diag = gum.InfluenceDiagram()\n");

    ScriptOptions options;
    options.emit_comments = false;
    ScriptSink bare{options};
    bare.begin_network("net");
    EXPECT_EQ(bare.str(), "import pyAgrum as gum\n\ndiag = gum.InfluenceDiagram()\n");

    ScriptSink anonymous;
    anonymous.begin_network("");
    EXPECT_EQ(anonymous.str().rfind("# Influence diagram converted from XDSL\n", 0), 0u);
}

TEST(ScriptSinkTests, Sink_NodeKinds)
{
    ScriptOptions options;
    options.emit_comments = false;
    ScriptSink sink{options};

    NodeRecord decision = make_node("D", NodeKind::Decision, {"go", "stay"});
    decision.display.name = "Decide";
    sink.add_node(decision);
    sink.add_node(make_node("U", NodeKind::Utility, {}));

    EXPECT_EQ(sink.str(),
              "\n"
              "diag.addDecisionNode(gum.LabelizedVariable('D', 'Decide', ['go', 'stay']))\n"
              "\n"
              "diag.addUtilityNode(gum.LabelizedVariable('U', 'U', 1))\n");
}

TEST(ScriptSinkTests, Sink_ArcAndTables)
{
    ScriptSink sink;
    NodeRecord a = make_node("A", NodeKind::Chance, {"t", "f"});
    NodeRecord u = make_node("U", NodeKind::Utility, {});

    sink.add_arc(a, u);

    PlannedTable probabilities;
    probabilities.values = {0.25, 0.75};
    sink.fill_table(a, probabilities);

    PlannedTable utilities;
    utilities.values = {-10, 2.5};
    utilities.weight = 0.5;
    utilities.weight_source = "M";
    sink.fill_table(u, utilities);

    EXPECT_EQ(sink.str(),
              "diag.addArc('A', 'U')\n"
              "diag.cpt('A').fillWith([0.25, 0.75])\n"
              "# utilities scaled by weight 0.5 of MAU 'M'\n"
              "diag.utility('U').fillWith([-10, 2.5])\n");
}

TEST(ScriptSinkTests, Sink_QuotesIdentifiers)
{
    ScriptOptions options;
    options.emit_comments = false;
    ScriptSink sink{options};
    sink.add_node(make_node("O'Brien", NodeKind::Chance, {"it's", "no"}));
    EXPECT_EQ(sink.str(),
              "\n"
              "diag.addChanceNode(gum.LabelizedVariable('O\\'Brien', 'O\\'Brien', "
              "['it\\'s', 'no']))\n");
}
