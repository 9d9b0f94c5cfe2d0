/**
 * @file document_loader_tests.cpp
 * @brief Unit tests for load_document()
 */
#include <gtest/gtest.h>
#include "xdslc/common/conversion_exceptions.hpp"
#include "xdslc/document/document_loader.hpp"
#include "test_documents.hpp"

using namespace xdslc;

namespace
{

void expect_malformed(std::string_view text)
{
    try
    {
        load_document(text);
        FAIL() << "Expected ConversionError for: " << text;
    }
    catch (const ConversionError& e)
    {
        EXPECT_EQ(e.code(), ConversionErrorCode::MalformedDocument);
        EXPECT_NE(std::string(e.what()).find("Malformed document"), std::string::npos);
    }
}

} // namespace

// ============================================================================
// Well-formed documents
// ============================================================================

TEST(DocumentLoaderTests, Load_BuildsAttributedTree)
{
    XmlElement root = load_document(xdslc_test::kThreeNodeNetwork);
    EXPECT_EQ(root.name, "smile");
    ASSERT_NE(root.attribute("id"), nullptr);
    EXPECT_EQ(*root.attribute("id"), "Network1");
    EXPECT_TRUE(root.has_attribute("numsamples"));
    EXPECT_FALSE(root.has_attribute("missing"));

    const XmlElement* nodes = root.first_child("nodes");
    ASSERT_NE(nodes, nullptr);
    auto cpts = nodes->children_named("cpt");
    ASSERT_EQ(cpts.size(), 3u);
    EXPECT_EQ(*cpts[1]->attribute("id"), "B");

    const XmlElement* parents = cpts[1]->first_child("parents");
    ASSERT_NE(parents, nullptr);
    EXPECT_EQ(parents->text, "A");
    EXPECT_EQ(cpts[1]->first_child("probabilities")->text, "0.9 0.1 0.2 0.8");
}

TEST(DocumentLoaderTests, Load_RecordsLineNumbers)
{
    XmlElement root = load_document(xdslc_test::kThreeNodeNetwork);
    EXPECT_EQ(root.line, 2);
    const XmlElement* first_cpt = root.first_child("nodes")->first_child("cpt");
    ASSERT_NE(first_cpt, nullptr);
    EXPECT_EQ(first_cpt->line, 4);
}

TEST(DocumentLoaderTests, Load_KeepsChildOrder)
{
    XmlElement root = load_document(xdslc_test::kInfluenceDiagram);
    const XmlElement* nodes = root.first_child("nodes");
    ASSERT_NE(nodes, nullptr);
    ASSERT_EQ(nodes->children.size(), 4u);
    EXPECT_EQ(nodes->children[0].name, "cpt");
    EXPECT_EQ(nodes->children[2].name, "decision");
    EXPECT_EQ(nodes->children[3].name, "utility");
}

TEST(DocumentLoaderTests, Load_DecodesEntities)
{
    XmlElement root = load_document("<smile id=\"a&amp;b\"><name>x &lt; y</name></smile>");
    EXPECT_EQ(*root.attribute("id"), "a&b");
    EXPECT_EQ(root.first_child("name")->text, "x < y");
}

// ============================================================================
// Malformed documents
// ============================================================================

TEST(DocumentLoaderTests, Malformed_MismatchedTag)
{
    expect_malformed("<smile><nodes></smile>");
}

TEST(DocumentLoaderTests, Malformed_Truncated)
{
    expect_malformed("<smile><nodes><cpt id=\"A\">");
}

TEST(DocumentLoaderTests, Malformed_Empty)
{
    expect_malformed("");
}

TEST(DocumentLoaderTests, Malformed_NotMarkup)
{
    expect_malformed("this is not xml");
}
