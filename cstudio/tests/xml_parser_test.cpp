//! # Documentation Comment Parser Tests
//!
//! Tests for the lenient XML parser: element kinds, attributes, blank
//! lines, verbatim `<code>`, and degradation of malformed markup to text.

#include "comment/block_scanner.hpp"
#include "xmldoc/xml_parser.hpp"

#include <gtest/gtest.h>

using namespace cstudio;
using namespace cstudio::xmldoc;

class XmlParserTest : public ::testing::Test {
protected:
    static auto only_element(const std::vector<XmlNode>& nodes) -> const XmlElement& {
        EXPECT_EQ(nodes.size(), 1u);
        EXPECT_TRUE(nodes.front().is_element());
        return nodes.front().as_element();
    }
};

TEST_F(XmlParserTest, EmptyInput) {
    EXPECT_TRUE(parse_xml("").empty());
    EXPECT_TRUE(parse_lines({}).empty());
}

TEST_F(XmlParserTest, PlainText) {
    auto nodes = parse_xml("Just a sentence.");
    ASSERT_EQ(nodes.size(), 1u);
    ASSERT_TRUE(nodes[0].is_text());
    EXPECT_EQ(nodes[0].as_text().content, "Just a sentence.");
}

TEST_F(XmlParserTest, SummaryElement) {
    auto nodes = parse_lines({"<summary>", "Does a thing.", "</summary>"});
    const auto& summary = only_element(nodes);
    EXPECT_EQ(summary.name, "summary");
    EXPECT_EQ(summary.kind, ElementKind::Block);
    ASSERT_EQ(summary.children.size(), 1u);
    EXPECT_EQ(summary.children[0].as_text().content, "\nDoes a thing.\n");
}

TEST_F(XmlParserTest, BlankLinesBecomeNodes) {
    auto nodes = parse_lines({"<summary>", "First.", "", "Second.", "</summary>"});
    const auto& summary = only_element(nodes);
    ASSERT_EQ(summary.children.size(), 3u);
    EXPECT_TRUE(summary.children[0].is_text());
    EXPECT_TRUE(summary.children[1].is_blank_line());
    EXPECT_TRUE(summary.children[2].is_text());
    EXPECT_TRUE(summary.has_blank_line_children());
}

TEST_F(XmlParserTest, LeadingBlankLines) {
    auto nodes = parse_lines({"", "Text"});
    ASSERT_EQ(nodes.size(), 2u);
    EXPECT_TRUE(nodes[0].is_blank_line());
    EXPECT_TRUE(nodes[1].is_text());
}

TEST_F(XmlParserTest, InlineChildren) {
    auto nodes = parse_xml("<summary>Uses <see cref=\"Foo\"/> and <c>bar</c>.</summary>");
    const auto& summary = only_element(nodes);
    ASSERT_EQ(summary.children.size(), 5u);
    EXPECT_FALSE(summary.has_block_children());

    const auto& see = summary.children[1].as_element();
    EXPECT_EQ(see.kind, ElementKind::Inline);
    EXPECT_TRUE(see.self_closing);
    EXPECT_EQ(see.attribute("cref"), "Foo");

    const auto& c = summary.children[3].as_element();
    EXPECT_EQ(c.name, "c");
    ASSERT_EQ(c.children.size(), 1u);
    EXPECT_EQ(c.children[0].as_text().content, "bar");
}

TEST_F(XmlParserTest, NestedBlockElements) {
    auto nodes = parse_xml("<remarks><para>One.</para><para>Two.</para></remarks>");
    const auto& remarks = only_element(nodes);
    EXPECT_TRUE(remarks.has_block_children());
    ASSERT_EQ(remarks.children.size(), 2u);
    EXPECT_TRUE(remarks.children[0].is_block_level());
}

TEST_F(XmlParserTest, UnknownTagIsGeneric) {
    auto nodes = parse_xml("<custom>x</custom>");
    const auto& custom = only_element(nodes);
    EXPECT_EQ(custom.kind, ElementKind::Generic);
    EXPECT_TRUE(custom.is_inline());
}

TEST_F(XmlParserTest, TagClassification) {
    EXPECT_EQ(classify_tag("SUMMARY"), ElementKind::Block);
    EXPECT_EQ(classify_tag("param"), ElementKind::Block);
    EXPECT_EQ(classify_tag("paramref"), ElementKind::Inline);
    EXPECT_EQ(classify_tag("code"), ElementKind::Verbatim);
    EXPECT_EQ(classify_tag("b"), ElementKind::Generic);
}

// ============================================================================
// Attributes
// ============================================================================

TEST_F(XmlParserTest, AttributeQuotingIsPreserved) {
    auto nodes = parse_xml("<param name='value'>The value.</param>");
    const auto& param = only_element(nodes);
    ASSERT_EQ(param.attributes.size(), 1u);
    EXPECT_EQ(param.attributes[0].name, "name");
    EXPECT_EQ(param.attributes[0].value, "value");
    EXPECT_EQ(param.attributes[0].quote, '\'');
    EXPECT_EQ(open_tag(param), "<param name='value'>");
    EXPECT_EQ(close_tag(param), "</param>");
}

TEST_F(XmlParserTest, UnquotedAttribute) {
    auto nodes = parse_xml("<list type=bullet></list>");
    const auto& list = only_element(nodes);
    ASSERT_EQ(list.attributes.size(), 1u);
    EXPECT_EQ(list.attributes[0].quote, '\0');
    EXPECT_EQ(open_tag(list), "<list type=bullet>");
}

TEST_F(XmlParserTest, MissingAttributeIsNullopt) {
    auto nodes = parse_xml("<see langword=\"null\"/>");
    const auto& see = only_element(nodes);
    EXPECT_EQ(see.attribute("langword"), "null");
    EXPECT_FALSE(see.attribute("cref").has_value());
    EXPECT_EQ(open_tag(see), "<see langword=\"null\"/>");
}

// ============================================================================
// Verbatim Code
// ============================================================================

TEST_F(XmlParserTest, CodeContentIsVerbatim) {
    auto nodes = parse_lines({"<code>", "  if (a < b) { <notatag> }", "</code>"});
    const auto& code = only_element(nodes);
    EXPECT_EQ(code.kind, ElementKind::Verbatim);
    ASSERT_EQ(code.children.size(), 1u);
    EXPECT_EQ(code.children[0].as_text().content, "\n  if (a < b) { <notatag> }\n");
}

TEST_F(XmlParserTest, UnterminatedCodeIsText) {
    auto nodes = parse_xml("<code>int x;");
    ASSERT_EQ(nodes.size(), 1u);
    ASSERT_TRUE(nodes[0].is_text());
    EXPECT_EQ(nodes[0].as_text().content, "<code>int x;");
}

// ============================================================================
// Malformed Markup
// ============================================================================

TEST_F(XmlParserTest, UnterminatedElementDegradesToText) {
    auto nodes = parse_xml("<para>never closed");
    ASSERT_EQ(nodes.size(), 1u);
    ASSERT_TRUE(nodes[0].is_text());
    EXPECT_EQ(nodes[0].as_text().content, "<para>never closed");
}

TEST_F(XmlParserTest, StrayCloseTagIsText) {
    auto nodes = parse_xml("a </b> c");
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(nodes[0].as_text().content, "a </b> c");
}

TEST_F(XmlParserTest, MismatchedNestingKeepsOuterElement) {
    auto nodes = parse_xml("<summary><c>x</summary>");
    const auto& summary = only_element(nodes);
    ASSERT_EQ(summary.children.size(), 1u);
    EXPECT_EQ(summary.children[0].as_text().content, "<c>x");
}

TEST_F(XmlParserTest, LessThanInText) {
    auto nodes = parse_xml("Returns true if a < b.");
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(nodes[0].as_text().content, "Returns true if a < b.");
}

// ============================================================================
// Serialization and Blocks
// ============================================================================

TEST_F(XmlParserTest, InlineStringCollapsesWhitespace) {
    auto nodes = parse_xml("<para>Hello   <c>x</c>\n world</para>");
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(to_inline_string(nodes[0]), "<para>Hello <c>x</c> world</para>");
}

TEST_F(XmlParserTest, ParsesCommentBlock) {
    auto snapshot = comment::TextSnapshot::from_string(
        "/// <summary>Adds.</summary>\n/// <returns>The sum.</returns>\nint Add();\n");
    auto blocks = comment::find_all_blocks(snapshot, comment::style_for(comment::Language::CSharp));
    ASSERT_EQ(blocks.size(), 1u);

    auto nodes = parse(blocks[0]);
    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_EQ(nodes[0].as_element().name, "summary");
    EXPECT_TRUE(nodes[1].is_text());
    EXPECT_EQ(nodes[2].as_element().name, "returns");
}
