//! # Link Anchor Tokenizer Tests
//!
//! Tests for `LINK:` reference detection: keyword rules, path/line/anchor
//! decoding, path prefixes, and caret lookup.

#include "links/link_tokenizer.hpp"

#include <gtest/gtest.h>

using namespace cstudio::links;

class LinkTokenizerTest : public ::testing::Test {
protected:
    static auto single(std::string_view line) -> LinkAnchorInfo {
        auto links = parse(line);
        EXPECT_EQ(links.size(), 1u) << line;
        return links.empty() ? LinkAnchorInfo{} : links.front();
    }
};

// ============================================================================
// Basic References
// ============================================================================

TEST_F(LinkTokenizerTest, FileReference) {
    std::string_view line = "// See LINK: Services/UserService.cs for implementation details.";
    auto link = single(line);
    ASSERT_TRUE(link.file_path.has_value());
    EXPECT_EQ(*link.file_path, "Services/UserService.cs");
    EXPECT_FALSE(link.has_line_number());
    EXPECT_FALSE(link.has_anchor());
    EXPECT_FALSE(link.is_local_anchor);
    EXPECT_EQ(link.prefix, PathPrefix::None);

    EXPECT_EQ(link.span_start, line.find("LINK"));
    EXPECT_EQ(link.target_start, line.find("Services"));
    EXPECT_EQ(line.substr(link.target_start, link.target_length), "Services/UserService.cs");
    EXPECT_EQ(line.substr(link.span_start, link.span_length), "LINK: Services/UserService.cs");
}

TEST_F(LinkTokenizerTest, LineRangeAndAnchor) {
    auto link = single("// LINK: Database/Schema.sql:45-67#create-tables");
    ASSERT_TRUE(link.file_path.has_value());
    EXPECT_EQ(*link.file_path, "Database/Schema.sql");
    EXPECT_EQ(link.line_number, 45);
    EXPECT_EQ(link.end_line_number, 67);
    EXPECT_TRUE(link.has_line_range());
    EXPECT_EQ(link.anchor_name, "create-tables");
}

TEST_F(LinkTokenizerTest, LocalAnchor) {
    auto link = single("// LINK: #local-anchor");
    EXPECT_TRUE(link.is_local_anchor);
    EXPECT_FALSE(link.file_path.has_value());
    EXPECT_EQ(link.anchor_name, "local-anchor");
}

TEST_F(LinkTokenizerTest, LocalAnchorDropsTrailingPunctuation) {
    auto link = single("// Explained in LINK: #setup.");
    EXPECT_EQ(link.anchor_name, "setup");
    EXPECT_EQ(link.target_length, 6u);
}

TEST_F(LinkTokenizerTest, SingleLine) {
    auto link = single("// LINK: src/main.cpp:42");
    EXPECT_EQ(link.file_path, "src/main.cpp");
    EXPECT_EQ(link.line_number, 42);
    EXPECT_FALSE(link.has_line_range());
}

TEST_F(LinkTokenizerTest, AnchorWithoutLine) {
    auto link = single("// LINK: docs/guide.md#install");
    EXPECT_EQ(link.file_path, "docs/guide.md");
    EXPECT_EQ(link.anchor_name, "install");
    EXPECT_FALSE(link.has_line_number());
}

// ============================================================================
// Keyword Rules
// ============================================================================

TEST_F(LinkTokenizerTest, LowercaseKeywordNeedsColon) {
    EXPECT_EQ(parse("// link: notes.md").size(), 1u);
    EXPECT_EQ(parse("// Link : notes.md").size(), 1u);
    EXPECT_TRUE(parse("// link notes.md").empty());
}

TEST_F(LinkTokenizerTest, UppercaseKeywordWithoutColon) {
    auto link = single("// LINK ./file.txt");
    EXPECT_EQ(link.file_path, "./file.txt");
    EXPECT_EQ(link.prefix, PathPrefix::Current);
}

TEST_F(LinkTokenizerTest, KeywordMustBeWholeWord) {
    EXPECT_TRUE(parse("// HYPERLINK: file.cs").empty());
    EXPECT_TRUE(parse("// LINKED: file.cs").empty());
    EXPECT_TRUE(parse("// a LINKED list").empty());
}

TEST_F(LinkTokenizerTest, NoKeywordFastPath) {
    EXPECT_TRUE(parse("int x = 1; // nothing to see").empty());
    EXPECT_FALSE(contains_link("int x = 1;"));
    EXPECT_TRUE(contains_link("// LINK: a.cs"));
}

TEST_F(LinkTokenizerTest, EmptyBodyIsNoMatch) {
    EXPECT_TRUE(parse("// LINK:").empty());
    EXPECT_TRUE(parse("// LINK:   ").empty());
    EXPECT_TRUE(parse("// LINK: #").empty());
    EXPECT_FALSE(contains_link("// LINK:"));
}

TEST_F(LinkTokenizerTest, MultipleLinksOnOneLine) {
    auto links = parse("// LINK: a.cs and LINK: b.cs:3");
    ASSERT_EQ(links.size(), 2u);
    EXPECT_EQ(links[0].file_path, "a.cs");
    EXPECT_EQ(links[1].file_path, "b.cs");
    EXPECT_EQ(links[1].line_number, 3);
}

TEST_F(LinkTokenizerTest, BodyStopsAtLineBreak) {
    auto link = single("// LINK: README\r\nmore");
    EXPECT_EQ(link.file_path, "README");
}

// ============================================================================
// Path Decoding
// ============================================================================

TEST_F(LinkTokenizerTest, PathWithSpaces) {
    auto link = single("// LINK: My Documents/notes.md:3 is relevant");
    EXPECT_EQ(link.file_path, "My Documents/notes.md");
    EXPECT_EQ(link.line_number, 3);
}

TEST_F(LinkTokenizerTest, PathWithoutExtensionTakesFirstWord) {
    auto link = single("// LINK: Makefile explains the build");
    EXPECT_EQ(link.file_path, "Makefile");
}

TEST_F(LinkTokenizerTest, TrailingPunctuationIsNotPartOfPath) {
    auto link = single("// (see LINK: docs/guide.md).");
    EXPECT_EQ(link.file_path, "docs/guide.md");
}

TEST_F(LinkTokenizerTest, ReversedRangeKeepsStartLine) {
    auto link = single("// LINK: file.cs:20-10");
    EXPECT_EQ(link.file_path, "file.cs");
    EXPECT_EQ(link.line_number, 20);
    EXPECT_FALSE(link.end_line_number.has_value());
}

TEST_F(LinkTokenizerTest, LineZeroStaysInPath) {
    auto link = single("// LINK: file.cs:0");
    EXPECT_EQ(link.file_path, "file.cs:0");
    EXPECT_FALSE(link.has_line_number());
}

TEST_F(LinkTokenizerTest, NonNumericSuffixStaysInPath) {
    auto link = single("// LINK: C:/work/file.cs");
    EXPECT_EQ(link.file_path, "C:/work/file.cs");
    EXPECT_FALSE(link.has_line_number());
}

// ============================================================================
// Path Prefixes
// ============================================================================

TEST_F(LinkTokenizerTest, ParentPrefixCountsDepth) {
    auto link = single("// LINK: ../../shared/utils.ts:10");
    EXPECT_EQ(link.prefix, PathPrefix::Parent);
    EXPECT_EQ(link.parent_depth, 2);
    EXPECT_EQ(link.line_number, 10);
}

TEST_F(LinkTokenizerTest, ClassifyPrefix) {
    EXPECT_EQ(classify_prefix("./a.cs"), std::make_pair(PathPrefix::Current, 0));
    EXPECT_EQ(classify_prefix("..\\lib\\x.cs"), std::make_pair(PathPrefix::Parent, 1));
    EXPECT_EQ(classify_prefix("/etc/hosts"), std::make_pair(PathPrefix::Root, 0));
    EXPECT_EQ(classify_prefix("~/config.json"), std::make_pair(PathPrefix::Home, 0));
    EXPECT_EQ(classify_prefix("@/src/app.ts"), std::make_pair(PathPrefix::Project, 0));
    EXPECT_EQ(classify_prefix("src/app.ts"), std::make_pair(PathPrefix::None, 0));
    EXPECT_EQ(classify_prefix(".hidden"), std::make_pair(PathPrefix::None, 0));
}

TEST_F(LinkTokenizerTest, PrefixNames) {
    EXPECT_EQ(prefix_name(PathPrefix::Parent), "parent");
    EXPECT_EQ(prefix_name(PathPrefix::Project), "project");
}

// ============================================================================
// Caret Lookup
// ============================================================================

TEST_F(LinkTokenizerTest, FindAtTarget) {
    std::string_view line = "// LINK: Services/UserService.cs here";
    size_t start = line.find("Services");
    size_t end = start + std::string_view("Services/UserService.cs").size();

    ASSERT_TRUE(find_at(line, start).has_value());
    EXPECT_EQ(find_at(line, start + 5)->file_path, "Services/UserService.cs");
    EXPECT_TRUE(find_at(line, end).has_value());
    EXPECT_FALSE(find_at(line, start - 1).has_value());
    EXPECT_FALSE(find_at(line, end + 2).has_value());
    EXPECT_FALSE(find_at(line, line.size()).has_value());
}

TEST_F(LinkTokenizerTest, FindAtPicksTheRightLink) {
    std::string_view line = "// LINK: a.cs and LINK: b.cs";
    auto second = find_at(line, line.rfind("b.cs"));
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->file_path, "b.cs");
}
