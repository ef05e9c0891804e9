//! # Reflow Engine Tests
//!
//! Tests for documentation comment reflow: compact and expanded layout,
//! greedy wrapping, blank line handling, verbatim `<code>`, idempotence,
//! and whole-buffer rewriting.

#include "comment/block_scanner.hpp"
#include "reflow/reflow_engine.hpp"
#include "util/text.hpp"
#include "xmldoc/xml_parser.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <sstream>

using namespace cstudio;
using namespace cstudio::comment;
using namespace cstudio::reflow;

class ReflowEngineTest : public ::testing::Test {
protected:
    static auto block_of(const std::string& source) -> CommentBlock {
        auto snapshot = TextSnapshot::from_string(source);
        auto blocks = find_all_blocks(snapshot, style_for(Language::CSharp));
        EXPECT_FALSE(blocks.empty()) << source;
        return blocks.empty() ? CommentBlock{} : blocks.front();
    }

    static auto config(int width, bool compact = true, bool blank_lines = true) -> ReflowConfig {
        auto result = make_reflow_config(width, compact, blank_lines);
        EXPECT_TRUE(is_ok(result));
        return is_ok(result) ? unwrap(result) : ReflowConfig{};
    }

    static auto split(const std::string& text) -> std::vector<std::string> {
        std::vector<std::string> lines;
        std::istringstream in(text);
        std::string line;
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    static auto non_whitespace(const std::vector<std::string>& lines) -> std::string {
        std::string out;
        for (const auto& line : lines) {
            for (char c : line) {
                if (!util::is_space(c)) {
                    out += c;
                }
            }
        }
        return out;
    }

    static auto words(size_t count) -> std::string {
        std::string text;
        for (size_t i = 0; i < count; ++i) {
            if (i > 0) {
                text += ' ';
            }
            text += "word" + std::to_string(i);
        }
        return text;
    }
};

// ============================================================================
// Configuration
// ============================================================================

TEST_F(ReflowEngineTest, ConfigRejectsNonPositiveWidth) {
    EXPECT_TRUE(is_err(make_reflow_config(0)));
    EXPECT_TRUE(is_err(make_reflow_config(-5)));

    auto one = make_reflow_config(1);
    ASSERT_TRUE(is_ok(one));
    EXPECT_EQ(unwrap(one).max_line_length, 1);
    EXPECT_TRUE(unwrap(one).use_compact_style);
    EXPECT_TRUE(unwrap(one).preserve_blank_lines);
}

// ============================================================================
// Compact Style
// ============================================================================

TEST_F(ReflowEngineTest, ShortSummaryBecomesCompact) {
    auto block = block_of("/// <summary>\n/// Gets the name.\n/// </summary>\n");
    auto result = reflow::reflow(block, config(120));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "/// <summary>Gets the name.</summary>");
}

TEST_F(ReflowEngineTest, CompactSummaryStaysOnOneLine) {
    auto block = block_of("/// <summary>Gets the name.</summary>\n");
    EXPECT_FALSE(reflow::reflow(block, config(120)).has_value());
}

TEST_F(ReflowEngineTest, LongSummaryExpands) {
    auto text = words(32);
    ASSERT_GE(text.size(), 200u);
    auto block = block_of("/// <summary>" + text + "</summary>\n");

    auto result = reflow::reflow(block, config(120));
    ASSERT_TRUE(result.has_value());
    auto lines = split(*result);
    ASSERT_GE(lines.size(), 3u);
    EXPECT_EQ(lines.front(), "/// <summary>");
    EXPECT_EQ(lines.back(), "/// </summary>");
}

TEST_F(ReflowEngineTest, ExpandedWhenCompactDisabled) {
    auto block = block_of("/// <summary>Gets the name.</summary>\n");
    auto result = reflow::reflow(block, config(120, false));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "/// <summary>\n/// Gets the name.\n/// </summary>");
}

TEST_F(ReflowEngineTest, AttributesSurviveCompaction) {
    auto block = block_of("/// <param name=\"id\">\n///   The identifier.\n/// </param>\n");
    auto result = reflow::reflow(block, config(120));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "/// <param name=\"id\">The identifier.</param>");
}

// ============================================================================
// Wrapping
// ============================================================================

TEST_F(ReflowEngineTest, WrapBound) {
    auto block = block_of("/// <summary>\n/// " + words(40) + "\n/// </summary>\n");
    auto result = reflow::reflow(block, config(40));
    ASSERT_TRUE(result.has_value());
    for (const auto& line : split(*result)) {
        EXPECT_LE(line.size(), 40u) << line;
    }
}

TEST_F(ReflowEngineTest, OverlongTokenGetsItsOwnLine) {
    std::string token(60, 'x');
    auto block = block_of("/// <summary>short " + token + " tail</summary>\n");
    auto result = reflow::reflow(block, config(30));
    ASSERT_TRUE(result.has_value());
    std::vector<std::string> expected = {"/// <summary>", "/// short", "/// " + token, "/// tail",
                                         "/// </summary>"};
    EXPECT_EQ(split(*result), expected);
}

TEST_F(ReflowEngineTest, ShortLinesAreJoined) {
    auto block = block_of("/// <remarks>\n/// One\n/// two\n/// three.\n/// <para>Next.</para>\n"
                          "/// </remarks>\n");
    auto result = reflow::reflow(block, config(120));
    ASSERT_TRUE(result.has_value());
    std::vector<std::string> expected = {"/// <remarks>", "/// One two three.",
                                         "/// <para>Next.</para>", "/// </remarks>"};
    EXPECT_EQ(split(*result), expected);
}

TEST_F(ReflowEngineTest, InlineElementIsNotSplit) {
    auto block = block_of("/// <summary>Calls <see cref=\"Service.Run\"/>. Then <c>stop now</c> "
                          "returns.</summary>\n");
    auto result = reflow::reflow(block, config(30));
    ASSERT_TRUE(result.has_value());
    auto lines = split(*result);
    EXPECT_NE(std::find(lines.begin(), lines.end(), "/// Calls"), lines.end());
    EXPECT_NE(std::find(lines.begin(), lines.end(), "/// <see cref=\"Service.Run\"/>."),
              lines.end());
    EXPECT_NE(std::find(lines.begin(), lines.end(), "/// Then <c>stop now</c>"), lines.end());
}

TEST_F(ReflowEngineTest, WidthOfOneTerminates) {
    auto block = block_of("/// <summary>a b c</summary>\n");
    auto result = reflow::reflow(block, config(1));
    ASSERT_TRUE(result.has_value());
    std::vector<std::string> expected = {"/// <summary>", "/// a", "/// b", "/// c",
                                         "/// </summary>"};
    EXPECT_EQ(split(*result), expected);
}

TEST_F(ReflowEngineTest, UnvalidatedWidthActsAsOne) {
    for (int width : {0, -7}) {
        ReflowEngine engine(
            ReflowConfig{.max_line_length = width, .use_compact_style = true,
                         .preserve_blank_lines = true});
        EXPECT_EQ(engine.config().max_line_length, 1);

        auto block = block_of("/// <summary>a b c</summary>\n");
        std::vector<std::string> expected = {"/// <summary>", "/// a", "/// b", "/// c",
                                             "/// </summary>"};
        EXPECT_EQ(engine.format_lines(block), expected) << width;
    }
}

// ============================================================================
// Character Widths
// ============================================================================

TEST_F(ReflowEngineTest, CharCountSkipsContinuationBytes) {
    EXPECT_EQ(util::char_count(""), 0u);
    EXPECT_EQ(util::char_count("abc"), 3u);
    EXPECT_EQ(util::char_count("\xC3\xA9t\xC3\xA9"), 3u);          // été
    EXPECT_EQ(util::char_count("\xE2\x82\xAC" "5"), 2u);            // €5
    EXPECT_EQ(util::char_count("\xF0\x9F\x98\x80"), 1u);            // U+1F600
}

TEST_F(ReflowEngineTest, MultiByteLineWithinWidthIsNoOp) {
    std::string e10;
    for (int i = 0; i < 10; ++i) {
        e10 += "\xC3\xA9";
    }
    // 25 characters, 45 bytes.
    auto block = block_of("/// <summary>\n/// " + e10 + " " + e10 + "\n/// </summary>\n");
    EXPECT_FALSE(reflow::reflow(block, config(30, false)).has_value());
}

TEST_F(ReflowEngineTest, MultiByteWordsWrapByCharacters) {
    const std::string word = "\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9"; // 5 characters
    std::string text;
    for (int i = 0; i < 6; ++i) {
        text += (i > 0 ? " " : "") + word;
    }
    auto block = block_of("/// <summary>" + text + "</summary>\n");

    auto result = reflow::reflow(block, config(16, false));
    ASSERT_TRUE(result.has_value());
    auto pair = "/// " + word + " " + word;
    std::vector<std::string> expected = {"/// <summary>", pair, pair, pair, "/// </summary>"};
    EXPECT_EQ(split(*result), expected);
    for (const auto& line : split(*result)) {
        EXPECT_LE(util::char_count(line), 16u) << line;
    }
}

TEST_F(ReflowEngineTest, MultiByteSummaryStaysCompactAtExactWidth) {
    // "Gr\xC3\xB6\xC3\x9F" is "Größe", "\xC3\xA4ndern" is "ändern".
    const std::string compact = "/// <summary>Gr\xC3\xB6\xC3\x9F" "e \xC3\xA4ndern.</summary>";
    ASSERT_EQ(util::char_count(compact), 36u);

    auto block = block_of("/// <summary>\n/// Gr\xC3\xB6\xC3\x9F" "e \xC3\xA4ndern.\n/// </summary>\n");
    auto result = reflow::reflow(block, config(36));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, compact);
}

TEST_F(ReflowEngineTest, InlineTokensGluePunctuation) {
    auto nodes = xmldoc::parse_xml("Use <see cref=\"X\"/>. Then  go");
    std::vector<const xmldoc::XmlNode*> run;
    for (const auto& node : nodes) {
        run.push_back(&node);
    }
    std::vector<std::string> expected = {"Use", "<see cref=\"X\"/>.", "Then", "go"};
    EXPECT_EQ(inline_tokens(run), expected);
}

// ============================================================================
// Blank Lines and Verbatim Code
// ============================================================================

TEST_F(ReflowEngineTest, BlankLinesArePreserved) {
    auto block = block_of("/// <remarks>\n/// First paragraph.\n///\n/// Second paragraph.\n"
                          "/// </remarks>\n");
    EXPECT_FALSE(reflow::reflow(block, config(120)).has_value());
}

TEST_F(ReflowEngineTest, BlankLinesDroppedWhenNotPreserved) {
    auto block = block_of("/// <remarks>\n/// First paragraph.\n///\n/// Second paragraph.\n"
                          "/// </remarks>\n");
    auto result = reflow::reflow(block, config(120, true, false));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "/// <remarks>First paragraph. Second paragraph.</remarks>");
}

TEST_F(ReflowEngineTest, CodeIsNeverRewrapped) {
    std::string source = "/// <example>\n"
                         "/// <code>\n"
                         "///   var result = Compute(first, second, third);\n"
                         "///\n"
                         "///   Run(result);\n"
                         "/// </code>\n"
                         "/// </example>\n";
    EXPECT_FALSE(reflow::reflow(block_of(source), config(30)).has_value());
}

// ============================================================================
// Block Forms
// ============================================================================

TEST_F(ReflowEngineTest, NoBlockLevelElementIsNoOp) {
    auto block = block_of("/// Plain text without any tag that runs on for a while.\n");
    EXPECT_FALSE(reflow::reflow(block, config(20)).has_value());

    ReflowEngine engine(config(20));
    EXPECT_TRUE(engine.format_lines(block).empty());
}

TEST_F(ReflowEngineTest, SlashStarBlockKeepsItsForm) {
    auto block = block_of("    /** <summary>Adds.</summary> */\n    int Add();\n");
    ASSERT_TRUE(block.is_block_style);
    auto result = reflow::reflow(block, config(120));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "    /**\n     * <summary>Adds.</summary>\n     */");
}

TEST_F(ReflowEngineTest, IndentationIsKept) {
    auto block = block_of("        /// <summary>\n        /// Gets.\n        /// </summary>\n");
    auto result = reflow::reflow(block, config(120));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "        /// <summary>Gets.</summary>");
}

// ============================================================================
// Properties
// ============================================================================

TEST_F(ReflowEngineTest, ReflowIsIdempotent) {
    std::vector<std::string> sources = {
        "/// <summary>\n/// " + words(50) + "\n/// </summary>\n/// <returns>x</returns>\n",
        "/// <remarks>\n/// a\n///\n/// b <see cref=\"T\"/>\n/// <para>" + words(20) +
            "</para>\n/// </remarks>\n",
        "/** <summary>" + words(25) + "</summary> */\n",
    };

    for (int width : {30, 60, 120}) {
        for (const auto& source : sources) {
            auto first = reflow::reflow(block_of(source), config(width));
            ASSERT_TRUE(first.has_value()) << source;
            EXPECT_FALSE(reflow::reflow(block_of(*first + "\n"), config(width)).has_value())
                << "width " << width << ":\n"
                << *first;
        }
    }
}

TEST_F(ReflowEngineTest, OnlyWhitespaceChanges) {
    auto source = "/// <summary>\n/// " + words(12) + " <c>a  b</c>\n/// " + words(9) +
                  "\n/// </summary>\n/// <param name=\"x\">" + words(15) + "</param>\n";
    auto original = block_of(source);
    auto result = reflow::reflow(original, config(50));
    ASSERT_TRUE(result.has_value());

    auto reflowed = block_of(*result + "\n");
    EXPECT_EQ(non_whitespace(block_body_lines(reflowed)),
              non_whitespace(block_body_lines(original)));
}

// ============================================================================
// Whole Buffer
// ============================================================================

TEST_F(ReflowEngineTest, DocumentReplacesChangedBlocks) {
    auto snapshot = TextSnapshot::from_string("class A\n{\n    /// <summary>\n    /// Gets.\n"
                                              "    /// </summary>\n    int X;\n"
                                              "    /// <summary>Sets.</summary>\n    int Y;\n}\n");
    auto result = reflow_document(snapshot, style_for(Language::CSharp), config(120));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "class A\n{\n    /// <summary>Gets.</summary>\n    int X;\n"
                       "    /// <summary>Sets.</summary>\n    int Y;\n}\n");
}

TEST_F(ReflowEngineTest, DocumentKeepsCrlf) {
    auto snapshot = TextSnapshot::from_string("/// <summary>\r\n/// Gets.\r\n/// </summary>\r\n"
                                              "int X;\r\n");
    auto result = reflow_document(snapshot, style_for(Language::CSharp), config(20, false));
    EXPECT_FALSE(result.has_value());

    result = reflow_document(snapshot, style_for(Language::CSharp), config(120));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "/// <summary>Gets.</summary>\r\nint X;\r\n");
}

TEST_F(ReflowEngineTest, FormattedDocumentIsNoOp) {
    auto snapshot = TextSnapshot::from_string("/// <summary>Gets.</summary>\nint X;\n");
    EXPECT_FALSE(
        reflow_document(snapshot, style_for(Language::CSharp), config(120)).has_value());
}
