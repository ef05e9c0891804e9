//! # Tag Tokenizer
//!
//! Recognizes task tags (`TODO`, `HACK`, `ANCHOR`, ...) at the start of
//! comment content, together with their optional metadata section.
//!
//! ## Syntax
//!
//! ```text
//! // TODO: message
//! // TODO(@owner, #123, 2026-02-01): message
//! // HACK[#42] message
//! // ANCHOR(section-id)
//! <!-- NOTE: message -->
//! ```
//!
//! ## Metadata Tokens
//!
//! The text between the brackets is split on whitespace, commas and
//! semicolons. Only the first token of each kind is recorded.
//!
//! | Token          | Field      |
//! |----------------|------------|
//! | `@name`        | `owner`    |
//! | `#digits`      | `issue`    |
//! | `yyyy-MM-dd`   | `due_date` (valid calendar dates only) |
//! | anything else  | ignored    |
//!
//! For `ANCHOR`, metadata without an owner or issue is the anchor id.

#ifndef CSTUDIO_TAGS_TAG_TOKENIZER_HPP
#define CSTUDIO_TAGS_TAG_TOKENIZER_HPP

#include "comment/comment_span.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cstudio::tags {

/// Tag that declares a named navigation point.
constexpr std::string_view ANCHOR_TAG = "ANCHOR";

/// Returns the built-in tags in their canonical spelling.
[[nodiscard]] auto builtin_tags() -> const std::vector<std::string>&;

/// Splits a comma separated tag list.
///
/// Names are trimmed, empty entries dropped and duplicates (ignoring case)
/// removed, keeping the first spelling.
[[nodiscard]] auto parse_custom_tags(std::string_view csv) -> std::vector<std::string>;

/// One recognized tag occurrence.
struct TagMatch {
    std::string tag_name;   ///< Spelling from the tag list, not from the line
    size_t span_start = 0;  ///< Offset of the tag keyword
    size_t span_length = 0; ///< Keyword, metadata section and colon
    bool is_custom = false;

    std::optional<std::string> owner; ///< Without the `@`
    std::optional<int> issue;
    std::optional<std::chrono::year_month_day> due_date;
    std::optional<std::string> anchor_id;

    std::optional<std::string> metadata; ///< Raw text between the brackets
    std::string message;                 ///< Trimmed text after the tag
};

/// How `parse` reads a single line.
struct LineContext {
    comment::CommentSyntax syntax = comment::CommentSyntax::CFamily;
    bool bare_line_is_comment = true; ///< No delimiter means the line is comment text
};

/// Finds the tags of one line, in order.
///
/// Each comment portion of the line is examined once. A line without any
/// comment delimiter is comment text only when `context.bare_line_is_comment`
/// is set, as it is for text already known to be a comment. A tag found in
/// both lists is reported as known.
[[nodiscard]] auto parse(std::string_view line, const std::vector<std::string>& known,
                         const std::vector<std::string>& custom = {},
                         const LineContext& context = {}) -> std::vector<TagMatch>;

/// A tag located in a multi-line text.
struct TagItem {
    TagMatch tag;
    size_t line = 0;   ///< 1-based
    size_t column = 0; ///< 1-based
    std::string file;  ///< Filled in by the caller; empty for in-memory text
};

/// Scans every line of `text` as source code. `\n`, `\r\n` and `\r` all end
/// a line.
///
/// Only comment portions are searched. A `/* ... */` or `<!-- ... -->`
/// comment may span lines; code outside comments never yields a tag.
[[nodiscard]] auto scan_text(std::string_view text, const std::vector<std::string>& known,
                             const std::vector<std::string>& custom = {},
                             comment::CommentSyntax syntax = comment::CommentSyntax::CFamily)
    -> std::vector<TagItem>;

/// Formats a date as `yyyy-MM-dd`.
[[nodiscard]] auto format_date(const std::chrono::year_month_day& date) -> std::string;

} // namespace cstudio::tags

#endif // CSTUDIO_TAGS_TAG_TOKENIZER_HPP
