//! # Comment Spans in Code Lines
//!
//! Heuristics for finding the comment portion of a single line of code,
//! used by the tag scanner to skip `TODO` words that live in code or in
//! string literals.

#ifndef CSTUDIO_COMMENT_COMMENT_SPAN_HPP
#define CSTUDIO_COMMENT_COMMENT_SPAN_HPP

#include "comment/comment_style.hpp"
#include "common.hpp"

#include <string_view>
#include <vector>

namespace cstudio::comment {

/// Comment and literal syntax of the code around comments.
enum class CommentSyntax {
    CFamily, ///< `//` and `/* */` comments, `'x'` character literals
    Basic,   ///< `'` comments, `""` escapes, no character literals
};

/// Returns the syntax of a language's code.
[[nodiscard]] auto syntax_for(const CommentStyle& style) -> CommentSyntax;

/// Returns true if `position` falls inside a string or character literal.
///
/// Walks the line from its start, tracking `"..."` strings with backslash
/// escapes, verbatim `@"..."` strings with `""` escapes, and `'x'` character
/// literals. Under `CommentSyntax::Basic` every string uses `""` escapes and
/// `'` opens a comment instead. Works on one line only, so a string opened on
/// a previous line is not detected.
[[nodiscard]] auto is_inside_string_literal(std::string_view line, size_t position,
                                            CommentSyntax syntax = CommentSyntax::CFamily)
    -> bool;

/// Returns the comment portions of a line, in order.
///
/// A line whose trimmed text starts with `//`, `/*`, `*`, `'` or `<!--` is a
/// comment from its first non-blank character to the end. Otherwise the
/// line is scanned for `//` and `/* ... */` openers (or, for Basic, a `'`)
/// that are not inside a string literal.
[[nodiscard]] auto comment_spans(std::string_view line,
                                 CommentSyntax syntax = CommentSyntax::CFamily)
    -> std::vector<TextSpan>;

} // namespace cstudio::comment

#endif // CSTUDIO_COMMENT_COMMENT_SPAN_HPP
