//! # Comment Block Scanner
//!
//! Locates documentation comment blocks in a text snapshot.
//!
//! ## Block Forms
//!
//! | Form        | Participating lines                                   |
//! |-------------|-------------------------------------------------------|
//! | Line marker | every line whose trimmed text starts with the marker  |
//! | Block       | from a line starting with `/**` to the line with `*/` |
//!
//! A line-marker block is the maximal run of consecutive marker lines. Any
//! other line (blank or code) ends it. A `/** */` block ends at its closing
//! delimiter, so a block directly followed by a `///` run, or by another
//! `/** */` block, is reported as two blocks.
//!
//! Scanning is a single forward pass and never fails: an unterminated `/**`
//! simply does not form a block.

#ifndef CSTUDIO_COMMENT_BLOCK_SCANNER_HPP
#define CSTUDIO_COMMENT_BLOCK_SCANNER_HPP

#include "comment/comment_style.hpp"
#include "comment/text_snapshot.hpp"
#include "common.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cstudio::comment {

/// A contiguous documentation comment.
///
/// Blocks are values produced by the scanner. After an edit the caller
/// re-scans instead of patching a block.
struct CommentBlock {
    size_t start_line = 0;              ///< First line (0-based, inclusive)
    size_t end_line = 0;                ///< Last line (0-based, inclusive)
    std::vector<std::string> raw_lines; ///< Lines as they appear in the buffer
    const CommentStyle* style = nullptr;
    std::string indentation;            ///< Leading whitespace of the first line
    bool is_block_style = false;        ///< `/** ... */` rather than a marker run
    TextSpan span;                      ///< Start of first line to end of last line

    [[nodiscard]] auto line_count() const -> size_t {
        return end_line - start_line + 1;
    }

    [[nodiscard]] auto contains_line(size_t line) const -> bool {
        return line >= start_line && line <= end_line;
    }
};

/// Finds every documentation comment block, in buffer order.
[[nodiscard]] auto find_all_blocks(const TextSnapshot& snapshot, const CommentStyle& style)
    -> std::vector<CommentBlock>;

/// Same as above with the style looked up by content type. An unknown
/// content type yields an empty result.
[[nodiscard]] auto find_all_blocks(const TextSnapshot& snapshot, std::string_view content_type)
    -> std::vector<CommentBlock>;

/// Returns the block containing the line of `offset`, if any.
[[nodiscard]] auto find_block_at_position(const TextSnapshot& snapshot, const CommentStyle& style,
                                          size_t offset) -> std::optional<CommentBlock>;

/// Returns the blocks whose span intersects `span`, in buffer order.
[[nodiscard]] auto find_blocks_in_span(const TextSnapshot& snapshot, const CommentStyle& style,
                                       TextSpan span) -> std::vector<CommentBlock>;

/// Strips the comment delimiters from every line of a block.
///
/// Each marker (`///`, `'''`, the `*` of a block continuation) is removed
/// together with one following space, and trailing whitespace is trimmed.
/// For the `/** */` form, the opening and closing lines contribute a body
/// line only when they carry text.
[[nodiscard]] auto block_body_lines(const CommentBlock& block) -> std::vector<std::string>;

} // namespace cstudio::comment

#endif // CSTUDIO_COMMENT_BLOCK_SCANNER_HPP
