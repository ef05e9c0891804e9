//! # Link Anchor Tokenizer
//!
//! Finds `LINK:` references inside a single line of comment text.
//!
//! ## Syntax
//!
//! ```text
//! LINK: [prefix]path[:line[-end]][#anchor]
//! LINK: #anchor
//! LINK path/to/file.cs          (uppercase keyword, colon optional)
//! ```
//!
//! | Prefix | Meaning                     |
//! |--------|-----------------------------|
//! | `./`   | Relative to the current file |
//! | `../`  | Parent directory, repeatable |
//! | `/`    | Solution root               |
//! | `~/`   | Solution root (alias)       |
//! | `@/`   | Project root                |
//!
//! Paths may contain spaces (`LINK: images/Add group calendar.png`). The
//! path ends at the first word that looks like a file name: one carrying an
//! extension, a `:line` suffix or an `#anchor`. When no word qualifies, the
//! path is the first word alone.
//!
//! Malformed suffixes never fail a match: a line number of `0`, an
//! overflowing number or a non-numeric suffix stays part of the path, and a
//! range whose end is not greater than its start keeps only its start.

#ifndef CSTUDIO_LINKS_LINK_TOKENIZER_HPP
#define CSTUDIO_LINKS_LINK_TOKENIZER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cstudio::links {

/// The path prefix of a link target.
enum class PathPrefix { None, Current, Parent, Root, Home, Project };

/// One `LINK:` occurrence in a line.
struct LinkAnchorInfo {
    size_t span_start = 0;    ///< Offset of the `LINK` keyword
    size_t span_length = 0;   ///< Keyword through end of target
    size_t target_start = 0;  ///< Offset of the target (after `LINK:` and spaces)
    size_t target_length = 0; ///< Length of `path:line#anchor`

    std::optional<std::string> file_path; ///< Path including its prefix; empty for local anchors
    bool is_local_anchor = false;
    std::optional<std::string> anchor_name;
    std::optional<int> line_number;     ///< 1-based
    std::optional<int> end_line_number; ///< Only set when greater than `line_number`

    PathPrefix prefix = PathPrefix::None;
    int parent_depth = 0; ///< Number of leading `../` segments

    [[nodiscard]] auto has_line_number() const -> bool {
        return line_number.has_value();
    }

    [[nodiscard]] auto has_line_range() const -> bool {
        return line_number.has_value() && end_line_number.has_value();
    }

    [[nodiscard]] auto has_anchor() const -> bool {
        return anchor_name.has_value();
    }

    [[nodiscard]] auto target_end() const -> size_t {
        return target_start + target_length;
    }
};

/// Returns true if the line contains at least one link reference.
///
/// Lines without the substring `link` (any case) are rejected without
/// further parsing.
[[nodiscard]] auto contains_link(std::string_view line) -> bool;

/// Parses every link reference of a line, left to right, non-overlapping.
[[nodiscard]] auto parse(std::string_view line) -> std::vector<LinkAnchorInfo>;

/// Returns the link whose target covers `offset`.
///
/// Only the target is clickable: an offset on the `LINK:` keyword yields
/// nullopt. The offset one past the target is still accepted, offsets at or
/// beyond the end of the line are not.
[[nodiscard]] auto find_at(std::string_view line, size_t offset) -> std::optional<LinkAnchorInfo>;

/// Classifies the prefix of a path and counts its `../` segments.
[[nodiscard]] auto classify_prefix(std::string_view path) -> std::pair<PathPrefix, int>;

[[nodiscard]] auto prefix_name(PathPrefix prefix) -> std::string_view;

} // namespace cstudio::links

#endif // CSTUDIO_LINKS_LINK_TOKENIZER_HPP
