//! # Text Snapshot
//!
//! An immutable view of a buffer as an ordered line sequence with line start
//! offsets. Every analysis entry point takes a snapshot, so callers adapt
//! their live editor buffer (or a file on disk) once per call.
//!
//! ## Example
//!
//! ```cpp
//! auto snapshot = TextSnapshot::from_string("/// <summary>\n/// Hi\n/// </summary>\n");
//! snapshot.line_count();          // 4 (the last line is empty)
//! snapshot.line(1);               // "/// Hi"
//! snapshot.line_from_offset(16);  // 1
//! ```

#ifndef CSTUDIO_COMMENT_TEXT_SNAPSHOT_HPP
#define CSTUDIO_COMMENT_TEXT_SNAPSHOT_HPP

#include "common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace cstudio::comment {

/// Immutable buffer content with an index of line starts.
///
/// Lines are 0-indexed. Both `\n` and `\r\n` terminate a line, and the
/// views returned by `line()` never include the terminator. Views stay valid
/// as long as the snapshot exists.
class TextSnapshot {
public:
    TextSnapshot(std::string name, std::string content);

    [[nodiscard]] auto content() const -> std::string_view {
        return content_;
    }

    [[nodiscard]] auto name() const -> std::string_view {
        return name_;
    }

    [[nodiscard]] auto line_count() const -> size_t {
        return line_starts_.size();
    }

    /// Returns line `index` without its terminator, or an empty view when out of range.
    [[nodiscard]] auto line(size_t index) const -> std::string_view;

    /// Offset of the first character of line `index`.
    [[nodiscard]] auto line_start(size_t index) const -> size_t;

    /// Offset one past the last character of line `index`, excluding the terminator.
    [[nodiscard]] auto line_end(size_t index) const -> size_t;

    /// Maps a character offset to its 0-based line. Offsets past the end map
    /// to the last line.
    [[nodiscard]] auto line_from_offset(size_t offset) const -> size_t;

    /// The dominant line terminator, `"\r\n"` if the first terminator is CRLF.
    [[nodiscard]] auto line_ending() const -> std::string_view;

    /// Whether the content ends with a line terminator.
    [[nodiscard]] auto ends_with_newline() const -> bool;

    [[nodiscard]] static auto from_string(std::string content, std::string name = "<input>")
        -> TextSnapshot;

    /// Joins `lines` with `\n`.
    [[nodiscard]] static auto from_lines(const std::vector<std::string>& lines) -> TextSnapshot;

    /// Reads a file. Returns an error message if it cannot be read.
    [[nodiscard]] static auto from_file(const std::string& path) -> Result<TextSnapshot, std::string>;

private:
    std::string name_;
    std::string content_;
    std::vector<size_t> line_starts_;

    void build_line_index();
};

} // namespace cstudio::comment

#endif // CSTUDIO_COMMENT_TEXT_SNAPSHOT_HPP
