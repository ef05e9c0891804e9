//! # Comment Block Scanner Implementation
//!
//! | Function                   | Description                               |
//! |----------------------------|-------------------------------------------|
//! | `find_all_blocks()`        | Forward pass over every line              |
//! | `find_block_at_position()` | Block containing an offset                |
//! | `find_blocks_in_span()`    | Blocks intersecting a span                |
//! | `block_body_lines()`       | Delimiter-free body text of a block       |

#include "comment/block_scanner.hpp"

#include "util/text.hpp"

#include <algorithm>

namespace cstudio::comment {

using namespace cstudio::util;

namespace {

auto starts_line_marker(std::string_view line, const CommentStyle& style) -> bool {
    return trim_start(line).starts_with(style.line_marker);
}

/// `/**` opens a documentation block, `/**/` is an empty ordinary comment.
auto starts_block_comment(std::string_view line, const CommentStyle& style) -> bool {
    if (!style.block) {
        return false;
    }
    auto trimmed = trim_start(line);
    return trimmed.starts_with(style.block->open) && !trimmed.starts_with("/**/");
}

auto make_block(const TextSnapshot& snapshot, const CommentStyle& style, size_t first, size_t last,
                bool block_style) -> CommentBlock {
    CommentBlock block;
    block.start_line = first;
    block.end_line = last;
    block.style = &style;
    block.is_block_style = block_style;
    for (size_t i = first; i <= last; ++i) {
        block.raw_lines.emplace_back(snapshot.line(i));
    }
    auto first_line = snapshot.line(first);
    block.indentation = std::string(first_line.substr(0, leading_whitespace(first_line)));
    block.span.start = snapshot.line_start(first);
    block.span.length = snapshot.line_end(last) - block.span.start;
    return block;
}

/// Returns the line holding the closing delimiter of a block opened on `first`.
auto find_block_close(const TextSnapshot& snapshot, const CommentStyle& style, size_t first)
    -> std::optional<size_t> {
    auto opening = snapshot.line(first);
    auto after_open = leading_whitespace(opening) + style.block->open.size();
    if (opening.find(style.block->close, after_open) != std::string_view::npos) {
        return first;
    }
    for (size_t i = first + 1; i < snapshot.line_count(); ++i) {
        if (snapshot.line(i).find(style.block->close) != std::string_view::npos) {
            return i;
        }
    }
    return std::nullopt;
}

auto strip_one_space(std::string_view text) -> std::string_view {
    if (!text.empty() && text.front() == ' ') {
        text.remove_prefix(1);
    }
    return text;
}

} // namespace

auto find_all_blocks(const TextSnapshot& snapshot, const CommentStyle& style)
    -> std::vector<CommentBlock> {
    std::vector<CommentBlock> blocks;
    size_t count = snapshot.line_count();
    size_t i = 0;

    while (i < count) {
        auto line = snapshot.line(i);

        if (starts_line_marker(line, style)) {
            size_t last = i;
            while (last + 1 < count && starts_line_marker(snapshot.line(last + 1), style)) {
                ++last;
            }
            blocks.push_back(make_block(snapshot, style, i, last, false));
            i = last + 1;
            continue;
        }

        if (starts_block_comment(line, style)) {
            if (auto close = find_block_close(snapshot, style, i)) {
                blocks.push_back(make_block(snapshot, style, i, *close, true));
                i = *close + 1;
                continue;
            }
        }

        ++i;
    }

    return blocks;
}

auto find_all_blocks(const TextSnapshot& snapshot, std::string_view content_type)
    -> std::vector<CommentBlock> {
    const auto* style = style_for_content_type(content_type);
    if (style == nullptr) {
        return {};
    }
    return find_all_blocks(snapshot, *style);
}

auto find_block_at_position(const TextSnapshot& snapshot, const CommentStyle& style, size_t offset)
    -> std::optional<CommentBlock> {
    if (offset > snapshot.content().size()) {
        return std::nullopt;
    }
    auto line = snapshot.line_from_offset(offset);
    for (auto& block : find_all_blocks(snapshot, style)) {
        if (block.contains_line(line)) {
            return std::move(block);
        }
        if (block.start_line > line) {
            break;
        }
    }
    return std::nullopt;
}

auto find_blocks_in_span(const TextSnapshot& snapshot, const CommentStyle& style, TextSpan span)
    -> std::vector<CommentBlock> {
    std::vector<CommentBlock> result;
    for (auto& block : find_all_blocks(snapshot, style)) {
        if (block.span.intersects(span)) {
            result.push_back(std::move(block));
        }
    }
    return result;
}

auto block_body_lines(const CommentBlock& block) -> std::vector<std::string> {
    std::vector<std::string> body;
    if (block.style == nullptr || block.raw_lines.empty()) {
        return body;
    }

    if (!block.is_block_style) {
        for (const auto& raw : block.raw_lines) {
            auto text = trim_start(raw);
            text.remove_prefix(std::min(text.size(), block.style->line_marker.size()));
            body.emplace_back(trim_end(strip_one_space(text)));
        }
        return body;
    }

    const auto& delims = *block.style->block;
    size_t last = block.raw_lines.size() - 1;
    for (size_t k = 0; k <= last; ++k) {
        std::string_view text = block.raw_lines[k];
        if (k == 0) {
            text = trim_start(text);
            text.remove_prefix(delims.open.size());
        }
        if (k == last) {
            auto close = text.find(delims.close);
            if (close != std::string_view::npos) {
                text = text.substr(0, close);
            }
        }
        if (k > 0) {
            text = trim_start(text);
            if (text.starts_with('*')) {
                text.remove_prefix(1);
            }
        }
        text = trim_end(strip_one_space(text));

        bool edge = k == 0 || k == last;
        if (edge && text.empty()) {
            continue;
        }
        body.emplace_back(text);
    }
    return body;
}

} // namespace cstudio::comment
