//! # Reflow Engine Implementation
//!
//! | Method              | Description                                   |
//! |---------------------|-----------------------------------------------|
//! | `reflow()`          | Format a block, or report that nothing changed |
//! | `format_lines()`    | Format a block into output lines              |
//! | `format_nodes()`    | Lay out a sequence of sibling nodes           |
//! | `format_element()`  | Compact or expanded block element             |
//! | `format_verbatim()` | `<code>` content, line for line               |
//! | `wrap()`            | Greedy fill of tokens into lines              |

#include "reflow/reflow_engine.hpp"

#include "util/text.hpp"
#include "xmldoc/xml_parser.hpp"

#include <algorithm>

namespace cstudio::reflow {

using namespace cstudio::util;
using xmldoc::ElementKind;
using xmldoc::XmlElement;
using xmldoc::XmlNode;

namespace {

auto has_block_level_node(const std::vector<XmlNode>& nodes) -> bool {
    for (const auto& node : nodes) {
        if (node.is_block_level()) {
            return true;
        }
    }
    return false;
}

auto join_tokens(const std::vector<std::string>& tokens) -> std::string {
    std::string joined;
    for (const auto& token : tokens) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += token;
    }
    return joined;
}

auto same_modulo_trailing_whitespace(const std::vector<std::string>& formatted,
                                     const std::vector<std::string>& original) -> bool {
    if (formatted.size() != original.size()) {
        return false;
    }
    for (size_t i = 0; i < formatted.size(); ++i) {
        if (trim_end(formatted[i]) != trim_end(original[i])) {
            return false;
        }
    }
    return true;
}

} // namespace

auto inline_tokens(const std::vector<const XmlNode*>& nodes) -> std::vector<std::string> {
    std::vector<std::string> tokens;
    std::string current;

    for (const auto* node : nodes) {
        if (node->is_text()) {
            for (char c : node->as_text().content) {
                if (is_space(c)) {
                    if (!current.empty()) {
                        tokens.push_back(std::move(current));
                        current.clear();
                    }
                } else {
                    current += c;
                }
            }
        } else if (node->is_element()) {
            current += xmldoc::to_inline_string(*node);
        }
    }

    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

// ============================================================================
// ReflowEngine
// ============================================================================

ReflowEngine::ReflowEngine(ReflowConfig config) : config_(config) {
    config_.max_line_length = std::max(config_.max_line_length, 1);
}

void ReflowEngine::emit_line(std::string_view text) {
    lines_.push_back(prefix_ + std::string(text));
}

void ReflowEngine::emit_blank_line() {
    lines_.push_back(blank_prefix_);
}

auto ReflowEngine::fits(size_t content_length) const -> bool {
    return char_count(prefix_) + content_length <= static_cast<size_t>(config_.max_line_length);
}

auto ReflowEngine::format_lines(const comment::CommentBlock& block) -> std::vector<std::string> {
    lines_.clear();
    if (block.style == nullptr) {
        return {};
    }

    auto nodes = xmldoc::parse(block);
    if (!has_block_level_node(nodes)) {
        return {};
    }

    if (block.is_block_style) {
        prefix_ = block.indentation + " * ";
        blank_prefix_ = block.indentation + " *";
        lines_.push_back(block.indentation + std::string(block.style->block->open));
    } else {
        blank_prefix_ = block.indentation + std::string(block.style->line_marker);
        prefix_ = blank_prefix_ + " ";
    }

    format_nodes(nodes);

    if (block.is_block_style) {
        lines_.push_back(block.indentation + " " + std::string(block.style->block->close));
    }
    return std::move(lines_);
}

auto ReflowEngine::reflow(const comment::CommentBlock& block) -> std::optional<std::string> {
    auto formatted = format_lines(block);
    if (formatted.empty() || same_modulo_trailing_whitespace(formatted, block.raw_lines)) {
        return std::nullopt;
    }

    std::string text;
    for (size_t i = 0; i < formatted.size(); ++i) {
        if (i > 0) {
            text += '\n';
        }
        text += formatted[i];
    }
    return text;
}

void ReflowEngine::format_nodes(const std::vector<XmlNode>& nodes) {
    std::vector<const XmlNode*> run;
    auto flush_run = [&] {
        wrap(inline_tokens(run));
        run.clear();
    };

    for (const auto& node : nodes) {
        if (node.is_blank_line()) {
            // Without preservation a separator is plain whitespace inside the run.
            if (config_.preserve_blank_lines) {
                flush_run();
                emit_blank_line();
            }
        } else if (node.is_block_level()) {
            flush_run();
            format_element(node.as_element());
        } else {
            run.push_back(&node);
        }
    }
    flush_run();
}

void ReflowEngine::format_element(const XmlElement& element) {
    if (element.self_closing) {
        emit_line(xmldoc::open_tag(element));
        return;
    }

    if (element.kind == ElementKind::Verbatim) {
        format_verbatim(element);
        return;
    }

    bool separated = config_.preserve_blank_lines && element.has_blank_line_children();
    if (config_.use_compact_style && !separated && !element.has_block_children()) {
        std::vector<const XmlNode*> content;
        for (const auto& child : element.children) {
            content.push_back(&child);
        }
        auto single = xmldoc::open_tag(element) + join_tokens(inline_tokens(content)) +
                      xmldoc::close_tag(element);
        if (fits(char_count(single))) {
            emit_line(single);
            return;
        }
    }

    emit_line(xmldoc::open_tag(element));
    format_nodes(element.children);
    emit_line(xmldoc::close_tag(element));
}

void ReflowEngine::format_verbatim(const XmlElement& element) {
    std::string content;
    for (const auto& child : element.children) {
        if (child.is_text()) {
            content += child.as_text().content;
        }
    }

    std::vector<std::string_view> code_lines;
    std::string_view rest = content;
    while (true) {
        auto newline = rest.find('\n');
        code_lines.push_back(rest.substr(0, newline));
        if (newline == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(newline + 1);
    }

    // The remainders of the open and close tag lines are not part of the code.
    if (!code_lines.empty() && is_blank(code_lines.front())) {
        code_lines.erase(code_lines.begin());
    }
    if (!code_lines.empty() && is_blank(code_lines.back())) {
        code_lines.pop_back();
    }

    emit_line(xmldoc::open_tag(element));
    for (auto line : code_lines) {
        if (is_blank(line)) {
            emit_blank_line();
        } else {
            emit_line(trim_end(line));
        }
    }
    emit_line(xmldoc::close_tag(element));
}

void ReflowEngine::wrap(const std::vector<std::string>& tokens) {
    std::string line;
    size_t line_length = 0;
    for (const auto& token : tokens) {
        size_t token_length = char_count(token);
        if (line.empty()) {
            line = token;
            line_length = token_length;
        } else if (fits(line_length + 1 + token_length)) {
            line += ' ';
            line += token;
            line_length += 1 + token_length;
        } else {
            emit_line(line);
            line = token;
            line_length = token_length;
        }
    }
    if (!line.empty()) {
        emit_line(line);
    }
}

// ============================================================================
// Free Functions
// ============================================================================

auto reflow(const comment::CommentBlock& block, const ReflowConfig& config)
    -> std::optional<std::string> {
    ReflowEngine engine(config);
    return engine.reflow(block);
}

auto reflow_document(const comment::TextSnapshot& snapshot, const comment::CommentStyle& style,
                     const ReflowConfig& config) -> std::optional<std::string> {
    ReflowEngine engine(config);
    auto content = snapshot.content();
    auto line_ending = snapshot.line_ending();

    std::string out;
    size_t cursor = 0;
    bool changed = false;

    for (const auto& block : comment::find_all_blocks(snapshot, style)) {
        auto replacement = engine.reflow(block);
        if (!replacement) {
            continue;
        }
        changed = true;
        out.append(content.substr(cursor, block.span.start - cursor));
        for (char c : *replacement) {
            if (c == '\n') {
                out.append(line_ending);
            } else {
                out += c;
            }
        }
        cursor = block.span.end();
    }

    if (!changed) {
        return std::nullopt;
    }
    out.append(content.substr(cursor));
    return out;
}

} // namespace cstudio::reflow
