#include "comment/comment_span.hpp"

#include "comment/comment_style.hpp"
#include "util/text.hpp"

namespace cstudio::comment {

using namespace cstudio::util;

namespace {

enum class LiteralState { Code, String, VerbatimString, Char };

/// Advances the literal state machine over `line[i]`, returning the index of
/// the next character to examine.
auto step(std::string_view line, size_t i, LiteralState& state, CommentSyntax syntax) -> size_t {
    char c = line[i];
    bool has_next = i + 1 < line.size();
    switch (state) {
    case LiteralState::Code:
        if (syntax == CommentSyntax::Basic) {
            if (c == '"') {
                state = LiteralState::VerbatimString;
            }
            return i + 1;
        }
        if (c == '@' && has_next && line[i + 1] == '"') {
            state = LiteralState::VerbatimString;
            return i + 2;
        }
        if (c == '"') {
            state = LiteralState::String;
        } else if (c == '\'') {
            state = LiteralState::Char;
        }
        return i + 1;
    case LiteralState::String:
        if (c == '\\') {
            return i + 2;
        }
        if (c == '"') {
            state = LiteralState::Code;
        }
        return i + 1;
    case LiteralState::VerbatimString:
        if (c == '"') {
            if (has_next && line[i + 1] == '"') {
                return i + 2;
            }
            state = LiteralState::Code;
        }
        return i + 1;
    case LiteralState::Char:
        if (c == '\\') {
            return i + 2;
        }
        if (c == '\'') {
            state = LiteralState::Code;
        }
        return i + 1;
    }
    return i + 1;
}

} // namespace

auto syntax_for(const CommentStyle& style) -> CommentSyntax {
    return style.language == Language::VisualBasic ? CommentSyntax::Basic
                                                   : CommentSyntax::CFamily;
}

auto is_inside_string_literal(std::string_view line, size_t position, CommentSyntax syntax)
    -> bool {
    auto state = LiteralState::Code;
    size_t i = 0;
    while (i < position && i < line.size()) {
        i = step(line, i, state, syntax);
    }
    // An escape pair or verbatim opener may step across `position`.
    if (i > position) {
        return true;
    }
    return state != LiteralState::Code;
}

auto comment_spans(std::string_view line, CommentSyntax syntax) -> std::vector<TextSpan> {
    std::vector<TextSpan> spans;
    size_t first = leading_whitespace(line);
    if (first == line.size()) {
        return spans;
    }

    if (is_comment_line(line) || line.substr(first).starts_with("<!--")) {
        spans.push_back({first, line.size() - first});
        return spans;
    }

    auto state = LiteralState::Code;
    size_t i = 0;
    while (i < line.size()) {
        if (syntax == CommentSyntax::Basic) {
            if (state == LiteralState::Code && line[i] == '\'') {
                spans.push_back({i, line.size() - i});
                break;
            }
        } else if (state == LiteralState::Code && i + 1 < line.size() && line[i] == '/') {
            if (line[i + 1] == '/') {
                spans.push_back({i, line.size() - i});
                break;
            }
            if (line[i + 1] == '*') {
                auto close = line.find("*/", i + 2);
                size_t end = close == std::string_view::npos ? line.size() : close + 2;
                spans.push_back({i, end - i});
                i = end;
                continue;
            }
        }
        i = step(line, i, state, syntax);
    }
    return spans;
}

} // namespace cstudio::comment
