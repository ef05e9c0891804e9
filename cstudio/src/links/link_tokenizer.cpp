//! # Link Anchor Tokenizer Implementation
//!
//! Hand-written scanner over one line. Each occurrence goes through three
//! steps:
//!
//! 1. `match_keyword`: `LINK` as a whole word, optional blanks, optional `:`
//! 2. `body_end`: the body runs to the next valid keyword or line break
//! 3. `decode_target`: split `path:line-end#anchor` from the right

#include "links/link_tokenizer.hpp"

#include "util/text.hpp"

#include <cctype>
#include <charconv>

namespace cstudio::links {

using namespace cstudio::util;

namespace {

constexpr std::string_view KEYWORD = "LINK";
constexpr std::string_view TRAILING_PUNCTUATION = ".,;!?)]}\"'";

auto is_blank_char(char c) -> bool {
    return c == ' ' || c == '\t';
}

auto is_separator(char c) -> bool {
    return c == '/' || c == '\\';
}

/// Returns the offset where the body starts if a valid keyword begins at
/// `pos`.
///
/// Any casing is accepted when a colon follows. Without the colon the
/// keyword must be uppercase and followed by a blank.
auto match_keyword(std::string_view line, size_t pos) -> std::optional<size_t> {
    if (!starts_with_ignore_case(line.substr(pos), KEYWORD)) {
        return std::nullopt;
    }
    if (pos > 0 && is_word_char(line[pos - 1])) {
        return std::nullopt;
    }
    size_t after = pos + KEYWORD.size();
    if (after < line.size() && is_word_char(line[after])) {
        return std::nullopt;
    }

    size_t i = after;
    while (i < line.size() && is_blank_char(line[i])) {
        ++i;
    }
    if (i < line.size() && line[i] == ':') {
        ++i;
        while (i < line.size() && is_blank_char(line[i])) {
            ++i;
        }
        return i;
    }
    if (line.substr(pos, KEYWORD.size()) != KEYWORD || i == after) {
        return std::nullopt;
    }
    return i;
}

struct KeywordMatch {
    size_t start;
    size_t body_start;
};

auto next_keyword(std::string_view line, size_t from) -> std::optional<KeywordMatch> {
    size_t pos = find_ignore_case(line, KEYWORD, from);
    while (pos != std::string_view::npos) {
        if (auto body_start = match_keyword(line, pos)) {
            return KeywordMatch{.start = pos, .body_start = *body_start};
        }
        pos = find_ignore_case(line, KEYWORD, pos + 1);
    }
    return std::nullopt;
}

auto body_end(std::string_view line, size_t body_start) -> size_t {
    size_t end = line.find_first_of("\r\n", body_start);
    if (end == std::string_view::npos) {
        end = line.size();
    }
    if (auto next = next_keyword(line.substr(0, end), body_start)) {
        end = next->start;
    }
    return end;
}

auto strip_trailing_punctuation(std::string_view word) -> std::string_view {
    while (!word.empty() && TRAILING_PUNCTUATION.find(word.back()) != std::string_view::npos) {
        word.remove_suffix(1);
    }
    return word;
}

auto has_extension(std::string_view word) -> bool {
    size_t slash = word.find_last_of("/\\");
    auto segment = slash == std::string_view::npos ? word : word.substr(slash + 1);
    size_t dot = segment.rfind('.');
    if (dot == std::string_view::npos || dot + 1 == segment.size()) {
        return false;
    }
    for (char c : segment.substr(dot + 1)) {
        if (!std::isalnum(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

auto has_line_suffix(std::string_view word) -> bool {
    for (size_t i = 0; i + 1 < word.size(); ++i) {
        if (word[i] == ':' && is_digit(word[i + 1])) {
            return true;
        }
    }
    return false;
}

/// A word ends the path when it names a file: an extension, a `:line`
/// suffix or an `#anchor`.
auto ends_path(std::string_view word) -> bool {
    return word.find('#') != std::string_view::npos || has_line_suffix(word) ||
           has_extension(word);
}

/// Parses a positive decimal number made of the whole input.
auto parse_line_number(std::string_view digits) -> std::optional<int> {
    if (digits.empty()) {
        return std::nullopt;
    }
    int value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size() || value < 1) {
        return std::nullopt;
    }
    return value;
}

struct LineSuffix {
    int line;
    std::optional<int> end_line;
};

/// Parses `N` or `N-M` after the last colon of a path.
auto parse_line_suffix(std::string_view suffix) -> std::optional<LineSuffix> {
    size_t dash = suffix.find('-');
    auto line = parse_line_number(suffix.substr(0, dash));
    if (!line) {
        return std::nullopt;
    }
    if (dash == std::string_view::npos) {
        return LineSuffix{.line = *line, .end_line = std::nullopt};
    }

    auto end_text = suffix.substr(dash + 1);
    if (end_text.empty()) {
        return std::nullopt;
    }
    for (char c : end_text) {
        if (!is_digit(c)) {
            return std::nullopt;
        }
    }
    auto end_line = parse_line_number(end_text);
    if (end_line && *end_line <= *line) {
        end_line.reset();
    }
    return LineSuffix{.line = *line, .end_line = end_line};
}

/// Fills the path, line and anchor fields from the target text.
///
/// Returns false when nothing usable remains.
auto decode_target(std::string_view target, LinkAnchorInfo& info) -> bool {
    auto path = target;

    size_t hash = path.find('#');
    if (hash != std::string_view::npos && hash + 1 < path.size()) {
        info.anchor_name = std::string(path.substr(hash + 1));
        path = path.substr(0, hash);
    }

    size_t colon = path.rfind(':');
    if (colon != std::string_view::npos) {
        if (auto suffix = parse_line_suffix(path.substr(colon + 1))) {
            info.line_number = suffix->line;
            info.end_line_number = suffix->end_line;
            path = path.substr(0, colon);
        }
    }

    path = trim_end(path);
    if (path.empty()) {
        if (!info.anchor_name) {
            return false;
        }
        info.is_local_anchor = true;
        return true;
    }

    info.file_path = std::string(path);
    auto [prefix, depth] = classify_prefix(path);
    info.prefix = prefix;
    info.parent_depth = depth;
    return true;
}

/// Decodes one body. `offset` is the position of the body in the line.
auto parse_body(std::string_view body, size_t offset) -> std::optional<LinkAnchorInfo> {
    if (body.empty()) {
        return std::nullopt;
    }

    LinkAnchorInfo info;
    info.target_start = offset;

    if (body.front() == '#') {
        size_t word_end = body.find_first_of(" \t");
        auto word = strip_trailing_punctuation(body.substr(0, word_end));
        if (word.size() < 2) {
            return std::nullopt;
        }
        info.is_local_anchor = true;
        info.anchor_name = std::string(word.substr(1));
        info.target_length = word.size();
        return info;
    }

    std::optional<size_t> target_end;
    size_t pos = 0;
    while (pos < body.size()) {
        while (pos < body.size() && is_blank_char(body[pos])) {
            ++pos;
        }
        size_t word_end = pos;
        while (word_end < body.size() && !is_blank_char(body[word_end])) {
            ++word_end;
        }
        auto word = strip_trailing_punctuation(body.substr(pos, word_end - pos));
        if (!word.empty() && ends_path(word)) {
            target_end = pos + word.size();
            break;
        }
        pos = word_end;
    }

    if (!target_end) {
        auto first = strip_trailing_punctuation(body.substr(0, body.find_first_of(" \t")));
        if (first.empty()) {
            return std::nullopt;
        }
        target_end = first.size();
    }

    info.target_length = *target_end;
    if (!decode_target(body.substr(0, *target_end), info)) {
        return std::nullopt;
    }
    return info;
}

} // namespace

// ============================================================================
// Public API
// ============================================================================

auto contains_link(std::string_view line) -> bool {
    if (!contains_ignore_case(line, KEYWORD)) {
        return false;
    }
    return !parse(line).empty();
}

auto parse(std::string_view line) -> std::vector<LinkAnchorInfo> {
    std::vector<LinkAnchorInfo> links;
    if (!contains_ignore_case(line, KEYWORD)) {
        return links;
    }

    size_t pos = 0;
    while (auto keyword = next_keyword(line, pos)) {
        size_t end = body_end(line, keyword->body_start);
        auto body = trim_end(line.substr(keyword->body_start, end - keyword->body_start));

        if (auto info = parse_body(body, keyword->body_start)) {
            info->span_start = keyword->start;
            info->span_length = info->target_end() - keyword->start;
            links.push_back(std::move(*info));
        }
        pos = end > keyword->start ? end : keyword->start + 1;
    }
    return links;
}

auto find_at(std::string_view line, size_t offset) -> std::optional<LinkAnchorInfo> {
    if (offset >= line.size()) {
        return std::nullopt;
    }
    for (auto& link : parse(line)) {
        if (offset >= link.target_start && offset <= link.target_end()) {
            return std::move(link);
        }
    }
    return std::nullopt;
}

auto classify_prefix(std::string_view path) -> std::pair<PathPrefix, int> {
    if (path.size() >= 3 && path.substr(0, 2) == ".." && is_separator(path[2])) {
        int depth = 0;
        while (path.size() >= 3 && path.substr(0, 2) == ".." && is_separator(path[2])) {
            path.remove_prefix(3);
            ++depth;
        }
        return {PathPrefix::Parent, depth};
    }
    if (path.size() >= 2 && is_separator(path[1])) {
        switch (path[0]) {
        case '.':
            return {PathPrefix::Current, 0};
        case '~':
            return {PathPrefix::Home, 0};
        case '@':
            return {PathPrefix::Project, 0};
        default:
            break;
        }
    }
    if (!path.empty() && is_separator(path[0])) {
        return {PathPrefix::Root, 0};
    }
    return {PathPrefix::None, 0};
}

auto prefix_name(PathPrefix prefix) -> std::string_view {
    switch (prefix) {
    case PathPrefix::None:
        return "none";
    case PathPrefix::Current:
        return "current";
    case PathPrefix::Parent:
        return "parent";
    case PathPrefix::Root:
        return "root";
    case PathPrefix::Home:
        return "home";
    case PathPrefix::Project:
        return "project";
    }
    return "none";
}

} // namespace cstudio::links
