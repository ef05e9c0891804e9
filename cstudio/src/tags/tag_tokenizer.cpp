//! # Tag Tokenizer Implementation
//!
//! | Step                | Function                 |
//! |---------------------|--------------------------|
//! | Comment portions    | `comment::comment_spans` |
//! | Multi-line comments | `source_line_spans()`    |
//! | Content start       | `content_start()`        |
//! | Keyword             | `match_tag()`            |
//! | Metadata section    | `read_metadata()`        |
//! | Metadata tokens     | `apply_metadata()`       |

#include "tags/tag_tokenizer.hpp"

#include "comment/comment_span.hpp"
#include "util/text.hpp"

#include <charconv>
#include <iomanip>
#include <sstream>
#include <utility>

namespace cstudio::tags {

using namespace cstudio::util;

namespace {

auto is_blank_char(char c) -> bool {
    return c == ' ' || c == '\t';
}

/// Skips comment openers and the blanks after them.
auto content_start(std::string_view line, size_t pos, size_t end) -> size_t {
    if (line.substr(pos, end - pos).starts_with("<!--")) {
        pos += 4;
    }
    while (pos < end) {
        char c = line[pos];
        if (is_blank_char(c) || c == '/' || c == '*' || c == '!' || c == '\'') {
            ++pos;
        } else {
            break;
        }
    }
    return pos;
}

struct TagHit {
    const std::string* name;
    bool is_custom;
};

auto match_in(std::string_view text, const std::vector<std::string>& tags)
    -> const std::string* {
    for (const auto& tag : tags) {
        if (tag.empty() || !starts_with_ignore_case(text, tag)) {
            continue;
        }
        if (tag.size() < text.size() && is_word_char(text[tag.size()])) {
            continue;
        }
        return &tag;
    }
    return nullptr;
}

auto match_tag(std::string_view text, const std::vector<std::string>& known,
               const std::vector<std::string>& custom) -> std::optional<TagHit> {
    if (const auto* tag = match_in(text, known)) {
        return TagHit{.name = tag, .is_custom = false};
    }
    if (const auto* tag = match_in(text, custom)) {
        return TagHit{.name = tag, .is_custom = true};
    }
    return std::nullopt;
}

/// Reads a `(...)` or `[...]` section starting at `pos`. Returns the inner
/// text and the offset after the closing bracket.
auto read_metadata(std::string_view line, size_t pos)
    -> std::optional<std::pair<std::string_view, size_t>> {
    if (pos >= line.size()) {
        return std::nullopt;
    }
    char close;
    if (line[pos] == '(') {
        close = ')';
    } else if (line[pos] == '[') {
        close = ']';
    } else {
        return std::nullopt;
    }
    size_t end = line.find(close, pos + 1);
    if (end == std::string_view::npos) {
        return std::nullopt;
    }
    return std::pair{line.substr(pos + 1, end - pos - 1), end + 1};
}

auto split_metadata(std::string_view metadata) -> std::vector<std::string_view> {
    std::vector<std::string_view> tokens;
    size_t i = 0;
    while (i < metadata.size()) {
        while (i < metadata.size() &&
               (is_space(metadata[i]) || metadata[i] == ',' || metadata[i] == ';')) {
            ++i;
        }
        size_t start = i;
        while (i < metadata.size() && !is_space(metadata[i]) && metadata[i] != ',' &&
               metadata[i] != ';') {
            ++i;
        }
        if (i > start) {
            tokens.push_back(metadata.substr(start, i - start));
        }
    }
    return tokens;
}

auto parse_int(std::string_view digits) -> std::optional<int> {
    if (digits.empty()) {
        return std::nullopt;
    }
    int value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return value;
}

auto all_digits(std::string_view s) -> bool {
    for (char c : s) {
        if (!is_digit(c)) {
            return false;
        }
    }
    return !s.empty();
}

/// Parses an exact `yyyy-MM-dd` token naming a real calendar day.
auto parse_date(std::string_view token) -> std::optional<std::chrono::year_month_day> {
    if (token.size() != 10 || token[4] != '-' || token[7] != '-') {
        return std::nullopt;
    }
    auto year = token.substr(0, 4);
    auto month = token.substr(5, 2);
    auto day = token.substr(8, 2);
    if (!all_digits(year) || !all_digits(month) || !all_digits(day)) {
        return std::nullopt;
    }
    std::chrono::year_month_day date{std::chrono::year{*parse_int(year)},
                                     std::chrono::month{static_cast<unsigned>(*parse_int(month))},
                                     std::chrono::day{static_cast<unsigned>(*parse_int(day))}};
    if (!date.ok()) {
        return std::nullopt;
    }
    return date;
}

void apply_metadata(std::string_view metadata, TagMatch& match) {
    for (auto token : split_metadata(metadata)) {
        if (token.size() > 1 && token.front() == '@') {
            if (!match.owner) {
                match.owner = std::string(token.substr(1));
            }
        } else if (token.size() > 1 && token.front() == '#' && all_digits(token.substr(1))) {
            if (!match.issue) {
                match.issue = parse_int(token.substr(1));
            }
        } else if (auto date = parse_date(token)) {
            if (!match.due_date) {
                match.due_date = date;
            }
        }
    }

    if (equals_ignore_case(match.tag_name, ANCHOR_TAG) && !match.owner && !match.issue) {
        auto id = trim(metadata);
        if (!id.empty()) {
            match.anchor_id = std::string(id);
        }
    }
}

/// Returns the message between `pos` and the first comment closer.
auto read_message(std::string_view line, size_t pos, size_t end) -> std::string {
    auto text = line.substr(pos, end - pos);
    size_t stop = text.size();
    for (std::string_view closer : {std::string_view("*/"), std::string_view("-->")}) {
        size_t found = text.find(closer);
        if (found < stop) {
            stop = found;
        }
    }
    return std::string(trim(text.substr(0, stop)));
}

auto parse_at(std::string_view line, size_t start, size_t end,
              const std::vector<std::string>& known, const std::vector<std::string>& custom)
    -> std::optional<TagMatch> {
    auto hit = match_tag(line.substr(start, end - start), known, custom);
    if (!hit) {
        return std::nullopt;
    }

    TagMatch match;
    match.tag_name = *hit->name;
    match.is_custom = hit->is_custom;
    match.span_start = start;

    size_t pos = start + hit->name->size();
    size_t span_end = pos;

    size_t probe = pos;
    while (probe < end && is_blank_char(line[probe])) {
        ++probe;
    }
    if (auto section = read_metadata(line.substr(0, end), probe)) {
        match.metadata = std::string(section->first);
        apply_metadata(section->first, match);
        pos = section->second;
        span_end = pos;
    }

    probe = pos;
    while (probe < end && is_blank_char(line[probe])) {
        ++probe;
    }
    if (probe < end && line[probe] == ':') {
        pos = probe + 1;
        span_end = pos;
    }

    match.span_length = span_end - start;
    match.message = read_message(line, pos, end);
    return match;
}

auto contains_any(std::string_view text, const std::vector<std::string>& tags) -> bool {
    for (const auto& tag : tags) {
        if (!tag.empty() && contains_ignore_case(text, tag)) {
            return true;
        }
    }
    return false;
}

auto find_in_spans(std::string_view line, const std::vector<TextSpan>& spans,
                   const std::vector<std::string>& known, const std::vector<std::string>& custom)
    -> std::vector<TagMatch> {
    std::vector<TagMatch> matches;
    for (const auto& span : spans) {
        size_t start = content_start(line, span.start, span.end());
        if (auto match = parse_at(line, start, span.end(), known, custom)) {
            matches.push_back(std::move(*match));
        }
    }
    return matches;
}

/// Returns the closer still awaited after a comment portion, or an empty
/// view when the portion is closed on its own line.
auto unterminated_closer(std::string_view portion) -> std::string_view {
    if (portion.starts_with("/*") && portion.find("*/", 2) == std::string_view::npos) {
        return "*/";
    }
    if (portion.starts_with("<!--") && portion.find("-->", 4) == std::string_view::npos) {
        return "-->";
    }
    return {};
}

/// Comment portions of one source line, given the closer of a comment left
/// open by the previous lines. Updates `open_closer` for the next line.
auto source_line_spans(std::string_view line, comment::CommentSyntax syntax,
                       std::string_view& open_closer) -> std::vector<TextSpan> {
    std::vector<TextSpan> spans;
    size_t rest = 0;

    if (!open_closer.empty()) {
        size_t first = leading_whitespace(line);
        size_t close = line.find(open_closer, first);
        size_t end = close == std::string_view::npos ? line.size() : close + open_closer.size();
        if (end > first) {
            spans.push_back({first, end - first});
        }
        if (close == std::string_view::npos) {
            return spans;
        }
        open_closer = {};
        rest = end;
    }

    for (auto span : comment::comment_spans(line.substr(rest), syntax)) {
        span.start += rest;
        spans.push_back(span);
    }
    if (!spans.empty() && spans.back().start >= rest) {
        open_closer = unterminated_closer(line.substr(spans.back().start, spans.back().length));
    }
    return spans;
}

} // namespace

auto builtin_tags() -> const std::vector<std::string>& {
    static const std::vector<std::string> tags = {
        "TODO", "HACK", "NOTE", "BUG", "FIXME", "UNDONE", "REVIEW", std::string(ANCHOR_TAG),
    };
    return tags;
}

auto parse_custom_tags(std::string_view csv) -> std::vector<std::string> {
    std::vector<std::string> tags;
    while (!csv.empty()) {
        size_t comma = csv.find(',');
        auto name = trim(csv.substr(0, comma));
        csv = comma == std::string_view::npos ? std::string_view{} : csv.substr(comma + 1);
        if (name.empty()) {
            continue;
        }
        bool duplicate = false;
        for (const auto& existing : tags) {
            if (equals_ignore_case(existing, name)) {
                duplicate = true;
                break;
            }
        }
        if (!duplicate) {
            tags.emplace_back(name);
        }
    }
    return tags;
}

auto parse(std::string_view line, const std::vector<std::string>& known,
           const std::vector<std::string>& custom, const LineContext& context)
    -> std::vector<TagMatch> {
    if (!contains_any(line, known) && !contains_any(line, custom)) {
        return {};
    }

    auto spans = comment::comment_spans(line, context.syntax);
    if (spans.empty() && context.bare_line_is_comment) {
        size_t first = leading_whitespace(line);
        spans.push_back({first, line.size() - first});
    }
    return find_in_spans(line, spans, known, custom);
}

auto scan_text(std::string_view text, const std::vector<std::string>& known,
               const std::vector<std::string>& custom, comment::CommentSyntax syntax)
    -> std::vector<TagItem> {
    std::vector<TagItem> items;
    if (!contains_any(text, known) && !contains_any(text, custom)) {
        return items;
    }

    std::string_view open_closer;
    size_t line_number = 1;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t end = text.find_first_of("\r\n", pos);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        auto line = text.substr(pos, end - pos);

        auto spans = source_line_spans(line, syntax, open_closer);
        if (contains_any(line, known) || contains_any(line, custom)) {
            for (auto& match : find_in_spans(line, spans, known, custom)) {
                size_t column = match.span_start + 1;
                items.push_back(
                    TagItem{.tag = std::move(match), .line = line_number, .column = column});
            }
        }

        if (end == text.size()) {
            break;
        }
        pos = end + (text[end] == '\r' && end + 1 < text.size() && text[end + 1] == '\n' ? 2 : 1);
        ++line_number;
    }
    return items;
}

auto format_date(const std::chrono::year_month_day& date) -> std::string {
    std::ostringstream out;
    out << std::setfill('0') << std::setw(4) << static_cast<int>(date.year()) << '-'
        << std::setw(2) << static_cast<unsigned>(date.month()) << '-' << std::setw(2)
        << static_cast<unsigned>(date.day());
    return out.str();
}

} // namespace cstudio::tags
