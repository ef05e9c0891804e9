//! # Text Helpers
//!
//! Small ASCII string utilities shared by the scanners and tokenizers, plus
//! UTF-8 character counting for width checks. All functions operate on
//! `std::string_view` and never allocate unless they return a `std::string`.

#ifndef CSTUDIO_UTIL_TEXT_HPP
#define CSTUDIO_UTIL_TEXT_HPP

#include <cctype>
#include <string>
#include <string_view>

namespace cstudio::util {

[[nodiscard]] inline auto is_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

/// Letters, digits and underscore, matching a regex `\w` over ASCII.
[[nodiscard]] inline auto is_word_char(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

[[nodiscard]] inline auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

[[nodiscard]] inline auto to_lower(char c) -> char {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

[[nodiscard]] inline auto to_upper(std::string_view s) -> std::string {
    std::string result(s);
    for (auto& c : result) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return result;
}

[[nodiscard]] inline auto trim_start(std::string_view s) -> std::string_view {
    size_t i = 0;
    while (i < s.size() && is_space(s[i])) {
        ++i;
    }
    return s.substr(i);
}

[[nodiscard]] inline auto trim_end(std::string_view s) -> std::string_view {
    size_t n = s.size();
    while (n > 0 && is_space(s[n - 1])) {
        --n;
    }
    return s.substr(0, n);
}

[[nodiscard]] inline auto trim(std::string_view s) -> std::string_view {
    return trim_end(trim_start(s));
}

/// Length of the leading whitespace run.
[[nodiscard]] inline auto leading_whitespace(std::string_view s) -> size_t {
    return s.size() - trim_start(s).size();
}

/// Number of characters in UTF-8 text. Every byte except a continuation
/// byte (`10xxxxxx`) starts a character.
[[nodiscard]] inline auto char_count(std::string_view s) -> size_t {
    size_t count = 0;
    for (char c : s) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

[[nodiscard]] inline auto is_blank(std::string_view s) -> bool {
    return trim_start(s).empty();
}

[[nodiscard]] inline auto equals_ignore_case(std::string_view a, std::string_view b) -> bool {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (to_lower(a[i]) != to_lower(b[i])) {
            return false;
        }
    }
    return true;
}

[[nodiscard]] inline auto starts_with_ignore_case(std::string_view s, std::string_view prefix)
    -> bool {
    return s.size() >= prefix.size() && equals_ignore_case(s.substr(0, prefix.size()), prefix);
}

/// Case-insensitive substring search. Returns npos when absent.
[[nodiscard]] inline auto find_ignore_case(std::string_view haystack, std::string_view needle,
                                           size_t from = 0) -> size_t {
    if (needle.empty()) {
        return from <= haystack.size() ? from : std::string_view::npos;
    }
    for (size_t i = from; i + needle.size() <= haystack.size(); ++i) {
        if (equals_ignore_case(haystack.substr(i, needle.size()), needle)) {
            return i;
        }
    }
    return std::string_view::npos;
}

[[nodiscard]] inline auto contains_ignore_case(std::string_view haystack, std::string_view needle)
    -> bool {
    return find_ignore_case(haystack, needle) != std::string_view::npos;
}

} // namespace cstudio::util

#endif // CSTUDIO_UTIL_TEXT_HPP
