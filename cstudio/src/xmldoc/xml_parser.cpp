//! # Documentation Comment Parser Implementation
//!
//! | Method                  | Description                                |
//! |-------------------------|--------------------------------------------|
//! | `parse_content()`       | Text, tags and blank lines until a close   |
//! | `parse_element()`       | Children of an open tag, or degradation    |
//! | `parse_open_tag()`      | `<name attr="v">` and `<name/>`            |
//! | `parse_close_tag()`     | `</name>`                                  |
//! | `consume_blank_lines()` | Marker-only lines as `XmlBlankLine` nodes  |

#include "xmldoc/xml_parser.hpp"

#include "util/text.hpp"

#include <cctype>
#include <optional>

namespace cstudio::xmldoc {

using namespace cstudio::util;

namespace {

auto is_name_start(char c) -> bool {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

auto is_name_char(char c) -> bool {
    return is_word_char(c) || c == '-' || c == ':' || c == '.';
}

/// Appends a node, merging it into a preceding text node when both are text.
void append_node(std::vector<XmlNode>& nodes, XmlNode node) {
    if (node.is_text() && !nodes.empty() && nodes.back().is_text()) {
        nodes.back().as_text().content += node.as_text().content;
        return;
    }
    nodes.push_back(std::move(node));
}

void append_text(std::vector<XmlNode>& nodes, std::string text) {
    if (!text.empty()) {
        append_node(nodes, XmlNode::text(std::move(text)));
    }
}

struct OpenTag {
    XmlElement element;
    size_t end; ///< Offset after `>`
};

struct CloseTag {
    std::string_view name;
    size_t start; ///< Offset of `<`
    size_t end;   ///< Offset after `>`
};

/// How a call to `parse_content` ended.
enum class Stop {
    EndOfInput,     ///< Ran out of input
    Closed,         ///< Consumed the close tag of the innermost open element
    AncestorClosed, ///< Found (but did not consume) the close tag of an outer element
};

class XmlParser {
public:
    explicit XmlParser(std::string_view input) : input_(input) {}

    auto parse() -> std::vector<XmlNode> {
        std::vector<XmlNode> nodes;
        if (input_.empty()) {
            return nodes;
        }
        consume_blank_lines(nodes);
        parse_content(nodes);
        return nodes;
    }

private:
    std::string_view input_;
    size_t pos_ = 0;
    std::vector<std::string> open_;

    auto parse_content(std::vector<XmlNode>& out) -> Stop {
        std::string text;
        auto flush = [&] {
            append_text(out, std::move(text));
            text.clear();
        };

        while (pos_ < input_.size()) {
            char c = input_[pos_];

            if (c == '\n') {
                text += '\n';
                ++pos_;
                if (blank_line_end(pos_)) {
                    flush();
                    consume_blank_lines(out);
                }
                continue;
            }

            if (c != '<') {
                text += c;
                ++pos_;
                continue;
            }

            if (auto close = parse_close_tag(pos_)) {
                if (!open_.empty() && open_.back() == close->name) {
                    flush();
                    pos_ = close->end;
                    return Stop::Closed;
                }
                if (is_open(close->name)) {
                    flush();
                    return Stop::AncestorClosed;
                }
                text.append(input_.substr(close->start, close->end - close->start));
                pos_ = close->end;
                continue;
            }

            auto open = parse_open_tag(pos_);
            if (!open) {
                text += c;
                ++pos_;
                continue;
            }

            flush();
            auto raw = input_.substr(pos_, open->end - pos_);
            pos_ = open->end;
            parse_element(out, std::move(open->element), raw);
        }

        flush();
        return Stop::EndOfInput;
    }

    void parse_element(std::vector<XmlNode>& out, XmlElement element, std::string_view raw) {
        if (element.self_closing) {
            append_node(out, XmlNode::element(std::move(element)));
            return;
        }

        if (element.kind == ElementKind::Verbatim) {
            auto close = find_close_tag(element.name, pos_);
            if (!close) {
                append_text(out, std::string(raw));
                return;
            }
            auto content = input_.substr(pos_, close->start - pos_);
            if (!content.empty()) {
                element.children.push_back(XmlNode::text(std::string(content)));
            }
            pos_ = close->end;
            append_node(out, XmlNode::element(std::move(element)));
            return;
        }

        open_.push_back(element.name);
        std::vector<XmlNode> children;
        auto stop = parse_content(children);
        open_.pop_back();

        if (stop == Stop::Closed) {
            element.children = std::move(children);
            append_node(out, XmlNode::element(std::move(element)));
            return;
        }

        // Unterminated: the open tag becomes text and its content moves up.
        append_text(out, std::string(raw));
        for (auto& child : children) {
            append_node(out, std::move(child));
        }
    }

    [[nodiscard]] auto is_open(std::string_view name) const -> bool {
        for (const auto& open : open_) {
            if (open == name) {
                return true;
            }
        }
        return false;
    }

    /// If the line starting at `p` is whitespace only, returns its end offset.
    [[nodiscard]] auto blank_line_end(size_t p) const -> std::optional<size_t> {
        if (p > input_.size()) {
            return std::nullopt;
        }
        size_t q = p;
        while (q < input_.size() && input_[q] != '\n') {
            if (!is_space(input_[q])) {
                return std::nullopt;
            }
            ++q;
        }
        return q;
    }

    void consume_blank_lines(std::vector<XmlNode>& out) {
        while (auto end = blank_line_end(pos_)) {
            out.push_back(XmlNode::blank_line());
            pos_ = *end;
            if (pos_ >= input_.size()) {
                return;
            }
            ++pos_;
        }
    }

    [[nodiscard]] auto parse_close_tag(size_t p) const -> std::optional<CloseTag> {
        if (input_.substr(p, 2) != "</") {
            return std::nullopt;
        }
        size_t q = p + 2;
        if (q >= input_.size() || !is_name_start(input_[q])) {
            return std::nullopt;
        }
        size_t name_start = q;
        while (q < input_.size() && is_name_char(input_[q])) {
            ++q;
        }
        auto name = input_.substr(name_start, q - name_start);
        while (q < input_.size() && is_space(input_[q])) {
            ++q;
        }
        if (q >= input_.size() || input_[q] != '>') {
            return std::nullopt;
        }
        return CloseTag{name, p, q + 1};
    }

    [[nodiscard]] auto find_close_tag(std::string_view name, size_t from) const
        -> std::optional<CloseTag> {
        size_t p = input_.find("</", from);
        while (p != std::string_view::npos) {
            auto close = parse_close_tag(p);
            if (close && close->name == name) {
                return close;
            }
            p = input_.find("</", p + 2);
        }
        return std::nullopt;
    }

    [[nodiscard]] auto parse_open_tag(size_t p) const -> std::optional<OpenTag> {
        size_t size = input_.size();
        size_t q = p + 1;
        if (q >= size || !is_name_start(input_[q])) {
            return std::nullopt;
        }

        size_t name_start = q;
        while (q < size && is_name_char(input_[q])) {
            ++q;
        }

        XmlElement element;
        element.name = std::string(input_.substr(name_start, q - name_start));
        element.kind = classify_tag(element.name);

        while (true) {
            while (q < size && is_space(input_[q])) {
                ++q;
            }
            if (q >= size) {
                return std::nullopt;
            }
            if (input_[q] == '>') {
                return OpenTag{std::move(element), q + 1};
            }
            if (input_[q] == '/') {
                if (q + 1 < size && input_[q + 1] == '>') {
                    element.self_closing = true;
                    return OpenTag{std::move(element), q + 2};
                }
                return std::nullopt;
            }
            if (!is_name_start(input_[q])) {
                return std::nullopt;
            }

            XmlAttribute attr;
            size_t attr_start = q;
            while (q < size && is_name_char(input_[q])) {
                ++q;
            }
            attr.name = std::string(input_.substr(attr_start, q - attr_start));

            size_t after_name = q;
            while (q < size && is_space(input_[q])) {
                ++q;
            }
            if (q >= size || input_[q] != '=') {
                attr.quote = '\0';
                q = after_name;
                element.attributes.push_back(std::move(attr));
                continue;
            }

            ++q;
            while (q < size && is_space(input_[q])) {
                ++q;
            }
            if (q >= size) {
                return std::nullopt;
            }

            char quote = input_[q];
            if (quote == '"' || quote == '\'') {
                auto value_end = input_.find(quote, q + 1);
                if (value_end == std::string_view::npos) {
                    return std::nullopt;
                }
                attr.value = std::string(input_.substr(q + 1, value_end - q - 1));
                attr.quote = quote;
                q = value_end + 1;
            } else {
                size_t value_start = q;
                while (q < size && !is_space(input_[q]) && input_[q] != '>' &&
                       input_.substr(q, 2) != "/>") {
                    ++q;
                }
                if (q == value_start) {
                    return std::nullopt;
                }
                attr.value = std::string(input_.substr(value_start, q - value_start));
                attr.quote = '\0';
            }
            element.attributes.push_back(std::move(attr));
        }
    }
};

} // namespace

auto parse_xml(std::string_view body) -> std::vector<XmlNode> {
    XmlParser parser(body);
    return parser.parse();
}

auto parse_lines(const std::vector<std::string>& body_lines) -> std::vector<XmlNode> {
    std::string joined;
    for (size_t i = 0; i < body_lines.size(); ++i) {
        if (i > 0) {
            joined += '\n';
        }
        joined += body_lines[i];
    }
    return parse_xml(joined);
}

auto parse(const comment::CommentBlock& block) -> std::vector<XmlNode> {
    return parse_lines(comment::block_body_lines(block));
}

} // namespace cstudio::xmldoc
