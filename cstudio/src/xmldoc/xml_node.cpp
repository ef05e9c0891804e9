#include "xmldoc/xml_node.hpp"

#include "util/text.hpp"

#include <array>

namespace cstudio::xmldoc {

using namespace cstudio::util;

namespace {

constexpr std::array<std::string_view, 15> BLOCK_TAGS = {
    "summary", "remarks", "returns",    "value", "param",   "typeparam",  "exception", "list",
    "item",    "listheader", "para", "example", "permission", "include", "inheritdoc",
};

constexpr std::array<std::string_view, 7> INLINE_TAGS = {
    "c", "see", "seealso", "paramref", "typeparamref", "term", "description",
};

void append_collapsed(std::string& out, std::string_view text) {
    for (char c : text) {
        if (is_space(c)) {
            if (out.empty() || out.back() != ' ') {
                out += ' ';
            }
        } else {
            out += c;
        }
    }
}

} // namespace

auto classify_tag(std::string_view name) -> ElementKind {
    if (equals_ignore_case(name, "code")) {
        return ElementKind::Verbatim;
    }
    for (auto tag : BLOCK_TAGS) {
        if (equals_ignore_case(name, tag)) {
            return ElementKind::Block;
        }
    }
    for (auto tag : INLINE_TAGS) {
        if (equals_ignore_case(name, tag)) {
            return ElementKind::Inline;
        }
    }
    return ElementKind::Generic;
}

// ============================================================================
// XmlNode
// ============================================================================

auto XmlNode::text(std::string content) -> XmlNode {
    return XmlNode{XmlText{std::move(content)}};
}

auto XmlNode::element(XmlElement element) -> XmlNode {
    return XmlNode{make_box<XmlElement>(std::move(element))};
}

auto XmlNode::blank_line() -> XmlNode {
    return XmlNode{XmlBlankLine{}};
}

auto XmlNode::as_element() const -> const XmlElement& {
    return *std::get<Box<XmlElement>>(value);
}

auto XmlNode::is_block_level() const -> bool {
    return is_element() && !as_element().is_inline();
}

// ============================================================================
// XmlElement
// ============================================================================

auto XmlElement::attribute(std::string_view attr_name) const -> std::optional<std::string_view> {
    for (const auto& attr : attributes) {
        if (attr.name == attr_name) {
            return std::string_view(attr.value);
        }
    }
    return std::nullopt;
}

auto XmlElement::has_block_children() const -> bool {
    for (const auto& child : children) {
        if (child.is_block_level()) {
            return true;
        }
    }
    return false;
}

auto XmlElement::has_blank_line_children() const -> bool {
    for (const auto& child : children) {
        if (child.is_blank_line()) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Serialization
// ============================================================================

auto open_tag(const XmlElement& element) -> std::string {
    std::string out = "<" + element.name;
    for (const auto& attr : element.attributes) {
        out += ' ';
        out += attr.name;
        if (attr.quote != '\0') {
            out += '=';
            out += attr.quote;
            out += attr.value;
            out += attr.quote;
        } else if (!attr.value.empty()) {
            out += '=';
            out += attr.value;
        }
    }
    out += element.self_closing ? "/>" : ">";
    return out;
}

auto close_tag(const XmlElement& element) -> std::string {
    return "</" + element.name + ">";
}

auto to_inline_string(const XmlNode& node) -> std::string {
    std::string out;
    if (node.is_text()) {
        append_collapsed(out, node.as_text().content);
    } else if (node.is_blank_line()) {
        out = " ";
    } else {
        const auto& element = node.as_element();
        out = open_tag(element);
        if (element.self_closing) {
            return out;
        }
        for (const auto& child : element.children) {
            append_collapsed(out, to_inline_string(child));
        }
        out += close_tag(element);
    }
    return out;
}

} // namespace cstudio::xmldoc
