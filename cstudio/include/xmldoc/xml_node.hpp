//! # XML Documentation Nodes
//!
//! The tree produced by the documentation comment parser.
//!
//! ## Node Kinds
//!
//! | Node           | Meaning                                             |
//! |----------------|-----------------------------------------------------|
//! | `XmlText`      | Literal text, including degraded malformed markup   |
//! | `XmlElement`   | `<name attr="v">...</name>` or `<name/>`            |
//! | `XmlBlankLine` | A comment line with no text (paragraph separator)   |
//!
//! ## Element Kinds
//!
//! | Kind       | Tags                                                      |
//! |------------|-----------------------------------------------------------|
//! | `Block`    | summary, remarks, returns, value, param, typeparam,       |
//! |            | exception, list, item, listheader, para, example,         |
//! |            | permission, include, inheritdoc                           |
//! | `Inline`   | c, see, seealso, paramref, typeparamref, term, description|
//! | `Verbatim` | code                                                      |
//! | `Generic`  | any other tag, wrapped like an inline element             |

#ifndef CSTUDIO_XMLDOC_XML_NODE_HPP
#define CSTUDIO_XMLDOC_XML_NODE_HPP

#include "common.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cstudio::xmldoc {

struct XmlElement;

/// Literal text.
struct XmlText {
    std::string content;
};

/// A marker-only comment line.
struct XmlBlankLine {};

/// How the reflow engine lays out an element.
enum class ElementKind {
    Block,    ///< Always starts a new line
    Inline,   ///< Atomic unit shared with surrounding text
    Verbatim, ///< Copied line for line, never rewrapped
    Generic   ///< Unknown tag, treated as inline
};

/// Classifies a tag name (case-insensitive).
[[nodiscard]] auto classify_tag(std::string_view name) -> ElementKind;

/// One attribute, in source order.
struct XmlAttribute {
    std::string name;
    std::string value;
    char quote = '"'; ///< `"` or `'`, or `\0` for unquoted and bare attributes
};

/// A node of the documentation tree.
///
/// Elements are boxed so that `XmlElement` can hold a vector of nodes.
struct XmlNode {
    std::variant<XmlText, Box<XmlElement>, XmlBlankLine> value;

    [[nodiscard]] static auto text(std::string content) -> XmlNode;
    [[nodiscard]] static auto element(XmlElement element) -> XmlNode;
    [[nodiscard]] static auto blank_line() -> XmlNode;

    [[nodiscard]] auto is_text() const -> bool {
        return std::holds_alternative<XmlText>(value);
    }
    [[nodiscard]] auto is_element() const -> bool {
        return std::holds_alternative<Box<XmlElement>>(value);
    }
    [[nodiscard]] auto is_blank_line() const -> bool {
        return std::holds_alternative<XmlBlankLine>(value);
    }

    [[nodiscard]] auto as_text() const -> const XmlText& {
        return std::get<XmlText>(value);
    }
    [[nodiscard]] auto as_text() -> XmlText& {
        return std::get<XmlText>(value);
    }
    [[nodiscard]] auto as_element() const -> const XmlElement&;

    /// True for elements that always start a new line (Block and Verbatim).
    [[nodiscard]] auto is_block_level() const -> bool;
};

/// A tagged element.
struct XmlElement {
    std::string name;
    std::vector<XmlAttribute> attributes;
    std::vector<XmlNode> children;
    ElementKind kind = ElementKind::Generic;
    bool self_closing = false;

    [[nodiscard]] auto is_inline() const -> bool {
        return kind == ElementKind::Inline || kind == ElementKind::Generic;
    }

    /// Returns the value of attribute `name`, if present.
    [[nodiscard]] auto attribute(std::string_view attr_name) const -> std::optional<std::string_view>;

    [[nodiscard]] auto has_block_children() const -> bool;

    [[nodiscard]] auto has_blank_line_children() const -> bool;
};

// ============================================================================
// Serialization
// ============================================================================

/// `<name attr="v">`, or `<name attr="v"/>` for a self-closing element.
[[nodiscard]] auto open_tag(const XmlElement& element) -> std::string;

/// `</name>`.
[[nodiscard]] auto close_tag(const XmlElement& element) -> std::string;

/// Serializes a node on one line, collapsing every whitespace run to one space.
[[nodiscard]] auto to_inline_string(const XmlNode& node) -> std::string;

} // namespace cstudio::xmldoc

#endif // CSTUDIO_XMLDOC_XML_NODE_HPP
