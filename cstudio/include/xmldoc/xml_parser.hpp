//! # Documentation Comment Parser
//!
//! Parses the body of a documentation comment into a tree of `XmlNode`s.
//!
//! ## Process
//!
//! 1. Strip the comment markers of every line (`block_body_lines`)
//! 2. Join the lines with `\n` into one logical stream
//! 3. Recursive descent over the stream, recording marker-only lines as
//!    `XmlBlankLine` nodes
//!
//! Parsing never fails. Markup that cannot be matched is kept as text:
//!
//! | Input                         | Result                                     |
//! |-------------------------------|--------------------------------------------|
//! | `a < b`                       | Text                                       |
//! | `List<T> items`               | Text `List<T> items` (unterminated `<T>`)  |
//! | `<summary>x` (no close tag)   | Text `<summary>` followed by its content   |
//! | `x</para>` (no open tag)      | Text `x</para>`                            |
//!
//! `<code>` content is captured raw up to `</code>`, line breaks included.

#ifndef CSTUDIO_XMLDOC_XML_PARSER_HPP
#define CSTUDIO_XMLDOC_XML_PARSER_HPP

#include "comment/block_scanner.hpp"
#include "xmldoc/xml_node.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace cstudio::xmldoc {

/// Parses the body of a comment block.
[[nodiscard]] auto parse(const comment::CommentBlock& block) -> std::vector<XmlNode>;

/// Parses already stripped body lines.
[[nodiscard]] auto parse_lines(const std::vector<std::string>& body_lines) -> std::vector<XmlNode>;

/// Parses a raw body stream whose lines are separated by `\n`.
[[nodiscard]] auto parse_xml(std::string_view body) -> std::vector<XmlNode>;

} // namespace cstudio::xmldoc

#endif // CSTUDIO_XMLDOC_XML_PARSER_HPP
