//! # Reflow Engine
//!
//! Rewraps documentation comments to a maximum line length while keeping
//! their markup and paragraph structure.
//!
//! ## Layout Rules
//!
//! | Element                                | Output                              |
//! |----------------------------------------|-------------------------------------|
//! | Block element that fits (compact mode) | `/// <summary>Gets the name.</summary>` |
//! | Block element otherwise                | open tag, wrapped content, close tag |
//! | Block element with block children      | open tag, children, close tag       |
//! | `<code>`                               | open tag, verbatim lines, close tag |
//! | Self-closing block element             | alone on its line                   |
//! | Marker-only line                       | kept if `preserve_blank_lines`      |
//!
//! Inline elements (`<c>`, `<see cref="X"/>`, ...) and words are atomic
//! tokens. Tokens are appended greedily while the line, prefix included,
//! stays within `max_line_length`. A token that alone exceeds the limit goes
//! on its own line unsplit.
//!
//! Blocks without any block-level element (plain prose, Doxygen commands)
//! are left untouched.
//!
//! ## Example
//!
//! ```cpp
//! auto config = unwrap(make_reflow_config(40));
//! if (auto text = reflow(block, config)) {
//!     // replace lines block.start_line..block.end_line with *text
//! }
//! ```

#ifndef CSTUDIO_REFLOW_REFLOW_ENGINE_HPP
#define CSTUDIO_REFLOW_REFLOW_ENGINE_HPP

#include "comment/block_scanner.hpp"
#include "comment/text_snapshot.hpp"
#include "reflow/reflow_config.hpp"
#include "xmldoc/xml_node.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cstudio::reflow {

/// Formats comment blocks under a fixed configuration.
class ReflowEngine {
public:
    /// A `max_line_length` below 1 is raised to 1, as if every token were
    /// overlong.
    explicit ReflowEngine(ReflowConfig config);

    /// Returns the reformatted lines of `block` joined with `\n`, or nullopt
    /// when the result equals the block modulo trailing whitespace.
    [[nodiscard]] auto reflow(const comment::CommentBlock& block) -> std::optional<std::string>;

    /// Formats `block` unconditionally. Returns an empty vector when the
    /// block has no block-level element.
    [[nodiscard]] auto format_lines(const comment::CommentBlock& block) -> std::vector<std::string>;

    [[nodiscard]] auto config() const -> const ReflowConfig& {
        return config_;
    }

private:
    ReflowConfig config_;
    std::vector<std::string> lines_;
    std::string prefix_;       ///< Indentation, marker and one space
    std::string blank_prefix_; ///< Indentation and marker only

    void emit_line(std::string_view text);
    void emit_blank_line();

    void format_nodes(const std::vector<xmldoc::XmlNode>& nodes);
    void format_element(const xmldoc::XmlElement& element);
    void format_verbatim(const xmldoc::XmlElement& element);
    void wrap(const std::vector<std::string>& tokens);

    [[nodiscard]] auto fits(size_t content_length) const -> bool;
};

/// Reflows one block. See `ReflowEngine::reflow`.
[[nodiscard]] auto reflow(const comment::CommentBlock& block, const ReflowConfig& config)
    -> std::optional<std::string>;

/// Reflows every documentation block of a buffer.
///
/// Returns the full rewritten text using the buffer's line terminator, or
/// nullopt if no block changed.
[[nodiscard]] auto reflow_document(const comment::TextSnapshot& snapshot,
                                   const comment::CommentStyle& style, const ReflowConfig& config)
    -> std::optional<std::string>;

/// Splits a run of inline nodes into wrap tokens.
///
/// Words split on whitespace. An inline element is one token, glued to any
/// text that touches it without whitespace, so `<see cref="X"/>.` stays one
/// token.
[[nodiscard]] auto inline_tokens(const std::vector<const xmldoc::XmlNode*>& nodes)
    -> std::vector<std::string>;

} // namespace cstudio::reflow

#endif // CSTUDIO_REFLOW_REFLOW_ENGINE_HPP
