//! # Comment Style Catalog
//!
//! Static, per-language documentation comment delimiters.
//!
//! | Language    | Content type | Line marker | Block form      |
//! |-------------|--------------|-------------|-----------------|
//! | C#          | `CSharp`     | `///`       | `/** ... */`    |
//! | Visual Basic| `Basic`      | `'''`       | none            |
//! | C/C++       | `C/C++`      | `///`       | `/** ... */`    |
//! | F#          | `F#`         | `///`       | none            |
//! | TypeScript  | `TypeScript` | `///`       | none            |
//! | JavaScript  | `JavaScript` | `///`       | none            |
//!
//! The catalog is the only process-wide state of the analysis core and it is
//! read-only.

#ifndef CSTUDIO_COMMENT_COMMENT_STYLE_HPP
#define CSTUDIO_COMMENT_COMMENT_STYLE_HPP

#include <optional>
#include <span>
#include <string_view>

namespace cstudio::comment {

/// Languages with a documentation comment style.
enum class Language { CSharp, VisualBasic, Cpp, FSharp, TypeScript, JavaScript };

/// Delimiters of a block documentation comment (`/** ... */`).
struct BlockDelimiters {
    std::string_view open;         ///< Opening delimiter, e.g. `/**`
    std::string_view close;        ///< Closing delimiter, e.g. `*/`
    std::string_view continuation; ///< Prefix of middle lines, e.g. ` * `
};

/// Documentation comment delimiters of one language.
struct CommentStyle {
    Language language;
    std::string_view language_id;         ///< Canonical content type name
    std::string_view line_marker;         ///< Single-line doc marker
    std::optional<BlockDelimiters> block; ///< Block form, if the language has one

    [[nodiscard]] auto supports_block() const -> bool {
        return block.has_value();
    }
};

/// Returns every style in the catalog.
[[nodiscard]] auto all_styles() -> std::span<const CommentStyle>;

/// Returns the style of a language.
[[nodiscard]] auto style_for(Language language) -> const CommentStyle&;

/// Looks up a style by editor content type.
///
/// Matching is a case-insensitive containment test, so `"csharp"`,
/// `"CSharp"` and `"Roslyn CSharp"` all resolve to C#. Returns nullptr for
/// unknown content types.
[[nodiscard]] auto style_for_content_type(std::string_view content_type) -> const CommentStyle*;

/// Looks up a style by file extension (with or without the leading dot).
[[nodiscard]] auto style_for_extension(std::string_view extension) -> const CommentStyle*;

/// Returns true if the trimmed line starts with `//`, `/*`, `*` or `'`.
[[nodiscard]] auto is_comment_line(std::string_view line) -> bool;

} // namespace cstudio::comment

#endif // CSTUDIO_COMMENT_COMMENT_STYLE_HPP
