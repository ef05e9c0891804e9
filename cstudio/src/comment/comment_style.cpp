#include "comment/comment_style.hpp"

#include "util/text.hpp"

#include <array>
#include <utility>

namespace cstudio::comment {

using namespace cstudio::util;

namespace {

constexpr BlockDelimiters SLASH_STAR_BLOCK{.open = "/**", .close = "*/", .continuation = " * "};

constexpr std::array<CommentStyle, 6> STYLES = {{
    {Language::CSharp, "CSharp", "///", SLASH_STAR_BLOCK},
    {Language::VisualBasic, "Basic", "'''", std::nullopt},
    {Language::Cpp, "C/C++", "///", SLASH_STAR_BLOCK},
    {Language::FSharp, "F#", "///", std::nullopt},
    {Language::TypeScript, "TypeScript", "///", std::nullopt},
    {Language::JavaScript, "JavaScript", "///", std::nullopt},
}};

// Content type aliases, checked in order.
constexpr std::array<std::pair<std::string_view, Language>, 8> CONTENT_TYPE_ALIASES = {{
    {"csharp", Language::CSharp},
    {"basic", Language::VisualBasic},
    {"c/c++", Language::Cpp},
    {"c++", Language::Cpp},
    {"fsharp", Language::FSharp},
    {"f#", Language::FSharp},
    {"typescript", Language::TypeScript},
    {"javascript", Language::JavaScript},
}};

constexpr std::array<std::pair<std::string_view, Language>, 16> EXTENSIONS = {{
    {"cs", Language::CSharp},      {"vb", Language::VisualBasic}, {"c", Language::Cpp},
    {"cc", Language::Cpp},         {"cpp", Language::Cpp},        {"cxx", Language::Cpp},
    {"h", Language::Cpp},          {"hh", Language::Cpp},         {"hpp", Language::Cpp},
    {"hxx", Language::Cpp},        {"fs", Language::FSharp},      {"fsi", Language::FSharp},
    {"ts", Language::TypeScript},  {"tsx", Language::TypeScript}, {"js", Language::JavaScript},
    {"jsx", Language::JavaScript},
}};

} // namespace

auto all_styles() -> std::span<const CommentStyle> {
    return STYLES;
}

auto style_for(Language language) -> const CommentStyle& {
    for (const auto& style : STYLES) {
        if (style.language == language) {
            return style;
        }
    }
    return STYLES[0];
}

auto style_for_content_type(std::string_view content_type) -> const CommentStyle* {
    if (content_type.empty()) {
        return nullptr;
    }
    for (const auto& [alias, language] : CONTENT_TYPE_ALIASES) {
        if (contains_ignore_case(content_type, alias)) {
            return &style_for(language);
        }
    }
    return nullptr;
}

auto style_for_extension(std::string_view extension) -> const CommentStyle* {
    if (extension.starts_with('.')) {
        extension.remove_prefix(1);
    }
    for (const auto& [ext, language] : EXTENSIONS) {
        if (equals_ignore_case(extension, ext)) {
            return &style_for(language);
        }
    }
    return nullptr;
}

auto is_comment_line(std::string_view line) -> bool {
    auto trimmed = trim_start(line);
    return trimmed.starts_with("//") || trimmed.starts_with("/*") || trimmed.starts_with('*') ||
           trimmed.starts_with('\'');
}

} // namespace cstudio::comment
