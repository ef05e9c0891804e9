//! # CLI Utilities Interface
//!
//! | Function             | Description                              |
//! |----------------------|------------------------------------------|
//! | `option_value()`     | Value of a `--name=value` argument       |
//! | `resolve_style()`    | Comment style from `--lang` or extension |
//! | `print_usage()`      | Print CLI help text                      |
//! | `print_version()`    | Print tool version                       |

#pragma once

#include "comment/comment_style.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace cstudio::cli {

// Argument helpers
std::optional<std::string_view> option_value(std::string_view arg, std::string_view name);

// Looks up the style by content type when `language` is set, otherwise by
// the extension of `path`. Returns nullptr if neither is known.
const comment::CommentStyle* resolve_style(const std::string& path, const std::string& language);

// Help text
void print_usage();
void print_version();

} // namespace cstudio::cli
