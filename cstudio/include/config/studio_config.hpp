//! # Studio Configuration
//!
//! Loads `cstudio.toml`.
//!
//! ```toml
//! [reflow]
//! max-line-length = 120
//! compact-style = true
//! preserve-blank-lines = true
//!
//! [tags]
//! custom = "PERF, SECURITY"
//! ```
//!
//! Only this subset of TOML is read: `[section]` headers, `key = value`
//! pairs, `#` comments, and quoted or bare values. Unknown sections and
//! keys are ignored.

#ifndef CSTUDIO_CONFIG_STUDIO_CONFIG_HPP
#define CSTUDIO_CONFIG_STUDIO_CONFIG_HPP

#include "common.hpp"
#include "reflow/reflow_config.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace cstudio::config {

/// Default configuration file name, looked up in the working directory.
constexpr const char* CONFIG_FILE_NAME = "cstudio.toml";

/// Settings read from `cstudio.toml`.
struct StudioConfig {
    reflow::ReflowConfig reflow;          ///< Validated reflow options
    std::vector<std::string> custom_tags; ///< From `[tags] custom`
    std::string source;                   ///< File the settings came from; empty for defaults
};

/// Parses configuration text. `origin` names the text in error messages.
[[nodiscard]] auto parse_studio_config(std::string_view text, std::string_view origin)
    -> Result<StudioConfig, std::string>;

/// Loads a configuration file.
///
/// A missing file yields the defaults. An unreadable file, a malformed
/// number or boolean, or a max line length below 1 is an error.
[[nodiscard]] auto load_studio_config(const std::filesystem::path& path)
    -> Result<StudioConfig, std::string>;

} // namespace cstudio::config

#endif // CSTUDIO_CONFIG_STUDIO_CONFIG_HPP
