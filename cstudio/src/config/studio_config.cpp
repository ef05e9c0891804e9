//! # Studio Configuration Loading
//!
//! Line-oriented reader for `cstudio.toml`. Values are checked as they are
//! read and the reflow options are validated once through
//! `make_reflow_config` at the end.

#include "config/studio_config.hpp"

#include "log/log.hpp"
#include "tags/tag_tokenizer.hpp"
#include "util/text.hpp"

#include <charconv>
#include <fstream>
#include <optional>
#include <sstream>

namespace fs = std::filesystem;

namespace cstudio::config {

using namespace cstudio::util;

namespace {

/// Removes a `#` comment that is not inside a quoted value.
auto strip_comment(std::string_view line) -> std::string_view {
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') {
            quoted = !quoted;
        } else if (line[i] == '#' && !quoted) {
            return line.substr(0, i);
        }
    }
    return line;
}

auto unquote(std::string_view value) -> std::string_view {
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

auto parse_bool(std::string_view value) -> std::optional<bool> {
    if (value == "true") {
        return true;
    }
    if (value == "false") {
        return false;
    }
    return std::nullopt;
}

auto parse_int(std::string_view value) -> std::optional<int> {
    int result = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (value.empty() || ec != std::errc{} || ptr != value.data() + value.size()) {
        return std::nullopt;
    }
    return result;
}

auto location(std::string_view origin, size_t line_number) -> std::string {
    return std::string(origin) + ":" + std::to_string(line_number) + ": ";
}

} // namespace

auto parse_studio_config(std::string_view text, std::string_view origin)
    -> Result<StudioConfig, std::string> {
    StudioConfig config;
    config.source = std::string(origin);

    int max_line_length = reflow::DEFAULT_MAX_LINE_LENGTH;
    bool compact_style = true;
    bool preserve_blank_lines = true;

    std::string section;
    std::istringstream input{std::string(text)};
    std::string raw;
    size_t line_number = 0;

    while (std::getline(input, raw)) {
        ++line_number;
        auto line = trim(strip_comment(raw));
        if (line.empty()) {
            continue;
        }

        if (line.front() == '[') {
            if (line.back() != ']') {
                return location(origin, line_number) + "malformed section header '" +
                       std::string(line) + "'";
            }
            section = std::string(trim(line.substr(1, line.size() - 2)));
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string_view::npos) {
            CSTUDIO_LOG_DEBUG("config", location(origin, line_number)
                                            << "ignoring line without '='");
            continue;
        }
        auto key = trim(line.substr(0, eq_pos));
        auto value = unquote(trim(line.substr(eq_pos + 1)));

        if (section == "reflow") {
            if (key == "max-line-length") {
                auto number = parse_int(value);
                if (!number) {
                    return location(origin, line_number) +
                           "max-line-length must be an integer, got '" + std::string(value) + "'";
                }
                max_line_length = *number;
                continue;
            }
            if (key == "compact-style" || key == "preserve-blank-lines") {
                auto flag = parse_bool(value);
                if (!flag) {
                    return location(origin, line_number) + std::string(key) +
                           " must be true or false, got '" + std::string(value) + "'";
                }
                (key == "compact-style" ? compact_style : preserve_blank_lines) = *flag;
                continue;
            }
        } else if (section == "tags" && key == "custom") {
            config.custom_tags = tags::parse_custom_tags(value);
            continue;
        }

        CSTUDIO_LOG_DEBUG("config", location(origin, line_number)
                                        << "ignoring unknown key '" << key << "' in ["
                                        << section << "]");
    }

    auto reflow_config = reflow::make_reflow_config(max_line_length, compact_style,
                                                    preserve_blank_lines);
    if (is_err(reflow_config)) {
        return std::string(origin) + ": " + unwrap_err(reflow_config);
    }
    config.reflow = unwrap(reflow_config);
    return config;
}

auto load_studio_config(const fs::path& path) -> Result<StudioConfig, std::string> {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        CSTUDIO_LOG_DEBUG("config", "no " << path.string() << ", using defaults");
        return StudioConfig{};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return "cannot read config file " + path.string();
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();

    auto config = parse_studio_config(buffer.str(), path.string());
    if (is_ok(config)) {
        CSTUDIO_LOG_INFO("config", "loaded " << path.string());
    }
    return config;
}

} // namespace cstudio::config
