//! # Tags Command Interface
//!
//! ## Usage
//!
//! - `run_tags({.path = p})`: One line per tag on stdout
//! - `run_tags({.path = p, .format = ExportFormat::Csv})`: CSV on stdout
//! - `run_tags({.path = p, .output = "anchors.md"})`: Markdown file, format
//!   taken from the extension

#pragma once

#include "tags/tag_exporter.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cstudio::cli {

struct TagsOptions {
    std::string path;
    std::string language; ///< Content type; empty means from the extension
    std::vector<std::string> custom_tags;
    std::optional<tags::ExportFormat> format;
    std::string output; ///< Empty means stdout
};

// Tags command
int run_tags(const TagsOptions& options);

} // namespace cstudio::cli
