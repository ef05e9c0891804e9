//! # Links Command Interface
//!
//! Lists the `LINK:` references of a file with their decoded fields.

#pragma once

#include <string>

namespace cstudio::cli {

// Links command
int run_links(const std::string& path);

} // namespace cstudio::cli
