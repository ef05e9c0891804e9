//! # Blocks Command Interface
//!
//! Lists the documentation comment blocks of a file with their line ranges.

#pragma once

#include <string>

namespace cstudio::cli {

// Blocks command
int run_blocks(const std::string& path, const std::string& language);

} // namespace cstudio::cli
