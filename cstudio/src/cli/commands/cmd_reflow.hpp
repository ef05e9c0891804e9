//! # Reflow Command Interface
//!
//! ## Usage
//!
//! - `run_reflow({.path = p})`: Print the reflowed file to stdout
//! - `run_reflow({.path = p, .check = true})`: Exit 1 if the file would change
//! - `run_reflow({.path = p, .write = true})`: Rewrite the file in place

#pragma once

#include "reflow/reflow_config.hpp"

#include <string>

namespace cstudio::cli {

struct ReflowOptions {
    std::string path;
    std::string language; ///< Content type override; empty means by extension
    reflow::ReflowConfig config;
    bool check = false;
    bool write = false;
};

// Reflow command
int run_reflow(const ReflowOptions& options);

} // namespace cstudio::cli
