//! # CLI Driver Interface
//!
//! `cstudio_main()` dispatches to the command handler named by the first
//! non-option argument.

#pragma once

namespace cstudio::cli {

// Main entry point of the cstudio CLI
int cstudio_main(int argc, char* argv[]);

} // namespace cstudio::cli
