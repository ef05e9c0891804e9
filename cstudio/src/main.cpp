//! # cstudio Entry Point
//!
//! The binary is named `cstudio`. `main()` only delegates to the CLI
//! driver, which parses arguments and runs the command.
//!
//! ```bash
//! cstudio reflow Service.cs --check    # Check documentation comment layout
//! cstudio links Service.cs             # List LINK: references
//! cstudio tags Service.cs --format=md  # Export TODO/HACK/... tags
//! ```

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return cstudio::cli::cstudio_main(argc, argv);
}
