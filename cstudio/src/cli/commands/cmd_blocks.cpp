//! # Blocks Command
//!
//! Prints one line per documentation comment block:
//!
//! ```text
//! 12-15  ///      <summary>Gets the name.</summary>
//! 20-24  /** */   <summary>
//! ```
//!
//! Line numbers are 1-based. The last column is the first body line.

#include "cmd_blocks.hpp"

#include "cli/utils.hpp"
#include "comment/block_scanner.hpp"
#include "comment/text_snapshot.hpp"
#include "log/log.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace cstudio::cli {

int run_blocks(const std::string& path, const std::string& language) {
    const auto* style = resolve_style(path, language);
    if (style == nullptr) {
        std::cerr << "error: cannot determine the comment style of " << path
                  << " (use --lang=<content-type>)\n";
        return 1;
    }

    auto loaded = comment::TextSnapshot::from_file(path);
    if (is_err(loaded)) {
        std::cerr << "error: " << unwrap_err(loaded) << "\n";
        return 1;
    }

    auto blocks = comment::find_all_blocks(unwrap(loaded), *style);
    CSTUDIO_LOG_INFO("blocks", path << ": " << blocks.size() << " block(s)");

    for (const auto& block : blocks) {
        std::ostringstream range;
        range << block.start_line + 1 << "-" << block.end_line + 1;

        auto body = comment::block_body_lines(block);
        std::string kind = block.is_block_style ? "/** */" : std::string(style->line_marker);

        std::cout << std::left << std::setw(8) << range.str() << std::setw(8) << kind
                  << (body.empty() ? "" : body.front()) << "\n";
    }
    return 0;
}

} // namespace cstudio::cli
