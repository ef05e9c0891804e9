//! # Reflow Command
//!
//! This file implements `cstudio reflow`.
//!
//! ## Usage
//!
//! ```bash
//! cstudio reflow Service.cs                      # Print the result
//! cstudio reflow Service.cs --max-line-length=80 # Narrower width
//! cstudio reflow Service.cs --check              # CI: exit 1 if unformatted
//! cstudio reflow Service.cs --write              # Rewrite in place
//! ```
//!
//! ## Process
//!
//! 1. Pick the comment style from `--lang` or the file extension
//! 2. Scan the blocks and reflow each one
//! 3. Print, check or write the rewritten text

#include "cmd_reflow.hpp"

#include "cli/utils.hpp"
#include "comment/block_scanner.hpp"
#include "comment/text_snapshot.hpp"
#include "log/log.hpp"
#include "reflow/reflow_engine.hpp"

#include <fstream>
#include <iostream>

namespace cstudio::cli {

/// Counts the blocks that would change, for the log.
static size_t count_changed_blocks(const comment::TextSnapshot& snapshot,
                                   const comment::CommentStyle& style,
                                   const reflow::ReflowConfig& config) {
    reflow::ReflowEngine engine(config);
    size_t changed = 0;
    for (const auto& block : comment::find_all_blocks(snapshot, style)) {
        if (engine.reflow(block)) {
            CSTUDIO_LOG_DEBUG("reflow", "block at lines " << block.start_line + 1 << "-"
                                                          << block.end_line + 1 << " changes");
            ++changed;
        }
    }
    return changed;
}

static bool write_text(const std::string& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return false;
    }
    out << text;
    return static_cast<bool>(out);
}

int run_reflow(const ReflowOptions& options) {
    const auto* style = resolve_style(options.path, options.language);
    if (style == nullptr) {
        std::cerr << "error: cannot determine the comment style of " << options.path
                  << " (use --lang=<content-type>)\n";
        return 1;
    }

    auto loaded = comment::TextSnapshot::from_file(options.path);
    if (is_err(loaded)) {
        std::cerr << "error: " << unwrap_err(loaded) << "\n";
        return 1;
    }
    const auto& snapshot = unwrap(loaded);

    CSTUDIO_LOG_INFO("reflow", options.path << ": style " << style->language_id
                                            << ", max line length "
                                            << options.config.max_line_length);

    auto result = reflow::reflow_document(snapshot, *style, options.config);
    if (!result) {
        CSTUDIO_LOG_INFO("reflow", options.path << ": already formatted");
        if (!options.check && !options.write) {
            std::cout << snapshot.content();
        }
        return 0;
    }

    size_t changed = count_changed_blocks(snapshot, *style, options.config);
    CSTUDIO_LOG_INFO("reflow", options.path << ": " << changed << " block(s) reflowed");

    if (options.check) {
        std::cout << "would reflow " << options.path << " (" << changed << " block"
                  << (changed == 1 ? "" : "s") << ")\n";
        return 1;
    }

    if (options.write) {
        if (!write_text(options.path, *result)) {
            std::cerr << "error: cannot write " << options.path << "\n";
            return 1;
        }
        std::cout << "reflowed " << options.path << "\n";
        return 0;
    }

    std::cout << *result;
    return 0;
}

} // namespace cstudio::cli
