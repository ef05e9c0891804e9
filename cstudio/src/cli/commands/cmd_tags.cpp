//! # Tags Command
//!
//! This file implements `cstudio tags`.
//!
//! ## Usage
//!
//! ```bash
//! cstudio tags Service.cs                          # Human readable list
//! cstudio tags Service.cs --custom-tags=PERF,SEC   # Extra tag names
//! cstudio tags Service.cs --format=json            # Export to stdout
//! cstudio tags Service.cs --output=anchors.csv     # Export, format from extension
//! cstudio tags Legacy.txt --lang=Basic             # `'` comments
//! ```

#include "cmd_tags.hpp"

#include "cli/utils.hpp"
#include "comment/text_snapshot.hpp"
#include "log/log.hpp"
#include "tags/tag_tokenizer.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

namespace cstudio::cli {

static void print_item(const tags::TagItem& item) {
    const auto& tag = item.tag;
    std::cout << item.file << ":" << item.line << ":" << item.column << ": " << tag.tag_name;
    if (tag.owner) {
        std::cout << " @" << *tag.owner;
    }
    if (tag.issue) {
        std::cout << " #" << *tag.issue;
    }
    if (tag.due_date) {
        std::cout << " due " << tags::format_date(*tag.due_date);
    }
    if (tag.anchor_id) {
        std::cout << " id=" << *tag.anchor_id;
    }
    if (!tag.message.empty()) {
        std::cout << ": " << tag.message;
    }
    std::cout << "\n";
}

int run_tags(const TagsOptions& options) {
    auto loaded = comment::TextSnapshot::from_file(options.path);
    if (is_err(loaded)) {
        std::cerr << "error: " << unwrap_err(loaded) << "\n";
        return 1;
    }

    // Files of unknown languages are scanned with C-style comment syntax.
    const auto* style = resolve_style(options.path, options.language);
    auto syntax = style != nullptr ? comment::syntax_for(*style) : comment::CommentSyntax::CFamily;

    auto items = tags::scan_text(unwrap(loaded).content(), tags::builtin_tags(),
                                 options.custom_tags, syntax);
    for (auto& item : items) {
        item.file = options.path;
    }
    CSTUDIO_LOG_INFO("tags", options.path << ": " << items.size() << " tag(s)");

    if (!options.format && options.output.empty()) {
        for (const auto& item : items) {
            print_item(item);
        }
        return 0;
    }

    auto format = options.format.value_or(tags::format_from_extension(
        std::filesystem::path(options.output).extension().string()));
    tags::TagExporter exporter(format);

    if (options.output.empty()) {
        exporter.generate(items, std::cout);
        return 0;
    }

    std::ofstream out(options.output, std::ios::binary | std::ios::trunc);
    if (!out) {
        std::cerr << "error: cannot write " << options.output << "\n";
        return 1;
    }
    exporter.generate(items, out);
    if (!out) {
        std::cerr << "error: cannot write " << options.output << "\n";
        return 1;
    }
    CSTUDIO_LOG_INFO("tags", "exported " << items.size() << " tag(s) as "
                                         << tags::format_name(format) << " to "
                                         << options.output);
    return 0;
}

} // namespace cstudio::cli
