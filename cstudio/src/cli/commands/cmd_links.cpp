//! # Links Command
//!
//! Prints every `LINK:` reference of a file:
//!
//! ```text
//! Service.cs:12:8: path=Database/Schema.sql lines=45-67 anchor=create-tables
//! Service.cs:30:8: local anchor=setup
//! ```

#include "cmd_links.hpp"

#include "comment/text_snapshot.hpp"
#include "links/link_tokenizer.hpp"
#include "log/log.hpp"

#include <iostream>

namespace cstudio::cli {

static void print_link(const std::string& path, size_t line, const links::LinkAnchorInfo& link) {
    std::cout << path << ":" << line + 1 << ":" << link.span_start + 1 << ":";
    if (link.is_local_anchor) {
        std::cout << " local";
    }
    if (link.file_path) {
        std::cout << " path=" << *link.file_path;
        if (link.prefix != links::PathPrefix::None) {
            std::cout << " prefix=" << links::prefix_name(link.prefix);
            if (link.prefix == links::PathPrefix::Parent) {
                std::cout << "(" << link.parent_depth << ")";
            }
        }
    }
    if (link.has_line_range()) {
        std::cout << " lines=" << *link.line_number << "-" << *link.end_line_number;
    } else if (link.has_line_number()) {
        std::cout << " line=" << *link.line_number;
    }
    if (link.has_anchor()) {
        std::cout << " anchor=" << *link.anchor_name;
    }
    std::cout << "\n";
}

int run_links(const std::string& path) {
    auto loaded = comment::TextSnapshot::from_file(path);
    if (is_err(loaded)) {
        std::cerr << "error: " << unwrap_err(loaded) << "\n";
        return 1;
    }
    const auto& snapshot = unwrap(loaded);

    size_t count = 0;
    for (size_t i = 0; i < snapshot.line_count(); ++i) {
        for (const auto& link : links::parse(snapshot.line(i))) {
            print_link(path, i, link);
            ++count;
        }
    }

    CSTUDIO_LOG_INFO("links", path << ": " << count << " link(s)");
    return 0;
}

} // namespace cstudio::cli
