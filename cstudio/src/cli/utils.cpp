#include "utils.hpp"

#include "common.hpp"

#include <filesystem>
#include <iostream>

namespace cstudio::cli {

std::optional<std::string_view> option_value(std::string_view arg, std::string_view name) {
    if (arg.size() <= name.size() + 1 || !arg.starts_with(name) || arg[name.size()] != '=') {
        return std::nullopt;
    }
    return arg.substr(name.size() + 1);
}

const comment::CommentStyle* resolve_style(const std::string& path, const std::string& language) {
    if (!language.empty()) {
        return comment::style_for_content_type(language);
    }
    return comment::style_for_extension(std::filesystem::path(path).extension().string());
}

void print_usage() {
    std::cout << "cstudio " << VERSION << "\n\n";
    std::cout << "Usage: cstudio <command> [options] <file>\n\n";
    std::cout << "Commands:\n";
    std::cout << "  reflow    Rewrap documentation comments\n";
    std::cout << "  blocks    List documentation comment blocks\n";
    std::cout << "  links     List LINK: references\n";
    std::cout << "  tags      List or export TODO/HACK/... tags\n";
    std::cout << "\nReflow options:\n";
    std::cout << "  --max-line-length=N   Target width (default 120)\n";
    std::cout << "  --no-compact          Never put an element on one line\n";
    std::cout << "  --no-blank-lines      Drop blank separator lines\n";
    std::cout << "  --check               Exit 1 if the file would change\n";
    std::cout << "  --write               Rewrite the file in place\n";
    std::cout << "  --lang=<type>         Content type, e.g. CSharp, Basic, C/C++\n";
    std::cout << "\nTag options:\n";
    std::cout << "  --custom-tags=A,B     Extra tag names\n";
    std::cout << "  --format=<fmt>        tsv, csv, md or json\n";
    std::cout << "  --output=<path>       Write the export to a file\n";
    std::cout << "  --lang=<type>         Comment syntax, e.g. Basic for ' comments\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --config=<path>       Configuration file (default cstudio.toml)\n";
    std::cout << "  --log-level=<level>   trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=<spec>   Per-module levels, e.g. config=debug,*=warn\n";
    std::cout << "  --log-file=<path>     Also write log records to a file\n";
    std::cout << "  --log-format=<fmt>    text or json\n";
    std::cout << "  -q, -v, -vv, -vvv     Quieter or more verbose logging\n";
    std::cout << "  --help, -h            Show this help\n";
    std::cout << "  --version, -V         Show version\n";
}

void print_version() {
    std::cout << "cstudio " << VERSION << "\n";
}

} // namespace cstudio::cli
