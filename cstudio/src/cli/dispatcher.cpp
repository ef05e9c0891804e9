//! # CLI Command Dispatcher
//!
//! This file implements the main entry point for the cstudio CLI.
//! It parses command-line arguments and routes to the appropriate command handler.
//!
//! ## Architecture
//!
//! ```text
//! cstudio_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ reflow         → run_reflow()
//!   ├─ blocks         → run_blocks()
//!   ├─ links          → run_links()
//!   └─ tags           → run_tags()
//! ```
//!
//! ## Global Flags
//!
//! These flags are available for all commands:
//! - `--config=<path>`: Configuration file (default `cstudio.toml`)
//! - `--log-level=`, `--log-filter=`, `--log-file=`, `--log-format=`
//! - `-q`, `-v`, `-vv`, `-vvv`: Logging verbosity
//!
//! Command line flags override the configuration file.

#include "cli/driver.hpp"
#include "cli/utils.hpp"
#include "commands/cmd_blocks.hpp"
#include "commands/cmd_links.hpp"
#include "commands/cmd_reflow.hpp"
#include "commands/cmd_tags.hpp"
#include "common.hpp"
#include "config/studio_config.hpp"
#include "log/log.hpp"
#include "tags/tag_tokenizer.hpp"

#include <charconv>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace cstudio::cli {

/// Splits the arguments after the command into the input file and options.
/// Returns false after reporting a missing or duplicated file argument.
static bool split_arguments(const std::vector<std::string>& args, const char* usage,
                            std::string& path, std::vector<std::string>& options) {
    for (size_t i = 1; i < args.size(); ++i) {
        if (args[i].starts_with("-")) {
            options.push_back(args[i]);
        } else if (path.empty()) {
            path = args[i];
        } else {
            std::cerr << "error: unexpected argument '" << args[i] << "'\n";
            std::cerr << "Usage: " << usage << "\n";
            return false;
        }
    }
    if (path.empty()) {
        std::cerr << "Usage: " << usage << "\n";
        return false;
    }
    return true;
}

static int unknown_option(const std::string& command, const std::string& option) {
    std::cerr << "error: unknown option '" << option << "' for " << command << "\n";
    return 1;
}

static int dispatch_reflow(const std::vector<std::string>& args,
                           const config::StudioConfig& settings) {
    const char* usage = "cstudio reflow <file> [--max-line-length=N] [--no-compact] "
                        "[--no-blank-lines] [--check] [--write] [--lang=<type>]";
    ReflowOptions options;
    std::vector<std::string> flags;
    if (!split_arguments(args, usage, options.path, flags)) {
        return 1;
    }

    int max_line_length = settings.reflow.max_line_length;
    bool compact = settings.reflow.use_compact_style;
    bool preserve_blank_lines = settings.reflow.preserve_blank_lines;

    for (const auto& flag : flags) {
        if (auto value = option_value(flag, "--max-line-length")) {
            auto [ptr, ec] =
                std::from_chars(value->data(), value->data() + value->size(), max_line_length);
            if (ec != std::errc{} || ptr != value->data() + value->size()) {
                std::cerr << "error: --max-line-length expects an integer, got '" << *value
                          << "'\n";
                return 1;
            }
        } else if (auto lang = option_value(flag, "--lang")) {
            options.language = std::string(*lang);
        } else if (flag == "--no-compact") {
            compact = false;
        } else if (flag == "--no-blank-lines") {
            preserve_blank_lines = false;
        } else if (flag == "--check") {
            options.check = true;
        } else if (flag == "--write") {
            options.write = true;
        } else {
            return unknown_option("reflow", flag);
        }
    }

    if (options.check && options.write) {
        std::cerr << "error: --check and --write cannot be combined\n";
        return 1;
    }

    auto config = reflow::make_reflow_config(max_line_length, compact, preserve_blank_lines);
    if (is_err(config)) {
        std::cerr << "error: " << unwrap_err(config) << "\n";
        return 1;
    }
    options.config = unwrap(config);
    return run_reflow(options);
}

static int dispatch_blocks(const std::vector<std::string>& args) {
    const char* usage = "cstudio blocks <file> [--lang=<type>]";
    std::string path;
    std::vector<std::string> flags;
    if (!split_arguments(args, usage, path, flags)) {
        return 1;
    }

    std::string language;
    for (const auto& flag : flags) {
        if (auto lang = option_value(flag, "--lang")) {
            language = std::string(*lang);
        } else {
            return unknown_option("blocks", flag);
        }
    }
    return run_blocks(path, language);
}

static int dispatch_links(const std::vector<std::string>& args) {
    std::string path;
    std::vector<std::string> flags;
    if (!split_arguments(args, "cstudio links <file>", path, flags)) {
        return 1;
    }
    if (!flags.empty()) {
        return unknown_option("links", flags.front());
    }
    return run_links(path);
}

static int dispatch_tags(const std::vector<std::string>& args,
                         const config::StudioConfig& settings) {
    const char* usage = "cstudio tags <file> [--custom-tags=A,B] [--format=tsv|csv|md|json] "
                        "[--output=<path>] [--lang=<type>]";
    TagsOptions options;
    std::vector<std::string> flags;
    if (!split_arguments(args, usage, options.path, flags)) {
        return 1;
    }

    options.custom_tags = settings.custom_tags;
    for (const auto& flag : flags) {
        if (auto custom = option_value(flag, "--custom-tags")) {
            options.custom_tags = tags::parse_custom_tags(*custom);
        } else if (auto format = option_value(flag, "--format")) {
            options.format = tags::parse_export_format(*format);
            if (!options.format) {
                std::cerr << "error: unknown export format '" << *format
                          << "' (expected tsv, csv, md or json)\n";
                return 1;
            }
        } else if (auto output = option_value(flag, "--output")) {
            options.output = std::string(*output);
        } else if (auto lang = option_value(flag, "--lang")) {
            options.language = std::string(*lang);
        } else {
            return unknown_option("tags", flag);
        }
    }
    return run_tags(options);
}

/// Main entry point for the cstudio CLI.
///
/// ## Return Codes
///
/// | Code | Meaning                                        |
/// |------|------------------------------------------------|
/// | 0    | Success                                        |
/// | 1    | Error, or `reflow --check` found work to do    |
int cstudio_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    std::vector<std::string> args;
    std::string config_path = config::CONFIG_FILE_NAME;
    bool explicit_config = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (log::is_log_option(arg)) {
            continue;
        }
        if (auto path = option_value(arg, "--config")) {
            config_path = std::string(*path);
            explicit_config = true;
            continue;
        }
        args.emplace_back(arg);
    }

    if (args.empty()) {
        print_usage();
        return 0;
    }

    const std::string& command = args.front();

    if (command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    if (command == "--version" || command == "-V") {
        print_version();
        return 0;
    }

    std::error_code ec;
    if (explicit_config && !std::filesystem::exists(config_path, ec)) {
        std::cerr << "error: config file " << config_path << " does not exist\n";
        return 1;
    }
    auto settings = config::load_studio_config(config_path);
    if (is_err(settings)) {
        std::cerr << "error: " << unwrap_err(settings) << "\n";
        return 1;
    }

    CSTUDIO_LOG_DEBUG("cli", "command " << command << " with " << args.size() - 1
                                        << " argument(s)");

    int status = 1;
    if (command == "reflow") {
        status = dispatch_reflow(args, unwrap(settings));
    } else if (command == "blocks") {
        status = dispatch_blocks(args);
    } else if (command == "links") {
        status = dispatch_links(args);
    } else if (command == "tags") {
        status = dispatch_tags(args, unwrap(settings));
    } else {
        std::cerr << "error: unknown command '" << command << "'\n";
        std::cerr << "Run 'cstudio --help' for usage.\n";
    }

    log::Logger::instance().flush();
    return status;
}

} // namespace cstudio::cli
