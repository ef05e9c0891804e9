//! # Log Initialization from the Command Line
//!
//! Turns logging flags and the `CSTUDIO_LOG` environment variable into a
//! LogConfig.

#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

namespace cstudio::log {

namespace {

/// Returns the number of `v` characters in `-v`, `-vv`, `-vvv`, or 0.
auto verbosity_count(std::string_view arg) -> int {
    if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-') {
        return 0;
    }
    for (size_t i = 1; i < arg.size(); ++i) {
        if (arg[i] != 'v') {
            return 0;
        }
    }
    return static_cast<int>(arg.size() - 1);
}

} // namespace

auto is_log_option(std::string_view arg) -> bool {
    return arg.starts_with("--log-level=") || arg.starts_with("--log-filter=") ||
           arg.starts_with("--log-file=") || arg.starts_with("--log-format=") || arg == "-q" ||
           arg == "--quiet" || arg == "--verbose" || verbosity_count(arg) > 0;
}

auto parse_log_options(int argc, char* argv[]) -> LogConfig {
    LogConfig config;
    config.level = LogLevel::Warn;

    bool has_level = false;
    bool has_filter = false;
    int verbosity = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg.starts_with("--log-level=")) {
            config.level = parse_level(arg.substr(12));
            has_level = true;
        } else if (arg.starts_with("--log-filter=")) {
            config.filter_spec = std::string(arg.substr(13));
            has_filter = true;
        } else if (arg.starts_with("--log-file=")) {
            config.log_file = std::string(arg.substr(11));
        } else if (arg.starts_with("--log-format=")) {
            auto fmt = arg.substr(13);
            config.format = (fmt == "json" || fmt == "JSON") ? LogFormat::JSON : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            config.level = LogLevel::Error;
            has_level = true;
        } else if (arg == "--verbose") {
            verbosity = std::max(verbosity, 1);
        } else {
            verbosity = std::max(verbosity, verbosity_count(arg));
        }
    }

    // -v = Info, -vv = Debug, -vvv = Trace, unless --log-level was explicit
    if (!has_level && verbosity > 0) {
        config.level = verbosity >= 3   ? LogLevel::Trace
                       : verbosity == 2 ? LogLevel::Debug
                                        : LogLevel::Info;
        has_level = true;
    }

    if (!has_level && !has_filter) {
        const char* env = std::getenv("CSTUDIO_LOG");
        std::string value = env != nullptr ? env : "";
        if (value.find('=') != std::string::npos || value.find(',') != std::string::npos) {
            config.filter_spec = value;
        } else if (!value.empty()) {
            config.level = parse_level(value);
        }
    }

    return config;
}

} // namespace cstudio::log
