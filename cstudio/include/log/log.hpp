//! # cstudio Logging
//!
//! Structured logging for the cstudio command line tool.
//!
//! - Five severities (Trace, Debug, Info, Warn, Error) plus Off
//! - Every message carries a module tag (`reflow`, `links`, `tags`, ...)
//! - Pluggable sinks: console, file and fan-out
//! - Per-module filtering with `mod=level,*=level` specifications
//! - Compile-time elision via `CSTUDIO_MIN_LOG_LEVEL`
//!
//! The analysis core (`comment/`, `xmldoc/`, `reflow/`, `links/`, `tags/`) does not
//! log. Only the command line layer and the configuration loader do.
//!
//! ## Usage
//!
//! ```cpp
//! CSTUDIO_LOG_INFO("reflow", "Rewrote " << changed << " blocks in " << path);
//! CSTUDIO_LOG_DEBUG("config", "Ignoring unknown key '" << key << "'");
//! ```

#ifndef CSTUDIO_LOG_HPP
#define CSTUDIO_LOG_HPP

#include <chrono>
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cstudio::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severities in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Fine-grained tracing
    Debug = 1, ///< Diagnostic detail
    Info = 2,  ///< Progress messages
    Warn = 3,  ///< Suspicious input that was tolerated
    Error = 4, ///< Failed operations
    Off = 5    ///< Disables all logging
};

/// Returns the upper-case name of a level (e.g. "WARN").
inline auto level_name(LogLevel level) -> const char* {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

/// Parses a level name, ignoring case. Unknown names map to Info.
auto parse_level(std::string_view name) -> LogLevel;

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with its metadata.
struct LogRecord {
    LogLevel level = LogLevel::Info; ///< Severity
    std::string_view module;         ///< Module tag
    std::string message;             ///< Formatted message text
    int64_t timestamp_ms = 0;        ///< Milliseconds since epoch
};

/// Output encoding used by sinks.
enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    JSON  ///< One JSON object per line
};

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract destination for log records.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr, coloured when stderr is a terminal.
class ConsoleSink : public LogSink {
public:
    ConsoleSink();

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
};

/// Appends to a file. Error records are flushed at once.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    [[nodiscard]] auto is_open() const -> bool {
        return file_.is_open();
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

/// Forwards every record to a list of child sinks.
class MultiSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;

    void add(std::unique_ptr<LogSink> sink);

    [[nodiscard]] auto size() const -> size_t {
        return sinks_.size();
    }

private:
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

/// Renders a record as a single line without the trailing newline.
[[nodiscard]] auto format_record(const LogRecord& record, LogFormat format) -> std::string;

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based level filter.
///
/// Accepts specifications such as `"links=trace,config=debug,*=warn"`. A bare
/// module name without `=level` enables everything for that module.
class LogFilter {
public:
    LogFilter() = default;

    void parse(std::string_view spec);

    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    [[nodiscard]] auto default_level() const -> LogLevel {
        return default_level_;
    }

    /// Lowest level accepted by any module or by the default.
    [[nodiscard]] auto min_level() const -> LogLevel;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

/// Logger setup produced by `parse_log_options` or built by hand.
struct LogConfig {
    LogLevel level = LogLevel::Info;    ///< Global minimum level
    LogFormat format = LogFormat::Text; ///< Sink output format
    std::string filter_spec;            ///< Module filter specification
    std::string log_file;               ///< Optional log file path, besides stderr
};

/// Process-wide, thread-safe logger.
///
/// Without an explicit `init()` the logger has no sinks and drops records.
class Logger {
public:
    /// Replaces the sinks and levels of the global logger.
    static void init(const LogConfig& config);

    static auto instance() -> Logger&;

    /// Cheap check used by the macros before a message is formatted.
    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void log(const LogRecord& record);
    void log(LogLevel level, std::string_view module, const std::string& message);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink. Used by tests to isolate captured output.
    void clear_sinks();

    /// Sets the global minimum and the filter's default level.
    void set_level(LogLevel level);

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger() = default;

    LogLevel level_ = LogLevel::Info;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Time
// ============================================================================

inline auto epoch_ms() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// Command Line
// ============================================================================

/// Builds a LogConfig from argv.
///
/// Recognises `--log-level=`, `--log-filter=`, `--log-file=`, `--log-format=`,
/// `-q`/`--quiet` and `-v`/`-vv`/`-vvv`. Falls back to the `CSTUDIO_LOG`
/// environment variable when no level or filter was given. The default level
/// is Warn.
[[nodiscard]] auto parse_log_options(int argc, char* argv[]) -> LogConfig;

/// Returns true if `arg` is one of the logging options above, so command
/// parsers can skip it.
[[nodiscard]] auto is_log_option(std::string_view arg) -> bool;

// ============================================================================
// Logging Macros
// ============================================================================

// Messages below this level are compiled out.
// 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Off
#ifndef CSTUDIO_MIN_LOG_LEVEL
#define CSTUDIO_MIN_LOG_LEVEL 0
#endif

#define CSTUDIO_LOG_IMPL(level, module_str, msg)                                                   \
    do {                                                                                           \
        if (static_cast<int>(level) >= CSTUDIO_MIN_LOG_LEVEL) {                                    \
            auto& cstudio_logger_ = ::cstudio::log::Logger::instance();                            \
            if (cstudio_logger_.should_log(level, module_str)) {                                   \
                std::ostringstream cstudio_oss_;                                                   \
                cstudio_oss_ << msg;                                                               \
                cstudio_logger_.log(level, module_str, cstudio_oss_.str());                        \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Usage: CSTUDIO_LOG_TRACE("module", "message " << value);
#define CSTUDIO_LOG_TRACE(module, msg) CSTUDIO_LOG_IMPL(::cstudio::log::LogLevel::Trace, module, msg)
#define CSTUDIO_LOG_DEBUG(module, msg) CSTUDIO_LOG_IMPL(::cstudio::log::LogLevel::Debug, module, msg)
#define CSTUDIO_LOG_INFO(module, msg) CSTUDIO_LOG_IMPL(::cstudio::log::LogLevel::Info, module, msg)
#define CSTUDIO_LOG_WARN(module, msg) CSTUDIO_LOG_IMPL(::cstudio::log::LogLevel::Warn, module, msg)
#define CSTUDIO_LOG_ERROR(module, msg) CSTUDIO_LOG_IMPL(::cstudio::log::LogLevel::Error, module, msg)

} // namespace cstudio::log

#endif // CSTUDIO_LOG_HPP
