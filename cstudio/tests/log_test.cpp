//! # Logger Unit Tests
//!
//! Tests for the cstudio logging layer: LogFilter parsing, record
//! formatting, FileSink I/O, command line options, the logging macros,
//! and thread safety.

#include "log/log.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace cstudio::log;
namespace fs = std::filesystem;

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("reflow=debug,*=warn");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "reflow"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "reflow"));

    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "tags"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "tags"));
}

TEST_F(LogFilterTest, ParseBareModuleName) {
    // A bare module name enables everything for that module
    filter.parse("links");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "links"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "config"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "config"));
}

TEST_F(LogFilterTest, ModuleOff) {
    filter.parse("config=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Error, "config"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "cli"));
}

TEST_F(LogFilterTest, MinLevelAcrossModules) {
    filter.parse("tags=trace,*=error");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST_F(LogFilterTest, MinLevelDefaultOnly) {
    filter.set_default_level(LogLevel::Error);
    EXPECT_EQ(filter.min_level(), LogLevel::Error);
}

TEST_F(LogFilterTest, EmptyFilter) {
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "anything"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "anything"));
}

TEST(LogLevelTest, ParseLevelNames) {
    EXPECT_EQ(parse_level("TRACE"), LogLevel::Trace);
    EXPECT_EQ(parse_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_level("Off"), LogLevel::Off);
    EXPECT_EQ(parse_level("loud"), LogLevel::Info);
    EXPECT_STREQ(level_name(LogLevel::Error), "ERROR");
}

// ============================================================================
// Record Formatting
// ============================================================================

TEST(FormatRecordTest, TextContainsLevelAndModule) {
    LogRecord record;
    record.level = LogLevel::Warn;
    record.module = "reflow";
    record.message = "block changed";

    auto text = format_record(record, LogFormat::Text);
    EXPECT_NE(text.find("WARN"), std::string::npos);
    EXPECT_NE(text.find("[reflow] block changed"), std::string::npos);
}

TEST(FormatRecordTest, TextTimeComesFromRecord) {
    LogRecord record;
    record.module = "cli";
    record.message = "x";
    record.timestamp_ms = 86'400'000 + 1234;

    auto text = format_record(record, LogFormat::Text);
    EXPECT_EQ(text.find(".234 INFO  [cli] x"), 8u) << text;
    EXPECT_EQ(format_record(record, LogFormat::Text), text);
}

TEST(FormatRecordTest, JsonEscapesSpecialCharacters) {
    LogRecord record;
    record.level = LogLevel::Info;
    record.module = "tags";
    record.message = "line1\nline2\t\"quoted\"\\";
    record.timestamp_ms = 42;

    EXPECT_EQ(format_record(record, LogFormat::JSON),
              "{\"ts\":42,\"level\":\"INFO\",\"module\":\"tags\","
              "\"msg\":\"line1\\nline2\\t\\\"quoted\\\"\\\\\"}");
}

// ============================================================================
// Helper: Capture sink that stores records in memory
// ============================================================================

class CaptureSink : public LogSink {
public:
    void write(const LogRecord& record) override {
        records.push_back({record.level, std::string(record.module), record.message});
    }
    void flush() override {}

    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };

    std::vector<Entry> records;
};

// ============================================================================
// FileSink
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    fs::path temp_file;

    void SetUp() override {
        temp_file = fs::temp_directory_path() / "cstudio_log_test.log";
        if (fs::exists(temp_file)) {
            fs::remove(temp_file);
        }
    }

    void TearDown() override {
        if (fs::exists(temp_file)) {
            fs::remove(temp_file);
        }
    }

    std::string read_file(const fs::path& path) {
        std::ifstream f(path);
        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        return content;
    }

    static LogRecord make_record(LogLevel level, std::string_view module, std::string message) {
        LogRecord record;
        record.level = level;
        record.module = module;
        record.message = std::move(message);
        record.timestamp_ms = epoch_ms();
        return record;
    }
};

TEST_F(FileSinkTest, CreatesAndWritesFile) {
    {
        FileSink sink(temp_file.string(), false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "config", "file sink test"));
        sink.flush();
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("INFO"), std::string::npos);
    EXPECT_NE(content.find("[config]"), std::string::npos);
    EXPECT_NE(content.find("file sink test"), std::string::npos);
}

TEST_F(FileSinkTest, AppendsToExistingFile) {
    {
        FileSink sink(temp_file.string(), true);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "m1", "first"));
    }
    {
        FileSink sink(temp_file.string(), true);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Warn, "m2", "second"));
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(FileSinkTest, JsonFormat) {
    {
        FileSink sink(temp_file.string(), false);
        sink.set_format(LogFormat::JSON);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Error, "cli", "error occurred"));
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("{\"ts\":"), std::string::npos);
    EXPECT_NE(content.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(content.find("\"module\":\"cli\""), std::string::npos);
    EXPECT_NE(content.find("\"msg\":\"error occurred\""), std::string::npos);
}

TEST(MultiSinkTest, ForwardsToEverySink) {
    MultiSink multi;
    auto first = std::make_unique<CaptureSink>();
    auto second = std::make_unique<CaptureSink>();
    auto* first_ptr = first.get();
    auto* second_ptr = second.get();
    multi.add(std::move(first));
    multi.add(std::move(second));
    EXPECT_EQ(multi.size(), 2u);

    LogRecord record;
    record.module = "links";
    record.message = "hello";
    multi.write(record);

    ASSERT_EQ(first_ptr->records.size(), 1u);
    ASSERT_EQ(second_ptr->records.size(), 1u);
    EXPECT_EQ(second_ptr->records[0].module, "links");
}

// ============================================================================
// Command Line Options
// ============================================================================

class LogOptionsTest : public ::testing::Test {
protected:
    static LogConfig parse(std::vector<std::string> args) {
        std::vector<char*> argv;
        args.insert(args.begin(), "cstudio");
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return parse_log_options(static_cast<int>(argv.size()), argv.data());
    }
};

TEST_F(LogOptionsTest, Verbosity) {
    EXPECT_EQ(parse({"-v"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"-vv"}).level, LogLevel::Debug);
    EXPECT_EQ(parse({"reflow", "-vvv"}).level, LogLevel::Trace);
    EXPECT_EQ(parse({"-q"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, ExplicitLevelWinsOverVerbosity) {
    EXPECT_EQ(parse({"-vvv", "--log-level=error"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, FilterFileAndFormat) {
    auto config = parse({"--log-filter=tags=trace", "--log-file=out.log", "--log-format=json",
                         "--log-level=warn"});
    EXPECT_EQ(config.filter_spec, "tags=trace");
    EXPECT_EQ(config.log_file, "out.log");
    EXPECT_EQ(config.format, LogFormat::JSON);
}

TEST_F(LogOptionsTest, RecognizesLogOptions) {
    EXPECT_TRUE(is_log_option("--log-level=info"));
    EXPECT_TRUE(is_log_option("-vv"));
    EXPECT_TRUE(is_log_option("--quiet"));
    EXPECT_FALSE(is_log_option("--check"));
    EXPECT_FALSE(is_log_option("-V"));
    EXPECT_FALSE(is_log_option("reflow"));
}

// ============================================================================
// Logger and Macros
// ============================================================================

class LoggerTest : public ::testing::Test {
protected:
    CaptureSink* capture = nullptr;

    void SetUp() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        auto sink = std::make_unique<CaptureSink>();
        capture = sink.get();
        logger.add_sink(std::move(sink));
        logger.set_level(LogLevel::Info);
    }

    void TearDown() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.set_level(LogLevel::Warn);
    }
};

TEST_F(LoggerTest, MacroFormatsMessage) {
    CSTUDIO_LOG_INFO("tags", "found " << 3 << " tag(s)");

    ASSERT_EQ(capture->records.size(), 1u);
    EXPECT_EQ(capture->records[0].level, LogLevel::Info);
    EXPECT_EQ(capture->records[0].module, "tags");
    EXPECT_EQ(capture->records[0].message, "found 3 tag(s)");
}

TEST_F(LoggerTest, BelowLevelIsDropped) {
    CSTUDIO_LOG_DEBUG("reflow", "hidden");
    CSTUDIO_LOG_WARN("reflow", "shown");

    ASSERT_EQ(capture->records.size(), 1u);
    EXPECT_EQ(capture->records[0].message, "shown");
}

TEST_F(LoggerTest, FilterEnablesOneModule) {
    Logger::instance().set_filter("config=debug");

    CSTUDIO_LOG_DEBUG("config", "visible");
    CSTUDIO_LOG_DEBUG("cli", "hidden");

    ASSERT_EQ(capture->records.size(), 1u);
    EXPECT_EQ(capture->records[0].module, "config");

    Logger::instance().set_filter("");
}

// ============================================================================
// Thread Safety
// ============================================================================

TEST_F(LoggerTest, ConcurrentLogging) {
    auto& logger = Logger::instance();

    const int num_threads = 8;
    const int messages_per_thread = 100;

    std::vector<std::thread> threads;
    threads.reserve(num_threads);

    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&logger, t, messages_per_thread]() {
            for (int i = 0; i < messages_per_thread; i++) {
                std::ostringstream oss;
                oss << "thread-" << t << "-msg-" << i;
                logger.log(LogLevel::Info, "test", oss.str());
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(static_cast<int>(capture->records.size()), num_threads * messages_per_thread);
}
