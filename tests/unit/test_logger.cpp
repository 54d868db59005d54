#include <gtest/gtest.h>

#include <tandem/logger.hpp>
#include <tandem/thread_names.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include "log_capture.hpp"

using namespace tandem;

namespace {

std::vector<std::string> read_lines(const std::filesystem::path& path) {
    std::ifstream            in(path);
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) {
        lines.push_back(line);
    }
    return lines;
}

Logger::LogEntry make_entry(LogLevel level, std::string category, std::string thread, std::string message) {
    Logger::LogEntry entry{};
    entry.timestamp   = std::chrono::system_clock::now();
    entry.level       = level;
    entry.category    = std::move(category);
    entry.thread_name = std::move(thread);
    entry.message     = std::move(message);
    entry.line        = 0;
    return entry;
}

}  // namespace

TEST(Logger, LevelFiltering) {
    test::LogCapture capture(LogLevel::Warning);

    TANDEM_LOG_DEBUG("test", "dropped");
    TANDEM_LOG_INFO("test", "dropped");
    TANDEM_LOG_WARN("test", "kept");
    TANDEM_LOG_ERROR("test", "kept");
    TANDEM_LOG_CRITICAL("test", "kept");

    auto entries = capture.entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].level, LogLevel::Warning);
    EXPECT_EQ(entries[1].level, LogLevel::Error);
    EXPECT_EQ(entries[2].level, LogLevel::Critical);
    EXPECT_FALSE(capture.contains("dropped"));
}

TEST(Logger, IsEnabledFollowsLevel) {
    test::LogCapture capture(LogLevel::Error);
    auto&            logger = Logger::instance();
    EXPECT_FALSE(logger.is_enabled(LogLevel::Warning));
    EXPECT_TRUE(logger.is_enabled(LogLevel::Error));
    EXPECT_TRUE(logger.is_enabled(LogLevel::Critical));
}

TEST(Logger, FormatsPlaceholdersInOrder) {
    test::LogCapture capture;

    TANDEM_LOG_INFO("test", "a {} b {} c {}", 1, std::string("x"), true);
    TANDEM_LOG_INFO("test", "ms {}", 30.0);
    TANDEM_LOG_INFO("test", "literal {} braces", "{}");
    TANDEM_LOG_INFO("test", "missing {} {}", 7);

    auto entries = capture.entries();
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].message, "a 1 b x c true");
    EXPECT_EQ(entries[1].message, "ms 30.00");
    EXPECT_EQ(entries[2].message, "literal {} braces");
    EXPECT_EQ(entries[3].message, "missing 7 {}");
}

TEST(Logger, EntryCarriesCategoryAndThreadName) {
    test::LogCapture capture;

    std::thread worker([]() {
        if (set_current_thread_name("logger-worker")) {
            TANDEM_LOG_INFO("net", "from worker");
        }
    });
    worker.join();

    auto entries = capture.entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].category, "net");
    EXPECT_EQ(entries[0].thread_name, "logger-worker");
}

TEST(Logger, UnnamedThreadGetsSynthesizedName) {
    test::LogCapture capture;

    std::thread worker([]() { TANDEM_LOG_INFO("net", "anonymous"); });
    worker.join();

    auto entries = capture.entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].thread_name.rfind("Thread-", 0), 0u);
}

TEST(Logger, NamedThreadLabelNotInheritedAfterJoin) {
    test::LogCapture capture;

    std::thread named([]() {
        if (set_current_thread_name("short-lived")) {
            TANDEM_LOG_INFO("net", "named");
        }
    });
    named.join();
    std::thread unnamed([]() { TANDEM_LOG_INFO("net", "unnamed"); });
    unnamed.join();

    auto entries = capture.entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].thread_name, "short-lived");
    EXPECT_EQ(entries[1].thread_name.rfind("Thread-", 0), 0u);
}

TEST(Logger, HereVariantsRecordSourceLocation) {
    test::LogCapture capture;
    TANDEM_LOG_WARN_HERE("test", "located");

    auto entries = capture.entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message.rfind("located [", 0), 0u);
    EXPECT_NE(entries[0].message.find("test_logger.cpp:"), std::string::npos);
    EXPECT_EQ(entries[0].message.back(), ']');
}

TEST(Logger, FormatLineLayout) {
    auto entry = make_entry(LogLevel::Warning, "render", "render", "Frame took 30.00ms");
    auto line  = Logger::format_line(entry);

    const std::string owner = "render @render";
    const std::string tail  = std::string(Logger::OWNER_WIDTH - owner.size(), ' ') + owner + " |: Frame took 30.00ms";
    EXPECT_NE(line.find("[WARN]    "), std::string::npos);
    ASSERT_GE(line.size(), tail.size());
    EXPECT_EQ(line.substr(line.size() - tail.size()), tail);

    // "YYYY-MM-DD HH:MM:SS.mmm " prefix
    ASSERT_GT(line.size(), 24u);
    EXPECT_EQ(line[4], '-');
    EXPECT_EQ(line[10], ' ');
    EXPECT_EQ(line[19], '.');
    EXPECT_EQ(line[23], ' ');
}

TEST(Logger, FormatLineAppendsSourceLocation) {
    auto entry     = make_entry(LogLevel::Error, "app", "control", "boom");
    entry.file     = "app.cpp";
    entry.line     = 12;
    entry.function = "build";

    auto line = Logger::format_line(entry);
    EXPECT_NE(line.find("|: boom (app.cpp:12 in build)"), std::string::npos);
}

TEST(Logger, LevelNames) {
    EXPECT_EQ(Logger::level_to_string(LogLevel::Trace), "TRACE");
    EXPECT_EQ(Logger::level_to_string(LogLevel::Debug), "DEBUG");
    EXPECT_EQ(Logger::level_to_string(LogLevel::Info), "INFO");
    EXPECT_EQ(Logger::level_to_string(LogLevel::Warning), "WARN");
    EXPECT_EQ(Logger::level_to_string(LogLevel::Error), "ERROR");
    EXPECT_EQ(Logger::level_to_string(LogLevel::Critical), "CRITICAL");
}

TEST(Logger, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_log_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("Info"), LogLevel::Info);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warning);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warning);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_EQ(parse_log_level("critical"), LogLevel::Critical);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
    EXPECT_FALSE(parse_log_level("").has_value());
}

TEST(Logger, EnvironmentSelectsLevel) {
    test::LogCapture capture(LogLevel::Info);

    ASSERT_EQ(setenv("TANDEM_LOG_LEVEL", "error", 1), 0);
    configure_logger_from_env();
    EXPECT_EQ(Logger::instance().get_level(), LogLevel::Error);

    ASSERT_EQ(setenv("TANDEM_LOG_LEVEL", "nonsense", 1), 0);
    configure_logger_from_env();
    EXPECT_EQ(Logger::instance().get_level(), LogLevel::Error);

    unsetenv("TANDEM_LOG_LEVEL");
}

TEST(Logger, OutputFileAppendsAndFlushes) {
    const auto path = std::filesystem::temp_directory_path() / "tandem_test_logger_output.log";
    {
        std::ofstream seed(path, std::ios::trunc);
        seed << "existing line\n";
    }

    {
        test::LogCapture capture(LogLevel::Info);
        Logger::instance().set_output_file(path.string());

        TANDEM_LOG_INFO("file", "first");
        TANDEM_LOG_WARN("file", "second {}", 2);

        // Flushed per entry: readable while the sink is still installed
        auto lines = read_lines(path);
        ASSERT_EQ(lines.size(), 3u);
        EXPECT_EQ(lines[0], "existing line");
        EXPECT_NE(lines[1].find("|: first"), std::string::npos);
        EXPECT_NE(lines[2].find("[WARN]"), std::string::npos);
        EXPECT_NE(lines[2].find("|: second 2"), std::string::npos);
    }

    std::filesystem::remove(path);
}

TEST(Logger, ConcurrentLoggingKeepsEveryEntry) {
    test::LogCapture capture;
    constexpr int    kThreads = 4;
    constexpr int    kEntries = 100;

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([t]() {
            for (int i = 0; i < kEntries; ++i) {
                TANDEM_LOG_INFO("stress", "worker {} entry {}", t, i);
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    EXPECT_EQ(capture.entries().size(), static_cast<size_t>(kThreads * kEntries));
}

TEST(Logger, NullSinkSwallowsOutput) {
    test::LogCapture capture(LogLevel::Info);
    auto&            logger = Logger::instance();
    logger.clear_sinks();
    logger.add_sink(sinks::null_sink());

    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    TANDEM_LOG_INFO("quiet", "nothing to see");
    TANDEM_LOG_ERROR("quiet", "still nothing");
    EXPECT_TRUE(testing::internal::GetCapturedStdout().empty());
    EXPECT_TRUE(testing::internal::GetCapturedStderr().empty());
    EXPECT_TRUE(capture.entries().empty());
}
