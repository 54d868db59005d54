#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <tandem/logger.hpp>
#include <tandem/thread_names.hpp>

namespace tandem
{

Logger& Logger::instance()
{
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::get_level() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::add_sink(LogSink sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
    sinks_configured_ = true;
}

void Logger::clear_sinks()
{
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
    sinks_configured_ = true;
}

void Logger::set_output_file(std::optional<std::string> path)
{
    LogSink sink = path ? sinks::file_sink(*path) : sinks::console_sink();

    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
    sinks_.push_back(std::move(sink));
    sinks_configured_ = true;
}

void Logger::log(LogLevel         level,
                 std::string_view category,
                 std::string_view message,
                 std::string_view file,
                 int              line,
                 std::string_view function)
{
    if (!is_enabled(level))
    {
        return;
    }

    // Resolved before taking mutex_: the name table lives behind its own slot lock.
    LogEntry entry{.timestamp   = std::chrono::system_clock::now(),
                   .level       = level,
                   .category    = std::string(category),
                   .thread_name = current_thread_name(),
                   .message     = std::string(message),
                   .file        = std::string(file),
                   .line        = line,
                   .function    = std::string(function)};

    std::lock_guard<std::mutex> lock(mutex_);
    if (!sinks_configured_)
    {
        sinks_.push_back(sinks::console_sink());
        sinks_configured_ = true;
    }
    for (const auto& sink : sinks_)
    {
        sink(entry);
    }
}

bool Logger::is_enabled(LogLevel level) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= min_level_;
}

std::string Logger::level_to_string(LogLevel level)
{
    switch (level)
    {
        case LogLevel::Trace:
            return "TRACE";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Critical:
            return "CRITICAL";
        default:
            return "UNKNOWN";
    }
}

std::string Logger::timestamp_to_string(const std::chrono::system_clock::time_point& tp)
{
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::stringstream ss;
    ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

std::string Logger::format_line(const LogEntry& entry)
{
    std::string owner = entry.category + " @" + entry.thread_name;

    std::stringstream ss;
    ss << timestamp_to_string(entry.timestamp) << " " << std::left << std::setw(10)
       << ("[" + level_to_string(entry.level) + "]") << " " << std::right
       << std::setw(static_cast<int>(OWNER_WIDTH)) << owner << " |: " << entry.message;

    if (!entry.file.empty())
    {
        ss << " (" << entry.file << ":" << entry.line;
        if (!entry.function.empty())
        {
            ss << " in " << entry.function;
        }
        ss << ")";
    }
    return ss.str();
}

std::optional<LogLevel> parse_log_level(std::string_view name)
{
    std::string lowered(name);
    std::transform(lowered.begin(),
                   lowered.end(),
                   lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace")
        return LogLevel::Trace;
    if (lowered == "debug")
        return LogLevel::Debug;
    if (lowered == "info")
        return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning")
        return LogLevel::Warning;
    if (lowered == "error")
        return LogLevel::Error;
    if (lowered == "critical")
        return LogLevel::Critical;
    return std::nullopt;
}

void configure_logger_from_env()
{
    auto& logger = Logger::instance();

    if (const char* env = std::getenv("TANDEM_LOG_LEVEL"); env && env[0] != '\0')
    {
        if (auto level = parse_log_level(env))
        {
            logger.set_level(*level);
        }
        else
        {
            TANDEM_LOG_WARN("logger", "Ignoring unknown TANDEM_LOG_LEVEL '{}'", env);
        }
    }

    if (const char* env = std::getenv("TANDEM_LOG_FILE"); env && env[0] != '\0')
    {
        logger.set_output_file(std::string(env));
    }
}

namespace sinks
{

Logger::LogSink console_sink()
{
    return [](const Logger::LogEntry& entry)
    {
        const char* color_code = "";
        const char* reset_code = "\033[0m";

        switch (entry.level)
        {
            case LogLevel::Trace:
                color_code = "\033[37m";
                break;
            case LogLevel::Debug:
                color_code = "\033[3;4;32m";
                break;
            case LogLevel::Info:
                color_code = "\033[34m";
                break;
            case LogLevel::Warning:
                color_code = "\033[1;33m";
                break;
            case LogLevel::Error:
                color_code = "\033[1;4;31m";
                break;
            case LogLevel::Critical:
                color_code = "\033[1;35m";
                break;
        }

        std::ostream& out = entry.level >= LogLevel::Error ? std::cerr : std::cout;
        out << color_code << Logger::format_line(entry) << reset_code << std::endl;
    };
}

Logger::LogSink file_sink(const std::string& filename)
{
    auto file = std::make_shared<std::ofstream>(filename, std::ios::app);
    return [file](const Logger::LogEntry& entry)
    {
        if (file->is_open())
        {
            *file << Logger::format_line(entry) << '\n';
            file->flush();
        }
    };
}

Logger::LogSink null_sink()
{
    return [](const Logger::LogEntry&)
    {
        // Do nothing
    };
}

}   // namespace sinks

}   // namespace tandem
