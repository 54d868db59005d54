#pragma once

#include <chrono>
#include <fstream>
#include <functional>
#include <iomanip>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace tandem
{

enum class LogLevel : int
{
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5
};

class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level;
        std::string                           category;
        std::string                           thread_name;
        std::string                           message;
        std::string                           file;
        int                                   line;
        std::string                           function;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    // Width the "owner @thread" column is right-justified to.
    static constexpr size_t OWNER_WIDTH = 48;

    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel get_level() const;

    void add_sink(LogSink sink);
    void clear_sinks();

    // Exclusive output selection: a path routes everything to that file
    // (append mode), std::nullopt routes everything to the console.
    void set_output_file(std::optional<std::string> path);

    void log(LogLevel         level,
             std::string_view category,
             std::string_view message,
             std::string_view file     = "",
             int              line     = 0,
             std::string_view function = "");

    template <typename... Args>
    void log_formatted(LogLevel         level,
                       std::string_view category,
                       std::string_view format,
                       Args&&... args);

    bool is_enabled(LogLevel level) const;

   private:
    Logger()                         = default;
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex   mutex_;
    LogLevel             min_level_ = LogLevel::Info;
    std::vector<LogSink> sinks_;
    bool                 sinks_configured_ = false;

    template <typename T>
    static std::string arg_to_string(T&& v)
    {
        using D = std::decay_t<T>;
        if constexpr (std::is_same_v<D, std::string>)
            return v;
        else if constexpr (std::is_same_v<D, std::string_view>)
            return std::string(v);
        else if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>)
        {
            const char* p = v;
            return p ? std::string(p) : std::string("(null)");
        }
        else if constexpr (std::is_same_v<D, bool>)
            return v ? "true" : "false";
        else if constexpr (std::is_floating_point_v<D>)
        {
            std::ostringstream ss;
            ss << std::fixed << std::setprecision(2) << v;
            return ss.str();
        }
        else
            return std::to_string(v);
    }

    static std::string format_message(std::string_view format, auto&&... args)
    {
        std::string result(format);
        if constexpr (sizeof...(args) > 0)
        {
            size_t search_from  = 0;
            auto   replace_next = [&](auto&& arg)
            {
                auto pos = result.find("{}", search_from);
                if (pos != std::string::npos)
                {
                    auto text = arg_to_string(std::forward<decltype(arg)>(arg));
                    result.replace(pos, 2, text);
                    search_from = pos + text.size();
                }
            };
            (replace_next(std::forward<decltype(args)>(args)), ...);
        }
        return result;
    }

   public:
    static std::string level_to_string(LogLevel level);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

    // "<timestamp> [LEVEL] <owner @thread> |: message" without colour codes.
    static std::string format_line(const LogEntry& entry);
};

// Template definitions must be in the header
template <typename... Args>
void Logger::log_formatted(LogLevel         level,
                           std::string_view category,
                           std::string_view format,
                           Args&&... args)
{
    if (!is_enabled(level))
    {
        return;
    }

    try
    {
        std::string formatted = format_message(format, std::forward<Args>(args)...);
        log(level, category, formatted);
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "logger", std::string("Format error: ") + e.what());
    }
}

// Parses "trace", "debug", "info", "warn"/"warning", "error", "critical".
std::optional<LogLevel> parse_log_level(std::string_view name);

// Applies TANDEM_LOG_LEVEL and TANDEM_LOG_FILE when they are set.
void configure_logger_from_env();

namespace sinks
{
Logger::LogSink console_sink();
Logger::LogSink file_sink(const std::string& filename);
Logger::LogSink null_sink();
}   // namespace sinks

#define TANDEM_LOG_AT(level, category, ...)                                                \
    do                                                                                     \
    {                                                                                      \
        if (::tandem::Logger::instance().is_enabled(level))                                \
        {                                                                                  \
            ::tandem::Logger::instance().log_formatted(level, category, __VA_ARGS__);      \
        }                                                                                  \
    } while (0)

#ifdef NDEBUG
    #define TANDEM_LOG_TRACE(category, ...) \
        do                                  \
        {                                   \
        } while (0)
#else
    #define TANDEM_LOG_TRACE(category, ...) \
        TANDEM_LOG_AT(::tandem::LogLevel::Trace, category, __VA_ARGS__)
#endif

#define TANDEM_LOG_DEBUG(category, ...) \
    TANDEM_LOG_AT(::tandem::LogLevel::Debug, category, __VA_ARGS__)

#define TANDEM_LOG_INFO(category, ...) \
    TANDEM_LOG_AT(::tandem::LogLevel::Info, category, __VA_ARGS__)

#define TANDEM_LOG_WARN(category, ...) \
    TANDEM_LOG_AT(::tandem::LogLevel::Warning, category, __VA_ARGS__)

#define TANDEM_LOG_ERROR(category, ...) \
    TANDEM_LOG_AT(::tandem::LogLevel::Error, category, __VA_ARGS__)

#define TANDEM_LOG_CRITICAL(category, ...) \
    TANDEM_LOG_AT(::tandem::LogLevel::Critical, category, __VA_ARGS__)

#define TANDEM_LOG_DEBUG_HERE(category, ...) \
    TANDEM_LOG_DEBUG(category, __VA_ARGS__ " [{}:{}:{}]", __FILE__, __LINE__, __FUNCTION__)

#define TANDEM_LOG_WARN_HERE(category, ...) \
    TANDEM_LOG_WARN(category, __VA_ARGS__ " [{}:{}:{}]", __FILE__, __LINE__, __FUNCTION__)

#define TANDEM_LOG_ERROR_HERE(category, ...) \
    TANDEM_LOG_ERROR(category, __VA_ARGS__ " [{}:{}:{}]", __FILE__, __LINE__, __FUNCTION__)

}   // namespace tandem
