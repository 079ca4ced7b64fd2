#pragma once

#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

// ANSI color codes for terminal output
namespace runmap::color {
inline constexpr const char* RESET = "\033[0m";
inline constexpr const char* RED = "\033[0;31m";
inline constexpr const char* GREEN = "\033[0;32m";
inline constexpr const char* YELLOW = "\033[0;33m";
inline constexpr const char* CYAN = "\033[0;36m";

inline constexpr const char* BOLD_RED = "\033[1;31m";
inline constexpr const char* BOLD_GREEN = "\033[1;32m";
inline constexpr const char* BOLD_YELLOW = "\033[1;33m";
}  // namespace runmap::color

// Usage: LOGI(COLORED(RED, "Error:"), " something went wrong")
#define COLORED(color_arg, text) \
    runmap::color::color_arg, text, runmap::color::RESET

#ifndef RUNMAP_PROJECT_ROOT
#define RUNMAP_PROJECT_ROOT ""
#define RUNMAP_PROJECT_ROOT_LENGTH 0
#endif

#define __RELATIVE_FILEPATH__                                                \
    (strncmp(__FILE__, RUNMAP_PROJECT_ROOT, RUNMAP_PROJECT_ROOT_LENGTH) == 0 \
         ? &(__FILE__[RUNMAP_PROJECT_ROOT_LENGTH])                           \
         : __FILE__)

enum class LogLevel {
    NONE = -2,     // Special level to disable all logging
    INHERIT = -1,  // Special level for partitions to inherit global level
    ERROR = 0,
    WARNING = 1,
    INFO = 2,
    DEBUG = 3
};

class LogPartition;

/**
 * Process-wide logger.
 *
 * Initialized statically, never torn down, safe to call from any thread.
 * Messages are assembled before the output mutex is taken so that slow
 * formatting never serializes callers.
 */
class Logger
{
private:
    static LogLevel current_level_;
    static std::mutex log_mutex_;
    static std::ostream* output_stream_;
    static std::ostream* error_stream_;

    static bool
    should_log(LogLevel level);

    static std::string
    format_timestamp()
    {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
            1000;

        std::tm tm_now;
#ifdef _WIN32
        localtime_s(&tm_now, &time_t_now);
#else
        localtime_r(&time_t_now, &tm_now);
#endif

        std::ostringstream oss;
        oss << "[" << std::setfill('0') << std::setw(2) << tm_now.tm_hour << ":"
            << std::setw(2) << tm_now.tm_min << ":" << std::setw(2)
            << tm_now.tm_sec << "." << std::setw(3) << ms.count() << "] ";

        return oss.str();
    }

    static const char*
    level_tag(LogLevel level)
    {
        switch (level)
        {
            case LogLevel::ERROR:
                return "[ERROR] ";
            case LogLevel::WARNING:
                return "[WARN]  ";
            case LogLevel::INFO:
                return "[INFO]  ";
            case LogLevel::DEBUG:
                return "[DEBUG] ";
            case LogLevel::NONE:
            case LogLevel::INHERIT:
                break;
        }
        return "";
    }

    // Emits an already level-checked message
    template <typename... Args>
    static void
    write(LogLevel level, const Args&... args)
    {
        std::ostringstream oss;
        oss << format_timestamp() << level_tag(level);
        (oss << ... << args);

        std::lock_guard<std::mutex> lock(log_mutex_);
        std::ostream& out = (level <= LogLevel::WARNING)
            ? (error_stream_ ? *error_stream_ : std::cerr)
            : (output_stream_ ? *output_stream_ : std::cout);
        out << oss.str() << std::endl;
    }

    friend class LogPartition;

public:
    static void
    set_level(LogLevel level);

    /**
     * Set the level by name; see parse_level().
     *
     * @return false, leaving the level unchanged, if the name is unknown
     */
    static bool
    set_level(const std::string& level);

    /**
     * Level for a case-insensitive name: none, error, warn or warning, info,
     * debug. INHERIT has no name.
     */
    static std::optional<LogLevel>
    parse_level(std::string_view name);

    static const char*
    level_name(LogLevel level);

    static LogLevel
    get_level();

    /**
     * Redirect INFO/DEBUG output. Pass nullptr to restore std::cout.
     */
    static void
    set_output_stream(std::ostream* output_stream);

    /**
     * Redirect ERROR/WARNING output. Pass nullptr to restore std::cerr.
     */
    static void
    set_error_stream(std::ostream* error_stream);

    static void
    reset_streams();

    template <typename... Args>
    static void
    log(LogLevel level, const Args&... args)
    {
        if (!should_log(level))
            return;
        write(level, args...);
    }
};

/**
 * A named logging channel with its own level.
 *
 * A partition left at INHERIT follows the global Logger level; one given an
 * explicit level is filtered by that level alone, so a single component can
 * be silenced or made verbose without touching the rest.
 */
class LogPartition
{
public:
    LogPartition(const std::string& name, LogLevel level = LogLevel::INHERIT)
        : name_(name), level_(level)
    {
    }

    const std::string&
    name() const
    {
        return name_;
    }

    LogLevel
    level() const
    {
        return (level_ == LogLevel::INHERIT) ? Logger::get_level() : level_;
    }

    void
    set_level(LogLevel level)
    {
        level_ = level;
    }

    bool
    should_log(LogLevel message_level) const
    {
        LogLevel effective_level = level();
        return effective_level != LogLevel::NONE &&
            message_level <= effective_level;
    }

    template <typename... Args>
    void
    log(LogLevel level, const Args&... args) const
    {
        if (!should_log(level))
            return;
        Logger::write(level, "[", name_, "] ", args...);
    }

private:
    std::string name_;
    LogLevel level_;
};

#define LOGE(...)              \
    Logger::log(               \
        LogLevel::ERROR,       \
        __VA_ARGS__,           \
        " (",                  \
        __RELATIVE_FILEPATH__, \
        ":",                   \
        __LINE__,              \
        ")")
#define LOGW(...)                                 \
    if (Logger::get_level() >= LogLevel::WARNING) \
    Logger::log(                                  \
        LogLevel::WARNING,                        \
        __VA_ARGS__,                              \
        " (",                                     \
        __RELATIVE_FILEPATH__,                    \
        ":",                                      \
        __LINE__,                                 \
        ")")
#define LOGI(...)                              \
    if (Logger::get_level() >= LogLevel::INFO) \
    Logger::log(                               \
        LogLevel::INFO,                        \
        __VA_ARGS__,                           \
        " (",                                  \
        __RELATIVE_FILEPATH__,                 \
        ":",                                   \
        __LINE__,                              \
        ")")
#define LOGD(...)                               \
    if (Logger::get_level() >= LogLevel::DEBUG) \
    Logger::log(                                \
        LogLevel::DEBUG,                        \
        __VA_ARGS__,                            \
        " (",                                   \
        __RELATIVE_FILEPATH__,                  \
        ":",                                    \
        __LINE__,                               \
        ")")
