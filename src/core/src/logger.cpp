#include "runmap/core/logger.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <iostream>
#include <utility>

LogLevel Logger::current_level_ = LogLevel::ERROR;
std::mutex Logger::log_mutex_;
std::ostream* Logger::output_stream_ = nullptr;  // nullptr = use std::cout
std::ostream* Logger::error_stream_ = nullptr;   // nullptr = use std::cerr

namespace {

constexpr std::array<std::pair<std::string_view, LogLevel>, 6> LEVEL_NAMES = {{
    {"none", LogLevel::NONE},
    {"error", LogLevel::ERROR},
    {"warn", LogLevel::WARNING},
    {"warning", LogLevel::WARNING},
    {"info", LogLevel::INFO},
    {"debug", LogLevel::DEBUG},
}};

bool
iequals(std::string_view a, std::string_view b)
{
    return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

}  // namespace

bool
Logger::should_log(LogLevel level)
{
    return current_level_ != LogLevel::NONE && level <= current_level_;
}

const char*
Logger::level_name(LogLevel level)
{
    switch (level)
    {
        case LogLevel::NONE:
            return "NONE";
        case LogLevel::INHERIT:
            return "INHERIT";
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::WARNING:
            return "WARNING";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::DEBUG:
            return "DEBUG";
    }
    return "UNKNOWN";
}

std::optional<LogLevel>
Logger::parse_level(std::string_view name)
{
    auto it = std::ranges::find_if(LEVEL_NAMES, [name](const auto& entry) {
        return iequals(entry.first, name);
    });
    if (it == LEVEL_NAMES.end())
        return std::nullopt;
    return it->second;
}

void
Logger::set_level(LogLevel level)
{
    LogLevel old_level = current_level_;
    current_level_ = level;

    // Announce when the new level shows INFO, or when it got more verbose
    if (should_log(LogLevel::INFO) ||
        (old_level != LogLevel::NONE && level > old_level))
    {
        std::lock_guard<std::mutex> lock(log_mutex_);
        std::ostream& out = output_stream_ ? *output_stream_ : std::cout;
        out << "[INFO] Log level set to " << level_name(level) << std::endl;
    }
}

bool
Logger::set_level(const std::string& level)
{
    auto parsed = parse_level(level);
    if (!parsed)
        return false;
    set_level(*parsed);
    return true;
}

LogLevel
Logger::get_level()
{
    return current_level_;
}

void
Logger::set_output_stream(std::ostream* output_stream)
{
    std::lock_guard<std::mutex> lock(log_mutex_);
    output_stream_ = output_stream;
}

void
Logger::set_error_stream(std::ostream* error_stream)
{
    std::lock_guard<std::mutex> lock(log_mutex_);
    error_stream_ = error_stream;
}

void
Logger::reset_streams()
{
    std::lock_guard<std::mutex> lock(log_mutex_);
    output_stream_ = nullptr;
    error_stream_ = nullptr;
}
