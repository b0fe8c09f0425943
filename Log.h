#pragma once

#include <chrono>
#include <ctime>
#include <iostream>
#include <optional>
#include <string_view>

namespace wpa {

enum class LogLevel {
    Error,
    Warning,
    Info,
    Debug
};

static inline LogLevel s_current_log_level = LogLevel::Info;

inline void set_log_level(LogLevel level)
{
    s_current_log_level = level;
}

inline std::optional<LogLevel> parse_log_level(std::string_view name)
{
    if (name == "error") {
        return LogLevel::Error;
    } else if (name == "warning") {
        return LogLevel::Warning;
    } else if (name == "info") {
        return LogLevel::Info;
    } else if (name == "debug") {
        return LogLevel::Debug;
    }
    return std::nullopt;
}

template<typename ... Args>
void log(LogLevel level, Args && ... args)
{
    if (level > s_current_log_level) {
        return;
    }

    char time_buf[32];
    std::time_t now_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", std::localtime(&now_t));
    std::cerr << time_buf << ": ";
    ((std::cerr << args), ...);
    std::cerr << std::endl;
}

} // namespace wpa
