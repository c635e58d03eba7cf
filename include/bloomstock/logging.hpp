#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

namespace bloomstock {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

LogLevel parse_log_level(const std::string& value);
std::string to_string(LogLevel level);

/// Process-wide minimum level; messages below it are dropped.
void set_log_level(LogLevel level);
LogLevel log_level();

inline std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&time_t, &tm);
    std::stringstream ss;
    ss << std::put_time(&tm, "%FT%TZ");
    return ss.str();
}

/// Emit one JSON log line. Debug and info go to stdout, warn and error to stderr.
/// Invalid UTF-8 in any string is replaced, never thrown.
void log_event(LogLevel level, const std::string& domain, const std::string& message,
               const nlohmann::json& fields = {});

inline void log_debug(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log_event(LogLevel::Debug, domain, message, fields);
}

inline void log_info(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log_event(LogLevel::Info, domain, message, fields);
}

inline void log_warn(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log_event(LogLevel::Warn, domain, message, fields);
}

inline void log_error(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log_event(LogLevel::Error, domain, message, fields);
}

}  // namespace bloomstock
