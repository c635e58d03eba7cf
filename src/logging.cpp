#include "bloomstock/logging.hpp"
#include "bloomstock/errors.hpp"
#include <atomic>
#include <mutex>

namespace bloomstock {

namespace {
std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_output_mutex;
}  // anonymous namespace

LogLevel parse_log_level(const std::string& value) {
    if (value == "debug") return LogLevel::Debug;
    if (value == "info") return LogLevel::Info;
    if (value == "warn" || value == "warning") return LogLevel::Warn;
    if (value == "error") return LogLevel::Error;
    throw InvalidArgumentError("Unknown log level: " + value);
}

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

void set_log_level(LogLevel level) { g_level.store(level); }

LogLevel log_level() { return g_level.load(); }

void log_event(LogLevel level, const std::string& domain, const std::string& message,
               const nlohmann::json& fields) {
    if (level < g_level.load()) return;

    nlohmann::json log_entry = {
        {"level", to_string(level)},
        {"message", message},
        {"domain", domain},
        {"timestamp", now_iso8601()}
    };
    for (auto& [key, value] : fields.items()) {
        log_entry[key] = value;
    }

    // Catalog and order strings are not guaranteed UTF-8; invalid bytes become U+FFFD.
    std::string line = log_entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(g_output_mutex);
    auto& out = level >= LogLevel::Warn ? std::cerr : std::cout;
    out << line << std::endl;
}

}  // namespace bloomstock
