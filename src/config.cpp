#include "bloomstock/config.hpp"
#include "bloomstock/errors.hpp"
#include <cstdlib>

namespace bloomstock {

namespace {

int parse_non_negative(const char* name, const std::string& value) {
    size_t consumed = 0;
    long parsed = 0;
    try {
        parsed = std::stol(value, &consumed);
    } catch (const std::logic_error&) {
        throw InvalidArgumentError(std::string(name) + " must be an integer, got '" + value + "'");
    }
    if (consumed != value.size() || parsed < 0 || parsed > 1000000000L) {
        throw InvalidArgumentError(std::string(name) + " must be a non-negative integer, got '" + value + "'");
    }
    return static_cast<int>(parsed);
}

}  // anonymous namespace

Config Config::from_env() {
    return from_lookup([](const char* name) { return std::getenv(name); });
}

Config Config::from_lookup(const std::function<const char*(const char*)>& lookup) {
    Config config;

    if (const char* port = lookup("PORT")) config.port = port;
    if (const char* path = lookup("BLOOMSTOCK_DB_PATH")) config.db_path = path;
    if (const char* timeout = lookup("BLOOMSTOCK_BUSY_TIMEOUT_MS")) {
        config.busy_timeout_ms = parse_non_negative("BLOOMSTOCK_BUSY_TIMEOUT_MS", timeout);
    }
    if (const char* hours = lookup("BLOOMSTOCK_CLEANUP_MAX_AGE_HOURS")) {
        config.cleanup_max_age_hours = parse_non_negative("BLOOMSTOCK_CLEANUP_MAX_AGE_HOURS", hours);
    }
    if (const char* level = lookup("BLOOMSTOCK_LOG_LEVEL")) config.log_level = parse_log_level(level);

    if (config.port.empty()) throw InvalidArgumentError("PORT must not be empty");
    if (config.db_path.empty()) throw InvalidArgumentError("BLOOMSTOCK_DB_PATH must not be empty");
    return config;
}

}  // namespace bloomstock
