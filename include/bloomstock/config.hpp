#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include "bloomstock/logging.hpp"

namespace bloomstock {

/**
 * Runtime settings, read from the environment.
 */
struct Config {
    std::string port = "51010";
    std::string db_path = "bloomstock.db";
    int busy_timeout_ms = 5000;
    int cleanup_max_age_hours = 72;
    LogLevel log_level = LogLevel::Info;

    std::string listen_address() const { return "0.0.0.0:" + port; }

    /**
     * Build a Config from PORT, BLOOMSTOCK_DB_PATH, BLOOMSTOCK_BUSY_TIMEOUT_MS,
     * BLOOMSTOCK_CLEANUP_MAX_AGE_HOURS and BLOOMSTOCK_LOG_LEVEL.
     * Unset variables keep their defaults; malformed numbers throw InvalidArgumentError.
     */
    static Config from_env();

    /// Same as from_env() with an injectable lookup, used by tests.
    static Config from_lookup(const std::function<const char*(const char*)>& lookup);
};

}  // namespace bloomstock
