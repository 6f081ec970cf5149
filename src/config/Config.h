#pragma once

#include <cstdint>
#include <string>

namespace config {

struct Config {
    enum class LogLevel { DEBUG, INFO, WARN, ERROR };
    uint16_t port = 8080;
    LogLevel log_level = LogLevel::INFO;
    bool metrics_enabled = true;
    bool access_log = true;
    std::string database_url;
    int db_workers = 16;
    int db_statement_timeout_ms = 5000;
    std::string jwt_secret;
    int registration_max_attempts = 5;
    int registration_backoff_ms = 5;
    int registration_max_backoff_ms = 200;
    // in-memory store only: "id:status:max[,...]"
    std::string seed_events;
    static Config from_env(int argc, char** argv);
    int log_level_number() const;
};

}
