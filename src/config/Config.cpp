#include "Config.h"
#include "../net/MiniJson.h"
#include <cstdlib>
#include <string>
#include <algorithm>

namespace config {

static std::string getenv_or(const char* name, const char* def) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string(def);
}

static int getenv_int_or(const char* name, int def) {
    const char* v = std::getenv(name);
    if (!v) return def;
    return parse_int_strict_sv(v).value_or(def);
}

static bool valid_port(std::optional<int> p) { return p && *p > 0 && *p <= 65535; }

static Config::LogLevel parse_level(const std::string& s) {
    std::string u = s;
    std::transform(u.begin(), u.end(), u.begin(), ::toupper);
    if (u == "DEBUG") return Config::LogLevel::DEBUG;
    if (u == "WARN") return Config::LogLevel::WARN;
    if (u == "ERROR") return Config::LogLevel::ERROR;
    return Config::LogLevel::INFO;
}

Config Config::from_env(int argc, char** argv) {
    Config c;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--port" && i+1 < argc) {
            auto p = parse_int_strict_sv(argv[i+1]);
            if (valid_port(p)) c.port = static_cast<uint16_t>(*p);
        }
    }
    const char* env_port = std::getenv("PORT");
    if (env_port) {
        auto p = parse_int_strict_sv(env_port);
        if (valid_port(p)) c.port = static_cast<uint16_t>(*p);
    }
    c.log_level = parse_level(getenv_or("LOG_LEVEL", "INFO"));
    c.metrics_enabled = getenv_or("METRICS_ENABLED", "1") != "0";
    c.access_log = getenv_or("ACCESS_LOG", "1") != "0";
    c.database_url = getenv_or("DATABASE_URL", "");

    c.db_workers = std::getenv("DB_WORKERS") ? getenv_int_or("DB_WORKERS", 16) : getenv_int_or("DB_POOL_SIZE", 16);
    c.db_workers = std::clamp(c.db_workers, 1, 256);
    c.db_statement_timeout_ms = std::max(0, getenv_int_or("DB_STATEMENT_TIMEOUT_MS", 5000));

    c.jwt_secret = getenv_or("JWT_SECRET", "");

    c.registration_max_attempts = std::clamp(getenv_int_or("REGISTRATION_MAX_ATTEMPTS", 5), 1, 50);
    c.registration_backoff_ms = std::clamp(getenv_int_or("REGISTRATION_BACKOFF_MS", 5), 0, 1000);
    c.registration_max_backoff_ms = std::max(c.registration_backoff_ms, getenv_int_or("REGISTRATION_MAX_BACKOFF_MS", 200));
    c.seed_events = getenv_or("SEED_EVENTS", "");
    return c;
}

int Config::log_level_number() const {
    switch (log_level) {
        case LogLevel::DEBUG: return 1;
        case LogLevel::INFO: return 2;
        case LogLevel::WARN: return 3;
        case LogLevel::ERROR: return 4;
    }
    return 2;
}

}
