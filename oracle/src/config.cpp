#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.stream_yield = get_env("STREAM_YIELD", "yield.updates");

    cfg.pg_dsn = get_env("PG_DSN");

    cfg.rpc_urls = util::split(get_env("RPC_URLS"), ',');
    cfg.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 5000);
    cfg.asset_address = get_env("ASSET_ADDRESS");
    cfg.protocols_file = get_env("PROTOCOLS_FILE", "config/protocols.json");

    cfg.cycle_interval_seconds = get_env_int("CYCLE_INTERVAL_SECONDS", 600);
    cfg.breaker_max_failures = get_env_int("BREAKER_MAX_FAILURES", 5);
    cfg.breaker_cooldown_seconds = get_env_int("BREAKER_COOLDOWN_SECONDS", 1800);

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);

    cfg.service_name = get_env("SERVICE_NAME", "yield_oracle");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (pg_dsn.empty()) {
        throw std::runtime_error("PG_DSN is required");
    }
    if (rpc_urls.empty()) {
        throw std::runtime_error("RPC_URLS is required");
    }
    if (cycle_interval_seconds <= 0) {
        throw std::runtime_error("CYCLE_INTERVAL_SECONDS must be positive");
    }
    if (breaker_max_failures <= 0) {
        throw std::runtime_error("BREAKER_MAX_FAILURES must be positive");
    }
    if (breaker_cooldown_seconds < 0) {
        throw std::runtime_error("BREAKER_COOLDOWN_SECONDS must not be negative");
    }
    if (request_timeout_ms <= 0) {
        throw std::runtime_error("REQUEST_TIMEOUT_MS must be positive");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Postgres: {}", util::redact_dsn(pg_dsn));
    spdlog::info("  RPC endpoints: {}", rpc_urls.size());
    spdlog::info("  Protocols file: {}", protocols_file);
    spdlog::info("  Cycle interval: {}s, request timeout: {}ms",
                 cycle_interval_seconds, request_timeout_ms);
    spdlog::info("  Breaker: {} failures, {}s cooldown",
                 breaker_max_failures, breaker_cooldown_seconds);
}
