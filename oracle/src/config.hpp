#pragma once

#include <string>
#include <vector>
#include <cstdlib>

struct Config {
    // Redis
    std::string redis_url;
    std::string stream_yield;

    // Postgres
    std::string pg_dsn;

    // Chain
    std::vector<std::string> rpc_urls;
    int request_timeout_ms;
    std::string asset_address;
    std::string protocols_file;

    // Cycle
    int cycle_interval_seconds;
    int breaker_max_failures;
    int breaker_cooldown_seconds;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
};
