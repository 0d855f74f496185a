#include "config.hpp"
#include "registry.hpp"
#include "evm_rpc_client.hpp"
#include "cycle.hpp"
#include "publisher.hpp"
#include "read_api.hpp"
#include "store_pg.hpp"
#include "redis_bus.hpp"
#include "health.hpp"
#include "util.hpp"
#include <curl/curl.h>
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("yieldoracle", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void cycle_loop(std::shared_ptr<Config> config,
                std::shared_ptr<CycleOrchestrator> orchestrator,
                std::shared_ptr<HealthCheck> health,
                std::atomic<bool>& running) {

    spdlog::info("Starting cycle loop, interval {}s", config->cycle_interval_seconds);

    while (running) {
        auto tick_start = util::current_timestamp_ms();

        try {
            auto metrics = orchestrator->run_cycle();
            health->record_cycle(metrics);
        } catch (const std::exception& e) {
            spdlog::error("Yield cycle failed: {}", e.what());
            health->record_cycle_error(e.what());
        }

        // Sleep until next tick, waking up for shutdown
        auto deadline = tick_start + static_cast<int64_t>(config->cycle_interval_seconds) * 1000;
        while (running && util::current_timestamp_ms() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(250));
        }
    }

    spdlog::info("Cycle loop stopped");
}

void register_routes(httplib::Server& server,
                     std::shared_ptr<ReadApi> read_api,
                     std::shared_ptr<HealthCheck> health,
                     const ProtocolRegistry& registry) {

    server.Get("/health", [health](const httplib::Request&, httplib::Response& res) {
        auto status = health->get_status();
        res.set_content(status.dump(), "application/json");
        res.status = HealthCheck::http_status(status);
    });

    server.Get("/yield/latest", [read_api](const httplib::Request&, httplib::Response& res) {
        try {
            auto latest = read_api->get_latest();
            if (!latest) {
                res.status = 404;
                res.set_content(R"({"error":"no yield data yet"})", "application/json");
                return;
            }
            res.set_content(latest->to_json().dump(), "application/json");
        } catch (const std::exception& e) {
            spdlog::error("Failed to serve latest yield: {}", e.what());
            res.status = 500;
            res.set_content(R"({"error":"internal error"})", "application/json");
        }
    });

    server.Get(R"(/yield/history/([A-Za-z0-9_\-]+))",
               [read_api, &registry](const httplib::Request& req, httplib::Response& res) {
        std::string protocol_id = req.matches[1];
        if (!registry.find(protocol_id)) {
            res.status = 404;
            res.set_content(R"({"error":"unknown protocol"})", "application/json");
            return;
        }

        int hours = 24;
        if (req.has_param("hours")) {
            try {
                hours = std::stoi(req.get_param_value("hours"));
            } catch (const std::exception&) {
                hours = 0;
            }
            if (hours <= 0) {
                res.status = 400;
                res.set_content(R"({"error":"hours must be a positive integer"})",
                                "application/json");
                return;
            }
        }

        try {
            auto samples = read_api->get_protocol_history(protocol_id, hours);
            nlohmann::json out = nlohmann::json::array();
            for (const auto& s : samples) {
                out.push_back(s.to_json());
            }
            res.set_content(nlohmann::json{{"protocol", protocol_id},
                                           {"hours", hours},
                                           {"samples", out}}.dump(),
                            "application/json");
        } catch (const std::exception& e) {
            spdlog::error("Failed to serve history for {}: {}", protocol_id, e.what());
            res.status = 500;
            res.set_content(R"({"error":"internal error"})", "application/json");
        }
    });
}

int main(int argc, char* argv[]) {
    try {
        auto config = std::make_shared<Config>(Config::from_env());
        setup_logging(config->log_level);

        spdlog::info("==============================================");
        spdlog::info("Yield Oracle v1.0");
        spdlog::info("==============================================");

        config->validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        curl_global_init(CURL_GLOBAL_DEFAULT);

        auto registry = ProtocolRegistry::from_file(config->protocols_file,
                                                    config->asset_address);
        if (registry.size() == 0) {
            throw std::runtime_error("No protocols configured");
        }

        // Initialize components
        auto redis = std::make_shared<RedisBus>(config->redis_url);
        auto pg = std::make_shared<PostgresStore>(config->pg_dsn);
        auto rpc = std::make_shared<EvmRpcClient>(config->rpc_urls, config->request_timeout_ms);

        auto publisher = std::make_shared<Publisher>(pg, redis, redis,
                                                     config->cycle_interval_seconds,
                                                     config->stream_yield);
        auto orchestrator = std::make_shared<CycleOrchestrator>(
            registry, rpc, publisher,
            config->breaker_max_failures,
            static_cast<int64_t>(config->breaker_cooldown_seconds) * 1000);
        auto read_api = std::make_shared<ReadApi>(pg, redis);
        auto health = std::make_shared<HealthCheck>(redis, pg, orchestrator);

        if (!rpc->is_healthy()) {
            spdlog::warn("RPC endpoint not responding at startup, continuing");
        }

        // Initialize database
        pg->init_schema();

        // Start cycle loop
        std::atomic<bool> loop_running{true};
        std::thread cycle_thread(cycle_loop, config, orchestrator, health,
                                 std::ref(loop_running));

        // Start HTTP server
        httplib::Server server;
        register_routes(server, read_api, health, registry);

        std::thread http_thread([&server, config]() {
            spdlog::info("Starting HTTP server on {}:{}", config->listen_addr, config->listen_port);
            server.listen(config->listen_addr.c_str(), config->listen_port);
        });

        spdlog::info("Yield oracle started");

        // Main loop
        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        // Shutdown
        spdlog::info("Stopping services...");
        loop_running = false;
        server.stop();

        if (cycle_thread.joinable()) cycle_thread.join();
        if (http_thread.joinable()) http_thread.join();

        curl_global_cleanup();
        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
