#pragma once

#include "redis_bus.hpp"
#include "store_pg.hpp"
#include "cycle.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <string>

class HealthCheck {
public:
    HealthCheck(std::shared_ptr<RedisBus> redis,
                std::shared_ptr<PostgresStore> pg,
                std::shared_ptr<CycleOrchestrator> orchestrator);

    nlohmann::json get_status();

    // 200 when the status reports every backend reachable, 503 otherwise
    static int http_status(const nlohmann::json& status);

    void record_cycle(const AggregateMetrics& metrics);
    void record_cycle_error(const std::string& error);

private:
    std::shared_ptr<RedisBus> redis_;
    std::shared_ptr<PostgresStore> pg_;
    std::shared_ptr<CycleOrchestrator> orchestrator_;

    std::mutex mutex_;
    int64_t last_cycle_ms_ = 0;
    int last_protocol_count_ = 0;
    std::string last_error_;
};
