#include "health.hpp"
#include "util.hpp"

HealthCheck::HealthCheck(std::shared_ptr<RedisBus> redis,
                         std::shared_ptr<PostgresStore> pg,
                         std::shared_ptr<CycleOrchestrator> orchestrator)
    : redis_(redis), pg_(pg), orchestrator_(orchestrator) {}

void HealthCheck::record_cycle(const AggregateMetrics& metrics) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_cycle_ms_ = metrics.timestamp_ms;
    last_protocol_count_ = metrics.protocol_count;
    last_error_.clear();
}

void HealthCheck::record_cycle_error(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_error_ = error;
}

nlohmann::json HealthCheck::get_status() {
    bool redis_ok = redis_->ping();
    bool pg_ok = pg_->ping();

    nlohmann::json protocols_json = nlohmann::json::object();
    const auto& breaker = orchestrator_->breaker();
    for (const auto& src : orchestrator_->registry().all()) {
        auto st = breaker.state(src.id);
        std::string status = "up";
        if (breaker.is_open(src.id)) {
            status = "open";
        } else if (st.failures > 0) {
            status = "degraded";
        }
        protocols_json[src.id] = {
            {"status", status},
            {"failures", st.failures}
        };
    }

    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json status = {
        {"ok", redis_ok && pg_ok},
        {"redis", redis_ok},
        {"postgres", pg_ok},
        {"protocols", protocols_json},
        {"last_cycle", last_cycle_ms_ > 0 ? util::iso8601_from_ms(last_cycle_ms_) : ""},
        {"last_protocol_count", last_protocol_count_},
        {"last_error", last_error_}
    };

    return status;
}

int HealthCheck::http_status(const nlohmann::json& status) {
    return status.value("ok", false) ? 200 : 503;
}
