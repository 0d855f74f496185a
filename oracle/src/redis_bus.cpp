#include "redis_bus.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <unordered_map>

RedisBus::RedisBus(const std::string& redis_url) {
    try {
        redis_ = std::make_shared<sw::redis::Redis>(redis_url);
        spdlog::info("Connected to Redis: {}", redis_url);
    } catch (const std::exception& e) {
        spdlog::error("Failed to connect to Redis: {}", e.what());
        throw;
    }
}

void RedisBus::set(const std::string& key, const std::string& value, int ttl_seconds) {
    redis_->setex(key, std::chrono::seconds(ttl_seconds), value);
}

std::optional<std::string> RedisBus::get(const std::string& key) {
    auto val = redis_->get(key);
    if (!val) return std::nullopt;
    return *val;
}

void RedisBus::publish(const std::string& stream, const nlohmann::json& data) {
    std::unordered_map<std::string, std::string> fields;
    fields["data"] = data.dump();

    redis_->xadd(stream, "*", fields.begin(), fields.end());
    spdlog::debug("Published event to {}", stream);
}

bool RedisBus::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const std::exception& e) {
        return false;
    }
}
