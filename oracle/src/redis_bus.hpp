#pragma once

#include "store.hpp"
#include <string>
#include <memory>
#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

class RedisBus : public CacheStore, public EventBus {
public:
    explicit RedisBus(const std::string& redis_url);

    void set(const std::string& key, const std::string& value, int ttl_seconds) override;
    std::optional<std::string> get(const std::string& key) override;

    void publish(const std::string& stream, const nlohmann::json& data) override;
    bool ping();

private:
    std::shared_ptr<sw::redis::Redis> redis_;
};
