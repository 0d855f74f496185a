#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Append-only time series of samples and cycle metrics. Implementations
// throw on connectivity or query errors.
class DurableStore {
public:
    virtual ~DurableStore() = default;

    // One cycle's samples (tagged with metrics.timestamp_ms) and its metrics row,
    // written all-or-nothing
    virtual void insert_cycle(const std::vector<YieldSample>& samples,
                              const AggregateMetrics& metrics) = 0;

    virtual std::optional<AggregateMetrics> query_latest_metrics() = 0;
    virtual std::vector<YieldSample> query_samples_for_cycle(int64_t cycle_ts_ms) = 0;
    // Ascending by timestamp
    virtual std::vector<YieldSample> query_samples_since(const std::string& protocol_id,
                                                         int64_t since_ms) = 0;
};

class CacheStore {
public:
    virtual ~CacheStore() = default;

    virtual void set(const std::string& key, const std::string& value, int ttl_seconds) = 0;
    virtual std::optional<std::string> get(const std::string& key) = 0;
};

class EventBus {
public:
    virtual ~EventBus() = default;

    virtual void publish(const std::string& stream, const nlohmann::json& data) = 0;
};
