#pragma once

#include "store.hpp"
#include "types.hpp"
#include <memory>
#include <string>
#include <vector>

extern const char* const kLatestCacheKey;
std::string protocol_cache_key(const std::string& protocol_id);

// Persists one cycle's output. Durable writes are fatal for the cycle and
// propagate; cache and event writes are best effort.
class Publisher {
public:
    Publisher(std::shared_ptr<DurableStore> store,
              std::shared_ptr<CacheStore> cache,
              std::shared_ptr<EventBus> events,
              int cache_ttl_seconds,
              std::string event_stream);

    void publish(const std::vector<YieldSample>& samples, const AggregateMetrics& metrics);

    static nlohmann::json snapshot_json(const std::vector<YieldSample>& samples,
                                        const AggregateMetrics& metrics,
                                        int ttl_seconds);

private:
    std::shared_ptr<DurableStore> store_;
    std::shared_ptr<CacheStore> cache_;
    std::shared_ptr<EventBus> events_;
    int cache_ttl_seconds_;
    std::string event_stream_;

    void write_cache(const std::vector<YieldSample>& samples, const AggregateMetrics& metrics);
    void emit_update(const std::vector<YieldSample>& samples, const AggregateMetrics& metrics);
};
