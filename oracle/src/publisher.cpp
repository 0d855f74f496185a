#include "publisher.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

const char* const kLatestCacheKey = "yield_data:latest";

std::string protocol_cache_key(const std::string& protocol_id) {
    return "yield_data:" + protocol_id;
}

Publisher::Publisher(std::shared_ptr<DurableStore> store,
                     std::shared_ptr<CacheStore> cache,
                     std::shared_ptr<EventBus> events,
                     int cache_ttl_seconds,
                     std::string event_stream)
    : store_(std::move(store))
    , cache_(std::move(cache))
    , events_(std::move(events))
    , cache_ttl_seconds_(cache_ttl_seconds)
    , event_stream_(std::move(event_stream))
{}

nlohmann::json Publisher::snapshot_json(const std::vector<YieldSample>& samples,
                                        const AggregateMetrics& metrics,
                                        int ttl_seconds) {
    nlohmann::json samples_json = nlohmann::json::array();
    for (const auto& s : samples) {
        samples_json.push_back(s.to_json());
    }

    return {
        {"metrics", metrics.to_json()},
        {"samples", samples_json},
        {"ttl", ttl_seconds}
    };
}

void Publisher::publish(const std::vector<YieldSample>& samples,
                        const AggregateMetrics& metrics) {
    store_->insert_cycle(samples, metrics);
    spdlog::info("Stored {} yield samples and cycle metrics", samples.size());

    if (samples.empty()) {
        spdlog::warn("No samples this cycle, keeping previous cache snapshot");
        return;
    }

    write_cache(samples, metrics);
    emit_update(samples, metrics);
}

void Publisher::write_cache(const std::vector<YieldSample>& samples,
                            const AggregateMetrics& metrics) {
    if (!cache_) return;

    try {
        auto snapshot = snapshot_json(samples, metrics, cache_ttl_seconds_);
        cache_->set(kLatestCacheKey, snapshot.dump(), cache_ttl_seconds_);

        for (const auto& s : samples) {
            cache_->set(protocol_cache_key(s.protocol_id), s.to_json().dump(),
                        cache_ttl_seconds_);
        }

        spdlog::debug("Cached yield snapshot with {} samples", samples.size());

    } catch (const std::exception& e) {
        spdlog::error("Error caching yield data: {}", e.what());
    }
}

void Publisher::emit_update(const std::vector<YieldSample>& samples,
                            const AggregateMetrics& metrics) {
    if (!events_ || event_stream_.empty()) return;

    try {
        nlohmann::json apys = nlohmann::json::object();
        for (const auto& s : samples) {
            apys[s.protocol_id] = s.apy;
        }

        nlohmann::json event = {
            {"type", "yield_update"},
            {"apy", apys},
            {"weighted_apy", metrics.weighted_apy},
            {"protocol_count", metrics.protocol_count},
            {"ts", util::iso8601_from_ms(metrics.timestamp_ms)}
        };

        events_->publish(event_stream_, event);

    } catch (const std::exception& e) {
        spdlog::error("Failed to publish yield update: {}", e.what());
    }
}
