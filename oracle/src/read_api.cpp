#include "read_api.hpp"
#include "publisher.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

ReadApi::ReadApi(std::shared_ptr<DurableStore> store,
                 std::shared_ptr<CacheStore> cache,
                 Clock clock)
    : store_(std::move(store)), cache_(std::move(cache)), clock_(std::move(clock)) {}

std::optional<LatestSnapshot> ReadApi::from_cache() {
    if (!cache_) return std::nullopt;

    std::optional<std::string> cached;
    try {
        cached = cache_->get(kLatestCacheKey);
    } catch (const std::exception& e) {
        spdlog::warn("Cache read failed, falling back to store: {}", e.what());
        return std::nullopt;
    }
    if (!cached) return std::nullopt;

    try {
        auto doc = nlohmann::json::parse(*cached);
        auto metrics = AggregateMetrics::from_json(doc.at("metrics"));
        if (!metrics) return std::nullopt;

        LatestSnapshot snap;
        snap.metrics = *metrics;
        snap.source = "cache";
        for (const auto& item : doc.at("samples")) {
            auto sample = YieldSample::from_json(item);
            if (!sample) return std::nullopt;
            snap.samples.push_back(*sample);
        }
        return snap;

    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Corrupt cache snapshot, falling back to store: {}", e.what());
        return std::nullopt;
    }
}

std::optional<LatestSnapshot> ReadApi::get_latest() {
    auto cached = from_cache();
    if (cached) return cached;

    auto metrics = store_->query_latest_metrics();
    if (!metrics) return std::nullopt;

    LatestSnapshot snap;
    snap.metrics = *metrics;
    snap.samples = store_->query_samples_for_cycle(metrics->timestamp_ms);
    snap.source = "store";
    return snap;
}

std::vector<YieldSample> ReadApi::get_protocol_history(const std::string& protocol_id,
                                                       int window_hours) {
    if (window_hours <= 0) {
        throw std::invalid_argument("window_hours must be positive");
    }

    int64_t since_ms = clock_() - static_cast<int64_t>(window_hours) * 3600 * 1000;
    return store_->query_samples_since(protocol_id, since_ms);
}
