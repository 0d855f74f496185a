#pragma once

#include "store.hpp"
#include "types.hpp"
#include "util.hpp"
#include <memory>
#include <optional>
#include <vector>

class ReadApi {
public:
    ReadApi(std::shared_ptr<DurableStore> store,
            std::shared_ptr<CacheStore> cache,
            Clock clock = util::current_timestamp_ms);

    // Cache snapshot when present, else the newest cycle in the durable store
    std::optional<LatestSnapshot> get_latest();

    // Durable store only, ascending by timestamp. Throws std::invalid_argument
    // for a non-positive window.
    std::vector<YieldSample> get_protocol_history(const std::string& protocol_id,
                                                  int window_hours = 24);

private:
    std::shared_ptr<DurableStore> store_;
    std::shared_ptr<CacheStore> cache_;
    Clock clock_;

    std::optional<LatestSnapshot> from_cache();
};
