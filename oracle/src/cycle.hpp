#pragma once

#include "chain_client.hpp"
#include "circuit_breaker.hpp"
#include "collector.hpp"
#include "publisher.hpp"
#include "registry.hpp"
#include "types.hpp"
#include <memory>
#include <mutex>

// One collection cycle: parallel per-protocol collection, aggregation,
// publication. Overlapping calls to run_cycle are serialized.
class CycleOrchestrator {
public:
    CycleOrchestrator(const ProtocolRegistry& registry,
                      std::shared_ptr<ChainClient> chain,
                      std::shared_ptr<Publisher> publisher,
                      int breaker_max_failures = 5,
                      int64_t breaker_cooldown_ms = 30 * 60 * 1000,
                      Clock clock = util::current_timestamp_ms);

    // Throws only when the publisher fails to persist the cycle
    AggregateMetrics run_cycle();

    std::vector<YieldSample> collect_all();

    const CircuitBreaker& breaker() const { return breaker_; }
    const ProtocolRegistry& registry() const { return registry_; }

private:
    const ProtocolRegistry& registry_;
    std::shared_ptr<ChainClient> chain_;
    std::shared_ptr<Publisher> publisher_;
    Clock clock_;
    CircuitBreaker breaker_;
    Collector collector_;
    std::mutex cycle_mutex_;
};
