#include "cycle.hpp"
#include "aggregator.hpp"
#include <spdlog/spdlog.h>
#include <future>

CycleOrchestrator::CycleOrchestrator(const ProtocolRegistry& registry,
                                     std::shared_ptr<ChainClient> chain,
                                     std::shared_ptr<Publisher> publisher,
                                     int breaker_max_failures,
                                     int64_t breaker_cooldown_ms,
                                     Clock clock)
    : registry_(registry)
    , chain_(std::move(chain))
    , publisher_(std::move(publisher))
    , clock_(std::move(clock))
    , breaker_(breaker_max_failures, breaker_cooldown_ms)
    , collector_(*chain_, breaker_, clock_)
{}

std::vector<YieldSample> CycleOrchestrator::collect_all() {
    std::vector<std::future<std::optional<YieldSample>>> pending;
    pending.reserve(registry_.size());

    for (const auto& source : registry_.all()) {
        pending.push_back(std::async(std::launch::async, [this, &source]() {
            return collector_.collect(source);
        }));
    }

    std::vector<YieldSample> samples;
    for (auto& f : pending) {
        auto result = f.get();
        if (result) {
            samples.push_back(std::move(*result));
        }
    }
    return samples;
}

AggregateMetrics CycleOrchestrator::run_cycle() {
    std::lock_guard<std::mutex> lock(cycle_mutex_);

    auto start_ms = clock_();
    spdlog::info("Starting yield data collection cycle ({} protocols)", registry_.size());

    auto samples = collect_all();
    auto metrics = Aggregator::aggregate(samples, start_ms);

    publisher_->publish(samples, metrics);

    spdlog::info("Cycle complete in {}ms: {}/{} protocols, APY {:.2f}%, volatility {:.2f}%, sharpe {:.2f}",
                 clock_() - start_ms, metrics.protocol_count, registry_.size(),
                 metrics.weighted_apy, metrics.volatility, metrics.sharpe_ratio);

    return metrics;
}
