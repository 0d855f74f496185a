#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/cycle.hpp"
#include "../src/read_api.hpp"
#include "fakes.hpp"

using Catch::Approx;

namespace {

struct CycleFixture {
    fakes::ManualClock clock;
    std::shared_ptr<fakes::FakeChainClient> chain = std::make_shared<fakes::FakeChainClient>();
    std::shared_ptr<fakes::InMemoryStore> store = std::make_shared<fakes::InMemoryStore>();
    std::shared_ptr<fakes::InMemoryCache> cache = std::make_shared<fakes::InMemoryCache>(clock.fn());
    std::shared_ptr<fakes::RecordingEventBus> events = std::make_shared<fakes::RecordingEventBus>();

    ProtocolSource a = fakes::make_source("a", 1);
    ProtocolSource b = fakes::make_source("b", 2);
    ProtocolSource c = fakes::make_source("c", 3);
    ProtocolSource d = fakes::make_source("d", 4);
    ProtocolRegistry registry{{a, b, c, d}};

    std::shared_ptr<Publisher> publisher =
        std::make_shared<Publisher>(store, cache, events, 600, "yield.updates");
    CycleOrchestrator orchestrator{registry, chain, publisher, 5, 30 * 60 * 1000, clock.fn()};
    ReadApi read_api{store, cache, clock.fn()};

    CycleFixture() {
        chain->set_reading(a, 800, 1000000, 1000000);
        chain->set_reading(b, 600, 500000, 1000000);
        chain->set_reading(c, 500, 250000, 1000000);
        chain->set_reading(d, 700, 100000, 1000000);
    }
};

} // namespace

TEST_CASE("Collection cycle", "[cycle]") {
    CycleFixture f;

    SECTION("All protocols succeed") {
        auto m = f.orchestrator.run_cycle();
        REQUIRE(m.protocol_count == 4);
        REQUIRE(m.timestamp_ms == f.clock.ms());
        REQUIRE(f.store->samples.size() == 4);
        REQUIRE(f.store->metrics.size() == 1);
    }

    SECTION("One failing protocol does not fail the cycle") {
        f.chain->set_failing(f.d.address, true);

        AggregateMetrics m;
        REQUIRE_NOTHROW(m = f.orchestrator.run_cycle());
        REQUIRE(m.protocol_count == 3);
        REQUIRE(m.weighted_apy == Approx(7.0));
        REQUIRE(m.volatility == Approx(1.2472).margin(1e-4));
        REQUIRE(f.orchestrator.breaker().state("d").failures == 1);
        REQUIRE(f.orchestrator.breaker().state("a").failures == 0);

        for (const auto& s : f.store->samples) {
            REQUIRE(s.sample.protocol_id != "d");
            REQUIRE(s.cycle_ts_ms == m.timestamp_ms);
        }
    }

    SECTION("All protocols failing still yields neutral metrics") {
        f.chain->set_all_failing(true);

        auto m = f.orchestrator.run_cycle();
        REQUIRE(m.protocol_count == 0);
        REQUIRE(m.weighted_apy == 0.0);
        REQUIRE(m.volatility == 0.0);
        REQUIRE(m.sharpe_ratio == 0.0);
        REQUIRE(f.store->metrics.size() == 1);
        for (const auto& id : {"a", "b", "c", "d"}) {
            REQUIRE(f.orchestrator.breaker().state(id).failures == 1);
        }
    }

    SECTION("Out of range APY never reaches the store or the read API") {
        f.chain->set_reading(f.d, 12000, 100000, 1000000); // 120%

        f.orchestrator.run_cycle();
        for (const auto& s : f.store->samples) {
            REQUIRE(s.sample.protocol_id != "d");
        }

        auto latest = f.read_api.get_latest();
        REQUIRE(latest.has_value());
        REQUIRE(latest->samples.size() == 3);
        for (const auto& s : latest->samples) {
            REQUIRE(s.protocol_id != "d");
        }
    }

    SECTION("Store outage propagates out of the cycle") {
        f.store->fail_writes = true;
        REQUIRE_THROWS(f.orchestrator.run_cycle());
        REQUIRE(f.cache->writes == 0);
    }

    SECTION("Breaker opens across cycles and stops calling the protocol") {
        f.chain->set_failing(f.d.address, true);
        for (int i = 0; i < 5; i++) {
            f.orchestrator.run_cycle();
            f.clock.advance_seconds(60);
        }
        REQUIRE(f.orchestrator.breaker().is_open("d", f.clock.ms()));

        int calls_before = f.chain->calls_to(f.d.address);
        auto m = f.orchestrator.run_cycle();
        REQUIRE(m.protocol_count == 3);
        REQUIRE(f.chain->calls_to(f.d.address) == calls_before);
        REQUIRE(f.orchestrator.breaker().state("d").failures == 5);
    }
}

TEST_CASE("Stale cache fallback", "[cycle][read_api]") {
    CycleFixture f;

    auto first = f.orchestrator.run_cycle();
    REQUIRE(first.protocol_count == 4);

    f.clock.advance_seconds(60);
    f.chain->set_all_failing(true);
    auto second = f.orchestrator.run_cycle();
    REQUIRE(second.protocol_count == 0);

    SECTION("Previous snapshot is served while the cache is fresh") {
        auto latest = f.read_api.get_latest();
        REQUIRE(latest.has_value());
        REQUIRE(latest->source == "cache");
        REQUIRE(latest->metrics.timestamp_ms == first.timestamp_ms);
        REQUIRE(latest->metrics.protocol_count == 4);
        REQUIRE(latest->metrics.weighted_apy == Approx(first.weighted_apy));
        REQUIRE(latest->samples.size() == 4);
    }

    SECTION("After the TTL the durable store's last row is served") {
        f.clock.advance_seconds(600);

        auto latest = f.read_api.get_latest();
        REQUIRE(latest.has_value());
        REQUIRE(latest->source == "store");
        REQUIRE(latest->metrics.timestamp_ms == second.timestamp_ms);
        REQUIRE(latest->metrics.protocol_count == 0);
        REQUIRE(latest->samples.empty());
    }
}
