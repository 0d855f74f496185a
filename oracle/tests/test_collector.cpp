#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/collector.hpp"
#include "fakes.hpp"

using Catch::Approx;

TEST_CASE("Collector", "[collector]") {
    fakes::ManualClock clock;
    fakes::FakeChainClient chain;
    CircuitBreaker breaker;
    Collector collector(chain, breaker, clock.fn());

    auto src = fakes::make_source("klayswap", 1, EncodingKind::BasisPoints, 100000);

    SECTION("Successful read yields a normalized sample") {
        chain.set_reading(src, 850, 2000000, 500000);

        auto sample = collector.collect(src);
        REQUIRE(sample.has_value());
        REQUIRE(sample->protocol_id == "klayswap");
        REQUIRE(sample->apy == Approx(8.5));
        REQUIRE(sample->tvl == 2000000);
        REQUIRE(sample->liquidity == 500000);
        REQUIRE(sample->risk_score == src.risk_score);
        REQUIRE(sample->timestamp_ms == clock.ms());
        REQUIRE(chain.calls_to(src.address) == 3);
    }

    SECTION("Ray encoded source") {
        auto aave = fakes::make_source("aave", 2, EncodingKind::Ray);
        chain.set_reading(aave, 3170979198376458650ULL, 1000000, 1000000);

        auto sample = collector.collect(aave);
        REQUIRE(sample.has_value());
        REQUIRE(sample->apy == Approx(10.0).epsilon(1e-9));
    }

    SECTION("RPC failure is swallowed and recorded") {
        chain.set_failing(src.address, true);

        REQUIRE_NOTHROW(collector.collect(src));
        REQUIRE_FALSE(collector.collect(src).has_value());
        REQUIRE(breaker.state("klayswap").failures == 2);
    }

    SECTION("Out of range APY is rejected and recorded") {
        chain.set_reading(src, 15000, 2000000, 500000); // 150%

        REQUIRE_FALSE(collector.collect(src).has_value());
        REQUIRE(breaker.state("klayswap").failures == 1);
    }

    SECTION("Liquidity below floor is rejected") {
        chain.set_reading(src, 850, 2000000, 99999);

        REQUIRE_FALSE(collector.collect(src).has_value());
        REQUIRE(breaker.state("klayswap").failures == 1);
    }

    SECTION("Success clears earlier failures") {
        chain.set_failing(src.address, true);
        collector.collect(src);
        collector.collect(src);
        REQUIRE(breaker.state("klayswap").failures == 2);

        chain.set_failing(src.address, false);
        chain.set_reading(src, 850, 2000000, 500000);
        REQUIRE(collector.collect(src).has_value());
        REQUIRE(breaker.state("klayswap").failures == 0);
    }

    SECTION("Open breaker skips chain calls until cooldown ends") {
        chain.set_failing(src.address, true);
        for (int i = 0; i < 5; i++) {
            REQUIRE_FALSE(collector.collect(src).has_value());
        }
        REQUIRE(breaker.is_open("klayswap", clock.ms()));

        int calls_before = chain.calls_to(src.address);
        REQUIRE_FALSE(collector.collect(src).has_value());
        REQUIRE(chain.calls_to(src.address) == calls_before);

        clock.advance_seconds(30 * 60);
        REQUIRE_FALSE(breaker.is_open("klayswap", clock.ms()));

        chain.set_failing(src.address, false);
        chain.set_reading(src, 850, 2000000, 500000);
        REQUIRE(collector.collect(src).has_value());
        REQUIRE(chain.calls_to(src.address) == calls_before + 3);
    }

    SECTION("Asset placeholder is substituted") {
        src.asset = fakes::address_for(99);
        src.liquidity_call.args = {kAssetPlaceholder};
        chain.set_reading(src, 850, 2000000, 500000);

        REQUIRE(collector.collect(src).has_value());
        auto args = chain.last_args();
        REQUIRE(args.size() == 1);
        REQUIRE(args[0] == src.asset);
    }

    SECTION("Raw values are decoded from the configured word") {
        chain.set_reading(src, 850, 2000000, 500000);
        auto raw = collector.read_raw(src);
        REQUIRE(raw.raw_apy == Approx(850.0));
        REQUIRE(raw.raw_tvl == 2000000);
        REQUIRE(raw.raw_liquidity == 500000);
    }
}
