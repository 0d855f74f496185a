#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/aggregator.hpp"
#include <algorithm>
#include <cstring>

using Catch::Approx;

namespace {

YieldSample sample(const std::string& id, double apy, uint64_t tvl) {
    YieldSample s;
    s.protocol_id = id;
    s.apy = apy;
    s.liquidity = tvl;
    s.tvl = tvl;
    s.risk_score = 200;
    s.timestamp_ms = 1700000000000;
    return s;
}

bool bit_identical(double a, double b) {
    return std::memcmp(&a, &b, sizeof(double)) == 0;
}

} // namespace

TEST_CASE("Aggregation", "[aggregator]") {
    std::vector<YieldSample> abc = {
        sample("a", 8.0, 1000000),
        sample("b", 6.0, 500000),
        sample("c", 5.0, 250000)
    };

    SECTION("TVL-weighted APY") {
        auto m = Aggregator::aggregate(abc, 42);
        REQUIRE(m.total_tvl == 1750000);
        REQUIRE(m.weighted_apy == Approx(7.0));
        REQUIRE(m.protocol_count == 3);
        REQUIRE(m.timestamp_ms == 42);
    }

    SECTION("Volatility and sharpe") {
        auto m = Aggregator::aggregate(abc, 42);
        REQUIRE(m.volatility == Approx(1.2472).margin(1e-4));
        REQUIRE(m.sharpe_ratio == Approx(4.01).margin(1e-2));
        REQUIRE(m.sharpe_ratio == Approx((7.0 - 2.0) / m.volatility));
    }

    SECTION("Repeated calls are bit-identical") {
        auto m1 = Aggregator::aggregate(abc, 42);
        auto m2 = Aggregator::aggregate(abc, 42);
        REQUIRE(bit_identical(m1.weighted_apy, m2.weighted_apy));
        REQUIRE(bit_identical(m1.volatility, m2.volatility));
        REQUIRE(bit_identical(m1.sharpe_ratio, m2.sharpe_ratio));
        REQUIRE(m1.total_tvl == m2.total_tvl);
    }

    SECTION("Input order does not change the result") {
        auto shuffled = abc;
        std::reverse(shuffled.begin(), shuffled.end());
        auto m1 = Aggregator::aggregate(abc, 42);
        auto m2 = Aggregator::aggregate(shuffled, 42);
        REQUIRE(bit_identical(m1.weighted_apy, m2.weighted_apy));
        REQUIRE(bit_identical(m1.volatility, m2.volatility));
    }

    SECTION("Empty sample set gives neutral metrics") {
        auto m = Aggregator::aggregate({}, 42);
        REQUIRE(m.protocol_count == 0);
        REQUIRE(m.total_tvl == 0);
        REQUIRE(m.weighted_apy == 0.0);
        REQUIRE(m.volatility == 0.0);
        REQUIRE(m.sharpe_ratio == 0.0);
    }

    SECTION("Single sample has no volatility") {
        auto m = Aggregator::aggregate({sample("a", 8.0, 1000)}, 42);
        REQUIRE(m.weighted_apy == Approx(8.0));
        REQUIRE(m.volatility == 0.0);
        REQUIRE(m.sharpe_ratio == 0.0);
    }

    SECTION("Zero total TVL gives zero weighted APY") {
        auto m = Aggregator::aggregate({sample("a", 8.0, 0), sample("b", 4.0, 0)}, 42);
        REQUIRE(m.weighted_apy == 0.0);
        REQUIRE(m.volatility == Approx(2.0));
        REQUIRE(m.sharpe_ratio == Approx(-1.0));
    }

    SECTION("TVL near the 64-bit limit sums exactly") {
        auto m = Aggregator::aggregate({sample("a", 5.0, 9000000000000000000ULL),
                                        sample("b", 7.0, 9000000000000000000ULL)}, 42);
        REQUIRE(m.total_tvl == 18000000000000000000ULL);
        REQUIRE(m.weighted_apy == Approx(6.0));
    }

    SECTION("Total TVL overflow is an error, not a wrapped sum") {
        std::vector<YieldSample> huge = {sample("a", 5.0, 10000000000000000000ULL),
                                         sample("b", 7.0, 10000000000000000000ULL)};
        REQUIRE_THROWS_AS(Aggregator::aggregate(huge, 42), std::overflow_error);
    }
}
