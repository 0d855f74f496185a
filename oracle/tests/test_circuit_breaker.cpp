#include <catch2/catch_test_macros.hpp>
#include "../src/circuit_breaker.hpp"

TEST_CASE("Circuit breaker", "[circuit_breaker]") {
    CircuitBreaker breaker;
    const int64_t t0 = 1700000000000;
    const int64_t minute = 60 * 1000;

    SECTION("Unknown protocol is closed") {
        REQUIRE_FALSE(breaker.is_open("aave", t0));
        REQUIRE(breaker.state("aave").failures == 0);
    }

    SECTION("Opens after five consecutive failures") {
        for (int i = 0; i < 4; i++) {
            breaker.record_result("aave", false, t0);
            REQUIRE_FALSE(breaker.is_open("aave", t0));
        }
        breaker.record_result("aave", false, t0);
        REQUIRE(breaker.is_open("aave", t0));
        REQUIRE(breaker.state("aave").failures == 5);
    }

    SECTION("Closes once the cooldown has elapsed") {
        for (int i = 0; i < 5; i++) breaker.record_result("aave", false, t0);

        REQUIRE(breaker.is_open("aave", t0 + 29 * minute));
        REQUIRE_FALSE(breaker.is_open("aave", t0 + 30 * minute));
    }

    SECTION("Success resets the failure count") {
        for (int i = 0; i < 4; i++) breaker.record_result("aave", false, t0);
        breaker.record_result("aave", true, t0);
        REQUIRE(breaker.state("aave").failures == 0);

        breaker.record_result("aave", false, t0);
        REQUIRE_FALSE(breaker.is_open("aave", t0));
    }

    SECTION("Failure after cooldown reopens immediately") {
        for (int i = 0; i < 5; i++) breaker.record_result("aave", false, t0);
        REQUIRE_FALSE(breaker.is_open("aave", t0 + 31 * minute));

        breaker.record_result("aave", false, t0 + 31 * minute);
        REQUIRE(breaker.is_open("aave", t0 + 32 * minute));
    }

    SECTION("Protocols are tracked independently") {
        for (int i = 0; i < 5; i++) breaker.record_result("aave", false, t0);
        REQUIRE(breaker.is_open("aave", t0));
        REQUIRE_FALSE(breaker.is_open("compound", t0));
    }

    SECTION("Custom threshold and cooldown") {
        CircuitBreaker strict(2, 10 * 1000);
        strict.record_result("aave", false, t0);
        strict.record_result("aave", false, t0);
        REQUIRE(strict.is_open("aave", t0 + 9999));
        REQUIRE_FALSE(strict.is_open("aave", t0 + 10000));
    }
}
