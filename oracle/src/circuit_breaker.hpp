#pragma once

#include "util.hpp"
#include <string>
#include <map>
#include <mutex>
#include <cstdint>

struct CircuitBreakerState {
    std::string protocol_id;
    int failures = 0;
    int64_t last_failure_ms = 0;
};

// Per-protocol consecutive-failure guard. Open while a protocol has
// failed max_failures times in a row and the last failure is younger
// than the cooldown.
class CircuitBreaker {
public:
    explicit CircuitBreaker(int max_failures = 5, int64_t cooldown_ms = 30 * 60 * 1000);

    void record_result(const std::string& protocol_id, bool success,
                       int64_t now_ms = util::current_timestamp_ms());
    bool is_open(const std::string& protocol_id,
                 int64_t now_ms = util::current_timestamp_ms()) const;

    CircuitBreakerState state(const std::string& protocol_id) const;

private:
    int max_failures_;
    int64_t cooldown_ms_;
    mutable std::mutex mutex_;
    std::map<std::string, CircuitBreakerState> states_;
};
