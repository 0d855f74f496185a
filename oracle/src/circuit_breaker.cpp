#include "circuit_breaker.hpp"
#include <spdlog/spdlog.h>

CircuitBreaker::CircuitBreaker(int max_failures, int64_t cooldown_ms)
    : max_failures_(max_failures), cooldown_ms_(cooldown_ms) {}

void CircuitBreaker::record_result(const std::string& protocol_id, bool success,
                                   int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& st = states_[protocol_id];
    st.protocol_id = protocol_id;

    if (success) {
        if (st.failures >= max_failures_) {
            spdlog::info("Circuit breaker closed for {}", protocol_id);
        }
        st.failures = 0;
        return;
    }

    st.failures++;
    st.last_failure_ms = now_ms;

    if (st.failures == max_failures_) {
        spdlog::warn("Circuit breaker opened for {} after {} consecutive failures",
                     protocol_id, st.failures);
    }
}

bool CircuitBreaker::is_open(const std::string& protocol_id, int64_t now_ms) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = states_.find(protocol_id);
    if (it == states_.end()) return false;

    const auto& st = it->second;
    return st.failures >= max_failures_ && (now_ms - st.last_failure_ms) < cooldown_ms_;
}

CircuitBreakerState CircuitBreaker::state(const std::string& protocol_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = states_.find(protocol_id);
    if (it == states_.end()) {
        CircuitBreakerState empty;
        empty.protocol_id = protocol_id;
        return empty;
    }
    return it->second;
}
