#pragma once

#include "types.hpp"
#include "chain_client.hpp"
#include "circuit_breaker.hpp"
#include <optional>

// Reads one protocol's APY, TVL and liquidity and turns them into a
// validated sample. Never throws: every failure is recorded on the
// protocol's breaker and reported as an empty result.
class Collector {
public:
    Collector(ChainClient& chain, CircuitBreaker& breaker,
              Clock clock = util::current_timestamp_ms);

    std::optional<YieldSample> collect(const ProtocolSource& source);

    RawReading read_raw(const ProtocolSource& source);

private:
    ChainClient& chain_;
    CircuitBreaker& breaker_;
    Clock clock_;

    std::string call_word(const ProtocolSource& source, const CallDescriptor& call);
};
