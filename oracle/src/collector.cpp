#include "collector.hpp"
#include "abi.hpp"
#include "normalize.hpp"
#include "validator.hpp"
#include <spdlog/spdlog.h>

Collector::Collector(ChainClient& chain, CircuitBreaker& breaker, Clock clock)
    : chain_(chain), breaker_(breaker), clock_(std::move(clock)) {}

std::string Collector::call_word(const ProtocolSource& source, const CallDescriptor& call) {
    std::vector<std::string> args;
    args.reserve(call.args.size());
    for (const auto& arg : call.args) {
        args.push_back(arg == kAssetPlaceholder ? source.asset : arg);
    }

    std::string target = call.target;
    if (target.empty()) {
        target = source.address;
    } else if (target == kAssetPlaceholder) {
        target = source.asset;
    }
    return chain_.call(target, call.selector, args);
}

RawReading Collector::read_raw(const ProtocolSource& source) {
    RawReading raw;
    raw.protocol_id = source.id;
    raw.timestamp_ms = clock_();

    auto apy_data = call_word(source, source.apy_call);
    auto tvl_data = call_word(source, source.tvl_call);
    auto liq_data = call_word(source, source.liquidity_call);

    raw.raw_apy = abi::decode_word_double(apy_data, source.apy_call.result_word);
    raw.raw_tvl = abi::decode_word_u64(tvl_data, source.tvl_call.result_word);
    raw.raw_liquidity = abi::decode_word_u64(liq_data, source.liquidity_call.result_word);

    return raw;
}

std::optional<YieldSample> Collector::collect(const ProtocolSource& source) {
    if (breaker_.is_open(source.id, clock_())) {
        spdlog::warn("Circuit breaker open for {}, skipping collection", source.id);
        return std::nullopt;
    }

    try {
        auto raw = read_raw(source);

        double apy = Normalizer::annualize_apy(raw.raw_apy, source.encoding,
                                               source.block_time_seconds);

        auto rejection = Validator::check(apy, raw.raw_tvl, raw.raw_liquidity, source);
        if (rejection) {
            spdlog::warn("Rejected sample for {}: {}", source.id, *rejection);
            breaker_.record_result(source.id, false, clock_());
            return std::nullopt;
        }

        breaker_.record_result(source.id, true, clock_());

        YieldSample sample;
        sample.protocol_id = source.id;
        sample.apy = apy;
        sample.liquidity = raw.raw_liquidity;
        sample.tvl = raw.raw_tvl;
        sample.risk_score = source.risk_score;
        sample.timestamp_ms = raw.timestamp_ms;

        spdlog::debug("Collected {}: apy={:.4f}% tvl={} liq={}",
                      source.id, sample.apy, sample.tvl, sample.liquidity);
        return sample;

    } catch (const std::exception& e) {
        spdlog::error("Error collecting data from {}: {}", source.id, e.what());
        breaker_.record_result(source.id, false, clock_());
        return std::nullopt;
    }
}
