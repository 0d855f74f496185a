#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

// How a protocol encodes its supply rate on-chain
enum class EncodingKind {
    Ray,          // per-second rate scaled by 1e27
    BasisPoints,  // annualized, scaled by 100
    PerBlock,     // per-block rate scaled by 1e18
    Default       // treated as basis points
};

EncodingKind encoding_from_string(const std::string& name);
std::string encoding_to_string(EncodingKind kind);

// Call target or argument placeholder replaced by the source's asset address
inline constexpr const char* kAssetPlaceholder = "$asset";

struct CallDescriptor {
    std::string target;             // contract to call, empty means the source address
    std::string selector;           // 4-byte function selector, 0x-prefixed hex
    std::vector<std::string> args;  // address arguments, may hold kAssetPlaceholder
    int result_word = 0;            // 32-byte word of the return data holding the value
};

struct ProtocolSource {
    std::string id;
    std::string name;
    std::string address;
    std::string asset;
    CallDescriptor apy_call;
    CallDescriptor tvl_call;
    CallDescriptor liquidity_call;
    EncodingKind encoding = EncodingKind::Default;
    int decimals = 6;
    double block_time_seconds = 12.0;
    int risk_score = 0;
    uint64_t min_liquidity = 0;

    double unit_scale() const;
};

struct RawReading {
    std::string protocol_id;
    double raw_apy;
    uint64_t raw_tvl;
    uint64_t raw_liquidity;
    int64_t timestamp_ms;
};

struct YieldSample {
    std::string protocol_id;
    double apy;
    uint64_t liquidity;
    uint64_t tvl;
    int risk_score;
    int64_t timestamp_ms;

    nlohmann::json to_json() const;
    static std::optional<YieldSample> from_json(const nlohmann::json& j);
};

struct AggregateMetrics {
    int64_t timestamp_ms = 0;
    double weighted_apy = 0.0;
    double volatility = 0.0;
    double sharpe_ratio = 0.0;
    uint64_t total_tvl = 0;
    int protocol_count = 0;

    nlohmann::json to_json() const;
    static std::optional<AggregateMetrics> from_json(const nlohmann::json& j);
};

struct LatestSnapshot {
    AggregateMetrics metrics;
    std::vector<YieldSample> samples;
    std::string source; // "cache" or "store"

    nlohmann::json to_json() const;
};
