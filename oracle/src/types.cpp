#include "types.hpp"
#include <cmath>
#include <spdlog/spdlog.h>

EncodingKind encoding_from_string(const std::string& name) {
    if (name == "ray") return EncodingKind::Ray;
    if (name == "basis_points") return EncodingKind::BasisPoints;
    if (name == "per_block") return EncodingKind::PerBlock;
    return EncodingKind::Default;
}

std::string encoding_to_string(EncodingKind kind) {
    switch (kind) {
        case EncodingKind::Ray: return "ray";
        case EncodingKind::BasisPoints: return "basis_points";
        case EncodingKind::PerBlock: return "per_block";
        default: return "default";
    }
}

double ProtocolSource::unit_scale() const {
    return std::pow(10.0, decimals);
}

nlohmann::json YieldSample::to_json() const {
    return {
        {"protocol", protocol_id},
        {"apy", apy},
        {"liquidity", liquidity},
        {"tvl", tvl},
        {"risk_score", risk_score},
        {"ts", timestamp_ms}
    };
}

std::optional<YieldSample> YieldSample::from_json(const nlohmann::json& j) {
    try {
        YieldSample s;
        s.protocol_id = j.at("protocol").get<std::string>();
        s.apy = j.at("apy").get<double>();
        s.liquidity = j.at("liquidity").get<uint64_t>();
        s.tvl = j.at("tvl").get<uint64_t>();
        s.risk_score = j.at("risk_score").get<int>();
        s.timestamp_ms = j.at("ts").get<int64_t>();
        return s;
    } catch (const std::exception& e) {
        spdlog::warn("Failed to parse yield sample: {}", e.what());
        return std::nullopt;
    }
}

nlohmann::json AggregateMetrics::to_json() const {
    return {
        {"ts", timestamp_ms},
        {"weighted_apy", weighted_apy},
        {"volatility", volatility},
        {"sharpe_ratio", sharpe_ratio},
        {"total_tvl", total_tvl},
        {"protocol_count", protocol_count}
    };
}

std::optional<AggregateMetrics> AggregateMetrics::from_json(const nlohmann::json& j) {
    try {
        AggregateMetrics m;
        m.timestamp_ms = j.at("ts").get<int64_t>();
        m.weighted_apy = j.at("weighted_apy").get<double>();
        m.volatility = j.at("volatility").get<double>();
        m.sharpe_ratio = j.at("sharpe_ratio").get<double>();
        m.total_tvl = j.at("total_tvl").get<uint64_t>();
        m.protocol_count = j.at("protocol_count").get<int>();
        return m;
    } catch (const std::exception& e) {
        spdlog::warn("Failed to parse aggregate metrics: {}", e.what());
        return std::nullopt;
    }
}

nlohmann::json LatestSnapshot::to_json() const {
    nlohmann::json samples_json = nlohmann::json::array();
    for (const auto& s : samples) {
        samples_json.push_back(s.to_json());
    }

    return {
        {"metrics", metrics.to_json()},
        {"samples", samples_json},
        {"source", source}
    };
}
