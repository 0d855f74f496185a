#include "registry.hpp"
#include "abi.hpp"
#include "validator.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <fstream>
#include <limits>
#include <set>
#include <stdexcept>

ProtocolRegistry::ProtocolRegistry(std::vector<ProtocolSource> sources)
    : sources_(std::move(sources)) {}

CallDescriptor ProtocolRegistry::parse_call(const nlohmann::json& j,
                                            const std::string& context) {
    CallDescriptor call;
    call.target = j.value("target", "");
    call.selector = j.at("selector").get<std::string>();
    call.result_word = j.value("word", 0);

    if (!abi::is_selector(call.selector)) {
        throw std::runtime_error("Invalid selector '" + call.selector + "' in " + context);
    }
    if (call.result_word < 0) {
        throw std::runtime_error("Negative result word in " + context);
    }
    if (!call.target.empty() && call.target != kAssetPlaceholder &&
        !abi::is_address(call.target)) {
        throw std::runtime_error("Invalid call target in " + context);
    }

    if (j.contains("args")) {
        for (const auto& arg : j.at("args")) {
            auto value = arg.get<std::string>();
            if (value != kAssetPlaceholder && !abi::is_address(value)) {
                throw std::runtime_error("Invalid address argument '" + value + "' in " + context);
            }
            call.args.push_back(value);
        }
    }

    return call;
}

ProtocolRegistry ProtocolRegistry::from_json(const nlohmann::json& doc,
                                             const std::string& default_asset) {
    std::vector<ProtocolSource> sources;
    std::set<std::string> seen;

    // Upper bounds of every enabled source's TVL must sum within uint64_t
    const long double tvl_capacity = std::numeric_limits<uint64_t>::max();
    long double tvl_bound_sum = 0.0L;

    for (const auto& entry : doc.at("protocols")) {
        ProtocolSource src;
        src.id = entry.at("id").get<std::string>();
        if (src.id.empty()) {
            throw std::runtime_error("Protocol entry without id");
        }
        if (!seen.insert(src.id).second) {
            throw std::runtime_error("Duplicate protocol id: " + src.id);
        }

        src.name = entry.value("name", src.id);
        src.address = entry.at("address").get<std::string>();
        if (!abi::is_address(src.address)) {
            throw std::runtime_error("Invalid address for protocol " + src.id);
        }
        src.asset = entry.value("asset", default_asset);
        src.encoding = encoding_from_string(entry.value("encoding", "basis_points"));
        src.decimals = entry.value("decimals", 6);
        src.block_time_seconds = entry.value("block_time_seconds", 12.0);
        src.risk_score = entry.value("risk_score", 0);
        src.min_liquidity = entry.value("min_liquidity", uint64_t{0});

        if (src.block_time_seconds <= 0.0) {
            throw std::runtime_error("block_time_seconds must be positive for " + src.id);
        }
        if (src.decimals < 0 || src.decimals > 36) {
            throw std::runtime_error("decimals out of range for " + src.id);
        }

        const auto& calls = entry.at("calls");
        src.apy_call = parse_call(calls.at("apy"), src.id + ".apy");
        src.tvl_call = parse_call(calls.at("tvl"), src.id + ".tvl");
        src.liquidity_call = parse_call(calls.at("liquidity"), src.id + ".liquidity");

        for (const auto* call : {&src.apy_call, &src.tvl_call, &src.liquidity_call}) {
            bool uses_asset = call->target == kAssetPlaceholder;
            for (const auto& arg : call->args) {
                uses_asset = uses_asset || arg == kAssetPlaceholder;
            }
            if (uses_asset && !abi::is_address(src.asset)) {
                throw std::runtime_error("Protocol " + src.id +
                                         " needs an asset address (ASSET_ADDRESS)");
            }
        }

        if (!entry.value("enabled", true)) {
            spdlog::info("Protocol {} disabled in configuration, skipping", src.id);
            continue;
        }

        long double tvl_bound = kMaxTvlUnits * std::pow(10.0L, src.decimals);
        if (tvl_bound > tvl_capacity) {
            throw std::runtime_error("decimals=" + std::to_string(src.decimals) + " for " +
                                     src.id + " puts the TVL bound beyond 64 bits");
        }
        tvl_bound_sum += tvl_bound;
        if (tvl_bound_sum > tvl_capacity) {
            throw std::runtime_error("Combined TVL bound exceeds 64 bits at protocol " + src.id);
        }

        spdlog::debug("Registered protocol {} ({}) encoding={} risk={}",
                      src.id, src.name, encoding_to_string(src.encoding), src.risk_score);
        sources.push_back(std::move(src));
    }

    return ProtocolRegistry(std::move(sources));
}

ProtocolRegistry ProtocolRegistry::from_file(const std::string& path,
                                             const std::string& default_asset) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open protocols file: " + path);
    }

    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed protocols file " + path + ": " + e.what());
    }

    auto registry = from_json(doc, default_asset);
    spdlog::info("Loaded {} protocols from {}", registry.size(), path);
    return registry;
}

const ProtocolSource* ProtocolRegistry::find(const std::string& id) const {
    for (const auto& src : sources_) {
        if (src.id == id) return &src;
    }
    return nullptr;
}
