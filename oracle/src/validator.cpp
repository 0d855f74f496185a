#include "validator.hpp"
#include <cmath>
#include <spdlog/fmt/fmt.h>

std::optional<std::string> Validator::check(double apy_percent, uint64_t tvl,
                                            uint64_t liquidity,
                                            const ProtocolSource& source) {
    if (!std::isfinite(apy_percent) || apy_percent < 0.0 || apy_percent > 100.0) {
        return fmt::format("APY {:.4f}% out of range for {}", apy_percent, source.name);
    }

    if (liquidity < source.min_liquidity) {
        return fmt::format("Insufficient liquidity {} (min {}) for {}",
                           liquidity, source.min_liquidity, source.name);
    }

    // tvl is unsigned, so only the upper bound can be violated
    double max_tvl = kMaxTvlUnits * source.unit_scale();
    if (static_cast<double>(tvl) > max_tvl) {
        return fmt::format("TVL {} above sanity bound for {}", tvl, source.name);
    }

    return std::nullopt;
}
