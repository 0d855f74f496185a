#pragma once

#include "types.hpp"
#include <optional>
#include <string>

constexpr double kMaxTvlUnits = 1e9;

class Validator {
public:
    // Returns the rejection reason, or nothing when the reading is plausible
    static std::optional<std::string> check(double apy_percent, uint64_t tvl,
                                            uint64_t liquidity,
                                            const ProtocolSource& source);
};
