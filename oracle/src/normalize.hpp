#pragma once

#include "types.hpp"

constexpr double kSecondsPerYear = 31536000.0;
constexpr double kRayScale = 1e27;
constexpr double kWadScale = 1e18;
constexpr double kBasisPointScale = 100.0;

class Normalizer {
public:
    // Annual percentage yield from a protocol's raw rate encoding
    static double annualize_apy(double raw_rate, EncodingKind encoding,
                                double block_time_seconds = 12.0);

    static double blocks_per_year(double block_time_seconds);
};
