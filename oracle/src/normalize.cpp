#include "normalize.hpp"

double Normalizer::blocks_per_year(double block_time_seconds) {
    return kSecondsPerYear / block_time_seconds;
}

double Normalizer::annualize_apy(double raw_rate, EncodingKind encoding,
                                 double block_time_seconds) {
    switch (encoding) {
        case EncodingKind::Ray:
            // Per-second rate
            return raw_rate / kRayScale * kSecondsPerYear * 100.0;

        case EncodingKind::PerBlock:
            return raw_rate / kWadScale * blocks_per_year(block_time_seconds) * 100.0;

        case EncodingKind::BasisPoints:
        case EncodingKind::Default:
        default:
            return raw_rate / kBasisPointScale;
    }
}
