#pragma once

#include "types.hpp"
#include <vector>

constexpr double kRiskFreeRatePct = 2.0;

class Aggregator {
public:
    static AggregateMetrics aggregate(const std::vector<YieldSample>& samples,
                                      int64_t timestamp_ms);

    // Population standard deviation, 0 for fewer than two values
    static double volatility(const std::vector<double>& apys);
    static double sharpe_ratio(double apy, double volatility);
};
