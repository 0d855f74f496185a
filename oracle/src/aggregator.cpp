#include "aggregator.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

double Aggregator::volatility(const std::vector<double>& apys) {
    if (apys.size() < 2) return 0.0;

    double sum = 0.0;
    for (double a : apys) sum += a;
    double mean = sum / apys.size();

    double variance = 0.0;
    for (double a : apys) variance += (a - mean) * (a - mean);
    variance /= apys.size();

    return std::sqrt(variance);
}

double Aggregator::sharpe_ratio(double apy, double volatility) {
    if (volatility <= 0.0) return 0.0;
    return (apy - kRiskFreeRatePct) / volatility;
}

AggregateMetrics Aggregator::aggregate(const std::vector<YieldSample>& samples,
                                       int64_t timestamp_ms) {
    AggregateMetrics m;
    m.timestamp_ms = timestamp_ms;
    m.protocol_count = static_cast<int>(samples.size());

    if (samples.empty()) return m;

    // Fixed summation order keeps results bit-identical whatever order
    // the collectors finished in
    std::vector<YieldSample> ordered(samples);
    std::sort(ordered.begin(), ordered.end(), [](const YieldSample& a, const YieldSample& b) {
        if (a.protocol_id != b.protocol_id) return a.protocol_id < b.protocol_id;
        if (a.timestamp_ms != b.timestamp_ms) return a.timestamp_ms < b.timestamp_ms;
        if (a.apy != b.apy) return a.apy < b.apy;
        return a.tvl < b.tvl;
    });

    double weighted_sum = 0.0;
    std::vector<double> apys;
    apys.reserve(ordered.size());

    for (const auto& s : ordered) {
        if (s.tvl > std::numeric_limits<uint64_t>::max() - m.total_tvl) {
            throw std::overflow_error("Total TVL overflows at protocol " + s.protocol_id);
        }
        m.total_tvl += s.tvl;
        weighted_sum += s.apy * static_cast<double>(s.tvl);
        apys.push_back(s.apy);
    }

    m.weighted_apy = m.total_tvl > 0 ? weighted_sum / static_cast<double>(m.total_tvl) : 0.0;
    m.volatility = volatility(apys);
    m.sharpe_ratio = sharpe_ratio(m.weighted_apy, m.volatility);

    return m;
}
