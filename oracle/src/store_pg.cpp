#include "store_pg.hpp"
#include <spdlog/spdlog.h>

namespace {

const char* kSampleColumns =
    "protocol, apy, liquidity::TEXT, tvl::TEXT, risk_score, "
    "(EXTRACT(EPOCH FROM ts) * 1000)::BIGINT";

} // namespace

PostgresStore::PostgresStore(const std::string& dsn) : dsn_(dsn) {}

pqxx::connection PostgresStore::make_connection() {
    return pqxx::connection(dsn_);
}

void PostgresStore::init_schema() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS yield_samples (
                id BIGSERIAL PRIMARY KEY,
                cycle_ts TIMESTAMPTZ NOT NULL,
                protocol TEXT NOT NULL,
                apy DOUBLE PRECISION NOT NULL,
                liquidity NUMERIC(40, 0) NOT NULL,
                tvl NUMERIC(40, 0) NOT NULL,
                risk_score INT NOT NULL,
                ts TIMESTAMPTZ NOT NULL
            )
        )");

        txn.exec(R"(
            CREATE INDEX IF NOT EXISTS yield_samples_protocol_ts
                ON yield_samples (protocol, ts)
        )");

        txn.exec(R"(
            CREATE INDEX IF NOT EXISTS yield_samples_cycle
                ON yield_samples (cycle_ts)
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS yield_metrics (
                id BIGSERIAL PRIMARY KEY,
                ts TIMESTAMPTZ NOT NULL,
                weighted_apy DOUBLE PRECISION NOT NULL,
                volatility DOUBLE PRECISION NOT NULL,
                sharpe_ratio DOUBLE PRECISION NOT NULL,
                total_tvl NUMERIC(40, 0) NOT NULL,
                protocol_count INT NOT NULL
            )
        )");

        txn.commit();
        spdlog::info("Database schema initialized");

    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize schema: {}", e.what());
        throw;
    }
}

void PostgresStore::insert_cycle(const std::vector<YieldSample>& samples,
                                 const AggregateMetrics& metrics) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        for (const auto& sample : samples) {
            txn.exec_params(
                "INSERT INTO yield_samples "
                "(cycle_ts, protocol, apy, liquidity, tvl, risk_score, ts) "
                "VALUES (to_timestamp($1::BIGINT / 1000.0), $2, $3, $4::NUMERIC, $5::NUMERIC, $6, "
                "to_timestamp($7::BIGINT / 1000.0))",
                metrics.timestamp_ms,
                sample.protocol_id,
                sample.apy,
                std::to_string(sample.liquidity),
                std::to_string(sample.tvl),
                sample.risk_score,
                sample.timestamp_ms
            );
        }

        txn.exec_params(
            "INSERT INTO yield_metrics "
            "(ts, weighted_apy, volatility, sharpe_ratio, total_tvl, protocol_count) "
            "VALUES (to_timestamp($1::BIGINT / 1000.0), $2, $3, $4, $5::NUMERIC, $6)",
            metrics.timestamp_ms,
            metrics.weighted_apy,
            metrics.volatility,
            metrics.sharpe_ratio,
            std::to_string(metrics.total_tvl),
            metrics.protocol_count
        );

        txn.commit();
        spdlog::debug("Inserted cycle {} with {} samples", metrics.timestamp_ms, samples.size());

    } catch (const std::exception& e) {
        spdlog::error("Failed to insert cycle {}: {}", metrics.timestamp_ms, e.what());
        throw;
    }
}

YieldSample PostgresStore::row_to_sample(const pqxx::row& row) {
    YieldSample s;
    s.protocol_id = row[0].as<std::string>();
    s.apy = row[1].as<double>();
    s.liquidity = std::stoull(row[2].as<std::string>());
    s.tvl = std::stoull(row[3].as<std::string>());
    s.risk_score = row[4].as<int>();
    s.timestamp_ms = row[5].as<int64_t>();
    return s;
}

std::optional<AggregateMetrics> PostgresStore::query_latest_metrics() {
    auto conn = make_connection();
    pqxx::work txn(conn);

    auto result = txn.exec(
        "SELECT (EXTRACT(EPOCH FROM ts) * 1000)::BIGINT, weighted_apy, volatility, "
        "sharpe_ratio, total_tvl::TEXT, protocol_count "
        "FROM yield_metrics ORDER BY ts DESC, id DESC LIMIT 1"
    );
    txn.commit();

    if (result.empty()) return std::nullopt;

    const auto& row = result[0];
    AggregateMetrics m;
    m.timestamp_ms = row[0].as<int64_t>();
    m.weighted_apy = row[1].as<double>();
    m.volatility = row[2].as<double>();
    m.sharpe_ratio = row[3].as<double>();
    m.total_tvl = std::stoull(row[4].as<std::string>());
    m.protocol_count = row[5].as<int>();
    return m;
}

std::vector<YieldSample> PostgresStore::query_samples_for_cycle(int64_t cycle_ts_ms) {
    std::vector<YieldSample> samples;

    auto conn = make_connection();
    pqxx::work txn(conn);

    auto result = txn.exec_params(
        std::string("SELECT ") + kSampleColumns +
        " FROM yield_samples WHERE cycle_ts = to_timestamp($1::BIGINT / 1000.0) "
        "ORDER BY protocol",
        cycle_ts_ms
    );
    txn.commit();

    for (const auto& row : result) {
        samples.push_back(row_to_sample(row));
    }
    return samples;
}

std::vector<YieldSample> PostgresStore::query_samples_since(const std::string& protocol_id,
                                                            int64_t since_ms) {
    std::vector<YieldSample> samples;

    auto conn = make_connection();
    pqxx::work txn(conn);

    auto result = txn.exec_params(
        std::string("SELECT ") + kSampleColumns +
        " FROM yield_samples WHERE protocol = $1 AND ts >= to_timestamp($2::BIGINT / 1000.0) "
        "ORDER BY ts ASC",
        protocol_id,
        since_ms
    );
    txn.commit();

    for (const auto& row : result) {
        samples.push_back(row_to_sample(row));
    }

    spdlog::debug("Loaded {} samples for {} since {}", samples.size(), protocol_id, since_ms);
    return samples;
}

bool PostgresStore::ping() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec("SELECT 1");
        txn.commit();
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Postgres ping failed: {}", e.what());
        return false;
    }
}
