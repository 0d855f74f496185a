#pragma once

#include "store.hpp"
#include <pqxx/pqxx>
#include <string>
#include <vector>

class PostgresStore : public DurableStore {
public:
    explicit PostgresStore(const std::string& dsn);

    void init_schema();

    void insert_cycle(const std::vector<YieldSample>& samples,
                      const AggregateMetrics& metrics) override;

    std::optional<AggregateMetrics> query_latest_metrics() override;
    std::vector<YieldSample> query_samples_for_cycle(int64_t cycle_ts_ms) override;
    std::vector<YieldSample> query_samples_since(const std::string& protocol_id,
                                                 int64_t since_ms) override;

    bool ping();

private:
    std::string dsn_;
    pqxx::connection make_connection();

    static YieldSample row_to_sample(const pqxx::row& row);
};
