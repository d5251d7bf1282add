#pragma once

#include "stores.hpp"
#include <string>
#include <vector>
#include <pqxx/pqxx>

// All three stores on one Postgres database. A connection is opened per
// call; failures surface as PersistenceFailure.
class PostgresStore : public SignalStore, public PairWatchStore, public RiskProfileStore {
public:
    explicit PostgresStore(const std::string& dsn);

    void init_schema();
    void seed_pairs(const std::vector<std::string>& symbols);
    void seed_risk_profile(const RiskProfile& profile);
    bool ping();

    // SignalStore
    int64_t create(const Signal& signal) override;
    void update_status(int64_t id, SignalStatus status,
                       const std::string& close_reason, int64_t at_ms) override;
    std::vector<Signal> list_open() override;
    int archive_older_than(int64_t cutoff_ms) override;

    // PairWatchStore
    std::vector<PairWatch> list_pairs() override;
    std::vector<std::string> list_enabled_pairs() override;
    bool set_pair_enabled(const std::string& symbol, bool enabled) override;
    void add_pair(const std::string& symbol) override;

    // RiskProfileStore
    RiskProfile get_risk_profile(const std::string& scope) override;
    void set_risk_pct(const std::string& scope, double risk_pct) override;

private:
    std::string dsn_;

    pqxx::connection make_connection();
    static Signal row_to_signal(const pqxx::row& row);
};
