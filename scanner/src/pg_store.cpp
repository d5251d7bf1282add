#include "pg_store.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

namespace {

const char* kSignalColumns =
    "id, symbol, timeframe, entry_price, stop_loss, take_profit_1, take_profit_2, "
    "grade, risk_pct, position_size, rationale, status, close_reason, "
    "(EXTRACT(EPOCH FROM expires_at) * 1000)::BIGINT AS expires_at_ms, "
    "(EXTRACT(EPOCH FROM triggered_at) * 1000)::BIGINT AS triggered_at_ms, "
    "(EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_at_ms, "
    "(EXTRACT(EPOCH FROM updated_at) * 1000)::BIGINT AS updated_at_ms";

}

PostgresStore::PostgresStore(const std::string& dsn) : dsn_(dsn) {
    spdlog::info("PostgresStore initialized: {}", util::redact_dsn(dsn));
}

pqxx::connection PostgresStore::make_connection() {
    return pqxx::connection(dsn_);
}

void PostgresStore::init_schema() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS pairs (
                symbol TEXT PRIMARY KEY,
                enabled BOOLEAN NOT NULL DEFAULT TRUE,
                added_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS risk_profiles (
                scope TEXT PRIMARY KEY,
                risk_pct NUMERIC NOT NULL CHECK (risk_pct > 0 AND risk_pct <= 5),
                max_concurrent_signals INT NOT NULL,
                max_hold_hours INT NOT NULL,
                signal_ttl_hours INT NOT NULL,
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS signals (
                id BIGSERIAL PRIMARY KEY,
                symbol TEXT NOT NULL,
                timeframe TEXT NOT NULL,
                entry_price DOUBLE PRECISION NOT NULL,
                stop_loss DOUBLE PRECISION NOT NULL,
                take_profit_1 DOUBLE PRECISION NOT NULL,
                take_profit_2 DOUBLE PRECISION NOT NULL,
                grade TEXT NOT NULL CHECK (grade IN ('A','B','C')),
                risk_pct DOUBLE PRECISION NOT NULL,
                position_size DOUBLE PRECISION NOT NULL,
                rationale TEXT,
                status TEXT NOT NULL CHECK (status IN
                    ('pending','active','triggered','expired','cancelled')),
                close_reason TEXT,
                expires_at TIMESTAMPTZ NOT NULL,
                triggered_at TIMESTAMPTZ,
                created_at TIMESTAMPTZ NOT NULL,
                updated_at TIMESTAMPTZ NOT NULL
            )
        )");

        txn.exec("CREATE INDEX IF NOT EXISTS idx_signals_status ON signals(status)");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_signals_created ON signals(created_at)");

        txn.commit();
        spdlog::info("Database schema initialized");

    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize schema: {}", e.what());
        throw PersistenceFailure(std::string("init_schema: ") + e.what());
    }
}

void PostgresStore::seed_pairs(const std::vector<std::string>& symbols) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        for (const auto& symbol : symbols) {
            txn.exec_params(
                "INSERT INTO pairs (symbol, enabled) VALUES ($1, TRUE) "
                "ON CONFLICT (symbol) DO NOTHING",
                symbol
            );
        }

        txn.commit();
        spdlog::info("Seeded {} default pairs", symbols.size());

    } catch (const std::exception& e) {
        spdlog::error("Failed to seed pairs: {}", e.what());
        throw PersistenceFailure(std::string("seed_pairs: ") + e.what());
    }
}

void PostgresStore::seed_risk_profile(const RiskProfile& profile) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec_params(
            "INSERT INTO risk_profiles "
            "(scope, risk_pct, max_concurrent_signals, max_hold_hours, signal_ttl_hours) "
            "VALUES ($1, $2, $3, $4, $5) "
            "ON CONFLICT (scope) DO NOTHING",
            profile.scope, profile.risk_pct, profile.max_concurrent_signals,
            static_cast<int>(profile.max_hold_ms / util::kHourMs),
            static_cast<int>(profile.signal_ttl_ms / util::kHourMs)
        );

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to seed risk profile: {}", e.what());
        throw PersistenceFailure(std::string("seed_risk_profile: ") + e.what());
    }
}

int64_t PostgresStore::create(const Signal& signal) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            "INSERT INTO signals (symbol, timeframe, entry_price, stop_loss, take_profit_1, "
            "take_profit_2, grade, risk_pct, position_size, rationale, status, "
            "expires_at, created_at, updated_at) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, "
            "to_timestamp($12::BIGINT / 1000.0), to_timestamp($13::BIGINT / 1000.0), "
            "to_timestamp($14::BIGINT / 1000.0)) "
            "RETURNING id",
            signal.symbol, signal.timeframe, signal.entry_price, signal.stop_loss,
            signal.take_profit_1, signal.take_profit_2, grade_to_string(signal.grade),
            signal.risk_pct, signal.position_size, signal.rationale,
            status_to_string(signal.status),
            signal.expires_at_ms, signal.created_at_ms, signal.updated_at_ms
        );

        txn.commit();
        return result[0][0].as<int64_t>();

    } catch (const std::exception& e) {
        spdlog::error("{} failed to store signal: {}", signal.symbol, e.what());
        throw PersistenceFailure(std::string("create signal: ") + e.what());
    }
}

void PostgresStore::update_status(int64_t id, SignalStatus status,
                                  const std::string& close_reason, int64_t at_ms) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            "UPDATE signals SET status = $2, "
            "close_reason = COALESCE(NULLIF($3, ''), close_reason), "
            "triggered_at = CASE WHEN $2 = 'triggered' "
            "    THEN to_timestamp($4::BIGINT / 1000.0) ELSE triggered_at END, "
            "updated_at = to_timestamp($4::BIGINT / 1000.0) "
            "WHERE id = $1",
            id, status_to_string(status), close_reason, at_ms
        );

        if (result.affected_rows() == 0) {
            throw SignalNotFound("signal " + std::to_string(id) + " not found");
        }
        txn.commit();

    } catch (const PersistenceFailure&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::error("Failed to update signal {}: {}", id, e.what());
        throw PersistenceFailure(std::string("update_status: ") + e.what());
    }
}

Signal PostgresStore::row_to_signal(const pqxx::row& row) {
    Signal s;
    s.id = row["id"].as<int64_t>();
    s.symbol = row["symbol"].as<std::string>();
    s.timeframe = row["timeframe"].as<std::string>();
    s.entry_price = row["entry_price"].as<double>();
    s.stop_loss = row["stop_loss"].as<double>();
    s.take_profit_1 = row["take_profit_1"].as<double>();
    s.take_profit_2 = row["take_profit_2"].as<double>();
    s.grade = grade_from_string(row["grade"].as<std::string>());
    s.risk_pct = row["risk_pct"].as<double>();
    s.position_size = row["position_size"].as<double>();
    s.rationale = row["rationale"].is_null() ? "" : row["rationale"].as<std::string>();
    s.status = status_from_string(row["status"].as<std::string>());
    s.close_reason = row["close_reason"].is_null() ? "" : row["close_reason"].as<std::string>();
    s.expires_at_ms = row["expires_at_ms"].as<int64_t>();
    s.triggered_at_ms = row["triggered_at_ms"].is_null() ? 0 : row["triggered_at_ms"].as<int64_t>();
    s.created_at_ms = row["created_at_ms"].as<int64_t>();
    s.updated_at_ms = row["updated_at_ms"].as<int64_t>();
    return s;
}

std::vector<Signal> PostgresStore::list_open() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec(
            std::string("SELECT ") + kSignalColumns +
            " FROM signals WHERE status IN ('pending', 'active') ORDER BY created_at"
        );

        std::vector<Signal> signals;
        for (const auto& row : result) {
            signals.push_back(row_to_signal(row));
        }

        txn.commit();
        return signals;

    } catch (const std::exception& e) {
        spdlog::error("Failed to list open signals: {}", e.what());
        throw PersistenceFailure(std::string("list_open: ") + e.what());
    }
}

int PostgresStore::archive_older_than(int64_t cutoff_ms) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            "DELETE FROM signals WHERE created_at < to_timestamp($1::BIGINT / 1000.0)",
            cutoff_ms
        );

        txn.commit();
        return static_cast<int>(result.affected_rows());

    } catch (const std::exception& e) {
        spdlog::error("Failed to archive signals: {}", e.what());
        throw PersistenceFailure(std::string("archive_older_than: ") + e.what());
    }
}

std::vector<PairWatch> PostgresStore::list_pairs() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec("SELECT symbol, enabled FROM pairs ORDER BY symbol");

        std::vector<PairWatch> pairs;
        for (const auto& row : result) {
            pairs.push_back({row[0].as<std::string>(), row[1].as<bool>()});
        }

        txn.commit();
        return pairs;

    } catch (const std::exception& e) {
        spdlog::error("Failed to list pairs: {}", e.what());
        throw PersistenceFailure(std::string("list_pairs: ") + e.what());
    }
}

std::vector<std::string> PostgresStore::list_enabled_pairs() {
    std::vector<std::string> symbols;
    for (const auto& pair : list_pairs()) {
        if (pair.enabled) symbols.push_back(pair.symbol);
    }
    return symbols;
}

bool PostgresStore::set_pair_enabled(const std::string& symbol, bool enabled) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            "UPDATE pairs SET enabled = $2 WHERE symbol = $1",
            symbol, enabled
        );

        txn.commit();
        spdlog::info("{} {}", symbol, enabled ? "enabled" : "disabled");
        return result.affected_rows() > 0;

    } catch (const std::exception& e) {
        spdlog::error("Failed to update pair {}: {}", symbol, e.what());
        throw PersistenceFailure(std::string("set_pair_enabled: ") + e.what());
    }
}

void PostgresStore::add_pair(const std::string& symbol) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec_params(
            "INSERT INTO pairs (symbol, enabled) VALUES ($1, TRUE) "
            "ON CONFLICT (symbol) DO UPDATE SET enabled = TRUE",
            symbol
        );

        txn.commit();
        spdlog::info("{} added to watch list", symbol);

    } catch (const std::exception& e) {
        spdlog::error("Failed to add pair {}: {}", symbol, e.what());
        throw PersistenceFailure(std::string("add_pair: ") + e.what());
    }
}

RiskProfile PostgresStore::get_risk_profile(const std::string& scope) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            "SELECT risk_pct, max_concurrent_signals, max_hold_hours, signal_ttl_hours "
            "FROM risk_profiles WHERE scope = $1",
            scope
        );
        txn.commit();

        if (result.empty()) {
            throw PersistenceFailure("no risk profile for scope " + scope);
        }

        RiskProfile profile;
        profile.scope = scope;
        profile.risk_pct = result[0][0].as<double>();
        profile.max_concurrent_signals = result[0][1].as<int>();
        profile.max_hold_ms = result[0][2].as<int64_t>() * util::kHourMs;
        profile.signal_ttl_ms = result[0][3].as<int64_t>() * util::kHourMs;
        return profile;

    } catch (const PersistenceFailure&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load risk profile {}: {}", scope, e.what());
        throw PersistenceFailure(std::string("get_risk_profile: ") + e.what());
    }
}

void PostgresStore::set_risk_pct(const std::string& scope, double risk_pct) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            "UPDATE risk_profiles SET risk_pct = $2, updated_at = NOW() WHERE scope = $1",
            scope, risk_pct
        );

        if (result.affected_rows() == 0) {
            throw PersistenceFailure("no risk profile for scope " + scope);
        }
        txn.commit();
        spdlog::info("Risk per signal for {} set to {}%", scope, risk_pct);

    } catch (const PersistenceFailure&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::error("Failed to update risk profile {}: {}", scope, e.what());
        throw PersistenceFailure(std::string("set_risk_pct: ") + e.what());
    }
}

bool PostgresStore::ping() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec("SELECT 1");
        txn.commit();
        return true;
    } catch (const std::exception& e) {
        spdlog::debug("Postgres ping failed: {}", e.what());
        return false;
    }
}
