#pragma once

#include "signal.hpp"
#include "risk_sizer.hpp"
#include <string>
#include <vector>
#include <stdexcept>
#include <cstdint>

class PersistenceFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The record addressed by id no longer exists
class SignalNotFound : public PersistenceFailure {
public:
    using PersistenceFailure::PersistenceFailure;
};

// Durable signal records. Performs no business logic; every method throws
// PersistenceFailure when the write or read did not happen.
class SignalStore {
public:
    virtual ~SignalStore() = default;

    // Returns the id assigned to the new record
    virtual int64_t create(const Signal& signal) = 0;
    // Throws SignalNotFound when no record has this id
    virtual void update_status(int64_t id, SignalStatus status,
                               const std::string& close_reason, int64_t at_ms) = 0;
    virtual std::vector<Signal> list_open() = 0;
    // Removes every record created before cutoff_ms, returns how many
    virtual int archive_older_than(int64_t cutoff_ms) = 0;
};

struct PairWatch {
    std::string symbol;
    bool enabled;
};

class PairWatchStore {
public:
    virtual ~PairWatchStore() = default;

    virtual std::vector<PairWatch> list_pairs() = 0;
    virtual std::vector<std::string> list_enabled_pairs() = 0;
    // Returns false when the symbol is not watched
    virtual bool set_pair_enabled(const std::string& symbol, bool enabled) = 0;
    virtual void add_pair(const std::string& symbol) = 0;
};

class RiskProfileStore {
public:
    virtual ~RiskProfileStore() = default;

    virtual RiskProfile get_risk_profile(const std::string& scope) = 0;
    virtual void set_risk_pct(const std::string& scope, double risk_pct) = 0;
};
