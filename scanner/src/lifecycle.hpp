#pragma once

#include "signal.hpp"
#include "stores.hpp"
#include "notifier.hpp"
#include "mute_state.hpp"
#include "market_data.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <cstdint>

enum class AdmissionReason {
    Admitted,
    DuplicatePair,
    CapReached,
    PairDisabled,
    Muted,
    CoolingDown,
    InvalidLevels
};

std::string admission_reason_to_string(AdmissionReason reason);

struct AdmissionResult {
    bool admitted;
    AdmissionReason reason;
    std::optional<Signal> signal;
};

// Everything admission and transitions decide on
struct BookState {
    std::map<std::string, Signal> open;           // non-terminal signals by symbol
    std::map<std::string, int64_t> closed_at_ms;  // last terminal transition per symbol
    std::set<std::string> enabled;
    bool muted = false;
};

// The shared open-signal set. Every read-decide-write runs inside transact()
// so admissions, sweeps and commands are linearizable.
class OpenSignalBook {
public:
    template <typename Fn>
    decltype(auto) transact(Fn&& fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        return fn(state_);
    }

    template <typename Fn>
    decltype(auto) read(Fn&& fn) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fn(static_cast<const BookState&>(state_));
    }

private:
    mutable std::mutex mutex_;
    BookState state_;
};

// Owns the signal state machine. The store write is the commit point of
// every transition: the book changes only after the store call returned,
// and notifications go out after the book lock is released.
class SignalLifecycleManager {
public:
    SignalLifecycleManager(SignalStore& store, Notifier& notifier, int64_t cooldown_ms = 0);

    // Rebuild the open set from the store, returns the number loaded. When a
    // pair has several open records the newest is kept and the rest are
    // cancelled as superseded.
    int load(int64_t now_ms);

    void set_enabled_pairs(const std::vector<std::string>& symbols);
    void set_muted(bool muted);
    bool muted() const;
    // Copies the shared mute flag in. Returns false and keeps the current
    // value when the flag cannot be read.
    bool refresh_mute(MuteState& source);

    AdmissionResult admit(const SignalCandidate& candidate, const RiskProfile& profile, int64_t now_ms);

    // Pending/Active signals past expires_at become Expired
    int sweep_expired(int64_t now_ms);
    // Drops records created more than retention_ms ago, whatever their status
    int sweep_retention(int64_t retention_ms, int64_t now_ms);

    std::optional<Signal> mark_active(int64_t id, int64_t now_ms);
    std::optional<Signal> mark_triggered(int64_t id, const std::string& reason, int64_t now_ms);
    std::optional<Signal> cancel(int64_t id, const std::string& reason, int64_t now_ms);

    // Disables the pair and cancels its open signal, if any
    std::optional<Signal> mute_pair(const std::string& symbol, int64_t now_ms);
    void unmute_pair(const std::string& symbol);

    // Applies entry, stop and target touches from candles opened after the
    // signal was created. Returns every state the signal passed through.
    // A failed store write stops the walk; steps already committed are
    // still notified before the PersistenceFailure is rethrown.
    std::vector<Signal> on_price(const std::string& symbol, const std::vector<Candle>& candles,
                                 int64_t now_ms);

    std::vector<Signal> open_signals() const;
    std::optional<Signal> find(int64_t id) const;
    bool has_open(const std::string& symbol) const;
    std::size_t open_count() const;

private:
    SignalStore& store_;
    Notifier& notifier_;
    int64_t cooldown_ms_;
    OpenSignalBook book_;

    Signal commit(BookState& state, const Signal& current, SignalStatus to,
                  const std::string& reason, int64_t now_ms);
    std::optional<Signal> transition_by_id(int64_t id, SignalStatus to,
                                           const std::string& reason, int64_t now_ms);
    void notify(const Signal& signal);
};
