#include "lifecycle.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>

std::string admission_reason_to_string(AdmissionReason reason) {
    switch (reason) {
        case AdmissionReason::Admitted: return "admitted";
        case AdmissionReason::DuplicatePair: return "duplicate_pair";
        case AdmissionReason::CapReached: return "cap_reached";
        case AdmissionReason::PairDisabled: return "pair_disabled";
        case AdmissionReason::Muted: return "muted";
        case AdmissionReason::CoolingDown: return "cooling_down";
        case AdmissionReason::InvalidLevels: return "invalid_levels";
    }
    return "unknown";
}

SignalLifecycleManager::SignalLifecycleManager(SignalStore& store, Notifier& notifier,
                                               int64_t cooldown_ms)
    : store_(store), notifier_(notifier), cooldown_ms_(cooldown_ms) {}

int SignalLifecycleManager::load(int64_t now_ms) {
    auto signals = store_.list_open();
    std::vector<Signal> cancelled;

    int loaded = book_.transact([&](BookState& state) {
        state.open.clear();
        std::vector<Signal> superseded;

        for (auto& signal : signals) {
            if (!signal.is_open()) continue;

            auto it = state.open.find(signal.symbol);
            if (it == state.open.end()) {
                state.open[signal.symbol] = signal;
                continue;
            }

            spdlog::warn("{} has more than one open signal in store ({} and {}), keeping newest",
                         signal.symbol, it->second.id, signal.id);
            if (signal.created_at_ms > it->second.created_at_ms) {
                superseded.push_back(it->second);
                it->second = signal;
            } else {
                superseded.push_back(signal);
            }
        }

        // Older duplicates are closed in the store only, the book never held them
        for (auto& older : superseded) {
            try {
                store_.update_status(older.id, SignalStatus::Cancelled, "superseded", now_ms);
            } catch (const PersistenceFailure& e) {
                spdlog::error("{} failed to cancel superseded signal {}: {}",
                              older.symbol, older.id, e.what());
                continue;
            }
            older.status = SignalStatus::Cancelled;
            older.close_reason = "superseded";
            older.updated_at_ms = now_ms;
            cancelled.push_back(older);
        }

        spdlog::info("Loaded {} open signals", state.open.size());
        return static_cast<int>(state.open.size());
    });

    for (const auto& signal : cancelled) notify(signal);
    return loaded;
}

void SignalLifecycleManager::set_enabled_pairs(const std::vector<std::string>& symbols) {
    book_.transact([&](BookState& state) {
        state.enabled = std::set<std::string>(symbols.begin(), symbols.end());
    });
}

void SignalLifecycleManager::set_muted(bool muted) {
    book_.transact([&](BookState& state) {
        if (state.muted != muted) {
            spdlog::info("Signal emission {}", muted ? "muted" : "unmuted");
        }
        state.muted = muted;
    });
}

bool SignalLifecycleManager::muted() const {
    return book_.read([](const BookState& state) { return state.muted; });
}

bool SignalLifecycleManager::refresh_mute(MuteState& source) {
    auto flag = source.is_muted();
    if (!flag) {
        spdlog::warn("Mute flag unreadable, emission stays {}", muted() ? "muted" : "unmuted");
        return false;
    }
    set_muted(*flag);
    return true;
}

Signal SignalLifecycleManager::commit(BookState& state, const Signal& current, SignalStatus to,
                                      const std::string& reason, int64_t now_ms) {
    try {
        store_.update_status(current.id, to, reason, now_ms);
    } catch (const SignalNotFound&) {
        // current may be the map entry itself
        const std::string symbol = current.symbol;
        const int64_t id = current.id;
        spdlog::error("{} signal {} no longer in store, dropping it from the open set", symbol, id);
        auto it = state.open.find(symbol);
        if (it != state.open.end() && it->second.id == id) state.open.erase(it);
        throw;
    }

    // current may live in state.open, copy before touching the map
    const SignalStatus from = current.status;
    Signal next = current;
    next.status = to;
    next.updated_at_ms = now_ms;
    if (is_terminal(to)) next.close_reason = reason;
    if (to == SignalStatus::Triggered) next.triggered_at_ms = now_ms;

    if (is_terminal(to)) {
        state.open.erase(next.symbol);
        state.closed_at_ms[next.symbol] = now_ms;
    } else {
        state.open[next.symbol] = next;
    }

    spdlog::info("{} signal {} {} -> {}{}", next.symbol, next.id,
                 status_to_string(from), status_to_string(to),
                 reason.empty() ? "" : " (" + reason + ")");
    return next;
}

void SignalLifecycleManager::notify(const Signal& signal) {
    try {
        notifier_.publish(signal);
    } catch (const std::exception& e) {
        spdlog::error("{} notify failed for signal {}: {}", signal.symbol, signal.id, e.what());
    }
}

AdmissionResult SignalLifecycleManager::admit(const SignalCandidate& candidate,
                                              const RiskProfile& profile, int64_t now_ms) {
    if (!candidate.levels_ordered()) {
        spdlog::warn("{} candidate rejected: levels not ordered (sl={} entry={} tp1={} tp2={})",
                     candidate.symbol, candidate.stop_loss, candidate.entry_price,
                     candidate.take_profit_1, candidate.take_profit_2);
        return {false, AdmissionReason::InvalidLevels, std::nullopt};
    }

    Signal signal = Signal::from_candidate(candidate, now_ms, profile.effective_ttl_ms());

    auto result = book_.transact([&](BookState& state) -> AdmissionResult {
        if (state.muted) {
            return {false, AdmissionReason::Muted, std::nullopt};
        }
        if (state.enabled.count(candidate.symbol) == 0) {
            return {false, AdmissionReason::PairDisabled, std::nullopt};
        }
        if (state.open.count(candidate.symbol) > 0) {
            return {false, AdmissionReason::DuplicatePair, std::nullopt};
        }
        if (static_cast<int>(state.open.size()) >= profile.max_concurrent_signals) {
            return {false, AdmissionReason::CapReached, std::nullopt};
        }
        auto closed = state.closed_at_ms.find(candidate.symbol);
        if (closed != state.closed_at_ms.end() && now_ms - closed->second < cooldown_ms_) {
            return {false, AdmissionReason::CoolingDown, std::nullopt};
        }

        signal.id = store_.create(signal);
        state.open[signal.symbol] = signal;
        return {true, AdmissionReason::Admitted, signal};
    });

    if (result.admitted) {
        spdlog::info("{} admitted signal {} grade {} entry={} sl={} tp1={} tp2={}",
                     signal.symbol, signal.id, grade_to_string(signal.grade), signal.entry_price,
                     signal.stop_loss, signal.take_profit_1, signal.take_profit_2);
        notify(*result.signal);
    } else {
        spdlog::info("{} candidate not admitted: {}", candidate.symbol,
                     admission_reason_to_string(result.reason));
    }
    return result;
}

int SignalLifecycleManager::sweep_expired(int64_t now_ms) {
    std::exception_ptr failure;

    std::vector<Signal> expired = book_.transact([&](BookState& state) {
        std::vector<Signal> due;
        for (const auto& [symbol, signal] : state.open) {
            if (now_ms > signal.expires_at_ms) due.push_back(signal);
        }

        std::vector<Signal> done;
        for (const auto& signal : due) {
            try {
                done.push_back(commit(state, signal, SignalStatus::Expired, "ttl", now_ms));
            } catch (const SignalNotFound&) {
                continue;
            } catch (const PersistenceFailure& e) {
                spdlog::error("{} failed to expire signal {}: {}", signal.symbol, signal.id, e.what());
                if (!failure) failure = std::current_exception();
            }
        }
        return done;
    });

    for (const auto& signal : expired) notify(signal);
    if (failure) std::rethrow_exception(failure);
    return static_cast<int>(expired.size());
}

int SignalLifecycleManager::sweep_retention(int64_t retention_ms, int64_t now_ms) {
    const int64_t cutoff = now_ms - retention_ms;

    return book_.transact([&](BookState& state) {
        int archived = store_.archive_older_than(cutoff);

        for (auto it = state.open.begin(); it != state.open.end();) {
            if (it->second.created_at_ms < cutoff) {
                spdlog::warn("{} open signal {} dropped by retention", it->first, it->second.id);
                it = state.open.erase(it);
            } else {
                ++it;
            }
        }
        for (auto it = state.closed_at_ms.begin(); it != state.closed_at_ms.end();) {
            if (now_ms - it->second >= cooldown_ms_) {
                it = state.closed_at_ms.erase(it);
            } else {
                ++it;
            }
        }

        if (archived > 0) {
            spdlog::info("Retention sweep archived {} signals", archived);
        }
        return archived;
    });
}

std::optional<Signal> SignalLifecycleManager::transition_by_id(int64_t id, SignalStatus to,
                                                               const std::string& reason,
                                                               int64_t now_ms) {
    auto changed = book_.transact([&](BookState& state) -> std::optional<Signal> {
        for (const auto& [symbol, signal] : state.open) {
            if (signal.id != id) continue;
            if (!can_transition(signal.status, to)) {
                spdlog::info("{} signal {} cannot go {} -> {}", symbol, id,
                             status_to_string(signal.status), status_to_string(to));
                return std::nullopt;
            }
            return commit(state, signal, to, reason, now_ms);
        }
        return std::nullopt;
    });

    if (changed) notify(*changed);
    return changed;
}

std::optional<Signal> SignalLifecycleManager::mark_active(int64_t id, int64_t now_ms) {
    return transition_by_id(id, SignalStatus::Active, "", now_ms);
}

std::optional<Signal> SignalLifecycleManager::mark_triggered(int64_t id, const std::string& reason,
                                                             int64_t now_ms) {
    return transition_by_id(id, SignalStatus::Triggered, reason, now_ms);
}

std::optional<Signal> SignalLifecycleManager::cancel(int64_t id, const std::string& reason,
                                                     int64_t now_ms) {
    return transition_by_id(id, SignalStatus::Cancelled, reason, now_ms);
}

std::optional<Signal> SignalLifecycleManager::mute_pair(const std::string& symbol, int64_t now_ms) {
    auto cancelled = book_.transact([&](BookState& state) -> std::optional<Signal> {
        state.enabled.erase(symbol);
        auto it = state.open.find(symbol);
        if (it == state.open.end()) return std::nullopt;
        return commit(state, it->second, SignalStatus::Cancelled, "pair_muted", now_ms);
    });

    if (cancelled) notify(*cancelled);
    return cancelled;
}

void SignalLifecycleManager::unmute_pair(const std::string& symbol) {
    book_.transact([&](BookState& state) { state.enabled.insert(symbol); });
}

std::vector<Signal> SignalLifecycleManager::on_price(const std::string& symbol,
                                                     const std::vector<Candle>& candles,
                                                     int64_t now_ms) {
    std::exception_ptr failure;

    auto changed = book_.transact([&](BookState& state) {
        std::vector<Signal> steps;
        auto it = state.open.find(symbol);
        if (it == state.open.end()) return steps;

        Signal current = it->second;
        try {
            for (const auto& c : candles) {
                if (c.timestamp_ms < current.created_at_ms) continue;

                if (current.status == SignalStatus::Pending) {
                    if (c.low > current.entry_price) continue;
                    current = commit(state, current, SignalStatus::Active, "", now_ms);
                    steps.push_back(current);
                }

                // Stop first: inside one candle the adverse touch is assumed to come first
                const char* reason = nullptr;
                if (c.low <= current.stop_loss) {
                    reason = "stop_loss";
                } else if (c.high >= current.take_profit_2) {
                    reason = "take_profit_2";
                } else if (c.high >= current.take_profit_1) {
                    reason = "take_profit_1";
                }

                if (reason) {
                    steps.push_back(commit(state, current, SignalStatus::Triggered, reason, now_ms));
                    break;
                }
            }
        } catch (const PersistenceFailure& e) {
            spdlog::error("{} price update for signal {} stopped: {}", symbol, current.id, e.what());
            failure = std::current_exception();
        }
        return steps;
    });

    // Committed steps go out even when a later one failed
    for (const auto& signal : changed) notify(signal);
    if (failure) std::rethrow_exception(failure);
    return changed;
}

std::vector<Signal> SignalLifecycleManager::open_signals() const {
    auto signals = book_.read([](const BookState& state) {
        std::vector<Signal> out;
        for (const auto& [_, signal] : state.open) out.push_back(signal);
        return out;
    });

    std::sort(signals.begin(), signals.end(), [](const Signal& a, const Signal& b) {
        return a.created_at_ms < b.created_at_ms;
    });
    return signals;
}

std::optional<Signal> SignalLifecycleManager::find(int64_t id) const {
    return book_.read([&](const BookState& state) -> std::optional<Signal> {
        for (const auto& [_, signal] : state.open) {
            if (signal.id == id) return signal;
        }
        return std::nullopt;
    });
}

bool SignalLifecycleManager::has_open(const std::string& symbol) const {
    return book_.read([&](const BookState& state) { return state.open.count(symbol) > 0; });
}

std::size_t SignalLifecycleManager::open_count() const {
    return book_.read([](const BookState& state) { return state.open.size(); });
}
