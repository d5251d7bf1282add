#pragma once

#include "../src/stores.hpp"
#include "../src/notifier.hpp"
#include "../src/mute_state.hpp"
#include "../src/market_data.hpp"
#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

// In-memory doubles for the boundary interfaces

class FakeSignalStore : public SignalStore {
public:
    std::atomic<bool> fail_writes{false};
    // Number of update_status calls that succeed before every later one fails, -1 for never
    std::atomic<int> updates_until_failure{-1};

    int64_t create(const Signal& signal) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_writes) throw PersistenceFailure("store unavailable");

        for (const auto& [_, rec] : records_) {
            if (rec.symbol == signal.symbol && rec.is_open()) duplicate_open_seen_ = true;
        }

        Signal rec = signal;
        rec.id = next_id_++;
        records_[rec.id] = rec;
        creates_++;
        max_open_seen_ = std::max(max_open_seen_, open_count_locked());
        return rec.id;
    }

    void update_status(int64_t id, SignalStatus status,
                       const std::string& close_reason, int64_t at_ms) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_writes) throw PersistenceFailure("store unavailable");
        if (updates_until_failure == 0) throw PersistenceFailure("store unavailable");
        if (updates_until_failure > 0) updates_until_failure--;

        auto it = records_.find(id);
        if (it == records_.end()) throw SignalNotFound("signal not found");

        it->second.status = status;
        it->second.updated_at_ms = at_ms;
        if (!close_reason.empty()) it->second.close_reason = close_reason;
        if (status == SignalStatus::Triggered) it->second.triggered_at_ms = at_ms;
        updates_++;
    }

    std::vector<Signal> list_open() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Signal> out;
        for (const auto& [_, rec] : records_) {
            if (rec.is_open()) out.push_back(rec);
        }
        return out;
    }

    int archive_older_than(int64_t cutoff_ms) override {
        std::lock_guard<std::mutex> lock(mutex_);
        int removed = 0;
        for (auto it = records_.begin(); it != records_.end();) {
            if (it->second.created_at_ms < cutoff_ms) {
                it = records_.erase(it);
                removed++;
            } else {
                ++it;
            }
        }
        return removed;
    }

    // Test helpers
    void insert(const Signal& signal) {
        std::lock_guard<std::mutex> lock(mutex_);
        records_[signal.id] = signal;
        next_id_ = std::max(next_id_, signal.id + 1);
    }

    void erase(int64_t id) {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.erase(id);
    }

    std::optional<Signal> get(int64_t id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(id);
        if (it == records_.end()) return std::nullopt;
        return it->second;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

    int open_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_count_locked();
    }

    int creates() const { return creates_; }
    int updates() const { return updates_; }
    int max_open_seen() const { return max_open_seen_; }
    bool duplicate_open_seen() const { return duplicate_open_seen_; }

private:
    mutable std::mutex mutex_;
    std::map<int64_t, Signal> records_;
    int64_t next_id_ = 1;
    std::atomic<int> creates_{0};
    std::atomic<int> updates_{0};
    int max_open_seen_ = 0;
    bool duplicate_open_seen_ = false;

    int open_count_locked() const {
        return static_cast<int>(std::count_if(records_.begin(), records_.end(),
                                              [](const auto& kv) { return kv.second.is_open(); }));
    }
};

class FakeNotifier : public Notifier {
public:
    std::atomic<bool> fail{false};

    void publish(const Signal& signal) override {
        if (fail) throw std::runtime_error("notifier down");
        std::lock_guard<std::mutex> lock(mutex_);
        published_.push_back(signal);
    }

    std::vector<Signal> published() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return published_;
    }

    std::size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return published_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<Signal> published_;
};

class FakePairWatchStore : public PairWatchStore {
public:
    explicit FakePairWatchStore(const std::vector<std::string>& symbols = {}) {
        for (const auto& s : symbols) pairs_[s] = true;
    }

    std::vector<PairWatch> list_pairs() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<PairWatch> out;
        for (const auto& [symbol, enabled] : pairs_) out.push_back({symbol, enabled});
        return out;
    }

    std::vector<std::string> list_enabled_pairs() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        for (const auto& [symbol, enabled] : pairs_) {
            if (enabled) out.push_back(symbol);
        }
        return out;
    }

    bool set_pair_enabled(const std::string& symbol, bool enabled) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pairs_.find(symbol);
        if (it == pairs_.end()) return false;
        it->second = enabled;
        return true;
    }

    void add_pair(const std::string& symbol) override {
        std::lock_guard<std::mutex> lock(mutex_);
        pairs_[symbol] = true;
    }

    bool is_enabled(const std::string& symbol) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pairs_.find(symbol);
        return it != pairs_.end() && it->second;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, bool> pairs_;
};

class FakeRiskProfileStore : public RiskProfileStore {
public:
    RiskProfile profile;

    RiskProfile get_risk_profile(const std::string& scope) override {
        RiskProfile p = profile;
        p.scope = scope;
        return p;
    }

    void set_risk_pct(const std::string&, double risk_pct) override {
        profile.risk_pct = risk_pct;
    }
};

class FakeMuteState : public MuteState {
public:
    bool muted = false;
    bool unreachable = false;
    int minutes = 0;

    void mute_all(int m) override {
        muted = true;
        minutes = m;
    }
    void unmute_all() override {
        muted = false;
        minutes = 0;
    }
    std::optional<bool> is_muted() override {
        if (unreachable) return std::nullopt;
        return muted;
    }
    int remaining_minutes() override { return muted ? minutes : 0; }
};

// Canned candle windows keyed by symbol and timeframe
class FakeMarketData : public MarketDataProvider {
public:
    std::map<std::string, std::vector<Candle>> series;
    std::map<std::string, MarketDataError::Kind> failing;
    std::set<std::string> crashing;

    void set(const std::string& symbol, const std::string& timeframe, std::vector<Candle> candles) {
        series[symbol + "|" + timeframe] = std::move(candles);
    }

    std::vector<Candle> get_candles(const std::string& symbol, const std::string& timeframe,
                                    int count) override {
        calls_++;
        if (crashing.count(symbol)) throw std::runtime_error("unexpected provider state");

        auto f = failing.find(symbol);
        if (f != failing.end()) throw MarketDataError(f->second, "simulated failure");

        auto it = series.find(symbol + "|" + timeframe);
        if (it == series.end()) throw MarketDataError(MarketDataError::Kind::NotFound, "no such series");

        const auto& all = it->second;
        if (static_cast<int>(all.size()) <= count) return all;
        return std::vector<Candle>(all.end() - count, all.end());
    }

    int calls() const { return calls_; }

private:
    std::atomic<int> calls_{0};
};
