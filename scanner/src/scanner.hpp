#pragma once

#include "detector.hpp"
#include "lifecycle.hpp"
#include "market_data.hpp"
#include "stores.hpp"
#include "worker_pool.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

struct ScannerSettings {
    int candle_limit = 250;
    int workers = 4;
    int64_t retention_ms = 30 * 24LL * 3600 * 1000;
    int64_t retention_interval_ms = 3600LL * 1000;
    std::string risk_scope = "global";
};

struct CycleSummary {
    int pairs = 0;
    int candidates = 0;
    int admitted = 0;
    int failures = 0;
    int expired = 0;
    int price_transitions = 0;
};

// One scan cycle: refresh pair and risk settings, expire stale signals,
// then evaluate every enabled pair on the worker pool. A pair's failure
// never reaches other pairs.
class Scanner {
public:
    Scanner(MarketDataProvider& market, PairWatchStore& pairs, RiskProfileStore& risk,
            SignalLifecycleManager& lifecycle, const SignalDetector& detector,
            const ScannerSettings& settings = ScannerSettings());

    CycleSummary run_cycle(int64_t now_ms);

    nlohmann::json stats_json() const;

private:
    MarketDataProvider& market_;
    PairWatchStore& pairs_;
    RiskProfileStore& risk_;
    SignalLifecycleManager& lifecycle_;
    const SignalDetector& detector_;
    ScannerSettings settings_;

    mutable std::mutex stats_mutex_;
    int64_t scan_count_ = 0;
    int64_t signals_generated_ = 0;
    int64_t last_scan_ms_ = 0;
    int64_t last_scan_duration_ms_ = 0;
    int64_t last_retention_ms_ = 0;
    std::map<std::string, int64_t> rejections_;

    void scan_pair(const std::string& symbol, const RiskProfile& profile,
                   int64_t now_ms, CycleSummary& summary, std::mutex& summary_mutex);
    void count_rejection(const std::string& reason);
};
