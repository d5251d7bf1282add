#include "scanner.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

Scanner::Scanner(MarketDataProvider& market, PairWatchStore& pairs, RiskProfileStore& risk,
                 SignalLifecycleManager& lifecycle, const SignalDetector& detector,
                 const ScannerSettings& settings)
    : market_(market)
    , pairs_(pairs)
    , risk_(risk)
    , lifecycle_(lifecycle)
    , detector_(detector)
    , settings_(settings) {}

void Scanner::count_rejection(const std::string& reason) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    rejections_[reason]++;
}

void Scanner::scan_pair(const std::string& symbol, const RiskProfile& profile,
                        int64_t now_ms, CycleSummary& summary, std::mutex& summary_mutex) {
    const auto& policy = detector_.policy();

    try {
        if (lifecycle_.has_open(symbol)) {
            auto candles = market_.get_candles(symbol, policy.entry_timeframe, settings_.candle_limit);
            auto steps = lifecycle_.on_price(symbol, candles, now_ms);

            std::lock_guard<std::mutex> lock(summary_mutex);
            summary.price_transitions += static_cast<int>(steps.size());
            return;
        }

        PairSeries series;
        series.symbol = symbol;
        series.trend = market_.get_candles(symbol, policy.trend_timeframe, settings_.candle_limit);
        series.entry = market_.get_candles(symbol, policy.entry_timeframe, settings_.candle_limit);
        series.confirmation = market_.get_candles(symbol, policy.confirmation_timeframe,
                                                  settings_.candle_limit);

        auto outcome = detector_.detect(series, profile);
        if (!outcome.candidate) {
            count_rejection(rejection_to_string(outcome.rejection));
            return;
        }

        {
            std::lock_guard<std::mutex> lock(summary_mutex);
            summary.candidates++;
        }

        auto result = lifecycle_.admit(*outcome.candidate, profile, now_ms);
        if (!result.admitted) {
            count_rejection("admission_" + admission_reason_to_string(result.reason));
            return;
        }

        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            signals_generated_++;
        }
        std::lock_guard<std::mutex> lock(summary_mutex);
        summary.admitted++;

    } catch (const MarketDataError& e) {
        spdlog::warn("{} market data {}: {}", symbol, e.kind_string(), e.what());
        count_rejection("market_data_" + e.kind_string());
        std::lock_guard<std::mutex> lock(summary_mutex);
        summary.failures++;
    } catch (const std::exception& e) {
        spdlog::error("{} scan failed: {}", symbol, e.what());
        count_rejection("error");
        std::lock_guard<std::mutex> lock(summary_mutex);
        summary.failures++;
    }
}

CycleSummary Scanner::run_cycle(int64_t now_ms) {
    const int64_t started = util::current_timestamp_ms();
    CycleSummary summary;

    auto symbols = pairs_.list_enabled_pairs();
    RiskProfile profile = risk_.get_risk_profile(settings_.risk_scope);
    lifecycle_.set_enabled_pairs(symbols);

    summary.pairs = static_cast<int>(symbols.size());
    try {
        summary.expired = lifecycle_.sweep_expired(now_ms);
    } catch (const PersistenceFailure& e) {
        spdlog::error("Expiry sweep failed, retrying next cycle: {}", e.what());
        count_rejection("expiry_sweep_failed");
    }

    std::mutex summary_mutex;
    worker_pool<std::string> pool(
        static_cast<std::size_t>(settings_.workers),
        [&](std::string&& symbol) { scan_pair(symbol, profile, now_ms, summary, summary_mutex); });
    pool.run(symbols);

    bool retention_due = false;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        if (now_ms - last_retention_ms_ >= settings_.retention_interval_ms) {
            last_retention_ms_ = now_ms;
            retention_due = true;
        }
    }
    if (retention_due) {
        try {
            lifecycle_.sweep_retention(settings_.retention_ms, now_ms);
        } catch (const PersistenceFailure& e) {
            spdlog::error("Retention sweep failed: {}", e.what());
            std::lock_guard<std::mutex> lock(stats_mutex_);
            last_retention_ms_ = 0;
        }
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        scan_count_++;
        last_scan_ms_ = now_ms;
        last_scan_duration_ms_ = util::current_timestamp_ms() - started;
    }

    spdlog::info("Scan cycle: {} pairs, {} candidates, {} admitted, {} expired, {} failures",
                 summary.pairs, summary.candidates, summary.admitted, summary.expired,
                 summary.failures);
    return summary;
}

nlohmann::json Scanner::stats_json() const {
    auto open = lifecycle_.open_signals();

    nlohmann::json grades = {{"A", 0}, {"B", 0}, {"C", 0}};
    for (const auto& signal : open) {
        grades[grade_to_string(signal.grade)] = grades[grade_to_string(signal.grade)].get<int>() + 1;
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    return {
        {"scan_count", scan_count_},
        {"signals_generated", signals_generated_},
        {"last_scan", last_scan_ms_ > 0 ? nlohmann::json(util::to_iso8601(last_scan_ms_))
                                        : nlohmann::json(nullptr)},
        {"last_scan_duration_ms", last_scan_duration_ms_},
        {"open_signals", open.size()},
        {"muted", lifecycle_.muted()},
        {"grades", grades},
        {"rejections", rejections_}
    };
}
