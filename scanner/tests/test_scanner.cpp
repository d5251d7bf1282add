#include <catch2/catch_test_macros.hpp>
#include "../src/scanner.hpp"
#include "fakes.hpp"
#include "series.hpp"

namespace {

const int64_t kEnd = 1700000000000;

void load_series(FakeMarketData& market, const PairSeries& series) {
    market.set(series.symbol, "1h", series.trend);
    market.set(series.symbol, "15m", series.entry);
    market.set(series.symbol, "5m", series.confirmation);
}

}

TEST_CASE("Scan cycle isolates pair failures", "[scanner]") {
    FakeMarketData market;
    FakePairWatchStore pairs({"GOODUSDT", "SLOWUSDT", "CRASHUSDT", "SHORTUSDT"});
    FakeRiskProfileStore risk;
    FakeSignalStore store;
    FakeNotifier notifier;
    SignalLifecycleManager lifecycle(store, notifier);
    SignalDetector detector;

    load_series(market, qualifying_series("GOODUSDT", 1.0, kEnd));
    market.failing["SLOWUSDT"] = MarketDataError::Kind::Timeout;
    market.crashing.insert("CRASHUSDT");

    auto short_series = qualifying_series("SHORTUSDT", 1.0, kEnd);
    short_series.entry.erase(short_series.entry.begin(), short_series.entry.begin() + 100);
    load_series(market, short_series);

    ScannerSettings settings;
    settings.workers = 3;
    Scanner scanner(market, pairs, risk, lifecycle, detector, settings);

    auto summary = scanner.run_cycle(kEnd);
    REQUIRE(summary.pairs == 4);
    REQUIRE(summary.candidates == 1);
    REQUIRE(summary.admitted == 1);
    REQUIRE(summary.failures == 2);

    REQUIRE(lifecycle.has_open("GOODUSDT"));
    REQUIRE(store.size() == 1);
    REQUIRE(notifier.count() == 1);

    auto stats = scanner.stats_json();
    REQUIRE(stats["scan_count"] == 1);
    REQUIRE(stats["signals_generated"] == 1);
    REQUIRE(stats["open_signals"] == 1);
    REQUIRE(stats["rejections"]["market_data_timeout"] == 1);
    REQUIRE(stats["rejections"]["error"] == 1);
    REQUIRE(stats["rejections"]["insufficient_data"] == 1);
    REQUIRE(stats["last_scan"].is_string());

    SECTION("Next cycle tracks the open signal instead of duplicating it") {
        auto second = scanner.run_cycle(kEnd + 60000);
        REQUIRE(second.admitted == 0);
        REQUIRE(second.price_transitions == 0);
        REQUIRE(store.size() == 1);
        REQUIRE(store.creates() == 1);
        REQUIRE(scanner.stats_json()["scan_count"] == 2);
    }

    SECTION("Disabled pairs are not scanned") {
        pairs.set_pair_enabled("GOODUSDT", false);
        auto second = scanner.run_cycle(kEnd + 60000);
        REQUIRE(second.pairs == 3);
    }

    SECTION("Expired signals are swept at the start of a cycle") {
        auto later = scanner.run_cycle(kEnd + 9 * util::kHourMs);
        REQUIRE(later.expired == 1);
        REQUIRE(store.get(1)->status == SignalStatus::Expired);
    }
}

TEST_CASE("Failed expiry sweep does not stop pair evaluation", "[scanner]") {
    FakeMarketData market;
    FakePairWatchStore pairs({"GOODUSDT", "OLDUSDT"});
    FakeRiskProfileStore risk;
    FakeSignalStore store;
    FakeNotifier notifier;

    Signal stale;
    stale.id = 1;
    stale.symbol = "OLDUSDT";
    stale.timeframe = "15m";
    stale.entry_price = 100.0;
    stale.stop_loss = 97.0;
    stale.take_profit_1 = 103.0;
    stale.take_profit_2 = 106.0;
    stale.created_at_ms = kEnd - 10 * util::kHourMs;
    stale.updated_at_ms = stale.created_at_ms;
    stale.expires_at_ms = kEnd - 2 * util::kHourMs;
    store.insert(stale);

    SignalLifecycleManager lifecycle(store, notifier);
    REQUIRE(lifecycle.load(kEnd) == 1);

    SignalDetector detector;
    load_series(market, qualifying_series("GOODUSDT", 1.0, kEnd));
    Scanner scanner(market, pairs, risk, lifecycle, detector);

    SECTION("Store rejects every status write") {
        store.updates_until_failure = 0;

        for (int cycle = 0; cycle < 2; cycle++) {
            auto summary = scanner.run_cycle(kEnd + cycle * 60000);
            REQUIRE(summary.expired == 0);
        }

        REQUIRE(lifecycle.has_open("GOODUSDT"));
        REQUIRE(lifecycle.has_open("OLDUSDT"));
        REQUIRE(store.creates() == 1);
        REQUIRE(scanner.stats_json()["rejections"]["expiry_sweep_failed"] == 2);
        REQUIRE(scanner.stats_json()["scan_count"] == 2);
    }

    SECTION("Record vanished from the store") {
        store.erase(1);

        auto summary = scanner.run_cycle(kEnd);
        REQUIRE(summary.admitted == 1);
        REQUIRE(lifecycle.has_open("GOODUSDT"));
        REQUIRE_FALSE(lifecycle.has_open("OLDUSDT"));
        REQUIRE(lifecycle.open_count() == 1);

        auto next = scanner.run_cycle(kEnd + 60000);
        REQUIRE(next.expired == 0);
        REQUIRE_FALSE(scanner.stats_json()["rejections"].contains("expiry_sweep_failed"));
    }
}

TEST_CASE("Scan cycle respects global mute", "[scanner]") {
    FakeMarketData market;
    FakePairWatchStore pairs({"GOODUSDT"});
    FakeRiskProfileStore risk;
    FakeSignalStore store;
    FakeNotifier notifier;
    SignalLifecycleManager lifecycle(store, notifier);
    SignalDetector detector;
    load_series(market, qualifying_series("GOODUSDT", 1.0, kEnd));

    Scanner scanner(market, pairs, risk, lifecycle, detector);
    lifecycle.set_muted(true);

    auto summary = scanner.run_cycle(kEnd);
    REQUIRE(summary.candidates == 1);
    REQUIRE(summary.admitted == 0);
    REQUIRE(store.size() == 0);
    REQUIRE(scanner.stats_json()["rejections"]["admission_muted"] == 1);
    REQUIRE(scanner.stats_json()["muted"] == true);
}

TEST_CASE("Open signal follows price on later cycles", "[scanner]") {
    FakeMarketData market;
    FakePairWatchStore pairs({"GOODUSDT"});
    FakeRiskProfileStore risk;
    FakeSignalStore store;
    FakeNotifier notifier;
    SignalLifecycleManager lifecycle(store, notifier);
    SignalDetector detector;

    auto series = qualifying_series("GOODUSDT", 1.0, kEnd);
    load_series(market, series);

    Scanner scanner(market, pairs, risk, lifecycle, detector);
    REQUIRE(scanner.run_cycle(kEnd).admitted == 1);

    // Two new 15m bars: dip to the entry, then the stop
    const int64_t tf = 15 * util::kMinuteMs;
    series.entry.push_back(bar(kEnd, 102.4, 102.5, 102.3, 102.4, 100));
    series.entry.push_back(bar(kEnd + tf, 102.4, 102.6, 99.0, 99.2, 300));
    market.set("GOODUSDT", "15m", series.entry);

    auto summary = scanner.run_cycle(kEnd + 2 * tf);
    REQUIRE(summary.price_transitions == 2);
    REQUIRE_FALSE(lifecycle.has_open("GOODUSDT"));
    REQUIRE(store.get(1)->close_reason == "stop_loss");
}
