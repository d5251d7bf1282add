#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/grading.hpp"
#include "../src/risk_sizer.hpp"
#include "../src/triggers.hpp"
#include "series.hpp"
#include <limits>

namespace {

TrendCheck aligned(double margin_pct, double rsi) {
    TrendCheck check{};
    check.passed = true;
    check.above_ema200_1h = true;
    check.above_ema50_15m = true;
    check.rsi_in_band = true;
    check.ema200_margin_pct = margin_pct;
    check.rsi = rsi;
    check.reason = "trend aligned";
    return check;
}

}

TEST_CASE("Long setup on a 2650 entry", "[grading][risk]") {
    const int64_t end = 1700000000000;
    IndicatorSnapshot trend;
    trend.close = {2650};
    trend.ema200 = {2600};
    trend.rsi = {55};

    IndicatorSnapshot entry;
    entry.close = {2640, 2650};
    entry.ema9 = {2640, 2652};
    entry.ema21 = {2645, 2648};
    entry.ema50 = {2600, 2610};
    entry.atr = {24, 25};
    entry.swing_low = 2610;

    auto entry_candles = breakout_15m(2650.0 / 102.4, end);
    auto confirm_candles = engulfing_5m(26.5, end);
    IndicatorSnapshot confirm;

    auto check = TrendFilter().check(trend, entry);
    REQUIRE(check.passed);

    auto evaluator = EntryTriggerEvaluator::with_default_triggers(TriggerPolicy{});
    auto triggers = evaluator.evaluate(SeriesView{entry, entry_candles},
                                       SeriesView{confirm, confirm_candles});
    REQUIRE(triggers.count() == 3);
    REQUIRE(triggers.fired("breakout_retest"));
    REQUIRE(triggers.fired("ema_crossover"));
    REQUIRE(triggers.fired("bullish_candle"));
    REQUIRE_FALSE(triggers.fired("bb_squeeze_expansion"));

    RiskProfile profile;
    auto pos = RiskSizer().size(2650, entry, profile);
    REQUIRE(pos.stop_loss == Catch::Approx(2610));
    REQUIRE(pos.take_profit_1 == Catch::Approx(2690));
    REQUIRE(pos.take_profit_2 == Catch::Approx(2730));
    REQUIRE(pos.stop_distance_pct == Catch::Approx(40.0 / 2650.0 * 100.0));
    REQUIRE(pos.reward_risk_tp1() == Catch::Approx(1.0));

    REQUIRE(SignalGrader().grade(triggers.count(), check, pos.stop_distance_pct) == Grade::A);
}

TEST_CASE("Grade table", "[grading]") {
    SignalGrader grader;
    auto strong = aligned(2.0, 55);
    auto weak_margin = aligned(0.5, 55);
    auto rsi_at_edge = aligned(2.0, 63.5);

    SECTION("Four or more triggers are always A") {
        REQUIRE(grader.grade(4, strong, 1.0) == Grade::A);
        REQUIRE(grader.grade(4, weak_margin, 8.0) == Grade::A);
    }

    SECTION("Three triggers need strong alignment and a tight stop for A") {
        REQUIRE(grader.grade(3, strong, 2.0) == Grade::A);
        REQUIRE(grader.grade(3, strong, 3.5) == Grade::B);
        REQUIRE(grader.grade(3, weak_margin, 2.0) == Grade::B);
        REQUIRE(grader.grade(3, rsi_at_edge, 2.0) == Grade::B);
    }

    SECTION("One or two triggers grade B at best") {
        REQUIRE(grader.grade(2, strong, 2.0) == Grade::B);
        REQUIRE(grader.grade(1, strong, 2.0) == Grade::B);
        REQUIRE(grader.grade(2, weak_margin, 2.0) == Grade::C);
        REQUIRE(grader.grade(2, strong, 3.01) == Grade::C);
    }

    SECTION("Stop width boundary is inclusive") {
        REQUIRE_FALSE(grader.wide_stop(3.0));
        REQUIRE(grader.wide_stop(3.0001));
    }

    SECTION("No triggers cannot be graded") {
        REQUIRE_THROWS_AS(grader.grade(0, strong, 2.0), std::invalid_argument);
    }

    SECTION("Grade names") {
        REQUIRE(grade_to_string(Grade::B) == "B");
        REQUIRE(grade_from_string("C") == Grade::C);
        REQUIRE_THROWS_AS(grade_from_string("D"), std::invalid_argument);
        REQUIRE(grade_description(Grade::A) == "Strong setup");
    }
}

TEST_CASE("Risk sizing", "[risk]") {
    RiskSizer sizer;
    RiskProfile profile;

    SECTION("ATR floor widens a tight structural stop") {
        auto pos = sizer.size(2650, 2630, 25, profile);
        REQUIRE(pos.stop_loss == Catch::Approx(2612.5));
        REQUIRE(pos.risk_per_unit == Catch::Approx(37.5));
        REQUIRE(pos.take_profit_2 == Catch::Approx(2725));
    }

    SECTION("Position size risks the configured share of equity") {
        profile.risk_pct = 1.0;
        auto pos = sizer.size(2650, 2610, 25, profile);
        REQUIRE(pos.risk_amount == Catch::Approx(100.0));
        REQUIRE(pos.position_size == Catch::Approx(2.5));
        REQUIRE(pos.position_size * pos.risk_per_unit == Catch::Approx(pos.risk_amount));
    }

    SECTION("Default profile risks 0.7 percent") {
        auto pos = sizer.size(2650, 2610, 25, profile);
        REQUIRE(pos.risk_amount == Catch::Approx(70.0));
        REQUIRE(pos.position_size == Catch::Approx(1.75));
    }

    SECTION("Degenerate inputs are rejected") {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        REQUIRE_THROWS_AS(sizer.size(2650, 2610, nan, profile), DegenerateRisk);
        REQUIRE_THROWS_AS(sizer.size(2650, nan, 25, profile), DegenerateRisk);
        REQUIRE_THROWS_AS(sizer.size(0, 2610, 25, profile), DegenerateRisk);
        // Swing low above entry and no volatility: no room for a stop
        REQUIRE_THROWS_AS(sizer.size(100, 105, 0, profile), DegenerateRisk);
        // 0.15% stop is too tight, 20% too wide
        REQUIRE_THROWS_AS(sizer.size(100, 99.9, 0.1, profile), DegenerateRisk);
        REQUIRE_THROWS_AS(sizer.size(100, 80, 1, profile), DegenerateRisk);
    }

    SECTION("Risk percentage must be in (0, 5]") {
        profile.risk_pct = 0.0;
        REQUIRE_THROWS_AS(sizer.size(2650, 2610, 25, profile), DegenerateRisk);
        profile.risk_pct = 5.5;
        REQUIRE_THROWS_AS(sizer.size(2650, 2610, 25, profile), DegenerateRisk);
        profile.risk_pct = 5.0;
        REQUIRE_NOTHROW(sizer.size(2650, 2610, 25, profile));
    }

    SECTION("TTL never exceeds the holding limit") {
        profile.signal_ttl_ms = 8 * util::kHourMs;
        profile.max_hold_ms = 4 * util::kHourMs;
        REQUIRE(profile.effective_ttl_ms() == 4 * util::kHourMs);
        profile.max_hold_ms = 24 * util::kHourMs;
        REQUIRE(profile.effective_ttl_ms() == 8 * util::kHourMs);
    }
}
