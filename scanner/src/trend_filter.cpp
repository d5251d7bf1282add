#include "trend_filter.hpp"
#include <cmath>
#include <fmt/format.h>

TrendFilter::TrendFilter(const TrendPolicy& policy) : policy_(policy) {}

bool TrendFilter::passes(const IndicatorSnapshot& trend_1h,
                         const IndicatorSnapshot& entry_15m) const {
    return check(trend_1h, entry_15m).passed;
}

TrendCheck TrendFilter::check(const IndicatorSnapshot& trend_1h,
                              const IndicatorSnapshot& entry_15m) const {
    TrendCheck result{};

    double close_1h = trend_1h.last_close();
    double ema200_1h = trend_1h.last_ema200();
    double close_15m = entry_15m.last_close();
    double ema50_15m = entry_15m.last_ema50();
    result.rsi = trend_1h.last_rsi();

    if (std::isnan(close_1h) || std::isnan(ema200_1h) || std::isnan(close_15m) ||
        std::isnan(ema50_15m) || std::isnan(result.rsi) || ema200_1h <= 0.0) {
        result.passed = false;
        result.reason = "missing indicator";
        return result;
    }

    result.ema200_margin_pct = (close_1h - ema200_1h) / ema200_1h * 100.0;
    result.above_ema200_1h = close_1h > ema200_1h;
    result.above_ema50_15m = close_15m > ema50_15m;
    result.rsi_in_band = result.rsi >= policy_.rsi_low && result.rsi <= policy_.rsi_high;
    result.passed = result.above_ema200_1h && result.above_ema50_15m && result.rsi_in_band;

    if (!result.above_ema200_1h) {
        result.reason = fmt::format("1h close {:.6g} not above EMA200 {:.6g}", close_1h, ema200_1h);
    } else if (!result.above_ema50_15m) {
        result.reason = fmt::format("15m close {:.6g} not above EMA50 {:.6g}", close_15m, ema50_15m);
    } else if (!result.rsi_in_band) {
        result.reason = fmt::format("1h RSI {:.1f} outside [{}, {}]",
                                    result.rsi, policy_.rsi_low, policy_.rsi_high);
    } else {
        result.reason = "trend aligned";
    }

    return result;
}
