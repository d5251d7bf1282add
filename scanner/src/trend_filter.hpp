#pragma once

#include "indicators.hpp"
#include <string>

struct TrendPolicy {
    double rsi_low = 45.0;
    double rsi_high = 65.0;
};

struct TrendCheck {
    bool passed;
    bool above_ema200_1h;
    bool above_ema50_15m;
    bool rsi_in_band;
    double ema200_margin_pct;  // (close - EMA200) / EMA200 on the trend series
    double rsi;
    std::string reason;
};

// Long-only gate: 1h close above EMA200, 15m close above EMA50 and 1h RSI
// inside the neutral-bullish band. Any missing value fails the check.
class TrendFilter {
public:
    explicit TrendFilter(const TrendPolicy& policy = TrendPolicy());

    bool passes(const IndicatorSnapshot& trend_1h, const IndicatorSnapshot& entry_15m) const;
    TrendCheck check(const IndicatorSnapshot& trend_1h, const IndicatorSnapshot& entry_15m) const;

    const TrendPolicy& policy() const { return policy_; }

private:
    TrendPolicy policy_;
};
