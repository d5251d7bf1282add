#pragma once

#include "../src/detector.hpp"
#include "../src/util.hpp"
#include <algorithm>
#include <vector>

// Deterministic candle windows. Every window has 250 closed bars, the last
// one opening a full period before end_ms.

inline Candle bar(int64_t ts, double o, double h, double l, double c, double v) {
    Candle candle;
    candle.open = o;
    candle.high = h;
    candle.low = l;
    candle.close = c;
    candle.volume = v;
    candle.timestamp_ms = ts;
    return candle;
}

inline int64_t bar_time(int i, int n, int64_t tf_ms, int64_t end_ms) {
    return end_ms - static_cast<int64_t>(n - i) * tf_ms;
}

inline std::vector<Candle> flat_series(int n, double price, int64_t tf_ms, int64_t end_ms) {
    std::vector<Candle> out;
    for (int i = 0; i < n; i++) {
        out.push_back(bar(bar_time(i, n, tf_ms, end_ms), price, price * 1.005, price * 0.995, price, 100));
    }
    return out;
}

// Rising 1h series with alternating +1.0 / -0.8 moves: close well above
// EMA200, RSI settles near 57
inline std::vector<Candle> uptrend_1h(double s, int64_t end_ms) {
    const int n = 250;
    const int64_t tf = util::kHourMs;
    std::vector<Candle> out;
    double prev = 100.0 * s;
    for (int i = 0; i < n; i++) {
        double close = (100.0 + 0.1 * i + (i % 2) * 0.9) * s;
        double open = i == 0 ? close : prev;
        out.push_back(bar(bar_time(i, n, tf, end_ms), open,
                          std::max(open, close) + 0.2 * s, std::min(open, close) - 0.2 * s,
                          close, 100));
        prev = close;
    }
    return out;
}

// Falling mirror of uptrend_1h
inline std::vector<Candle> downtrend_1h(double s, int64_t end_ms) {
    const int n = 250;
    const int64_t tf = util::kHourMs;
    std::vector<Candle> out;
    double prev = 200.0 * s;
    for (int i = 0; i < n; i++) {
        double close = (200.0 - 0.1 * i - (i % 2) * 0.9) * s;
        double open = i == 0 ? close : prev;
        out.push_back(bar(bar_time(i, n, tf, end_ms), open,
                          std::max(open, close) + 0.2 * s, std::min(open, close) - 0.2 * s,
                          close, 100));
        prev = close;
    }
    return out;
}

// Flat at 100 (resistance 100.5), breakout at bar 240, retest at 242,
// then a steady climb to 102.4. depth sets how far the flat bars dip,
// upper_wick how far the climbing bars spike above their close.
inline std::vector<Candle> breakout_15m(double s, int64_t end_ms,
                                        double depth = 0.5, double upper_wick = 0.2) {
    const int n = 250;
    const int64_t tf = 15 * util::kMinuteMs;
    std::vector<Candle> out;
    for (int i = 0; i < 240; i++) {
        out.push_back(bar(bar_time(i, n, tf, end_ms), 100.0 * s, 100.5 * s, (100.0 - depth) * s,
                          100.0 * s, 100));
    }
    out.push_back(bar(bar_time(240, n, tf, end_ms), 100.0 * s, 101.8 * s, 99.9 * s, 101.5 * s, 180));
    out.push_back(bar(bar_time(241, n, tf, end_ms), 101.5 * s, 102.0 * s, 101.2 * s, 101.8 * s, 120));
    out.push_back(bar(bar_time(242, n, tf, end_ms), 101.8 * s, 101.9 * s, 100.6 * s, 101.0 * s, 110));

    double prev = 101.0;
    for (int i = 243; i < n; i++) {
        double close = prev + 0.2;
        out.push_back(bar(bar_time(i, n, tf, end_ms), prev * s, (close + upper_wick) * s,
                          (close - 0.3) * s, close * s, 100));
        prev = close;
    }
    return out;
}

// Flat at 100 ending in a red bar engulfed by a green bar on double volume
inline std::vector<Candle> engulfing_5m(double s, int64_t end_ms) {
    const int n = 250;
    const int64_t tf = 5 * util::kMinuteMs;
    std::vector<Candle> out;
    for (int i = 0; i < n - 2; i++) {
        out.push_back(bar(bar_time(i, n, tf, end_ms), 100.0 * s, 100.5 * s, 99.5 * s, 100.0 * s, 100));
    }
    out.push_back(bar(bar_time(n - 2, n, tf, end_ms), 100.2 * s, 100.3 * s, 99.7 * s, 99.8 * s, 100));
    out.push_back(bar(bar_time(n - 1, n, tf, end_ms), 99.7 * s, 100.7 * s, 99.6 * s, 100.6 * s, 200));
    return out;
}

// Passes the trend filter with breakout-retest and bullish-candle triggers
inline PairSeries qualifying_series(const std::string& symbol, double s, int64_t end_ms) {
    PairSeries series;
    series.symbol = symbol;
    series.trend = uptrend_1h(s, end_ms);
    series.entry = breakout_15m(s, end_ms);
    series.confirmation = engulfing_5m(s, end_ms);
    return series;
}
