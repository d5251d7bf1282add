#pragma once

#include "market_data.hpp"
#include <string>
#include <vector>
#include <cstddef>
#include <stdexcept>

class InsufficientData : public std::runtime_error {
public:
    InsufficientData(std::size_t have, std::size_t need)
        : std::runtime_error("insufficient candles: have " + std::to_string(have) +
                             ", need " + std::to_string(need))
        , have_(have), need_(need) {}

    std::size_t have() const { return have_; }
    std::size_t need() const { return need_; }

private:
    std::size_t have_;
    std::size_t need_;
};

struct IndicatorParams {
    int ema_fast = 9;
    int ema_medium = 21;
    int ema_slow = 50;
    int ema_trend = 200;
    int rsi_period = 14;
    int bb_period = 20;
    double bb_stddev = 2.0;
    int atr_period = 14;
    int swing_lookback = 20;
};

// Indicator series aligned index-for-index with the candle window they were
// computed from. Positions before an indicator's warmup hold NaN.
struct IndicatorSnapshot {
    std::string timeframe;

    std::vector<double> close;
    std::vector<double> ema9;
    std::vector<double> ema21;
    std::vector<double> ema50;
    std::vector<double> ema200;
    std::vector<double> rsi;
    std::vector<double> bb_upper;
    std::vector<double> bb_middle;
    std::vector<double> bb_lower;
    std::vector<double> bb_width;
    std::vector<double> atr;

    double swing_high;
    double swing_low;

    std::size_t size() const { return close.size(); }

    // Value `back` positions before the latest one, NaN when out of range
    static double at(const std::vector<double>& series, std::size_t back = 0);

    double last_close() const { return at(close); }
    double last_ema9() const { return at(ema9); }
    double last_ema21() const { return at(ema21); }
    double last_ema50() const { return at(ema50); }
    double last_ema200() const { return at(ema200); }
    double last_rsi() const { return at(rsi); }
    double last_atr() const { return at(atr); }
};

class IndicatorEngine {
public:
    explicit IndicatorEngine(const IndicatorParams& params = IndicatorParams());

    // Throws InsufficientData when the window is shorter than required_candles()
    IndicatorSnapshot compute(const std::vector<Candle>& candles,
                              const std::string& timeframe) const;

    std::size_t required_candles() const;
    const IndicatorParams& params() const { return params_; }

    // SMA-seeded exponential moving average
    static std::vector<double> ema(const std::vector<double>& values, int period);
    // Wilder RSI seeded from the mean gain/loss of the first `period` changes
    static std::vector<double> rsi(const std::vector<double>& closes, int period);
    // Wilder ATR seeded from the mean true range of the first `period` bars
    static std::vector<double> atr(const std::vector<Candle>& candles, int period);
    static void bollinger(const std::vector<double>& closes, int period, double k,
                          std::vector<double>& upper, std::vector<double>& middle,
                          std::vector<double>& lower, std::vector<double>& width);

private:
    IndicatorParams params_;
};
