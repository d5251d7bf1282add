#include "indicators.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

}

double IndicatorSnapshot::at(const std::vector<double>& series, std::size_t back) {
    if (back >= series.size()) return kNaN;
    return series[series.size() - 1 - back];
}

IndicatorEngine::IndicatorEngine(const IndicatorParams& params) : params_(params) {}

std::size_t IndicatorEngine::required_candles() const {
    int need = std::max({200, params_.ema_trend, params_.ema_slow, params_.bb_period,
                         params_.rsi_period + 1, params_.atr_period + 1,
                         params_.swing_lookback});
    return static_cast<std::size_t>(need);
}

std::vector<double> IndicatorEngine::ema(const std::vector<double>& values, int period) {
    std::vector<double> out(values.size(), kNaN);
    const auto p = static_cast<std::size_t>(period);
    if (period <= 0 || values.size() < p) return out;

    double seed = 0.0;
    for (std::size_t i = 0; i < p; i++) seed += values[i];
    double e = seed / period;
    out[p - 1] = e;

    const double k = 2.0 / (period + 1.0);
    for (std::size_t i = p; i < values.size(); i++) {
        e = values[i] * k + e * (1.0 - k);
        out[i] = e;
    }
    return out;
}

std::vector<double> IndicatorEngine::rsi(const std::vector<double>& closes, int period) {
    std::vector<double> out(closes.size(), kNaN);
    const auto p = static_cast<std::size_t>(period);
    if (period <= 0 || closes.size() <= p) return out;

    auto to_rsi = [](double avg_gain, double avg_loss) {
        if (avg_loss == 0.0) return avg_gain == 0.0 ? 50.0 : 100.0;
        double rs = avg_gain / avg_loss;
        return 100.0 - 100.0 / (1.0 + rs);
    };

    double gain = 0.0, loss = 0.0;
    for (std::size_t i = 1; i <= p; i++) {
        double d = closes[i] - closes[i - 1];
        if (d >= 0) gain += d; else loss -= d;
    }
    double avg_gain = gain / period;
    double avg_loss = loss / period;
    out[p] = to_rsi(avg_gain, avg_loss);

    for (std::size_t i = p + 1; i < closes.size(); i++) {
        double d = closes[i] - closes[i - 1];
        double g = d > 0 ? d : 0.0;
        double l = d < 0 ? -d : 0.0;
        avg_gain = (avg_gain * (period - 1) + g) / period;
        avg_loss = (avg_loss * (period - 1) + l) / period;
        out[i] = to_rsi(avg_gain, avg_loss);
    }
    return out;
}

std::vector<double> IndicatorEngine::atr(const std::vector<Candle>& candles, int period) {
    std::vector<double> out(candles.size(), kNaN);
    const auto p = static_cast<std::size_t>(period);
    if (period <= 0 || candles.size() < p) return out;

    std::vector<double> tr(candles.size());
    tr[0] = candles[0].high - candles[0].low;
    for (std::size_t i = 1; i < candles.size(); i++) {
        double prev_close = candles[i - 1].close;
        tr[i] = std::max({candles[i].high - candles[i].low,
                          std::abs(candles[i].high - prev_close),
                          std::abs(candles[i].low - prev_close)});
    }

    double sum = 0.0;
    for (std::size_t i = 0; i < p; i++) sum += tr[i];
    double a = sum / period;
    out[p - 1] = a;

    for (std::size_t i = p; i < candles.size(); i++) {
        a = (a * (period - 1) + tr[i]) / period;
        out[i] = a;
    }
    return out;
}

void IndicatorEngine::bollinger(const std::vector<double>& closes, int period, double k,
                                std::vector<double>& upper, std::vector<double>& middle,
                                std::vector<double>& lower, std::vector<double>& width) {
    const std::size_t n = closes.size();
    upper.assign(n, kNaN);
    middle.assign(n, kNaN);
    lower.assign(n, kNaN);
    width.assign(n, kNaN);

    const auto p = static_cast<std::size_t>(period);
    if (period <= 0 || n < p) return;

    for (std::size_t i = p - 1; i < n; i++) {
        double mean = 0.0;
        for (std::size_t j = i + 1 - p; j <= i; j++) mean += closes[j];
        mean /= period;

        double var = 0.0;
        for (std::size_t j = i + 1 - p; j <= i; j++) {
            double d = closes[j] - mean;
            var += d * d;
        }
        double sd = std::sqrt(std::max(0.0, var / period));

        middle[i] = mean;
        upper[i] = mean + k * sd;
        lower[i] = mean - k * sd;
        width[i] = mean != 0.0 ? (upper[i] - lower[i]) / mean : kNaN;
    }
}

IndicatorSnapshot IndicatorEngine::compute(const std::vector<Candle>& candles,
                                           const std::string& timeframe) const {
    if (candles.size() < required_candles()) {
        throw InsufficientData(candles.size(), required_candles());
    }

    IndicatorSnapshot snap;
    snap.timeframe = timeframe;

    snap.close.reserve(candles.size());
    for (const auto& c : candles) snap.close.push_back(c.close);

    snap.ema9 = ema(snap.close, params_.ema_fast);
    snap.ema21 = ema(snap.close, params_.ema_medium);
    snap.ema50 = ema(snap.close, params_.ema_slow);
    snap.ema200 = ema(snap.close, params_.ema_trend);
    snap.rsi = rsi(snap.close, params_.rsi_period);
    snap.atr = atr(candles, params_.atr_period);
    bollinger(snap.close, params_.bb_period, params_.bb_stddev,
              snap.bb_upper, snap.bb_middle, snap.bb_lower, snap.bb_width);

    const auto lookback = std::min(candles.size(), static_cast<std::size_t>(params_.swing_lookback));
    snap.swing_high = candles.back().high;
    snap.swing_low = candles.back().low;
    for (std::size_t i = candles.size() - lookback; i < candles.size(); i++) {
        snap.swing_high = std::max(snap.swing_high, candles[i].high);
        snap.swing_low = std::min(snap.swing_low, candles[i].low);
    }

    return snap;
}
