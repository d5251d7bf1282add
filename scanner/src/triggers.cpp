#include "triggers.hpp"
#include <algorithm>
#include <cmath>

int TriggerResult::count() const {
    return static_cast<int>(std::count_if(flags.begin(), flags.end(),
                                          [](const auto& kv) { return kv.second; }));
}

bool TriggerResult::fired(const std::string& name) const {
    auto it = flags.find(name);
    return it != flags.end() && it->second;
}

std::vector<std::string> TriggerResult::fired_names() const {
    std::vector<std::string> names;
    for (const auto& [name, on] : flags) {
        if (on) names.push_back(name);
    }
    return names;
}

double prior_average_volume(const std::vector<Candle>& candles, int lookback) {
    const auto n = candles.size();
    const auto l = static_cast<std::size_t>(lookback);
    if (lookback <= 0 || n < l + 1) return 0.0;

    double sum = 0.0;
    for (std::size_t i = n - 1 - l; i < n - 1; i++) sum += candles[i].volume;
    return sum / lookback;
}

bool BreakoutRetestTrigger::fires(const TriggerInput& input) const {
    const auto& c = input.entry.candles;
    const auto n = c.size();
    const auto window = static_cast<std::size_t>(policy_.retest_window);
    const auto lookback = static_cast<std::size_t>(policy_.swing_lookback);
    if (window < 2 || n < window + lookback + 1) return false;

    // Resistance is the swing high formed before the retest window
    double resistance = c[n - window - lookback].high;
    for (std::size_t i = n - window - lookback; i < n - window; i++) {
        resistance = std::max(resistance, c[i].high);
    }

    std::size_t breakout = n;
    for (std::size_t i = n - window; i < n - 1; i++) {
        if (c[i].close > resistance) {
            breakout = i;
            break;
        }
    }
    if (breakout == n) return false;

    const double retest_level = resistance * (1.0 + policy_.retest_tolerance_pct / 100.0);
    bool retested = false;
    for (std::size_t i = breakout + 1; i < n; i++) {
        if (c[i].close < resistance) return false;
        if (c[i].low <= retest_level) retested = true;
    }

    return retested && c[n - 1].close > resistance;
}

bool SqueezeExpansionTrigger::fires(const TriggerInput& input) const {
    const auto& width = input.entry.snapshot.bb_width;
    const auto& c = input.entry.candles;
    const auto n = width.size();
    const auto lookback = static_cast<std::size_t>(policy_.squeeze_lookback);
    if (lookback == 0 || n < lookback + 2 || c.size() != n) return false;

    double current = width[n - 1];
    double previous = width[n - 2];
    if (std::isnan(current) || std::isnan(previous)) return false;

    double sum = 0.0;
    double min_width = width[n - 1 - lookback];
    std::size_t min_idx = n - 1 - lookback;
    for (std::size_t i = n - 1 - lookback; i < n - 1; i++) {
        if (std::isnan(width[i])) return false;
        sum += width[i];
        if (width[i] <= min_width) {
            min_width = width[i];
            min_idx = i;
        }
    }
    double mean_width = sum / lookback;

    const auto recency = static_cast<std::size_t>(std::max(1, policy_.squeeze_recency));
    bool squeezed = min_width <= policy_.squeeze_ratio * mean_width && min_idx + recency >= n - 1;
    bool expanding = current > previous * policy_.expansion_factor;

    double avg_volume = prior_average_volume(c, policy_.volume_lookback);
    bool volume_spike = avg_volume > 0.0 && c[n - 1].volume > policy_.bb_volume_mult * avg_volume;

    return squeezed && expanding && volume_spike;
}

bool EmaCrossoverTrigger::fires(const TriggerInput& input) const {
    const auto& s = input.entry.snapshot;
    double prev9 = IndicatorSnapshot::at(s.ema9, 1);
    double prev21 = IndicatorSnapshot::at(s.ema21, 1);
    double cur9 = s.last_ema9();
    double cur21 = s.last_ema21();
    double cur50 = s.last_ema50();

    if (std::isnan(prev9) || std::isnan(prev21) || std::isnan(cur9) ||
        std::isnan(cur21) || std::isnan(cur50)) {
        return false;
    }

    bool crossed = prev9 <= prev21 && cur9 > cur21;
    bool above_slow = cur9 > cur50 && cur21 > cur50;
    return crossed && above_slow;
}

bool BullishCandleTrigger::is_bullish_engulfing(const Candle& prev, const Candle& cur) {
    return prev.close < prev.open &&
           cur.close > cur.open &&
           cur.open <= prev.close &&
           cur.close > prev.open;
}

bool BullishCandleTrigger::is_hammer(const Candle& cur) {
    double body = std::abs(cur.close - cur.open);
    double lower_wick = std::min(cur.open, cur.close) - cur.low;
    double upper_wick = cur.high - std::max(cur.open, cur.close);
    return lower_wick > 0.0 && lower_wick >= 2.0 * body && upper_wick < body;
}

bool BullishCandleTrigger::fires(const TriggerInput& input) const {
    const auto& c = input.confirmation.candles;
    if (c.size() < 2) return false;

    const Candle& prev = c[c.size() - 2];
    const Candle& cur = c.back();
    if (!is_bullish_engulfing(prev, cur) && !is_hammer(cur)) return false;

    double avg_volume = prior_average_volume(c, policy_.volume_lookback);
    return avg_volume > 0.0 && cur.volume > policy_.candle_volume_mult * avg_volume;
}

EntryTriggerEvaluator EntryTriggerEvaluator::with_default_triggers(const TriggerPolicy& policy) {
    EntryTriggerEvaluator evaluator;
    evaluator.add_trigger(std::make_unique<BreakoutRetestTrigger>(policy));
    evaluator.add_trigger(std::make_unique<SqueezeExpansionTrigger>(policy));
    evaluator.add_trigger(std::make_unique<EmaCrossoverTrigger>());
    evaluator.add_trigger(std::make_unique<BullishCandleTrigger>(policy));
    return evaluator;
}

void EntryTriggerEvaluator::add_trigger(std::unique_ptr<EntryTrigger> trigger) {
    triggers_.push_back(std::move(trigger));
}

TriggerResult EntryTriggerEvaluator::evaluate(const IndicatorSnapshot& snapshot,
                                              const std::vector<Candle>& candles) const {
    SeriesView view{snapshot, candles};
    return evaluate(view, view);
}

TriggerResult EntryTriggerEvaluator::evaluate(const SeriesView& entry,
                                              const SeriesView& confirmation) const {
    TriggerResult result;
    TriggerInput input{entry, confirmation};

    for (const auto& trigger : triggers_) {
        bool on = trigger->fires(input);
        result.flags[trigger->name()] = on;
        if (on) result.rationale.push_back(trigger->description());
    }

    return result;
}
