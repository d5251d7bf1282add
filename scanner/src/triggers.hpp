#pragma once

#include "indicators.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

struct TriggerPolicy {
    // Breakout & retest
    int swing_lookback = 20;
    int retest_window = 10;
    double retest_tolerance_pct = 0.5;

    // Bollinger squeeze -> expansion
    int squeeze_lookback = 20;
    int squeeze_recency = 5;
    double squeeze_ratio = 0.85;
    double expansion_factor = 1.1;
    double bb_volume_mult = 1.2;

    // Candle pattern
    double candle_volume_mult = 1.1;

    int volume_lookback = 20;
    int min_triggers = 2;
};

// A candle window together with the indicators computed over it
struct SeriesView {
    const IndicatorSnapshot& snapshot;
    const std::vector<Candle>& candles;
};

struct TriggerInput {
    SeriesView entry;         // 15m: breakout, squeeze, crossover
    SeriesView confirmation;  // 5m: candle pattern
};

struct TriggerResult {
    std::map<std::string, bool> flags;
    std::vector<std::string> rationale;

    int count() const;
    bool fired(const std::string& name) const;
    std::vector<std::string> fired_names() const;

    bool operator==(const TriggerResult& other) const {
        return flags == other.flags && rationale == other.rationale;
    }
};

// One independent entry condition. New conditions are added by deriving from
// this and registering the instance with EntryTriggerEvaluator::add_trigger.
class EntryTrigger {
public:
    virtual ~EntryTrigger() = default;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    virtual bool fires(const TriggerInput& input) const = 0;
};

class BreakoutRetestTrigger final : public EntryTrigger {
public:
    explicit BreakoutRetestTrigger(const TriggerPolicy& policy) : policy_(policy) {}
    std::string name() const override { return "breakout_retest"; }
    std::string description() const override { return "Breakout & retest of resistance"; }
    bool fires(const TriggerInput& input) const override;

private:
    TriggerPolicy policy_;
};

class SqueezeExpansionTrigger final : public EntryTrigger {
public:
    explicit SqueezeExpansionTrigger(const TriggerPolicy& policy) : policy_(policy) {}
    std::string name() const override { return "bb_squeeze_expansion"; }
    std::string description() const override { return "BB squeeze expansion + volume"; }
    bool fires(const TriggerInput& input) const override;

private:
    TriggerPolicy policy_;
};

class EmaCrossoverTrigger final : public EntryTrigger {
public:
    std::string name() const override { return "ema_crossover"; }
    std::string description() const override { return "EMA9/21 crossover above EMA50"; }
    bool fires(const TriggerInput& input) const override;
};

class BullishCandleTrigger final : public EntryTrigger {
public:
    explicit BullishCandleTrigger(const TriggerPolicy& policy) : policy_(policy) {}
    std::string name() const override { return "bullish_candle"; }
    std::string description() const override { return "Bullish candle + volume"; }
    bool fires(const TriggerInput& input) const override;

    static bool is_bullish_engulfing(const Candle& prev, const Candle& cur);
    static bool is_hammer(const Candle& cur);

private:
    TriggerPolicy policy_;
};

class EntryTriggerEvaluator {
public:
    EntryTriggerEvaluator() = default;

    static EntryTriggerEvaluator with_default_triggers(const TriggerPolicy& policy);

    void add_trigger(std::unique_ptr<EntryTrigger> trigger);
    std::size_t trigger_count() const { return triggers_.size(); }

    // Single-series form: every trigger reads the same window
    TriggerResult evaluate(const IndicatorSnapshot& snapshot,
                           const std::vector<Candle>& candles) const;
    TriggerResult evaluate(const SeriesView& entry, const SeriesView& confirmation) const;

private:
    std::vector<std::unique_ptr<EntryTrigger>> triggers_;
};

// Mean volume of the `lookback` bars preceding the last one, 0 if too short
double prior_average_volume(const std::vector<Candle>& candles, int lookback);
