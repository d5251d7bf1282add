#include "risk_sizer.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>

RiskSizer::RiskSizer(const RiskPolicy& policy) : policy_(policy) {}

SizedPosition RiskSizer::size(double entry, const IndicatorSnapshot& entry_series,
                              const RiskProfile& profile) const {
    return size(entry, entry_series.swing_low, entry_series.last_atr(), profile);
}

SizedPosition RiskSizer::size(double entry, double swing_low, double atr,
                              const RiskProfile& profile) const {
    if (std::isnan(entry) || entry <= 0.0) {
        throw DegenerateRisk("entry price must be positive");
    }
    if (std::isnan(atr) || std::isnan(swing_low)) {
        throw DegenerateRisk("missing ATR or swing low");
    }
    if (profile.risk_pct <= 0.0 || profile.risk_pct > policy_.max_risk_pct) {
        throw DegenerateRisk(fmt::format("risk_pct {} outside (0, {}]",
                                         profile.risk_pct, policy_.max_risk_pct));
    }

    SizedPosition pos{};
    pos.entry = entry;

    double distance = std::max(entry - swing_low, policy_.atr_stop_mult * atr);
    pos.stop_loss = entry - distance;
    pos.risk_per_unit = entry - pos.stop_loss;

    if (pos.risk_per_unit <= 0.0) {
        throw DegenerateRisk(fmt::format("non-positive risk per unit {:.6g}", pos.risk_per_unit));
    }

    pos.stop_distance_pct = pos.risk_per_unit / entry * 100.0;
    if (pos.stop_distance_pct < policy_.min_stop_pct || pos.stop_distance_pct > policy_.max_stop_pct) {
        throw DegenerateRisk(fmt::format("stop distance {:.2f}% outside [{}, {}]",
                                         pos.stop_distance_pct,
                                         policy_.min_stop_pct, policy_.max_stop_pct));
    }

    pos.take_profit_1 = entry + policy_.tp1_r * pos.risk_per_unit;
    pos.take_profit_2 = entry + policy_.tp2_r * pos.risk_per_unit;

    pos.risk_amount = policy_.account_equity * profile.risk_pct / 100.0;
    pos.position_size = pos.risk_amount / pos.risk_per_unit;

    return pos;
}
