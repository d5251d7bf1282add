#pragma once

#include "indicators.hpp"
#include <string>
#include <stdexcept>
#include <cstdint>

class DegenerateRisk : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct RiskPolicy {
    double account_equity = 10000.0;
    double atr_stop_mult = 1.5;
    double tp1_r = 1.0;
    double tp2_r = 2.0;
    double min_stop_pct = 0.5;
    double max_stop_pct = 10.0;
    double max_risk_pct = 5.0;
};

struct RiskProfile {
    std::string scope = "global";
    double risk_pct = 0.7;               // percent of equity risked per signal
    int max_concurrent_signals = 3;
    int64_t max_hold_ms = 24LL * 3600 * 1000;
    int64_t signal_ttl_ms = 8LL * 3600 * 1000;

    // TTL applied to new signals, never longer than the holding limit
    int64_t effective_ttl_ms() const {
        return signal_ttl_ms < max_hold_ms ? signal_ttl_ms : max_hold_ms;
    }
};

struct SizedPosition {
    double entry;
    double stop_loss;
    double take_profit_1;
    double take_profit_2;
    double risk_per_unit;
    double stop_distance_pct;
    double risk_amount;
    double position_size;

    double reward_risk_tp1() const {
        return risk_per_unit > 0.0 ? (take_profit_1 - entry) / risk_per_unit : 0.0;
    }
};

class RiskSizer {
public:
    explicit RiskSizer(const RiskPolicy& policy = RiskPolicy());

    // Uses the swing low and latest ATR of the entry series.
    // Throws DegenerateRisk when no valid stop can be placed.
    SizedPosition size(double entry, const IndicatorSnapshot& entry_series,
                       const RiskProfile& profile) const;
    SizedPosition size(double entry, double swing_low, double atr,
                       const RiskProfile& profile) const;

    const RiskPolicy& policy() const { return policy_; }

private:
    RiskPolicy policy_;
};
