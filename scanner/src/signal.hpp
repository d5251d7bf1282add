#pragma once

#include "grading.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <cstdint>

enum class SignalStatus {
    Pending,
    Active,
    Triggered,
    Expired,
    Cancelled
};

std::string status_to_string(SignalStatus status);
SignalStatus status_from_string(const std::string& s);

bool is_terminal(SignalStatus status);
// Transitions are one-way: Pending -> Active -> {Triggered, Expired, Cancelled},
// and Pending may also go straight to any terminal state.
bool can_transition(SignalStatus from, SignalStatus to);

// stop_loss < entry < tp1 < tp2
bool levels_ordered(double stop_loss, double entry, double tp1, double tp2);

// Qualified detection output, not yet admitted
struct SignalCandidate {
    std::string symbol;
    std::string timeframe;
    double entry_price;
    double stop_loss;
    double take_profit_1;
    double take_profit_2;
    Grade grade;
    double risk_pct;
    double position_size;
    std::string rationale;
    std::vector<std::string> triggers;

    bool levels_ordered() const {
        return ::levels_ordered(stop_loss, entry_price, take_profit_1, take_profit_2);
    }
};

struct Signal {
    int64_t id = 0;
    std::string symbol;
    std::string timeframe;
    double entry_price = 0.0;
    double stop_loss = 0.0;
    double take_profit_1 = 0.0;
    double take_profit_2 = 0.0;
    Grade grade = Grade::C;
    double risk_pct = 0.0;
    double position_size = 0.0;
    std::string rationale;
    SignalStatus status = SignalStatus::Pending;
    std::string close_reason;
    int64_t expires_at_ms = 0;
    int64_t triggered_at_ms = 0;
    int64_t created_at_ms = 0;
    int64_t updated_at_ms = 0;

    bool is_open() const { return !is_terminal(status); }
    bool levels_ordered() const {
        return ::levels_ordered(stop_loss, entry_price, take_profit_1, take_profit_2);
    }
    // symbol:timeframe:created_at
    std::string key() const;

    nlohmann::json to_json() const;

    static Signal from_candidate(const SignalCandidate& candidate, int64_t now_ms, int64_t ttl_ms);
};
