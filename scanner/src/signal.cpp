#include "signal.hpp"
#include "util.hpp"
#include <stdexcept>

std::string status_to_string(SignalStatus status) {
    switch (status) {
        case SignalStatus::Pending: return "pending";
        case SignalStatus::Active: return "active";
        case SignalStatus::Triggered: return "triggered";
        case SignalStatus::Expired: return "expired";
        case SignalStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

SignalStatus status_from_string(const std::string& s) {
    if (s == "pending") return SignalStatus::Pending;
    if (s == "active") return SignalStatus::Active;
    if (s == "triggered") return SignalStatus::Triggered;
    if (s == "expired") return SignalStatus::Expired;
    if (s == "cancelled") return SignalStatus::Cancelled;
    throw std::invalid_argument("unknown signal status: " + s);
}

bool is_terminal(SignalStatus status) {
    return status == SignalStatus::Triggered ||
           status == SignalStatus::Expired ||
           status == SignalStatus::Cancelled;
}

bool can_transition(SignalStatus from, SignalStatus to) {
    if (is_terminal(from) || from == to) return false;
    if (to == SignalStatus::Pending) return false;
    if (to == SignalStatus::Active) return from == SignalStatus::Pending;
    return true;
}

bool levels_ordered(double stop_loss, double entry, double tp1, double tp2) {
    return stop_loss > 0.0 && stop_loss < entry && entry < tp1 && tp1 < tp2;
}

std::string Signal::key() const {
    return symbol + ":" + timeframe + ":" + std::to_string(created_at_ms);
}

nlohmann::json Signal::to_json() const {
    nlohmann::json j = {
        {"id", id},
        {"symbol", symbol},
        {"timeframe", timeframe},
        {"entry_price", entry_price},
        {"stop_loss", stop_loss},
        {"take_profit_1", take_profit_1},
        {"take_profit_2", take_profit_2},
        {"grade", grade_to_string(grade)},
        {"risk_pct", risk_pct},
        {"position_size", position_size},
        {"rationale", rationale},
        {"status", status_to_string(status)},
        {"expires_at", util::to_iso8601(expires_at_ms)},
        {"created_at", util::to_iso8601(created_at_ms)},
        {"updated_at", util::to_iso8601(updated_at_ms)}
    };

    j["close_reason"] = close_reason.empty() ? nlohmann::json(nullptr) : nlohmann::json(close_reason);
    j["triggered_at"] = triggered_at_ms > 0 ? nlohmann::json(util::to_iso8601(triggered_at_ms))
                                            : nlohmann::json(nullptr);
    return j;
}

Signal Signal::from_candidate(const SignalCandidate& candidate, int64_t now_ms, int64_t ttl_ms) {
    Signal s;
    s.symbol = candidate.symbol;
    s.timeframe = candidate.timeframe;
    s.entry_price = candidate.entry_price;
    s.stop_loss = candidate.stop_loss;
    s.take_profit_1 = candidate.take_profit_1;
    s.take_profit_2 = candidate.take_profit_2;
    s.grade = candidate.grade;
    s.risk_pct = candidate.risk_pct;
    s.position_size = candidate.position_size;
    s.rationale = candidate.rationale;
    s.status = SignalStatus::Pending;
    s.created_at_ms = now_ms;
    s.updated_at_ms = now_ms;
    s.expires_at_ms = now_ms + ttl_ms;
    return s;
}
