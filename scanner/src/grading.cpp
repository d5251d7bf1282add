#include "grading.hpp"
#include <cmath>
#include <stdexcept>

std::string grade_to_string(Grade grade) {
    switch (grade) {
        case Grade::A: return "A";
        case Grade::B: return "B";
        default: return "C";
    }
}

Grade grade_from_string(const std::string& s) {
    if (s == "A") return Grade::A;
    if (s == "B") return Grade::B;
    if (s == "C") return Grade::C;
    throw std::invalid_argument("unknown grade: " + s);
}

std::string grade_description(Grade grade) {
    switch (grade) {
        case Grade::A: return "Strong setup";
        case Grade::B: return "Good setup";
        default: return "Moderate setup";
    }
}

SignalGrader::SignalGrader(const GradingPolicy& policy) : policy_(policy) {}

bool SignalGrader::strong_alignment(const TrendCheck& trend) const {
    if (!trend.passed || std::isnan(trend.ema200_margin_pct) || std::isnan(trend.rsi)) {
        return false;
    }
    return trend.ema200_margin_pct >= policy_.strong_ema200_margin_pct &&
           trend.rsi >= policy_.rsi_low + policy_.strong_rsi_margin &&
           trend.rsi <= policy_.rsi_high - policy_.strong_rsi_margin;
}

bool SignalGrader::wide_stop(double stop_distance_pct) const {
    return stop_distance_pct > policy_.wide_stop_pct;
}

Grade SignalGrader::grade(int trigger_count, const TrendCheck& trend,
                          double stop_distance_pct) const {
    if (trigger_count < 1) {
        throw std::invalid_argument("cannot grade a candidate without triggers");
    }
    if (trigger_count >= 4) return Grade::A;

    bool strong = strong_alignment(trend) && !wide_stop(stop_distance_pct);
    if (trigger_count == 3) return strong ? Grade::A : Grade::B;
    return strong ? Grade::B : Grade::C;
}
