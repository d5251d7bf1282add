#pragma once

#include "trend_filter.hpp"
#include <string>

enum class Grade {
    A,
    B,
    C
};

std::string grade_to_string(Grade grade);
Grade grade_from_string(const std::string& s);
// Human label used as the rationale prefix
std::string grade_description(Grade grade);

// Rule table:
//   triggers | strong & not wide | otherwise
//   4+       | A                 | A
//   3        | A                 | B
//   2 or 1   | B                 | C
struct GradingPolicy {
    double strong_ema200_margin_pct = 1.0;
    double strong_rsi_margin = 3.0;
    double wide_stop_pct = 3.0;
    double rsi_low = 45.0;
    double rsi_high = 65.0;
};

class SignalGrader {
public:
    explicit SignalGrader(const GradingPolicy& policy = GradingPolicy());

    // Throws std::invalid_argument when trigger_count < 1
    Grade grade(int trigger_count, const TrendCheck& trend, double stop_distance_pct) const;

    bool strong_alignment(const TrendCheck& trend) const;
    bool wide_stop(double stop_distance_pct) const;

    const GradingPolicy& policy() const { return policy_; }

private:
    GradingPolicy policy_;
};
