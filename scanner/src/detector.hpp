#pragma once

#include "indicators.hpp"
#include "trend_filter.hpp"
#include "triggers.hpp"
#include "grading.hpp"
#include "risk_sizer.hpp"
#include "signal.hpp"
#include <optional>
#include <string>
#include <vector>

struct DetectorPolicy {
    IndicatorParams indicators;
    TrendPolicy trend;
    TriggerPolicy triggers;
    GradingPolicy grading;
    RiskPolicy risk;
    std::string trend_timeframe = "1h";
    std::string entry_timeframe = "15m";
    std::string confirmation_timeframe = "5m";
};

// Candle windows of one pair for a single scan cycle
struct PairSeries {
    std::string symbol;
    std::vector<Candle> trend;
    std::vector<Candle> entry;
    std::vector<Candle> confirmation;
};

enum class Rejection {
    None,
    InsufficientData,
    TrendFilter,
    NotEnoughTriggers,
    DegenerateRisk
};

std::string rejection_to_string(Rejection rejection);

struct DetectionOutcome {
    std::optional<SignalCandidate> candidate;
    Rejection rejection = Rejection::None;
    std::string detail;
    TriggerResult triggers;
};

// Indicators -> trend gate -> triggers -> sizing -> grade. Pure: the same
// series and profile always give the same outcome.
class SignalDetector {
public:
    explicit SignalDetector(const DetectorPolicy& policy = DetectorPolicy());

    DetectionOutcome detect(const PairSeries& series, const RiskProfile& profile) const;

    // Register additional entry conditions
    EntryTriggerEvaluator& evaluator() { return evaluator_; }
    const DetectorPolicy& policy() const { return policy_; }

private:
    DetectorPolicy policy_;
    IndicatorEngine engine_;
    TrendFilter trend_filter_;
    EntryTriggerEvaluator evaluator_;
    SignalGrader grader_;
    RiskSizer sizer_;
};

// "a", "a and b", "a, b and c"
std::string join_rationale(const std::vector<std::string>& parts);
