#include "detector.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

std::string rejection_to_string(Rejection rejection) {
    switch (rejection) {
        case Rejection::None: return "none";
        case Rejection::InsufficientData: return "insufficient_data";
        case Rejection::TrendFilter: return "trend_filter";
        case Rejection::NotEnoughTriggers: return "not_enough_triggers";
        case Rejection::DegenerateRisk: return "degenerate_risk";
    }
    return "unknown";
}

std::string join_rationale(const std::vector<std::string>& parts) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += (i + 1 == parts.size()) ? " and " : ", ";
        out += parts[i];
    }
    return out;
}

SignalDetector::SignalDetector(const DetectorPolicy& policy)
    : policy_(policy)
    , engine_(policy.indicators)
    , trend_filter_(policy.trend)
    , evaluator_(EntryTriggerEvaluator::with_default_triggers(policy.triggers))
    , grader_(policy.grading)
    , sizer_(policy.risk) {}

DetectionOutcome SignalDetector::detect(const PairSeries& series, const RiskProfile& profile) const {
    DetectionOutcome outcome;

    IndicatorSnapshot trend, entry, confirmation;
    try {
        trend = engine_.compute(series.trend, policy_.trend_timeframe);
        entry = engine_.compute(series.entry, policy_.entry_timeframe);
        confirmation = engine_.compute(series.confirmation, policy_.confirmation_timeframe);
    } catch (const InsufficientData& e) {
        outcome.rejection = Rejection::InsufficientData;
        outcome.detail = e.what();
        spdlog::debug("{} skipped: {}", series.symbol, e.what());
        return outcome;
    }

    TrendCheck check = trend_filter_.check(trend, entry);
    if (!check.passed) {
        outcome.rejection = Rejection::TrendFilter;
        outcome.detail = check.reason;
        spdlog::debug("{} rejected by trend filter: {}", series.symbol, check.reason);
        return outcome;
    }

    outcome.triggers = evaluator_.evaluate(SeriesView{entry, series.entry},
                                           SeriesView{confirmation, series.confirmation});
    int fired = outcome.triggers.count();
    if (fired < policy_.triggers.min_triggers) {
        outcome.rejection = Rejection::NotEnoughTriggers;
        outcome.detail = fmt::format("{} of {} required triggers", fired, policy_.triggers.min_triggers);
        spdlog::debug("{} rejected: {}", series.symbol, outcome.detail);
        return outcome;
    }

    double entry_price = entry.last_close();
    SizedPosition sized;
    try {
        sized = sizer_.size(entry_price, entry, profile);
    } catch (const DegenerateRisk& e) {
        outcome.rejection = Rejection::DegenerateRisk;
        outcome.detail = e.what();
        spdlog::warn("{} degenerate risk: {}", series.symbol, e.what());
        return outcome;
    }

    Grade grade = grader_.grade(fired, check, sized.stop_distance_pct);

    SignalCandidate candidate;
    candidate.symbol = series.symbol;
    candidate.timeframe = policy_.entry_timeframe;
    candidate.entry_price = sized.entry;
    candidate.stop_loss = sized.stop_loss;
    candidate.take_profit_1 = sized.take_profit_1;
    candidate.take_profit_2 = sized.take_profit_2;
    candidate.grade = grade;
    candidate.risk_pct = profile.risk_pct;
    candidate.position_size = sized.position_size;
    candidate.triggers = outcome.triggers.fired_names();
    candidate.rationale = fmt::format("{}: {} (R:R 1:{:.1f} to TP1)",
                                      grade_description(grade),
                                      join_rationale(outcome.triggers.rationale),
                                      sized.reward_risk_tp1());

    spdlog::debug("{} candidate grade {} with {} triggers", series.symbol,
                  grade_to_string(grade), fired);
    outcome.candidate = std::move(candidate);
    return outcome;
}
