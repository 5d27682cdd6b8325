#include "evaluator.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <cmath>

namespace {

std::string threshold_message(const AlertCondition& cond, const std::string& name,
                              const char* direction, double price) {
    if (cond.message) return *cond.message;
    return fmt::format("{} is {} ${:.2f} (currently ${:.2f})", name, direction, cond.value, price);
}

std::string change_message(const AlertCondition& cond, const std::string& name,
                           double change, double price) {
    if (cond.message) return *cond.message;

    const char* direction = change < 0 ? "down" : "up";
    if (cond.kind == ConditionKind::PercentChange) {
        return fmt::format("{} moved {:.1f}% {} in {} (currently ${:.2f})",
                           name, std::fabs(change), direction, cond.period_text, price);
    }
    return fmt::format("{} moved ${:.2f} {} in {} (currently ${:.2f})",
                       name, std::fabs(change), direction, cond.period_text, price);
}

Evaluation no_change(const EvaluationInput& input) {
    return Evaluation{false, input.triggered, ""};
}

Evaluation evaluate_above(const AlertCondition& cond, const std::string& name,
                          const EvaluationInput& input) {
    if (input.price >= cond.value) {
        if (!input.triggered) {
            return Evaluation{true, true, threshold_message(cond, name, "above", input.price)};
        }
        return no_change(input);
    }

    // Re-arm only once the previous run confirms the price was above the line
    if (input.triggered && input.prior_last_price && *input.prior_last_price >= cond.value) {
        return Evaluation{false, false, ""};
    }
    return no_change(input);
}

Evaluation evaluate_below(const AlertCondition& cond, const std::string& name,
                          const EvaluationInput& input) {
    if (input.price <= cond.value) {
        if (!input.triggered) {
            return Evaluation{true, true, threshold_message(cond, name, "below", input.price)};
        }
        return no_change(input);
    }

    if (input.triggered && input.prior_last_price && *input.prior_last_price <= cond.value) {
        return Evaluation{false, false, ""};
    }
    return no_change(input);
}

Evaluation apply_change(const AlertCondition& cond, const std::string& name,
                        const EvaluationInput& input, double change) {
    if (std::fabs(change) >= cond.value) {
        if (!input.triggered) {
            return Evaluation{true, true, change_message(cond, name, change, input.price)};
        }
        return no_change(input);
    }
    return Evaluation{false, false, ""};
}

Evaluation evaluate_percent_change(const AlertCondition& cond, const std::string& name,
                                   const EvaluationInput& input) {
    if (!input.reference_price || *input.reference_price <= 0) {
        return no_change(input);
    }
    double ref = *input.reference_price;
    double change_pct = (input.price - ref) / ref * 100.0;
    return apply_change(cond, name, input, change_pct);
}

Evaluation evaluate_absolute_change(const AlertCondition& cond, const std::string& name,
                                    const EvaluationInput& input) {
    if (!input.reference_price || *input.reference_price <= 0) {
        return no_change(input);
    }
    return apply_change(cond, name, input, input.price - *input.reference_price);
}

} // namespace

Evaluation evaluate_condition(const AlertCondition& cond, const std::string& display_name,
                              const EvaluationInput& input) {
    switch (cond.kind) {
        case ConditionKind::Above:
            return evaluate_above(cond, display_name, input);
        case ConditionKind::Below:
            return evaluate_below(cond, display_name, input);
        case ConditionKind::PercentChange:
            return evaluate_percent_change(cond, display_name, input);
        case ConditionKind::AbsoluteChange:
            return evaluate_absolute_change(cond, display_name, input);
    }
    return no_change(input);
}

ConditionEvaluator::ConditionEvaluator(StateStore& state, util::TimePoint now)
    : state_(state), now_(now) {}

std::optional<TriggeredAlert> ConditionEvaluator::evaluate(const std::string& ticker,
                                                           const std::string& name,
                                                           const AlertCondition& cond,
                                                           const Quote& quote) {
    std::string key = StateStore::alert_key(ticker, cond.kind, cond.value);

    EvaluationInput input;
    input.price = quote.price;
    input.prior_last_price = state_.last_price(ticker);
    input.triggered = state_.is_triggered(key);
    if (cond.is_change_based() && cond.period) {
        input.reference_price = state_.price_at(ticker, *cond.period, now_);
    }

    const std::string& display_name = name.empty() ? ticker : name;
    Evaluation result = evaluate_condition(cond, display_name, input);

    if (result.new_triggered != input.triggered) {
        state_.set_triggered(key, result.new_triggered);
        if (!result.new_triggered) {
            spdlog::debug("{} re-armed at ${:.2f}", key, quote.price);
        }
    }

    if (!result.fires) {
        return std::nullopt;
    }

    spdlog::debug("{} fired at ${:.2f}", key, quote.price);
    return TriggeredAlert{ticker, name, cond, quote.price, result.message};
}
