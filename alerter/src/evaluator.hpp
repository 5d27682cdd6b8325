#pragma once

#include "condition.hpp"
#include "quote_source.hpp"
#include "state_store.hpp"
#include <string>
#include <optional>

struct EvaluationInput {
    double price;
    std::optional<double> prior_last_price;   // previous run's recorded price
    std::optional<double> reference_price;    // price one period ago, change kinds only
    bool triggered;
};

struct Evaluation {
    bool fires;
    bool new_triggered;
    std::string message;   // set only when fires
};

// Decides fire / reset / no-op for one condition. No side effects.
Evaluation evaluate_condition(const AlertCondition& cond, const std::string& display_name,
                              const EvaluationInput& input);

struct TriggeredAlert {
    std::string ticker;
    std::string name;
    AlertCondition condition;
    double price;
    std::string message;
};

// Reads inputs from the state store, runs evaluate_condition and writes the flag back.
class ConditionEvaluator {
public:
    ConditionEvaluator(StateStore& state, util::TimePoint now);

    std::optional<TriggeredAlert> evaluate(const std::string& ticker, const std::string& name,
                                           const AlertCondition& cond, const Quote& quote);

private:
    StateStore& state_;
    util::TimePoint now_;
};
