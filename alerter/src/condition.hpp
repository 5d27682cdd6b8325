#pragma once

#include <string>
#include <chrono>
#include <optional>

enum class ConditionKind {
    Above,           // price >= value
    Below,           // price <= value
    PercentChange,   // |change %| over period >= value
    AbsoluteChange   // |change $| over period >= value
};

struct AlertCondition {
    ConditionKind kind;
    double value;
    std::optional<std::chrono::seconds> period;
    std::string period_text;              // as written in config, used in messages
    std::optional<std::string> message;   // custom text, sent verbatim

    bool is_change_based() const;
};

// "above", "below", "percent_change", "absolute_change"
std::string kind_to_string(ConditionKind kind);
std::optional<ConditionKind> kind_from_string(const std::string& text);

// Upper bound keeps now - period representable in a nanosecond time_point.
constexpr long long MAX_PERIOD_DAYS = 36500;

// Accepts "7d" plus h/m/s/ms units, combinable and fractional ("1h30m", "1.5h").
// nullopt on bad syntax or anything longer than MAX_PERIOD_DAYS.
std::optional<std::chrono::seconds> parse_period(const std::string& text);
