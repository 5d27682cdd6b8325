#include "condition.hpp"
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>

bool AlertCondition::is_change_based() const {
    switch (kind) {
        case ConditionKind::Above:
        case ConditionKind::Below:
            return false;
        case ConditionKind::PercentChange:
        case ConditionKind::AbsoluteChange:
            return true;
    }
    return false;
}

std::string kind_to_string(ConditionKind kind) {
    switch (kind) {
        case ConditionKind::Above: return "above";
        case ConditionKind::Below: return "below";
        case ConditionKind::PercentChange: return "percent_change";
        case ConditionKind::AbsoluteChange: return "absolute_change";
    }
    return "unknown";
}

std::optional<ConditionKind> kind_from_string(const std::string& text) {
    if (text == "above") return ConditionKind::Above;
    if (text == "below") return ConditionKind::Below;
    if (text == "percent_change") return ConditionKind::PercentChange;
    if (text == "absolute_change") return ConditionKind::AbsoluteChange;
    return std::nullopt;
}

std::optional<std::chrono::seconds> parse_period(const std::string& text) {
    if (text.empty()) return std::nullopt;

    // Day suffix takes a whole count only
    if (text.size() > 1 && text.back() == 'd') {
        std::string count = text.substr(0, text.size() - 1);
        for (char c : count) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        }
        // More than six digits is already past MAX_PERIOD_DAYS
        if (count.size() > 6) return std::nullopt;
        long long days = std::strtoll(count.c_str(), nullptr, 10);
        if (days > MAX_PERIOD_DAYS) return std::nullopt;
        return std::chrono::seconds(days * 24 * 3600);
    }

    double total_seconds = 0.0;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t start = pos;
        while (pos < text.size() &&
               (std::isdigit(static_cast<unsigned char>(text[pos])) || text[pos] == '.')) {
            pos++;
        }
        if (pos == start) return std::nullopt;

        std::string number = text.substr(start, pos - start);
        if (number == "." || number.find('.') != number.rfind('.')) return std::nullopt;
        double amount = std::strtod(number.c_str(), nullptr);

        size_t unit_start = pos;
        while (pos < text.size() && std::isalpha(static_cast<unsigned char>(text[pos]))) {
            pos++;
        }
        std::string unit = text.substr(unit_start, pos - unit_start);

        if (unit == "h") {
            total_seconds += amount * 3600.0;
        } else if (unit == "m") {
            total_seconds += amount * 60.0;
        } else if (unit == "s") {
            total_seconds += amount;
        } else if (unit == "ms") {
            total_seconds += amount / 1000.0;
        } else {
            return std::nullopt;
        }
    }

    if (!std::isfinite(total_seconds) || total_seconds > MAX_PERIOD_DAYS * 24.0 * 3600.0) {
        return std::nullopt;
    }
    return std::chrono::seconds(static_cast<int64_t>(std::llround(total_seconds)));
}
