#pragma once

#include <string>
#include <chrono>
#include <optional>

namespace util {
    using TimePoint = std::chrono::system_clock::time_point;

    std::string format_iso8601(TimePoint tp);
    std::optional<TimePoint> parse_iso8601(const std::string& text);

    // Replaces ${VAR} with the variable's value; unset or empty keeps the literal.
    std::string expand_env_vars(const std::string& content);

    std::string to_upper(const std::string& str);
    std::string trim(const std::string& str);
    std::string get_env(const char* name, const std::string& default_val = "");
}
