#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <regex>

namespace util {

std::string format_iso8601(TimePoint tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
    int64_t secs = ms / 1000;
    int64_t frac = ms % 1000;
    if (frac < 0) {
        frac += 1000;
        secs -= 1;
    }

    std::time_t itt = static_cast<std::time_t>(secs);
    std::tm tm{};
    gmtime_r(&itt, &tm);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(frac));
    return buf;
}

std::optional<TimePoint> parse_iso8601(const std::string& text) {
    // YYYY-MM-DDTHH:MM:SS[.fraction](Z|+hh:mm|-hh:mm)
    static const std::regex re(
        R"(^(\d{4})-(\d{2})-(\d{2})[Tt ](\d{2}):(\d{2}):(\d{2})(\.\d+)?([Zz]|[+-]\d{2}:\d{2})$)");

    std::smatch m;
    if (!std::regex_match(text, m, re)) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = std::stoi(m[1]) - 1900;
    tm.tm_mon = std::stoi(m[2]) - 1;
    tm.tm_mday = std::stoi(m[3]);
    tm.tm_hour = std::stoi(m[4]);
    tm.tm_min = std::stoi(m[5]);
    tm.tm_sec = std::stoi(m[6]);

    if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
        tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
        return std::nullopt;
    }

    int64_t secs = static_cast<int64_t>(timegm(&tm));

    std::string offset = m[8];
    if (offset != "Z" && offset != "z") {
        int sign = offset[0] == '-' ? -1 : 1;
        int hours = std::stoi(offset.substr(1, 2));
        int minutes = std::stoi(offset.substr(4, 2));
        secs -= sign * (hours * 3600 + minutes * 60);
    }

    // Keep up to nanosecond digits, drop the rest
    int64_t nanos = 0;
    if (m[7].matched) {
        std::string digits = m[7].str().substr(1);
        digits = digits.substr(0, 9);
        while (digits.size() < 9) digits += '0';
        nanos = std::stoll(digits);
    }

    auto since_epoch = std::chrono::seconds(secs) + std::chrono::nanoseconds(nanos);
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(since_epoch));
}

std::string expand_env_vars(const std::string& content) {
    static const std::regex re(R"(\$\{([^}]+)\})");

    std::string result;
    auto begin = std::sregex_iterator(content.begin(), content.end(), re);
    auto end = std::sregex_iterator();

    size_t last = 0;
    for (auto it = begin; it != end; ++it) {
        const auto& match = *it;
        result += content.substr(last, match.position() - last);

        std::string name = match[1];
        const char* val = std::getenv(name.c_str());
        if (val && *val) {
            result += val;
        } else {
            result += match.str();
        }
        last = match.position() + match.length();
    }
    result += content.substr(last);
    return result;
}

std::string to_upper(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

} // namespace util
