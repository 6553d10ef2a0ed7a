#pragma once

#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// Calendar dates encoded as YYYYMMDD integers (e.g. 20220103)
// ---------------------------------------------------------------------------
namespace time_utils {

constexpr int64_t DATE_YEAR_FACTOR  = 10'000;
constexpr int64_t DATE_MONTH_FACTOR = 100;

inline bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

inline int days_in_month(int year, int month) {
    static constexpr int DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) return 29;
    return DAYS[month - 1];
}

inline int64_t make_date(int year, int month, int day) {
    return static_cast<int64_t>(year) * DATE_YEAR_FACTOR
         + static_cast<int64_t>(month) * DATE_MONTH_FACTOR + day;
}

// Parse "YYYY-MM-DD" (an optional time suffix after the day is ignored).
// Returns nullopt for anything that is not a real calendar date.
inline std::optional<int64_t> parse_date(const std::string& text) {
    int year = 0, month = 0, day = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%n", &year, &month, &day, &consumed) != 3) {
        return std::nullopt;
    }
    if (consumed != 10) return std::nullopt;
    if (text.size() > 10 && text[10] != ' ' && text[10] != 'T') return std::nullopt;
    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > days_in_month(year, month)) return std::nullopt;
    return make_date(year, month, day);
}

inline std::string date_to_string(int64_t date) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d",
                  static_cast<int>(date / DATE_YEAR_FACTOR),
                  static_cast<int>((date / DATE_MONTH_FACTOR) % 100),
                  static_cast<int>(date % 100));
    return buf;
}

}  // namespace time_utils
