#pragma once

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// Time constants and calendar helpers for UTC nanosecond timestamps
// ---------------------------------------------------------------------------
namespace time_utils {

constexpr uint64_t NS_PER_SEC  = 1'000'000'000ULL;
constexpr uint64_t NS_PER_HOUR = 3600ULL * NS_PER_SEC;
constexpr uint64_t NS_PER_DAY  = 24ULL * NS_PER_HOUR;

// Days since 1970-01-01 for a proleptic Gregorian date (Hinnant's algorithm).
inline int64_t days_from_civil(int y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

inline void civil_from_days(int64_t z, int& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int>(yoe) + static_cast<int>(era) * 400 + (m <= 2 ? 1 : 0);
}

inline bool is_leap_year(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

inline unsigned days_in_month(int y, unsigned m) {
    static constexpr unsigned DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap_year(y)) return 29;
    return DAYS[m - 1];
}

// Parse "YYYY-MM-DD" into midnight UTC in nanoseconds. Dates before the epoch
// and malformed strings yield nullopt.
inline std::optional<uint64_t> parse_date(const std::string& s) {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') return std::nullopt;
    for (size_t i = 0; i < s.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return std::nullopt;
    }
    int y = std::stoi(s.substr(0, 4));
    unsigned m = static_cast<unsigned>(std::stoi(s.substr(5, 2)));
    unsigned d = static_cast<unsigned>(std::stoi(s.substr(8, 2)));
    if (y < 1970 || m < 1 || m > 12 || d < 1 || d > days_in_month(y, m)) {
        return std::nullopt;
    }
    int64_t days = days_from_civil(y, m, d);
    return static_cast<uint64_t>(days) * NS_PER_DAY;
}

// Last nanosecond of the UTC day containing ts.
inline uint64_t end_of_day_ns(uint64_t ts) {
    return (ts / NS_PER_DAY) * NS_PER_DAY + NS_PER_DAY - 1;
}

inline std::string format_date(uint64_t ts) {
    int y = 0;
    unsigned m = 0, d = 0;
    civil_from_days(static_cast<int64_t>(ts / NS_PER_DAY), y, m, d);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", y, m, d);
    return buf;
}

}  // namespace time_utils
