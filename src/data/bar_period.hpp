#pragma once

#include "bars/bar.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Lookback periods ("1mo", "3mo", "6mo", "1y", "2y", "5y", "max") and
// interval names accepted by bar providers.
// ---------------------------------------------------------------------------
namespace bar_period {

struct Period {
    bool is_max = false;
    int months = 0;
};

inline std::optional<Period> parse(const std::string& s) {
    if (s == "max") return Period{true, 0};
    if (s == "1mo") return Period{false, 1};
    if (s == "3mo") return Period{false, 3};
    if (s == "6mo") return Period{false, 6};
    if (s == "1y") return Period{false, 12};
    if (s == "2y") return Period{false, 24};
    if (s == "5y") return Period{false, 60};
    return std::nullopt;
}

inline bool is_valid_interval(const std::string& s) {
    return s == "1s" || s == "1m" || s == "1h" || s == "1d";
}

// Midnight UTC `months` calendar months before the day containing ts.
// The day of month is clamped to the target month's length.
inline uint64_t months_before(uint64_t ts, int months) {
    int y = 0;
    unsigned m = 0, d = 0;
    time_utils::civil_from_days(static_cast<int64_t>(ts / time_utils::NS_PER_DAY), y, m, d);
    int total = y * 12 + static_cast<int>(m) - 1 - months;
    int ty = total / 12;
    unsigned tm = static_cast<unsigned>(total % 12) + 1;
    if (ty < 1970) return 0;
    unsigned td = std::min(d, time_utils::days_in_month(ty, tm));
    return static_cast<uint64_t>(time_utils::days_from_civil(ty, tm, td)) *
           time_utils::NS_PER_DAY;
}

// Keep the bars that fall inside `period`, measured back from the last bar.
inline std::vector<Bar> trim(const std::vector<Bar>& bars, const Period& period) {
    if (period.is_max || bars.empty()) return bars;
    uint64_t start = months_before(bars.back().timestamp, period.months);
    std::vector<Bar> out;
    for (const auto& b : bars) {
        if (b.timestamp >= start) out.push_back(b);
    }
    return out;
}

// Bars with start_ns <= timestamp <= end_ns.
inline std::vector<Bar> slice(const std::vector<Bar>& bars, uint64_t start_ns, uint64_t end_ns) {
    std::vector<Bar> out;
    for (const auto& b : bars) {
        if (b.timestamp >= start_ns && b.timestamp <= end_ns) out.push_back(b);
    }
    return out;
}

}  // namespace bar_period
