#pragma once

#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Bar — one OHLCV interval, timestamp in UTC nanoseconds
// ---------------------------------------------------------------------------
struct Bar {
    uint64_t timestamp = 0;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;

    // A bar with any missing (NaN/Inf) price or volume field is skipped by
    // the backtest replay and never reaches indicator state.
    bool is_complete() const {
        return std::isfinite(open) && std::isfinite(high) &&
               std::isfinite(low) && std::isfinite(close) &&
               std::isfinite(volume);
    }
};

// ---------------------------------------------------------------------------
// Column views used by the batch indicator functions
// ---------------------------------------------------------------------------
namespace bar_columns {

inline std::vector<double> closes(const std::vector<Bar>& bars) {
    std::vector<double> out;
    out.reserve(bars.size());
    for (const auto& b : bars) out.push_back(b.close);
    return out;
}

inline std::vector<double> highs(const std::vector<Bar>& bars) {
    std::vector<double> out;
    out.reserve(bars.size());
    for (const auto& b : bars) out.push_back(b.high);
    return out;
}

inline std::vector<double> lows(const std::vector<Bar>& bars) {
    std::vector<double> out;
    out.reserve(bars.size());
    for (const auto& b : bars) out.push_back(b.low);
    return out;
}

}  // namespace bar_columns

// Bars are expected in strictly increasing timestamp order.
inline bool is_strictly_ascending(const std::vector<Bar>& bars) {
    for (size_t i = 1; i < bars.size(); ++i) {
        if (bars[i].timestamp <= bars[i - 1].timestamp) return false;
    }
    return true;
}
