#pragma once

#include "bars/bar.hpp"
#include "indicators/oscillators.hpp"
#include "indicators/rolling.hpp"
#include "indicators/trend.hpp"

#include <cstddef>
#include <limits>
#include <stdexcept>
#include <vector>

// ---------------------------------------------------------------------------
// indicators:: — whole-series transforms aligned 1:1 with the input.
//
// Warm-up entries are NaN. An empty input yields an empty output. Each
// series is produced by feeding the incremental state, so values match a
// bar-by-bar replay exactly.
// ---------------------------------------------------------------------------
namespace indicators {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

struct MacdSeries {
    std::vector<double> macd;
    std::vector<double> signal;
    std::vector<double> histogram;
};

struct BollingerSeries {
    std::vector<double> upper;
    std::vector<double> middle;
    std::vector<double> lower;
};

struct StochasticSeries {
    std::vector<double> k;
    std::vector<double> d;
};

namespace detail {

inline void check_hlc(const std::vector<double>& high, const std::vector<double>& low,
                      const std::vector<double>& close) {
    if (high.size() != low.size() || high.size() != close.size()) {
        throw std::invalid_argument("high/low/close series must have equal length");
    }
}

}  // namespace detail

inline std::vector<double> sma(const std::vector<double>& values, int period) {
    SmaState state(period);
    std::vector<double> out(values.size(), NaN);
    for (size_t i = 0; i < values.size(); ++i) {
        state.update(values[i]);
        if (state.ready()) out[i] = state.value();
    }
    return out;
}

inline std::vector<double> ema(const std::vector<double>& values, int period) {
    EmaState state(period);
    std::vector<double> out(values.size(), NaN);
    for (size_t i = 0; i < values.size(); ++i) {
        state.update(values[i]);
        if (state.ready()) out[i] = state.value();
    }
    return out;
}

inline std::vector<double> rsi(const std::vector<double>& close, int period = 14) {
    RsiState state(period);
    std::vector<double> out(close.size(), NaN);
    for (size_t i = 0; i < close.size(); ++i) {
        state.update(close[i]);
        if (state.ready()) out[i] = state.value();
    }
    return out;
}

inline MacdSeries macd(const std::vector<double>& close, int fast = 12, int slow = 26,
                       int signal = 9) {
    MacdState state(fast, slow, signal);
    MacdSeries out;
    out.macd.assign(close.size(), NaN);
    out.signal.assign(close.size(), NaN);
    out.histogram.assign(close.size(), NaN);
    for (size_t i = 0; i < close.size(); ++i) {
        state.update(close[i]);
        if (state.ready()) out.macd[i] = state.macd();
        if (state.signal_ready()) {
            out.signal[i] = state.signal();
            out.histogram[i] = state.histogram();
        }
    }
    return out;
}

inline BollingerSeries bollinger_bands(const std::vector<double>& close, int period = 20,
                                       double num_std = 2.0) {
    BollingerState state(period, num_std);
    BollingerSeries out;
    out.upper.assign(close.size(), NaN);
    out.middle.assign(close.size(), NaN);
    out.lower.assign(close.size(), NaN);
    for (size_t i = 0; i < close.size(); ++i) {
        state.update(close[i]);
        if (state.ready()) {
            out.upper[i] = state.upper();
            out.middle[i] = state.middle();
            out.lower[i] = state.lower();
        }
    }
    return out;
}

inline StochasticSeries stochastic(const std::vector<double>& high,
                                   const std::vector<double>& low,
                                   const std::vector<double>& close,
                                   int k_period = 14, int d_period = 3) {
    detail::check_hlc(high, low, close);
    StochasticState state(k_period, d_period);
    StochasticSeries out;
    out.k.assign(close.size(), NaN);
    out.d.assign(close.size(), NaN);
    for (size_t i = 0; i < close.size(); ++i) {
        state.update(high[i], low[i], close[i]);
        if (state.ready()) out.k[i] = state.k();
        if (state.d_ready()) out.d[i] = state.d();
    }
    return out;
}

inline std::vector<double> williams_r(const std::vector<double>& high,
                                      const std::vector<double>& low,
                                      const std::vector<double>& close,
                                      int period = 14) {
    detail::check_hlc(high, low, close);
    WilliamsRState state(period);
    std::vector<double> out(close.size(), NaN);
    for (size_t i = 0; i < close.size(); ++i) {
        state.update(high[i], low[i], close[i]);
        if (state.ready()) out[i] = state.value();
    }
    return out;
}

inline std::vector<double> atr(const std::vector<double>& high,
                               const std::vector<double>& low,
                               const std::vector<double>& close,
                               int period = 14) {
    detail::check_hlc(high, low, close);
    AtrState state(period);
    std::vector<double> out(close.size(), NaN);
    for (size_t i = 0; i < close.size(); ++i) {
        state.update(high[i], low[i], close[i]);
        if (state.ready()) out[i] = state.value();
    }
    return out;
}

// Bar-sequence overloads.
inline StochasticSeries stochastic(const std::vector<Bar>& bars, int k_period = 14,
                                   int d_period = 3) {
    return stochastic(bar_columns::highs(bars), bar_columns::lows(bars),
                      bar_columns::closes(bars), k_period, d_period);
}

inline std::vector<double> williams_r(const std::vector<Bar>& bars, int period = 14) {
    return williams_r(bar_columns::highs(bars), bar_columns::lows(bars),
                      bar_columns::closes(bars), period);
}

inline std::vector<double> atr(const std::vector<Bar>& bars, int period = 14) {
    return atr(bar_columns::highs(bars), bar_columns::lows(bars),
               bar_columns::closes(bars), period);
}

}  // namespace indicators
