#pragma once

#include "indicators/indicator_set.hpp"
#include "signals/signal.hpp"
#include "signals/signal_config.hpp"

#include <algorithm>
#include <cstdio>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// Per-indicator strategies. Each reads the current state of an IndicatorSet
// and returns at most one candidate. Indicator accessors throw
// InsufficientData during warm-up; callers treat that as an abstention.
// ---------------------------------------------------------------------------
namespace strategies {

inline std::string format_value(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", v);
    return buf;
}

// RSI below oversold -> BUY, above overbought -> SELL. Confidence grows
// linearly over 10 RSI points past the threshold, capped at 1.
inline std::optional<Candidate> rsi(const IndicatorSet& ind, const SignalConfig& cfg) {
    const RsiState& state = ind.rsi();
    if (state.avg_gain() == 0.0 && state.avg_loss() == 0.0) return std::nullopt;

    double value = state.value();
    if (value < cfg.rsi_oversold) {
        return Candidate{StrategyKind::RSI, SignalKind::BUY,
                         std::min(1.0, (cfg.rsi_oversold - value) / 10.0),
                         "RSI oversold at " + format_value(value)};
    }
    if (value > cfg.rsi_overbought) {
        return Candidate{StrategyKind::RSI, SignalKind::SELL,
                         std::min(1.0, (value - cfg.rsi_overbought) / 10.0),
                         "RSI overbought at " + format_value(value)};
    }
    return std::nullopt;
}

inline std::optional<Candidate> macd(const IndicatorSet& ind, const SignalConfig&) {
    switch (ind.macd_cross()) {
        case CrossDirection::CROSSED_ABOVE:
            return Candidate{StrategyKind::MACD, SignalKind::BUY, 0.7,
                             "MACD bullish crossover"};
        case CrossDirection::CROSSED_BELOW:
            return Candidate{StrategyKind::MACD, SignalKind::SELL, 0.7,
                             "MACD bearish crossover"};
        case CrossDirection::NONE:
            break;
    }
    return std::nullopt;
}

// Touching or piercing a band counts. A zero-width band (constant window)
// abstains.
inline std::optional<Candidate> bollinger(const IndicatorSet& ind, const SignalConfig&) {
    const BollingerState& bands = ind.bollinger();
    double upper = bands.upper();
    double lower = bands.lower();
    if (upper == lower) return std::nullopt;

    double close = ind.last_bar().close;
    if (close <= lower) {
        return Candidate{StrategyKind::BOLLINGER, SignalKind::BUY, 0.6,
                         "Price at Bollinger lower band"};
    }
    if (close >= upper) {
        return Candidate{StrategyKind::BOLLINGER, SignalKind::SELL, 0.6,
                         "Price at Bollinger upper band"};
    }
    return std::nullopt;
}

inline std::optional<Candidate> ma_cross(const IndicatorSet& ind, const SignalConfig& cfg) {
    std::string short_name = "SMA" + std::to_string(cfg.indicators.sma_short);
    std::string long_name = "SMA" + std::to_string(cfg.indicators.sma_long);
    switch (ind.ma_cross()) {
        case CrossDirection::CROSSED_ABOVE:
            return Candidate{StrategyKind::MA_CROSS, SignalKind::BUY, 0.8,
                             "Golden cross: " + short_name + " above " + long_name};
        case CrossDirection::CROSSED_BELOW:
            return Candidate{StrategyKind::MA_CROSS, SignalKind::SELL, 0.8,
                             "Death cross: " + short_name + " below " + long_name};
        case CrossDirection::NONE:
            break;
    }
    return std::nullopt;
}

}  // namespace strategies
