#pragma once

#include "errors.hpp"
#include "indicators/indicator_set.hpp"

#include <string>

// ---------------------------------------------------------------------------
// SignalConfig — strategy thresholds, enable flags and the provider request
// used by generate_signals()
// ---------------------------------------------------------------------------
struct SignalConfig {
    IndicatorConfig indicators;
    double rsi_oversold = 30.0;
    double rsi_overbought = 70.0;

    bool enable_ma_cross = true;
    bool enable_macd = true;
    bool enable_rsi = true;
    bool enable_bollinger = true;

    std::string lookback_period = "6mo";
    std::string interval = "1d";

    void validate() const {
        indicators.validate();
        if (rsi_oversold < 0.0 || rsi_oversold > 100.0) {
            throw InvalidConfiguration("rsi_oversold must be in [0, 100], got " +
                                       std::to_string(rsi_oversold));
        }
        if (rsi_overbought < 0.0 || rsi_overbought > 100.0) {
            throw InvalidConfiguration("rsi_overbought must be in [0, 100], got " +
                                       std::to_string(rsi_overbought));
        }
        if (rsi_oversold >= rsi_overbought) {
            throw InvalidConfiguration("rsi_oversold must be below rsi_overbought");
        }
        if (interval.empty()) {
            throw InvalidConfiguration("interval must not be empty");
        }
    }
};
