#pragma once

#include "indicators/indicator_set.hpp"

#include <cstdint>
#include <string>

enum class SignalKind { BUY, SELL };

// Declaration order is the tie-break priority: earlier wins.
enum class StrategyKind { MA_CROSS, MACD, RSI, BOLLINGER };

inline const char* to_string(SignalKind k) {
    switch (k) {
        case SignalKind::BUY: return "BUY";
        case SignalKind::SELL: return "SELL";
    }
    return "UNKNOWN";
}

inline const char* to_string(StrategyKind s) {
    switch (s) {
        case StrategyKind::MA_CROSS: return "MA_CROSS";
        case StrategyKind::MACD: return "MACD";
        case StrategyKind::RSI: return "RSI";
        case StrategyKind::BOLLINGER: return "BOLLINGER";
    }
    return "UNKNOWN";
}

inline int priority_rank(StrategyKind s) { return static_cast<int>(s); }

// ---------------------------------------------------------------------------
// Candidate — one strategy's opinion on the current bar
// ---------------------------------------------------------------------------
struct Candidate {
    StrategyKind strategy = StrategyKind::MA_CROSS;
    SignalKind kind = SignalKind::BUY;
    double confidence = 0.0;
    std::string reason;
};

// ---------------------------------------------------------------------------
// Signal — the combined decision for one symbol at one bar.
// Hold is represented by the absence of a Signal (std::nullopt).
// ---------------------------------------------------------------------------
struct Signal {
    std::string symbol;
    SignalKind kind = SignalKind::BUY;
    double price = 0.0;
    uint64_t timestamp = 0;
    double confidence = 0.0;
    StrategyKind strategy = StrategyKind::MA_CROSS;
    IndicatorSnapshot indicators;
    std::string reason;
};
