#pragma once

#include <cstdint>
#include <string>

enum class ExitReason { SIGNAL, END_OF_RUN };

inline const char* to_string(ExitReason r) {
    switch (r) {
        case ExitReason::SIGNAL:     return "SIGNAL";
        case ExitReason::END_OF_RUN: return "END_OF_RUN";
    }
    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// TradeRecord — one closed long position.
// realized_profit = gross_pnl - commission, which matches
// proceeds - cost_basis up to rounding.
// ---------------------------------------------------------------------------
struct TradeRecord {
    std::string symbol;
    int64_t shares = 0;
    uint64_t entry_ts = 0;
    uint64_t exit_ts = 0;
    double entry_price = 0.0;
    double exit_price = 0.0;
    int entry_bar_idx = 0;
    int exit_bar_idx = 0;
    int bars_held = 0;
    double cost_basis = 0.0;      // shares * entry * (1 + rate)
    double proceeds = 0.0;        // shares * exit * (1 - rate)
    double gross_pnl = 0.0;       // (exit - entry) * shares
    double commission = 0.0;      // entry side + exit side
    double realized_profit = 0.0;
    double return_pct = 0.0;      // realized_profit / (entry * shares) * 100
    ExitReason exit_reason = ExitReason::SIGNAL;
};

// ---------------------------------------------------------------------------
// EquityPoint — ledger state marked to the bar's close
// ---------------------------------------------------------------------------
struct EquityPoint {
    uint64_t timestamp = 0;
    double cash = 0.0;
    int64_t shares_held = 0;
    double mark_price = 0.0;
    double portfolio_value = 0.0;  // cash + shares_held * mark_price
};
