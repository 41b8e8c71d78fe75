#pragma once

#include "analysis/performance_metrics.hpp"
#include "backtest/trade_record.hpp"

#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// BacktestCounters — what happened to the bars and signals of one replay
// ---------------------------------------------------------------------------
struct BacktestCounters {
    int bars_processed = 0;
    int bars_skipped = 0;             // incomplete (NaN) bars
    int buy_signals = 0;
    int sell_signals = 0;
    int buys_executed = 0;
    int sells_executed = 0;
    int buys_skipped_insufficient_cash = 0;
    int buys_ignored_open = 0;        // buy while already holding
    int sells_ignored_flat = 0;       // sell with no position
};

// ---------------------------------------------------------------------------
// BacktestResult — full outcome of a single-symbol replay
// ---------------------------------------------------------------------------
struct BacktestResult {
    std::string symbol;
    uint64_t start_ts = 0;
    uint64_t end_ts = 0;
    double initial_capital = 0.0;
    double final_capital = 0.0;       // cash after the end-of-run close
    double position_size_fraction = 0.0;
    double commission_rate = 0.0;
    std::vector<EquityPoint> equity_curve;  // one point per input bar
    std::vector<TradeRecord> trades;
    BacktestCounters counters;
    PerformanceMetrics metrics;
};

inline PerformanceMetrics compute_metrics(const BacktestResult& r) {
    return metrics_calculator::compute(r.initial_capital, r.final_capital,
                                       r.equity_curve, r.trades);
}
