#pragma once

#include "backtest/backtest_result.hpp"
#include "bars/bar.hpp"
#include "indicators/indicator_set.hpp"
#include "signals/signal_config.hpp"
#include "signals/signal_generator.hpp"
#include "time_utils.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// ExportTable — column-oriented table handed to the Parquet and CSV writers
// ---------------------------------------------------------------------------
struct ExportColumn {
    enum class Type { INT64, FLOAT64, BOOL, UTF8 };

    std::string name;
    Type type = Type::FLOAT64;
    std::vector<int64_t> ints;
    std::vector<double> doubles;
    std::vector<bool> bools;
    std::vector<std::string> strings;

    size_t size() const {
        switch (type) {
            case Type::INT64:   return ints.size();
            case Type::FLOAT64: return doubles.size();
            case Type::BOOL:    return bools.size();
            case Type::UTF8:    return strings.size();
        }
        return 0;
    }
};

struct ExportTable {
    std::vector<ExportColumn> columns;

    ExportColumn& add(const std::string& name, ExportColumn::Type type) {
        ExportColumn c;
        c.name = name;
        c.type = type;
        columns.push_back(std::move(c));
        return columns.back();
    }

    size_t num_rows() const { return columns.empty() ? 0 : columns.front().size(); }

    // All columns must have the same length.
    void check() const {
        for (const auto& c : columns) {
            if (c.size() != num_rows()) {
                throw std::runtime_error("export column '" + c.name + "' has " +
                                         std::to_string(c.size()) + " rows, expected " +
                                         std::to_string(num_rows()));
            }
        }
    }
};

namespace export_tables {

// Bars, every indicator and the combined decision per bar. Incomplete bars
// keep their row with NaN indicators and decision "SKIP".
inline ExportTable indicator_table(const std::string& symbol, const std::vector<Bar>& bars,
                                   const SignalConfig& cfg = {}) {
    using T = ExportColumn::Type;
    constexpr double NaN = std::numeric_limits<double>::quiet_NaN();
    constexpr size_t NUM_VALUES = 18;       // OHLCV + indicators
    constexpr size_t FIRST_INDICATOR = 5;

    std::vector<int64_t> ts;
    std::vector<std::string> dates, decisions, strategies;
    std::vector<bool> warmup;
    std::vector<std::vector<double>> vals(NUM_VALUES);
    std::vector<double> confidence;

    SignalGenerator gen(symbol, cfg);
    for (const auto& bar : bars) {
        ts.push_back(static_cast<int64_t>(bar.timestamp));
        dates.push_back(time_utils::format_date(bar.timestamp));

        IndicatorSnapshot s;
        std::string decision = "SKIP";
        std::string strategy;
        double conf = NaN;
        if (bar.is_complete()) {
            auto sig = gen.on_bar(bar);
            s = gen.indicators().snapshot();
            decision = sig ? to_string(sig->kind) : "HOLD";
            if (sig) {
                strategy = to_string(sig->strategy);
                conf = sig->confidence;
            }
        }

        double row[] = {bar.open, bar.high, bar.low, bar.close, bar.volume,
                        s.rsi, s.macd, s.macd_signal, s.macd_histogram,
                        s.bb_upper, s.bb_middle, s.bb_lower,
                        s.sma_short, s.sma_long, s.stoch_k, s.stoch_d,
                        s.williams_r, s.atr};
        for (size_t c = 0; c < NUM_VALUES; ++c) vals[c].push_back(row[c]);

        bool any_undefined = false;
        for (size_t c = FIRST_INDICATOR; c < NUM_VALUES; ++c) {
            if (std::isnan(row[c])) any_undefined = true;
        }
        warmup.push_back(any_undefined);
        decisions.push_back(decision);
        strategies.push_back(strategy);
        confidence.push_back(conf);
    }

    static const char* const NAMES[NUM_VALUES] = {"open", "high", "low", "close", "volume",
                                  "rsi", "macd", "macd_signal", "macd_histogram",
                                  "bb_upper", "bb_middle", "bb_lower",
                                  "sma_short", "sma_long", "stoch_k", "stoch_d",
                                  "williams_r", "atr"};

    ExportTable table;
    table.add("timestamp", T::INT64).ints = ts;
    table.add("date", T::UTF8).strings = dates;
    for (size_t c = 0; c < NUM_VALUES; ++c) table.add(NAMES[c], T::FLOAT64).doubles = vals[c];
    table.add("is_warmup", T::BOOL).bools = warmup;
    table.add("decision", T::UTF8).strings = decisions;
    table.add("strategy", T::UTF8).strings = strategies;
    table.add("confidence", T::FLOAT64).doubles = confidence;
    return table;
}

inline ExportTable equity_table(const BacktestResult& r) {
    using T = ExportColumn::Type;
    ExportTable table;
    table.add("timestamp", T::INT64);
    table.add("cash", T::FLOAT64);
    table.add("shares_held", T::INT64);
    table.add("mark_price", T::FLOAT64);
    table.add("portfolio_value", T::FLOAT64);

    // add() may reallocate, so columns are filled by index once all exist.
    auto& c = table.columns;
    for (const auto& p : r.equity_curve) {
        c[0].ints.push_back(static_cast<int64_t>(p.timestamp));
        c[1].doubles.push_back(p.cash);
        c[2].ints.push_back(p.shares_held);
        c[3].doubles.push_back(p.mark_price);
        c[4].doubles.push_back(p.portfolio_value);
    }
    return table;
}

inline ExportTable trade_table(const BacktestResult& r) {
    using T = ExportColumn::Type;
    ExportTable table;
    table.add("symbol", T::UTF8);
    table.add("shares", T::INT64);
    table.add("entry_ts", T::INT64);
    table.add("exit_ts", T::INT64);
    table.add("entry_price", T::FLOAT64);
    table.add("exit_price", T::FLOAT64);
    table.add("bars_held", T::INT64);
    table.add("cost_basis", T::FLOAT64);
    table.add("proceeds", T::FLOAT64);
    table.add("gross_pnl", T::FLOAT64);
    table.add("commission", T::FLOAT64);
    table.add("realized_profit", T::FLOAT64);
    table.add("return_pct", T::FLOAT64);
    table.add("exit_reason", T::UTF8);

    auto& c = table.columns;
    for (const auto& t : r.trades) {
        c[0].strings.push_back(t.symbol);
        c[1].ints.push_back(t.shares);
        c[2].ints.push_back(static_cast<int64_t>(t.entry_ts));
        c[3].ints.push_back(static_cast<int64_t>(t.exit_ts));
        c[4].doubles.push_back(t.entry_price);
        c[5].doubles.push_back(t.exit_price);
        c[6].ints.push_back(t.bars_held);
        c[7].doubles.push_back(t.cost_basis);
        c[8].doubles.push_back(t.proceeds);
        c[9].doubles.push_back(t.gross_pnl);
        c[10].doubles.push_back(t.commission);
        c[11].doubles.push_back(t.realized_profit);
        c[12].doubles.push_back(t.return_pct);
        c[13].strings.push_back(to_string(t.exit_reason));
    }
    return table;
}

}  // namespace export_tables
