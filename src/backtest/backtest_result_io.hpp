#pragma once

#include "backtest/backtest_result.hpp"
#include "backtest/trade_record.hpp"
#include "batch/batch_runner.hpp"
#include "indicators/indicator_set.hpp"
#include "signals/signal.hpp"
#include "signals/signal_generator.hpp"
#include "time_utils.hpp"

#include <cmath>
#include <cstdio>
#include <iomanip>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

namespace backtest_io {

// Escape a string for JSON output
inline std::string json_escape(const std::string& s) {
    std::string result;
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

// Numbers with enough digits to round-trip money amounts; NaN/Inf as null.
inline std::string json_number(double v) {
    if (!std::isfinite(v)) return "null";
    std::ostringstream ss;
    ss << std::setprecision(15) << v;
    return ss.str();
}

inline std::string json_string(const std::string& s) {
    return "\"" + json_escape(s) + "\"";
}

inline std::string to_json(const IndicatorSnapshot& s) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"timestamp\":" << s.timestamp;
    ss << ",\"close\":" << json_number(s.close);
    ss << ",\"rsi\":" << json_number(s.rsi);
    ss << ",\"macd\":" << json_number(s.macd);
    ss << ",\"macd_signal\":" << json_number(s.macd_signal);
    ss << ",\"macd_histogram\":" << json_number(s.macd_histogram);
    ss << ",\"bb_upper\":" << json_number(s.bb_upper);
    ss << ",\"bb_middle\":" << json_number(s.bb_middle);
    ss << ",\"bb_lower\":" << json_number(s.bb_lower);
    ss << ",\"sma_short\":" << json_number(s.sma_short);
    ss << ",\"sma_long\":" << json_number(s.sma_long);
    ss << ",\"stoch_k\":" << json_number(s.stoch_k);
    ss << ",\"stoch_d\":" << json_number(s.stoch_d);
    ss << ",\"williams_r\":" << json_number(s.williams_r);
    ss << ",\"atr\":" << json_number(s.atr);
    ss << "}";
    return ss.str();
}

inline std::string to_json(const Candidate& c) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"strategy\":\"" << to_string(c.strategy) << "\"";
    ss << ",\"kind\":\"" << to_string(c.kind) << "\"";
    ss << ",\"confidence\":" << json_number(c.confidence);
    ss << ",\"reason\":" << json_string(c.reason);
    ss << "}";
    return ss.str();
}

// Serialize a Signal; an absent signal is a HOLD.
inline std::string to_json(const Signal& s) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"symbol\":" << json_string(s.symbol);
    ss << ",\"kind\":\"" << to_string(s.kind) << "\"";
    ss << ",\"price\":" << json_number(s.price);
    ss << ",\"timestamp\":" << s.timestamp;
    ss << ",\"date\":\"" << time_utils::format_date(s.timestamp) << "\"";
    ss << ",\"confidence\":" << json_number(s.confidence);
    ss << ",\"strategy\":\"" << to_string(s.strategy) << "\"";
    ss << ",\"reason\":" << json_string(s.reason);
    ss << ",\"indicators\":" << to_json(s.indicators);
    ss << "}";
    return ss.str();
}

inline std::string to_json(const std::optional<Signal>& s) {
    return s ? to_json(*s) : std::string("{\"kind\":\"HOLD\"}");
}

inline std::string to_json(const TradeRecord& t) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"symbol\":" << json_string(t.symbol);
    ss << ",\"shares\":" << t.shares;
    ss << ",\"entry_date\":\"" << time_utils::format_date(t.entry_ts) << "\"";
    ss << ",\"exit_date\":\"" << time_utils::format_date(t.exit_ts) << "\"";
    ss << ",\"entry_ts\":" << t.entry_ts;
    ss << ",\"exit_ts\":" << t.exit_ts;
    ss << ",\"entry_price\":" << json_number(t.entry_price);
    ss << ",\"exit_price\":" << json_number(t.exit_price);
    ss << ",\"bars_held\":" << t.bars_held;
    ss << ",\"cost_basis\":" << json_number(t.cost_basis);
    ss << ",\"proceeds\":" << json_number(t.proceeds);
    ss << ",\"gross_pnl\":" << json_number(t.gross_pnl);
    ss << ",\"commission\":" << json_number(t.commission);
    ss << ",\"profit\":" << json_number(t.realized_profit);
    ss << ",\"return_pct\":" << json_number(t.return_pct);
    ss << ",\"exit_reason\":\"" << to_string(t.exit_reason) << "\"";
    ss << "}";
    return ss.str();
}

inline std::string to_json(const PerformanceMetrics& m) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"total_return\":" << json_number(m.total_return);
    ss << ",\"total_return_pct\":" << json_number(m.total_return_pct);
    ss << ",\"sharpe\":" << json_number(m.sharpe);
    ss << ",\"max_drawdown\":" << json_number(m.max_drawdown);
    ss << ",\"win_rate\":" << json_number(m.win_rate);
    ss << ",\"total_trades\":" << m.total_trades;
    ss << ",\"profitable_trades\":" << m.profitable_trades;
    ss << ",\"losing_trades\":" << m.losing_trades;
    ss << ",\"profit_factor\":" << json_number(m.profit_factor);
    ss << ",\"expectancy\":" << json_number(m.expectancy);
    ss << "}";
    return ss.str();
}

// Serialize a BacktestResult. The equity curve is included only on request.
inline std::string to_json(const BacktestResult& r, bool include_equity_curve = false) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"symbol\":" << json_string(r.symbol);
    ss << ",\"start_date\":\"" << time_utils::format_date(r.start_ts) << "\"";
    ss << ",\"end_date\":\"" << time_utils::format_date(r.end_ts) << "\"";
    ss << ",\"initial_capital\":" << json_number(r.initial_capital);
    ss << ",\"final_capital\":" << json_number(r.final_capital);
    ss << ",\"position_size_fraction\":" << json_number(r.position_size_fraction);
    ss << ",\"commission_rate\":" << json_number(r.commission_rate);
    ss << ",\"metrics\":" << to_json(r.metrics);

    const BacktestCounters& c = r.counters;
    ss << ",\"counters\":{";
    ss << "\"bars_processed\":" << c.bars_processed;
    ss << ",\"bars_skipped\":" << c.bars_skipped;
    ss << ",\"buy_signals\":" << c.buy_signals;
    ss << ",\"sell_signals\":" << c.sell_signals;
    ss << ",\"buys_executed\":" << c.buys_executed;
    ss << ",\"sells_executed\":" << c.sells_executed;
    ss << ",\"buys_skipped_insufficient_cash\":" << c.buys_skipped_insufficient_cash;
    ss << ",\"buys_ignored_open\":" << c.buys_ignored_open;
    ss << ",\"sells_ignored_flat\":" << c.sells_ignored_flat;
    ss << "}";

    ss << ",\"trades\":[";
    for (size_t i = 0; i < r.trades.size(); ++i) {
        if (i > 0) ss << ",";
        ss << to_json(r.trades[i]);
    }
    ss << "]";

    if (include_equity_curve) {
        ss << ",\"equity_curve\":[";
        for (size_t i = 0; i < r.equity_curve.size(); ++i) {
            if (i > 0) ss << ",";
            const auto& p = r.equity_curve[i];
            ss << "{";
            ss << "\"timestamp\":" << p.timestamp;
            ss << ",\"cash\":" << json_number(p.cash);
            ss << ",\"shares_held\":" << p.shares_held;
            ss << ",\"mark_price\":" << json_number(p.mark_price);
            ss << ",\"portfolio_value\":" << json_number(p.portfolio_value);
            ss << "}";
        }
        ss << "]";
    }

    ss << "}";
    return ss.str();
}

inline std::string to_json(const SymbolFailure& f) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"symbol\":" << json_string(f.symbol);
    ss << ",\"kind\":\"" << to_string(f.kind) << "\"";
    ss << ",\"message\":" << json_string(f.message);
    ss << ",\"attempts\":" << f.attempts;
    ss << "}";
    return ss.str();
}

inline std::string to_json(const ScreenResult& r) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"symbol\":" << json_string(r.symbol);
    ss << ",\"date\":\"" << time_utils::format_date(r.latest_bar.timestamp) << "\"";
    ss << ",\"close\":" << json_number(r.latest_bar.close);
    ss << ",\"bars_used\":" << r.bars_used;
    ss << ",\"decision\":" << to_json(r.decision);
    ss << ",\"candidates\":[";
    for (size_t i = 0; i < r.candidates.size(); ++i) {
        if (i > 0) ss << ",";
        ss << to_json(r.candidates[i]);
    }
    ss << "]";
    ss << ",\"indicators\":" << to_json(r.indicators);
    ss << "}";
    return ss.str();
}

// Batch outcomes: {"results":{symbol:...}, "failures":[...]}
template <typename T>
std::string to_json(const std::map<std::string, SymbolOutcome<T>>& outcomes) {
    std::ostringstream ss;
    ss << "{\"results\":{";
    bool first = true;
    for (const auto& [symbol, outcome] : outcomes) {
        if (const auto* r = std::get_if<T>(&outcome)) {
            if (!first) ss << ",";
            first = false;
            ss << json_string(symbol) << ":" << to_json(*r);
        }
    }
    ss << "},\"failures\":[";
    std::vector<SymbolFailure> failed = failures(outcomes);
    for (size_t i = 0; i < failed.size(); ++i) {
        if (i > 0) ss << ",";
        ss << to_json(failed[i]);
    }
    ss << "]}";
    return ss.str();
}

}  // namespace backtest_io
