#pragma once

#include "backtest/trade_record.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

// ---------------------------------------------------------------------------
// PerformanceMetrics — risk and return statistics of one backtest
// ---------------------------------------------------------------------------
struct PerformanceMetrics {
    double total_return = 0.0;
    double total_return_pct = 0.0;
    double sharpe = 0.0;
    double max_drawdown = 0.0;     // percent, <= 0
    double win_rate = 0.0;         // percent
    int total_trades = 0;
    int profitable_trades = 0;
    int losing_trades = 0;
    double profit_factor = 0.0;
    double expectancy = 0.0;
    std::vector<double> daily_returns;
};

// ---------------------------------------------------------------------------
// metrics_calculator — pure functions over an equity curve and trade log.
// The same inputs always give bit-identical metrics.
// ---------------------------------------------------------------------------
namespace metrics_calculator {

constexpr double TRADING_DAYS_PER_YEAR = 252.0;

// Period-over-period fractional change; the first point has no predecessor.
// Points whose previous value is zero or non-finite are dropped.
inline std::vector<double> pct_change(const std::vector<double>& values) {
    std::vector<double> out;
    if (values.size() < 2) return out;
    out.reserve(values.size() - 1);
    for (size_t i = 1; i < values.size(); ++i) {
        double prev = values[i - 1];
        double curr = values[i];
        if (prev == 0.0 || !std::isfinite(prev) || !std::isfinite(curr)) continue;
        out.push_back(curr / prev - 1.0);
    }
    return out;
}

// mean / sample stddev * sqrt(252). Zero with fewer than two returns or a
// zero stddev (all returns equal).
inline double annualized_sharpe(const std::vector<double>& returns) {
    if (returns.size() < 2) return 0.0;
    if (std::all_of(returns.begin(), returns.end(),
                    [&](double r) { return r == returns.front(); })) {
        return 0.0;
    }
    double n = static_cast<double>(returns.size());
    double sum = 0.0;
    for (double r : returns) sum += r;
    double mean = sum / n;
    double sum_sq = 0.0;
    for (double r : returns) {
        double diff = r - mean;
        sum_sq += diff * diff;
    }
    double stddev = std::sqrt(sum_sq / (n - 1.0));
    if (stddev == 0.0) return 0.0;
    return mean / stddev * std::sqrt(TRADING_DAYS_PER_YEAR);
}

// Deepest fall below the running peak, in percent of that peak (<= 0).
inline double max_drawdown_pct(const std::vector<double>& values) {
    double peak = 0.0;
    bool have_peak = false;
    double worst = 0.0;
    for (double v : values) {
        if (!std::isfinite(v)) continue;
        if (!have_peak || v > peak) {
            peak = v;
            have_peak = true;
        }
        if (peak > 0.0) {
            double dd = (v - peak) / peak;
            if (dd < worst) worst = dd;
        }
    }
    return worst * 100.0;
}

inline std::vector<double> portfolio_values(const std::vector<EquityPoint>& curve) {
    std::vector<double> values;
    values.reserve(curve.size());
    for (const auto& p : curve) values.push_back(p.portfolio_value);
    return values;
}

inline PerformanceMetrics compute(double initial_capital, double final_capital,
                                  const std::vector<EquityPoint>& equity_curve,
                                  const std::vector<TradeRecord>& trades) {
    PerformanceMetrics m;
    m.total_return = final_capital - initial_capital;
    if (initial_capital != 0.0) {
        m.total_return_pct = m.total_return / initial_capital * 100.0;
    }

    std::vector<double> values = portfolio_values(equity_curve);
    m.daily_returns = pct_change(values);
    m.sharpe = annualized_sharpe(m.daily_returns);
    m.max_drawdown = max_drawdown_pct(values);

    double wins = 0.0;
    double losses = 0.0;
    double sum_profit = 0.0;
    for (const auto& t : trades) {
        sum_profit += t.realized_profit;
        if (t.realized_profit > 0.0) {
            ++m.profitable_trades;
            wins += t.realized_profit;
        } else {
            ++m.losing_trades;
            losses += std::abs(t.realized_profit);
        }
    }
    m.total_trades = static_cast<int>(trades.size());
    if (m.total_trades > 0) {
        m.win_rate = static_cast<double>(m.profitable_trades) /
                     static_cast<double>(m.total_trades) * 100.0;
        m.expectancy = sum_profit / static_cast<double>(m.total_trades);
    }
    if (losses > 0.0) m.profit_factor = wins / losses;
    return m;
}

}  // namespace metrics_calculator
