#pragma once

#include "backtest/backtest_result.hpp"
#include "backtest/cancellation.hpp"
#include "backtest/execution_costs.hpp"
#include "backtest/position_ledger.hpp"
#include "bars/bar.hpp"
#include "data/bar_period.hpp"
#include "data/bar_provider.hpp"
#include "errors.hpp"
#include "signals/signal_config.hpp"
#include "signals/signal_generator.hpp"
#include "signals/signal_source.hpp"
#include "time_utils.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// BacktestConfig — capital, costs and the signal setup for a replay.
// The position size fraction is chosen per run.
// ---------------------------------------------------------------------------
struct BacktestConfig {
    double initial_capital = 100000.0;
    ExecutionCosts costs;
    SignalConfig signal;

    void validate() const {
        if (!(initial_capital > 0.0) || !std::isfinite(initial_capital)) {
            throw InvalidConfiguration("initial_capital must be > 0");
        }
        costs.validate();
        signal.validate();
    }
};

// ---------------------------------------------------------------------------
// BacktestEngine — strictly sequential bar-by-bar replay of one symbol.
//
// Per complete bar: evaluate signals on bars <= t, execute at the close,
// record cash + shares * close. Incomplete bars are skipped and carry the
// previous mark forward. A position still open after the last bar is closed
// at the last complete close.
// ---------------------------------------------------------------------------
class BacktestEngine {
public:
    explicit BacktestEngine(const BacktestConfig& cfg = {}) : cfg_(cfg) { cfg_.validate(); }

    const BacktestConfig& config() const { return cfg_; }

    BacktestResult replay(const std::string& symbol, const std::vector<Bar>& bars,
                          double position_size_fraction,
                          const CancellationToken* cancel = nullptr) const {
        SignalGenerator generator(symbol, cfg_.signal);
        return replay(symbol, bars, position_size_fraction, generator, cancel);
    }

    BacktestResult replay(const std::string& symbol, const std::vector<Bar>& bars,
                          double position_size_fraction, SignalSource& signals,
                          const CancellationToken* cancel = nullptr) const {
        check_fraction(position_size_fraction);
        if (bars.empty()) throw DataUnavailable(symbol, "no bars to replay");
        if (!is_strictly_ascending(bars)) {
            throw DataUnavailable(symbol, "bar timestamps are not strictly increasing");
        }

        PositionLedger ledger(cfg_.initial_capital, cfg_.costs);
        BacktestResult result;
        result.symbol = symbol;
        result.start_ts = bars.front().timestamp;
        result.end_ts = bars.back().timestamp;
        result.initial_capital = cfg_.initial_capital;
        result.position_size_fraction = position_size_fraction;
        result.commission_rate = cfg_.costs.commission_rate;
        result.equity_curve.reserve(bars.size());

        BacktestCounters& counters = result.counters;
        double last_mark = 0.0;
        int last_idx = -1;

        for (size_t i = 0; i < bars.size(); ++i) {
            if (cancel && cancel->cancelled()) throw BacktestCancelled(symbol);

            const Bar& bar = bars[i];
            int idx = static_cast<int>(i);

            if (!bar.is_complete()) {
                ++counters.bars_skipped;
                spdlog::debug("{} bar {}: incomplete, skipped", symbol, idx);
                result.equity_curve.push_back(mark(ledger, symbol, bar.timestamp, last_mark));
                continue;
            }
            ++counters.bars_processed;

            if (auto sig = signals.on_bar(bar)) {
                switch (sig->kind) {
                    case SignalKind::BUY:
                        ++counters.buy_signals;
                        execute_buy(ledger, symbol, bar, idx, position_size_fraction, counters);
                        break;
                    case SignalKind::SELL:
                        ++counters.sell_signals;
                        execute_sell(ledger, symbol, bar, idx, counters);
                        break;
                }
            }

            last_mark = bar.close;
            last_idx = idx;
            result.equity_curve.push_back(mark(ledger, symbol, bar.timestamp, last_mark));
        }

        if (last_idx < 0) throw DataUnavailable(symbol, "no complete bars in range");

        if (ledger.has_position(symbol)) {
            const Bar& last = bars[static_cast<size_t>(last_idx)];
            auto trade = ledger.sell(symbol, last.close, last.timestamp, last_idx,
                                     ExitReason::END_OF_RUN);
            spdlog::debug("{}: end-of-run close of {} shares at {:.2f}, profit {:.2f}",
                          symbol, trade->shares, last.close, trade->realized_profit);
        }

        result.final_capital = ledger.cash();
        result.trades = ledger.trade_log();
        result.metrics = compute_metrics(result);
        return result;
    }

    // [start of start_date, last nanosecond of end_date] in UTC.
    static std::pair<uint64_t, uint64_t> date_range(const std::string& start_date,
                                                    const std::string& end_date) {
        auto start = time_utils::parse_date(start_date);
        auto end = time_utils::parse_date(end_date);
        if (!start) throw InvalidConfiguration("bad start_date '" + start_date + "'");
        if (!end) throw InvalidConfiguration("bad end_date '" + end_date + "'");
        if (*start > *end) {
            throw InvalidConfiguration("start_date " + start_date + " is after end_date " +
                                       end_date);
        }
        return {*start, time_utils::end_of_day_ns(*end)};
    }

    // Replays the part of `history` inside [start_ns, end_ns].
    BacktestResult replay_range(const std::string& symbol, const std::vector<Bar>& history,
                                uint64_t start_ns, uint64_t end_ns,
                                double position_size_fraction,
                                const CancellationToken* cancel = nullptr) const {
        std::vector<Bar> bars = bar_period::slice(history, start_ns, end_ns);
        if (bars.empty()) {
            throw DataUnavailable(symbol, "no data between " + time_utils::format_date(start_ns) +
                                              " and " + time_utils::format_date(end_ns));
        }
        return replay(symbol, bars, position_size_fraction, cancel);
    }

    // Fetches the full history, restricts it to [start_date, end_date]
    // (UTC calendar days, end inclusive) and replays it.
    BacktestResult run_backtest(BarProvider& provider, const std::string& symbol,
                                const std::string& start_date, const std::string& end_date,
                                double position_size_fraction,
                                const CancellationToken* cancel = nullptr) const {
        check_fraction(position_size_fraction);
        auto [start_ns, end_ns] = date_range(start_date, end_date);

        spdlog::info("Starting backtest for {} from {} to {}", symbol, start_date, end_date);
        std::vector<Bar> history = provider.get_bars(symbol, "max", cfg_.signal.interval);
        BacktestResult result = replay_range(symbol, history, start_ns, end_ns,
                                             position_size_fraction, cancel);
        spdlog::info("Backtest completed for {}. Total return: {:.2f}%", symbol,
                     result.metrics.total_return_pct);
        return result;
    }

    static void check_fraction(double f) {
        if (!(f > 0.0) || f > 1.0) {
            throw InvalidConfiguration("position_size_fraction must be in (0, 1], got " +
                                       std::to_string(f));
        }
    }

private:
    static EquityPoint mark(const PositionLedger& ledger, const std::string& symbol,
                            uint64_t ts, double mark_price) {
        EquityPoint p;
        p.timestamp = ts;
        p.cash = ledger.cash();
        p.shares_held = ledger.shares_held(symbol);
        p.mark_price = mark_price;
        p.portfolio_value = ledger.portfolio_value(symbol, mark_price);
        return p;
    }

    static void execute_buy(PositionLedger& ledger, const std::string& symbol, const Bar& bar,
                            int idx, double fraction, BacktestCounters& counters) {
        BuyOutcome outcome = ledger.buy(symbol, fraction, bar.close, bar.timestamp, idx);
        switch (outcome) {
            case BuyOutcome::OPENED:
                ++counters.buys_executed;
                spdlog::debug("{} bar {}: opened {} shares at {:.2f}", symbol, idx,
                              ledger.shares_held(symbol), bar.close);
                break;
            case BuyOutcome::ALREADY_OPEN:
                ++counters.buys_ignored_open;
                spdlog::debug("{} bar {}: buy ignored, position already open", symbol, idx);
                break;
            case BuyOutcome::ZERO_SHARES:
            case BuyOutcome::INSUFFICIENT_CASH:
                ++counters.buys_skipped_insufficient_cash;
                spdlog::debug("{} bar {}: buy skipped ({}), cash {:.2f}", symbol, idx,
                              to_string(outcome), ledger.cash());
                break;
        }
    }

    static void execute_sell(PositionLedger& ledger, const std::string& symbol, const Bar& bar,
                             int idx, BacktestCounters& counters) {
        auto trade = ledger.sell(symbol, bar.close, bar.timestamp, idx, ExitReason::SIGNAL);
        if (!trade) {
            ++counters.sells_ignored_flat;
            spdlog::debug("{} bar {}: sell ignored, no position", symbol, idx);
            return;
        }
        ++counters.sells_executed;
        spdlog::debug("{} bar {}: closed {} shares at {:.2f}, profit {:.2f}", symbol, idx,
                      trade->shares, bar.close, trade->realized_profit);
    }

    BacktestConfig cfg_;
};
