#pragma once

#include "backtest/execution_costs.hpp"
#include "backtest/trade_record.hpp"
#include "errors.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Position — an open long holding. Created only by a buy, removed only by a
// sell or the end-of-run close.
// ---------------------------------------------------------------------------
struct Position {
    std::string symbol;
    int64_t shares = 0;
    double entry_price = 0.0;
    uint64_t entry_ts = 0;
    int entry_bar_idx = 0;
    double cost_basis = 0.0;
};

enum class BuyOutcome { OPENED, ALREADY_OPEN, ZERO_SHARES, INSUFFICIENT_CASH };

inline const char* to_string(BuyOutcome o) {
    switch (o) {
        case BuyOutcome::OPENED:            return "OPENED";
        case BuyOutcome::ALREADY_OPEN:      return "ALREADY_OPEN";
        case BuyOutcome::ZERO_SHARES:       return "ZERO_SHARES";
        case BuyOutcome::INSUFFICIENT_CASH: return "INSUFFICIENT_CASH";
    }
    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// PositionLedger — cash, at most one open position per symbol, and the
// append-only trade log. Cash never goes negative.
// ---------------------------------------------------------------------------
class PositionLedger {
public:
    PositionLedger(double initial_cash, const ExecutionCosts& costs)
        : cash_(initial_cash), costs_(costs) {
        if (!(initial_cash > 0.0) || !std::isfinite(initial_cash)) {
            throw InvalidConfiguration("initial capital must be > 0");
        }
        costs_.validate();
    }

    // Commits `fraction` of current cash to a new position at `price`.
    // shares = floor(cash * fraction / price); executes only when the full
    // cost including commission is covered by cash. Throws
    // InvalidConfiguration for a fraction outside (0, 1].
    BuyOutcome buy(const std::string& symbol, double fraction, double price,
                   uint64_t ts, int bar_idx) {
        if (!(fraction > 0.0 && fraction <= 1.0)) {
            throw InvalidConfiguration("position_size_fraction must be in (0, 1], got " +
                                       std::to_string(fraction));
        }
        if (positions_.count(symbol)) return BuyOutcome::ALREADY_OPEN;
        if (!(price > 0.0) || !std::isfinite(price)) return BuyOutcome::ZERO_SHARES;

        double quotient = std::floor(cash_ * fraction / price);
        if (!(quotient >= 1.0)) return BuyOutcome::ZERO_SHARES;
        if (quotient >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
            throw std::overflow_error(symbol + ": share count out of range");
        }
        int64_t shares = static_cast<int64_t>(quotient);

        double cost = costs_.buy_cost(shares, price);
        if (cash_ < cost) return BuyOutcome::INSUFFICIENT_CASH;

        Position pos;
        pos.symbol = symbol;
        pos.shares = shares;
        pos.entry_price = price;
        pos.entry_ts = ts;
        pos.entry_bar_idx = bar_idx;
        pos.cost_basis = cost;
        positions_.emplace(symbol, pos);
        cash_ -= cost;
        return BuyOutcome::OPENED;
    }

    // Closes the symbol's position at `price`; nullopt when flat.
    std::optional<TradeRecord> sell(const std::string& symbol, double price, uint64_t ts,
                                    int bar_idx, ExitReason reason = ExitReason::SIGNAL) {
        auto it = positions_.find(symbol);
        if (it == positions_.end()) return std::nullopt;
        const Position& pos = it->second;

        TradeRecord t;
        t.symbol = symbol;
        t.shares = pos.shares;
        t.entry_ts = pos.entry_ts;
        t.exit_ts = ts;
        t.entry_price = pos.entry_price;
        t.exit_price = price;
        t.entry_bar_idx = pos.entry_bar_idx;
        t.exit_bar_idx = bar_idx;
        t.bars_held = bar_idx - pos.entry_bar_idx;
        t.cost_basis = pos.cost_basis;
        t.proceeds = costs_.sell_proceeds(pos.shares, price);
        t.gross_pnl = (price - pos.entry_price) * static_cast<double>(pos.shares);
        t.commission = costs_.round_trip_commission(pos.shares, pos.entry_price, price);
        t.realized_profit = t.gross_pnl - t.commission;
        t.return_pct = t.realized_profit /
                       (pos.entry_price * static_cast<double>(pos.shares)) * 100.0;
        t.exit_reason = reason;

        cash_ += t.proceeds;
        positions_.erase(it);
        trade_log_.push_back(t);
        return t;
    }

    bool has_position(const std::string& symbol) const { return positions_.count(symbol) > 0; }

    const Position* position(const std::string& symbol) const {
        auto it = positions_.find(symbol);
        return it == positions_.end() ? nullptr : &it->second;
    }

    int64_t shares_held(const std::string& symbol) const {
        const Position* p = position(symbol);
        return p ? p->shares : 0;
    }

    // cash + shares * mark for the symbol's position (if any).
    double portfolio_value(const std::string& symbol, double mark) const {
        return cash_ + static_cast<double>(shares_held(symbol)) * mark;
    }

    double cash() const { return cash_; }
    const ExecutionCosts& costs() const { return costs_; }
    const std::map<std::string, Position>& open_positions() const { return positions_; }
    const std::vector<TradeRecord>& trade_log() const { return trade_log_; }

private:
    double cash_;
    ExecutionCosts costs_;
    std::map<std::string, Position> positions_;
    std::vector<TradeRecord> trade_log_;
};
