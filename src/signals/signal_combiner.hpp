#pragma once

#include "signals/signal.hpp"

#include <optional>
#include <vector>

// ---------------------------------------------------------------------------
// Candidate combination — reduces the strategies' opinions for one bar to at
// most one decision.
//
// With candidates on both sides the single best across the union wins; with
// one side only its best wins. "Best" is the highest confidence, ties broken
// by StrategyKind priority (MA_CROSS > MACD > RSI > BOLLINGER).
// ---------------------------------------------------------------------------
namespace signal_combiner {

inline bool outranks(const Candidate& a, const Candidate& b) {
    if (a.confidence != b.confidence) return a.confidence > b.confidence;
    return priority_rank(a.strategy) < priority_rank(b.strategy);
}

inline std::optional<Candidate> best_of(const std::vector<Candidate>& side) {
    std::optional<Candidate> best;
    for (const auto& c : side) {
        if (!best || outranks(c, *best)) best = c;
    }
    return best;
}

inline std::optional<Candidate> combine(const std::vector<Candidate>& candidates) {
    std::vector<Candidate> buys;
    std::vector<Candidate> sells;
    for (const auto& c : candidates) {
        switch (c.kind) {
            case SignalKind::BUY: buys.push_back(c); break;
            case SignalKind::SELL: sells.push_back(c); break;
        }
    }

    if (buys.empty() && sells.empty()) return std::nullopt;
    if (sells.empty()) return best_of(buys);
    if (buys.empty()) return best_of(sells);

    auto best_buy = best_of(buys);
    auto best_sell = best_of(sells);
    return outranks(*best_buy, *best_sell) ? best_buy : best_sell;
}

}  // namespace signal_combiner
