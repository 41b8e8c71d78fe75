#pragma once

#include "bars/bar.hpp"
#include "data/bar_provider.hpp"
#include "errors.hpp"
#include "indicators/indicator_set.hpp"
#include "signals/signal.hpp"
#include "signals/signal_combiner.hpp"
#include "signals/signal_config.hpp"
#include "signals/signal_source.hpp"
#include "signals/strategies.hpp"

#include <spdlog/spdlog.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// SignalGenerator — per-symbol streaming signal generation.
//
// Owns the symbol's IndicatorSet. on_bar() feeds one complete bar and
// returns the combined decision for that bar; nothing after the bar is ever
// visible. A strategy whose indicators are still warming up abstains.
// ---------------------------------------------------------------------------
class SignalGenerator : public SignalSource {
public:
    explicit SignalGenerator(std::string symbol, const SignalConfig& cfg = {})
        : symbol_(std::move(symbol)), cfg_(validated(cfg)), indicators_(cfg.indicators) {}

    // An incomplete bar is not fed to the indicators and yields Hold.
    std::optional<Signal> on_bar(const Bar& bar) override {
        if (!bar.is_complete()) return std::nullopt;
        indicators_.update(bar);
        return evaluate();
    }

    // Every strategy's opinion on the current bar, in priority order.
    std::vector<Candidate> evaluate_candidates() const {
        std::vector<Candidate> out;
        run(cfg_.enable_ma_cross, StrategyKind::MA_CROSS, strategies::ma_cross, out);
        run(cfg_.enable_macd, StrategyKind::MACD, strategies::macd, out);
        run(cfg_.enable_rsi, StrategyKind::RSI, strategies::rsi, out);
        run(cfg_.enable_bollinger, StrategyKind::BOLLINGER, strategies::bollinger, out);
        return out;
    }

    // Combined decision for the current bar; nullopt is Hold.
    std::optional<Signal> evaluate() const {
        if (indicators_.bars_seen() == 0) return std::nullopt;
        auto best = signal_combiner::combine(evaluate_candidates());
        if (!best) return std::nullopt;

        const Bar& bar = indicators_.last_bar();
        Signal s;
        s.symbol = symbol_;
        s.kind = best->kind;
        s.price = bar.close;
        s.timestamp = bar.timestamp;
        s.confidence = best->confidence;
        s.strategy = best->strategy;
        s.indicators = indicators_.snapshot();
        s.reason = std::move(best->reason);
        return s;
    }

    const std::string& symbol() const { return symbol_; }
    const SignalConfig& config() const { return cfg_; }
    const IndicatorSet& indicators() const { return indicators_; }

    void reset() { indicators_.reset(); }

private:
    using StrategyFn = std::optional<Candidate> (*)(const IndicatorSet&, const SignalConfig&);

    static const SignalConfig& validated(const SignalConfig& cfg) {
        cfg.validate();
        return cfg;
    }

    void run(bool enabled, StrategyKind kind, StrategyFn fn, std::vector<Candidate>& out) const {
        if (!enabled) return;
        try {
            if (auto c = fn(indicators_, cfg_)) out.push_back(std::move(*c));
        } catch (const InsufficientData& e) {
            spdlog::trace("{} {}: abstains ({})", symbol_, to_string(kind), e.what());
        }
    }

    std::string symbol_;
    SignalConfig cfg_;
    IndicatorSet indicators_;
};

// ---------------------------------------------------------------------------
// ScreenResult — latest state of one symbol after replaying its lookback
// ---------------------------------------------------------------------------
struct ScreenResult {
    std::string symbol;
    Bar latest_bar;
    IndicatorSnapshot indicators;
    std::vector<Candidate> candidates;
    std::optional<Signal> decision;
    int bars_used = 0;
};

// Replays bars through a fresh generator. Incomplete bars are skipped.
inline ScreenResult screen_bars(const std::string& symbol, const std::vector<Bar>& bars,
                                const SignalConfig& cfg = {}) {
    SignalGenerator gen(symbol, cfg);
    ScreenResult result;
    result.symbol = symbol;
    for (const auto& bar : bars) {
        if (!bar.is_complete()) continue;
        result.decision = gen.on_bar(bar);
        result.latest_bar = bar;
        ++result.bars_used;
    }
    if (result.bars_used == 0) throw DataUnavailable(symbol, "no complete bars");
    result.indicators = gen.indicators().snapshot();
    result.candidates = gen.evaluate_candidates();
    return result;
}

inline ScreenResult screen_symbol(BarProvider& provider, const std::string& symbol,
                                  const SignalConfig& cfg = {}) {
    cfg.validate();
    std::vector<Bar> bars = provider.get_bars(symbol, cfg.lookback_period, cfg.interval);
    return screen_bars(symbol, bars, cfg);
}

// Decision for the most recent bar of the symbol's lookback window.
inline std::optional<Signal> generate_signals(BarProvider& provider, const std::string& symbol,
                                              const SignalConfig& cfg = {}) {
    return screen_symbol(provider, symbol, cfg).decision;
}
