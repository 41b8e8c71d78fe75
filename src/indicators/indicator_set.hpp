#pragma once

#include "bars/bar.hpp"
#include "errors.hpp"
#include "indicators/crossover.hpp"
#include "indicators/oscillators.hpp"
#include "indicators/rolling.hpp"
#include "indicators/trend.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

// ---------------------------------------------------------------------------
// IndicatorConfig — lookback parameters for every indicator in the set
// ---------------------------------------------------------------------------
struct IndicatorConfig {
    int rsi_period = 14;
    int macd_fast = 12;
    int macd_slow = 26;
    int macd_signal = 9;
    int bb_period = 20;
    double bb_std_dev = 2.0;
    int sma_short = 10;
    int sma_long = 50;
    int stoch_k = 14;
    int stoch_d = 3;
    int williams_period = 14;
    int atr_period = 14;

    void validate() const {
        auto positive = [](const char* name, int v) {
            if (v <= 0) {
                throw InvalidConfiguration(std::string(name) + " must be > 0, got " +
                                           std::to_string(v));
            }
        };
        positive("rsi_period", rsi_period);
        positive("macd_fast", macd_fast);
        positive("macd_slow", macd_slow);
        positive("macd_signal", macd_signal);
        positive("bb_period", bb_period);
        positive("sma_short", sma_short);
        positive("sma_long", sma_long);
        positive("stoch_k", stoch_k);
        positive("stoch_d", stoch_d);
        positive("williams_period", williams_period);
        positive("atr_period", atr_period);
        if (bb_period < 2) {
            throw InvalidConfiguration("bb_period must be >= 2 for a sample stddev");
        }
        if (!(bb_std_dev > 0.0)) {
            throw InvalidConfiguration("bb_std_dev must be > 0");
        }
        if (macd_fast >= macd_slow) {
            throw InvalidConfiguration("macd_fast must be below macd_slow");
        }
        if (sma_short >= sma_long) {
            throw InvalidConfiguration("sma_short must be below sma_long");
        }
    }
};

// ---------------------------------------------------------------------------
// IndicatorSnapshot — every indicator value at one bar, NaN when undefined.
// prev_* fields hold the previous bar's values used for crossover checks.
// ---------------------------------------------------------------------------
struct IndicatorSnapshot {
    static constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

    uint64_t timestamp = 0;
    double close = NaN;

    double rsi = NaN;
    double macd = NaN;
    double macd_signal = NaN;
    double macd_histogram = NaN;
    double bb_upper = NaN;
    double bb_middle = NaN;
    double bb_lower = NaN;
    double sma_short = NaN;
    double sma_long = NaN;
    double stoch_k = NaN;
    double stoch_d = NaN;
    double williams_r = NaN;
    double atr = NaN;

    double prev_macd = NaN;
    double prev_macd_signal = NaN;
    double prev_sma_short = NaN;
    double prev_sma_long = NaN;
};

// ---------------------------------------------------------------------------
// IndicatorSet — all incremental indicator states for one symbol.
//
// update() consumes one complete bar. Accessors of the underlying states
// throw InsufficientData during their warm-up; snapshot() never throws.
// ---------------------------------------------------------------------------
class IndicatorSet {
public:
    explicit IndicatorSet(const IndicatorConfig& cfg = {})
        : cfg_(validated(cfg)),
          rsi_(cfg.rsi_period),
          macd_(cfg.macd_fast, cfg.macd_slow, cfg.macd_signal),
          bollinger_(cfg.bb_period, cfg.bb_std_dev),
          sma_short_(cfg.sma_short),
          sma_long_(cfg.sma_long),
          stochastic_(cfg.stoch_k, cfg.stoch_d),
          williams_r_(cfg.williams_period),
          atr_(cfg.atr_period) {}

    void update(const Bar& bar) {
        prev_macd_ = current_.macd;
        prev_macd_signal_ = current_.macd_signal;
        prev_sma_short_ = current_.sma_short;
        prev_sma_long_ = current_.sma_long;

        rsi_.update(bar.close);
        macd_.update(bar.close);
        bollinger_.update(bar.close);
        sma_short_.update(bar.close);
        sma_long_.update(bar.close);
        stochastic_.update(bar.high, bar.low, bar.close);
        williams_r_.update(bar.high, bar.low, bar.close);
        atr_.update(bar.high, bar.low, bar.close);

        last_bar_ = bar;
        ++bars_seen_;
        current_ = build_snapshot();
    }

    const IndicatorConfig& config() const { return cfg_; }
    int bars_seen() const { return bars_seen_; }
    const Bar& last_bar() const { return last_bar_; }

    const RsiState& rsi() const { return rsi_; }
    const MacdState& macd() const { return macd_; }
    const BollingerState& bollinger() const { return bollinger_; }
    const SmaState& sma_short() const { return sma_short_; }
    const SmaState& sma_long() const { return sma_long_; }
    const StochasticState& stochastic() const { return stochastic_; }
    const WilliamsRState& williams_r() const { return williams_r_; }
    const AtrState& atr() const { return atr_; }

    // Short SMA against long SMA between the previous and current bar.
    CrossDirection ma_cross() const {
        return detect_cross(prev_sma_short_, prev_sma_long_,
                            sma_short_.value(), sma_long_.value());
    }

    // MACD line against its signal line between the previous and current bar.
    CrossDirection macd_cross() const {
        return detect_cross(prev_macd_, prev_macd_signal_,
                            macd_.macd(), macd_.signal());
    }

    const IndicatorSnapshot& snapshot() const { return current_; }

    void reset() {
        rsi_.reset();
        macd_.reset();
        bollinger_.reset();
        sma_short_.reset();
        sma_long_.reset();
        stochastic_.reset();
        williams_r_.reset();
        atr_.reset();
        last_bar_ = Bar{};
        bars_seen_ = 0;
        current_ = IndicatorSnapshot{};
        prev_macd_ = IndicatorSnapshot::NaN;
        prev_macd_signal_ = IndicatorSnapshot::NaN;
        prev_sma_short_ = IndicatorSnapshot::NaN;
        prev_sma_long_ = IndicatorSnapshot::NaN;
    }

private:
    static const IndicatorConfig& validated(const IndicatorConfig& cfg) {
        cfg.validate();
        return cfg;
    }

    IndicatorSnapshot build_snapshot() const {
        IndicatorSnapshot s;
        s.timestamp = last_bar_.timestamp;
        s.close = last_bar_.close;
        if (rsi_.ready()) s.rsi = rsi_.value();
        if (macd_.ready()) s.macd = macd_.macd();
        if (macd_.signal_ready()) {
            s.macd_signal = macd_.signal();
            s.macd_histogram = macd_.histogram();
        }
        if (bollinger_.ready()) {
            s.bb_upper = bollinger_.upper();
            s.bb_middle = bollinger_.middle();
            s.bb_lower = bollinger_.lower();
        }
        if (sma_short_.ready()) s.sma_short = sma_short_.value();
        if (sma_long_.ready()) s.sma_long = sma_long_.value();
        if (stochastic_.ready()) s.stoch_k = stochastic_.k();
        if (stochastic_.d_ready()) s.stoch_d = stochastic_.d();
        if (williams_r_.ready()) s.williams_r = williams_r_.value();
        if (atr_.ready()) s.atr = atr_.value();
        s.prev_macd = prev_macd_;
        s.prev_macd_signal = prev_macd_signal_;
        s.prev_sma_short = prev_sma_short_;
        s.prev_sma_long = prev_sma_long_;
        return s;
    }

    IndicatorConfig cfg_;
    RsiState rsi_;
    MacdState macd_;
    BollingerState bollinger_;
    SmaState sma_short_;
    SmaState sma_long_;
    StochasticState stochastic_;
    WilliamsRState williams_r_;
    AtrState atr_;

    Bar last_bar_;
    int bars_seen_ = 0;
    IndicatorSnapshot current_;
    double prev_macd_ = IndicatorSnapshot::NaN;
    double prev_macd_signal_ = IndicatorSnapshot::NaN;
    double prev_sma_short_ = IndicatorSnapshot::NaN;
    double prev_sma_long_ = IndicatorSnapshot::NaN;
};
