#pragma once

#include "indicators/rolling.hpp"
#include "indicators/warmup.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <string>

// ---------------------------------------------------------------------------
// RsiState — relative strength index from the mean gain and mean loss of
// the last `period` close-to-close changes. Needs period + 1 closes.
// A window without losses reports exactly 100.
// ---------------------------------------------------------------------------
class RsiState {
public:
    explicit RsiState(int period)
        : period_(indicator_detail::checked_period("RSI", period)),
          warmup_("RSI(" + std::to_string(period) + ")", period) {}

    void update(double close) {
        if (has_prev_) {
            double delta = close - prev_close_;
            gains_.push_back(delta > 0.0 ? delta : 0.0);
            losses_.push_back(delta < 0.0 ? -delta : 0.0);
            if (static_cast<int>(gains_.size()) > period_) {
                gains_.pop_front();
                losses_.pop_front();
            }
            warmup_.observe();
        }
        prev_close_ = close;
        has_prev_ = true;
    }

    bool ready() const { return !warmup_.is_warmup(); }

    double avg_gain() const {
        warmup_.require();
        return indicator_detail::window_mean(gains_);
    }

    double avg_loss() const {
        warmup_.require();
        return indicator_detail::window_mean(losses_);
    }

    double value() const {
        double gain = avg_gain();
        double loss = avg_loss();
        if (loss == 0.0) return 100.0;
        double rs = gain / loss;
        return 100.0 - 100.0 / (1.0 + rs);
    }

    void reset() {
        gains_.clear();
        losses_.clear();
        has_prev_ = false;
        prev_close_ = 0.0;
        warmup_.reset();
    }

private:
    int period_;
    WarmupTracker warmup_;
    std::deque<double> gains_;
    std::deque<double> losses_;
    double prev_close_ = 0.0;
    bool has_prev_ = false;
};

// ---------------------------------------------------------------------------
// StochasticState — %K over k bars, %D = SMA(%K, d).
// A zero high-low range puts %K at the midpoint (50).
// ---------------------------------------------------------------------------
class StochasticState {
public:
    StochasticState(int k_period, int d_period)
        : extrema_(indicator_detail::checked_period("Stochastic %K", k_period)),
          d_sma_(indicator_detail::checked_period("Stochastic %D", d_period)),
          k_warmup_("Stochastic %K(" + std::to_string(k_period) + ")", k_period) {}

    void update(double high, double low, double close) {
        extrema_.update(high, low);
        k_warmup_.observe();
        if (extrema_.ready()) {
            double max_high = extrema_.max_high();
            double min_low = extrema_.min_low();
            double range = max_high - min_low;
            k_ = (range > 0.0) ? (close - min_low) / range * 100.0 : 50.0;
            d_sma_.update(k_);
        }
    }

    bool ready() const { return extrema_.ready(); }
    bool d_ready() const { return d_sma_.ready(); }

    double k() const {
        k_warmup_.require();
        return k_;
    }

    double d() const { return d_sma_.value(); }

    void reset() {
        extrema_.reset();
        d_sma_.reset();
        k_warmup_.reset();
        k_ = 0.0;
    }

private:
    RollingExtremaState extrema_;
    SmaState d_sma_;
    WarmupTracker k_warmup_;
    double k_ = 0.0;
};

// ---------------------------------------------------------------------------
// WilliamsRState — -100 * (max_high - close) / (max_high - min_low)
// A zero high-low range reports the midpoint (-50).
// ---------------------------------------------------------------------------
class WilliamsRState {
public:
    explicit WilliamsRState(int period)
        : extrema_(indicator_detail::checked_period("Williams %R", period)) {}

    void update(double high, double low, double close) {
        extrema_.update(high, low);
        close_ = close;
    }

    bool ready() const { return extrema_.ready(); }

    double value() const {
        double max_high = extrema_.max_high();
        double min_low = extrema_.min_low();
        double range = max_high - min_low;
        if (range <= 0.0) return -50.0;
        return -100.0 * (max_high - close_) / range;
    }

    void reset() {
        extrema_.reset();
        close_ = 0.0;
    }

private:
    RollingExtremaState extrema_;
    double close_ = 0.0;
};

// ---------------------------------------------------------------------------
// AtrState — simple mean of the true range over `period` bars.
// The first bar has no previous close, so its true range is high - low.
// ---------------------------------------------------------------------------
class AtrState {
public:
    explicit AtrState(int period)
        : tr_sma_(indicator_detail::checked_period("ATR", period)) {}

    static double true_range(double high, double low, double prev_close) {
        return std::max({high - low, std::abs(high - prev_close), std::abs(low - prev_close)});
    }

    void update(double high, double low, double close) {
        double tr = has_prev_ ? true_range(high, low, prev_close_) : high - low;
        tr_sma_.update(tr);
        prev_close_ = close;
        has_prev_ = true;
    }

    bool ready() const { return tr_sma_.ready(); }
    double value() const { return tr_sma_.value(); }

    void reset() {
        tr_sma_.reset();
        prev_close_ = 0.0;
        has_prev_ = false;
    }

private:
    SmaState tr_sma_;
    double prev_close_ = 0.0;
    bool has_prev_ = false;
};
