#pragma once

#include "indicators/rolling.hpp"
#include "indicators/warmup.hpp"

#include <string>

// ---------------------------------------------------------------------------
// MacdState — MACD line = EMA(fast) - EMA(slow), signal = EMA(macd, signal),
// histogram = macd - signal.
//
// The signal EMA only sees MACD values from the bar the slow EMA is defined
// onward, so the signal line is first defined at slow - 1 + signal - 1.
// ---------------------------------------------------------------------------
class MacdState {
public:
    MacdState(int fast, int slow, int signal)
        : fast_(indicator_detail::checked_period("MACD fast", fast)),
          slow_(indicator_detail::checked_period("MACD slow", slow)),
          signal_(indicator_detail::checked_period("MACD signal", signal)),
          line_warmup_("MACD(" + std::to_string(fast) + "," + std::to_string(slow) + ")", slow) {
        if (fast >= slow) {
            throw InvalidConfiguration("MACD fast period (" + std::to_string(fast) +
                                       ") must be below slow period (" +
                                       std::to_string(slow) + ")");
        }
    }

    void update(double close) {
        fast_.update(close);
        slow_.update(close);
        line_warmup_.observe();
        if (slow_.ready()) {
            macd_ = fast_.value() - slow_.value();
            signal_.update(macd_);
        }
    }

    bool ready() const { return slow_.ready(); }
    bool signal_ready() const { return signal_.ready(); }

    double macd() const {
        line_warmup_.require();
        return macd_;
    }

    double signal() const { return signal_.value(); }

    double histogram() const {
        double s = signal();
        return macd_ - s;
    }

    void reset() {
        fast_.reset();
        slow_.reset();
        signal_.reset();
        line_warmup_.reset();
        macd_ = 0.0;
    }

private:
    EmaState fast_;
    EmaState slow_;
    EmaState signal_;
    WarmupTracker line_warmup_;
    double macd_ = 0.0;
};

// ---------------------------------------------------------------------------
// BollingerState — middle = SMA(period), bands at middle +/- k sample stddev
// ---------------------------------------------------------------------------
class BollingerState {
public:
    BollingerState(int period, double num_std)
        : sma_(indicator_detail::checked_period("Bollinger", period, 2)),
          std_(period),
          num_std_(num_std) {
        if (!(num_std > 0.0)) {
            throw InvalidConfiguration("Bollinger std-dev multiplier must be > 0, got " +
                                       std::to_string(num_std));
        }
    }

    void update(double close) {
        sma_.update(close);
        std_.update(close);
    }

    bool ready() const { return sma_.ready(); }

    double middle() const { return sma_.value(); }
    double upper() const { return sma_.value() + num_std_ * std_.value(); }
    double lower() const { return sma_.value() - num_std_ * std_.value(); }
    double bandwidth() const { return 2.0 * num_std_ * std_.value(); }

    void reset() {
        sma_.reset();
        std_.reset();
    }

private:
    SmaState sma_;
    RollingStdState std_;
    double num_std_;
};
