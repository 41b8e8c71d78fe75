#pragma once

#include "errors.hpp"
#include "indicators/warmup.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <string>

namespace indicator_detail {

inline int checked_period(const std::string& name, int period, int minimum = 1) {
    if (period < minimum) {
        throw InvalidConfiguration(name + " period must be >= " + std::to_string(minimum) +
                                   ", got " + std::to_string(period));
    }
    return period;
}

inline double window_mean(const std::deque<double>& w) {
    double sum = 0.0;
    for (double v : w) sum += v;
    return sum / static_cast<double>(w.size());
}

}  // namespace indicator_detail

// ---------------------------------------------------------------------------
// SmaState — simple moving average over the last `period` values
// ---------------------------------------------------------------------------
class SmaState {
public:
    explicit SmaState(int period)
        : period_(indicator_detail::checked_period("SMA", period)),
          warmup_("SMA(" + std::to_string(period) + ")", period) {}

    void update(double x) {
        window_.push_back(x);
        if (static_cast<int>(window_.size()) > period_) window_.pop_front();
        warmup_.observe();
    }

    bool ready() const { return !warmup_.is_warmup(); }

    double value() const {
        warmup_.require();
        return indicator_detail::window_mean(window_);
    }

    void reset() {
        window_.clear();
        warmup_.reset();
    }

    int period() const { return period_; }

private:
    int period_;
    WarmupTracker warmup_;
    std::deque<double> window_;
};

// ---------------------------------------------------------------------------
// EmaState — exponential moving average, alpha = 2 / (period + 1).
// The recursion is seeded with the first value; outputs count as defined
// once `period` values have been seen. A constant input keeps the average
// exactly constant.
// ---------------------------------------------------------------------------
class EmaState {
public:
    explicit EmaState(int period)
        : period_(indicator_detail::checked_period("EMA", period)),
          alpha_(2.0 / (static_cast<double>(period) + 1.0)),
          warmup_("EMA(" + std::to_string(period) + ")", period) {}

    void update(double x) {
        if (!seeded_) {
            ema_ = x;
            seeded_ = true;
        } else {
            ema_ += alpha_ * (x - ema_);
        }
        warmup_.observe();
    }

    bool ready() const { return !warmup_.is_warmup(); }

    double value() const {
        warmup_.require();
        return ema_;
    }

    void reset() {
        ema_ = 0.0;
        seeded_ = false;
        warmup_.reset();
    }

    int period() const { return period_; }
    double alpha() const { return alpha_; }

private:
    int period_;
    double alpha_;
    WarmupTracker warmup_;
    double ema_ = 0.0;
    bool seeded_ = false;
};

// ---------------------------------------------------------------------------
// RollingStdState — sample standard deviation (n - 1) over `period` values.
// A constant window yields exactly zero.
// ---------------------------------------------------------------------------
class RollingStdState {
public:
    explicit RollingStdState(int period)
        : period_(indicator_detail::checked_period("StdDev", period, 2)),
          warmup_("StdDev(" + std::to_string(period) + ")", period) {}

    void update(double x) {
        window_.push_back(x);
        if (static_cast<int>(window_.size()) > period_) window_.pop_front();
        warmup_.observe();
    }

    bool ready() const { return !warmup_.is_warmup(); }

    double value() const {
        warmup_.require();
        if (std::all_of(window_.begin(), window_.end(),
                        [this](double v) { return v == window_.front(); })) {
            return 0.0;
        }
        double mean = indicator_detail::window_mean(window_);
        double sum_sq = 0.0;
        for (double v : window_) {
            double diff = v - mean;
            sum_sq += diff * diff;
        }
        return std::sqrt(sum_sq / static_cast<double>(window_.size() - 1));
    }

    void reset() {
        window_.clear();
        warmup_.reset();
    }

private:
    int period_;
    WarmupTracker warmup_;
    std::deque<double> window_;
};

// ---------------------------------------------------------------------------
// RollingExtremaState — highest high and lowest low over `period` bars
// ---------------------------------------------------------------------------
class RollingExtremaState {
public:
    explicit RollingExtremaState(int period)
        : period_(indicator_detail::checked_period("Extrema", period)),
          warmup_("Extrema(" + std::to_string(period) + ")", period) {}

    void update(double high, double low) {
        highs_.push_back(high);
        lows_.push_back(low);
        if (static_cast<int>(highs_.size()) > period_) {
            highs_.pop_front();
            lows_.pop_front();
        }
        warmup_.observe();
    }

    bool ready() const { return !warmup_.is_warmup(); }

    double max_high() const {
        warmup_.require();
        return *std::max_element(highs_.begin(), highs_.end());
    }

    double min_low() const {
        warmup_.require();
        return *std::min_element(lows_.begin(), lows_.end());
    }

    void reset() {
        highs_.clear();
        lows_.clear();
        warmup_.reset();
    }

private:
    int period_;
    WarmupTracker warmup_;
    std::deque<double> highs_;
    std::deque<double> lows_;
};
