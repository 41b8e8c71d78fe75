#pragma once

#include "data/bar_provider.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// MemoryBarProvider — serves bars from an in-memory symbol map.
//
// Failures can be scripted per symbol: a permanent DataUnavailable, a number
// of transient failures before success, or an artificial delay per call.
// ---------------------------------------------------------------------------
class MemoryBarProvider : public BarProvider {
public:
    void set_bars(const std::string& symbol, std::vector<Bar> bars) {
        std::lock_guard<std::mutex> lock(mu_);
        bars_[symbol] = std::move(bars);
    }

    void fail_always(const std::string& symbol, std::string message = "provider error") {
        std::lock_guard<std::mutex> lock(mu_);
        Script& s = script_[symbol];
        s.fail_always = true;
        s.permanent_error = std::move(message);
    }

    void fail_transient(const std::string& symbol, int times) {
        std::lock_guard<std::mutex> lock(mu_);
        script_[symbol].transient_failures = times;
    }

    void set_delay(const std::string& symbol, std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mu_);
        script_[symbol].delay = delay;
    }

    int call_count(const std::string& symbol) const {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = calls_.find(symbol);
        return it == calls_.end() ? 0 : it->second;
    }

    std::vector<Bar> get_bars(const std::string& symbol,
                              const std::string& period,
                              const std::string& interval) override {
        bar_period::Period p = checked_period(symbol, period);
        check_interval(symbol, interval);

        std::chrono::milliseconds delay{0};
        std::vector<Bar> bars;
        {
            std::lock_guard<std::mutex> lock(mu_);
            ++calls_[symbol];
            auto sit = script_.find(symbol);
            if (sit != script_.end()) {
                Script& s = sit->second;
                if (s.fail_always) {
                    throw DataUnavailable(symbol, s.permanent_error);
                }
                if (s.transient_failures > 0) {
                    --s.transient_failures;
                    throw DataUnavailable(symbol, "transient provider error", true);
                }
                delay = s.delay;
            }
            auto it = bars_.find(symbol);
            if (it == bars_.end()) throw DataUnavailable(symbol, "unknown symbol");
            bars = it->second;
        }

        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        return finish(symbol, std::move(bars), p);
    }

private:
    struct Script {
        bool fail_always = false;
        std::string permanent_error;
        int transient_failures = 0;
        std::chrono::milliseconds delay{0};
    };

    mutable std::mutex mu_;
    std::map<std::string, std::vector<Bar>> bars_;
    std::map<std::string, Script> script_;
    std::map<std::string, int> calls_;
};
