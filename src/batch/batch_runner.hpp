#pragma once

#include "backtest/backtest_engine.hpp"
#include "backtest/backtest_result.hpp"
#include "backtest/cancellation.hpp"
#include "batch/batch_config.hpp"
#include "batch/worker_pool.hpp"
#include "bars/bar.hpp"
#include "data/bar_provider.hpp"
#include "errors.hpp"
#include "signals/signal_config.hpp"
#include "signals/signal_generator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

// ---------------------------------------------------------------------------
// SymbolFailure — why one symbol of a batch produced no result
// ---------------------------------------------------------------------------
enum class FailureKind { DATA_UNAVAILABLE, INVALID_CONFIGURATION, TIMEOUT, CANCELLED, INTERNAL };

inline const char* to_string(FailureKind k) {
    switch (k) {
        case FailureKind::DATA_UNAVAILABLE:      return "DATA_UNAVAILABLE";
        case FailureKind::INVALID_CONFIGURATION: return "INVALID_CONFIGURATION";
        case FailureKind::TIMEOUT:               return "TIMEOUT";
        case FailureKind::CANCELLED:             return "CANCELLED";
        case FailureKind::INTERNAL:              return "INTERNAL";
    }
    return "UNKNOWN";
}

struct SymbolFailure {
    std::string symbol;
    FailureKind kind = FailureKind::INTERNAL;
    std::string message;
    int attempts = 0;
};

template <typename T>
using SymbolOutcome = std::variant<T, SymbolFailure>;

using BacktestOutcomes = std::map<std::string, SymbolOutcome<BacktestResult>>;
using ScreenOutcomes = std::map<std::string, SymbolOutcome<ScreenResult>>;

template <typename T>
std::vector<SymbolFailure> failures(const std::map<std::string, SymbolOutcome<T>>& outcomes) {
    std::vector<SymbolFailure> out;
    for (const auto& [symbol, outcome] : outcomes) {
        if (const auto* f = std::get_if<SymbolFailure>(&outcome)) out.push_back(*f);
    }
    return out;
}

template <typename T>
std::vector<std::string> successes(const std::map<std::string, SymbolOutcome<T>>& outcomes) {
    std::vector<std::string> out;
    for (const auto& [symbol, outcome] : outcomes) {
        if (std::holds_alternative<T>(outcome)) out.push_back(symbol);
    }
    return out;
}

// ---------------------------------------------------------------------------
// BatchRunner — fans independent per-symbol pipelines out over a bounded
// worker pool and gathers one result-or-failure per symbol.
//
// Each job owns its ledger and indicator state; jobs share only the provider
// and the cancellation token. Provider calls run under fetch_timeout and
// transient failures are retried up to max_retries times with a fixed
// backoff. A single symbol's failure never aborts the batch.
//
// Once cancelled, jobs not yet started report CANCELLED and running replays
// stop at their next bar boundary. The token stays tripped for later batches.
// ---------------------------------------------------------------------------
class BatchRunner {
public:
    BatchRunner(std::shared_ptr<BarProvider> provider, const BatchConfig& batch_cfg = {},
                const BacktestConfig& backtest_cfg = {},
                std::shared_ptr<CancellationToken> token = nullptr)
        : provider_(std::move(provider)),
          batch_cfg_(batch_cfg),
          engine_(backtest_cfg),
          token_(token ? std::move(token) : std::make_shared<CancellationToken>()) {
        if (!provider_) throw InvalidConfiguration("batch runner needs a bar provider");
        batch_cfg_.validate();
    }

    BatchRunner(const BatchRunner&) = delete;
    BatchRunner& operator=(const BatchRunner&) = delete;

    // Waits for provider calls that outlived their timeout.
    ~BatchRunner() {
        std::lock_guard<std::mutex> lock(abandoned_mu_);
        abandoned_.clear();
    }

    // Timed-out provider calls still running in the background.
    size_t abandoned_calls() {
        std::lock_guard<std::mutex> lock(abandoned_mu_);
        return abandoned_.size();
    }

    BacktestOutcomes run_multiple_symbol_backtest(const std::vector<std::string>& symbols,
                                                  const std::string& start_date,
                                                  const std::string& end_date,
                                                  double position_size_fraction) {
        BacktestEngine::check_fraction(position_size_fraction);
        std::pair<uint64_t, uint64_t> range = BacktestEngine::date_range(start_date, end_date);
        const std::string interval = engine_.config().signal.interval;

        spdlog::info("Batch backtest of {} symbols from {} to {}", symbols.size(),
                     start_date, end_date);
        auto outcomes = run_all<BacktestResult>(symbols, [&](const std::string& symbol,
                                                             int& attempts) {
            std::vector<Bar> history = fetch(symbol, "max", interval, attempts);
            return engine_.replay_range(symbol, history, range.first, range.second,
                                        position_size_fraction, token_.get());
        });
        log_summary("backtest", outcomes);
        return outcomes;
    }

    ScreenOutcomes screen_symbols(const std::vector<std::string>& symbols) {
        const SignalConfig& cfg = engine_.config().signal;
        auto outcomes = run_all<ScreenResult>(symbols, [&](const std::string& symbol,
                                                           int& attempts) {
            std::vector<Bar> bars = fetch(symbol, cfg.lookback_period, cfg.interval, attempts);
            if (token_->cancelled()) throw BacktestCancelled(symbol);
            return screen_bars(symbol, bars, cfg);
        });
        log_summary("screen", outcomes);
        return outcomes;
    }

    void cancel() { token_->cancel(); }
    bool cancelled() const { return token_->cancelled(); }
    const std::shared_ptr<CancellationToken>& token() const { return token_; }

    const BatchConfig& batch_config() const { return batch_cfg_; }
    const BacktestEngine& engine() const { return engine_; }

private:
    template <typename T, typename Job>
    std::map<std::string, SymbolOutcome<T>> run_all(const std::vector<std::string>& symbols,
                                                     Job job) {
        std::set<std::string> seen;
        std::vector<std::string> unique;
        for (const auto& s : symbols) {
            if (seen.insert(s).second) unique.push_back(s);
        }

        std::vector<std::optional<SymbolOutcome<T>>> slots(unique.size());
        if (!unique.empty()) {
            int workers = std::min(batch_cfg_.max_workers, static_cast<int>(unique.size()));
            WorkerPool pool(workers);
            for (size_t i = 0; i < unique.size(); ++i) {
                pool.submit([this, &job, &slots, &unique, i] {
                    slots[i] = run_one<T>(unique[i], job);
                });
            }
            pool.wait_idle();
        }

        std::map<std::string, SymbolOutcome<T>> outcomes;
        for (size_t i = 0; i < unique.size(); ++i) {
            outcomes.emplace(unique[i], std::move(*slots[i]));
        }
        return outcomes;
    }

    // Runs one symbol's pipeline, mapping every failure to a SymbolFailure.
    template <typename T, typename Job>
    SymbolOutcome<T> run_one(const std::string& symbol, Job& job) {
        int attempts = 0;
        auto fail = [&](FailureKind kind, const std::string& message) {
            spdlog::warn("{}: {} ({})", symbol, message, to_string(kind));
            return SymbolOutcome<T>{SymbolFailure{symbol, kind, message, attempts}};
        };

        if (token_->cancelled()) return fail(FailureKind::CANCELLED, "cancelled before start");
        try {
            return SymbolOutcome<T>{job(symbol, attempts)};
        } catch (const BacktestCancelled& e) {
            return fail(FailureKind::CANCELLED, e.what());
        } catch (const FetchTimeout& e) {
            return fail(FailureKind::TIMEOUT, e.what());
        } catch (const DataUnavailable& e) {
            return fail(FailureKind::DATA_UNAVAILABLE, e.what());
        } catch (const InvalidConfiguration& e) {
            return fail(FailureKind::INVALID_CONFIGURATION, e.what());
        } catch (const std::exception& e) {
            return fail(FailureKind::INTERNAL, e.what());
        }
    }

    // Provider call with timeout and retry on transient failures.
    std::vector<Bar> fetch(const std::string& symbol, const std::string& period,
                           const std::string& interval, int& attempts) {
        for (;;) {
            if (token_->cancelled()) throw BacktestCancelled(symbol);
            ++attempts;
            try {
                return fetch_once(symbol, period, interval);
            } catch (const DataUnavailable& e) {
                if (!e.transient() || attempts > batch_cfg_.max_retries) throw;
                spdlog::warn("{}: attempt {} failed ({}), retrying in {} ms", symbol, attempts,
                             e.what(), batch_cfg_.retry_backoff.count());
            }
            std::this_thread::sleep_for(batch_cfg_.retry_backoff);
        }
    }

    std::vector<Bar> fetch_once(const std::string& symbol, const std::string& period,
                                const std::string& interval) {
        prune_abandoned();
        std::shared_ptr<BarProvider> provider = provider_;
        auto future = std::async(std::launch::async, [provider, symbol, period, interval] {
            return provider->get_bars(symbol, period, interval);
        });
        if (future.wait_for(batch_cfg_.fetch_timeout) != std::future_status::ready) {
            {
                std::lock_guard<std::mutex> lock(abandoned_mu_);
                abandoned_.push_back(std::move(future));
            }
            throw FetchTimeout(symbol, static_cast<long long>(batch_cfg_.fetch_timeout.count()));
        }
        return future.get();
    }

    // Drops timed-out calls that have since finished.
    void prune_abandoned() {
        std::lock_guard<std::mutex> lock(abandoned_mu_);
        abandoned_.erase(std::remove_if(abandoned_.begin(), abandoned_.end(),
                                        [](const std::future<std::vector<Bar>>& f) {
                                            return f.wait_for(std::chrono::seconds(0)) ==
                                                   std::future_status::ready;
                                        }),
                         abandoned_.end());
    }

    template <typename T>
    static void log_summary(const char* what, const std::map<std::string, SymbolOutcome<T>>& o) {
        size_t failed = failures(o).size();
        spdlog::info("Batch {} finished: {} succeeded, {} failed", what, o.size() - failed,
                     failed);
    }

    std::shared_ptr<BarProvider> provider_;
    BatchConfig batch_cfg_;
    BacktestEngine engine_;
    std::shared_ptr<CancellationToken> token_;

    std::mutex abandoned_mu_;
    std::vector<std::future<std::vector<Bar>>> abandoned_;
};
