#pragma once

#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// InsufficientData — an indicator was asked for a value inside its warm-up
// window. Strategies catch it and abstain.
// ---------------------------------------------------------------------------
class InsufficientData : public std::runtime_error {
public:
    InsufficientData(const std::string& indicator, int have, int need)
        : std::runtime_error(indicator + ": insufficient data (" +
                             std::to_string(have) + " of " +
                             std::to_string(need) + " samples)"),
          have_(have), need_(need) {}

    int have() const { return have_; }
    int need() const { return need_; }

private:
    int have_;
    int need_;
};

// ---------------------------------------------------------------------------
// DataUnavailable — the bar provider failed or returned nothing usable.
// Transient failures (timeouts, flaky sources) are eligible for retry.
// ---------------------------------------------------------------------------
class DataUnavailable : public std::runtime_error {
public:
    DataUnavailable(const std::string& symbol, const std::string& what,
                    bool transient = false)
        : std::runtime_error(symbol + ": " + what),
          symbol_(symbol), transient_(transient) {}

    const std::string& symbol() const { return symbol_; }
    bool transient() const { return transient_; }

private:
    std::string symbol_;
    bool transient_;
};

// ---------------------------------------------------------------------------
// InvalidConfiguration — rejected at construction, never recovered from.
// ---------------------------------------------------------------------------
class InvalidConfiguration : public std::invalid_argument {
public:
    explicit InvalidConfiguration(const std::string& what)
        : std::invalid_argument("invalid configuration: " + what) {}
};

// ---------------------------------------------------------------------------
// BacktestCancelled — raised at a bar boundary once cancellation is requested.
// ---------------------------------------------------------------------------
class BacktestCancelled : public std::runtime_error {
public:
    explicit BacktestCancelled(const std::string& symbol)
        : std::runtime_error(symbol + ": backtest cancelled"), symbol_(symbol) {}

    const std::string& symbol() const { return symbol_; }

private:
    std::string symbol_;
};

// ---------------------------------------------------------------------------
// FetchTimeout — a provider call exceeded the batch fetch timeout. Always
// transient.
// ---------------------------------------------------------------------------
class FetchTimeout : public DataUnavailable {
public:
    FetchTimeout(const std::string& symbol, long long timeout_ms)
        : DataUnavailable(symbol, "fetch timed out after " + std::to_string(timeout_ms) + " ms",
                          true) {}
};
