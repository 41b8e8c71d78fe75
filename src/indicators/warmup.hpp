#pragma once

#include "errors.hpp"

#include <string>
#include <utility>

// ---------------------------------------------------------------------------
// WarmupTracker — counts samples fed to an indicator and guards value access
// until the lookback window is full.
// ---------------------------------------------------------------------------
class WarmupTracker {
public:
    WarmupTracker(std::string indicator, int required)
        : indicator_(std::move(indicator)), required_(required) {}

    void observe() { ++seen_; }
    void reset() { seen_ = 0; }

    bool is_warmup() const { return seen_ < required_; }
    int seen() const { return seen_; }
    int required() const { return required_; }

    // Throws InsufficientData while still warming up.
    void require() const {
        if (is_warmup()) throw InsufficientData(indicator_, seen_, required_);
    }

private:
    std::string indicator_;
    int required_;
    int seen_ = 0;
};
