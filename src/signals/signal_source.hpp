#pragma once

#include "bars/bar.hpp"
#include "signals/signal.hpp"

#include <optional>

// ---------------------------------------------------------------------------
// SignalSource — per-bar decision feed consumed by the backtest replay.
// on_bar() sees each complete bar once, in order.
// ---------------------------------------------------------------------------
class SignalSource {
public:
    virtual ~SignalSource() = default;
    virtual std::optional<Signal> on_bar(const Bar& bar) = 0;
};
