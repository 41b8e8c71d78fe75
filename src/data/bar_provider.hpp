#pragma once

#include "bars/bar.hpp"
#include "data/bar_period.hpp"
#include "errors.hpp"

#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// BarProvider — source of historical OHLCV bars for one symbol.
//
// get_bars() returns bars in strictly increasing timestamp order covering
// `period` (see bar_period::parse) at `interval`, or throws DataUnavailable.
// Implementations must be safe to call from several threads at once.
// ---------------------------------------------------------------------------
class BarProvider {
public:
    virtual ~BarProvider() = default;

    virtual std::vector<Bar> get_bars(const std::string& symbol,
                                      const std::string& period,
                                      const std::string& interval) = 0;

protected:
    static bar_period::Period checked_period(const std::string& symbol,
                                             const std::string& period) {
        auto p = bar_period::parse(period);
        if (!p) throw InvalidConfiguration("unknown period '" + period + "' for " + symbol);
        return *p;
    }

    static void check_interval(const std::string& symbol, const std::string& interval) {
        if (!bar_period::is_valid_interval(interval)) {
            throw InvalidConfiguration("unknown interval '" + interval + "' for " + symbol);
        }
    }

    // Sort check and period trim shared by file-backed providers.
    static std::vector<Bar> finish(const std::string& symbol, std::vector<Bar> bars,
                                   const bar_period::Period& period) {
        if (!is_strictly_ascending(bars)) {
            throw DataUnavailable(symbol, "bar timestamps are not strictly increasing");
        }
        bars = bar_period::trim(bars, period);
        if (bars.empty()) throw DataUnavailable(symbol, "no bars returned");
        return bars;
    }
};
