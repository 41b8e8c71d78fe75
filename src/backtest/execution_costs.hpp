#pragma once

#include "errors.hpp"

#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// ExecutionCosts — proportional commission charged on each side of a trade
// ---------------------------------------------------------------------------
struct ExecutionCosts {
    double commission_rate = 0.001;

    // Cash debited for a buy: notional plus commission.
    double buy_cost(int64_t shares, double price) const {
        return static_cast<double>(shares) * price * (1.0 + commission_rate);
    }

    // Cash credited for a sell: notional less commission.
    double sell_proceeds(int64_t shares, double price) const {
        return static_cast<double>(shares) * price * (1.0 - commission_rate);
    }

    double per_side_commission(int64_t shares, double price) const {
        return static_cast<double>(shares) * price * commission_rate;
    }

    double round_trip_commission(int64_t shares, double entry_price, double exit_price) const {
        return per_side_commission(shares, entry_price) + per_side_commission(shares, exit_price);
    }

    void validate() const {
        if (!(commission_rate >= 0.0) || commission_rate >= 1.0) {
            throw InvalidConfiguration("commission_rate must be in [0, 1), got " +
                                       std::to_string(commission_rate));
        }
    }
};
