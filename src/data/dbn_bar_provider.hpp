#pragma once

#include "data/bar_provider.hpp"

#include <databento/dbn_file_store.hpp>
#include <databento/record.hpp>

#include <cstdint>
#include <exception>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// DbnBarProvider — reads <dir>/<SYMBOL>.ohlcv-<interval>.dbn.zst
//
// Every OHLCV record in the file belongs to the symbol. Prices are
// fixed-point with 1e-9 scale.
// ---------------------------------------------------------------------------
class DbnBarProvider : public BarProvider {
public:
    static constexpr double PRICE_SCALE = 1e-9;

    explicit DbnBarProvider(std::filesystem::path dir) : dir_(std::move(dir)) {}

    std::filesystem::path file_for(const std::string& symbol, const std::string& interval) const {
        return dir_ / (symbol + ".ohlcv-" + interval + ".dbn.zst");
    }

    std::vector<Bar> get_bars(const std::string& symbol,
                              const std::string& period,
                              const std::string& interval) override {
        bar_period::Period p = checked_period(symbol, period);
        check_interval(symbol, interval);

        std::filesystem::path path = file_for(symbol, interval);
        if (!std::filesystem::exists(path)) {
            throw DataUnavailable(symbol, "no data file " + path.string());
        }

        std::vector<Bar> bars;
        try {
            databento::DbnFileStore store{path};
            while (const auto* record = store.NextRecord()) {
                if (const auto* ohlcv = record->GetIf<databento::OhlcvMsg>()) {
                    Bar b;
                    b.timestamp = static_cast<uint64_t>(
                        ohlcv->hd.ts_event.time_since_epoch().count());
                    b.open = static_cast<double>(ohlcv->open) * PRICE_SCALE;
                    b.high = static_cast<double>(ohlcv->high) * PRICE_SCALE;
                    b.low = static_cast<double>(ohlcv->low) * PRICE_SCALE;
                    b.close = static_cast<double>(ohlcv->close) * PRICE_SCALE;
                    b.volume = static_cast<double>(ohlcv->volume);
                    bars.push_back(b);
                }
            }
        } catch (const std::exception& e) {
            throw DataUnavailable(symbol, std::string("failed reading ") + path.string() +
                                              ": " + e.what());
        }
        return finish(symbol, std::move(bars), p);
    }

private:
    std::filesystem::path dir_;
};
