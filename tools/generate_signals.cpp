// generate_signals.cpp — Screens a list of symbols and prints the combined
// BUY/SELL/HOLD decision for each one's most recent bar.
//
// Usage:
//   generate_signals --symbols AAPL,MSFT,... (--csv-dir DIR | --dbn-dir DIR)
//                    [--period 6mo] [--interval 1d] [--workers 10]
//                    [--output signals.json] [--all] [--verbose]

#include "backtest/backtest_engine.hpp"
#include "backtest/backtest_result_io.hpp"
#include "batch/batch_runner.hpp"
#include "data/csv_bar_provider.hpp"
#include "data/dbn_bar_provider.hpp"
#include "time_utils.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace {

void print_screen(const ScreenResult& r, bool show_candidates) {
    const IndicatorSnapshot& s = r.indicators;
    std::printf("%-8s %s  close %10.2f  ", r.symbol.c_str(),
                time_utils::format_date(r.latest_bar.timestamp).c_str(), r.latest_bar.close);
    if (r.decision) {
        std::printf("%-4s conf %.2f  [%s] %s\n", to_string(r.decision->kind),
                    r.decision->confidence, to_string(r.decision->strategy),
                    r.decision->reason.c_str());
    } else {
        std::printf("HOLD\n");
    }
    if (!show_candidates) return;
    std::printf("         RSI %.2f  MACD %.4f/%.4f  BB %.2f/%.2f/%.2f  SMA %.2f/%.2f\n", s.rsi,
                s.macd, s.macd_signal, s.bb_lower, s.bb_middle, s.bb_upper, s.sma_short,
                s.sma_long);
    for (const auto& c : r.candidates) {
        std::printf("         candidate %-9s %-4s conf %.2f  %s\n", to_string(c.strategy),
                    to_string(c.kind), c.confidence, c.reason.c_str());
    }
}

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --symbols <SYM[,SYM...]> (--csv-dir <dir> | --dbn-dir <dir>)\n"
              << "\n"
              << "  --period    Lookback: 1mo, 3mo, 6mo, 1y, 2y, 5y, max (default: 6mo)\n"
              << "  --interval  Bar interval: 1s, 1m, 1h, 1d (default: 1d)\n"
              << "  --workers   Worker threads (default: 10)\n"
              << "  --output    JSON output path\n"
              << "  --all       Print indicators and every strategy candidate\n"
              << "  --verbose   Debug logging\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string symbols_arg, csv_dir, dbn_dir, output_path;
    BacktestConfig cfg;
    BatchConfig batch_cfg;
    bool show_all = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--symbols" && i + 1 < argc) {
                symbols_arg = argv[++i];
            } else if (arg == "--csv-dir" && i + 1 < argc) {
                csv_dir = argv[++i];
            } else if (arg == "--dbn-dir" && i + 1 < argc) {
                dbn_dir = argv[++i];
            } else if (arg == "--period" && i + 1 < argc) {
                cfg.signal.lookback_period = argv[++i];
            } else if (arg == "--interval" && i + 1 < argc) {
                cfg.signal.interval = argv[++i];
            } else if (arg == "--workers" && i + 1 < argc) {
                batch_cfg.max_workers = std::stoi(argv[++i]);
            } else if (arg == "--output" && i + 1 < argc) {
                output_path = argv[++i];
            } else if (arg == "--all") {
                show_all = true;
            } else if (arg == "--verbose") {
                spdlog::set_level(spdlog::level::debug);
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Bad numeric argument: " << e.what() << "\n";
        return 1;
    }

    std::vector<std::string> symbols = split_symbol_list(symbols_arg);
    if (symbols.empty() || csv_dir.empty() == dbn_dir.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    std::shared_ptr<BarProvider> provider;
    if (!csv_dir.empty()) {
        provider = std::make_shared<CsvBarProvider>(csv_dir);
    } else {
        provider = std::make_shared<DbnBarProvider>(dbn_dir);
    }

    try {
        BatchRunner runner(provider, batch_cfg, cfg);
        ScreenOutcomes outcomes = runner.screen_symbols(symbols);

        int buys = 0, sells = 0, holds = 0;
        for (const auto& [symbol, outcome] : outcomes) {
            if (const auto* r = std::get_if<ScreenResult>(&outcome)) {
                print_screen(*r, show_all);
                if (!r->decision) ++holds;
                else if (r->decision->kind == SignalKind::BUY) ++buys;
                else ++sells;
            } else {
                const auto& f = std::get<SymbolFailure>(outcome);
                std::printf("%-8s FAILED (%s) %s\n", symbol.c_str(), to_string(f.kind),
                            f.message.c_str());
            }
        }
        std::printf("\n%d BUY, %d SELL, %d HOLD, %zu failed\n", buys, sells, holds,
                    failures(outcomes).size());

        if (!output_path.empty()) {
            std::ofstream out(output_path);
            if (!out.is_open()) {
                std::cerr << "Cannot open output file: " << output_path << "\n";
                return 1;
            }
            out << backtest_io::to_json(outcomes) << "\n";
            std::cout << "Signals written to " << output_path << "\n";
        }
        return 0;
    } catch (const InvalidConfiguration& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 2;
    }
}
