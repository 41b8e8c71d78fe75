// run_backtest.cpp — Signal-driven backtest of one symbol or a batch.
// Reads bars from a CSV or DBN directory, replays them through the
// SignalGenerator + PositionLedger, prints a report and writes JSON.
//
// Usage:
//   run_backtest --symbols AAPL[,MSFT,...] --start 2024-01-01 --end 2024-12-31
//                (--csv-dir DIR | --dbn-dir DIR) [--output result.json]
//                [--capital 100000] [--fraction 0.1] [--commission 0.001]
//                [--workers 10] [--equity-out curve.parquet] [--trades-out trades.csv]
//                [--verbose]

#include "backtest/backtest_engine.hpp"
#include "backtest/backtest_result_io.hpp"
#include "batch/batch_runner.hpp"
#include "data/csv_bar_provider.hpp"
#include "data/dbn_bar_provider.hpp"
#include "io/csv_writer.hpp"
#include "io/export_table.hpp"
#include "io/parquet_writer.hpp"
#include "time_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace {

// Parquet when the path ends in .parquet, CSV otherwise.
void write_table(const ExportTable& table, const std::string& path) {
    if (std::filesystem::path(path).extension() == ".parquet") {
        parquet_io::write(table, path);
    } else {
        csv_io::write(table, path);
    }
}

void print_report(const BacktestResult& r) {
    const PerformanceMetrics& m = r.metrics;
    std::printf("=== %s: %s to %s ===\n", r.symbol.c_str(),
                time_utils::format_date(r.start_ts).c_str(),
                time_utils::format_date(r.end_ts).c_str());
    std::printf("  Initial capital: $%.2f\n", r.initial_capital);
    std::printf("  Final capital:   $%.2f\n", r.final_capital);
    std::printf("  Total return:    $%.2f (%.2f%%)\n", m.total_return, m.total_return_pct);
    std::printf("  Max drawdown:    %.2f%%\n", m.max_drawdown);
    std::printf("  Sharpe:          %.3f\n", m.sharpe);
    std::printf("  Trades: %d (won %d, lost %d), win rate %.1f%%\n", m.total_trades,
                m.profitable_trades, m.losing_trades, m.win_rate);
    std::printf("  Profit factor: %.2f, expectancy $%.2f per trade\n", m.profit_factor,
                m.expectancy);
    std::printf("  Bars: %d processed, %d skipped; buys skipped for cash: %d\n",
                r.counters.bars_processed, r.counters.bars_skipped,
                r.counters.buys_skipped_insufficient_cash);

    if (r.trades.empty()) return;
    std::printf("  Last trades:\n");
    size_t first = r.trades.size() > 10 ? r.trades.size() - 10 : 0;
    for (size_t i = first; i < r.trades.size(); ++i) {
        const TradeRecord& t = r.trades[i];
        std::printf("    %s -> %s  %lld sh  %.2f -> %.2f  profit $%.2f (%.2f%%) %s\n",
                    time_utils::format_date(t.entry_ts).c_str(),
                    time_utils::format_date(t.exit_ts).c_str(),
                    static_cast<long long>(t.shares), t.entry_price, t.exit_price,
                    t.realized_profit, t.return_pct, to_string(t.exit_reason));
    }
}

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --symbols <SYM[,SYM...]> --start <YYYY-MM-DD> --end <YYYY-MM-DD>"
                 " (--csv-dir <dir> | --dbn-dir <dir>)\n"
              << "\n"
              << "  --output      JSON result path (default: backtest_result.json)\n"
              << "  --capital     Initial capital (default: 100000)\n"
              << "  --fraction    Position size fraction in (0, 1] (default: 0.1)\n"
              << "  --commission  Commission rate per side (default: 0.001)\n"
              << "  --interval    Bar interval: 1s, 1m, 1h, 1d (default: 1d)\n"
              << "  --workers     Batch worker threads (default: 10)\n"
              << "  --equity-out  Equity curve table (.parquet or .csv), single symbol\n"
              << "  --trades-out  Trade log table (.parquet or .csv), single symbol\n"
              << "  --verbose     Debug logging\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string symbols_arg, start, end, csv_dir, dbn_dir;
    std::string output_path = "backtest_result.json";
    std::string equity_out, trades_out;
    BacktestConfig cfg;
    BatchConfig batch_cfg;
    double fraction = 0.1;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--symbols" && i + 1 < argc) {
                symbols_arg = argv[++i];
            } else if (arg == "--start" && i + 1 < argc) {
                start = argv[++i];
            } else if (arg == "--end" && i + 1 < argc) {
                end = argv[++i];
            } else if (arg == "--csv-dir" && i + 1 < argc) {
                csv_dir = argv[++i];
            } else if (arg == "--dbn-dir" && i + 1 < argc) {
                dbn_dir = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                output_path = argv[++i];
            } else if (arg == "--capital" && i + 1 < argc) {
                cfg.initial_capital = std::stod(argv[++i]);
            } else if (arg == "--fraction" && i + 1 < argc) {
                fraction = std::stod(argv[++i]);
            } else if (arg == "--commission" && i + 1 < argc) {
                cfg.costs.commission_rate = std::stod(argv[++i]);
            } else if (arg == "--interval" && i + 1 < argc) {
                cfg.signal.interval = argv[++i];
            } else if (arg == "--workers" && i + 1 < argc) {
                batch_cfg.max_workers = std::stoi(argv[++i]);
            } else if (arg == "--equity-out" && i + 1 < argc) {
                equity_out = argv[++i];
            } else if (arg == "--trades-out" && i + 1 < argc) {
                trades_out = argv[++i];
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
    if (symbols.empty() || start.empty() || end.empty()) {
        std::cerr << "Missing required argument: --symbols, --start and --end\n";
        print_usage(argv[0]);
        return 1;
    }
    if (csv_dir.empty() == dbn_dir.empty()) {
        std::cerr << "Exactly one of --csv-dir or --dbn-dir is required\n";
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
        std::string json;
        int exit_code = 0;

        if (symbols.size() == 1) {
            BacktestEngine engine(cfg);
            BacktestResult result = engine.run_backtest(*provider, symbols.front(), start, end,
                                                        fraction);
            print_report(result);
            json = backtest_io::to_json(result, /*include_equity_curve=*/true);
            if (!equity_out.empty()) {
                write_table(export_tables::equity_table(result), equity_out);
                std::cout << "Equity curve written to " << equity_out << "\n";
            }
            if (!trades_out.empty()) {
                write_table(export_tables::trade_table(result), trades_out);
                std::cout << "Trade log written to " << trades_out << "\n";
            }
        } else {
            BatchRunner runner(provider, batch_cfg, cfg);
            BacktestOutcomes outcomes = runner.run_multiple_symbol_backtest(symbols, start, end,
                                                                            fraction);
            for (const auto& [symbol, outcome] : outcomes) {
                if (const auto* r = std::get_if<BacktestResult>(&outcome)) {
                    print_report(*r);
                } else {
                    const auto& f = std::get<SymbolFailure>(outcome);
                    std::printf("=== %s: FAILED (%s) %s\n", symbol.c_str(), to_string(f.kind),
                                f.message.c_str());
                }
            }
            std::vector<SymbolFailure> failed = failures(outcomes);
            std::printf("\n%zu of %zu symbols succeeded\n", outcomes.size() - failed.size(),
                        outcomes.size());
            if (failed.size() == outcomes.size()) exit_code = 2;
            json = backtest_io::to_json(outcomes);
        }

        std::ofstream out(output_path);
        if (!out.is_open()) {
            std::cerr << "Cannot open output file: " << output_path << "\n";
            return 1;
        }
        out << json << "\n";
        std::cout << "Results written to " << output_path << "\n";
        return exit_code;
    } catch (const InvalidConfiguration& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 2;
    }
}
