// indicator_export.cpp — Per-bar indicator table for one symbol.
// Every OHLCV bar with all indicators, the warm-up flag and the combined
// decision, written as Parquet (ZSTD) or CSV by output extension.
//
// Usage:
//   indicator_export --symbol AAPL (--csv-dir DIR | --dbn-dir DIR)
//                    --output indicators.parquet [--period max] [--interval 1d]

#include "data/csv_bar_provider.hpp"
#include "data/dbn_bar_provider.hpp"
#include "io/csv_writer.hpp"
#include "io/export_table.hpp"
#include "io/parquet_writer.hpp"
#include "signals/signal_config.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --symbol <SYM> (--csv-dir <dir> | --dbn-dir <dir>) --output <path>\n"
              << "\n"
              << "  --output    Output file path (.csv or .parquet)\n"
              << "  --period    Lookback: 1mo, 3mo, 6mo, 1y, 2y, 5y, max (default: max)\n"
              << "  --interval  Bar interval: 1s, 1m, 1h, 1d (default: 1d)\n"
              << "  --verbose   Debug logging\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string symbol, csv_dir, dbn_dir, output_path;
    SignalConfig cfg;
    cfg.lookback_period = "max";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--symbol" && i + 1 < argc) {
            symbol = argv[++i];
        } else if (arg == "--csv-dir" && i + 1 < argc) {
            csv_dir = argv[++i];
        } else if (arg == "--dbn-dir" && i + 1 < argc) {
            dbn_dir = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            output_path = argv[++i];
        } else if (arg == "--period" && i + 1 < argc) {
            cfg.lookback_period = argv[++i];
        } else if (arg == "--interval" && i + 1 < argc) {
            cfg.interval = argv[++i];
        } else if (arg == "--verbose") {
            spdlog::set_level(spdlog::level::debug);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (symbol.empty() || output_path.empty() || csv_dir.empty() == dbn_dir.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    // Detect output format by file extension
    std::string ext = std::filesystem::path(output_path).extension().string();
    if (ext != ".parquet" && ext != ".csv") {
        std::cerr << "Unsupported output format. Use .csv or .parquet extension.\n";
        return 1;
    }

    std::unique_ptr<BarProvider> provider;
    if (!csv_dir.empty()) {
        provider = std::make_unique<CsvBarProvider>(csv_dir);
    } else {
        provider = std::make_unique<DbnBarProvider>(dbn_dir);
    }

    try {
        cfg.validate();
        std::vector<Bar> bars = provider->get_bars(symbol, cfg.lookback_period, cfg.interval);
        ExportTable table = export_tables::indicator_table(symbol, bars, cfg);
        if (ext == ".parquet") {
            parquet_io::write(table, output_path);
        } else {
            csv_io::write(table, output_path);
        }
        std::cout << "Wrote " << table.num_rows() << " bars x " << table.columns.size()
                  << " columns to " << output_path << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 2;
    }
}
