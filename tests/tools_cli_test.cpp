// tools_cli_test.cpp — Tests for the run_backtest, generate_signals and
// indicator_export command-line tools
//
// Argument validation, exit codes, and the files each tool writes, run
// against a temporary CSV bar directory.

#include <gtest/gtest.h>

#include "test_tool_helpers.hpp"

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using tool_test_helpers::read_all_lines;
using tool_test_helpers::read_file;
using tool_test_helpers::run_command;
using tool_test_helpers::tool_path;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// 300 daily bars from 2024-01-01 with a slow oscillation.
void write_wave_csv(const std::filesystem::path& path) {
    std::ofstream out(path);
    out << "timestamp,open,high,low,close,volume\n";
    for (int i = 0; i < 300; ++i) {
        long long day = 19723 + i;
        double close = 100.0 + 10.0 * std::sin(i / 8.0) + 0.05 * i;
        out << day * 86400LL * 1000000000LL << "," << close << "," << close + 1.0 << ","
            << close - 1.0 << "," << close << ",1000\n";
    }
}

}  // namespace

class ToolsCliTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = std::filesystem::temp_directory_path() /
              ("tools_cli_test_" +
               std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::create_directories(dir);
        write_wave_csv(dir / "WAVE.csv");
        write_wave_csv(dir / "ALSO.csv");
    }
    void TearDown() override { std::filesystem::remove_all(dir); }

    std::string out_path(const std::string& name) const { return (dir / name).string(); }

    std::filesystem::path dir;
};

// ===========================================================================
// 1. run_backtest
// ===========================================================================

TEST_F(ToolsCliTest, BacktestMissingArgumentsExitsOne) {
    auto r = run_command(tool_path("run_backtest") + " --symbols WAVE");
    EXPECT_EQ(r.exit_code, 1);
    EXPECT_TRUE(contains(r.output, "Usage"));
}

TEST_F(ToolsCliTest, BacktestRejectsBothDataSources) {
    auto r = run_command(tool_path("run_backtest") +
                         " --symbols WAVE --start 2024-01-01 --end 2024-06-30 --csv-dir " +
                         dir.string() + " --dbn-dir " + dir.string());
    EXPECT_EQ(r.exit_code, 1);
}

TEST_F(ToolsCliTest, BacktestBadFractionIsConfigurationError) {
    auto r = run_command(tool_path("run_backtest") +
                         " --symbols WAVE --start 2024-01-01 --end 2024-06-30 --fraction 1.5"
                         " --csv-dir " + dir.string() + " --output " + out_path("r.json"));
    EXPECT_EQ(r.exit_code, 1);
    EXPECT_TRUE(contains(r.output, "position_size_fraction"));
}

TEST_F(ToolsCliTest, BacktestSingleSymbolWritesAllOutputs) {
    auto json = out_path("result.json");
    auto equity = out_path("equity.csv");
    auto trades = out_path("trades.parquet");
    auto r = run_command(tool_path("run_backtest") +
                         " --symbols WAVE --start 2024-01-01 --end 2024-09-30 --fraction 0.2"
                         " --csv-dir " + dir.string() + " --output " + json +
                         " --equity-out " + equity + " --trades-out " + trades);
    ASSERT_EQ(r.exit_code, 0) << r.output;
    EXPECT_TRUE(contains(r.output, "Final capital"));

    std::string text = read_file(json);
    EXPECT_TRUE(contains(text, "\"symbol\":\"WAVE\""));
    EXPECT_TRUE(contains(text, "\"equity_curve\":["));

    auto lines = read_all_lines(equity);
    ASSERT_FALSE(lines.empty());
    EXPECT_EQ(lines[0], "timestamp,cash,shares_held,mark_price,portfolio_value");
    EXPECT_EQ(lines.size(), 275u);  // header + 2024-01-01 .. 2024-09-30
    EXPECT_TRUE(std::filesystem::exists(trades));
}

TEST_F(ToolsCliTest, BacktestBatchReportsPerSymbolFailure) {
    auto json = out_path("batch.json");
    auto r = run_command(tool_path("run_backtest") +
                         " --symbols WAVE,ALSO,NOPE --start 2024-01-01 --end 2024-06-30"
                         " --workers 2 --csv-dir " + dir.string() + " --output " + json);
    ASSERT_EQ(r.exit_code, 0) << r.output;
    EXPECT_TRUE(contains(r.output, "2 of 3 symbols succeeded"));

    std::string text = read_file(json);
    EXPECT_TRUE(contains(text, "\"results\":{\"ALSO\":"));
    EXPECT_TRUE(contains(text, "\"symbol\":\"NOPE\",\"kind\":\"DATA_UNAVAILABLE\""));
}

TEST_F(ToolsCliTest, BacktestAllSymbolsFailingExitsTwo) {
    auto r = run_command(tool_path("run_backtest") +
                         " --symbols NOPE,NADA --start 2024-01-01 --end 2024-06-30"
                         " --csv-dir " + dir.string() + " --output " + out_path("f.json"));
    EXPECT_EQ(r.exit_code, 2);
}

// ===========================================================================
// 2. generate_signals
// ===========================================================================

TEST_F(ToolsCliTest, GenerateSignalsPrintsDecisionPerSymbol) {
    auto json = out_path("signals.json");
    auto r = run_command(tool_path("generate_signals") + " --symbols WAVE,NOPE --period 6mo"
                         " --csv-dir " + dir.string() + " --output " + json + " --all");
    ASSERT_EQ(r.exit_code, 0) << r.output;
    EXPECT_TRUE(contains(r.output, "WAVE"));
    EXPECT_TRUE(contains(r.output, "NOPE     FAILED"));
    EXPECT_TRUE(contains(r.output, "1 failed"));
    EXPECT_TRUE(contains(read_file(json), "\"decision\":"));
}

TEST_F(ToolsCliTest, GenerateSignalsUnknownPeriodFailsSymbol) {
    auto r = run_command(tool_path("generate_signals") + " --symbols WAVE --period 3w"
                         " --csv-dir " + dir.string());
    EXPECT_TRUE(contains(r.output, "INVALID_CONFIGURATION")) << r.output;
}

// ===========================================================================
// 3. indicator_export
// ===========================================================================

TEST_F(ToolsCliTest, IndicatorExportCsv) {
    auto csv = out_path("ind.csv");
    auto r = run_command(tool_path("indicator_export") + " --symbol WAVE --csv-dir " +
                         dir.string() + " --output " + csv);
    ASSERT_EQ(r.exit_code, 0) << r.output;
    auto lines = read_all_lines(csv);
    ASSERT_EQ(lines.size(), 301u);
    EXPECT_EQ(lines[0].rfind("timestamp,date,open,high,low,close,volume,rsi,", 0), 0u);
}

TEST_F(ToolsCliTest, IndicatorExportParquet) {
    auto pq = out_path("ind.parquet");
    auto r = run_command(tool_path("indicator_export") + " --symbol WAVE --period 1y"
                         " --csv-dir " + dir.string() + " --output " + pq);
    ASSERT_EQ(r.exit_code, 0) << r.output;
    std::ifstream f(pq, std::ios::binary);
    char magic[4] = {};
    f.read(magic, 4);
    EXPECT_EQ(std::string(magic, 4), "PAR1");
}

TEST_F(ToolsCliTest, IndicatorExportMissingSymbolExitsTwo) {
    auto r = run_command(tool_path("indicator_export") + " --symbol NOPE --csv-dir " +
                         dir.string() + " --output " + out_path("x.csv"));
    EXPECT_EQ(r.exit_code, 2);
}
