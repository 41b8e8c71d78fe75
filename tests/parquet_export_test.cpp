// parquet_export_test.cpp — Tests for the Parquet and CSV table writers
//
// Schema and row counts of the indicator, equity and trade tables, a
// Parquet read-back of values, ZSTD compression, and CSV formatting.

#include <gtest/gtest.h>

// Arrow/Parquet reader to validate written files
#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/reader.h>
#include <parquet/file_reader.h>
#include <parquet/metadata.h>

#include "backtest/backtest_engine.hpp"
#include "io/csv_writer.hpp"
#include "io/export_table.hpp"
#include "io/parquet_writer.hpp"
#include "test_bar_helpers.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

std::string temp_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() / ("parquet_export_test_" + name)).string();
}

std::shared_ptr<arrow::Table> read_parquet_table(const std::string& path) {
    auto open_result = arrow::io::ReadableFile::Open(path);
    if (!open_result.ok()) return nullptr;

    auto file_reader_result = parquet::arrow::OpenFile(
        open_result.ValueOrDie(), arrow::default_memory_pool());
    if (!file_reader_result.ok()) return nullptr;
    auto reader = file_reader_result.MoveValueUnsafe();

    std::shared_ptr<arrow::Table> table;
    if (!reader->ReadTable(&table).ok()) return nullptr;
    return table;
}

std::shared_ptr<parquet::FileMetaData> read_parquet_metadata(const std::string& path) {
    auto open_result = arrow::io::ReadableFile::Open(path);
    if (!open_result.ok()) return nullptr;
    auto file_reader = parquet::ParquetFileReader::Open(open_result.ValueOrDie());
    if (!file_reader) return nullptr;
    return file_reader->metadata();
}

std::vector<std::string> read_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

const ExportColumn* find_column(const ExportTable& t, const std::string& name) {
    for (const auto& c : t.columns) {
        if (c.name == name) return &c;
    }
    return nullptr;
}

}  // namespace

// ===========================================================================
// 1. Export tables
// ===========================================================================

TEST(ExportTableTest, IndicatorTableShape) {
    auto bars = test_helpers::make_wave_series(60);
    ExportTable t = export_tables::indicator_table("W", bars);
    EXPECT_NO_THROW(t.check());
    EXPECT_EQ(t.num_rows(), 60u);
    ASSERT_EQ(t.columns.size(), 24u);
    EXPECT_EQ(t.columns.front().name, "timestamp");
    EXPECT_EQ(t.columns[1].name, "date");
    EXPECT_EQ(t.columns[7].name, "rsi");
    EXPECT_EQ(t.columns.back().name, "confidence");
}

TEST(ExportTableTest, IndicatorTableWarmupFlag) {
    ExportTable t = export_tables::indicator_table("W", test_helpers::make_wave_series(60));
    const ExportColumn* warmup = find_column(t, "is_warmup");
    ASSERT_NE(warmup, nullptr);
    EXPECT_TRUE(warmup->bools[0]);
    EXPECT_TRUE(warmup->bools[48]);   // SMA50 still undefined
    EXPECT_FALSE(warmup->bools[49]);
}

TEST(ExportTableTest, IncompleteBarKeepsRowAsSkip) {
    auto bars = test_helpers::make_wave_series(60);
    bars[40] = test_helpers::make_nan_bar(40);
    ExportTable t = export_tables::indicator_table("W", bars);
    EXPECT_EQ(t.num_rows(), 60u);

    const ExportColumn* decision = find_column(t, "decision");
    const ExportColumn* rsi = find_column(t, "rsi");
    ASSERT_NE(decision, nullptr);
    ASSERT_NE(rsi, nullptr);
    EXPECT_EQ(decision->strings[40], "SKIP");
    EXPECT_TRUE(std::isnan(rsi->doubles[40]));
    EXPECT_NE(decision->strings[41], "SKIP");
    EXPECT_FALSE(std::isnan(rsi->doubles[41]));
}

TEST(ExportTableTest, RaggedColumnsRejected) {
    ExportTable t;
    t.add("a", ExportColumn::Type::INT64).ints = {1, 2};
    t.add("b", ExportColumn::Type::FLOAT64).doubles = {1.0};
    EXPECT_THROW(t.check(), std::runtime_error);
}

class BacktestExportTest : public ::testing::Test {
protected:
    void SetUp() override {
        BacktestEngine engine;
        result = engine.replay("WAVE", test_helpers::make_wave_series(250), 0.3);
    }
    BacktestResult result;
};

TEST_F(BacktestExportTest, EquityTableOneRowPerPoint) {
    ExportTable t = export_tables::equity_table(result);
    ASSERT_EQ(t.columns.size(), 5u);
    EXPECT_EQ(t.num_rows(), result.equity_curve.size());
    EXPECT_NO_THROW(t.check());
    EXPECT_DOUBLE_EQ(t.columns[4].doubles.back(), result.equity_curve.back().portfolio_value);
}

TEST_F(BacktestExportTest, TradeTableOneRowPerTrade) {
    ExportTable t = export_tables::trade_table(result);
    ASSERT_EQ(t.columns.size(), 14u);
    EXPECT_EQ(t.num_rows(), result.trades.size());
    EXPECT_NO_THROW(t.check());
}

// ===========================================================================
// 2. Parquet
// ===========================================================================

class ParquetWriterTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const auto& p : temp_files_) std::filesystem::remove(p);
    }
    std::string track_temp(const std::string& name) {
        temp_files_.push_back(temp_path(name));
        return temp_files_.back();
    }
    std::vector<std::string> temp_files_;
};

TEST_F(ParquetWriterTest, SchemaAndRowsReadBack) {
    auto path = track_temp("indicators.parquet");
    ExportTable t = export_tables::indicator_table("W", test_helpers::make_wave_series(60));
    parquet_io::write(t, path);

    auto table = read_parquet_table(path);
    ASSERT_NE(table, nullptr) << "Cannot read Parquet file";
    EXPECT_EQ(table->num_rows(), 60);
    ASSERT_EQ(table->num_columns(), static_cast<int>(t.columns.size()));
    for (size_t i = 0; i < t.columns.size(); ++i) {
        EXPECT_EQ(table->schema()->field(static_cast<int>(i))->name(), t.columns[i].name);
    }
    EXPECT_TRUE(table->schema()->GetFieldByName("timestamp")->type()->Equals(arrow::int64()));
    EXPECT_TRUE(table->schema()->GetFieldByName("close")->type()->Equals(arrow::float64()));
    EXPECT_TRUE(table->schema()->GetFieldByName("is_warmup")->type()->Equals(arrow::boolean()));
    EXPECT_TRUE(table->schema()->GetFieldByName("decision")->type()->Equals(arrow::utf8()));
}

TEST_F(ParquetWriterTest, ValuesSurviveExactly) {
    auto path = track_temp("values.parquet");
    ExportTable t;
    t.add("ts", ExportColumn::Type::INT64).ints = {1, 2, 3};
    t.add("x", ExportColumn::Type::FLOAT64).doubles = {0.1, std::nan(""), 109890.123456789};
    parquet_io::write(t, path);

    auto table = read_parquet_table(path);
    ASSERT_NE(table, nullptr);
    auto x = std::dynamic_pointer_cast<arrow::DoubleArray>(
        table->GetColumnByName("x")->chunk(0));
    ASSERT_NE(x, nullptr);
    EXPECT_EQ(x->Value(0), 0.1);
    EXPECT_TRUE(std::isnan(x->Value(1)));
    EXPECT_EQ(x->Value(2), 109890.123456789);
    auto ts = std::dynamic_pointer_cast<arrow::Int64Array>(
        table->GetColumnByName("ts")->chunk(0));
    ASSERT_NE(ts, nullptr);
    EXPECT_EQ(ts->Value(2), 3);
}

TEST_F(ParquetWriterTest, AllColumnsUseZstd) {
    auto path = track_temp("zstd.parquet");
    parquet_io::write(export_tables::indicator_table("W", test_helpers::make_wave_series(30)),
                      path);

    auto metadata = read_parquet_metadata(path);
    ASSERT_NE(metadata, nullptr) << "Cannot read Parquet metadata";
    ASSERT_GT(metadata->num_row_groups(), 0);
    auto row_group = metadata->RowGroup(0);
    for (int c = 0; c < row_group->num_columns(); ++c) {
        EXPECT_EQ(row_group->ColumnChunk(c)->compression(), parquet::Compression::ZSTD)
            << "column " << c;
    }
}

TEST_F(ParquetWriterTest, EmptyTableWritesSchemaOnly) {
    auto path = track_temp("empty.parquet");
    BacktestResult empty;
    parquet_io::write(export_tables::trade_table(empty), path);
    auto table = read_parquet_table(path);
    ASSERT_NE(table, nullptr);
    EXPECT_EQ(table->num_rows(), 0);
    EXPECT_EQ(table->num_columns(), 14);
}

TEST_F(ParquetWriterTest, UnwritablePathThrows) {
    ExportTable t;
    t.add("a", ExportColumn::Type::INT64).ints = {1};
    EXPECT_THROW(parquet_io::write(t, "/nonexistent_dir/out.parquet"), std::runtime_error);
}

// ===========================================================================
// 3. CSV
// ===========================================================================

TEST(CsvWriterTest, HeaderAndCellFormatting) {
    ExportTable t;
    t.add("ts", ExportColumn::Type::INT64).ints = {7};
    t.add("x", ExportColumn::Type::FLOAT64).doubles = {std::nan("")};
    t.add("flag", ExportColumn::Type::BOOL).bools = {true};
    t.add("note", ExportColumn::Type::UTF8).strings = {"a,\"b\""};

    std::ostringstream out;
    csv_io::write(t, out);
    auto lines = read_lines(out.str());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "ts,x,flag,note");
    EXPECT_EQ(lines[1], "7,,true,\"a,\"\"b\"\"\"");
}

TEST(CsvWriterTest, TenSignificantDigits) {
    ExportColumn c;
    c.type = ExportColumn::Type::FLOAT64;
    c.doubles = {123.456789012345, 0.5};
    EXPECT_EQ(csv_io::cell(c, 0), "123.456789");
    EXPECT_EQ(csv_io::cell(c, 1), "0.5");
}

TEST(CsvWriterTest, FileMatchesStream) {
    ExportTable t = export_tables::indicator_table("W", test_helpers::make_wave_series(20));
    auto path = temp_path("table.csv");
    csv_io::write(t, path);

    std::ifstream in(path);
    std::stringstream file_text;
    file_text << in.rdbuf();
    std::ostringstream expected;
    csv_io::write(t, expected);
    EXPECT_EQ(file_text.str(), expected.str());
    EXPECT_EQ(read_lines(file_text.str()).size(), 21u);
    std::filesystem::remove(path);
}
