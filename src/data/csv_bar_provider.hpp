#pragma once

#include "data/bar_provider.hpp"
#include "time_utils.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// CsvBarProvider — reads <dir>/<SYMBOL>.csv
//
// Header must name timestamp,open,high,low,close,volume (any order, extra
// columns ignored). Timestamps are YYYY-MM-DD dates or integer nanoseconds
// since the epoch. Empty price or volume cells load as NaN so the backtest
// can skip the bar.
// ---------------------------------------------------------------------------
class CsvBarProvider : public BarProvider {
public:
    explicit CsvBarProvider(std::filesystem::path dir) : dir_(std::move(dir)) {}

    std::vector<Bar> get_bars(const std::string& symbol,
                              const std::string& period,
                              const std::string& interval) override {
        bar_period::Period p = checked_period(symbol, period);
        check_interval(symbol, interval);

        std::filesystem::path path = dir_ / (symbol + ".csv");
        if (!std::filesystem::exists(path)) {
            throw DataUnavailable(symbol, "no data file " + path.string());
        }
        return finish(symbol, read_file(symbol, path), p);
    }

    static std::vector<Bar> read_file(const std::string& symbol,
                                      const std::filesystem::path& path) {
        std::ifstream in(path);
        if (!in.is_open()) throw DataUnavailable(symbol, "cannot open " + path.string(), true);

        std::string line;
        if (!std::getline(in, line)) throw DataUnavailable(symbol, "empty file " + path.string());

        std::vector<std::string> header = split(line);
        std::map<std::string, size_t> col;
        for (size_t i = 0; i < header.size(); ++i) col[header[i]] = i;
        static const char* REQUIRED[] = {"timestamp", "open", "high", "low", "close", "volume"};
        for (const char* name : REQUIRED) {
            if (!col.count(name)) {
                throw DataUnavailable(symbol, std::string("missing column '") + name + "'");
            }
        }

        std::vector<Bar> bars;
        int line_no = 1;
        while (std::getline(in, line)) {
            ++line_no;
            if (line.empty() || line == "\r") continue;
            std::vector<std::string> cells = split(line);
            if (cells.size() < header.size()) cells.resize(header.size());

            Bar b;
            auto ts = parse_timestamp(cells[col["timestamp"]]);
            if (!ts) {
                throw DataUnavailable(symbol, "bad timestamp on line " + std::to_string(line_no));
            }
            b.timestamp = *ts;
            b.open = parse_number(symbol, cells[col["open"]], line_no);
            b.high = parse_number(symbol, cells[col["high"]], line_no);
            b.low = parse_number(symbol, cells[col["low"]], line_no);
            b.close = parse_number(symbol, cells[col["close"]], line_no);
            b.volume = parse_number(symbol, cells[col["volume"]], line_no);
            bars.push_back(b);
        }
        return bars;
    }

private:
    static std::vector<std::string> split(const std::string& line) {
        std::vector<std::string> cells;
        std::istringstream ss(line);
        std::string cell;
        while (std::getline(ss, cell, ',')) {
            while (!cell.empty() && (cell.back() == '\r' || cell.back() == ' ')) cell.pop_back();
            while (!cell.empty() && cell.front() == ' ') cell.erase(cell.begin());
            cells.push_back(cell);
        }
        if (!line.empty() && line.back() == ',') cells.emplace_back();
        return cells;
    }

    static std::optional<uint64_t> parse_timestamp(const std::string& cell) {
        if (cell.size() == 10 && cell[4] == '-') return time_utils::parse_date(cell);
        if (cell.empty()) return std::nullopt;
        for (char c : cell) {
            if (c < '0' || c > '9') return std::nullopt;
        }
        return static_cast<uint64_t>(std::strtoull(cell.c_str(), nullptr, 10));
    }

    static double parse_number(const std::string& symbol, const std::string& cell, int line_no) {
        if (cell.empty() || cell == "nan" || cell == "NaN") {
            return std::numeric_limits<double>::quiet_NaN();
        }
        char* end = nullptr;
        double v = std::strtod(cell.c_str(), &end);
        if (end == cell.c_str() || *end != '\0') {
            throw DataUnavailable(symbol, "bad number '" + cell + "' on line " +
                                              std::to_string(line_no));
        }
        return v;
    }

    std::filesystem::path dir_;
};
