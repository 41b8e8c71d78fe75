#pragma once

#include "io/export_table.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// csv_io — ExportTable to CSV. NaN cells are written empty.
// ---------------------------------------------------------------------------
namespace csv_io {

inline std::string quote(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    return out + "\"";
}

inline std::string cell(const ExportColumn& c, size_t row) {
    switch (c.type) {
        case ExportColumn::Type::INT64:
            return std::to_string(c.ints[row]);
        case ExportColumn::Type::FLOAT64: {
            double v = c.doubles[row];
            if (std::isnan(v)) return "";
            std::ostringstream ss;
            ss << std::setprecision(10) << v;
            return ss.str();
        }
        case ExportColumn::Type::BOOL:
            return c.bools[row] ? "true" : "false";
        case ExportColumn::Type::UTF8:
            return quote(c.strings[row]);
    }
    return "";
}

inline void write(const ExportTable& table, std::ostream& out) {
    table.check();
    for (size_t i = 0; i < table.columns.size(); ++i) {
        if (i > 0) out << ",";
        out << quote(table.columns[i].name);
    }
    out << "\n";
    for (size_t r = 0; r < table.num_rows(); ++r) {
        for (size_t i = 0; i < table.columns.size(); ++i) {
            if (i > 0) out << ",";
            out << cell(table.columns[i], r);
        }
        out << "\n";
    }
}

inline void write(const ExportTable& table, const std::string& path) {
    std::ofstream out(path);
    if (!out.is_open()) throw std::runtime_error("Cannot open CSV output file " + path);
    write(table, out);
    if (!out) throw std::runtime_error("Failed to write CSV " + path);
}

}  // namespace csv_io
