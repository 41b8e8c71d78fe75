#pragma once

#include "io/export_table.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// parquet_io — ExportTable to a ZSTD-compressed Parquet file
// ---------------------------------------------------------------------------
namespace parquet_io {

namespace detail {

inline void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) throw std::runtime_error(what + ": " + status.ToString());
}

inline std::shared_ptr<arrow::DataType> arrow_type(ExportColumn::Type t) {
    switch (t) {
        case ExportColumn::Type::INT64:   return arrow::int64();
        case ExportColumn::Type::FLOAT64: return arrow::float64();
        case ExportColumn::Type::BOOL:    return arrow::boolean();
        case ExportColumn::Type::UTF8:    return arrow::utf8();
    }
    return arrow::float64();
}

inline std::shared_ptr<arrow::Array> build_array(const ExportColumn& c) {
    std::shared_ptr<arrow::Array> arr;
    const std::string what = "column '" + c.name + "'";
    switch (c.type) {
        case ExportColumn::Type::INT64: {
            arrow::Int64Builder b;
            check(b.AppendValues(c.ints), what);
            check(b.Finish(&arr), what);
            break;
        }
        case ExportColumn::Type::FLOAT64: {
            // NaN is written as NaN, not null.
            arrow::DoubleBuilder b;
            check(b.AppendValues(c.doubles.data(), static_cast<int64_t>(c.doubles.size())), what);
            check(b.Finish(&arr), what);
            break;
        }
        case ExportColumn::Type::BOOL: {
            arrow::BooleanBuilder b;
            for (bool v : c.bools) check(b.Append(v), what);
            check(b.Finish(&arr), what);
            break;
        }
        case ExportColumn::Type::UTF8: {
            arrow::StringBuilder b;
            for (const auto& v : c.strings) check(b.Append(v), what);
            check(b.Finish(&arr), what);
            break;
        }
    }
    return arr;
}

}  // namespace detail

inline void write(const ExportTable& table, const std::string& path) {
    table.check();

    arrow::FieldVector fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    for (const auto& c : table.columns) {
        fields.push_back(arrow::field(c.name, detail::arrow_type(c.type)));
        arrays.push_back(detail::build_array(c));
    }
    auto out_table = arrow::Table::Make(arrow::schema(fields), arrays);

    auto outfile_result = arrow::io::FileOutputStream::Open(path);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet output file " + path + ": " +
                                 outfile_result.status().ToString());
    }
    auto outfile = *outfile_result;

    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();

    int64_t chunk = std::max<int64_t>(1, static_cast<int64_t>(table.num_rows()));
    detail::check(parquet::arrow::WriteTable(*out_table, arrow::default_memory_pool(), outfile,
                                             chunk, props),
                  "Failed to write Parquet " + path);
    detail::check(outfile->Close(), "Failed to close " + path);
}

}  // namespace parquet_io
