#pragma once

#include "backtest/chart_data.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace chart_parquet {

inline void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error(what + ": " + status.ToString());
    }
}

// Column names, in file order.
inline std::vector<std::string> column_names() {
    return {"timestamp", "price", "short_ma", "long_ma", "signal", "position_change",
            "cumulative_return", "buy_and_hold_return"};
}

inline std::shared_ptr<arrow::Table> to_table(const ChartData& chart) {
    auto names = column_names();
    arrow::FieldVector fields;
    fields.push_back(arrow::field(names[0], arrow::int64()));
    fields.push_back(arrow::field(names[1], arrow::float64()));
    fields.push_back(arrow::field(names[2], arrow::float64()));
    fields.push_back(arrow::field(names[3], arrow::float64()));
    fields.push_back(arrow::field(names[4], arrow::int32()));
    fields.push_back(arrow::field(names[5], arrow::int32()));
    fields.push_back(arrow::field(names[6], arrow::float64()));
    fields.push_back(arrow::field(names[7], arrow::float64()));
    auto schema = arrow::schema(fields);

    std::vector<std::shared_ptr<arrow::Array>> arrays;
    std::shared_ptr<arrow::Array> arr;

    // timestamp (INT64)
    {
        arrow::Int64Builder b;
        for (const auto& r : chart.rows) check(b.Append(r.timestamp), "timestamp");
        check(b.Finish(&arr), "timestamp");
        arrays.push_back(arr);
    }

    auto append_double = [&](const char* name, double ChartRow::*field) {
        arrow::DoubleBuilder b;
        for (const auto& r : chart.rows) check(b.Append(r.*field), name);
        check(b.Finish(&arr), name);
        arrays.push_back(arr);
    };
    auto append_int = [&](const char* name, int ChartRow::*field) {
        arrow::Int32Builder b;
        for (const auto& r : chart.rows) check(b.Append(r.*field), name);
        check(b.Finish(&arr), name);
        arrays.push_back(arr);
    };

    append_double("price", &ChartRow::price);
    append_double("short_ma", &ChartRow::short_ma);
    append_double("long_ma", &ChartRow::long_ma);
    append_int("signal", &ChartRow::signal);
    append_int("position_change", &ChartRow::position_change);
    append_double("cumulative_return", &ChartRow::cumulative_return);
    append_double("buy_and_hold_return", &ChartRow::buy_and_hold_return);

    return arrow::Table::Make(schema, arrays);
}

// Write chart rows to Parquet with ZSTD compression, one row group.
inline void write(const ChartData& chart, const std::string& path) {
    auto table = to_table(chart);

    auto outfile_result = arrow::io::FileOutputStream::Open(path);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet output file: " + path);
    }
    auto outfile = *outfile_result;

    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();

    int64_t chunk_size = std::max<int64_t>(1, static_cast<int64_t>(chart.rows.size()));
    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile,
                                     chunk_size, props),
          "Failed to write Parquet");
    check(outfile->Close(), "Failed to close Parquet output");
}

}  // namespace chart_parquet
