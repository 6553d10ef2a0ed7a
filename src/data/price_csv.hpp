#pragma once

#include "data/price_series.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// CsvLoadOptions / CsvLoadResult
// ---------------------------------------------------------------------------
struct CsvLoadOptions {
    std::string date_column = "Date";
    std::string price_column = "Adj Close";
    // Tried in order when price_column is absent from the header.
    std::vector<std::string> fallback_columns = {"price", "Close"};
};

struct CsvLoadResult {
    std::vector<PriceRow> rows;
    std::string price_column;  // column actually used
    int skipped_rows = 0;      // empty or "null" prices
};

namespace price_csv {

inline std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    std::string out = s.substr(b, e - b);
    if (out.size() >= 2 && out.front() == '"' && out.back() == '"') {
        out = out.substr(1, out.size() - 2);
    }
    return out;
}

inline std::vector<std::string> split_line(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(trim(field));
    }
    if (!line.empty() && line.back() == ',') fields.emplace_back();
    return fields;
}

inline int find_column(const std::vector<std::string>& header, const std::string& name) {
    auto it = std::find(header.begin(), header.end(), name);
    if (it == header.end()) return -1;
    return static_cast<int>(it - header.begin());
}

inline bool is_missing(const std::string& value) {
    return value.empty() || value == "null" || value == "NaN" || value == "nan";
}

// Parse CSV text. Rows come back in file order; ordering is enforced when
// the rows are turned into a PriceSeries.
inline CsvLoadResult parse(std::istream& in, const CsvLoadOptions& opts = {}) {
    std::string line;
    if (!std::getline(in, line)) {
        throw std::runtime_error("Price CSV is empty");
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    auto header = split_line(line);

    int date_col = find_column(header, opts.date_column);
    if (date_col < 0) {
        throw std::runtime_error("Price CSV has no '" + opts.date_column + "' column");
    }

    CsvLoadResult result{};
    int price_col = find_column(header, opts.price_column);
    result.price_column = opts.price_column;
    for (size_t i = 0; price_col < 0 && i < opts.fallback_columns.size(); ++i) {
        price_col = find_column(header, opts.fallback_columns[i]);
        result.price_column = opts.fallback_columns[i];
    }
    if (price_col < 0) {
        throw std::runtime_error("Price CSV has no '" + opts.price_column + "' column");
    }

    int line_no = 1;
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim(line).empty()) continue;

        auto fields = split_line(line);
        int needed = std::max(date_col, price_col);
        if (static_cast<int>(fields.size()) <= needed) {
            throw std::runtime_error("Line " + std::to_string(line_no) + ": too few fields");
        }

        auto date = time_utils::parse_date(fields[date_col]);
        if (!date) {
            throw std::runtime_error("Line " + std::to_string(line_no) + ": bad date '" +
                                     fields[date_col] + "'");
        }

        const auto& raw = fields[price_col];
        if (is_missing(raw)) {
            ++result.skipped_rows;
            continue;
        }

        double price = 0.0;
        size_t used = 0;
        try {
            price = std::stod(raw, &used);
        } catch (const std::exception&) {
            used = 0;
        }
        if (used != raw.size()) {
            throw std::runtime_error("Line " + std::to_string(line_no) + ": bad price '" +
                                     raw + "'");
        }
        result.rows.push_back({*date, price});
    }
    return result;
}

inline CsvLoadResult load(const std::string& path, const CsvLoadOptions& opts = {}) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open price file: " + path);
    }
    return parse(file, opts);
}

}  // namespace price_csv
