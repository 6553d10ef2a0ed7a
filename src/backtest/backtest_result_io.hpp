#pragma once

#include "backtest/backtest_engine.hpp"
#include "backtest/chart_data.hpp"
#include "backtest/metrics.hpp"

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace backtest_io {

// Escape a string for JSON output
inline std::string json_escape(const std::string& s) {
    std::string result;
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            default:   result += c;
        }
    }
    return result;
}

// JSON has no NaN/Inf; a zero-volatility Sharpe ratio is written as null.
inline std::string json_number(double v) {
    if (!std::isfinite(v)) return "null";
    std::ostringstream ss;
    ss << std::setprecision(12) << v;
    return ss.str();
}

inline std::string csv_number(double v) {
    if (std::isnan(v)) return "NaN";
    if (std::isinf(v)) return v > 0 ? "Inf" : "-Inf";
    std::ostringstream ss;
    ss << std::setprecision(17) << v;
    return ss.str();
}

// Serialize Metrics to JSON
inline std::string to_json(const Metrics& m) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"total_return\":" << json_number(m.total_return);
    ss << ",\"annualized_return\":" << json_number(m.annualized_return);
    ss << ",\"sharpe_ratio\":" << json_number(m.sharpe_ratio);
    ss << ",\"max_drawdown\":" << json_number(m.max_drawdown);
    ss << "}";
    return ss.str();
}

// Serialize a BacktestResult: config, metrics and trade markers
inline std::string to_json(const BacktestResult& result) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"short_window\":" << result.config.short_window;
    ss << ",\"long_window\":" << result.config.long_window;
    ss << ",\"cost_rate\":" << json_number(result.config.cost_rate);
    ss << ",\"series_length\":" << result.series_length;
    ss << ",\"simulated_rows\":" << result.returns.size();
    ss << ",\"metrics\":" << to_json(result.metrics);

    ss << ",\"markers\":[";
    auto markers = chart_util::trade_markers(result.returns);
    for (size_t i = 0; i < markers.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& mk = markers[i];
        ss << "{";
        ss << "\"timestamp\":" << mk.timestamp;
        ss << ",\"price\":" << json_number(mk.price);
        ss << ",\"side\":\"" << json_escape(side_str(mk.side)) << "\"";
        ss << "}";
    }
    ss << "]";

    ss << "}";
    return ss.str();
}

// Human-readable summary, one metric per line. Returns are percentages,
// the Sharpe ratio is a plain ratio.
inline std::string format_report(const Metrics& m) {
    std::ostringstream ss;
    char line[64];
    std::snprintf(line, sizeof(line), "%-20s %.2f%%\n", "Total Return", m.total_return * 100.0);
    ss << line;
    std::snprintf(line, sizeof(line), "%-20s %.2f%%\n", "Annualized Return",
                  m.annualized_return * 100.0);
    ss << line;
    std::snprintf(line, sizeof(line), "%-20s %.2f\n", "Sharpe Ratio", m.sharpe_ratio);
    ss << line;
    std::snprintf(line, sizeof(line), "%-20s %.2f%%\n", "Max Drawdown", m.max_drawdown * 100.0);
    ss << line;
    return ss.str();
}

// ---------------------------------------------------------------------------
// Chart data CSV
// ---------------------------------------------------------------------------
inline std::string chart_csv_header() {
    return "timestamp,price,short_ma,long_ma,signal,position_change,"
           "cumulative_return,buy_and_hold_return";
}

inline std::string chart_csv_row(const ChartRow& r) {
    std::ostringstream ss;
    ss << r.timestamp;
    ss << "," << csv_number(r.price);
    ss << "," << csv_number(r.short_ma);
    ss << "," << csv_number(r.long_ma);
    ss << "," << r.signal;
    ss << "," << r.position_change;
    ss << "," << csv_number(r.cumulative_return);
    ss << "," << csv_number(r.buy_and_hold_return);
    return ss.str();
}

inline void write_chart_csv(const ChartData& chart, const std::string& path) {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        throw std::runtime_error("Output directory does not exist: " + parent.string());
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open output file: " + path);
    }
    file << chart_csv_header() << "\n";
    for (const auto& row : chart.rows) {
        file << chart_csv_row(row) << "\n";
    }
}

}  // namespace backtest_io
