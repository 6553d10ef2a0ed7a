#pragma once

#include "backtest/returns_simulator.hpp"

#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// ChartRow — what a price/MA panel and an equity panel need per period
// ---------------------------------------------------------------------------
struct ChartRow {
    int64_t timestamp = 0;
    double price = 0.0;
    double short_ma = 0.0;
    double long_ma = 0.0;
    int signal = 0;
    int position_change = 0;
    double cumulative_return = 0.0;
    double buy_and_hold_return = 0.0;  // price / first retained price - 1
};

struct TradeMarker {
    enum class Side { BUY, SELL };

    int64_t timestamp = 0;
    double price = 0.0;
    Side side = Side::BUY;
};

inline std::string side_str(TradeMarker::Side s) {
    return s == TradeMarker::Side::BUY ? "BUY" : "SELL";
}

struct ChartData {
    int short_window = 0;
    int long_window = 0;
    std::vector<ChartRow> rows;
    std::vector<TradeMarker> markers;
};

// ---------------------------------------------------------------------------
// chart_util — derive ChartData from simulated rows
// ---------------------------------------------------------------------------
namespace chart_util {

// Positive position change marks a buy, negative a sell.
inline std::vector<TradeMarker> trade_markers(const std::vector<ReturnsRow>& rows) {
    std::vector<TradeMarker> markers;
    for (const auto& r : rows) {
        if (r.position_change > 0) {
            markers.push_back({r.timestamp, r.price, TradeMarker::Side::BUY});
        } else if (r.position_change < 0) {
            markers.push_back({r.timestamp, r.price, TradeMarker::Side::SELL});
        }
    }
    return markers;
}

inline ChartData build(const std::vector<ReturnsRow>& rows, int short_window, int long_window) {
    ChartData chart{};
    chart.short_window = short_window;
    chart.long_window = long_window;
    chart.rows.reserve(rows.size());

    double base_price = rows.empty() ? 0.0 : rows.front().price;
    for (const auto& r : rows) {
        ChartRow c{};
        c.timestamp = r.timestamp;
        c.price = r.price;
        c.short_ma = r.short_ma;
        c.long_ma = r.long_ma;
        c.signal = r.signal;
        c.position_change = r.position_change;
        c.cumulative_return = r.cumulative_return;
        c.buy_and_hold_return = r.price / base_price - 1.0;
        chart.rows.push_back(c);
    }
    chart.markers = trade_markers(rows);
    return chart;
}

}  // namespace chart_util
