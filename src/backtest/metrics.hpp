#pragma once

#include "backtest/backtest_errors.hpp"
#include "backtest/returns_simulator.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

constexpr int TRADING_DAYS_PER_YEAR = 252;

// ---------------------------------------------------------------------------
// Metrics — scalar summary of a simulated run
// ---------------------------------------------------------------------------
struct Metrics {
    double total_return = 0.0;
    double annualized_return = 0.0;
    double sharpe_ratio = 0.0;
    double max_drawdown = 0.0;
};

// ---------------------------------------------------------------------------
// metrics_util — reductions over plain return vectors
// ---------------------------------------------------------------------------
namespace metrics_util {

inline double mean(const std::vector<double>& v) {
    double sum = 0.0;
    for (double x : v) sum += x;
    return sum / static_cast<double>(v.size());
}

// Sample standard deviation (n - 1). A single observation gives NaN.
inline double sample_stddev(const std::vector<double>& v) {
    double m = mean(v);
    double sum_sq = 0.0;
    for (double x : v) {
        double diff = x - m;
        sum_sq += diff * diff;
    }
    double variance = sum_sq / static_cast<double>(v.size() - 1);
    return std::sqrt(variance);
}

// Zero volatility is passed through as the IEEE quotient (NaN or +/-Inf).
inline double sharpe_ratio(const std::vector<double>& returns,
                           int periods_per_year = TRADING_DAYS_PER_YEAR) {
    return std::sqrt(static_cast<double>(periods_per_year)) * mean(returns) /
           sample_stddev(returns);
}

// Worst peak-to-trough ratio on the wealth curve 1 + cumulative_return.
inline double max_drawdown(const std::vector<double>& cumulative_returns) {
    if (cumulative_returns.empty()) return 0.0;
    double peak = 1.0 + cumulative_returns.front();
    double worst = 0.0;
    for (double c : cumulative_returns) {
        double wealth = 1.0 + c;
        peak = std::max(peak, wealth);
        worst = std::min(worst, wealth / peak - 1.0);
    }
    return worst;
}

}  // namespace metrics_util

// ---------------------------------------------------------------------------
// MetricsCalculator
// ---------------------------------------------------------------------------
class MetricsCalculator {
public:
    // `series_length` is the length of the input price series.
    static Metrics compute(const std::vector<ReturnsRow>& rows, size_t series_length) {
        if (rows.empty()) {
            throw StateError("Backtest not run yet: no simulated returns");
        }

        std::vector<double> net;
        std::vector<double> cumulative;
        net.reserve(rows.size());
        cumulative.reserve(rows.size());
        for (const auto& r : rows) {
            net.push_back(r.net_return);
            cumulative.push_back(r.cumulative_return);
        }

        Metrics m{};
        m.total_return = cumulative.back();
        // Annualized over the full input length, warm-up rows included, so
        // the exponent is smaller than the simulated period count implies.
        m.annualized_return = std::pow(1.0 + m.total_return,
                                       static_cast<double>(TRADING_DAYS_PER_YEAR) /
                                       static_cast<double>(series_length)) - 1.0;
        m.sharpe_ratio = metrics_util::sharpe_ratio(net);
        m.max_drawdown = metrics_util::max_drawdown(cumulative);
        return m;
    }
};
