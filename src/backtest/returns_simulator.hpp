#pragma once

#include "backtest/backtest_errors.hpp"
#include "data/price_series.hpp"
#include "strategy/signal_generator.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

constexpr double DEFAULT_COST_RATE = 0.001;  // 10 bps of notional per unit of signal change

// ---------------------------------------------------------------------------
// ReturnsRow — one simulated period
// ---------------------------------------------------------------------------
struct ReturnsRow {
    size_t index = 0;
    int64_t timestamp = 0;
    double price = 0.0;
    double short_ma = 0.0;
    double long_ma = 0.0;
    int signal = 0;
    int position_change = 0;
    double price_return = 0.0;
    double strategy_return = 0.0;
    double transaction_cost = 0.0;
    double net_return = 0.0;
    double cumulative_return = 0.0;
};

// ---------------------------------------------------------------------------
// ReturnsSimulator — position-aware net returns and the compounded curve
// ---------------------------------------------------------------------------
class ReturnsSimulator {
public:
    explicit ReturnsSimulator(double cost_rate = DEFAULT_COST_RATE) : cost_rate_(cost_rate) {
        if (!std::isfinite(cost_rate) || cost_rate < 0.0) {
            throw InvalidParameterError("Cost rate must be a non-negative finite fraction");
        }
    }

    double cost_rate() const { return cost_rate_; }

    // `cleaned` holds only retained rows; `series` is the series they index into.
    std::vector<ReturnsRow> simulate(const std::vector<SignalRow>& cleaned,
                                     const PriceSeries& series) const {
        if (cleaned.empty()) {
            throw InsufficientDataError("No rows left after warm-up; series is too short");
        }

        std::vector<ReturnsRow> out;
        out.reserve(cleaned.size());
        double wealth = 1.0;

        for (size_t k = 0; k < cleaned.size(); ++k) {
            const auto& s = cleaned[k];
            if (!s.retained()) {
                throw InvalidParameterError("Row " + std::to_string(s.index) +
                                            " has undefined fields; clean() before simulate()");
            }

            ReturnsRow r{};
            r.index = s.index;
            r.timestamp = s.timestamp;
            r.price = s.price;
            r.short_ma = *s.short_ma;
            r.long_ma = *s.long_ma;
            r.signal = *s.signal;
            r.position_change = *s.position_change;

            r.price_return = price_return(series, s.index);

            // Position held over this period was set at the previous close;
            // flat until the first defined signal.
            int held = s.previous_signal.value_or(0);
            r.strategy_return = static_cast<double>(held) * r.price_return;

            // Cost lands one period after the change; the first retained
            // row has no retained predecessor and pays nothing.
            if (k > 0) {
                r.transaction_cost = std::abs(*cleaned[k - 1].position_change) * cost_rate_;
            }

            r.net_return = r.strategy_return - r.transaction_cost;
            wealth *= 1.0 + r.net_return;
            r.cumulative_return = wealth - 1.0;
            out.push_back(r);
        }
        return out;
    }

    // Simple return from the preceding row of the source series.
    static double price_return(const PriceSeries& series, size_t index) {
        if (index == 0 || index >= series.size()) {
            throw InvalidParameterError("Price return needs a predecessor (index " +
                                        std::to_string(index) + ")");
        }
        double prev = series[index - 1].price;
        if (prev <= 0.0) {
            throw DomainError("Non-positive price " + std::to_string(prev) +
                              " at row " + std::to_string(index - 1));
        }
        return (series[index].price - prev) / prev;
    }

private:
    double cost_rate_;
};
