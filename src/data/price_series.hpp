#pragma once

#include "backtest/backtest_errors.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// PriceRow — one observation of the input series
// ---------------------------------------------------------------------------
struct PriceRow {
    int64_t timestamp = 0;  // strictly increasing; YYYYMMDD when loaded from CSV
    double price = 0.0;
};

// ---------------------------------------------------------------------------
// PriceSeries — immutable, time-ordered (timestamp, price) rows
//
// Prices must be finite. Positivity is not checked here: a non-positive
// price is reported as DomainError by ReturnsSimulator::price_return, the
// first place it divides, so rows it never divides by are left alone.
// ---------------------------------------------------------------------------
class PriceSeries {
public:
    explicit PriceSeries(std::vector<PriceRow> rows) : rows_(std::move(rows)) {
        if (rows_.empty()) {
            throw InvalidParameterError("PriceSeries requires at least one row");
        }
        for (size_t i = 0; i < rows_.size(); ++i) {
            if (!std::isfinite(rows_[i].price)) {
                throw InvalidParameterError("Non-finite price at row " + std::to_string(i));
            }
            if (i > 0 && rows_[i].timestamp <= rows_[i - 1].timestamp) {
                throw InvalidParameterError(
                    "Timestamps must be strictly increasing (row " + std::to_string(i) + ")");
            }
        }
    }

    // Convenience for synthetic series: timestamps 0, 1, 2, ...
    static PriceSeries from_prices(const std::vector<double>& prices) {
        std::vector<PriceRow> rows;
        rows.reserve(prices.size());
        for (size_t i = 0; i < prices.size(); ++i) {
            rows.push_back({static_cast<int64_t>(i), prices[i]});
        }
        return PriceSeries(std::move(rows));
    }

    size_t size() const { return rows_.size(); }
    const PriceRow& operator[](size_t i) const { return rows_[i]; }
    const PriceRow& at(size_t i) const { return rows_.at(i); }
    const std::vector<PriceRow>& rows() const { return rows_; }

    int64_t first_timestamp() const { return rows_.front().timestamp; }
    int64_t last_timestamp() const { return rows_.back().timestamp; }

    std::vector<double> prices() const {
        std::vector<double> out;
        out.reserve(rows_.size());
        for (const auto& r : rows_) out.push_back(r.price);
        return out;
    }

    // New series restricted to timestamps in [first, last].
    PriceSeries between(int64_t first, int64_t last) const {
        std::vector<PriceRow> kept;
        for (const auto& r : rows_) {
            if (r.timestamp >= first && r.timestamp <= last) kept.push_back(r);
        }
        if (kept.empty()) {
            throw InvalidParameterError("No prices between " + std::to_string(first) +
                                        " and " + std::to_string(last));
        }
        return PriceSeries(std::move(kept));
    }

private:
    std::vector<PriceRow> rows_;
};
