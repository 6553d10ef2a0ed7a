#pragma once

#include "backtest/backtest_errors.hpp"
#include "data/price_series.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// SignalRow — per-row moving averages and crossover signal
// ---------------------------------------------------------------------------
struct SignalRow {
    enum class DropReason { NONE, SHORT_WARMUP, LONG_WARMUP, NO_PREVIOUS_ROW };

    size_t index = 0;  // position in the source PriceSeries
    int64_t timestamp = 0;
    double price = 0.0;
    std::optional<double> short_ma;
    std::optional<double> long_ma;
    std::optional<int> signal;           // +1 = LONG, -1 = SHORT
    std::optional<int> previous_signal;  // signal of the preceding row, if defined
    std::optional<int> position_change;  // signal[t] - signal[t-1], warm-up counted as SHORT

    // First undefined field, in the order the fields are derived.
    DropReason drop_reason() const {
        if (!short_ma) return DropReason::SHORT_WARMUP;
        if (!long_ma) return DropReason::LONG_WARMUP;
        if (!position_change) return DropReason::NO_PREVIOUS_ROW;
        return DropReason::NONE;
    }

    bool retained() const { return drop_reason() == DropReason::NONE; }
};

inline std::string drop_reason_str(SignalRow::DropReason r) {
    switch (r) {
        case SignalRow::DropReason::NONE:               return "NONE";
        case SignalRow::DropReason::SHORT_WARMUP:       return "SHORT_WARMUP";
        case SignalRow::DropReason::LONG_WARMUP:        return "LONG_WARMUP";
        case SignalRow::DropReason::NO_PREVIOUS_ROW:    return "NO_PREVIOUS_ROW";
        default: return "UNKNOWN";
    }
}

// ---------------------------------------------------------------------------
// signal_gen — the individual transformations
// ---------------------------------------------------------------------------
namespace signal_gen {

// Stand-in for an undefined signal when differencing: warm-up rows count as
// SHORT, so entering LONG on the first defined signal is a change of +2.
constexpr int WARMUP_SIGNAL = -1;

// Trailing arithmetic mean; nullopt for indices < window - 1.
inline std::vector<std::optional<double>> moving_average(const PriceSeries& series, int window) {
    int n = static_cast<int>(series.size());
    if (window < 1) {
        throw InvalidParameterError("Moving average window must be >= 1, got " +
                                    std::to_string(window));
    }
    if (window > n) {
        throw InvalidParameterError("Moving average window " + std::to_string(window) +
                                    " exceeds series length " + std::to_string(n));
    }

    std::vector<std::optional<double>> out(n);
    for (int i = window - 1; i < n; ++i) {
        // Summing offsets from the window's first price keeps a constant
        // window exactly equal to that price.
        double anchor = series[i - window + 1].price;
        double offset_sum = 0.0;
        for (int j = i - window + 1; j <= i; ++j) {
            offset_sum += series[j].price - anchor;
        }
        out[i] = anchor + offset_sum / static_cast<double>(window);
    }
    return out;
}

// Strict comparison: equal averages resolve to SHORT.
inline std::optional<int> signal(const std::optional<double>& short_ma,
                                 const std::optional<double>& long_ma) {
    if (!short_ma || !long_ma) return std::nullopt;
    return (*short_ma > *long_ma) ? 1 : -1;
}

inline std::vector<std::optional<int>> signals(const std::vector<std::optional<double>>& short_ma,
                                               const std::vector<std::optional<double>>& long_ma) {
    std::vector<std::optional<int>> out(short_ma.size());
    for (size_t i = 0; i < short_ma.size() && i < long_ma.size(); ++i) {
        out[i] = signal(short_ma[i], long_ma[i]);
    }
    return out;
}

// First difference with undefined signals read as WARMUP_SIGNAL; undefined
// only at the first element.
inline std::vector<std::optional<int>> position_change(const std::vector<std::optional<int>>& sig) {
    std::vector<std::optional<int>> out(sig.size());
    for (size_t i = 1; i < sig.size(); ++i) {
        out[i] = sig[i].value_or(WARMUP_SIGNAL) - sig[i - 1].value_or(WARMUP_SIGNAL);
    }
    return out;
}

}  // namespace signal_gen

// ---------------------------------------------------------------------------
// SignalGenerator — assembles SignalRows for a window pair
// ---------------------------------------------------------------------------
class SignalGenerator {
public:
    SignalGenerator(int short_window, int long_window)
        : short_window_(short_window), long_window_(long_window) {}

    int short_window() const { return short_window_; }
    int long_window() const { return long_window_; }

    // One row per price, undefined fields left empty.
    std::vector<SignalRow> generate(const PriceSeries& series) const {
        auto short_ma = signal_gen::moving_average(series, short_window_);
        auto long_ma = signal_gen::moving_average(series, long_window_);
        auto sig = signal_gen::signals(short_ma, long_ma);
        auto change = signal_gen::position_change(sig);

        std::vector<SignalRow> rows(series.size());
        for (size_t i = 0; i < series.size(); ++i) {
            auto& r = rows[i];
            r.index = i;
            r.timestamp = series[i].timestamp;
            r.price = series[i].price;
            r.short_ma = short_ma[i];
            r.long_ma = long_ma[i];
            r.signal = sig[i];
            if (i > 0) r.previous_signal = sig[i - 1];
            r.position_change = change[i];
        }
        return rows;
    }

    // Rows with every field defined, in time order.
    static std::vector<SignalRow> clean(const std::vector<SignalRow>& rows) {
        std::vector<SignalRow> kept;
        for (const auto& r : rows) {
            if (r.retained()) kept.push_back(r);
        }
        return kept;
    }

    std::vector<SignalRow> generate_clean(const PriceSeries& series) const {
        return clean(generate(series));
    }

private:
    int short_window_;
    int long_window_;
};
