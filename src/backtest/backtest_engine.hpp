#pragma once

#include "backtest/backtest_errors.hpp"
#include "backtest/chart_data.hpp"
#include "backtest/metrics.hpp"
#include "backtest/returns_simulator.hpp"
#include "data/price_series.hpp"
#include "strategy/signal_generator.hpp"

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// BacktestConfig — parameters of one crossover run
// ---------------------------------------------------------------------------
struct BacktestConfig {
    int short_window = 50;
    int long_window = 200;
    double cost_rate = DEFAULT_COST_RATE;
};

// ---------------------------------------------------------------------------
// BacktestResult — immutable outcome of a completed run
// ---------------------------------------------------------------------------
struct BacktestResult {
    BacktestConfig config;
    size_t series_length = 0;
    std::vector<SignalRow> signals;  // every input row, undefined fields empty
    std::vector<ReturnsRow> returns; // retained rows only
    Metrics metrics;

    ChartData chart_data() const {
        return chart_util::build(returns, config.short_window, config.long_window);
    }
};

// Checks both windows against the series before any averaging happens.
inline void validate_windows(const BacktestConfig& cfg, size_t series_length) {
    for (int w : {cfg.short_window, cfg.long_window}) {
        if (w < 1) {
            throw InvalidParameterError("Window sizes must be positive, got " +
                                        std::to_string(w));
        }
    }
    for (int w : {cfg.short_window, cfg.long_window}) {
        if (static_cast<size_t>(w) > series_length) {
            throw InsufficientDataError("Series of " + std::to_string(series_length) +
                                        " prices is shorter than the " + std::to_string(w) +
                                        "-period window");
        }
    }
}

// Signals -> returns -> metrics over one series.
inline BacktestResult run_backtest(const PriceSeries& series, const BacktestConfig& cfg) {
    validate_windows(cfg, series.size());
    ReturnsSimulator simulator(cfg.cost_rate);
    SignalGenerator generator(cfg.short_window, cfg.long_window);

    BacktestResult result{};
    result.config = cfg;
    result.series_length = series.size();
    result.signals = generator.generate(series);
    result.returns = simulator.simulate(SignalGenerator::clean(result.signals), series);
    result.metrics = MetricsCalculator::compute(result.returns, series.size());
    return result;
}

// ---------------------------------------------------------------------------
// BacktestEngine — owns one series and the result of its latest run
// ---------------------------------------------------------------------------
class BacktestEngine {
public:
    explicit BacktestEngine(PriceSeries series) : series_(std::move(series)) {}

    Metrics run(int short_window, int long_window, double cost_rate = DEFAULT_COST_RATE) {
        return run(BacktestConfig{short_window, long_window, cost_rate});
    }

    // Replaces the stored result only once the new run has fully succeeded.
    Metrics run(const BacktestConfig& cfg) {
        result_ = run_backtest(series_, cfg);
        return result_->metrics;
    }

    bool has_run() const { return result_.has_value(); }

    const Metrics& metrics() const { return result().metrics; }

    const BacktestResult& result() const {
        if (!result_) {
            throw StateError("Backtest not run yet.");
        }
        return *result_;
    }

    ChartData chart_data() const { return result().chart_data(); }

    const PriceSeries& series() const { return series_; }

private:
    PriceSeries series_;
    std::optional<BacktestResult> result_;
};
