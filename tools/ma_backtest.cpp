// ma_backtest.cpp — command-line front end for the moving-average crossover backtest
// Loads a daily price CSV, runs BacktestEngine, prints the metric report and
// optionally writes chart data (.csv or .parquet) and a JSON result.
//
// Usage: ./ma_backtest --prices <csv> [--short 50] [--long 200] [--cost 0.001]
//                      [--column "Adj Close"] [--start YYYY-MM-DD] [--end YYYY-MM-DD]
//                      [--output <chart.csv|chart.parquet>] [--json <result.json>]

#include "backtest/backtest_engine.hpp"
#include "backtest/backtest_errors.hpp"
#include "backtest/backtest_result_io.hpp"
#include "backtest/chart_parquet.hpp"
#include "data/price_csv.hpp"
#include "data/price_series.hpp"
#include "time_utils.hpp"

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

enum ExitCode {
    EXIT_OK = 0,
    EXIT_USAGE = 1,
    EXIT_IO = 2,
    EXIT_INVALID_PARAMETER = 3,
    EXIT_INSUFFICIENT_DATA = 4,
    EXIT_DOMAIN = 5,
    EXIT_STATE = 6,
    EXIT_INTERNAL = 7,
};

struct CliOptions {
    std::string prices_path;
    std::string output_path;
    std::string json_path;
    std::optional<int64_t> start;
    std::optional<int64_t> end;
    CsvLoadOptions csv;
    BacktestConfig backtest;
};

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --prices <csv> [options]\n"
              << "\n"
              << "  --prices   Daily price CSV with a Date column (required)\n"
              << "  --column   Price column name (default: Adj Close)\n"
              << "  --start    First date to include, YYYY-MM-DD\n"
              << "  --end      Last date to include, YYYY-MM-DD\n"
              << "  --short    Short moving-average window (default: 50)\n"
              << "  --long     Long moving-average window (default: 200)\n"
              << "  --cost     Cost per unit of position change (default: 0.001)\n"
              << "  --output   Chart data output path (.csv or .parquet)\n"
              << "  --json     Result JSON output path\n";
}

bool parse_int(const std::string& text, int& out) {
    size_t used = 0;
    try {
        out = std::stoi(text, &used);
    } catch (const std::exception&) {
        return false;
    }
    return used == text.size();
}

bool parse_double(const std::string& text, double& out) {
    size_t used = 0;
    try {
        out = std::stod(text, &used);
    } catch (const std::exception&) {
        return false;
    }
    return used == text.size();
}

// Returns false (after printing why) on any malformed flag.
bool parse_args(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") return false;
        bool has_value = i + 1 < argc;
        if (!has_value) {
            std::cerr << "Missing value for " << arg << "\n";
            return false;
        }
        std::string value = argv[++i];

        if (arg == "--prices") {
            opts.prices_path = value;
        } else if (arg == "--column") {
            opts.csv.price_column = value;
        } else if (arg == "--output") {
            opts.output_path = value;
        } else if (arg == "--json") {
            opts.json_path = value;
        } else if (arg == "--start" || arg == "--end") {
            auto date = time_utils::parse_date(value);
            if (!date) {
                std::cerr << "Invalid date for " << arg << ": '" << value
                          << "' (expected YYYY-MM-DD)\n";
                return false;
            }
            (arg == "--start" ? opts.start : opts.end) = *date;
        } else if (arg == "--short" || arg == "--long") {
            int w = 0;
            if (!parse_int(value, w)) {
                std::cerr << "Invalid integer for " << arg << ": '" << value << "'\n";
                return false;
            }
            (arg == "--short" ? opts.backtest.short_window : opts.backtest.long_window) = w;
        } else if (arg == "--cost") {
            if (!parse_double(value, opts.backtest.cost_rate)) {
                std::cerr << "Invalid number for --cost: '" << value << "'\n";
                return false;
            }
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }
    }

    if (opts.prices_path.empty()) {
        std::cerr << "Missing required argument: --prices\n";
        return false;
    }
    if (!opts.output_path.empty()) {
        std::string ext = std::filesystem::path(opts.output_path).extension().string();
        if (ext != ".csv" && ext != ".parquet") {
            std::cerr << "Unsupported output format. Use .csv or .parquet extension.\n";
            return false;
        }
    }
    return true;
}

PriceSeries load_series(const CliOptions& opts) {
    std::cout << "Loading " << opts.prices_path << "...\n";
    auto loaded = price_csv::load(opts.prices_path, opts.csv);
    std::cout << "  " << loaded.rows.size() << " prices from column '"
              << loaded.price_column << "'";
    if (loaded.skipped_rows > 0) {
        std::cout << ", " << loaded.skipped_rows << " rows without a price skipped";
    }
    std::cout << "\n";

    PriceSeries series(std::move(loaded.rows));
    if (opts.start || opts.end) {
        int64_t first = opts.start.value_or(std::numeric_limits<int64_t>::min());
        int64_t last = opts.end.value_or(std::numeric_limits<int64_t>::max());
        series = series.between(first, last);
    }
    std::cout << "  Range " << time_utils::date_to_string(series.first_timestamp())
              << " to " << time_utils::date_to_string(series.last_timestamp())
              << " (" << series.size() << " prices)\n";
    return series;
}

void write_outputs(const CliOptions& opts, const BacktestEngine& engine) {
    if (!opts.output_path.empty()) {
        auto chart = engine.chart_data();
        std::string ext = std::filesystem::path(opts.output_path).extension().string();
        if (ext == ".parquet") {
            chart_parquet::write(chart, opts.output_path);
        } else {
            backtest_io::write_chart_csv(chart, opts.output_path);
        }
        std::cout << "Chart data (" << chart.rows.size() << " rows, "
                  << chart.markers.size() << " trades) written to "
                  << opts.output_path << "\n";
    }

    if (!opts.json_path.empty()) {
        std::ofstream out(opts.json_path);
        if (!out.is_open()) {
            throw std::runtime_error("Cannot open output file: " + opts.json_path);
        }
        out << backtest_io::to_json(engine.result()) << "\n";
        std::cout << "Result JSON written to " << opts.json_path << "\n";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    try {
        BacktestEngine engine(load_series(opts));

        std::printf("Backtest initialising (short=%d, long=%d, cost=%.4f)...\n",
                    opts.backtest.short_window, opts.backtest.long_window,
                    opts.backtest.cost_rate);
        auto metrics = engine.run(opts.backtest);
        std::cout << "Backtest completed: " << engine.result().returns.size()
                  << " simulated periods.\n\n";

        std::cout << "Backtest Results:\n" << backtest_io::format_report(metrics) << "\n";

        write_outputs(opts, engine);
    } catch (const InvalidParameterError& e) {
        std::cerr << "ERROR (invalid parameter): " << e.what() << "\n";
        return EXIT_INVALID_PARAMETER;
    } catch (const InsufficientDataError& e) {
        std::cerr << "ERROR (insufficient data): " << e.what() << "\n";
        std::cerr << "Use a longer date range or smaller windows.\n";
        return EXIT_INSUFFICIENT_DATA;
    } catch (const DomainError& e) {
        std::cerr << "ERROR (bad price data): " << e.what() << "\n";
        return EXIT_DOMAIN;
    } catch (const StateError& e) {
        std::cerr << "ERROR (state): " << e.what() << "\n";
        return EXIT_STATE;
    } catch (const std::runtime_error& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return EXIT_IO;
    } catch (const std::exception& e) {
        std::cerr << "ERROR (internal): " << e.what() << "\n";
        return EXIT_INTERNAL;
    }

    return EXIT_OK;
}
