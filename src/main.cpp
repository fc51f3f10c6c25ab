/// @file src/main.cpp
/// @brief RMCE CLI entry point.
///
/// Usage:
///   rmce --regime <csv_file>                 Regime analysis of one series
///   rmce --risk <csv_file> [options]         Monte Carlo risk of one series
///   rmce --batch <dir> <SYMBOL>...           Both pipelines over <dir>/<SYMBOL>.csv
///   rmce --help                              Print usage
///
/// Options:
///   --horizon <days>  --paths <n>  --seed <n>  --workers <n>  --log-level <name>

#include "rmce/batch.hpp"
#include "rmce/data_loader.hpp"
#include "rmce/engine.hpp"
#include "rmce/errors.hpp"
#include "rmce/logging.hpp"

#include <fmt/core.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  rmce --regime <csv_file>             Regime analysis of one series\n"
        "  rmce --risk <csv_file> [options]     Monte Carlo risk of one series\n"
        "  rmce --batch <dir> <SYMBOL>...       Both pipelines over <dir>/<SYMBOL>.csv\n"
        "  rmce --help                          Show this help\n"
        "\n"
        "Options:\n"
        "  --horizon <days>     Simulation horizon in trading days (default 30)\n"
        "  --paths <n>          Number of simulated paths (default 10000)\n"
        "  --seed <n>           RNG seed (default: random, or RMCE_RNG_SEED)\n"
        "  --workers <n>        Simulation threads (default: all cores)\n"
        "  --log-level <name>   trace|debug|info|warn|error|off (or RMCE_LOG_LEVEL)\n"
        "\n"
        "CSV format (header required, columns matched by name):\n"
        "  date,close,volume\n"
    );
}

struct CliOptions {
    std::string              mode;
    std::string              target;
    std::vector<std::string> symbols;
    rmce::batch::BatchConfig batch = rmce::batch::BatchConfig::from_env();
};

std::optional<std::uint64_t> parse_unsigned(const std::string& flag, const std::string& text) {
    try {
        std::size_t pos = 0;
        const unsigned long long value = std::stoull(text, &pos);
        if (pos == text.size() && text.find('-') == std::string::npos) {
            return static_cast<std::uint64_t>(value);
        }
    } catch (const std::logic_error&) {
        // fall through to the error below
    }
    fmt::print(stderr, "Error: {} expects a non-negative integer, got '{}'\n", flag, text);
    return std::nullopt;
}

/// Returns nullopt (after printing an error) on malformed arguments.
std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    opts.mode = argv[1];

    int i = 2;
    if (opts.mode == "--regime" || opts.mode == "--risk" || opts.mode == "--batch") {
        if (argc < 3) {
            fmt::print(stderr, "Error: {} requires a path argument\n", opts.mode);
            return std::nullopt;
        }
        opts.target = argv[2];
        i = 3;
    }

    auto& risk = opts.batch.engine.risk;
    for (; i < argc; ++i) {
        const std::string arg(argv[i]);
        const bool has_value = i + 1 < argc;

        if (arg.rfind("--", 0) != 0) {
            if (opts.mode != "--batch") {
                fmt::print(stderr, "Error: unexpected argument '{}' for {}\n", arg, opts.mode);
                return std::nullopt;
            }
            opts.symbols.push_back(arg);
            continue;
        }
        if (!has_value) {
            fmt::print(stderr, "Error: {} requires a value\n", arg);
            return std::nullopt;
        }
        const std::string value(argv[++i]);

        if (arg == "--log-level") {
            opts.batch.log_level = value;
            continue;
        }
        const auto number = parse_unsigned(arg, value);
        if (!number) return std::nullopt;

        if (arg == "--horizon") {
            risk.horizon_days = static_cast<std::size_t>(*number);
        } else if (arg == "--paths") {
            risk.path_count = static_cast<std::size_t>(*number);
        } else if (arg == "--seed") {
            risk.rng_seed = *number;
        } else if (arg == "--workers") {
            risk.worker_count = static_cast<std::size_t>(*number);
        } else {
            fmt::print(stderr, "Unknown option: {}\n", arg);
            return std::nullopt;
        }
    }
    return opts;
}

/// Load a CSV file, printing an error when it yields no observations.
std::optional<rmce::ObservationSeries> load_series(const std::string& filepath) {
    auto series = rmce::core::DataLoader::load_csv(filepath);
    if (!series) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", filepath);
        return std::nullopt;
    }
    if (series->empty()) {
        fmt::print(stderr, "Error: no valid observations loaded from '{}'\n", filepath);
        return std::nullopt;
    }
    fmt::print("Loaded {} observations from '{}'\n", series->size(), filepath);
    return series;
}

int run_regime(const CliOptions& opts) {
    const auto series = load_series(opts.target);
    if (!series) return 1;

    const rmce::core::Engine engine(opts.batch.engine);
    fmt::print("{}\n", engine.run_regime_analysis(*series).to_string());
    return 0;
}

int run_risk(const CliOptions& opts) {
    const auto series = load_series(opts.target);
    if (!series) return 1;

    const rmce::core::Engine engine(opts.batch.engine);
    fmt::print("{}\n", engine.run_monte_carlo_risk(*series).to_string());
    return 0;
}

int run_batch(const CliOptions& opts) {
    if (opts.symbols.empty()) {
        fmt::print(stderr, "Error: --batch requires at least one symbol\n");
        return 1;
    }

    rmce::batch::CsvDirectoryProvider provider(opts.target);
    rmce::batch::ConsoleSink sink;
    rmce::batch::BatchRunner runner(provider, sink, opts.batch);

    const auto summary = runner.run(opts.symbols);
    fmt::print("{}", summary.to_string());
    return summary.failed == 0 ? 0 : 2;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);
    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage();
        return 1;
    }
    if (!rmce::log::set_level(opts->batch.log_level)) {
        fmt::print(stderr, "Warning: unknown log level '{}'\n", opts->batch.log_level);
    }

    try {
        if (mode == "--regime") return run_regime(*opts);
        if (mode == "--risk")   return run_risk(*opts);
        if (mode == "--batch")  return run_batch(*opts);
    } catch (const rmce::Error& e) {
        fmt::print(stderr, "Error [{}]: {}\n", rmce::to_string(e.code()), e.what());
        return 1;
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
