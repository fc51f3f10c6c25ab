/// @file src/batch/batch_runner.cpp
/// @brief BatchRunner, stock providers/sinks and BatchConfig.

#include "rmce/batch.hpp"
#include "rmce/data_loader.hpp"
#include "rmce/logging.hpp"

#include <fmt/format.h>

#include <chrono>
#include <cstdlib>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace rmce::batch {

// ─── CsvDirectoryProvider ─────────────────────────────────────────────────────

CsvDirectoryProvider::CsvDirectoryProvider(std::string directory)
    : directory_(std::move(directory)) {}

std::optional<ObservationSeries>
CsvDirectoryProvider::fetch(const std::string& symbol) {
    const std::string path = directory_.empty()
        ? fmt::format("{}.csv", symbol)
        : fmt::format("{}/{}.csv", directory_, symbol);
    return core::DataLoader::load_csv(path);
}

// ─── ConsoleSink ──────────────────────────────────────────────────────────────

void ConsoleSink::on_regime(const std::string& symbol,
                            const regime::RegimeAnalysisResult& result) {
    fmt::print(out_, "=== {} : regime ===\n{}\n", symbol, result.to_string());
}

void ConsoleSink::on_risk(const std::string& symbol, const risk::RiskReport& report) {
    fmt::print(out_, "=== {} : risk ===\n{}\n", symbol, report.to_string());
}

// ─── BatchConfig ──────────────────────────────────────────────────────────────

BatchConfig BatchConfig::from_env() {
    BatchConfig cfg;

    if (const char* level = std::getenv("RMCE_LOG_LEVEL")) {
        cfg.log_level = level;
    }
    if (const char* seed = std::getenv("RMCE_RNG_SEED")) {
        try {
            std::size_t pos = 0;
            const unsigned long long value = std::stoull(seed, &pos);
            if (pos != std::string(seed).size()) {
                throw std::invalid_argument("trailing characters");
            }
            cfg.engine.risk.rng_seed = static_cast<std::uint64_t>(value);
        } catch (const std::logic_error&) {
            log::logger()->warn("ignoring invalid RMCE_RNG_SEED '{}'", seed);
        }
    }
    return cfg;
}

void BatchConfig::validate() const {
    if (!run_regime && !run_risk) {
        throw InvalidParameterError("batch must enable regime analysis, risk, or both");
    }
    engine.validate();
}

// ─── BatchSummary ─────────────────────────────────────────────────────────────

double BatchSummary::success_rate() const noexcept {
    return processed == 0
        ? 0.0
        : static_cast<double>(successful) / static_cast<double>(processed);
}

std::string BatchSummary::to_string() const {
    std::string out = fmt::format(
        "Batch: {}/{} processed, {} succeeded, {} failed ({:.1f}% success) in {:.2f}s\n",
        processed, total, successful, failed, success_rate() * 100.0, duration_seconds);
    auto it = std::back_inserter(out);
    for (const auto& f : failures) {
        fmt::format_to(it, "  {:<10} {:<20} {}\n", f.symbol, rmce::to_string(f.code), f.message);
    }
    return out;
}

// ─── BatchRunner ──────────────────────────────────────────────────────────────

BatchRunner::BatchRunner(SeriesProvider& provider, ResultSink& sink, BatchConfig config)
    : provider_(provider),
      sink_(sink),
      config_(std::move(config)),
      engine_(config_.engine) {
    config_.validate();
}

BatchSummary BatchRunner::run(const std::vector<std::string>& symbols) {
    const simulation::CancellationToken never;
    return run(symbols, never);
}

BatchSummary BatchRunner::run(const std::vector<std::string>&      symbols,
                              const simulation::CancellationToken& token) {
    const auto start = std::chrono::steady_clock::now();

    BatchSummary summary;
    summary.total = symbols.size();
    log::logger()->info("batch started: {} symbol(s)", symbols.size());

    for (const auto& symbol : symbols) {
        if (token.is_cancelled()) {
            log::logger()->warn("batch cancelled after {} of {} symbols",
                                summary.processed, summary.total);
            break;
        }

        ++summary.processed;
        auto failure = process_symbol(symbol, token);
        if (!failure) {
            ++summary.successful;
            log::logger()->info("{}: ok", symbol);
            continue;
        }

        ++summary.failed;
        log::logger()->warn("{}: {} ({})", symbol, failure->message,
                            rmce::to_string(failure->code));
        const bool cancelled = failure->code == ErrorCode::Cancelled;
        summary.failures.push_back(std::move(*failure));
        if (cancelled) break;
    }

    summary.duration_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();
    log::logger()->info("batch finished: {} succeeded, {} failed in {:.2f}s",
                        summary.successful, summary.failed, summary.duration_seconds);
    return summary;
}

std::optional<SymbolFailure>
BatchRunner::process_symbol(const std::string& symbol,
                            const simulation::CancellationToken& token) {
    const auto series = provider_.fetch(symbol);
    if (!series) {
        return SymbolFailure{
            .symbol  = symbol,
            .code    = ErrorCode::InsufficientData,
            .message = "no data available",
        };
    }

    try {
        if (config_.run_regime) {
            sink_.on_regime(symbol, engine_.run_regime_analysis(*series));
        }
        if (config_.run_risk) {
            sink_.on_risk(symbol, engine_.run_monte_carlo_risk(*series, token));
        }
    } catch (const Error& e) {
        return SymbolFailure{.symbol = symbol, .code = e.code(), .message = e.what()};
    }
    return std::nullopt;
}

}  // namespace rmce::batch
