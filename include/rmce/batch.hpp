#pragma once

/// @file include/rmce/batch.hpp
/// @brief BatchRunner: run both engines over many instruments.
///
/// # Module: Batch Runner
///
/// ## Responsibility
/// For each requested symbol: fetch its series from a `SeriesProvider`, run
/// the enabled pipelines through an `Engine`, and hand results to a
/// `ResultSink`. A failure on one symbol is logged, tallied and does not stop
/// the batch.
///
/// ## Injection Points
/// ```
/// SeriesProvider ──fetch(symbol)──▶ BatchRunner ──on_regime / on_risk──▶ ResultSink
/// ```
/// `CsvDirectoryProvider` reads `<dir>/<SYMBOL>.csv`; `ConsoleSink` prints
/// the `to_string()` reports to stdout.
///
/// ## NOT Responsible For
/// - Persisting results (the sink decides)
/// - Retrying failed symbols

#include "rmce/engine.hpp"
#include "rmce/errors.hpp"
#include "rmce/monte_carlo.hpp"
#include "rmce/regime.hpp"
#include "rmce/risk.hpp"
#include "rmce/types.hpp"

#include <cstddef>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

namespace rmce::batch {

// ─── Interfaces ───────────────────────────────────────────────────────────────

/// Source of observation series keyed by symbol.
class SeriesProvider {
public:
    virtual ~SeriesProvider() = default;

    /// `nullopt` if the symbol is unknown to the provider.
    [[nodiscard]] virtual std::optional<ObservationSeries>
    fetch(const std::string& symbol) = 0;
};

/// Consumer of per-symbol results.
class ResultSink {
public:
    virtual ~ResultSink() = default;

    virtual void on_regime(const std::string& symbol,
                           const regime::RegimeAnalysisResult& result) = 0;
    virtual void on_risk(const std::string& symbol,
                         const risk::RiskReport& report) = 0;
};

// ─── Stock implementations ────────────────────────────────────────────────────

/// Reads `<directory>/<symbol>.csv` through `core::DataLoader`.
class CsvDirectoryProvider final : public SeriesProvider {
public:
    explicit CsvDirectoryProvider(std::string directory);

    [[nodiscard]] std::optional<ObservationSeries>
    fetch(const std::string& symbol) override;

private:
    std::string directory_;
};

/// Prints each report to a stdio stream (stdout by default).
class ConsoleSink final : public ResultSink {
public:
    explicit ConsoleSink(std::FILE* out = stdout) : out_(out) {}

    void on_regime(const std::string& symbol,
                   const regime::RegimeAnalysisResult& result) override;
    void on_risk(const std::string& symbol,
                 const risk::RiskReport& report) override;

private:
    std::FILE* out_;
};

// ─── Configuration ────────────────────────────────────────────────────────────

struct BatchConfig {
    bool               run_regime = true;
    bool               run_risk   = true;
    core::EngineConfig engine{};
    std::string        log_level  = "info";

    /// Defaults overridden by `RMCE_LOG_LEVEL` and `RMCE_RNG_SEED`.  An
    /// unparsable seed is ignored with a warning.
    [[nodiscard]] static BatchConfig from_env();

    /// Throws `InvalidParameterError` if neither pipeline is enabled or the
    /// engine config is invalid.
    void validate() const;
};

// ─── Summary ──────────────────────────────────────────────────────────────────

struct SymbolFailure {
    std::string symbol;
    ErrorCode   code;
    std::string message;
};

struct BatchSummary {
    std::size_t                total      = 0;
    std::size_t                processed  = 0;  ///< Symbols attempted before stop
    std::size_t                successful = 0;
    std::size_t                failed     = 0;
    std::vector<SymbolFailure> failures;
    double                     duration_seconds = 0.0;

    /// successful / processed, 0 when nothing was processed.
    [[nodiscard]] double success_rate() const noexcept;

    [[nodiscard]] std::string to_string() const;
};

// ─── BatchRunner ──────────────────────────────────────────────────────────────

class BatchRunner {
public:
    /// `provider` and `sink` must outlive the runner.
    BatchRunner(SeriesProvider& provider, ResultSink& sink, BatchConfig config);

    /// Process every symbol in order.
    [[nodiscard]] BatchSummary run(const std::vector<std::string>& symbols);

    /// As above; `token` is forwarded to the simulator and checked between
    /// symbols. Symbols not reached after cancellation are not counted as
    /// processed.
    [[nodiscard]] BatchSummary run(const std::vector<std::string>&      symbols,
                                   const simulation::CancellationToken& token);

private:
    /// Returns nullopt on success, the failure otherwise.
    [[nodiscard]] std::optional<SymbolFailure>
    process_symbol(const std::string& symbol,
                   const simulation::CancellationToken& token);

    SeriesProvider& provider_;
    ResultSink&     sink_;
    BatchConfig     config_;
    core::Engine    engine_;
};

}  // namespace rmce::batch
