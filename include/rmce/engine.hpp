#pragma once

/// @file include/rmce/engine.hpp
/// @brief Engine: the two public call contracts of RMCE.
///
/// # Module: Engine
///
/// ## Responsibility
/// Validate an instrument's observation series and run one of the two
/// independent pipelines over it:
/// ```
/// ObservationSeries ──▶ ReturnCalculator ──▶ RegimeClassifier
///                   ──▶ RegimeAnalytics  ──▶ RegimeAnalysisResult
///
/// ObservationSeries ──▶ ReturnCalculator ──▶ SimulationParameters
///                   ──▶ MonteCarloSimulator ──▶ RiskMetricsCalculator ──▶ RiskReport
/// ```
///
/// ## Usage
/// ```cpp
/// auto series = DataLoader::load_csv("AAPL.csv");
/// if (series) {
///     Engine engine;
///     fmt::print("{}\n", engine.run_regime_analysis(*series).to_string());
/// }
/// ```
///
/// ## History Windows
/// Both pipelines first keep only the most recent `max_history` observations,
/// then require at least `min_history` observations (50 for regime analysis,
/// 30 for simulation).
///
/// ## Guarantees
/// - Inputs are never modified; results are independent values
/// - `run_*` are const and may be called concurrently on one Engine
/// - Failures are reported by throwing an `rmce::Error` subclass

#include "rmce/types.hpp"
#include "rmce/constants.hpp"
#include "rmce/monte_carlo.hpp"
#include "rmce/regime.hpp"
#include "rmce/risk.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace rmce::core {

// ─── Configuration ────────────────────────────────────────────────────────────

struct RiskConfig {
    std::size_t                  horizon_days = constants::DEFAULT_HORIZON_DAYS;
    std::size_t                  path_count   = constants::DEFAULT_PATH_COUNT;
    std::size_t                  min_history  = constants::MIN_SIMULATION_HISTORY;
    std::size_t                  max_history  = constants::DEFAULT_MAX_HISTORY;  ///< 0 = keep all
    std::optional<std::uint64_t> rng_seed;     ///< Empty: draw from std::random_device
    std::size_t                  worker_count = 0;  ///< 0 = hardware concurrency
    std::size_t                  batch_size   = constants::DEFAULT_BATCH_SIZE;

    /// Throws `InvalidParameterError` on a zero batch size, a horizon or path
    /// count outside the simulator's bounds, `min_history < 2`, or a non-zero
    /// `max_history` below `min_history`.
    void validate() const;
};

struct EngineConfig {
    regime::RegimeConfig regime{};
    RiskConfig           risk{};

    void validate() const;
};

// ─── Engine ───────────────────────────────────────────────────────────────────

class Engine {
public:
    /// Throws `InvalidParameterError` if `config` fails validation.
    explicit Engine(EngineConfig config = EngineConfig{});

    /// Classify the instrument's recent returns into regimes and aggregate
    /// the Markov model.
    ///
    /// # Throws
    /// - `InsufficientDataError` for fewer than 2 observations
    /// - `InvalidSeriesError` if the series is unordered or has bad values
    /// - `InsufficientHistoryError` below `regime.min_history` observations
    [[nodiscard]] regime::RegimeAnalysisResult
    run_regime_analysis(std::span<const Observation> observations) const;

    /// Estimate GBM parameters from the series and simulate its risk.
    ///
    /// # Throws
    /// As `run_regime_analysis` with `risk.min_history`, plus
    /// `OperationCancelledError` if `token` is cancelled.
    [[nodiscard]] risk::RiskReport
    run_monte_carlo_risk(std::span<const Observation> observations) const;

    [[nodiscard]] risk::RiskReport
    run_monte_carlo_risk(std::span<const Observation>      observations,
                         const simulation::CancellationToken& token) const;

    /// Simulate from explicit parameters.  `horizon_days` and `path_count`
    /// are taken from `params`, not from the risk config.
    [[nodiscard]] risk::RiskReport
    run_monte_carlo_risk(const simulation::SimulationParameters& params) const;

    [[nodiscard]] risk::RiskReport
    run_monte_carlo_risk(const simulation::SimulationParameters& params,
                         const simulation::CancellationToken&    token) const;

    /// Throws `InvalidSeriesError` unless dates strictly increase, every close
    /// is positive and finite, and every volume is non-negative and finite.
    static void validate_series(std::span<const Observation> observations);

    /// The most recent `max_history` observations (all of them if 0).
    [[nodiscard]] static std::span<const Observation>
    recent(std::span<const Observation> observations, std::size_t max_history) noexcept;

    /// GBM parameters from a series: last close, annualised sample
    /// volatility and drift of its log returns.
    [[nodiscard]] static simulation::SimulationParameters
    estimate_parameters(std::span<const Observation> observations,
                        std::size_t                  horizon_days,
                        std::size_t                  path_count);

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    /// Size checks shared by both pipelines; returns the trimmed window.
    [[nodiscard]] static std::span<const Observation>
    prepare(std::span<const Observation> observations,
            std::size_t                  min_history,
            std::size_t                  max_history,
            const char*                  stage);

    EngineConfig config_;
};

// ─── Free-function entry points ───────────────────────────────────────────────

[[nodiscard]] regime::RegimeAnalysisResult
run_regime_analysis(std::span<const Observation> observations,
                    const regime::RegimeConfig&  config = regime::RegimeConfig{});

[[nodiscard]] risk::RiskReport
run_monte_carlo_risk(std::span<const Observation> observations,
                     const RiskConfig&            config = RiskConfig{});

[[nodiscard]] risk::RiskReport
run_monte_carlo_risk(const simulation::SimulationParameters& params,
                     const RiskConfig&                       config = RiskConfig{});

}  // namespace rmce::core
