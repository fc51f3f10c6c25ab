#pragma once

/// @file include/rmce/risk.hpp
/// @brief RiskMetricsCalculator: VaR, expected shortfall, stress and tail
///        diagnostics over a simulated ensemble.
///
/// # Module: Risk Metrics
///
/// ## Responsibility
/// Reduce a `SimulatedPathEnsemble` of terminal simple returns to a
/// `RiskReport`.  All quantities are in return space (−0.05 = a 5% loss).
///
/// ## Conventions
/// - Percentiles interpolate linearly between order statistics at rank
///   `p/100 · (n − 1)`.
/// - VaR_p is the (100 − p)th percentile; ES_p is the mean of the returns at
///   or below VaR_p, so ES_p <= VaR_p always holds.
/// - Standard deviation, skewness and kurtosis are population moments.
///
/// ## Guarantees
/// - `var_99 <= var_95` and `es_99 <= var_99`, `es_95 <= var_95`
/// - Throws only `EmptyEnsembleError`

#include "rmce/monte_carlo.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace rmce::risk {

// ─── Report Records ───────────────────────────────────────────────────────────

struct StressTestResults {
    double worst_case_1pct          = 0.0;
    double worst_case_5pct          = 0.0;
    double worst_case_10pct         = 0.0;
    double extreme_loss_probability = 0.0;  ///< P(r < −20%)
    double tail_expectation         = 0.0;  ///< Same value as expected_shortfall_95
};

struct TailRiskAnalysis {
    double      kurtosis       = 0.0;  ///< Excess kurtosis, 0 for a constant ensemble
    double      skewness       = 0.0;
    double      fourth_moment  = 0.0;  ///< E[(r − mean)^4]
    std::string tail_thickness = "normal";     ///< "heavy" | "normal"
    std::string tail_asymmetry = "symmetric";  ///< "left" | "right" | "symmetric"
};

struct RiskReport {
    double var_95                      = 0.0;
    double var_99                      = 0.0;
    double expected_shortfall_95       = 0.0;
    double expected_shortfall_99       = 0.0;
    double mean_return                 = 0.0;
    double std_return                  = 0.0;
    double min_return                  = 0.0;
    double max_return                  = 0.0;
    double median_return               = 0.0;
    double probability_positive_return = 0.0;
    double probability_negative_return = 0.0;

    StressTestResults stress_test;
    TailRiskAnalysis  tail_risk;

    simulation::SimulationParameters parameters;  ///< Inputs that produced the ensemble
    std::uint64_t                    seed_used  = 0;
    std::size_t                      path_count = 0;

    /// Multi-line human-readable report.
    [[nodiscard]] std::string to_string() const;
};

// ─── RiskMetricsCalculator ────────────────────────────────────────────────────

class RiskMetricsCalculator {
public:
    RiskMetricsCalculator() = delete;

    /// Compute every ensemble statistic.  `parameters`, `seed_used` and
    /// `path_count` of the result are left for the caller to fill.
    ///
    /// # Throws
    /// - `EmptyEnsembleError` if `ensemble` is empty
    [[nodiscard]] static RiskReport compute(std::span<const double> ensemble);

    /// Mean of the values at or below `threshold`, never above `threshold`
    /// nor below the smallest such value; 0.0 if there are none.
    [[nodiscard]] static double
    expected_shortfall(std::span<const double> ensemble, double threshold) noexcept;

    /// Stress percentiles and extreme-loss probability over a sorted ensemble.
    [[nodiscard]] static StressTestResults
    stress_tests(std::span<const double> sorted);

    /// Moment-based tail diagnostics.  Skewness and kurtosis are 0 when the
    /// ensemble has no dispersion.
    [[nodiscard]] static TailRiskAnalysis
    tail_risk(std::span<const double> ensemble);
};

}  // namespace rmce::risk
