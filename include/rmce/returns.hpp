#pragma once

/// @file include/rmce/returns.hpp
/// @brief ReturnCalculator: price series to log-return series.
///
/// # Module: Return Calculator
///
/// ## Responsibility
/// The single entry point where prices become returns. Both pipelines (regime
/// analysis and Monte Carlo parameterisation) consume its output.
///
/// ## Core Formula
/// ```
/// r_t = ln(P_t / P_{t−1}),   t = 1 … n − 1
/// ```
///
/// ## Guarantees
/// - Pure static functions, no state
/// - Output length is always `prices.size() − 1`
/// - Throws `InsufficientDataError` for fewer than 2 prices and
///   `InvalidSeriesError` for a non-positive or non-finite price

#include "rmce/types.hpp"
#include "rmce/constants.hpp"

#include <span>

namespace rmce::core {

class ReturnCalculator {
public:
    ReturnCalculator() = delete;

    /// Compute log returns from an ascending price series.
    [[nodiscard]] static ReturnSeries log_returns(std::span<const double> prices);

    /// Compute log returns from the closes of an observation series.
    [[nodiscard]] static ReturnSeries
    log_returns(std::span<const Observation> observations);

    /// Annualised volatility: sample std-dev of daily returns × √252.
    /// Returns 0.0 for fewer than 2 returns.
    [[nodiscard]] static double
    annualised_volatility(std::span<const double> returns) noexcept;

    /// Annualised drift: mean daily return × 252.  Returns 0.0 on empty input.
    [[nodiscard]] static double
    annualised_drift(std::span<const double> returns) noexcept;
};

}  // namespace rmce::core
