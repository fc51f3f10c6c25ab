#pragma once

/// @file include/rmce/types.hpp
/// @brief Shared primitive types for the Regime & Monte Carlo Engine (RMCE).
///
/// Every module includes this file. It defines the observation record, the
/// regime enumeration with its fixed index mapping, and the Eigen-based
/// fixed-size aliases used for the Markov model.

#include <Eigen/Dense>

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace rmce {

/// Number of discrete market regimes.
static constexpr int REGIME_COUNT = 3;

// ─── Regime ───────────────────────────────────────────────────────────────────

/// Discrete market-condition label. The underlying value is the row/column
/// index of the regime in every matrix and array of this library.
enum class Regime : int {
    Bull     = 0,
    Bear     = 1,
    Sideways = 2,
};

/// All regimes in index order.
inline constexpr std::array<Regime, REGIME_COUNT> ALL_REGIMES{
    Regime::Bull, Regime::Bear, Regime::Sideways};

[[nodiscard]] constexpr std::size_t index_of(Regime r) noexcept {
    return static_cast<std::size_t>(r);
}

[[nodiscard]] constexpr std::string_view to_string(Regime r) noexcept {
    switch (r) {
        case Regime::Bull:     return "BULL";
        case Regime::Bear:     return "BEAR";
        case Regime::Sideways: return "SIDEWAYS";
    }
    return "UNKNOWN";
}

/// One value per regime, indexed with `index_of`.
template <typename T>
using RegimeArray = std::array<T, REGIME_COUNT>;

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// Row-stochastic regime transition matrix: P(i, j) = P(next = j | now = i).
using TransitionMatrix = Eigen::Matrix<double, REGIME_COUNT, REGIME_COUNT>;

/// Raw transition counts before normalisation.
using TransitionCounts = Eigen::Matrix<Eigen::Index, REGIME_COUNT, REGIME_COUNT>;

/// A probability distribution over regimes (row vector, so that a one-step
/// evolution reads `next = current * P`).
using StateDistribution = Eigen::Matrix<double, 1, REGIME_COUNT>;

// ─── Series Types ─────────────────────────────────────────────────────────────

/// A single daily observation of an instrument.
struct Observation {
    std::string date;    ///< ISO-8601 date (lexicographic order == time order)
    double      close;   ///< Closing price, > 0
    double      volume;  ///< Traded volume, >= 0
};

/// Observations in strictly increasing date order.
using ObservationSeries = std::vector<Observation>;

/// Log returns derived from an ObservationSeries (length = observations − 1).
using ReturnSeries = std::vector<double>;

/// One regime label per return.
using RegimeSeries = std::vector<Regime>;

} // namespace rmce
