#pragma once

#include <cstddef>
#include <cstdint>

/// @file include/rmce/constants.hpp
/// @brief Model and numerical constants for the RMCE system.

namespace rmce::constants {

// ─── Calendar ─────────────────────────────────────────────────────────────────

/// Trading days per year; annualisation factor and inverse GBM step.
static constexpr double TRADING_DAYS_PER_YEAR = 252.0;

/// Default lookback: the most recent year of trading observations.
static constexpr std::size_t DEFAULT_MAX_HISTORY = 252;

// ─── Regime Model ─────────────────────────────────────────────────────────────

/// A daily log return above this is labelled BULL.
static constexpr double DEFAULT_HIGH_THRESHOLD = 0.02;

/// A daily log return below this is labelled BEAR.
static constexpr double DEFAULT_LOW_THRESHOLD = -0.02;

/// Minimum number of observations for regime analysis.
static constexpr std::size_t MIN_REGIME_HISTORY = 50;

/// Length of the trailing label window reported in the analysis result.
static constexpr std::size_t STATE_HISTORY_LENGTH = 20;

/// Rolling window for per-regime return volatility.
static constexpr std::size_t ROLLING_VOLATILITY_WINDOW = 5;

/// Default number of forecast steps for the state forecast.
static constexpr std::size_t DEFAULT_FORECAST_HORIZON = 5;

/// Upper bound on `forecast_horizon`.
static constexpr std::size_t MAX_FORECAST_HORIZON = 2520;

/// Shortest run of identical labels reported as a regime episode.
static constexpr std::size_t DEFAULT_MIN_RUN_LENGTH = 5;

/// Transition matrix rows must sum to 1 within this tolerance.
static constexpr double ROW_SUM_TOLERANCE = 1e-9;

// ─── Simulation ───────────────────────────────────────────────────────────────

/// Minimum number of observations to parameterise a simulation.
static constexpr std::size_t MIN_SIMULATION_HISTORY = 30;

static constexpr std::size_t DEFAULT_HORIZON_DAYS = 30;
static constexpr std::size_t DEFAULT_PATH_COUNT   = 10000;

/// Upper bounds on a single simulation: 100 years of daily steps and an
/// ensemble of at most 800 MB.
static constexpr std::size_t MAX_HORIZON_DAYS = 25200;
static constexpr std::size_t MAX_PATH_COUNT   = 100'000'000;

/// Paths per unit of work handed to a simulation worker. Each batch owns an
/// independently seeded generator, so results do not depend on worker count.
static constexpr std::size_t DEFAULT_BATCH_SIZE = 1024;

/// Golden-ratio increment used to derive per-batch seeds.
static constexpr std::uint64_t SEED_INCREMENT = 0x9E3779B97F4A7C15ULL;

// ─── Risk Report ──────────────────────────────────────────────────────────────

/// Terminal return below which a path counts as an extreme loss (−20 %).
static constexpr double EXTREME_LOSS_THRESHOLD = -0.20;

/// Excess kurtosis above which tails are labelled "heavy".
static constexpr double HEAVY_TAIL_KURTOSIS = 3.0;

/// |skewness| above which the distribution is labelled asymmetric.
static constexpr double SKEW_ASYMMETRY_THRESHOLD = 0.5;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

} // namespace rmce::constants
