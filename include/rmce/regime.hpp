#pragma once

/// @file include/rmce/regime.hpp
/// @brief Regime classification and empirical Markov model: public API.
///
/// # Module: Regime Analysis
///
/// ## Responsibility
/// Label each daily log return with a discrete market regime, estimate the
/// regime transition matrix from consecutive labels, and aggregate the
/// per-regime statistics consumed by reporting.
///
/// ## Pipeline
/// ```
/// ReturnSeries ──RegimeClassifier──▶ RegimeSeries
///              ──TransitionMatrixEstimator──▶ TransitionMatrix
///              ──RegimeAnalytics::analyse──▶ RegimeAnalysisResult
/// ```
///
/// ## Degenerate Inputs
/// A regime that never occurs is not an error. Its transition row becomes the
/// uniform distribution (1/3 each) and every per-regime statistic defaults to
/// zero. The uniform row biases the steady-state approximation and the
/// entropy when data is sparse.
///
/// ## Guarantees
/// - Transition matrix rows sum to 1 within `ROW_SUM_TOLERANCE`
/// - Identical input yields bit-identical results (no randomness)
/// - Only `InsufficientHistoryError` / `InvalidParameterError` are thrown
///
/// ## NOT Responsible For
/// - Computing returns from prices (see rmce/returns.hpp)
/// - Validating observation ordering (see rmce/engine.hpp)

#include "rmce/types.hpp"
#include "rmce/constants.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace rmce::regime {

// ─── Configuration ────────────────────────────────────────────────────────────

struct RegimeConfig {
    double      high_threshold   = constants::DEFAULT_HIGH_THRESHOLD;
    double      low_threshold    = constants::DEFAULT_LOW_THRESHOLD;
    std::size_t min_history      = constants::MIN_REGIME_HISTORY;
    std::size_t max_history      = constants::DEFAULT_MAX_HISTORY;  ///< 0 = keep all
    std::size_t forecast_horizon = constants::DEFAULT_FORECAST_HORIZON;
    std::size_t min_run_length   = constants::DEFAULT_MIN_RUN_LENGTH;

    /// Throws `InvalidParameterError` if thresholds are non-finite or
    /// `low_threshold >= high_threshold`, if `min_history < 2`, if a
    /// non-zero `max_history` is below `min_history`, or if
    /// `forecast_horizon` exceeds `MAX_FORECAST_HORIZON`.
    void validate() const;
};

// ─── RegimeClassifier ─────────────────────────────────────────────────────────

/// Threshold classifier: BULL if r > high, BEAR if r < low, else SIDEWAYS.
class RegimeClassifier {
public:
    /// Throws `InvalidParameterError` if `low_threshold >= high_threshold`.
    explicit RegimeClassifier(double high_threshold = constants::DEFAULT_HIGH_THRESHOLD,
                              double low_threshold  = constants::DEFAULT_LOW_THRESHOLD);

    [[nodiscard]] Regime classify(double log_return) const noexcept;

    /// Label every return in order.
    [[nodiscard]] RegimeSeries classify_series(std::span<const double> returns) const;

    [[nodiscard]] double high_threshold() const noexcept { return high_threshold_; }
    [[nodiscard]] double low_threshold()  const noexcept { return low_threshold_; }

private:
    double high_threshold_;
    double low_threshold_;
};

// ─── TransitionMatrixEstimator ────────────────────────────────────────────────

/// Counts label[i] → label[i+1] transitions and row-normalises them.
class TransitionMatrixEstimator {
public:
    TransitionMatrixEstimator() = delete;

    /// 3×3 count matrix over consecutive label pairs.
    [[nodiscard]] static TransitionCounts
    count_transitions(std::span<const Regime> labels) noexcept;

    /// Row-normalise counts; a zero row becomes uniform (1/3 each).
    [[nodiscard]] static TransitionMatrix
    normalise(const TransitionCounts& counts) noexcept;

    /// `normalise(count_transitions(labels))`.
    [[nodiscard]] static TransitionMatrix
    estimate(std::span<const Regime> labels) noexcept;

    /// True if every entry is in [0, 1] and every row sums to 1 within `tolerance`.
    [[nodiscard]] static bool
    is_row_stochastic(const TransitionMatrix& m,
                      double tolerance = constants::ROW_SUM_TOLERANCE) noexcept;
};

// ─── Result Records ───────────────────────────────────────────────────────────

/// Return statistics over the observations labelled with one regime.
struct RegimeCharacteristics {
    double      mean_return  = 0.0;
    double      volatility   = 0.0;  ///< Population std-dev of returns
    std::size_t frequency    = 0;    ///< Observation count
    double      avg_duration = 0.0;  ///< frequency / total (duration proxy)
};

struct VolatilityRegime {
    double      avg_volatility   = 0.0;  ///< Mean rolling(5) sample std-dev
    std::string volatility_trend = "stable";
};

struct TrendRegime {
    double trend_slope    = 0.0;  ///< OLS slope of closes vs observation rank
    double trend_strength = 0.0;  ///< |trend_slope|
};

struct VolumeRegime {
    double avg_volume        = 0.0;
    double volume_volatility = 0.0;  ///< Population std-dev of volume
};

struct ModelMetrics {
    double      entropy           = 0.0;  ///< Σ −p·log2(p) over nonzero entries
    double      persistence       = 0.0;  ///< Mean self-transition probability
    std::size_t states_count      = 0;    ///< Distinct regimes observed
    std::size_t transitions_count = 0;    ///< labels − 1
};

/// Distribution over regimes `step` periods ahead of the current state.
struct StateForecast {
    std::size_t       step;
    StateDistribution probabilities;
    Regime            most_likely;
};

/// A maximal run of identical consecutive labels.
struct RegimeRun {
    Regime      state;
    std::size_t start_index;  ///< Index of the first label of the run
    std::size_t end_index;    ///< Index of the last label (inclusive)
    std::size_t length;
};

struct RegimeRunSummary {
    std::vector<RegimeRun> runs;
    double                 average_length = 0.0;
    std::size_t            min_length     = 0;
    std::size_t            max_length     = 0;
};

/// Aggregate output of one regime analysis of one instrument.
struct RegimeAnalysisResult {
    Regime                             current_state;
    RegimeArray<double>                state_probabilities;
    TransitionMatrix                   transition_matrix;
    RegimeArray<double>                steady_state_probabilities;  ///< Column-average approximation
    RegimeArray<double>                stationary_distribution;     ///< Exact π = πP
    RegimeArray<double>                expected_duration;           ///< +∞ if absorbing
    RegimeArray<RegimeCharacteristics> regime_characteristics;
    RegimeArray<VolatilityRegime>      volatility_regimes;
    RegimeArray<TrendRegime>           trend_regimes;
    RegimeArray<VolumeRegime>          volume_regimes;
    RegimeSeries                       state_history;               ///< Trailing 20 labels
    ModelMetrics                       model_metrics;
    std::vector<StateForecast>         forecast;
    RegimeRunSummary                   regime_runs;
    std::size_t                        observation_count = 0;       ///< Labels analysed

    /// Multi-line human-readable report.
    [[nodiscard]] std::string to_string() const;
};

// ─── RegimeAnalytics ──────────────────────────────────────────────────────────

/// Stateless aggregation of regime statistics.
///
/// `closes` and `volumes` are aligned with `returns`: element i is the
/// observation at which return i was realised (i.e. observation i + 1 of the
/// raw series).
class RegimeAnalytics {
public:
    RegimeAnalytics() = delete;

    /// Run every aggregation and assemble the result.
    ///
    /// # Throws
    /// - `InvalidParameterError` if the four spans differ in length
    /// - `InsufficientHistoryError` if `labels` is empty
    [[nodiscard]] static RegimeAnalysisResult
    analyse(std::span<const double> closes,
            std::span<const double> volumes,
            std::span<const double> returns,
            std::span<const Regime> labels,
            const RegimeConfig&     config = RegimeConfig{});

    /// Marginal frequency of each regime.  All zero on empty input.
    [[nodiscard]] static RegimeArray<double>
    state_probabilities(std::span<const Regime> labels) noexcept;

    /// Column-wise mean of the transition matrix, renormalised to sum to 1.
    ///
    /// Approximates the stationary distribution.  See
    /// `stationary_distribution` for the exact solution.
    [[nodiscard]] static RegimeArray<double>
    steady_state_approximation(const TransitionMatrix& m) noexcept;

    /// Exact stationary distribution: solve π(I − P) = 0 with Σπ = 1.
    ///
    /// # Returns
    /// `nullopt` if the system is singular (e.g. several closed classes).
    [[nodiscard]] static std::optional<RegimeArray<double>>
    stationary_distribution(const TransitionMatrix& m) noexcept;

    /// 1 / (1 − P(s→s)), or +∞ when P(s→s) = 1.
    [[nodiscard]] static RegimeArray<double>
    expected_duration(const TransitionMatrix& m) noexcept;

    [[nodiscard]] static RegimeArray<RegimeCharacteristics>
    regime_characteristics(std::span<const double> returns,
                           std::span<const Regime> labels);

    [[nodiscard]] static RegimeArray<VolatilityRegime>
    volatility_regimes(std::span<const double> returns,
                       std::span<const Regime> labels);

    [[nodiscard]] static RegimeArray<TrendRegime>
    trend_regimes(std::span<const double> closes,
                  std::span<const Regime> labels);

    [[nodiscard]] static RegimeArray<VolumeRegime>
    volume_regimes(std::span<const double> volumes,
                   std::span<const Regime> labels);

    [[nodiscard]] static ModelMetrics
    model_metrics(std::span<const Regime> labels,
                  const TransitionMatrix& m) noexcept;

    /// The last `length` labels (all of them if fewer).
    [[nodiscard]] static RegimeSeries
    state_history(std::span<const Regime> labels,
                  std::size_t length = constants::STATE_HISTORY_LENGTH);

    /// h-step distributions e_current · P^h for h = 1 … horizon.
    [[nodiscard]] static std::vector<StateForecast>
    forecast(const TransitionMatrix& m, Regime current, std::size_t horizon);

    /// Maximal runs of identical labels whose length is at least `min_length`.
    [[nodiscard]] static RegimeRunSummary
    detect_regime_runs(std::span<const Regime> labels, std::size_t min_length);
};

}  // namespace rmce::regime
