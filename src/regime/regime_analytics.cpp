/// @file src/regime/regime_analytics.cpp
/// @brief RegimeAnalytics: per-regime aggregation, steady state, forecasts.

#include "rmce/regime.hpp"
#include "rmce/errors.hpp"
#include "rmce/logging.hpp"

#include "../stats/descriptive.hpp"

#include <Eigen/LU>
#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace rmce::regime {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

/// Values of `series` at the indices labelled `state`, in order.
std::vector<double> select(std::span<const double> series,
                           std::span<const Regime> labels,
                           Regime state) {
    std::vector<double> out;
    for (std::size_t i = 0; i < labels.size(); ++i) {
        if (labels[i] == state) {
            out.push_back(series[i]);
        }
    }
    return out;
}

RegimeArray<double> to_regime_array(const StateDistribution& d) noexcept {
    return {d(0), d(1), d(2)};
}

Regime argmax(const StateDistribution& d) noexcept {
    Eigen::Index best = 0;
    d.maxCoeff(&best);
    return ALL_REGIMES[static_cast<std::size_t>(best)];
}

}  // namespace

// ─── RegimeAnalytics::analyse ─────────────────────────────────────────────────

RegimeAnalysisResult
RegimeAnalytics::analyse(std::span<const double> closes,
                         std::span<const double> volumes,
                         std::span<const double> returns,
                         std::span<const Regime> labels,
                         const RegimeConfig&     config) {
    const std::size_t n = labels.size();
    if (closes.size() != n || volumes.size() != n || returns.size() != n) {
        throw InvalidParameterError(fmt::format(
            "misaligned regime inputs: closes={} volumes={} returns={} labels={}",
            closes.size(), volumes.size(), returns.size(), n));
    }
    if (n == 0) {
        throw InsufficientHistoryError("regime analysis needs at least one label");
    }

    const TransitionMatrix matrix = TransitionMatrixEstimator::estimate(labels);

    auto stationary = stationary_distribution(matrix);
    if (!stationary) {
        log::logger()->debug("stationary solve singular; using uniform distribution");
        stationary = RegimeArray<double>{1.0 / 3.0, 1.0 / 3.0, 1.0 / 3.0};
    }

    RegimeAnalysisResult result{
        .current_state              = labels.back(),
        .state_probabilities        = state_probabilities(labels),
        .transition_matrix          = matrix,
        .steady_state_probabilities = steady_state_approximation(matrix),
        .stationary_distribution    = *stationary,
        .expected_duration          = expected_duration(matrix),
        .regime_characteristics     = regime_characteristics(returns, labels),
        .volatility_regimes         = volatility_regimes(returns, labels),
        .trend_regimes              = trend_regimes(closes, labels),
        .volume_regimes             = volume_regimes(volumes, labels),
        .state_history              = state_history(labels),
        .model_metrics              = model_metrics(labels, matrix),
        .forecast                   = forecast(matrix, labels.back(), config.forecast_horizon),
        .regime_runs                = detect_regime_runs(labels, config.min_run_length),
        .observation_count          = n,
    };

    if (result.model_metrics.states_count < static_cast<std::size_t>(REGIME_COUNT)) {
        log::logger()->debug("{} regime(s) never observed; uniform rows and zero statistics applied",
                             REGIME_COUNT - static_cast<int>(result.model_metrics.states_count));
    }
    log::logger()->debug("regime analysis: {} labels, current={}, entropy={:.4f}",
                         n, to_string(result.current_state),
                         result.model_metrics.entropy);
    return result;
}

// ─── Probabilities ────────────────────────────────────────────────────────────

RegimeArray<double>
RegimeAnalytics::state_probabilities(std::span<const Regime> labels) noexcept {
    RegimeArray<double> probs{};
    if (labels.empty()) return probs;

    for (Regime r : labels) {
        probs[index_of(r)] += 1.0;
    }
    for (double& p : probs) {
        p /= static_cast<double>(labels.size());
    }
    return probs;
}

RegimeArray<double>
RegimeAnalytics::steady_state_approximation(const TransitionMatrix& m) noexcept {
    const StateDistribution col_mean = m.colwise().mean();
    const double total = col_mean.sum();
    // Rows are stochastic, so total == 1 up to rounding; renormalise anyway.
    return to_regime_array(col_mean / total);
}

std::optional<RegimeArray<double>>
RegimeAnalytics::stationary_distribution(const TransitionMatrix& m) noexcept {
    // π P = π  ⇔  (I − Pᵀ) πᵀ = 0.  Replace the last (redundant) equation by
    // the normalisation Σπ = 1.
    TransitionMatrix a = TransitionMatrix::Identity() - m.transpose();
    a.row(REGIME_COUNT - 1).setOnes();

    Eigen::Matrix<double, REGIME_COUNT, 1> b = Eigen::Matrix<double, REGIME_COUNT, 1>::Zero();
    b(REGIME_COUNT - 1) = 1.0;

    Eigen::FullPivLU<TransitionMatrix> lu(a);
    if (!lu.isInvertible()) {
        return std::nullopt;
    }

    Eigen::Matrix<double, REGIME_COUNT, 1> pi = lu.solve(b);
    pi = pi.cwiseMax(0.0);
    const double total = pi.sum();
    if (!(total > constants::FLOAT_EPSILON) || !pi.allFinite()) {
        return std::nullopt;
    }
    pi /= total;
    return RegimeArray<double>{pi(0), pi(1), pi(2)};
}

RegimeArray<double>
RegimeAnalytics::expected_duration(const TransitionMatrix& m) noexcept {
    RegimeArray<double> out{};
    for (Regime r : ALL_REGIMES) {
        const auto i = static_cast<Eigen::Index>(index_of(r));
        const double stay = m(i, i);
        out[index_of(r)] = (stay < 1.0)
            ? 1.0 / (1.0 - stay)
            : std::numeric_limits<double>::infinity();
    }
    return out;
}

// ─── Per-regime statistics ────────────────────────────────────────────────────

RegimeArray<RegimeCharacteristics>
RegimeAnalytics::regime_characteristics(std::span<const double> returns,
                                        std::span<const Regime> labels) {
    RegimeArray<RegimeCharacteristics> out{};
    if (labels.empty()) return out;

    for (Regime r : ALL_REGIMES) {
        const auto state_returns = select(returns, labels, r);
        if (state_returns.empty()) continue;  // unvisited: all zero

        auto& c = out[index_of(r)];
        c.mean_return  = *stats::mean(state_returns);
        c.volatility   = *stats::population_stddev(state_returns);
        c.frequency    = state_returns.size();
        c.avg_duration = static_cast<double>(state_returns.size())
                       / static_cast<double>(labels.size());
    }
    return out;
}

RegimeArray<VolatilityRegime>
RegimeAnalytics::volatility_regimes(std::span<const double> returns,
                                    std::span<const Regime> labels) {
    RegimeArray<VolatilityRegime> out{};
    for (Regime r : ALL_REGIMES) {
        const auto state_returns = select(returns, labels, r);
        auto& v = out[index_of(r)];
        v.avg_volatility = stats::mean_rolling_stddev(
            state_returns, constants::ROLLING_VOLATILITY_WINDOW).value_or(0.0);
        v.volatility_trend = state_returns.size() > 1 ? "increasing" : "stable";
    }
    return out;
}

RegimeArray<TrendRegime>
RegimeAnalytics::trend_regimes(std::span<const double> closes,
                               std::span<const Regime> labels) {
    RegimeArray<TrendRegime> out{};
    for (Regime r : ALL_REGIMES) {
        const auto state_closes = select(closes, labels, r);
        const double slope = stats::linear_slope(state_closes).value_or(0.0);
        out[index_of(r)] = TrendRegime{
            .trend_slope    = slope,
            .trend_strength = std::abs(slope),
        };
    }
    return out;
}

RegimeArray<VolumeRegime>
RegimeAnalytics::volume_regimes(std::span<const double> volumes,
                                std::span<const Regime> labels) {
    RegimeArray<VolumeRegime> out{};
    for (Regime r : ALL_REGIMES) {
        const auto state_volumes = select(volumes, labels, r);
        out[index_of(r)] = VolumeRegime{
            .avg_volume        = stats::mean(state_volumes).value_or(0.0),
            .volume_volatility = stats::population_stddev(state_volumes).value_or(0.0),
        };
    }
    return out;
}

// ─── Model metrics ────────────────────────────────────────────────────────────

ModelMetrics RegimeAnalytics::model_metrics(std::span<const Regime> labels,
                                            const TransitionMatrix& m) noexcept {
    double entropy = 0.0;
    for (Eigen::Index i = 0; i < REGIME_COUNT; ++i) {
        for (Eigen::Index j = 0; j < REGIME_COUNT; ++j) {
            const double p = m(i, j);
            if (p > 0.0) {
                entropy -= p * std::log2(p);
            }
        }
    }

    RegimeArray<bool> seen{};
    for (Regime r : labels) {
        seen[index_of(r)] = true;
    }

    return ModelMetrics{
        .entropy           = entropy,
        .persistence       = m.diagonal().mean(),
        .states_count      = static_cast<std::size_t>(std::count(seen.begin(), seen.end(), true)),
        .transitions_count = labels.empty() ? 0 : labels.size() - 1,
    };
}

RegimeSeries RegimeAnalytics::state_history(std::span<const Regime> labels,
                                            std::size_t length) {
    const std::size_t keep = std::min(length, labels.size());
    const auto tail = labels.last(keep);
    return RegimeSeries(tail.begin(), tail.end());
}

// ─── Forecast and run detection ───────────────────────────────────────────────

std::vector<StateForecast>
RegimeAnalytics::forecast(const TransitionMatrix& m, Regime current,
                          std::size_t horizon) {
    std::vector<StateForecast> out;
    out.reserve(horizon);

    StateDistribution state = StateDistribution::Zero();
    state(static_cast<Eigen::Index>(index_of(current))) = 1.0;

    for (std::size_t step = 1; step <= horizon; ++step) {
        state = state * m;
        out.push_back(StateForecast{
            .step          = step,
            .probabilities = state,
            .most_likely   = argmax(state),
        });
    }
    return out;
}

RegimeRunSummary
RegimeAnalytics::detect_regime_runs(std::span<const Regime> labels,
                                    std::size_t min_length) {
    RegimeRunSummary summary;
    if (labels.empty()) return summary;

    std::size_t start = 0;
    for (std::size_t i = 1; i <= labels.size(); ++i) {
        const bool run_ends = (i == labels.size()) || (labels[i] != labels[start]);
        if (!run_ends) continue;

        const std::size_t length = i - start;
        if (length >= min_length) {
            summary.runs.push_back(RegimeRun{
                .state       = labels[start],
                .start_index = start,
                .end_index   = i - 1,
                .length      = length,
            });
        }
        start = i;
    }

    if (!summary.runs.empty()) {
        std::size_t total = 0;
        summary.min_length = summary.runs.front().length;
        for (const auto& run : summary.runs) {
            total += run.length;
            summary.min_length = std::min(summary.min_length, run.length);
            summary.max_length = std::max(summary.max_length, run.length);
        }
        summary.average_length = static_cast<double>(total)
                               / static_cast<double>(summary.runs.size());
    }
    return summary;
}

}  // namespace rmce::regime
