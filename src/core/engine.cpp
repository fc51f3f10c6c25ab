/// @file src/core/engine.cpp
/// @brief Engine: series validation and the two pipeline entry points.

#include "rmce/engine.hpp"
#include "rmce/errors.hpp"
#include "rmce/logging.hpp"
#include "rmce/returns.hpp"

#include <fmt/format.h>

#include <cmath>
#include <random>
#include <utility>
#include <vector>

namespace rmce::core {

// ─── Configuration ────────────────────────────────────────────────────────────

void RiskConfig::validate() const {
    if (horizon_days < 1 || horizon_days > constants::MAX_HORIZON_DAYS) {
        throw InvalidParameterError(fmt::format(
            "risk.horizon_days must be in [1, {}], got {}",
            constants::MAX_HORIZON_DAYS, horizon_days));
    }
    if (path_count < 1 || path_count > constants::MAX_PATH_COUNT) {
        throw InvalidParameterError(fmt::format(
            "risk.path_count must be in [1, {}], got {}",
            constants::MAX_PATH_COUNT, path_count));
    }
    if (batch_size < 1) {
        throw InvalidParameterError("risk.batch_size must be at least 1");
    }
    if (min_history < 2) {
        throw InvalidParameterError(fmt::format(
            "risk.min_history must be at least 2, got {}", min_history));
    }
    if (max_history != 0 && max_history < min_history) {
        throw InvalidParameterError(fmt::format(
            "risk.max_history ({}) is below risk.min_history ({})",
            max_history, min_history));
    }
}

void EngineConfig::validate() const {
    regime.validate();
    risk.validate();
}

// ─── Series helpers ───────────────────────────────────────────────────────────

void Engine::validate_series(std::span<const Observation> observations) {
    for (std::size_t i = 0; i < observations.size(); ++i) {
        const Observation& obs = observations[i];
        if (!std::isfinite(obs.close) || obs.close <= 0.0) {
            throw InvalidSeriesError(fmt::format(
                "observation {} ({}): close must be positive and finite, got {}",
                i, obs.date, obs.close));
        }
        if (!std::isfinite(obs.volume) || obs.volume < 0.0) {
            throw InvalidSeriesError(fmt::format(
                "observation {} ({}): volume must be non-negative and finite, got {}",
                i, obs.date, obs.volume));
        }
        if (i > 0 && !(observations[i - 1].date < obs.date)) {
            throw InvalidSeriesError(fmt::format(
                "observation {}: date '{}' does not follow '{}'",
                i, obs.date, observations[i - 1].date));
        }
    }
}

std::span<const Observation>
Engine::recent(std::span<const Observation> observations, std::size_t max_history) noexcept {
    if (max_history == 0 || observations.size() <= max_history) {
        return observations;
    }
    return observations.last(max_history);
}

std::span<const Observation>
Engine::prepare(std::span<const Observation> observations,
                std::size_t                  min_history,
                std::size_t                  max_history,
                const char*                  stage) {
    if (observations.size() < 2) {
        throw InsufficientDataError(fmt::format(
            "{}: need at least 2 observations, got {}", stage, observations.size()));
    }
    validate_series(observations);

    const auto window = recent(observations, max_history);
    if (window.size() < min_history) {
        throw InsufficientHistoryError(fmt::format(
            "{}: need at least {} observations, got {}",
            stage, min_history, window.size()));
    }
    return window;
}

simulation::SimulationParameters
Engine::estimate_parameters(std::span<const Observation> observations,
                            std::size_t                  horizon_days,
                            std::size_t                  path_count) {
    const ReturnSeries returns = ReturnCalculator::log_returns(observations);
    return simulation::SimulationParameters{
        .current_price = observations.back().close,
        .volatility    = ReturnCalculator::annualised_volatility(returns),
        .drift         = ReturnCalculator::annualised_drift(returns),
        .horizon_days  = horizon_days,
        .path_count    = path_count,
    };
}

// ─── Engine ───────────────────────────────────────────────────────────────────

Engine::Engine(EngineConfig config) : config_(std::move(config)) {
    config_.validate();
}

regime::RegimeAnalysisResult
Engine::run_regime_analysis(std::span<const Observation> observations) const {
    const auto& cfg    = config_.regime;
    const auto  window = prepare(observations, cfg.min_history, cfg.max_history,
                                 "regime analysis");

    const ReturnSeries returns = ReturnCalculator::log_returns(window);
    const regime::RegimeClassifier classifier(cfg.high_threshold, cfg.low_threshold);
    const RegimeSeries labels = classifier.classify_series(returns);

    // Return i is realised at observation i + 1.
    std::vector<double> closes;
    std::vector<double> volumes;
    closes.reserve(returns.size());
    volumes.reserve(returns.size());
    for (std::size_t i = 1; i < window.size(); ++i) {
        closes.push_back(window[i].close);
        volumes.push_back(window[i].volume);
    }

    return regime::RegimeAnalytics::analyse(closes, volumes, returns, labels, cfg);
}

risk::RiskReport
Engine::run_monte_carlo_risk(std::span<const Observation> observations) const {
    const simulation::CancellationToken never;
    return run_monte_carlo_risk(observations, never);
}

risk::RiskReport
Engine::run_monte_carlo_risk(std::span<const Observation>         observations,
                             const simulation::CancellationToken& token) const {
    const auto& cfg    = config_.risk;
    const auto  window = prepare(observations, cfg.min_history, cfg.max_history,
                                 "monte carlo risk");

    const auto params = estimate_parameters(window, cfg.horizon_days, cfg.path_count);
    log::logger()->debug("estimated GBM parameters: price={:.4f} vol={:.4f} drift={:.4f}",
                         params.current_price, params.volatility, params.drift);
    return run_monte_carlo_risk(params, token);
}

risk::RiskReport
Engine::run_monte_carlo_risk(const simulation::SimulationParameters& params) const {
    const simulation::CancellationToken never;
    return run_monte_carlo_risk(params, never);
}

risk::RiskReport
Engine::run_monte_carlo_risk(const simulation::SimulationParameters& params,
                             const simulation::CancellationToken&    token) const {
    params.validate();

    const auto& cfg = config_.risk;
    std::uint64_t seed = 0;
    if (cfg.rng_seed) {
        seed = *cfg.rng_seed;
    } else {
        std::random_device device;
        seed = (static_cast<std::uint64_t>(device()) << 32) ^ device();
    }

    const simulation::MonteCarloSimulator simulator(simulation::SimulatorConfig{
        .seed         = seed,
        .batch_size   = cfg.batch_size,
        .worker_count = cfg.worker_count,
    });
    const auto ensemble = simulator.simulate(params, token);

    risk::RiskReport report = risk::RiskMetricsCalculator::compute(ensemble);
    report.parameters = params;
    report.seed_used  = seed;
    return report;
}

// ─── Free-function entry points ───────────────────────────────────────────────

regime::RegimeAnalysisResult
run_regime_analysis(std::span<const Observation> observations,
                    const regime::RegimeConfig&  config) {
    return Engine(EngineConfig{.regime = config}).run_regime_analysis(observations);
}

risk::RiskReport
run_monte_carlo_risk(std::span<const Observation> observations,
                     const RiskConfig&            config) {
    return Engine(EngineConfig{.risk = config}).run_monte_carlo_risk(observations);
}

risk::RiskReport
run_monte_carlo_risk(const simulation::SimulationParameters& params,
                     const RiskConfig&                       config) {
    return Engine(EngineConfig{.risk = config}).run_monte_carlo_risk(params);
}

}  // namespace rmce::core
