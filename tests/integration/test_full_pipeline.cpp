/// @file tests/integration/test_full_pipeline.cpp
/// @brief End-to-end tests through the Engine entry points.
///
/// These tests exercise both call contracts:
///   ObservationSeries → ReturnCalculator → RegimeClassifier →
///   TransitionMatrixEstimator → RegimeAnalytics → RegimeAnalysisResult
///   ObservationSeries → parameter estimate → MonteCarloSimulator →
///   RiskMetricsCalculator → RiskReport

#include "rmce/engine.hpp"
#include "rmce/data_loader.hpp"
#include "rmce/errors.hpp"
#include "rmce/constants.hpp"

#include <gtest/gtest.h>
#include <fmt/format.h>

#include <cmath>
#include <string>
#include <utility>
#include <vector>

using namespace rmce;
using namespace rmce::core;
using namespace rmce::constants;

// ─── Synthetic data helpers ───────────────────────────────────────────────────

namespace {

std::string day_key(std::size_t i) {
    return fmt::format("2020-D{:05d}", i);
}

/// n observations whose log returns alternate +step / −step, starting up.
ObservationSeries make_alternating(std::size_t n, double step = 0.03) {
    ObservationSeries obs;
    double close = 100.0;
    for (std::size_t i = 0; i < n; ++i) {
        if (i > 0) close *= std::exp((i % 2 == 1) ? step : -step);
        obs.push_back(Observation{.date = day_key(i), .close = close, .volume = 1e6});
    }
    return obs;
}

/// n observations with a deterministic pseudo-random walk.
ObservationSeries make_walk(std::size_t n) {
    ObservationSeries obs;
    double close = 50.0;
    for (std::size_t i = 0; i < n; ++i) {
        close *= std::exp(0.025 * std::sin(static_cast<double>(i) * 1.3));
        obs.push_back(Observation{
            .date   = day_key(i),
            .close  = close,
            .volume = 1000.0 + static_cast<double>(i % 11) * 10.0,
        });
    }
    return obs;
}

RiskConfig seeded_risk(std::size_t paths = 2000) {
    RiskConfig cfg;
    cfg.path_count = paths;
    cfg.rng_seed   = 314159;
    cfg.worker_count = 2;
    return cfg;
}

}  // namespace

// ─── Regime analysis ──────────────────────────────────────────────────────────

TEST(Pipeline_Regime, AlternatingSeriesMatchesHandComputedModel) {
    const auto res = run_regime_analysis(make_alternating(60));
    EXPECT_EQ(res.observation_count, 59u);
    EXPECT_NEAR(res.transition_matrix(0, 1), 1.0, 1e-12);
    EXPECT_NEAR(res.transition_matrix(1, 0), 1.0, 1e-12);
    EXPECT_NEAR(res.steady_state_probabilities[2], 1.0 / 9.0, 1e-12);
    EXPECT_NEAR(res.model_metrics.entropy, 1.58496, 1e-5);
    EXPECT_NEAR(res.model_metrics.persistence, 1.0 / 9.0, 1e-12);
    EXPECT_EQ(res.model_metrics.states_count, 2u);
    EXPECT_NEAR(res.expected_duration[2], 1.5, 1e-12);
}

TEST(Pipeline_Regime, ExactlyMinimumHistorySucceeds) {
    EXPECT_NO_THROW((void)run_regime_analysis(make_walk(MIN_REGIME_HISTORY)));
}

TEST(Pipeline_Regime, OneBelowMinimumHistoryFails) {
    EXPECT_THROW((void)run_regime_analysis(make_walk(MIN_REGIME_HISTORY - 1)),
                 InsufficientHistoryError);
}

TEST(Pipeline_Regime, SingleObservationIsInsufficientData) {
    EXPECT_THROW((void)run_regime_analysis(make_walk(1)), InsufficientDataError);
    EXPECT_THROW((void)run_regime_analysis(ObservationSeries{}), InsufficientDataError);
}

TEST(Pipeline_Regime, HistoryIsTrimmedToMostRecentWindow) {
    const auto res = run_regime_analysis(make_walk(400));
    EXPECT_EQ(res.observation_count, DEFAULT_MAX_HISTORY - 1);
}

TEST(Pipeline_Regime, UnboundedHistoryKeepsEveryObservation) {
    regime::RegimeConfig cfg;
    cfg.max_history = 0;
    EXPECT_EQ(run_regime_analysis(make_walk(400), cfg).observation_count, 399u);
}

TEST(Pipeline_Regime, ResultIsIdempotent) {
    const auto series = make_walk(120);
    const Engine engine;
    const auto a = engine.run_regime_analysis(series);
    const auto b = engine.run_regime_analysis(series);
    EXPECT_TRUE(a.transition_matrix == b.transition_matrix);
    EXPECT_EQ(a.state_probabilities, b.state_probabilities);
    EXPECT_EQ(a.stationary_distribution, b.stationary_distribution);
}

TEST(Pipeline_Regime, ProbabilitiesSumToOne) {
    const auto res = run_regime_analysis(make_walk(200));
    double p = 0.0, s = 0.0, st = 0.0;
    for (std::size_t i = 0; i < ALL_REGIMES.size(); ++i) {
        p  += res.state_probabilities[i];
        s  += res.steady_state_probabilities[i];
        st += res.stationary_distribution[i];
    }
    EXPECT_NEAR(p, 1.0, 1e-12);
    EXPECT_NEAR(s, 1.0, 1e-12);
    EXPECT_NEAR(st, 1.0, 1e-12);
    EXPECT_TRUE(regime::TransitionMatrixEstimator::is_row_stochastic(res.transition_matrix));
}

// ─── Series validation ────────────────────────────────────────────────────────

TEST(Pipeline_Validation, UnorderedDatesRejected) {
    auto series = make_walk(60);
    std::swap(series[10].date, series[11].date);
    EXPECT_THROW((void)run_regime_analysis(series), InvalidSeriesError);
}

TEST(Pipeline_Validation, DuplicateDatesRejected) {
    auto series = make_walk(60);
    series[20].date = series[19].date;
    EXPECT_THROW((void)run_monte_carlo_risk(series, seeded_risk()), InvalidSeriesError);
}

TEST(Pipeline_Validation, NonPositiveCloseRejected) {
    auto series = make_walk(60);
    series[5].close = 0.0;
    EXPECT_THROW(Engine::validate_series(series), InvalidSeriesError);
}

TEST(Pipeline_Validation, NegativeVolumeRejected) {
    auto series = make_walk(60);
    series[5].volume = -1.0;
    EXPECT_THROW(Engine::validate_series(series), InvalidSeriesError);
}

TEST(Pipeline_Validation, InvalidConfigRejectedAtConstruction) {
    EngineConfig cfg;
    cfg.risk.path_count = 0;
    EXPECT_THROW((void)Engine{cfg}, InvalidParameterError);
}

// ─── Monte Carlo risk ─────────────────────────────────────────────────────────

TEST(Pipeline_Risk, ExactlyMinimumHistorySucceeds) {
    EXPECT_NO_THROW((void)run_monte_carlo_risk(make_walk(MIN_SIMULATION_HISTORY),
                                               seeded_risk(500)));
}

TEST(Pipeline_Risk, OneBelowMinimumHistoryFails) {
    EXPECT_THROW((void)run_monte_carlo_risk(make_walk(MIN_SIMULATION_HISTORY - 1),
                                            seeded_risk(500)),
                 InsufficientHistoryError);
}

TEST(Pipeline_Risk, ParametersEstimatedFromHistory) {
    const auto series = make_walk(100);
    const auto rep = run_monte_carlo_risk(series, seeded_risk(500));
    EXPECT_DOUBLE_EQ(rep.parameters.current_price, series.back().close);
    EXPECT_GT(rep.parameters.volatility, 0.0);
    EXPECT_EQ(rep.parameters.horizon_days, DEFAULT_HORIZON_DAYS);
    EXPECT_EQ(rep.path_count, 500u);
}

TEST(Pipeline_Risk, SeedIsRecordedAndReplays) {
    const auto series = make_walk(100);
    const auto a = run_monte_carlo_risk(series, seeded_risk());
    const auto b = run_monte_carlo_risk(series, seeded_risk());
    EXPECT_EQ(a.seed_used, 314159u);
    EXPECT_EQ(a.var_95, b.var_95);
    EXPECT_EQ(a.mean_return, b.mean_return);
}

TEST(Pipeline_Risk, DrawnSeedCanBeReplayed) {
    RiskConfig cfg = seeded_risk();
    cfg.rng_seed.reset();
    const auto series = make_walk(100);
    const auto first = run_monte_carlo_risk(series, cfg);

    cfg.rng_seed = first.seed_used;
    const auto replay = run_monte_carlo_risk(series, cfg);
    EXPECT_EQ(first.var_95, replay.var_95);
    EXPECT_EQ(first.expected_shortfall_99, replay.expected_shortfall_99);
}

TEST(Pipeline_Risk, ZeroVolatilityParametersGiveZeroRisk) {
    const simulation::SimulationParameters params{
        .current_price = 100.0, .volatility = 0.0, .drift = 0.0,
        .horizon_days = 30, .path_count = 1000};
    const auto rep = run_monte_carlo_risk(params, seeded_risk());
    EXPECT_EQ(rep.var_95, 0.0);
    EXPECT_EQ(rep.var_99, 0.0);
    EXPECT_EQ(rep.expected_shortfall_95, 0.0);
    EXPECT_EQ(rep.probability_positive_return, 0.0);
    EXPECT_EQ(rep.tail_risk.kurtosis, 0.0);
    EXPECT_EQ(rep.tail_risk.skewness, 0.0);
}

TEST(Pipeline_Risk, ZeroVolatilityWithDriftKeepsShortfallInsideTail) {
    for (const double drift : {0.05, 0.03, -0.04}) {
        const simulation::SimulationParameters params{
            .current_price = 100.0, .volatility = 0.0, .drift = drift,
            .horizon_days = 21, .path_count = 1000};
        RiskConfig cfg = seeded_risk();
        cfg.rng_seed = 1;
        const auto rep = run_monte_carlo_risk(params, cfg);

        EXPECT_LE(rep.expected_shortfall_95, rep.var_95) << "drift " << drift;
        EXPECT_LE(rep.expected_shortfall_99, rep.var_99) << "drift " << drift;
        EXPECT_GE(rep.expected_shortfall_95, rep.min_return) << "drift " << drift;
        EXPECT_GE(rep.expected_shortfall_99, rep.min_return) << "drift " << drift;
    }
}

TEST(Pipeline_Risk, VaR95MatchesLognormalQuantile) {
    const simulation::SimulationParameters params{
        .current_price = 100.0, .volatility = 0.3, .drift = 0.05,
        .horizon_days = 30, .path_count = 20000};
    const auto rep = run_monte_carlo_risk(params, seeded_risk());

    const double t = 30.0 / TRADING_DAYS_PER_YEAR;
    const double z05 = -1.6448536;
    const double expected =
        std::exp((0.05 - 0.5 * 0.3 * 0.3) * t + 0.3 * std::sqrt(t) * z05) - 1.0;
    EXPECT_NEAR(rep.var_95, expected, 0.05 * std::abs(expected));
    EXPECT_LE(rep.var_99, rep.var_95);
    EXPECT_LE(rep.expected_shortfall_95, rep.var_95);
}

TEST(Pipeline_Risk, CancelledTokenAborts) {
    simulation::CancellationToken token;
    token.cancel();
    const Engine engine(EngineConfig{.risk = seeded_risk()});
    EXPECT_THROW((void)engine.run_monte_carlo_risk(make_walk(100), token),
                 OperationCancelledError);
}

TEST(Pipeline_Risk, InvalidExplicitParametersRejected) {
    const simulation::SimulationParameters params{
        .current_price = -1.0, .volatility = 0.2, .drift = 0.0,
        .horizon_days = 30, .path_count = 10};
    EXPECT_THROW((void)run_monte_carlo_risk(params, seeded_risk()), InvalidParameterError);
}

// ─── CSV to report ────────────────────────────────────────────────────────────

TEST(Pipeline_Csv, LoadedSeriesRunsThroughBothPipelines) {
    std::string csv = "date,close,volume\n";
    for (const auto& o : make_walk(80)) {
        csv += fmt::format("{},{:.10f},{}\n", o.date, o.close, o.volume);
    }
    const auto series = DataLoader::parse_csv_string(csv);
    ASSERT_EQ(series.size(), 80u);

    const Engine engine(EngineConfig{.risk = seeded_risk(500)});
    EXPECT_EQ(engine.run_regime_analysis(series).observation_count, 79u);
    EXPECT_EQ(engine.run_monte_carlo_risk(series).path_count, 500u);
}
