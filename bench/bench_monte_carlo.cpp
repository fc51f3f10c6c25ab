/**
 * @file  bench/bench_monte_carlo.cpp
 * @brief Google Benchmark suite for the Monte Carlo risk pipeline.
 *
 * Benchmarks
 * ----------
 *   BM_Simulate_Workers  : ensemble generation vs worker count
 *   BM_Simulate_Paths    : ensemble generation vs path count (all cores)
 *   BM_RiskMetrics       : sort + percentile + moment reduction
 *   BM_RegimeAnalysis    : full regime pipeline on a 252-day series
 *
 * Build (CMake):
 *   cmake --build build --target bench_monte_carlo
 *   ./build/bench_monte_carlo --benchmark_format=json
 *
 * Throughput units: items/second (simulated paths or observations).
 */

#include "benchmark/benchmark.h"

#include "rmce/engine.hpp"
#include "rmce/logging.hpp"
#include "rmce/monte_carlo.hpp"
#include "rmce/risk.hpp"

#include <cmath>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

using namespace rmce;

// ── Fixture helpers ────────────────────────────────────────────────────────────

static simulation::SimulationParameters make_params(std::size_t paths) {
    return simulation::SimulationParameters{
        .current_price = 100.0,
        .volatility    = 0.25,
        .drift         = 0.06,
        .horizon_days  = 30,
        .path_count    = paths,
    };
}

static ObservationSeries make_series(std::size_t n) {
    ObservationSeries obs;
    obs.reserve(n);
    double close = 100.0;
    for (std::size_t i = 0; i < n; ++i) {
        close *= std::exp(0.03 * std::sin(static_cast<double>(i) * 0.77));
        std::string date = std::to_string(100000 + i);
        obs.push_back(Observation{std::move(date), close, 1e6});
    }
    return obs;
}

// ── Simulation ─────────────────────────────────────────────────────────────────

static void BM_Simulate_Workers(benchmark::State& state) {
    const auto workers = static_cast<std::size_t>(state.range(0));
    const simulation::MonteCarloSimulator sim(simulation::SimulatorConfig{
        .seed = 42, .batch_size = 1024, .worker_count = workers});
    const auto params = make_params(10000);

    for (auto _ : state) {
        auto ensemble = sim.simulate(params);
        benchmark::DoNotOptimize(ensemble.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * 10000);
}
BENCHMARK(BM_Simulate_Workers)->Arg(1)->Arg(2)->Arg(4)->Arg(8)->Unit(benchmark::kMillisecond);

static void BM_Simulate_Paths(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const simulation::MonteCarloSimulator sim(simulation::SimulatorConfig{.seed = 7});
    const auto params = make_params(n);

    for (auto _ : state) {
        auto ensemble = sim.simulate(params);
        benchmark::DoNotOptimize(ensemble.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Simulate_Paths)->RangeMultiplier(4)->Range(1024, 65536)->Unit(benchmark::kMillisecond);

// ── Reductions ─────────────────────────────────────────────────────────────────

static void BM_RiskMetrics(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const simulation::MonteCarloSimulator sim(simulation::SimulatorConfig{.seed = 3});
    const auto ensemble = sim.simulate(make_params(n));

    for (auto _ : state) {
        auto report = risk::RiskMetricsCalculator::compute(ensemble);
        benchmark::DoNotOptimize(report.var_95);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_RiskMetrics)->RangeMultiplier(4)->Range(1024, 65536)->Unit(benchmark::kMicrosecond);

static void BM_RegimeAnalysis(benchmark::State& state) {
    log::set_level("off");
    const auto series = make_series(252);
    const core::Engine engine;

    for (auto _ : state) {
        auto result = engine.run_regime_analysis(series);
        benchmark::DoNotOptimize(result.model_metrics.entropy);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * 252);
}
BENCHMARK(BM_RegimeAnalysis)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
