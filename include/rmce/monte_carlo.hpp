#pragma once

/// @file include/rmce/monte_carlo.hpp
/// @brief MonteCarloSimulator: GBM terminal-return ensembles.
///
/// # Module: Monte Carlo Simulator
///
/// ## Responsibility
/// Simulate `path_count` independent geometric Brownian motion price paths
/// over `horizon_days` daily steps and keep only each path's terminal simple
/// return.
///
/// ## Step Formula
/// ```
/// P_t = P_{t−1} · exp((μ − σ²/2)·dt + σ·√dt·Z),   dt = 1/252,  Z ~ N(0, 1)
/// terminal return = (P_H − P_0) / P_0
/// ```
///
/// ## Parallel Decomposition
/// Paths are grouped into fixed-size batches. Batch `b` owns a private
/// `std::mt19937_64` seeded with `splitmix64(seed ^ SEED_INCREMENT·(b + 1))`
/// and writes only its own slice of the output vector. The ensemble is
/// therefore bit-identical for a given seed whatever the worker count, and
/// no synchronisation is needed beyond the batch counter.
///
/// ## Guarantees
/// - Output element i is the terminal return of path i
/// - `volatility == 0 && drift == 0` yields exactly 0.0 for every path
/// - Cancellation is observed before the first batch and between batches
///
/// ## NOT Responsible For
/// - Estimating μ and σ from history (see rmce/returns.hpp)
/// - Risk statistics over the ensemble (see rmce/risk.hpp)

#include "rmce/constants.hpp"

#include <atomic>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace rmce::simulation {

// ─── Parameters ───────────────────────────────────────────────────────────────

/// GBM inputs for one instrument.  Volatility and drift are annualised.
struct SimulationParameters {
    double      current_price = 0.0;
    double      volatility    = 0.0;
    double      drift         = 0.0;
    std::size_t horizon_days  = constants::DEFAULT_HORIZON_DAYS;
    std::size_t path_count    = constants::DEFAULT_PATH_COUNT;

    /// Throws `InvalidParameterError` unless `current_price > 0`,
    /// `volatility >= 0`, both volatility and drift are finite, and
    /// `horizon_days` is in [1, MAX_HORIZON_DAYS] and `path_count` in
    /// [1, MAX_PATH_COUNT].
    void validate() const;
};

/// Terminal simple returns, one per path, in path order.
using SimulatedPathEnsemble = std::vector<double>;

// ─── CancellationToken ────────────────────────────────────────────────────────

/// Cooperative cancellation flag shared between a caller and a running
/// simulation.
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<bool> cancelled_{false};
};

// ─── MonteCarloSimulator ──────────────────────────────────────────────────────

struct SimulatorConfig {
    std::uint64_t seed         = 0;
    std::size_t   batch_size   = constants::DEFAULT_BATCH_SIZE;
    std::size_t   worker_count = 0;  ///< 0 = std::thread::hardware_concurrency()
};

class MonteCarloSimulator {
public:
    /// Throws `InvalidParameterError` if `batch_size == 0`.
    explicit MonteCarloSimulator(SimulatorConfig config);

    /// Simulate the full ensemble.
    ///
    /// # Throws
    /// - `InvalidParameterError` if `params` fails validation
    [[nodiscard]] SimulatedPathEnsemble
    simulate(const SimulationParameters& params) const;

    /// As above, polling `token` before the first batch and between batches.
    ///
    /// # Throws
    /// - `OperationCancelledError` once cancellation is observed
    [[nodiscard]] SimulatedPathEnsemble
    simulate(const SimulationParameters& params,
             const CancellationToken&    token) const;

    /// Simulate one path with a caller-supplied generator and normal
    /// distribution.  Returns the terminal simple return.
    template <typename URBG>
    [[nodiscard]] static double
    simulate_path(const SimulationParameters&       params,
                  URBG&                             rng,
                  std::normal_distribution<double>& normal) {
        const double dt        = 1.0 / constants::TRADING_DAYS_PER_YEAR;
        const double sigma     = params.volatility;
        const double drift     = (params.drift - 0.5 * sigma * sigma) * dt;
        const double diffusion = sigma * std::sqrt(dt);

        double price = params.current_price;
        for (std::size_t step = 0; step < params.horizon_days; ++step) {
            price *= std::exp(drift + diffusion * normal(rng));
        }
        return (price - params.current_price) / params.current_price;
    }

    template <typename URBG>
    [[nodiscard]] static double
    simulate_path(const SimulationParameters& params, URBG& rng) {
        std::normal_distribution<double> normal(0.0, 1.0);
        return simulate_path(params, rng, normal);
    }

    /// Seed of batch `batch_index`: splitmix64(seed ^ SEED_INCREMENT·(b + 1)).
    [[nodiscard]] static std::uint64_t
    batch_seed(std::uint64_t seed, std::size_t batch_index) noexcept;

    [[nodiscard]] const SimulatorConfig& config() const noexcept { return config_; }

    /// Workers actually used for `batch_count` batches.
    [[nodiscard]] std::size_t resolved_workers(std::size_t batch_count) const noexcept;

private:
    SimulatorConfig config_;
};

}  // namespace rmce::simulation
