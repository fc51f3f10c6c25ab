/// @file src/simulation/monte_carlo.cpp
/// @brief MonteCarloSimulator: batched GBM ensembles on a std::thread pool.

#include "rmce/monte_carlo.hpp"
#include "rmce/errors.hpp"
#include "rmce/logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <thread>

namespace rmce::simulation {

// ─── SimulationParameters::validate ───────────────────────────────────────────

void SimulationParameters::validate() const {
    if (!std::isfinite(current_price) || current_price <= 0.0) {
        throw InvalidParameterError(fmt::format(
            "current_price must be positive and finite, got {}", current_price));
    }
    if (!std::isfinite(volatility) || volatility < 0.0) {
        throw InvalidParameterError(fmt::format(
            "volatility must be non-negative and finite, got {}", volatility));
    }
    if (!std::isfinite(drift)) {
        throw InvalidParameterError(fmt::format("drift must be finite, got {}", drift));
    }
    if (horizon_days < 1 || horizon_days > constants::MAX_HORIZON_DAYS) {
        throw InvalidParameterError(fmt::format(
            "horizon_days must be in [1, {}], got {}",
            constants::MAX_HORIZON_DAYS, horizon_days));
    }
    if (path_count < 1 || path_count > constants::MAX_PATH_COUNT) {
        throw InvalidParameterError(fmt::format(
            "path_count must be in [1, {}], got {}",
            constants::MAX_PATH_COUNT, path_count));
    }
}

// ─── MonteCarloSimulator ──────────────────────────────────────────────────────

namespace {

std::uint64_t splitmix64(std::uint64_t x) noexcept {
    x += 0x9E3779B97F4A7C15ULL;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
    return x ^ (x >> 31);
}

}  // namespace

MonteCarloSimulator::MonteCarloSimulator(SimulatorConfig config)
    : config_(config) {
    if (config_.batch_size == 0) {
        throw InvalidParameterError("batch_size must be at least 1");
    }
}

std::uint64_t MonteCarloSimulator::batch_seed(std::uint64_t seed,
                                              std::size_t   batch_index) noexcept {
    const auto b = static_cast<std::uint64_t>(batch_index) + 1;
    return splitmix64(seed ^ (constants::SEED_INCREMENT * b));
}

std::size_t MonteCarloSimulator::resolved_workers(std::size_t batch_count) const noexcept {
    std::size_t workers = config_.worker_count;
    if (workers == 0) {
        workers = std::max<std::size_t>(1, std::thread::hardware_concurrency());
    }
    return std::max<std::size_t>(1, std::min(workers, batch_count));
}

SimulatedPathEnsemble
MonteCarloSimulator::simulate(const SimulationParameters& params) const {
    const CancellationToken never;
    return simulate(params, never);
}

SimulatedPathEnsemble
MonteCarloSimulator::simulate(const SimulationParameters& params,
                              const CancellationToken&    token) const {
    params.validate();
    if (token.is_cancelled()) {
        throw OperationCancelledError("simulation cancelled before start");
    }

    const std::size_t n           = params.path_count;
    const std::size_t batch_size  = config_.batch_size;
    const std::size_t batch_count = (n + batch_size - 1) / batch_size;
    const std::size_t workers     = resolved_workers(batch_count);

    SimulatedPathEnsemble ensemble(n, 0.0);
    std::atomic<std::size_t> next_batch{0};
    std::atomic<bool>        stopped{false};

    // Each batch writes only ensemble[begin, end).
    auto worker = [&] {
        for (;;) {
            if (token.is_cancelled()) {
                stopped.store(true, std::memory_order_relaxed);
                return;
            }
            const std::size_t b = next_batch.fetch_add(1, std::memory_order_relaxed);
            if (b >= batch_count) return;

            const std::size_t begin = b * batch_size;
            const std::size_t end   = std::min(n, begin + batch_size);

            std::mt19937_64 rng(batch_seed(config_.seed, b));
            std::normal_distribution<double> normal(0.0, 1.0);
            for (std::size_t i = begin; i < end; ++i) {
                ensemble[i] = simulate_path(params, rng, normal);
            }
        }
    };

    if (workers == 1) {
        worker();
    } else {
        std::vector<std::jthread> pool;
        pool.reserve(workers);
        for (std::size_t w = 0; w < workers; ++w) {
            pool.emplace_back(worker);
        }
    }  // jthreads join here

    if (stopped.load(std::memory_order_relaxed)) {
        throw OperationCancelledError(fmt::format(
            "simulation cancelled after {} of {} batches",
            std::min(next_batch.load(), batch_count), batch_count));
    }

    log::logger()->debug("simulated {} paths x {} days in {} batches on {} worker(s)",
                         n, params.horizon_days, batch_count, workers);
    return ensemble;
}

}  // namespace rmce::simulation
