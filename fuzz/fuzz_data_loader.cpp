/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for DataLoader + regime pipeline (end-to-end)
 *
 * Build:
 *   cmake -DRMCE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB for any byte sequence.
 *   2. Every parsed observation has close > 0, finite, volume >= 0.
 *   3. The engine either returns a result or throws an rmce::Error;
 *      nothing else escapes.
 *   4. If a result is returned its transition matrix is row-stochastic and
 *      its state probabilities sum to 1.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

#include "rmce/data_loader.hpp"
#include "rmce/engine.hpp"
#include "rmce/errors.hpp"
#include "rmce/logging.hpp"

using namespace rmce;
using namespace rmce::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    static const bool quiet = rmce::log::set_level("off");
    (void)quiet;

    const std::string input(reinterpret_cast<const char*>(data), size);
    const auto series = DataLoader::parse_csv_string(input);

    for (const auto& obs : series) {
        assert(std::isfinite(obs.close) && obs.close > 0.0);
        assert(std::isfinite(obs.volume) && obs.volume >= 0.0);
        assert(!obs.date.empty());
    }

    regime::RegimeConfig cfg;
    cfg.min_history = 2;
    try {
        const auto res = run_regime_analysis(series, cfg);
        assert(regime::TransitionMatrixEstimator::is_row_stochastic(res.transition_matrix));
        const double total = res.state_probabilities[0]
                           + res.state_probabilities[1]
                           + res.state_probabilities[2];
        assert(std::abs(total - 1.0) < 1e-9);
        (void)total;
    } catch (const rmce::Error&) {
        // Unordered dates and short series are expected outcomes.
    }
    return 0;
}
