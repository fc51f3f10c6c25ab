/// @file src/regime/regime_report.cpp
/// @brief Text rendering of RegimeAnalysisResult.

#include "rmce/regime.hpp"

#include <fmt/format.h>

#include <iterator>
#include <string>

namespace rmce::regime {

std::string RegimeAnalysisResult::to_string() const {
    std::string out;
    auto it = std::back_inserter(out);

    fmt::format_to(it, "Regime analysis ({} labels)  current={}\n",
                   observation_count, rmce::to_string(current_state));

    fmt::format_to(it, "\n{:<10} {:>8} {:>8} {:>8} {:>10} {:>10} {:>10} {:>6}\n",
                   "state", "P(s)", "steady", "exact", "duration",
                   "mean_ret", "vol", "count");
    for (Regime r : ALL_REGIMES) {
        const std::size_t i = index_of(r);
        const auto& c = regime_characteristics[i];
        fmt::format_to(it, "{:<10} {:8.4f} {:8.4f} {:8.4f} {:10.3f} {:10.5f} {:10.5f} {:6d}\n",
                       rmce::to_string(r),
                       state_probabilities[i],
                       steady_state_probabilities[i],
                       stationary_distribution[i],
                       expected_duration[i],
                       c.mean_return, c.volatility, c.frequency);
    }

    fmt::format_to(it, "\nTransition matrix (from \\ to)   BULL     BEAR     SIDEWAYS\n");
    for (Regime r : ALL_REGIMES) {
        const auto i = static_cast<Eigen::Index>(index_of(r));
        fmt::format_to(it, "  {:<28} {:8.4f} {:8.4f} {:8.4f}\n",
                       rmce::to_string(r),
                       transition_matrix(i, 0),
                       transition_matrix(i, 1),
                       transition_matrix(i, 2));
    }

    fmt::format_to(it, "\nentropy={:.4f}  persistence={:.4f}  states={}  transitions={}\n",
                   model_metrics.entropy, model_metrics.persistence,
                   model_metrics.states_count, model_metrics.transitions_count);

    fmt::format_to(it, "runs={}  avg_len={:.2f}  history:", regime_runs.runs.size(),
                   regime_runs.average_length);
    for (Regime r : state_history) {
        fmt::format_to(it, " {}", rmce::to_string(r).front());
    }
    out.push_back('\n');

    for (const auto& f : forecast) {
        fmt::format_to(it, "  t+{}: BULL={:.3f} BEAR={:.3f} SIDEWAYS={:.3f} -> {}\n",
                       f.step, f.probabilities(0), f.probabilities(1), f.probabilities(2),
                       rmce::to_string(f.most_likely));
    }
    return out;
}

}  // namespace rmce::regime
