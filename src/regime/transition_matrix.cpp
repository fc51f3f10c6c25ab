/// @file src/regime/transition_matrix.cpp
/// @brief TransitionMatrixEstimator implementation.

#include "rmce/regime.hpp"

#include <cmath>

namespace rmce::regime {

TransitionCounts
TransitionMatrixEstimator::count_transitions(std::span<const Regime> labels) noexcept {
    TransitionCounts counts = TransitionCounts::Zero();
    for (std::size_t i = 0; i + 1 < labels.size(); ++i) {
        const auto from = static_cast<Eigen::Index>(index_of(labels[i]));
        const auto to   = static_cast<Eigen::Index>(index_of(labels[i + 1]));
        ++counts(from, to);
    }
    return counts;
}

TransitionMatrix
TransitionMatrixEstimator::normalise(const TransitionCounts& counts) noexcept {
    TransitionMatrix m;
    for (Eigen::Index i = 0; i < REGIME_COUNT; ++i) {
        const Eigen::Index row_sum = counts.row(i).sum();
        if (row_sum > 0) {
            m.row(i) = counts.row(i).cast<double>() / static_cast<double>(row_sum);
        } else {
            // Never a source state: fall back to the uniform row.
            m.row(i).setConstant(1.0 / REGIME_COUNT);
        }
    }
    return m;
}

TransitionMatrix
TransitionMatrixEstimator::estimate(std::span<const Regime> labels) noexcept {
    return normalise(count_transitions(labels));
}

bool TransitionMatrixEstimator::is_row_stochastic(const TransitionMatrix& m,
                                                  double tolerance) noexcept {
    if (!m.allFinite()) return false;
    if ((m.array() < 0.0).any() || (m.array() > 1.0 + tolerance).any()) return false;

    for (Eigen::Index i = 0; i < REGIME_COUNT; ++i) {
        if (std::abs(m.row(i).sum() - 1.0) > tolerance) return false;
    }
    return true;
}

}  // namespace rmce::regime
