#include <gtest/gtest.h>
#include "rmce/regime.hpp"
#include "rmce/constants.hpp"
#include <vector>

using namespace rmce;
using namespace rmce::regime;
using namespace rmce::constants;

namespace {

constexpr Regime B = Regime::Bull;
constexpr Regime D = Regime::Bear;
constexpr Regime S = Regime::Sideways;

}  // namespace

// ─── count_transitions ────────────────────────────────────────────────────────

TEST(TransitionMatrix_Counts, CountsConsecutivePairs) {
    const RegimeSeries labels{B, B, D, S, B, D};
    const auto c = TransitionMatrixEstimator::count_transitions(labels);
    EXPECT_EQ(c(0, 0), 1);  // B→B
    EXPECT_EQ(c(0, 1), 2);  // B→D
    EXPECT_EQ(c(1, 2), 1);  // D→S
    EXPECT_EQ(c(2, 0), 1);  // S→B
    EXPECT_EQ(c.sum(), static_cast<Eigen::Index>(labels.size() - 1));
}

TEST(TransitionMatrix_Counts, SingleLabelHasNoTransitions) {
    const RegimeSeries labels{S};
    EXPECT_EQ(TransitionMatrixEstimator::count_transitions(labels).sum(), 0);
}

// ─── estimate ─────────────────────────────────────────────────────────────────

TEST(TransitionMatrix_Estimate, RowsAreConditionalFrequencies) {
    const RegimeSeries labels{B, B, D, B, B, S, S};
    const auto m = TransitionMatrixEstimator::estimate(labels);
    // From B: B→B twice, B→D once, B→S once.
    EXPECT_NEAR(m(0, 0), 0.5, 1e-15);
    EXPECT_NEAR(m(0, 1), 0.25, 1e-15);
    EXPECT_NEAR(m(0, 2), 0.25, 1e-15);
    EXPECT_NEAR(m(1, 0), 1.0, 1e-15);
    EXPECT_NEAR(m(2, 2), 1.0, 1e-15);
}

TEST(TransitionMatrix_Estimate, UnvisitedSourceStateIsUniform) {
    const RegimeSeries labels{B, D, B, D};
    const auto m = TransitionMatrixEstimator::estimate(labels);
    for (Eigen::Index j = 0; j < REGIME_COUNT; ++j) {
        EXPECT_NEAR(m(2, j), 1.0 / 3.0, 1e-15);
    }
}

TEST(TransitionMatrix_Estimate, EmptyLabelsGiveAllUniformRows) {
    const auto m = TransitionMatrixEstimator::estimate(RegimeSeries{});
    EXPECT_TRUE(m.isApprox(TransitionMatrix::Constant(1.0 / 3.0)));
    EXPECT_TRUE(TransitionMatrixEstimator::is_row_stochastic(m));
}

TEST(TransitionMatrix_Estimate, RowsSumToOne) {
    const RegimeSeries labels{B, S, S, D, D, D, B, S, B, B, D, S};
    const auto m = TransitionMatrixEstimator::estimate(labels);
    for (Eigen::Index i = 0; i < REGIME_COUNT; ++i) {
        EXPECT_NEAR(m.row(i).sum(), 1.0, ROW_SUM_TOLERANCE);
    }
    EXPECT_TRUE(TransitionMatrixEstimator::is_row_stochastic(m));
}

// ─── is_row_stochastic ────────────────────────────────────────────────────────

TEST(TransitionMatrix_Check, RejectsBadRowsAndEntries) {
    TransitionMatrix m = TransitionMatrix::Identity();
    EXPECT_TRUE(TransitionMatrixEstimator::is_row_stochastic(m));

    m(0, 1) = 0.1;  // row 0 sums to 1.1
    EXPECT_FALSE(TransitionMatrixEstimator::is_row_stochastic(m));

    m = TransitionMatrix::Identity();
    m(1, 1) = 1.5;
    m(1, 0) = -0.5;  // sums to 1 but has a negative entry
    EXPECT_FALSE(TransitionMatrixEstimator::is_row_stochastic(m));
}
