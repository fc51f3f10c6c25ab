/// @file tests/core/test_returns.cpp
/// @brief Unit tests for ReturnCalculator.

#include "rmce/returns.hpp"
#include "rmce/errors.hpp"
#include "rmce/constants.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

using namespace rmce;
using namespace rmce::core;
using namespace rmce::constants;

// ─── log_returns ──────────────────────────────────────────────────────────────

TEST(ReturnCalculator_LogReturns, LengthIsPricesMinusOne) {
    const std::vector<double> prices{100.0, 101.0, 99.0, 102.0};
    EXPECT_EQ(ReturnCalculator::log_returns(prices).size(), 3u);
}

TEST(ReturnCalculator_LogReturns, MatchesLogRatio) {
    const std::vector<double> prices{100.0, 110.0, 99.0};
    const auto r = ReturnCalculator::log_returns(prices);
    ASSERT_EQ(r.size(), 2u);
    EXPECT_NEAR(r[0], std::log(1.1), 1e-15);
    EXPECT_NEAR(r[1], std::log(0.9), 1e-15);
}

TEST(ReturnCalculator_LogReturns, ConstantPricesGiveZeroReturns) {
    const std::vector<double> prices(10, 50.0);
    for (double r : ReturnCalculator::log_returns(prices)) {
        EXPECT_EQ(r, 0.0);
    }
}

TEST(ReturnCalculator_LogReturns, ReturnsSumToLogOfTotalGrowth) {
    const std::vector<double> prices{100.0, 104.0, 97.0, 120.0, 118.5};
    double sum = 0.0;
    for (double r : ReturnCalculator::log_returns(prices)) sum += r;
    EXPECT_NEAR(sum, std::log(118.5 / 100.0), 1e-12);
}

TEST(ReturnCalculator_LogReturns, SinglePrice_ThrowsInsufficientData) {
    const std::vector<double> prices{100.0};
    EXPECT_THROW((void)ReturnCalculator::log_returns(prices), InsufficientDataError);
}

TEST(ReturnCalculator_LogReturns, Empty_ThrowsInsufficientData) {
    const std::vector<double> prices;
    EXPECT_THROW((void)ReturnCalculator::log_returns(prices), InsufficientDataError);
}

TEST(ReturnCalculator_LogReturns, ZeroPrice_ThrowsInvalidSeries) {
    const std::vector<double> prices{100.0, 0.0, 101.0};
    EXPECT_THROW((void)ReturnCalculator::log_returns(prices), InvalidSeriesError);
}

TEST(ReturnCalculator_LogReturns, NaNPrice_ThrowsInvalidSeries) {
    const std::vector<double> prices{100.0, std::numeric_limits<double>::quiet_NaN()};
    EXPECT_THROW((void)ReturnCalculator::log_returns(prices), InvalidSeriesError);
}

TEST(ReturnCalculator_LogReturns, ErrorsShareBaseClassAndCode) {
    const std::vector<double> prices{100.0, -1.0};
    try {
        (void)ReturnCalculator::log_returns(prices);
        FAIL() << "expected an exception";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidSeries);
    }
}

TEST(ReturnCalculator_LogReturns, ObservationOverloadUsesCloses) {
    const std::vector<Observation> obs{
        {"2024-01-01", 100.0, 1.0},
        {"2024-01-02", 105.0, 2.0},
    };
    const auto r = ReturnCalculator::log_returns(std::span<const Observation>(obs));
    ASSERT_EQ(r.size(), 1u);
    EXPECT_NEAR(r[0], std::log(1.05), 1e-15);
}

// ─── Annualisation ────────────────────────────────────────────────────────────

TEST(ReturnCalculator_Annualise, VolatilityIsSampleStdTimesSqrt252) {
    const std::vector<double> r{0.01, -0.01, 0.01, -0.01};
    // mean 0, sample variance = 4e-4 / 3
    const double expected = std::sqrt(4e-4 / 3.0) * std::sqrt(TRADING_DAYS_PER_YEAR);
    EXPECT_NEAR(ReturnCalculator::annualised_volatility(r), expected, 1e-14);
}

TEST(ReturnCalculator_Annualise, DriftIsMeanTimes252) {
    const std::vector<double> r{0.001, 0.002, 0.003};
    EXPECT_NEAR(ReturnCalculator::annualised_drift(r), 0.002 * 252.0, 1e-14);
}

TEST(ReturnCalculator_Annualise, DegenerateInputsGiveZero) {
    const std::vector<double> one{0.05};
    const std::vector<double> none;
    EXPECT_EQ(ReturnCalculator::annualised_volatility(one), 0.0);
    EXPECT_EQ(ReturnCalculator::annualised_drift(none), 0.0);
}
