/// @file src/core/returns.cpp
/// @brief ReturnCalculator implementation.

#include "rmce/returns.hpp"
#include "rmce/errors.hpp"

#include "../stats/descriptive.hpp"

#include <fmt/format.h>

#include <cmath>
#include <vector>

namespace rmce::core {

ReturnSeries ReturnCalculator::log_returns(std::span<const double> prices) {
    if (prices.size() < 2) {
        throw InsufficientDataError(fmt::format(
            "log returns need at least 2 prices, got {}", prices.size()));
    }

    ReturnSeries rets;
    rets.reserve(prices.size() - 1);

    for (std::size_t i = 0; i < prices.size(); ++i) {
        const double p = prices[i];
        if (!std::isfinite(p) || p <= 0.0) {
            throw InvalidSeriesError(fmt::format(
                "price at index {} is not a positive finite value ({})", i, p));
        }
        if (i > 0) {
            rets.push_back(std::log(p / prices[i - 1]));
        }
    }
    return rets;
}

ReturnSeries
ReturnCalculator::log_returns(std::span<const Observation> observations) {
    std::vector<double> closes;
    closes.reserve(observations.size());
    for (const auto& obs : observations) {
        closes.push_back(obs.close);
    }
    return log_returns(closes);
}

double
ReturnCalculator::annualised_volatility(std::span<const double> returns) noexcept {
    const auto sd = stats::sample_stddev(returns);
    return sd ? *sd * std::sqrt(constants::TRADING_DAYS_PER_YEAR) : 0.0;
}

double
ReturnCalculator::annualised_drift(std::span<const double> returns) noexcept {
    const auto mu = stats::mean(returns);
    return mu ? *mu * constants::TRADING_DAYS_PER_YEAR : 0.0;
}

}  // namespace rmce::core
