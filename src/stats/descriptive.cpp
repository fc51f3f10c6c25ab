/// @file src/stats/descriptive.cpp
/// @brief Descriptive statistics helpers.

#include "descriptive.hpp"

#include <cmath>
#include <numeric>

namespace rmce::stats {

std::optional<double> mean(std::span<const double> v) noexcept {
    if (v.empty()) return std::nullopt;
    const double sum = std::accumulate(v.begin(), v.end(), 0.0);
    return sum / static_cast<double>(v.size());
}

namespace {

/// Sum of squared deviations from `mu`.
double squared_deviations(std::span<const double> v, double mu) noexcept {
    double sq_sum = 0.0;
    for (double x : v) {
        const double d = x - mu;
        sq_sum += d * d;
    }
    return sq_sum;
}

}  // namespace

std::optional<double> population_stddev(std::span<const double> v) noexcept {
    const auto mu = mean(v);
    if (!mu) return std::nullopt;
    return std::sqrt(squared_deviations(v, *mu) / static_cast<double>(v.size()));
}

std::optional<double> sample_stddev(std::span<const double> v) noexcept {
    if (v.size() < 2) return std::nullopt;
    const double mu = *mean(v);
    return std::sqrt(squared_deviations(v, mu) / static_cast<double>(v.size() - 1));
}

std::optional<double>
percentile_sorted(std::span<const double> sorted, double pct) noexcept {
    if (sorted.empty())                         return std::nullopt;
    if (!(pct >= 0.0 && pct <= 100.0))          return std::nullopt;

    const double rank  = pct / 100.0 * static_cast<double>(sorted.size() - 1);
    const auto   lower = static_cast<std::size_t>(std::floor(rank));
    const auto   upper = static_cast<std::size_t>(std::ceil(rank));
    const double frac  = rank - static_cast<double>(lower);

    if (lower == upper) return sorted[lower];
    return sorted[lower] + frac * (sorted[upper] - sorted[lower]);
}

std::optional<double> linear_slope(std::span<const double> y) noexcept {
    const std::size_t n = y.size();
    if (n < 2) return std::nullopt;

    // x̄ = (n − 1) / 2 for x = 0..n−1
    const double x_mean = static_cast<double>(n - 1) / 2.0;
    const double y_mean = *mean(y);

    double sxy = 0.0;
    double sxx = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double dx = static_cast<double>(i) - x_mean;
        sxy += dx * (y[i] - y_mean);
        sxx += dx * dx;
    }
    return sxy / sxx;
}

std::optional<double>
mean_rolling_stddev(std::span<const double> v, std::size_t window) noexcept {
    if (window < 2 || v.size() < window) return std::nullopt;

    double total = 0.0;
    std::size_t windows = 0;
    for (std::size_t start = 0; start + window <= v.size(); ++start) {
        total += *sample_stddev(v.subspan(start, window));
        ++windows;
    }
    return total / static_cast<double>(windows);
}

} // namespace rmce::stats
