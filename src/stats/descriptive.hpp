#pragma once

/// @file src/stats/descriptive.hpp
/// @brief Descriptive statistics shared by the regime and risk modules.
///
/// ## Conventions
/// - Population moments divide by n, sample moments by n − 1.
/// - Percentiles interpolate linearly between order statistics at rank
///   `pct / 100 · (n − 1)`; the input must already be sorted ascending.
/// - Every function returns `std::nullopt` when the statistic is undefined for
///   the given length instead of producing NaN.
///
/// ## NOT Responsible For
/// - Applying zero / uniform defaults (callers decide the fallback)

#include <cstddef>
#include <optional>
#include <span>

namespace rmce::stats {

/// Arithmetic mean.  `nullopt` on empty input.
[[nodiscard]] std::optional<double> mean(std::span<const double> v) noexcept;

/// Population standard deviation (n denominator).  `nullopt` on empty input.
[[nodiscard]] std::optional<double>
population_stddev(std::span<const double> v) noexcept;

/// Sample standard deviation (n − 1 denominator).  `nullopt` if n < 2.
[[nodiscard]] std::optional<double>
sample_stddev(std::span<const double> v) noexcept;

/// Linearly interpolated percentile of an ascending-sorted span.
///
/// # Arguments
/// * `sorted`: Values sorted ascending
/// * `pct`   : Percentile in [0, 100]
///
/// # Returns
/// `nullopt` on empty input or `pct` outside [0, 100].
[[nodiscard]] std::optional<double>
percentile_sorted(std::span<const double> sorted, double pct) noexcept;

/// Least-squares slope of `y` against x = 0, 1, …, n − 1.
/// `nullopt` if n < 2.
[[nodiscard]] std::optional<double>
linear_slope(std::span<const double> y) noexcept;

/// Mean of the rolling sample standard deviation over full windows of
/// `window` consecutive values.  `nullopt` when no full window exists.
[[nodiscard]] std::optional<double>
mean_rolling_stddev(std::span<const double> v, std::size_t window) noexcept;

} // namespace rmce::stats
