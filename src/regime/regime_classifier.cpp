/// @file src/regime/regime_classifier.cpp
/// @brief RegimeClassifier and RegimeConfig validation.

#include "rmce/regime.hpp"
#include "rmce/errors.hpp"

#include <fmt/format.h>

#include <cmath>

namespace rmce::regime {

// ─── RegimeConfig::validate ───────────────────────────────────────────────────

void RegimeConfig::validate() const {
    if (!std::isfinite(high_threshold) || !std::isfinite(low_threshold)) {
        throw InvalidParameterError("regime thresholds must be finite");
    }
    if (low_threshold >= high_threshold) {
        throw InvalidParameterError(fmt::format(
            "low_threshold ({}) must be below high_threshold ({})",
            low_threshold, high_threshold));
    }
    if (min_history < 2) {
        throw InvalidParameterError(fmt::format(
            "min_history must be at least 2, got {}", min_history));
    }
    if (max_history != 0 && max_history < min_history) {
        throw InvalidParameterError(fmt::format(
            "max_history ({}) is below min_history ({})", max_history, min_history));
    }
    if (forecast_horizon > constants::MAX_FORECAST_HORIZON) {
        throw InvalidParameterError(fmt::format(
            "forecast_horizon must be at most {}, got {}",
            constants::MAX_FORECAST_HORIZON, forecast_horizon));
    }
}

// ─── RegimeClassifier ─────────────────────────────────────────────────────────

RegimeClassifier::RegimeClassifier(double high_threshold, double low_threshold)
    : high_threshold_(high_threshold)
    , low_threshold_(low_threshold)
{
    if (!(low_threshold_ < high_threshold_)) {
        throw InvalidParameterError(fmt::format(
            "low_threshold ({}) must be below high_threshold ({})",
            low_threshold_, high_threshold_));
    }
}

Regime RegimeClassifier::classify(double log_return) const noexcept {
    if (log_return > high_threshold_) return Regime::Bull;
    if (log_return < low_threshold_)  return Regime::Bear;
    return Regime::Sideways;
}

RegimeSeries RegimeClassifier::classify_series(std::span<const double> returns) const {
    RegimeSeries labels;
    labels.reserve(returns.size());
    for (double r : returns) {
        labels.push_back(classify(r));
    }
    return labels;
}

}  // namespace rmce::regime
