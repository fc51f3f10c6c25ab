/// @file src/risk/risk_metrics.cpp
/// @brief RiskMetricsCalculator implementation.

#include "rmce/risk.hpp"
#include "rmce/errors.hpp"
#include "rmce/logging.hpp"

#include "../stats/descriptive.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace rmce::risk {

namespace {

double fraction_where(std::span<const double> v, bool (*pred)(double)) noexcept {
    const auto hits = std::count_if(v.begin(), v.end(), pred);
    return static_cast<double>(hits) / static_cast<double>(v.size());
}

}  // namespace

// ─── Expected shortfall ───────────────────────────────────────────────────────

double RiskMetricsCalculator::expected_shortfall(std::span<const double> ensemble,
                                                 double threshold) noexcept {
    // Shortfalls are summed relative to the threshold so a tied tail yields
    // exactly the threshold; the clamp keeps ES within [worst, threshold].
    double      excess = 0.0;
    double      worst  = threshold;
    std::size_t count  = 0;
    for (double r : ensemble) {
        if (r <= threshold) {
            excess += r - threshold;
            worst   = std::min(worst, r);
            ++count;
        }
    }
    if (count == 0) return 0.0;
    return std::clamp(threshold + excess / static_cast<double>(count), worst, threshold);
}

// ─── Stress tests ─────────────────────────────────────────────────────────────

StressTestResults RiskMetricsCalculator::stress_tests(std::span<const double> sorted) {
    if (sorted.empty()) {
        return StressTestResults{};
    }
    const double p5 = *stats::percentile_sorted(sorted, 5.0);
    return StressTestResults{
        .worst_case_1pct          = *stats::percentile_sorted(sorted, 1.0),
        .worst_case_5pct          = p5,
        .worst_case_10pct         = *stats::percentile_sorted(sorted, 10.0),
        .extreme_loss_probability = fraction_where(sorted, [](double r) {
            return r < constants::EXTREME_LOSS_THRESHOLD;
        }),
        .tail_expectation         = expected_shortfall(sorted, p5),
    };
}

// ─── Tail risk ────────────────────────────────────────────────────────────────

TailRiskAnalysis RiskMetricsCalculator::tail_risk(std::span<const double> ensemble) {
    TailRiskAnalysis out;
    const auto mu = stats::mean(ensemble);
    const auto sd = stats::population_stddev(ensemble);
    if (!mu || !sd) return out;

    double m3 = 0.0;
    double m4 = 0.0;
    for (double r : ensemble) {
        const double d  = r - *mu;
        const double d2 = d * d;
        m3 += d2 * d;
        m4 += d2 * d2;
    }
    const auto n = static_cast<double>(ensemble.size());
    m3 /= n;
    m4 /= n;
    out.fourth_moment = m4;

    // A constant ensemble has undefined standardised moments; report 0.
    if (*sd > constants::FLOAT_EPSILON * std::max(1.0, std::abs(*mu))) {
        const double s2 = *sd * *sd;
        out.skewness = m3 / (s2 * *sd);
        out.kurtosis = m4 / (s2 * s2) - 3.0;
    }

    out.tail_thickness = out.kurtosis > constants::HEAVY_TAIL_KURTOSIS ? "heavy" : "normal";
    if (out.skewness < -constants::SKEW_ASYMMETRY_THRESHOLD) {
        out.tail_asymmetry = "left";
    } else if (out.skewness > constants::SKEW_ASYMMETRY_THRESHOLD) {
        out.tail_asymmetry = "right";
    } else {
        out.tail_asymmetry = "symmetric";
    }
    return out;
}

// ─── compute ──────────────────────────────────────────────────────────────────

RiskReport RiskMetricsCalculator::compute(std::span<const double> ensemble) {
    if (ensemble.empty()) {
        throw EmptyEnsembleError("risk metrics require at least one simulated path");
    }

    std::vector<double> sorted(ensemble.begin(), ensemble.end());
    std::sort(sorted.begin(), sorted.end());

    RiskReport report;
    report.var_95                = *stats::percentile_sorted(sorted, 5.0);
    report.var_99                = *stats::percentile_sorted(sorted, 1.0);
    report.expected_shortfall_95 = expected_shortfall(sorted, report.var_95);
    report.expected_shortfall_99 = expected_shortfall(sorted, report.var_99);

    report.mean_return   = *stats::mean(sorted);
    report.std_return    = *stats::population_stddev(sorted);
    report.min_return    = sorted.front();
    report.max_return    = sorted.back();
    report.median_return = *stats::percentile_sorted(sorted, 50.0);

    report.probability_positive_return =
        fraction_where(sorted, [](double r) { return r > 0.0; });
    report.probability_negative_return =
        fraction_where(sorted, [](double r) { return r < 0.0; });

    report.stress_test = stress_tests(sorted);
    report.tail_risk   = tail_risk(sorted);
    report.path_count  = ensemble.size();

    log::logger()->debug("risk metrics over {} paths: VaR95={:.5f} ES95={:.5f}",
                         ensemble.size(), report.var_95, report.expected_shortfall_95);
    return report;
}

}  // namespace rmce::risk
