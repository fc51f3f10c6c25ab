/// @file src/risk/risk_report.cpp
/// @brief Text rendering of RiskReport.

#include "rmce/risk.hpp"

#include <fmt/format.h>

#include <iterator>
#include <string>

namespace rmce::risk {

namespace {

constexpr double pct(double fraction) noexcept { return fraction * 100.0; }

}  // namespace

std::string RiskReport::to_string() const {
    std::string out;
    auto it = std::back_inserter(out);

    fmt::format_to(it, "Monte Carlo risk ({} paths, {} days, seed {})\n",
                   path_count, parameters.horizon_days, seed_used);
    fmt::format_to(it, "  price={:.4f}  vol={:.4f}  drift={:.4f}\n\n",
                   parameters.current_price, parameters.volatility, parameters.drift);

    fmt::format_to(it, "  {:<24} {:>9.4f}%\n", "VaR 95%", pct(var_95));
    fmt::format_to(it, "  {:<24} {:>9.4f}%\n", "VaR 99%", pct(var_99));
    fmt::format_to(it, "  {:<24} {:>9.4f}%\n", "Expected shortfall 95%", pct(expected_shortfall_95));
    fmt::format_to(it, "  {:<24} {:>9.4f}%\n", "Expected shortfall 99%", pct(expected_shortfall_99));
    fmt::format_to(it, "  {:<24} {:>9.4f}%\n", "Mean", pct(mean_return));
    fmt::format_to(it, "  {:<24} {:>9.4f}%\n", "Median", pct(median_return));
    fmt::format_to(it, "  {:<24} {:>9.4f}%\n", "Std-dev", pct(std_return));
    fmt::format_to(it, "  {:<24} {:>9.4f}%\n", "Min", pct(min_return));
    fmt::format_to(it, "  {:<24} {:>9.4f}%\n", "Max", pct(max_return));
    fmt::format_to(it, "  {:<24} {:>9.4f}%\n", "P(return > 0)", pct(probability_positive_return));
    fmt::format_to(it, "  {:<24} {:>9.4f}%\n", "P(return < 0)", pct(probability_negative_return));

    fmt::format_to(it, "\nStress: 1%={:.4f}% 5%={:.4f}% 10%={:.4f}% P(<-20%)={:.4f}%\n",
                   pct(stress_test.worst_case_1pct), pct(stress_test.worst_case_5pct),
                   pct(stress_test.worst_case_10pct), pct(stress_test.extreme_loss_probability));
    fmt::format_to(it, "Tail: kurtosis={:.4f} ({}) skewness={:.4f} ({})\n",
                   tail_risk.kurtosis, tail_risk.tail_thickness,
                   tail_risk.skewness, tail_risk.tail_asymmetry);
    return out;
}

}  // namespace rmce::risk
