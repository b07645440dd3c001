/// @file src/backtest/performance_metrics.cpp
/// @brief Implementation of PerformanceCalculator.
///
/// Fallible paths return std::nullopt; no function ever calls abort(),
/// assert(), or throws an exception.

#include "mlbedge/backtest.hpp"

#include <Eigen/Core>

#include <algorithm>
#include <cmath>

namespace mlbedge::backtest {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

using ConstVectorMap = Eigen::Map<const Eigen::VectorXd>;

[[nodiscard]] ConstVectorMap as_vector(std::span<const double> v) noexcept {
    return ConstVectorMap(v.data(), static_cast<Eigen::Index>(v.size()));
}

/// Return false if any element of `v` is NaN or ±Inf.
[[nodiscard]] bool all_finite(std::span<const double> v) noexcept {
    return v.empty() || as_vector(v).allFinite();
}

}  // namespace

// ─── PerformanceCalculator: private statics ─────────────────────────────────

double PerformanceCalculator::mean(std::span<const double> v) noexcept {
    return as_vector(v).mean();
}

double PerformanceCalculator::stddev(std::span<const double> v, double mean_val) noexcept {
    // Sample std-dev (Bessel-corrected, n−1 denominator).
    const double sq_sum = (as_vector(v).array() - mean_val).square().sum();
    return std::sqrt(sq_sum / static_cast<double>(v.size() - 1));
}

// ─── PerformanceCalculator: Sharpe ─────────────────────────────────────────

std::optional<double>
PerformanceCalculator::sharpe(std::span<const double> returns,
                              double annualisation) noexcept {
    if (returns.size() < 2)     return std::nullopt;
    if (!all_finite(returns))   return std::nullopt;
    if (!(annualisation > 0.0)) return std::nullopt;

    const double mu = mean(returns);
    const double sd = stddev(returns, mu);

    if (sd <= 0.0) return std::nullopt;  // zero variance, ratio undefined

    return mu / sd * std::sqrt(annualisation);
}

// ─── PerformanceCalculator: MaxDrawdown ─────────────────────────────────────

std::optional<double>
PerformanceCalculator::max_drawdown(std::span<const double> bankroll) noexcept {
    if (bankroll.empty())      return std::nullopt;
    if (!all_finite(bankroll)) return std::nullopt;

    double peak   = bankroll.front();
    double max_dd = 0.0;

    for (double b : bankroll) {
        if (b > peak) {
            peak = b;
        } else if (peak > 0.0) {
            const double dd = (peak - b) / peak;
            if (dd > max_dd) max_dd = dd;
        }
    }
    return std::min(max_dd, 1.0);
}

std::vector<double>
PerformanceCalculator::bankroll_series(double initial, std::span<const double> profits) {
    std::vector<double> series;
    series.reserve(profits.size() + 1);
    series.push_back(initial);
    double running = initial;
    for (double p : profits) {
        running += p;
        series.push_back(running);
    }
    return series;
}

}  // namespace mlbedge::backtest
