#include <gtest/gtest.h>
#include "mlbedge/backtest.hpp"
#include "mlbedge/constants.hpp"

#include <cmath>
#include <limits>
#include <vector>

using namespace mlbedge;
using namespace mlbedge::backtest;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static std::vector<double> alternating(double mean, double spread, std::size_t n) {
    std::vector<double> v(n);
    for (std::size_t i = 0; i < n; ++i) {
        v[i] = (i % 2 == 0) ? mean + spread : mean - spread;
    }
    return v;
}

// ─── Sharpe ──────────────────────────────────────────────────────────────────

TEST(PerformanceCalculator_Sharpe, FewerThanTwo_Nullopt) {
    EXPECT_FALSE(PerformanceCalculator::sharpe(std::vector<double>{}).has_value());
    EXPECT_FALSE(PerformanceCalculator::sharpe(std::vector<double>{0.5}).has_value());
}

TEST(PerformanceCalculator_Sharpe, ZeroVariance_Nullopt) {
    const std::vector<double> r(10, 0.9);
    EXPECT_FALSE(PerformanceCalculator::sharpe(r).has_value());
}

TEST(PerformanceCalculator_Sharpe, NonFinite_Nullopt) {
    const std::vector<double> r{0.1, std::numeric_limits<double>::infinity(), -0.2};
    EXPECT_FALSE(PerformanceCalculator::sharpe(r).has_value());
}

TEST(PerformanceCalculator_Sharpe, KnownValue) {
    const auto r = alternating(0.1, 0.5, 10);
    // Sample σ of ±0.5 around the mean over 10 points: 0.5·√(10/9)
    const double sd = 0.5 * std::sqrt(10.0 / 9.0);
    const auto s = PerformanceCalculator::sharpe(r, 100.0);
    ASSERT_TRUE(s.has_value());
    EXPECT_NEAR(*s, 0.1 / sd * 10.0, 1e-9);
}

TEST(PerformanceCalculator_Sharpe, DefaultAnnualisation) {
    const auto r = alternating(0.1, 0.5, 10);
    const auto s1 = PerformanceCalculator::sharpe(r);
    const auto s2 = PerformanceCalculator::sharpe(r, constants::BETS_PER_YEAR);
    ASSERT_TRUE(s1.has_value());
    EXPECT_DOUBLE_EQ(*s1, *s2);
}

// ─── Max drawdown ────────────────────────────────────────────────────────────

TEST(PerformanceCalculator_MaxDrawdown, Empty_Nullopt) {
    EXPECT_FALSE(PerformanceCalculator::max_drawdown(std::vector<double>{}).has_value());
}

TEST(PerformanceCalculator_MaxDrawdown, MonotoneUp_Zero) {
    const std::vector<double> b{100.0, 110.0, 120.0};
    EXPECT_DOUBLE_EQ(*PerformanceCalculator::max_drawdown(b), 0.0);
}

TEST(PerformanceCalculator_MaxDrawdown, PeakToTrough) {
    const std::vector<double> b{100.0, 120.0, 90.0, 110.0, 60.0, 130.0};
    EXPECT_NEAR(*PerformanceCalculator::max_drawdown(b), 0.5, 1e-12);
}

TEST(PerformanceCalculator_MaxDrawdown, NaN_Nullopt) {
    const std::vector<double> b{100.0, std::nan("")};
    EXPECT_FALSE(PerformanceCalculator::max_drawdown(b).has_value());
}

// ─── Bankroll series ─────────────────────────────────────────────────────────

TEST(PerformanceCalculator_BankrollSeries, CumulativeFromInitial) {
    const std::vector<double> profits{50.0, -20.0, 10.0};
    const auto s = PerformanceCalculator::bankroll_series(1'000.0, profits);
    const std::vector<double> expected{1'000.0, 1'050.0, 1'030.0, 1'040.0};
    EXPECT_EQ(s, expected);
}
