#include <gtest/gtest.h>
#include "mlbedge/markets.hpp"

#include <cmath>

using namespace mlbedge;
using namespace mlbedge::markets;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static Analysis totals_analysis(double projected, double line,
                                std::optional<OddsQuote> over = DecimalOdds{1.91},
                                std::optional<OddsQuote> under = DecimalOdds{1.91}) {
    Analysis a;
    a.event_id = "G7";
    a.date     = "2024-05-02";
    a.teams    = Teams{"COL", "SD"};
    a.projections.total_runs = projected;
    a.confidence = 0.70;
    a.market.total = TotalsMarket{line, over, under};
    return a;
}

// ─── over_probability ────────────────────────────────────────────────────────

TEST(TotalsEvaluator_OverProbability, OnTheLine_Half) {
    EXPECT_DOUBLE_EQ(TotalsEvaluator::over_probability(8.5, 8.5), 0.5);
}

TEST(TotalsEvaluator_OverProbability, LogisticOfDifference) {
    EXPECT_NEAR(TotalsEvaluator::over_probability(9.5, 8.5), 1.0 / (1.0 + std::exp(-1.0)),
                1e-12);
    EXPECT_LT(TotalsEvaluator::over_probability(7.0, 8.5), 0.5);
}

// ─── evaluate ────────────────────────────────────────────────────────────────

TEST(TotalsEvaluator_Evaluate, HighProjection_OverPick) {
    const auto pick = TotalsEvaluator::evaluate(totals_analysis(9.5, 8.5), 0.03, 0.55);
    ASSERT_TRUE(pick.has_value());
    EXPECT_EQ(pick->market, MarketType::Total);
    EXPECT_EQ(pick->side, Side::Over);
    ASSERT_TRUE(pick->line.has_value());
    EXPECT_DOUBLE_EQ(*pick->line, 8.5);
    const double p = 1.0 / (1.0 + std::exp(-1.0));
    EXPECT_NEAR(pick->model_prob, p, 1e-12);
    EXPECT_NEAR(pick->edge, (p - 1.0 / 1.91) * 1.91, 1e-12);
    EXPECT_DOUBLE_EQ(pick->confidence, 0.70);
    EXPECT_TRUE(pick->team.empty());
}

TEST(TotalsEvaluator_Evaluate, LowProjection_UnderPick) {
    const auto pick = TotalsEvaluator::evaluate(totals_analysis(7.0, 8.5), 0.03, 0.55);
    ASSERT_TRUE(pick.has_value());
    EXPECT_EQ(pick->side, Side::Under);
}

TEST(TotalsEvaluator_Evaluate, ProjectionOnLine_NoPick) {
    EXPECT_FALSE(TotalsEvaluator::evaluate(totals_analysis(8.5, 8.5), 0.03, 0.55).has_value());
}

TEST(TotalsEvaluator_Evaluate, TotalFromTeamRuns) {
    auto a = totals_analysis(0.0, 8.5);
    a.projections.total_runs.reset();
    a.projections.home_runs = 5.5;
    a.projections.away_runs = 4.5;
    const auto pick = TotalsEvaluator::evaluate(a, 0.03, 0.55);
    ASSERT_TRUE(pick.has_value());
    EXPECT_EQ(pick->side, Side::Over);
}

TEST(TotalsEvaluator_Evaluate, BadOverPrice_UnderStillEvaluated) {
    const auto pick = TotalsEvaluator::evaluate(
        totals_analysis(7.0, 8.5, OddsQuote{DecimalOdds{1.0}}, OddsQuote{DecimalOdds{1.91}}),
        0.03, 0.55);
    ASSERT_TRUE(pick.has_value());
    EXPECT_EQ(pick->side, Side::Under);
}

TEST(TotalsEvaluator_Evaluate, BadPriceOnValueSide_NoPick) {
    const auto pick = TotalsEvaluator::evaluate(
        totals_analysis(9.5, 8.5, OddsQuote{AmericanOdds{0}}, OddsQuote{DecimalOdds{1.91}}),
        0.03, 0.55);
    EXPECT_FALSE(pick.has_value());
}

TEST(TotalsEvaluator_Evaluate, MissingLineOrMarket_Nullopt) {
    auto a = totals_analysis(9.5, 8.5);
    a.market.total->line.reset();
    EXPECT_FALSE(TotalsEvaluator::evaluate(a, 0.03, 0.55).has_value());

    a.market.total.reset();
    EXPECT_FALSE(TotalsEvaluator::evaluate(a, 0.03, 0.55).has_value());
}

TEST(TotalsEvaluator_Evaluate, LowConfidence_Nullopt) {
    auto a = totals_analysis(9.5, 8.5);
    a.confidence = 0.50;
    EXPECT_FALSE(TotalsEvaluator::evaluate(a, 0.03, 0.55).has_value());
}
