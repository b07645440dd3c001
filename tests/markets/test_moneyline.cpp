#include <gtest/gtest.h>
#include "mlbedge/markets.hpp"

#include <cmath>
#include <memory>
#include <string>
#include <vector>

using namespace mlbedge;
using namespace mlbedge::markets;
using mlbedge::simulation::WinProbabilities;
using mlbedge::simulation::WinProbabilityModel;

// ─── Helpers ─────────────────────────────────────────────────────────────────

/// Win-probability model that always answers the same home probability.
class FixedModel final : public WinProbabilityModel {
public:
    explicit FixedModel(double p_home) : p_home_(p_home) {}

    std::optional<WinProbabilities>
    moneyline(double, double, std::optional<double>, std::optional<double>) const override {
        return WinProbabilities{p_home_, 1.0 - p_home_, 1000};
    }

private:
    double p_home_;
};

static MoneylineEvaluator evaluator(double p_home) {
    return MoneylineEvaluator(std::make_shared<FixedModel>(p_home));
}

static Analysis make_analysis(OddsQuote home, OddsQuote away, double conf = 0.70) {
    Analysis a;
    a.event_id = "G1";
    a.date     = "2024-04-01";
    a.teams    = Teams{"NYY", "BOS"};
    a.projections.home_runs = 4.5;
    a.projections.away_runs = 4.0;
    a.confidence = conf;
    a.market.moneyline = MoneylineMarket{home, away};
    return a;
}

// ─── Quality penalty ─────────────────────────────────────────────────────────

TEST(Markets_QualityPenalty, CountsOnlyQualityMarkers) {
    const std::vector<std::string> flags{"LOW_SAMPLE_PITCHER_NYY", "NO_H2H_DATA",
                                         "TBD_PITCHER", "NO_RECENT_OFFENSE"};
    EXPECT_EQ(count_quality_flags(flags), 3u);
    EXPECT_NEAR(quality_penalty(flags), 0.105, 1e-12);
}

TEST(Markets_QualityPenalty, CappedAt12Percent) {
    const std::vector<std::string> flags(10, "LOW_SAMPLE_X");
    EXPECT_NEAR(quality_penalty(flags), 0.12, 1e-12);
}

TEST(Markets_QualityPenalty, ProbabilityClamped) {
    const std::vector<std::string> none;
    EXPECT_DOUBLE_EQ(apply_quality_penalty(0.99, none), 0.95);
    EXPECT_DOUBLE_EQ(apply_quality_penalty(0.01, none), 0.05);
}

// ─── MoneylineEvaluator ──────────────────────────────────────────────────────

TEST(MoneylineEvaluator_Evaluate, HomeValue_HomePick) {
    const auto pick = evaluator(0.60).evaluate(
        make_analysis(DecimalOdds{2.0}, DecimalOdds{2.0}), 0.03, 0.55);
    ASSERT_TRUE(pick.has_value());
    EXPECT_EQ(pick->side, Side::Home);
    EXPECT_EQ(pick->team, "NYY");
    EXPECT_EQ(pick->market, MarketType::Moneyline);
    EXPECT_NEAR(pick->edge, 0.20, 1e-12);
    EXPECT_NEAR(pick->implied_prob, 0.5, 1e-12);
    EXPECT_NEAR(pick->confidence, (0.70 + 0.60) / 2.0, 1e-12);
    EXPECT_EQ(pick->correlation_note, "No totals data available");
}

TEST(MoneylineEvaluator_Evaluate, MirroredProbability_AwayPick) {
    const auto pick = evaluator(0.40).evaluate(
        make_analysis(DecimalOdds{2.0}, DecimalOdds{2.0}), 0.03, 0.55);
    ASSERT_TRUE(pick.has_value());
    EXPECT_EQ(pick->side, Side::Away);
    EXPECT_EQ(pick->team, "BOS");
    EXPECT_NEAR(pick->edge, 0.20, 1e-12);
}

TEST(MoneylineEvaluator_Evaluate, EqualEdges_HomeWinsTie) {
    const auto pick = evaluator(0.50).evaluate(
        make_analysis(DecimalOdds{2.2}, DecimalOdds{2.2}), 0.03, 0.55);
    ASSERT_TRUE(pick.has_value());
    EXPECT_EQ(pick->side, Side::Home);
}

TEST(MoneylineEvaluator_Evaluate, AmericanPrices_Normalised) {
    const auto pick = evaluator(0.60).evaluate(
        make_analysis(AmericanOdds{100}, AmericanOdds{-120}), 0.03, 0.55);
    ASSERT_TRUE(pick.has_value());
    EXPECT_DOUBLE_EQ(pick->odds, 2.0);
}

TEST(MoneylineEvaluator_Evaluate, NoEdge_Nullopt) {
    const auto pick = evaluator(0.50).evaluate(
        make_analysis(DecimalOdds{1.95}, DecimalOdds{1.95}), 0.03, 0.55);
    EXPECT_FALSE(pick.has_value());
}

TEST(MoneylineEvaluator_Evaluate, EdgeBelowMinimum_Nullopt) {
    const auto pick = evaluator(0.51).evaluate(
        make_analysis(DecimalOdds{2.0}, DecimalOdds{2.0}), 0.03, 0.55);
    EXPECT_FALSE(pick.has_value());
}

TEST(MoneylineEvaluator_Evaluate, LowConfidence_Nullopt) {
    const auto pick = evaluator(0.60).evaluate(
        make_analysis(DecimalOdds{2.0}, DecimalOdds{2.0}, 0.40), 0.03, 0.55);
    EXPECT_FALSE(pick.has_value());
}

TEST(MoneylineEvaluator_Evaluate, MissingData_Nullopt) {
    auto a = make_analysis(DecimalOdds{2.0}, DecimalOdds{2.0});
    a.confidence.reset();
    EXPECT_FALSE(evaluator(0.6).evaluate(a, 0.03, 0.55).has_value());

    a = make_analysis(DecimalOdds{2.0}, DecimalOdds{2.0});
    a.projections.away_runs.reset();
    EXPECT_FALSE(evaluator(0.6).evaluate(a, 0.03, 0.55).has_value());

    a = make_analysis(DecimalOdds{2.0}, DecimalOdds{2.0});
    a.market.moneyline.reset();
    EXPECT_FALSE(evaluator(0.6).evaluate(a, 0.03, 0.55).has_value());
}

TEST(MoneylineEvaluator_Evaluate, MalformedOdds_MarketSkipped) {
    const auto pick = evaluator(0.60).evaluate(
        make_analysis(AmericanOdds{0}, DecimalOdds{2.0}), 0.03, 0.55);
    EXPECT_FALSE(pick.has_value());
}

TEST(MoneylineEvaluator_Evaluate, QualityFlags_ShrinkModelProbability) {
    auto a = make_analysis(DecimalOdds{2.0}, DecimalOdds{2.0});
    a.flags = {"LOW_SAMPLE_PITCHER_NYY", "NO_H2H_DATA"};
    const auto pick = evaluator(0.60).evaluate(a, 0.03, 0.55);
    ASSERT_TRUE(pick.has_value());
    EXPECT_NEAR(pick->model_prob, 0.60 * (1.0 - 0.07), 1e-12);
}

TEST(MoneylineEvaluator_Evaluate, FavouriteInHighScoringGame_EdgeBoosted) {
    auto a = make_analysis(DecimalOdds{1.8}, DecimalOdds{2.1});
    a.projections.total_runs = 10.0;
    a.market.total = TotalsMarket{8.5, DecimalOdds{1.91}, DecimalOdds{1.91}};

    const auto pick = evaluator(0.70).evaluate(a, 0.03, 0.55);
    ASSERT_TRUE(pick.has_value());
    const double raw = (0.70 - 1.0 / 1.8) / (1.0 / 1.8);
    EXPECT_NEAR(pick->edge, raw * 1.07, 1e-9);
    EXPECT_EQ(pick->correlation_note, "Favorite aligned with high-scoring projection");
    EXPECT_LE(pick->confidence, 1.0);
}

TEST(MoneylineEvaluator_Evaluate, NullModel_Nullopt) {
    const MoneylineEvaluator eval(nullptr);
    EXPECT_FALSE(eval.evaluate(make_analysis(DecimalOdds{2.0}, DecimalOdds{2.0}),
                               0.03, 0.55).has_value());
}

TEST(MoneylineEvaluator_Evaluate, QualityPenaltyAppliedToEachSide) {
    auto a = make_analysis(DecimalOdds{2.0}, DecimalOdds{2.0});
    a.flags = {"NO_H2H_DATA"};
    const auto pick = evaluator(0.40).evaluate(a, 0.03, 0.55);
    ASSERT_TRUE(pick.has_value());
    EXPECT_EQ(pick->side, Side::Away);
    // The away probability is penalised on its own, not taken as 1 − penalised home.
    EXPECT_NEAR(pick->model_prob, 0.60 * (1.0 - 0.035), 1e-12);
    EXPECT_NEAR(pick->edge, (0.60 * 0.965 - 0.5) / 0.5, 1e-12);
}
