#include <gtest/gtest.h>
#include "mlbedge/staking.hpp"

#include <cmath>
#include <limits>

using namespace mlbedge;
using namespace mlbedge::staking;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static Pick make_pick(MarketType market, Side side, double p, double odds) {
    Pick pick;
    pick.event_id   = "G1";
    pick.market     = market;
    pick.side       = side;
    pick.model_prob = p;
    pick.odds       = odds;
    return pick;
}

// ─── kelly_fraction ──────────────────────────────────────────────────────────

TEST(Staking_Kelly, EvenMoneySixtyPercent_TwentyPercent) {
    EXPECT_NEAR(kelly_fraction(0.6, 2.0), 0.2, 1e-12);
}

TEST(Staking_Kelly, NoEdge_Zero) {
    EXPECT_DOUBLE_EQ(kelly_fraction(0.5, 2.0), 0.0);
    EXPECT_DOUBLE_EQ(kelly_fraction(0.4, 2.0), 0.0);
}

TEST(Staking_Kelly, InvalidOdds_Zero) {
    EXPECT_DOUBLE_EQ(kelly_fraction(0.9, 1.0), 0.0);
    EXPECT_DOUBLE_EQ(kelly_fraction(0.9, 0.5), 0.0);
    EXPECT_DOUBLE_EQ(kelly_fraction(std::numeric_limits<double>::quiet_NaN(), 2.0), 0.0);
}

TEST(Staking_Kelly, PositiveOnlyAboveImplied) {
    for (double odds : {1.5, 1.91, 2.5, 4.0}) {
        const double implied = 1.0 / odds;
        EXPECT_DOUBLE_EQ(kelly_fraction(implied - 0.01, odds), 0.0);
        EXPECT_GT(kelly_fraction(implied + 0.01, odds), 0.0);
    }
}

// ─── StakeEngine ─────────────────────────────────────────────────────────────

TEST(StakeEngine_BaseFraction, FractionalKelly) {
    const StakeEngine engine(RiskProfile::balanced());
    EXPECT_NEAR(engine.base_fraction(0.55, 2.0), 0.10 * 0.25, 1e-12);
}

TEST(StakeEngine_BaseFraction, CappedAtProfileMaximum) {
    const StakeEngine engine(RiskProfile::balanced());
    EXPECT_DOUBLE_EQ(engine.base_fraction(0.9, 3.0), 0.05);

    const StakeEngine conservative(RiskProfile::conservative());
    EXPECT_DOUBLE_EQ(conservative.base_fraction(0.9, 3.0), 0.03);
}

TEST(StakeEngine_SizeStake, MoneylineStandalone) {
    const StakeEngine engine;
    const auto staked = engine.size_stake(
        make_pick(MarketType::Moneyline, Side::Home, 0.55, 2.0), 10'000.0);
    EXPECT_NEAR(staked.stake_fraction, 0.025, 1e-12);
    EXPECT_NEAR(staked.stake_amount, 250.0, 1e-9);
    EXPECT_EQ(staked.stake_note, "No correlated market");
}

TEST(StakeEngine_SizeStake, TotalsMultiplier) {
    const StakeEngine engine;
    const auto staked = engine.size_stake(
        make_pick(MarketType::Total, Side::Over, 0.55, 2.0), 10'000.0);
    EXPECT_NEAR(staked.stake_fraction, 0.025 * 0.9, 1e-12);
}

TEST(StakeEngine_SizeStake, PairedWithOver_Reduced) {
    const StakeEngine engine;
    const auto over = make_pick(MarketType::Total, Side::Over, 0.6, 1.91);
    const auto staked = engine.size_stake(
        make_pick(MarketType::Moneyline, Side::Home, 0.55, 2.0), 10'000.0, over);
    EXPECT_NEAR(staked.stake_fraction, 0.025 * 0.75, 1e-12);
}

TEST(StakeEngine_SizeStake, PairedWithUnder_ReducedMore) {
    const StakeEngine engine;
    const auto under = make_pick(MarketType::Total, Side::Under, 0.6, 1.91);
    const auto staked = engine.size_stake(
        make_pick(MarketType::Moneyline, Side::Home, 0.55, 2.0), 10'000.0, under);
    EXPECT_NEAR(staked.stake_fraction, 0.025 * 0.70, 1e-12);
}

TEST(StakeEngine_SizeStake, TotalsPairedWithMoneyline_NoCorrelationCut) {
    const StakeEngine engine;
    const auto ml = make_pick(MarketType::Moneyline, Side::Home, 0.6, 1.91);
    const auto staked = engine.size_stake(
        make_pick(MarketType::Total, Side::Under, 0.55, 2.0), 10'000.0, ml);
    EXPECT_NEAR(staked.stake_fraction, 0.025 * 0.9, 1e-12);
}

TEST(StakeEngine_SizeStake, NeverExceedsCap) {
    for (const auto& profile : {RiskProfile::conservative(), RiskProfile::balanced(),
                                RiskProfile::aggressive()}) {
        const StakeEngine engine(profile);
        for (double p = 0.05; p < 0.96; p += 0.05) {
            for (double odds : {1.2, 1.8, 2.5, 6.0, 30.0}) {
                const auto s = engine.size_stake(
                    make_pick(MarketType::Moneyline, Side::Away, p, odds), 5'000.0);
                EXPECT_GE(s.stake_fraction, 0.0);
                EXPECT_LE(s.stake_fraction, profile.max_stake_fraction + 1e-12);
            }
        }
    }
}

TEST(StakeEngine_SizeStake, InvalidBankroll_ZeroAmount) {
    const StakeEngine engine;
    const auto s = engine.size_stake(
        make_pick(MarketType::Moneyline, Side::Home, 0.55, 2.0), -100.0);
    EXPECT_DOUBLE_EQ(s.stake_amount, 0.0);
}

// ─── RiskProfile ─────────────────────────────────────────────────────────────

TEST(RiskProfile_FromName, PresetsAndUnknown) {
    ASSERT_TRUE(RiskProfile::from_name("aggressive").has_value());
    EXPECT_DOUBLE_EQ(RiskProfile::from_name("aggressive")->min_edge, 0.02);
    EXPECT_EQ(RiskProfile::from_name("conservative")->max_picks_per_day, 3u);
    EXPECT_FALSE(RiskProfile::from_name("yolo").has_value());
    EXPECT_EQ(RiskProfile::preset_names().size(), 3u);
}
