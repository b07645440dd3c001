#include <gtest/gtest.h>
#include "mlbedge/projection.hpp"
#include "mlbedge/constants.hpp"

#include <cmath>
#include <limits>

using namespace mlbedge;
using namespace mlbedge::projection;
using namespace mlbedge::constants;

// ─── Helpers ─────────────────────────────────────────────────────────────────

/// League-average everything with full confidence.
static OffenseProfile league_offense() {
    OffenseProfile o;
    o.runs_per_game.adjusted   = LEAGUE_RPG;
    o.runs_per_game.confidence = 1.0;
    o.ops_adjusted = LEAGUE_OPS;
    return o;
}

static PitcherProfile league_pitcher() {
    PitcherProfile p;
    p.era.adjusted   = LEAGUE_ERA;
    p.era.confidence = 1.0;
    return p;
}

static DefenseProfile league_defense() {
    DefenseProfile d;
    d.errors_per_game.adjusted   = LEAGUE_ERRORS_PER_GAME;
    d.errors_per_game.confidence = 1.0;
    return d;
}

static ContextRecord neutral_context() {
    ContextRecord c;
    c.confidence = 1.0;
    return c;
}

static TeamMetrics league_team() {
    return TeamMetrics{league_offense(), league_pitcher(), {}, league_defense(),
                       neutral_context()};
}

// ─── Factors ─────────────────────────────────────────────────────────────────

TEST(RunProjection_Factors, LeagueAverage_AllNeutral) {
    const auto o = league_offense();
    EXPECT_DOUBLE_EQ(RunProjectionModel::split_factor(o, Handedness::Right), 1.0);
    EXPECT_DOUBLE_EQ(RunProjectionModel::recent_factor(o), 1.0);
    EXPECT_NEAR(RunProjectionModel::pitcher_factor(league_pitcher()), 1.0, 1e-12);
    EXPECT_NEAR(RunProjectionModel::defense_factor(league_defense()), 1.0, 1e-12);
}

TEST(RunProjection_Factors, SplitFactor_BlendsSplitAndTeam) {
    auto o = league_offense();
    o.ops_vs_lhp = 0.858;  // 1.2 × league
    const double f = RunProjectionModel::split_factor(o, Handedness::Left);
    EXPECT_NEAR(f, 0.6 * 1.2 + 0.4 * 1.0, 1e-9);
    // Right-handed starter has no split → neutral.
    EXPECT_DOUBLE_EQ(RunProjectionModel::split_factor(o, Handedness::Right), 1.0);
}

TEST(RunProjection_Factors, RecentFactor_Clamped) {
    auto o = league_offense();
    o.runs_last_30 = 100.0;
    EXPECT_DOUBLE_EQ(RunProjectionModel::recent_factor(o), RECENT_FACTOR_MAX);
    o.runs_last_30 = 0.0;
    EXPECT_DOUBLE_EQ(RunProjectionModel::recent_factor(o), 1.0 - WEIGHT_RECENT_30);
}

TEST(RunProjection_Factors, PitcherFactor_AceSuppresses) {
    auto p = league_pitcher();
    p.era.adjusted = 2.15;
    EXPECT_NEAR(RunProjectionModel::pitcher_factor(p), 0.6, 1e-12);
    p.era.adjusted = 20.0;
    EXPECT_DOUBLE_EQ(RunProjectionModel::pitcher_factor(p), PITCHER_FACTOR_MAX);
}

TEST(RunProjection_Factors, H2hDelta_AntisymmetricByVenue) {
    HeadToHeadRecord h;
    h.winrate_weighted = 0.8;
    h.confidence = 0.35;
    const double home = RunProjectionModel::h2h_delta(h, true);
    EXPECT_NEAR(home, 0.3 * 0.05 * 0.35, 1e-12);
    EXPECT_DOUBLE_EQ(RunProjectionModel::h2h_delta(h, false), -home);
}

// ─── Confidence ──────────────────────────────────────────────────────────────

TEST(RunProjection_Confidence, WeightsSumToOne) {
    EXPECT_NEAR(RunProjectionModel::confidence_weights().sum(), 1.0, 1e-12);
}

TEST(RunProjection_Confidence, ClampedToRange) {
    ConfidenceVector zero = ConfidenceVector::Zero();
    EXPECT_DOUBLE_EQ(RunProjectionModel::combine_confidence(zero), PROJECTION_CONFIDENCE_MIN);

    ConfidenceVector ones = ConfidenceVector::Ones();
    EXPECT_NEAR(RunProjectionModel::combine_confidence(ones), 1.0, 1e-12);
}

TEST(RunProjection_Confidence, NonFiniteInputs_TreatedAsZero) {
    ConfidenceVector c = ConfidenceVector::Ones();
    c(0) = std::numeric_limits<double>::quiet_NaN();
    EXPECT_NEAR(RunProjectionModel::combine_confidence(c), 0.60, 1e-12);
}

// ─── Team / game projection ──────────────────────────────────────────────────

TEST(RunProjection_Team, LeagueAverage_ProjectsLeagueRuns) {
    const auto b = RunProjectionModel::project_team(
        league_offense(), league_pitcher(), league_defense(), neutral_context(),
        HeadToHeadRecord{}, true);
    EXPECT_NEAR(b.mu, LEAGUE_RPG, 1e-9);
}

TEST(RunProjection_Team, ContextTermsApplied) {
    auto ctx = neutral_context();
    ctx.park_factor     = 1.10;
    ctx.weather_runs    = 0.05;
    ctx.fatigue_penalty = 0.05;
    const auto b = RunProjectionModel::project_team(
        league_offense(), league_pitcher(), league_defense(), ctx, HeadToHeadRecord{}, true);
    EXPECT_NEAR(b.mu, LEAGUE_RPG * 1.10, 1e-9);
}

TEST(RunProjection_Team, ParkFactorClamped) {
    auto ctx = neutral_context();
    ctx.park_factor = 3.0;
    const auto high = RunProjectionModel::project_team(
        league_offense(), league_pitcher(), league_defense(), ctx, HeadToHeadRecord{}, true);
    EXPECT_DOUBLE_EQ(high.park_factor, PARK_FACTOR_MAX);
    EXPECT_NEAR(high.mu, LEAGUE_RPG * PARK_FACTOR_MAX, 1e-9);

    ctx.park_factor = 0.1;
    const auto low = RunProjectionModel::project_team(
        league_offense(), league_pitcher(), league_defense(), ctx, HeadToHeadRecord{}, true);
    EXPECT_DOUBLE_EQ(low.park_factor, PARK_FACTOR_MIN);
}

TEST(RunProjection_Team, NeverBelowMinimum) {
    auto o = league_offense();
    o.runs_per_game.adjusted = 0.0;
    auto ctx = neutral_context();
    ctx.fatigue_penalty = 5.0;
    const auto b = RunProjectionModel::project_team(
        o, league_pitcher(), league_defense(), ctx, HeadToHeadRecord{}, false);
    EXPECT_DOUBLE_EQ(b.mu, MIN_RUNS);
}

TEST(RunProjection_Game, SymmetricTeams_EqualRuns) {
    const GameMetrics m{league_team(), league_team(), HeadToHeadRecord{}};
    const auto g = RunProjectionModel::project_game(m);
    EXPECT_NEAR(g.home.mu, g.away.mu, 1e-12);
    EXPECT_NEAR(g.total, 2.0 * LEAGUE_RPG, 1e-9);
    EXPECT_GE(g.confidence, PROJECTION_CONFIDENCE_MIN);
    EXPECT_LE(g.confidence, PROJECTION_CONFIDENCE_MAX);
}

TEST(RunProjection_Game, BetterOpposingPitcher_FewerRuns) {
    GameMetrics m{league_team(), league_team(), HeadToHeadRecord{}};
    m.away.starter.era.adjusted = 2.5;
    const auto g = RunProjectionModel::project_game(m);
    EXPECT_LT(g.home.mu, g.away.mu);
}
