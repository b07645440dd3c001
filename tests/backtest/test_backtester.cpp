#include <gtest/gtest.h>
#include "mlbedge/backtest.hpp"

#include <cmath>
#include <string>
#include <vector>

using namespace mlbedge;
using namespace mlbedge::backtest;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static HistoricalGame make_game(std::string id, std::string date, int home, int away) {
    HistoricalGame g;
    g.game_id    = std::move(id);
    g.date       = std::move(date);
    g.home_team  = "NYY";
    g.away_team  = "BOS";
    g.home_score = home;
    g.away_score = away;
    return g;
}

static Pick ml_pick(std::string id, Side side, double odds = 2.0, double stake = 100.0) {
    Pick p;
    p.event_id     = std::move(id);
    p.market       = MarketType::Moneyline;
    p.side         = side;
    p.team         = side == Side::Home ? "NYY" : "BOS";
    p.odds         = odds;
    p.edge         = 0.05;
    p.stake_amount = stake;
    return p;
}

static Pick total_pick(std::string id, Side side, double line, double odds = 1.91) {
    Pick p;
    p.event_id     = std::move(id);
    p.market       = MarketType::Total;
    p.side         = side;
    p.line         = line;
    p.odds         = odds;
    p.edge         = 0.04;
    p.stake_amount = 100.0;
    return p;
}

// ─── settle ──────────────────────────────────────────────────────────────────

TEST(BacktestEngine_Settle, MoneylineWinnerAndLoser) {
    const auto game = make_game("G1", "2024-04-01", 5, 3);
    EXPECT_EQ(BacktestEngine::settle(ml_pick("G1", Side::Home), game), Outcome::Win);
    EXPECT_EQ(BacktestEngine::settle(ml_pick("G1", Side::Away), game), Outcome::Loss);
}

TEST(BacktestEngine_Settle, MoneylineTiedScore_Push) {
    const auto game = make_game("G1", "2024-04-01", 4, 4);
    EXPECT_EQ(BacktestEngine::settle(ml_pick("G1", Side::Home), game), Outcome::Push);
}

TEST(BacktestEngine_Settle, Totals) {
    const auto game = make_game("G1", "2024-04-01", 5, 3);  // total 8
    EXPECT_EQ(BacktestEngine::settle(total_pick("G1", Side::Over, 7.5), game), Outcome::Win);
    EXPECT_EQ(BacktestEngine::settle(total_pick("G1", Side::Under, 8.5), game), Outcome::Win);
    EXPECT_EQ(BacktestEngine::settle(total_pick("G1", Side::Over, 8.5), game), Outcome::Loss);
    EXPECT_EQ(BacktestEngine::settle(total_pick("G1", Side::Over, 8.0), game), Outcome::Push);
}

TEST(BacktestEngine_Settle, UnsettleableCases_Pending) {
    auto game = make_game("G1", "2024-04-01", 5, 3);
    auto no_line = total_pick("G1", Side::Over, 7.5);
    no_line.line.reset();
    EXPECT_EQ(BacktestEngine::settle(no_line, game), Outcome::Pending);

    game.status = "Scheduled";
    EXPECT_EQ(BacktestEngine::settle(ml_pick("G1", Side::Home), game), Outcome::Pending);
}

// ─── profit ──────────────────────────────────────────────────────────────────

TEST(BacktestEngine_Profit, ByOutcome) {
    EXPECT_DOUBLE_EQ(BacktestEngine::profit(Outcome::Win, 100.0, 2.5), 150.0);
    EXPECT_DOUBLE_EQ(BacktestEngine::profit(Outcome::Loss, 100.0, 2.5), -100.0);
    EXPECT_DOUBLE_EQ(BacktestEngine::profit(Outcome::Push, 100.0, 2.5), 0.0);
    EXPECT_DOUBLE_EQ(BacktestEngine::profit(Outcome::Pending, 100.0, 2.5), 0.0);
}

// ─── run ─────────────────────────────────────────────────────────────────────

TEST(BacktestEngine_Run, UnmatchedPickSkipped) {
    const std::vector<HistoricalGame> games{make_game("G1", "2024-04-01", 5, 3)};
    const std::vector<Pick> picks{ml_pick("G1", Side::Home), ml_pick("G9", Side::Home)};
    const BacktestEngine engine;
    const auto results = engine.run(games, picks);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].game_id, "G1");
    EXPECT_EQ(results[0].outcome, Outcome::Win);
    EXPECT_DOUBLE_EQ(results[0].profit, 100.0);
    EXPECT_DOUBLE_EQ(results[0].roi, 1.0);
    EXPECT_EQ(results[0].home_score, 5);
}

TEST(BacktestEngine_Run, ResultsSortedByDate) {
    const std::vector<HistoricalGame> games{make_game("G2", "2024-04-03", 1, 2),
                                            make_game("G1", "2024-04-01", 5, 3)};
    const std::vector<Pick> picks{ml_pick("G2", Side::Away), ml_pick("G1", Side::Home)};
    const auto results = BacktestEngine().run(games, picks);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].date, "2024-04-01");
    EXPECT_EQ(results[1].date, "2024-04-03");
}

TEST(BacktestEngine_Run, PendingCarriesNoStake) {
    auto game = make_game("G1", "2024-04-01", 0, 0);
    game.status = "Scheduled";
    const std::vector<HistoricalGame> games{game};
    const std::vector<Pick> picks{ml_pick("G1", Side::Home)};
    const auto results = BacktestEngine().run(games, picks);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].outcome, Outcome::Pending);
    EXPECT_DOUBLE_EQ(results[0].stake, 0.0);
}

TEST(BacktestEngine_Run, FlatStakes) {
    BacktestConfig cfg;
    cfg.use_pick_stakes     = false;
    cfg.initial_bankroll    = 5'000.0;
    cfg.flat_stake_fraction = 0.02;
    const std::vector<HistoricalGame> games{make_game("G1", "2024-04-01", 5, 3)};
    const std::vector<Pick> picks{ml_pick("G1", Side::Away, 2.0, 999.0)};
    const auto results = BacktestEngine(cfg).run(games, picks);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_DOUBLE_EQ(results[0].stake, 100.0);
    EXPECT_DOUBLE_EQ(results[0].profit, -100.0);
}

// ─── evaluate / summarize ────────────────────────────────────────────────────

TEST(BacktestEngine_Evaluate, SummaryCounts) {
    const std::vector<HistoricalGame> games{
        make_game("G1", "2024-04-01", 5, 3),
        make_game("G2", "2024-04-02", 2, 6),
        make_game("G3", "2024-04-03", 4, 4),
    };
    const std::vector<Pick> picks{
        ml_pick("G1", Side::Home),                // win +100
        ml_pick("G2", Side::Home),                // loss -100
        total_pick("G3", Side::Over, 8.0),        // push
        ml_pick("G4", Side::Home),                // unmatched
    };
    const auto s = BacktestEngine().evaluate(games, picks);
    EXPECT_EQ(s.total_bets, 3u);
    EXPECT_EQ(s.wins, 1u);
    EXPECT_EQ(s.losses, 1u);
    EXPECT_EQ(s.pushes, 1u);
    EXPECT_EQ(s.unmatched_picks, 1u);
    EXPECT_DOUBLE_EQ(s.win_rate, 0.5);
    EXPECT_DOUBLE_EQ(s.total_stake, 300.0);
    EXPECT_DOUBLE_EQ(s.total_profit, 0.0);
    EXPECT_DOUBLE_EQ(s.roi, 0.0);
    EXPECT_DOUBLE_EQ(s.final_bankroll, s.initial_bankroll);
    EXPECT_NEAR(s.max_drawdown, 100.0 / 10'100.0, 1e-12);
    ASSERT_EQ(s.by_market.count(MarketType::Moneyline), 1u);
    EXPECT_EQ(s.by_market.at(MarketType::Moneyline).bets, 2u);
    EXPECT_EQ(s.by_market.at(MarketType::Total).pushes, 1u);
}

TEST(BacktestEngine_Summarize, EdgeRealization) {
    const std::vector<HistoricalGame> games{make_game("G1", "2024-04-01", 5, 3),
                                            make_game("G2", "2024-04-02", 5, 3)};
    const std::vector<Pick> picks{ml_pick("G1", Side::Home), ml_pick("G2", Side::Away)};
    const auto s = BacktestEngine().evaluate(games, picks);
    EXPECT_DOUBLE_EQ(s.roi, 0.0);
    EXPECT_NEAR(s.avg_edge, 0.05, 1e-12);
    EXPECT_DOUBLE_EQ(s.edge_realization, 0.0);
    ASSERT_TRUE(s.sharpe_ratio.has_value());
    EXPECT_DOUBLE_EQ(*s.sharpe_ratio, 0.0);
}

TEST(BacktestEngine_Summarize, Empty_NoSharpe) {
    const auto s = BacktestEngine().summarize({});
    EXPECT_EQ(s.total_bets, 0u);
    EXPECT_FALSE(s.sharpe_ratio.has_value());
    EXPECT_DOUBLE_EQ(s.max_drawdown, 0.0);
    EXPECT_NE(s.to_string().find("n/a"), std::string::npos);
}

TEST(BacktestEngine_Summarize, DrawdownFollowsDateOrder) {
    const auto settled = [](std::string date, Outcome outcome, double profit) {
        BacktestResult r;
        r.pick    = ml_pick("G-" + date, Side::Home);
        r.game_id = r.pick.event_id;
        r.date    = std::move(date);
        r.outcome = outcome;
        r.stake   = 500.0;
        r.profit  = profit;
        r.roi     = profit / 500.0;
        return r;
    };
    BacktestConfig cfg;
    cfg.initial_bankroll = 1000.0;
    const BacktestEngine engine(cfg);

    const std::vector<BacktestResult> in_order{
        settled("2024-04-01", Outcome::Loss, -500.0),
        settled("2024-04-02", Outcome::Win, 500.0)};
    const std::vector<BacktestResult> reversed{in_order[1], in_order[0]};

    const auto a = engine.summarize(in_order);
    const auto b = engine.summarize(reversed);
    EXPECT_DOUBLE_EQ(a.max_drawdown, 0.5);
    EXPECT_DOUBLE_EQ(b.max_drawdown, 0.5);
    EXPECT_DOUBLE_EQ(b.final_bankroll, 1000.0);
}
