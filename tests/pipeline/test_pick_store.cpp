#include <gtest/gtest.h>
#include "mlbedge/log.hpp"
#include "mlbedge/storage.hpp"

#include <string>
#include <vector>

using namespace mlbedge;
using namespace mlbedge::storage;
using mlbedge::backtest::BacktestResult;
using mlbedge::backtest::Outcome;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static Pick stored_pick(std::string date, MarketType market, double stake,
                        double edge = 0.05, double odds = 2.0) {
    Pick p;
    p.event_id     = "G-" + date;
    p.date         = std::move(date);
    p.market       = market;
    p.side         = market == MarketType::Total ? Side::Over : Side::Home;
    p.odds         = odds;
    p.edge         = edge;
    p.confidence   = 0.7;
    p.stake_amount = stake;
    return p;
}

// ─── InMemoryPickStore ───────────────────────────────────────────────────────

TEST(InMemoryPickStore_SavePick, SequentialIds) {
    InMemoryPickStore store;
    EXPECT_EQ(store.save_pick(stored_pick("2024-04-01", MarketType::Moneyline, 100.0)), 1u);
    EXPECT_EQ(store.save_pick(stored_pick("2024-04-02", MarketType::Total, 50.0)), 2u);
    EXPECT_EQ(store.pick_count(), 2u);

    const auto p = store.pick(2);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->pick.market, MarketType::Total);
    EXPECT_EQ(p->result, Outcome::Pending);
    EXPECT_FALSE(store.pick(0).has_value());
    EXPECT_FALSE(store.pick(3).has_value());
}

TEST(InMemoryPickStore_SaveEvent, UpsertById) {
    InMemoryPickStore store;
    Analysis a;
    a.event_id = "G1";
    a.date     = "2024-04-01";
    a.teams    = Teams{"NYY", "BOS"};
    store.save_event(a);
    a.venue = "Yankee Stadium";
    store.save_event(a);

    const auto e = store.event("G1");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->home_team, "NYY");
    EXPECT_EQ(e->venue, "Yankee Stadium");
    EXPECT_FALSE(store.event("G2").has_value());
}

TEST(InMemoryPickStore_UpdateResult, UnknownId_False) {
    InMemoryPickStore store;
    EXPECT_FALSE(store.update_result(1, Outcome::Win, 100.0));
    const auto id = store.save_pick(stored_pick("2024-04-01", MarketType::Moneyline, 100.0));
    EXPECT_TRUE(store.update_result(id, Outcome::Win, 100.0, "5-3"));
    EXPECT_EQ(store.pick(id)->actual_outcome, "5-3");
}

TEST(InMemoryPickStore_Stats, SettledAndPending) {
    InMemoryPickStore store;
    const auto a = store.save_pick(stored_pick("2024-04-01", MarketType::Moneyline, 100.0, 0.04, 2.0));
    const auto b = store.save_pick(stored_pick("2024-04-02", MarketType::Moneyline, 100.0, 0.06, 1.8));
    const auto c = store.save_pick(stored_pick("2024-04-03", MarketType::Total, 50.0, 0.05, 1.9));
    store.save_pick(stored_pick("2024-04-04", MarketType::Total, 80.0, 0.05, 1.9));
    ASSERT_TRUE(store.update_result(a, Outcome::Win, 100.0));
    ASSERT_TRUE(store.update_result(b, Outcome::Loss, -100.0));
    ASSERT_TRUE(store.update_result(c, Outcome::Push, 0.0));

    const auto s = store.get_performance_stats();
    EXPECT_EQ(s.total_picks, 4u);
    EXPECT_EQ(s.wins, 1u);
    EXPECT_EQ(s.losses, 1u);
    EXPECT_EQ(s.pushes, 1u);
    EXPECT_EQ(s.pending, 1u);
    EXPECT_DOUBLE_EQ(s.total_stake, 250.0);
    EXPECT_DOUBLE_EQ(s.total_profit, 0.0);
    EXPECT_DOUBLE_EQ(s.win_rate, 0.5);
    EXPECT_NEAR(s.avg_edge, 0.05, 1e-12);
    EXPECT_NEAR(s.avg_odds, (2.0 + 1.8 + 1.9 + 1.9) / 4.0, 1e-12);
}

TEST(InMemoryPickStore_Stats, Filters) {
    InMemoryPickStore store;
    store.save_pick(stored_pick("2024-04-01", MarketType::Moneyline, 100.0));
    store.save_pick(stored_pick("2024-04-02", MarketType::Total, 100.0));
    store.save_pick(stored_pick("2024-04-03", MarketType::Moneyline, 100.0));

    PerformanceFilter by_market;
    by_market.market = MarketType::Moneyline;
    EXPECT_EQ(store.get_performance_stats(by_market).total_picks, 2u);

    PerformanceFilter by_date;
    by_date.start_date = "2024-04-02";
    by_date.end_date   = "2024-04-02";
    EXPECT_EQ(store.get_performance_stats(by_date).total_picks, 1u);
}

TEST(InMemoryPickStore_Stats, Empty_Zeroes) {
    const InMemoryPickStore store;
    const auto s = store.get_performance_stats();
    EXPECT_EQ(s.total_picks, 0u);
    EXPECT_DOUBLE_EQ(s.roi, 0.0);
    EXPECT_FALSE(s.to_string().empty());
}

// ─── record_results ──────────────────────────────────────────────────────────

TEST(Storage_RecordResults, SettledResultsUpdated) {
    BacktestResult win;
    win.pick       = stored_pick("2024-04-01", MarketType::Moneyline, 999.0);
    win.game_id    = "G1";
    win.outcome    = Outcome::Win;
    win.stake      = 100.0;
    win.profit     = 100.0;
    win.home_score = 5;
    win.away_score = 3;

    BacktestResult pending;
    pending.pick    = stored_pick("2024-04-02", MarketType::Total, 50.0);
    pending.outcome = Outcome::Pending;

    const std::vector<BacktestResult> results{win, pending};
    InMemoryPickStore store;
    const auto ids = record_results(store, results);
    ASSERT_EQ(ids.size(), 2u);

    const auto first = store.pick(ids[0]);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->result, Outcome::Win);
    EXPECT_DOUBLE_EQ(first->pick.stake_amount, 100.0);
    EXPECT_EQ(first->actual_outcome, "5-3");
    EXPECT_EQ(store.pick(ids[1])->result, Outcome::Pending);

    const auto s = store.get_performance_stats();
    EXPECT_DOUBLE_EQ(s.roi, 1.0);
}
