/// @file src/backtest/backtester.cpp
/// @brief Implementation of the BacktestEngine.
///
/// The engine orchestrates:
///   1. Matching picks to historical games by id
///   2. Market-specific settlement and profit
///   3. Date-ordered bankroll replay
///   4. Summary statistics via PerformanceCalculator

#include "mlbedge/backtest.hpp"
#include "mlbedge/log.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace mlbedge::backtest {

// ─── Enum / record formatting ─────────────────────────────────────────────────

std::string_view to_string(Outcome outcome) noexcept {
    switch (outcome) {
        case Outcome::Win:     return "WIN";
        case Outcome::Loss:    return "LOSS";
        case Outcome::Push:    return "PUSH";
        case Outcome::Pending: return "PENDING";
    }
    return "UNKNOWN";
}

Winner HistoricalGame::winner() const noexcept {
    if (home_score > away_score) return Winner::Home;
    if (away_score > home_score) return Winner::Away;
    return Winner::None;
}

std::string BacktestResult::to_string() const {
    return fmt::format("{} {} {:<9} {:<6} {:>7} stake={:.2f} profit={:+.2f} ({}-{})",
                       date, game_id, mlbedge::to_string(pick.market),
                       mlbedge::to_string(pick.side), backtest::to_string(outcome),
                       stake, profit, home_score, away_score);
}

std::string BacktestSummary::to_string() const {
    std::string out = fmt::format(
        "=== Backtest Summary ===\n"
        "Bets:             {} ({}W / {}L / {}P, {} pending, {} unmatched)\n"
        "Win rate:         {:.1f}%\n"
        "Total stake:      ${:.2f}\n"
        "Total profit:     ${:+.2f}\n"
        "ROI:              {:+.2f}%\n"
        "Bankroll:         ${:.2f} -> ${:.2f}\n"
        "Max drawdown:     {:.1f}%\n",
        total_bets, wins, losses, pushes, pending, unmatched_picks,
        win_rate * 100.0, total_stake, total_profit, roi * 100.0,
        initial_bankroll, final_bankroll, max_drawdown * 100.0);

    if (sharpe_ratio) {
        out += fmt::format("Sharpe ratio:     {:.2f}\n", *sharpe_ratio);
    } else {
        out += "Sharpe ratio:     n/a\n";
    }
    out += fmt::format(
        "Avg model edge:   {:.2f}%\n"
        "Realized edge:    {:+.2f}%\n"
        "Edge realization: {:.1f}%\n",
        avg_edge * 100.0, realized_edge * 100.0, edge_realization * 100.0);

    for (const auto& [market, s] : by_market) {
        out += fmt::format("  {:<9} bets={} W={} L={} P={} staked=${:.2f} profit=${:+.2f}\n",
                           mlbedge::to_string(market), s.bets, s.wins, s.losses,
                           s.pushes, s.staked, s.profit);
    }
    return out;
}

// ─── BacktestEngine ───────────────────────────────────────────────────────────

BacktestEngine::BacktestEngine(BacktestConfig config) : config_(config) {}

Outcome BacktestEngine::settle(const Pick& pick, const HistoricalGame& game) noexcept {
    if (!game.is_final()) return Outcome::Pending;

    if (pick.market == MarketType::Moneyline) {
        if (pick.side != Side::Home && pick.side != Side::Away) return Outcome::Pending;
        const Winner w = game.winner();
        if (w == Winner::None) return Outcome::Push;
        const bool home_pick = pick.side == Side::Home;
        return (home_pick == (w == Winner::Home)) ? Outcome::Win : Outcome::Loss;
    }

    if (pick.market == MarketType::Total) {
        if (!pick.line || !std::isfinite(*pick.line)) return Outcome::Pending;
        const double total = static_cast<double>(game.total_runs());
        const double line  = *pick.line;
        if (total == line) return Outcome::Push;
        if (pick.side == Side::Over)  return total > line ? Outcome::Win : Outcome::Loss;
        if (pick.side == Side::Under) return total < line ? Outcome::Win : Outcome::Loss;
    }
    return Outcome::Pending;
}

double BacktestEngine::profit(Outcome outcome, double stake, double odds) noexcept {
    switch (outcome) {
        case Outcome::Win:  return stake * (odds - 1.0);
        case Outcome::Loss: return -stake;
        default:            return 0.0;
    }
}

double BacktestEngine::stake_for(const Pick& pick) const noexcept {
    if (!config_.use_pick_stakes) {
        return config_.initial_bankroll * config_.flat_stake_fraction;
    }
    return (std::isfinite(pick.stake_amount) && pick.stake_amount > 0.0)
               ? pick.stake_amount
               : 0.0;
}

std::vector<BacktestResult>
BacktestEngine::run(std::span<const HistoricalGame> games,
                    std::span<const Pick> picks) const {
    log::info("Running backtest: {} picks, {} games", picks.size(), games.size());

    std::unordered_map<std::string, const HistoricalGame*> index;
    index.reserve(games.size());
    for (const auto& g : games) index.emplace(g.game_id, &g);

    std::vector<BacktestResult> results;
    results.reserve(picks.size());
    std::size_t unmatched = 0;

    for (const auto& pick : picks) {
        const auto it = index.find(pick.event_id);
        if (it == index.end()) {
            ++unmatched;
            log::warn("No game found for pick: {} | {} | {} | {}",
                      mlbedge::to_string(pick.market), pick.team, pick.event_id, pick.date);
            continue;
        }
        const HistoricalGame& game = *it->second;

        if (!std::isfinite(pick.odds) || pick.odds <= 1.0) {
            log::warn("Skipping pick on {} with invalid odds {}", game.game_id, pick.odds);
            continue;
        }

        BacktestResult r;
        r.pick       = pick;
        r.game_id    = game.game_id;
        r.date       = game.date.empty() ? pick.date : game.date;
        r.outcome    = settle(pick, game);
        r.stake      = r.outcome == Outcome::Pending ? 0.0 : stake_for(pick);
        r.profit     = profit(r.outcome, r.stake, pick.odds);
        r.roi        = r.stake > 0.0 ? r.profit / r.stake : 0.0;
        r.home_score = game.home_score;
        r.away_score = game.away_score;
        results.push_back(std::move(r));
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const BacktestResult& a, const BacktestResult& b) {
                         return a.date < b.date;
                     });

    log::info("Backtest complete: {} matched, {} unmatched", results.size(), unmatched);
    return results;
}

BacktestSummary BacktestEngine::summarize(std::span<const BacktestResult> results,
                                          std::size_t unmatched_picks) const {
    BacktestSummary s;
    s.initial_bankroll = config_.initial_bankroll;
    s.final_bankroll   = config_.initial_bankroll;
    s.unmatched_picks  = unmatched_picks;

    // Bankroll and drawdown follow settlement order, whatever order the caller used.
    std::vector<const BacktestResult*> ordered;
    ordered.reserve(results.size());
    for (const auto& r : results) ordered.push_back(&r);
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const BacktestResult* a, const BacktestResult* b) {
                         return a->date < b->date;
                     });

    std::vector<double> profits;
    std::vector<double> rois;
    double edge_sum = 0.0;

    for (const BacktestResult* rp : ordered) {
        const BacktestResult& r = *rp;
        auto& m = s.by_market[r.pick.market];
        ++m.bets;
        ++s.total_bets;
        switch (r.outcome) {
            case Outcome::Win:     ++s.wins;   ++m.wins;   break;
            case Outcome::Loss:    ++s.losses; ++m.losses; break;
            case Outcome::Push:    ++s.pushes; ++m.pushes; break;
            case Outcome::Pending: ++s.pending; continue;
        }
        m.staked += r.stake;
        m.profit += r.profit;
        s.total_stake  += r.stake;
        s.total_profit += r.profit;
        edge_sum += std::isfinite(r.pick.edge) ? r.pick.edge : 0.0;
        profits.push_back(r.profit);
        rois.push_back(r.roi);
    }

    const std::size_t decided = s.wins + s.losses;
    const std::size_t settled = decided + s.pushes;
    s.win_rate = decided > 0 ? static_cast<double>(s.wins) / static_cast<double>(decided) : 0.0;
    s.roi      = s.total_stake > 0.0 ? s.total_profit / s.total_stake : 0.0;
    s.avg_edge = settled > 0 ? edge_sum / static_cast<double>(settled) : 0.0;
    s.realized_edge    = s.roi;
    s.edge_realization = s.avg_edge > 0.0 ? s.roi / s.avg_edge : 0.0;

    const auto bankroll = PerformanceCalculator::bankroll_series(config_.initial_bankroll, profits);
    s.final_bankroll = bankroll.back();
    s.max_drawdown   = PerformanceCalculator::max_drawdown(bankroll).value_or(0.0);
    s.sharpe_ratio   = PerformanceCalculator::sharpe(rois, config_.bets_per_year);
    return s;
}

BacktestSummary BacktestEngine::evaluate(std::span<const HistoricalGame> games,
                                         std::span<const Pick> picks) const {
    const auto results = run(games, picks);

    std::unordered_set<std::string_view> known;
    for (const auto& g : games) known.insert(g.game_id);
    const auto unmatched = static_cast<std::size_t>(std::count_if(
        picks.begin(), picks.end(),
        [&known](const Pick& p) { return !known.contains(p.event_id); }));

    return summarize(results, unmatched);
}

}  // namespace mlbedge::backtest
