/// @file src/pipeline/pick_store.cpp
/// @brief InMemoryPickStore and backtest result recording.

#include "mlbedge/storage.hpp"
#include "mlbedge/log.hpp"

#include <fmt/format.h>

#include <cmath>
#include <utility>

namespace mlbedge::storage {

namespace {

[[nodiscard]] bool matches(const Pick& p, const PerformanceFilter& f) {
    if (f.market && p.market != *f.market) return false;
    if (f.start_date && p.date < *f.start_date) return false;
    if (f.end_date && p.date > *f.end_date) return false;
    return true;
}

[[nodiscard]] double finite_or_zero(double v) noexcept {
    return std::isfinite(v) ? v : 0.0;
}

}  // namespace

std::string PerformanceStats::to_string() const {
    return fmt::format(
        "picks={} W={} L={} P={} pending={} staked={:.2f} profit={:+.2f} "
        "win_rate={:.1f}% roi={:+.2f}% avg_edge={:.2f}% avg_conf={:.3f} avg_odds={:.2f}",
        total_picks, wins, losses, pushes, pending, total_stake, total_profit,
        win_rate * 100.0, roi * 100.0, avg_edge * 100.0, avg_confidence, avg_odds);
}

// ─── InMemoryPickStore ────────────────────────────────────────────────────────

void InMemoryPickStore::save_event(const Analysis& analysis) {
    events_[analysis.event_id] = StoredEvent{analysis.event_id, analysis.date,
                                             analysis.teams.home, analysis.teams.away,
                                             analysis.venue};
}

PickId InMemoryPickStore::save_pick(const Pick& pick) {
    StoredPick stored;
    stored.id   = picks_.size() + 1;
    stored.pick = pick;
    picks_.push_back(std::move(stored));
    return picks_.back().id;
}

bool InMemoryPickStore::update_result(PickId id, backtest::Outcome result, double profit,
                                      std::string actual_outcome) {
    if (id == 0 || id > picks_.size()) return false;
    auto& stored = picks_[id - 1];
    stored.result         = result;
    stored.profit         = finite_or_zero(profit);
    stored.actual_outcome = std::move(actual_outcome);
    return true;
}

PerformanceStats InMemoryPickStore::get_performance_stats(const PerformanceFilter& filter) const {
    PerformanceStats s;
    double edge_sum = 0.0;
    double conf_sum = 0.0;
    double odds_sum = 0.0;

    for (const auto& stored : picks_) {
        if (!matches(stored.pick, filter)) continue;
        ++s.total_picks;
        edge_sum += finite_or_zero(stored.pick.edge);
        conf_sum += finite_or_zero(stored.pick.confidence);
        odds_sum += finite_or_zero(stored.pick.odds);

        switch (stored.result) {
            case backtest::Outcome::Win:     ++s.wins;    break;
            case backtest::Outcome::Loss:    ++s.losses;  break;
            case backtest::Outcome::Push:    ++s.pushes;  break;
            case backtest::Outcome::Pending: ++s.pending; continue;
        }
        s.total_stake  += finite_or_zero(stored.pick.stake_amount);
        s.total_profit += stored.profit;
    }

    if (s.total_picks == 0) return s;

    const auto n       = static_cast<double>(s.total_picks);
    const auto decided = s.wins + s.losses;
    s.win_rate       = decided > 0 ? static_cast<double>(s.wins) / static_cast<double>(decided) : 0.0;
    s.roi            = s.total_stake > 0.0 ? s.total_profit / s.total_stake : 0.0;
    s.avg_edge       = edge_sum / n;
    s.avg_confidence = conf_sum / n;
    s.avg_odds       = odds_sum / n;
    return s;
}

std::optional<StoredEvent> InMemoryPickStore::event(const std::string& event_id) const {
    const auto it = events_.find(event_id);
    if (it == events_.end()) return std::nullopt;
    return it->second;
}

std::optional<StoredPick> InMemoryPickStore::pick(PickId id) const {
    if (id == 0 || id > picks_.size()) return std::nullopt;
    return picks_[id - 1];
}

// ─── Backtest bridge ──────────────────────────────────────────────────────────

std::vector<PickId> record_results(PickStore& store,
                                   std::span<const backtest::BacktestResult> results) {
    std::vector<PickId> ids;
    ids.reserve(results.size());
    for (const auto& r : results) {
        Pick settled         = r.pick;
        settled.stake_amount = r.stake;
        const PickId id = store.save_pick(settled);
        if (r.outcome != backtest::Outcome::Pending &&
            !store.update_result(id, r.outcome, r.profit,
                                 fmt::format("{}-{}", r.home_score, r.away_score))) {
            log::warn("Could not record result for pick {} on {}", id, r.game_id);
        }
        ids.push_back(id);
    }
    return ids;
}

}  // namespace mlbedge::storage
