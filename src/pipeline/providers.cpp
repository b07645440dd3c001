/// @file src/pipeline/providers.cpp
/// @brief FakeOddsProvider and InMemoryStatsSource.

#include "mlbedge/interfaces.hpp"

#include <utility>

namespace mlbedge {

// ─── FakeOddsProvider ─────────────────────────────────────────────────────────

MarketOdds FakeOddsProvider::get_markets(const Analysis& analysis) const {
    MarketOdds out;
    out.moneyline = MoneylineMarket{prices_.ml_home, prices_.ml_away};

    // No total projection, no totals market.
    if (analysis.projections.total_runs) {
        out.total = TotalsMarket{prices_.total_line, prices_.over, prices_.under};
    }
    return out;
}

// ─── InMemoryStatsSource ──────────────────────────────────────────────────────

void InMemoryStatsSource::add_game(metrics::GameObservation game) {
    auto& slot = by_date_[game.date];
    slot.push_back(std::move(game));
}

std::vector<metrics::GameObservation>
InMemoryStatsSource::games_on(std::string_view date) const {
    const auto it = by_date_.find(date);
    if (it == by_date_.end()) return {};
    return it->second;
}

std::size_t InMemoryStatsSource::size() const noexcept {
    std::size_t n = 0;
    for (const auto& [date, games] : by_date_) n += games.size();
    return n;
}

}  // namespace mlbedge
