#pragma once

/// @file include/mlbedge/storage.hpp
/// @brief Pick persistence interface and its in-memory implementation.
///
/// # Module: PickStore
///
/// ## Responsibility
/// Keep every event and pick the pipeline emits, record settlements, and
/// answer aggregate performance queries over a filter.
///
/// ## Performance Stats
///   win rate = wins / (wins + losses)
///   ROI      = total profit / total stake over settled picks
///   averages (edge, confidence, odds) cover every pick matching the filter
///
/// ## NOT Responsible For
/// - Durable storage; `InMemoryPickStore` lives as long as the process
/// - Settling picks (see backtest.hpp)

#include "mlbedge/backtest.hpp"
#include "mlbedge/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace mlbedge::storage {

using PickId = std::size_t;

struct StoredEvent {
    std::string event_id;
    std::string date;
    std::string home_team;
    std::string away_team;
    std::string venue;
};

struct StoredPick {
    PickId            id = 0;
    Pick              pick;
    backtest::Outcome result = backtest::Outcome::Pending;
    double            profit = 0.0;
    std::string       actual_outcome;  ///< e.g. "5-3"
};

/// All fields optional; an empty filter matches everything.  Dates are
/// inclusive YYYY-MM-DD bounds on the pick date.
struct PerformanceFilter {
    std::optional<MarketType>  market;
    std::optional<std::string> start_date;
    std::optional<std::string> end_date;
};

struct PerformanceStats {
    std::size_t total_picks = 0;
    std::size_t wins        = 0;
    std::size_t losses      = 0;
    std::size_t pushes      = 0;
    std::size_t pending     = 0;
    double total_stake    = 0.0;
    double total_profit   = 0.0;
    double win_rate       = 0.0;
    double roi            = 0.0;
    double avg_edge       = 0.0;
    double avg_confidence = 0.0;
    double avg_odds       = 0.0;

    [[nodiscard]] std::string to_string() const;
};

// ─── PickStore ────────────────────────────────────────────────────────────────

class PickStore {
public:
    virtual ~PickStore() = default;

    /// Insert or replace the event keyed by `analysis.event_id`.
    virtual void save_event(const Analysis& analysis) = 0;

    /// Store a pick as Pending and return its id.
    virtual PickId save_pick(const Pick& pick) = 0;

    /// Record a settlement.  Returns false for an unknown id.
    virtual bool update_result(PickId id, backtest::Outcome result, double profit,
                               std::string actual_outcome = {}) = 0;

    [[nodiscard]] virtual PerformanceStats
    get_performance_stats(const PerformanceFilter& filter = {}) const = 0;
};

class InMemoryPickStore final : public PickStore {
public:
    void save_event(const Analysis& analysis) override;
    PickId save_pick(const Pick& pick) override;
    bool update_result(PickId id, backtest::Outcome result, double profit,
                       std::string actual_outcome = {}) override;

    [[nodiscard]] PerformanceStats
    get_performance_stats(const PerformanceFilter& filter = {}) const override;

    [[nodiscard]] std::optional<StoredEvent> event(const std::string& event_id) const;
    [[nodiscard]] std::optional<StoredPick> pick(PickId id) const;
    [[nodiscard]] std::size_t pick_count() const noexcept { return picks_.size(); }

private:
    std::map<std::string, StoredEvent> events_;
    std::vector<StoredPick>            picks_;  ///< Index = id − 1
};

/// Save every result's pick and its settlement.  Returns the new ids in
/// input order.
std::vector<PickId> record_results(PickStore& store,
                                   std::span<const backtest::BacktestResult> results);

}  // namespace mlbedge::storage
