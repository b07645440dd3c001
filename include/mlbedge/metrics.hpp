#pragma once

/// @file include/mlbedge/metrics.hpp
/// @brief Metric builders: partial raw observations → shrunk, flagged profiles.
///
/// # Module: Metric Builders
///
/// ## Responsibility
/// Turn whatever a statistics source managed to report for a team (every
/// field optional) into `MetricRecord`-based profiles.  Rates are blended
/// toward league priors with the Shrinkage Estimator; every missing or thin
/// input sets a `QualityFlag` and multiplies confidence down.
///
/// ## Confidence penalties (multiplicative, then floored)
///   pitcher : TBD 0.10 fixed | low ×0.60 | no-recent ×0.85 | no-FIP ×0.90 | fatigue ×0.80 (floor 0.05)
///   offense : low ×0.80 | no-recent ×0.90 | no-splits ×0.92 | estimated ×0.90 (floor 0.40)
///   defense : low ×0.85 | no-recent ×0.92 | no-advanced ×0.97 (floor 0.50)
///   bullpen : estimated ×0.85 | low ×0.80 | no-high-leverage ×0.95 | no-recent ×0.92 (floor 0.30)
///
/// Because every penalty is < 1 and the floor is applied last, confidence is
/// non-increasing as flags are added.
///
/// ## Guarantees
/// - Never throws; a missing observation yields a league-average record with
///   a fixed low confidence and `QualityFlag::NoTeamData` (or `PitcherTbd`)
/// - Context records are built per game and never cached
///
/// ## NOT Responsible For
/// - Fetching observations (see `StatsSource` in interfaces.hpp)
/// - Combining profiles into runs (see projection.hpp)

#include "mlbedge/types.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mlbedge::metrics {

// ─── Raw observations ─────────────────────────────────────────────────────────

/// Probable starter as reported.  An absent observation means TBD.
struct PitcherObservation {
    std::string name;
    std::optional<double> era;
    std::optional<double> innings;
    std::optional<double> fip;
    Handedness throws = Handedness::Right;
    std::optional<int> days_rest;
    bool has_recent_logs = false;
};

struct OffenseObservation {
    std::optional<double> runs_per_game;
    std::optional<double> games;
    std::optional<double> ops;
    std::optional<double> ops_vs_rhp;
    std::optional<double> ops_vs_lhp;
    std::optional<double> runs_last_30;
    bool estimated_from_aggregate = false;
};

struct DefenseObservation {
    std::optional<double> errors_per_game;
    std::optional<double> games;
    bool has_recent   = false;
    bool has_advanced = false;  ///< Defensive efficiency available
};

struct BullpenObservation {
    std::optional<double> era;
    std::optional<double> innings;
    bool estimated_from_team  = false;  ///< Innings derived from team totals
    bool has_high_leverage    = false;
    bool has_recent           = false;
};

/// One prior meeting, seen from the current home team.
struct HeadToHeadGame {
    int    seasons_ago = 0;      ///< 0 = current season
    bool   home_team_won = false;
    double run_margin = 0.0;     ///< Home team runs − away team runs
};

struct TeamObservation {
    std::string name;
    std::optional<OffenseObservation> offense;
    std::optional<PitcherObservation> starter;
    std::optional<DefenseObservation> defense;
    std::optional<BullpenObservation> bullpen;
    bool back_to_back = false;
};

/// Everything a statistics source knows about one scheduled game.
struct GameObservation {
    std::string event_id;
    std::string date;
    std::string venue;
    std::optional<double> temperature_c;
    std::optional<double> wind_kph;
    TeamObservation home;
    TeamObservation away;
    std::vector<HeadToHeadGame> head_to_head;
};

// ─── MetricBuilder ────────────────────────────────────────────────────────────

/// Stateless builders for every metric category.
class MetricBuilder {
public:
    [[nodiscard]] static PitcherProfile
    build_pitcher(const std::optional<PitcherObservation>& obs) noexcept;

    [[nodiscard]] static OffenseProfile
    build_offense(const std::optional<OffenseObservation>& obs) noexcept;

    [[nodiscard]] static DefenseProfile
    build_defense(const std::optional<DefenseObservation>& obs) noexcept;

    [[nodiscard]] static BullpenProfile
    build_bullpen(const std::optional<BullpenObservation>& obs) noexcept;

    /// Park factor, weather delta and back-to-back penalty for one team.
    ///
    /// # Formula
    ///   weather = (temp_c − 22)·0.005 + (wind_kph − 10)·0.002
    ///   confidence = 0.70 × 0.90 [no weather] × 0.95 [no park], in [0.4, 1]
    [[nodiscard]] static ContextRecord
    build_context(std::string_view venue,
                  std::optional<double> temperature_c,
                  std::optional<double> wind_kph,
                  bool back_to_back) noexcept;

    /// Season-decayed (1.0, 0.6, 0.4) head-to-head summary.  Meetings more
    /// than two seasons back are ignored.
    [[nodiscard]] static HeadToHeadRecord
    build_head_to_head(std::span<const HeadToHeadGame> games) noexcept;

    [[nodiscard]] static TeamMetrics
    build_team(const TeamObservation& team, const GameObservation& game) noexcept;

    [[nodiscard]] static GameMetrics build_game(const GameObservation& game) noexcept;

    /// Known venue park factor, or `nullopt` for an unknown venue.
    [[nodiscard]] static std::optional<double> park_factor(std::string_view venue) noexcept;

    /// Data-quality warning strings for `Analysis::flags`, e.g.
    /// `TBD_PITCHER`, `LOW_SAMPLE_PITCHER_<team>`, `NO_H2H_DATA`.
    [[nodiscard]] static std::vector<std::string>
    quality_warnings(const GameMetrics& metrics, const Teams& teams);
};

}  // namespace mlbedge::metrics
