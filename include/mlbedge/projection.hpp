#pragma once

/// @file include/mlbedge/projection.hpp
/// @brief Run Projection Model: expected runs per team per game.
///
/// # Module: Run Projection
///
/// ## Formula
///   mu = base_rpg
///        × split_factor × recent_factor × pitcher_factor × defense_factor
///        × park_factor
///        + weather_delta − fatigue_penalty ± h2h_delta
///   mu = max(mu, MIN_RUNS)
///
/// where
///   split   = clamp(0.6·(ops_vs_hand/0.715) + 0.4·(ops_team/0.715), 0.6, 1.4)
///   recent  = clamp(1 + 0.2·(r30/base − 1), 0.7, 1.3)
///   pitcher = clamp((era_adj/4.30)^α, 0.6, 1.7)
///   defense = clamp(1 + 0.25·(errors_pg_adj − 0.55), 0.8, 1.2)
///   park    = clamp(park_factor, 0.8, 1.4)
///   h2h     = (winrate − 0.5)·0.05·h2h_confidence   (+home / −away)
///
/// Missing optional signals fall back to the neutral value (1.0 or 0.0).
///
/// ## Confidence
///   conf = w · c,  w = (0.40, 0.40, 0.10, 0.05, 0.05)
///   c = (offense, pitcher, defense, context, h2h), result clamped to [0.2, 1.0]
///
/// ## Guarantees
/// - `mu >= MIN_RUNS` and finite for every input
/// - Pure, no side effects

#include "mlbedge/types.hpp"

#include <Eigen/Core>

namespace mlbedge::projection {

/// Per-input confidences in the order offense, pitcher, defense, context, h2h.
using ConfidenceVector = Eigen::Matrix<double, 5, 1>;

/// Both teams' projections for one game.
struct GameProjection {
    ProjectionBreakdown home;
    ProjectionBreakdown away;
    double total      = 0.0;  ///< home.mu + away.mu
    double confidence = 0.0;  ///< Mean of the two team confidences
};

/// Stateless run projection model.
class RunProjectionModel {
public:
    [[nodiscard]] static ProjectionBreakdown
    project_team(const OffenseProfile&   offense,
                 const PitcherProfile&   opposing_pitcher,
                 const DefenseProfile&   opposing_defense,
                 const ContextRecord&    context,
                 const HeadToHeadRecord& h2h,
                 bool is_home) noexcept;

    /// Project both sides.  The home offense faces the away starter and
    /// defense, and vice versa.
    [[nodiscard]] static GameProjection project_game(const GameMetrics& metrics) noexcept;

    // ── Individual factors (exposed for testing) ─────────────────────────────

    /// 1.0 when no split against `opposing_throws` is known.
    [[nodiscard]] static double split_factor(const OffenseProfile& offense,
                                             Handedness opposing_throws) noexcept;
    [[nodiscard]] static double recent_factor(const OffenseProfile& offense) noexcept;
    [[nodiscard]] static double pitcher_factor(const PitcherProfile& pitcher) noexcept;
    [[nodiscard]] static double defense_factor(const DefenseProfile& defense) noexcept;
    [[nodiscard]] static double h2h_delta(const HeadToHeadRecord& h2h, bool is_home) noexcept;

    [[nodiscard]] static double combine_confidence(const ConfidenceVector& c) noexcept;

    /// Fixed blend weights applied by `combine_confidence`.
    [[nodiscard]] static const ConfidenceVector& confidence_weights() noexcept;
};

}  // namespace mlbedge::projection
