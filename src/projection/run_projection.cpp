/// @file src/projection/run_projection.cpp
/// @brief RunProjectionModel implementation.

#include "mlbedge/projection.hpp"
#include "mlbedge/constants.hpp"

#include <algorithm>
#include <cmath>

namespace mlbedge::projection {

namespace {

constexpr double OPS_CLAMP_MIN = 0.3;
constexpr double OPS_CLAMP_MAX = 1.5;
constexpr double ERA_CLAMP_MIN = 0.5;
constexpr double ERA_CLAMP_MAX = 10.0;

/// Replace a non-finite value with `fallback`.
[[nodiscard]] double finite_or(double v, double fallback) noexcept {
    return std::isfinite(v) ? v : fallback;
}

}  // namespace

// ─── Factors ──────────────────────────────────────────────────────────────────

double RunProjectionModel::split_factor(const OffenseProfile& offense,
                                        Handedness opposing_throws) noexcept {
    const auto& ops_vs = opposing_throws == Handedness::Right ? offense.ops_vs_rhp
                                                              : offense.ops_vs_lhp;
    if (!ops_vs || !std::isfinite(*ops_vs)) return 1.0;

    const double split = std::clamp(*ops_vs, OPS_CLAMP_MIN, OPS_CLAMP_MAX);
    const double team  = std::clamp(finite_or(offense.ops_adjusted, constants::LEAGUE_OPS),
                                    OPS_CLAMP_MIN, OPS_CLAMP_MAX);

    const double combined =
        constants::WEIGHT_SPLIT * (split / constants::LEAGUE_OPS) +
        (1.0 - constants::WEIGHT_SPLIT) * (team / constants::LEAGUE_OPS);
    return std::clamp(combined, constants::SPLIT_FACTOR_MIN, constants::SPLIT_FACTOR_MAX);
}

double RunProjectionModel::recent_factor(const OffenseProfile& offense) noexcept {
    if (!offense.runs_last_30 || !std::isfinite(*offense.runs_last_30)) return 1.0;

    const double base  = finite_or(offense.runs_per_game.adjusted, constants::LEAGUE_RPG);
    const double ratio = *offense.runs_last_30 / std::max(base, constants::MIN_RUNS);
    return std::clamp(1.0 + constants::WEIGHT_RECENT_30 * (ratio - 1.0),
                      constants::RECENT_FACTOR_MIN, constants::RECENT_FACTOR_MAX);
}

double RunProjectionModel::pitcher_factor(const PitcherProfile& pitcher) noexcept {
    const double era = std::clamp(finite_or(pitcher.era.adjusted, constants::LEAGUE_ERA),
                                  ERA_CLAMP_MIN, ERA_CLAMP_MAX);
    const double factor =
        std::pow(era / constants::LEAGUE_ERA, constants::PITCHER_SENSITIVITY);
    return std::clamp(factor, constants::PITCHER_FACTOR_MIN, constants::PITCHER_FACTOR_MAX);
}

double RunProjectionModel::defense_factor(const DefenseProfile& defense) noexcept {
    const double epg = finite_or(defense.errors_per_game.adjusted,
                                 constants::LEAGUE_ERRORS_PER_GAME);
    const double f = 1.0 + constants::DEFENSE_SENSITIVITY *
                               (epg - constants::LEAGUE_ERRORS_PER_GAME);
    return std::clamp(f, constants::DEFENSE_FACTOR_MIN, constants::DEFENSE_FACTOR_MAX);
}

double RunProjectionModel::h2h_delta(const HeadToHeadRecord& h2h, bool is_home) noexcept {
    if (!(h2h.confidence > 0.0) || !std::isfinite(h2h.winrate_weighted)) return 0.0;
    const double adj =
        (h2h.winrate_weighted - 0.5) * constants::H2H_SENSITIVITY * h2h.confidence;
    return is_home ? adj : -adj;
}

// ─── Confidence ───────────────────────────────────────────────────────────────

const ConfidenceVector& RunProjectionModel::confidence_weights() noexcept {
    static const ConfidenceVector weights =
        (ConfidenceVector() << 0.40, 0.40, 0.10, 0.05, 0.05).finished();
    return weights;
}

double RunProjectionModel::combine_confidence(const ConfidenceVector& c) noexcept {
    const ConfidenceVector safe = c.unaryExpr([](double v) {
        return std::isfinite(v) ? std::clamp(v, 0.0, 1.0) : 0.0;
    });
    return std::clamp(confidence_weights().dot(safe),
                      constants::PROJECTION_CONFIDENCE_MIN,
                      constants::PROJECTION_CONFIDENCE_MAX);
}

// ─── Projection ───────────────────────────────────────────────────────────────

ProjectionBreakdown
RunProjectionModel::project_team(const OffenseProfile&   offense,
                                 const PitcherProfile&   opposing_pitcher,
                                 const DefenseProfile&   opposing_defense,
                                 const ContextRecord&    context,
                                 const HeadToHeadRecord& h2h,
                                 bool is_home) noexcept {
    ProjectionBreakdown b;
    b.base_rate       = std::max(finite_or(offense.runs_per_game.adjusted,
                                           constants::LEAGUE_RPG), 0.0);
    b.split_factor    = split_factor(offense, opposing_pitcher.throws);
    b.recent_factor   = recent_factor(offense);
    b.pitcher_factor  = pitcher_factor(opposing_pitcher);
    b.defense_factor  = defense_factor(opposing_defense);
    b.park_factor     = std::clamp(finite_or(context.park_factor, constants::DEFAULT_PARK_FACTOR),
                                   constants::PARK_FACTOR_MIN, constants::PARK_FACTOR_MAX);
    b.weather_delta   = finite_or(context.weather_runs, 0.0);
    b.fatigue_penalty = finite_or(context.fatigue_penalty, 0.0);
    b.h2h_delta       = h2h_delta(h2h, is_home);

    double mu = b.base_rate * b.split_factor * b.recent_factor *
                b.pitcher_factor * b.defense_factor;
    mu *= b.park_factor;
    mu += b.weather_delta;
    mu -= b.fatigue_penalty;
    mu += b.h2h_delta;
    b.mu = std::isfinite(mu) ? std::max(mu, constants::MIN_RUNS) : constants::MIN_RUNS;

    ConfidenceVector c;
    c << offense.runs_per_game.confidence,
         opposing_pitcher.era.confidence,
         opposing_defense.errors_per_game.confidence,
         context.confidence,
         h2h.confidence;
    b.confidence = combine_confidence(c);
    return b;
}

GameProjection RunProjectionModel::project_game(const GameMetrics& m) noexcept {
    GameProjection g;
    g.home = project_team(m.home.offense, m.away.starter, m.away.defense,
                          m.home.context, m.h2h, true);
    g.away = project_team(m.away.offense, m.home.starter, m.home.defense,
                          m.away.context, m.h2h, false);
    g.total      = g.home.mu + g.away.mu;
    g.confidence = 0.5 * (g.home.confidence + g.away.confidence);
    return g;
}

}  // namespace mlbedge::projection
