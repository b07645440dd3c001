/// @file src/metrics/metric_builder.cpp
/// @brief Pitching, offense, defense and bullpen profile builders.

#include "mlbedge/metrics.hpp"
#include "mlbedge/constants.hpp"
#include "mlbedge/shrinkage.hpp"

#include <algorithm>
#include <cmath>

namespace mlbedge::metrics {

using shrinkage::ShrinkageEstimator;

namespace {

/// One multiplicative confidence penalty per flag.
struct Penalty {
    QualityFlag flag;
    double      factor;
};

constexpr Penalty PITCHER_PENALTIES[] = {
    {QualityFlag::LowSample,    0.60},
    {QualityFlag::NoRecentData, 0.85},
    {QualityFlag::NoFip,        0.90},
    {QualityFlag::Fatigue,      0.80},
};

constexpr Penalty OFFENSE_PENALTIES[] = {
    {QualityFlag::LowSample,              0.80},
    {QualityFlag::NoRecentData,           0.90},
    {QualityFlag::NoSplits,               0.92},
    {QualityFlag::EstimatedFromAggregate, 0.90},
};

constexpr Penalty DEFENSE_PENALTIES[] = {
    {QualityFlag::LowSample,         0.85},
    {QualityFlag::NoRecentData,      0.92},
    {QualityFlag::NoAdvancedMetrics, 0.97},
};

constexpr Penalty BULLPEN_PENALTIES[] = {
    {QualityFlag::EstimatedFromAggregate, 0.85},
    {QualityFlag::LowSample,              0.80},
    {QualityFlag::NoHighLeverage,         0.95},
    {QualityFlag::NoRecentData,           0.92},
};

constexpr double PITCHER_FLOOR = 0.05;
constexpr double OFFENSE_FLOOR = 0.40;
constexpr double DEFENSE_FLOOR = 0.50;
constexpr double BULLPEN_FLOOR = 0.30;

constexpr double TBD_PITCHER_CONFIDENCE = 0.10;

template <std::size_t N>
[[nodiscard]] double penalised_confidence(const QualityFlags& flags,
                                          const Penalty (&table)[N],
                                          double floor) noexcept {
    double conf = 1.0;
    for (const auto& p : table) {
        if (flags.test(p.flag)) conf *= p.factor;
    }
    return std::clamp(conf, floor, 1.0);
}

[[nodiscard]] double positive_or_zero(const std::optional<double>& v) noexcept {
    return (v && std::isfinite(*v) && *v > 0.0) ? *v : 0.0;
}

/// League-average record used when a category has no observation at all.
[[nodiscard]] MetricRecord league_record(MetricCategory category, double prior,
                                         double confidence, QualityFlag flag) noexcept {
    return MetricRecord{
        .category   = category,
        .observed   = prior,
        .sample     = 0.0,
        .prior      = prior,
        .adjusted   = prior,
        .confidence = confidence,
        .flags      = QualityFlags{flag},
    };
}

[[nodiscard]] MetricRecord shrunk_record(MetricCategory category, double observed,
                                         double sample, double prior,
                                         double prior_weight) noexcept {
    return MetricRecord{
        .category = category,
        .observed = observed,
        .sample   = sample,
        .prior    = prior,
        .adjusted = ShrinkageEstimator::adjust(observed, sample, prior, prior_weight),
    };
}

[[nodiscard]] bool is_tbd(const PitcherObservation& p) noexcept {
    if (!p.era || !std::isfinite(*p.era)) return true;
    const auto& n = p.name;
    return n.empty() || n == "TBD" || n == "tbd" || n == "Unknown" || n == "unknown";
}

}  // namespace

// ─── Pitching ─────────────────────────────────────────────────────────────────

PitcherProfile
MetricBuilder::build_pitcher(const std::optional<PitcherObservation>& obs) noexcept {
    if (!obs || is_tbd(*obs)) {
        PitcherProfile tbd;
        tbd.era = league_record(MetricCategory::Pitching, constants::LEAGUE_ERA,
                                TBD_PITCHER_CONFIDENCE, QualityFlag::PitcherTbd);
        if (obs) tbd.throws = obs->throws;
        return tbd;
    }

    const double ip = positive_or_zero(obs->innings);
    PitcherProfile out;
    out.throws    = obs->throws;
    out.days_rest = obs->days_rest;
    out.era = shrunk_record(MetricCategory::Pitching, *obs->era, ip,
                            constants::LEAGUE_ERA, constants::EB_INNINGS);

    auto& flags = out.era.flags;
    if (ip < constants::MIN_IP_CONFIDENT) flags.set(QualityFlag::LowSample);
    if (!obs->has_recent_logs)            flags.set(QualityFlag::NoRecentData);
    if (!obs->fip)                        flags.set(QualityFlag::NoFip);
    if (obs->days_rest && *obs->days_rest < constants::MIN_DAYS_REST) {
        flags.set(QualityFlag::Fatigue);
    }
    out.era.confidence = penalised_confidence(flags, PITCHER_PENALTIES, PITCHER_FLOOR);
    return out;
}

// ─── Offense ──────────────────────────────────────────────────────────────────

OffenseProfile
MetricBuilder::build_offense(const std::optional<OffenseObservation>& obs) noexcept {
    if (!obs || !obs->runs_per_game || !std::isfinite(*obs->runs_per_game)) {
        OffenseProfile none;
        none.runs_per_game = league_record(MetricCategory::Offense, constants::LEAGUE_RPG,
                                           OFFENSE_FLOOR, QualityFlag::NoTeamData);
        none.ops_adjusted = constants::LEAGUE_OPS;
        return none;
    }

    const double games = positive_or_zero(obs->games);
    OffenseProfile out;
    out.runs_per_game = shrunk_record(MetricCategory::Offense, *obs->runs_per_game,
                                      games, constants::LEAGUE_RPG, constants::EB_GAMES);
    out.ops_adjusted = obs->ops
        ? ShrinkageEstimator::adjust(*obs->ops, games, constants::LEAGUE_OPS,
                                     constants::EB_GAMES)
        : constants::LEAGUE_OPS;
    out.ops_vs_rhp   = obs->ops_vs_rhp;
    out.ops_vs_lhp   = obs->ops_vs_lhp;
    out.runs_last_30 = obs->runs_last_30;

    auto& flags = out.runs_per_game.flags;
    if (games < constants::MIN_GAMES_CONFIDENT)  flags.set(QualityFlag::LowSample);
    if (!obs->runs_last_30)                      flags.set(QualityFlag::NoRecentData);
    if (!obs->ops_vs_rhp || !obs->ops_vs_lhp)    flags.set(QualityFlag::NoSplits);
    if (obs->estimated_from_aggregate) flags.set(QualityFlag::EstimatedFromAggregate);
    out.runs_per_game.confidence =
        penalised_confidence(flags, OFFENSE_PENALTIES, OFFENSE_FLOOR);
    return out;
}

// ─── Defense ──────────────────────────────────────────────────────────────────

DefenseProfile
MetricBuilder::build_defense(const std::optional<DefenseObservation>& obs) noexcept {
    if (!obs || !obs->errors_per_game || !std::isfinite(*obs->errors_per_game)) {
        return DefenseProfile{
            league_record(MetricCategory::Defense, constants::LEAGUE_ERRORS_PER_GAME,
                          DEFENSE_FLOOR, QualityFlag::NoTeamData)};
    }

    const double games = positive_or_zero(obs->games);
    DefenseProfile out{
        shrunk_record(MetricCategory::Defense, *obs->errors_per_game, games,
                      constants::LEAGUE_ERRORS_PER_GAME, constants::EB_GAMES)};

    auto& flags = out.errors_per_game.flags;
    if (games < constants::MIN_GAMES_CONFIDENT) flags.set(QualityFlag::LowSample);
    if (!obs->has_recent)                       flags.set(QualityFlag::NoRecentData);
    if (!obs->has_advanced)                     flags.set(QualityFlag::NoAdvancedMetrics);
    out.errors_per_game.confidence =
        penalised_confidence(flags, DEFENSE_PENALTIES, DEFENSE_FLOOR);
    return out;
}

// ─── Bullpen ──────────────────────────────────────────────────────────────────

BullpenProfile
MetricBuilder::build_bullpen(const std::optional<BullpenObservation>& obs) noexcept {
    if (!obs || !obs->era || !std::isfinite(*obs->era)) {
        return BullpenProfile{
            league_record(MetricCategory::Bullpen, constants::LEAGUE_BULLPEN_ERA,
                          BULLPEN_FLOOR, QualityFlag::NoTeamData)};
    }

    const double ip = positive_or_zero(obs->innings);
    BullpenProfile out{shrunk_record(MetricCategory::Bullpen, *obs->era, ip,
                                     constants::LEAGUE_BULLPEN_ERA,
                                     constants::EB_INNINGS)};

    auto& flags = out.era.flags;
    if (obs->estimated_from_team) flags.set(QualityFlag::EstimatedFromAggregate);
    if (ip < constants::MIN_BULLPEN_IP_CONFIDENT) flags.set(QualityFlag::LowSample);
    if (!obs->has_high_leverage)  flags.set(QualityFlag::NoHighLeverage);
    if (!obs->has_recent)         flags.set(QualityFlag::NoRecentData);
    out.era.confidence = penalised_confidence(flags, BULLPEN_PENALTIES, BULLPEN_FLOOR);
    return out;
}

// ─── Team / game assembly ─────────────────────────────────────────────────────

TeamMetrics MetricBuilder::build_team(const TeamObservation& team,
                                      const GameObservation& game) noexcept {
    return TeamMetrics{
        .offense = build_offense(team.offense),
        .starter = build_pitcher(team.starter),
        .bullpen = build_bullpen(team.bullpen),
        .defense = build_defense(team.defense),
        .context = build_context(game.venue, game.temperature_c, game.wind_kph,
                                 team.back_to_back),
    };
}

GameMetrics MetricBuilder::build_game(const GameObservation& game) noexcept {
    return GameMetrics{
        .home = build_team(game.home, game),
        .away = build_team(game.away, game),
        .h2h  = build_head_to_head(game.head_to_head),
    };
}

std::vector<std::string>
MetricBuilder::quality_warnings(const GameMetrics& m, const Teams& teams) {
    std::vector<std::string> out;

    const auto per_team = [&out](const TeamMetrics& t, const std::string& name) {
        if (t.starter.era.flags.test(QualityFlag::LowSample))
            out.push_back("LOW_SAMPLE_PITCHER_" + name);
        if (t.starter.era.flags.test(QualityFlag::Fatigue))
            out.push_back("FATIGUE_" + name);
        if (t.offense.runs_per_game.flags.test(QualityFlag::LowSample))
            out.push_back("LOW_SAMPLE_OFFENSE_" + name);
        if (t.bullpen.era.flags.test(QualityFlag::NoTeamData))
            out.push_back("NO_BULLPEN_" + name);
        else if (t.bullpen.era.flags.test(QualityFlag::LowSample))
            out.push_back("LOW_SAMPLE_BULLPEN_" + name);
    };

    if (m.home.starter.era.flags.test(QualityFlag::PitcherTbd) ||
        m.away.starter.era.flags.test(QualityFlag::PitcherTbd)) {
        out.emplace_back("TBD_PITCHER");
    }
    per_team(m.home, teams.home);
    per_team(m.away, teams.away);

    if (m.home.offense.runs_per_game.flags.test(QualityFlag::NoRecentData) ||
        m.away.offense.runs_per_game.flags.test(QualityFlag::NoRecentData)) {
        out.emplace_back("NO_RECENT_OFFENSE");
    }
    if (m.home.offense.runs_per_game.flags.test(QualityFlag::NoSplits) ||
        m.away.offense.runs_per_game.flags.test(QualityFlag::NoSplits)) {
        out.emplace_back("NO_SPLITS_OFFENSE");
    }
    if (m.home.defense.errors_per_game.flags.test(QualityFlag::NoRecentData) ||
        m.away.defense.errors_per_game.flags.test(QualityFlag::NoRecentData)) {
        out.emplace_back("NO_DEF_RECENT");
    }

    if (m.h2h.flags.test(QualityFlag::NoHeadToHead)) {
        out.emplace_back("NO_H2H_DATA");
    } else if (m.h2h.flags.test(QualityFlag::LowSample)) {
        out.emplace_back("LOW_SAMPLE_H2H");
    }
    return out;
}

}  // namespace mlbedge::metrics
