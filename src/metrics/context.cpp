/// @file src/metrics/context.cpp
/// @brief Game context (park, weather, fatigue) and head-to-head builders.

#include "mlbedge/metrics.hpp"
#include "mlbedge/constants.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <utility>

namespace mlbedge::metrics {

namespace {

constexpr std::array<std::pair<std::string_view, double>, 7> PARK_FACTORS{{
    {"Coors Field",      1.34},
    {"Fenway Park",      1.12},
    {"Globe Life Field", 1.10},
    {"Oakland Coliseum", 0.94},
    {"Dodger Stadium",   1.01},
    {"Petco Park",       0.92},
    {"Yankee Stadium",   1.08},
}};

constexpr double NO_WEATHER_PENALTY = 0.90;
constexpr double NO_PARK_PENALTY    = 0.95;
constexpr double CONTEXT_CONF_FLOOR = 0.40;

constexpr std::array<double, 3> SEASON_DECAY{1.0, 0.6, 0.4};
constexpr double H2H_LOW_SAMPLE_PENALTY = 0.65;

}  // namespace

// ─── Context ──────────────────────────────────────────────────────────────────

std::optional<double> MetricBuilder::park_factor(std::string_view venue) noexcept {
    for (const auto& [name, factor] : PARK_FACTORS) {
        if (name == venue) return factor;
    }
    return std::nullopt;
}

ContextRecord MetricBuilder::build_context(std::string_view venue,
                                           std::optional<double> temperature_c,
                                           std::optional<double> wind_kph,
                                           bool back_to_back) noexcept {
    ContextRecord out;
    double conf = constants::CONTEXT_BASE_CONFIDENCE;

    if (const auto pf = park_factor(venue)) {
        out.park_factor = *pf;
    } else {
        out.park_factor = constants::DEFAULT_PARK_FACTOR;
        out.flags.set(QualityFlag::NoParkFactor);
        conf *= NO_PARK_PENALTY;
    }

    const bool has_temp = temperature_c && std::isfinite(*temperature_c);
    const bool has_wind = wind_kph && std::isfinite(*wind_kph);
    if (has_temp || has_wind) {
        // A missing component sits at its neutral value and contributes 0.
        const double t = has_temp ? *temperature_c : constants::WEATHER_TEMP_NEUTRAL_C;
        const double w = has_wind ? *wind_kph : constants::WEATHER_WIND_NEUTRAL_KPH;
        out.weather_runs =
            (t - constants::WEATHER_TEMP_NEUTRAL_C) * constants::WEATHER_RUNS_PER_DEGREE +
            (w - constants::WEATHER_WIND_NEUTRAL_KPH) * constants::WEATHER_RUNS_PER_KPH;
    } else {
        out.flags.set(QualityFlag::NoWeather);
        conf *= NO_WEATHER_PENALTY;
    }

    if (back_to_back) {
        out.fatigue_penalty = constants::BACK_TO_BACK_PENALTY;
        out.flags.set(QualityFlag::Fatigue);
    }

    out.confidence = std::clamp(conf, CONTEXT_CONF_FLOOR, 1.0);
    return out;
}

// ─── Head-to-head ─────────────────────────────────────────────────────────────

HeadToHeadRecord
MetricBuilder::build_head_to_head(std::span<const HeadToHeadGame> games) noexcept {
    double weighted_games  = 0.0;
    double weighted_wins   = 0.0;
    double weighted_margin = 0.0;
    std::size_t counted    = 0;

    for (const auto& g : games) {
        if (g.seasons_ago < 0 ||
            g.seasons_ago >= static_cast<int>(SEASON_DECAY.size()) ||
            !std::isfinite(g.run_margin)) {
            continue;
        }
        const double w = SEASON_DECAY[static_cast<std::size_t>(g.seasons_ago)];
        weighted_games  += w;
        weighted_wins   += g.home_team_won ? w : 0.0;
        weighted_margin += w * g.run_margin;
        ++counted;
    }

    HeadToHeadRecord out;
    if (counted == 0 || weighted_games <= 0.0) {
        out.confidence = constants::H2H_BASE_CONFIDENCE * 0.5;
        out.flags.set(QualityFlag::NoHeadToHead);
        return out;
    }

    out.games            = counted;
    out.winrate_weighted = weighted_wins / weighted_games;
    out.margin_weighted  = weighted_margin / weighted_games;
    out.confidence       = constants::H2H_BASE_CONFIDENCE;
    if (counted < constants::H2H_LOW_SAMPLE_GAMES) {
        out.flags.set(QualityFlag::LowSample);
        out.confidence *= H2H_LOW_SAMPLE_PENALTY;
    }
    return out;
}

}  // namespace mlbedge::metrics
