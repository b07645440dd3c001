/// @file src/core/types.cpp
/// @brief String conversions for the shared record types.

#include "mlbedge/types.hpp"

#include <fmt/format.h>

namespace mlbedge {

std::string_view to_string(QualityFlag flag) noexcept {
    switch (flag) {
        case QualityFlag::LowSample:              return "low_sample";
        case QualityFlag::NoRecentData:           return "no_recent_data";
        case QualityFlag::EstimatedFromAggregate: return "estimated_from_aggregate";
        case QualityFlag::NoSplits:               return "no_splits";
        case QualityFlag::NoFip:                  return "no_fip";
        case QualityFlag::PitcherTbd:             return "pitcher_tbd";
        case QualityFlag::Fatigue:                return "fatigue";
        case QualityFlag::NoHighLeverage:         return "no_high_leverage";
        case QualityFlag::NoTeamData:             return "no_team_data";
        case QualityFlag::NoAdvancedMetrics:      return "no_advanced_metrics";
        case QualityFlag::NoWeather:              return "no_weather";
        case QualityFlag::NoParkFactor:           return "no_park_factor";
        case QualityFlag::NoHeadToHead:           return "no_data";
    }
    return "unknown";
}

std::vector<std::string_view> QualityFlags::names() const {
    std::vector<std::string_view> out;
    for (unsigned i = 0; i <= static_cast<unsigned>(QualityFlag::NoHeadToHead); ++i) {
        const auto f = static_cast<QualityFlag>(i);
        if (test(f)) out.push_back(to_string(f));
    }
    return out;
}

std::string_view to_string(MetricCategory category) noexcept {
    switch (category) {
        case MetricCategory::Pitching: return "pitching";
        case MetricCategory::Offense:  return "offense";
        case MetricCategory::Defense:  return "defense";
        case MetricCategory::Bullpen:  return "bullpen";
    }
    return "unknown";
}

std::string_view to_string(MarketType market) noexcept {
    switch (market) {
        case MarketType::Moneyline: return "moneyline";
        case MarketType::Total:     return "total";
    }
    return "unknown";
}

std::string_view to_string(Side side) noexcept {
    switch (side) {
        case Side::Home:  return "home";
        case Side::Away:  return "away";
        case Side::Over:  return "over";
        case Side::Under: return "under";
    }
    return "unknown";
}

std::string ProjectionBreakdown::to_string() const {
    return fmt::format(
        "mu={:.2f} (base={:.2f} split={:.3f} recent={:.3f} pitcher={:.3f} "
        "defense={:.3f} park={:.2f} weather={:+.2f} fatigue={:.2f} h2h={:+.3f}) "
        "conf={:.2f}",
        mu, base_rate, split_factor, recent_factor, pitcher_factor,
        defense_factor, park_factor, weather_delta, fatigue_penalty, h2h_delta,
        confidence);
}

std::string Pick::to_string() const {
    const std::string label =
        market == MarketType::Total
            ? fmt::format("{} {:.1f}", mlbedge::to_string(side), line.value_or(0.0))
            : fmt::format("{} ({})", team, mlbedge::to_string(side));
    return fmt::format(
        "{} {:<9} {:<22} @ {:.2f}  p={:.3f} imp={:.3f} edge={:+.1f}% "
        "conf={:.2f} stake={:.2f}% (${:.2f})",
        event_id, mlbedge::to_string(market), label, odds, model_prob,
        implied_prob, edge * 100.0, confidence, stake_fraction * 100.0,
        stake_amount);
}

}  // namespace mlbedge
