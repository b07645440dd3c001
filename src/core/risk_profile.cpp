/// @file src/core/risk_profile.cpp
/// @brief RiskProfile presets.

#include "mlbedge/risk_profile.hpp"

#include <fmt/format.h>

namespace mlbedge {

RiskProfile RiskProfile::conservative() {
    return RiskProfile{
        .name               = "conservative",
        .min_edge           = 0.04,
        .min_confidence     = 0.65,
        .kelly_fraction     = 0.20,
        .max_stake_fraction = 0.03,
        .max_picks_per_day  = 3,
        .description        = "Fewer, higher-conviction picks with small stakes",
    };
}

RiskProfile RiskProfile::balanced() {
    return RiskProfile{
        .name               = "balanced",
        .min_edge           = 0.03,
        .min_confidence     = 0.60,
        .kelly_fraction     = 0.25,
        .max_stake_fraction = 0.05,
        .max_picks_per_day  = 5,
        .description        = "Quarter Kelly with a 5% cap",
    };
}

RiskProfile RiskProfile::aggressive() {
    return RiskProfile{
        .name               = "aggressive",
        .min_edge           = 0.02,
        .min_confidence     = 0.55,
        .kelly_fraction     = 0.33,
        .max_stake_fraction = 0.05,
        .max_picks_per_day  = 8,
        .description        = "More volume, one-third Kelly",
    };
}

std::optional<RiskProfile> RiskProfile::from_name(std::string_view name) {
    if (name == "conservative") return conservative();
    if (name == "balanced")     return balanced();
    if (name == "aggressive")   return aggressive();
    return std::nullopt;
}

std::vector<std::string_view> RiskProfile::preset_names() {
    return {"conservative", "balanced", "aggressive"};
}

std::string RiskProfile::to_string() const {
    return fmt::format(
        "{}: min_edge={:.1f}% min_conf={:.2f} kelly={:.2f} cap={:.1f}% max_picks={}",
        name, min_edge * 100.0, min_confidence, kelly_fraction,
        max_stake_fraction * 100.0, max_picks_per_day);
}

}  // namespace mlbedge
