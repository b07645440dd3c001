#pragma once

/// @file include/mlbedge/risk_profile.hpp
/// @brief Immutable risk-appetite presets.
///
/// A RiskProfile is plain configuration.  It is passed explicitly into every
/// evaluator, stake engine and validator; switching appetite means building
/// a new set of components, never mutating shared state.

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mlbedge {

struct RiskProfile {
    std::string name;
    double      min_edge           = 0.03;
    double      min_confidence     = 0.60;
    double      kelly_fraction     = 0.25;
    double      max_stake_fraction = 0.05;
    std::size_t max_picks_per_day  = 5;
    std::string description;

    /// 0.04 / 0.65 / 0.20 / 0.03 / 3
    [[nodiscard]] static RiskProfile conservative();
    /// 0.03 / 0.60 / 0.25 / 0.05 / 5 (default)
    [[nodiscard]] static RiskProfile balanced();
    /// 0.02 / 0.55 / 0.33 / 0.05 / 8
    [[nodiscard]] static RiskProfile aggressive();

    /// Look up a preset by name ("conservative", "balanced", "aggressive").
    [[nodiscard]] static std::optional<RiskProfile> from_name(std::string_view name);

    [[nodiscard]] static std::vector<std::string_view> preset_names();

    [[nodiscard]] std::string to_string() const;
};

}  // namespace mlbedge
