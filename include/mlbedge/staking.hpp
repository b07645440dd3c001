#pragma once

/// @file include/mlbedge/staking.hpp
/// @brief Fractional-Kelly stake sizing with a hard cap and correlation haircut.
///
/// # Formula
///   b     = decimal_odds − 1
///   kelly = (b·p − q) / b,  q = 1 − p          (0 when ≤ 0)
///   f     = min(kelly × kelly_fraction, max_stake_fraction)
///           × market_multiplier × correlation_multiplier
///
/// Every multiplier is ≤ 1, so `f` never exceeds the profile's cap.
/// Invalid odds (≤ 1.0, non-finite) give a zero stake, never an exception.

#include "mlbedge/risk_profile.hpp"
#include "mlbedge/types.hpp"

#include <optional>
#include <string>

namespace mlbedge::staking {

struct StakingConfig {
    double moneyline_multiplier    = 1.00;
    double totals_multiplier       = 0.90;
    double paired_over_multiplier  = 0.75;  ///< Moneyline held alongside an Over
    double paired_under_multiplier = 0.70;  ///< Moneyline held alongside an Under
};

/// Full-Kelly fraction for a bet at `decimal_odds` won with probability `p`.
/// 0 for a non-positive edge or an invalid input.
[[nodiscard]] double kelly_fraction(double p, double decimal_odds) noexcept;

struct CorrelationStake {
    double      multiplier = 1.0;
    std::string reason;
};

class StakeEngine {
public:
    explicit StakeEngine(RiskProfile profile = RiskProfile::balanced(),
                         StakingConfig config = {});

    /// Copy of `pick` with stake fraction, amount and note populated.
    ///
    /// # Arguments
    /// * `bankroll`   : non-finite or negative bankroll stakes nothing
    /// * `correlated` : totals pick held on the same game, if any
    [[nodiscard]] Pick size_stake(Pick pick, double bankroll,
                                  const std::optional<Pick>& correlated = std::nullopt) const;

    /// Capped fractional-Kelly fraction before market/correlation multipliers.
    [[nodiscard]] double base_fraction(double p, double decimal_odds) const noexcept;

    [[nodiscard]] CorrelationStake
    correlation_multiplier(const Pick& pick, const std::optional<Pick>& correlated) const;

    [[nodiscard]] const RiskProfile& profile() const noexcept { return profile_; }

private:
    RiskProfile   profile_;
    StakingConfig config_;
};

}  // namespace mlbedge::staking
