/// @file src/staking/stake_engine.cpp
/// @brief Kelly fraction and StakeEngine implementation.

#include "mlbedge/staking.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace mlbedge::staking {

double kelly_fraction(double p, double decimal_odds) noexcept {
    if (!std::isfinite(p) || !std::isfinite(decimal_odds)) return 0.0;
    if (decimal_odds <= 1.0 || p <= 0.0) return 0.0;

    const double b = decimal_odds - 1.0;
    const double q = 1.0 - p;
    const double kelly = (b * p - q) / b;
    return kelly > 0.0 ? kelly : 0.0;
}

StakeEngine::StakeEngine(RiskProfile profile, StakingConfig config)
    : profile_(std::move(profile)), config_(config) {}

double StakeEngine::base_fraction(double p, double decimal_odds) const noexcept {
    const double kelly = kelly_fraction(p, decimal_odds);
    if (kelly <= 0.0) return 0.0;
    const double cap = std::max(profile_.max_stake_fraction, 0.0);
    return std::min(kelly * profile_.kelly_fraction, cap);
}

CorrelationStake
StakeEngine::correlation_multiplier(const Pick& pick,
                                    const std::optional<Pick>& correlated) const {
    if (pick.market != MarketType::Moneyline || !correlated ||
        correlated->market != MarketType::Total) {
        return {1.0, "No correlated market"};
    }
    if (correlated->side == Side::Over) {
        return {config_.paired_over_multiplier,
                "Positive moneyline/totals correlation (shared scoring dominance)"};
    }
    if (correlated->side == Side::Under) {
        return {config_.paired_under_multiplier,
                "Negative moneyline/totals correlation (pace suppression)"};
    }
    return {1.0, "No meaningful correlation detected"};
}

Pick StakeEngine::size_stake(Pick pick, double bankroll,
                             const std::optional<Pick>& correlated) const {
    const double market_mult = pick.market == MarketType::Total
                                   ? config_.totals_multiplier
                                   : config_.moneyline_multiplier;
    const auto corr = correlation_multiplier(pick, correlated);

    double fraction = base_fraction(pick.model_prob, pick.odds) *
                      std::clamp(market_mult, 0.0, 1.0) *
                      std::clamp(corr.multiplier, 0.0, 1.0);
    if (!std::isfinite(fraction)) fraction = 0.0;

    const double usable_bankroll =
        (std::isfinite(bankroll) && bankroll > 0.0) ? bankroll : 0.0;

    pick.stake_fraction = fraction;
    pick.stake_amount   = fraction * usable_bankroll;
    pick.stake_note     = corr.reason;
    return pick;
}

}  // namespace mlbedge::staking
