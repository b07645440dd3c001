#pragma once

/// @file include/mlbedge/correlation.hpp
/// @brief Cross-market (moneyline ↔ totals) correlation adjuster.
///
/// Moneyline and totals edges on the same game are not independent signals.
/// The adjuster compares the projected total with the market line and
/// scales a moneyline pick's edge and confidence by (1 + boost):
///
///   delta = projected_total − line,  active only when |delta| > 0.6
///
///   favourite + high total : boost = min(+0.07,  0.04 + 0.02·delta)
///   favourite + low total  : boost = max(−0.07, −0.04 + 0.02·delta)
///   underdog  + low total  : boost = min(+0.07,  0.035 + 0.02·|delta|)
///   underdog  + high total : boost = max(−0.07, −0.04 − 0.02·delta)
///
/// A favourite is a positive-edge pick priced below 2.0 (decimal); an
/// underdog is priced at 2.0 or above.

#include "mlbedge/types.hpp"

#include <string>

namespace mlbedge::correlation {

struct CorrelationAdjustment {
    double edge_multiplier       = 1.0;
    double confidence_multiplier = 1.0;
    std::string reason;

    /// Boost actually applied (multiplier − 1).
    [[nodiscard]] double boost() const noexcept { return edge_multiplier - 1.0; }
};

class CorrelationAdjuster {
public:
    /// Neutral (multipliers 1.0, reason "No totals data available") when the
    /// analysis has no total projection or no totals line.
    [[nodiscard]] static CorrelationAdjustment
    adjust_for_correlation(const Pick& primary, const Analysis& analysis);

    [[nodiscard]] static bool is_favorite(const Pick& pick) noexcept;
    [[nodiscard]] static bool is_underdog(const Pick& pick) noexcept;
};

}  // namespace mlbedge::correlation
