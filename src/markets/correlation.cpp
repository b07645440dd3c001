/// @file src/markets/correlation.cpp
/// @brief CorrelationAdjuster implementation.

#include "mlbedge/correlation.hpp"
#include "mlbedge/constants.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <utility>

namespace mlbedge::correlation {

namespace {

constexpr double EVEN_MONEY = 2.0;

[[nodiscard]] std::optional<double> projected_total(const Analysis& a) noexcept {
    if (a.projections.total_runs) return a.projections.total_runs;
    if (a.projections.home_runs && a.projections.away_runs) {
        return *a.projections.home_runs + *a.projections.away_runs;
    }
    return std::nullopt;
}

}  // namespace

bool CorrelationAdjuster::is_favorite(const Pick& pick) noexcept {
    return pick.edge > 0.0 && pick.odds < EVEN_MONEY;
}

bool CorrelationAdjuster::is_underdog(const Pick& pick) noexcept {
    return pick.odds >= EVEN_MONEY;
}

CorrelationAdjustment
CorrelationAdjuster::adjust_for_correlation(const Pick& primary, const Analysis& analysis) {
    const auto total = projected_total(analysis);
    const std::optional<double> line =
        analysis.market.total ? analysis.market.total->line : std::nullopt;

    if (!total || !line || !std::isfinite(*total) || !std::isfinite(*line)) {
        return {1.0, 1.0, "No totals data available"};
    }

    const double delta    = *total - *line;
    const double band     = constants::CORRELATION_DEADBAND;
    const double max_up   = constants::CORRELATION_MAX_BOOST;
    const double max_down = constants::CORRELATION_MAX_PENALTY;

    double boost = 0.0;
    std::string reason = "Neutral moneyline/totals correlation";

    if (is_favorite(primary) && delta > band) {
        boost  = std::min(max_up, 0.04 + 0.02 * delta);
        reason = "Favorite aligned with high-scoring projection";
    } else if (is_favorite(primary) && delta < -band) {
        boost  = std::max(max_down, -0.04 + 0.02 * delta);
        reason = "Favorite in projected low-scoring game (higher variance)";
    } else if (is_underdog(primary) && delta < -band) {
        boost  = std::min(max_up, 0.035 + 0.02 * std::abs(delta));
        reason = "Underdog aligned with low-scoring projection";
    } else if (is_underdog(primary) && delta > band) {
        boost  = std::max(max_down, -0.04 - 0.02 * delta);
        reason = "Underdog in projected high-scoring game";
    }

    boost = std::clamp(boost, max_down, max_up);
    return {1.0 + boost, 1.0 + boost, std::move(reason)};
}

}  // namespace mlbedge::correlation
