/// @file src/markets/totals.cpp
/// @brief TotalsEvaluator (Over/Under via logistic transform).

#include "mlbedge/markets.hpp"
#include "mlbedge/errors.hpp"
#include "mlbedge/odds.hpp"

#include <fmt/format.h>

#include <cmath>
#include <utility>

namespace mlbedge::markets {

double TotalsEvaluator::over_probability(double projected_total, double line) noexcept {
    return 1.0 / (1.0 + std::exp(-(projected_total - line)));
}

std::optional<Pick>
TotalsEvaluator::evaluate(const Analysis& analysis, double min_edge, double min_confidence) {
    const auto& proj = analysis.projections;
    std::optional<double> total = proj.total_runs;
    if (!total && proj.home_runs && proj.away_runs) total = *proj.home_runs + *proj.away_runs;

    if (!total || !std::isfinite(*total)) return std::nullopt;
    if (!analysis.market.total || !analysis.market.total->line) return std::nullopt;
    if (!analysis.confidence || !(*analysis.confidence >= min_confidence)) return std::nullopt;

    const auto& market = *analysis.market.total;
    const double line  = *market.line;
    if (!std::isfinite(line)) return std::nullopt;

    const double p_over  = over_probability(*total, line);
    const double p_under = 1.0 - p_over;

    std::optional<Pick> best;
    const auto consider = [&](Side side, const std::optional<OddsQuote>& quote, double p) {
        if (!quote) return;
        double price = 0.0;
        try {
            price = odds::normalize_to_decimal(*quote);
        } catch (const OddsError&) {
            return;  // this side's price is unusable
        }
        const double imp  = 1.0 / price;
        const double edge = odds::normalized_edge(p, imp);
        if (!(edge > 0.0) || edge < min_edge) return;
        if (best && !(edge > best->edge)) return;

        Pick pick;
        pick.event_id     = analysis.event_id;
        pick.date         = analysis.date;
        pick.market       = MarketType::Total;
        pick.side         = side;
        pick.line         = line;
        pick.odds         = price;
        pick.model_prob   = p;
        pick.implied_prob = imp;
        pick.edge         = edge;
        pick.confidence   = *analysis.confidence;
        pick.rationale    = fmt::format(
            "Projected total {:.2f} vs line {:.1f} ({:+.2f} runs), logistic P({})={:.3f}",
            *total, line, *total - line, mlbedge::to_string(side), p);
        best = std::move(pick);
    };

    consider(Side::Over, market.over, p_over);
    consider(Side::Under, market.under, p_under);
    return best;
}

}  // namespace mlbedge::markets
