/// @file src/markets/moneyline.cpp
/// @brief Data-quality penalty and MoneylineEvaluator.

#include "mlbedge/markets.hpp"
#include "mlbedge/constants.hpp"
#include "mlbedge/errors.hpp"
#include "mlbedge/odds.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <string_view>
#include <utility>

namespace mlbedge::markets {

namespace {

constexpr std::array<std::string_view, 3> QUALITY_MARKERS{"LOW_SAMPLE", "NO_H2H", "NO_RECENT"};

struct SideQuote {
    Side        side;
    std::string team;
    double      odds;
    double      model_prob;
    double      implied_prob;
    double      edge;
};

}  // namespace

// ─── Data-quality penalty ─────────────────────────────────────────────────────

std::size_t count_quality_flags(std::span<const std::string> flags) noexcept {
    return static_cast<std::size_t>(std::count_if(
        flags.begin(), flags.end(), [](const std::string& f) {
            return std::any_of(QUALITY_MARKERS.begin(), QUALITY_MARKERS.end(),
                               [&f](std::string_view m) {
                                   return f.find(m) != std::string::npos;
                               });
        }));
}

double quality_penalty(std::span<const std::string> flags) noexcept {
    return std::min(static_cast<double>(count_quality_flags(flags)) *
                        constants::PENALTY_PER_FLAG,
                    constants::MAX_FLAG_PENALTY);
}

double apply_quality_penalty(double probability,
                             std::span<const std::string> flags) noexcept {
    return std::clamp(probability * (1.0 - quality_penalty(flags)),
                      constants::MODEL_PROB_FLOOR, constants::MODEL_PROB_CEILING);
}

// ─── MoneylineEvaluator ───────────────────────────────────────────────────────

MoneylineEvaluator::MoneylineEvaluator()
    : model_(std::make_shared<simulation::WinProbabilitySimulator>()) {}

MoneylineEvaluator::MoneylineEvaluator(
        std::shared_ptr<const simulation::WinProbabilityModel> model)
    : model_(std::move(model)) {}

std::optional<Pick>
MoneylineEvaluator::evaluate(const Analysis& analysis, double min_edge,
                             double min_confidence) const {
    if (!model_) return std::nullopt;
    if (!analysis.confidence || !(*analysis.confidence >= min_confidence)) return std::nullopt;
    if (!analysis.market.moneyline) return std::nullopt;

    const auto& proj = analysis.projections;
    if (!proj.home_runs || !proj.away_runs) return std::nullopt;

    double home_odds = 0.0;
    double away_odds = 0.0;
    try {
        home_odds = odds::normalize_to_decimal(analysis.market.moneyline->home);
        away_odds = odds::normalize_to_decimal(analysis.market.moneyline->away);
    } catch (const OddsError&) {
        return std::nullopt;  // malformed market: skip it
    }

    std::optional<double> bullpen_home;
    std::optional<double> bullpen_away;
    if (analysis.metrics) {
        bullpen_home = analysis.metrics->home.bullpen.era.adjusted;
        bullpen_away = analysis.metrics->away.bullpen.era.adjusted;
    }

    const auto probs = model_->moneyline(*proj.home_runs, *proj.away_runs,
                                         bullpen_home, bullpen_away);
    if (!probs) return std::nullopt;

    const auto quote = [&](Side side, const std::string& team, double price,
                           double raw_prob) {
        const double p   = apply_quality_penalty(raw_prob, analysis.flags);
        const double imp = 1.0 / price;
        return SideQuote{side, team, price, p, imp, odds::normalized_edge(p, imp)};
    };
    const SideQuote home = quote(Side::Home, analysis.teams.home, home_odds,
                                 probs->home_win_prob);
    const SideQuote away = quote(Side::Away, analysis.teams.away, away_odds,
                                 probs->away_win_prob);

    const SideQuote* best = nullptr;
    if (home.edge > 0.0 && home.edge >= min_edge) best = &home;
    if (away.edge > 0.0 && away.edge >= min_edge && (!best || away.edge > best->edge)) {
        best = &away;
    }
    if (!best) return std::nullopt;

    Pick pick;
    pick.event_id     = analysis.event_id;
    pick.date         = analysis.date;
    pick.market       = MarketType::Moneyline;
    pick.side         = best->side;
    pick.team         = best->team;
    pick.odds         = best->odds;
    pick.model_prob   = best->model_prob;
    pick.implied_prob = best->implied_prob;
    pick.edge         = best->edge;
    pick.confidence   = (*analysis.confidence + best->model_prob) / 2.0;
    pick.rationale    = fmt::format(
        "Monte Carlo moneyline (starter + bullpen phases, {} trials): "
        "{} {:.2f} vs {} {:.2f} runs, quality penalty {:.1f}%",
        probs->trials, analysis.teams.home, *proj.home_runs, analysis.teams.away,
        *proj.away_runs, quality_penalty(analysis.flags) * 100.0);

    const auto corr = correlation::CorrelationAdjuster::adjust_for_correlation(pick, analysis);
    pick.edge       *= corr.edge_multiplier;
    pick.confidence  = std::clamp(pick.confidence * corr.confidence_multiplier, 0.0, 1.0);
    pick.correlation_note = corr.reason;

    if (pick.edge < min_edge) return std::nullopt;
    return pick;
}

}  // namespace mlbedge::markets
