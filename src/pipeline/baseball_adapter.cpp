/// @file src/pipeline/baseball_adapter.cpp
/// @brief BaseballAdapter: observations to validated, staked picks.

#include "mlbedge/pipeline.hpp"
#include "mlbedge/log.hpp"
#include "mlbedge/metrics.hpp"
#include "mlbedge/projection.hpp"
#include "mlbedge/reliability.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace mlbedge::pipeline {

namespace {

[[nodiscard]] std::optional<reliability::GameReliability>
reliability_of(const Analysis& analysis, double market_confidence) {
    if (!analysis.metrics) return std::nullopt;
    const auto modules = reliability::modules_from_metrics(*analysis.metrics, market_confidence);
    return reliability::compute_game_reliability(modules);
}

void sort_by_edge(std::vector<Pick>& picks) {
    std::stable_sort(picks.begin(), picks.end(),
                     [](const Pick& a, const Pick& b) { return a.edge > b.edge; });
}

}  // namespace

BaseballAdapter::BaseballAdapter(AdapterConfig config,
                                 std::shared_ptr<const StatsSource> stats,
                                 std::shared_ptr<const OddsProvider> odds,
                                 std::shared_ptr<const simulation::WinProbabilityModel> model)
    : config_(std::move(config)),
      stats_(std::move(stats)),
      odds_(std::move(odds)),
      moneyline_(model ? markets::MoneylineEvaluator(std::move(model))
                       : markets::MoneylineEvaluator()),
      stakes_(config_.profile, config_.staking),
      validator_(config_.profile, config_.limits) {}

// ─── Events ───────────────────────────────────────────────────────────────────

std::vector<metrics::GameObservation>
BaseballAdapter::get_events(std::string_view date) const {
    if (!stats_) return {};
    auto events = stats_->games_on(date);
    log::info("{} events on {}", events.size(), date);
    return events;
}

// ─── Analysis ─────────────────────────────────────────────────────────────────

std::optional<Analysis>
BaseballAdapter::analyze_event(const metrics::GameObservation& event) const {
    if (event.event_id.empty() || event.home.name.empty() || event.away.name.empty()) {
        log::warn("Skipping event without id or teams: '{}'", event.event_id);
        return std::nullopt;
    }

    Analysis a;
    a.event_id   = event.event_id;
    a.date       = event.date;
    a.venue      = event.venue;
    a.teams      = Teams{event.home.name, event.away.name};

    const auto game_metrics = metrics::MetricBuilder::build_game(event);
    const auto game_proj    = projection::RunProjectionModel::project_game(game_metrics);

    a.projections    = Projections{game_proj.home.mu, game_proj.away.mu, game_proj.total};
    a.home_breakdown = game_proj.home;
    a.away_breakdown = game_proj.away;
    a.confidence     = game_proj.confidence;
    a.flags          = metrics::MetricBuilder::quality_warnings(game_metrics, a.teams);
    a.metrics        = game_metrics;

    if (odds_) a.market = odds_->get_markets(a);

    if (const auto rel = reliability_of(a, config_.market_confidence)) {
        a.notes.push_back(rel->to_string());
        a.notes.insert(a.notes.end(), rel->warnings.begin(), rel->warnings.end());
    }

    log::debug("Analysed {}: {} {:.2f} - {} {:.2f} (conf {:.3f}, {} flags)",
               a.event_id, a.teams.home, game_proj.home.mu, a.teams.away,
               game_proj.away.mu, game_proj.confidence, a.flags.size());
    return a;
}

bool BaseballAdapter::evaluable(const Analysis& analysis) const {
    const auto& proj = analysis.projections;
    if (proj.home_runs && proj.away_runs) {
        const auto check = validation::ProjectionValidator::validate(
            *proj.home_runs, *proj.away_runs, analysis.confidence.value_or(0.0));
        if (!check.is_valid()) {
            log::warn("Projection rejected for {}: {}", analysis.event_id, check.summary());
            return false;
        }
    }

    if (const auto rel = reliability_of(analysis, config_.market_confidence)) {
        if (!rel->usable()) {
            log::info("Discarding {}: {}", analysis.event_id, rel->to_string());
            return false;
        }
    }
    return true;
}

// ─── Picks ────────────────────────────────────────────────────────────────────

std::vector<Pick> BaseballAdapter::generate_picks(const Analysis& analysis) const {
    if (!evaluable(analysis)) return {};

    const auto& profile = config_.profile;
    auto ml    = moneyline_.evaluate(analysis, profile.min_edge, profile.min_confidence);
    auto total = markets::TotalsEvaluator::evaluate(analysis, profile.min_edge,
                                                    profile.min_confidence);

    std::vector<Pick> candidates;
    if (ml)    candidates.push_back(stakes_.size_stake(*ml, config_.bankroll, total));
    if (total) candidates.push_back(stakes_.size_stake(*total, config_.bankroll, ml));

    std::vector<Pick> picks;
    picks.reserve(candidates.size());
    for (auto& pick : candidates) {
        const auto result = validator_.validate(pick);
        if (!result.is_valid()) {
            log::info("Rejected {} {} on {}: {}", to_string(pick.market),
                      to_string(pick.side), pick.event_id, fmt::join(result.errors, "; "));
            continue;
        }
        for (const auto& w : result.warnings) {
            log::debug("{} {}: {}", pick.event_id, to_string(pick.market), w);
        }
        picks.push_back(std::move(pick));
    }

    sort_by_edge(picks);
    return picks;
}

// ─── PickPipeline ─────────────────────────────────────────────────────────────

PickPipeline::PickPipeline(std::shared_ptr<const SportAdapter> adapter)
    : adapter_(std::move(adapter)),
      profile_(adapter_ ? adapter_->profile() : RiskProfile::balanced()) {}

std::vector<Pick> PickPipeline::select_daily(std::vector<Pick> picks, std::size_t max_picks) {
    sort_by_edge(picks);
    if (picks.size() > max_picks) picks.resize(max_picks);
    return picks;
}

std::vector<Pick> PickPipeline::run_date(std::string_view date) const {
    if (!adapter_) return {};

    std::vector<Analysis> analyses;
    for (const auto& event : adapter_->get_events(date)) {
        if (auto a = adapter_->analyze_event(event)) analyses.push_back(std::move(*a));
    }
    return run_analyses(analyses);
}

std::vector<Pick> PickPipeline::run_analyses(std::span<const Analysis> analyses) const {
    if (!adapter_) return {};

    std::vector<Pick> all;
    for (const auto& a : analyses) {
        auto picks = adapter_->generate_picks(a);
        all.insert(all.end(), std::make_move_iterator(picks.begin()),
                   std::make_move_iterator(picks.end()));
    }
    auto selected = select_daily(std::move(all), profile_.max_picks_per_day);
    log::info("{} picks selected from {} games (cap {})", selected.size(),
              analyses.size(), profile_.max_picks_per_day);
    return selected;
}

}  // namespace mlbedge::pipeline
