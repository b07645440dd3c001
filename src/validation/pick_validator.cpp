/// @file src/validation/pick_validator.cpp
/// @brief PickValidator, ProjectionValidator and ValidationResult formatting.

#include "mlbedge/validation.hpp"
#include "mlbedge/constants.hpp"
#include "mlbedge/odds.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <array>
#include <cmath>
#include <string_view>
#include <utility>

namespace mlbedge::validation {

namespace {

constexpr std::array<std::string_view, 6> RATIONALE_QUALITY_MARKERS{
    "LOW_SAMPLE", "NO_H2H", "NO_RECENT", "TBD_PITCHER", "NO_BULLPEN", "NO_SPLITS"};

constexpr double MIN_RUNS_PER_TEAM  = 0.5;
constexpr double MIN_TOTAL_RUNS     = 1.0;
constexpr double MAX_RUNS_PER_TEAM  = 15.0;
constexpr double MAX_TOTAL_RUNS     = 25.0;
constexpr double MAX_DEVIATION_RUNS = 3.0;
constexpr double MIN_PROJECTION_CONFIDENCE = 0.50;

}  // namespace

// ─── ValidationResult ─────────────────────────────────────────────────────────

std::string ValidationResult::summary() const {
    std::string s = is_valid() ? "VALID" : "INVALID";
    if (!errors.empty())   s += fmt::format(" | Errors: {}", errors.size());
    if (!warnings.empty()) s += fmt::format(" | Warnings: {}", warnings.size());
    return s;
}

std::string ValidationResult::to_string() const {
    std::string out = is_valid() ? "PICK VALID" : "PICK INVALID";
    const auto section = [&out](std::string_view title,
                                const std::vector<std::string>& items) {
        if (items.empty()) return;
        out += fmt::format("\n{}:", title);
        for (const auto& item : items) out += fmt::format("\n  - {}", item);
    };
    section("ERRORS", errors);
    section("WARNINGS", warnings);
    section("INFO", info);
    return out;
}

// ─── PickValidator ────────────────────────────────────────────────────────────

PickValidator::PickValidator(RiskProfile profile, ValidationLimits limits)
    : profile_(std::move(profile)), limits_(limits) {}

ValidationResult PickValidator::validate(const Pick& pick) const {
    ValidationResult out;

    std::vector<std::string_view> missing;
    if (pick.event_id.empty())               missing.emplace_back("event_id");
    if (!std::isfinite(pick.odds))           missing.emplace_back("odds");
    if (!std::isfinite(pick.model_prob))     missing.emplace_back("model_prob");
    if (!std::isfinite(pick.implied_prob))   missing.emplace_back("implied_prob");
    if (!std::isfinite(pick.edge))           missing.emplace_back("edge");
    if (!std::isfinite(pick.confidence))     missing.emplace_back("confidence");
    if (pick.market == MarketType::Moneyline && pick.team.empty()) missing.emplace_back("team");
    if (pick.market == MarketType::Total && !pick.line)            missing.emplace_back("line");
    if (!missing.empty()) {
        out.add_error(fmt::format("Missing required fields: {}", fmt::join(missing, ", ")));
        return out;
    }

    check_edge(pick, out);
    check_confidence(pick, out);
    check_odds(pick, out);
    check_probabilities(pick, out);
    check_stake(pick, out);
    check_consistency(pick, out);
    return out;
}

void PickValidator::check_edge(const Pick& pick, ValidationResult& out) const {
    if (pick.edge < profile_.min_edge) {
        out.add_error(fmt::format("Edge below minimum: {:.2f}% < {:.2f}%",
                                  pick.edge * 100.0, profile_.min_edge * 100.0));
    }
    if (pick.edge < 0.0) {
        out.add_error(fmt::format("Negative edge: {:.2f}%", pick.edge * 100.0));
    }
    if (pick.edge > limits_.max_edge_warning) {
        out.add_warning(fmt::format("Suspiciously high edge: {:.2f}% (possible data error)",
                                    pick.edge * 100.0));
    }
}

void PickValidator::check_confidence(const Pick& pick, ValidationResult& out) const {
    if (pick.confidence < 0.0 || pick.confidence > 1.0) {
        out.add_error(fmt::format("Confidence out of range [0, 1]: {:.3f}", pick.confidence));
    }
    if (pick.confidence < profile_.min_confidence) {
        out.add_error(fmt::format("Confidence below minimum: {:.3f} < {:.3f}",
                                  pick.confidence, profile_.min_confidence));
    }
    if (pick.edge > 0.10 && pick.confidence < limits_.min_confidence_high_edge) {
        out.add_warning(fmt::format("High edge ({:.2f}%) with low confidence ({:.3f})",
                                    pick.edge * 100.0, pick.confidence));
    }
}

void PickValidator::check_odds(const Pick& pick, ValidationResult& out) const {
    if (pick.odds < limits_.min_odds) {
        out.add_error(fmt::format("Odds too low: {:.3f} < {:.2f}", pick.odds, limits_.min_odds));
    } else if (pick.odds >= limits_.max_odds) {
        out.add_error(fmt::format("Odds out of range: {:.2f} >= {:.2f}", pick.odds,
                                  limits_.max_odds));
    } else if (pick.odds > limits_.longshot_odds) {
        out.add_warning(fmt::format("Odds very high: {:.2f} (longshot)", pick.odds));
    }
}

void PickValidator::check_probabilities(const Pick& pick, ValidationResult& out) const {
    if (pick.model_prob < limits_.min_model_prob || pick.model_prob > limits_.max_model_prob) {
        out.add_error(fmt::format("Model probability out of range [{:.2f}, {:.2f}]: {:.3f}",
                                  limits_.min_model_prob, limits_.max_model_prob,
                                  pick.model_prob));
    }
    if (!(pick.implied_prob > 0.0 && pick.implied_prob < 1.0)) {
        out.add_error(fmt::format("Implied probability out of range (0, 1): {:.3f}",
                                  pick.implied_prob));
        return;
    }
    const double expected = odds::normalized_edge(pick.model_prob, pick.implied_prob);
    if (std::abs(expected - pick.edge) > limits_.edge_tolerance) {
        out.add_warning(fmt::format(
            "Edge mismatch: reported {:.2f}% vs recomputed {:.2f}%",
            pick.edge * 100.0, expected * 100.0));
    }
}

void PickValidator::check_stake(const Pick& pick, ValidationResult& out) const {
    if (!std::isfinite(pick.stake_fraction) || !std::isfinite(pick.stake_amount)) {
        out.add_error("Stake is not a finite number");
        return;
    }
    if (pick.stake_fraction > profile_.max_stake_fraction) {
        out.add_error(fmt::format("Stake fraction exceeds cap: {:.2f}% > {:.2f}%",
                                  pick.stake_fraction * 100.0,
                                  profile_.max_stake_fraction * 100.0));
    } else if (pick.stake_fraction < limits_.min_stake_fraction) {
        out.add_warning(fmt::format("Very small stake: {:.3f}%", pick.stake_fraction * 100.0));
    }
    if (pick.stake_amount < 0.0 || pick.stake_fraction < 0.0) {
        out.add_error(fmt::format("Negative stake: {:.2f}", pick.stake_amount));
    } else if (pick.stake_amount > limits_.max_stake_amount) {
        out.add_warning(fmt::format("Large stake amount: ${:.2f}", pick.stake_amount));
    }
}

void PickValidator::check_consistency(const Pick& pick, ValidationResult& out) const {
    std::vector<std::string_view> found;
    for (const auto marker : RATIONALE_QUALITY_MARKERS) {
        if (pick.rationale.find(marker) != std::string::npos) found.push_back(marker);
    }
    if (!found.empty()) {
        out.add_info(fmt::format("Data quality flags: {}", fmt::join(found, ", ")));
    }

    if (pick.edge > 0.08 && pick.confidence < 0.65) {
        out.add_warning(fmt::format(
            "Edge/confidence mismatch: high edge ({:.2f}%) but moderate confidence ({:.3f})",
            pick.edge * 100.0, pick.confidence));
    }
    if (pick.confidence > 0.80 && pick.edge < 0.03) {
        out.add_warning(fmt::format(
            "Edge/confidence mismatch: high confidence ({:.3f}) but low edge ({:.2f}%)",
            pick.confidence, pick.edge * 100.0));
    }
}

// ─── ProjectionValidator ──────────────────────────────────────────────────────

ValidationResult
ProjectionValidator::validate(double home_runs, double away_runs, double confidence) {
    ValidationResult out;
    if (!std::isfinite(home_runs) || !std::isfinite(away_runs)) {
        out.add_error("Projection is not a finite number");
        return out;
    }

    const double total = home_runs + away_runs;
    if (home_runs < MIN_RUNS_PER_TEAM) {
        out.add_error(fmt::format("Home projection too low: {:.2f}", home_runs));
    }
    if (away_runs < MIN_RUNS_PER_TEAM) {
        out.add_error(fmt::format("Away projection too low: {:.2f}", away_runs));
    }
    if (total < MIN_TOTAL_RUNS) {
        out.add_error(fmt::format("Total projection too low: {:.2f}", total));
    }

    if (home_runs > MAX_RUNS_PER_TEAM) {
        out.add_warning(fmt::format("Home projection very high: {:.2f}", home_runs));
    }
    if (away_runs > MAX_RUNS_PER_TEAM) {
        out.add_warning(fmt::format("Away projection very high: {:.2f}", away_runs));
    }
    if (total > MAX_TOTAL_RUNS) {
        out.add_warning(fmt::format("Total projection very high: {:.2f}", total));
    }
    for (const auto& [label, runs] : {std::pair{"Home", home_runs}, std::pair{"Away", away_runs}}) {
        const double dev = std::abs(runs - constants::LEAGUE_RPG);
        if (dev > MAX_DEVIATION_RUNS) {
            out.add_warning(fmt::format("{} projection {:.2f} is {:.2f} runs from league average",
                                        label, runs, dev));
        }
    }
    if (!std::isfinite(confidence) || confidence < MIN_PROJECTION_CONFIDENCE) {
        out.add_warning(fmt::format("Low projection confidence: {:.3f}", confidence));
    }
    return out;
}

}  // namespace mlbedge::validation
