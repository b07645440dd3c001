#pragma once

/// @file include/mlbedge/markets.hpp
/// @brief Moneyline and totals edge evaluators.
///
/// # Module: Market Evaluators
///
/// ## Contract
///   evaluate(analysis, min_edge, min_confidence) → optional<Pick>
///
/// `nullopt` ("no pick") is the normal outcome for missing projections,
/// missing or malformed odds, low confidence, or no side clearing
/// `min_edge`.  Malformed odds raise `OddsError` inside the odds layer and
/// are caught here, so the evaluators themselves never throw for bad data.
///
/// ## Edge
///   implied = 1 / decimal_odds
///   edge    = (model − implied) / implied
///
/// ## Tie-break
/// Home (Over) is evaluated first and must reach `min_edge`; Away (Under)
/// replaces it only with a strictly greater edge.
///
/// ## Guarantees
/// - No I/O and no logging
/// - Picks always carry decimal odds

#include "mlbedge/correlation.hpp"
#include "mlbedge/simulator.hpp"
#include "mlbedge/types.hpp"

#include <memory>
#include <optional>
#include <span>
#include <string>

namespace mlbedge::markets {

// ─── Data-quality penalty ─────────────────────────────────────────────────────

/// Number of flags naming a low-sample, missing-H2H or missing-recent condition.
[[nodiscard]] std::size_t count_quality_flags(std::span<const std::string> flags) noexcept;

/// min(count · 0.035, 0.12)
[[nodiscard]] double quality_penalty(std::span<const std::string> flags) noexcept;

/// clamp(p · (1 − penalty), 0.05, 0.95)
[[nodiscard]] double apply_quality_penalty(double probability,
                                           std::span<const std::string> flags) noexcept;

// ─── MoneylineEvaluator ───────────────────────────────────────────────────────

class MoneylineEvaluator {
public:
    /// Uses a default-configured `WinProbabilitySimulator`.
    MoneylineEvaluator();

    explicit MoneylineEvaluator(std::shared_ptr<const simulation::WinProbabilityModel> model);

    /// Select at most one moneyline side.
    ///
    /// Each side's model probability is quality-penalised independently.
    /// The selected pick's edge and confidence are then scaled by the
    /// correlation adjustment; a pick pushed below `min_edge` is dropped.
    [[nodiscard]] std::optional<Pick>
    evaluate(const Analysis& analysis, double min_edge, double min_confidence) const;

private:
    std::shared_ptr<const simulation::WinProbabilityModel> model_;
};

// ─── TotalsEvaluator ──────────────────────────────────────────────────────────

class TotalsEvaluator {
public:
    /// Select at most one of Over / Under.
    [[nodiscard]] static std::optional<Pick>
    evaluate(const Analysis& analysis, double min_edge, double min_confidence);

    /// P(Over) = 1 / (1 + e^−(projected_total − line))
    [[nodiscard]] static double over_probability(double projected_total,
                                                 double line) noexcept;
};

}  // namespace mlbedge::markets
