#pragma once

/// @file include/mlbedge/odds.hpp
/// @brief Odds conversion, implied probability and edge utilities.
///
/// # Module: Odds
///
/// ## Responsibility
/// Convert between American and decimal price conventions, derive
/// market-implied probabilities, and compute the normalised edge used by
/// every market evaluator.
///
/// ## Conventions
///   American  -150  → decimal 100/150 + 1 = 1.6667
///   American  +120  → decimal 120/100 + 1 = 2.20
///   implied probability = 1 / decimal
///   edge = (model − implied) / implied
///
/// ## Guarantees
/// - Every conversion of a malformed price throws `mlbedge::OddsError`
/// - Valid decimal odds are always in (1.0, MAX_DECIMAL_ODDS)
/// - `parse_odds_quote` never throws

#include "mlbedge/errors.hpp"
#include "mlbedge/types.hpp"

#include <optional>
#include <string_view>
#include <utility>

namespace mlbedge::odds {

/// American → decimal.
///
/// # Errors
/// `OddsError` if |american| < 100 (includes 0).
[[nodiscard]] double american_to_decimal(int american);

/// Decimal → American, rounded to the nearest integer.
///
///   decimal ≥ 2.0 → +round((decimal − 1) × 100)
///   decimal < 2.0 → −round(100 / (decimal − 1))
///
/// # Errors
/// `OddsError` if `decimal` is not a valid decimal price.
[[nodiscard]] int decimal_to_american(double decimal);

/// 1 / decimal.  Throws `OddsError` on an invalid price.
[[nodiscard]] double implied_probability_from_decimal(double decimal);

[[nodiscard]] double implied_probability_from_american(int american);

/// Normalise either convention to a validated decimal price.
[[nodiscard]] double normalize_to_decimal(const OddsQuote& quote);

/// True when `decimal` is finite and within (1.0, MAX_DECIMAL_ODDS).
[[nodiscard]] bool is_valid_decimal(double decimal) noexcept;

/// Classify a textual price.
///
/// An integer token with |v| ≥ 100 (optionally prefixed by '+') is American;
/// any number in (1, 100) is decimal.  Anything else yields `nullopt`.
[[nodiscard]] std::optional<OddsQuote> parse_odds_quote(std::string_view token) noexcept;

/// Bookmaker overround of a two-way market: 1/a + 1/b − 1.
[[nodiscard]] double vig(double decimal_a, double decimal_b);

/// Implied probabilities of a two-way market with the overround removed.
/// The pair sums to 1.
[[nodiscard]] std::pair<double, double> remove_vig(double decimal_a, double decimal_b);

/// Expected profit of a `stake` bet at `decimal` odds won with probability `p`.
[[nodiscard]] double expected_value(double p, double decimal, double stake = 1.0);

/// (model − implied) / implied.  Returns 0 when `implied` ≤ 0.
[[nodiscard]] double normalized_edge(double model_prob, double implied_prob) noexcept;

}  // namespace mlbedge::odds
