/// @file src/odds/odds.cpp
/// @brief Odds conversion and implied-probability utilities.

#include "mlbedge/odds.hpp"
#include "mlbedge/constants.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <type_traits>
#include <variant>

namespace mlbedge::odds {

namespace {

void require_valid_decimal(double decimal) {
    if (!is_valid_decimal(decimal)) {
        throw OddsError(fmt::format("invalid decimal odds: {}", decimal));
    }
}

std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

}  // namespace

// ─── Conversions ──────────────────────────────────────────────────────────────

bool is_valid_decimal(double decimal) noexcept {
    return std::isfinite(decimal) && decimal > 1.0 &&
           decimal < constants::MAX_DECIMAL_ODDS;
}

double american_to_decimal(int american) {
    if (american > -100 && american < 100) {
        throw OddsError(fmt::format("invalid American odds: {}", american));
    }
    const double a = static_cast<double>(american);
    return a > 0.0 ? a / 100.0 + 1.0 : 100.0 / -a + 1.0;
}

int decimal_to_american(double decimal) {
    require_valid_decimal(decimal);
    // Valid decimals keep |american| ≤ 100 / (ulp above 1.0), so guard int range.
    const double raw = decimal >= 2.0 ? (decimal - 1.0) * 100.0
                                      : -100.0 / (decimal - 1.0);
    if (std::abs(raw) > static_cast<double>(std::numeric_limits<int>::max())) {
        throw OddsError(fmt::format("decimal odds {} out of American range", decimal));
    }
    return static_cast<int>(std::lround(raw));
}

double implied_probability_from_decimal(double decimal) {
    require_valid_decimal(decimal);
    return 1.0 / decimal;
}

double implied_probability_from_american(int american) {
    return 1.0 / american_to_decimal(american);
}

double normalize_to_decimal(const OddsQuote& quote) {
    return std::visit(
        [](const auto& q) -> double {
            using T = std::decay_t<decltype(q)>;
            if constexpr (std::is_same_v<T, AmericanOdds>) {
                const double d = american_to_decimal(q.value);
                require_valid_decimal(d);
                return d;
            } else {
                require_valid_decimal(q.value);
                return q.value;
            }
        },
        quote);
}

std::optional<OddsQuote> parse_odds_quote(std::string_view token) noexcept {
    token = trim(token);
    if (!token.empty() && token.front() == '+') token.remove_prefix(1);
    if (token.empty()) return std::nullopt;

    const char* first = token.data();
    const char* last  = token.data() + token.size();

    int as_int = 0;
    const auto [ip, iec] = std::from_chars(first, last, as_int);
    if (iec == std::errc{} && ip == last && (as_int >= 100 || as_int <= -100)) {
        // |v| >= 100 here, so the conversion cannot throw.
        if (!is_valid_decimal(american_to_decimal(as_int))) return std::nullopt;
        return OddsQuote{AmericanOdds{as_int}};
    }

    double as_double = 0.0;
    const auto [dp, dec] = std::from_chars(first, last, as_double);
    if (dec == std::errc{} && dp == last && is_valid_decimal(as_double)) {
        return OddsQuote{DecimalOdds{as_double}};
    }
    return std::nullopt;
}

// ─── Market-level helpers ─────────────────────────────────────────────────────

double vig(double decimal_a, double decimal_b) {
    return implied_probability_from_decimal(decimal_a) +
           implied_probability_from_decimal(decimal_b) - 1.0;
}

std::pair<double, double> remove_vig(double decimal_a, double decimal_b) {
    const double pa  = implied_probability_from_decimal(decimal_a);
    const double pb  = implied_probability_from_decimal(decimal_b);
    const double sum = pa + pb;
    return {pa / sum, pb / sum};
}

double expected_value(double p, double decimal, double stake) {
    require_valid_decimal(decimal);
    return p * (decimal - 1.0) * stake - (1.0 - p) * stake;
}

double normalized_edge(double model_prob, double implied_prob) noexcept {
    if (!(implied_prob > 0.0)) return 0.0;
    return (model_prob - implied_prob) / implied_prob;
}

}  // namespace mlbedge::odds
