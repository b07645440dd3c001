#pragma once

/// @file include/mlbedge/types.hpp
/// @brief Shared record types for the mlbedge projection-and-edge pipeline.
///
/// Every record here is a plain value: produced once by exactly one
/// component, then passed read-only (by const reference or by copy) to the
/// next.  No record holds a pointer into another record.

#include <bit>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mlbedge {

/// Sentinel for a numeric field that was never populated.
inline constexpr double MISSING = std::numeric_limits<double>::quiet_NaN();

// ─── Quality flags ────────────────────────────────────────────────────────────

/// Named data-quality conditions attached to a metric or context record.
enum class QualityFlag : std::uint8_t {
    LowSample,
    NoRecentData,
    EstimatedFromAggregate,
    NoSplits,
    NoFip,
    PitcherTbd,
    Fatigue,
    NoHighLeverage,
    NoTeamData,
    NoAdvancedMetrics,
    NoWeather,
    NoParkFactor,
    NoHeadToHead,
};

[[nodiscard]] std::string_view to_string(QualityFlag flag) noexcept;

/// Small bit-set of QualityFlag values.
class QualityFlags {
public:
    QualityFlags() noexcept = default;
    QualityFlags(std::initializer_list<QualityFlag> flags) noexcept {
        for (auto f : flags) set(f);
    }

    void set(QualityFlag f) noexcept { bits_ |= mask(f); }

    [[nodiscard]] bool test(QualityFlag f) const noexcept {
        return (bits_ & mask(f)) != 0;
    }

    [[nodiscard]] std::size_t count() const noexcept {
        return static_cast<std::size_t>(std::popcount(bits_));
    }

    [[nodiscard]] bool empty() const noexcept { return bits_ == 0; }

    /// Names of all set flags, in enum order.
    [[nodiscard]] std::vector<std::string_view> names() const;

    friend bool operator==(const QualityFlags&, const QualityFlags&) = default;

private:
    static constexpr std::uint32_t mask(QualityFlag f) noexcept {
        return std::uint32_t{1} << static_cast<unsigned>(f);
    }

    std::uint32_t bits_ = 0;
};

// ─── Metric records ───────────────────────────────────────────────────────────

enum class MetricCategory : std::uint8_t { Pitching, Offense, Defense, Bullpen };

enum class Handedness : std::uint8_t { Right, Left };

[[nodiscard]] std::string_view to_string(MetricCategory category) noexcept;

/// One shrunk rate statistic for one team in one category.
struct MetricRecord {
    MetricCategory category = MetricCategory::Offense;
    double observed   = 0.0;   ///< Raw statistic as reported
    double sample     = 0.0;   ///< Innings or games behind `observed`
    double prior      = 0.0;   ///< League-average prior
    double adjusted   = 0.0;   ///< Shrinkage-adjusted value
    double confidence = 0.0;   ///< In [0, 1]; non-increasing in `flags`
    QualityFlags flags;
};

struct OffenseProfile {
    MetricRecord runs_per_game;                ///< Adjusted RPG is the projection base
    double ops_adjusted = 0.0;                 ///< Shrunk team-wide OPS
    std::optional<double> ops_vs_rhp;          ///< Split vs right-handed starters
    std::optional<double> ops_vs_lhp;          ///< Split vs left-handed starters
    std::optional<double> runs_last_30;        ///< Recent-form run rate
};

struct PitcherProfile {
    MetricRecord era;
    Handedness throws = Handedness::Right;
    std::optional<int> days_rest;
};

struct DefenseProfile {
    MetricRecord errors_per_game;
};

struct BullpenProfile {
    MetricRecord era;
};

/// Per-team, per-game environment.  Built fresh for every game date.
struct ContextRecord {
    double park_factor     = 1.0;
    double weather_runs    = 0.0;  ///< Additive run delta from temperature/wind
    double fatigue_penalty = 0.0;  ///< Runs subtracted on a back-to-back
    double confidence      = 0.0;
    QualityFlags flags;
};

/// Season-decayed head-to-head summary, from the home team's point of view.
struct HeadToHeadRecord {
    std::size_t games       = 0;
    double winrate_weighted = 0.5;
    double margin_weighted  = 0.0;
    double confidence       = 0.0;
    QualityFlags flags;
};

struct TeamMetrics {
    OffenseProfile offense;
    PitcherProfile starter;
    BullpenProfile bullpen;
    DefenseProfile defense;
    ContextRecord  context;
};

struct GameMetrics {
    TeamMetrics home;
    TeamMetrics away;
    HeadToHeadRecord h2h;
};

// ─── Projection ───────────────────────────────────────────────────────────────

/// Full decomposition of one team's expected runs for one game.
struct ProjectionBreakdown {
    double base_rate       = 0.0;
    double split_factor    = 1.0;
    double recent_factor   = 1.0;
    double pitcher_factor  = 1.0;
    double defense_factor  = 1.0;
    double park_factor     = 1.0;
    double weather_delta   = 0.0;
    double fatigue_penalty = 0.0;
    double h2h_delta       = 0.0;
    double mu              = 0.0;  ///< Final expected runs, >= MIN_RUNS
    double confidence      = 0.0;

    [[nodiscard]] std::string to_string() const;
};

// ─── Odds ─────────────────────────────────────────────────────────────────────

/// American (moneyline) odds, e.g. -150 or +120.
struct AmericanOdds {
    int value;
};

/// Decimal (European) odds, always > 1.0 when valid.
struct DecimalOdds {
    double value;
};

/// A bookmaker price in either convention.
using OddsQuote = std::variant<AmericanOdds, DecimalOdds>;

struct MoneylineMarket {
    OddsQuote home;
    OddsQuote away;
};

struct TotalsMarket {
    std::optional<double>    line;
    std::optional<OddsQuote> over;
    std::optional<OddsQuote> under;
};

struct MarketOdds {
    std::optional<MoneylineMarket> moneyline;
    std::optional<TotalsMarket>    total;
};

// ─── Analysis ─────────────────────────────────────────────────────────────────

struct Teams {
    std::string home;
    std::string away;
};

struct Projections {
    std::optional<double> home_runs;
    std::optional<double> away_runs;
    std::optional<double> total_runs;
};

/// Normalised per-game bundle consumed by every market evaluator.
struct Analysis {
    std::string event_id;
    std::string date;   ///< YYYY-MM-DD
    std::string venue;
    Teams teams;

    Projections projections;
    std::optional<ProjectionBreakdown> home_breakdown;
    std::optional<ProjectionBreakdown> away_breakdown;

    MarketOdds market;
    std::optional<GameMetrics> metrics;

    std::optional<double> confidence;
    std::vector<std::string> flags;  ///< Accumulated data-quality warnings
    std::vector<std::string> notes;  ///< Informational annotations (reliability, gates)
};

// ─── Pick ─────────────────────────────────────────────────────────────────────

enum class MarketType : std::uint8_t { Moneyline, Total };

enum class Side : std::uint8_t { Home, Away, Over, Under };

[[nodiscard]] std::string_view to_string(MarketType market) noexcept;
[[nodiscard]] std::string_view to_string(Side side) noexcept;

/// A market-side recommendation.  Numeric fields left at MISSING count as
/// absent for validation.
struct Pick {
    std::string event_id;
    std::string date;
    MarketType  market = MarketType::Moneyline;
    Side        side   = Side::Home;
    std::string team;                  ///< Empty for totals
    std::optional<double> line;        ///< Totals line

    double odds         = MISSING;     ///< Always decimal
    double model_prob   = MISSING;
    double implied_prob = MISSING;
    double edge         = MISSING;     ///< (model − implied) / implied
    double confidence   = MISSING;

    double stake_fraction = 0.0;       ///< Fraction of bankroll
    double stake_amount   = 0.0;

    std::string rationale;
    std::string correlation_note;
    std::string stake_note;

    [[nodiscard]] std::string to_string() const;
};

} // namespace mlbedge
