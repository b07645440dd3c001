#pragma once

/// @file include/mlbedge/interfaces.hpp
/// @brief Collaborator seams: odds provider, statistics source, sport adapter.
///
/// # Module: Interfaces
///
/// ## Responsibility
/// Abstract classes for everything the pipeline consumes from outside the
/// numeric core, plus the in-process implementations used by the CLI and
/// the tests.
///
/// ## Guarantees
/// - Every implementation here is immutable after construction and safe to
///   share between threads through `std::shared_ptr<const T>`
/// - `FakeOddsProvider` never invents a totals market for an analysis that
///   carries no total projection
///
/// ## NOT Responsible For
/// - Remote odds feeds or the remote statistics service
/// - Turning observations into picks (see pipeline.hpp)

#include "mlbedge/metrics.hpp"
#include "mlbedge/risk_profile.hpp"
#include "mlbedge/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mlbedge {

// ─── OddsProvider ─────────────────────────────────────────────────────────────

/// Source of bookmaker prices for one game.
class OddsProvider {
public:
    virtual ~OddsProvider() = default;

    /// Markets currently offered for the game described by `analysis`.
    /// A market the provider does not offer is left as `nullopt`.
    [[nodiscard]] virtual MarketOdds get_markets(const Analysis& analysis) const = 0;
};

/// Fixed-price provider for offline runs and tests.
class FakeOddsProvider final : public OddsProvider {
public:
    struct Prices {
        OddsQuote ml_home    = DecimalOdds{1.85};
        OddsQuote ml_away    = DecimalOdds{2.05};
        double    total_line = 8.5;
        OddsQuote over       = DecimalOdds{1.95};
        OddsQuote under      = DecimalOdds{1.95};
    };

    FakeOddsProvider() = default;
    explicit FakeOddsProvider(Prices prices) : prices_(prices) {}

    [[nodiscard]] MarketOdds get_markets(const Analysis& analysis) const override;

    [[nodiscard]] const Prices& prices() const noexcept { return prices_; }

private:
    Prices prices_;
};

// ─── StatsSource ──────────────────────────────────────────────────────────────

/// Raw per-team observations for every game on a date.
class StatsSource {
public:
    virtual ~StatsSource() = default;

    /// Games scheduled on `date` (YYYY-MM-DD).  Empty when none are known.
    [[nodiscard]] virtual std::vector<metrics::GameObservation>
    games_on(std::string_view date) const = 0;
};

/// StatsSource backed by a date → games table held in memory.
class InMemoryStatsSource final : public StatsSource {
public:
    void add_game(metrics::GameObservation game);

    [[nodiscard]] std::vector<metrics::GameObservation>
    games_on(std::string_view date) const override;

    [[nodiscard]] std::size_t size() const noexcept;

private:
    std::map<std::string, std::vector<metrics::GameObservation>, std::less<>> by_date_;
};

// ─── SportAdapter ─────────────────────────────────────────────────────────────

/// One sport's path from scheduled games to validated picks.
///
/// `analyze_event` never produces picks and `generate_picks` never fetches
/// data; the split lets an Analysis loaded from disk skip the first step.
class SportAdapter {
public:
    virtual ~SportAdapter() = default;

    [[nodiscard]] virtual std::string_view sport() const noexcept = 0;
    [[nodiscard]] virtual std::string_view league() const noexcept = 0;

    /// Thresholds, staking and the daily cap this adapter picks under.
    [[nodiscard]] virtual const RiskProfile& profile() const noexcept = 0;

    [[nodiscard]] virtual std::vector<metrics::GameObservation>
    get_events(std::string_view date) const = 0;

    /// Build the normalised Analysis for one game.  `nullopt` when the game
    /// cannot be analysed at all.
    [[nodiscard]] virtual std::optional<Analysis>
    analyze_event(const metrics::GameObservation& event) const = 0;

    /// Validated, staked picks for one analysis, highest edge first.
    [[nodiscard]] virtual std::vector<Pick>
    generate_picks(const Analysis& analysis) const = 0;
};

}  // namespace mlbedge
