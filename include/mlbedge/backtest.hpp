#pragma once

/// @file include/mlbedge/backtest.hpp
/// @brief Backtest Engine: settle picks against historical results.
///
/// # Module: Backtest Engine
///
/// ## Responsibility
/// Match each pick to its game by id, settle it, and measure whether the
/// edge the model claimed actually materialised.
///
/// ## Settlement
///   moneyline : side matches the winner → Win, otherwise Loss (a tied final
///               score is a Push)
///   totals    : total runs vs line; exactly on the line → Push
///   anything the engine cannot settle (totals pick without a line,
///   unfinished game) → Pending
///
///   profit = stake·(odds − 1) on Win, −stake on Loss, 0 on Push/Pending
///
/// ## Performance Metrics
///   win rate         = wins / (wins + losses)
///   ROI              = total profit / total settled stake
///   max drawdown     = max over t of (peak_t − bankroll_t) / peak_t
///   Sharpe           = mean(roi_i) / σ(roi_i) × √bets_per_year
///   edge realisation = ROI / mean(model edge)
///
/// ## Guarantees
/// - A single bad pick or game never aborts the batch; it is logged and skipped
/// - The bankroll series is replayed in date order (stable) regardless of
///   the order picks arrive in
/// - Fallible statistics return `std::optional`
///
/// ## NOT Responsible For
/// - Generating picks (see pipeline.hpp)
/// - Persisting results (see storage.hpp)

#include "mlbedge/constants.hpp"
#include "mlbedge/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mlbedge::backtest {

// ─── Types ────────────────────────────────────────────────────────────────────

enum class Outcome : std::uint8_t { Win, Loss, Push, Pending };

[[nodiscard]] std::string_view to_string(Outcome outcome) noexcept;

enum class Winner : std::uint8_t { Home, Away, None };

/// A completed (or scheduled) game with its final score.
struct HistoricalGame {
    std::string game_id;
    std::string date;       ///< YYYY-MM-DD
    std::string home_team;
    std::string away_team;
    std::string venue;
    int home_score = 0;
    int away_score = 0;
    std::string status = "Final";

    [[nodiscard]] int total_runs() const noexcept { return home_score + away_score; }
    [[nodiscard]] bool is_final() const noexcept { return status == "Final"; }
    [[nodiscard]] Winner winner() const noexcept;
};

/// Settlement of one pick.
struct BacktestResult {
    Pick        pick;
    std::string game_id;
    std::string date;
    Outcome     outcome = Outcome::Pending;
    double      stake   = 0.0;
    double      profit  = 0.0;
    double      roi     = 0.0;  ///< profit / stake; 0 for a zero stake
    int         home_score = 0;
    int         away_score = 0;

    [[nodiscard]] std::string to_string() const;
};

struct MarketStats {
    std::size_t bets   = 0;
    std::size_t wins   = 0;
    std::size_t losses = 0;
    std::size_t pushes = 0;
    double      staked = 0.0;
    double      profit = 0.0;
};

/// Aggregate statistics over a batch of settled picks.
struct BacktestSummary {
    std::size_t total_bets = 0;
    std::size_t wins       = 0;
    std::size_t losses     = 0;
    std::size_t pushes     = 0;
    std::size_t pending    = 0;
    std::size_t unmatched_picks = 0;

    double win_rate      = 0.0;
    double total_stake   = 0.0;
    double total_profit  = 0.0;
    double roi           = 0.0;
    double avg_edge      = 0.0;
    double realized_edge = 0.0;     ///< Equal to ROI
    double edge_realization = 0.0;  ///< ROI / avg_edge; 0 when avg_edge ≤ 0
    double max_drawdown  = 0.0;
    std::optional<double> sharpe_ratio;

    double initial_bankroll = constants::DEFAULT_BANKROLL;
    double final_bankroll   = constants::DEFAULT_BANKROLL;

    std::map<MarketType, MarketStats> by_market;

    /// Formatted multi-line report.
    [[nodiscard]] std::string to_string() const;
};

/// Configuration for a backtest run.
struct BacktestConfig {
    double initial_bankroll    = constants::DEFAULT_BANKROLL;
    double bets_per_year       = constants::BETS_PER_YEAR;
    bool   use_pick_stakes     = true;  ///< false → flat stakes
    double flat_stake_fraction = 0.01;  ///< Of the initial bankroll
};

// ─── PerformanceCalculator ────────────────────────────────────────────────────

/// Stateless utility for computing betting performance metrics.
///
/// All methods are static and operate on `std::span<const double>` for
/// zero-copy access to any contiguous container.
class PerformanceCalculator {
public:
    /// Annualised Sharpe-like ratio of per-bet returns.
    ///
    /// # Formula
    ///   Sharpe = mean(R) / σ(R) × √ann      (σ Bessel-corrected, n − 1)
    ///
    /// # Returns
    /// `nullopt` if fewer than 2 returns, σ = 0, or any NaN/Inf.
    [[nodiscard]] static std::optional<double>
    sharpe(std::span<const double> returns,
           double annualisation = constants::BETS_PER_YEAR) noexcept;

    /// Maximum peak-to-trough fractional decline of a bankroll series.
    ///
    /// # Formula
    ///   MDD = max over t of { (peak_t − B_t) / peak_t },  peak_t = max_{s ≤ t} B_s
    ///
    /// # Returns
    /// A value in [0, 1] (0 for a non-decreasing series).  `nullopt` on empty
    /// input or any NaN/Inf.
    [[nodiscard]] static std::optional<double>
    max_drawdown(std::span<const double> bankroll) noexcept;

    /// initial, initial + p₀, initial + p₀ + p₁, …
    [[nodiscard]] static std::vector<double>
    bankroll_series(double initial, std::span<const double> profits);

private:
    /// Mean of a span.  Unchecked; caller must ensure non-empty, finite.
    static double mean(std::span<const double> v) noexcept;
    /// Sample std-dev of a span.  Unchecked; caller ensures length ≥ 2.
    static double stddev(std::span<const double> v, double mean_val) noexcept;
};

// ─── BacktestEngine ───────────────────────────────────────────────────────────

class BacktestEngine {
public:
    explicit BacktestEngine(BacktestConfig config = {});

    /// Settle one pick against its game.
    [[nodiscard]] static Outcome settle(const Pick& pick, const HistoricalGame& game) noexcept;

    /// stake·(odds − 1) on Win, −stake on Loss, 0 otherwise.
    [[nodiscard]] static double profit(Outcome outcome, double stake, double odds) noexcept;

    /// Settle every pick whose `event_id` names a known game.  Unmatched
    /// picks are logged and skipped.  Results come back stably sorted by date.
    [[nodiscard]] std::vector<BacktestResult>
    run(std::span<const HistoricalGame> games, std::span<const Pick> picks) const;

    /// Aggregate a batch of results (assumed in date order).
    [[nodiscard]] BacktestSummary
    summarize(std::span<const BacktestResult> results,
              std::size_t unmatched_picks = 0) const;

    /// `run` followed by `summarize`, counting unmatched picks.
    [[nodiscard]] BacktestSummary
    evaluate(std::span<const HistoricalGame> games, std::span<const Pick> picks) const;

    [[nodiscard]] const BacktestConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] double stake_for(const Pick& pick) const noexcept;

    BacktestConfig config_;
};

}  // namespace mlbedge::backtest
