#pragma once

/// @file include/mlbedge/simulator.hpp
/// @brief Monte Carlo win-probability simulator.
///
/// # Module: Win-Probability Simulator
///
/// ## Model
/// A nine-inning game is split into a starter phase (innings 1–6) and a
/// bullpen phase (innings 7–9).  Each inning's runs are Poisson with rate
/// mu/9.  In the bullpen phase the rate is scaled by
///
///     clamp(opposing_bullpen_era / LEAGUE_BULLPEN_ERA, 0.8, 1.2)
///
/// so a worse opposing bullpen raises scoring.  A tied game is settled by an
/// unweighted coin flip, standing in for extra innings.  Both choices are
/// deliberate approximations: there is no base/out state machine and no
/// leverage modelling.
///
/// ## Sampling error
/// The estimate has standard error √(p(1−p)/n); halving it needs 4× trials.
///
/// ## Reproducibility
/// Every worker draws from its own `RandomStream`, seeded from
/// (seed, worker index) via SplitMix64.  For a fixed (seed, workers, trials)
/// the result is bit-for-bit deterministic.

#include "mlbedge/constants.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>

namespace mlbedge::simulation {

// ─── RandomStream ─────────────────────────────────────────────────────────────

/// Independent, seedable source of random draws.  Not thread-safe: each
/// thread owns its own stream.
class RandomStream {
public:
    explicit RandomStream(std::uint64_t seed) noexcept;

    /// Stream for worker `index` of a run seeded with `seed`.
    [[nodiscard]] static RandomStream for_worker(std::uint64_t seed,
                                                 std::size_t index) noexcept;

    /// Poisson draw; returns 0 for a non-positive or non-finite mean.
    [[nodiscard]] int poisson(double mean);

    [[nodiscard]] bool coin_flip();

    /// Uniform draw in [0, 1).
    [[nodiscard]] double uniform();

private:
    std::mt19937_64 engine_;
};

/// SplitMix64 finaliser, used to derive well-separated stream seeds.
[[nodiscard]] std::uint64_t splitmix64(std::uint64_t x) noexcept;

// ─── Configuration ────────────────────────────────────────────────────────────

struct SimulationConfig {
    std::size_t   trials             = constants::DEFAULT_TRIALS;
    int           starter_innings    = constants::STARTER_INNINGS;
    int           bullpen_innings    = constants::BULLPEN_INNINGS;
    double        bullpen_factor_min = constants::BULLPEN_FACTOR_MIN;
    double        bullpen_factor_max = constants::BULLPEN_FACTOR_MAX;
    double        league_bullpen_era = constants::LEAGUE_BULLPEN_ERA;
    std::uint64_t seed               = 20240401;
    std::size_t   workers            = 1;
};

struct WinProbabilities {
    double home_win_prob = 0.5;
    double away_win_prob = 0.5;
    std::size_t trials   = 0;

    /// √(p(1−p)/n) for the home probability.
    [[nodiscard]] double standard_error() const noexcept;

    [[nodiscard]] std::string to_string() const;
};

// ─── WinProbabilityModel ──────────────────────────────────────────────────────

/// Source of moneyline win probabilities.  The simulator is the production
/// implementation; tests may inject fixed probabilities.
class WinProbabilityModel {
public:
    virtual ~WinProbabilityModel() = default;

    /// `nullopt` when the inputs cannot produce a probability.
    [[nodiscard]] virtual std::optional<WinProbabilities>
    moneyline(double home_mu, double away_mu,
              std::optional<double> bullpen_home_era,
              std::optional<double> bullpen_away_era) const = 0;
};

// ─── WinProbabilitySimulator ──────────────────────────────────────────────────

class WinProbabilitySimulator final : public WinProbabilityModel {
public:
    explicit WinProbabilitySimulator(SimulationConfig config = {});

    /// Simulate `n_trials` games.
    ///
    /// # Returns
    /// `nullopt` if either mu is non-finite or ≤ 0, or `n_trials` is 0.
    [[nodiscard]] std::optional<WinProbabilities>
    simulate_moneyline(double home_mu, double away_mu,
                       std::optional<double> bullpen_home_era,
                       std::optional<double> bullpen_away_era,
                       std::size_t n_trials) const;

    [[nodiscard]] std::optional<WinProbabilities>
    moneyline(double home_mu, double away_mu,
              std::optional<double> bullpen_home_era,
              std::optional<double> bullpen_away_era) const override;

    /// Bullpen-phase scoring multiplier against a bullpen with `opposing_era`.
    /// 1.0 when the ERA is unknown or non-positive.
    [[nodiscard]] double bullpen_factor(std::optional<double> opposing_era) const noexcept;

    [[nodiscard]] const SimulationConfig& config() const noexcept { return config_; }

private:
    SimulationConfig config_;
};

}  // namespace mlbedge::simulation
