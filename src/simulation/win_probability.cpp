/// @file src/simulation/win_probability.cpp
/// @brief RandomStream and WinProbabilitySimulator implementation.

#include "mlbedge/simulator.hpp"

#include <Eigen/Core>
#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <future>
#include <vector>

namespace mlbedge::simulation {

// ─── RandomStream ─────────────────────────────────────────────────────────────

std::uint64_t splitmix64(std::uint64_t x) noexcept {
    x += 0x9E3779B97F4A7C15ULL;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
    return x ^ (x >> 31);
}

RandomStream::RandomStream(std::uint64_t seed) noexcept : engine_(seed) {}

RandomStream RandomStream::for_worker(std::uint64_t seed, std::size_t index) noexcept {
    return RandomStream(splitmix64(splitmix64(seed) ^ static_cast<std::uint64_t>(index)));
}

int RandomStream::poisson(double mean) {
    if (!(mean > 0.0) || !std::isfinite(mean)) return 0;
    std::poisson_distribution<int> dist(mean);
    return dist(engine_);
}

bool RandomStream::coin_flip() {
    return std::bernoulli_distribution(0.5)(engine_);
}

double RandomStream::uniform() {
    return std::uniform_real_distribution<double>(0.0, 1.0)(engine_);
}

// ─── WinProbabilities ─────────────────────────────────────────────────────────

double WinProbabilities::standard_error() const noexcept {
    if (trials == 0) return 0.0;
    return std::sqrt(home_win_prob * (1.0 - home_win_prob) /
                     static_cast<double>(trials));
}

std::string WinProbabilities::to_string() const {
    return fmt::format("home={:.4f} away={:.4f} (n={}, se={:.4f})",
                       home_win_prob, away_win_prob, trials, standard_error());
}

// ─── WinProbabilitySimulator ──────────────────────────────────────────────────

namespace {

/// Per-phase Poisson rates for one batting team.
struct PhaseRates {
    double starter;
    double bullpen;
};

/// Run `n` trials on one stream and return the number of home wins.
///
/// Per-inning Poisson draws summed over a phase are Poisson with the summed
/// rate, so each phase is a single draw.
std::size_t simulate_block(std::size_t n, PhaseRates home, PhaseRates away,
                           RandomStream stream) {
    Eigen::ArrayXi home_runs(static_cast<Eigen::Index>(n));
    Eigen::ArrayXi away_runs(static_cast<Eigen::Index>(n));

    for (Eigen::Index i = 0; i < home_runs.size(); ++i) {
        home_runs(i) = stream.poisson(home.starter) + stream.poisson(home.bullpen);
        away_runs(i) = stream.poisson(away.starter) + stream.poisson(away.bullpen);
    }

    auto wins = static_cast<std::size_t>((home_runs > away_runs).count());
    const auto ties = static_cast<std::size_t>((home_runs == away_runs).count());
    for (std::size_t t = 0; t < ties; ++t) {
        if (stream.coin_flip()) ++wins;
    }
    return wins;
}

}  // namespace

WinProbabilitySimulator::WinProbabilitySimulator(SimulationConfig config)
    : config_(config) {
    config_.workers = std::max<std::size_t>(config_.workers, 1);
}

double WinProbabilitySimulator::bullpen_factor(
        std::optional<double> opposing_era) const noexcept {
    if (!opposing_era || !std::isfinite(*opposing_era) || *opposing_era <= 0.0 ||
        !(config_.league_bullpen_era > 0.0)) {
        return 1.0;
    }
    return std::clamp(*opposing_era / config_.league_bullpen_era,
                      config_.bullpen_factor_min, config_.bullpen_factor_max);
}

std::optional<WinProbabilities>
WinProbabilitySimulator::simulate_moneyline(double home_mu, double away_mu,
                                            std::optional<double> bullpen_home_era,
                                            std::optional<double> bullpen_away_era,
                                            std::size_t n_trials) const {
    if (!std::isfinite(home_mu) || !std::isfinite(away_mu)) return std::nullopt;
    if (home_mu <= 0.0 || away_mu <= 0.0)                    return std::nullopt;
    if (n_trials == 0)                                       return std::nullopt;

    const int innings = config_.starter_innings + config_.bullpen_innings;
    if (innings <= 0) return std::nullopt;

    const auto rates = [&](double mu, std::optional<double> opposing_bullpen) {
        const double per_inning = mu / static_cast<double>(innings);
        return PhaseRates{
            .starter = per_inning * config_.starter_innings,
            .bullpen = per_inning * config_.bullpen_innings *
                       bullpen_factor(opposing_bullpen),
        };
    };
    // The home lineup faces the away bullpen late, and vice versa.
    const PhaseRates home = rates(home_mu, bullpen_away_era);
    const PhaseRates away = rates(away_mu, bullpen_home_era);

    const std::size_t workers = std::min(config_.workers, n_trials);
    std::size_t home_wins = 0;

    if (workers == 1) {
        home_wins = simulate_block(n_trials, home, away,
                                   RandomStream::for_worker(config_.seed, 0));
    } else {
        std::vector<std::future<std::size_t>> futures;
        futures.reserve(workers);
        const std::size_t base = n_trials / workers;
        const std::size_t rem  = n_trials % workers;
        for (std::size_t w = 0; w < workers; ++w) {
            const std::size_t n = base + (w < rem ? 1 : 0);
            futures.push_back(std::async(std::launch::async, simulate_block, n, home,
                                         away, RandomStream::for_worker(config_.seed, w)));
        }
        for (auto& f : futures) home_wins += f.get();
    }

    const double p_home = static_cast<double>(home_wins) / static_cast<double>(n_trials);
    return WinProbabilities{
        .home_win_prob = p_home,
        .away_win_prob = 1.0 - p_home,
        .trials        = n_trials,
    };
}

std::optional<WinProbabilities>
WinProbabilitySimulator::moneyline(double home_mu, double away_mu,
                                   std::optional<double> bullpen_home_era,
                                   std::optional<double> bullpen_away_era) const {
    return simulate_moneyline(home_mu, away_mu, bullpen_home_era, bullpen_away_era,
                              config_.trials);
}

}  // namespace mlbedge::simulation
