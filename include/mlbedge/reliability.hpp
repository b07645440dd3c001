#pragma once

/// @file include/mlbedge/reliability.hpp
/// @brief Whole-game reliability score from per-module confidences.
///
/// # Formula
///   score = Σ wᵢ·cᵢ / Σ wᵢ   over modules that report a confidence
///   w = pitching 0.35, offense 0.30, context 0.20, market 0.15
///
/// # Tiers
///   Discard < 0.55 ≤ Low < 0.65 ≤ Medium < 0.75 ≤ High
///
/// Discard games are never bet.

#include "mlbedge/types.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mlbedge::reliability {

enum class ReliabilityTier : std::uint8_t { Discard, Low, Medium, High };

[[nodiscard]] std::string_view to_string(ReliabilityTier tier) noexcept;

[[nodiscard]] ReliabilityTier tier_for(double score) noexcept;

/// Confidence and active flags of one analysis module for one game.
struct ModuleScore {
    std::string           name;  ///< "pitching", "offense", "context", "market"
    std::optional<double> confidence;
    QualityFlags          flags;
};

struct ReliabilityWeights {
    double pitching = 0.35;
    double offense  = 0.30;
    double context  = 0.20;
    double market   = 0.15;

    /// Weight for a module name; 0 for an unknown module.
    [[nodiscard]] double for_module(std::string_view name) const noexcept;
};

struct GameReliability {
    double                   score = 0.0;
    ReliabilityTier          tier  = ReliabilityTier::Discard;
    std::vector<std::string> warnings;  ///< Sorted, unique "<MODULE>_<FLAG>"

    [[nodiscard]] bool usable() const noexcept { return tier != ReliabilityTier::Discard; }
    [[nodiscard]] std::string to_string() const;
};

[[nodiscard]] GameReliability
compute_game_reliability(std::span<const ModuleScore> modules,
                         const ReliabilityWeights& weights = {});

/// Module scores for a game: each module takes the weaker team's confidence
/// and the union of both teams' flags.
[[nodiscard]] std::vector<ModuleScore>
modules_from_metrics(const GameMetrics& metrics, double market_confidence = 0.75);

}  // namespace mlbedge::reliability
