/// @file src/reliability/game_reliability.cpp
/// @brief Game reliability scoring.

#include "mlbedge/reliability.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace mlbedge::reliability {

namespace {

constexpr double DISCARD_BELOW = 0.55;
constexpr double LOW_BELOW     = 0.65;
constexpr double MEDIUM_BELOW  = 0.75;

[[nodiscard]] std::string upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

[[nodiscard]] QualityFlags merged(const QualityFlags& a, const QualityFlags& b) {
    QualityFlags out = a;
    for (unsigned i = 0; i <= static_cast<unsigned>(QualityFlag::NoHeadToHead); ++i) {
        const auto f = static_cast<QualityFlag>(i);
        if (b.test(f)) out.set(f);
    }
    return out;
}

}  // namespace

std::string_view to_string(ReliabilityTier tier) noexcept {
    switch (tier) {
        case ReliabilityTier::Discard: return "DISCARD";
        case ReliabilityTier::Low:     return "LOW";
        case ReliabilityTier::Medium:  return "MEDIUM";
        case ReliabilityTier::High:    return "HIGH";
    }
    return "UNKNOWN";
}

ReliabilityTier tier_for(double score) noexcept {
    if (!(score >= DISCARD_BELOW)) return ReliabilityTier::Discard;
    if (score < LOW_BELOW)         return ReliabilityTier::Low;
    if (score < MEDIUM_BELOW)      return ReliabilityTier::Medium;
    return ReliabilityTier::High;
}

double ReliabilityWeights::for_module(std::string_view name) const noexcept {
    if (name == "pitching") return pitching;
    if (name == "offense")  return offense;
    if (name == "context")  return context;
    if (name == "market")   return market;
    return 0.0;
}

std::string GameReliability::to_string() const {
    return fmt::format("reliability={:.3f} tier={} warnings={}", score,
                       reliability::to_string(tier), warnings.size());
}

GameReliability compute_game_reliability(std::span<const ModuleScore> modules,
                                         const ReliabilityWeights& weights) {
    double weighted = 0.0;
    double total_w  = 0.0;
    GameReliability out;

    for (const auto& m : modules) {
        if (!m.confidence || !std::isfinite(*m.confidence)) {
            out.warnings.push_back(upper(m.name) + "_NO_CONFIDENCE");
            continue;
        }
        const double w = weights.for_module(m.name);
        weighted += *m.confidence * w;
        total_w  += w;
        for (const auto flag : m.flags.names()) {
            out.warnings.push_back(upper(m.name) + "_" + upper(flag));
        }
    }

    out.score = total_w > 0.0 ? weighted / total_w : 0.0;
    out.tier  = tier_for(out.score);
    std::sort(out.warnings.begin(), out.warnings.end());
    out.warnings.erase(std::unique(out.warnings.begin(), out.warnings.end()),
                       out.warnings.end());
    return out;
}

std::vector<ModuleScore> modules_from_metrics(const GameMetrics& m,
                                              double market_confidence) {
    return {
        ModuleScore{"pitching",
                    std::min(m.home.starter.era.confidence, m.away.starter.era.confidence),
                    merged(m.home.starter.era.flags, m.away.starter.era.flags)},
        ModuleScore{"offense",
                    std::min(m.home.offense.runs_per_game.confidence,
                             m.away.offense.runs_per_game.confidence),
                    merged(m.home.offense.runs_per_game.flags,
                           m.away.offense.runs_per_game.flags)},
        ModuleScore{"context",
                    std::min(m.home.context.confidence, m.away.context.confidence),
                    merged(m.home.context.flags, m.away.context.flags)},
        ModuleScore{"market", market_confidence, {}},
    };
}

}  // namespace mlbedge::reliability
