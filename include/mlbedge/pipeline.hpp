#pragma once

/// @file include/mlbedge/pipeline.hpp
/// @brief BaseballAdapter and the daily PickPipeline.
///
/// # Module: Pipeline
///
/// ## Responsibility
/// Wire the numeric components into the full per-game chain:
///
///   observations → MetricBuilder → RunProjectionModel → OddsProvider
///     → GameReliability → ProjectionValidator gate → evaluators
///     (correlation applied inside) → StakeEngine → PickValidator
///
/// and cap the surviving picks at the profile's daily limit.
///
/// ## Guarantees
/// - Only picks with zero validation errors are returned
/// - Picks come back highest edge first
/// - A game that fails the projection gate or lands in the Discard
///   reliability tier yields no picks; the reason is logged
/// - Every component receives the RiskProfile explicitly; there is no global
///
/// ## NOT Responsible For
/// - Persisting picks (see storage.hpp)
/// - Settling picks (see backtest.hpp)

#include "mlbedge/constants.hpp"
#include "mlbedge/interfaces.hpp"
#include "mlbedge/markets.hpp"
#include "mlbedge/risk_profile.hpp"
#include "mlbedge/staking.hpp"
#include "mlbedge/validation.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace mlbedge::pipeline {

struct AdapterConfig {
    RiskProfile                   profile  = RiskProfile::balanced();
    double                        bankroll = constants::DEFAULT_BANKROLL;
    staking::StakingConfig        staking;
    validation::ValidationLimits  limits;
    double                        market_confidence = 0.75;  ///< Reliability input
};

// ─── BaseballAdapter ──────────────────────────────────────────────────────────

class BaseballAdapter final : public SportAdapter {
public:
    /// Any collaborator may be null: no stats source means no events, no
    /// odds provider keeps whatever market the analysis already carries, and
    /// no win-probability model means the default simulator.
    BaseballAdapter(AdapterConfig config,
                    std::shared_ptr<const StatsSource> stats,
                    std::shared_ptr<const OddsProvider> odds,
                    std::shared_ptr<const simulation::WinProbabilityModel> model = nullptr);

    [[nodiscard]] std::string_view sport() const noexcept override { return "baseball"; }
    [[nodiscard]] std::string_view league() const noexcept override { return "MLB"; }

    [[nodiscard]] std::vector<metrics::GameObservation>
    get_events(std::string_view date) const override;

    [[nodiscard]] std::optional<Analysis>
    analyze_event(const metrics::GameObservation& event) const override;

    [[nodiscard]] std::vector<Pick>
    generate_picks(const Analysis& analysis) const override;

    [[nodiscard]] const RiskProfile& profile() const noexcept override {
        return config_.profile;
    }

    [[nodiscard]] const AdapterConfig& config() const noexcept { return config_; }

private:
    /// True when the projection gate and the reliability tier let markets
    /// be evaluated for this analysis.
    [[nodiscard]] bool evaluable(const Analysis& analysis) const;

    AdapterConfig                         config_;
    std::shared_ptr<const StatsSource>    stats_;
    std::shared_ptr<const OddsProvider>   odds_;
    markets::MoneylineEvaluator           moneyline_;
    staking::StakeEngine                  stakes_;
    validation::PickValidator             validator_;
};

// ─── PickPipeline ─────────────────────────────────────────────────────────────

/// Runs an adapter over a whole slate and applies the adapter's daily cap.
/// A different profile means a different adapter.
class PickPipeline {
public:
    explicit PickPipeline(std::shared_ptr<const SportAdapter> adapter);

    /// Keep the `max_picks` highest-edge picks (stable for equal edges).
    [[nodiscard]] static std::vector<Pick>
    select_daily(std::vector<Pick> picks, std::size_t max_picks);

    /// Events for `date` → analyses → picks → daily cap.
    [[nodiscard]] std::vector<Pick> run_date(std::string_view date) const;

    /// Picks for already-built analyses, capped.
    [[nodiscard]] std::vector<Pick> run_analyses(std::span<const Analysis> analyses) const;

    [[nodiscard]] const RiskProfile& profile() const noexcept { return profile_; }

private:
    std::shared_ptr<const SportAdapter> adapter_;
    RiskProfile                         profile_;
};

}  // namespace mlbedge::pipeline
