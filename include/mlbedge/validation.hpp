#pragma once

/// @file include/mlbedge/validation.hpp
/// @brief Two-tier validation of picks and projections.
///
/// # Module: Validation Layer
///
/// ## Taxonomy
///   errors   → the pick is rejected (never acted upon or persisted)
///   warnings → the pick is accepted but flagged for review
///   info     → notes, e.g. data-quality markers found in the rationale
///
/// A result is valid iff it has zero errors.  Validation never throws.

#include "mlbedge/risk_profile.hpp"
#include "mlbedge/types.hpp"

#include <string>
#include <utility>
#include <vector>

namespace mlbedge::validation {

struct ValidationResult {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::vector<std::string> info;

    [[nodiscard]] bool is_valid() const noexcept { return errors.empty(); }

    void add_error(std::string message)   { errors.push_back(std::move(message)); }
    void add_warning(std::string message) { warnings.push_back(std::move(message)); }
    void add_info(std::string message)    { info.push_back(std::move(message)); }

    /// One-line status, e.g. "VALID | Warnings: 2".
    [[nodiscard]] std::string summary() const;

    /// Multi-line itemised report.
    [[nodiscard]] std::string to_string() const;
};

/// Absolute limits that do not depend on the risk profile.
struct ValidationLimits {
    double min_odds                 = 1.01;
    double max_odds                 = 100.0;  ///< Above this is an error
    double longshot_odds            = 50.0;   ///< Above this is a warning
    double min_model_prob           = 0.05;
    double max_model_prob           = 0.95;
    double max_edge_warning         = 0.25;
    double min_confidence_high_edge = 0.60;
    double min_stake_fraction       = 0.001;
    double max_stake_amount         = 500.0;
    double edge_tolerance           = 0.01;
};

class PickValidator {
public:
    explicit PickValidator(RiskProfile profile = RiskProfile::balanced(),
                           ValidationLimits limits = {});

    [[nodiscard]] ValidationResult validate(const Pick& pick) const;

    [[nodiscard]] const RiskProfile& profile() const noexcept { return profile_; }
    [[nodiscard]] const ValidationLimits& limits() const noexcept { return limits_; }

private:
    void check_edge(const Pick& pick, ValidationResult& out) const;
    void check_confidence(const Pick& pick, ValidationResult& out) const;
    void check_odds(const Pick& pick, ValidationResult& out) const;
    void check_probabilities(const Pick& pick, ValidationResult& out) const;
    void check_stake(const Pick& pick, ValidationResult& out) const;
    void check_consistency(const Pick& pick, ValidationResult& out) const;

    RiskProfile      profile_;
    ValidationLimits limits_;
};

/// Sanity checks on a game's run projections.
///
///   errors   : < 0.5 runs for either team, < 1.0 total, non-finite input
///   warnings : > 15 for either team, > 25 total, > 3 runs from the 4.6
///              league average, confidence < 0.50
class ProjectionValidator {
public:
    [[nodiscard]] static ValidationResult
    validate(double home_runs, double away_runs, double confidence);
};

}  // namespace mlbedge::validation
