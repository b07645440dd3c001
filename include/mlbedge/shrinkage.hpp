#pragma once

/// @file include/mlbedge/shrinkage.hpp
/// @brief Empirical-Bayes shrinkage of an observed rate toward a league prior.
///
/// # Formula
///   adjusted = (value · n + prior · w) / (n + w)
///
/// where n is the observed sample volume (innings, games) and w is the
/// "virtual sample size" the league prior is worth.

namespace mlbedge::shrinkage {

class ShrinkageEstimator {
public:
    /// Blend `value` toward `prior`.
    ///
    /// # Returns
    /// - `prior` when `sample_size <= 0` or `value` is non-finite
    /// - `value` when `prior_weight <= 0`
    /// - the weighted blend otherwise
    [[nodiscard]] static double adjust(double value, double sample_size,
                                       double prior, double prior_weight) noexcept;

    /// Share of the adjusted value carried by the observation: n / (n + w).
    [[nodiscard]] static double reliability(double sample_size,
                                            double prior_weight) noexcept;
};

}  // namespace mlbedge::shrinkage
