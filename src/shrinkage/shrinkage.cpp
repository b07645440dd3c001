/// @file src/shrinkage/shrinkage.cpp
/// @brief ShrinkageEstimator implementation.

#include "mlbedge/shrinkage.hpp"

#include <cmath>

namespace mlbedge::shrinkage {

double ShrinkageEstimator::adjust(double value, double sample_size,
                                  double prior, double prior_weight) noexcept {
    if (!(sample_size > 0.0) || !std::isfinite(value)) return prior;
    if (!(prior_weight > 0.0)) return value;

    return (value * sample_size + prior * prior_weight) /
           (sample_size + prior_weight);
}

double ShrinkageEstimator::reliability(double sample_size,
                                       double prior_weight) noexcept {
    if (!(sample_size > 0.0)) return 0.0;
    if (!(prior_weight > 0.0)) return 1.0;
    return sample_size / (sample_size + prior_weight);
}

}  // namespace mlbedge::shrinkage
