#pragma once

/// @file include/mlbedge/errors.hpp
/// @brief Typed errors raised at input boundaries.
///
/// Only malformed *required* inputs raise.  Missing optional data degrades
/// confidence instead, and validation failures are returned as data.

#include <stdexcept>
#include <string>

namespace mlbedge {

/// Out-of-range or malformed odds value (American 0, decimal ≤ 1.0, NaN, …).
///
/// Thrown only by the odds conversion functions; market evaluators catch it
/// and treat the affected market as absent.
class OddsError : public std::invalid_argument {
public:
    explicit OddsError(const std::string& what_arg)
        : std::invalid_argument(what_arg) {}
};

}  // namespace mlbedge
