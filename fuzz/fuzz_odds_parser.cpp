/**
 * @file  fuzz_odds_parser.cpp
 * @brief libFuzzer target for odds::parse_odds_quote and normalisation
 *
 * Build:
 *   cmake -DMLBEDGE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_odds_parser
 *
 * Run for 60 seconds:
 *   ./fuzz_odds_parser -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. parse_odds_quote never throws or crashes, for any byte sequence.
 *   2. If a quote is returned:
 *      a. normalize_to_decimal does not throw
 *      b. the decimal price is in (1, 100)
 *      c. the implied probability is in (0, 1)
 *   3. American quotes always have |value| ≥ 100.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>
#include <variant>

#include "mlbedge/odds.hpp"

using namespace mlbedge;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    const auto quote = odds::parse_odds_quote(input);
    if (!quote) return 0;

    if (const auto* american = std::get_if<AmericanOdds>(&*quote)) {
        assert(std::abs(american->value) >= 100);
    }

    const double decimal = odds::normalize_to_decimal(*quote);
    assert(odds::is_valid_decimal(decimal));
    assert(decimal > 1.0 && decimal < 100.0);

    const double p = odds::implied_probability_from_decimal(decimal);
    assert(p > 0.0 && p < 1.0);
    (void)p;
    return 0;
}
