#pragma once

/// @file include/mlbedge/data_loader.hpp
/// @brief CSV loader for game slates (projections, prices, final scores).
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse slate CSV files into one `SlateRow` per game: the Analysis the
/// evaluators consume and, when both scores are present, the settled game
/// the backtest engine needs.
///
/// ## Expected CSV Format
/// ```
/// game_id,date,home_team,away_team,home_runs,away_runs,confidence,ml_home,ml_away,total_line,odds_over,odds_under,home_score,away_score
/// G1,2024-04-01,NYY,BOS,4.8,4.1,0.72,-120,+110,8.5,1.91,1.91,5,3
/// G2,2024-04-01,LAD,SF,4.5,3.9,0.70,1.70,2.20,,,,,
/// ```
/// The first non-comment line is the header and is skipped.  Odds cells
/// accept American (|v| ≥ 100) or decimal (1, 100) prices.  An empty cell
/// means "missing".
///
/// ## Guarantees
/// - Never throws; returns `nullopt` only when the file cannot be opened
/// - Skips individual bad rows (logged) rather than failing the entire load
/// - Does not modify any file or external state

#include "mlbedge/backtest.hpp"
#include "mlbedge/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mlbedge::core {

/// One game of a slate.
struct SlateRow {
    Analysis                                analysis;
    std::optional<backtest::HistoricalGame> result;  ///< Set when both scores are present
};

struct SlateLoadReport {
    std::vector<SlateRow> rows;
    std::size_t           skipped = 0;  ///< Malformed data rows
};

/// Loads game slates from CSV files and strings.
class DataLoader {
public:
    /// Number of columns in a slate row.
    static constexpr std::size_t COLUMN_COUNT = 14;

    /// Load a slate from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Report with every well-formed row and the count of skipped ones
    [[nodiscard]] static std::optional<SlateLoadReport>
    load_slate_csv(const std::string& filepath) noexcept;

    /// Parse a slate from a CSV-formatted string (useful for testing).
    [[nodiscard]] static SlateLoadReport parse_slate_csv(std::string_view csv_content) noexcept;

    /// Parse a single data row.  `nullopt` if the row is malformed.
    [[nodiscard]] static std::optional<SlateRow> parse_row(std::string_view line) noexcept;

    /// Every settled game among `rows`.
    [[nodiscard]] static std::vector<backtest::HistoricalGame>
    games(const std::vector<SlateRow>& rows);
};

}  // namespace mlbedge::core
