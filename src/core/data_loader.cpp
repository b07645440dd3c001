/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for game slates.

#include "mlbedge/data_loader.hpp"
#include "mlbedge/log.hpp"
#include "mlbedge/odds.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>
#include <string>

namespace mlbedge::core {

namespace {

enum Column : std::size_t {
    GameId, Date, HomeTeam, AwayTeam, HomeRuns, AwayRuns, Confidence,
    MlHome, MlAway, TotalLine, OddsOver, OddsUnder, HomeScore, AwayScore,
};

using Cells = std::array<std::string_view, DataLoader::COLUMN_COUNT>;

[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

/// Split on commas into exactly COLUMN_COUNT trimmed cells.
[[nodiscard]] std::optional<Cells> split(std::string_view line) noexcept {
    Cells cells{};
    std::size_t col = 0;
    for (;;) {
        const auto comma = line.find(',');
        if (col >= cells.size()) return std::nullopt;  // too many columns
        cells[col++] = trim(line.substr(0, comma));
        if (comma == std::string_view::npos) break;
        line.remove_prefix(comma + 1);
    }
    if (col != cells.size()) return std::nullopt;
    return cells;
}

/// A cell that must be empty or a finite number.  The outer optional is
/// "parsed", the inner one "present".
[[nodiscard]] std::optional<std::optional<double>> number(std::string_view cell) noexcept {
    if (cell.empty()) return std::optional<double>{};
    if (cell.front() == '+') cell.remove_prefix(1);
    double v = 0.0;
    const auto [ptr, ec] = std::from_chars(cell.data(), cell.data() + cell.size(), v);
    if (ec != std::errc{} || ptr != cell.data() + cell.size() || !std::isfinite(v)) {
        return std::nullopt;
    }
    return std::optional<double>{v};
}

[[nodiscard]] std::optional<std::optional<int>> score(std::string_view cell) noexcept {
    if (cell.empty()) return std::optional<int>{};
    int v = 0;
    const auto [ptr, ec] = std::from_chars(cell.data(), cell.data() + cell.size(), v);
    if (ec != std::errc{} || ptr != cell.data() + cell.size() || v < 0) return std::nullopt;
    return std::optional<int>{v};
}

[[nodiscard]] std::optional<std::optional<OddsQuote>> price(std::string_view cell) noexcept {
    if (cell.empty()) return std::optional<OddsQuote>{};
    auto q = odds::parse_odds_quote(cell);
    if (!q) return std::nullopt;
    return std::optional<OddsQuote>{*q};
}

}  // namespace

// ─── DataLoader::parse_row ────────────────────────────────────────────────────

std::optional<SlateRow> DataLoader::parse_row(std::string_view line) noexcept {
    const auto cells = split(line);
    if (!cells) return std::nullopt;
    const Cells& c = *cells;

    if (c[GameId].empty() || c[Date].empty() || c[HomeTeam].empty() || c[AwayTeam].empty()) {
        return std::nullopt;
    }

    const auto home_runs  = number(c[HomeRuns]);
    const auto away_runs  = number(c[AwayRuns]);
    const auto confidence = number(c[Confidence]);
    const auto ml_home    = price(c[MlHome]);
    const auto ml_away    = price(c[MlAway]);
    const auto line_value = number(c[TotalLine]);
    const auto over       = price(c[OddsOver]);
    const auto under      = price(c[OddsUnder]);
    const auto home_score = score(c[HomeScore]);
    const auto away_score = score(c[AwayScore]);

    if (!home_runs || !away_runs || !confidence || !ml_home || !ml_away ||
        !line_value || !over || !under || !home_score || !away_score) {
        return std::nullopt;
    }
    // Half a moneyline or half a final score is a malformed row.
    if (ml_home->has_value() != ml_away->has_value()) return std::nullopt;
    if (home_score->has_value() != away_score->has_value()) return std::nullopt;

    SlateRow row;
    Analysis& a = row.analysis;
    a.event_id = std::string(c[GameId]);
    a.date     = std::string(c[Date]);
    a.teams    = Teams{std::string(c[HomeTeam]), std::string(c[AwayTeam])};

    a.projections.home_runs = *home_runs;
    a.projections.away_runs = *away_runs;
    if (*home_runs && *away_runs) {
        a.projections.total_runs = **home_runs + **away_runs;
    }
    a.confidence = *confidence;

    if (*ml_home) {
        a.market.moneyline = MoneylineMarket{**ml_home, **ml_away};
    }
    if (*line_value || *over || *under) {
        a.market.total = TotalsMarket{*line_value, *over, *under};
    }

    if (*home_score) {
        backtest::HistoricalGame g;
        g.game_id    = a.event_id;
        g.date       = a.date;
        g.home_team  = a.teams.home;
        g.away_team  = a.teams.away;
        g.home_score = **home_score;
        g.away_score = **away_score;
        row.result   = std::move(g);
    }
    return row;
}

// ─── DataLoader::parse_slate_csv ──────────────────────────────────────────────

SlateLoadReport DataLoader::parse_slate_csv(std::string_view csv_content) noexcept {
    SlateLoadReport report;
    bool header_skipped = false;
    std::size_t line_no = 0;

    while (!csv_content.empty()) {
        const auto nl = csv_content.find('\n');
        std::string_view line = csv_content.substr(0, nl);
        csv_content.remove_prefix(nl == std::string_view::npos ? csv_content.size() : nl + 1);
        ++line_no;

        line = trim(line);
        if (line.empty() || line.front() == '#') continue;

        if (!header_skipped) {
            header_skipped = true;
            continue;
        }

        if (auto row = parse_row(line)) {
            report.rows.push_back(std::move(*row));
        } else {
            ++report.skipped;
            log::warn("Skipping malformed slate row {}: {}", line_no, line);
        }
    }

    if (report.skipped > 0) {
        log::warn("{} malformed slate rows skipped", report.skipped);
    }
    log::info("Loaded {} games from slate", report.rows.size());
    return report;
}

// ─── DataLoader::load_slate_csv ───────────────────────────────────────────────

std::optional<SlateLoadReport> DataLoader::load_slate_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_slate_csv(contents.str());
}

std::vector<backtest::HistoricalGame> DataLoader::games(const std::vector<SlateRow>& rows) {
    std::vector<backtest::HistoricalGame> out;
    out.reserve(rows.size());
    for (const auto& r : rows) {
        if (r.result) out.push_back(*r.result);
    }
    return out;
}

}  // namespace mlbedge::core
