/// @file src/main.cpp
/// @brief mlbedge CLI entry point.
///
/// Usage:
///   mlbedge --picks <csv_file>      Staked, validated picks for a slate
///   mlbedge --backtest <csv_file>   Picks for a slate, settled against final scores
///   mlbedge --help                  Print usage
///
/// Options (after the mode):
///   --profile <conservative|balanced|aggressive>
///   --bankroll <amount>   --trials <n>   --seed <n>
///   --log-level <debug|info|warn|error|off>

#include "mlbedge/backtest.hpp"
#include "mlbedge/constants.hpp"
#include "mlbedge/data_loader.hpp"
#include "mlbedge/log.hpp"
#include "mlbedge/pipeline.hpp"
#include "mlbedge/risk_profile.hpp"
#include "mlbedge/simulator.hpp"
#include "mlbedge/storage.hpp"

#include <fmt/core.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace {

struct Options {
    std::string              mode;
    std::string              path;
    mlbedge::RiskProfile     profile  = mlbedge::RiskProfile::balanced();
    double                   bankroll = mlbedge::constants::DEFAULT_BANKROLL;
    mlbedge::simulation::SimulationConfig sim;
};

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  mlbedge --picks <csv_file>      Staked, validated picks for a slate\n"
        "  mlbedge --backtest <csv_file>   Settle the slate's picks against final scores\n"
        "  mlbedge --help                  Show this help\n"
        "\n"
        "Options:\n"
        "  --profile <{}>   (default balanced)\n"
        "  --bankroll <amount>   (default {:.0f})\n"
        "  --trials <n>          Monte Carlo trials per game (default {})\n"
        "  --seed <n>            Simulation seed\n"
        "  --log-level <debug|info|warn|error|off>\n"
        "\n"
        "CSV format (header required):\n"
        "  game_id,date,home_team,away_team,home_runs,away_runs,confidence,\n"
        "  ml_home,ml_away,total_line,odds_over,odds_under,home_score,away_score\n",
        fmt::join(mlbedge::RiskProfile::preset_names(), "|"),
        mlbedge::constants::DEFAULT_BANKROLL, mlbedge::constants::DEFAULT_TRIALS);
}

template <typename T>
[[nodiscard]] std::optional<T> parse_number(std::string_view s) {
    T v{};
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

/// Parse argv into Options.  Prints the problem and returns nullopt on any
/// malformed flag.
std::optional<Options> parse_args(int argc, char* argv[]) {
    Options opt;
    opt.mode = argv[1];
    if (opt.mode == "--help" || opt.mode == "-h") return opt;

    if (argc < 3) {
        fmt::print(stderr, "Error: {} requires a CSV file path\n", opt.mode);
        return std::nullopt;
    }
    opt.path = argv[2];
    opt.sim.workers = std::max(1u, std::thread::hardware_concurrency());

    for (int i = 3; i < argc; ++i) {
        const std::string_view flag(argv[i]);
        if (i + 1 >= argc) {
            fmt::print(stderr, "Error: {} requires a value\n", flag);
            return std::nullopt;
        }
        const std::string_view value(argv[++i]);

        if (flag == "--profile") {
            auto p = mlbedge::RiskProfile::from_name(value);
            if (!p) {
                fmt::print(stderr, "Error: unknown profile '{}'\n", value);
                return std::nullopt;
            }
            opt.profile = std::move(*p);
        } else if (flag == "--bankroll") {
            const auto b = parse_number<double>(value);
            if (!b || !(*b > 0.0)) {
                fmt::print(stderr, "Error: bankroll must be a positive number\n");
                return std::nullopt;
            }
            opt.bankroll = *b;
        } else if (flag == "--trials") {
            const auto n = parse_number<std::size_t>(value);
            if (!n || *n == 0) {
                fmt::print(stderr, "Error: trials must be a positive integer\n");
                return std::nullopt;
            }
            opt.sim.trials = *n;
        } else if (flag == "--seed") {
            const auto s = parse_number<std::uint64_t>(value);
            if (!s) {
                fmt::print(stderr, "Error: seed must be a non-negative integer\n");
                return std::nullopt;
            }
            opt.sim.seed = *s;
        } else if (flag == "--log-level") {
            const auto l = mlbedge::log::parse_level(value);
            if (!l) {
                fmt::print(stderr, "Error: unknown log level '{}'\n", value);
                return std::nullopt;
            }
            mlbedge::log::set_level(*l);
        } else {
            fmt::print(stderr, "Unknown option: {}\n", flag);
            return std::nullopt;
        }
    }
    return opt;
}

/// Picks for every game in the slate, with the daily cap applied per date.
std::vector<mlbedge::Pick> slate_picks(const Options& opt,
                                       const std::vector<mlbedge::core::SlateRow>& rows) {
    using namespace mlbedge;

    pipeline::AdapterConfig cfg;
    cfg.profile  = opt.profile;
    cfg.bankroll = opt.bankroll;

    auto model   = std::make_shared<simulation::WinProbabilitySimulator>(opt.sim);
    auto adapter = std::make_shared<pipeline::BaseballAdapter>(cfg, nullptr, nullptr, model);
    const pipeline::PickPipeline pipe(adapter);

    std::map<std::string, std::vector<Analysis>> by_date;
    for (const auto& r : rows) by_date[r.analysis.date].push_back(r.analysis);

    std::vector<Pick> picks;
    for (const auto& [date, analyses] : by_date) {
        auto day = pipe.run_analyses(analyses);
        picks.insert(picks.end(), day.begin(), day.end());
    }
    return picks;
}

/// Load the slate and print the picks.  Returns 0 on success, 1 on error.
int run_picks(const Options& opt, bool settle) {
    using namespace mlbedge;

    auto slate = core::DataLoader::load_slate_csv(opt.path);
    if (!slate) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", opt.path);
        return 1;
    }
    if (slate->rows.empty()) {
        fmt::print(stderr, "Error: no valid games loaded from '{}'\n", opt.path);
        return 1;
    }

    fmt::print("Loaded {} games from '{}' ({} skipped)\n", slate->rows.size(), opt.path,
               slate->skipped);
    fmt::print("{}\n\n", opt.profile.to_string());

    const auto picks = slate_picks(opt, slate->rows);
    if (picks.empty()) {
        fmt::print("No picks cleared the {} profile.\n", opt.profile.name);
    }
    for (const auto& p : picks) {
        fmt::print("{}\n", p.to_string());
    }
    if (!settle) return 0;

    const auto games = core::DataLoader::games(slate->rows);
    backtest::BacktestConfig bt_cfg;
    bt_cfg.initial_bankroll = opt.bankroll;
    const backtest::BacktestEngine engine(bt_cfg);

    const auto results = engine.run(games, picks);
    fmt::print("\n");
    for (const auto& r : results) {
        fmt::print("{}\n", r.to_string());
    }
    const auto summary = engine.summarize(results, picks.size() - results.size());
    fmt::print("\n{}", summary.to_string());

    storage::InMemoryPickStore store;
    for (const auto& r : slate->rows) store.save_event(r.analysis);
    const auto ids = storage::record_results(store, results);
    fmt::print("\nStored {} settled picks: {}\n", ids.size(),
               store.get_performance_stats().to_string());
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const auto opt = parse_args(argc, argv);
    if (!opt) {
        print_usage();
        return 1;
    }

    if (opt->mode == "--help" || opt->mode == "-h") {
        print_usage();
        return 0;
    }
    if (opt->mode == "--picks") {
        return run_picks(*opt, false);
    }
    if (opt->mode == "--backtest") {
        return run_picks(*opt, true);
    }

    fmt::print(stderr, "Unknown option: {}\n", opt->mode);
    print_usage();
    return 1;
}
