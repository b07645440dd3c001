/**
 * @file  bench/bench_simulator.cpp
 * @brief Google Benchmark suite for the Monte Carlo win-probability simulator
 *        and the per-game pick chain.
 *
 * Benchmarks
 * ----------
 *   BM_Simulate_Trials      : single worker, trials swept 1k … 256k
 *   BM_Simulate_Workers     : 50k trials, workers swept 1 … 8
 *   BM_Project_Game         : metrics → run projection
 *   BM_Generate_Picks       : full BaseballAdapter chain for one game
 *
 * Build (CMake):
 *   cmake --build build --target bench_simulator
 *   ./build/bench_simulator --benchmark_format=json
 *
 * Throughput units: items/second (simulated games).
 * Custom counter "Mgames_per_sec" = throughput / 1e6.
 */

#include "benchmark/benchmark.h"

#include "mlbedge/log.hpp"
#include "mlbedge/metrics.hpp"
#include "mlbedge/pipeline.hpp"
#include "mlbedge/projection.hpp"
#include "mlbedge/simulator.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>

using namespace mlbedge;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// A league-average game with every observation present.
static metrics::GameObservation make_game() {
    const auto team = [](const char* name) {
        metrics::TeamObservation t;
        t.name    = name;
        t.offense = metrics::OffenseObservation{
            .runs_per_game = 4.8, .games = 120.0, .ops = 0.740,
            .ops_vs_rhp = 0.735, .ops_vs_lhp = 0.760, .runs_last_30 = 5.0};
        t.starter = metrics::PitcherObservation{
            .name = "starter", .era = 3.6, .innings = 140.0, .fip = 3.8,
            .days_rest = 5, .has_recent_logs = true};
        t.defense = metrics::DefenseObservation{
            .errors_per_game = 0.5, .games = 120.0, .has_recent = true, .has_advanced = true};
        t.bullpen = metrics::BullpenObservation{
            .era = 4.0, .innings = 300.0, .has_high_leverage = true, .has_recent = true};
        return t;
    };

    metrics::GameObservation g;
    g.event_id      = "BENCH";
    g.date          = "2024-06-01";
    g.venue         = "Yankee Stadium";
    g.temperature_c = 27.0;
    g.wind_kph      = 12.0;
    g.home          = team("NYY");
    g.away          = team("BOS");
    return g;
}

// ── Simulator benchmarks ───────────────────────────────────────────────────────

static void BM_Simulate_Trials(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const simulation::WinProbabilitySimulator sim;
    for (auto _ : state) {
        auto result = sim.simulate_moneyline(4.9, 4.2, 3.9, 4.4, n);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
    state.counters["Mgames_per_sec"] = benchmark::Counter(
        static_cast<double>(state.iterations()) * static_cast<double>(n) / 1e6,
        benchmark::Counter::kIsRate);
}
BENCHMARK(BM_Simulate_Trials)->RangeMultiplier(4)->Range(1'024, 262'144)->Unit(benchmark::kMicrosecond);

static void BM_Simulate_Workers(benchmark::State& state) {
    simulation::SimulationConfig cfg;
    cfg.workers = static_cast<std::size_t>(state.range(0));
    const simulation::WinProbabilitySimulator sim(cfg);
    for (auto _ : state) {
        auto result = sim.moneyline(4.9, 4.2, 3.9, 4.4);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(cfg.trials));
}
BENCHMARK(BM_Simulate_Workers)->RangeMultiplier(2)->Range(1, 8)->Unit(benchmark::kMillisecond)->UseRealTime();

// ── Pipeline benchmarks ────────────────────────────────────────────────────────

static void BM_Project_Game(benchmark::State& state) {
    const auto game = make_game();
    for (auto _ : state) {
        const auto m = metrics::MetricBuilder::build_game(game);
        auto proj = projection::RunProjectionModel::project_game(m);
        benchmark::DoNotOptimize(proj);
    }
}
BENCHMARK(BM_Project_Game);

static void BM_Generate_Picks(benchmark::State& state) {
    log::set_level(log::Level::Off);
    const pipeline::BaseballAdapter adapter(pipeline::AdapterConfig{}, nullptr,
                                            std::make_shared<FakeOddsProvider>());
    const auto game = make_game();
    for (auto _ : state) {
        const auto analysis = adapter.analyze_event(game);
        if (!analysis) {
            state.SkipWithError("analysis failed");
            return;
        }
        auto picks = adapter.generate_picks(*analysis);
        benchmark::DoNotOptimize(picks.data());
    }
}
BENCHMARK(BM_Generate_Picks)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
