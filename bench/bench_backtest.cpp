/**
 * @file  bench/bench_backtest.cpp
 * @brief Google Benchmark suite for the strategy and backtest hot paths.
 *
 * Benchmarks
 * ----------
 *   BM_Indicator_Rsi            - RSI over a full series
 *   BM_Strategy_Evaluate        - one evaluation per reference strategy
 *   BM_Ensemble_Evaluate        - default four-member ensemble
 *   BM_Backtest_MovingAverage   - full replay, single strategy
 *   BM_Backtest_Ensemble        - full replay, default ensemble
 *   BM_MonteCarlo_50            - 50 shuffled replays
 *
 * Build (CMake):
 *   cmake -DQSAE_BENCH=ON ..
 *   cmake --build build --target bench_backtest
 *   ./build/bench_backtest --benchmark_format=json
 *
 * Throughput units: items/second (bars replayed).
 */

#include "benchmark/benchmark.h"

#include "qsae/backtest.hpp"
#include "qsae/indicators.hpp"
#include "qsae/strategy.hpp"

#include <cmath>
#include <cstddef>
#include <random>
#include <string>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// Geometric random walk, fixed seed so every run measures the same series.
static std::vector<qsae::MarketObservation> make_walk(std::size_t n) {
    std::mt19937_64 rng(42);
    std::normal_distribution<double> step(0.0, 0.01);
    std::vector<qsae::MarketObservation> obs(n);
    double price = 100.0;
    for (std::size_t i = 0; i < n; ++i) {
        price *= std::exp(step(rng));
        obs[i].symbol    = "BENCH";
        obs[i].price     = price;
        obs[i].volume    = 1'000.0 + 500.0 * std::abs(step(rng)) * 100.0;
        obs[i].timestamp = static_cast<qsae::Timestamp>(i) * 60'000;
    }
    return obs;
}

static std::vector<double> prices_of(const std::vector<qsae::MarketObservation>& obs) {
    std::vector<double> p;
    p.reserve(obs.size());
    for (const auto& o : obs) p.push_back(o.price);
    return p;
}

static std::vector<double> volumes_of(const std::vector<qsae::MarketObservation>& obs) {
    std::vector<double> v;
    v.reserve(obs.size());
    for (const auto& o : obs) v.push_back(o.volume);
    return v;
}

// ── Indicators ─────────────────────────────────────────────────────────────────

static void BM_Indicator_Rsi(benchmark::State& state) {
    const auto prices = prices_of(make_walk(static_cast<std::size_t>(state.range(0))));
    for (auto _ : state) {
        auto out = qsae::strategy::indicators::rsi(prices, 14);
        benchmark::DoNotOptimize(out.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_Indicator_Rsi)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

// ── Single evaluations ─────────────────────────────────────────────────────────

static void BM_Strategy_Evaluate(benchmark::State& state) {
    const auto names = qsae::strategy::reference_strategy_names();
    const auto strat = qsae::strategy::make_reference_strategy(
        names[static_cast<std::size_t>(state.range(0))]);
    const auto obs     = make_walk(strat->minimum_lookback());
    const auto prices  = prices_of(obs);
    const auto volumes = volumes_of(obs);
    const qsae::strategy::MarketWindow window{.prices = prices, .volumes = volumes};

    for (auto _ : state) {
        auto sig = strat->evaluate(window);
        benchmark::DoNotOptimize(sig.confidence);
    }
    state.SetLabel(std::string(strat->name()));
}
BENCHMARK(BM_Strategy_Evaluate)->DenseRange(0, 3);

static void BM_Ensemble_Evaluate(benchmark::State& state) {
    const auto ensemble = qsae::strategy::default_ensemble();
    const auto obs      = make_walk(ensemble.minimum_lookback());
    const auto prices   = prices_of(obs);
    const auto volumes  = volumes_of(obs);
    const qsae::strategy::MarketWindow window{.prices = prices, .volumes = volumes};

    for (auto _ : state) {
        auto sig = ensemble.evaluate(window);
        benchmark::DoNotOptimize(sig.confidence);
    }
}
BENCHMARK(BM_Ensemble_Evaluate);

// ── Full replays ───────────────────────────────────────────────────────────────

static void BM_Backtest_MovingAverage(benchmark::State& state) {
    const auto obs = make_walk(static_cast<std::size_t>(state.range(0)));
    const qsae::strategy::MovingAverageCrossover ma;
    const qsae::backtest::Backtester bt;
    for (auto _ : state) {
        auto report = bt.run(obs, ma);
        benchmark::DoNotOptimize(report.final_equity);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_Backtest_MovingAverage)->RangeMultiplier(4)->Range(256, 16384)->Unit(benchmark::kMillisecond);

static void BM_Backtest_Ensemble(benchmark::State& state) {
    const auto obs      = make_walk(static_cast<std::size_t>(state.range(0)));
    const auto ensemble = qsae::strategy::default_ensemble();
    const qsae::backtest::Backtester bt;
    for (auto _ : state) {
        auto report = bt.run(obs, ensemble);
        benchmark::DoNotOptimize(report.final_equity);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_Backtest_Ensemble)->RangeMultiplier(4)->Range(256, 16384)->Unit(benchmark::kMillisecond);

static void BM_MonteCarlo_50(benchmark::State& state) {
    const auto obs = make_walk(1'000);
    const qsae::strategy::MovingAverageCrossover ma;
    for (auto _ : state) {
        auto summary = qsae::backtest::run_monte_carlo(obs, ma, 50, 7);
        benchmark::DoNotOptimize(summary.mean_return);
    }
}
BENCHMARK(BM_MonteCarlo_50)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
