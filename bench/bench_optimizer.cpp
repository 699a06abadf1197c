/**
 * @file  bench/bench_optimizer.cpp
 * @brief Google Benchmark suite for the portfolio optimizer.
 *
 * Benchmarks
 * ----------
 *   BM_Invert_GaussJordan / Cholesky   - n×n SPD inversion
 *   BM_Optimize/<objective>            - full optimize() per objective
 *   BM_Optimize_Cached                 - optimize() through a warm cache
 *
 * Build (CMake):
 *   cmake -DQSAE_BENCH=ON ..
 *   cmake --build build --target bench_optimizer
 *   ./build/bench_optimizer --benchmark_format=json
 */

#include "benchmark/benchmark.h"

#include "qsae/covariance_cache.hpp"
#include "qsae/linalg.hpp"
#include "qsae/portfolio.hpp"

#include <cstddef>
#include <string>
#include <vector>

using namespace qsae;
using namespace qsae::portfolio;

// ── Fixture helpers ────────────────────────────────────────────────────────────

static OptimizationRequest make_request(std::size_t n, Objective objective) {
    OptimizationRequest req;
    req.objective     = objective;
    req.total_capital = 1'000'000.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double x = static_cast<double>(i);
        req.market.push_back(MarketSnapshot{
            .symbol             = "SYM" + std::to_string(i),
            .price              = 10.0 + x,
            .change_percent_24h = -4.0 + 8.0 * x / static_cast<double>(n),
            .volume_24h         = 1e6,
            .market_cap         = 1e9 * (1.0 + x),
        });
    }
    req.positions.push_back(Holding{.symbol = "SYM0", .quantity = 1'000.0, .entry_price = 10.0});
    return req;
}

static Matrix make_spd(Eigen::Index n) {
    Matrix a = Matrix::Constant(n, n, 0.3);
    a.diagonal().setOnes();
    return a;
}

// ── Inversion ──────────────────────────────────────────────────────────────────

static void BM_Invert_GaussJordan(benchmark::State& state) {
    const Matrix a = make_spd(state.range(0));
    for (auto _ : state) {
        auto inv = linalg::invert(a, linalg::InversionMethod::GaussJordan);
        benchmark::DoNotOptimize(inv);
    }
}
BENCHMARK(BM_Invert_GaussJordan)->RangeMultiplier(2)->Range(4, 128)->Unit(benchmark::kMicrosecond);

static void BM_Invert_Cholesky(benchmark::State& state) {
    const Matrix a = make_spd(state.range(0));
    for (auto _ : state) {
        auto inv = linalg::invert(a, linalg::InversionMethod::Cholesky);
        benchmark::DoNotOptimize(inv);
    }
}
BENCHMARK(BM_Invert_Cholesky)->RangeMultiplier(2)->Range(4, 128)->Unit(benchmark::kMicrosecond);

// ── Optimize ───────────────────────────────────────────────────────────────────

static void BM_Optimize(benchmark::State& state) {
    const auto objective = static_cast<Objective>(state.range(0));
    const auto req       = make_request(static_cast<std::size_t>(state.range(1)), objective);
    const PortfolioOptimizer optimizer;
    for (auto _ : state) {
        auto result = optimizer.optimize(req);
        benchmark::DoNotOptimize(result.expected_risk);
    }
    state.SetLabel(std::string(to_string(objective)));
}
BENCHMARK(BM_Optimize)
    ->ArgsProduct({benchmark::CreateDenseRange(0, 4, 1), {8, 32, 64}})
    ->Unit(benchmark::kMicrosecond);

static void BM_Optimize_Cached(benchmark::State& state) {
    const auto req = make_request(static_cast<std::size_t>(state.range(0)), Objective::MinVariance);
    const PortfolioOptimizer optimizer;
    CovarianceCache cache;
    for (auto _ : state) {
        auto result = optimizer.optimize(req, cache);
        benchmark::DoNotOptimize(result.expected_risk);
    }
    state.counters["hit_rate"] = benchmark::Counter(
        static_cast<double>(cache.hits()) /
        static_cast<double>(cache.hits() + cache.misses()));
}
BENCHMARK(BM_Optimize_Cached)->Arg(8)->Arg(32)->Arg(64)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
