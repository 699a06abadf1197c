/**
 * @file  fuzz_backtester.cpp
 * @brief libFuzzer target for the Backtester over raw observation bytes
 *
 * Build:
 *   cmake -DQSAE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_backtester
 *
 * Run for 60 seconds:
 *   ./fuzz_backtester -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. max_drawdown and every equity point's drawdown lie in [0, 1].
 *   3. bars_processed + observations_skipped never exceeds the input length.
 *   4. Trades are non-decreasing in timestamp and ids run 1, 2, 3, …
 *   5. No position is left open: the ledger has an even number of entries.
 *   6. Ratios are finite or ±inf, never NaN.
 *
 * Fuzzer strategy:
 *   Every 16 input bytes become one observation: two raw IEEE-754 doubles
 *   (price, volume), so NaN, ±inf, zero, negatives and denormals all reach
 *   the sanitiser.  The first byte selects the strategy.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#include "qsae/backtest.hpp"
#include "qsae/strategy.hpp"

using namespace qsae;
using namespace qsae::backtest;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 1) return 0;

    const auto names = strategy::reference_strategy_names();
    const auto strat = strategy::make_reference_strategy(names[data[0] % names.size()]);
    assert(strat != nullptr);
    ++data;
    --size;

    std::vector<MarketObservation> obs;
    obs.reserve(size / 16);
    for (std::size_t off = 0; off + 16 <= size; off += 16) {
        MarketObservation o;
        o.symbol = "FZ";
        std::memcpy(&o.price, data + off, sizeof(double));
        std::memcpy(&o.volume, data + off + 8, sizeof(double));
        o.timestamp = static_cast<Timestamp>(off / 16) * 60'000;
        obs.push_back(o);
    }

    BacktestConfig cfg;
    cfg.cost_rate     = 0.001;
    cfg.slippage_rate = 0.0005;

    const auto report = Backtester(cfg).run(obs, *strat);

    // Invariant 2
    assert(report.max_drawdown >= 0.0 && report.max_drawdown <= 1.0);
    for (const auto& p : report.equity_curve) {
        assert(p.drawdown >= 0.0 && p.drawdown <= 1.0);
    }

    // Invariant 3
    assert(report.bars_processed + report.observations_skipped <= obs.size());

    // Invariant 4
    for (std::size_t i = 0; i < report.trades.size(); ++i) {
        assert(report.trades[i].id == i + 1);
        if (i > 0) assert(report.trades[i].timestamp >= report.trades[i - 1].timestamp);
    }

    // Invariant 5
    assert(report.trades.size() % 2 == 0);

    // Invariant 6
    assert(!std::isnan(report.total_return));
    assert(!std::isnan(report.sharpe_ratio));
    assert(!std::isnan(report.sortino_ratio));
    assert(!std::isnan(report.calmar_ratio));
    assert(!std::isnan(report.profit_factor));

    return 0;
}
