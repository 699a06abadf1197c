/**
 * @file  fuzz_optimizer.cpp
 * @brief libFuzzer target for PortfolioOptimizer::optimize
 *
 * Build:
 *   cmake -DQSAE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_optimizer
 *
 * Run for 60 seconds:
 *   ./fuzz_optimizer -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. For a non-empty universe, Σ weights = 1 within 1e-9.
 *   3. Every weight is finite.
 *   4. Every rebalance action moves more than the configured threshold.
 *
 * Fuzzer strategy:
 *   Byte 0 picks the objective, byte 1 the universe size (1–16).  Each asset
 *   then consumes 24 bytes: raw doubles for price, 24h change and market
 *   cap.  Symbols repeat every 8 assets so duplicate handling is exercised.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include "qsae/portfolio.hpp"

using namespace qsae::portfolio;

namespace {

double read_double(const uint8_t* p) {
    double v;
    std::memcpy(&v, p, sizeof(double));
    return v;
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 2) return 0;

    constexpr Objective kObjectives[] = {
        Objective::MeanVariance, Objective::RiskParity, Objective::BlackLitterman,
        Objective::MinVariance,  Objective::MaxSharpe,
    };

    OptimizationRequest req;
    req.objective     = kObjectives[data[0] % 5];
    req.total_capital = 100'000.0;
    const std::size_t n = 1 + data[1] % 16;
    data += 2;
    size -= 2;

    for (std::size_t i = 0; i < n && (i + 1) * 24 <= size; ++i) {
        const uint8_t* p = data + i * 24;
        MarketSnapshot s;
        s.symbol             = "A" + std::to_string(i % 8);
        s.price              = read_double(p);
        s.change_percent_24h = read_double(p + 8);
        const double cap     = read_double(p + 16);
        if (cap > 0.0) s.market_cap = cap;
        req.market.push_back(s);
    }

    const PortfolioOptimizer optimizer;
    const auto result = optimizer.optimize(req);

    if (!result.symbols.empty()) {
        // Invariants 2 and 3
        double sum = 0.0;
        for (const auto& [symbol, w] : result.weights) {
            assert(std::isfinite(w));
            sum += w;
        }
        assert(std::abs(sum - 1.0) < 1e-9);
    }

    // Invariant 4
    for (const auto& action : result.rebalance_actions) {
        assert(std::abs(action.weight_delta) > optimizer.config().rebalance_threshold);
    }

    return 0;
}
