/**
 * @file  prop_trade_conservation.cpp
 * @brief Property: cash is conserved across every round trip
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_trade_conservation
 *
 * For every closing trade:
 *   realized_pnl + cost + slippage = q · (exit − entry)     (long)
 *   realized_pnl + cost + slippage = q · (entry − exit)     (short)
 *
 * And for the whole run, with every position closed at the end:
 *   final_equity = initial + Σ realized_pnl − Σ opening costs
 */

#include <rapidcheck.h>
#include <algorithm>
#include <cmath>
#include <optional>
#include <vector>

#include "qsae/backtest.hpp"

using namespace qsae;
using namespace qsae::backtest;

int main() {
    rc::check(
        "trade_conservation: per-trade and whole-run cash identities",
        [] {
            const auto n     = *rc::gen::inRange<std::size_t>(0, 250);
            const auto moves = *rc::gen::container<std::vector<int>>(n, rc::gen::inRange(-60, 61));

            std::vector<MarketObservation> obs;
            double price = 50.0;
            for (std::size_t i = 0; i < n; ++i) {
                price = std::max(0.01, price * (1.0 + moves[i] / 1'000.0));
                obs.push_back(MarketObservation{.symbol = "P", .price = price, .volume = 1.0,
                                                .timestamp = static_cast<Timestamp>(i)});
            }

            BacktestConfig cfg;
            cfg.cost_rate       = *rc::gen::inRange(0, 100) / 10'000.0;
            cfg.slippage_rate   = *rc::gen::inRange(0, 100) / 10'000.0;
            cfg.initial_capital = *rc::gen::inRange(100, 1'000'000);

            const auto report = Backtester(cfg).run(obs, strategy::MovingAverageCrossover{2, 6});
            const double scale = cfg.initial_capital;

            std::optional<Trade> open;
            double expected = cfg.initial_capital;
            for (const auto& t : report.trades) {
                if (!t.realized_pnl) {
                    RC_ASSERT(!open.has_value());
                    open = t;
                    expected -= t.cost;
                    continue;
                }
                RC_ASSERT(open.has_value());
                const double gross = t.kind == TradeKind::CloseLong
                                         ? t.quantity * (t.price - open->price)
                                         : t.quantity * (open->price - t.price);
                RC_ASSERT(std::abs(*t.realized_pnl + t.cost + t.slippage - gross) <= 1e-9 * scale);
                expected += *t.realized_pnl;
                open.reset();
            }

            RC_ASSERT(!open.has_value());
            RC_ASSERT(std::abs(report.final_equity - expected) <= 1e-9 * scale);
        }
    );

    return 0;
}
