/// @file src/backtest/report.cpp
/// @brief Human-readable formatting of backtest and Monte Carlo results.

#include "qsae/backtest.hpp"

#include <fmt/format.h>

namespace qsae::backtest {

std::string BacktestReport::to_string() const {
    return fmt::format(
        "┌──────────────────────────────────────────────────────────┐\n"
        "│ Backtest: {:<47}│\n"
        "├───────────────────────────┬──────────────────────────────┤\n"
        "│ Bars / skipped            │ {:>12} / {:<15}│\n"
        "│ Final equity              │ {:>28.2f} │\n"
        "│ Total return              │ {:>27.4f}% │\n"
        "│ Annualised return         │ {:>27.4f}% │\n"
        "│ Buy & hold return         │ {:>27.4f}% │\n"
        "│ Costs / slippage          │ {:>13.4f} / {:<13.4f}│\n"
        "├───────────────────────────┼──────────────────────────────┤\n"
        "│ Ledger entries / trips    │ {:>12} / {:<15}│\n"
        "│ Win rate                  │ {:>27.2f}% │\n"
        "│ Profit factor             │ {:>28.4f} │\n"
        "│ Expectancy                │ {:>28.4f} │\n"
        "│ SQN                       │ {:>28.4f} │\n"
        "├───────────────────────────┼──────────────────────────────┤\n"
        "│ Sharpe / Sortino          │ {:>13.4f} / {:<13.4f}│\n"
        "│ Calmar                    │ {:>28.4f} │\n"
        "│ VaR                       │ {:>28.4f} │\n"
        "│ Volatility (annualised)   │ {:>28.4f} │\n"
        "│ Max drawdown / bars       │ {:>13.4f} / {:<13}│\n"
        "│ Ulcer index               │ {:>28.4f} │\n"
        "├───────────────────────────┼──────────────────────────────┤\n"
        "│ Alpha / beta              │ {:>13.6f} / {:<13.4f}│\n"
        "│ Tracking error / IR       │ {:>13.6f} / {:<13.4f}│\n"
        "└───────────────────────────┴──────────────────────────────┘\n",
        strategy_name,
        bars_processed, observations_skipped,
        final_equity,
        total_return * 100.0,
        annualised_return * 100.0,
        buy_and_hold_return * 100.0,
        total_costs, total_slippage,
        total_trades, completed_trades,
        win_rate * 100.0,
        profit_factor,
        expectancy,
        system_quality_number,
        sharpe_ratio, sortino_ratio,
        calmar_ratio,
        value_at_risk,
        volatility,
        max_drawdown, max_drawdown_duration,
        ulcer_index,
        alpha, beta,
        tracking_error, information_ratio);
}

std::string MonteCarloSummary::to_string() const {
    return fmt::format(
        "Monte Carlo: {}/{} iterations{}\n"
        "  mean={:+.4f}  stddev={:.4f}  P(win)={:.2f}\n"
        "  best={:+.4f}  worst={:+.4f}  p5={:+.4f}  p95={:+.4f}",
        iterations_completed, iterations_requested, cancelled() ? " (cancelled)" : "",
        mean_return, stddev_return, win_probability,
        best_return, worst_return, p5_return, p95_return);
}

}  // namespace qsae::backtest
