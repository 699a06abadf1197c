#pragma once

/// @file include/qsae/backtest.hpp
/// @brief Backtest Simulator - public API.
///
/// # Module: Backtest Simulator
///
/// ## Responsibility
/// Replay an ordered series of market observations through a Strategy, one
/// bar at a time, holding at most one position (flat, long or short), and
/// account for transaction cost and slippage on every fill.  Produce a full
/// performance report from the resulting equity curve and trade ledger.
///
/// ## Execution Model
/// For a strategy with minimum lookback L and n sanitised observations:
///
///     for i in [L, n):
///         window  = observations [i − L, i)      (strictly before i)
///         signal  = strategy.evaluate(window)
///         execute signal at price[i]
///         mark to market at price[i]
///
/// Any open position is force-closed at the last observed price.
///
/// ## Cost Model
///   notional  = min(position_fraction × cash, cash) × confidence
///   quantity  = notional / price
///   cost      = notional × cost_rate
///   slippage  = notional × slippage_rate
///   long entry  = price + slippage / quantity
///   short entry = price − slippage / quantity
///
/// ## Guarantees
/// - Deterministic: identical inputs produce identical reports
/// - Never throws for malformed data: bad observations are skipped and counted
/// - Every ratio in the report is finite when no trade occurs
/// - The trade ledger is append-only and non-decreasing in timestamp
///
/// ## NOT Responsible For
/// - Signal generation (see include/qsae/strategy.hpp)
/// - Order routing or persistence

#include "qsae/constants.hpp"
#include "qsae/strategy.hpp"
#include "qsae/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace qsae::backtest {

// ─── Types ────────────────────────────────────────────────────────────────────

/// Which side of the market the simulator currently holds.
enum class Side { None, Long, Short };

/// Position transition recorded by a Trade.
enum class TradeKind { OpenLong, OpenShort, CloseLong, CloseShort };

[[nodiscard]] std::string_view to_string(Side side) noexcept;
[[nodiscard]] std::string_view to_string(TradeKind kind) noexcept;

/// The single open position.
struct Position {
    Side      side        = Side::None;
    double    entry_price = 0.0;  ///< Slippage-adjusted
    double    quantity    = 0.0;
    Timestamp opened_at   = 0;
};

/// One ledger entry per position transition.
struct Trade {
    std::uint64_t         id        = 0;  ///< Sequential from 1
    Action                action    = Action::Hold;
    TradeKind             kind      = TradeKind::OpenLong;
    double                price     = 0.0;  ///< Execution price (entry price for opens)
    double                quantity  = 0.0;
    Timestamp             timestamp = 0;
    double                cost      = 0.0;
    double                slippage  = 0.0;
    std::optional<double> realized_pnl;  ///< Set on closing trades only
};

/// Equity after each simulated bar.
struct EquityPoint {
    Timestamp timestamp = 0;
    double    equity    = 0.0;
    double    drawdown  = 0.0;  ///< (peak − equity) / peak, in [0, 1]
};

/// A strategy evaluation made during the replay.
struct SignalRecord {
    std::size_t index     = 0;  ///< Index into the sanitised observations
    Timestamp   timestamp = 0;
    Signal      signal;
};

/// Simulation parameters.
struct BacktestConfig {
    double cost_rate         = constants::DEFAULT_COST_RATE;
    double slippage_rate     = constants::DEFAULT_SLIPPAGE_RATE;
    double initial_capital   = constants::DEFAULT_INITIAL_CAPITAL;
    double position_fraction = constants::DEFAULT_POSITION_FRACTION;
    double risk_free_rate    = constants::DEFAULT_RISK_FREE_RATE;  ///< Per period
    double annualisation     = constants::ANNUALISATION_FACTOR;
    double var_confidence    = constants::DEFAULT_VAR_CONFIDENCE;
    bool   verbose           = false;  ///< Log transitions to stderr
};

/// Result of one backtest.  Read-only, fully recomputed per run.
struct BacktestReport {
    std::string strategy_name;

    // Returns
    double initial_capital     = 0.0;
    double final_equity        = 0.0;
    double total_return        = 0.0;  ///< (final − initial) / initial
    double annualised_return   = 0.0;  ///< Compounded over bars_processed
    double buy_and_hold_return = 0.0;  ///< Over the simulated span
    double total_costs         = 0.0;
    double total_slippage      = 0.0;

    // Trades
    std::size_t total_trades     = 0;  ///< Ledger entries (opens + closes)
    std::size_t completed_trades = 0;  ///< Round trips
    std::size_t winning_trades   = 0;
    std::size_t losing_trades    = 0;
    double win_rate              = 0.0;
    double avg_win               = 0.0;
    double avg_loss              = 0.0;  ///< Magnitude (≥ 0)
    double largest_win           = 0.0;
    double largest_loss          = 0.0;  ///< Most negative realized P&L (≤ 0)
    double profit_factor         = 0.0;
    double expectancy            = 0.0;  ///< Mean realized P&L per round trip
    double payoff_ratio          = 0.0;  ///< avg_win / avg_loss
    double system_quality_number = 0.0;  ///< mean/σ of P&L × √round trips
    double avg_hold_time_ms      = 0.0;

    // Risk
    double      sharpe_ratio          = 0.0;
    double      sortino_ratio         = 0.0;
    double      calmar_ratio          = 0.0;
    double      value_at_risk         = 0.0;
    double      volatility            = 0.0;  ///< Annualised σ of returns
    double      max_drawdown          = 0.0;
    std::size_t max_drawdown_duration = 0;    ///< Longest run of bars below peak
    double      ulcer_index           = 0.0;
    double      recovery_factor       = 0.0;

    // Benchmark-relative (per bar, over the common prefix of the two series)
    double alpha             = 0.0;  ///< OLS intercept of returns on benchmark
    double beta              = 0.0;  ///< OLS slope; 0 for a zero-variance benchmark
    double tracking_error    = 0.0;  ///< σ(returns − benchmark)
    double information_ratio = 0.0;  ///< mean(returns − benchmark) / tracking_error

    // Series
    std::vector<EquityPoint>  equity_curve;
    std::vector<double>       returns;
    std::vector<double>       benchmark_returns;  ///< Aligned with `returns`
    std::vector<SignalRecord> signals;
    std::vector<Trade>        trades;

    // Span
    Timestamp   start_time           = 0;
    Timestamp   end_time             = 0;
    std::size_t bars_processed       = 0;
    std::size_t observations_skipped = 0;

    /// Human-readable multi-line summary.
    [[nodiscard]] std::string to_string() const;
};

/// Distribution of total returns across shuffled replays.
struct MonteCarloSummary {
    std::size_t         iterations_requested = 0;
    std::size_t         iterations_completed = 0;
    double              mean_return          = 0.0;
    double              stddev_return        = 0.0;
    double              win_probability      = 0.0;  ///< Fraction with total_return > 0
    double              best_return          = 0.0;
    double              worst_return         = 0.0;
    double              p5_return            = 0.0;
    double              p95_return           = 0.0;
    std::vector<double> returns;

    [[nodiscard]] bool cancelled() const noexcept {
        return iterations_completed < iterations_requested;
    }

    [[nodiscard]] std::string to_string() const;
};

// ─── Backtester ───────────────────────────────────────────────────────────────

/// Bar-by-bar simulator.
///
/// Usage pattern:
/// ```cpp
/// BacktestConfig cfg;
/// cfg.cost_rate = 0.002;
///
/// Backtester bt(cfg);
/// auto report = bt.run(observations, strategy::MovingAverageCrossover{});
/// fmt::print("{}\n", report.to_string());
/// ```
class Backtester {
public:
    explicit Backtester(BacktestConfig config = BacktestConfig{});

    /// Replay `observations` through `strategy`.
    ///
    /// # Arguments
    /// * `benchmark_returns` - Per-bar benchmark returns aligned with the
    ///   simulated bars.  Empty selects the traded asset's own close-to-close
    ///   returns (buy-and-hold).  A shorter series is used over its length.
    ///
    /// # Returns
    /// A well-formed report.  Empty input, or input shorter than the
    /// strategy's minimum lookback, yields zero trades and zero ratios.
    [[nodiscard]] BacktestReport
    run(std::span<const MarketObservation> observations,
        const strategy::Strategy&          strategy,
        std::span<const double>            benchmark_returns = {}) const;

    [[nodiscard]] const BacktestConfig& config() const noexcept { return config_; }

private:
    BacktestConfig config_;
};

/// Convenience entry point with the cost model spelled out.
[[nodiscard]] BacktestReport
run_backtest(std::span<const MarketObservation> observations,
             const strategy::Strategy&          strategy,
             double cost_rate       = constants::DEFAULT_COST_RATE,
             double slippage_rate   = constants::DEFAULT_SLIPPAGE_RATE,
             double initial_capital = constants::DEFAULT_INITIAL_CAPITAL);

// ─── Monte Carlo ──────────────────────────────────────────────────────────────

/// Robustness check by order resampling.
///
/// Each iteration shuffles a copy of the observations (prices, volumes and
/// symbols move together; the original timestamps are re-applied in order so
/// the shuffled series remains a valid timeline) and reruns the backtest.
/// The shuffle intentionally destroys temporal structure.
///
/// # Arguments
/// * `seed`   - Deterministic `std::mt19937_64` seed; `nullopt` draws one
///              from `std::random_device`.
/// * `stop`   - Checked between iterations; a stop request ends the run
///              early and the summary covers the completed iterations.
[[nodiscard]] MonteCarloSummary
run_monte_carlo(std::span<const MarketObservation> observations,
                const strategy::Strategy&          strategy,
                std::size_t                        iterations,
                std::optional<std::uint64_t>       seed   = std::nullopt,
                std::stop_token                    stop   = {},
                const BacktestConfig&              config = BacktestConfig{});

}  // namespace qsae::backtest
