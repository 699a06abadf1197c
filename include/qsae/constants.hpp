#pragma once

#include <cstddef>

/// @file include/qsae/constants.hpp
/// @brief Numerical and financial constants for the QSAE engine.
///
/// Every configuration struct takes its defaults from here so that the
/// backtester and the optimizer agree on shared conventions (annualisation,
/// tolerances, cost model).

namespace qsae::constants {

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

/// Pivot magnitude below which Gauss-Jordan treats a matrix as singular.
static constexpr double SINGULAR_PIVOT_EPSILON = 1e-10;

/// Tolerance used when comparing weight deltas against rebalance thresholds.
static constexpr double WEIGHT_EPSILON = 1e-9;

// ─── Calendar ─────────────────────────────────────────────────────────────────

/// Default annualisation factor: 252 trading days per year.
static constexpr double ANNUALISATION_FACTOR = 252.0;

/// Crypto markets trade every day; used to annualise 24h volatility.
static constexpr double CRYPTO_DAYS_PER_YEAR = 365.0;

// ─── Backtester Defaults ──────────────────────────────────────────────────────

/// Fee charged on every fill, as a fraction of notional.
static constexpr double DEFAULT_COST_RATE = 0.001;

/// Execution-price penalty, as a fraction of notional.
static constexpr double DEFAULT_SLIPPAGE_RATE = 0.0005;

/// Starting cash for a simulation.
static constexpr double DEFAULT_INITIAL_CAPITAL = 10000.0;

/// Fraction of current capital committed to a new position before the
/// confidence scaling is applied.
static constexpr double DEFAULT_POSITION_FRACTION = 0.10;

/// Default per-period risk-free rate (zero - excess-return framing).
static constexpr double DEFAULT_RISK_FREE_RATE = 0.0;

/// Confidence level for the historical Value-at-Risk in backtest reports.
static constexpr double DEFAULT_VAR_CONFIDENCE = 0.95;

// ─── Strategy Defaults ────────────────────────────────────────────────────────

/// An ensemble must clear this normalised score before it trades.
static constexpr double ENSEMBLE_SIGNAL_THRESHOLD = 0.3;

/// Reference strategies never report more confidence than this.
static constexpr double MAX_STRATEGY_CONFIDENCE = 0.9;

// ─── Optimizer Defaults ───────────────────────────────────────────────────────

/// Annual risk-free rate used by the optimizer's Sharpe analogues.
static constexpr double OPTIMIZER_RISK_FREE_RATE = 0.02;

/// Cost charged on rebalance notional.
static constexpr double REBALANCE_COST_RATE = 0.001;

/// |Δw| must exceed this before a rebalance action is emitted.
static constexpr double REBALANCE_THRESHOLD = 0.05;

/// |Δw| at or above this marks an action as high priority.
static constexpr double HIGH_PRIORITY_THRESHOLD = 0.10;

/// Risk parity fixed-point passes and damping exponent.
static constexpr std::size_t RISK_PARITY_ITERATIONS = 100;
static constexpr double RISK_PARITY_DAMPING = 0.1;

/// Black-Litterman risk aversion δ and prior scaling τ.
static constexpr double BL_RISK_AVERSION = 3.0;
static constexpr double BL_TAU = 0.025;

/// Pairwise correlation assumed when no return history is available.
static constexpr double DEFAULT_PAIRWISE_CORRELATION = 0.3;

/// Volatility substituted for a zero estimate in inverse-volatility weighting.
static constexpr double FALLBACK_VOLATILITY = 0.1;

/// One-sided normal quantiles for parametric VaR.
static constexpr double Z_95 = 1.645;
static constexpr double Z_99 = 2.326;

/// Expected shortfall approximated as this multiple of VaR95.
static constexpr double ES_VAR_MULTIPLIER = 1.2;

/// Default covariance cache bucket: one hour in milliseconds.
static constexpr long long DEFAULT_CACHE_BUCKET_MS = 3'600'000;

} // namespace qsae::constants
