#pragma once

/// @file include/qsae/types.hpp
/// @brief Shared value types for the Quantitative Simulation & Allocation
///        Engine (QSAE).
///
/// Every module includes this file. It defines the market observation fed in
/// by the data collaborator, the trading signal produced by strategies, and
/// the Eigen aliases used by the optimizer.

#include <Eigen/Dense>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace qsae {

// ─── Market Data ──────────────────────────────────────────────────────────────

/// Milliseconds since the Unix epoch.
using Timestamp = std::int64_t;

/// A single market observation supplied by the external data layer.
///
/// Observations are immutable and arrive in time order. Price and volume may
/// be malformed (NaN, ±Inf, non-positive price); consumers coerce or skip
/// them instead of failing.
struct MarketObservation {
    std::string           symbol;
    double                price     = 0.0;
    double                volume    = 0.0;
    Timestamp             timestamp = 0;
    std::optional<double> high;
    std::optional<double> low;
    std::optional<double> bid;
    std::optional<double> ask;
};

// ─── Signal Type ──────────────────────────────────────────────────────────────

/// Trading decision emitted by a strategy.
enum class Action { Buy, Sell, Hold };

/// Short lowercase name of an action ("buy", "sell", "hold").
[[nodiscard]] std::string_view to_string(Action action) noexcept;

/// A named numeric diagnostic attached to a signal (e.g. "rsi" → 74.2).
using SignalDetail = std::vector<std::pair<std::string, double>>;

/// Output of one strategy evaluation.  Carries no state between calls.
struct Signal {
    Action       action     = Action::Hold;
    double       confidence = 0.0;  ///< In [0, 1]
    SignalDetail detail;

    /// The neutral signal: hold with zero confidence.
    [[nodiscard]] static Signal hold() { return Signal{}; }

    /// Look up a detail value by key.
    [[nodiscard]] std::optional<double> find(std::string_view key) const;
};

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// Dense symbol-by-symbol matrix (covariance, correlation, inverse).
using Matrix = Eigen::MatrixXd;

/// Dense per-symbol vector (weights, expected returns, volatilities).
using Vector = Eigen::VectorXd;

} // namespace qsae
