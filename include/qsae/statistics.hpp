#pragma once

/// @file include/qsae/statistics.hpp
/// @brief Statistics Library - shared risk and performance math.
///
/// # Module: Statistics
///
/// ## Responsibility
/// Stateless numeric kernels used by both the backtester and the portfolio
/// optimizer, so that "Sharpe" or "drawdown" mean exactly the same thing in
/// every report the engine produces.
///
/// ## Conventions
///   - Variance and standard deviation are population moments (÷ n).
///   - Ratios are per-period; annualisation is the caller's choice except
///     for `calmar_ratio`, which annualises the mean return explicitly.
///
/// ## Guarantees
/// - Never throws, except `std::bad_alloc` from the order statistics
///   (`value_at_risk`, `percentile`), which sort a copy of their input
/// - Never returns NaN for finite input
/// - Degenerate input (empty, zero variance) returns the documented fallback
/// - All functions take `std::span<const double>` for zero-copy access
///
/// ## NOT Responsible For
/// - Equity-curve construction (see src/backtest/)
/// - Covariance matrices (see src/portfolio/)

#include "qsae/constants.hpp"

#include <span>

namespace qsae::stats {

/// Result of a single-factor least-squares fit y = alpha + beta·x.
struct Regression {
    double alpha = 0.0;
    double beta  = 0.0;
};

/// Arithmetic mean.  Empty input → 0.
[[nodiscard]] double mean(std::span<const double> v) noexcept;

/// Population variance.  Empty input → 0.
[[nodiscard]] double variance(std::span<const double> v) noexcept;

/// Population standard deviation.  Empty input → 0.
[[nodiscard]] double stddev(std::span<const double> v) noexcept;

/// Population covariance over the common prefix of `x` and `y`.
[[nodiscard]] double covariance(std::span<const double> x,
                                std::span<const double> y) noexcept;

/// Pearson correlation over the common prefix.  Zero variance on either
/// side → 0.  Result is clamped to [−1, 1].
[[nodiscard]] double correlation(std::span<const double> x,
                                 std::span<const double> y) noexcept;

/// Per-period Sharpe ratio.
///
/// # Formula
///   Sharpe = mean(r − rf) / σ(r − rf)
///
/// # Returns
/// 0 when the excess series is empty or has zero variance.
[[nodiscard]] double sharpe_ratio(std::span<const double> returns,
                                  double risk_free_rate = 0.0) noexcept;

/// Root-mean-square shortfall of the returns that fall below `target`.
/// Returns 0 when no return is below target.
[[nodiscard]] double downside_deviation(std::span<const double> returns,
                                        double target = 0.0) noexcept;

/// Per-period Sortino ratio.
///
/// # Formula
///   Sortino = mean(r − target) / downside_deviation(r, target)
///
/// # Returns
/// +∞ when nothing falls below target and the mean excess is positive,
/// 0 when nothing falls below target otherwise.
[[nodiscard]] double sortino_ratio(std::span<const double> returns,
                                   double target = 0.0) noexcept;

/// Calmar ratio: annualised mean return over maximum drawdown.
///
/// # Formula
///   Calmar = mean(r) × annualisation / max_dd
///
/// # Returns
/// 0 when `max_dd` is not strictly positive.
[[nodiscard]] double calmar_ratio(std::span<const double> returns,
                                  double max_dd,
                                  double annualisation = constants::ANNUALISATION_FACTOR) noexcept;

/// Largest relative peak-to-trough decline of a price or equity series.
///
/// Forward scan keeping the running peak:
///   MDD = max_t (peak_t − p_t) / peak_t
///
/// # Returns
/// Value in [0, 1]; 0 for empty input.  Points where the running peak is
/// not positive are ignored and a decline through zero is capped at 1.
[[nodiscard]] double max_drawdown(std::span<const double> prices) noexcept;

/// Historical Value-at-Risk: magnitude of the empirical (1 − confidence)
/// quantile of the sorted return sample.  Empty input → 0.
[[nodiscard]] double value_at_risk(std::span<const double> returns,
                                   double confidence = constants::DEFAULT_VAR_CONFIDENCE);

/// Nearest-rank percentile, `p` in [0, 1].  Empty input → 0.
[[nodiscard]] double percentile(std::span<const double> v, double p);

/// Closed-form single-factor OLS used for alpha/beta attribution.
///
///   beta  = cov(x, y) / var(x)
///   alpha = mean(y) − beta · mean(x)
///
/// When var(x) = 0 the slope is undefined: beta = 0, alpha = mean(y).
[[nodiscard]] Regression ols_regression(std::span<const double> x,
                                        std::span<const double> y) noexcept;

}  // namespace qsae::stats
