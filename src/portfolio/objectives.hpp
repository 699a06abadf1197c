#pragma once

/// @file src/portfolio/objectives.hpp
/// @brief Objective solvers shared by the optimizer (internal header).
///
/// Every solver returns raw weights summing to 1 over the universe, before
/// the final clamp-and-renormalise.  Solvers that invert Σ report whether
/// the identity fallback was used.

#include "qsae/linalg.hpp"
#include "qsae/portfolio.hpp"

#include <string>
#include <vector>

namespace qsae::portfolio::detail {

struct SolveOutput {
    Vector weights;
    Vector implied_returns;  ///< Black-Litterman only
    bool   singular = false;
};

/// Uniform 1/n weights.
[[nodiscard]] Vector equal_weights(Eigen::Index n);

/// w ∝ 1/σ, with σ = 0 replaced by FALLBACK_VOLATILITY.
[[nodiscard]] SolveOutput mean_variance(const Vector& volatility);

[[nodiscard]] SolveOutput min_variance(const Matrix& covariance,
                                       linalg::InversionMethod method);

[[nodiscard]] SolveOutput max_sharpe(const Matrix& covariance,
                                     const Vector& expected,
                                     double risk_free_rate,
                                     linalg::InversionMethod method);

[[nodiscard]] SolveOutput risk_parity(const Matrix& covariance,
                                      const PortfolioConstraints& constraints,
                                      std::size_t iterations,
                                      double damping);

[[nodiscard]] SolveOutput black_litterman(const Matrix& covariance,
                                          const std::vector<std::string>& symbols,
                                          const std::vector<MarketSnapshot>& market,
                                          const std::vector<InvestorView>& views,
                                          double risk_aversion,
                                          double tau,
                                          linalg::InversionMethod method);

/// Per-asset fractional risk contribution w_i (Σw)_i / wᵀΣw; zero when the
/// portfolio variance is not positive.
[[nodiscard]] Vector risk_contributions(const Vector& weights, const Matrix& covariance);

}  // namespace qsae::portfolio::detail
