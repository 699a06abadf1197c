/// @file src/portfolio/objectives.cpp
/// @brief Mean-variance, min-variance, max-Sharpe, risk parity and
///        Black-Litterman weight solvers.

#include "objectives.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace qsae::portfolio::detail {

namespace {

/// Divide by the sum, or fall back to equal weights when the sum is not a
/// usable normaliser.
Vector normalise_or_equal(const Vector& raw) {
    const double sum = raw.sum();
    if (!std::isfinite(sum) || std::abs(sum) < constants::FLOAT_EPSILON || !raw.allFinite()) {
        return equal_weights(raw.size());
    }
    return raw / sum;
}

}  // namespace

Vector equal_weights(Eigen::Index n) {
    if (n <= 0) return Vector(0);
    return Vector::Constant(n, 1.0 / static_cast<double>(n));
}

// ─── Mean-variance (inverse volatility) ───────────────────────────────────────

SolveOutput mean_variance(const Vector& volatility) {
    const Eigen::Index n = volatility.size();
    Vector raw(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const double sigma = volatility(i) > 0.0 ? volatility(i) : constants::FALLBACK_VOLATILITY;
        raw(i) = 1.0 / sigma;
    }
    return SolveOutput{.weights = normalise_or_equal(raw)};
}

// ─── Minimum variance ─────────────────────────────────────────────────────────

SolveOutput min_variance(const Matrix& covariance, linalg::InversionMethod method) {
    const auto inv = linalg::invert_or_identity(covariance, method);
    const Vector ones = Vector::Ones(covariance.rows());
    return SolveOutput{
        .weights  = normalise_or_equal(inv.inverse * ones),
        .singular = inv.singular,
    };
}

// ─── Maximum Sharpe ───────────────────────────────────────────────────────────

SolveOutput max_sharpe(const Matrix& covariance,
                       const Vector& expected,
                       double risk_free_rate,
                       linalg::InversionMethod method) {
    const auto inv = linalg::invert_or_identity(covariance, method);
    const Vector excess = (expected.array() - risk_free_rate).matrix();
    return SolveOutput{
        .weights  = normalise_or_equal(inv.inverse * excess),
        .singular = inv.singular,
    };
}

// ─── Risk parity ──────────────────────────────────────────────────────────────

SolveOutput risk_parity(const Matrix& covariance,
                        const PortfolioConstraints& constraints,
                        std::size_t iterations,
                        double damping) {
    const Eigen::Index n = covariance.rows();
    Vector w = equal_weights(n);
    if (n == 0) return SolveOutput{.weights = w};

    const double target = 1.0 / static_cast<double>(n);
    Vector sigma_w(n);
    Vector next(n);

    for (std::size_t it = 0; it < iterations; ++it) {
        sigma_w.noalias() = covariance * w;
        const double variance = w.dot(sigma_w);
        if (!(variance > 0.0) || !std::isfinite(variance)) break;

        for (Eigen::Index i = 0; i < n; ++i) {
            const double rc = w(i) * sigma_w(i) / variance;
            next(i) = (rc > 0.0 && std::isfinite(rc))
                          ? w(i) * std::pow(target / rc, damping)
                          : w(i);
        }

        const double sum = next.sum();
        if (!(sum > 0.0) || !std::isfinite(sum)) break;
        w = next / sum;
        apply_weight_bounds(w, constraints.min_position_weight,
                            constraints.max_position_weight);
    }
    return SolveOutput{.weights = w};
}

// ─── Black-Litterman ──────────────────────────────────────────────────────────

SolveOutput black_litterman(const Matrix& covariance,
                            const std::vector<std::string>& symbols,
                            const std::vector<MarketSnapshot>& market,
                            const std::vector<InvestorView>& views,
                            double risk_aversion,
                            double tau,
                            linalg::InversionMethod method) {
    const auto n = static_cast<Eigen::Index>(symbols.size());

    auto index_of = [&](const std::string& symbol) -> Eigen::Index {
        const auto it = std::find(symbols.begin(), symbols.end(), symbol);
        return it == symbols.end() ? -1 : static_cast<Eigen::Index>(it - symbols.begin());
    };

    // Prior: market-cap weights when every symbol has a usable cap.
    Vector prior = equal_weights(n);
    Vector caps(n);
    bool   have_caps = n > 0;
    for (Eigen::Index i = 0; i < n && have_caps; ++i) {
        const auto it = std::find_if(market.begin(), market.end(), [&](const MarketSnapshot& s) {
            return s.symbol == symbols[static_cast<std::size_t>(i)];
        });
        have_caps = it != market.end() && it->market_cap && std::isfinite(*it->market_cap) &&
                    *it->market_cap > 0.0;
        if (have_caps) caps(i) = *it->market_cap;
    }
    if (have_caps) prior = caps / caps.sum();

    SolveOutput out;
    out.implied_returns = risk_aversion * (covariance * prior);

    // Pick matrix P, view returns Q, view confidences.
    std::vector<Vector> rows;
    std::vector<double> q;
    std::vector<double> confidence;
    for (const auto& view : views) {
        if (!std::isfinite(view.expected_return)) continue;
        Vector p = Vector::Zero(n);
        bool any = false;
        for (const auto& [symbol, weight] : view.picks) {
            const Eigen::Index k = index_of(symbol);
            if (k < 0 || !std::isfinite(weight)) continue;
            p(k) += weight;
            any = true;
        }
        if (!any || p.isZero(0.0)) continue;
        rows.push_back(std::move(p));
        q.push_back(view.expected_return);
        confidence.push_back(std::isfinite(view.confidence)
                                 ? std::clamp(view.confidence, 0.01, 0.99)
                                 : 0.5);
    }

    if (rows.empty()) {
        out.weights = prior;
        return out;
    }

    const auto k = static_cast<Eigen::Index>(rows.size());
    Matrix P(k, n);
    Vector Q(k);
    Vector omega_inv(k);
    const Matrix tau_sigma = tau * covariance;

    for (Eigen::Index v = 0; v < k; ++v) {
        const auto idx = static_cast<std::size_t>(v);
        P.row(v) = rows[idx].transpose();
        Q(v)     = q[idx];
        const double c        = confidence[idx];
        const double variance = rows[idx].dot(tau_sigma * rows[idx]);
        const double omega    = std::max((1.0 - c) / c * variance, constants::FLOAT_EPSILON);
        omega_inv(v) = 1.0 / omega;
    }

    const auto tau_sigma_inv = linalg::invert_or_identity(tau_sigma, method);
    const Matrix pt_omega_inv = P.transpose() * omega_inv.asDiagonal();

    const Matrix lhs = tau_sigma_inv.inverse + pt_omega_inv * P;
    const Vector rhs = tau_sigma_inv.inverse * out.implied_returns + pt_omega_inv * Q;
    const auto   lhs_inv = linalg::invert_or_identity(lhs, method);
    const Vector mu_bl   = lhs_inv.inverse * rhs;

    const auto scaled_inv = linalg::invert_or_identity(risk_aversion * covariance, method);
    const Vector raw      = scaled_inv.inverse * mu_bl;

    const double sum = raw.sum();
    out.weights  = (std::isfinite(sum) && std::abs(sum) > constants::FLOAT_EPSILON && raw.allFinite())
                       ? Vector(raw / sum)
                       : prior;
    out.singular = tau_sigma_inv.singular || lhs_inv.singular || scaled_inv.singular;
    return out;
}

// ─── Diagnostics helpers ──────────────────────────────────────────────────────

Vector risk_contributions(const Vector& weights, const Matrix& covariance) {
    const Vector sigma_w  = covariance * weights;
    const double variance = weights.dot(sigma_w);
    if (!(variance > 0.0) || !std::isfinite(variance)) {
        return Vector::Zero(weights.size());
    }
    return weights.cwiseProduct(sigma_w) / variance;
}

}  // namespace qsae::portfolio::detail
