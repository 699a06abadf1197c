/// @file src/statistics/statistics.cpp
/// @brief Implementation of the shared statistics kernels.
///
/// Every function degrades to a documented fallback instead of dividing by
/// zero; none of them allocate except the order statistics (VaR,
/// percentile), which sort a copy of their input.

#include "qsae/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <vector>

namespace qsae::stats {

namespace {

/// Sorted copy of `v`.
std::vector<double> sorted_copy(std::span<const double> v) {
    std::vector<double> out(v.begin(), v.end());
    std::sort(out.begin(), out.end());
    return out;
}

}  // namespace

// ─── Moments ──────────────────────────────────────────────────────────────────

double mean(std::span<const double> v) noexcept {
    if (v.empty()) return 0.0;
    const double sum = std::accumulate(v.begin(), v.end(), 0.0);
    return sum / static_cast<double>(v.size());
}

double variance(std::span<const double> v) noexcept {
    if (v.empty()) return 0.0;
    const double m = mean(v);
    double sq_sum = 0.0;
    for (double x : v) {
        const double d = x - m;
        sq_sum += d * d;
    }
    return sq_sum / static_cast<double>(v.size());
}

double stddev(std::span<const double> v) noexcept {
    return std::sqrt(variance(v));
}

double covariance(std::span<const double> x,
                  std::span<const double> y) noexcept {
    const std::size_t n = std::min(x.size(), y.size());
    if (n == 0) return 0.0;
    x = x.first(n);
    y = y.first(n);

    const double mx = mean(x);
    const double my = mean(y);
    double acc = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        acc += (x[i] - mx) * (y[i] - my);
    }
    return acc / static_cast<double>(n);
}

double correlation(std::span<const double> x,
                   std::span<const double> y) noexcept {
    const std::size_t n = std::min(x.size(), y.size());
    if (n == 0) return 0.0;
    x = x.first(n);
    y = y.first(n);

    const double sx = stddev(x);
    const double sy = stddev(y);
    if (sx <= 0.0 || sy <= 0.0) return 0.0;  // zero variance - undefined

    // Rounding can push |ρ| a hair above 1 for perfectly collinear inputs.
    return std::clamp(covariance(x, y) / (sx * sy), -1.0, 1.0);
}

// ─── Risk-adjusted ratios ─────────────────────────────────────────────────────

double sharpe_ratio(std::span<const double> returns,
                    double risk_free_rate) noexcept {
    if (returns.empty()) return 0.0;

    // mean(r − rf) = mean(r) − rf and σ(r − rf) = σ(r): no copy needed.
    const double sd = stddev(returns);
    if (sd <= 0.0) return 0.0;
    return (mean(returns) - risk_free_rate) / sd;
}

double downside_deviation(std::span<const double> returns,
                          double target) noexcept {
    double sq_sum = 0.0;
    std::size_t count = 0;
    for (double r : returns) {
        if (r < target) {
            const double d = r - target;
            sq_sum += d * d;
            ++count;
        }
    }
    if (count == 0) return 0.0;
    return std::sqrt(sq_sum / static_cast<double>(count));
}

double sortino_ratio(std::span<const double> returns,
                     double target) noexcept {
    if (returns.empty()) return 0.0;

    const double excess = mean(returns) - target;
    const double dd     = downside_deviation(returns, target);
    if (dd <= 0.0) {
        // Nothing below target: unbounded upside if we are net positive.
        return excess > 0.0 ? std::numeric_limits<double>::infinity() : 0.0;
    }
    return excess / dd;
}

double calmar_ratio(std::span<const double> returns,
                    double max_dd,
                    double annualisation) noexcept {
    if (!(max_dd > 0.0)) return 0.0;
    return mean(returns) * annualisation / max_dd;
}

// ─── Drawdown ─────────────────────────────────────────────────────────────────

double max_drawdown(std::span<const double> prices) noexcept {
    if (prices.empty()) return 0.0;

    double peak   = prices.front();
    double max_dd = 0.0;
    for (double p : prices) {
        if (p > peak) peak = p;
        if (peak <= 0.0) continue;
        const double dd = (peak - p) / peak;
        if (dd > max_dd) max_dd = dd;
    }
    // An equity curve that crosses zero is a total loss, not more.
    return std::min(max_dd, 1.0);
}

// ─── Order statistics ─────────────────────────────────────────────────────────

double value_at_risk(std::span<const double> returns,
                     double confidence) {
    if (returns.empty()) return 0.0;

    const auto sorted = sorted_copy(returns);
    const double tail = std::clamp(1.0 - confidence, 0.0, 1.0);
    auto idx = static_cast<std::size_t>(
        std::floor(tail * static_cast<double>(sorted.size())));
    idx = std::min(idx, sorted.size() - 1);
    return std::abs(sorted[idx]);
}

double percentile(std::span<const double> v, double p) {
    if (v.empty()) return 0.0;

    const auto sorted = sorted_copy(v);
    const double rank = std::ceil(std::clamp(p, 0.0, 1.0) *
                                  static_cast<double>(sorted.size()));
    const std::size_t idx =
        rank < 1.0 ? 0 : std::min(static_cast<std::size_t>(rank) - 1,
                                  sorted.size() - 1);
    return sorted[idx];
}

// ─── Regression ───────────────────────────────────────────────────────────────

Regression ols_regression(std::span<const double> x,
                          std::span<const double> y) noexcept {
    const std::size_t n = std::min(x.size(), y.size());
    x = x.first(n);
    y = y.first(n);

    const double var_x = variance(x);
    if (var_x <= 0.0) {
        return Regression{.alpha = mean(y), .beta = 0.0};
    }
    const double beta = covariance(x, y) / var_x;
    return Regression{.alpha = mean(y) - beta * mean(x), .beta = beta};
}

}  // namespace qsae::stats
