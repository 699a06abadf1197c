/// @file src/portfolio/estimators.cpp
/// @brief MomentumEstimator, ConstantCorrelation, HistoricalCorrelation.

#include "qsae/estimators.hpp"
#include "qsae/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace qsae::portfolio {

// ─── MomentumEstimator ────────────────────────────────────────────────────────

std::string_view MomentumEstimator::name() const noexcept {
    return "momentum";
}

AssetEstimate MomentumEstimator::estimate(const MarketSnapshot& snapshot) const {
    const double c = std::isfinite(snapshot.change_percent_24h)
                         ? snapshot.change_percent_24h / 100.0
                         : 0.0;
    return AssetEstimate{
        .symbol          = snapshot.symbol,
        .expected_return = c + 0.1 * std::abs(c),
        .volatility      = std::abs(c) * std::sqrt(constants::CRYPTO_DAYS_PER_YEAR),
    };
}

// ─── ConstantCorrelation ──────────────────────────────────────────────────────

ConstantCorrelation::ConstantCorrelation(double rho) noexcept
    : rho_(std::isfinite(rho) ? std::clamp(rho, -1.0, 1.0)
                              : constants::DEFAULT_PAIRWISE_CORRELATION) {}

std::string_view ConstantCorrelation::name() const noexcept {
    return "constant";
}

Matrix ConstantCorrelation::correlation(const std::vector<std::string>& symbols) const {
    const auto n = static_cast<Eigen::Index>(symbols.size());
    Matrix rho = Matrix::Constant(n, n, rho_);
    rho.diagonal().setOnes();
    return rho;
}

// ─── HistoricalCorrelation ────────────────────────────────────────────────────

HistoricalCorrelation::HistoricalCorrelation(
    std::map<std::string, std::vector<double>> histories, double fallback)
    : histories_(std::move(histories))
    , fallback_(std::isfinite(fallback) ? std::clamp(fallback, -1.0, 1.0)
                                        : constants::DEFAULT_PAIRWISE_CORRELATION) {}

std::string_view HistoricalCorrelation::name() const noexcept {
    return "historical";
}

Matrix HistoricalCorrelation::correlation(const std::vector<std::string>& symbols) const {
    const auto n = static_cast<Eigen::Index>(symbols.size());
    Matrix rho = Matrix::Identity(n, n);

    for (Eigen::Index i = 0; i < n; ++i) {
        const auto hi = histories_.find(symbols[static_cast<std::size_t>(i)]);
        for (Eigen::Index j = i + 1; j < n; ++j) {
            const auto hj = histories_.find(symbols[static_cast<std::size_t>(j)]);

            double r = fallback_;
            if (hi != histories_.end() && hj != histories_.end() &&
                std::min(hi->second.size(), hj->second.size()) >= 2) {
                r = stats::correlation(hi->second, hj->second);
            }
            rho(i, j) = r;
            rho(j, i) = r;
        }
    }
    return rho;
}

}  // namespace qsae::portfolio
