#pragma once

/// @file include/qsae/estimators.hpp
/// @brief Pluggable return / volatility / correlation estimators for the
///        portfolio optimizer.
///
/// The optimizer's math never assumes a particular estimator: it consumes
/// one AssetEstimate per symbol and a symmetric correlation matrix with a
/// unit diagonal, and forms Cov[i][j] = ρ_ij σ_i σ_j.

#include "qsae/constants.hpp"
#include "qsae/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qsae::portfolio {

/// A point-in-time market snapshot for one symbol.
struct MarketSnapshot {
    std::string           symbol;
    double                price              = 0.0;
    double                change_percent_24h = 0.0;  ///< e.g. 2.5 for +2.5%
    double                volume_24h         = 0.0;
    std::optional<double> market_cap;
};

/// Per-symbol estimate consumed by the objectives.
struct AssetEstimate {
    std::string symbol;
    double      expected_return = 0.0;
    double      volatility      = 0.0;  ///< Annualised, ≥ 0
};

// ─── Return / volatility ──────────────────────────────────────────────────────

class ReturnEstimator {
public:
    virtual ~ReturnEstimator() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// Estimate expected return and volatility for one snapshot.  Must
    /// return finite values with volatility ≥ 0.
    [[nodiscard]] virtual AssetEstimate estimate(const MarketSnapshot& snapshot) const = 0;
};

/// Momentum proxy from the 24h change c = change_percent_24h / 100:
///   expected return = c + 0.1 |c|
///   volatility      = |c| · √365
/// A non-finite change is treated as zero.
class MomentumEstimator final : public ReturnEstimator {
public:
    [[nodiscard]] std::string_view name() const noexcept override;
    [[nodiscard]] AssetEstimate estimate(const MarketSnapshot& snapshot) const override;
};

// ─── Correlation ──────────────────────────────────────────────────────────────

class CorrelationEstimator {
public:
    virtual ~CorrelationEstimator() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// Symmetric correlation matrix over `symbols` (same order), unit
    /// diagonal, entries in [−1, 1].
    [[nodiscard]] virtual Matrix correlation(const std::vector<std::string>& symbols) const = 0;
};

/// The same ρ for every pair.
class ConstantCorrelation final : public CorrelationEstimator {
public:
    explicit ConstantCorrelation(double rho = constants::DEFAULT_PAIRWISE_CORRELATION) noexcept;

    [[nodiscard]] std::string_view name() const noexcept override;
    [[nodiscard]] Matrix correlation(const std::vector<std::string>& symbols) const override;

    [[nodiscard]] double rho() const noexcept { return rho_; }

private:
    double rho_;
};

/// Pearson correlation of supplied per-symbol return histories.
///
/// A pair falls back to `fallback` when either history is missing or the
/// common length is below two observations.
class HistoricalCorrelation final : public CorrelationEstimator {
public:
    explicit HistoricalCorrelation(std::map<std::string, std::vector<double>> histories,
                                   double fallback = constants::DEFAULT_PAIRWISE_CORRELATION);

    [[nodiscard]] std::string_view name() const noexcept override;
    [[nodiscard]] Matrix correlation(const std::vector<std::string>& symbols) const override;

private:
    std::map<std::string, std::vector<double>> histories_;
    double                                     fallback_;
};

}  // namespace qsae::portfolio
