#pragma once

/// @file include/qsae/portfolio.hpp
/// @brief Portfolio Optimizer - public API.
///
/// # Module: Portfolio Optimizer
///
/// ## Responsibility
/// Turn current holdings, a market snapshot, total capital and constraints
/// into a risk-adjusted target allocation, a set of diagnostics and a
/// prioritised list of rebalance actions.
///
/// ## Pipeline
///   1. Universe = distinct snapshot symbols, in input order
///   2. AssetEstimate per symbol from the ReturnEstimator
///   3. Correlation from the CorrelationEstimator; Σ_ij = ρ_ij σ_i σ_j
///   4. Raw weights from the selected Objective
///   5. Clamp to [min, max] and renormalise to Σw = 1
///   6. Diagnostics, constraint report and rebalance actions
///
/// ## Objectives
///   - MeanVariance   - w ∝ 1/σ (σ = 0 treated as 0.1)
///   - MinVariance    - w = Σ⁻¹1 / 1ᵀΣ⁻¹1
///   - MaxSharpe      - w ∝ Σ⁻¹(μ − r_f)
///   - RiskParity     - damped fixed point towards equal risk contribution
///   - BlackLitterman - market prior, optionally tilted by investor views
///
/// ## Guarantees
/// - Never throws for numerical problems: a singular covariance is replaced
///   by the identity and flagged in `OptimizationResult::singular_covariance`
/// - Weights sum to 1 for any non-empty universe
/// - Clamp-then-renormalise is an approximation: when several weights hit
///   the bounds at once, renormalising can push a weight past
///   `max_position_weight`.  The constraint report flags it.
///
/// ## NOT Responsible For
/// - Order execution
/// - Fetching market data

#include "qsae/constants.hpp"
#include "qsae/covariance_cache.hpp"
#include "qsae/estimators.hpp"
#include "qsae/linalg.hpp"
#include "qsae/types.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace qsae::portfolio {

// ─── Inputs ───────────────────────────────────────────────────────────────────

/// A currently held position.
struct Holding {
    std::string symbol;
    double      quantity    = 0.0;  ///< Negative for a short
    double      entry_price = 0.0;
};

struct PortfolioConstraints {
    double                max_position_weight = 1.0;
    double                min_position_weight = 0.0;
    double                max_risk            = 1.0;
    std::optional<double> target_return;
    std::optional<double> max_turnover;
    std::optional<double> min_diversification;
    std::optional<double> max_concentration;
};

enum class Objective { MeanVariance, RiskParity, BlackLitterman, MinVariance, MaxSharpe };

/// "meanVariance", "riskParity", "blackLitterman", "minVariance", "maxSharpe".
[[nodiscard]] std::string_view to_string(Objective objective) noexcept;
[[nodiscard]] std::optional<Objective> parse_objective(std::string_view name) noexcept;

/// A Black-Litterman view: Σ_k pick_k · r_k = expected_return.
///
/// An absolute view has one pick of weight 1; a relative view such as
/// "BTC outperforms ETH by 2%" picks {BTC: +1, ETH: −1}.  `confidence` in
/// (0, 1) scales the view variance Ω_kk = (1 − c)/c · p τΣ pᵀ.
struct InvestorView {
    std::vector<std::pair<std::string, double>> picks;
    double                                       expected_return = 0.0;
    double                                       confidence      = 0.5;
};

struct OptimizationRequest {
    std::vector<Holding>        positions;
    std::vector<MarketSnapshot> market;
    double                      total_capital = 0.0;
    PortfolioConstraints        constraints;
    Objective                   objective = Objective::MeanVariance;
    std::vector<InvestorView>   views;
    Timestamp                   as_of = 0;  ///< Cache bucket key
};

struct OptimizerConfig {
    double                  risk_free_rate          = constants::OPTIMIZER_RISK_FREE_RATE;
    double                  transaction_cost        = constants::REBALANCE_COST_RATE;
    double                  rebalance_threshold     = constants::REBALANCE_THRESHOLD;
    double                  high_priority_threshold = constants::HIGH_PRIORITY_THRESHOLD;
    std::size_t             risk_parity_iterations  = constants::RISK_PARITY_ITERATIONS;
    double                  risk_parity_damping     = constants::RISK_PARITY_DAMPING;
    double                  risk_aversion           = constants::BL_RISK_AVERSION;
    double                  bl_tau                  = constants::BL_TAU;
    linalg::InversionMethod inversion               = linalg::InversionMethod::GaussJordan;
    bool                    verbose                 = false;
};

// ─── Outputs ──────────────────────────────────────────────────────────────────

/// Symbol → value, ordered by symbol.
using WeightMap = std::map<std::string, double>;

enum class TradeDirection { Buy, Sell, Hold };
enum class Priority { High, Medium, Low };

[[nodiscard]] std::string_view to_string(TradeDirection direction) noexcept;  ///< "BUY" / "SELL" / "HOLD"
[[nodiscard]] std::string_view to_string(Priority priority) noexcept;         ///< "high" / "medium" / "low"

struct ExpectedImpact {
    double return_contribution    = 0.0;  ///< Δw · μ
    double risk_contribution      = 0.0;  ///< |Δw| · σ
    double diversification_impact = 0.0;  ///< w_current² − w_target²
};

struct RebalanceAction {
    std::string    symbol;
    TradeDirection action          = TradeDirection::Hold;
    double         current_weight  = 0.0;
    double         target_weight   = 0.0;
    double         weight_delta    = 0.0;  ///< target − current
    double         amount_to_trade = 0.0;  ///< |Δw| · capital
    double         estimated_cost  = 0.0;
    Priority       priority        = Priority::Low;
    std::string    rationale;
    ExpectedImpact impact;
};

/// Simplified 60 / 30 / 10 split of the return delta versus current weights.
struct PerformanceAttribution {
    double total_return       = 0.0;
    double asset_allocation   = 0.0;
    double security_selection = 0.0;
    double interaction        = 0.0;
};

/// Which constraints the final allocation satisfies.  Optional checks are
/// `nullopt` when the constraint was not requested.
struct ConstraintReport {
    bool                weights_within_bounds = true;
    bool                within_max_risk       = true;
    std::optional<bool> meets_target_return;
    std::optional<bool> within_max_turnover;
    std::optional<bool> meets_min_diversification;
    std::optional<bool> within_max_concentration;
    double              turnover = 0.0;  ///< ½ Σ |Δw|

    [[nodiscard]] bool all_satisfied() const noexcept;
};

struct OptimizationResult {
    Objective                objective = Objective::MeanVariance;
    std::vector<std::string> symbols;  ///< Universe, in input order
    WeightMap                weights;
    WeightMap                current_weights;

    double expected_return       = 0.0;
    double expected_risk         = 0.0;
    double sharpe_ratio          = 0.0;
    double sortino_ratio         = 0.0;
    double calmar_ratio          = 0.0;
    double diversification_score = 0.0;
    double concentration_risk    = 0.0;  ///< Herfindahl Σw²
    double value_at_risk_95      = 0.0;
    double value_at_risk_99      = 0.0;
    double expected_shortfall    = 0.0;

    WeightMap                    risk_contributions;
    WeightMap                    implied_returns;  ///< Black-Litterman π, else empty
    PerformanceAttribution       attribution;
    std::vector<RebalanceAction> rebalance_actions;
    ConstraintReport             constraint_report;
    bool                         singular_covariance = false;
    bool                         from_cache          = false;

    /// Weight of `symbol`, 0 if it is not in the universe.
    [[nodiscard]] double weight(const std::string& symbol) const;

    [[nodiscard]] std::string to_string() const;
};

// ─── PortfolioOptimizer ───────────────────────────────────────────────────────

/// Stateless optimizer over pluggable estimators.
///
/// ```cpp
/// PortfolioOptimizer opt;   // momentum returns, ρ = 0.3
/// OptimizationRequest req{.positions = held, .market = snap,
///                         .total_capital = 100'000.0,
///                         .objective = Objective::RiskParity};
/// auto result = opt.optimize(req);
/// ```
class PortfolioOptimizer {
public:
    explicit PortfolioOptimizer(
        OptimizerConfig                             config      = OptimizerConfig{},
        std::shared_ptr<const ReturnEstimator>      returns     = nullptr,
        std::shared_ptr<const CorrelationEstimator> correlation = nullptr);

    [[nodiscard]] OptimizationResult optimize(const OptimizationRequest& request) const;

    /// As above, reusing estimates and covariance for the same universe and
    /// time bucket through `cache`.
    [[nodiscard]] OptimizationResult optimize(const OptimizationRequest& request,
                                              CovarianceCache&           cache) const;

    [[nodiscard]] const OptimizerConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] OptimizationResult run(const OptimizationRequest& request,
                                         CovarianceCache*           cache) const;

    [[nodiscard]] CovarianceCache::Entry
    estimate(const std::vector<std::string>&   symbols,
             const std::vector<MarketSnapshot>& snapshots) const;

    OptimizerConfig                             config_;
    std::shared_ptr<const ReturnEstimator>      returns_;
    std::shared_ptr<const CorrelationEstimator> correlation_;
};

/// Convenience entry point with default estimators and configuration.
[[nodiscard]] OptimizationResult
optimize_portfolio(const std::vector<Holding>&        positions,
                   const std::vector<MarketSnapshot>& market,
                   double                             total_capital,
                   const PortfolioConstraints&        constraints,
                   Objective objective = Objective::MeanVariance);

/// Clamp each weight to [min_weight, max_weight] and renormalise to Σw = 1.
/// Falls back to equal weights when the clamped sum is not positive.
void apply_weight_bounds(Vector& weights, double min_weight, double max_weight);

/// Rebalance actions for every symbol in `current` ∪ `target` whose weight
/// changes by more than `config.rebalance_threshold`, sorted by amount to
/// trade (largest first, ties by symbol).  `estimates` feeds the expected
/// impact; symbols without an estimate get zero return and risk impact.
[[nodiscard]] std::vector<RebalanceAction>
generate_rebalance_actions(const WeightMap&                  current,
                           const WeightMap&                  target,
                           double                            total_capital,
                           const OptimizerConfig&            config    = OptimizerConfig{},
                           const std::vector<AssetEstimate>& estimates = {});

}  // namespace qsae::portfolio
