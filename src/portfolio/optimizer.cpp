/// @file src/portfolio/optimizer.cpp
/// @brief PortfolioOptimizer pipeline: estimation, objective dispatch,
///        bounds, diagnostics.

#include "qsae/portfolio.hpp"
#include "qsae/statistics.hpp"
#include "objectives.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <limits>
#include <span>
#include <utility>

namespace qsae::portfolio {

namespace {

/// Distinct snapshot symbols in input order.
std::vector<std::string> universe_of(const std::vector<MarketSnapshot>& market) {
    std::vector<std::string> symbols;
    symbols.reserve(market.size());
    for (const auto& snap : market) {
        if (std::find(symbols.begin(), symbols.end(), snap.symbol) == symbols.end()) {
            symbols.push_back(snap.symbol);
        }
    }
    return symbols;
}

/// |quantity × entry_price| / capital per symbol; empty when capital ≤ 0.
WeightMap current_weights_of(const std::vector<Holding>& positions, double total_capital) {
    WeightMap weights;
    if (!(total_capital > 0.0) || !std::isfinite(total_capital)) return weights;
    for (const auto& h : positions) {
        const double value = std::abs(h.quantity * h.entry_price);
        if (!std::isfinite(value)) continue;
        weights[h.symbol] += value / total_capital;
    }
    return weights;
}

double lookup(const WeightMap& m, const std::string& key) {
    const auto it = m.find(key);
    return it == m.end() ? 0.0 : it->second;
}

/// 1 − weighted average pairwise correlation; 0 for fewer than two assets.
double diversification_score(const Vector& w, const Matrix& correlation) {
    const Eigen::Index n = w.size();
    if (n < 2) return 0.0;

    double num = 0.0;
    double den = 0.0;
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = 0; j < n; ++j) {
            if (i == j) continue;
            const double ww = w(i) * w(j);
            num += ww * correlation(i, j);
            den += ww;
        }
    }
    if (!(den > 0.0)) return 0.0;
    return std::max(0.0, 1.0 - num / den);
}

}  // namespace

// ─── Enum names ───────────────────────────────────────────────────────────────

std::string_view to_string(Objective objective) noexcept {
    switch (objective) {
        case Objective::MeanVariance:   return "meanVariance";
        case Objective::RiskParity:     return "riskParity";
        case Objective::BlackLitterman: return "blackLitterman";
        case Objective::MinVariance:    return "minVariance";
        case Objective::MaxSharpe:      return "maxSharpe";
    }
    return "meanVariance";
}

std::optional<Objective> parse_objective(std::string_view name) noexcept {
    for (auto o : {Objective::MeanVariance, Objective::RiskParity, Objective::BlackLitterman,
                   Objective::MinVariance, Objective::MaxSharpe}) {
        if (to_string(o) == name) return o;
    }
    return std::nullopt;
}

std::string_view to_string(TradeDirection direction) noexcept {
    switch (direction) {
        case TradeDirection::Buy:  return "BUY";
        case TradeDirection::Sell: return "SELL";
        case TradeDirection::Hold: return "HOLD";
    }
    return "HOLD";
}

std::string_view to_string(Priority priority) noexcept {
    switch (priority) {
        case Priority::High:   return "high";
        case Priority::Medium: return "medium";
        case Priority::Low:    return "low";
    }
    return "low";
}

// ─── Bounds ───────────────────────────────────────────────────────────────────

void apply_weight_bounds(Vector& weights, double min_weight, double max_weight) {
    if (weights.size() == 0) return;
    weights = weights.cwiseMax(min_weight).cwiseMin(max_weight);

    const double sum = weights.sum();
    if (sum > 0.0 && std::isfinite(sum)) {
        weights /= sum;
    } else {
        weights = detail::equal_weights(weights.size());
    }
}

// ─── Result helpers ───────────────────────────────────────────────────────────

bool ConstraintReport::all_satisfied() const noexcept {
    return weights_within_bounds && within_max_risk &&
           meets_target_return.value_or(true) &&
           within_max_turnover.value_or(true) &&
           meets_min_diversification.value_or(true) &&
           within_max_concentration.value_or(true);
}

double OptimizationResult::weight(const std::string& symbol) const {
    return lookup(weights, symbol);
}

std::string OptimizationResult::to_string() const {
    std::string out = fmt::format(
        "Portfolio ({}){}\n"
        "  E[r]={:+.4f}  risk={:.4f}  Sharpe={:.4f}  Sortino={:.4f}  Calmar={:.4f}\n"
        "  diversification={:.4f}  HHI={:.4f}  VaR95={:.4f}  VaR99={:.4f}  ES={:.4f}\n",
        qsae::portfolio::to_string(objective), singular_covariance ? " [singular covariance]" : "",
        expected_return, expected_risk, sharpe_ratio, sortino_ratio, calmar_ratio,
        diversification_score, concentration_risk, value_at_risk_95, value_at_risk_99,
        expected_shortfall);

    for (const auto& symbol : symbols) {
        out += fmt::format("  {:<10} {:7.2f}%  (current {:6.2f}%, risk {:6.2f}%)\n", symbol,
                           weight(symbol) * 100.0, lookup(current_weights, symbol) * 100.0,
                           lookup(risk_contributions, symbol) * 100.0);
    }
    for (const auto& a : rebalance_actions) {
        out += fmt::format("  {:<4} {:<10} {:>12.2f}  [{}] {}\n",
                           qsae::portfolio::to_string(a.action), a.symbol, a.amount_to_trade,
                           qsae::portfolio::to_string(a.priority), a.rationale);
    }
    return out;
}

// ─── PortfolioOptimizer ───────────────────────────────────────────────────────

PortfolioOptimizer::PortfolioOptimizer(OptimizerConfig                             config,
                                       std::shared_ptr<const ReturnEstimator>      returns,
                                       std::shared_ptr<const CorrelationEstimator> correlation)
    : config_(config)
    , returns_(returns ? std::move(returns) : std::make_shared<MomentumEstimator>())
    , correlation_(correlation ? std::move(correlation)
                               : std::make_shared<ConstantCorrelation>()) {}

OptimizationResult PortfolioOptimizer::optimize(const OptimizationRequest& request) const {
    return run(request, nullptr);
}

OptimizationResult PortfolioOptimizer::optimize(const OptimizationRequest& request,
                                                CovarianceCache&           cache) const {
    return run(request, &cache);
}

CovarianceCache::Entry
PortfolioOptimizer::estimate(const std::vector<std::string>&    symbols,
                             const std::vector<MarketSnapshot>& snapshots) const {
    const auto n = static_cast<Eigen::Index>(symbols.size());

    CovarianceCache::Entry entry;
    entry.symbols = symbols;
    entry.estimates.reserve(symbols.size());

    Vector sigma(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const auto& symbol = symbols[static_cast<std::size_t>(i)];
        const auto  snap   = std::find_if(snapshots.begin(), snapshots.end(),
                                          [&](const MarketSnapshot& s) { return s.symbol == symbol; });

        AssetEstimate est = returns_->estimate(*snap);
        est.symbol = symbol;
        if (!std::isfinite(est.expected_return)) est.expected_return = 0.0;
        est.volatility = std::isfinite(est.volatility) ? std::abs(est.volatility) : 0.0;
        sigma(i) = est.volatility;
        entry.estimates.push_back(std::move(est));
    }

    Matrix rho = correlation_->correlation(symbols);
    if (rho.rows() != n || rho.cols() != n) {
        rho = ConstantCorrelation{}.correlation(symbols);
    }
    rho = rho.unaryExpr([](double x) { return std::isfinite(x) ? std::clamp(x, -1.0, 1.0) : 0.0; });
    rho.diagonal().setOnes();

    entry.covariance  = rho.cwiseProduct(sigma * sigma.transpose());
    entry.correlation = std::move(rho);
    return entry;
}

OptimizationResult PortfolioOptimizer::run(const OptimizationRequest& request,
                                           CovarianceCache*           cache) const {
    OptimizationResult result;
    result.objective       = request.objective;
    result.symbols         = universe_of(request.market);
    result.current_weights = current_weights_of(request.positions, request.total_capital);

    const auto& constraints = request.constraints;
    const auto& symbols     = result.symbols;
    const auto  n           = static_cast<Eigen::Index>(symbols.size());

    if (config_.verbose) {
        fmt::print(stderr, "[optimizer] objective={} universe={}\n",
                   to_string(request.objective), symbols.size());
    }

    // ── Estimation ──
    std::optional<CovarianceCache::Entry> cached;
    if (cache) cached = cache->find(symbols, request.as_of);
    result.from_cache = cached.has_value();

    CovarianceCache::Entry entry = cached ? std::move(*cached) : estimate(symbols, request.market);
    if (cache && !result.from_cache) cache->insert(entry, request.as_of);

    Vector mu(n);
    Vector sigma(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        mu(i)    = entry.estimates[static_cast<std::size_t>(i)].expected_return;
        sigma(i) = entry.estimates[static_cast<std::size_t>(i)].volatility;
    }
    const Matrix& cov = entry.covariance;

    // ── Objective ──
    detail::SolveOutput solved;
    switch (request.objective) {
        case Objective::MinVariance:
            solved = detail::min_variance(cov, config_.inversion);
            break;
        case Objective::MaxSharpe:
            solved = detail::max_sharpe(cov, mu, config_.risk_free_rate, config_.inversion);
            break;
        case Objective::RiskParity:
            solved = detail::risk_parity(cov, constraints, config_.risk_parity_iterations,
                                         config_.risk_parity_damping);
            break;
        case Objective::BlackLitterman:
            solved = detail::black_litterman(cov, symbols, request.market, request.views,
                                             config_.risk_aversion, config_.bl_tau,
                                             config_.inversion);
            break;
        case Objective::MeanVariance:
            solved = detail::mean_variance(sigma);
            break;
    }

    Vector w = std::move(solved.weights);
    apply_weight_bounds(w, constraints.min_position_weight, constraints.max_position_weight);
    result.singular_covariance = solved.singular;

    if (config_.verbose && solved.singular) {
        fmt::print(stderr, "[optimizer] singular covariance ({}x{}): identity substituted\n", n, n);
    }

    for (Eigen::Index i = 0; i < n; ++i) {
        const auto& symbol = symbols[static_cast<std::size_t>(i)];
        result.weights[symbol] = w(i);
        if (solved.implied_returns.size() == n) {
            result.implied_returns[symbol] = solved.implied_returns(i);
        }
    }

    // ── Diagnostics ──
    if (n > 0) {
        const double er   = w.dot(mu);
        const double risk = std::sqrt(std::max(w.dot(cov * w), 0.0));
        const double rf   = config_.risk_free_rate;

        result.expected_return = er;
        result.expected_risk   = risk;
        result.sharpe_ratio    = risk > 0.0 ? (er - rf) / risk : 0.0;

        const Vector contributions = w.cwiseProduct(mu);
        const double downside = stats::downside_deviation(
            std::span<const double>(contributions.data(), static_cast<std::size_t>(n)), 0.0);
        if (downside > 0.0) {
            result.sortino_ratio = (er - rf) / downside;
        } else {
            result.sortino_ratio = er - rf > 0.0 ? std::numeric_limits<double>::infinity() : 0.0;
        }

        const double est_drawdown = 0.5 * std::abs(mu.minCoeff());
        result.calmar_ratio = est_drawdown > 0.0 ? er / est_drawdown : 0.0;

        result.diversification_score = diversification_score(w, entry.correlation);
        result.concentration_risk    = w.squaredNorm();
        result.value_at_risk_95      = constants::Z_95 * risk - er;
        result.value_at_risk_99      = constants::Z_99 * risk - er;
        result.expected_shortfall    = constants::ES_VAR_MULTIPLIER * result.value_at_risk_95;

        const Vector rc = detail::risk_contributions(w, cov);
        double current_er = 0.0;
        for (Eigen::Index i = 0; i < n; ++i) {
            const auto& symbol = symbols[static_cast<std::size_t>(i)];
            result.risk_contributions[symbol] = rc(i);
            current_er += lookup(result.current_weights, symbol) * mu(i);
        }

        const double delta = er - current_er;
        result.attribution = PerformanceAttribution{
            .total_return       = delta,
            .asset_allocation   = 0.6 * delta,
            .security_selection = 0.3 * delta,
            .interaction        = 0.1 * delta,
        };
    }

    result.rebalance_actions = generate_rebalance_actions(
        result.current_weights, result.weights, request.total_capital, config_, entry.estimates);

    // ── Constraint report ──
    auto& report = result.constraint_report;
    constexpr double tol = constants::WEIGHT_EPSILON;

    for (const auto& [symbol, wi] : result.weights) {
        if (wi < constraints.min_position_weight - tol || wi > constraints.max_position_weight + tol) {
            report.weights_within_bounds = false;
        }
    }
    double abs_delta = 0.0;
    for (const auto& [symbol, wi] : result.weights) {
        abs_delta += std::abs(wi - lookup(result.current_weights, symbol));
    }
    for (const auto& [symbol, wi] : result.current_weights) {
        if (!result.weights.contains(symbol)) abs_delta += std::abs(wi);
    }
    report.turnover        = 0.5 * abs_delta;
    report.within_max_risk = result.expected_risk <= constraints.max_risk + tol;
    if (constraints.target_return) {
        report.meets_target_return = result.expected_return >= *constraints.target_return - tol;
    }
    if (constraints.max_turnover) {
        report.within_max_turnover = report.turnover <= *constraints.max_turnover + tol;
    }
    if (constraints.min_diversification) {
        report.meets_min_diversification =
            result.diversification_score >= *constraints.min_diversification - tol;
    }
    if (constraints.max_concentration) {
        report.within_max_concentration =
            result.concentration_risk <= *constraints.max_concentration + tol;
    }

    if (config_.verbose && !report.all_satisfied()) {
        fmt::print(stderr, "[optimizer] allocation violates at least one constraint "
                           "(turnover={:.4f}, risk={:.4f})\n",
                   report.turnover, result.expected_risk);
    }
    return result;
}

OptimizationResult optimize_portfolio(const std::vector<Holding>&        positions,
                                      const std::vector<MarketSnapshot>& market,
                                      double                             total_capital,
                                      const PortfolioConstraints&        constraints,
                                      Objective                          objective) {
    OptimizationRequest request;
    request.positions     = positions;
    request.market        = market;
    request.total_capital = total_capital;
    request.constraints   = constraints;
    request.objective     = objective;
    return PortfolioOptimizer{}.optimize(request);
}

}  // namespace qsae::portfolio
