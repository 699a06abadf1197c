/// @file tests/portfolio/test_optimizer.cpp
/// @brief Tests for PortfolioOptimizer objectives, diagnostics and the
///        constraint report.
///
/// Most cases pin the estimates through a table-driven ReturnEstimator and a
/// zero or constant correlation so that every objective has a closed form.

#include <gtest/gtest.h>
#include "qsae/constants.hpp"
#include "qsae/portfolio.hpp"

#include <cmath>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace qsae;
using namespace qsae::portfolio;

// ─── Helpers ─────────────────────────────────────────────────────────────────

/// Looks up (expected return, volatility) by symbol.
class TableEstimator final : public ReturnEstimator {
public:
    explicit TableEstimator(std::map<std::string, std::pair<double, double>> table)
        : table_(std::move(table)) {}

    std::string_view name() const noexcept override { return "table"; }
    AssetEstimate estimate(const MarketSnapshot& s) const override {
        const auto it = table_.find(s.symbol);
        if (it == table_.end()) return AssetEstimate{.symbol = s.symbol};
        return AssetEstimate{.symbol          = s.symbol,
                             .expected_return = it->second.first,
                             .volatility      = it->second.second};
    }

private:
    std::map<std::string, std::pair<double, double>> table_;
};

static std::vector<MarketSnapshot> snapshots(const std::vector<std::string>& symbols) {
    std::vector<MarketSnapshot> out;
    for (const auto& s : symbols) out.push_back(MarketSnapshot{.symbol = s, .price = 100.0});
    return out;
}

/// A: μ 10% σ 10%, B: μ 8% σ 20%, C: μ 5% σ 40%.
static PortfolioOptimizer three_asset_optimizer(double rho = 0.0,
                                                OptimizerConfig config = OptimizerConfig{}) {
    auto table = std::make_shared<TableEstimator>(std::map<std::string, std::pair<double, double>>{
        {"A", {0.10, 0.10}},
        {"B", {0.08, 0.20}},
        {"C", {0.05, 0.40}},
    });
    return PortfolioOptimizer(config, table, std::make_shared<ConstantCorrelation>(rho));
}

static OptimizationRequest request_for(Objective objective,
                                       const std::vector<std::string>& symbols = {"A", "B", "C"}) {
    OptimizationRequest req;
    req.market        = snapshots(symbols);
    req.total_capital = 10'000.0;
    req.objective     = objective;
    return req;
}

static double weight_sum(const OptimizationResult& r) {
    double s = 0.0;
    for (const auto& [sym, w] : r.weights) s += w;
    return s;
}

// ─── Objectives ──────────────────────────────────────────────────────────────

TEST(Optimizer_MeanVariance, InverseVolatility) {
    const auto r = three_asset_optimizer().optimize(request_for(Objective::MeanVariance));
    // 1/σ = 10, 5, 2.5
    EXPECT_NEAR(r.weight("A"), 10.0 / 17.5, 1e-12);
    EXPECT_NEAR(r.weight("B"), 5.0 / 17.5, 1e-12);
    EXPECT_NEAR(r.weight("C"), 2.5 / 17.5, 1e-12);
}

TEST(Optimizer_MeanVariance, ZeroVolatilityUsesFallback) {
    auto table = std::make_shared<TableEstimator>(std::map<std::string, std::pair<double, double>>{
        {"A", {0.0, 0.0}},
        {"B", {0.0, 0.2}},
    });
    PortfolioOptimizer opt(OptimizerConfig{}, table);
    const auto r = opt.optimize(request_for(Objective::MeanVariance, {"A", "B"}));
    // 1/0.1 = 10, 1/0.2 = 5
    EXPECT_NEAR(r.weight("A"), 2.0 / 3.0, 1e-12);
    EXPECT_NEAR(r.weight("B"), 1.0 / 3.0, 1e-12);
}

TEST(Optimizer_MinVariance, UncorrelatedInverseVariance) {
    const auto r = three_asset_optimizer().optimize(request_for(Objective::MinVariance));
    // 1/σ² = 100, 25, 6.25
    EXPECT_NEAR(r.weight("A"), 100.0 / 131.25, 1e-9);
    EXPECT_NEAR(r.weight("B"), 25.0 / 131.25, 1e-9);
    EXPECT_NEAR(r.weight("C"), 6.25 / 131.25, 1e-9);
    EXPECT_GT(r.weight("A"), r.weight("B"));
    EXPECT_GT(r.weight("B"), r.weight("C"));
    EXPECT_NEAR(weight_sum(r), 1.0, 1e-9);
    EXPECT_FALSE(r.singular_covariance);
}

TEST(Optimizer_MinVariance, CholeskyMatchesGaussJordan) {
    OptimizerConfig cfg;
    cfg.inversion = linalg::InversionMethod::Cholesky;
    const auto gj = three_asset_optimizer(0.3).optimize(request_for(Objective::MinVariance));
    const auto ch = three_asset_optimizer(0.3, cfg).optimize(request_for(Objective::MinVariance));
    for (const auto* s : {"A", "B", "C"}) EXPECT_NEAR(gj.weight(s), ch.weight(s), 1e-9) << s;
}

TEST(Optimizer_MinVariance, SingularCovariance_EqualWeightsFlagged) {
    auto table = std::make_shared<TableEstimator>(std::map<std::string, std::pair<double, double>>{
        {"A", {0.01, 0.0}}, {"B", {0.02, 0.0}}, {"C", {0.03, 0.0}},
    });
    for (auto method : {linalg::InversionMethod::GaussJordan, linalg::InversionMethod::Cholesky}) {
        OptimizerConfig cfg;
        cfg.inversion = method;
        PortfolioOptimizer opt(cfg, table);
        const auto r = opt.optimize(request_for(Objective::MinVariance));
        EXPECT_TRUE(r.singular_covariance);
        for (const auto* s : {"A", "B", "C"}) EXPECT_NEAR(r.weight(s), 1.0 / 3.0, 1e-12);
    }
}

TEST(Optimizer_MaxSharpe, UncorrelatedExcessOverVariance) {
    auto table = std::make_shared<TableEstimator>(std::map<std::string, std::pair<double, double>>{
        {"X", {0.12, 0.2}},
        {"Y", {0.07, 0.1}},
    });
    PortfolioOptimizer opt(OptimizerConfig{}, table, std::make_shared<ConstantCorrelation>(0.0));
    const auto r = opt.optimize(request_for(Objective::MaxSharpe, {"X", "Y"}));
    // (0.10 / 0.04, 0.05 / 0.01) = (2.5, 5)
    EXPECT_NEAR(r.weight("X"), 1.0 / 3.0, 1e-9);
    EXPECT_NEAR(r.weight("Y"), 2.0 / 3.0, 1e-9);
}

TEST(Optimizer_MaxSharpe, NoExcessReturn_EqualWeights) {
    auto table = std::make_shared<TableEstimator>(std::map<std::string, std::pair<double, double>>{
        {"X", {constants::OPTIMIZER_RISK_FREE_RATE, 0.2}},
        {"Y", {constants::OPTIMIZER_RISK_FREE_RATE, 0.1}},
    });
    PortfolioOptimizer opt(OptimizerConfig{}, table, std::make_shared<ConstantCorrelation>(0.0));
    const auto r = opt.optimize(request_for(Objective::MaxSharpe, {"X", "Y"}));
    EXPECT_NEAR(r.weight("X"), 0.5, 1e-12);
    EXPECT_NEAR(r.weight("Y"), 0.5, 1e-12);
}

TEST(Optimizer_RiskParity, EqualisesRiskContributions) {
    for (double rho : {0.0, 0.3}) {
        const auto r = three_asset_optimizer(rho).optimize(request_for(Objective::RiskParity));
        for (const auto& [sym, rc] : r.risk_contributions) {
            EXPECT_NEAR(rc, 1.0 / 3.0, 1e-5) << sym << " rho=" << rho;
        }
        EXPECT_NEAR(weight_sum(r), 1.0, 1e-12);
    }
}

TEST(Optimizer_RiskParity, UncorrelatedMatchesInverseVolatility) {
    const auto r = three_asset_optimizer().optimize(request_for(Objective::RiskParity));
    EXPECT_NEAR(r.weight("A"), 10.0 / 17.5, 1e-6);
    EXPECT_NEAR(r.weight("B"), 5.0 / 17.5, 1e-6);
    EXPECT_NEAR(r.weight("C"), 2.5 / 17.5, 1e-6);
}

// ─── Black-Litterman ─────────────────────────────────────────────────────────

TEST(Optimizer_BlackLitterman, NoViewsNoCaps_EqualPrior) {
    const auto r = three_asset_optimizer(0.3).optimize(request_for(Objective::BlackLitterman));
    for (const auto* s : {"A", "B", "C"}) EXPECT_NEAR(r.weight(s), 1.0 / 3.0, 1e-12);
    ASSERT_EQ(r.implied_returns.size(), 3u);

    // π = δ Σ w for A: δ · (σ_A² w_A + ρ σ_A σ_B w_B + ρ σ_A σ_C w_C)
    const double expected_pi_a = constants::BL_RISK_AVERSION *
        (0.01 + 0.3 * 0.1 * 0.2 + 0.3 * 0.1 * 0.4) / 3.0;
    EXPECT_NEAR(r.implied_returns.at("A"), expected_pi_a, 1e-12);
}

TEST(Optimizer_BlackLitterman, MarketCapPrior) {
    auto req = request_for(Objective::BlackLitterman);
    req.market[0].market_cap = 600.0;
    req.market[1].market_cap = 300.0;
    req.market[2].market_cap = 100.0;
    const auto r = three_asset_optimizer(0.3).optimize(req);
    EXPECT_NEAR(r.weight("A"), 0.6, 1e-12);
    EXPECT_NEAR(r.weight("B"), 0.3, 1e-12);
    EXPECT_NEAR(r.weight("C"), 0.1, 1e-12);
}

TEST(Optimizer_BlackLitterman, ViewAgreeingWithPrior_LeavesPriorUnchanged) {
    const auto base = three_asset_optimizer(0.3).optimize(request_for(Objective::BlackLitterman));

    auto req = request_for(Objective::BlackLitterman);
    req.views.push_back(InvestorView{.picks           = {{"C", 1.0}},
                                     .expected_return = base.implied_returns.at("C"),
                                     .confidence      = 0.8});
    const auto r = three_asset_optimizer(0.3).optimize(req);
    for (const auto* s : {"A", "B", "C"}) EXPECT_NEAR(r.weight(s), 1.0 / 3.0, 1e-9) << s;
    EXPECT_FALSE(r.singular_covariance);
}

TEST(Optimizer_BlackLitterman, BullishViewRaisesWeight) {
    auto req = request_for(Objective::BlackLitterman);
    req.views.push_back(InvestorView{.picks = {{"C", 1.0}}, .expected_return = 0.5, .confidence = 0.7});
    const auto r = three_asset_optimizer(0.3).optimize(req);
    EXPECT_GT(r.weight("C"), 1.0 / 3.0);
    EXPECT_NEAR(weight_sum(r), 1.0, 1e-12);
}

TEST(Optimizer_BlackLitterman, RelativeView) {
    auto req = request_for(Objective::BlackLitterman);
    req.views.push_back(InvestorView{.picks           = {{"B", 1.0}, {"A", -1.0}},
                                     .expected_return = 0.2,
                                     .confidence      = 0.6});
    const auto r = three_asset_optimizer(0.3).optimize(req);
    EXPECT_GT(r.weight("B"), r.weight("A"));
}

TEST(Optimizer_BlackLitterman, ViewOnUnknownSymbol_Ignored) {
    auto req = request_for(Objective::BlackLitterman);
    req.views.push_back(InvestorView{.picks = {{"ZZZ", 1.0}}, .expected_return = 1.0});
    const auto r = three_asset_optimizer(0.3).optimize(req);
    for (const auto* s : {"A", "B", "C"}) EXPECT_NEAR(r.weight(s), 1.0 / 3.0, 1e-12);
}

// ─── Bounds ──────────────────────────────────────────────────────────────────

TEST(Optimizer_Bounds, ApplyWeightBounds_ClampsAndRenormalises) {
    Vector w(3);
    w << 0.7, 0.2, 0.1;
    apply_weight_bounds(w, 0.15, 0.5);
    // clamp → 0.5, 0.2, 0.15 → sum 0.85
    EXPECT_NEAR(w(0), 0.5 / 0.85, 1e-12);
    EXPECT_NEAR(w(1), 0.2 / 0.85, 1e-12);
    EXPECT_NEAR(w(2), 0.15 / 0.85, 1e-12);
    EXPECT_NEAR(w.sum(), 1.0, 1e-12);
}

TEST(Optimizer_Bounds, ApplyWeightBounds_ZeroSumFallsBackToEqual) {
    Vector w = Vector::Zero(4);
    apply_weight_bounds(w, 0.0, 1.0);
    for (Eigen::Index i = 0; i < 4; ++i) EXPECT_DOUBLE_EQ(w(i), 0.25);
}

TEST(Optimizer_Bounds, NonBindingBounds_Satisfied) {
    auto req = request_for(Objective::MeanVariance);
    req.constraints.max_position_weight = 0.8;
    const auto r = three_asset_optimizer().optimize(req);
    EXPECT_TRUE(r.constraint_report.weights_within_bounds);
}

TEST(Optimizer_Bounds, RenormalisingPastMaxIsReported) {
    auto table = std::make_shared<TableEstimator>(std::map<std::string, std::pair<double, double>>{
        {"A", {0.0, 0.01}}, {"B", {0.0, 0.5}}, {"C", {0.0, 0.5}},
    });
    PortfolioOptimizer opt(OptimizerConfig{}, table);
    auto req = request_for(Objective::MeanVariance);
    req.constraints.max_position_weight = 0.5;

    const auto r = opt.optimize(req);
    EXPECT_NEAR(weight_sum(r), 1.0, 1e-12);
    EXPECT_GT(r.weight("A"), 0.5);
    EXPECT_FALSE(r.constraint_report.weights_within_bounds);
    EXPECT_FALSE(r.constraint_report.all_satisfied());
}

// ─── Diagnostics ─────────────────────────────────────────────────────────────

TEST(Optimizer_Diagnostics, ClosedFormUncorrelated) {
    const auto r = three_asset_optimizer().optimize(request_for(Objective::MeanVariance));
    const double wa = 10.0 / 17.5, wb = 5.0 / 17.5, wc = 2.5 / 17.5;

    const double er   = wa * 0.10 + wb * 0.08 + wc * 0.05;
    const double risk = std::sqrt(wa * wa * 0.01 + wb * wb * 0.04 + wc * wc * 0.16);
    EXPECT_NEAR(r.expected_return, er, 1e-12);
    EXPECT_NEAR(r.expected_risk, risk, 1e-12);
    EXPECT_NEAR(r.sharpe_ratio, (er - constants::OPTIMIZER_RISK_FREE_RATE) / risk, 1e-9);
    EXPECT_NEAR(r.concentration_risk, wa * wa + wb * wb + wc * wc, 1e-12);
    EXPECT_NEAR(r.diversification_score, 1.0, 1e-12);
    EXPECT_NEAR(r.value_at_risk_95, constants::Z_95 * risk - er, 1e-12);
    EXPECT_NEAR(r.value_at_risk_99, constants::Z_99 * risk - er, 1e-12);
    EXPECT_NEAR(r.expected_shortfall, constants::ES_VAR_MULTIPLIER * r.value_at_risk_95, 1e-12);
    EXPECT_NEAR(r.calmar_ratio, er / (0.5 * 0.05), 1e-12);
    // No negative contributions → no downside, positive excess
    EXPECT_TRUE(std::isinf(r.sortino_ratio));
}

TEST(Optimizer_Diagnostics, DiversificationUnderConstantCorrelation) {
    const auto r = three_asset_optimizer(0.3).optimize(request_for(Objective::MeanVariance));
    EXPECT_NEAR(r.diversification_score, 0.7, 1e-12);
}

TEST(Optimizer_Diagnostics, RiskContributionsSumToOne) {
    const auto r = three_asset_optimizer(0.3).optimize(request_for(Objective::MinVariance));
    double total = 0.0;
    for (const auto& [sym, rc] : r.risk_contributions) total += rc;
    EXPECT_NEAR(total, 1.0, 1e-9);
}

TEST(Optimizer_Diagnostics, AttributionSplit) {
    auto req = request_for(Objective::MeanVariance);
    req.positions = {Holding{.symbol = "C", .quantity = 50.0, .entry_price = 100.0}};
    const auto r = three_asset_optimizer().optimize(req);

    const auto& a = r.attribution;
    EXPECT_NEAR(a.total_return, r.expected_return - 0.5 * 0.05, 1e-12);
    EXPECT_NEAR(a.asset_allocation, 0.6 * a.total_return, 1e-12);
    EXPECT_NEAR(a.security_selection, 0.3 * a.total_return, 1e-12);
    EXPECT_NEAR(a.interaction, 0.1 * a.total_return, 1e-12);
}

// ─── Current weights, turnover and constraint report ─────────────────────────

TEST(Optimizer_Current, WeightsFromHoldings) {
    auto req = request_for(Objective::MeanVariance);
    req.total_capital = 1'000.0;
    req.positions = {
        Holding{.symbol = "A", .quantity = 2.0, .entry_price = 100.0},
        Holding{.symbol = "B", .quantity = -1.0, .entry_price = 100.0},
    };
    const auto r = three_asset_optimizer().optimize(req);
    EXPECT_NEAR(r.current_weights.at("A"), 0.2, 1e-12);
    EXPECT_NEAR(r.current_weights.at("B"), 0.1, 1e-12);
}

TEST(Optimizer_Current, ZeroCapital_NoCurrentWeights) {
    auto req = request_for(Objective::MeanVariance);
    req.total_capital = 0.0;
    req.positions = {Holding{.symbol = "A", .quantity = 2.0, .entry_price = 100.0}};
    const auto r = three_asset_optimizer().optimize(req);
    EXPECT_TRUE(r.current_weights.empty());
    for (const auto& a : r.rebalance_actions) EXPECT_DOUBLE_EQ(a.amount_to_trade, 0.0);
}

TEST(Optimizer_Constraints, OptionalChecks) {
    auto req = request_for(Objective::MeanVariance);
    req.total_capital = 1'000.0;
    req.positions = {Holding{.symbol = "A", .quantity = 2.0, .entry_price = 100.0}};
    req.constraints.max_turnover        = 0.1;
    req.constraints.target_return       = 0.5;
    req.constraints.min_diversification = 0.5;
    req.constraints.max_concentration   = 0.3;

    const auto r = three_asset_optimizer().optimize(req);
    const auto& c = r.constraint_report;

    // ½ (|0.5714 − 0.2| + 0.2857 + 0.1429) = 0.4
    EXPECT_NEAR(c.turnover, 0.4, 1e-12);
    ASSERT_TRUE(c.within_max_turnover.has_value());
    EXPECT_FALSE(*c.within_max_turnover);
    EXPECT_FALSE(*c.meets_target_return);
    EXPECT_TRUE(*c.meets_min_diversification);
    EXPECT_FALSE(*c.within_max_concentration);
    EXPECT_FALSE(c.all_satisfied());
}

TEST(Optimizer_Constraints, UnrequestedChecksAreUnset) {
    const auto r = three_asset_optimizer().optimize(request_for(Objective::MeanVariance));
    const auto& c = r.constraint_report;
    EXPECT_FALSE(c.meets_target_return.has_value());
    EXPECT_FALSE(c.within_max_turnover.has_value());
    EXPECT_FALSE(c.meets_min_diversification.has_value());
    EXPECT_FALSE(c.within_max_concentration.has_value());
    EXPECT_TRUE(c.all_satisfied());
}

TEST(Optimizer_Constraints, HoldingOutsideUniverseCountsTowardsTurnover) {
    auto req = request_for(Objective::MeanVariance);
    req.total_capital = 1'000.0;
    req.positions = {Holding{.symbol = "Z", .quantity = 1.0, .entry_price = 100.0}};
    const auto r = three_asset_optimizer().optimize(req);
    // ½ (1 + 0.1) over the union {A, B, C, Z}
    EXPECT_NEAR(r.constraint_report.turnover, 0.55, 1e-12);

    bool sells_z = false;
    for (const auto& a : r.rebalance_actions) {
        if (a.symbol == "Z") sells_z = a.action == TradeDirection::Sell;
    }
    EXPECT_TRUE(sells_z);
}

// ─── Universe edge cases ─────────────────────────────────────────────────────

TEST(Optimizer_Universe, EmptyMarket_EmptyResult) {
    OptimizationRequest req;
    req.total_capital = 1'000.0;
    const auto r = PortfolioOptimizer{}.optimize(req);
    EXPECT_TRUE(r.weights.empty());
    EXPECT_TRUE(std::isfinite(r.expected_return));
    EXPECT_TRUE(std::isfinite(r.sharpe_ratio));
}

TEST(Optimizer_Universe, DuplicateSymbolsCollapse) {
    const auto r = three_asset_optimizer().optimize(
        request_for(Objective::MeanVariance, {"A", "B", "A"}));
    ASSERT_EQ(r.symbols, (std::vector<std::string>{"A", "B"}));
    EXPECT_NEAR(weight_sum(r), 1.0, 1e-12);
}

TEST(Optimizer_Universe, EveryObjectiveSumsToOne) {
    for (auto objective : {Objective::MeanVariance, Objective::RiskParity,
                           Objective::BlackLitterman, Objective::MinVariance,
                           Objective::MaxSharpe}) {
        const auto r = three_asset_optimizer(0.3).optimize(request_for(objective));
        EXPECT_NEAR(weight_sum(r), 1.0, 1e-9) << to_string(objective);
        EXPECT_EQ(r.objective, objective);
    }
}

TEST(Optimizer_Universe, DefaultEstimatorsFromSnapshots) {
    std::vector<MarketSnapshot> market{
        {.symbol = "BTC", .price = 60'000.0, .change_percent_24h = 2.5},
        {.symbol = "ETH", .price = 3'000.0, .change_percent_24h = -1.0},
        {.symbol = "SOL", .price = 150.0, .change_percent_24h = 5.0},
    };
    const auto r = optimize_portfolio({}, market, 50'000.0, PortfolioConstraints{});
    EXPECT_EQ(r.objective, Objective::MeanVariance);
    EXPECT_NEAR(weight_sum(r), 1.0, 1e-12);
    // Lowest |change| → lowest volatility → largest inverse-vol weight
    EXPECT_GT(r.weight("ETH"), r.weight("BTC"));
    EXPECT_GT(r.weight("BTC"), r.weight("SOL"));
}

// ─── Names and presentation ──────────────────────────────────────────────────

TEST(Optimizer_Names, ObjectiveRoundTrip) {
    for (auto o : {Objective::MeanVariance, Objective::RiskParity, Objective::BlackLitterman,
                   Objective::MinVariance, Objective::MaxSharpe}) {
        EXPECT_EQ(parse_objective(to_string(o)), o);
    }
    EXPECT_FALSE(parse_objective("kelly").has_value());
    EXPECT_EQ(to_string(Objective::RiskParity), "riskParity");
}

TEST(Optimizer_Names, ToStringListsUniverse) {
    const auto r = three_asset_optimizer().optimize(request_for(Objective::MinVariance));
    const std::string text = r.to_string();
    EXPECT_NE(text.find("minVariance"), std::string::npos);
    for (const auto* s : {"A", "B", "C"}) EXPECT_NE(text.find(s), std::string::npos);
}
