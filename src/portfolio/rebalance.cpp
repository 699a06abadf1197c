/// @file src/portfolio/rebalance.cpp
/// @brief Rebalance action generation and prioritisation.

#include "qsae/portfolio.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <set>
#include <utility>

namespace qsae::portfolio {

std::vector<RebalanceAction>
generate_rebalance_actions(const WeightMap&                  current,
                           const WeightMap&                  target,
                           double                            total_capital,
                           const OptimizerConfig&            config,
                           const std::vector<AssetEstimate>& estimates) {
    constexpr double eps = constants::WEIGHT_EPSILON;

    std::set<std::string> symbols;
    for (const auto& [symbol, w] : current) symbols.insert(symbol);
    for (const auto& [symbol, w] : target)  symbols.insert(symbol);

    const double capital = std::isfinite(total_capital) ? std::max(total_capital, 0.0) : 0.0;

    std::vector<RebalanceAction> actions;
    for (const auto& symbol : symbols) {
        const auto   cur_it = current.find(symbol);
        const auto   tgt_it = target.find(symbol);
        const double cur    = cur_it == current.end() ? 0.0 : cur_it->second;
        const double tgt    = tgt_it == target.end() ? 0.0 : tgt_it->second;
        const double delta  = tgt - cur;
        const double size   = std::abs(delta);

        if (!(size > config.rebalance_threshold + eps)) continue;

        const auto est = std::find_if(estimates.begin(), estimates.end(),
                                      [&](const AssetEstimate& e) { return e.symbol == symbol; });
        const double mu    = est == estimates.end() ? 0.0 : est->expected_return;
        const double sigma = est == estimates.end() ? 0.0 : est->volatility;

        RebalanceAction a;
        a.symbol          = symbol;
        a.action          = delta > 0.0 ? TradeDirection::Buy
                          : delta < 0.0 ? TradeDirection::Sell
                                        : TradeDirection::Hold;
        a.current_weight  = cur;
        a.target_weight   = tgt;
        a.weight_delta    = delta;
        a.amount_to_trade = size * capital;
        a.estimated_cost  = a.amount_to_trade * config.transaction_cost;
        // Thresholds are compared with a tolerance: 0.5 − 0.4 is 0.0999…
        a.priority = size >= config.high_priority_threshold - eps ? Priority::High
                   : size >  config.rebalance_threshold + eps     ? Priority::Medium
                                                                  : Priority::Low;
        a.rationale = fmt::format("Rebalance from {:.1f}% to {:.1f}%", cur * 100.0, tgt * 100.0);
        a.impact    = ExpectedImpact{
            .return_contribution    = delta * mu,
            .risk_contribution      = size * sigma,
            .diversification_impact = cur * cur - tgt * tgt,
        };
        actions.push_back(std::move(a));
    }

    std::sort(actions.begin(), actions.end(), [](const RebalanceAction& a, const RebalanceAction& b) {
        if (a.amount_to_trade != b.amount_to_trade) return a.amount_to_trade > b.amount_to_trade;
        return a.symbol < b.symbol;
    });
    return actions;
}

}  // namespace qsae::portfolio
