#include <gtest/gtest.h>
#include "qsae/constants.hpp"
#include "qsae/portfolio.hpp"

#include <string>
#include <vector>

using namespace qsae;
using namespace qsae::portfolio;

// ─── Threshold and direction ─────────────────────────────────────────────────

TEST(Rebalance, BelowThreshold_NoAction) {
    const auto actions = generate_rebalance_actions({{"BTC", 0.50}}, {{"BTC", 0.53}}, 100'000.0);
    EXPECT_TRUE(actions.empty());
}

TEST(Rebalance, ExactlyAtThreshold_NoAction) {
    const auto actions = generate_rebalance_actions({{"BTC", 0.50}}, {{"BTC", 0.55}}, 100'000.0);
    EXPECT_TRUE(actions.empty());
}

TEST(Rebalance, LargeDecrease_HighPrioritySell) {
    const auto actions = generate_rebalance_actions({{"BTC", 0.50}}, {{"BTC", 0.40}}, 100'000.0);
    ASSERT_EQ(actions.size(), 1u);

    const auto& a = actions[0];
    EXPECT_EQ(a.symbol, "BTC");
    EXPECT_EQ(a.action, TradeDirection::Sell);
    EXPECT_EQ(a.priority, Priority::High);
    EXPECT_NEAR(a.weight_delta, -0.10, 1e-12);
    EXPECT_NEAR(a.amount_to_trade, 10'000.0, 1e-6);
    EXPECT_NEAR(a.estimated_cost, 10'000.0 * constants::REBALANCE_COST_RATE, 1e-9);
    EXPECT_EQ(a.rationale, "Rebalance from 50.0% to 40.0%");
}

TEST(Rebalance, ModerateIncrease_MediumPriorityBuy) {
    const auto actions = generate_rebalance_actions({{"ETH", 0.20}}, {{"ETH", 0.27}}, 50'000.0);
    ASSERT_EQ(actions.size(), 1u);
    EXPECT_EQ(actions[0].action, TradeDirection::Buy);
    EXPECT_EQ(actions[0].priority, Priority::Medium);
    EXPECT_NEAR(actions[0].amount_to_trade, 3'500.0, 1e-6);
}

TEST(Rebalance, ConfigurableThresholds) {
    OptimizerConfig cfg;
    cfg.rebalance_threshold     = 0.01;
    cfg.high_priority_threshold = 0.03;
    cfg.transaction_cost        = 0.0;
    const auto actions =
        generate_rebalance_actions({{"BTC", 0.50}}, {{"BTC", 0.53}}, 100'000.0, cfg);
    ASSERT_EQ(actions.size(), 1u);
    EXPECT_EQ(actions[0].priority, Priority::High);
    EXPECT_DOUBLE_EQ(actions[0].estimated_cost, 0.0);
}

// ─── Union of symbols ────────────────────────────────────────────────────────

TEST(Rebalance, NewSymbolIsBought) {
    const auto actions = generate_rebalance_actions({}, {{"SOL", 0.3}}, 1'000.0);
    ASSERT_EQ(actions.size(), 1u);
    EXPECT_EQ(actions[0].action, TradeDirection::Buy);
    EXPECT_DOUBLE_EQ(actions[0].current_weight, 0.0);
}

TEST(Rebalance, DroppedSymbolIsSold) {
    const auto actions = generate_rebalance_actions({{"DOGE", 0.2}}, {}, 1'000.0);
    ASSERT_EQ(actions.size(), 1u);
    EXPECT_EQ(actions[0].action, TradeDirection::Sell);
    EXPECT_DOUBLE_EQ(actions[0].target_weight, 0.0);
}

// ─── Ordering and impact ─────────────────────────────────────────────────────

TEST(Rebalance, SortedByAmountThenSymbol) {
    const WeightMap current{{"A", 0.125}, {"B", 0.375}, {"C", 0.625}, {"D", 0.0}};
    const WeightMap target {{"A", 0.375}, {"B", 0.125}, {"C", 0.125}, {"D", 0.5}};
    const auto actions = generate_rebalance_actions(current, target, 1'000.0);

    ASSERT_EQ(actions.size(), 4u);
    EXPECT_EQ(actions[0].symbol, "C");  // 0.5
    EXPECT_EQ(actions[1].symbol, "D");  // 0.5, after C
    EXPECT_EQ(actions[2].symbol, "A");  // 0.25
    EXPECT_EQ(actions[3].symbol, "B");  // 0.25, after A
    for (std::size_t i = 1; i < actions.size(); ++i) {
        EXPECT_GE(actions[i - 1].amount_to_trade, actions[i].amount_to_trade - 1e-9);
    }
}

TEST(Rebalance, ExpectedImpactFromEstimates) {
    const std::vector<AssetEstimate> est{{.symbol = "BTC", .expected_return = 0.2, .volatility = 0.5}};
    const auto actions = generate_rebalance_actions({{"BTC", 0.5}}, {{"BTC", 0.3}}, 1'000.0,
                                                    OptimizerConfig{}, est);
    ASSERT_EQ(actions.size(), 1u);
    const auto& impact = actions[0].impact;
    EXPECT_NEAR(impact.return_contribution, -0.2 * 0.2, 1e-12);
    EXPECT_NEAR(impact.risk_contribution, 0.2 * 0.5, 1e-12);
    EXPECT_NEAR(impact.diversification_impact, 0.25 - 0.09, 1e-12);
}

TEST(Rebalance, MissingEstimate_ZeroImpact) {
    const auto actions = generate_rebalance_actions({{"X", 0.5}}, {{"X", 0.1}}, 1'000.0);
    ASSERT_EQ(actions.size(), 1u);
    EXPECT_DOUBLE_EQ(actions[0].impact.return_contribution, 0.0);
    EXPECT_DOUBLE_EQ(actions[0].impact.risk_contribution, 0.0);
}

TEST(Rebalance, EnumNames) {
    EXPECT_EQ(to_string(TradeDirection::Buy), "BUY");
    EXPECT_EQ(to_string(TradeDirection::Sell), "SELL");
    EXPECT_EQ(to_string(Priority::High), "high");
    EXPECT_EQ(to_string(Priority::Low), "low");
}
