/// @file src/strategy/ensemble.cpp
/// @brief StrategyEnsemble weighted vote, default ensemble and the
///        reference-strategy registry.

#include "qsae/strategy.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace qsae::strategy {

// ─── Construction ─────────────────────────────────────────────────────────────

StrategyEnsemble::StrategyEnsemble(std::vector<Member> members, std::string name)
    : members_(std::move(members))
    , name_(std::move(name)) {
    for (const auto& m : members_) {
        total_weight_ += m.weight;
        lookback_ = std::max(lookback_, m.strategy->minimum_lookback());
    }
}

std::optional<StrategyEnsemble>
StrategyEnsemble::make(std::vector<Member> members, std::string name) {
    if (members.empty()) return std::nullopt;
    for (const auto& m : members) {
        if (!m.strategy) return std::nullopt;
        if (!std::isfinite(m.weight) || m.weight <= 0.0) return std::nullopt;
    }
    return StrategyEnsemble(std::move(members), std::move(name));
}

std::optional<StrategyEnsemble>
StrategyEnsemble::make(const std::vector<StrategyPtr>& strategies,
                       const std::vector<double>&      weights,
                       std::string                     name) {
    if (strategies.size() != weights.size()) return std::nullopt;

    std::vector<Member> members;
    members.reserve(strategies.size());
    for (std::size_t i = 0; i < strategies.size(); ++i) {
        members.push_back(Member{strategies[i], weights[i]});
    }
    return make(std::move(members), std::move(name));
}

// ─── Strategy interface ───────────────────────────────────────────────────────

std::string_view StrategyEnsemble::name() const noexcept {
    return name_;
}

std::size_t StrategyEnsemble::minimum_lookback() const noexcept {
    return lookback_;
}

Signal StrategyEnsemble::evaluate(const MarketWindow& window) const {
    double buy_score  = 0.0;
    double sell_score = 0.0;

    for (const auto& m : members_) {
        const Signal s = m.strategy->evaluate(window);
        if (s.action == Action::Buy)  buy_score  += s.confidence * m.weight;
        if (s.action == Action::Sell) sell_score += s.confidence * m.weight;
    }
    buy_score  /= total_weight_;
    sell_score /= total_weight_;

    Signal out;
    out.detail = {{"buy_score", buy_score}, {"sell_score", sell_score}};

    const double threshold = constants::ENSEMBLE_SIGNAL_THRESHOLD;
    if (buy_score > threshold && buy_score > sell_score) {
        out.action     = Action::Buy;
        out.confidence = std::min(buy_score, 1.0);
    } else if (sell_score > threshold && sell_score > buy_score) {
        out.action     = Action::Sell;
        out.confidence = std::min(sell_score, 1.0);
    }
    return out;
}

// ─── Defaults and registry ────────────────────────────────────────────────────

StrategyEnsemble default_ensemble() {
    // Weights are positive and the member list is non-empty: make() cannot fail.
    return *StrategyEnsemble::make({
        {std::make_shared<MovingAverageCrossover>(), 0.30},
        {std::make_shared<BollingerMeanReversion>(), 0.25},
        {std::make_shared<RsiMomentum>(),            0.25},
        {std::make_shared<Breakout>(),               0.20},
    });
}

StrategyPtr make_reference_strategy(std::string_view name) {
    if (name == "MovingAverageCrossover") return std::make_shared<MovingAverageCrossover>();
    if (name == "MeanReversion")          return std::make_shared<BollingerMeanReversion>();
    if (name == "Momentum")               return std::make_shared<RsiMomentum>();
    if (name == "Breakout")               return std::make_shared<Breakout>();
    if (name == "Ensemble")               return std::make_shared<StrategyEnsemble>(default_ensemble());
    return nullptr;
}

std::vector<std::string_view> reference_strategy_names() {
    return {"MovingAverageCrossover", "MeanReversion", "Momentum", "Breakout", "Ensemble"};
}

}  // namespace qsae::strategy
