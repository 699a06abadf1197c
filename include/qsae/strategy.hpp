#pragma once

/// @file include/qsae/strategy.hpp
/// @brief Strategy Signal Source - public API.
///
/// # Module: Strategy
///
/// ## Responsibility
/// Map a bounded trailing window of prices and volumes to a trading Signal.
/// Strategies are the only pluggable part of the backtester: anything that
/// implements `Strategy` can be replayed through it.
///
/// ## Contract
///   - `evaluate` is a pure function of the window: no state survives a call
///   - A window shorter than `minimum_lookback()` yields Hold / confidence 0
///   - The last element of the window is the most recent observation
///   - If `volumes.size() != prices.size()` the volume series is ignored
///
/// ## Reference Set
/// Four classical single-asset rules ship with the engine for testing and as
/// ensemble members:
///   - MovingAverageCrossover - SMA(short) crossing SMA(long)
///   - BollingerMeanReversion - position within Bollinger bands
///   - RsiMomentum            - RSI overbought / oversold
///   - Breakout               - channel breakout on a volume spike
///
/// ## Guarantees
/// - Thread-safe: `evaluate` is const and touches no shared state
/// - Confidence is always within [0, MAX_STRATEGY_CONFIDENCE] for the
///   reference set and within [0, 1] for the ensemble

#include "qsae/constants.hpp"
#include "qsae/types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace qsae::strategy {

// ─── Types ────────────────────────────────────────────────────────────────────

/// Trailing market window handed to a strategy.
struct MarketWindow {
    std::span<const double> prices;
    std::span<const double> volumes;

    /// True when a volume series aligned with `prices` is present.
    [[nodiscard]] bool has_volumes() const noexcept {
        return !volumes.empty() && volumes.size() == prices.size();
    }
};

// ─── Strategy ─────────────────────────────────────────────────────────────────

/// Closed strategy interface: a name, a minimum lookback, and a pure
/// window → Signal evaluation.
class Strategy {
public:
    virtual ~Strategy() = default;

    /// Human-readable identifier used in reports and logs.
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// Number of observations the strategy needs before it can emit
    /// anything other than Hold.  The backtester slices windows of exactly
    /// this length.
    [[nodiscard]] virtual std::size_t minimum_lookback() const noexcept = 0;

    /// Evaluate the window.
    [[nodiscard]] virtual Signal evaluate(const MarketWindow& window) const = 0;
};

using StrategyPtr = std::shared_ptr<const Strategy>;

// ─── Reference strategies ─────────────────────────────────────────────────────

/// Trend following on a simple-moving-average crossover.
///
/// Bullish crossover (prev short ≤ prev long, now short > long) → Buy;
/// bearish crossover → Sell.  Confidence = min(|strength| × boost, 0.9)
/// where strength is the relative MA gap and boost = 1.5 when the latest
/// volume exceeds 1.2 × the 20-bar mean volume.
class MovingAverageCrossover final : public Strategy {
public:
    explicit MovingAverageCrossover(std::size_t short_period = 10,
                                    std::size_t long_period  = 30) noexcept;

    [[nodiscard]] std::string_view name() const noexcept override;
    [[nodiscard]] std::size_t minimum_lookback() const noexcept override;
    [[nodiscard]] Signal evaluate(const MarketWindow& window) const override;

private:
    std::size_t short_period_;
    std::size_t long_period_;
};

/// Mean reversion inside Bollinger bands.
///
/// p = (price − lower) / (upper − lower).  p > 0.8 → Sell with confidence
/// min((p − 0.8) × 5, 0.9); p < 0.2 → Buy with confidence min((0.2 − p) × 5, 0.9).
class BollingerMeanReversion final : public Strategy {
public:
    explicit BollingerMeanReversion(std::size_t period   = 20,
                                    double      k        = 2.0,
                                    std::size_t lookback = 30) noexcept;

    [[nodiscard]] std::string_view name() const noexcept override;
    [[nodiscard]] std::size_t minimum_lookback() const noexcept override;
    [[nodiscard]] Signal evaluate(const MarketWindow& window) const override;

private:
    std::size_t period_;
    double      k_;
    std::size_t lookback_;
};

/// RSI overbought / oversold.
///
/// RSI > 70 → Sell with confidence min((RSI − 70) / 30, 0.9);
/// RSI < 30 → Buy with confidence min((30 − RSI) / 30, 0.9).
class RsiMomentum final : public Strategy {
public:
    explicit RsiMomentum(std::size_t period   = 14,
                         std::size_t lookback = 30) noexcept;

    [[nodiscard]] std::string_view name() const noexcept override;
    [[nodiscard]] std::size_t minimum_lookback() const noexcept override;
    [[nodiscard]] Signal evaluate(const MarketWindow& window) const override;

private:
    std::size_t period_;
    std::size_t lookback_;
};

/// Channel breakout confirmed by a volume spike.
///
/// The channel is the high/low of the `channel` prices preceding the latest
/// one.  A close more than 2% of the channel range beyond it, with volume
/// above 1.5 × the mean volume over the same channel bars, triggers Buy (upside) or Sell
/// (downside) with confidence min(strength × 10 × (1 + σ_returns), 0.9).
class Breakout final : public Strategy {
public:
    explicit Breakout(std::size_t channel  = 20,
                      std::size_t lookback = 50) noexcept;

    [[nodiscard]] std::string_view name() const noexcept override;
    [[nodiscard]] std::size_t minimum_lookback() const noexcept override;
    [[nodiscard]] Signal evaluate(const MarketWindow& window) const override;

private:
    std::size_t channel_;
    std::size_t lookback_;
};

// ─── StrategyEnsemble ─────────────────────────────────────────────────────────

/// Weighted-vote composition of several strategies.
///
/// # Voting Rule
///   buy_score  = Σ_{buy votes}  confidence_i · w_i / Σ w_i
///   sell_score = Σ_{sell votes} confidence_i · w_i / Σ w_i
///
/// Buy iff buy_score > 0.3 and buy_score > sell_score; Sell symmetrically;
/// otherwise Hold with zero confidence.  The threshold and the strict
/// dominance test govern how often downstream backtests trade.
///
/// # Example
/// ```cpp
/// auto ens = StrategyEnsemble::make({
///     {std::make_shared<MovingAverageCrossover>(), 0.6},
///     {std::make_shared<RsiMomentum>(),           0.4},
/// });
/// if (ens) auto sig = ens->evaluate(window);
/// ```
class StrategyEnsemble final : public Strategy {
public:
    struct Member {
        StrategyPtr strategy;
        double      weight = 1.0;
    };

    /// Build an ensemble.
    ///
    /// # Returns
    /// `nullopt` if `members` is empty, any strategy is null, or any weight
    /// is non-finite or not strictly positive.
    [[nodiscard]] static std::optional<StrategyEnsemble>
    make(std::vector<Member> members, std::string name = "Ensemble");

    /// Parallel-array overload.  Also `nullopt` when the sizes differ.
    [[nodiscard]] static std::optional<StrategyEnsemble>
    make(const std::vector<StrategyPtr>& strategies,
         const std::vector<double>&      weights,
         std::string                     name = "Ensemble");

    [[nodiscard]] std::string_view name() const noexcept override;
    [[nodiscard]] std::size_t minimum_lookback() const noexcept override;
    [[nodiscard]] Signal evaluate(const MarketWindow& window) const override;

    [[nodiscard]] const std::vector<Member>& members() const noexcept { return members_; }

private:
    StrategyEnsemble(std::vector<Member> members, std::string name);

    std::vector<Member> members_;
    std::string         name_;
    double              total_weight_ = 0.0;
    std::size_t         lookback_     = 0;
};

/// The four reference strategies weighted 0.3 / 0.25 / 0.25 / 0.2.
[[nodiscard]] StrategyEnsemble default_ensemble();

/// Look up a reference strategy by registry name:
/// "MovingAverageCrossover", "MeanReversion", "Momentum", "Breakout",
/// "Ensemble".  Returns nullptr for an unknown name.
[[nodiscard]] StrategyPtr make_reference_strategy(std::string_view name);

/// Registry names accepted by `make_reference_strategy`.
[[nodiscard]] std::vector<std::string_view> reference_strategy_names();

}  // namespace qsae::strategy
