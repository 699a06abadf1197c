/// @file src/strategy/reference_strategies.cpp
/// @brief MovingAverageCrossover, BollingerMeanReversion, RsiMomentum and
///        Breakout.

#include "qsae/strategy.hpp"
#include "qsae/indicators.hpp"
#include "qsae/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace qsae::strategy {

namespace {

constexpr std::size_t VOLUME_WINDOW = 20;

/// Mean of the trailing VOLUME_WINDOW volumes, or 1 when the series is too
/// short to average.
double trailing_volume_mean(std::span<const double> volumes) noexcept {
    if (volumes.size() <= VOLUME_WINDOW) return 1.0;
    return stats::mean(volumes.last(VOLUME_WINDOW));
}

/// Latest volume; a zero or missing reading counts as 1.
double latest_volume(const MarketWindow& window) noexcept {
    if (!window.has_volumes()) return 1.0;
    const double v = window.volumes.back();
    return v > 0.0 ? v : 1.0;
}

double cap_confidence(double c) noexcept {
    if (!std::isfinite(c)) return 0.0;
    return std::clamp(c, 0.0, constants::MAX_STRATEGY_CONFIDENCE);
}

Signal make_signal(Action action, double confidence, SignalDetail detail) {
    Signal s;
    s.action     = action;
    s.confidence = cap_confidence(confidence);
    s.detail     = std::move(detail);
    return s;
}

}  // namespace

// ─── MovingAverageCrossover ───────────────────────────────────────────────────

MovingAverageCrossover::MovingAverageCrossover(std::size_t short_period,
                                               std::size_t long_period) noexcept
    : short_period_(std::max<std::size_t>(short_period, 1))
    , long_period_(std::max(long_period, short_period_ + 1)) {}

std::string_view MovingAverageCrossover::name() const noexcept {
    return "MovingAverageCrossover";
}

std::size_t MovingAverageCrossover::minimum_lookback() const noexcept {
    return long_period_ + 1;
}

Signal MovingAverageCrossover::evaluate(const MarketWindow& window) const {
    if (window.prices.size() < minimum_lookback()) return Signal::hold();

    const auto short_ma = indicators::sma(window.prices, short_period_);
    const auto long_ma  = indicators::sma(window.prices, long_period_);
    if (short_ma.size() < 2 || long_ma.size() < 2) return Signal::hold();

    const double curr_short = short_ma[short_ma.size() - 1];
    const double prev_short = short_ma[short_ma.size() - 2];
    const double curr_long  = long_ma[long_ma.size() - 1];
    const double prev_long  = long_ma[long_ma.size() - 2];

    const double avg_volume =
        window.has_volumes() ? trailing_volume_mean(window.volumes) : 1.0;
    const bool   confirmed  = latest_volume(window) > avg_volume * 1.2;
    const double boost      = confirmed ? 1.5 : 1.0;

    const bool bullish = prev_short <= prev_long && curr_short > curr_long;
    const bool bearish = prev_short >= prev_long && curr_short < curr_long;

    if (bullish && curr_long > 0.0) {
        const double strength = (curr_short - curr_long) / curr_long;
        return make_signal(Action::Buy, std::abs(strength) * boost,
                           {{"strength", strength},
                            {"volume_confirmed", confirmed ? 1.0 : 0.0}});
    }
    if (bearish && curr_short > 0.0) {
        const double strength = (curr_long - curr_short) / curr_short;
        return make_signal(Action::Sell, std::abs(strength) * boost,
                           {{"strength", strength},
                            {"volume_confirmed", confirmed ? 1.0 : 0.0}});
    }
    return Signal::hold();
}

// ─── BollingerMeanReversion ───────────────────────────────────────────────────

BollingerMeanReversion::BollingerMeanReversion(std::size_t period, double k,
                                               std::size_t lookback) noexcept
    : period_(std::max<std::size_t>(period, 2))
    , k_(k)
    , lookback_(std::max(lookback, period_)) {}

std::string_view BollingerMeanReversion::name() const noexcept {
    return "MeanReversion";
}

std::size_t BollingerMeanReversion::minimum_lookback() const noexcept {
    return lookback_;
}

Signal BollingerMeanReversion::evaluate(const MarketWindow& window) const {
    if (window.prices.size() < minimum_lookback()) return Signal::hold();

    const auto bands = indicators::bollinger(window.prices, period_, k_);
    if (bands.upper.empty()) return Signal::hold();

    const double price = window.prices.back();
    const double upper = bands.upper.back();
    const double lower = bands.lower.back();
    const double width = upper - lower;
    if (!(width > 0.0)) return Signal::hold();  // flat window

    const double position = (price - lower) / width;
    SignalDetail detail{{"band_position", position}, {"band_width", width}};

    if (position > 0.8) {
        return make_signal(Action::Sell, (position - 0.8) * 5.0, std::move(detail));
    }
    if (position < 0.2) {
        return make_signal(Action::Buy, (0.2 - position) * 5.0, std::move(detail));
    }
    return Signal::hold();
}

// ─── RsiMomentum ──────────────────────────────────────────────────────────────

RsiMomentum::RsiMomentum(std::size_t period, std::size_t lookback) noexcept
    : period_(std::max<std::size_t>(period, 1))
    , lookback_(std::max(lookback, period_ + 1)) {}

std::string_view RsiMomentum::name() const noexcept {
    return "Momentum";
}

std::size_t RsiMomentum::minimum_lookback() const noexcept {
    return lookback_;
}

Signal RsiMomentum::evaluate(const MarketWindow& window) const {
    if (window.prices.size() < minimum_lookback()) return Signal::hold();

    const auto values = indicators::rsi(window.prices, period_);
    if (values.empty()) return Signal::hold();

    const double current = values.back();
    if (current > 70.0) {
        return make_signal(Action::Sell, (current - 70.0) / 30.0, {{"rsi", current}});
    }
    if (current < 30.0) {
        return make_signal(Action::Buy, (30.0 - current) / 30.0, {{"rsi", current}});
    }
    return Signal::hold();
}

// ─── Breakout ─────────────────────────────────────────────────────────────────

Breakout::Breakout(std::size_t channel, std::size_t lookback) noexcept
    : channel_(std::max<std::size_t>(channel, 2))
    , lookback_(std::max(lookback, channel_ + 1)) {}

std::string_view Breakout::name() const noexcept {
    return "Breakout";
}

std::size_t Breakout::minimum_lookback() const noexcept {
    return lookback_;
}

Signal Breakout::evaluate(const MarketWindow& window) const {
    const auto& prices = window.prices;
    if (prices.size() < minimum_lookback()) return Signal::hold();

    const double current = prices.back();
    // Channel: the `channel_` prices before the latest one.
    const auto channel = prices.subspan(prices.size() - 1 - channel_, channel_);
    const auto [lo_it, hi_it] = std::minmax_element(channel.begin(), channel.end());
    const double high  = *hi_it;
    const double low   = *lo_it;
    const double range = high - low;
    const double threshold = range * 0.02;

    const auto   returns    = indicators::simple_returns(prices.last(channel_));
    const double volatility = stats::stddev(returns);

    // Mean volume over the same bars as the channel.
    double avg_volume = 1.0;
    if (window.has_volumes()) {
        avg_volume = stats::mean(
            window.volumes.subspan(window.volumes.size() - 1 - channel_, channel_));
    }
    const bool spike = latest_volume(window) > avg_volume * 1.5;
    if (!spike) return Signal::hold();

    if (current > high + threshold && high > 0.0) {
        const double strength = (current - high) / high;
        return make_signal(Action::Buy, strength * 10.0 * (1.0 + volatility),
                           {{"strength", strength},
                            {"volatility", volatility},
                            {"channel_high", high}});
    }
    if (current < low - threshold && current > 0.0) {
        const double strength = (low - current) / current;
        return make_signal(Action::Sell, strength * 10.0 * (1.0 + volatility),
                           {{"strength", strength},
                            {"volatility", volatility},
                            {"channel_low", low}});
    }
    return Signal::hold();
}

}  // namespace qsae::strategy
