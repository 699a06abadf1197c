/// @file src/strategy/indicators.cpp
/// @brief SMA / EMA / RSI / Bollinger implementations.

#include "qsae/indicators.hpp"
#include "qsae/statistics.hpp"

#include <cmath>

namespace qsae::strategy::indicators {

std::vector<double> sma(std::span<const double> prices, std::size_t period) {
    if (period == 0 || prices.size() < period) return {};

    std::vector<double> out;
    out.reserve(prices.size() - period + 1);

    double sum = 0.0;
    for (std::size_t i = 0; i < period; ++i) sum += prices[i];
    out.push_back(sum / static_cast<double>(period));

    for (std::size_t i = period; i < prices.size(); ++i) {
        sum += prices[i] - prices[i - period];
        out.push_back(sum / static_cast<double>(period));
    }
    return out;
}

std::vector<double> ema(std::span<const double> prices, std::size_t period) {
    if (period == 0 || prices.size() < period) return {};

    const double alpha = 2.0 / (static_cast<double>(period) + 1.0);

    std::vector<double> out;
    out.reserve(prices.size() - period + 1);
    out.push_back(stats::mean(prices.first(period)));

    for (std::size_t i = period; i < prices.size(); ++i) {
        out.push_back(alpha * prices[i] + (1.0 - alpha) * out.back());
    }
    return out;
}

std::vector<double> rsi(std::span<const double> prices, std::size_t period) {
    if (period == 0 || prices.size() <= period) return {};

    auto to_rsi = [](double avg_gain, double avg_loss) {
        if (avg_loss <= 0.0) return avg_gain > 0.0 ? 100.0 : 50.0;
        const double rs = avg_gain / avg_loss;
        return 100.0 - 100.0 / (1.0 + rs);
    };

    // Seed with the simple average of the first `period` changes.
    double avg_gain = 0.0;
    double avg_loss = 0.0;
    for (std::size_t i = 1; i <= period; ++i) {
        const double change = prices[i] - prices[i - 1];
        if (change > 0.0) avg_gain += change;
        else              avg_loss -= change;
    }
    const double p = static_cast<double>(period);
    avg_gain /= p;
    avg_loss /= p;

    std::vector<double> out;
    out.reserve(prices.size() - period);
    out.push_back(to_rsi(avg_gain, avg_loss));

    // Wilder smoothing: avg = (avg · (p − 1) + x) / p
    for (std::size_t i = period + 1; i < prices.size(); ++i) {
        const double change = prices[i] - prices[i - 1];
        const double gain   = change > 0.0 ?  change : 0.0;
        const double loss   = change < 0.0 ? -change : 0.0;
        avg_gain = (avg_gain * (p - 1.0) + gain) / p;
        avg_loss = (avg_loss * (p - 1.0) + loss) / p;
        out.push_back(to_rsi(avg_gain, avg_loss));
    }
    return out;
}

Bands bollinger(std::span<const double> prices, std::size_t period, double k) {
    Bands bands;
    if (period == 0 || prices.size() < period) return bands;

    const std::size_t n = prices.size() - period + 1;
    bands.upper.reserve(n);
    bands.middle.reserve(n);
    bands.lower.reserve(n);

    for (std::size_t i = 0; i < n; ++i) {
        const auto window = prices.subspan(i, period);
        const double mid  = stats::mean(window);
        const double sd   = stats::stddev(window);
        bands.middle.push_back(mid);
        bands.upper.push_back(mid + k * sd);
        bands.lower.push_back(mid - k * sd);
    }
    return bands;
}

std::vector<double> simple_returns(std::span<const double> prices) {
    if (prices.size() < 2) return {};

    std::vector<double> rets;
    rets.reserve(prices.size() - 1);
    for (std::size_t i = 1; i < prices.size(); ++i) {
        const double prev = prices[i - 1];
        const double curr = prices[i];
        if (!std::isfinite(prev) || !std::isfinite(curr) || prev <= 0.0) {
            rets.push_back(0.0);
        } else {
            rets.push_back((curr - prev) / prev);
        }
    }
    return rets;
}

}  // namespace qsae::strategy::indicators
