#pragma once

/// @file include/qsae/indicators.hpp
/// @brief Technical indicators used by the reference strategies.
///
/// All indicators are pure functions of a price span.  Output series are
/// aligned to the END of the input: the last output element always refers to
/// the last input price.  An input shorter than the indicator period yields
/// an empty series.

#include <cstddef>
#include <span>
#include <vector>

namespace qsae::strategy::indicators {

/// Bollinger band series, each of length `prices.size() − period + 1`.
struct Bands {
    std::vector<double> upper;
    std::vector<double> middle;
    std::vector<double> lower;
};

/// Simple moving average.  Output length `prices.size() − period + 1`.
[[nodiscard]] std::vector<double>
sma(std::span<const double> prices, std::size_t period);

/// Exponential moving average, α = 2 / (period + 1), seeded with the SMA of
/// the first `period` prices.  Output length `prices.size() − period + 1`.
[[nodiscard]] std::vector<double>
ema(std::span<const double> prices, std::size_t period);

/// Wilder's Relative Strength Index in [0, 100].
/// Output length `prices.size() − period`.  A window with no losses reads
/// 100; a window with neither gains nor losses reads 50.
[[nodiscard]] std::vector<double>
rsi(std::span<const double> prices, std::size_t period);

/// Bollinger bands: SMA ± k · population σ over each window.
[[nodiscard]] Bands
bollinger(std::span<const double> prices, std::size_t period, double k);

/// Simple close-to-close returns, length `prices.size() − 1`.
/// A non-positive previous price yields a 0 return for that step.
[[nodiscard]] std::vector<double>
simple_returns(std::span<const double> prices);

}  // namespace qsae::strategy::indicators
