/// @file src/backtest/monte_carlo.cpp
/// @brief Shuffled-replay Monte Carlo over the backtester.

#include "qsae/backtest.hpp"
#include "qsae/statistics.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <random>

namespace qsae::backtest {

MonteCarloSummary run_monte_carlo(std::span<const MarketObservation> observations,
                                  const strategy::Strategy&          strategy,
                                  std::size_t                        iterations,
                                  std::optional<std::uint64_t>       seed,
                                  std::stop_token                    stop,
                                  const BacktestConfig&              config) {
    MonteCarloSummary summary;
    summary.iterations_requested = iterations;
    summary.returns.reserve(iterations);

    std::mt19937_64 rng(seed ? *seed : std::random_device{}());
    const Backtester backtester(config);

    std::vector<MarketObservation> shuffled(observations.begin(), observations.end());

    for (std::size_t it = 0; it < iterations; ++it) {
        if (stop.stop_requested()) break;

        std::shuffle(shuffled.begin(), shuffled.end(), rng);
        // Keep the clock monotonic so the sanitiser does not discard bars.
        for (std::size_t k = 0; k < shuffled.size(); ++k) {
            shuffled[k].timestamp = observations[k].timestamp;
        }

        const auto report = backtester.run(shuffled, strategy);
        summary.returns.push_back(report.total_return);
    }

    summary.iterations_completed = summary.returns.size();
    if (summary.returns.empty()) return summary;

    const std::span<const double> r(summary.returns);
    summary.mean_return   = stats::mean(r);
    summary.stddev_return = stats::stddev(r);
    summary.best_return   = *std::max_element(r.begin(), r.end());
    summary.worst_return  = *std::min_element(r.begin(), r.end());
    summary.p5_return     = stats::percentile(r, 0.05);
    summary.p95_return    = stats::percentile(r, 0.95);

    const auto wins = std::count_if(r.begin(), r.end(), [](double x) { return x > 0.0; });
    summary.win_probability =
        static_cast<double>(wins) / static_cast<double>(summary.iterations_completed);

    if (config.verbose) {
        fmt::print(stderr, "[monte-carlo] {}\n", summary.to_string());
    }
    return summary;
}

}  // namespace qsae::backtest
