/// @file src/backtest/backtester.cpp
/// @brief Backtester replay loop and position accounting.

#include "qsae/backtest.hpp"
#include "qsae/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <fmt/format.h>
#include <limits>
#include <utility>

namespace qsae::backtest {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

/// Observations that survived sanitisation, split into parallel columns so
/// windows can be handed to strategies as spans.
struct CleanSeries {
    std::vector<double>    prices;
    std::vector<double>    volumes;
    std::vector<Timestamp> timestamps;
    std::size_t            skipped = 0;
};

/// Drop unusable observations and coerce bad volumes to zero.
///
/// Skipped: non-finite or non-positive price, or a timestamp earlier than
/// the previous accepted observation.
CleanSeries sanitise(std::span<const MarketObservation> observations) {
    CleanSeries s;
    s.prices.reserve(observations.size());
    s.volumes.reserve(observations.size());
    s.timestamps.reserve(observations.size());

    for (const auto& obs : observations) {
        const bool bad_price = !std::isfinite(obs.price) || obs.price <= 0.0;
        const bool backwards = !s.timestamps.empty() && obs.timestamp < s.timestamps.back();
        if (bad_price || backwards) {
            ++s.skipped;
            continue;
        }
        const double volume =
            (std::isfinite(obs.volume) && obs.volume > 0.0) ? obs.volume : 0.0;
        s.prices.push_back(obs.price);
        s.volumes.push_back(volume);
        s.timestamps.push_back(obs.timestamp);
    }
    return s;
}

/// Cash, the open position and the trade ledger for a single replay.
class Account {
public:
    explicit Account(const BacktestConfig& config)
        : config_(config)
        , cash_(config.initial_capital) {}

    [[nodiscard]] Side side() const noexcept { return position_.side; }

    /// Equity marked at `price`.
    [[nodiscard]] double equity(double price) const noexcept {
        switch (position_.side) {
            case Side::Long:
                return cash_ + position_.quantity * price;
            case Side::Short:
                return cash_ + position_.quantity * (2.0 * position_.entry_price - price);
            case Side::None:
                break;
        }
        return cash_;
    }

    /// Open a position of `side` sized by `confidence`.  No-op if the
    /// resulting notional is zero.
    void open(Side side, double price, double confidence, Timestamp ts) {
        if (!(confidence > 0.0)) return;
        const double budget   = std::min(config_.position_fraction * cash_, cash_);
        const double notional = budget * std::min(confidence, 1.0);
        if (!(notional > 0.0)) return;

        const double quantity = notional / price;
        const double cost     = notional * config_.cost_rate;
        const double slippage = notional * config_.slippage_rate;
        const double entry    = side == Side::Long ? price + slippage / quantity
                                                   : price - slippage / quantity;

        cash_ -= quantity * entry + cost;
        position_ = Position{side, entry, quantity, ts};

        record(Trade{
            .id        = next_id_++,
            .action    = side == Side::Long ? Action::Buy : Action::Sell,
            .kind      = side == Side::Long ? TradeKind::OpenLong : TradeKind::OpenShort,
            .price     = entry,
            .quantity  = quantity,
            .timestamp = ts,
            .cost      = cost,
            .slippage  = slippage,
        });
    }

    /// Close the open position at `price`.  No-op when flat.
    void close(double price, Timestamp ts) {
        if (position_.side == Side::None) return;

        const double q        = position_.quantity;
        const double e        = position_.entry_price;
        const double notional = q * price;
        const double cost     = notional * config_.cost_rate;
        const double slippage = notional * config_.slippage_rate;
        const bool   is_long  = position_.side == Side::Long;

        const double realized = is_long ? q * (price - e) - cost - slippage
                                        : q * (e - price) - cost - slippage;
        cash_ += is_long ? notional - cost - slippage
                         : q * (2.0 * e - price) - cost - slippage;

        hold_time_total_ += static_cast<double>(ts - position_.opened_at);
        position_ = Position{};

        record(Trade{
            .id           = next_id_++,
            .action       = is_long ? Action::Sell : Action::Buy,
            .kind         = is_long ? TradeKind::CloseLong : TradeKind::CloseShort,
            .price        = price,
            .quantity     = q,
            .timestamp    = ts,
            .cost         = cost,
            .slippage     = slippage,
            .realized_pnl = realized,
        });
    }

    [[nodiscard]] double cash() const noexcept { return cash_; }
    [[nodiscard]] double hold_time_total() const noexcept { return hold_time_total_; }
    [[nodiscard]] std::vector<Trade>& trades() noexcept { return trades_; }

private:
    void record(Trade trade) {
        if (config_.verbose) {
            fmt::print(stderr, "[backtest] #{} {} qty={:.6f} @ {:.4f} cost={:.4f} slip={:.4f}{}\n",
                       trade.id, to_string(trade.kind), trade.quantity, trade.price,
                       trade.cost, trade.slippage,
                       trade.realized_pnl ? fmt::format(" pnl={:.4f}", *trade.realized_pnl)
                                          : std::string{});
        }
        trades_.push_back(std::move(trade));
    }

    const BacktestConfig& config_;
    double                cash_;
    Position              position_;
    std::vector<Trade>    trades_;
    std::uint64_t         next_id_         = 1;
    double                hold_time_total_ = 0.0;
};

/// Fill the trade-statistics block from the closing trades of the ledger.
void summarise_trades(BacktestReport& r, double hold_time_total) {
    std::vector<double> pnls;
    double gross_win  = 0.0;
    double gross_loss = 0.0;

    for (const auto& t : r.trades) {
        r.total_costs    += t.cost;
        r.total_slippage += t.slippage;
        if (!t.realized_pnl) continue;

        const double pnl = *t.realized_pnl;
        pnls.push_back(pnl);
        if (pnl > 0.0) {
            ++r.winning_trades;
            gross_win += pnl;
            r.largest_win = std::max(r.largest_win, pnl);
        } else if (pnl < 0.0) {
            ++r.losing_trades;
            gross_loss += pnl;
            r.largest_loss = std::min(r.largest_loss, pnl);
        }
    }

    r.total_trades     = r.trades.size();
    r.completed_trades = pnls.size();
    if (pnls.empty()) return;

    const double n = static_cast<double>(pnls.size());
    r.win_rate = static_cast<double>(r.winning_trades) / n;
    r.avg_win  = r.winning_trades > 0 ? gross_win / static_cast<double>(r.winning_trades) : 0.0;
    r.avg_loss = r.losing_trades > 0 ? -gross_loss / static_cast<double>(r.losing_trades) : 0.0;

    if (gross_loss < 0.0) {
        r.profit_factor = gross_win / -gross_loss;
    } else {
        r.profit_factor = gross_win > 0.0 ? std::numeric_limits<double>::infinity() : 0.0;
    }

    r.expectancy   = stats::mean(pnls);
    r.payoff_ratio = r.avg_loss > 0.0 ? r.avg_win / r.avg_loss : 0.0;

    const double sd = stats::stddev(pnls);
    r.system_quality_number = sd > 0.0 ? r.expectancy / sd * std::sqrt(n) : 0.0;
    r.avg_hold_time_ms      = hold_time_total / n;
}

/// Fill the return, drawdown and ratio block from the equity curve.
void summarise_equity(BacktestReport& r, const BacktestConfig& config) {
    r.final_equity = r.equity_curve.empty() ? config.initial_capital
                                            : r.equity_curve.back().equity;
    r.total_return = config.initial_capital > 0.0
        ? (r.final_equity - config.initial_capital) / config.initial_capital
        : 0.0;

    // Per-bar returns and drawdowns, anchored on the initial capital.
    double prev = config.initial_capital;
    double peak = config.initial_capital;
    std::vector<double> equity_values{config.initial_capital};
    equity_values.reserve(r.equity_curve.size() + 1);
    r.returns.reserve(r.equity_curve.size());

    std::size_t run = 0;
    double dd_sq_sum = 0.0;
    for (auto& point : r.equity_curve) {
        r.returns.push_back(prev > 0.0 ? (point.equity - prev) / prev : 0.0);
        prev = point.equity;
        peak = std::max(peak, point.equity);
        point.drawdown = peak > 0.0 ? std::clamp((peak - point.equity) / peak, 0.0, 1.0) : 0.0;

        run = point.drawdown > 0.0 ? run + 1 : 0;
        r.max_drawdown_duration = std::max(r.max_drawdown_duration, run);
        dd_sq_sum += point.drawdown * point.drawdown;
        equity_values.push_back(point.equity);
    }

    r.max_drawdown = stats::max_drawdown(equity_values);
    if (!r.equity_curve.empty()) {
        r.ulcer_index = std::sqrt(dd_sq_sum / static_cast<double>(r.equity_curve.size()));
    }
    r.recovery_factor = r.max_drawdown > 0.0 ? r.total_return / r.max_drawdown : 0.0;

    const double bars = static_cast<double>(r.bars_processed);
    if (bars > 0.0 && r.total_return > -1.0) {
        r.annualised_return =
            std::pow(1.0 + r.total_return, config.annualisation / bars) - 1.0;
    } else if (bars > 0.0) {
        r.annualised_return = -1.0;
    }

    r.sharpe_ratio  = stats::sharpe_ratio(r.returns, config.risk_free_rate);
    r.sortino_ratio = stats::sortino_ratio(r.returns, config.risk_free_rate);
    r.calmar_ratio  = stats::calmar_ratio(r.returns, r.max_drawdown, config.annualisation);
    r.value_at_risk = stats::value_at_risk(r.returns, config.var_confidence);
    r.volatility    = stats::stddev(r.returns) * std::sqrt(config.annualisation);
}

/// Fill alpha, beta, tracking error and information ratio against the
/// report's benchmark series.
void summarise_benchmark(BacktestReport& r) {
    const std::size_t n = std::min(r.returns.size(), r.benchmark_returns.size());
    if (n == 0) return;

    const std::span<const double> y(r.returns.data(), n);
    const std::span<const double> x(r.benchmark_returns.data(), n);

    const auto fit = stats::ols_regression(x, y);
    r.alpha = fit.alpha;
    r.beta  = fit.beta;

    std::vector<double> active(n);
    for (std::size_t k = 0; k < n; ++k) active[k] = y[k] - x[k];
    r.tracking_error    = stats::stddev(active);
    r.information_ratio = r.tracking_error > 0.0 ? stats::mean(active) / r.tracking_error : 0.0;
}

}  // namespace

// ─── Enum names ───────────────────────────────────────────────────────────────

std::string_view to_string(Side side) noexcept {
    switch (side) {
        case Side::Long:  return "long";
        case Side::Short: return "short";
        case Side::None:  return "flat";
    }
    return "flat";
}

std::string_view to_string(TradeKind kind) noexcept {
    switch (kind) {
        case TradeKind::OpenLong:   return "open-long";
        case TradeKind::OpenShort:  return "open-short";
        case TradeKind::CloseLong:  return "close-long";
        case TradeKind::CloseShort: return "close-short";
    }
    return "open-long";
}

// ─── Backtester ───────────────────────────────────────────────────────────────

Backtester::Backtester(BacktestConfig config)
    : config_(config) {}

BacktestReport Backtester::run(std::span<const MarketObservation> observations,
                               const strategy::Strategy&          strategy,
                               std::span<const double>            benchmark_returns) const {
    BacktestReport report;
    report.strategy_name   = std::string(strategy.name());
    report.initial_capital = config_.initial_capital;

    const CleanSeries series = sanitise(observations);
    report.observations_skipped = series.skipped;
    if (config_.verbose && series.skipped > 0) {
        fmt::print(stderr, "[backtest] skipped {} malformed observation(s)\n", series.skipped);
    }

    const std::size_t n        = series.prices.size();
    const std::size_t lookback = strategy.minimum_lookback();
    const std::span<const double> prices(series.prices);
    const std::span<const double> volumes(series.volumes);

    Account account(config_);

    for (std::size_t i = lookback; i < n; ++i) {
        const strategy::MarketWindow window{
            .prices  = prices.subspan(i - lookback, lookback),
            .volumes = volumes.subspan(i - lookback, lookback),
        };
        Signal signal = strategy.evaluate(window);

        const double    price = series.prices[i];
        const Timestamp ts    = series.timestamps[i];

        if (signal.action == Action::Buy && account.side() != Side::Long) {
            account.close(price, ts);
            account.open(Side::Long, price, signal.confidence, ts);
        } else if (signal.action == Action::Sell && account.side() != Side::Short) {
            account.close(price, ts);
            account.open(Side::Short, price, signal.confidence, ts);
        }

        if (benchmark_returns.empty()) {
            const double prev = series.prices[i - (i > 0 ? 1 : 0)];
            report.benchmark_returns.push_back((price - prev) / prev);
        }
        report.equity_curve.push_back(EquityPoint{ts, account.equity(price), 0.0});
        report.signals.push_back(SignalRecord{i, ts, std::move(signal)});
    }

    report.bars_processed = report.equity_curve.size();
    if (!benchmark_returns.empty()) {
        const auto m = std::min(benchmark_returns.size(), report.bars_processed);
        report.benchmark_returns.assign(benchmark_returns.begin(),
                                        benchmark_returns.begin() + static_cast<std::ptrdiff_t>(m));
    }
    if (report.bars_processed > 0) {
        report.start_time = series.timestamps[lookback];
        report.end_time   = series.timestamps[n - 1];

        // Force-close at the last observed price; the final bar reflects it.
        account.close(series.prices[n - 1], series.timestamps[n - 1]);
        report.equity_curve.back().equity = account.cash();

        const double first_price   = series.prices[lookback];
        report.buy_and_hold_return = (series.prices[n - 1] - first_price) / first_price;
    }

    report.trades = std::move(account.trades());
    summarise_trades(report, account.hold_time_total());
    summarise_equity(report, config_);
    summarise_benchmark(report);

    if (config_.verbose) {
        fmt::print(stderr, "[backtest] {}: {} bars, {} trades, return {:+.4f}%\n",
                   report.strategy_name, report.bars_processed, report.total_trades,
                   report.total_return * 100.0);
    }
    return report;
}

BacktestReport run_backtest(std::span<const MarketObservation> observations,
                            const strategy::Strategy&          strategy,
                            double cost_rate,
                            double slippage_rate,
                            double initial_capital) {
    BacktestConfig config;
    config.cost_rate       = cost_rate;
    config.slippage_rate   = slippage_rate;
    config.initial_capital = initial_capital;
    return Backtester(config).run(observations, strategy);
}

}  // namespace qsae::backtest
