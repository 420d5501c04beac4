#include "metrics.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <iterator>
#include <numeric>

namespace backtester {

    namespace {

        double sampleStdDev(const std::vector<double>& values) {
            if (values.size() < 2) {
                return 0.0;
            }
            const double mean = std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
            double sq_sum = 0.0;
            for (double v : values) {
                sq_sum += (v - mean) * (v - mean);
            }
            return std::sqrt(sq_sum / static_cast<double>(values.size() - 1));
        }

    } // end anonymous namespace

    void BacktestMetrics::logMetrics() const {
        auto logger = core::logging::getLogger();
        logger->info("--- Backtest Metrics ---");
        logger->info("Initial Capital: {:.2f}", initial_capital);
        logger->info("Final Capital: {:.2f}", final_capital);
        logger->info("Total PnL: {:.2f}", total_pnl);
        logger->info("Total Return: {:.2f}%", total_return_pct);
        logger->info("Annual Return: {:.2f}%", annual_return_pct);
        logger->info("Max Drawdown: {:.2f}%", max_drawdown_pct);
        logger->info("Volatility: {:.2f}%", volatility_pct);
        logger->info("Sharpe Ratio: {:.2f}", sharpe_ratio);
        logger->info("Sortino Ratio: {:.2f}", sortino_ratio);
        logger->info("Calmar Ratio: {:.2f}", calmar_ratio);
        logger->info("Trades: {} ({} won, {} lost)", total_trades, winning_trades, losing_trades);
        logger->info("Win Rate: {:.2f}%", win_rate_pct);
        logger->info("Profit Factor: {:.2f}", profit_factor);
        logger->info("Avg Win PnL: {:.2f}", avg_win_pnl);
        logger->info("Avg Loss PnL: {:.2f}", avg_loss_pnl);
        logger->info("Avg Trade Duration: {:.2f} days", avg_trade_duration_days);
        logger->info("Commission Paid: {:.2f}", total_commission);
        for (const auto& [reason, count] : exit_reasons) {
            logger->info("Exit '{}': {}", reason, count);
        }
        logger->info("------------------------");
    }

    BacktestMetrics computeMetrics(const std::vector<core::Trade>& trades,
                                   const std::vector<core::EquityPoint>& equity_curve,
                                   double initial_capital,
                                   double risk_free_rate) {
        BacktestMetrics metrics;
        metrics.initial_capital = initial_capital;
        metrics.final_capital = initial_capital;

        // --- Trade-Based Metrics ---
        metrics.total_trades = static_cast<int>(trades.size());
        double gross_profit = 0.0;
        double gross_loss = 0.0;
        double total_days = 0.0;
        for (const auto& trade : trades) {
            if (trade.pnl > 0) {
                metrics.winning_trades++;
                gross_profit += trade.pnl;
            } else if (trade.pnl < 0) {
                metrics.losing_trades++;
                gross_loss += trade.pnl; // Loss is negative
            }
            metrics.total_commission += trade.commission_paid;
            metrics.exit_reasons[core::utils::exitReasonToString(trade.exit_reason)]++;
            total_days += std::chrono::duration<double>(trade.exit_time - trade.entry_time).count() / 86400.0;
        }

        if (metrics.total_trades > 0) {
            metrics.win_rate_pct = 100.0 * metrics.winning_trades / metrics.total_trades;
            metrics.avg_trade_duration_days = total_days / metrics.total_trades;
        }
        if (std::abs(gross_loss) > 1e-9) {
            metrics.profit_factor = gross_profit / std::abs(gross_loss);
        } else if (gross_profit > 1e-9) {
            metrics.profit_factor = std::numeric_limits<double>::infinity();
        }
        metrics.avg_win_pnl = metrics.winning_trades > 0 ? gross_profit / metrics.winning_trades : 0.0;
        metrics.avg_loss_pnl = metrics.losing_trades > 0 ? gross_loss / metrics.losing_trades : 0.0;

        if (equity_curve.empty()) {
            return metrics;
        }

        // --- PnL and Return ---
        const core::EquityPoint& last = equity_curve.back();
        metrics.final_capital = last.capital + last.unrealized_pnl;
        metrics.total_pnl = metrics.final_capital - initial_capital;
        const double total_return = initial_capital > 1e-9 ? metrics.total_pnl / initial_capital : 0.0;
        metrics.total_return_pct = total_return * 100.0;

        // --- Max Drawdown ---
        double peak_equity = initial_capital;
        double max_drawdown = 0.0;
        for (const auto& point : equity_curve) {
            const double equity = point.capital + point.unrealized_pnl;
            peak_equity = std::max(peak_equity, equity);
            const double drawdown = peak_equity > 1e-9 ? (peak_equity - equity) / peak_equity : 0.0;
            max_drawdown = std::max(max_drawdown, drawdown);
        }
        metrics.max_drawdown_pct = max_drawdown * 100.0;

        // --- Periodic returns ---
        std::vector<double> returns;
        returns.reserve(equity_curve.size());
        double previous = initial_capital;
        for (const auto& point : equity_curve) {
            const double equity = point.capital + point.unrealized_pnl;
            returns.push_back(previous > 1e-9 ? equity / previous - 1.0 : 0.0);
            previous = equity;
        }

        const double periods = static_cast<double>(returns.size());
        if (1.0 + total_return > 0.0) {
            metrics.annual_return_pct = (std::pow(1.0 + total_return, kPeriodsPerYear / periods) - 1.0) * 100.0;
        } else {
            metrics.annual_return_pct = -100.0;
        }

        const double annualizer = std::sqrt(static_cast<double>(kPeriodsPerYear));
        const double daily_risk_free = std::pow(1.0 + risk_free_rate, 1.0 / kPeriodsPerYear) - 1.0;
        const double std_dev = sampleStdDev(returns);
        const double mean_excess = std::accumulate(returns.begin(), returns.end(), 0.0) / periods - daily_risk_free;

        metrics.volatility_pct = std_dev * annualizer * 100.0;
        if (std_dev > 1e-12) {
            metrics.sharpe_ratio = mean_excess / std_dev * annualizer;
        }

        std::vector<double> downside;
        std::copy_if(returns.begin(), returns.end(), std::back_inserter(downside), [](double r) { return r < 0.0; });
        const double downside_dev = sampleStdDev(downside) * annualizer;
        if (downside_dev > 1e-12) {
            metrics.sortino_ratio = mean_excess * annualizer / downside_dev;
        }
        if (max_drawdown > 1e-12) {
            metrics.calmar_ratio = (metrics.annual_return_pct / 100.0) / max_drawdown;
        }
        return metrics;
    }

} // namespace backtester
