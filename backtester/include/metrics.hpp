#pragma once

#include <map>
#include <string>
#include <vector>

#include "datatypes.hpp"

namespace backtester {

    // --- Backtest Metrics Struct ---
    // Percent fields hold percentages (12.5 == 12.5%)
    struct BacktestMetrics {
        double initial_capital = 0.0;
        double final_capital = 0.0;
        double total_pnl = 0.0;
        double total_return_pct = 0.0;
        double annual_return_pct = 0.0;
        double max_drawdown_pct = 0.0;
        double volatility_pct = 0.0;      // Annualized
        double sharpe_ratio = 0.0;
        double sortino_ratio = 0.0;
        double calmar_ratio = 0.0;

        int total_trades = 0;
        int winning_trades = 0;
        int losing_trades = 0;
        double win_rate_pct = 0.0;
        double profit_factor = 0.0;       // Gross profit / gross loss
        double avg_win_pnl = 0.0;
        double avg_loss_pnl = 0.0;        // Negative
        double avg_trade_duration_days = 0.0;
        double total_commission = 0.0;

        std::map<std::string, int> exit_reasons; // exit_reason -> trade count

        void logMetrics() const;
    };

    constexpr int kPeriodsPerYear = 252;

    // Equity for returns and drawdown is capital + unrealized PnL
    BacktestMetrics computeMetrics(const std::vector<core::Trade>& trades,
                                   const std::vector<core::EquityPoint>& equity_curve,
                                   double initial_capital,
                                   double risk_free_rate);

} // namespace backtester
