#pragma once

#include <string>
#include <vector>

#include "datatypes.hpp" // Provides core::Trade, core::EquityPoint

namespace trading {

    // Append-only record of closed trades, the equity curve and order outcomes
    class Ledger {
    public:
        void recordTrade(const core::Trade& trade);
        void recordEquity(const core::EquityPoint& point);
        void recordFill() { ++fill_count_; }
        void recordRejection() { ++rejection_count_; }

        const std::vector<core::Trade>& getTrades() const { return trades_; }
        const std::vector<core::EquityPoint>& getEquityCurve() const { return equity_curve_; }
        int getFillCount() const { return fill_count_; }
        int getRejectionCount() const { return rejection_count_; }

    private:
        std::vector<core::Trade> trades_;
        std::vector<core::EquityPoint> equity_curve_;
        int fill_count_ = 0;
        int rejection_count_ = 0;
    };

} // namespace trading
