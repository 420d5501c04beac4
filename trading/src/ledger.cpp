#include "ledger.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

namespace trading {

    void Ledger::recordTrade(const core::Trade& trade) {
        trades_.push_back(trade);
        core::logging::getLogger()->debug("Ledger: trade #{} {} {} PnL {:.2f}", trades_.size(), trade.symbol,
                                          core::utils::exitReasonToString(trade.exit_reason), trade.pnl);
    }

    void Ledger::recordEquity(const core::EquityPoint& point) {
        if (!equity_curve_.empty() && point.timestamp <= equity_curve_.back().timestamp) {
            throw core::BacktestException(fmt::format("Equity point at {} does not follow {}.",
                core::utils::timestampToString(point.timestamp),
                core::utils::timestampToString(equity_curve_.back().timestamp)));
        }
        equity_curve_.push_back(point);
    }

} // namespace trading
