#pragma once

#include "datatypes.hpp"
#include "risk_manager.hpp"
#include "execution_handler.hpp"
#include "ledger.hpp"
#include "notifications.hpp"
#include <map>
#include <optional>
#include <string>

namespace trading {

    struct BarOutcome {
        std::optional<core::Trade> trade;              // Position closed on this bar
        std::optional<core::Position> opened;          // Position opened on this bar
        std::optional<core::Rejection> rejection;      // Order refused on this bar
    };

    // The per-bar step shared by backtesting and live trading:
    // effective signal -> risk manager -> execution -> ledger and notifications.
    // Order ids are "<symbol>-<n>" with n counting every order this engine issues.
    class DecisionEngine {
    public:
        DecisionEngine(risk::RiskManager& risk_manager,
                       execution::IExecutionHandler& execution,
                       Ledger& ledger,
                       INotificationSink* notifications = nullptr);

        // Exit checks first; an entry is only considered when no exit was issued
        BarOutcome processBar(const core::Bar& bar, const core::Signal& signal);

        // Closes the symbol's open position at the bar's close (end_of_data, shutdown)
        BarOutcome forceClose(const core::Bar& bar, core::ExitReason reason);

        // Capital plus mark-to-market of open positions at `last_closes`
        core::EquityPoint recordEquity(const core::Timestamp& timestamp, const std::map<std::string, double>& last_closes);

    private:
        std::string nextOrderId(const std::string& symbol) const;
        void executeExit(const risk::ExitDecision& decision, BarOutcome& outcome);
        void executeEntry(const core::Order& order, BarOutcome& outcome);

        risk::RiskManager& risk_manager_;
        execution::IExecutionHandler& execution_;
        Ledger& ledger_;
        INotificationSink* notifications_;
        long long order_sequence_ = 0;
    };

} // namespace trading
