#include "decision_engine.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <variant>

namespace trading {

    DecisionEngine::DecisionEngine(risk::RiskManager& risk_manager,
                                   execution::IExecutionHandler& execution,
                                   Ledger& ledger,
                                   INotificationSink* notifications)
        : risk_manager_(risk_manager), execution_(execution), ledger_(ledger), notifications_(notifications)
    {
        core::logging::getLogger()->debug("DecisionEngine created with '{}' execution", execution_.getName());
    }

    std::string DecisionEngine::nextOrderId(const std::string& symbol) const {
        return fmt::format("{}-{}", symbol, order_sequence_ + 1);
    }

    BarOutcome DecisionEngine::processBar(const core::Bar& bar, const core::Signal& signal) {
        BarOutcome outcome;

        if (auto exit = risk_manager_.checkExit(bar, signal, nextOrderId(bar.symbol))) {
            ++order_sequence_;
            executeExit(*exit, outcome);
            return outcome;
        }

        if (auto entry = risk_manager_.prepareEntry(signal, bar, nextOrderId(bar.symbol))) {
            ++order_sequence_;
            executeEntry(*entry, outcome);
        }
        return outcome;
    }

    BarOutcome DecisionEngine::forceClose(const core::Bar& bar, core::ExitReason reason) {
        BarOutcome outcome;
        if (auto exit = risk_manager_.forceExit(bar, reason, nextOrderId(bar.symbol))) {
            ++order_sequence_;
            executeExit(*exit, outcome);
        }
        return outcome;
    }

    void DecisionEngine::executeEntry(const core::Order& order, BarOutcome& outcome) {
        execution::ExecutionResult result = execution_.submit(order);

        if (const auto* rejection = std::get_if<core::Rejection>(&result)) {
            ledger_.recordRejection();
            risk_manager_.abortEntry(order.symbol, rejection->reason);
            outcome.rejection = *rejection;
            return;
        }

        const core::Fill& fill = std::get<core::Fill>(result);
        ledger_.recordFill();
        if (!risk_manager_.confirmEntry(fill)) {
            ledger_.recordRejection();
            outcome.rejection = core::Rejection{order.order_id, "insufficient capital"};
            return;
        }

        outcome.opened = risk_manager_.getPosition(order.symbol);
        TradeEvent event;
        event.type = TradeEventType::Entry;
        event.timestamp = fill.timestamp;
        event.symbol = fill.symbol;
        event.direction = order.action == core::SignalAction::EnterShort ? core::Direction::Short : core::Direction::Long;
        event.quantity = fill.quantity;
        event.price = fill.price;
        notifySafely(notifications_, event);
    }

    void DecisionEngine::executeExit(const risk::ExitDecision& decision, BarOutcome& outcome) {
        const core::Order& order = decision.order;
        execution::ExecutionResult result = execution_.submit(order);

        if (const auto* rejection = std::get_if<core::Rejection>(&result)) {
            ledger_.recordRejection();
            risk_manager_.abortExit(order.symbol, rejection->reason);
            outcome.rejection = *rejection;
            return;
        }

        const core::Fill& fill = std::get<core::Fill>(result);
        ledger_.recordFill();
        const core::Trade trade = risk_manager_.confirmExit(fill);
        ledger_.recordTrade(trade);
        outcome.trade = trade;

        TradeEvent event;
        event.type = TradeEventType::Exit;
        event.timestamp = trade.exit_time;
        event.symbol = trade.symbol;
        event.direction = trade.direction;
        event.quantity = trade.quantity;
        event.price = trade.exit_price;
        event.exit_reason = trade.exit_reason;
        event.pnl = trade.pnl;
        notifySafely(notifications_, event);
    }

    core::EquityPoint DecisionEngine::recordEquity(const core::Timestamp& timestamp, const std::map<std::string, double>& last_closes) {
        core::EquityPoint point;
        point.timestamp = timestamp;
        point.capital = risk_manager_.getCapital();

        for (const auto& position : risk_manager_.getOpenPositions()) {
            auto price = last_closes.find(position.symbol);
            if (price == last_closes.end()) {
                continue;
            }
            const double sign = position.direction == core::Direction::Short ? -1.0 : 1.0;
            point.unrealized_pnl += sign * (price->second - position.entry_price) * static_cast<double>(position.quantity);
        }

        ledger_.recordEquity(point);
        core::logging::getLogger()->trace("Equity at {}: capital {:.2f}, unrealized {:.2f}",
                                          core::utils::timestampToString(timestamp), point.capital, point.unrealized_pnl);
        return point;
    }

} // namespace trading
