#include "notifications.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <exception>

namespace trading {

    std::string formatTradeEvent(const TradeEvent& event) {
        if (event.type == TradeEventType::Entry) {
            return fmt::format("ENTRY {} {} x{} @ {:.2f} ({})",
                               core::utils::directionToString(event.direction), event.symbol, event.quantity, event.price,
                               core::utils::timestampToString(event.timestamp));
        }
        return fmt::format("EXIT {} {} x{} @ {:.2f} ({}), reason {}, PnL {:.2f}",
                           core::utils::directionToString(event.direction), event.symbol, event.quantity, event.price,
                           core::utils::timestampToString(event.timestamp),
                           event.exit_reason ? core::utils::exitReasonToString(*event.exit_reason) : "unknown",
                           event.pnl.value_or(0.0));
    }

    void LoggingNotificationSink::notify(const TradeEvent& event) {
        core::logging::getLogger()->info("[notify] {}", formatTradeEvent(event));
    }

    void notifySafely(INotificationSink* sink, const TradeEvent& event) {
        if (!sink) {
            return;
        }
        try {
            sink->notify(event);
        } catch (const std::exception& e) {
            core::logging::getLogger()->error("Notification for {} failed: {}", event.symbol, e.what());
        }
    }

} // namespace trading
