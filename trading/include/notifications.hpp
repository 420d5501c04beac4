#pragma once

#include "datatypes.hpp"
#include <optional>
#include <string>

namespace trading {

    enum class TradeEventType {
        Entry,
        Exit
    };

    struct TradeEvent {
        TradeEventType type = TradeEventType::Entry;
        core::Timestamp timestamp;
        std::string symbol;
        core::Direction direction = core::Direction::Long;
        long long quantity = 0;
        double price = 0.0;
        std::optional<core::ExitReason> exit_reason; // Exit only
        std::optional<double> pnl;                   // Exit only
    };

    // Fire-and-forget delivery of entry/exit events (chat bot, e-mail, ...)
    class INotificationSink {
    public:
        virtual ~INotificationSink() = default;
        virtual void notify(const TradeEvent& event) = 0;
    };

    class LoggingNotificationSink : public INotificationSink {
    public:
        void notify(const TradeEvent& event) override;
    };

    std::string formatTradeEvent(const TradeEvent& event);

    // Delivers to `sink` (if any); a failing sink is logged, never propagated
    void notifySafely(INotificationSink* sink, const TradeEvent& event);

} // namespace trading
