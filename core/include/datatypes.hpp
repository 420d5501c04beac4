#pragma once

#include <string>
#include <vector>
#include <chrono> // For timestamps

namespace core {

    // Using system_clock for time points, all values are UTC
    using Timestamp = std::chrono::system_clock::time_point;

    // One OHLCV observation for a symbol at a fixed timeframe
    struct Bar {
        std::string symbol;
        Timestamp timestamp;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        long long volume = 0; // Use long long for potentially large volumes

        bool operator<(const Bar& other) const {
            return timestamp < other.timestamp;
        }
    };

    // Directional vote of a strategy, or side of a position
    enum class Direction {
        Flat,
        Long,
        Short
    };

    enum class SignalAction {
        None,
        EnterLong,
        ExitLong,
        EnterShort,
        ExitShort
    };

    enum class ExitReason {
        StopLoss,
        TrailingStop,
        TakeProfit,
        MaxHoldingDays,
        OpposingSignal,
        EndOfData
    };

    struct Signal {
        Timestamp timestamp;
        std::string symbol;
        std::string strategy_name; // Identify which strategy generated it
        Direction direction = Direction::Flat;
    };

    struct Order {
        std::string order_id; // Unique ID for the order
        Timestamp timestamp;
        std::string symbol;
        SignalAction action = SignalAction::None;
        long long quantity = 0;
        double reference_price = 0.0; // Close of the bar that produced the order
    };

    struct Fill {
        std::string order_id;
        Timestamp timestamp;
        std::string symbol;
        SignalAction action = SignalAction::None;
        long long quantity = 0;
        double price = 0.0; // Actual execution price
        double commission = 0.0;
    };

    struct Rejection {
        std::string order_id;
        std::string reason;
    };

    // Open position, owned by the risk manager
    struct Position {
        std::string symbol;
        Direction direction = Direction::Long;
        Timestamp entry_time;
        double entry_price = 0.0;
        long long quantity = 0;
        double size = 0.0;              // Fraction of capital allocated at entry
        double entry_commission = 0.0;
        double stop_loss_price = 0.0;
        double trailing_stop_price = 0.0;
        double take_profit_price = 0.0;
        double best_price = 0.0;        // Most favorable price seen since entry
        Timestamp max_exit_time;
    };

    struct Trade {
        std::string symbol;
        Direction direction = Direction::Long;
        long long quantity = 0;
        Timestamp entry_time;
        double entry_price = 0.0;
        Timestamp exit_time;
        double exit_price = 0.0;
        ExitReason exit_reason = ExitReason::EndOfData;
        double pnl = 0.0;               // Net of entry and exit commission
        double commission_paid = 0.0;   // Total commission (entry + exit)
        double return_pct = 0.0;        // PnL / Entry Value
    };

    struct EquityPoint {
        Timestamp timestamp;
        double capital = 0.0;        // Cash plus cost basis of open positions
        double unrealized_pnl = 0.0; // Mark-to-market of open positions at close
    };

    template<typename T>
    using TimeSeries = std::vector<T>;

} // namespace core
