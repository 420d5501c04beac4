#pragma once

#include "datatypes.hpp"
#include "config.hpp"
#include "capital_pool.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace risk {

    enum class PositionState {
        Flat,
        Entering,
        Open,
        Exiting
    };

    std::string positionStateToString(PositionState state);

    struct ExitDecision {
        core::Order order;
        core::ExitReason reason = core::ExitReason::EndOfData;
    };

    // Stop, trailing and take-profit levels for a fresh position
    struct ProtectiveLevels {
        double stop_loss = 0.0;
        double take_profit = 0.0;
    };

    // Owns every open position and the capital pool. Per symbol the state moves
    // Flat -> Entering -> Open -> Exiting -> Flat; a rejected entry returns to
    // Flat and a rejected exit returns to Open.
    class RiskManager {
    public:
        explicit RiskManager(const core::TradingConfig& config);

        RiskManager(const RiskManager&) = delete;
        RiskManager& operator=(const RiskManager&) = delete;

        // Flat -> Entering. Returns the entry order, or nullopt when the signal is
        // flat, the symbol is busy or exited on this bar, max_positions is reached
        // (CapacityExceeded), or the allocation buys no whole lot.
        std::optional<core::Order> prepareEntry(const core::Signal& signal, const core::Bar& bar, const std::string& order_id);

        // Entering -> Open. False (and back to Flat) if the fill would overdraw cash.
        bool confirmEntry(const core::Fill& fill);

        // Entering -> Flat, reservation released
        void abortEntry(const std::string& symbol, const std::string& reason);

        // For an Open position: stop/trailing, take-profit, max holding time, then
        // opposing signal. On exit the state becomes Exiting; otherwise the trailing
        // stop ratchets with the bar's extreme.
        std::optional<ExitDecision> checkExit(const core::Bar& bar, const core::Signal& signal, const std::string& order_id);

        // Open -> Exiting unconditionally (end of data, shutdown)
        std::optional<ExitDecision> forceExit(const core::Bar& bar, core::ExitReason reason, const std::string& order_id);

        // Exiting -> Flat, producing the Trade. The proceeds are always booked, so a
        // short closed above the account's means leaves a cash deficit.
        core::Trade confirmExit(const core::Fill& fill);

        // Exiting -> Open, re-evaluated on the next bar
        void abortExit(const std::string& symbol, const std::string& reason);

        // Entry quantities for `symbol` are rounded down to multiples of `lot`.
        // Throws std::invalid_argument if lot < 1.
        void setLotSize(const std::string& symbol, long long lot);
        long long lotSize(const std::string& symbol) const;

        // Installs a broker-reported position as Open (startup reconciliation)
        void adoptPosition(const core::Position& position);

        PositionState getState(const std::string& symbol) const;
        std::optional<core::Position> getPosition(const std::string& symbol) const;
        std::vector<core::Position> getOpenPositions() const;
        int activeCount() const;

        // Cash plus cost basis of open positions
        double getCapital() const;
        const CapitalPool& getCapitalPool() const { return pool_; }

        ProtectiveLevels levelsFor(core::Direction direction, double entry_price) const;

    private:
        struct SymbolBook {
            PositionState state = PositionState::Flat;
            core::Position position;
            core::Order pending_order;
            double reserved_amount = 0.0;
            double pending_size = 0.0;
            core::ExitReason pending_reason = core::ExitReason::EndOfData;
            std::optional<core::Timestamp> last_exit_time;
        };

        int activeCountLocked() const;
        ExitDecision beginExitLocked(SymbolBook& book, const core::Bar& bar, core::ExitReason reason, const std::string& order_id);
        void ratchetLocked(core::Position& position, const core::Bar& bar) const;
        std::optional<core::ExitReason> breachLocked(const core::Position& position, const core::Bar& bar, const core::Signal& signal) const;

        const double stop_loss_fraction_;
        const double trailing_fraction_;
        const double take_profit_fraction_;
        const double commission_rate_;
        const double max_position_size_;
        const int max_positions_;
        const int max_holding_days_;

        mutable std::mutex mutex_;
        std::map<std::string, SymbolBook> books_;
        std::map<std::string, long long> lot_sizes_;
        CapitalPool pool_;
    };

} // namespace risk
