#include "risk_manager.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace risk {

    using core::Direction;
    using core::ExitReason;

    std::string positionStateToString(PositionState state) {
        switch (state) {
            case PositionState::Flat: return "Flat";
            case PositionState::Entering: return "Entering";
            case PositionState::Open: return "Open";
            case PositionState::Exiting: return "Exiting";
        }
        return "Unknown";
    }

    RiskManager::RiskManager(const core::TradingConfig& config)
        : stop_loss_fraction_(config.stop_loss_percent / 100.0),
          trailing_fraction_(config.trailing_stop_percent / 100.0),
          take_profit_fraction_(config.take_profit_percent / 100.0),
          commission_rate_(config.commission_rate),
          max_position_size_(config.max_position_size),
          max_positions_(config.max_positions),
          max_holding_days_(config.max_holding_days),
          pool_(config.initial_capital)
    {
        core::logging::getLogger()->info(
            "RiskManager initialized: capital {:.2f}, max {} position(s) at {:.0f}% each, SL {}%, trailing {}%, TP {}%, max hold {} days",
            config.initial_capital, max_positions_, max_position_size_ * 100.0,
            config.stop_loss_percent, config.trailing_stop_percent, config.take_profit_percent, max_holding_days_);
    }

    ProtectiveLevels RiskManager::levelsFor(Direction direction, double entry_price) const {
        ProtectiveLevels levels;
        if (direction == Direction::Short) {
            levels.stop_loss = entry_price * (1.0 + stop_loss_fraction_);
            levels.take_profit = entry_price * (1.0 - take_profit_fraction_);
        } else {
            levels.stop_loss = entry_price * (1.0 - stop_loss_fraction_);
            levels.take_profit = entry_price * (1.0 + take_profit_fraction_);
        }
        return levels;
    }

    int RiskManager::activeCountLocked() const {
        return static_cast<int>(std::count_if(books_.begin(), books_.end(),
            [](const auto& entry) { return entry.second.state != PositionState::Flat; }));
    }

    std::optional<core::Order> RiskManager::prepareEntry(const core::Signal& signal, const core::Bar& bar, const std::string& order_id) {
        if (signal.direction == Direction::Flat) {
            return std::nullopt;
        }
        auto logger = core::logging::getLogger();
        std::lock_guard<std::mutex> lock(mutex_);
        SymbolBook& book = books_[bar.symbol];

        if (book.state != PositionState::Flat) {
            logger->trace("{}: entry signal ignored, position is {}", bar.symbol, positionStateToString(book.state));
            return std::nullopt;
        }
        if (book.last_exit_time && *book.last_exit_time == bar.timestamp) {
            logger->debug("{}: no re-entry on the bar of an exit ({})", bar.symbol, core::utils::timestampToString(bar.timestamp));
            return std::nullopt;
        }
        if (activeCountLocked() >= max_positions_) {
            logger->info("CapacityExceeded: {} {} entry dropped, {} of {} position slots in use",
                         bar.symbol, core::utils::directionToString(signal.direction), activeCountLocked(), max_positions_);
            return std::nullopt;
        }
        if (bar.close <= 0.0) {
            logger->warn("{}: non-positive close {} at {}, entry skipped", bar.symbol, bar.close, core::utils::timestampToString(bar.timestamp));
            return std::nullopt;
        }

        const double cash = pool_.cash();
        const double allocation = max_position_size_ * cash;
        const double per_share = bar.close * (1.0 + commission_rate_);
        const auto lot_it = lot_sizes_.find(bar.symbol);
        const long long lot = lot_it == lot_sizes_.end() ? 1 : lot_it->second;
        const long long affordable = allocation > 0.0 ? static_cast<long long>(std::floor(allocation / per_share)) : 0;
        const long long quantity = affordable / lot * lot;
        if (quantity <= 0) {
            logger->debug("{}: allocation {:.2f} buys no {}-share lot at {:.4f}, entry skipped", bar.symbol, allocation, lot, bar.close);
            return std::nullopt;
        }

        const double reserve_amount = static_cast<double>(quantity) * per_share;
        if (!pool_.reserve(reserve_amount)) {
            logger->warn("{}: could not reserve {:.2f} (cash {:.2f}), entry skipped", bar.symbol, reserve_amount, cash);
            return std::nullopt;
        }

        core::Order order;
        order.order_id = order_id;
        order.timestamp = bar.timestamp;
        order.symbol = bar.symbol;
        order.action = signal.direction == Direction::Long ? core::SignalAction::EnterLong : core::SignalAction::EnterShort;
        order.quantity = quantity;
        order.reference_price = bar.close;

        book.state = PositionState::Entering;
        book.pending_order = order;
        book.reserved_amount = reserve_amount;
        book.pending_size = (static_cast<double>(quantity) * bar.close) / cash;

        logger->debug("{}: {} {} x{} @ {:.4f}, reserved {:.2f}", bar.symbol, order.order_id,
                      core::utils::actionToString(order.action), quantity, bar.close, reserve_amount);
        return order;
    }

    bool RiskManager::confirmEntry(const core::Fill& fill) {
        auto logger = core::logging::getLogger();
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = books_.find(fill.symbol);
        if (it == books_.end() || it->second.state != PositionState::Entering) {
            throw core::OrderStateException(fmt::format("Entry fill {} for {} which has no pending entry.", fill.order_id, fill.symbol));
        }
        SymbolBook& book = it->second;

        const double cost = static_cast<double>(fill.quantity) * fill.price;
        if (!pool_.settle(book.reserved_amount, -(cost + fill.commission))) {
            pool_.release(book.reserved_amount);
            book.reserved_amount = 0.0;
            book.state = PositionState::Flat;
            logger->warn("{}: entry fill {} rejected, cost {:.2f} exceeds available cash", fill.symbol, fill.order_id, cost + fill.commission);
            return false;
        }

        core::Position position;
        position.symbol = fill.symbol;
        position.direction = fill.action == core::SignalAction::EnterShort ? Direction::Short : Direction::Long;
        position.entry_time = fill.timestamp;
        position.entry_price = fill.price;
        position.quantity = fill.quantity;
        position.size = book.pending_size;
        position.entry_commission = fill.commission;
        const ProtectiveLevels levels = levelsFor(position.direction, fill.price);
        position.stop_loss_price = levels.stop_loss;
        position.trailing_stop_price = levels.stop_loss;
        position.take_profit_price = levels.take_profit;
        position.best_price = fill.price;
        position.max_exit_time = core::utils::addDays(fill.timestamp, max_holding_days_);

        book.position = position;
        book.reserved_amount = 0.0;
        book.state = PositionState::Open;

        logger->info("Opened {} {} x{} @ {:.4f} (SL {:.4f}, TP {:.4f}, exit by {})",
                     core::utils::directionToString(position.direction), position.symbol, position.quantity,
                     position.entry_price, position.stop_loss_price, position.take_profit_price,
                     core::utils::timestampToString(position.max_exit_time));
        return true;
    }

    void RiskManager::abortEntry(const std::string& symbol, const std::string& reason) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = books_.find(symbol);
        if (it == books_.end() || it->second.state != PositionState::Entering) {
            throw core::OrderStateException(fmt::format("Cannot abort entry for {}: no pending entry.", symbol));
        }
        pool_.release(it->second.reserved_amount);
        it->second.reserved_amount = 0.0;
        it->second.state = PositionState::Flat;
        core::logging::getLogger()->warn("{}: entry {} rejected ({}), capital released", symbol, it->second.pending_order.order_id, reason);
    }

    std::optional<ExitReason> RiskManager::breachLocked(const core::Position& position, const core::Bar& bar, const core::Signal& signal) const {
        // A zero stop percent disables the initial stop but not a ratcheted trailing stop
        const bool stop_active = stop_loss_fraction_ > 0.0 || position.trailing_stop_price != position.stop_loss_price;
        if (position.direction == Direction::Long) {
            const double effective_stop = std::max(position.stop_loss_price, position.trailing_stop_price);
            if (stop_active && bar.low <= effective_stop) {
                return position.trailing_stop_price > position.stop_loss_price ? ExitReason::TrailingStop : ExitReason::StopLoss;
            }
            if (take_profit_fraction_ > 0.0 && bar.high >= position.take_profit_price) {
                return ExitReason::TakeProfit;
            }
        } else {
            const double effective_stop = std::min(position.stop_loss_price, position.trailing_stop_price);
            if (stop_active && bar.high >= effective_stop) {
                return position.trailing_stop_price < position.stop_loss_price ? ExitReason::TrailingStop : ExitReason::StopLoss;
            }
            if (take_profit_fraction_ > 0.0 && bar.low <= position.take_profit_price) {
                return ExitReason::TakeProfit;
            }
        }

        if (bar.timestamp >= position.max_exit_time) {
            return ExitReason::MaxHoldingDays;
        }

        const bool opposing = (position.direction == Direction::Long && signal.direction == Direction::Short) ||
                              (position.direction == Direction::Short && signal.direction == Direction::Long);
        if (opposing) {
            return ExitReason::OpposingSignal;
        }
        return std::nullopt;
    }

    void RiskManager::ratchetLocked(core::Position& position, const core::Bar& bar) const {
        if (trailing_fraction_ <= 0.0) {
            return;
        }
        if (position.direction == Direction::Long) {
            position.best_price = std::max(position.best_price, bar.high);
            if (position.best_price > position.entry_price * (1.0 + trailing_fraction_)) {
                const double candidate = position.best_price * (1.0 - trailing_fraction_);
                if (candidate > position.trailing_stop_price) {
                    position.trailing_stop_price = candidate;
                    core::logging::getLogger()->debug("{}: trailing stop raised to {:.4f} (best {:.4f})",
                                                      position.symbol, candidate, position.best_price);
                }
            }
        } else {
            position.best_price = std::min(position.best_price, bar.low);
            if (position.best_price < position.entry_price * (1.0 - trailing_fraction_)) {
                const double candidate = position.best_price * (1.0 + trailing_fraction_);
                if (candidate < position.trailing_stop_price) {
                    position.trailing_stop_price = candidate;
                    core::logging::getLogger()->debug("{}: trailing stop lowered to {:.4f} (best {:.4f})",
                                                      position.symbol, candidate, position.best_price);
                }
            }
        }
    }

    ExitDecision RiskManager::beginExitLocked(SymbolBook& book, const core::Bar& bar, ExitReason reason, const std::string& order_id) {
        ExitDecision decision;
        decision.reason = reason;
        decision.order.order_id = order_id;
        decision.order.timestamp = bar.timestamp;
        decision.order.symbol = book.position.symbol;
        decision.order.action = book.position.direction == Direction::Short ? core::SignalAction::ExitShort : core::SignalAction::ExitLong;
        decision.order.quantity = book.position.quantity;
        decision.order.reference_price = bar.close;

        book.state = PositionState::Exiting;
        book.pending_order = decision.order;
        book.pending_reason = reason;

        core::logging::getLogger()->debug("{}: exit {} ({}) @ {:.4f}", book.position.symbol, order_id,
                                          core::utils::exitReasonToString(reason), bar.close);
        return decision;
    }

    std::optional<ExitDecision> RiskManager::checkExit(const core::Bar& bar, const core::Signal& signal, const std::string& order_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = books_.find(bar.symbol);
        if (it == books_.end() || it->second.state != PositionState::Open) {
            return std::nullopt;
        }
        SymbolBook& book = it->second;

        std::optional<ExitReason> reason = breachLocked(book.position, bar, signal);
        if (reason) {
            return beginExitLocked(book, bar, *reason, order_id);
        }
        ratchetLocked(book.position, bar);
        return std::nullopt;
    }

    std::optional<ExitDecision> RiskManager::forceExit(const core::Bar& bar, ExitReason reason, const std::string& order_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = books_.find(bar.symbol);
        if (it == books_.end() || it->second.state != PositionState::Open) {
            return std::nullopt;
        }
        return beginExitLocked(it->second, bar, reason, order_id);
    }

    core::Trade RiskManager::confirmExit(const core::Fill& fill) {
        auto logger = core::logging::getLogger();
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = books_.find(fill.symbol);
        if (it == books_.end() || it->second.state != PositionState::Exiting) {
            throw core::OrderStateException(fmt::format("Exit fill {} for {} which has no pending exit.", fill.order_id, fill.symbol));
        }
        SymbolBook& book = it->second;
        const core::Position& position = book.position;

        if (fill.quantity != position.quantity) {
            logger->warn("{}: exit fill quantity {} differs from position quantity {}", fill.symbol, fill.quantity, position.quantity);
        }
        const double sign = position.direction == Direction::Long ? 1.0 : -1.0;
        const double quantity = static_cast<double>(position.quantity);
        const double cost_basis = quantity * position.entry_price;
        const double gross = sign * (fill.price - position.entry_price) * quantity;

        // The broker has already executed the exit, so it is booked whatever the cash
        pool_.settleClose(cost_basis + gross - fill.commission);

        core::Trade trade;
        trade.symbol = position.symbol;
        trade.direction = position.direction;
        trade.quantity = position.quantity;
        trade.entry_time = position.entry_time;
        trade.entry_price = position.entry_price;
        trade.exit_time = fill.timestamp;
        trade.exit_price = fill.price;
        trade.exit_reason = book.pending_reason;
        trade.commission_paid = position.entry_commission + fill.commission;
        trade.pnl = gross - trade.commission_paid;
        trade.return_pct = cost_basis > 0.0 ? trade.pnl / cost_basis * 100.0 : 0.0;

        book.state = PositionState::Flat;
        book.last_exit_time = fill.timestamp;
        book.position = core::Position{};

        logger->info("Closed {} {} x{} @ {:.4f} ({}), PnL {:.2f} ({:.2f}%)",
                     core::utils::directionToString(trade.direction), trade.symbol, trade.quantity, trade.exit_price,
                     core::utils::exitReasonToString(trade.exit_reason), trade.pnl, trade.return_pct);
        return trade;
    }

    void RiskManager::abortExit(const std::string& symbol, const std::string& reason) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = books_.find(symbol);
        if (it == books_.end() || it->second.state != PositionState::Exiting) {
            throw core::OrderStateException(fmt::format("Cannot abort exit for {}: no pending exit.", symbol));
        }
        it->second.state = PositionState::Open;
        core::logging::getLogger()->warn("{}: exit {} rejected ({}), position stays open", symbol, it->second.pending_order.order_id, reason);
    }

    void RiskManager::setLotSize(const std::string& symbol, long long lot) {
        if (lot < 1) {
            throw std::invalid_argument(fmt::format("Lot size for {} must be at least 1 (got {}).", symbol, lot));
        }
        std::lock_guard<std::mutex> lock(mutex_);
        lot_sizes_[symbol] = lot;
        core::logging::getLogger()->debug("{}: lot size {}", symbol, lot);
    }

    long long RiskManager::lotSize(const std::string& symbol) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = lot_sizes_.find(symbol);
        return it == lot_sizes_.end() ? 1 : it->second;
    }

    void RiskManager::adoptPosition(const core::Position& position) {
        auto logger = core::logging::getLogger();
        std::lock_guard<std::mutex> lock(mutex_);
        SymbolBook& book = books_[position.symbol];
        if (book.state != PositionState::Flat) {
            throw core::OrderStateException(fmt::format("Cannot adopt {}: position is {}.", position.symbol, positionStateToString(book.state)));
        }
        if (position.quantity <= 0 || position.entry_price <= 0.0 || position.direction == Direction::Flat) {
            throw core::OrderStateException(fmt::format("Cannot adopt {}: invalid quantity, price or direction.", position.symbol));
        }

        const double cost_basis = static_cast<double>(position.quantity) * position.entry_price;
        if (!pool_.settle(0.0, -cost_basis)) {
            throw core::OrderStateException(fmt::format("Cannot adopt {}: cost basis {:.2f} exceeds available cash.", position.symbol, cost_basis));
        }

        core::Position adopted = position;
        const ProtectiveLevels levels = levelsFor(adopted.direction, adopted.entry_price);
        if (adopted.stop_loss_price <= 0.0) {
            adopted.stop_loss_price = levels.stop_loss;
        }
        if (adopted.trailing_stop_price <= 0.0) {
            adopted.trailing_stop_price = adopted.stop_loss_price;
        }
        if (adopted.take_profit_price <= 0.0) {
            adopted.take_profit_price = levels.take_profit;
        }
        if (adopted.best_price <= 0.0) {
            adopted.best_price = adopted.entry_price;
        }
        if (adopted.max_exit_time == core::Timestamp{}) {
            adopted.max_exit_time = core::utils::addDays(adopted.entry_time, max_holding_days_);
        }

        book.position = adopted;
        book.state = PositionState::Open;
        logger->info("Adopted broker position {} {} x{} @ {:.4f}", core::utils::directionToString(adopted.direction),
                     adopted.symbol, adopted.quantity, adopted.entry_price);
    }

    PositionState RiskManager::getState(const std::string& symbol) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = books_.find(symbol);
        return it == books_.end() ? PositionState::Flat : it->second.state;
    }

    std::optional<core::Position> RiskManager::getPosition(const std::string& symbol) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = books_.find(symbol);
        if (it == books_.end() ||
            (it->second.state != PositionState::Open && it->second.state != PositionState::Exiting)) {
            return std::nullopt;
        }
        return it->second.position;
    }

    std::vector<core::Position> RiskManager::getOpenPositions() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<core::Position> positions;
        for (const auto& [symbol, book] : books_) {
            if (book.state == PositionState::Open || book.state == PositionState::Exiting) {
                positions.push_back(book.position);
            }
        }
        return positions;
    }

    int RiskManager::activeCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return activeCountLocked();
    }

    double RiskManager::getCapital() const {
        std::lock_guard<std::mutex> lock(mutex_);
        double invested = 0.0;
        for (const auto& [symbol, book] : books_) {
            if (book.state == PositionState::Open || book.state == PositionState::Exiting) {
                invested += static_cast<double>(book.position.quantity) * book.position.entry_price;
            }
        }
        return pool_.cash() + pool_.reserved() + invested;
    }

} // namespace risk
