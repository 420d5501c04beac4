#include <gtest/gtest.h>

#include "capital_pool.hpp"
#include "risk_manager.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

#include <stdexcept>

using core::Direction;
using core::ExitReason;
using risk::PositionState;
using test_helpers::makeBar;
using test_helpers::makeSignal;

TEST(CapitalPoolTest, ReservationsNeverOverdraw) {
    risk::CapitalPool pool(1000.0);
    EXPECT_TRUE(pool.reserve(600.0));
    EXPECT_FALSE(pool.reserve(500.0));
    EXPECT_DOUBLE_EQ(pool.cash(), 400.0);
    EXPECT_DOUBLE_EQ(pool.reserved(), 600.0);

    pool.release(600.0);
    EXPECT_DOUBLE_EQ(pool.cash(), 1000.0);
    EXPECT_DOUBLE_EQ(pool.reserved(), 0.0);
}

TEST(CapitalPoolTest, SettleIsAllOrNothing) {
    risk::CapitalPool pool(1000.0);
    ASSERT_TRUE(pool.reserve(500.0));
    EXPECT_FALSE(pool.settle(500.0, -1200.0));
    EXPECT_DOUBLE_EQ(pool.cash(), 500.0);
    EXPECT_DOUBLE_EQ(pool.reserved(), 500.0);

    EXPECT_TRUE(pool.settle(500.0, -490.0));
    EXPECT_DOUBLE_EQ(pool.cash(), 510.0);
    EXPECT_DOUBLE_EQ(pool.reserved(), 0.0);
    EXPECT_DOUBLE_EQ(pool.initialCash(), 1000.0);
}

TEST(CapitalPoolTest, ClosingProceedsAreAlwaysBooked) {
    risk::CapitalPool pool(1000.0);
    pool.settleClose(-1500.0);
    EXPECT_DOUBLE_EQ(pool.cash(), -500.0);
    EXPECT_FALSE(pool.reserve(1.0));

    pool.settleClose(700.0);
    EXPECT_DOUBLE_EQ(pool.cash(), 200.0);
    EXPECT_TRUE(pool.reserve(100.0));
}

class RiskManagerTest : public ::testing::Test {
protected:
    RiskManagerTest() : config_(test_helpers::baseConfig()) {}

    core::Fill fillFor(const core::Order& order, double price) const {
        core::Fill fill;
        fill.order_id = order.order_id;
        fill.timestamp = order.timestamp;
        fill.symbol = order.symbol;
        fill.action = order.action;
        fill.quantity = order.quantity;
        fill.price = price;
        fill.commission = price * static_cast<double>(order.quantity) * config_.commission_rate;
        return fill;
    }

    // Opens a position at `price` on `day` and returns it
    core::Position open(risk::RiskManager& manager, const std::string& symbol, Direction direction,
                        double price, int day) {
        core::Bar bar = makeBar(symbol, day, price, price, price, price);
        auto order = manager.prepareEntry(makeSignal(bar, direction), bar, symbol + "-entry");
        EXPECT_TRUE(order.has_value());
        EXPECT_TRUE(manager.confirmEntry(fillFor(*order, price)));
        return *manager.getPosition(symbol);
    }

    core::TradingConfig config_;
};

TEST_F(RiskManagerTest, SizesEntryFromFreeCash) {
    risk::RiskManager manager(config_);
    core::Bar bar = makeBar("SBER", 0, 100.0, 100.0, 100.0, 100.0);
    auto order = manager.prepareEntry(makeSignal(bar, Direction::Long), bar, "SBER-1");
    ASSERT_TRUE(order.has_value());

    // floor(0.9 * 50000 / (100 * 1.003)) = 448
    EXPECT_EQ(order->quantity, 448);
    EXPECT_EQ(order->action, core::SignalAction::EnterLong);
    EXPECT_DOUBLE_EQ(order->reference_price, 100.0);
    EXPECT_EQ(manager.getState("SBER"), PositionState::Entering);
    EXPECT_NEAR(manager.getCapitalPool().reserved(), 448 * 100.0 * (1.0 + config_.commission_rate), 1e-6);
    EXPECT_NEAR(manager.getCapital(), 50000.0, 1e-6);
}

TEST_F(RiskManagerTest, EntryRoundsDownToWholeLots) {
    risk::RiskManager manager(config_);
    manager.setLotSize("SBER", 10);
    EXPECT_EQ(manager.lotSize("SBER"), 10);
    EXPECT_EQ(manager.lotSize("GAZP"), 1);

    // 448 affordable shares -> 44 lots of 10
    core::Bar bar = makeBar("SBER", 0, 100.0, 100.0, 100.0, 100.0);
    auto order = manager.prepareEntry(makeSignal(bar, Direction::Long), bar, "SBER-1");
    ASSERT_TRUE(order.has_value());
    EXPECT_EQ(order->quantity, 440);
    EXPECT_NEAR(manager.getCapitalPool().reserved(), 440 * 100.0 * (1.0 + config_.commission_rate), 1e-6);
    manager.abortEntry("SBER", "test");

    // Allocation of 45000 cannot buy a single 1000-share lot at 100
    manager.setLotSize("SBER", 1000);
    EXPECT_FALSE(manager.prepareEntry(makeSignal(bar, Direction::Long), bar, "SBER-2").has_value());
    EXPECT_EQ(manager.getState("SBER"), PositionState::Flat);

    EXPECT_THROW(manager.setLotSize("SBER", 0), std::invalid_argument);
}

TEST_F(RiskManagerTest, ConfirmedEntrySetsProtectiveLevels) {
    risk::RiskManager manager(config_);
    core::Position position = open(manager, "SBER", Direction::Long, 100.0, 0);

    EXPECT_EQ(manager.getState("SBER"), PositionState::Open);
    EXPECT_NEAR(position.stop_loss_price, 97.5, 1e-9);
    EXPECT_NEAR(position.trailing_stop_price, 97.5, 1e-9);
    EXPECT_NEAR(position.take_profit_price, 106.0, 1e-9);
    EXPECT_EQ(position.max_exit_time, test_helpers::dayTime(7));
    EXPECT_NEAR(position.entry_commission, 134.4, 1e-9);
    EXPECT_NEAR(manager.getCapitalPool().cash(), 50000.0 - 44800.0 - 134.4, 1e-6);
    EXPECT_DOUBLE_EQ(manager.getCapitalPool().reserved(), 0.0);
}

TEST_F(RiskManagerTest, ShortLevelsAreMirrored) {
    risk::RiskManager manager(config_);
    risk::ProtectiveLevels levels = manager.levelsFor(Direction::Short, 200.0);
    EXPECT_NEAR(levels.stop_loss, 205.0, 1e-9);
    EXPECT_NEAR(levels.take_profit, 188.0, 1e-9);
}

TEST_F(RiskManagerTest, StopLossClosesWithCommissionInPnl) {
    risk::RiskManager manager(config_);
    open(manager, "SBER", Direction::Long, 100.0, 0);

    core::Bar bar = makeBar("SBER", 1, 99.0, 99.5, 97.0, 97.4);
    auto exit = manager.checkExit(bar, makeSignal(bar, Direction::Flat), "SBER-2");
    ASSERT_TRUE(exit.has_value());
    EXPECT_EQ(exit->reason, ExitReason::StopLoss);
    EXPECT_EQ(exit->order.action, core::SignalAction::ExitLong);
    EXPECT_EQ(manager.getState("SBER"), PositionState::Exiting);

    core::Trade trade = manager.confirmExit(fillFor(exit->order, 97.4));
    const double exit_commission = 97.4 * 448 * 0.003;
    EXPECT_NEAR(trade.commission_paid, 134.4 + exit_commission, 1e-9);
    EXPECT_NEAR(trade.pnl, 448 * (97.4 - 100.0) - 134.4 - exit_commission, 1e-9);
    EXPECT_NEAR(trade.return_pct, trade.pnl / 44800.0 * 100.0, 1e-9);
    EXPECT_EQ(manager.getState("SBER"), PositionState::Flat);
    EXPECT_NEAR(manager.getCapital(), 50000.0 + trade.pnl, 1e-6);
}

TEST_F(RiskManagerTest, TrailingStopOnlyTightens) {
    risk::RiskManager manager(config_);
    open(manager, "SBER", Direction::Long, 100.0, 0);

    std::vector<core::Bar> bars {
        makeBar("SBER", 1, 101.0, 105.0, 101.0, 104.0),
        makeBar("SBER", 2, 104.0, 104.5, 103.5, 104.0),
        makeBar("SBER", 3, 104.0, 104.0, 103.0, 103.2)
    };
    double previous = manager.getPosition("SBER")->trailing_stop_price;

    EXPECT_FALSE(manager.checkExit(bars[0], makeSignal(bars[0], Direction::Flat), "x").has_value());
    double after_first = manager.getPosition("SBER")->trailing_stop_price;
    EXPECT_NEAR(after_first, 105.0 * (1.0 - 0.018), 1e-9);
    EXPECT_GE(after_first, previous);

    EXPECT_FALSE(manager.checkExit(bars[1], makeSignal(bars[1], Direction::Flat), "x").has_value());
    EXPECT_DOUBLE_EQ(manager.getPosition("SBER")->trailing_stop_price, after_first);

    auto exit = manager.checkExit(bars[2], makeSignal(bars[2], Direction::Flat), "SBER-2");
    ASSERT_TRUE(exit.has_value());
    EXPECT_EQ(exit->reason, ExitReason::TrailingStop);
}

TEST_F(RiskManagerTest, ShortTakeProfit) {
    risk::RiskManager manager(config_);
    open(manager, "SBER", Direction::Short, 100.0, 0);

    core::Bar bar = makeBar("SBER", 1, 98.0, 99.0, 93.9, 94.5);
    auto exit = manager.checkExit(bar, makeSignal(bar, Direction::Flat), "SBER-2");
    ASSERT_TRUE(exit.has_value());
    EXPECT_EQ(exit->reason, ExitReason::TakeProfit);
    EXPECT_EQ(exit->order.action, core::SignalAction::ExitShort);

    core::Trade trade = manager.confirmExit(fillFor(exit->order, 94.5));
    EXPECT_GT(trade.pnl, 0.0);
    EXPECT_EQ(trade.direction, Direction::Short);
}

TEST_F(RiskManagerTest, StopTakesPriorityOverTakeProfit) {
    risk::RiskManager manager(config_);
    open(manager, "SBER", Direction::Long, 100.0, 0);
    core::Bar wide = makeBar("SBER", 1, 100.0, 107.0, 97.0, 100.0);
    auto exit = manager.checkExit(wide, makeSignal(wide, Direction::Flat), "SBER-2");
    ASSERT_TRUE(exit.has_value());
    EXPECT_EQ(exit->reason, ExitReason::StopLoss);
}

TEST_F(RiskManagerTest, OpposingSignalAndHoldingLimit) {
    risk::RiskManager manager(config_);
    open(manager, "SBER", Direction::Long, 100.0, 0);

    core::Bar quiet = makeBar("SBER", 1, 100.0, 100.5, 99.5, 100.0);
    auto opposing = manager.checkExit(quiet, makeSignal(quiet, Direction::Short), "SBER-2");
    ASSERT_TRUE(opposing.has_value());
    EXPECT_EQ(opposing->reason, ExitReason::OpposingSignal);
    manager.abortExit("SBER", "test");
    EXPECT_EQ(manager.getState("SBER"), PositionState::Open);

    core::Bar same_side = makeBar("SBER", 2, 100.0, 100.5, 99.5, 100.0);
    EXPECT_FALSE(manager.checkExit(same_side, makeSignal(same_side, Direction::Long), "x").has_value());

    core::Bar late = makeBar("SBER", 7, 100.0, 100.5, 99.5, 100.0);
    auto held = manager.checkExit(late, makeSignal(late, Direction::Flat), "SBER-3");
    ASSERT_TRUE(held.has_value());
    EXPECT_EQ(held->reason, ExitReason::MaxHoldingDays);
}

TEST_F(RiskManagerTest, ZeroPercentDisablesLevels) {
    config_.stop_loss_percent = 0.0;
    config_.trailing_stop_percent = 0.0;
    config_.take_profit_percent = 0.0;
    risk::RiskManager manager(config_);
    open(manager, "SBER", Direction::Long, 100.0, 0);

    core::Bar crash = makeBar("SBER", 1, 100.0, 150.0, 50.0, 90.0);
    EXPECT_FALSE(manager.checkExit(crash, makeSignal(crash, Direction::Flat), "x").has_value());
}

TEST_F(RiskManagerTest, CapacityLimitsOpenPositions) {
    risk::RiskManager manager(config_);
    open(manager, "SBER", Direction::Long, 100.0, 0);

    core::Bar other = makeBar("GAZP", 0, 150.0, 150.0, 150.0, 150.0);
    EXPECT_FALSE(manager.prepareEntry(makeSignal(other, Direction::Long), other, "GAZP-1").has_value());
    EXPECT_EQ(manager.getState("GAZP"), PositionState::Flat);
    EXPECT_EQ(manager.activeCount(), 1);
}

TEST_F(RiskManagerTest, SecondPositionUsesRemainingCash) {
    config_.max_positions = 2;
    config_.max_position_size = 0.5;
    risk::RiskManager manager(config_);
    open(manager, "SBER", Direction::Long, 100.0, 0);
    const double cash_after_first = manager.getCapitalPool().cash();

    core::Bar other = makeBar("GAZP", 0, 50.0, 50.0, 50.0, 50.0);
    auto order = manager.prepareEntry(makeSignal(other, Direction::Long), other, "GAZP-1");
    ASSERT_TRUE(order.has_value());
    EXPECT_EQ(order->quantity, static_cast<long long>(0.5 * cash_after_first / (50.0 * (1.0 + config_.commission_rate))));
    ASSERT_TRUE(manager.confirmEntry(fillFor(*order, 50.0)));
    EXPECT_GE(manager.getCapitalPool().cash(), 0.0);
    EXPECT_EQ(manager.getOpenPositions().size(), 2u);
}

TEST_F(RiskManagerTest, NoReentryOnExitBar) {
    risk::RiskManager manager(config_);
    open(manager, "SBER", Direction::Long, 100.0, 0);

    core::Bar bar = makeBar("SBER", 1, 99.0, 99.5, 97.0, 97.4);
    auto exit = manager.checkExit(bar, makeSignal(bar, Direction::Flat), "SBER-2");
    ASSERT_TRUE(exit.has_value());
    manager.confirmExit(fillFor(exit->order, 97.4));

    EXPECT_FALSE(manager.prepareEntry(makeSignal(bar, Direction::Short), bar, "SBER-3").has_value());
    core::Bar next = makeBar("SBER", 2, 97.0, 97.5, 96.5, 97.0);
    EXPECT_TRUE(manager.prepareEntry(makeSignal(next, Direction::Short), next, "SBER-3").has_value());
}

TEST_F(RiskManagerTest, ShortLosingMoreThanCashStillCloses) {
    config_.max_position_size = 1.0;
    config_.stop_loss_percent = 0.0;
    config_.trailing_stop_percent = 0.0;
    config_.take_profit_percent = 0.0;
    risk::RiskManager manager(config_);

    // floor(50000 / 100.3) = 498 shares short
    core::Position position = open(manager, "SBER", Direction::Short, 100.0, 0);
    ASSERT_EQ(position.quantity, 498);

    core::Bar spike = makeBar("SBER", 1, 250.0, 250.0, 250.0, 250.0);
    auto exit = manager.forceExit(spike, ExitReason::EndOfData, "SBER-2");
    ASSERT_TRUE(exit.has_value());
    core::Trade trade = manager.confirmExit(fillFor(exit->order, 250.0));

    EXPECT_EQ(trade.exit_reason, ExitReason::EndOfData);
    EXPECT_NEAR(trade.pnl, -150.0 * 498 - 149.4 - 373.5, 1e-6);
    EXPECT_EQ(manager.getState("SBER"), PositionState::Flat);
    EXPECT_TRUE(manager.getOpenPositions().empty());
    EXPECT_NEAR(manager.getCapitalPool().cash(), 50000.0 + trade.pnl, 1e-6);
    EXPECT_LT(manager.getCapitalPool().cash(), 0.0);

    core::Bar later = makeBar("SBER", 2, 100.0, 100.0, 100.0, 100.0);
    EXPECT_FALSE(manager.prepareEntry(makeSignal(later, Direction::Long), later, "SBER-3").has_value());
}

TEST_F(RiskManagerTest, RejectedEntryReleasesReservation) {
    risk::RiskManager manager(config_);
    core::Bar bar = makeBar("SBER", 0, 100.0, 100.0, 100.0, 100.0);
    ASSERT_TRUE(manager.prepareEntry(makeSignal(bar, Direction::Long), bar, "SBER-1").has_value());
    manager.abortEntry("SBER", "timeout");
    EXPECT_EQ(manager.getState("SBER"), PositionState::Flat);
    EXPECT_DOUBLE_EQ(manager.getCapitalPool().cash(), 50000.0);
    EXPECT_DOUBLE_EQ(manager.getCapitalPool().reserved(), 0.0);
}

TEST_F(RiskManagerTest, FillsWithoutPendingOrderAreErrors) {
    risk::RiskManager manager(config_);
    core::Fill stray;
    stray.order_id = "SBER-9";
    stray.symbol = "SBER";
    stray.quantity = 1;
    stray.price = 100.0;
    EXPECT_THROW(manager.confirmEntry(stray), core::OrderStateException);
    EXPECT_THROW(manager.confirmExit(stray), core::OrderStateException);
    EXPECT_THROW(manager.abortEntry("SBER", "x"), core::OrderStateException);
}

TEST_F(RiskManagerTest, ForceExitClosesOpenPosition) {
    risk::RiskManager manager(config_);
    core::Bar bar = makeBar("SBER", 3, 101.0, 101.0, 101.0, 101.0);
    EXPECT_FALSE(manager.forceExit(bar, ExitReason::EndOfData, "x").has_value());

    open(manager, "SBER", Direction::Long, 100.0, 0);
    auto exit = manager.forceExit(bar, ExitReason::EndOfData, "SBER-2");
    ASSERT_TRUE(exit.has_value());
    EXPECT_EQ(exit->reason, ExitReason::EndOfData);
    EXPECT_DOUBLE_EQ(exit->order.reference_price, 101.0);
}

TEST_F(RiskManagerTest, AdoptedPositionGetsDefaultLevels) {
    risk::RiskManager manager(config_);
    core::Position broker_position;
    broker_position.symbol = "LKOH";
    broker_position.direction = Direction::Long;
    broker_position.quantity = 5;
    broker_position.entry_price = 200.0;
    broker_position.entry_time = test_helpers::dayTime(0);
    manager.adoptPosition(broker_position);

    auto adopted = manager.getPosition("LKOH");
    ASSERT_TRUE(adopted.has_value());
    EXPECT_NEAR(adopted->stop_loss_price, 195.0, 1e-9);
    EXPECT_NEAR(adopted->take_profit_price, 212.0, 1e-9);
    EXPECT_NEAR(manager.getCapitalPool().cash(), 49000.0, 1e-9);
    EXPECT_THROW(manager.adoptPosition(broker_position), core::OrderStateException);
}
