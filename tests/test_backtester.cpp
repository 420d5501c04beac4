#include <gtest/gtest.h>

#include "backtester.hpp"
#include "live_trader.hpp"
#include "metrics.hpp"
#include "report_writer.hpp"
#include "market_data_feed.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <limits>

using core::ExitReason;
using test_helpers::dayTime;
using test_helpers::makeBar;
using test_helpers::breakoutThenStop;
using test_helpers::trendConfig;

namespace {

    core::TimeSeries<core::Bar> flatSeries(const std::string& symbol, int first_day, int count, double price) {
        core::TimeSeries<core::Bar> bars;
        for (int day = first_day; day < first_day + count; ++day) {
            bars.push_back(makeBar(symbol, day, price, price + 1.0, price - 1.0, price));
        }
        return bars;
    }

} // namespace

TEST(BacktesterTest, BreakoutEntryStopsOut) {
    data::InMemoryMarketDataFeed feed;
    feed.addBars("SBER", "day", breakoutThenStop("SBER"));
    backtester::Backtester backtester(trendConfig(), feed);

    backtester::BacktestResult result = backtester.run();

    ASSERT_EQ(result.trades.size(), 1u);
    const core::Trade& trade = result.trades.front();
    EXPECT_EQ(trade.direction, core::Direction::Long);
    EXPECT_EQ(trade.quantity, 407);
    EXPECT_EQ(trade.entry_time, dayTime(20));
    EXPECT_DOUBLE_EQ(trade.entry_price, 110.0);
    EXPECT_EQ(trade.exit_time, dayTime(25));
    EXPECT_DOUBLE_EQ(trade.exit_price, 106.5);
    EXPECT_EQ(trade.exit_reason, ExitReason::StopLoss);
    EXPECT_NEAR(trade.commission_paid, 134.31 + 130.0365, 1e-6);
    EXPECT_NEAR(trade.pnl, -1688.8465, 1e-6);

    EXPECT_EQ(result.fills, 2);
    EXPECT_EQ(result.rejections, 0);
    EXPECT_EQ(result.equity_curve.size(), 60u);
    EXPECT_NEAR(result.metrics.final_capital, 48311.1535, 1e-6);
    EXPECT_EQ(result.metrics.total_trades, 1);
    EXPECT_EQ(result.metrics.losing_trades, 1);
    EXPECT_DOUBLE_EQ(result.metrics.profit_factor, 0.0);
    EXPECT_GT(result.metrics.max_drawdown_pct, 0.0);
    EXPECT_EQ(result.metrics.exit_reasons.at("stop_loss"), 1);
}

TEST(BacktesterTest, SlowerAveragesStillEnterOnBreakoutBar) {
    core::TradingConfig config = trendConfig();
    config.trend.ema_short = 5;
    config.trend.ema_long = 12;

    // Falls 120 -> 101, jumps to 125 on heavy volume, holds, then breaks the 121.875 stop
    core::TimeSeries<core::Bar> bars;
    for (int day = 0; day < 60; ++day) {
        if (day < 20) {
            const double close = 120.0 - day;
            bars.push_back(makeBar("SBER", day, close, close + 0.5, close - 0.5, close));
        } else if (day == 20) {
            bars.push_back(makeBar("SBER", day, 102.0, 126.0, 101.5, 125.0, 3000));
        } else if (day < 25) {
            bars.push_back(makeBar("SBER", day, 125.0, 126.0, 124.0, 125.0));
        } else if (day == 25) {
            bars.push_back(makeBar("SBER", day, 123.0, 124.0, 121.0, 121.5));
        } else {
            bars.push_back(makeBar("SBER", day, 121.5, 122.0, 121.0, 121.5));
        }
    }
    data::InMemoryMarketDataFeed feed;
    feed.addBars("SBER", "day", bars);

    backtester::BacktestResult result = backtester::Backtester(config, feed).run();

    ASSERT_EQ(result.trades.size(), 1u);
    const core::Trade& trade = result.trades.front();
    EXPECT_EQ(trade.direction, core::Direction::Long);
    EXPECT_EQ(trade.entry_time, dayTime(20));
    EXPECT_EQ(trade.quantity, 358);
    EXPECT_EQ(trade.exit_time, dayTime(25));
    EXPECT_EQ(trade.exit_reason, ExitReason::StopLoss);
    EXPECT_NEAR(trade.pnl, -1517.741, 1e-6);
    EXPECT_NEAR(result.metrics.final_capital, 48482.259, 1e-6);
}

TEST(BacktesterTest, OpenPositionClosesOnLastBar) {
    core::TradingConfig config = trendConfig();
    config.min_data_points = 20;
    data::InMemoryMarketDataFeed feed;
    feed.addBars("SBER", "day", breakoutThenStop("SBER", 23));

    backtester::BacktestResult result = backtester::Backtester(config, feed).run();

    ASSERT_EQ(result.trades.size(), 1u);
    EXPECT_EQ(result.trades[0].exit_reason, ExitReason::EndOfData);
    EXPECT_EQ(result.trades[0].exit_time, dayTime(22));
    EXPECT_NEAR(result.trades[0].pnl, -268.62, 1e-6);

    const core::EquityPoint& last = result.equity_curve.back();
    EXPECT_DOUBLE_EQ(last.unrealized_pnl, 0.0);
    EXPECT_NEAR(last.capital, 49731.38, 1e-6);
}

TEST(BacktesterTest, RepeatedRunsAreIdentical) {
    core::TradingConfig config = trendConfig();
    config.symbols = {"SBER", "GAZP"};
    data::InMemoryMarketDataFeed feed;
    feed.addBars("SBER", "day", breakoutThenStop("SBER"));
    feed.addBars("GAZP", "day", flatSeries("GAZP", 5, 60, 160.0));

    backtester::Backtester backtester(config, feed);
    const std::string first = backtester::backtestResultToJson(backtester.run()).dump();
    const std::string second = backtester::backtestResultToJson(backtester.run()).dump();
    EXPECT_EQ(first, second);
}

TEST(BacktesterTest, EquityCurveHasOnePointPerTimestamp) {
    core::TradingConfig config = trendConfig();
    config.symbols = {"SBER", "GAZP"};
    data::InMemoryMarketDataFeed feed;
    feed.addBars("SBER", "day", breakoutThenStop("SBER"));
    feed.addBars("GAZP", "day", flatSeries("GAZP", 5, 60, 160.0));

    backtester::BacktestResult result = backtester::Backtester(config, feed).run();

    ASSERT_EQ(result.equity_curve.size(), 65u);
    for (size_t i = 1; i < result.equity_curve.size(); ++i) {
        EXPECT_LT(result.equity_curve[i - 1].timestamp, result.equity_curve[i].timestamp);
    }
    EXPECT_EQ(result.symbols, (std::vector<std::string>{"SBER", "GAZP"}));
    EXPECT_TRUE(result.symbol_errors.empty());
    EXPECT_EQ(result.trades.size(), 1u);
}

TEST(BacktesterTest, BadSymbolsAreSkipped) {
    core::TradingConfig config = trendConfig();
    data::InMemoryMarketDataFeed feed;
    feed.addBars("SBER", "day", breakoutThenStop("SBER"));
    feed.addBars("GAZP", "day", flatSeries("GAZP", 0, 10, 160.0));
    auto broken = flatSeries("ROSN", 0, 40, 400.0);
    broken[30].timestamp = broken[10].timestamp;
    feed.addBars("ROSN", "day", broken);

    backtester::BacktestResult result = backtester::Backtester(config, feed).run({"SBER", "GAZP", "ROSN", "LKOH"});

    EXPECT_EQ(result.symbols, std::vector<std::string>{"SBER"});
    ASSERT_EQ(result.symbol_errors.size(), 3u);
    EXPECT_NE(result.symbol_errors.at("GAZP").find("10 bars"), std::string::npos);
    EXPECT_TRUE(result.symbol_errors.count("ROSN"));
    EXPECT_TRUE(result.symbol_errors.count("LKOH"));
    EXPECT_EQ(result.trades.size(), 1u);
}

TEST(BacktesterTest, FailsWhenNoSymbolIsUsable) {
    data::InMemoryMarketDataFeed feed;
    feed.addBars("SBER", "day", flatSeries("SBER", 0, 10, 100.0));
    EXPECT_THROW(backtester::Backtester(trendConfig(), feed).run(), core::InsufficientHistoryException);

    auto broken = flatSeries("SBER", 0, 40, 100.0);
    std::swap(broken[3], broken[4]);
    data::InMemoryMarketDataFeed broken_feed;
    broken_feed.addBars("SBER", "day", broken);
    EXPECT_THROW(backtester::Backtester(trendConfig(), broken_feed).run(), core::DataIntegrityException);
}

TEST(MetricsTest, WinnersOnlyHaveUnboundedProfitFactor) {
    core::Trade win;
    win.symbol = "SBER";
    win.entry_time = dayTime(0);
    win.exit_time = dayTime(2);
    win.pnl = 500.0;
    win.commission_paid = 20.0;
    win.exit_reason = ExitReason::TakeProfit;

    core::EquityPoint point;
    point.timestamp = dayTime(2);
    point.capital = 10500.0;

    backtester::BacktestMetrics metrics = backtester::computeMetrics({win}, {point}, 10000.0, 0.0);
    EXPECT_TRUE(std::isinf(metrics.profit_factor));
    EXPECT_DOUBLE_EQ(metrics.win_rate_pct, 100.0);
    EXPECT_DOUBLE_EQ(metrics.avg_trade_duration_days, 2.0);
    EXPECT_NEAR(metrics.total_return_pct, 5.0, 1e-9);
    EXPECT_DOUBLE_EQ(metrics.max_drawdown_pct, 0.0);
    EXPECT_TRUE(backtester::metricsToJson(metrics)["profit_factor"].is_null());
}

TEST(MetricsTest, EmptyRunKeepsInitialCapital) {
    backtester::BacktestMetrics metrics = backtester::computeMetrics({}, {}, 10000.0, 0.02);
    EXPECT_DOUBLE_EQ(metrics.final_capital, 10000.0);
    EXPECT_EQ(metrics.total_trades, 0);
    EXPECT_DOUBLE_EQ(metrics.profit_factor, 0.0);
}

TEST(ReportWriterTest, WritesJsonReport) {
    data::InMemoryMarketDataFeed feed;
    feed.addBars("SBER", "day", breakoutThenStop("SBER"));
    backtester::BacktestResult result = backtester::Backtester(trendConfig(), feed).run();

    const std::filesystem::path path = std::filesystem::path(::testing::TempDir()) / "equity_trader_reports" / "sber.json";
    backtester::JsonReportWriter(path.string()).publish(result);

    std::ifstream in(path);
    ASSERT_TRUE(in.is_open());
    backtester::json report = backtester::json::parse(in);
    ASSERT_EQ(report["trades"].size(), 1u);
    EXPECT_EQ(report["trades"][0]["exit_reason"], "stop_loss");
    EXPECT_EQ(report["trades"][0]["entry_time"], "2024-01-21T00:00:00Z");
    EXPECT_EQ(report["equity_curve"].size(), 60u);
    EXPECT_EQ(report["metrics"]["total_trades"], 1);
    in.close();
    std::filesystem::remove(path);
}

TEST(LiveTraderTest, DemoModeProcessesOnlyNewBars) {
    core::TradingConfig config = trendConfig();
    config.demo_mode = true;
    auto feed = std::make_shared<data::InMemoryMarketDataFeed>();
    feed->addBars("SBER", "day", breakoutThenStop("SBER", 21));

    trading::LiveTrader trader(config, feed, nullptr, nullptr);
    EXPECT_NO_THROW(trader.reconcile());

    EXPECT_EQ(trader.runOnce(), 1);
    EXPECT_EQ(trader.getRiskManager().getState("SBER"), risk::PositionState::Open);
    EXPECT_EQ(trader.runOnce(), 0);

    feed->addBars("SBER", "day", breakoutThenStop("SBER", 26));
    EXPECT_EQ(trader.runOnce(), 5);
    ASSERT_EQ(trader.getLedger().getTrades().size(), 1u);
    EXPECT_EQ(trader.getLedger().getTrades()[0].exit_reason, ExitReason::StopLoss);
    EXPECT_EQ(trader.getLedger().getTrades()[0].exit_time, dayTime(25));
    EXPECT_EQ(trader.runOnce(), 0);
}

TEST(LiveTraderTest, BarsArrivingBetweenPollsAreAllEvaluated) {
    core::TradingConfig config = trendConfig();
    config.demo_mode = true;
    auto feed = std::make_shared<data::InMemoryMarketDataFeed>();
    feed->addBars("SBER", "day", breakoutThenStop("SBER", 21));

    trading::LiveTrader trader(config, feed, nullptr, nullptr);
    ASSERT_EQ(trader.runOnce(), 1);
    ASSERT_EQ(trader.getRiskManager().getState("SBER"), risk::PositionState::Open);

    // Bar 22 touches the 116.6 take-profit but is not the newest bar of the next poll
    core::TimeSeries<core::Bar> later = breakoutThenStop("SBER", 26);
    later[22] = makeBar("SBER", 22, 110.0, 117.0, 109.0, 110.0);
    feed->addBars("SBER", "day", later);

    EXPECT_EQ(trader.runOnce(), 5);
    ASSERT_FALSE(trader.getLedger().getTrades().empty());
    const core::Trade& trade = trader.getLedger().getTrades().front();
    EXPECT_EQ(trade.exit_reason, ExitReason::TakeProfit);
    EXPECT_EQ(trade.exit_time, dayTime(22));
    EXPECT_DOUBLE_EQ(trade.exit_price, 110.0);
}

TEST(LiveTraderTest, LiveModeNeedsBroker) {
    core::TradingConfig config = trendConfig();
    config.demo_mode = false;
    auto feed = std::make_shared<data::InMemoryMarketDataFeed>();
    EXPECT_THROW(trading::LiveTrader(config, feed, nullptr, nullptr), core::ConfigException);
}
