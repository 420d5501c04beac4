#pragma once

#include "datatypes.hpp"
#include "config.hpp"
#include "utils.hpp"

#include <string>
#include <vector>

namespace test_helpers {

    // Day 0 of every synthetic series
    inline core::Timestamp baseTime() {
        return core::utils::dateToTimestamp("2024-01-01");
    }

    inline core::Timestamp dayTime(int day) {
        return core::utils::addDays(baseTime(), day);
    }

    inline core::Bar makeBar(const std::string& symbol, int day,
                             double open, double high, double low, double close,
                             long long volume = 1000) {
        core::Bar bar;
        bar.symbol = symbol;
        bar.timestamp = dayTime(day);
        bar.open = open;
        bar.high = high;
        bar.low = low;
        bar.close = close;
        bar.volume = volume;
        return bar;
    }

    // open = high = low = close
    inline core::Bar flatBar(const std::string& symbol, int day, double price, long long volume = 1000) {
        return makeBar(symbol, day, price, price, price, price, volume);
    }

    // One bar per calendar day with the given closes; high/low straddle the close by `spread`
    inline core::TimeSeries<core::Bar> barsFromCloses(const std::string& symbol,
                                                      const std::vector<double>& closes,
                                                      double spread = 0.0,
                                                      long long volume = 1000) {
        core::TimeSeries<core::Bar> bars;
        bars.reserve(closes.size());
        for (size_t i = 0; i < closes.size(); ++i) {
            bars.push_back(makeBar(symbol, static_cast<int>(i), closes[i], closes[i] + spread,
                                   closes[i] - spread, closes[i], volume));
        }
        return bars;
    }

    inline core::Signal makeSignal(const core::Bar& bar, core::Direction direction,
                                   const std::string& name = "combined") {
        core::Signal signal;
        signal.timestamp = bar.timestamp;
        signal.symbol = bar.symbol;
        signal.strategy_name = name;
        signal.direction = direction;
        return signal;
    }

    // 50000 capital, one position at 90%, 0.3% commission, SL 2.5 / trail 1.8 / TP 6, 7 days
    inline core::TradingConfig baseConfig() {
        core::TradingConfig config;
        config.symbols = {"SBER"};
        config.min_data_points = 30;
        return config;
    }

    // Falls from 120 to 101, jumps to 110 on three times the usual volume (day 20),
    // holds for four days, then drops through the 2.5% stop on day 25 and stays flat.
    inline core::TimeSeries<core::Bar> breakoutThenStop(const std::string& symbol, int days = 60) {
        core::TimeSeries<core::Bar> bars;
        for (int day = 0; day < days; ++day) {
            if (day < 20) {
                const double close = 120.0 - day;
                bars.push_back(makeBar(symbol, day, close, close + 0.5, close - 0.5, close));
            } else if (day == 20) {
                bars.push_back(makeBar(symbol, day, 101.0, 111.0, 100.5, 110.0, 3000));
            } else if (day < 25) {
                bars.push_back(makeBar(symbol, day, 110.0, 111.0, 109.0, 110.0));
            } else if (day == 25) {
                bars.push_back(makeBar(symbol, day, 108.0, 109.0, 106.0, 106.5));
            } else {
                bars.push_back(makeBar(symbol, day, 106.5, 107.0, 106.0, 106.5));
            }
        }
        return bars;
    }

    // Fast trend settings so a 60-bar series has enough warm-up
    inline core::TradingConfig trendConfig() {
        core::TradingConfig config = baseConfig();
        config.active_strategies = {"trend"};
        config.trend.ema_short = 3;
        config.trend.ema_long = 8;
        config.trend.macd_fast = 5;
        config.trend.macd_slow = 12;
        config.trend.macd_signal = 3;
        config.trend.volume_ma_period = 5;
        return config;
    }

} // namespace test_helpers
