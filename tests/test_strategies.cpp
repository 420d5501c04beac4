#include <gtest/gtest.h>

#include "trend_strategy.hpp"
#include "reversal_strategy.hpp"
#include "signal_combiner.hpp"
#include "strategy_factory.hpp"
#include "signal_pipeline.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

using core::Direction;
using indicators::IndicatorSnapshot;
using namespace strategy_engine;

namespace {

    IndicatorSnapshot trendSnapshot(int day, double ema_short, double ema_long,
                                    double histogram, long long volume, double volume_ma) {
        IndicatorSnapshot snapshot;
        snapshot.timestamp = test_helpers::dayTime(day);
        snapshot.close = 100.0;
        snapshot.volume = volume;
        snapshot.ema_short = ema_short;
        snapshot.ema_long = ema_long;
        snapshot.macd_histogram = histogram;
        snapshot.volume_ma = volume_ma;
        return snapshot;
    }

    IndicatorSnapshot reversalSnapshot(double close, double rsi, double lower, double upper) {
        IndicatorSnapshot snapshot;
        snapshot.timestamp = test_helpers::dayTime(0);
        snapshot.close = close;
        snapshot.rsi = rsi;
        snapshot.bb_lower = lower;
        snapshot.bb_middle = (lower + upper) / 2.0;
        snapshot.bb_upper = upper;
        return snapshot;
    }

    core::Signal vote(const std::string& name, Direction direction) {
        core::Signal signal;
        signal.timestamp = test_helpers::dayTime(0);
        signal.symbol = "SBER";
        signal.strategy_name = name;
        signal.direction = direction;
        return signal;
    }

} // namespace

TEST(DetectCrossTest, ClassifiesCrossings) {
    EXPECT_EQ(detectCross(1.0, 2.0, 3.0, 2.0), CrossType::CrossesAbove);
    EXPECT_EQ(detectCross(2.0, 2.0, 2.5, 2.0), CrossType::CrossesAbove);
    EXPECT_EQ(detectCross(3.0, 2.0, 1.0, 2.0), CrossType::CrossesBelow);
    EXPECT_EQ(detectCross(3.0, 2.0, 4.0, 2.0), CrossType::None);
    EXPECT_EQ(detectCross(2.0, 2.0, 2.0, 2.0), CrossType::None);
}

TEST(TrendStrategyTest, FirstBarHasNoHistory) {
    TrendStrategy strategy{core::TrendParams{}};
    std::vector<IndicatorSnapshot> snapshots {trendSnapshot(0, 10, 9, 1, 2000, 1000)};
    EXPECT_THROW(strategy.evaluate("SBER", snapshots, 0), core::InsufficientDataException);
}

TEST(TrendStrategyTest, ConfirmedUpCrossIsLong) {
    TrendStrategy strategy{core::TrendParams{}};
    std::vector<IndicatorSnapshot> snapshots {
        trendSnapshot(0, 9.0, 10.0, -0.1, 1000, 1000),
        trendSnapshot(1, 10.5, 10.0, 0.2, 1500, 1000)
    };
    core::Signal signal = strategy.evaluate("SBER", snapshots, 1);
    EXPECT_EQ(signal.direction, Direction::Long);
    EXPECT_EQ(signal.strategy_name, "trend");
    EXPECT_EQ(signal.symbol, "SBER");
    EXPECT_EQ(signal.timestamp, snapshots[1].timestamp);
}

TEST(TrendStrategyTest, LowVolumeCrossIsFlat) {
    TrendStrategy strategy{core::TrendParams{}};
    std::vector<IndicatorSnapshot> snapshots {
        trendSnapshot(0, 9.0, 10.0, -0.1, 1000, 1000),
        trendSnapshot(1, 10.5, 10.0, 0.2, 1499, 1000)
    };
    EXPECT_EQ(strategy.evaluate("SBER", snapshots, 1).direction, Direction::Flat);
}

TEST(TrendStrategyTest, HistogramMustAgreeWithCross) {
    TrendStrategy strategy{core::TrendParams{}};
    std::vector<IndicatorSnapshot> snapshots {
        trendSnapshot(0, 9.0, 10.0, -0.1, 1000, 1000),
        trendSnapshot(1, 10.5, 10.0, -0.05, 5000, 1000)
    };
    EXPECT_EQ(strategy.evaluate("SBER", snapshots, 1).direction, Direction::Flat);
}

TEST(TrendStrategyTest, ConfirmedDownCrossIsShort) {
    TrendStrategy strategy{core::TrendParams{}};
    std::vector<IndicatorSnapshot> snapshots {
        trendSnapshot(0, 11.0, 10.0, 0.1, 1000, 1000),
        trendSnapshot(1, 9.5, 10.0, -0.3, 3000, 1000)
    };
    EXPECT_EQ(strategy.evaluate("SBER", snapshots, 1).direction, Direction::Short);
}

TEST(TrendStrategyTest, NoCrossIsFlatEvenWithoutMacd) {
    TrendStrategy strategy{core::TrendParams{}};
    std::vector<IndicatorSnapshot> snapshots {
        trendSnapshot(0, 11.0, 10.0, 0.1, 1000, 1000),
        trendSnapshot(1, 12.0, 10.0, 0.1, 1000, 1000)
    };
    snapshots[1].macd_histogram.reset();
    EXPECT_EQ(strategy.evaluate("SBER", snapshots, 1).direction, Direction::Flat);
}

TEST(TrendStrategyTest, CrossWithoutMacdNeedsMoreData) {
    TrendStrategy strategy{core::TrendParams{}};
    std::vector<IndicatorSnapshot> snapshots {
        trendSnapshot(0, 9.0, 10.0, 0.1, 1000, 1000),
        trendSnapshot(1, 11.0, 10.0, 0.1, 2000, 1000)
    };
    snapshots[1].macd_histogram.reset();
    EXPECT_THROW(strategy.evaluate("SBER", snapshots, 1), core::InsufficientDataException);
}

TEST(ReversalStrategyTest, OversoldAtLowerBandIsLong) {
    ReversalStrategy strategy{core::ReversalParams{}};
    std::vector<IndicatorSnapshot> snapshots {reversalSnapshot(95.0, 25.0, 95.0, 105.0)};
    core::Signal signal = strategy.evaluate("SBER", snapshots, 0);
    EXPECT_EQ(signal.direction, Direction::Long);
    EXPECT_EQ(signal.strategy_name, "reversal");
}

TEST(ReversalStrategyTest, OverboughtAtUpperBandIsShort) {
    ReversalStrategy strategy{core::ReversalParams{}};
    std::vector<IndicatorSnapshot> snapshots {reversalSnapshot(106.0, 75.0, 95.0, 105.0)};
    EXPECT_EQ(strategy.evaluate("SBER", snapshots, 0).direction, Direction::Short);
}

TEST(ReversalStrategyTest, BothConditionsAreRequired) {
    ReversalStrategy strategy{core::ReversalParams{}};
    std::vector<IndicatorSnapshot> inside_band {reversalSnapshot(96.0, 25.0, 95.0, 105.0)};
    EXPECT_EQ(strategy.evaluate("SBER", inside_band, 0).direction, Direction::Flat);
    std::vector<IndicatorSnapshot> neutral_rsi {reversalSnapshot(94.0, 45.0, 95.0, 105.0)};
    EXPECT_EQ(strategy.evaluate("SBER", neutral_rsi, 0).direction, Direction::Flat);
}

TEST(ReversalStrategyTest, MissingRsiNeedsMoreData) {
    ReversalStrategy strategy{core::ReversalParams{}};
    std::vector<IndicatorSnapshot> snapshots {reversalSnapshot(95.0, 25.0, 95.0, 105.0)};
    snapshots[0].rsi.reset();
    EXPECT_THROW(strategy.evaluate("SBER", snapshots, 0), core::InsufficientDataException);
}

TEST(SignalCombinerTest, AnyTakesFirstNonFlatVote) {
    SignalCombiner combiner(CombineMode::Any);
    core::Signal result = combiner.combine({vote("trend", Direction::Flat), vote("reversal", Direction::Short)},
                                           test_helpers::dayTime(3), "SBER");
    EXPECT_EQ(result.direction, Direction::Short);
    EXPECT_EQ(result.strategy_name, "combined");
    EXPECT_EQ(result.timestamp, test_helpers::dayTime(3));
}

TEST(SignalCombinerTest, AnyCancelsOpposingVotes) {
    SignalCombiner combiner(CombineMode::Any);
    core::Signal result = combiner.combine({vote("trend", Direction::Long), vote("reversal", Direction::Short)},
                                           test_helpers::dayTime(0), "SBER");
    EXPECT_EQ(result.direction, Direction::Flat);
}

TEST(SignalCombinerTest, AllRequiresUnanimity) {
    SignalCombiner combiner(CombineMode::All);
    EXPECT_EQ(combiner.combine({vote("trend", Direction::Long), vote("reversal", Direction::Long)},
                               test_helpers::dayTime(0), "SBER").direction, Direction::Long);
    EXPECT_EQ(combiner.combine({vote("trend", Direction::Long), vote("reversal", Direction::Flat)},
                               test_helpers::dayTime(0), "SBER").direction, Direction::Flat);
    EXPECT_EQ(combiner.combine({vote("trend", Direction::Flat), vote("reversal", Direction::Flat)},
                               test_helpers::dayTime(0), "SBER").direction, Direction::Flat);
}

TEST(SignalCombinerTest, NoVotesIsFlat) {
    SignalCombiner combiner(CombineMode::Any);
    EXPECT_EQ(combiner.combine({}, test_helpers::dayTime(0), "SBER").direction, Direction::Flat);
}

TEST(StrategyFactoryTest, NamesAreCaseInsensitive) {
    core::TradingConfig config = test_helpers::baseConfig();
    EXPECT_EQ(StrategyFactory::createStrategy("Trend", config)->getKind(), StrategyKind::Trend);
    EXPECT_EQ(StrategyFactory::createStrategy("REVERSAL", config)->getName(), "reversal");
    EXPECT_EQ(StrategyFactory::parseCombineMode("ALL"), CombineMode::All);
}

TEST(StrategyFactoryTest, RejectsUnknownAndDuplicateNames) {
    core::TradingConfig config = test_helpers::baseConfig();
    EXPECT_THROW(StrategyFactory::createStrategy("momentum", config), core::ConfigException);
    EXPECT_THROW(StrategyFactory::parseCombineMode("majority"), core::ConfigException);

    config.active_strategies = {"trend", "Trend"};
    EXPECT_THROW(StrategyFactory::createStrategies(config), core::ConfigException);
    config.active_strategies.clear();
    EXPECT_THROW(StrategyFactory::createStrategies(config), core::ConfigException);
}

TEST(StrategyFactoryTest, KeepsConfiguredOrder) {
    core::TradingConfig config = test_helpers::baseConfig();
    config.active_strategies = {"reversal", "trend"};
    auto strategies = StrategyFactory::createStrategies(config);
    ASSERT_EQ(strategies.size(), 2u);
    EXPECT_EQ(strategies[0]->getName(), "reversal");
    EXPECT_EQ(strategies[1]->getName(), "trend");
}

TEST(SignalPipelineTest, WarmUpBarsAreFlat) {
    core::TradingConfig config = test_helpers::baseConfig();
    SignalPipeline pipeline(config);
    auto bars = test_helpers::barsFromCloses("SBER", {100, 101, 99, 102, 98}, 1.0);
    std::vector<core::Signal> signals = pipeline.generateSignals("SBER", bars);
    ASSERT_EQ(signals.size(), bars.size());
    for (size_t i = 0; i < signals.size(); ++i) {
        EXPECT_EQ(signals[i].direction, Direction::Flat);
        EXPECT_EQ(signals[i].timestamp, bars[i].timestamp);
        EXPECT_EQ(signals[i].strategy_name, "combined");
    }
}

TEST(SignalPipelineTest, LatestSignalMatchesLastGeneratedSignal) {
    core::TradingConfig config = test_helpers::baseConfig();
    std::vector<double> closes;
    for (int i = 0; i < 40; ++i) {
        closes.push_back(100.0 + (i % 7) - (i % 3));
    }
    auto bars = test_helpers::barsFromCloses("SBER", closes, 0.5);
    SignalPipeline pipeline(config);
    std::vector<core::Signal> signals = pipeline.generateSignals("SBER", bars);
    EXPECT_EQ(pipeline.latestSignal("SBER", bars).direction, signals.back().direction);
    EXPECT_THROW(pipeline.latestSignal("SBER", {}), core::InsufficientDataException);
}
