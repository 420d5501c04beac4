#include <gtest/gtest.h>

#include "bar_validator.hpp"
#include "database_manager.hpp"
#include "market_data_feed.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

#include <limits>

using test_helpers::barsFromCloses;
using test_helpers::dayTime;
using test_helpers::makeBar;

TEST(BarValidatorTest, AcceptsStrictlyIncreasingSeries) {
    auto bars = barsFromCloses("SBER", {100, 101, 102}, 1.0);
    EXPECT_NO_THROW(data::validateBarSeries("SBER", bars));

    data::BarSequenceChecker checker("SBER");
    for (const auto& bar : bars) {
        checker.check(bar);
    }
    EXPECT_EQ(checker.count(), 3u);
}

TEST(BarValidatorTest, RejectsDuplicatesAndReordering) {
    auto duplicate = barsFromCloses("SBER", {100, 101});
    duplicate[1].timestamp = duplicate[0].timestamp;
    EXPECT_THROW(data::validateBarSeries("SBER", duplicate), core::DataIntegrityException);

    auto reversed = barsFromCloses("SBER", {100, 101});
    std::swap(reversed[0], reversed[1]);
    EXPECT_THROW(data::validateBarSeries("SBER", reversed), core::DataIntegrityException);
}

TEST(BarValidatorTest, RejectsForeignAndMalformedBars) {
    data::BarSequenceChecker checker("SBER");
    EXPECT_THROW(checker.check(makeBar("GAZP", 0, 1, 1, 1, 1)), core::DataIntegrityException);
    EXPECT_THROW(checker.check(makeBar("SBER", 0, 100, 99, 101, 100)), core::DataIntegrityException);
    EXPECT_THROW(checker.check(makeBar("SBER", 0, 100, 100, 100, std::numeric_limits<double>::quiet_NaN())),
                 core::DataIntegrityException);
    EXPECT_THROW(checker.check(makeBar("SBER", 0, 100, 100, 100, 100, -5)), core::DataIntegrityException);
    EXPECT_EQ(checker.count(), 0u);
}

TEST(BarValidatorTest, ResetForgetsHistory) {
    data::BarSequenceChecker checker("SBER");
    checker.check(makeBar("SBER", 5, 100, 100, 100, 100));
    checker.reset();
    EXPECT_NO_THROW(checker.check(makeBar("SBER", 1, 100, 100, 100, 100)));
}

TEST(InMemoryFeedTest, StreamsAndRestarts) {
    data::InMemoryMarketDataFeed feed;
    feed.addBars("SBER", "day", barsFromCloses("SBER", {100, 101, 102}));
    auto stream = feed.openStream("SBER", "day");

    auto first = stream->next();
    ASSERT_TRUE(first.has_value());
    EXPECT_DOUBLE_EQ(first->close, 100.0);
    EXPECT_EQ(data::readAll(*stream).size(), 2u);
    EXPECT_FALSE(stream->next().has_value());

    stream->reset();
    EXPECT_EQ(data::readAll(*stream).size(), 3u);
}

TEST(InMemoryFeedTest, UnknownSymbolOrTimeframeFails) {
    data::InMemoryMarketDataFeed feed;
    feed.addBars("SBER", "day", barsFromCloses("SBER", {100}));
    EXPECT_THROW(feed.openStream("GAZP", "day"), core::DataLoadException);
    EXPECT_THROW(feed.openStream("SBER", "hour"), core::DataLoadException);
}

TEST(InMemoryFeedTest, OutOfOrderDataFailsWhileStreaming) {
    auto bars = barsFromCloses("SBER", {100, 101, 102});
    bars[2].timestamp = bars[0].timestamp;
    data::InMemoryMarketDataFeed feed;
    feed.addBars("SBER", "day", bars);
    auto stream = feed.openStream("SBER", "day");
    EXPECT_THROW(data::readAll(*stream), core::DataIntegrityException);
}

class DatabaseTest : public ::testing::Test {
protected:
    DatabaseTest() : db_(":memory:") {}

    void SetUp() override {
        ASSERT_TRUE(db_.connect());
        ASSERT_TRUE(db_.initializeSchema());
    }

    data::DatabaseManager db_;
};

TEST_F(DatabaseTest, SavesAndQueriesBarsInOrder) {
    auto bars = barsFromCloses("SBER", {100, 101, 102, 103}, 0.5);
    bars[2].volume = 123456789012LL;
    ASSERT_TRUE(db_.saveBars(bars, "day"));
    EXPECT_EQ(db_.countBars("SBER", "day"), 4);

    auto loaded = db_.queryBars("SBER", "day");
    ASSERT_EQ(loaded.size(), 4u);
    EXPECT_EQ(loaded[0].timestamp, dayTime(0));
    EXPECT_EQ(loaded[3].timestamp, dayTime(3));
    EXPECT_DOUBLE_EQ(loaded[1].high, 101.5);
    EXPECT_EQ(loaded[2].volume, 123456789012LL);
    EXPECT_EQ(loaded[0].symbol, "SBER");
}

TEST_F(DatabaseTest, DuplicatesAreIgnored) {
    auto bars = barsFromCloses("SBER", {100, 101});
    ASSERT_TRUE(db_.saveBars(bars, "day"));
    bars[0].close = 999.0;
    ASSERT_TRUE(db_.saveBars(bars, "day"));
    EXPECT_EQ(db_.countBars("SBER", "day"), 2);
    EXPECT_DOUBLE_EQ(db_.queryBars("SBER", "day")[0].close, 100.0);
}

TEST_F(DatabaseTest, RangeAndTimeframeFilter) {
    ASSERT_TRUE(db_.saveBars(barsFromCloses("SBER", {100, 101, 102, 103, 104}), "day"));
    ASSERT_TRUE(db_.saveBars(barsFromCloses("SBER", {50}), "hour"));
    ASSERT_TRUE(db_.saveBars(barsFromCloses("GAZP", {150, 151}), "day"));

    auto ranged = db_.queryBars("SBER", "day", dayTime(1), dayTime(3));
    ASSERT_EQ(ranged.size(), 3u);
    EXPECT_DOUBLE_EQ(ranged.front().close, 101.0);
    EXPECT_DOUBLE_EQ(ranged.back().close, 103.0);

    EXPECT_EQ(db_.queryBars("SBER", "hour").size(), 1u);
    EXPECT_TRUE(db_.queryBars("ROSN", "day").empty());
}

TEST_F(DatabaseTest, CursorStreamsAndRestarts) {
    ASSERT_TRUE(db_.saveBars(barsFromCloses("SBER", {100, 101, 102}), "day"));
    auto cursor = db_.openCursor("SBER", "day", dayTime(1));
    EXPECT_EQ(data::readAll(*cursor).size(), 2u);
    EXPECT_FALSE(cursor->next().has_value());
    cursor->reset();
    auto again = cursor->next();
    ASSERT_TRUE(again.has_value());
    EXPECT_DOUBLE_EQ(again->close, 101.0);
}

TEST_F(DatabaseTest, FeedServesDateRange) {
    ASSERT_TRUE(db_.saveBars(barsFromCloses("SBER", {100, 101, 102, 103}), "day"));
    data::SqliteMarketDataFeed feed(db_, dayTime(2));
    auto stream = feed.openStream("SBER", "day");
    auto bars = data::readAll(*stream);
    ASSERT_EQ(bars.size(), 2u);
    EXPECT_EQ(bars.front().timestamp, dayTime(2));
}

TEST(DatabaseManagerTest, QueriesNeedAConnection) {
    data::DatabaseManager db(":memory:");
    EXPECT_FALSE(db.isConnected());
    EXPECT_THROW(db.queryBars("SBER", "day"), core::DataLoadException);
    EXPECT_THROW(db.openCursor("SBER", "day"), core::DataLoadException);
    EXPECT_FALSE(db.saveBars(barsFromCloses("SBER", {100}), "day"));
}
