#include <gtest/gtest.h>
#include "mdcache/core/records.h"
#include "mdcache/core/types.h"

namespace mdcache {
namespace core {
namespace {

TEST(TimeRangeTest, HalfOpenSemantics) {
    TimeRange range(10, 20);
    EXPECT_TRUE(range.contains(10));
    EXPECT_FALSE(range.contains(20));
    EXPECT_EQ(range.duration(), 10);
    EXPECT_FALSE(range.empty());
    EXPECT_TRUE(TimeRange(5, 5).empty());
}

TEST(TimeRangeTest, AdjacentRangesTouchButDoNotOverlap) {
    TimeRange a(0, 10);
    TimeRange b(10, 20);
    EXPECT_FALSE(a.overlaps(b));
    EXPECT_TRUE(a.touches(b));
    EXPECT_FALSE(a.touches(TimeRange(11, 20)));
}

TEST(TimeRangeTest, IntersectAndHull) {
    TimeRange a(0, 10);
    TimeRange b(5, 15);
    EXPECT_EQ(a.intersect(b), TimeRange(5, 10));
    EXPECT_EQ(a.hull(b), TimeRange(0, 15));
    EXPECT_TRUE(a.intersect(TimeRange(20, 30)).empty());
    EXPECT_EQ(TimeRange().hull(b), b);
}

TEST(TimeRangeTest, ToString) {
    EXPECT_EQ(TimeRange(1, 2).to_string(), "[1, 2)");
}

TEST(TimeframeTest, ParsesBinanceIntervals) {
    EXPECT_EQ(parse_timeframe("1m").value_or(0), kMinuteMs);
    EXPECT_EQ(parse_timeframe("15m").value_or(0), 15 * kMinuteMs);
    EXPECT_EQ(parse_timeframe("4h").value_or(0), 4 * kHourMs);
    EXPECT_EQ(parse_timeframe("1d").value_or(0), kDayMs);
    EXPECT_EQ(parse_timeframe("1w").value_or(0), 7 * kDayMs);
    EXPECT_EQ(parse_timeframe("1M").value_or(0), kMonthMs);
}

TEST(TimeframeTest, RejectsMalformedInput) {
    EXPECT_FALSE(parse_timeframe("").has_value());
    EXPECT_FALSE(parse_timeframe("h").has_value());
    EXPECT_FALSE(parse_timeframe("0m").has_value());
    EXPECT_FALSE(parse_timeframe("-1m").has_value());
    EXPECT_FALSE(parse_timeframe("1x").has_value());
    EXPECT_FALSE(parse_timeframe("default").has_value());
    EXPECT_FALSE(parse_timeframe("99999999999h").has_value());
}

TEST(TimeframeTest, ExpectedRecordInterval) {
    EXPECT_EQ(expected_record_interval(DataKind::CANDLES, "1h").value_or(0), kHourMs);
    EXPECT_EQ(expected_record_interval(DataKind::FUNDING, kDefaultSubKey).value_or(0), 8 * kHourMs);
    EXPECT_EQ(expected_record_interval(DataKind::OPEN_INTEREST, "15m").value_or(0), 15 * kMinuteMs);
    EXPECT_EQ(expected_record_interval(DataKind::OPEN_INTEREST, kDefaultSubKey).value_or(0), 5 * kMinuteMs);
    EXPECT_FALSE(expected_record_interval(DataKind::AGG_TRADES, kDefaultSubKey).has_value());
}

TEST(AlignTest, AlignsToGrid) {
    EXPECT_EQ(align_down(kHourMs + 5, kHourMs), kHourMs);
    EXPECT_EQ(align_up(kHourMs + 5, kHourMs), 2 * kHourMs);
    EXPECT_EQ(align_up(kHourMs, kHourMs), kHourMs);
    EXPECT_EQ(align_down(-1, kHourMs), -kHourMs);
    EXPECT_EQ(align_outward(TimeRange(kHourMs + 1, 2 * kHourMs + 1), kHourMs),
              TimeRange(kHourMs, 3 * kHourMs));
}

TEST(SeriesKeyTest, OrderingAndFormatting) {
    SeriesKey a{DataKind::CANDLES, "BTCUSDT", "1h"};
    SeriesKey b{DataKind::CANDLES, "ETHUSDT", "1h"};
    EXPECT_TRUE(a < b);
    EXPECT_FALSE(b < a);
    EXPECT_EQ(a.to_string(), "CANDLES:BTCUSDT:1h");
}

TEST(RecordsTest, TimestampsComeFromKeyFields) {
    Candle candle;
    candle.open_time = 1;
    FundingRate funding;
    funding.funding_time = 2;
    OpenInterest oi;
    oi.time = 3;
    AggTrade trade;
    trade.trade_time = 4;
    PremiumIndex premium;
    premium.open_time = 5;

    EXPECT_EQ(candle.timestamp(), 1);
    EXPECT_EQ(funding.timestamp(), 2);
    EXPECT_EQ(oi.timestamp(), 3);
    EXPECT_EQ(trade.timestamp(), 4);
    EXPECT_EQ(premium.timestamp(), 5);
}

} // namespace
} // namespace core
} // namespace mdcache
