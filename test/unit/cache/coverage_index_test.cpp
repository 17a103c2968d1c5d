#include <gtest/gtest.h>

#include <random>
#include <thread>
#include <vector>

#include "mdcache/cache/coverage_index.h"
#include "mdcache/cache/range_set.h"

using namespace mdcache::cache;
using namespace mdcache::core;

namespace {

constexpr Duration kBucket = kHourMs;
constexpr Timestamp kBase = 1000 * kHourMs;

Timestamp H(int hours) {
    return kBase + static_cast<Timestamp>(hours) * kHourMs;
}

class CoverageIndexTest : public ::testing::Test {
protected:
    CoverageIndexTest() : index_(SeriesKey{DataKind::CANDLES, "BTCUSDT", "1h"}, kBucket, 50) {}

    CoverageIndex index_;
};

TEST_F(CoverageIndexTest, EmptyIndexReturnsWholeRangeAsOneGap) {
    auto gaps = index_.query_gaps(TimeRange(H(0), H(10)));
    ASSERT_EQ(gaps.size(), 1u);
    EXPECT_EQ(gaps[0], TimeRange(H(0), H(10)));
    EXPECT_EQ(index_.level_of(TimeRange(H(0), H(10))), CoverageLevel::MISSING);
}

TEST_F(CoverageIndexTest, QueryInsideFullIntervalHasNoGaps) {
    index_.merge(TimeRange(H(0), H(24)), CoverageLevel::FULL);

    EXPECT_TRUE(index_.query_gaps(TimeRange(H(3), H(7))).empty());
    EXPECT_TRUE(index_.is_fully_covered(TimeRange(H(0), H(24))));
    EXPECT_EQ(index_.level_of(TimeRange(H(3), H(7))), CoverageLevel::FULL);
}

TEST_F(CoverageIndexTest, GapsAreTheComplementOfFull) {
    index_.merge(TimeRange(H(0), H(5)), CoverageLevel::FULL);
    index_.merge(TimeRange(H(8), H(10)), CoverageLevel::FULL);

    auto gaps = index_.query_gaps(TimeRange(H(0), H(12)));
    ASSERT_EQ(gaps.size(), 2u);
    EXPECT_EQ(gaps[0], TimeRange(H(5), H(8)));
    EXPECT_EQ(gaps[1], TimeRange(H(10), H(12)));
}

TEST_F(CoverageIndexTest, PartialIntervalsAreStillGaps) {
    index_.merge(TimeRange(H(0), H(4)), CoverageLevel::PARTIAL);
    index_.merge(TimeRange(H(4), H(6)), CoverageLevel::PARTIAL);

    auto gaps = index_.query_gaps(TimeRange(H(0), H(6)));
    ASSERT_EQ(gaps.size(), 1u);
    EXPECT_EQ(gaps[0], TimeRange(H(0), H(6)));
    EXPECT_EQ(index_.level_of(TimeRange(H(0), H(6))), CoverageLevel::PARTIAL);
}

TEST_F(CoverageIndexTest, FullDominatesPartialInEitherOrder) {
    CoverageIndex other(SeriesKey{DataKind::CANDLES, "BTCUSDT", "1h"}, kBucket, 50);

    index_.merge(TimeRange(H(0), H(10)), CoverageLevel::FULL);
    index_.merge(TimeRange(H(2), H(5)), CoverageLevel::PARTIAL);

    other.merge(TimeRange(H(2), H(5)), CoverageLevel::PARTIAL);
    other.merge(TimeRange(H(0), H(10)), CoverageLevel::FULL);

    EXPECT_EQ(index_.level_of(TimeRange(H(2), H(5))), CoverageLevel::FULL);
    EXPECT_EQ(index_.intervals(), other.intervals());
    ASSERT_EQ(index_.interval_count(), 1u);
    EXPECT_EQ(index_.intervals()[0], CoverageInterval(TimeRange(H(0), H(10)), CoverageLevel::FULL));
}

TEST_F(CoverageIndexTest, PartialOverlapSplitsExistingInterval) {
    index_.merge(TimeRange(H(0), H(10)), CoverageLevel::PARTIAL);
    index_.merge(TimeRange(H(3), H(6)), CoverageLevel::FULL);

    auto intervals = index_.intervals();
    ASSERT_EQ(intervals.size(), 3u);
    EXPECT_EQ(intervals[0], CoverageInterval(TimeRange(H(0), H(3)), CoverageLevel::PARTIAL));
    EXPECT_EQ(intervals[1], CoverageInterval(TimeRange(H(3), H(6)), CoverageLevel::FULL));
    EXPECT_EQ(intervals[2], CoverageInterval(TimeRange(H(6), H(10)), CoverageLevel::PARTIAL));
    EXPECT_EQ(index_.level_at(H(4)), CoverageLevel::FULL);
    EXPECT_EQ(index_.level_at(H(7)), CoverageLevel::PARTIAL);
    EXPECT_EQ(index_.level_at(H(11)), CoverageLevel::MISSING);
}

TEST_F(CoverageIndexTest, MergingMissingIsANoOp) {
    index_.merge(TimeRange(H(0), H(10)), CoverageLevel::MISSING);
    EXPECT_EQ(index_.interval_count(), 0u);
}

TEST_F(CoverageIndexTest, InteriorSubBucketHoleIsSatisfied) {
    const Duration half = kBucket / 2;
    index_.merge(TimeRange(H(0), H(5)), CoverageLevel::FULL);
    index_.merge(TimeRange(H(5) + half, H(10)), CoverageLevel::FULL);

    EXPECT_TRUE(index_.query_gaps(TimeRange(H(0), H(10))).empty());
}

TEST_F(CoverageIndexTest, SubBucketHoleAtQueryEdgeIsSatisfied) {
    const Duration half = kBucket / 2;
    index_.merge(TimeRange(H(0), H(5)), CoverageLevel::FULL);
    index_.merge(TimeRange(H(5) + half, H(10)), CoverageLevel::FULL);

    EXPECT_TRUE(index_.query_gaps(TimeRange(H(5), H(10))).empty());
    EXPECT_TRUE(index_.query_gaps(TimeRange(H(0), H(5) + half)).empty());
    EXPECT_TRUE(index_.query_gaps(TimeRange(H(2), H(10) + half)).empty());

    // A hole of a full bucket or more is still reported at the edge
    auto edge = index_.query_gaps(TimeRange(H(8), H(12)));
    ASSERT_EQ(edge.size(), 1u);
    EXPECT_EQ(edge[0], TimeRange(H(10), H(12)));
}

TEST_F(CoverageIndexTest, ShortQueryWithoutDataIsAGap) {
    const TimeRange query(H(20), H(20) + kBucket / 4);
    auto gaps = index_.query_gaps(query);
    ASSERT_EQ(gaps.size(), 1u);
    EXPECT_EQ(gaps[0], query);

    index_.merge(TimeRange(H(0), H(5)), CoverageLevel::FULL);
    EXPECT_EQ(index_.query_gaps(query), std::vector<TimeRange>{query});
}

TEST_F(CoverageIndexTest, ConsolidatesWhenFragmented) {
    CoverageIndex small(SeriesKey{DataKind::CANDLES, "BTCUSDT", "1m"}, kBucket, 4);
    const Duration step = kBucket / 4;
    for (int i = 0; i < 10; ++i) {
        const Timestamp start = kBase + i * 2 * step;
        small.merge(TimeRange(start, start + step), CoverageLevel::FULL);
    }
    // Holes of one step are shorter than a bucket and get bridged
    EXPECT_LE(small.interval_count(), 4u);
    EXPECT_EQ(small.level_of(TimeRange(kBase, kBase + 17 * step)), CoverageLevel::FULL);
    EXPECT_TRUE(small.query_gaps(TimeRange(kBase, kBase + 19 * step)).empty());
}

TEST_F(CoverageIndexTest, MergingReturnedGapsLeavesNoGaps) {
    std::mt19937 rng(7);
    std::uniform_int_distribution<int> hour(0, 200);
    std::uniform_int_distribution<int> length(1, 12);
    std::uniform_int_distribution<int> level(1, 2);

    for (int i = 0; i < 60; ++i) {
        const Timestamp start = H(hour(rng));
        index_.merge(TimeRange(start, start + length(rng) * kHourMs),
                     static_cast<CoverageLevel>(level(rng)));
    }

    const TimeRange query(H(0), H(220));
    for (const auto& gap : index_.query_gaps(query)) {
        index_.merge(gap, CoverageLevel::FULL);
    }
    EXPECT_TRUE(index_.query_gaps(query).empty());
}

TEST_F(CoverageIndexTest, GapsMatchComplementOfFullUnion) {
    std::mt19937 rng(11);
    std::uniform_int_distribution<int> hour(0, 100);
    std::uniform_int_distribution<int> length(1, 6);

    RangeSet full;
    for (int i = 0; i < 15; ++i) {
        const Timestamp start = H(hour(rng));
        const TimeRange range(start, start + length(rng) * kHourMs);
        index_.merge(range, CoverageLevel::FULL);
        full.add(range);
    }

    const TimeRange query(H(0), H(110));
    // Whole-hour holes are never shorter than a bucket, so nothing is dropped
    EXPECT_EQ(index_.query_gaps(query), full.gaps(query));
}

TEST_F(CoverageIndexTest, SummaryReportsExtentAndGaps) {
    index_.merge(TimeRange(H(0), H(4)), CoverageLevel::FULL);
    index_.merge(TimeRange(H(6), H(8)), CoverageLevel::FULL);
    index_.merge(TimeRange(H(8), H(9)), CoverageLevel::PARTIAL);

    auto summary = index_.summary();
    EXPECT_EQ(summary.key.symbol, "BTCUSDT");
    EXPECT_EQ(summary.min_start, H(0));
    EXPECT_EQ(summary.max_end, H(9));
    EXPECT_EQ(summary.full_duration, 6 * kHourMs);
    ASSERT_EQ(summary.gaps.size(), 2u);
    EXPECT_EQ(summary.gaps[0], TimeRange(H(4), H(6)));
    EXPECT_EQ(summary.gaps[1], TimeRange(H(8), H(9)));
    EXPECT_EQ(summary.interval_count, 3u);
}

TEST_F(CoverageIndexTest, ConcurrentMergesAndQueries) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, t] {
            for (int i = 0; i < 50; ++i) {
                const Timestamp start = H(t * 50 + i);
                index_.merge(TimeRange(start, start + kHourMs), CoverageLevel::FULL);
                index_.query_gaps(TimeRange(H(0), H(200)));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_TRUE(index_.query_gaps(TimeRange(H(0), H(200))).empty());
    EXPECT_EQ(index_.interval_count(), 1u);
}

TEST(CoverageIndexConstructionTest, RejectsNonPositiveBucket) {
    EXPECT_THROW(CoverageIndex(SeriesKey{DataKind::CANDLES, "X", "1h"}, 0), InvalidArgumentError);
}

TEST(CoverageRegistryTest, IndexesArePerSeriesWithKindBucket) {
    CoverageRegistry registry;
    auto candles = registry.get_or_create(SeriesKey{DataKind::CANDLES, "BTCUSDT", "1h"});
    auto funding = registry.get_or_create(SeriesKey{DataKind::FUNDING, "BTCUSDT", kDefaultSubKey});

    EXPECT_EQ(candles, registry.get_or_create(SeriesKey{DataKind::CANDLES, "BTCUSDT", "1h"}));
    EXPECT_NE(candles, funding);
    EXPECT_EQ(candles->bucket(), kHourMs);
    EXPECT_EQ(funding->bucket(), 30 * kDayMs);
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry.find(SeriesKey{DataKind::CANDLES, "ETHUSDT", "1h"}), nullptr);
}

TEST(CoverageRegistryTest, SummariesCoverEverySeries) {
    CoverageRegistry registry;
    registry.get_or_create(SeriesKey{DataKind::CANDLES, "BTCUSDT", "1h"})
        ->merge(TimeRange(H(0), H(2)), CoverageLevel::FULL);
    registry.get_or_create(SeriesKey{DataKind::CANDLES, "ETHUSDT", "1h"});

    auto summaries = registry.summaries();
    ASSERT_EQ(summaries.size(), 2u);
    EXPECT_EQ(summaries[0].full_duration, 2 * kHourMs);
    EXPECT_EQ(summaries[1].interval_count, 0u);
}

TEST(CoverageRegistryTest, InvalidConfigThrows) {
    auto config = CoverageConfig::Default();
    config.consolidate_threshold = 0;
    EXPECT_THROW(CoverageRegistry registry(config), InvalidArgumentError);
}

} // namespace
