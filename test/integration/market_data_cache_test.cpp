#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "mdcache/core/error.h"
#include "mdcache/market_data_cache.h"
#include "test_util/fake_fetch_backend.h"
#include "test_util/recording_listener.h"
#include "test_util/wait.h"

namespace mdcache {
namespace integration {
namespace {

using namespace testutil;
using core::DataKind;
using core::PageState;

/**
 * @brief End-to-end tests of the assembled cache
 *
 * A chart session requests candles and funding for the same window and
 * subscribes to an indicator over the candles, while a second consumer
 * shares the candle page. Backends are in-process fakes so every scenario
 * is deterministic.
 */
class MarketDataCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        candles_ = MakeCandleBackend();
        funding_ = std::make_shared<FakeFetchBackend<core::FundingRate>>(
            [](const cache::FetchRequest& request) {
                std::vector<core::FundingRate> rates;
                const core::Duration period = 8 * core::kHourMs;
                for (core::Timestamp ts = core::align_up(request.range.start, period); ts < request.range.end;
                     ts += period) {
                    core::FundingRate rate;
                    rate.funding_time = ts;
                    rate.rate = 0.0001;
                    rate.mark_price = 100.0;
                    rates.push_back(rate);
                }
                return rates;
            },
            "fake-funding");
    }

    static core::CacheConfig TestConfig() {
        auto config = core::CacheConfig::Default();
        for (auto& entry : config.managers) {
            entry.second.enable_reaper = false;
            entry.second.eviction_grace = std::chrono::milliseconds(50);
            entry.second.worker_wait_timeout = std::chrono::milliseconds(10);
        }
        return config;
    }

    std::unique_ptr<MarketDataCache> Build() {
        FetchBackends backends;
        backends.candles = candles_;
        backends.funding = funding_;
        return std::make_unique<MarketDataCache>(TestConfig(), backends);
    }

    std::shared_ptr<FakeCandleBackend> candles_;
    std::shared_ptr<FakeFetchBackend<core::FundingRate>> funding_;
};

TEST_F(MarketDataCacheTest, BuildsManagersForConfiguredBackends) {
    auto cache = Build();
    EXPECT_NE(cache->candles(), nullptr);
    EXPECT_NE(cache->funding(), nullptr);
    EXPECT_EQ(cache->open_interest(), nullptr);
    EXPECT_EQ(cache->agg_trades(), nullptr);
    EXPECT_EQ(cache->premium_index(), nullptr);
    EXPECT_NE(cache->indicators(), nullptr);
    EXPECT_EQ(cache->indicator_registry()->types().size(), 6u);

    EXPECT_FALSE(cache->is_running());
    ASSERT_TRUE(cache->initialize().ok());
    EXPECT_TRUE(cache->is_running());
    EXPECT_TRUE(cache->candles()->is_running());
    EXPECT_EQ(cache->initialize().code(), core::Error::Code::ALREADY_EXISTS);

    ASSERT_TRUE(cache->shutdown().ok());
    EXPECT_FALSE(cache->is_running());
    EXPECT_FALSE(cache->funding()->is_running());
    EXPECT_TRUE(cache->shutdown().ok());
}

TEST_F(MarketDataCacheTest, NoCandleBackendMeansNoIndicators) {
    FetchBackends backends;
    backends.funding = funding_;
    MarketDataCache cache(TestConfig(), backends);
    EXPECT_EQ(cache.candles(), nullptr);
    EXPECT_EQ(cache.indicators(), nullptr);
    ASSERT_TRUE(cache.initialize().ok());
}

TEST_F(MarketDataCacheTest, InvalidConfigIsRejected) {
    auto config = TestConfig();
    config.managers[DataKind::CANDLES].fetch_workers = 0;
    EXPECT_THROW(MarketDataCache(config, FetchBackends{}), core::InvalidArgumentError);

    config = TestConfig();
    config.event_log.max_global_events = 0;
    EXPECT_THROW(MarketDataCache(config, FetchBackends{}), core::InvalidArgumentError);
}

TEST_F(MarketDataCacheTest, ChartSessionEndToEnd) {
    auto cache = Build();
    ASSERT_TRUE(cache->initialize().ok());

    auto candle_listener = std::make_shared<RecordingListener<core::Candle>>();
    auto funding_listener = std::make_shared<RecordingListener<core::FundingRate>>();
    auto rsi_listener = std::make_shared<RecordingIndicatorListener>();

    auto candles = cache->candles()->request("BTCUSDT", "1h", T(0), T(48), candle_listener, "chart");
    ASSERT_TRUE(candles.ok()) << candles.error();
    auto funding = cache->funding()->request("BTCUSDT", "default", T(0), T(48), funding_listener, "chart");
    ASSERT_TRUE(funding.ok()) << funding.error();
    auto rsi = cache->indicators()->subscribe("RSI", "14", candles.value()->key(), rsi_listener, "chart");
    ASSERT_TRUE(rsi.ok()) << rsi.error();

    ASSERT_TRUE(cache->wait_for_idle().ok());

    EXPECT_EQ(candles.value()->state(), PageState::READY);
    EXPECT_EQ(candles.value()->record_count(), 48u);
    EXPECT_EQ(funding.value()->state(), PageState::READY);
    EXPECT_EQ(funding.value()->record_count(), 6u);
    EXPECT_EQ(rsi.value()->state(), PageState::READY);
    ASSERT_EQ(rsi.value()->values()->size(), 48u);
    for (size_t i = 14; i < 48; ++i) {
        const double value = (*rsi.value()->values())[i];
        EXPECT_GE(value, 0.0);
        EXPECT_LE(value, 100.0);
    }

    EXPECT_EQ(candle_listener->Transitions().back().second, PageState::READY);
    EXPECT_EQ(funding_listener->DataChanges(), 1);
    EXPECT_EQ(rsi_listener->DataChanges(), 1);

    auto snapshot = cache->snapshot();
    EXPECT_GT(snapshot.taken_at, 0);
    EXPECT_EQ(snapshot.active_pages, 3u);
    EXPECT_EQ(snapshot.pages.size(), 3u);
    EXPECT_EQ(snapshot.total_records, 54u);
    EXPECT_EQ(snapshot.estimated_memory_bytes,
              48 * sizeof(core::Candle) + 6 * sizeof(core::FundingRate) +
                  48 * (sizeof(double) + sizeof(core::Timestamp)));
    EXPECT_EQ(snapshot.coverage.size(), 2u);
    EXPECT_GT(snapshot.events.total_events, 0u);
    EXPECT_EQ(snapshot.events.events_by_kind.count(DataKind::INDICATOR), 1u);
    EXPECT_TRUE(std::any_of(snapshot.pages.begin(), snapshot.pages.end(),
                            [](const cache::PageInfo& info) { return info.key.kind == DataKind::INDICATOR; }));

    // One backend call per data kind
    EXPECT_EQ(candles_->CallCount(), 1u);
    EXPECT_EQ(funding_->CallCount(), 1u);
}

TEST_F(MarketDataCacheTest, ConsumersShareOverlappingPages) {
    auto cache = Build();
    ASSERT_TRUE(cache->initialize().ok());

    auto chart = cache->candles()->request("ETHUSDT", "1h", T(0), T(24), nullptr, "chart");
    auto screener = cache->candles()->request("ETHUSDT", "1h", T(6), T(12), nullptr, "screener");
    ASSERT_TRUE(chart.ok());
    ASSERT_TRUE(screener.ok());
    ASSERT_TRUE(cache->wait_for_idle().ok());

    EXPECT_EQ(chart.value(), screener.value());
    EXPECT_EQ(chart.value()->consumers(), (std::vector<std::string>{"chart", "screener"}));
    EXPECT_EQ(candles_->CallCount(), 1u);

    auto index = cache->coverage()->find(core::SeriesKey{DataKind::CANDLES, "ETHUSDT", "1h"});
    ASSERT_NE(index, nullptr);
    EXPECT_EQ(index->level_of(core::TimeRange(T(0), T(24))), cache::CoverageLevel::FULL);
}

TEST_F(MarketDataCacheTest, ReleasedSessionIsEvicted) {
    auto cache = Build();
    ASSERT_TRUE(cache->initialize().ok());

    auto candles = cache->candles()->request("BTCUSDT", "1h", T(0), T(24), nullptr, "chart");
    ASSERT_TRUE(candles.ok());
    auto sma = cache->indicators()->subscribe("SMA", "5", candles.value()->key(), nullptr, "chart");
    ASSERT_TRUE(sma.ok());
    ASSERT_TRUE(cache->wait_for_idle().ok());

    cache->indicators()->release(sma.value(), std::string("chart"));
    cache->candles()->release(candles.value(), std::string("chart"));

    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    EXPECT_EQ(cache->candles()->evict_idle_pages(), 1u);
    EXPECT_TRUE(sma.value()->is_evicted());

    auto snapshot = cache->snapshot();
    EXPECT_EQ(snapshot.active_pages, 0u);
    EXPECT_EQ(snapshot.total_records, 0u);
    // What was fetched is still known after the pages are gone
    EXPECT_EQ(snapshot.coverage.size(), 1u);

    auto events = cache->event_log()->page_log(candles.value()->id());
    EXPECT_EQ(events.back().type, cache::DownloadEventType::PAGE_EVICTED);
}

TEST_F(MarketDataCacheTest, ReaperRunsWhenEnabled) {
    auto config = TestConfig();
    config.managers[DataKind::CANDLES].enable_reaper = true;
    config.managers[DataKind::CANDLES].reaper_interval = std::chrono::milliseconds(20);
    FetchBackends backends;
    backends.candles = candles_;
    MarketDataCache cache(config, backends);
    ASSERT_TRUE(cache.initialize().ok());

    auto page = cache.candles()->request("BTCUSDT", "1h", T(0), T(4), nullptr, "chart");
    ASSERT_TRUE(page.ok());
    ASSERT_TRUE(cache.wait_for_idle().ok());
    cache.candles()->release(page.value(), std::string("chart"));

    EXPECT_TRUE(WaitForCondition([&cache] { return cache.snapshot().active_pages == 0; }));
}

TEST_F(MarketDataCacheTest, DestructorStopsRunningCache) {
    auto cache = Build();
    ASSERT_TRUE(cache->initialize().ok());
    ASSERT_TRUE(cache->candles()->request("BTCUSDT", "1h", T(0), T(4), nullptr, "chart").ok());
    auto dispatcher = cache->dispatcher();
    cache.reset();
    EXPECT_FALSE(dispatcher->enqueue([] {}));
}

} // namespace
} // namespace integration
} // namespace mdcache
