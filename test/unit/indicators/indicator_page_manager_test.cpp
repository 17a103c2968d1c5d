#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "mdcache/core/error.h"
#include "mdcache/indicators/indicator_page_manager.h"
#include "test_util/fake_fetch_backend.h"
#include "test_util/recording_listener.h"

using namespace mdcache::cache;
using namespace mdcache::core;
using namespace mdcache::indicators;
using namespace mdcache::testutil;

namespace {

// Returns one value too few, which the manager must reject
class TruncatingIndicator : public IndicatorCalculator {
public:
    std::string type() const override { return "TRUNCATED"; }
    Result<void> validate(const IndicatorParams&) const override { return Result<void>(); }
    Result<std::vector<double>> compute(const std::vector<Candle>& candles,
                                        const IndicatorParams&) const override {
        return std::vector<double>(candles.empty() ? 0 : candles.size() - 1, 0.0);
    }
};

class IndicatorPageManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_ = MakeCandleBackend();
        event_log_ = std::make_shared<DownloadEventLog>();
        dispatcher_ = std::make_shared<NotificationDispatcher>();
        ASSERT_TRUE(dispatcher_->start().ok());

        auto config = PageManagerConfig::ForKind(DataKind::CANDLES);
        config.enable_reaper = false;
        config.eviction_grace = std::chrono::milliseconds(50);
        config.worker_wait_timeout = std::chrono::milliseconds(10);
        candles_ = std::make_shared<CandlePageManager>(DataKind::CANDLES, backend_,
                                                       std::make_shared<CoverageRegistry>(), event_log_,
                                                       dispatcher_, config);
        ASSERT_TRUE(candles_->initialize().ok());

        registry_ = IndicatorRegistry::with_builtins();
        indicators_ = IndicatorPageManager::create(candles_, registry_, dispatcher_, event_log_);
    }

    void TearDown() override {
        indicators_->shutdown();
        backend_->OpenGate();
        candles_->shutdown();
        dispatcher_->shutdown();
    }

    static PageKey Source(int hours = 10) {
        return PageKey(DataKind::CANDLES, "BTCUSDT", "1h", TimeRange(T(0), T(hours)));
    }

    IndicatorPagePtr Subscribe(const std::string& type, const std::string& params,
                               IndicatorListenerPtr listener = nullptr, const std::string& consumer = "chart") {
        auto result = indicators_->subscribe(type, params, Source(), std::move(listener), consumer);
        EXPECT_TRUE(result.ok()) << result.error();
        return result.ok() ? result.value() : nullptr;
    }

    CandlePageManager::PagePtr SourcePage() {
        return candles_->peek("BTCUSDT", "1h", T(0), T(10));
    }

    void WaitIdle() { ASSERT_TRUE(candles_->wait_for_idle().ok()); }

    std::shared_ptr<FakeCandleBackend> backend_;
    std::shared_ptr<DownloadEventLog> event_log_;
    std::shared_ptr<NotificationDispatcher> dispatcher_;
    std::shared_ptr<CandlePageManager> candles_;
    std::shared_ptr<IndicatorRegistry> registry_;
    std::shared_ptr<IndicatorPageManager> indicators_;
};

TEST_F(IndicatorPageManagerTest, ComputesOnceSourceIsReady) {
    auto listener = std::make_shared<RecordingIndicatorListener>();
    auto page = Subscribe("SMA", "3", listener);
    ASSERT_NE(page, nullptr);
    WaitIdle();

    auto source = SourcePage();
    ASSERT_NE(source, nullptr);
    auto candles = source->records();
    ASSERT_EQ(candles->size(), 10u);

    EXPECT_EQ(page->state(), PageState::READY);
    EXPECT_EQ(page->compute_count(), 1u);
    EXPECT_EQ(page->source_version(), source->data_version());
    EXPECT_FALSE(page->is_stale());

    auto values = page->values();
    auto timestamps = page->timestamps();
    ASSERT_EQ(values->size(), candles->size());
    ASSERT_EQ(timestamps->size(), candles->size());
    EXPECT_TRUE(std::isnan((*values)[0]));
    EXPECT_TRUE(std::isnan((*values)[1]));
    for (size_t i = 2; i < candles->size(); ++i) {
        const double expected = ((*candles)[i].close + (*candles)[i - 1].close + (*candles)[i - 2].close) / 3.0;
        EXPECT_DOUBLE_EQ((*values)[i], expected);
        EXPECT_EQ((*timestamps)[i], (*candles)[i].open_time);
    }

    EXPECT_EQ(listener->Transitions(), (std::vector<StateChange>{{PageState::EMPTY, PageState::READY}}));
    EXPECT_EQ(listener->DataChanges(), 1);
    EXPECT_EQ(listener->LastValues(), values);
}

TEST_F(IndicatorPageManagerTest, ReadySourceComputesDuringSubscribe) {
    ASSERT_TRUE(candles_->request("BTCUSDT", "1h", T(0), T(10), nullptr, "chart").ok());
    WaitIdle();

    auto listener = std::make_shared<RecordingIndicatorListener>();
    auto page = Subscribe("ema", "4", listener);
    EXPECT_EQ(page->state(), PageState::READY);
    EXPECT_EQ(page->compute_count(), 1u);
    EXPECT_EQ(page->values()->size(), 10u);

    WaitIdle();
    EXPECT_EQ(listener->Transitions(), (std::vector<StateChange>{{PageState::EMPTY, PageState::READY}}));
    EXPECT_EQ(listener->DataChanges(), 1);
}

TEST_F(IndicatorPageManagerTest, EquivalentSubscriptionsShareOnePage) {
    auto first = Subscribe("SMA", "3", nullptr, "chart");
    auto second = Subscribe("sma", " 3 ", nullptr, "screener");
    auto other = Subscribe("SMA", "5", nullptr, "chart");
    WaitIdle();

    EXPECT_EQ(first, second);
    EXPECT_NE(first, other);
    EXPECT_EQ(first->consumers(), (std::vector<std::string>{"chart", "screener"}));
    EXPECT_EQ(first->key().type, "SMA");
    EXPECT_EQ(first->key().params, "3");
    EXPECT_EQ(indicators_->active_page_count(), 2u);
    EXPECT_EQ(indicators_->source_count(), 1u);

    // The source page carries one registration for all dependents
    auto source = SourcePage();
    ASSERT_NE(source, nullptr);
    EXPECT_EQ(source->listener_count(), 1u);
    EXPECT_EQ(source->consumers(), (std::vector<std::string>{"IndicatorPageManager"}));
    EXPECT_EQ(backend_->CallCount(), 1u);
}

TEST_F(IndicatorPageManagerTest, SourceUpdateRecomputesEachDependentOnce) {
    auto sma_listener = std::make_shared<RecordingIndicatorListener>();
    auto rsi_listener = std::make_shared<RecordingIndicatorListener>();
    auto sma = Subscribe("SMA", "3", sma_listener);
    auto rsi = Subscribe("RSI", "2", rsi_listener);
    WaitIdle();
    sma_listener->Clear();
    rsi_listener->Clear();

    auto source = SourcePage();
    ASSERT_TRUE(candles_->refresh(source));
    WaitIdle();

    EXPECT_EQ(source->data_version(), 2u);
    for (const auto& page : {sma, rsi}) {
        EXPECT_EQ(page->compute_count(), 2u);
        EXPECT_EQ(page->source_version(), 2u);
        EXPECT_EQ(page->state(), PageState::READY);
        EXPECT_FALSE(page->is_stale());
    }
    for (const auto& listener : {sma_listener, rsi_listener}) {
        EXPECT_EQ(listener->DataChanges(), 1);
        EXPECT_TRUE(listener->Transitions().empty());
    }
    EXPECT_EQ(sma->info().data_version, 2u);
}

TEST_F(IndicatorPageManagerTest, SourceGrowthRecomputesOverWholePage) {
    auto page = Subscribe("SMA", "3");
    WaitIdle();
    ASSERT_EQ(page->values()->size(), 10u);

    ASSERT_TRUE(candles_->request("BTCUSDT", "1h", T(0), T(15), nullptr, "zoomed").ok());
    WaitIdle();

    EXPECT_EQ(page->values()->size(), 15u);
    EXPECT_EQ(page->compute_count(), 2u);
}

TEST_F(IndicatorPageManagerTest, InvalidParamsProduceErrorPage) {
    auto listener = std::make_shared<RecordingIndicatorListener>();
    auto page = Subscribe("SMA", "0", listener);
    ASSERT_NE(page, nullptr);
    EXPECT_EQ(page->state(), PageState::ERROR);
    EXPECT_EQ(page->last_error(), "SMA period must be a positive integer, got '0'");

    auto garbage = Subscribe("RSI", "abc");
    EXPECT_EQ(garbage->state(), PageState::ERROR);
    EXPECT_EQ(garbage->last_error(), "Invalid indicator parameter 'abc'");

    WaitIdle();
    EXPECT_EQ(page->state(), PageState::ERROR);
    EXPECT_EQ(page->compute_count(), 0u);
    EXPECT_TRUE(page->values()->empty());
    EXPECT_EQ(listener->Transitions(), (std::vector<StateChange>{{PageState::EMPTY, PageState::ERROR}}));
    EXPECT_EQ(listener->DataChanges(), 0);
}

TEST_F(IndicatorPageManagerTest, RejectsUnknownTypeAndNonCandleSource) {
    auto unknown = indicators_->subscribe("MACD", "12,26,9", Source(), nullptr, "chart");
    EXPECT_FALSE(unknown.ok());
    EXPECT_EQ(unknown.code(), Error::Code::INVALID_ARGUMENT);

    PageKey funding(DataKind::FUNDING, "BTCUSDT", "default", TimeRange(T(0), T(10)));
    auto wrong_kind = indicators_->subscribe("SMA", "3", funding, nullptr, "chart");
    EXPECT_FALSE(wrong_kind.ok());
    EXPECT_EQ(wrong_kind.code(), Error::Code::INVALID_ARGUMENT);

    EXPECT_EQ(indicators_->active_page_count(), 0u);
    EXPECT_EQ(indicators_->source_count(), 0u);
    EXPECT_EQ(backend_->CallCount(), 0u);
}

TEST_F(IndicatorPageManagerTest, SourceRequestErrorsAreReturned) {
    PageKey bad(DataKind::CANDLES, "", "1h", TimeRange(T(0), T(10)));
    auto result = indicators_->subscribe("SMA", "3", bad, nullptr, "chart");
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.code(), Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(result.error().rfind("Source request failed: ", 0), 0u);
}

TEST_F(IndicatorPageManagerTest, SourceFailurePropagatesAndRecovers) {
    backend_->FailRange(TimeRange(T(0), T(10)), Error::Code::UNAVAILABLE, "HTTP 503");
    auto listener = std::make_shared<RecordingIndicatorListener>();
    auto page = Subscribe("RSI", "2", listener);
    WaitIdle();

    EXPECT_EQ(page->state(), PageState::ERROR);
    EXPECT_EQ(page->last_error(), "Source page failed: HTTP 503");
    EXPECT_EQ(listener->Transitions(), (std::vector<StateChange>{{PageState::EMPTY, PageState::ERROR}}));

    backend_->ClearFailures();
    ASSERT_TRUE(candles_->retry(SourcePage()));
    WaitIdle();

    EXPECT_EQ(page->state(), PageState::READY);
    EXPECT_EQ(page->compute_count(), 1u);
    EXPECT_EQ(listener->Transitions().back(), StateChange(PageState::ERROR, PageState::READY));
    EXPECT_EQ(listener->DataChanges(), 1);
}

TEST_F(IndicatorPageManagerTest, MismatchedOutputIsInternalError) {
    ASSERT_TRUE(registry_->register_calculator(std::make_shared<TruncatingIndicator>()).ok());
    auto page = Subscribe("TRUNCATED", "");
    WaitIdle();

    EXPECT_EQ(page->state(), PageState::ERROR);
    EXPECT_EQ(page->last_error(), "Calculator returned 9 values for 10 candles");
    EXPECT_TRUE(page->values()->empty());
}

TEST_F(IndicatorPageManagerTest, LateSubscriberGetsCurrentValues) {
    auto page = Subscribe("VWAP", "", nullptr, "chart");
    WaitIdle();

    auto late = std::make_shared<RecordingIndicatorListener>();
    EXPECT_EQ(Subscribe("VWAP", "", late, "panel"), page);
    WaitIdle();
    EXPECT_EQ(late->Transitions(), (std::vector<StateChange>{{PageState::EMPTY, PageState::READY}}));
    EXPECT_EQ(late->DataChanges(), 1);
    EXPECT_EQ(page->compute_count(), 1u);
}

TEST_F(IndicatorPageManagerTest, LastReleaseReleasesSource) {
    auto listener = std::make_shared<RecordingIndicatorListener>();
    auto page = Subscribe("ATR", "3", listener, "chart");
    WaitIdle();
    auto source = SourcePage();
    ASSERT_EQ(source->consumer_count(), 1u);

    indicators_->release(page, IndicatorListenerPtr(listener));
    indicators_->release(page, IndicatorListenerPtr(listener));
    EXPECT_EQ(page->consumer_count(), 0u);
    EXPECT_EQ(source->consumer_count(), 0u);
    EXPECT_EQ(indicators_->active_page_count(), 1u);

    // Cached values are reused while the source is still around
    EXPECT_EQ(Subscribe("ATR", "3", nullptr, "chart"), page);
    EXPECT_EQ(source->consumer_count(), 1u);
    WaitIdle();
    EXPECT_EQ(page->compute_count(), 1u);

    indicators_->release(page, std::string("chart"));
    EXPECT_EQ(source->consumer_count(), 0u);
}

TEST_F(IndicatorPageManagerTest, SourceEvictionDropsDependents) {
    auto page = Subscribe("SMA", "3", nullptr, "chart");
    WaitIdle();
    indicators_->release(page, std::string("chart"));

    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    ASSERT_EQ(candles_->evict_idle_pages(), 1u);

    EXPECT_TRUE(page->is_evicted());
    EXPECT_TRUE(page->values()->empty());
    EXPECT_EQ(indicators_->active_page_count(), 0u);
    EXPECT_EQ(indicators_->source_count(), 0u);

    auto fresh = Subscribe("SMA", "3", nullptr, "chart");
    EXPECT_NE(fresh, page);
    WaitIdle();
    EXPECT_EQ(fresh->state(), PageState::READY);
    EXPECT_EQ(fresh->values()->size(), 10u);
}

TEST_F(IndicatorPageManagerTest, ShutdownReleasesSources) {
    Subscribe("SMA", "3", nullptr, "chart");
    WaitIdle();
    auto source = SourcePage();
    ASSERT_EQ(source->consumer_count(), 1u);

    indicators_->shutdown();
    EXPECT_EQ(source->consumer_count(), 0u);
    EXPECT_EQ(indicators_->active_page_count(), 0u);
}

TEST_F(IndicatorPageManagerTest, PageInfoDescribesDerivedSeries) {
    auto page = Subscribe("SMA", "3");
    WaitIdle();

    auto info = page->info();
    EXPECT_EQ(info.id, "SMA(3)@" + SourcePage()->id());
    EXPECT_EQ(info.key.kind, DataKind::INDICATOR);
    EXPECT_EQ(info.key.symbol, "BTCUSDT");
    EXPECT_EQ(info.state, PageState::READY);
    EXPECT_EQ(info.record_count, 10u);
    EXPECT_EQ(info.load_progress, 100);
    EXPECT_EQ(indicators_->active_pages().size(), 1u);
}

TEST_F(IndicatorPageManagerTest, CreateRejectsMissingCollaborators) {
    EXPECT_THROW(IndicatorPageManager::create(nullptr, registry_, dispatcher_, event_log_), InvalidArgumentError);
    EXPECT_THROW(IndicatorPageManager::create(candles_, nullptr, dispatcher_, event_log_), InvalidArgumentError);
}

} // namespace
