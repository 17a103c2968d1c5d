#ifndef MDCACHE_MARKET_DATA_CACHE_H_
#define MDCACHE_MARKET_DATA_CACHE_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <vector>

#include "mdcache/cache/coverage_index.h"
#include "mdcache/cache/event_log.h"
#include "mdcache/cache/notification_dispatcher.h"
#include "mdcache/cache/page_manager.h"
#include "mdcache/core/config.h"
#include "mdcache/core/result.h"
#include "mdcache/indicators/indicator_page_manager.h"
#include "mdcache/indicators/indicator_registry.h"

namespace mdcache {

/**
 * @brief Fetch backends for each data kind
 *
 * Kinds without a backend get no page manager; requesting them through the
 * corresponding accessor returns nullptr.
 */
struct FetchBackends {
    std::shared_ptr<cache::FetchBackend<core::Candle>> candles;
    std::shared_ptr<cache::FetchBackend<core::FundingRate>> funding;
    std::shared_ptr<cache::FetchBackend<core::OpenInterest>> open_interest;
    std::shared_ptr<cache::FetchBackend<core::AggTrade>> agg_trades;
    std::shared_ptr<cache::FetchBackend<core::PremiumIndex>> premium_index;
};

/**
 * @brief Point-in-time view of the whole cache for dashboards
 */
struct CacheSnapshot {
    core::Timestamp taken_at{0};
    std::vector<cache::PageInfo> pages;       // Data pages then indicator pages
    size_t active_pages{0};
    size_t total_records{0};
    size_t estimated_memory_bytes{0};
    cache::EventLogStatistics events;
    std::vector<cache::CoverageSummary> coverage;
};

/**
 * @brief Composition root of the market data cache
 *
 * Owns the notification dispatcher, coverage registry, event log, one page
 * manager per configured data kind and the indicator manager. Built once by
 * the application and handed to consumers explicitly.
 */
class MarketDataCache {
public:
    /**
     * @throws core::InvalidArgumentError if the config does not validate
     */
    MarketDataCache(const core::CacheConfig& config, FetchBackends backends);
    ~MarketDataCache();

    MarketDataCache(const MarketDataCache&) = delete;
    MarketDataCache& operator=(const MarketDataCache&) = delete;

    core::Result<void> initialize();

    /**
     * @brief Stop indicators, then data managers, then the dispatcher
     */
    core::Result<void> shutdown();

    bool is_running() const { return running_.load(); }

    const std::shared_ptr<cache::CandlePageManager>& candles() const { return candles_; }
    const std::shared_ptr<cache::FundingPageManager>& funding() const { return funding_; }
    const std::shared_ptr<cache::OpenInterestPageManager>& open_interest() const { return open_interest_; }
    const std::shared_ptr<cache::AggTradePageManager>& agg_trades() const { return agg_trades_; }
    const std::shared_ptr<cache::PremiumIndexPageManager>& premium_index() const { return premium_index_; }
    const std::shared_ptr<indicators::IndicatorPageManager>& indicators() const { return indicators_; }

    const std::shared_ptr<indicators::IndicatorRegistry>& indicator_registry() const { return registry_; }
    const std::shared_ptr<cache::CoverageRegistry>& coverage() const { return coverage_; }
    const std::shared_ptr<cache::DownloadEventLog>& event_log() const { return event_log_; }
    const std::shared_ptr<cache::NotificationDispatcher>& dispatcher() const { return dispatcher_; }
    const core::CacheConfig& config() const { return config_; }

    CacheSnapshot snapshot() const;

    /**
     * @brief Block until every manager is idle and notifications are delivered
     */
    core::Result<void> wait_for_idle(std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});

private:
    template<typename Fn>
    void for_each_manager(Fn&& fn) const;

    const core::CacheConfig config_;
    std::shared_ptr<cache::NotificationDispatcher> dispatcher_;
    std::shared_ptr<cache::CoverageRegistry> coverage_;
    std::shared_ptr<cache::DownloadEventLog> event_log_;
    std::shared_ptr<indicators::IndicatorRegistry> registry_;

    std::shared_ptr<cache::CandlePageManager> candles_;
    std::shared_ptr<cache::FundingPageManager> funding_;
    std::shared_ptr<cache::OpenInterestPageManager> open_interest_;
    std::shared_ptr<cache::AggTradePageManager> agg_trades_;
    std::shared_ptr<cache::PremiumIndexPageManager> premium_index_;
    std::shared_ptr<indicators::IndicatorPageManager> indicators_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};
};

} // namespace mdcache

#endif // MDCACHE_MARKET_DATA_CACHE_H_
