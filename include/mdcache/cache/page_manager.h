#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "mdcache/cache/background_processor.h"
#include "mdcache/cache/coverage_index.h"
#include "mdcache/cache/event_log.h"
#include "mdcache/cache/fetch_backend.h"
#include "mdcache/cache/notification_dispatcher.h"
#include "mdcache/cache/page.h"
#include "mdcache/core/config.h"
#include "mdcache/core/result.h"

namespace mdcache {
namespace cache {

/**
 * @brief Counters for one page manager (snapshot, not atomics)
 */
struct PageManagerStats {
    uint64_t fetch_jobs_dispatched = 0;
    uint64_t fetch_jobs_completed = 0;
    uint64_t fetch_jobs_failed = 0;     // Jobs that ended in ERROR
    uint64_t chunks_fetched = 0;
    uint64_t chunks_failed = 0;
    uint64_t records_fetched = 0;
    uint64_t records_copied = 0;      // Served from another live page of the series
    uint64_t pages_created = 0;
    uint64_t pages_evicted = 0;
    uint64_t queue_rejections = 0;
    size_t active_pages = 0;
    size_t total_records = 0;
    size_t estimated_memory_bytes = 0;
};

/**
 * @brief Called after a page was evicted, outside every manager lock
 */
using EvictionCallback = std::function<void(const PageKey& key, const std::string& page_id)>;

/**
 * @brief Owner of all pages of one data kind
 *
 * request() finds or creates the page covering a range, registers the
 * caller and schedules a background fetch for whatever the page is still
 * missing. At most one fetch job per page is queued or running at any time;
 * concurrent requests attach to it, and a range that grows while the job
 * runs is fetched by that same job before it reports READY. Ranges the
 * coverage index knows as FULL are copied from another live page of the
 * series when one holds them. Pages without consumers are evicted by the
 * reaper once the grace period has passed and no fetch is in flight.
 *
 * Lock order: page map, then page, then dispatcher and worker queues.
 *
 * Thread-safe.
 */
template<typename R>
class PageManager {
public:
    using PagePtr = std::shared_ptr<Page<R>>;
    using ListenerPtr = std::shared_ptr<PageListener<R>>;
    using BackendPtr = std::shared_ptr<FetchBackend<R>>;

    /**
     * @throws core::InvalidArgumentError on a null collaborator or invalid config
     */
    PageManager(core::DataKind kind,
                BackendPtr backend,
                std::shared_ptr<CoverageRegistry> coverage,
                std::shared_ptr<DownloadEventLog> event_log,
                std::shared_ptr<NotificationDispatcher> dispatcher,
                const core::PageManagerConfig& config = core::PageManagerConfig{});
    ~PageManager();

    PageManager(const PageManager&) = delete;
    PageManager& operator=(const PageManager&) = delete;

    /**
     * @brief Start fetch workers and the eviction reaper
     */
    core::Result<void> initialize();

    /**
     * @brief Wait for running fetches, then stop workers and reaper
     *
     * Queued jobs that did not start are dropped; their pages stay in
     * LOADING or UPDATING.
     */
    core::Result<void> shutdown();

    /**
     * @brief Get or create the page covering [start, end) and register on it
     *
     * Page selection: a page with the same aligned range, else the smallest
     * page containing the range, else an overlapping or adjacent page which
     * is extended, else a new page. Registration is idempotent per listener
     * (or per consumer label when listener is null). If the page lacks data
     * inside its range a fetch is scheduled for exactly the missing
     * sub-ranges. Returns immediately.
     *
     * @return The page, or INVALID_ARGUMENT for an empty symbol or
     *         start >= end, UNAVAILABLE when not initialized
     */
    core::Result<PagePtr> request(const std::string& symbol,
                                  const std::string& sub_key,
                                  core::Timestamp start,
                                  core::Timestamp end,
                                  ListenerPtr listener,
                                  const std::string& consumer);

    /**
     * @brief Remove a listener registration; unknown pairs are ignored
     */
    void release(const PagePtr& page, const ListenerPtr& listener);

    /**
     * @brief Remove every registration made under a consumer label
     */
    void release(const PagePtr& page, const std::string& consumer);

    /**
     * @brief Existing page containing [start, end), without registering or fetching
     * @return The page, or nullptr
     */
    PagePtr peek(const std::string& symbol, const std::string& sub_key,
                 core::Timestamp start, core::Timestamp end) const;

    /**
     * @brief Re-fetch the page's whole range (manual resync)
     * @return true if a fetch was scheduled or folded into a pending one
     */
    bool refresh(const PagePtr& page);

    /**
     * @brief Re-fetch the failed sub-ranges of a page in ERROR
     * @return true if a fetch was scheduled
     */
    bool retry(const PagePtr& page);

    /**
     * @brief Evict consumerless pages whose grace period has elapsed
     * @return Number of pages evicted
     */
    size_t evict_idle_pages();

    uint64_t add_eviction_callback(EvictionCallback callback);
    void remove_eviction_callback(uint64_t id);

    std::vector<PageInfo> active_pages() const;
    size_t active_page_count() const;
    size_t total_record_count() const;
    size_t estimate_memory_bytes() const;
    PageManagerStats stats() const;

    /**
     * @brief Block until no fetch is queued or running and notifications are delivered
     */
    core::Result<void> wait_for_idle(std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});

    core::DataKind kind() const { return kind_; }
    const core::PageManagerConfig& config() const { return config_; }
    bool is_running() const { return running_.load(); }

private:
    std::vector<PagePtr> all_pages() const;
    bool owns_locked(const PagePtr& page) const;
    PagePtr find_containing_locked(const core::SeriesKey& series, const core::TimeRange& range) const;

    // Page lock held for every *_locked helper below
    void register_locked(const PagePtr& page, const ListenerPtr& listener, const std::string& consumer);
    void dispatch_locked(const PagePtr& page);
    void transition_locked(const PagePtr& page, core::PageState new_state);
    void notify_data_locked(const PagePtr& page);
    void notify_progress_locked(const PagePtr& page);
    void mark_idle_if_unused_locked(const PagePtr& page);

    // State of one fetch job across its planning rounds
    struct FetchJob {
        bool refresh = false;
        core::PageState operation = core::PageState::LOADING;
        std::chrono::steady_clock::time_point started;
        core::Duration interval = 0;  // Record spacing; 0 when the kind has none
        int64_t expected = -1;        // Records expected from the backend; -1 when unknowable
        size_t fetched = 0;
        size_t chunks = 0;
        size_t failed = 0;
        bool all_retryable = true;
        bool data_merged = false;
        std::string first_error;
        core::Error::Code first_code = core::Error::Code::UNKNOWN;
    };

    core::Result<void> run_fetch(const PagePtr& page);
    std::vector<core::TimeRange> copy_from_siblings(const PagePtr& page,
                                                    const CoverageIndex& index,
                                                    const std::vector<core::TimeRange>& gaps,
                                                    FetchJob& job);
    void fetch_round(const PagePtr& page, CoverageIndex& index,
                     const std::vector<core::TimeRange>& gaps, FetchJob& job);
    std::vector<core::TimeRange> remaining_gaps_locked(const PagePtr& page) const;
    std::string finish_job_locked(const PagePtr& page, const FetchJob& job);
    std::vector<core::TimeRange> plan_chunks(const std::vector<core::TimeRange>& gaps) const;
    core::Result<std::vector<R>> fetch_chunk(const FetchRequest& request);

    void reaper_loop();

    const core::DataKind kind_;
    BackendPtr backend_;
    std::shared_ptr<CoverageRegistry> coverage_;
    std::shared_ptr<DownloadEventLog> event_log_;
    std::shared_ptr<NotificationDispatcher> dispatcher_;
    const core::PageManagerConfig config_;
    std::unique_ptr<BackgroundProcessor> processor_;

    mutable std::mutex map_mutex_;
    std::map<core::SeriesKey, std::vector<PagePtr>> pages_;

    std::atomic<bool> running_{false};

    std::mutex reaper_mutex_;
    std::condition_variable reaper_cond_;
    bool reaper_stop_{false};
    std::thread reaper_;

    mutable std::mutex callbacks_mutex_;
    std::map<uint64_t, EvictionCallback> eviction_callbacks_;
    uint64_t next_callback_id_{1};

    std::atomic<uint64_t> fetch_jobs_dispatched_{0};
    std::atomic<uint64_t> fetch_jobs_completed_{0};
    std::atomic<uint64_t> fetch_jobs_failed_{0};
    std::atomic<uint64_t> chunks_fetched_{0};
    std::atomic<uint64_t> chunks_failed_{0};
    std::atomic<uint64_t> records_fetched_{0};
    std::atomic<uint64_t> records_copied_{0};
    std::atomic<uint64_t> pages_created_{0};
    std::atomic<uint64_t> pages_evicted_{0};
    std::atomic<uint64_t> queue_rejections_{0};
};

using CandlePageManager = PageManager<core::Candle>;
using FundingPageManager = PageManager<core::FundingRate>;
using OpenInterestPageManager = PageManager<core::OpenInterest>;
using AggTradePageManager = PageManager<core::AggTrade>;
using PremiumIndexPageManager = PageManager<core::PremiumIndex>;

} // namespace cache
} // namespace mdcache
