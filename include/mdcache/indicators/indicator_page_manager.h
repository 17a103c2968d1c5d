#ifndef MDCACHE_INDICATORS_INDICATOR_PAGE_MANAGER_H_
#define MDCACHE_INDICATORS_INDICATOR_PAGE_MANAGER_H_

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "mdcache/cache/event_log.h"
#include "mdcache/cache/notification_dispatcher.h"
#include "mdcache/cache/page_manager.h"
#include "mdcache/core/result.h"
#include "mdcache/indicators/indicator_page.h"
#include "mdcache/indicators/indicator_registry.h"

namespace mdcache {
namespace indicators {

/**
 * @brief Derived pages computed from candle pages
 *
 * Each source candle page is requested once, under a single internal
 * listener, no matter how many indicators depend on it. Dependents are
 * recomputed when the source reaches READY with a data version they have not
 * seen, so a source update produces one recomputation and one
 * on_data_changed per indicator. Indicator pages without consumers stay
 * cached until their source page is evicted.
 *
 * Thread-safe. Construct through create().
 */
class IndicatorPageManager : public std::enable_shared_from_this<IndicatorPageManager> {
public:
    /**
     * @throws core::InvalidArgumentError on a null collaborator
     */
    static std::shared_ptr<IndicatorPageManager> create(
        std::shared_ptr<cache::CandlePageManager> candles,
        std::shared_ptr<IndicatorRegistry> registry,
        std::shared_ptr<cache::NotificationDispatcher> dispatcher,
        std::shared_ptr<cache::DownloadEventLog> event_log);

    ~IndicatorPageManager();

    IndicatorPageManager(const IndicatorPageManager&) = delete;
    IndicatorPageManager& operator=(const IndicatorPageManager&) = delete;

    /**
     * @brief Get or create the indicator page for (type, params, source)
     *
     * If the source page is READY and the cached values are current they are
     * returned as is; if they are outdated they are recomputed before this
     * returns. Otherwise the page stays EMPTY until the source is ready.
     * Invalid parameters produce a page in ERROR.
     *
     * @return INVALID_ARGUMENT for an unknown type or a non-candle source,
     *         or the error of the source request
     */
    core::Result<IndicatorPagePtr> subscribe(const std::string& type,
                                             const std::string& params,
                                             const cache::PageKey& source,
                                             IndicatorListenerPtr listener,
                                             const std::string& consumer);

    void release(const IndicatorPagePtr& page, const IndicatorListenerPtr& listener);
    void release(const IndicatorPagePtr& page, const std::string& consumer);

    /**
     * @brief Release every source page and drop all indicator pages
     */
    void shutdown();

    std::vector<cache::PageInfo> active_pages() const;
    size_t active_page_count() const;

    /**
     * @brief Number of source pages this manager currently holds
     */
    size_t source_count() const;

    const std::shared_ptr<IndicatorRegistry>& registry() const { return registry_; }

private:
    class SourceListener;
    using SourcePagePtr = cache::CandlePageManager::PagePtr;

    struct SourceBinding {
        SourcePagePtr page;
        bool registered{false};
        std::map<IndicatorKey, IndicatorPagePtr> dependents;
    };

    IndicatorPageManager(std::shared_ptr<cache::CandlePageManager> candles,
                         std::shared_ptr<IndicatorRegistry> registry,
                         std::shared_ptr<cache::NotificationDispatcher> dispatcher,
                         std::shared_ptr<cache::DownloadEventLog> event_log);

    void on_source_state(const SourcePagePtr& source, core::PageState new_state);
    void on_source_data(const SourcePagePtr& source);
    void on_source_evicted(const std::string& source_id);

    // mutex_ held
    void recompute_locked(SourceBinding& binding);
    void release_source_if_unused_locked(SourceBinding& binding);
    void drop_dependents_locked(SourceBinding& binding);

    // mutex_ and the indicator page's lock held
    void compute_locked(const IndicatorPagePtr& page, const cache::PageSnapshot<core::Candle>& source);
    void register_locked(const IndicatorPagePtr& page, const IndicatorListenerPtr& listener,
                         const std::string& consumer);
    void transition_locked(const IndicatorPagePtr& page, core::PageState new_state);
    void notify_data_locked(const IndicatorPagePtr& page);

    std::shared_ptr<cache::CandlePageManager> candles_;
    std::shared_ptr<IndicatorRegistry> registry_;
    std::shared_ptr<cache::NotificationDispatcher> dispatcher_;
    std::shared_ptr<cache::DownloadEventLog> event_log_;
    std::shared_ptr<SourceListener> source_listener_;
    uint64_t eviction_callback_id_{0};

    mutable std::mutex mutex_;
    std::map<std::string, SourceBinding> bindings_;
};

} // namespace indicators
} // namespace mdcache

#endif // MDCACHE_INDICATORS_INDICATOR_PAGE_MANAGER_H_
