#include "mdcache/market_data_cache.h"

#include <algorithm>

#include "mdcache/common/logger.h"
#include "mdcache/core/error.h"

namespace mdcache {

namespace {

template<typename R>
std::shared_ptr<cache::PageManager<R>> make_manager(core::DataKind kind,
                                                    std::shared_ptr<cache::FetchBackend<R>> backend,
                                                    const core::CacheConfig& config,
                                                    const std::shared_ptr<cache::CoverageRegistry>& coverage,
                                                    const std::shared_ptr<cache::DownloadEventLog>& event_log,
                                                    const std::shared_ptr<cache::NotificationDispatcher>& dispatcher) {
    if (!backend) {
        MDCACHE_DEBUG("No backend for {}, page manager not created", core::to_string(kind));
        return nullptr;
    }
    return std::make_shared<cache::PageManager<R>>(kind, std::move(backend), coverage, event_log,
                                                   dispatcher, config.manager(kind));
}

std::chrono::milliseconds remaining(std::chrono::steady_clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return std::max(left, std::chrono::milliseconds{0});
}

} // namespace

MarketDataCache::MarketDataCache(const core::CacheConfig& config, FetchBackends backends)
    : config_(config) {
    auto valid = config_.validate();
    if (!valid.ok()) {
        throw core::InvalidArgumentError("Invalid cache config: " + valid.error());
    }

    dispatcher_ = std::make_shared<cache::NotificationDispatcher>();
    coverage_ = std::make_shared<cache::CoverageRegistry>(config_.coverage);
    event_log_ = std::make_shared<cache::DownloadEventLog>(config_.event_log);
    registry_ = indicators::IndicatorRegistry::with_builtins();

    candles_ = make_manager(core::DataKind::CANDLES, std::move(backends.candles), config_, coverage_,
                            event_log_, dispatcher_);
    funding_ = make_manager(core::DataKind::FUNDING, std::move(backends.funding), config_, coverage_,
                            event_log_, dispatcher_);
    open_interest_ = make_manager(core::DataKind::OPEN_INTEREST, std::move(backends.open_interest),
                                  config_, coverage_, event_log_, dispatcher_);
    agg_trades_ = make_manager(core::DataKind::AGG_TRADES, std::move(backends.agg_trades), config_,
                               coverage_, event_log_, dispatcher_);
    premium_index_ = make_manager(core::DataKind::PREMIUM_INDEX, std::move(backends.premium_index),
                                  config_, coverage_, event_log_, dispatcher_);

    if (candles_) {
        indicators_ = indicators::IndicatorPageManager::create(candles_, registry_, dispatcher_, event_log_);
    }
}

MarketDataCache::~MarketDataCache() {
    auto result = shutdown();
    if (!result.ok()) {
        MDCACHE_WARN("Market data cache shutdown: {}", result.error());
    }
}

template<typename Fn>
void MarketDataCache::for_each_manager(Fn&& fn) const {
    if (candles_) fn(*candles_);
    if (funding_) fn(*funding_);
    if (open_interest_) fn(*open_interest_);
    if (agg_trades_) fn(*agg_trades_);
    if (premium_index_) fn(*premium_index_);
}

core::Result<void> MarketDataCache::initialize() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_.load()) {
        return core::Result<void>::error("Market data cache already initialized",
                                         core::Error::Code::ALREADY_EXISTS);
    }

    auto started = dispatcher_->start();
    if (!started.ok()) {
        return started;
    }

    core::Result<void> failure;
    for_each_manager([&failure](auto& manager) {
        if (!failure.ok()) {
            return;
        }
        auto result = manager.initialize();
        if (!result.ok()) {
            failure = core::Result<void>::error(
                std::string(core::to_string(manager.kind())) + " manager: " + result.error(), result.code());
        }
    });
    if (!failure.ok()) {
        MDCACHE_ERROR("Market data cache failed to start: {}", failure.error());
        for_each_manager([](auto& manager) {
            auto stopped = manager.shutdown();
            if (!stopped.ok()) {
                MDCACHE_WARN("{} manager shutdown: {}", core::to_string(manager.kind()), stopped.error());
            }
        });
        auto stopped = dispatcher_->shutdown();
        if (!stopped.ok()) {
            MDCACHE_WARN("Notification dispatcher shutdown: {}", stopped.error());
        }
        return failure;
    }

    running_.store(true);
    MDCACHE_INFO("Market data cache started");
    return core::Result<void>();
}

core::Result<void> MarketDataCache::shutdown() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_.exchange(false)) {
        return core::Result<void>();
    }

    if (indicators_) {
        indicators_->shutdown();
    }

    core::Result<void> first_error;
    for_each_manager([&first_error](auto& manager) {
        auto result = manager.shutdown();
        if (!result.ok()) {
            MDCACHE_WARN("{} manager shutdown: {}", core::to_string(manager.kind()), result.error());
            if (first_error.ok()) {
                first_error = std::move(result);
            }
        }
    });

    auto stopped = dispatcher_->shutdown();
    if (!stopped.ok() && first_error.ok()) {
        first_error = std::move(stopped);
    }
    MDCACHE_INFO("Market data cache stopped");
    return first_error;
}

CacheSnapshot MarketDataCache::snapshot() const {
    CacheSnapshot snap;
    snap.taken_at = core::now_ms();
    for_each_manager([&snap](const auto& manager) {
        auto pages = manager.active_pages();
        snap.active_pages += pages.size();
        snap.total_records += manager.total_record_count();
        snap.estimated_memory_bytes += manager.estimate_memory_bytes();
        snap.pages.insert(snap.pages.end(), pages.begin(), pages.end());
    });
    if (indicators_) {
        auto pages = indicators_->active_pages();
        snap.active_pages += pages.size();
        for (const auto& info : pages) {
            snap.estimated_memory_bytes += info.record_count * (sizeof(double) + sizeof(core::Timestamp));
        }
        snap.pages.insert(snap.pages.end(), pages.begin(), pages.end());
    }
    snap.events = event_log_->statistics();
    snap.coverage = coverage_->summaries();
    return snap;
}

core::Result<void> MarketDataCache::wait_for_idle(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    core::Result<void> outcome;
    for_each_manager([&outcome, deadline](auto& manager) {
        if (!outcome.ok()) {
            return;
        }
        auto result = manager.wait_for_idle(remaining(deadline));
        if (!result.ok()) {
            outcome = std::move(result);
        }
    });
    if (!outcome.ok()) {
        return outcome;
    }
    return dispatcher_->wait_idle(remaining(deadline));
}

} // namespace mdcache
