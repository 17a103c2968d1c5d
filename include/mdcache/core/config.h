#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>

#include "mdcache/core/result.h"
#include "mdcache/core/types.h"

namespace mdcache {
namespace core {

/**
 * @brief Configuration for the per-series coverage index
 */
struct CoverageConfig {
    // Comparison granularity per data kind. Interior holes shorter than one
    // bucket are treated as covered.
    std::map<DataKind, Duration> bucket_sizes;
    size_t consolidate_threshold;   // Interval count that triggers consolidation

    CoverageConfig() : consolidate_threshold(50) {}

    Duration bucket_for(DataKind kind) const;

    static CoverageConfig Default() {
        CoverageConfig config;
        config.bucket_sizes[DataKind::CANDLES] = kHourMs;
        config.bucket_sizes[DataKind::PREMIUM_INDEX] = kHourMs;
        config.bucket_sizes[DataKind::AGG_TRADES] = kHourMs;
        config.bucket_sizes[DataKind::FUNDING] = kMonthMs;
        config.bucket_sizes[DataKind::OPEN_INTEREST] = kMonthMs;
        config.bucket_sizes[DataKind::INDICATOR] = kHourMs;
        config.consolidate_threshold = 50;
        return config;
    }

    Result<void> validate() const;
};

/**
 * @brief Configuration for one page manager and its fetch workers
 */
struct PageManagerConfig {
    uint32_t fetch_workers = 2;
    uint32_t max_queue_size = 256;
    Duration page_alignment = kHourMs;      // Page ranges are widened to this grid
    Duration chunk_duration = 30 * kDayMs;  // Largest range handed to one backend call
    std::chrono::milliseconds eviction_grace{10000};
    std::chrono::milliseconds reaper_interval{1000};
    std::chrono::milliseconds shutdown_timeout{5000};
    std::chrono::milliseconds worker_wait_timeout{100};
    int progress_step = 5;                  // Percent between progress notifications
    bool enable_reaper = true;

    PageManagerConfig() = default;

    static PageManagerConfig ForKind(DataKind kind);

    Result<void> validate() const;
};

/**
 * @brief Configuration for the download event log
 */
struct EventLogConfig {
    size_t max_page_events = 500;
    size_t max_global_events = 10'000;
    size_t max_tracked_pages = 1'000;  // Per-page logs kept; least recently active dropped first

    static EventLogConfig Default() { return EventLogConfig{}; }

    Result<void> validate() const;
};

/**
 * @brief Top-level cache configuration
 */
struct CacheConfig {
    CoverageConfig coverage;
    EventLogConfig event_log;
    std::map<DataKind, PageManagerConfig> managers;

    static CacheConfig Default();

    /**
     * @brief Manager settings for a kind, falling back to ForKind() defaults
     */
    PageManagerConfig manager(DataKind kind) const;

    Result<void> validate() const;
};

} // namespace core
} // namespace mdcache
