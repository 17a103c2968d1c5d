#include "mdcache/core/config.h"

#include <string>

namespace mdcache {
namespace core {

Duration CoverageConfig::bucket_for(DataKind kind) const {
    auto it = bucket_sizes.find(kind);
    if (it == bucket_sizes.end()) {
        return kHourMs;
    }
    return it->second;
}

Result<void> CoverageConfig::validate() const {
    for (const auto& [kind, bucket] : bucket_sizes) {
        if (bucket <= 0) {
            return Result<void>::error(std::string("Coverage bucket must be positive for ") +
                                           to_string(kind),
                                       Error::Code::INVALID_ARGUMENT);
        }
    }
    if (consolidate_threshold < 2) {
        return Result<void>::error("Coverage consolidate threshold must be at least 2",
                                   Error::Code::INVALID_ARGUMENT);
    }
    return Result<void>();
}

PageManagerConfig PageManagerConfig::ForKind(DataKind kind) {
    PageManagerConfig config;
    switch (kind) {
        case DataKind::CANDLES:
        case DataKind::PREMIUM_INDEX:
            config.page_alignment = kHourMs;
            config.chunk_duration = 30 * kDayMs;
            break;
        case DataKind::AGG_TRADES:
            // Tick data: one hour per backend call keeps responses bounded
            config.page_alignment = kHourMs;
            config.chunk_duration = kHourMs;
            config.fetch_workers = 4;
            break;
        case DataKind::FUNDING:
        case DataKind::OPEN_INTEREST:
            config.page_alignment = kDayMs;
            config.chunk_duration = 90 * kDayMs;
            break;
        case DataKind::INDICATOR:
            break;
    }
    return config;
}

Result<void> PageManagerConfig::validate() const {
    if (fetch_workers == 0) {
        return Result<void>::error("Invalid number of fetch workers: 0",
                                   Error::Code::INVALID_ARGUMENT);
    }
    if (max_queue_size == 0) {
        return Result<void>::error("Invalid max queue size: 0", Error::Code::INVALID_ARGUMENT);
    }
    if (page_alignment <= 0) {
        return Result<void>::error("Page alignment must be positive",
                                   Error::Code::INVALID_ARGUMENT);
    }
    if (chunk_duration <= 0) {
        return Result<void>::error("Chunk duration must be positive",
                                   Error::Code::INVALID_ARGUMENT);
    }
    if (eviction_grace.count() < 0) {
        return Result<void>::error("Eviction grace period must not be negative",
                                   Error::Code::INVALID_ARGUMENT);
    }
    if (enable_reaper && reaper_interval.count() <= 0) {
        return Result<void>::error("Reaper interval must be positive",
                                   Error::Code::INVALID_ARGUMENT);
    }
    if (progress_step <= 0 || progress_step > 100) {
        return Result<void>::error("Progress step must be within 1..100",
                                   Error::Code::INVALID_ARGUMENT);
    }
    return Result<void>();
}

Result<void> EventLogConfig::validate() const {
    if (max_page_events == 0 || max_global_events == 0 || max_tracked_pages == 0) {
        return Result<void>::error("Event log capacities must be greater than 0",
                                   Error::Code::INVALID_ARGUMENT);
    }
    return Result<void>();
}

CacheConfig CacheConfig::Default() {
    CacheConfig config;
    config.coverage = CoverageConfig::Default();
    config.event_log = EventLogConfig::Default();
    for (auto kind : {DataKind::CANDLES, DataKind::FUNDING, DataKind::OPEN_INTEREST,
                      DataKind::AGG_TRADES, DataKind::PREMIUM_INDEX}) {
        config.managers[kind] = PageManagerConfig::ForKind(kind);
    }
    return config;
}

PageManagerConfig CacheConfig::manager(DataKind kind) const {
    auto it = managers.find(kind);
    if (it == managers.end()) {
        return PageManagerConfig::ForKind(kind);
    }
    return it->second;
}

Result<void> CacheConfig::validate() const {
    auto coverage_result = coverage.validate();
    if (!coverage_result.ok()) {
        return coverage_result;
    }
    auto log_result = event_log.validate();
    if (!log_result.ok()) {
        return log_result;
    }
    for (const auto& [kind, manager_config] : managers) {
        auto result = manager_config.validate();
        if (!result.ok()) {
            return Result<void>::error(std::string(to_string(kind)) + ": " + result.error(),
                                       result.code());
        }
    }
    return Result<void>();
}

} // namespace core
} // namespace mdcache
