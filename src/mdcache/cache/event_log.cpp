#include "mdcache/cache/event_log.h"

#include <algorithm>

#include "mdcache/common/logger.h"
#include "mdcache/core/error.h"

namespace mdcache {
namespace cache {

namespace {

constexpr core::Duration kRecentWindowMs = 5 * core::kMinuteMs;

} // namespace

const char* to_string(DownloadEventType type) {
    switch (type) {
        case DownloadEventType::PAGE_CREATED:
            return "PAGE_CREATED";
        case DownloadEventType::LOAD_STARTED:
            return "LOAD_STARTED";
        case DownloadEventType::LOAD_COMPLETED:
            return "LOAD_COMPLETED";
        case DownloadEventType::UPDATE_STARTED:
            return "UPDATE_STARTED";
        case DownloadEventType::UPDATE_COMPLETED:
            return "UPDATE_COMPLETED";
        case DownloadEventType::ERROR:
            return "ERROR";
        case DownloadEventType::PAGE_RELEASED:
            return "PAGE_RELEASED";
        case DownloadEventType::PAGE_EVICTED:
            return "PAGE_EVICTED";
        case DownloadEventType::LISTENER_ADDED:
            return "LISTENER_ADDED";
        case DownloadEventType::LISTENER_REMOVED:
            return "LISTENER_REMOVED";
    }
    return "UNKNOWN";
}

DownloadEventLog::DownloadEventLog(const core::EventLogConfig& config) : config_(config) {
    auto result = config_.validate();
    if (!result.ok()) {
        throw core::InvalidArgumentError(result.error());
    }
}

void DownloadEventLog::record(DownloadEvent event) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = pages_.find(event.page_key);
        if (it == pages_.end()) {
            it = pages_.emplace(event.page_key, PageLog{}).first;
            it->second.recency = recency_.insert(recency_.end(), event.page_key);
        } else {
            recency_.splice(recency_.end(), recency_, it->second.recency);
        }
        auto& page = it->second.events;
        page.push_back(event);
        while (page.size() > config_.max_page_events) {
            page.pop_front();
        }
        while (pages_.size() > config_.max_tracked_pages) {
            pages_.erase(recency_.front());
            recency_.pop_front();
        }

        global_.push_back(std::move(event));
        while (global_.size() > config_.max_global_events) {
            global_.pop_front();
        }
    } catch (const std::exception& e) {
        // Diagnostics only; the event is lost
        MDCACHE_DEBUG("Dropping download event: {}", e.what());
    }
}

void DownloadEventLog::log(const std::string& key, core::DataKind kind, DownloadEventType type,
                           std::string message, std::optional<core::Duration> duration,
                           std::optional<size_t> record_count) {
    DownloadEvent event;
    event.timestamp = core::now_ms();
    event.page_key = key;
    event.kind = kind;
    event.type = type;
    event.message = std::move(message);
    event.duration = duration;
    event.record_count = record_count;
    record(std::move(event));
}

void DownloadEventLog::log_page_created(const std::string& key, core::DataKind kind,
                                        const std::string& consumer) {
    log(key, kind, DownloadEventType::PAGE_CREATED, "Created for " + consumer);
}

void DownloadEventLog::log_load_started(const std::string& key, core::DataKind kind,
                                        const std::string& message) {
    log(key, kind, DownloadEventType::LOAD_STARTED, message);
}

void DownloadEventLog::log_load_completed(const std::string& key, core::DataKind kind,
                                          core::Duration duration, size_t record_count) {
    log(key, kind, DownloadEventType::LOAD_COMPLETED,
        "Loaded " + std::to_string(record_count) + " records in " + std::to_string(duration) + "ms",
        duration, record_count);
}

void DownloadEventLog::log_update_started(const std::string& key, core::DataKind kind,
                                          const std::string& message) {
    log(key, kind, DownloadEventType::UPDATE_STARTED, message);
}

void DownloadEventLog::log_update_completed(const std::string& key, core::DataKind kind,
                                            core::Duration duration, size_t record_count) {
    log(key, kind, DownloadEventType::UPDATE_COMPLETED,
        "Updated to " + std::to_string(record_count) + " records in " + std::to_string(duration) + "ms",
        duration, record_count);
}

void DownloadEventLog::log_error(const std::string& key, core::DataKind kind,
                                 const std::string& message) {
    log(key, kind, DownloadEventType::ERROR, message);
}

void DownloadEventLog::log_page_released(const std::string& key, core::DataKind kind,
                                         const std::string& consumer) {
    log(key, kind, DownloadEventType::PAGE_RELEASED, "Released by " + consumer);
}

void DownloadEventLog::log_page_evicted(const std::string& key, core::DataKind kind) {
    log(key, kind, DownloadEventType::PAGE_EVICTED, "Evicted after grace period");
}

void DownloadEventLog::log_listener_added(const std::string& key, core::DataKind kind,
                                          const std::string& consumer) {
    log(key, kind, DownloadEventType::LISTENER_ADDED, "Listener added: " + consumer);
}

void DownloadEventLog::log_listener_removed(const std::string& key, core::DataKind kind,
                                            const std::string& consumer) {
    log(key, kind, DownloadEventType::LISTENER_REMOVED, "Listener removed: " + consumer);
}

std::vector<DownloadEvent> DownloadEventLog::page_log(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pages_.find(key);
    if (it == pages_.end()) {
        return {};
    }
    return std::vector<DownloadEvent>(it->second.events.begin(), it->second.events.end());
}

std::vector<DownloadEvent> DownloadEventLog::global_log(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DownloadEvent> result;
    result.reserve(std::min(limit, global_.size()));
    for (auto it = global_.rbegin(); it != global_.rend() && result.size() < limit; ++it) {
        result.push_back(*it);
    }
    return result;
}

std::vector<DownloadEvent> DownloadEventLog::query(const EventQuery& query) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DownloadEvent> result;
    for (auto it = global_.rbegin(); it != global_.rend() && result.size() < query.limit; ++it) {
        const auto& event = *it;
        if (query.since && event.timestamp < *query.since) {
            // Global log is time ordered; everything older follows
            break;
        }
        if (query.kind && event.kind != *query.kind) {
            continue;
        }
        if (query.type && event.type != *query.type) {
            continue;
        }
        if (!query.key_contains.empty() &&
            event.page_key.find(query.key_contains) == std::string::npos) {
            continue;
        }
        result.push_back(event);
    }
    return result;
}

std::vector<DownloadEvent> DownloadEventLog::error_log(size_t limit) const {
    EventQuery q;
    q.type = DownloadEventType::ERROR;
    q.limit = limit;
    return query(q);
}

EventLogStatistics DownloadEventLog::statistics() const {
    const core::Timestamp cutoff = core::now_ms() - kRecentWindowMs;

    std::lock_guard<std::mutex> lock(mutex_);
    EventLogStatistics stats;
    stats.total_events = global_.size();
    stats.tracked_pages = pages_.size();

    core::Duration total_duration = 0;
    size_t timed_events = 0;
    for (const auto& event : global_) {
        stats.events_by_kind[event.kind]++;
        stats.events_by_type[event.type]++;
        if (event.timestamp >= cutoff) {
            stats.events_last_5_min++;
            if (event.is_error()) {
                stats.errors_last_5_min++;
            }
        }
        if (event.duration && (event.type == DownloadEventType::LOAD_COMPLETED ||
                               event.type == DownloadEventType::UPDATE_COMPLETED)) {
            total_duration += *event.duration;
            timed_events++;
        }
    }
    if (timed_events > 0) {
        stats.avg_load_duration_ms =
            static_cast<double>(total_duration) / static_cast<double>(timed_events);
    }
    return stats;
}

size_t DownloadEventLog::tracked_page_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pages_.size();
}

std::vector<std::string> DownloadEventLog::tracked_page_keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    keys.reserve(pages_.size());
    for (const auto& entry : pages_) {
        keys.push_back(entry.first);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

void DownloadEventLog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    global_.clear();
    pages_.clear();
    recency_.clear();
}

void DownloadEventLog::clear_page_log(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pages_.find(key);
    if (it == pages_.end()) {
        return;
    }
    recency_.erase(it->second.recency);
    pages_.erase(it);
}

} // namespace cache
} // namespace mdcache
