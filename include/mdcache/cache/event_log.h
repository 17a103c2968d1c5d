#pragma once

#include <cstddef>
#include <deque>
#include <list>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "mdcache/core/config.h"
#include "mdcache/core/types.h"

namespace mdcache {
namespace cache {

enum class DownloadEventType : uint8_t {
    PAGE_CREATED,
    LOAD_STARTED,
    LOAD_COMPLETED,
    UPDATE_STARTED,
    UPDATE_COMPLETED,
    ERROR,
    PAGE_RELEASED,
    PAGE_EVICTED,
    LISTENER_ADDED,
    LISTENER_REMOVED
};

const char* to_string(DownloadEventType type);

struct DownloadEvent {
    core::Timestamp timestamp{0};
    std::string page_key;
    core::DataKind kind{core::DataKind::CANDLES};
    DownloadEventType type{DownloadEventType::PAGE_CREATED};
    std::string message;
    std::optional<core::Duration> duration;     // Load/update events only
    std::optional<size_t> record_count;         // Completion events only

    bool is_error() const { return type == DownloadEventType::ERROR; }
};

/**
 * @brief Filter for DownloadEventLog::query; unset fields match everything
 */
struct EventQuery {
    std::optional<core::Timestamp> since;
    std::optional<core::DataKind> kind;
    std::optional<DownloadEventType> type;
    std::string key_contains;
    size_t limit{100};
};

struct EventLogStatistics {
    size_t total_events{0};
    size_t events_last_5_min{0};
    size_t errors_last_5_min{0};
    size_t tracked_pages{0};
    std::map<core::DataKind, size_t> events_by_kind;
    std::map<DownloadEventType, size_t> events_by_type;
    double avg_load_duration_ms{0.0};   // Over LOAD_COMPLETED and UPDATE_COMPLETED
};

/**
 * @brief Bounded diagnostic history of page lifecycle events
 *
 * Keeps the last max_page_events per page key and the last
 * max_global_events overall; the oldest entries are dropped on overflow.
 * At most max_tracked_pages page logs are kept. Past that the log of the
 * page with the oldest last event is dropped, which is usually one that
 * was evicted long ago.
 * Recording never throws and never fails a cache operation.
 *
 * Thread-safe.
 */
class DownloadEventLog {
public:
    explicit DownloadEventLog(const core::EventLogConfig& config = core::EventLogConfig::Default());

    void record(DownloadEvent event) noexcept;

    void log_page_created(const std::string& key, core::DataKind kind, const std::string& consumer);
    void log_load_started(const std::string& key, core::DataKind kind, const std::string& message);
    void log_load_completed(const std::string& key, core::DataKind kind, core::Duration duration,
                            size_t record_count);
    void log_update_started(const std::string& key, core::DataKind kind, const std::string& message);
    void log_update_completed(const std::string& key, core::DataKind kind, core::Duration duration,
                              size_t record_count);
    void log_error(const std::string& key, core::DataKind kind, const std::string& message);
    void log_page_released(const std::string& key, core::DataKind kind, const std::string& consumer);
    void log_page_evicted(const std::string& key, core::DataKind kind);
    void log_listener_added(const std::string& key, core::DataKind kind, const std::string& consumer);
    void log_listener_removed(const std::string& key, core::DataKind kind, const std::string& consumer);

    /**
     * @brief Events for one page, oldest first
     */
    std::vector<DownloadEvent> page_log(const std::string& key) const;

    /**
     * @brief Most recent events across all pages, newest first
     */
    std::vector<DownloadEvent> global_log(size_t limit = 100) const;

    /**
     * @brief Filtered view of the global log, newest first
     */
    std::vector<DownloadEvent> query(const EventQuery& query) const;

    std::vector<DownloadEvent> error_log(size_t limit = 100) const;

    EventLogStatistics statistics() const;

    size_t tracked_page_count() const;
    std::vector<std::string> tracked_page_keys() const;

    void clear();
    void clear_page_log(const std::string& key);

    const core::EventLogConfig& config() const { return config_; }

private:
    void log(const std::string& key, core::DataKind kind, DownloadEventType type, std::string message,
             std::optional<core::Duration> duration = std::nullopt,
             std::optional<size_t> record_count = std::nullopt);

    const core::EventLogConfig config_;

    struct PageLog {
        std::deque<DownloadEvent> events;
        std::list<std::string>::iterator recency;
    };

    mutable std::mutex mutex_;
    std::deque<DownloadEvent> global_;
    std::unordered_map<std::string, PageLog> pages_;
    std::list<std::string> recency_;  // Page keys, least recently active first
};

} // namespace cache
} // namespace mdcache
