#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "mdcache/cache/page_key.h"
#include "mdcache/cache/range_set.h"
#include "mdcache/core/records.h"
#include "mdcache/core/types.h"

namespace mdcache {
namespace cache {

template<typename R> class Page;
template<typename R> class PageManager;

/**
 * @brief Receiver of page lifecycle notifications
 *
 * Callbacks arrive on the notification thread, never on the caller's
 * thread, and in the order the page actually changed. A listener that
 * throws is logged and skipped; other listeners still run.
 */
template<typename R>
class PageListener {
public:
    virtual ~PageListener() = default;

    virtual void on_state_changed(const std::shared_ptr<Page<R>>& page,
                                  core::PageState old_state,
                                  core::PageState new_state) = 0;

    virtual void on_data_changed(const std::shared_ptr<Page<R>>& page) = 0;

    /**
     * @param percent 0-100, or -1 when the total is not knowable in advance
     */
    virtual void on_progress(const std::shared_ptr<Page<R>>& page, int percent) {
        (void)page;
        (void)percent;
    }
};

/**
 * @brief Consistent view of a page's data at one instant
 */
template<typename R>
struct PageSnapshot {
    std::shared_ptr<const std::vector<R>> records;
    uint64_t data_version{0};
    core::PageState state{core::PageState::EMPTY};
    core::TimeRange range;
};

/**
 * @brief Merge incoming records into a sorted, timestamp-unique sequence
 *
 * The result is sorted ascending by timestamp. When several records share a
 * timestamp the incoming one wins, and within incoming the last one wins.
 */
template<typename R>
std::vector<R> merge_records(const std::vector<R>& existing, std::vector<R> incoming) {
    auto by_time = [](const R& a, const R& b) { return a.timestamp() < b.timestamp(); };
    std::stable_sort(incoming.begin(), incoming.end(), by_time);

    // Keep the last of each run of equal timestamps
    std::vector<R> unique;
    unique.reserve(incoming.size());
    for (auto& record : incoming) {
        if (!unique.empty() && unique.back().timestamp() == record.timestamp()) {
            unique.back() = std::move(record);
        } else {
            unique.push_back(std::move(record));
        }
    }

    std::vector<R> merged;
    merged.reserve(existing.size() + unique.size());
    auto ei = existing.begin();
    auto ui = unique.begin();
    while (ei != existing.end() && ui != unique.end()) {
        if (ei->timestamp() < ui->timestamp()) {
            merged.push_back(*ei++);
        } else if (ui->timestamp() < ei->timestamp()) {
            merged.push_back(std::move(*ui++));
        } else {
            merged.push_back(std::move(*ui++));
            ++ei;
        }
    }
    merged.insert(merged.end(), ei, existing.end());
    std::move(ui, unique.end(), std::back_inserter(merged));
    return merged;
}

/**
 * @brief Cached buffer of records for one series over an aligned range
 *
 * Pages are created and mutated only by their PageManager; consumers get a
 * shared handle and read through the accessors below. Every accessor takes
 * the page's own lock, so unrelated pages never contend. The record buffer
 * is copy-on-write: records() hands out an immutable vector that stays
 * valid after later merges.
 */
template<typename R>
class Page : public std::enable_shared_from_this<Page<R>> {
public:
    using ListenerPtr = std::shared_ptr<PageListener<R>>;
    using RecordsPtr = std::shared_ptr<const std::vector<R>>;

    Page(core::DataKind kind, std::string symbol, std::string sub_key, core::TimeRange range);

    Page(const Page&) = delete;
    Page& operator=(const Page&) = delete;

    /**
     * @brief Stable identifier; the key at creation time
     */
    const std::string& id() const { return id_; }
    core::DataKind kind() const { return kind_; }
    const std::string& symbol() const { return symbol_; }
    const std::string& sub_key() const { return sub_key_; }

    PageKey key() const;
    core::TimeRange range() const;
    core::PageState state() const;

    RecordsPtr records() const;
    size_t record_count() const;
    PageSnapshot<R> snapshot() const;

    std::vector<core::TimeRange> coverage() const;
    std::vector<core::TimeRange> failed_ranges() const;
    std::string last_error() const;
    bool is_retryable() const;
    int load_progress() const;

    size_t consumer_count() const;
    size_t listener_count() const;
    std::vector<std::string> consumers() const;

    uint64_t data_version() const;
    core::Timestamp last_sync_time() const;
    bool is_evicted() const;

    PageInfo info() const;

private:
    friend class PageManager<R>;

    enum class FetchPhase { IDLE, QUEUED, RUNNING };

    struct Registration {
        ListenerPtr listener;
        std::string consumer;
    };

    // All helpers below expect mutex_ to be held
    std::vector<ListenerPtr> listeners_locked() const;
    size_t consumer_count_locked() const;
    PageKey key_locked() const;

    const std::string id_;
    const core::DataKind kind_;
    const std::string symbol_;
    const std::string sub_key_;

    mutable std::mutex mutex_;
    core::TimeRange range_;
    core::PageState state_{core::PageState::EMPTY};
    RecordsPtr records_;
    RangeSet coverage_;
    RangeSet failed_ranges_;
    std::vector<Registration> registrations_;

    int progress_{0};
    int notified_progress_{0};
    std::string last_error_;
    bool retryable_{false};

    FetchPhase phase_{FetchPhase::IDLE};
    bool refresh_pending_{false};

    uint64_t data_version_{0};
    bool idle_{true};
    std::chrono::steady_clock::time_point idle_since_;
    core::Timestamp last_sync_time_{0};
    bool evicted_{false};
};

} // namespace cache
} // namespace mdcache
