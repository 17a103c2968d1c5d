#include "mdcache/cache/page.h"

#include <set>

namespace mdcache {
namespace cache {

template<typename R>
Page<R>::Page(core::DataKind kind, std::string symbol, std::string sub_key, core::TimeRange range)
    : id_(PageKey(kind, symbol, sub_key, range).to_string()),
      kind_(kind),
      symbol_(std::move(symbol)),
      sub_key_(std::move(sub_key)),
      range_(range),
      records_(std::make_shared<const std::vector<R>>()),
      idle_since_(std::chrono::steady_clock::now()) {
}

template<typename R>
PageKey Page<R>::key_locked() const {
    return PageKey(kind_, symbol_, sub_key_, range_);
}

template<typename R>
PageKey Page<R>::key() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return key_locked();
}

template<typename R>
core::TimeRange Page<R>::range() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return range_;
}

template<typename R>
core::PageState Page<R>::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

template<typename R>
typename Page<R>::RecordsPtr Page<R>::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

template<typename R>
size_t Page<R>::record_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_->size();
}

template<typename R>
PageSnapshot<R> Page<R>::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PageSnapshot<R> snap;
    snap.records = records_;
    snap.data_version = data_version_;
    snap.state = state_;
    snap.range = range_;
    return snap;
}

template<typename R>
std::vector<core::TimeRange> Page<R>::coverage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return coverage_.ranges();
}

template<typename R>
std::vector<core::TimeRange> Page<R>::failed_ranges() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_ranges_.ranges();
}

template<typename R>
std::string Page<R>::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

template<typename R>
bool Page<R>::is_retryable() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retryable_;
}

template<typename R>
int Page<R>::load_progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_;
}

template<typename R>
size_t Page<R>::consumer_count_locked() const {
    std::set<std::string> labels;
    for (const auto& registration : registrations_) {
        labels.insert(registration.consumer);
    }
    return labels.size();
}

template<typename R>
size_t Page<R>::consumer_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consumer_count_locked();
}

template<typename R>
size_t Page<R>::listener_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_locked().size();
}

template<typename R>
std::vector<std::string> Page<R>::consumers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> labels;
    for (const auto& registration : registrations_) {
        labels.insert(registration.consumer);
    }
    return std::vector<std::string>(labels.begin(), labels.end());
}

template<typename R>
uint64_t Page<R>::data_version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_version_;
}

template<typename R>
core::Timestamp Page<R>::last_sync_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_sync_time_;
}

template<typename R>
bool Page<R>::is_evicted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evicted_;
}

template<typename R>
std::vector<typename Page<R>::ListenerPtr> Page<R>::listeners_locked() const {
    std::vector<ListenerPtr> listeners;
    listeners.reserve(registrations_.size());
    for (const auto& registration : registrations_) {
        if (registration.listener) {
            listeners.push_back(registration.listener);
        }
    }
    return listeners;
}

template<typename R>
PageInfo Page<R>::info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PageInfo info;
    info.id = id_;
    info.key = key_locked();
    info.state = state_;
    info.consumer_count = consumer_count_locked();
    info.listener_count = listeners_locked().size();
    info.record_count = records_->size();
    info.load_progress = progress_;
    info.error = last_error_;
    info.retryable = retryable_;
    info.failed_ranges = failed_ranges_.ranges();
    std::set<std::string> labels;
    for (const auto& registration : registrations_) {
        labels.insert(registration.consumer);
    }
    info.consumers.assign(labels.begin(), labels.end());
    info.coverage = coverage_.ranges();
    info.last_sync_time = last_sync_time_;
    info.data_version = data_version_;
    info.idle = registrations_.empty();
    return info;
}

template class Page<core::Candle>;
template class Page<core::FundingRate>;
template class Page<core::OpenInterest>;
template class Page<core::AggTrade>;
template class Page<core::PremiumIndex>;

} // namespace cache
} // namespace mdcache
