#include "mdcache/indicators/indicator_page.h"

#include <set>

namespace mdcache {
namespace indicators {

std::string IndicatorKey::to_string() const {
    return type + "(" + params + ")@" + source_id;
}

IndicatorPage::IndicatorPage(IndicatorKey key, cache::PageKey source_key,
                             IndicatorCalculatorPtr calculator, IndicatorParams params)
    : key_(std::move(key)),
      source_key_(std::move(source_key)),
      calculator_(std::move(calculator)),
      params_(std::move(params)),
      values_(std::make_shared<const std::vector<double>>()),
      timestamps_(std::make_shared<const std::vector<core::Timestamp>>()) {
}

core::PageState IndicatorPage::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::shared_ptr<const std::vector<double>> IndicatorPage::values() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_;
}

std::shared_ptr<const std::vector<core::Timestamp>> IndicatorPage::timestamps() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timestamps_;
}

IndicatorSnapshot IndicatorPage::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    IndicatorSnapshot snap;
    snap.values = values_;
    snap.timestamps = timestamps_;
    snap.source_version = source_version_;
    snap.state = state_;
    snap.stale = stale_;
    return snap;
}

uint64_t IndicatorPage::source_version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return source_version_;
}

bool IndicatorPage::is_stale() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stale_;
}

std::string IndicatorPage::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

uint64_t IndicatorPage::compute_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return compute_count_;
}

size_t IndicatorPage::consumer_count() const {
    return consumers().size();
}

size_t IndicatorPage::listener_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_locked().size();
}

std::vector<std::string> IndicatorPage::consumers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> labels;
    for (const auto& registration : registrations_) {
        labels.insert(registration.consumer);
    }
    return std::vector<std::string>(labels.begin(), labels.end());
}

bool IndicatorPage::is_evicted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evicted_;
}

std::vector<IndicatorListenerPtr> IndicatorPage::listeners_locked() const {
    std::vector<IndicatorListenerPtr> listeners;
    for (const auto& registration : registrations_) {
        if (registration.listener) {
            listeners.push_back(registration.listener);
        }
    }
    return listeners;
}

cache::PageInfo IndicatorPage::info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    cache::PageInfo info;
    info.id = key_.to_string();
    info.key = cache::PageKey(core::DataKind::INDICATOR, source_key_.symbol,
                              key_.type + "(" + key_.params + ")@" + source_key_.sub_key,
                              source_key_.range);
    info.state = state_;
    std::set<std::string> labels;
    for (const auto& registration : registrations_) {
        labels.insert(registration.consumer);
    }
    info.consumers.assign(labels.begin(), labels.end());
    info.consumer_count = labels.size();
    info.listener_count = listeners_locked().size();
    info.record_count = values_->size();
    info.load_progress = state_ == core::PageState::READY ? 100 : 0;
    info.error = last_error_;
    info.data_version = source_version_;
    info.idle = registrations_.empty();
    return info;
}

} // namespace indicators
} // namespace mdcache
