#include "mdcache/indicators/indicator_page_manager.h"

#include <algorithm>
#include <chrono>

#include "mdcache/common/logger.h"
#include "mdcache/core/error.h"

namespace mdcache {
namespace indicators {

namespace {

constexpr const char* kSourceConsumer = "IndicatorPageManager";
constexpr const char* kAnonymousConsumer = "anonymous";

} // namespace

/**
 * @brief The one listener registered on every source page
 */
class IndicatorPageManager::SourceListener : public cache::PageListener<core::Candle> {
public:
    explicit SourceListener(std::weak_ptr<IndicatorPageManager> owner) : owner_(std::move(owner)) {}

    void on_state_changed(const SourcePagePtr& page, core::PageState, core::PageState new_state) override {
        if (auto owner = owner_.lock()) {
            owner->on_source_state(page, new_state);
        }
    }

    void on_data_changed(const SourcePagePtr& page) override {
        if (auto owner = owner_.lock()) {
            owner->on_source_data(page);
        }
    }

private:
    std::weak_ptr<IndicatorPageManager> owner_;
};

std::shared_ptr<IndicatorPageManager> IndicatorPageManager::create(
    std::shared_ptr<cache::CandlePageManager> candles,
    std::shared_ptr<IndicatorRegistry> registry,
    std::shared_ptr<cache::NotificationDispatcher> dispatcher,
    std::shared_ptr<cache::DownloadEventLog> event_log) {
    if (!candles || !registry || !dispatcher || !event_log) {
        throw core::InvalidArgumentError(
            "IndicatorPageManager requires a candle manager, registry, dispatcher and event log");
    }
    std::shared_ptr<IndicatorPageManager> manager(new IndicatorPageManager(
        std::move(candles), std::move(registry), std::move(dispatcher), std::move(event_log)));

    manager->source_listener_ = std::make_shared<SourceListener>(manager);
    std::weak_ptr<IndicatorPageManager> weak = manager;
    manager->eviction_callback_id_ = manager->candles_->add_eviction_callback(
        [weak](const cache::PageKey&, const std::string& page_id) {
            if (auto self = weak.lock()) {
                self->on_source_evicted(page_id);
            }
        });
    return manager;
}

IndicatorPageManager::IndicatorPageManager(std::shared_ptr<cache::CandlePageManager> candles,
                                           std::shared_ptr<IndicatorRegistry> registry,
                                           std::shared_ptr<cache::NotificationDispatcher> dispatcher,
                                           std::shared_ptr<cache::DownloadEventLog> event_log)
    : candles_(std::move(candles)),
      registry_(std::move(registry)),
      dispatcher_(std::move(dispatcher)),
      event_log_(std::move(event_log)) {
}

IndicatorPageManager::~IndicatorPageManager() {
    candles_->remove_eviction_callback(eviction_callback_id_);
}

core::Result<IndicatorPagePtr> IndicatorPageManager::subscribe(const std::string& type,
                                                               const std::string& params,
                                                               const cache::PageKey& source,
                                                               IndicatorListenerPtr listener,
                                                               const std::string& consumer) {
    auto calculator = registry_->find(type);
    if (!calculator) {
        return core::Result<IndicatorPagePtr>::error("Unknown indicator type '" + type + "'",
                                                     core::Error::Code::INVALID_ARGUMENT);
    }
    if (source.kind != core::DataKind::CANDLES) {
        return core::Result<IndicatorPagePtr>::error(
            std::string("Indicators are computed from candle pages, not ") + core::to_string(source.kind),
            core::Error::Code::INVALID_ARGUMENT);
    }
    const std::string label = consumer.empty() ? kAnonymousConsumer : consumer;

    auto parsed = IndicatorParams::parse(params);
    core::Result<void> validity = parsed.ok()
                                      ? calculator->validate(parsed.value())
                                      : core::Result<void>::error(parsed.error(), parsed.code());
    const std::string canonical = parsed.ok() ? parsed.value().canonical() : params;

    std::lock_guard<std::mutex> lock(mutex_);

    auto source_result = candles_->request(source.symbol, source.sub_key, source.range.start,
                                           source.range.end, source_listener_, kSourceConsumer);
    if (!source_result.ok()) {
        return core::Result<IndicatorPagePtr>::error("Source request failed: " + source_result.error(),
                                                     source_result.code());
    }
    SourcePagePtr source_page = source_result.take_value();

    auto& binding = bindings_[source_page->id()];
    if (binding.page && binding.page != source_page) {
        // Source was evicted and recreated before the eviction callback ran
        drop_dependents_locked(binding);
    }
    binding.page = source_page;
    binding.registered = true;

    const IndicatorKey key{IndicatorRegistry::normalize(calculator->type()), canonical, source_page->id()};
    IndicatorPagePtr page;
    bool created = false;
    auto it = binding.dependents.find(key);
    if (it != binding.dependents.end()) {
        page = it->second;
    } else {
        page = std::make_shared<IndicatorPage>(key, source_page->key(), calculator,
                                               parsed.ok() ? parsed.take_value() : IndicatorParams{});
        binding.dependents.emplace(key, page);
        created = true;
        event_log_->log_page_created(page->id(), core::DataKind::INDICATOR, label);
        MDCACHE_DEBUG("Created indicator page {}", page->id());
    }

    const auto snapshot = source_page->snapshot();
    std::lock_guard<std::mutex> page_lock(page->mutex_);
    if (created && !validity.ok()) {
        page->params_valid_ = false;
        page->last_error_ = validity.error();
        page->state_ = core::PageState::ERROR;
        event_log_->log_error(page->id(), core::DataKind::INDICATOR, page->last_error_);
        MDCACHE_WARN("Indicator {} rejected: {}", page->id(), page->last_error_);
    } else if (page->params_valid_ && snapshot.state == core::PageState::READY &&
               (!page->computed_ || page->source_version_ != snapshot.data_version)) {
        compute_locked(page, snapshot);
    } else if (created && snapshot.state == core::PageState::ERROR) {
        page->last_error_ = "Source page failed: " + source_page->last_error();
        page->state_ = core::PageState::ERROR;
    }
    register_locked(page, listener, label);
    return page;
}

void IndicatorPageManager::register_locked(const IndicatorPagePtr& page,
                                           const IndicatorListenerPtr& listener,
                                           const std::string& consumer) {
    auto& registrations = page->registrations_;
    auto existing = std::find_if(registrations.begin(), registrations.end(),
                                 [&](const IndicatorPage::Registration& registration) {
                                     if (listener) {
                                         return registration.listener == listener;
                                     }
                                     return !registration.listener && registration.consumer == consumer;
                                 });
    if (existing != registrations.end()) {
        return;
    }
    registrations.push_back(IndicatorPage::Registration{listener, consumer});
    if (!listener) {
        return;
    }
    event_log_->log_listener_added(page->id(), core::DataKind::INDICATOR, consumer);

    const core::PageState state = page->state_;
    if (state == core::PageState::EMPTY) {
        return;
    }
    const bool has_values = page->computed_ && state == core::PageState::READY;
    IndicatorPagePtr self = page;
    dispatcher_->enqueue([listener, self, state]() {
        listener->on_state_changed(self, core::PageState::EMPTY, state);
    });
    if (has_values) {
        dispatcher_->enqueue([listener, self]() { listener->on_data_changed(self); });
    }
}

void IndicatorPageManager::transition_locked(const IndicatorPagePtr& page, core::PageState new_state) {
    const core::PageState old_state = page->state_;
    if (old_state == new_state) {
        return;
    }
    page->state_ = new_state;
    auto listeners = page->listeners_locked();
    if (listeners.empty()) {
        return;
    }
    IndicatorPagePtr self = page;
    dispatcher_->enqueue([listeners, self, old_state, new_state]() {
        for (const auto& listener : listeners) {
            try {
                listener->on_state_changed(self, old_state, new_state);
            } catch (const std::exception& e) {
                MDCACHE_WARN("Indicator listener on {} threw: {}", self->id(), e.what());
            }
        }
    });
}

void IndicatorPageManager::notify_data_locked(const IndicatorPagePtr& page) {
    auto listeners = page->listeners_locked();
    if (listeners.empty()) {
        return;
    }
    IndicatorPagePtr self = page;
    dispatcher_->enqueue([listeners, self]() {
        for (const auto& listener : listeners) {
            try {
                listener->on_data_changed(self);
            } catch (const std::exception& e) {
                MDCACHE_WARN("Indicator listener on {} threw: {}", self->id(), e.what());
            }
        }
    });
}

void IndicatorPageManager::compute_locked(const IndicatorPagePtr& page,
                                          const cache::PageSnapshot<core::Candle>& source) {
    const auto started = std::chrono::steady_clock::now();
    const auto& candles = *source.records;
    const bool first = !page->computed_;

    auto result = page->calculator_->compute(candles, page->params_);
    page->compute_count_++;
    page->computed_ = true;
    page->source_version_ = source.data_version;
    page->stale_ = false;

    if (result.ok() && result.value().size() != candles.size()) {
        result = core::Result<std::vector<double>>::error(
            "Calculator returned " + std::to_string(result.value().size()) + " values for " +
                std::to_string(candles.size()) + " candles",
            core::Error::Code::INTERNAL);
    }
    if (!result.ok()) {
        page->last_error_ = result.error();
        transition_locked(page, core::PageState::ERROR);
        event_log_->log_error(page->id(), core::DataKind::INDICATOR, page->last_error_);
        MDCACHE_WARN("Indicator {} failed: {}", page->id(), page->last_error_);
        return;
    }

    std::vector<core::Timestamp> timestamps;
    timestamps.reserve(candles.size());
    for (const auto& candle : candles) {
        timestamps.push_back(candle.timestamp());
    }
    page->values_ = std::make_shared<const std::vector<double>>(result.take_value());
    page->timestamps_ = std::make_shared<const std::vector<core::Timestamp>>(std::move(timestamps));
    page->last_error_.clear();

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::steady_clock::now() - started)
                             .count();
    if (first) {
        event_log_->log_load_completed(page->id(), core::DataKind::INDICATOR, elapsed, candles.size());
    } else {
        event_log_->log_update_completed(page->id(), core::DataKind::INDICATOR, elapsed, candles.size());
    }
    transition_locked(page, core::PageState::READY);
    notify_data_locked(page);
}

void IndicatorPageManager::recompute_locked(SourceBinding& binding) {
    const auto snapshot = binding.page->snapshot();
    if (snapshot.state != core::PageState::READY) {
        return;
    }
    for (auto& entry : binding.dependents) {
        const auto& page = entry.second;
        std::lock_guard<std::mutex> page_lock(page->mutex_);
        if (!page->params_valid_) {
            continue;
        }
        if (page->computed_ && page->source_version_ == snapshot.data_version) {
            page->stale_ = false;
            continue;
        }
        compute_locked(page, snapshot);
    }
}

void IndicatorPageManager::on_source_state(const SourcePagePtr& source, core::PageState new_state) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = bindings_.find(source->id());
    if (it == bindings_.end() || it->second.page != source) {
        return;
    }
    auto& binding = it->second;

    switch (new_state) {
        case core::PageState::LOADING:
        case core::PageState::UPDATING:
            for (auto& entry : binding.dependents) {
                std::lock_guard<std::mutex> page_lock(entry.second->mutex_);
                if (entry.second->computed_) {
                    entry.second->stale_ = true;
                }
            }
            break;
        case core::PageState::READY:
            recompute_locked(binding);
            break;
        case core::PageState::ERROR: {
            const std::string error = "Source page failed: " + source->last_error();
            for (auto& entry : binding.dependents) {
                const auto& page = entry.second;
                std::lock_guard<std::mutex> page_lock(page->mutex_);
                if (!page->params_valid_ || page->state_ == core::PageState::READY) {
                    continue;
                }
                page->last_error_ = error;
                transition_locked(page, core::PageState::ERROR);
            }
            break;
        }
        case core::PageState::EMPTY:
            break;
    }
}

void IndicatorPageManager::on_source_data(const SourcePagePtr& source) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = bindings_.find(source->id());
    if (it == bindings_.end() || it->second.page != source) {
        return;
    }
    recompute_locked(it->second);
}

void IndicatorPageManager::on_source_evicted(const std::string& source_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = bindings_.find(source_id);
    if (it == bindings_.end() || !it->second.page->is_evicted()) {
        return;
    }
    MDCACHE_DEBUG("Dropping {} indicator page(s) of evicted source {}", it->second.dependents.size(),
                  source_id);
    drop_dependents_locked(it->second);
    bindings_.erase(it);
}

void IndicatorPageManager::drop_dependents_locked(SourceBinding& binding) {
    for (auto& entry : binding.dependents) {
        const auto& page = entry.second;
        std::lock_guard<std::mutex> page_lock(page->mutex_);
        page->evicted_ = true;
        page->values_ = std::make_shared<const std::vector<double>>();
        page->timestamps_ = std::make_shared<const std::vector<core::Timestamp>>();
        event_log_->log_page_evicted(page->id(), core::DataKind::INDICATOR);
    }
    binding.dependents.clear();
}

void IndicatorPageManager::release_source_if_unused_locked(SourceBinding& binding) {
    if (!binding.registered) {
        return;
    }
    for (const auto& entry : binding.dependents) {
        std::lock_guard<std::mutex> page_lock(entry.second->mutex_);
        if (!entry.second->registrations_.empty()) {
            return;
        }
    }
    candles_->release(binding.page, std::static_pointer_cast<cache::PageListener<core::Candle>>(source_listener_));
    binding.registered = false;
}

void IndicatorPageManager::release(const IndicatorPagePtr& page, const IndicatorListenerPtr& listener) {
    if (!page || !listener) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = bindings_.find(page->key().source_id);
    if (it == bindings_.end()) {
        return;
    }
    auto dependent = it->second.dependents.find(page->key());
    if (dependent == it->second.dependents.end() || dependent->second != page) {
        return;
    }
    {
        std::lock_guard<std::mutex> page_lock(page->mutex_);
        auto& registrations = page->registrations_;
        auto reg = std::find_if(registrations.begin(), registrations.end(),
                                [&](const IndicatorPage::Registration& registration) {
                                    return registration.listener == listener;
                                });
        if (reg == registrations.end()) {
            return;
        }
        const std::string consumer = reg->consumer;
        registrations.erase(reg);
        event_log_->log_listener_removed(page->id(), core::DataKind::INDICATOR, consumer);
        if (registrations.empty()) {
            event_log_->log_page_released(page->id(), core::DataKind::INDICATOR, consumer);
        }
    }
    release_source_if_unused_locked(it->second);
}

void IndicatorPageManager::release(const IndicatorPagePtr& page, const std::string& consumer) {
    if (!page) {
        return;
    }
    const std::string label = consumer.empty() ? kAnonymousConsumer : consumer;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = bindings_.find(page->key().source_id);
    if (it == bindings_.end()) {
        return;
    }
    auto dependent = it->second.dependents.find(page->key());
    if (dependent == it->second.dependents.end() || dependent->second != page) {
        return;
    }
    {
        std::lock_guard<std::mutex> page_lock(page->mutex_);
        auto& registrations = page->registrations_;
        const size_t before = registrations.size();
        registrations.erase(std::remove_if(registrations.begin(), registrations.end(),
                                           [&](const IndicatorPage::Registration& registration) {
                                               return registration.consumer == label;
                                           }),
                            registrations.end());
        if (registrations.size() == before) {
            return;
        }
        if (registrations.empty()) {
            event_log_->log_page_released(page->id(), core::DataKind::INDICATOR, label);
        }
    }
    release_source_if_unused_locked(it->second);
}

void IndicatorPageManager::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : bindings_) {
        if (entry.second.registered) {
            candles_->release(entry.second.page,
                              std::static_pointer_cast<cache::PageListener<core::Candle>>(source_listener_));
        }
    }
    bindings_.clear();
}

std::vector<cache::PageInfo> IndicatorPageManager::active_pages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<cache::PageInfo> infos;
    for (const auto& binding : bindings_) {
        for (const auto& entry : binding.second.dependents) {
            infos.push_back(entry.second->info());
        }
    }
    return infos;
}

size_t IndicatorPageManager::active_page_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& binding : bindings_) {
        count += binding.second.dependents.size();
    }
    return count;
}

size_t IndicatorPageManager::source_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bindings_.size();
}

} // namespace indicators
} // namespace mdcache
