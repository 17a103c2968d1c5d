#include "mdcache/cache/page_manager.h"

#include <algorithm>

#include "mdcache/common/logger.h"
#include "mdcache/core/error.h"

namespace mdcache {
namespace cache {

namespace {

constexpr const char* kAnonymousConsumer = "anonymous";

BackgroundProcessorConfig make_processor_config(const core::PageManagerConfig& config) {
    BackgroundProcessorConfig processor_config;
    processor_config.num_workers = config.fetch_workers;
    processor_config.max_queue_size = config.max_queue_size;
    processor_config.shutdown_timeout = config.shutdown_timeout;
    processor_config.worker_wait_timeout = config.worker_wait_timeout;
    return processor_config;
}

std::string describe(const std::vector<core::TimeRange>& ranges) {
    std::string out;
    for (const auto& range : ranges) {
        if (!out.empty()) {
            out += ", ";
        }
        out += range.to_string();
    }
    return out;
}

std::chrono::milliseconds remaining_until(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return std::max(left, std::chrono::milliseconds{0});
}

} // namespace

template<typename R>
PageManager<R>::PageManager(core::DataKind kind,
                            BackendPtr backend,
                            std::shared_ptr<CoverageRegistry> coverage,
                            std::shared_ptr<DownloadEventLog> event_log,
                            std::shared_ptr<NotificationDispatcher> dispatcher,
                            const core::PageManagerConfig& config)
    : kind_(kind),
      backend_(std::move(backend)),
      coverage_(std::move(coverage)),
      event_log_(std::move(event_log)),
      dispatcher_(std::move(dispatcher)),
      config_(config) {
    if (!backend_ || !coverage_ || !event_log_ || !dispatcher_) {
        throw core::InvalidArgumentError(
            "PageManager requires a backend, coverage registry, event log and dispatcher");
    }
    auto valid = config_.validate();
    if (!valid.ok()) {
        throw core::InvalidArgumentError(valid.error());
    }
    processor_ = std::make_unique<BackgroundProcessor>(make_processor_config(config_));
}

template<typename R>
PageManager<R>::~PageManager() {
    if (running_.load()) {
        auto result = shutdown();
        if (!result.ok()) {
            MDCACHE_WARN("{} page manager shutdown failed: {}", core::to_string(kind_), result.error());
        }
    }
}

template<typename R>
core::Result<void> PageManager<R>::initialize() {
    if (running_.load()) {
        return core::Result<void>::error("Page manager already initialized",
                                         core::Error::Code::ALREADY_EXISTS);
    }
    auto result = processor_->initialize();
    if (!result.ok()) {
        return result;
    }
    running_.store(true);

    if (config_.enable_reaper) {
        {
            std::lock_guard<std::mutex> lock(reaper_mutex_);
            reaper_stop_ = false;
        }
        reaper_ = std::thread(&PageManager<R>::reaper_loop, this);
    }

    MDCACHE_INFO("{} page manager started: {} fetch workers, backend {}", core::to_string(kind_),
                 config_.fetch_workers, backend_->name());
    return core::Result<void>();
}

template<typename R>
core::Result<void> PageManager<R>::shutdown() {
    if (!running_.exchange(false)) {
        return core::Result<void>();
    }

    {
        std::lock_guard<std::mutex> lock(reaper_mutex_);
        reaper_stop_ = true;
    }
    reaper_cond_.notify_all();
    if (reaper_.joinable()) {
        reaper_.join();
    }

    auto drained = processor_->waitForCompletion(config_.shutdown_timeout);
    if (!drained.ok()) {
        MDCACHE_WARN("{} page manager stopping with fetches in flight: {}", core::to_string(kind_),
                     drained.error());
    }
    auto result = processor_->shutdown();

    MDCACHE_INFO("{} page manager stopped", core::to_string(kind_));
    return result;
}

template<typename R>
core::Result<typename PageManager<R>::PagePtr> PageManager<R>::request(const std::string& symbol,
                                                                     const std::string& sub_key,
                                                                     core::Timestamp start,
                                                                     core::Timestamp end,
                                                                     ListenerPtr listener,
                                                                     const std::string& consumer) {
    if (symbol.empty()) {
        return core::Result<PagePtr>::error("Symbol must not be empty",
                                            core::Error::Code::INVALID_ARGUMENT);
    }
    if (start >= end) {
        return core::Result<PagePtr>::error(
            "Invalid range " + core::TimeRange(start, end).to_string(),
            core::Error::Code::INVALID_ARGUMENT);
    }
    if (!running_.load()) {
        return core::Result<PagePtr>::error(
            std::string(core::to_string(kind_)) + " page manager is not running",
            core::Error::Code::UNAVAILABLE);
    }

    const std::string label = consumer.empty() ? kAnonymousConsumer : consumer;
    const core::TimeRange aligned =
        core::align_outward(core::TimeRange(start, end), config_.page_alignment);
    const core::SeriesKey series{kind_, symbol, sub_key};

    std::lock_guard<std::mutex> map_lock(map_mutex_);
    auto& series_pages = pages_[series];

    PagePtr page;
    bool extend = false;
    for (const auto& candidate : series_pages) {
        if (candidate->range() == aligned) {
            page = candidate;
            break;
        }
    }
    if (!page) {
        page = find_containing_locked(series, aligned);
    }
    if (!page) {
        for (const auto& candidate : series_pages) {
            if (candidate->range().touches(aligned)) {
                page = candidate;
                extend = true;
                break;
            }
        }
    }
    if (!page) {
        page = std::make_shared<Page<R>>(kind_, symbol, sub_key, aligned);
        series_pages.push_back(page);
        pages_created_.fetch_add(1);
        event_log_->log_page_created(page->id(), kind_, label);
        MDCACHE_INFO("Created page {} for {}", page->id(), label);
    }

    std::lock_guard<std::mutex> page_lock(page->mutex_);
    if (extend && !page->range_.contains(aligned)) {
        const core::TimeRange old_range = page->range_;
        page->range_ = page->range_.hull(aligned);
        MDCACHE_DEBUG("Extended page {} from {} to {}", page->id(), old_range.to_string(),
                      page->range_.to_string());
    }
    register_locked(page, listener, label);

    // A queued job plans when it starts and a running one re-plans before it
    // finishes, so either picks up the new range
    if (page->phase_ == Page<R>::FetchPhase::IDLE && !page->coverage_.gaps(page->range_).empty()) {
        dispatch_locked(page);
    }
    return page;
}

template<typename R>
void PageManager<R>::register_locked(const PagePtr& page, const ListenerPtr& listener,
                                     const std::string& consumer) {
    auto& registrations = page->registrations_;
    auto existing = std::find_if(registrations.begin(), registrations.end(),
                                 [&](const typename Page<R>::Registration& registration) {
                                     if (listener) {
                                         return registration.listener == listener;
                                     }
                                     return !registration.listener && registration.consumer == consumer;
                                 });
    if (existing != registrations.end()) {
        return;
    }

    registrations.push_back(typename Page<R>::Registration{listener, consumer});
    page->idle_ = false;

    if (!listener) {
        return;
    }
    event_log_->log_listener_added(page->id(), kind_, consumer);

    // Late joiner: replay the current state to this listener alone
    const core::PageState state = page->state_;
    if (state == core::PageState::EMPTY) {
        return;
    }
    const bool has_data = page->data_version_ > 0;
    PagePtr self = page;
    dispatcher_->enqueue([listener, self, state]() {
        listener->on_state_changed(self, core::PageState::EMPTY, state);
    });
    if (has_data) {
        dispatcher_->enqueue([listener, self]() { listener->on_data_changed(self); });
    }
}

template<typename R>
void PageManager<R>::transition_locked(const PagePtr& page, core::PageState new_state) {
    const core::PageState old_state = page->state_;
    if (old_state == new_state) {
        return;
    }
    page->state_ = new_state;
    MDCACHE_DEBUG("Page {}: {} -> {}", page->id(), core::to_string(old_state),
                  core::to_string(new_state));

    auto listeners = page->listeners_locked();
    if (listeners.empty()) {
        return;
    }
    PagePtr self = page;
    dispatcher_->enqueue([listeners, self, old_state, new_state]() {
        for (const auto& listener : listeners) {
            try {
                listener->on_state_changed(self, old_state, new_state);
            } catch (const std::exception& e) {
                MDCACHE_WARN("Listener on {} threw on state change: {}", self->id(), e.what());
            }
        }
    });
}

template<typename R>
void PageManager<R>::notify_data_locked(const PagePtr& page) {
    auto listeners = page->listeners_locked();
    if (listeners.empty()) {
        return;
    }
    PagePtr self = page;
    dispatcher_->enqueue([listeners, self]() {
        for (const auto& listener : listeners) {
            try {
                listener->on_data_changed(self);
            } catch (const std::exception& e) {
                MDCACHE_WARN("Listener on {} threw on data change: {}", self->id(), e.what());
            }
        }
    });
}

template<typename R>
void PageManager<R>::notify_progress_locked(const PagePtr& page) {
    const int progress = page->progress_;
    if (progress < 0) {
        if (page->notified_progress_ == -1) {
            return;
        }
    } else if (progress < page->notified_progress_ + config_.progress_step) {
        return;
    }
    page->notified_progress_ = progress;

    auto listeners = page->listeners_locked();
    if (listeners.empty()) {
        return;
    }
    PagePtr self = page;
    dispatcher_->enqueue([listeners, self, progress]() {
        for (const auto& listener : listeners) {
            try {
                listener->on_progress(self, progress);
            } catch (const std::exception& e) {
                MDCACHE_WARN("Listener on {} threw on progress: {}", self->id(), e.what());
            }
        }
    });
}

template<typename R>
void PageManager<R>::mark_idle_if_unused_locked(const PagePtr& page) {
    if (page->registrations_.empty()) {
        page->idle_ = true;
        page->idle_since_ = std::chrono::steady_clock::now();
    }
}

template<typename R>
void PageManager<R>::dispatch_locked(const PagePtr& page) {
    const core::PageState next = page->state_ == core::PageState::READY ? core::PageState::UPDATING
                                                                        : core::PageState::LOADING;
    page->phase_ = Page<R>::FetchPhase::QUEUED;
    page->last_error_.clear();
    page->retryable_ = false;
    page->failed_ranges_.clear();
    page->progress_ = 0;
    page->notified_progress_ = 0;
    transition_locked(page, next);

    const std::string message = "Fetch queued for " + page->range_.to_string();
    if (next == core::PageState::UPDATING) {
        event_log_->log_update_started(page->id(), kind_, message);
    } else {
        event_log_->log_load_started(page->id(), kind_, message);
    }
    fetch_jobs_dispatched_.fetch_add(1);

    PagePtr self = page;
    auto submitted = processor_->submitFetchTask([this, self]() { return run_fetch(self); });
    if (submitted.ok()) {
        MDCACHE_DEBUG("Dispatched fetch for page {}", page->id());
        return;
    }

    queue_rejections_.fetch_add(1);
    fetch_jobs_failed_.fetch_add(1);
    page->phase_ = Page<R>::FetchPhase::IDLE;
    page->refresh_pending_ = false;
    page->last_error_ = "Fetch not scheduled: " + submitted.error();
    page->retryable_ = submitted.retryable();
    page->failed_ranges_ = RangeSet(page->coverage_.gaps(page->range_));
    transition_locked(page, core::PageState::ERROR);
    event_log_->log_error(page->id(), kind_, page->last_error_);
    MDCACHE_WARN("Page {}: {}", page->id(), page->last_error_);
    mark_idle_if_unused_locked(page);
}

template<typename R>
std::vector<core::TimeRange> PageManager<R>::plan_chunks(const std::vector<core::TimeRange>& gaps) const {
    std::vector<core::TimeRange> chunks;
    const core::Duration step = config_.chunk_duration;
    for (const auto& gap : gaps) {
        core::Timestamp cursor = gap.start;
        while (cursor < gap.end) {
            // Chunk boundaries sit on the chunk grid so re-fetches line up
            const core::Timestamp boundary = core::align_down(cursor, step) + step;
            const core::Timestamp chunk_end = std::min(boundary, gap.end);
            chunks.emplace_back(cursor, chunk_end);
            cursor = chunk_end;
        }
    }
    return chunks;
}

template<typename R>
core::Result<std::vector<R>> PageManager<R>::fetch_chunk(const FetchRequest& request) {
    try {
        return backend_->fetch(request);
    } catch (const core::Error& e) {
        return core::Result<std::vector<R>>(e);
    } catch (const std::exception& e) {
        return core::Result<std::vector<R>>::error(
            std::string("Backend ") + backend_->name() + " threw: " + e.what(),
            core::Error::Code::INTERNAL);
    }
}

template<typename R>
core::Result<void> PageManager<R>::run_fetch(const PagePtr& page) {
    FetchJob job;
    job.started = std::chrono::steady_clock::now();
    const auto interval = core::expected_record_interval(kind_, page->sub_key());
    if (interval && *interval > 0) {
        job.interval = *interval;
        job.expected = 0;
    }

    std::vector<core::TimeRange> gaps;
    {
        std::lock_guard<std::mutex> lock(page->mutex_);
        page->phase_ = Page<R>::FetchPhase::RUNNING;
        job.refresh = page->refresh_pending_;
        page->refresh_pending_ = false;
        job.operation = page->state_;
        gaps = job.refresh ? std::vector<core::TimeRange>{page->range_}
                           : page->coverage_.gaps(page->range_);
        page->failed_ranges_.clear();
        page->progress_ = job.expected < 0 ? -1 : 0;
        notify_progress_locked(page);
    }

    auto index = coverage_->get_or_create(core::SeriesKey{kind_, page->symbol(), page->sub_key()});

    std::string error_message;
    while (true) {
        fetch_round(page, *index, gaps, job);
        job.refresh = false;

        // Re-plan and finish under one lock, so a request that grows the
        // range either lands in the next round or sees the job finished
        std::lock_guard<std::mutex> lock(page->mutex_);
        gaps = remaining_gaps_locked(page);
        if (!gaps.empty()) {
            MDCACHE_DEBUG("Page {} grew while fetching, continuing with {}", page->id(), describe(gaps));
            continue;
        }
        error_message = finish_job_locked(page, job);
        break;
    }

    if (job.failed == 0) {
        fetch_jobs_completed_.fetch_add(1);
        MDCACHE_DEBUG("Page {} fetched {} record(s) in {} chunk(s)", page->id(), job.fetched, job.chunks);
        return core::Result<void>();
    }
    fetch_jobs_failed_.fetch_add(1);
    return core::Result<void>::error(error_message, job.first_code);
}

template<typename R>
std::vector<core::TimeRange> PageManager<R>::copy_from_siblings(const PagePtr& page,
                                                                const CoverageIndex& index,
                                                                const std::vector<core::TimeRange>& gaps,
                                                                FetchJob& job) {
    // Only what the index knows as FULL can be held by another page
    RangeSet known;
    for (const auto& gap : gaps) {
        RangeSet full(std::vector<core::TimeRange>{gap});
        for (const auto& missing : index.query_gaps(gap)) {
            full.subtract(missing);
        }
        known.add(full);
    }
    if (known.empty()) {
        return gaps;
    }

    std::vector<PagePtr> siblings;
    {
        std::lock_guard<std::mutex> map_lock(map_mutex_);
        auto it = pages_.find(core::SeriesKey{kind_, page->symbol(), page->sub_key()});
        if (it != pages_.end()) {
            for (const auto& candidate : it->second) {
                if (candidate != page) {
                    siblings.push_back(candidate);
                }
            }
        }
    }

    RangeSet copied;
    for (const auto& sibling : siblings) {
        RangeSet held;
        typename Page<R>::RecordsPtr records;
        {
            std::lock_guard<std::mutex> lock(sibling->mutex_);
            for (const auto& range : known.ranges()) {
                held.add(sibling->coverage_.intersect(range));
            }
            records = sibling->records_;
        }
        if (held.empty()) {
            continue;
        }

        std::vector<R> subset;
        for (const auto& record : *records) {
            for (const auto& range : held.ranges()) {
                if (range.contains(record.timestamp())) {
                    subset.push_back(record);
                    break;
                }
            }
        }
        for (const auto& range : held.ranges()) {
            known.subtract(range);
        }
        copied.add(held);
        records_copied_.fetch_add(subset.size());
        MDCACHE_DEBUG("Page {} copied {} record(s) for {} from page {}", page->id(), subset.size(),
                      describe(held.ranges()), sibling->id());

        std::lock_guard<std::mutex> lock(page->mutex_);
        if (!subset.empty()) {
            page->records_ = std::make_shared<const std::vector<R>>(
                merge_records(*page->records_, std::move(subset)));
            job.data_merged = true;
        }
        page->coverage_.add(held);
        if (known.empty()) {
            break;
        }
    }

    // Split what is left at FULL boundaries so each chunk carries one hint
    std::vector<core::TimeRange> remaining;
    for (const auto& gap : gaps) {
        for (const auto& piece : copied.gaps(gap)) {
            RangeSet unknown(std::vector<core::TimeRange>{piece});
            for (const auto& range : known.ranges()) {
                unknown.subtract(range);
            }
            const auto full = known.intersect(piece).ranges();
            remaining.insert(remaining.end(), full.begin(), full.end());
            remaining.insert(remaining.end(), unknown.ranges().begin(), unknown.ranges().end());
        }
    }
    std::sort(remaining.begin(), remaining.end(),
              [](const core::TimeRange& a, const core::TimeRange& b) { return a.start < b.start; });
    return remaining;
}

template<typename R>
void PageManager<R>::fetch_round(const PagePtr& page, CoverageIndex& index,
                                 const std::vector<core::TimeRange>& gaps, FetchJob& job) {
    // A refresh resyncs from the backend, never from another page
    const auto to_fetch = job.refresh ? gaps : copy_from_siblings(page, index, gaps, job);
    const auto chunks = plan_chunks(to_fetch);
    job.chunks += chunks.size();

    if (job.interval > 0) {
        for (const auto& chunk : chunks) {
            job.expected += (chunk.duration() + job.interval - 1) / job.interval;
        }
    }

    if (!chunks.empty()) {
        MDCACHE_DEBUG("Fetching {} chunk(s) for page {} via {}: {}", chunks.size(), page->id(),
                      backend_->name(), describe(to_fetch));
    }

    for (const auto& chunk : chunks) {
        FetchRequest request;
        request.symbol = page->symbol();
        request.sub_key = page->sub_key();
        request.range = chunk;
        request.known_level = index.level_of(chunk);
        request.refresh = job.refresh;

        auto result = fetch_chunk(request);
        if (!result.ok()) {
            ++job.failed;
            chunks_failed_.fetch_add(1);
            job.all_retryable = job.all_retryable && result.retryable();
            if (job.first_error.empty()) {
                job.first_error = result.error();
                job.first_code = result.code();
            }
            MDCACHE_WARN("{} fetch of {} {} {} via {} failed ({}): {}", core::to_string(kind_),
                         page->symbol(), page->sub_key(), chunk.to_string(), backend_->name(),
                         core::to_string(result.code()), result.error());
            std::lock_guard<std::mutex> lock(page->mutex_);
            page->failed_ranges_.add(chunk);
            continue;
        }

        std::vector<R> records = result.take_value();
        records.erase(std::remove_if(records.begin(), records.end(),
                                     [&chunk](const R& record) {
                                         return !chunk.contains(record.timestamp());
                                     }),
                      records.end());
        const size_t count = records.size();
        job.fetched += count;
        chunks_fetched_.fetch_add(1);
        records_fetched_.fetch_add(count);

        {
            std::lock_guard<std::mutex> lock(page->mutex_);
            if (!records.empty()) {
                page->records_ = std::make_shared<const std::vector<R>>(
                    merge_records(*page->records_, std::move(records)));
                job.data_merged = true;
            }
            page->coverage_.add(chunk);
            if (job.expected > 0) {
                page->progress_ = static_cast<int>(
                    std::min<int64_t>(99, static_cast<int64_t>(job.fetched) * 100 / job.expected));
                notify_progress_locked(page);
            }
        }
        index.merge(chunk, CoverageLevel::FULL);
    }
}

template<typename R>
std::vector<core::TimeRange> PageManager<R>::remaining_gaps_locked(const PagePtr& page) const {
    RangeSet remaining(page->coverage_.gaps(page->range_));
    for (const auto& failed : page->failed_ranges_.ranges()) {
        remaining.subtract(failed);
    }
    return remaining.ranges();
}

template<typename R>
std::string PageManager<R>::finish_job_locked(const PagePtr& page, const FetchJob& job) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::steady_clock::now() - job.started)
                             .count();
    page->phase_ = Page<R>::FetchPhase::IDLE;
    if (job.data_merged) {
        page->data_version_++;
    }
    if (job.failed < job.chunks || job.chunks == 0) {
        page->last_sync_time_ = core::now_ms();
    }

    std::string error_message;
    if (job.failed == 0) {
        page->progress_ = 100;
        transition_locked(page, core::PageState::READY);
        if (job.operation == core::PageState::UPDATING) {
            event_log_->log_update_completed(page->id(), kind_, elapsed, page->records_->size());
        } else {
            event_log_->log_load_completed(page->id(), kind_, elapsed, page->records_->size());
        }
    } else {
        error_message = job.failed == job.chunks
                            ? job.first_error
                            : std::to_string(job.failed) + " of " + std::to_string(job.chunks) +
                                  " chunk(s) failed: " + job.first_error;
        page->last_error_ = error_message;
        page->retryable_ = job.all_retryable;
        transition_locked(page, core::PageState::ERROR);
        event_log_->log_error(page->id(), kind_,
                              error_message + " (failed: " + describe(page->failed_ranges_.ranges()) + ")");
    }
    if (job.data_merged) {
        notify_data_locked(page);
    }

    // A refresh asked for while this job was running gets a job of its own
    if (page->refresh_pending_) {
        dispatch_locked(page);
    } else {
        mark_idle_if_unused_locked(page);
    }
    return error_message;
}

template<typename R>
void PageManager<R>::release(const PagePtr& page, const ListenerPtr& listener) {
    if (!page || !listener) {
        return;
    }
    std::lock_guard<std::mutex> map_lock(map_mutex_);
    if (!owns_locked(page)) {
        return;
    }
    std::lock_guard<std::mutex> page_lock(page->mutex_);
    auto& registrations = page->registrations_;
    auto it = std::find_if(registrations.begin(), registrations.end(),
                           [&](const typename Page<R>::Registration& registration) {
                               return registration.listener == listener;
                           });
    if (it == registrations.end()) {
        return;
    }
    const std::string consumer = it->consumer;
    registrations.erase(it);
    event_log_->log_listener_removed(page->id(), kind_, consumer);

    if (registrations.empty()) {
        event_log_->log_page_released(page->id(), kind_, consumer);
        mark_idle_if_unused_locked(page);
        MDCACHE_DEBUG("Page {} has no consumers left", page->id());
    }
}

template<typename R>
void PageManager<R>::release(const PagePtr& page, const std::string& consumer) {
    if (!page) {
        return;
    }
    const std::string label = consumer.empty() ? kAnonymousConsumer : consumer;
    std::lock_guard<std::mutex> map_lock(map_mutex_);
    if (!owns_locked(page)) {
        return;
    }
    std::lock_guard<std::mutex> page_lock(page->mutex_);
    auto& registrations = page->registrations_;
    const size_t before = registrations.size();
    for (auto it = registrations.begin(); it != registrations.end();) {
        if (it->consumer != label) {
            ++it;
            continue;
        }
        if (it->listener) {
            event_log_->log_listener_removed(page->id(), kind_, label);
        }
        it = registrations.erase(it);
    }
    if (registrations.size() == before) {
        return;
    }
    if (registrations.empty()) {
        event_log_->log_page_released(page->id(), kind_, label);
        mark_idle_if_unused_locked(page);
        MDCACHE_DEBUG("Page {} has no consumers left", page->id());
    }
}

template<typename R>
typename PageManager<R>::PagePtr PageManager<R>::peek(const std::string& symbol,
                                                      const std::string& sub_key,
                                                      core::Timestamp start,
                                                      core::Timestamp end) const {
    if (start >= end) {
        return nullptr;
    }
    const core::TimeRange aligned =
        core::align_outward(core::TimeRange(start, end), config_.page_alignment);
    std::lock_guard<std::mutex> map_lock(map_mutex_);
    return find_containing_locked(core::SeriesKey{kind_, symbol, sub_key}, aligned);
}

template<typename R>
bool PageManager<R>::refresh(const PagePtr& page) {
    if (!page || !running_.load()) {
        return false;
    }
    std::lock_guard<std::mutex> map_lock(map_mutex_);
    if (!owns_locked(page)) {
        return false;
    }
    std::lock_guard<std::mutex> page_lock(page->mutex_);
    page->refresh_pending_ = true;
    switch (page->phase_) {
        case Page<R>::FetchPhase::IDLE:
            dispatch_locked(page);
            return page->phase_ == Page<R>::FetchPhase::QUEUED;
        case Page<R>::FetchPhase::QUEUED:
        case Page<R>::FetchPhase::RUNNING:
            // Picked up when the job starts, or by a new job after it finishes
            return true;
    }
    return false;
}

template<typename R>
bool PageManager<R>::retry(const PagePtr& page) {
    if (!page || !running_.load()) {
        return false;
    }
    std::lock_guard<std::mutex> map_lock(map_mutex_);
    if (!owns_locked(page)) {
        return false;
    }
    std::lock_guard<std::mutex> page_lock(page->mutex_);
    if (page->state_ != core::PageState::ERROR || page->phase_ != Page<R>::FetchPhase::IDLE) {
        return false;
    }
    MDCACHE_INFO("Retrying page {}: {}", page->id(), describe(page->failed_ranges_.ranges()));
    dispatch_locked(page);
    return page->phase_ == Page<R>::FetchPhase::QUEUED;
}

template<typename R>
size_t PageManager<R>::evict_idle_pages() {
    const auto now = std::chrono::steady_clock::now();
    std::vector<std::pair<PageKey, std::string>> evicted;
    {
        std::lock_guard<std::mutex> map_lock(map_mutex_);
        for (auto it = pages_.begin(); it != pages_.end();) {
            auto& series_pages = it->second;
            for (auto pit = series_pages.begin(); pit != series_pages.end();) {
                PagePtr page = *pit;
                std::lock_guard<std::mutex> page_lock(page->mutex_);
                const bool expired = page->registrations_.empty() && page->idle_ &&
                                     page->phase_ == Page<R>::FetchPhase::IDLE &&
                                     now - page->idle_since_ >= config_.eviction_grace;
                if (!expired) {
                    ++pit;
                    continue;
                }
                // Coverage knowledge stays in the coverage index
                page->evicted_ = true;
                page->records_ = std::make_shared<const std::vector<R>>();
                page->coverage_.clear();
                evicted.emplace_back(page->key_locked(), page->id());
                pit = series_pages.erase(pit);
            }
            if (series_pages.empty()) {
                it = pages_.erase(it);
            } else {
                ++it;
            }
        }
    }

    if (evicted.empty()) {
        return 0;
    }

    std::vector<EvictionCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        for (const auto& entry : eviction_callbacks_) {
            callbacks.push_back(entry.second);
        }
    }
    for (const auto& [key, id] : evicted) {
        pages_evicted_.fetch_add(1);
        event_log_->log_page_evicted(id, kind_);
        MDCACHE_INFO("Evicted page {}", id);
        for (const auto& callback : callbacks) {
            try {
                callback(key, id);
            } catch (const std::exception& e) {
                MDCACHE_WARN("Eviction callback for {} threw: {}", id, e.what());
            }
        }
    }
    return evicted.size();
}

template<typename R>
uint64_t PageManager<R>::add_eviction_callback(EvictionCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    const uint64_t id = next_callback_id_++;
    eviction_callbacks_.emplace(id, std::move(callback));
    return id;
}

template<typename R>
void PageManager<R>::remove_eviction_callback(uint64_t id) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    eviction_callbacks_.erase(id);
}

template<typename R>
std::vector<typename PageManager<R>::PagePtr> PageManager<R>::all_pages() const {
    std::lock_guard<std::mutex> map_lock(map_mutex_);
    std::vector<PagePtr> pages;
    for (const auto& entry : pages_) {
        pages.insert(pages.end(), entry.second.begin(), entry.second.end());
    }
    return pages;
}

template<typename R>
bool PageManager<R>::owns_locked(const PagePtr& page) const {
    auto it = pages_.find(core::SeriesKey{kind_, page->symbol(), page->sub_key()});
    if (it == pages_.end()) {
        return false;
    }
    return std::find(it->second.begin(), it->second.end(), page) != it->second.end();
}

template<typename R>
typename PageManager<R>::PagePtr PageManager<R>::find_containing_locked(const core::SeriesKey& series,
                                                                        const core::TimeRange& range) const {
    auto it = pages_.find(series);
    if (it == pages_.end()) {
        return nullptr;
    }
    PagePtr best;
    core::Duration best_duration = 0;
    for (const auto& candidate : it->second) {
        const core::TimeRange candidate_range = candidate->range();
        if (!candidate_range.contains(range)) {
            continue;
        }
        if (!best || candidate_range.duration() < best_duration) {
            best = candidate;
            best_duration = candidate_range.duration();
        }
    }
    return best;
}

template<typename R>
std::vector<PageInfo> PageManager<R>::active_pages() const {
    std::vector<PageInfo> infos;
    for (const auto& page : all_pages()) {
        infos.push_back(page->info());
    }
    std::sort(infos.begin(), infos.end(),
              [](const PageInfo& a, const PageInfo& b) { return a.id < b.id; });
    return infos;
}

template<typename R>
size_t PageManager<R>::active_page_count() const {
    std::lock_guard<std::mutex> map_lock(map_mutex_);
    size_t count = 0;
    for (const auto& entry : pages_) {
        count += entry.second.size();
    }
    return count;
}

template<typename R>
size_t PageManager<R>::total_record_count() const {
    size_t total = 0;
    for (const auto& page : all_pages()) {
        total += page->record_count();
    }
    return total;
}

template<typename R>
size_t PageManager<R>::estimate_memory_bytes() const {
    return total_record_count() * sizeof(R);
}

template<typename R>
PageManagerStats PageManager<R>::stats() const {
    PageManagerStats snap;
    snap.fetch_jobs_dispatched = fetch_jobs_dispatched_.load();
    snap.fetch_jobs_completed = fetch_jobs_completed_.load();
    snap.fetch_jobs_failed = fetch_jobs_failed_.load();
    snap.chunks_fetched = chunks_fetched_.load();
    snap.chunks_failed = chunks_failed_.load();
    snap.records_fetched = records_fetched_.load();
    snap.records_copied = records_copied_.load();
    snap.pages_created = pages_created_.load();
    snap.pages_evicted = pages_evicted_.load();
    snap.queue_rejections = queue_rejections_.load();
    snap.active_pages = active_page_count();
    snap.total_records = total_record_count();
    snap.estimated_memory_bytes = snap.total_records * sizeof(R);
    return snap;
}

template<typename R>
core::Result<void> PageManager<R>::wait_for_idle(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto fetches = processor_->waitForCompletion(remaining_until(deadline));
        if (!fetches.ok()) {
            return fetches;
        }
        auto notifications = dispatcher_->wait_idle(remaining_until(deadline));
        if (!notifications.ok()) {
            return notifications;
        }
        // A listener may have issued new requests while notifications drained
        auto settled = processor_->waitForCompletion(std::chrono::milliseconds{0});
        if (settled.ok()) {
            return core::Result<void>();
        }
    }
}

template<typename R>
void PageManager<R>::reaper_loop() {
    std::unique_lock<std::mutex> lock(reaper_mutex_);
    while (!reaper_stop_) {
        reaper_cond_.wait_for(lock, config_.reaper_interval, [this] { return reaper_stop_; });
        if (reaper_stop_) {
            break;
        }
        lock.unlock();
        evict_idle_pages();
        lock.lock();
    }
}

template class PageManager<core::Candle>;
template class PageManager<core::FundingRate>;
template class PageManager<core::OpenInterest>;
template class PageManager<core::AggTrade>;
template class PageManager<core::PremiumIndex>;

} // namespace cache
} // namespace mdcache
