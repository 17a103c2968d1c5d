#include "mdcache/cache/background_processor.h"
#include "mdcache/common/logger.h"
#include "mdcache/core/error.h"

namespace mdcache {
namespace cache {

BackgroundProcessor::BackgroundProcessor(const BackgroundProcessorConfig& config)
    : config_(config) {
}

BackgroundProcessor::~BackgroundProcessor() {
    if (initialized_.load()) {
        auto result = shutdown();
        if (!result.ok()) {
            MDCACHE_WARN("BackgroundProcessor shutdown failed: {}", result.error());
        }
    }
}

core::Result<void> BackgroundProcessor::initialize() {
    if (initialized_.load()) {
        return core::Result<void>::error("BackgroundProcessor already initialized",
                                         core::Error::Code::ALREADY_EXISTS);
    }

    if (config_.num_workers == 0) {
        return core::Result<void>::error("Invalid number of workers: 0",
                                         core::Error::Code::INVALID_ARGUMENT);
    }

    if (config_.max_queue_size == 0) {
        return core::Result<void>::error("Invalid max queue size: 0",
                                         core::Error::Code::INVALID_ARGUMENT);
    }

    shutdown_requested_.store(false);
    startWorkers();

    initialized_.store(true);
    return core::Result<void>();
}

core::Result<void> BackgroundProcessor::shutdown() {
    if (!initialized_.load() || shutdown_requested_.load()) {
        return core::Result<void>();
    }

    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        shutdown_requested_.store(true);
        dropped = task_queue_.size();
        task_queue_.clear();
    }
    queue_condition_.notify_all();
    if (dropped > 0) {
        MDCACHE_DEBUG("BackgroundProcessor dropped {} queued jobs on shutdown", dropped);
    }

    // Running jobs are allowed to finish within the shutdown timeout
    bool drained;
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        drained = tasks_finished_cond_.wait_for(lock, config_.shutdown_timeout,
                                                [this] { return active_tasks_ == 0; });
    }

    stopWorkers();
    initialized_.store(false);

    if (!drained) {
        return core::Result<void>::error("Timed out waiting for running tasks",
                                         core::Error::Code::TIMEOUT);
    }
    return core::Result<void>();
}

core::Result<void> BackgroundProcessor::submitFetchTask(FetchTask task) {
    if (shutdown_requested_.load()) {
        return core::Result<void>::error("BackgroundProcessor is shutting down",
                                         core::Error::Code::UNAVAILABLE);
    }

    if (!initialized_.load()) {
        return core::Result<void>::error("BackgroundProcessor not initialized",
                                         core::Error::Code::UNAVAILABLE);
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (task_queue_.size() >= config_.max_queue_size) {
            return core::Result<void>::error("Queue is full", core::Error::Code::RESOURCE_EXHAUSTED);
        }
        task_queue_.emplace_back(next_task_id_++, std::move(task));
    }

    queue_condition_.notify_one();
    return core::Result<void>();
}

core::Result<void> BackgroundProcessor::waitForCompletion(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    bool done = tasks_finished_cond_.wait_for(lock, timeout, [this] {
        return task_queue_.empty() && active_tasks_ == 0;
    });
    if (!done) {
        return core::Result<void>::error("Wait for completion timed out", core::Error::Code::TIMEOUT);
    }
    return core::Result<void>();
}

void BackgroundProcessor::workerThread() {
    FetchTask task;
    uint64_t task_id = 0;
    while (!shutdown_requested_.load()) {
        if (!getNextTask(task, task_id)) {
            continue;
        }
        processTask(task, task_id);
        task = nullptr;
    }
}

void BackgroundProcessor::processTask(FetchTask& task, uint64_t task_id) {
    try {
        auto result = task();
        if (!result.ok()) {
            MDCACHE_DEBUG("Background task {} failed: {}", task_id, result.error());
        }
    } catch (const std::exception& e) {
        MDCACHE_WARN("Background task {} threw: {}", task_id, e.what());
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        --active_tasks_;
    }
    tasks_finished_cond_.notify_all();
}

bool BackgroundProcessor::getNextTask(FetchTask& task, uint64_t& task_id) {
    std::unique_lock<std::mutex> lock(queue_mutex_);

    queue_condition_.wait_for(lock, config_.worker_wait_timeout, [this] {
        return !task_queue_.empty() || shutdown_requested_.load();
    });

    if (shutdown_requested_.load() || task_queue_.empty()) {
        return false;
    }

    task_id = task_queue_.front().first;
    task = std::move(task_queue_.front().second);
    task_queue_.pop_front();
    // Counted while still holding the lock so waitForCompletion never sees
    // an empty queue with the job in neither place
    ++active_tasks_;
    return true;
}

void BackgroundProcessor::startWorkers() {
    workers_.clear();
    workers_.reserve(config_.num_workers);

    for (uint32_t i = 0; i < config_.num_workers; ++i) {
        workers_.emplace_back(&BackgroundProcessor::workerThread, this);
    }
}

void BackgroundProcessor::stopWorkers() {
    queue_condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    workers_.clear();
}

} // namespace cache
} // namespace mdcache
