#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "mdcache/core/result.h"

namespace mdcache {
namespace cache {

/**
 * @brief Background processor configuration
 */
struct BackgroundProcessorConfig {
    uint32_t num_workers = 2;
    uint32_t max_queue_size = 256;
    std::chrono::milliseconds shutdown_timeout{5000};
    std::chrono::milliseconds worker_wait_timeout{100};  // 100ms for worker polling

    BackgroundProcessorConfig() = default;
};

/**
 * @brief Bounded worker pool for page fetch jobs
 *
 * Each page manager owns one processor. Jobs run in submission order and
 * submission is rejected with RESOURCE_EXHAUSTED once the queue is full, so
 * request() never blocks on a saturated pool.
 */
class BackgroundProcessor {
public:
    using FetchTask = std::function<core::Result<void>()>;

    explicit BackgroundProcessor(const BackgroundProcessorConfig& config = BackgroundProcessorConfig{});
    ~BackgroundProcessor();

    // Disable copy
    BackgroundProcessor(const BackgroundProcessor&) = delete;
    BackgroundProcessor& operator=(const BackgroundProcessor&) = delete;

    // Disable move
    BackgroundProcessor(BackgroundProcessor&&) = delete;
    BackgroundProcessor& operator=(BackgroundProcessor&&) = delete;

    /**
     * @brief Start the worker threads
     * @return Result indicating success or failure
     */
    core::Result<void> initialize();

    /**
     * @brief Stop the workers once running jobs finish
     *
     * Jobs still queued when shutdown is requested are dropped.
     * @return Result indicating success or TIMEOUT
     */
    core::Result<void> shutdown();

    /**
     * @brief Queue a fetch job behind those already submitted
     * @param task Fetch function
     * @return Result indicating success, UNAVAILABLE, or RESOURCE_EXHAUSTED
     */
    core::Result<void> submitFetchTask(FetchTask task);

    /**
     * @brief Wait for all pending jobs to complete
     * @param timeout Maximum time to wait
     * @return Result indicating success or TIMEOUT
     */
    core::Result<void> waitForCompletion(std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});

private:
    void workerThread();

    void processTask(FetchTask& task, uint64_t task_id);

    /**
     * @brief Pop the oldest job, waiting up to worker_wait_timeout
     * @return false if no job was taken
     */
    bool getNextTask(FetchTask& task, uint64_t& task_id);

    void startWorkers();

    void stopWorkers();

    BackgroundProcessorConfig config_;

    std::atomic<bool> initialized_{false};
    std::atomic<bool> shutdown_requested_{false};

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_condition_;
    std::condition_variable tasks_finished_cond_;
    uint32_t active_tasks_{0};  // Guarded by queue_mutex_
    uint64_t next_task_id_{1};  // Guarded by queue_mutex_
    std::deque<std::pair<uint64_t, FetchTask>> task_queue_;

    std::vector<std::thread> workers_;
};

} // namespace cache
} // namespace mdcache
