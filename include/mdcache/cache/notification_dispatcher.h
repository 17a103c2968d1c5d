#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

#include "mdcache/core/result.h"

namespace mdcache {
namespace cache {

struct NotificationStats {
    uint64_t enqueued = 0;
    uint64_t delivered = 0;
    uint64_t failed = 0;     // Callbacks that threw
    uint64_t pending = 0;
};

/**
 * @brief Serial delivery thread for listener callbacks
 *
 * Callbacks run one at a time in enqueue order, so notifications that a page
 * enqueues under its own lock reach listeners in the order the page changed.
 * Listeners must treat this thread as arbitrary and redispatch if they need
 * a particular thread. A throwing callback is logged and skipped.
 */
class NotificationDispatcher {
public:
    using Callback = std::function<void()>;

    NotificationDispatcher();
    ~NotificationDispatcher();

    NotificationDispatcher(const NotificationDispatcher&) = delete;
    NotificationDispatcher& operator=(const NotificationDispatcher&) = delete;

    core::Result<void> start();

    /**
     * @brief Deliver everything already queued, then stop the thread
     */
    core::Result<void> shutdown();

    /**
     * @return false if the dispatcher is not running; the callback is dropped
     */
    bool enqueue(Callback callback);

    /**
     * @brief Block until the queue is empty and no callback is running
     *
     * Must not be called from a callback.
     */
    core::Result<void> wait_idle(std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});

    bool is_running() const { return running_.load(); }

    /**
     * @brief True when called from the delivery thread
     */
    bool on_dispatch_thread() const;

    NotificationStats stats() const;

private:
    void run();

    std::atomic<bool> running_{false};
    bool stop_requested_{false};   // Guarded by mutex_
    bool busy_{false};             // Guarded by mutex_

    mutable std::mutex mutex_;
    std::condition_variable work_cond_;
    std::condition_variable idle_cond_;
    std::deque<Callback> queue_;
    std::thread thread_;

    std::atomic<uint64_t> enqueued_{0};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> failed_{0};
};

} // namespace cache
} // namespace mdcache
