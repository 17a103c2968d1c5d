#include "mdcache/cache/notification_dispatcher.h"

#include "mdcache/common/logger.h"

namespace mdcache {
namespace cache {

NotificationDispatcher::NotificationDispatcher() = default;

NotificationDispatcher::~NotificationDispatcher() {
    if (running_.load()) {
        auto result = shutdown();
        if (!result.ok()) {
            MDCACHE_WARN("NotificationDispatcher shutdown failed: {}", result.error());
        }
    }
}

core::Result<void> NotificationDispatcher::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_.load()) {
        return core::Result<void>::error("NotificationDispatcher already running",
                                         core::Error::Code::ALREADY_EXISTS);
    }
    stop_requested_ = false;
    running_.store(true);
    thread_ = std::thread(&NotificationDispatcher::run, this);
    return core::Result<void>();
}

core::Result<void> NotificationDispatcher::shutdown() {
    if (on_dispatch_thread()) {
        return core::Result<void>::error("NotificationDispatcher cannot stop itself",
                                         core::Error::Code::INVALID_ARGUMENT);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load()) {
            return core::Result<void>();
        }
        stop_requested_ = true;
    }
    work_cond_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    running_.store(false);
    return core::Result<void>();
}

bool NotificationDispatcher::enqueue(Callback callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load() || stop_requested_) {
            return false;
        }
        queue_.push_back(std::move(callback));
    }
    enqueued_.fetch_add(1);
    work_cond_.notify_one();
    return true;
}

core::Result<void> NotificationDispatcher::wait_idle(std::chrono::milliseconds timeout) {
    if (on_dispatch_thread()) {
        return core::Result<void>::error("wait_idle called from the dispatch thread",
                                         core::Error::Code::INVALID_ARGUMENT);
    }
    std::unique_lock<std::mutex> lock(mutex_);
    bool idle = idle_cond_.wait_for(lock, timeout, [this] { return queue_.empty() && !busy_; });
    if (!idle) {
        return core::Result<void>::error("Timed out waiting for notifications",
                                         core::Error::Code::TIMEOUT);
    }
    return core::Result<void>();
}

bool NotificationDispatcher::on_dispatch_thread() const {
    return std::this_thread::get_id() == thread_.get_id();
}

NotificationStats NotificationDispatcher::stats() const {
    NotificationStats snap;
    snap.enqueued = enqueued_.load();
    snap.delivered = delivered_.load();
    snap.failed = failed_.load();
    std::lock_guard<std::mutex> lock(mutex_);
    snap.pending = queue_.size();
    return snap;
}

void NotificationDispatcher::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        work_cond_.wait(lock, [this] { return stop_requested_ || !queue_.empty(); });
        if (queue_.empty()) {
            // Stop requested and everything delivered
            break;
        }

        Callback callback = std::move(queue_.front());
        queue_.pop_front();
        busy_ = true;
        lock.unlock();

        try {
            callback();
        } catch (const std::exception& e) {
            failed_.fetch_add(1);
            MDCACHE_WARN("Listener callback threw: {}", e.what());
        }
        delivered_.fetch_add(1);

        lock.lock();
        busy_ = false;
        if (queue_.empty()) {
            idle_cond_.notify_all();
        }
    }
    idle_cond_.notify_all();
}

} // namespace cache
} // namespace mdcache
