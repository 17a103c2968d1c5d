#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "mdcache/cache/notification_dispatcher.h"

using namespace mdcache::cache;
using mdcache::core::Error;

namespace {

class NotificationDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_TRUE(dispatcher_.start().ok()); }
    void TearDown() override { dispatcher_.shutdown(); }

    NotificationDispatcher dispatcher_;
};

TEST_F(NotificationDispatcherTest, DeliversInEnqueueOrder) {
    std::vector<int> delivered;
    std::mutex mutex;
    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(dispatcher_.enqueue([&delivered, &mutex, i] {
            std::lock_guard<std::mutex> lock(mutex);
            delivered.push_back(i);
        }));
    }
    ASSERT_TRUE(dispatcher_.wait_idle().ok());

    ASSERT_EQ(delivered.size(), 100u);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(delivered[i], i);
    }
}

TEST_F(NotificationDispatcherTest, AllCallbacksRunOnOneThread) {
    std::vector<std::thread::id> threads;
    std::mutex mutex;
    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&] {
            for (int i = 0; i < 25; ++i) {
                dispatcher_.enqueue([&] {
                    std::lock_guard<std::mutex> lock(mutex);
                    threads.push_back(std::this_thread::get_id());
                });
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }
    ASSERT_TRUE(dispatcher_.wait_idle().ok());

    ASSERT_EQ(threads.size(), 100u);
    for (const auto& id : threads) {
        EXPECT_EQ(id, threads.front());
        EXPECT_NE(id, std::this_thread::get_id());
    }
}

TEST_F(NotificationDispatcherTest, ThrowingCallbackDoesNotStopDelivery) {
    std::atomic<int> delivered{0};
    dispatcher_.enqueue([] { throw std::runtime_error("listener bug"); });
    dispatcher_.enqueue([&] { delivered.fetch_add(1); });
    ASSERT_TRUE(dispatcher_.wait_idle().ok());

    EXPECT_EQ(delivered.load(), 1);
    auto stats = dispatcher_.stats();
    EXPECT_EQ(stats.enqueued, 2u);
    EXPECT_EQ(stats.delivered, 2u);
    EXPECT_EQ(stats.failed, 1u);
    EXPECT_EQ(stats.pending, 0u);
}

TEST_F(NotificationDispatcherTest, WaitIdleFromDispatchThreadIsRejected) {
    std::atomic<bool> rejected{false};
    std::atomic<bool> on_thread{false};
    dispatcher_.enqueue([&] {
        on_thread.store(dispatcher_.on_dispatch_thread());
        auto result = dispatcher_.wait_idle(std::chrono::milliseconds(10));
        rejected.store(!result.ok() && result.code() == Error::Code::INVALID_ARGUMENT);
    });
    ASSERT_TRUE(dispatcher_.wait_idle().ok());
    EXPECT_TRUE(on_thread.load());
    EXPECT_TRUE(rejected.load());
    EXPECT_FALSE(dispatcher_.on_dispatch_thread());
}

TEST_F(NotificationDispatcherTest, WaitIdleTimesOutWhileBusy) {
    std::atomic<bool> release{false};
    dispatcher_.enqueue([&] {
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
    });
    auto result = dispatcher_.wait_idle(std::chrono::milliseconds(20));
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.code(), Error::Code::TIMEOUT);
    release.store(true);
    EXPECT_TRUE(dispatcher_.wait_idle().ok());
}

TEST_F(NotificationDispatcherTest, ShutdownDrainsQueue) {
    std::atomic<int> delivered{0};
    for (int i = 0; i < 50; ++i) {
        dispatcher_.enqueue([&] { delivered.fetch_add(1); });
    }
    ASSERT_TRUE(dispatcher_.shutdown().ok());
    EXPECT_EQ(delivered.load(), 50);
    EXPECT_FALSE(dispatcher_.is_running());
    EXPECT_FALSE(dispatcher_.enqueue([] {}));
}

TEST(NotificationDispatcherLifecycleTest, DoubleStartFails) {
    NotificationDispatcher dispatcher;
    ASSERT_TRUE(dispatcher.start().ok());
    auto again = dispatcher.start();
    EXPECT_FALSE(again.ok());
    EXPECT_EQ(again.code(), Error::Code::ALREADY_EXISTS);
    EXPECT_TRUE(dispatcher.shutdown().ok());
    EXPECT_TRUE(dispatcher.shutdown().ok());
}

TEST(NotificationDispatcherLifecycleTest, EnqueueBeforeStartIsRefused) {
    NotificationDispatcher dispatcher;
    EXPECT_FALSE(dispatcher.enqueue([] {}));
}

} // namespace
