// MediaRelay - WebRTC SFU Signaling Server
// Tests for Linux Thread PAL Implementation

#include <gtest/gtest.h>
#include "mediarelay/pal/thread_pal.hpp"
#include "mediarelay/pal/linux/linux_thread_pal.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace mediarelay {
namespace pal {
namespace test {

class LinuxThreadPALTest : public ::testing::Test {
protected:
    void SetUp() override {
        threadPal_ = std::make_unique<linux::LinuxThreadPAL>();
    }

    void TearDown() override {
        threadPal_.reset();
    }

    std::unique_ptr<linux::LinuxThreadPAL> threadPal_;
};

TEST_F(LinuxThreadPALTest, ImplementsIThreadPALInterface) {
    IThreadPAL* interface = threadPal_.get();
    EXPECT_NE(interface, nullptr);
}

// =============================================================================
// Pool Creation
// =============================================================================

TEST_F(LinuxThreadPALTest, CreateThreadPoolReturnsValidHandle) {
    ThreadPoolOptions options;
    options.name = "test-pool";

    auto result = threadPal_->createThreadPool(2, options);

    ASSERT_TRUE(result.isSuccess());
    EXPECT_NE(result.value(), INVALID_THREAD_POOL_HANDLE);

    EXPECT_TRUE(threadPal_->destroyThreadPool(result.value()).isSuccess());
}

TEST_F(LinuxThreadPALTest, CreateThreadPoolWithZeroThreadsFails) {
    auto result = threadPal_->createThreadPool(0, ThreadPoolOptions{});

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ThreadErrorCode::PoolCreationFailed);
}

TEST_F(LinuxThreadPALTest, PoolHandlesAreDistinct) {
    auto first = threadPal_->createThreadPool(1, ThreadPoolOptions{});
    auto second = threadPal_->createThreadPool(1, ThreadPoolOptions{});
    ASSERT_TRUE(first.isSuccess());
    ASSERT_TRUE(second.isSuccess());

    EXPECT_NE(first.value(), second.value());
}

// =============================================================================
// Work Submission
// =============================================================================

TEST_F(LinuxThreadPALTest, SubmittedWorkRuns) {
    auto pool = threadPal_->createThreadPool(2, ThreadPoolOptions{});
    ASSERT_TRUE(pool.isSuccess());

    std::atomic<int> counter{0};
    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(threadPal_->submitWork(pool.value(), [&counter]() { ++counter; }).isSuccess());
    }

    // Destroying the pool drains the queue
    ASSERT_TRUE(threadPal_->destroyThreadPool(pool.value()).isSuccess());
    EXPECT_EQ(counter.load(), 20);
}

TEST_F(LinuxThreadPALTest, WorkRunsOffTheCallingThread) {
    auto pool = threadPal_->createThreadPool(1, ThreadPoolOptions{});
    ASSERT_TRUE(pool.isSuccess());

    std::thread::id workerId;
    ASSERT_TRUE(threadPal_->submitWork(pool.value(), [&workerId]() {
        workerId = std::this_thread::get_id();
    }).isSuccess());
    ASSERT_TRUE(threadPal_->destroyThreadPool(pool.value()).isSuccess());

    EXPECT_NE(workerId, std::thread::id{});
    EXPECT_NE(workerId, std::this_thread::get_id());
}

TEST_F(LinuxThreadPALTest, SubmitNullWorkFails) {
    auto pool = threadPal_->createThreadPool(1, ThreadPoolOptions{});
    ASSERT_TRUE(pool.isSuccess());

    auto result = threadPal_->submitWork(pool.value(), WorkItem{});
    EXPECT_TRUE(result.isError());
}

TEST_F(LinuxThreadPALTest, SubmitToUnknownPoolFails) {
    auto result = threadPal_->submitWork(ThreadPoolHandle{9999}, []() {});

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ThreadErrorCode::InvalidHandle);
}

TEST_F(LinuxThreadPALTest, SubmitBeyondQueueCapacityFails) {
    ThreadPoolOptions options;
    options.queueSize = 1;
    auto pool = threadPal_->createThreadPool(1, options);
    ASSERT_TRUE(pool.isSuccess());

    std::mutex mutex;
    std::condition_variable cv;
    bool release = false;
    std::atomic<bool> started{false};

    // Occupy the only worker so that queued items stay queued
    ASSERT_TRUE(threadPal_->submitWork(pool.value(), [&]() {
        started = true;
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait_for(lock, std::chrono::seconds(2), [&]() { return release; });
    }).isSuccess());

    while (!started.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    EXPECT_TRUE(threadPal_->submitWork(pool.value(), []() {}).isSuccess());
    auto overflow = threadPal_->submitWork(pool.value(), []() {});
    ASSERT_TRUE(overflow.isError());
    EXPECT_EQ(overflow.error().code, ThreadErrorCode::WorkQueueFull);

    {
        std::lock_guard<std::mutex> lock(mutex);
        release = true;
    }
    cv.notify_all();
    EXPECT_TRUE(threadPal_->destroyThreadPool(pool.value()).isSuccess());
}

// =============================================================================
// Pool Destruction
// =============================================================================

TEST_F(LinuxThreadPALTest, DestroyUnknownPoolFails) {
    auto result = threadPal_->destroyThreadPool(ThreadPoolHandle{424242});

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ThreadErrorCode::InvalidHandle);
}

TEST_F(LinuxThreadPALTest, DestroyTwiceFails) {
    auto pool = threadPal_->createThreadPool(1, ThreadPoolOptions{});
    ASSERT_TRUE(pool.isSuccess());

    EXPECT_TRUE(threadPal_->destroyThreadPool(pool.value()).isSuccess());
    EXPECT_TRUE(threadPal_->destroyThreadPool(pool.value()).isError());
}

TEST_F(LinuxThreadPALTest, SubmitAfterDestroyFails) {
    auto pool = threadPal_->createThreadPool(1, ThreadPoolOptions{});
    ASSERT_TRUE(pool.isSuccess());
    ASSERT_TRUE(threadPal_->destroyThreadPool(pool.value()).isSuccess());

    auto result = threadPal_->submitWork(pool.value(), []() {});
    EXPECT_TRUE(result.isError());
}

TEST_F(LinuxThreadPALTest, DestructorJoinsRemainingPools) {
    std::atomic<int> counter{0};
    {
        linux::LinuxThreadPAL localPal;
        auto pool = localPal.createThreadPool(2, ThreadPoolOptions{});
        ASSERT_TRUE(pool.isSuccess());
        for (int i = 0; i < 10; ++i) {
            ASSERT_TRUE(localPal.submitWork(pool.value(), [&counter]() { ++counter; }).isSuccess());
        }
    }
    EXPECT_EQ(counter.load(), 10);
}

// =============================================================================
// Sleep
// =============================================================================

TEST_F(LinuxThreadPALTest, SleepForWaitsAtLeastTheDuration) {
    auto start = std::chrono::steady_clock::now();
    threadPal_->sleepFor(std::chrono::milliseconds(30));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    EXPECT_GE(elapsed.count(), 30);
}

} // namespace test
} // namespace pal
} // namespace mediarelay
