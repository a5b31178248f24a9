// MediaRelay - WebRTC SFU Signaling Server
// Test Support - Manually fired timers and inline worker threads

#ifndef MEDIARELAY_TEST_SUPPORT_FAKE_SCHEDULING_PAL_HPP
#define MEDIARELAY_TEST_SUPPORT_FAKE_SCHEDULING_PAL_HPP

#include "mediarelay/pal/thread_pal.hpp"
#include "mediarelay/pal/timer_pal.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace mediarelay {
namespace test {

/**
 * @brief ITimerPAL double; timers fire only through fireAll().
 */
class FakeTimerPAL : public pal::ITimerPAL {
public:
    core::Result<pal::TimerHandle, pal::TimerError> scheduleOnce(
        std::chrono::milliseconds delay,
        pal::TimerCallback callback
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);
        pal::TimerHandle handle{++nextHandle_};
        pending_[handle.value] = Pending{delay, std::move(callback)};
        return core::Result<pal::TimerHandle, pal::TimerError>::success(handle);
    }

    core::Result<void, pal::TimerError> cancelTimer(pal::TimerHandle handle) override {
        using R = core::Result<void, pal::TimerError>;
        if (handle == pal::INVALID_TIMER_HANDLE) {
            return R::error(pal::TimerError(pal::TimerErrorCode::InvalidHandle, "Invalid timer"));
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_.erase(handle.value) == 0) {
            return R::error(pal::TimerError(pal::TimerErrorCode::AlreadyCancelled, "Timer gone"));
        }
        ++cancelled_;
        return R::success();
    }

    std::chrono::steady_clock::time_point now() const override {
        return std::chrono::steady_clock::now();
    }

    uint64_t getMonotonicMillis() const override {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            now().time_since_epoch()).count());
    }

    /**
     * @brief Run and forget every pending timer.
     */
    size_t fireAll() {
        std::map<uint64_t, Pending> due;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            due.swap(pending_);
        }
        for (auto& entry : due) {
            entry.second.callback();
        }
        return due.size();
    }

    size_t pendingCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

    std::vector<std::chrono::milliseconds> pendingDelays() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::chrono::milliseconds> delays;
        for (const auto& entry : pending_) {
            delays.push_back(entry.second.delay);
        }
        return delays;
    }

    int cancelledCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

private:
    struct Pending {
        std::chrono::milliseconds delay{0};
        pal::TimerCallback callback;
    };

    mutable std::mutex mutex_;
    uint64_t nextHandle_ = 0;
    std::map<uint64_t, Pending> pending_;
    int cancelled_ = 0;
};

/**
 * @brief IThreadPAL double running work inline; sleeps are real but counted.
 */
class InlineThreadPAL : public pal::IThreadPAL {
public:
    core::Result<pal::ThreadPoolHandle, pal::ThreadError> createThreadPool(
        size_t threadCount,
        const pal::ThreadPoolOptions&
    ) override {
        using R = core::Result<pal::ThreadPoolHandle, pal::ThreadError>;
        if (threadCount == 0) {
            return R::error(pal::ThreadError(pal::ThreadErrorCode::PoolCreationFailed, "No workers"));
        }
        return R::success(pal::ThreadPoolHandle{1});
    }

    core::Result<void, pal::ThreadError> submitWork(pal::ThreadPoolHandle, pal::WorkItem work) override {
        work();
        return core::Result<void, pal::ThreadError>::success();
    }

    core::Result<void, pal::ThreadError> destroyThreadPool(pal::ThreadPoolHandle) override {
        return core::Result<void, pal::ThreadError>::success();
    }

    void sleepFor(std::chrono::milliseconds duration) override {
        ++sleeps_;
        std::this_thread::sleep_for(duration);
    }

    int sleeps() const { return sleeps_.load(); }

private:
    std::atomic<int> sleeps_{0};
};

} // namespace test
} // namespace mediarelay

#endif // MEDIARELAY_TEST_SUPPORT_FAKE_SCHEDULING_PAL_HPP
