// MediaRelay - WebRTC SFU Signaling Server
// Linux Timer PAL Implementation
//
// timerfd timers multiplexed by epoll on a dedicated thread.

#ifndef MEDIARELAY_PAL_LINUX_LINUX_TIMER_PAL_HPP
#define MEDIARELAY_PAL_LINUX_LINUX_TIMER_PAL_HPP

#include "mediarelay/pal/timer_pal.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace mediarelay {
namespace pal {
namespace linux {

/**
 * @brief Linux implementation of ITimerPAL using timerfd.
 *
 * This implementation uses:
 * - timerfd_create(CLOCK_MONOTONIC) per timer
 * - epoll keyed by timer handle, so a recycled descriptor never fires a
 *   stale timer
 * - an eventfd to wake the timer thread on shutdown
 */
class LinuxTimerPAL : public ITimerPAL {
public:
    /**
     * @brief Creates the epoll instance and starts the timer thread.
     */
    LinuxTimerPAL();

    /**
     * @brief Stops the timer thread and drops every pending timer.
     */
    ~LinuxTimerPAL() override;

    LinuxTimerPAL(const LinuxTimerPAL&) = delete;
    LinuxTimerPAL& operator=(const LinuxTimerPAL&) = delete;
    LinuxTimerPAL(LinuxTimerPAL&&) = delete;
    LinuxTimerPAL& operator=(LinuxTimerPAL&&) = delete;

    core::Result<TimerHandle, TimerError> scheduleOnce(
        std::chrono::milliseconds delay,
        TimerCallback callback
    ) override;

    core::Result<void, TimerError> cancelTimer(TimerHandle handle) override;

    std::chrono::steady_clock::time_point now() const override;

    uint64_t getMonotonicMillis() const override;

private:
    struct TimerInfo {
        int timerFd;
        TimerCallback callback;
    };

    void timerThreadFunc();
    void wakeTimerThread();

    // Reserved epoll key for the wake eventfd; timer handles start at 1
    static constexpr uint64_t WAKE_KEY = 0;

    std::atomic<uint64_t> nextHandle_{1};

    mutable std::mutex timersMutex_;
    std::unordered_map<uint64_t, std::unique_ptr<TimerInfo>> timers_;

    int epollFd_{-1};
    int wakeEventFd_{-1};

    std::thread timerThread_;
    std::atomic<bool> shutdown_{false};
};

} // namespace linux
} // namespace pal
} // namespace mediarelay

#endif // MEDIARELAY_PAL_LINUX_LINUX_TIMER_PAL_HPP
