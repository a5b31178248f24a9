// MediaRelay - WebRTC SFU Signaling Server
// Linux Timer PAL Implementation

#include "mediarelay/pal/linux/linux_timer_pal.hpp"

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <time.h>

namespace mediarelay {
namespace pal {
namespace linux {

// =============================================================================
// Constructor / Destructor
// =============================================================================

LinuxTimerPAL::LinuxTimerPAL() {
    epollFd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epollFd_ < 0) {
        // scheduleOnce() reports CreationFailed from now on
        return;
    }

    wakeEventFd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wakeEventFd_ < 0) {
        close(epollFd_);
        epollFd_ = -1;
        return;
    }

    struct epoll_event ev;
    memset(&ev, 0, sizeof(ev));
    ev.events = EPOLLIN;
    ev.data.u64 = WAKE_KEY;
    if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, wakeEventFd_, &ev) < 0) {
        close(wakeEventFd_);
        close(epollFd_);
        wakeEventFd_ = -1;
        epollFd_ = -1;
        return;
    }

    timerThread_ = std::thread(&LinuxTimerPAL::timerThreadFunc, this);
}

LinuxTimerPAL::~LinuxTimerPAL() {
    shutdown_ = true;
    wakeTimerThread();

    if (timerThread_.joinable()) {
        timerThread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(timersMutex_);
        for (auto& pair : timers_) {
            close(pair.second->timerFd);
        }
        timers_.clear();
    }

    if (wakeEventFd_ >= 0) {
        close(wakeEventFd_);
        wakeEventFd_ = -1;
    }
    if (epollFd_ >= 0) {
        close(epollFd_);
        epollFd_ = -1;
    }
}

// =============================================================================
// Timer Thread
// =============================================================================

void LinuxTimerPAL::timerThreadFunc() {
    const int maxEvents = 32;
    struct epoll_event events[maxEvents];

    while (!shutdown_) {
        int nfds = epoll_wait(epollFd_, events, maxEvents, -1);
        if (nfds < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }

        for (int i = 0; i < nfds; ++i) {
            uint64_t key = events[i].data.u64;

            if (key == WAKE_KEY) {
                uint64_t val;
                while (read(wakeEventFd_, &val, sizeof(val)) > 0) {
                }
                continue;
            }

            // One-shot: take ownership under the lock, fire outside it
            std::unique_ptr<TimerInfo> fired;
            {
                std::lock_guard<std::mutex> lock(timersMutex_);
                auto it = timers_.find(key);
                if (it == timers_.end()) {
                    continue;
                }
                fired = std::move(it->second);
                timers_.erase(it);
                epoll_ctl(epollFd_, EPOLL_CTL_DEL, fired->timerFd, nullptr);
            }

            close(fired->timerFd);
            if (fired->callback && !shutdown_) {
                fired->callback();
            }
        }
    }
}

void LinuxTimerPAL::wakeTimerThread() {
    if (wakeEventFd_ >= 0) {
        uint64_t val = 1;
        if (write(wakeEventFd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
            // Counter saturated or fd closed; the loop is already awake or gone
            return;
        }
    }
}

// =============================================================================
// Timer Scheduling
// =============================================================================

core::Result<TimerHandle, TimerError> LinuxTimerPAL::scheduleOnce(
    std::chrono::milliseconds delay,
    TimerCallback callback
) {
    if (epollFd_ < 0) {
        return core::Result<TimerHandle, TimerError>::error(
            TimerError{TimerErrorCode::CreationFailed, "Timer subsystem not initialized"}
        );
    }

    int timerFd = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timerFd < 0) {
        return core::Result<TimerHandle, TimerError>::error(
            TimerError{TimerErrorCode::CreationFailed,
                       "timerfd_create failed: " + std::string(strerror(errno))}
        );
    }

    struct itimerspec its;
    memset(&its, 0, sizeof(its));
    its.it_value.tv_sec = delay.count() / 1000;
    its.it_value.tv_nsec = (delay.count() % 1000) * 1000000;

    // A zero it_value disarms the timer; use the smallest delay instead
    if (its.it_value.tv_sec == 0 && its.it_value.tv_nsec == 0) {
        its.it_value.tv_nsec = 1;
    }

    if (timerfd_settime(timerFd, 0, &its, nullptr) < 0) {
        int err = errno;
        close(timerFd);
        return core::Result<TimerHandle, TimerError>::error(
            TimerError{TimerErrorCode::CreationFailed,
                       "timerfd_settime failed: " + std::string(strerror(err))}
        );
    }

    TimerHandle handle{nextHandle_.fetch_add(1, std::memory_order_relaxed)};

    auto timerInfo = std::make_unique<TimerInfo>();
    timerInfo->timerFd = timerFd;
    timerInfo->callback = std::move(callback);

    // Register before arming epoll so the thread always finds the entry
    std::lock_guard<std::mutex> lock(timersMutex_);
    timers_[handle.value] = std::move(timerInfo);

    struct epoll_event ev;
    memset(&ev, 0, sizeof(ev));
    ev.events = EPOLLIN;
    ev.data.u64 = handle.value;
    if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, timerFd, &ev) < 0) {
        int err = errno;
        timers_.erase(handle.value);
        close(timerFd);
        return core::Result<TimerHandle, TimerError>::error(
            TimerError{TimerErrorCode::CreationFailed,
                       "epoll_ctl failed: " + std::string(strerror(err))}
        );
    }

    return core::Result<TimerHandle, TimerError>::success(handle);
}

core::Result<void, TimerError> LinuxTimerPAL::cancelTimer(TimerHandle handle) {
    if (handle == INVALID_TIMER_HANDLE) {
        return core::Result<void, TimerError>::error(
            TimerError{TimerErrorCode::InvalidHandle, "Invalid timer handle"}
        );
    }

    std::lock_guard<std::mutex> lock(timersMutex_);

    auto it = timers_.find(handle.value);
    if (it == timers_.end()) {
        return core::Result<void, TimerError>::error(
            TimerError{TimerErrorCode::AlreadyCancelled, "Timer not found or already fired"}
        );
    }

    int fd = it->second->timerFd;
    epoll_ctl(epollFd_, EPOLL_CTL_DEL, fd, nullptr);
    close(fd);
    timers_.erase(it);

    return core::Result<void, TimerError>::success();
}

// =============================================================================
// Time Measurement
// =============================================================================

std::chrono::steady_clock::time_point LinuxTimerPAL::now() const {
    return std::chrono::steady_clock::now();
}

uint64_t LinuxTimerPAL::getMonotonicMillis() const {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<uint64_t>(ts.tv_sec) * 1000 + static_cast<uint64_t>(ts.tv_nsec) / 1000000;
}

} // namespace linux
} // namespace pal
} // namespace mediarelay
