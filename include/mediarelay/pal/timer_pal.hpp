// MediaRelay - WebRTC SFU Signaling Server
// Platform Abstraction Layer - Timer Interface
//
// One-shot timers for deferred work (HLS output checks) and a monotonic
// clock.

#ifndef MEDIARELAY_PAL_TIMER_PAL_HPP
#define MEDIARELAY_PAL_TIMER_PAL_HPP

#include "mediarelay/pal/pal_types.hpp"
#include "mediarelay/core/result.hpp"

#include <chrono>

namespace mediarelay {
namespace pal {

/**
 * @brief Abstract interface for timers.
 *
 * Callbacks run on a dedicated timer thread and must not block for long.
 * A cancelled timer never fires after cancelTimer() returns, unless its
 * callback was already running.
 */
class ITimerPAL {
public:
    virtual ~ITimerPAL() = default;

    /**
     * @brief Run a callback once after the given delay.
     *
     * @code
     * auto timer = timerPal->scheduleOnce(std::chrono::milliseconds(5000), [weak]() {
     *     if (auto recorder = weak.lock()) {
     *         recorder->logFileStatus();
     *     }
     * });
     * @endcode
     */
    virtual core::Result<TimerHandle, TimerError> scheduleOnce(
        std::chrono::milliseconds delay,
        TimerCallback callback
    ) = 0;

    /**
     * @brief Cancel a pending timer.
     *
     * Error conditions:
     * - InvalidHandle: handle is INVALID_TIMER_HANDLE
     * - AlreadyCancelled: timer fired or was cancelled before
     */
    virtual core::Result<void, TimerError> cancelTimer(TimerHandle handle) = 0;

    virtual std::chrono::steady_clock::time_point now() const = 0;

    virtual uint64_t getMonotonicMillis() const = 0;
};

} // namespace pal
} // namespace mediarelay

#endif // MEDIARELAY_PAL_TIMER_PAL_HPP
