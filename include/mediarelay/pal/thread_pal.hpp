// MediaRelay - WebRTC SFU Signaling Server
// Platform Abstraction Layer - Threading Interface
//
// Worker pools that run signaling work items off the network loop thread.

#ifndef MEDIARELAY_PAL_THREAD_PAL_HPP
#define MEDIARELAY_PAL_THREAD_PAL_HPP

#include "mediarelay/pal/pal_types.hpp"
#include "mediarelay/core/result.hpp"

#include <chrono>
#include <string>

namespace mediarelay {
namespace pal {

/**
 * @brief Abstract interface for worker pools.
 *
 * ## Thread Pool Lifecycle
 * 1. Create pool with createThreadPool()
 * 2. Submit work items with submitWork()
 * 3. Destroy pool with destroyThreadPool() (drains queued work, joins workers)
 *
 * Work items run in submission order per worker but with no ordering across
 * workers; core::SerialExecutor adds per-client ordering on top.
 */
class IThreadPAL {
public:
    virtual ~IThreadPAL() = default;

    /**
     * @brief Create a pool of worker threads.
     *
     * @param threadCount Number of workers, must be > 0
     * @param options Pool name (thread name prefix) and queue capacity
     *
     * @return ThreadPoolHandle on success, or ThreadError on failure
     *
     * @code
     * ThreadPoolOptions opts;
     * opts.name = "signal";
     * auto pool = threadPal->createThreadPool(4, opts);
     * if (pool.isError()) {
     *     logger->error("Failed to create worker pool: " + pool.error().message, "Server");
     * }
     * @endcode
     */
    virtual core::Result<ThreadPoolHandle, ThreadError> createThreadPool(
        size_t threadCount,
        const ThreadPoolOptions& options
    ) = 0;

    /**
     * @brief Queue a work item on a pool.
     *
     * Error conditions:
     * - InvalidHandle: Pool handle is not valid
     * - PoolShutdown: Pool is being shut down
     * - WorkQueueFull: Queue has reached ThreadPoolOptions::queueSize
     */
    virtual core::Result<void, ThreadError> submitWork(
        ThreadPoolHandle pool,
        WorkItem work
    ) = 0;

    /**
     * @brief Shut a pool down.
     *
     * Already queued work is executed before the workers exit.
     */
    virtual core::Result<void, ThreadError> destroyThreadPool(
        ThreadPoolHandle pool
    ) = 0;

    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

} // namespace pal
} // namespace mediarelay

#endif // MEDIARELAY_PAL_THREAD_PAL_HPP
