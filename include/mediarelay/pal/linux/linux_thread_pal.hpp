// MediaRelay - WebRTC SFU Signaling Server
// Linux Thread PAL Implementation
//
// pthread worker pools with a condition-variable work queue.

#ifndef MEDIARELAY_PAL_LINUX_LINUX_THREAD_PAL_HPP
#define MEDIARELAY_PAL_LINUX_LINUX_THREAD_PAL_HPP

#include "mediarelay/pal/thread_pal.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <unordered_map>
#include <vector>

#include <pthread.h>

namespace mediarelay {
namespace pal {
namespace linux {

/**
 * @brief Linux implementation of IThreadPAL using pthreads.
 *
 * Workers are named "<pool name>-<index>" (truncated to 15 characters) so
 * they are recognisable in top/gdb.
 *
 * Thread Safety:
 * - All methods are thread-safe
 * - destroyThreadPool() must not be called from one of the pool's workers
 */
class LinuxThreadPAL : public IThreadPAL {
public:
    LinuxThreadPAL();

    /**
     * @brief Destroys every pool that is still alive.
     */
    ~LinuxThreadPAL() override;

    LinuxThreadPAL(const LinuxThreadPAL&) = delete;
    LinuxThreadPAL& operator=(const LinuxThreadPAL&) = delete;
    LinuxThreadPAL(LinuxThreadPAL&&) = delete;
    LinuxThreadPAL& operator=(LinuxThreadPAL&&) = delete;

    core::Result<ThreadPoolHandle, ThreadError> createThreadPool(
        size_t threadCount,
        const ThreadPoolOptions& options
    ) override;

    core::Result<void, ThreadError> submitWork(
        ThreadPoolHandle pool,
        WorkItem work
    ) override;

    core::Result<void, ThreadError> destroyThreadPool(
        ThreadPoolHandle pool
    ) override;

    void sleepFor(std::chrono::milliseconds duration) override;

private:
    struct ThreadPoolData {
        std::vector<pthread_t> workers;
        std::queue<WorkItem> workQueue;
        std::mutex queueMutex;
        std::condition_variable workCondition;
        std::atomic<bool> shutdown{false};
        std::string name;
        size_t queueCapacity = 0;
    };

    struct WorkerStart {
        ThreadPoolData* pool;
        std::string threadName;
    };

    static void* poolWorkerFunction(void* arg);
    static void shutdownPool(ThreadPoolData& pool);

    std::atomic<uint64_t> nextHandle_{1};

    // shared_ptr so submitWork can use a pool while destroyThreadPool runs
    mutable std::mutex poolsMutex_;
    std::unordered_map<uint64_t, std::shared_ptr<ThreadPoolData>> pools_;
};

} // namespace linux
} // namespace pal
} // namespace mediarelay

#endif // MEDIARELAY_PAL_LINUX_LINUX_THREAD_PAL_HPP
