// MediaRelay - WebRTC SFU Signaling Server
// Linux Thread PAL Implementation

#include "mediarelay/pal/linux/linux_thread_pal.hpp"

#include <cstring>
#include <sys/prctl.h>
#include <unistd.h>

namespace mediarelay {
namespace pal {
namespace linux {

// =============================================================================
// Worker Function
// =============================================================================

void* LinuxThreadPAL::poolWorkerFunction(void* arg) {
    std::unique_ptr<WorkerStart> start(static_cast<WorkerStart*>(arg));
    ThreadPoolData* pool = start->pool;

    if (!start->threadName.empty()) {
        // Linux limits thread names to 16 characters including null terminator
        prctl(PR_SET_NAME, start->threadName.substr(0, 15).c_str(), 0, 0, 0);
    }

    while (true) {
        WorkItem work;

        {
            std::unique_lock<std::mutex> lock(pool->queueMutex);
            pool->workCondition.wait(lock, [pool]() {
                return pool->shutdown.load() || !pool->workQueue.empty();
            });

            if (pool->shutdown.load() && pool->workQueue.empty()) {
                break;
            }

            work = std::move(pool->workQueue.front());
            pool->workQueue.pop();
        }

        // Execute work item outside the lock
        if (work) {
            work();
        }
    }

    return nullptr;
}

// =============================================================================
// Constructor / Destructor
// =============================================================================

LinuxThreadPAL::LinuxThreadPAL() = default;

LinuxThreadPAL::~LinuxThreadPAL() {
    std::unordered_map<uint64_t, std::shared_ptr<ThreadPoolData>> remaining;
    {
        std::lock_guard<std::mutex> lock(poolsMutex_);
        remaining.swap(pools_);
    }
    for (auto& entry : remaining) {
        shutdownPool(*entry.second);
    }
}

// =============================================================================
// Thread Pool Operations
// =============================================================================

core::Result<ThreadPoolHandle, ThreadError> LinuxThreadPAL::createThreadPool(
    size_t threadCount,
    const ThreadPoolOptions& options
) {
    if (threadCount == 0) {
        return core::Result<ThreadPoolHandle, ThreadError>::error(
            ThreadError{ThreadErrorCode::PoolCreationFailed, "Invalid thread count"}
        );
    }

    auto poolData = std::make_shared<ThreadPoolData>();
    poolData->name = options.name;
    poolData->queueCapacity = options.queueSize;

    for (size_t i = 0; i < threadCount; ++i) {
        auto* start = new WorkerStart{poolData.get(),
            options.name.empty() ? std::string() : options.name + "-" + std::to_string(i)};

        pthread_t worker;
        int result = pthread_create(&worker, nullptr, poolWorkerFunction, start);
        if (result != 0) {
            delete start;
            shutdownPool(*poolData);
            return core::Result<ThreadPoolHandle, ThreadError>::error(
                ThreadError{ThreadErrorCode::PoolCreationFailed,
                            "Failed to create worker thread: " + std::string(strerror(result))}
            );
        }
        poolData->workers.push_back(worker);
    }

    uint64_t handleValue = nextHandle_.fetch_add(1);
    {
        std::lock_guard<std::mutex> lock(poolsMutex_);
        pools_[handleValue] = std::move(poolData);
    }

    return core::Result<ThreadPoolHandle, ThreadError>::success(ThreadPoolHandle{handleValue});
}

core::Result<void, ThreadError> LinuxThreadPAL::submitWork(
    ThreadPoolHandle pool,
    WorkItem work
) {
    if (!work) {
        return core::Result<void, ThreadError>::error(
            ThreadError{ThreadErrorCode::Unknown, "Work item is null"}
        );
    }

    std::shared_ptr<ThreadPoolData> poolData;
    {
        std::lock_guard<std::mutex> lock(poolsMutex_);
        auto it = pools_.find(pool.value);
        if (it == pools_.end()) {
            return core::Result<void, ThreadError>::error(
                ThreadError{ThreadErrorCode::InvalidHandle, "Invalid thread pool handle"}
            );
        }
        poolData = it->second;
    }

    {
        std::lock_guard<std::mutex> lock(poolData->queueMutex);
        if (poolData->shutdown.load()) {
            return core::Result<void, ThreadError>::error(
                ThreadError{ThreadErrorCode::PoolShutdown, "Thread pool is shutting down"}
            );
        }
        if (poolData->queueCapacity > 0 && poolData->workQueue.size() >= poolData->queueCapacity) {
            return core::Result<void, ThreadError>::error(
                ThreadError{ThreadErrorCode::WorkQueueFull, "Work queue is full"}
            );
        }
        poolData->workQueue.push(std::move(work));
    }
    poolData->workCondition.notify_one();

    return core::Result<void, ThreadError>::success();
}

core::Result<void, ThreadError> LinuxThreadPAL::destroyThreadPool(
    ThreadPoolHandle pool
) {
    std::shared_ptr<ThreadPoolData> poolData;
    {
        std::lock_guard<std::mutex> lock(poolsMutex_);
        auto it = pools_.find(pool.value);
        if (it == pools_.end()) {
            return core::Result<void, ThreadError>::error(
                ThreadError{ThreadErrorCode::InvalidHandle, "Invalid thread pool handle"}
            );
        }
        poolData = std::move(it->second);
        pools_.erase(it);
    }

    shutdownPool(*poolData);
    return core::Result<void, ThreadError>::success();
}

void LinuxThreadPAL::shutdownPool(ThreadPoolData& pool) {
    {
        std::lock_guard<std::mutex> lock(pool.queueMutex);
        pool.shutdown = true;
    }
    pool.workCondition.notify_all();

    for (auto& worker : pool.workers) {
        pthread_join(worker, nullptr);
    }
    pool.workers.clear();
}

void LinuxThreadPAL::sleepFor(std::chrono::milliseconds duration) {
    usleep(static_cast<useconds_t>(duration.count() * 1000));
}

} // namespace linux
} // namespace pal
} // namespace mediarelay
