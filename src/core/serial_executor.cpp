// MediaRelay - WebRTC SFU Signaling Server
// Serial Executor Implementation

#include "mediarelay/core/serial_executor.hpp"

#include <algorithm>
#include <exception>

namespace mediarelay {
namespace core {

namespace {

const char* LOG_CATEGORY = "Executor";

} // namespace

SerialExecutor::SerialExecutor(
    pal::IThreadPAL& threadPal,
    pal::ThreadPoolHandle pool,
    std::shared_ptr<StructuredLogger> logger
)
    : threadPal_(threadPal)
    , pool_(pool)
    , logger_(std::move(logger)) {}

Result<void, pal::ThreadError> SerialExecutor::post(pal::WorkItem task) {
    if (!task) {
        return Result<void, pal::ThreadError>::error(
            pal::ThreadError{pal::ThreadErrorCode::Unknown, "Task is null"});
    }

    uint64_t taskId = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return Result<void, pal::ThreadError>::error(
                pal::ThreadError{pal::ThreadErrorCode::PoolShutdown, "Executor is closed"});
        }
        taskId = ++nextTaskId_;
        tasks_.push_back(QueuedTask{taskId, std::move(task)});
        if (scheduled_) {
            return Result<void, pal::ThreadError>::success();
        }
        scheduled_ = true;
    }

    auto self = shared_from_this();
    auto submitted = threadPal_.submitWork(pool_, [self]() { self->drainOne(); });
    if (submitted.isSuccess()) {
        return Result<void, pal::ThreadError>::success();
    }

    bool othersQueued = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Other posts may have queued behind this task in the meantime
        auto it = std::find_if(tasks_.begin(), tasks_.end(),
            [taskId](const QueuedTask& queued) { return queued.id == taskId; });
        if (it != tasks_.end()) {
            tasks_.erase(it);
        }
        othersQueued = !tasks_.empty();
        if (!othersQueued) {
            scheduled_ = false;
        }
    }

    if (othersQueued) {
        // Those posts were told they succeeded
        MEDIARELAY_LOG_WARNING(logger_, LOG_CATEGORY,
            "Worker pool rejected work (" + submitted.error().message + "), draining inline");
        drainOne();
    }
    return submitted;
}

void SerialExecutor::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

bool SerialExecutor::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t SerialExecutor::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void SerialExecutor::drainOne() {
    while (true) {
        pal::WorkItem task;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (tasks_.empty()) {
                scheduled_ = false;
                return;
            }
            task = std::move(tasks_.front().work);
        }

        runTask(task);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            tasks_.pop_front();
            if (tasks_.empty()) {
                scheduled_ = false;
                return;
            }
        }

        auto self = shared_from_this();
        if (threadPal_.submitWork(pool_, [self]() { self->drainOne(); }).isSuccess()) {
            return;
        }
        // Pool is going away; keep draining on this worker so nothing is lost
    }
}

void SerialExecutor::runTask(const pal::WorkItem& task) {
    try {
        task();
    } catch (const std::exception& e) {
        MEDIARELAY_LOG_ERROR(logger_, LOG_CATEGORY, std::string("Task failed: ") + e.what());
    }
}

} // namespace core
} // namespace mediarelay
