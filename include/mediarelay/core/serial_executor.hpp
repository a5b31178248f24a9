// MediaRelay - WebRTC SFU Signaling Server
// Serial Executor - strictly ordered task queue on top of a worker pool
//
// Each signaling client owns one executor. Tasks posted to it run one at a
// time in posting order, while tasks of different clients run in parallel
// on the shared pool.

#ifndef MEDIARELAY_CORE_SERIAL_EXECUTOR_HPP
#define MEDIARELAY_CORE_SERIAL_EXECUTOR_HPP

#include "mediarelay/core/result.hpp"
#include "mediarelay/core/structured_logger.hpp"
#include "mediarelay/pal/thread_pal.hpp"

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>

namespace mediarelay {
namespace core {

/**
 * @brief Runs posted tasks one after another on a thread pool.
 *
 * At most one task of an executor is in flight at any time. The executor
 * hands a drain step to the pool when work arrives on an idle queue; each
 * step runs one task and resubmits itself while work remains, so a busy
 * client never monopolises a worker.
 *
 * A task that throws a std::exception is logged and the queue moves on.
 * When the pool rejects a drain step the queue is drained on the calling
 * thread instead, so no accepted task is left behind.
 *
 * Must be owned by a shared_ptr: queued drain steps keep it alive.
 *
 * @code
 * auto executor = std::make_shared<SerialExecutor>(threadPal, pool);
 * executor->post([=]() { handler->handleText(clientId, frame1); });
 * executor->post([=]() { handler->handleText(clientId, frame2); }); // runs after frame1
 * @endcode
 */
class SerialExecutor : public std::enable_shared_from_this<SerialExecutor> {
public:
    SerialExecutor(
        pal::IThreadPAL& threadPal,
        pal::ThreadPoolHandle pool,
        std::shared_ptr<StructuredLogger> logger = nullptr
    );
    ~SerialExecutor() = default;

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    /**
     * @brief Queue a task behind every task posted before it.
     *
     * @return Error when the executor is closed or the pool rejected work
     */
    Result<void, pal::ThreadError> post(pal::WorkItem task);

    /**
     * @brief Stop accepting tasks; already queued tasks still run.
     */
    void close();

    [[nodiscard]] bool isClosed() const;

    /**
     * @brief Number of queued tasks, including the one running.
     */
    [[nodiscard]] size_t pending() const;

private:
    struct QueuedTask {
        uint64_t id;
        pal::WorkItem work;
    };

    void drainOne();
    void runTask(const pal::WorkItem& task);

    pal::IThreadPAL& threadPal_;
    pal::ThreadPoolHandle pool_;
    std::shared_ptr<StructuredLogger> logger_;

    mutable std::mutex mutex_;
    std::deque<QueuedTask> tasks_;
    uint64_t nextTaskId_ = 0;
    bool scheduled_ = false;
    bool closed_ = false;
};

} // namespace core
} // namespace mediarelay

#endif // MEDIARELAY_CORE_SERIAL_EXECUTOR_HPP
