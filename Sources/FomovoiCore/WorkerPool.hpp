#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace fv {

/// Fixed set of worker threads draining one FIFO task queue.
///
/// post() never blocks the caller.  Tasks must not throw; a task that does
/// is logged and dropped so a worker is never lost.
class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(size_t num_threads = 2);
    ~WorkerPool();

    // Non-copyable.
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue a task.  Returns false once the pool is shutting down.
    bool post(Task task);

    /// Drop every queued task that has not started.  Returns how many were
    /// dropped.  Running tasks are unaffected.
    size_t clear();

    /// Stop accepting work, finish the queue, join the workers.
    void shutdown();

    size_t queue_size() const;
    size_t thread_count() const { return workers_.size(); }

private:
    void worker_thread();

    std::vector<std::thread> workers_;
    std::queue<Task>         tasks_;
    mutable std::mutex       mu_;
    std::condition_variable  cv_;
    std::atomic<bool>        stop_requested_{false};
};

} // namespace fv
