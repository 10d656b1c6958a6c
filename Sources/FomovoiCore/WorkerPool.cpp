#include "WorkerPool.hpp"
#include "Logger.hpp"

#include <exception>

namespace fv {

WorkerPool::WorkerPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = 1;
    }
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&WorkerPool::worker_thread, this);
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (stop_requested_.load()) {
            return false;
        }
        tasks_.push(std::move(task));
    }
    cv_.notify_one();
    return true;
}

size_t WorkerPool::clear() {
    std::lock_guard<std::mutex> lock(mu_);
    size_t dropped = tasks_.size();
    std::queue<Task> empty;
    tasks_.swap(empty);
    return dropped;
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (stop_requested_.exchange(true) && workers_.empty()) {
            return;
        }
    }
    cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) {
            t.join();
        }
    }
    workers_.clear();
}

size_t WorkerPool::queue_size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return tasks_.size();
}

void WorkerPool::worker_thread() {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mu_);
            cv_.wait(lock, [this] { return stop_requested_.load() || !tasks_.empty(); });
            if (tasks_.empty()) {
                return;   // stop requested and queue drained
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            FV_LOG_ERROR("WorkerPool", std::string("Task threw: ") + e.what());
        } catch (...) {
            FV_LOG_ERROR("WorkerPool", "Task threw a non-standard exception");
        }
    }
}

} // namespace fv
