#pragma once

#include <functional>
#include <queue>
#include <vector>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>

namespace gradebox {

// Fixed number of threads draining a bounded FIFO of tasks
class WorkerPool {
public:
    using Task = std::function<void()>;

    WorkerPool(size_t thread_count, size_t queue_capacity);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Enqueue without blocking. Returns false when the queue is full or the
    // pool is shutting down.
    bool submit(Task task);

    // Stop accepting work, finish what is queued, join the threads. Idempotent.
    // Must not be called from a task.
    void shutdown();

    size_t queued() const;
    size_t active() const { return active_; }
    size_t thread_count() const { return threads_.size(); }
    size_t capacity() const { return capacity_; }

private:
    void run();

    size_t capacity_;
    std::vector<std::thread> threads_;
    std::queue<Task> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    bool stopping_ = false;
    std::atomic<size_t> active_{0};
};

} // namespace gradebox
