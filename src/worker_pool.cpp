#include "worker_pool.h"
#include <iostream>
#include <stdexcept>

namespace gradebox {

WorkerPool::WorkerPool(size_t thread_count, size_t queue_capacity) : capacity_(queue_capacity) {
    if (thread_count == 0) {
        throw std::invalid_argument("worker pool needs at least one thread");
    }
    threads_.reserve(thread_count);
    for (size_t i = 0; i < thread_count; ++i) {
        threads_.emplace_back([this]() { run(); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ || tasks_.size() >= capacity_) {
            return false;
        }
        tasks_.push(std::move(task));
    }
    ready_.notify_one();
    return true;
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && threads_.empty()) {
            return;
        }
        stopping_ = true;
    }
    ready_.notify_all();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    std::lock_guard<std::mutex> lock(mutex_);
    threads_.clear();
}

size_t WorkerPool::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void WorkerPool::run() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            ready_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                return;   // Stopping and drained
            }
            task = std::move(tasks_.front());
            tasks_.pop();
            active_++;
        }

        // Tasks handle their own failures; this only keeps the thread alive
        try {
            task();
        } catch (const std::exception& e) {
            std::cerr << "[Pipeline] Worker task failed: " << e.what() << std::endl;
        }
        active_--;
    }
}

} // namespace gradebox
