#include "runtime.hpp"
#include <iostream>

namespace rembed {

WorkerPool::WorkerPool(uint32_t threads) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (uint32_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
}

void WorkerPool::submit(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw BridgeError("worker pool is shutting down");
        }
        queue_.push_back(std::move(job));
        ++submitted_;
    }
    cv_.notify_one();
}

void WorkerPool::worker_loop() {
    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return;
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        // Jobs wrap packaged_tasks, which capture their own exceptions.
        job();
    }
}

WorkerPool& WorkerPool::shared(uint32_t threads) {
    // Leaked so that workers never race static destruction at exit.
    static WorkerPool* pool = [threads] {
        std::cerr << "[bridge] Starting shared pool with " << threads << " workers\n";
        return new WorkerPool(threads);
    }();
    return *pool;
}

ExecutionBridge::ExecutionBridge(uint32_t worker_threads)
    : pool_(WorkerPool::shared(worker_threads)) {}

ExecutionBridge::ExecutionBridge(WorkerPool& pool)
    : pool_(pool) {}

} // namespace rembed
