#pragma once
#include "errors.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace rembed {

// Fixed set of worker threads draining a FIFO job queue.
class WorkerPool {
public:
    using Job = std::function<void()>;

    explicit WorkerPool(uint32_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Throws BridgeError once the pool is shutting down
    void submit(Job job);

    uint32_t size() const { return static_cast<uint32_t>(workers_.size()); }
    uint64_t submitted() const { return submitted_.load(); }

    // The process-wide pool, created on first use with the given size.
    // Later calls ignore threads. Never torn down.
    static WorkerPool& shared(uint32_t threads);

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::deque<Job> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
    std::atomic<uint64_t> submitted_{0};
};

// Lets synchronous callers drive provider work on the worker pool.
//
// Errors raised by the work surface from wait()/run_blocking(): library
// errors (rembed::Error) unchanged, anything else as BridgeError.
class ExecutionBridge {
public:
    // Over the process-wide shared pool
    explicit ExecutionBridge(uint32_t worker_threads);

    // Over a caller-owned pool that must outlive the bridge
    explicit ExecutionBridge(WorkerPool& pool);

    template <typename F>
    auto spawn(F work) -> std::future<std::invoke_result_t<F>> {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::move(work));
        auto future = task->get_future();
        pool_.submit([task] { (*task)(); });
        return future;
    }

    template <typename R>
    static R wait(std::future<R>& future) {
        try {
            return future.get();
        } catch (const Error&) {
            throw;
        } catch (const std::exception& e) {
            throw BridgeError(e.what());
        } catch (...) {
            throw BridgeError("unknown failure in worker");
        }
    }

    // Submit and block the calling thread until the result is ready
    template <typename F>
    auto run_blocking(F work) -> std::invoke_result_t<F> {
        auto future = spawn(std::move(work));
        return wait(future);
    }

    uint32_t worker_count() const { return pool_.size(); }

private:
    WorkerPool& pool_;
};

} // namespace rembed
