#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace rembed {

// Counting semaphore gating in-flight requests for one admission scope.
// Shared by every batch that runs against the same scope.
class Semaphore {
public:
    explicit Semaphore(uint32_t permits);

    Semaphore(const Semaphore&) = delete;
    Semaphore& operator=(const Semaphore&) = delete;

    void acquire();
    bool try_acquire();

    // Waits until a permit frees up or the deadline passes
    bool try_acquire_until(std::chrono::steady_clock::time_point deadline);

    void release();

    uint32_t available() const;
    uint32_t capacity() const { return capacity_; }

private:
    const uint32_t capacity_;
    uint32_t available_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace rembed
