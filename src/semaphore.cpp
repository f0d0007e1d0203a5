#include "semaphore.hpp"
#include <stdexcept>

namespace rembed {

Semaphore::Semaphore(uint32_t permits)
    : capacity_(permits), available_(permits) {
    if (permits == 0) {
        throw std::invalid_argument("Semaphore needs at least one permit");
    }
}

void Semaphore::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return available_ > 0; });
    --available_;
}

bool Semaphore::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (available_ == 0) return false;
    --available_;
    return true;
}

bool Semaphore::try_acquire_until(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_until(lock, deadline, [this] { return available_ > 0; })) {
        return false;
    }
    --available_;
    return true;
}

void Semaphore::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (available_ >= capacity_) {
            throw std::logic_error("Semaphore released more often than acquired");
        }
        ++available_;
    }
    cv_.notify_one();
}

uint32_t Semaphore::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_;
}

} // namespace rembed
