#pragma once
/**
 * @file BoundedQueue.h
 * @brief Fixed-capacity FIFO shared between threads (non-blocking send, timed receive).
 */
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stddef.h>
#include <stdint.h>

/**
 * @brief Copy-in/copy-out queue with a compile-time capacity.
 *
 * `send()` never blocks and fails when the queue is full, so producers on
 * callback threads cannot stall. `receive()` waits up to `waitMs`.
 */
template<typename T, size_t N>
class BoundedQueue {
public:
    bool send(const T& item) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (count_ >= N) return false;
            items_[(head_ + count_) % N] = item;
            ++count_;
        }
        cv_.notify_one();
        return true;
    }

    bool receive(T& out, uint32_t waitMs) {
        std::unique_lock<std::mutex> lock(mtx_);
        if (!cv_.wait_for(lock, std::chrono::milliseconds(waitMs), [this] { return count_ > 0; })) {
            return false;
        }
        out = items_[head_];
        head_ = (head_ + 1) % N;
        --count_;
        return true;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return count_;
    }

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    T items_[N]{};
    size_t head_ = 0;
    size_t count_ = 0;
};
