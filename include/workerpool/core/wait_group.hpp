#pragma once

/**
 * @file wait_group.hpp
 * @brief Completion counter used to await worker shutdown
 */

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stdexcept>

namespace workerpool {

/**
 * @brief Counts outstanding participants and lets callers wait for zero
 */
class WaitGroup {
public:
    WaitGroup() = default;

    WaitGroup(const WaitGroup&) = delete;
    WaitGroup& operator=(const WaitGroup&) = delete;

    void add(std::int64_t n = 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        count_ += n;
        if (count_ < 0) {
            throw std::logic_error("WaitGroup: negative counter");
        }
    }

    /**
     * @brief Mark one participant finished
     * @throws std::logic_error if the counter would drop below zero
     */
    void done() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (count_ == 0) {
                throw std::logic_error("WaitGroup: done() without matching add()");
            }
            if (--count_ > 0) {
                return;
            }
        }
        zero_.notify_all();
    }

    /**
     * @brief Block until the counter reaches zero
     */
    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        zero_.wait(lock, [this] { return count_ == 0; });
    }

    [[nodiscard]] std::int64_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable zero_;
    std::int64_t count_{0};
};

} // namespace workerpool
