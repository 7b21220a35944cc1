#pragma once

/**
 * @file reaper.hpp
 * @brief Background loop retiring workers idle past the survival time
 */

#include <condition_variable>
#include <mutex>
#include <thread>

namespace workerpool {

class Pool;

/**
 * @brief Idle-expiry timer for one pool
 *
 * Sleeps until the oldest parked worker can expire, asks the pool to
 * retire everything past the survival time, and repeats. The pool
 * computes the next wake-up, floored at its minimum cleanup interval.
 * cancel() wakes the loop immediately; it then retires every parked
 * worker and exits.
 */
class Reaper {
public:
    explicit Reaper(Pool& pool)
        : pool_(pool) {}

    ~Reaper() {
        cancel();
    }

    Reaper(const Reaper&) = delete;
    Reaper& operator=(const Reaper&) = delete;

    /**
     * @brief Start the background thread
     */
    void start();

    /**
     * @brief Stop the loop and wait for its final sweep
     *
     * Safe to call more than once and from several threads.
     */
    void cancel();

private:
    void run();

    Pool& pool_;
    std::thread thread_;
    std::mutex join_mutex_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_{false};
};

} // namespace workerpool
