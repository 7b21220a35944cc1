#pragma once

/**
 * @file task.hpp
 * @brief Units of work accepted by the pool
 */

#include <chrono>
#include <functional>
#include <memory>

namespace workerpool {

/**
 * @brief Monotonic clock used for idle bookkeeping
 */
using Clock = std::chrono::steady_clock;

/**
 * @brief Timestamp type for park/expiry decisions
 */
using Timestamp = Clock::time_point;

/**
 * @brief Opaque zero-argument unit of work
 *
 * An empty Task is rejected by submit(). Inside a worker's mailbox an
 * empty Task is the termination sentinel.
 */
using Task = std::function<void()>;

/**
 * @brief Object-style unit of work
 *
 * Callers that already model work as objects can hand them to the pool
 * through Pool::submit_job() without wrapping them in a lambda.
 */
class Job {
public:
    virtual ~Job() = default;

    /**
     * @brief Execute the job on a worker thread
     */
    virtual void run() = 0;
};

} // namespace workerpool
