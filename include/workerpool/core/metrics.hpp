#pragma once

/**
 * @file metrics.hpp
 * @brief Pool activity counters and snapshot reporting
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <sstream>
#include <string>

namespace workerpool {

/**
 * @brief Counter metric (monotonically increasing)
 */
class Counter {
public:
    void increment(std::uint64_t value = 1) noexcept {
        value_.fetch_add(value, std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t value() const noexcept {
        return value_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<std::uint64_t> value_{0};
};

/**
 * @brief Point-in-time view of pool activity
 */
struct PoolMetrics {
    std::uint64_t tasks_submitted{0};
    std::uint64_t tasks_completed{0};
    std::uint64_t tasks_failed{0};
    std::uint64_t workers_spawned{0};       // Fresh Worker allocations
    std::uint64_t workers_recycled{0};      // Retired shells restarted
    std::uint64_t idle_handoffs{0};         // Tasks given to a parked worker
    std::uint64_t workers_reaped{0};        // Retired by idle expiry or close
    std::uint64_t overload_retirements{0};  // Retired because running > capacity
    std::uint64_t blocked_submits{0};       // Submissions that had to wait
    std::uint64_t threads_joined{0};        // Exited worker threads reclaimed
    std::int64_t peak_running{0};
    int running{0};
    int idle{0};
    int capacity{0};
    int allocated_workers{0};               // Worker objects currently held
    std::chrono::milliseconds uptime{0};

    /**
     * @brief Render the snapshot as one line
     */
    [[nodiscard]] std::string format() const {
        std::ostringstream oss;
        oss << "Running: " << running << "/" << capacity
            << " | Idle: " << idle
            << " | Peak: " << peak_running
            << " | Submitted: " << tasks_submitted
            << " | Completed: " << tasks_completed
            << " | Failed: " << tasks_failed
            << " | Spawned: " << workers_spawned
            << " | Recycled: " << workers_recycled
            << " | Handoffs: " << idle_handoffs
            << " | Reaped: " << workers_reaped
            << " | Overload: " << overload_retirements
            << " | Blocked: " << blocked_submits
            << " | Joined: " << threads_joined
            << " | Allocated: " << allocated_workers;
        return oss.str();
    }
};

/**
 * @brief Counters updated by the pool and its workers
 */
class PoolMetricsCollector {
public:
    PoolMetricsCollector() : start_time_(std::chrono::steady_clock::now()) {}

    Counter& tasks_submitted() { return tasks_submitted_; }
    Counter& tasks_completed() { return tasks_completed_; }
    Counter& tasks_failed() { return tasks_failed_; }
    Counter& workers_spawned() { return workers_spawned_; }
    Counter& workers_recycled() { return workers_recycled_; }
    Counter& idle_handoffs() { return idle_handoffs_; }
    Counter& workers_reaped() { return workers_reaped_; }
    Counter& overload_retirements() { return overload_retirements_; }
    Counter& blocked_submits() { return blocked_submits_; }
    Counter& threads_joined() { return threads_joined_; }

    /**
     * @brief Raise the running high watermark if @p running exceeds it
     */
    void observe_running(std::int64_t running) noexcept {
        auto peak = peak_running_.load(std::memory_order_relaxed);
        while (running > peak &&
               !peak_running_.compare_exchange_weak(peak, running, std::memory_order_relaxed)) {
        }
    }

    /**
     * @brief Collect counter values; gauges are filled in by the pool
     */
    [[nodiscard]] PoolMetrics snapshot() const {
        PoolMetrics m;
        m.tasks_submitted = tasks_submitted_.value();
        m.tasks_completed = tasks_completed_.value();
        m.tasks_failed = tasks_failed_.value();
        m.workers_spawned = workers_spawned_.value();
        m.workers_recycled = workers_recycled_.value();
        m.idle_handoffs = idle_handoffs_.value();
        m.workers_reaped = workers_reaped_.value();
        m.overload_retirements = overload_retirements_.value();
        m.blocked_submits = blocked_submits_.value();
        m.threads_joined = threads_joined_.value();
        m.peak_running = peak_running_.load(std::memory_order_relaxed);
        m.uptime = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time_
        );
        return m;
    }

private:
    std::chrono::steady_clock::time_point start_time_;

    Counter tasks_submitted_;
    Counter tasks_completed_;
    Counter tasks_failed_;
    Counter workers_spawned_;
    Counter workers_recycled_;
    Counter idle_handoffs_;
    Counter workers_reaped_;
    Counter overload_retirements_;
    Counter blocked_submits_;
    Counter threads_joined_;
    std::atomic<std::int64_t> peak_running_{0};
};

} // namespace workerpool
