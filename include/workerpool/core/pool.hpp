#pragma once

/**
 * @file pool.hpp
 * @brief Bounded pool of reusable workers
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "workerpool/core/idle_list.hpp"
#include "workerpool/core/metrics.hpp"
#include "workerpool/core/reaper.hpp"
#include "workerpool/core/status.hpp"
#include "workerpool/core/task.hpp"
#include "workerpool/core/wait_group.hpp"
#include "workerpool/core/worker.hpp"

namespace workerpool {

constexpr int DEFAULT_CAPACITY = 100000;
constexpr std::chrono::milliseconds DEFAULT_SURVIVAL_TIME{1000};
constexpr std::chrono::milliseconds DEFAULT_MINI_CLEANUP_INTERVAL{100};
constexpr std::chrono::milliseconds MIN_CLEANUP_INTERVAL{100};

/**
 * @brief Pool configuration
 */
struct PoolConfig {
    int capacity{DEFAULT_CAPACITY};                                      // < 0 = default
    std::chrono::milliseconds survival_time{DEFAULT_SURVIVAL_TIME};      // <= 0 = default
    std::chrono::milliseconds mini_cleanup_interval{DEFAULT_MINI_CLEANUP_INTERVAL};
    std::string name{"workerpool"};                                      // Used in log lines

    /**
     * @brief Copy with out-of-range values replaced by their defaults
     *
     * The cleanup interval is never allowed below MIN_CLEANUP_INTERVAL.
     */
    [[nodiscard]] PoolConfig normalized() const {
        PoolConfig c = *this;
        if (c.capacity < 0) {
            c.capacity = DEFAULT_CAPACITY;
        }
        if (c.survival_time <= std::chrono::milliseconds::zero()) {
            c.survival_time = DEFAULT_SURVIVAL_TIME;
        }
        if (c.mini_cleanup_interval < MIN_CLEANUP_INTERVAL) {
            c.mini_cleanup_interval = MIN_CLEANUP_INTERVAL;
        }
        return c;
    }
};

/**
 * @brief Bounded, reusable worker pool
 *
 * Runs submitted tasks on at most cap() concurrently live workers.
 * A submission is handed to the longest-idle parked worker if there is
 * one, otherwise a worker is started if the pool is under capacity,
 * otherwise the caller blocks until a worker frees up. Idle workers are
 * retired by a background Reaper once they have been parked for the
 * survival time.
 *
 * A retired worker's thread is joined, and its Worker object freed, on
 * the Reaper's next pass unless a submission restarts the object first.
 * Memory held for workers therefore follows the live count with a lag
 * of one cleanup pass rather than the historical peak.
 *
 * A task that throws never takes down its worker thread or the pool: the
 * exception is logged, the failure handler (if any) is invoked and the
 * worker retires instead of parking.
 *
 * The destructor closes the pool gracefully and joins every worker
 * thread, so a task must not destroy the pool it runs on.
 */
class Pool {
public:
    explicit Pool(PoolConfig config = {});
    ~Pool();

    // Non-copyable, non-movable
    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;

    /**
     * @brief Run a task on a pooled worker
     *
     * Blocks while the pool is saturated.
     * @return Ok, InvalidTask for an empty task, Closed after close()
     * @throws std::system_error if a new worker thread cannot be started
     */
    [[nodiscard]] Status submit(Task task);

    /**
     * @brief Run @p fn with one caller-supplied argument
     *
     * Both the callable and the argument are copied into the task and
     * must be copyable. An empty callable yields InvalidTask.
     */
    template<typename F, typename Arg>
    [[nodiscard]] Status submit(F&& fn, Arg&& arg);

    /**
     * @brief Run an object-style job; a null job yields InvalidTask
     */
    [[nodiscard]] Status submit_job(std::shared_ptr<Job> job);

    /**
     * @brief Change the capacity at runtime
     *
     * Negative or unchanged values are ignored. Lowering the capacity
     * does not interrupt running workers; surplus workers retire as
     * they finish their current task.
     */
    void adjust(int capacity);

    /**
     * @brief Close the pool without waiting for running workers
     *
     * Parked workers are told to terminate before this returns. Running
     * workers finish their current task and then exit. Idempotent.
     */
    Status close();

    /**
     * @brief Close the pool and wait until every worker has exited
     *
     * Also joins every worker thread that is still waiting to be reclaimed.
     */
    Status close_graceful();

    /**
     * @brief Set the callback invoked when a task throws
     */
    void set_failure_handler(std::function<void()> handler);

    /**
     * @brief Number of live workers (running or parked)
     */
    [[nodiscard]] int len() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    [[nodiscard]] int cap() const noexcept {
        return capacity_.load(std::memory_order_acquire);
    }

    /**
     * @brief Workers that may still be started; negative under overload
     */
    [[nodiscard]] int free() const noexcept {
        return cap() - len();
    }

    /**
     * @brief Number of parked workers
     */
    [[nodiscard]] int idle() const;

    [[nodiscard]] bool is_closed() const noexcept {
        return closed_.load(std::memory_order_acquire);
    }

    [[nodiscard]] PoolMetrics metrics() const;

    [[nodiscard]] const PoolConfig& config() const noexcept { return config_; }

private:
    friend class Worker;
    friend class Reaper;

    Status shutdown(bool graceful);

    // Called by workers
    Status push(Worker& worker);
    void retire(Worker& worker, bool holds_slot);
    void report_failure();
    bool shed_overload() noexcept;

    // Called by the reaper
    Clock::duration reap_expired(Timestamp now);
    void reap_all();
    void reclaim();

    Worker& reserve_worker();  // Requires mutex_
    void launch(Worker& worker, Task task);

    PoolConfig config_;
    std::atomic<std::int32_t> capacity_;
    std::atomic<std::int32_t> running_{0};
    std::atomic<bool> closed_{false};

    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::unordered_map<Worker*, std::unique_ptr<Worker>> workers_;  // Every live or retired shell
    IdleList<Worker> idle_;
    std::vector<Worker*> retired_;        // Shells ready for reuse
    std::vector<std::thread> finished_;   // Exited incarnations awaiting join
    std::uint32_t next_worker_id_{0};

    std::mutex handler_mutex_;
    std::function<void()> failure_handler_;

    WaitGroup live_workers_;
    PoolMetricsCollector metrics_;
    Reaper reaper_;
};

template<typename F, typename Arg>
Status Pool::submit(F&& fn, Arg&& arg) {
    using Fn = std::decay_t<F>;
    if constexpr (std::is_constructible_v<bool, const Fn&>) {
        if (!static_cast<bool>(fn)) {
            return Status::InvalidTask;
        }
    }
    return submit(Task{[fn = Fn(std::forward<F>(fn)),
                        arg = std::decay_t<Arg>(std::forward<Arg>(arg))]() mutable {
        std::invoke(fn, arg);
    }});
}

} // namespace workerpool
