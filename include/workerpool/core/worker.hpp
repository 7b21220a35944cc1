#pragma once

/**
 * @file worker.hpp
 * @brief Reusable execution context owned by a Pool
 */

#include <cstdint>
#include <thread>
#include <utility>

#include "workerpool/core/idle_list.hpp"
#include "workerpool/core/mailbox.hpp"
#include "workerpool/core/task.hpp"

namespace workerpool {

class Pool;

/**
 * @brief One concurrently-running task slot
 *
 * Each live worker runs on its own thread and receives work one item at
 * a time through a single-slot mailbox. After a task the worker asks the
 * pool to park it; if the pool refuses (closed or overloaded), or the
 * task threw, the thread exits and hands its handle and shell back to
 * the pool. An empty Task in the mailbox means "terminate".
 *
 * Workers are created and owned by Pool; user code never constructs one.
 */
class Worker : public IdleHook<Worker> {
public:
    Worker(std::uint32_t id, Pool& pool)
        : id_(id)
        , pool_(pool) {}

    ~Worker() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    /**
     * @brief Start a new incarnation of this worker with its first task
     *
     * The previous incarnation's thread must already have been handed
     * over with release_thread().
     * @throws std::system_error if the thread cannot be created
     */
    void start(Task first);

    /**
     * @brief Hand the next task to a parked worker
     */
    void deliver(Task task) {
        mailbox_.push(std::move(task));
    }

    /**
     * @brief Ask a parked worker to terminate
     */
    void stop() {
        mailbox_.push(Task{});
    }

    /**
     * @brief Give up ownership of the current incarnation's thread
     *
     * Called by the retiring thread itself; the pool joins the returned
     * handle once the thread has exited.
     */
    std::thread release_thread() noexcept {
        return std::move(thread_);
    }

    [[nodiscard]] std::uint32_t id() const noexcept { return id_; }

    // Guarded by the pool mutex.
    [[nodiscard]] Timestamp last_idle_at() const noexcept { return last_idle_at_; }

    void mark_idle(Timestamp now) noexcept {
        last_idle_at_ = now;
    }

private:
    void run();
    bool execute(const Task& task);

    std::uint32_t id_;
    Pool& pool_;
    Mailbox<Task> mailbox_;
    std::thread thread_;
    Timestamp last_idle_at_{};
};

} // namespace workerpool
