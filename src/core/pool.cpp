/**
 * @file pool.cpp
 * @brief Pool admission, parking, reaping and shutdown
 */

#include "workerpool/core/pool.hpp"

#include <algorithm>
#include <system_error>

#include "workerpool/core/logging.hpp"

namespace workerpool {

namespace {

long long to_millis(Clock::duration d) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

} // namespace

Pool::Pool(PoolConfig config)
    : config_(config.normalized())
    , capacity_(config_.capacity)
    , reaper_(*this) {
    reaper_.start();
    WORKERPOOL_LOG_INFO("pool '{}' created: capacity={} survival={}ms cleanup={}ms",
                        config_.name, config_.capacity,
                        config_.survival_time.count(), config_.mini_cleanup_interval.count());
}

Pool::~Pool() {
    // Waits for every worker and joins their threads.
    shutdown(true);
}

Status Pool::submit(Task task) {
    if (!task) {
        return Status::InvalidTask;
    }
    if (closed_.load(std::memory_order_acquire)) {
        return Status::Closed;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    bool waited = false;
    for (;;) {
        if (closed_.load(std::memory_order_relaxed)) {
            return Status::Closed;
        }

        if (Worker* worker = idle_.pop_front()) {
            lock.unlock();
            metrics_.idle_handoffs().increment();
            metrics_.tasks_submitted().increment();
            worker->deliver(std::move(task));
            return Status::Ok;
        }

        if (free() > 0) {
            Worker& worker = reserve_worker();
            lock.unlock();
            launch(worker, std::move(task));
            metrics_.tasks_submitted().increment();
            return Status::Ok;
        }

        if (!waited) {
            waited = true;
            metrics_.blocked_submits().increment();
            WORKERPOOL_LOG_TRACE("pool '{}' saturated ({} running), submitter waiting",
                                 config_.name, len());
        }
        available_.wait(lock);
    }
}

Status Pool::submit_job(std::shared_ptr<Job> job) {
    if (!job) {
        return Status::InvalidTask;
    }
    return submit([job = std::move(job)] { job->run(); });
}

void Pool::adjust(int capacity) {
    if (capacity < 0 || capacity == cap()) {
        return;
    }
    const int previous = capacity_.exchange(capacity, std::memory_order_acq_rel);
    {
        // Pairs with the free() check made under the lock in submit().
        std::lock_guard<std::mutex> lock(mutex_);
    }
    available_.notify_all();
    WORKERPOOL_LOG_INFO("pool '{}' capacity adjusted {} -> {}", config_.name, previous, capacity);
}

Status Pool::close() {
    return shutdown(false);
}

Status Pool::close_graceful() {
    return shutdown(true);
}

Status Pool::shutdown(bool graceful) {
    if (!closed_.load(std::memory_order_acquire)) {
        bool first = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!closed_.load(std::memory_order_relaxed)) {
                closed_.store(true, std::memory_order_release);
                first = true;
            }
        }
        if (first) {
            available_.notify_all();
            WORKERPOOL_LOG_INFO("pool '{}' closing: running={} graceful={}",
                                config_.name, len(), graceful);
        }
    }

    reaper_.cancel();

    if (graceful) {
        live_workers_.wait();
        reclaim();
    }
    return Status::Ok;
}

void Pool::set_failure_handler(std::function<void()> handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    failure_handler_ = std::move(handler);
}

int Pool::idle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(idle_.size());
}

PoolMetrics Pool::metrics() const {
    auto m = metrics_.snapshot();
    m.running = len();
    m.capacity = cap();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        m.idle = static_cast<int>(idle_.size());
        m.allocated_workers = static_cast<int>(workers_.size());
    }
    return m;
}

Worker& Pool::reserve_worker() {
    Worker* worker = nullptr;
    if (!retired_.empty()) {
        worker = retired_.back();
        retired_.pop_back();
        metrics_.workers_recycled().increment();
    } else {
        auto shell = std::make_unique<Worker>(next_worker_id_++, *this);
        worker = shell.get();
        workers_.emplace(worker, std::move(shell));
        metrics_.workers_spawned().increment();
    }

    // Reserved under the lock so concurrent submitters never start more
    // workers than the capacity allows.
    metrics_.observe_running(running_.fetch_add(1, std::memory_order_acq_rel) + 1);
    live_workers_.add();
    return *worker;
}

void Pool::launch(Worker& worker, Task task) {
    try {
        worker.start(std::move(task));
    } catch (const std::system_error& e) {
        WORKERPOOL_LOG_ERROR("pool '{}' failed to start worker {}: {}",
                             config_.name, worker.id(), e.what());
        retire(worker, true);
        throw;
    }
    WORKERPOOL_LOG_TRACE("pool '{}' started worker {}", config_.name, worker.id());
}

Status Pool::push(Worker& worker) {
    metrics_.tasks_completed().increment();

    if (closed_.load(std::memory_order_acquire)) {
        return Status::Closed;
    }

    if (shed_overload()) {
        metrics_.overload_retirements().increment();
        WORKERPOOL_LOG_DEBUG("pool '{}' overloaded, retiring worker {} ({} running, capacity {})",
                             config_.name, worker.id(), len(), cap());
        return Status::Overload;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_.load(std::memory_order_relaxed)) {
            return Status::Closed;
        }
        worker.mark_idle(Clock::now());
        idle_.push_back(worker);
    }
    available_.notify_one();
    return Status::Ok;
}

bool Pool::shed_overload() noexcept {
    auto running = running_.load(std::memory_order_acquire);
    while (running > capacity_.load(std::memory_order_acquire)) {
        if (running_.compare_exchange_weak(running, running - 1, std::memory_order_acq_rel)) {
            return true;
        }
    }
    return false;
}

void Pool::retire(Worker& worker, bool holds_slot) {
    // A shell without a thread may be freed by reclaim() once it is listed.
    const auto id = worker.id();
    {
        // The shell is reusable before the slot is given back, and the
        // release happens under the lock so a waiting submitter sees both.
        std::lock_guard<std::mutex> lock(mutex_);
        std::thread thread = worker.release_thread();
        if (thread.joinable()) {
            finished_.push_back(std::move(thread));
        }
        retired_.push_back(&worker);
        if (holds_slot) {
            running_.fetch_sub(1, std::memory_order_acq_rel);
        }
    }
    available_.notify_one();
    WORKERPOOL_LOG_TRACE("pool '{}' retired worker {}", config_.name, id);
    live_workers_.done();
}

void Pool::report_failure() {
    metrics_.tasks_failed().increment();

    std::function<void()> handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = failure_handler_;
    }
    if (!handler) {
        return;
    }

    try {
        handler();
    } catch (const std::exception& e) {
        WORKERPOOL_LOG_ERROR("pool '{}' failure handler threw: {}", config_.name, e.what());
    } catch (...) {
        WORKERPOOL_LOG_ERROR("pool '{}' failure handler threw a non-standard exception", config_.name);
    }
}

Clock::duration Pool::reap_expired(Timestamp now) {
    reclaim();

    const Clock::duration survival = config_.survival_time;
    Clock::duration next_wait = survival;
    std::size_t reaped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Park order is age order: stop at the first worker still in its window.
        while (Worker* worker = idle_.front()) {
            const auto idle_for = now - worker->last_idle_at();
            if (idle_for < survival) {
                next_wait = survival - idle_for;
                break;
            }
            idle_.pop_front();
            worker->stop();
            reaped++;
        }
    }

    if (reaped > 0) {
        metrics_.workers_reaped().increment(reaped);
        WORKERPOOL_LOG_DEBUG("pool '{}' reaped {} idle workers", config_.name, reaped);
    }

    next_wait = std::max<Clock::duration>(next_wait, config_.mini_cleanup_interval);
    WORKERPOOL_LOG_TRACE("pool '{}' next reap in {}ms", config_.name, to_millis(next_wait));
    return next_wait;
}

void Pool::reap_all() {
    std::size_t reaped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        while (Worker* worker = idle_.pop_front()) {
            worker->stop();
            reaped++;
        }
    }
    metrics_.workers_reaped().increment(reaped);
    WORKERPOOL_LOG_DEBUG("pool '{}' final sweep stopped {} idle workers", config_.name, reaped);
}

void Pool::reclaim() {
    std::vector<std::thread> finished;
    std::vector<std::unique_ptr<Worker>> shells;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished.swap(finished_);
        // Every shell in retired_ has already handed its thread to finished_.
        shells.reserve(retired_.size());
        for (Worker* worker : retired_) {
            auto it = workers_.find(worker);
            shells.push_back(std::move(it->second));
            workers_.erase(it);
        }
        retired_.clear();
    }

    for (auto& thread : finished) {
        thread.join();
    }
    // Shells are destroyed on return, after their threads have exited.

    if (!finished.empty() || !shells.empty()) {
        metrics_.threads_joined().increment(finished.size());
        WORKERPOOL_LOG_DEBUG("pool '{}' joined {} worker threads, freed {} workers",
                             config_.name, finished.size(), shells.size());
    }
}

} // namespace workerpool
