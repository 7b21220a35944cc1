/**
 * @file reaper.cpp
 * @brief Reaper timer loop
 */

#include "workerpool/core/reaper.hpp"

#include "workerpool/core/pool.hpp"

namespace workerpool {

void Reaper::start() {
    thread_ = std::thread(&Reaper::run, this);
}

void Reaper::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();

    std::lock_guard<std::mutex> join_lock(join_mutex_);
    if (thread_.joinable()) {
        thread_.join();
    }
}

void Reaper::run() {
    Clock::duration wait = pool_.config().survival_time;

    std::unique_lock<std::mutex> lock(mutex_);
    while (!cv_.wait_for(lock, wait, [this] { return cancelled_; })) {
        lock.unlock();
        wait = pool_.reap_expired(Clock::now());
        lock.lock();
    }
    lock.unlock();

    pool_.reap_all();
}

} // namespace workerpool
