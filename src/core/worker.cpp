/**
 * @file worker.cpp
 * @brief Worker execution loop
 */

#include "workerpool/core/worker.hpp"

#include <exception>

#include "workerpool/core/logging.hpp"
#include "workerpool/core/pool.hpp"

namespace workerpool {

void Worker::start(Task first) {
    thread_ = std::thread(&Worker::run, this);
    deliver(std::move(first));
}

void Worker::run() {
    bool holds_slot = true;

    for (;;) {
        Task task = mailbox_.pop();
        if (!task) {
            break;  // Termination sentinel
        }

        if (!execute(task)) {
            break;
        }
        task = nullptr;

        const Status parked = pool_.push(*this);
        if (parked != Status::Ok) {
            WORKERPOOL_LOG_TRACE("worker {} not parked: {}", id_, to_string(parked));
            // The pool already gave back our slot when shedding overload.
            holds_slot = parked != Status::Overload;
            break;
        }
    }

    pool_.retire(*this, holds_slot);
}

bool Worker::execute(const Task& task) {
    try {
        task();
        return true;
    } catch (const std::exception& e) {
        WORKERPOOL_LOG_ERROR("worker {}: task failed: {}", id_, e.what());
    } catch (...) {
        WORKERPOOL_LOG_ERROR("worker {}: task failed with a non-standard exception", id_);
    }
    pool_.report_failure();
    return false;
}

} // namespace workerpool
