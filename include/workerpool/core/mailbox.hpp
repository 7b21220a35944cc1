#pragma once

/**
 * @file mailbox.hpp
 * @brief Single-slot blocking channel used to hand work to one worker
 */

#include <condition_variable>
#include <mutex>
#include <optional>
#include <utility>

namespace workerpool {

/**
 * @brief Single-slot blocking mailbox
 *
 * Holds at most one item. Producers block while the slot is occupied,
 * the consumer blocks while it is empty. Used by the pool to deliver the
 * next task (or the termination sentinel) to a parked worker.
 *
 * @tparam T Item type (must be movable)
 */
template<typename T>
class Mailbox {
public:
    Mailbox() = default;

    // Non-copyable, non-movable (due to synchronization primitives)
    Mailbox(const Mailbox&) = delete;
    Mailbox& operator=(const Mailbox&) = delete;
    Mailbox(Mailbox&&) = delete;
    Mailbox& operator=(Mailbox&&) = delete;

    /**
     * @brief Deliver an item, blocking while the slot is occupied
     */
    void push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return !slot_.has_value(); });
        slot_.emplace(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
    }

    /**
     * @brief Take the item, blocking until one is delivered
     */
    T pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return slot_.has_value(); });
        T item = std::move(*slot_);
        slot_.reset();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

private:
    std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::optional<T> slot_;
};

} // namespace workerpool
