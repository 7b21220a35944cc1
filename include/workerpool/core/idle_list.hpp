#pragma once

/**
 * @file idle_list.hpp
 * @brief Intrusive, park-ordered list of idle workers
 */

#include <cstddef>
#include <stdexcept>

namespace workerpool {

template<typename T>
class IdleList;

/**
 * @brief Link storage embedded in every element of an IdleList
 *
 * Derive from IdleHook<T> to make T linkable. An element can be on at
 * most one list at a time.
 */
template<typename T>
class IdleHook {
public:
    IdleHook() = default;

    IdleHook(const IdleHook&) = delete;
    IdleHook& operator=(const IdleHook&) = delete;

    [[nodiscard]] bool is_linked() const noexcept { return linked_; }

private:
    friend class IdleList<T>;

    T* prev_{nullptr};
    T* next_{nullptr};
    bool linked_{false};
};

/**
 * @brief Doubly-linked list ordered by park time (oldest at front)
 *
 * All operations are O(1). The list does not own its elements.
 * Claiming from the front hands out the longest-idle worker, and since
 * park order equals age order the front is also the next reaping
 * candidate.
 *
 * Not thread-safe; the pool guards it with its mutex.
 *
 * @tparam T Element type deriving from IdleHook<T>
 */
template<typename T>
class IdleList {
public:
    IdleList() = default;

    IdleList(const IdleList&) = delete;
    IdleList& operator=(const IdleList&) = delete;

    ~IdleList() { clear(); }

    /**
     * @brief Append an element (newest idle)
     * @throws std::logic_error if the element is already linked
     */
    void push_back(T& element) {
        auto& hook = hook_of(element);
        if (hook.linked_) {
            throw std::logic_error("IdleList::push_back: element already linked");
        }
        hook.prev_ = tail_;
        hook.next_ = nullptr;
        hook.linked_ = true;
        if (tail_) {
            hook_of(*tail_).next_ = &element;
        } else {
            head_ = &element;
        }
        tail_ = &element;
        size_++;
    }

    /**
     * @brief Oldest element, or nullptr if empty
     */
    [[nodiscard]] T* front() const noexcept { return head_; }

    /**
     * @brief Element parked after @p element, or nullptr
     */
    [[nodiscard]] T* next(const T& element) const noexcept {
        return hook_of(element).next_;
    }

    /**
     * @brief Unlink and return the oldest element, or nullptr if empty
     */
    T* pop_front() noexcept {
        T* element = head_;
        if (element) {
            unlink(*element);
        }
        return element;
    }

    /**
     * @brief Unlink an arbitrary element
     * @return false if the element was not on the list
     */
    bool remove(T& element) noexcept {
        if (!hook_of(element).linked_) {
            return false;
        }
        unlink(element);
        return true;
    }

    /**
     * @brief Unlink every element
     */
    void clear() noexcept {
        while (head_) {
            unlink(*head_);
        }
    }

    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

private:
    static IdleHook<T>& hook_of(T& element) noexcept {
        return static_cast<IdleHook<T>&>(element);
    }

    static const IdleHook<T>& hook_of(const T& element) noexcept {
        return static_cast<const IdleHook<T>&>(element);
    }

    void unlink(T& element) noexcept {
        auto& hook = hook_of(element);
        if (hook.prev_) {
            hook_of(*hook.prev_).next_ = hook.next_;
        } else {
            head_ = hook.next_;
        }
        if (hook.next_) {
            hook_of(*hook.next_).prev_ = hook.prev_;
        } else {
            tail_ = hook.prev_;
        }
        hook.prev_ = nullptr;
        hook.next_ = nullptr;
        hook.linked_ = false;
        size_--;
    }

    T* head_{nullptr};
    T* tail_{nullptr};
    std::size_t size_{0};
};

} // namespace workerpool
