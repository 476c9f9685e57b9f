// SPDX-License-Identifier: MIT

// lib/stream/bounded_queue.hpp
#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace streamkit {

// BoundedQueue - blocking FIFO between one producer and one consumer.
//
// Push() blocks while the queue is full; Pop() blocks while it is empty.
// Close() ends the stream from the producer side: Pop() drains what is
// left, then returns std::nullopt. Abandon() is the consumer's way out:
// pending and future Push() calls return false instead of blocking.
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /// Enqueue `item`, waiting for room. Returns false if the consumer has
    /// abandoned the queue or it was closed; the item is dropped.
    bool Push(T item) {
        std::unique_lock lock(mutex_);
        not_full_.wait(lock, [this] {
            return items_.size() < capacity_ || abandoned_ || closed_;
        });
        if (abandoned_ || closed_) return false;
        items_.push_back(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    /// Dequeue the next item, waiting for one. std::nullopt once the queue
    /// is closed and empty.
    std::optional<T> Pop() {
        std::unique_lock lock(mutex_);
        not_empty_.wait(lock, [this] { return !items_.empty() || closed_; });
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    /// No more items will be pushed.
    void Close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    /// Consumer stops taking items: wake the producer and drop what is queued.
    void Abandon() {
        {
            std::lock_guard lock(mutex_);
            abandoned_ = true;
            items_.clear();
        }
        not_full_.notify_all();
    }

    bool Abandoned() const {
        std::lock_guard lock(mutex_);
        return abandoned_;
    }

    size_t Size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    size_t capacity() const noexcept { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::deque<T> items_;
    bool closed_ = false;
    bool abandoned_ = false;
};

}  // namespace streamkit
