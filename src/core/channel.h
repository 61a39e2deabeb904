#pragma once
// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace core {

// ---------------------------------------------------------------------------
// MpmcChannel<T> -- Multi-Producer Multi-Consumer channel
// ---------------------------------------------------------------------------
// A mutex + condition-variable queue shared between producers (request
// dispatch threads) and a pool of consumers (worker threads).
//
// When capacity == 0 the channel is unbounded (limited only by memory).
// When capacity > 0 the channel is bounded; try_send() returns false
// immediately when the buffer is full.
// ---------------------------------------------------------------------------
template<typename T>
class MpmcChannel {
public:
    explicit MpmcChannel(size_t capacity = 0)
        : capacity_(capacity) {}

    MpmcChannel(const MpmcChannel&)            = delete;
    MpmcChannel& operator=(const MpmcChannel&) = delete;

    // -- Send interface -----------------------------------------------------

    /// Non-blocking enqueue.
    /// @return true if the item was enqueued, false if the channel is
    ///         closed or bounded-and-full.
    bool try_send(T item) {
        std::lock_guard lock(mutex_);
        if (closed_) return false;
        if (capacity_ > 0 && queue_.size() >= capacity_) return false;
        queue_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    // -- Receive interface --------------------------------------------------

    /// Dequeue with timeout.
    /// @return The front item, or std::nullopt if the timeout expired or
    ///         the channel is closed and drained.
    std::optional<T> try_receive_for(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        bool ok = not_empty_.wait_for(lock, timeout, [this] {
            return !queue_.empty() || closed_;
        });
        if (!ok || queue_.empty()) return std::nullopt;
        T item = std::move(queue_.front());
        queue_.pop_front();
        return item;
    }

    // -- Lifecycle -----------------------------------------------------------

    /// Signal that no more items will be sent.  Wakes all blocked waiters.
    /// Items already queued can still be received.
    void close() {
        std::lock_guard lock(mutex_);
        closed_ = true;
        not_empty_.notify_all();
    }

    [[nodiscard]] bool is_closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

private:
    mutable std::mutex      mutex_;
    std::condition_variable not_empty_;
    std::deque<T>           queue_;
    size_t                  capacity_{0};
    bool                    closed_{false};
};

}  // namespace core
