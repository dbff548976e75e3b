// ============================================================================
// fanout/pool/work_queue.hpp - FIFO Work Queue with Backpressure
// ============================================================================
//
// WorkQueue<T> is the shared queue between producers (Submit, RunBatch) and
// the pool's workers.
//
// 1. FIFO: items are popped in the order they were pushed
// 2. BOUNDED OR NOT: capacity 0 means unbounded; otherwise Push() blocks
//    while the queue is full (backpressure) instead of dropping work
// 3. CANCELLABLE WAIT: a blocked Push() returns PushStatus::Cancelled as
//    soon as the producer's token is cancelled
// 4. CLOSE SEMANTICS: after Close(), Push() fails with PushStatus::Closed and
//    Pop() drains what is left, then returns std::nullopt
//
// ============================================================================

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "fanout/core/cancellation.hpp"

namespace fanout {

enum class PushStatus : uint8_t {
    Ok,
    Closed,
    Cancelled,
};

inline std::string_view ToString(PushStatus status) noexcept {
    switch (status) {
        case PushStatus::Ok:
            return "ok";
        case PushStatus::Closed:
            return "closed";
        case PushStatus::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

template <typename T>
class WorkQueue {
   public:
    explicit WorkQueue(size_t capacity = 0) : capacity_(capacity) {}

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    // Blocks while the queue is full. `item` is moved from only on
    // PushStatus::Ok, so the caller can still settle it otherwise.
    PushStatus Push(T&& item, const CancellationToken& token = CancellationToken::None()) {
        std::optional<CancellationCallbackGuard> wake_on_cancel;
        if (capacity_ != 0 && token.IsValid()) {
            // Registered before taking the lock: the callback runs inline
            // when the token is already cancelled, and it locks mutex_.
            wake_on_cancel.emplace(token, [this] {
                std::lock_guard<std::mutex> lock(mutex_);
                not_full_.notify_all();
            });
        }

        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_full_.wait(lock, [&] { return closed_ || token.IsCancelled() || HasRoom(); });
            if (closed_) {
                return PushStatus::Closed;
            }
            if (token.IsCancelled()) {
                return PushStatus::Cancelled;
            }
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return PushStatus::Ok;
    }

    // Blocks until an item is available; std::nullopt once closed and empty
    std::optional<T> Pop() {
        std::optional<T> item;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
            if (items_.empty()) {
                return std::nullopt;
            }
            item.emplace(std::move(items_.front()));
            items_.pop_front();
        }
        not_full_.notify_one();
        return item;
    }

    // Refuse new items; consumers drain what is left
    void Close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    // Refuse new items and hand back everything still queued, in FIFO order
    std::vector<T> CloseAndDrain() {
        std::vector<T> drained;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            drained.reserve(items_.size());
            for (auto& item : items_) {
                drained.push_back(std::move(item));
            }
            items_.clear();
        }
        not_empty_.notify_all();
        not_full_.notify_all();
        return drained;
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool IsClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    // 0 means unbounded
    size_t Capacity() const noexcept { return capacity_; }

   private:
    bool HasRoom() const { return capacity_ == 0 || items_.size() < capacity_; }

    const size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    bool closed_ = false;
};

}  // namespace fanout
