// ============================================================================
// DeadlineTimer Implementation
// ============================================================================

#include "fanout/core/deadline_timer.hpp"

#include <algorithm>
#include <functional>

#include "fanout/core/cancellation.hpp"
#include "fanout/core/log.hpp"
#include "fanout/pool/thread_utils.hpp"

namespace fanout {

DeadlineTimer& DeadlineTimer::Instance() {
    static DeadlineTimer instance;
    return instance;
}

DeadlineTimer::DeadlineTimer() : logger_(GetLogger()) {
    thread_ = std::thread([this] { TimerLoop(); });
}

DeadlineTimer::~DeadlineTimer() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void DeadlineTimer::Schedule(Clock::time_point when, std::weak_ptr<CancellationState> state) {
    bool new_front = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (entries_.size() >= prune_threshold_) {
            PruneReleasedLocked();
        }
        new_front = entries_.empty() || when < entries_.front().when;
        entries_.push_back({when, std::move(state)});
        std::push_heap(entries_.begin(), entries_.end(), std::greater<Entry>{});
    }
    // Only an earlier deadline changes what the timer thread is waiting for
    if (new_front) {
        cv_.notify_one();
    }
}

size_t DeadlineTimer::Pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void DeadlineTimer::PruneReleasedLocked() {
    size_t before = entries_.size();
    std::erase_if(entries_, [](const Entry& entry) { return entry.state.expired(); });
    std::make_heap(entries_.begin(), entries_.end(), std::greater<Entry>{});
    prune_threshold_ = std::max(kMinPruneThreshold, entries_.size() * 2);
    if (before != entries_.size()) {
        logger_->trace("deadline timer pruned {} released entries", before - entries_.size());
    }
}

void DeadlineTimer::TimerLoop() {
    SetThreadName("fanout-deadline");

    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (entries_.empty()) {
            cv_.wait(lock, [this] { return stopping_ || !entries_.empty(); });
            continue;
        }

        auto when = entries_.front().when;
        if (Clock::now() < when) {
            // Woken early by a new front entry, shutdown, or spuriously:
            // re-evaluate the heap either way.
            cv_.wait_until(lock, when);
            continue;
        }

        // Collect everything that is due, then fire outside the lock:
        // Cancel() runs callbacks that may schedule new deadlines.
        std::vector<std::weak_ptr<CancellationState>> due;
        auto now = Clock::now();
        while (!entries_.empty() && entries_.front().when <= now) {
            std::pop_heap(entries_.begin(), entries_.end(), std::greater<Entry>{});
            due.push_back(std::move(entries_.back().state));
            entries_.pop_back();
        }

        lock.unlock();
        size_t fired = 0;
        for (auto& weak : due) {
            if (auto state = weak.lock()) {
                if (state->Cancel(CancelReason::Timeout)) {
                    ++fired;
                }
            }
        }
        if (fired > 0) {
            logger_->debug("deadline timer cancelled {} token(s)", fired);
        }
        lock.lock();
    }
}

}  // namespace fanout
