// ============================================================================
// fanout/core/deadline_timer.hpp - Deadline Service for Cancellation Tokens
// ============================================================================
//
// DeadlineTimer is the process-wide timer thread behind timeout-bound
// cancellation sources. Entries are (deadline, weak state) pairs kept in a
// min-heap; when an entry comes due, the state is cancelled with
// CancelReason::Timeout. The timer never extends a token's lifetime: entries
// whose state has been released are discarded when they come due, and the
// whole heap is pruned of them whenever it grows past a threshold that
// doubles with the number of live entries.
//
// The thread is started on first use and joined at static destruction.
//
// ============================================================================

#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <spdlog/logger.h>

namespace fanout {

class CancellationState;

class DeadlineTimer {
   public:
    using Clock = std::chrono::steady_clock;

    static DeadlineTimer& Instance();

    ~DeadlineTimer();

    DeadlineTimer(const DeadlineTimer&) = delete;
    DeadlineTimer& operator=(const DeadlineTimer&) = delete;

    // Cancel `state` with CancelReason::Timeout at `when`
    void Schedule(Clock::time_point when, std::weak_ptr<CancellationState> state);

    // Number of entries not yet due, including released ones not pruned yet
    size_t Pending() const;

    // Heap size at which Schedule() first prunes released entries
    static constexpr size_t kMinPruneThreshold = 64;

   private:
    DeadlineTimer();

    void TimerLoop();

    // Drop entries whose state is gone; mutex_ must be held
    void PruneReleasedLocked();

    struct Entry {
        Clock::time_point when;
        std::weak_ptr<CancellationState> state;

        bool operator>(const Entry& other) const { return when > other.when; }
    };

    // Min-heap on `when` (std::push_heap/pop_heap with std::greater)
    std::vector<Entry> entries_;
    size_t prune_threshold_ = kMinPruneThreshold;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;

    // Held so the logger outlives the timer thread at static destruction
    std::shared_ptr<spdlog::logger> logger_;
    std::thread thread_;
};

}  // namespace fanout
