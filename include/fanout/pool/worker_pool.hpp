// ============================================================================
// fanout/pool/worker_pool.hpp - Fixed-Size Worker Pool
// ============================================================================
//
// WorkerPool runs tasks on a fixed number of worker threads pulling from one
// shared FIFO queue. It bounds concurrency (threads), memory (an optional
// queue capacity) and, through them, the pressure put on whatever the task
// bodies talk to.
//
// KEY CONCEPTS:
// -------------
// 1. FIXED SIZE: N workers, chosen at construction, for the pool's lifetime
// 2. BACKPRESSURE: with a bounded queue, Submit() blocks while it is full
// 3. ISOLATION: a throwing body becomes a recovered Failure; the worker
//    keeps going
// 4. EXACTLY ONE RESULT: every accepted item is settled once - run,
//    cancelled before start, or rejected
//
// USAGE:
// ------
//   WorkerPool::Options opts;
//   opts.num_workers = 4;
//   opts.queue_capacity = 64;
//   WorkerPool pool(opts);
//
//   auto future = pool.Submit(MakeTask([](const TaskContext& ctx) {
//       return Compute(ctx.token);
//   }));
//   Result<int> r = future.Get();
//
//   pool.Shutdown(/*drain=*/true);
//
// SHUTDOWN:
// ---------
//   Shutdown(true)  - stop accepting, finish queued and running items, join
//   Shutdown(false) - stop accepting, cancel running items' tokens, settle
//                     queued items as Cancelled, return without waiting
// The destructor performs Shutdown(true) unless a shutdown already happened,
// and always joins the workers.
//
// ============================================================================

#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/logger.h>

#include "fanout/core/cancellation.hpp"
#include "fanout/core/future.hpp"
#include "fanout/core/result.hpp"
#include "fanout/core/task.hpp"
#include "fanout/pool/thread_utils.hpp"
#include "fanout/pool/work_item.hpp"
#include "fanout/pool/work_queue.hpp"

namespace fanout {

class WorkerPool {
   public:
    // ========================================================================
    // Options
    // ========================================================================
    struct Options {
        // Number of worker threads (default: hardware_concurrency, at least 1)
        size_t num_workers = std::max<size_t>(1, std::thread::hardware_concurrency());

        // Maximum queued (not yet running) items; 0 means unbounded
        size_t queue_capacity = 0;

        WorkerThreadConfig thread_config;

        // Defaults overridden by FANOUT_WORKERS and FANOUT_QUEUE_CAPACITY.
        // Malformed values are ignored with a warning.
        static Options FromEnv();
    };

    struct Stats {
        size_t submitted = 0;  // accepted into the queue
        size_t executed = 0;   // bodies run to completion
        size_t cancelled = 0;  // settled as Cancelled without running
        size_t rejected = 0;   // refused after shutdown
    };

    // ========================================================================
    // Construction
    // ========================================================================

    WorkerPool();

    explicit WorkerPool(size_t num_workers);

    explicit WorkerPool(const Options& options);

    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // ========================================================================
    // Submission
    // ========================================================================

    // Enqueue `task`; blocks while a bounded queue is full. The body sees a
    // token that is cancelled when `token` is, or when the pool is shut
    // down without draining.
    //
    // The returned future always settles:
    //   - Cancelled   if `token` fires before the body starts
    //   - Failure     with Errc::PoolShutdown if the pool no longer accepts
    template <typename T>
    Future<Result<T>> Submit(Task<T> task, const CancellationToken& token = CancellationToken::None()) {
        Promise<Result<T>> promise;
        auto future = promise.GetFuture();
        Post(std::make_unique<PromiseWorkItem<T>>(std::move(task), MakeItemSource(token), std::move(promise)));
        return future;
    }

    // Lower-level enqueue used by Submit() and the fan-out coordinator.
    // Blocks while a bounded queue is full. Anything other than
    // PushStatus::Ok means the pool already settled the item (Cancel or
    // Reject) before returning.
    PushStatus Post(std::unique_ptr<WorkItem> item);

    // Cancellation source for an item submitted under `token`: cancelled by
    // `token` and by Shutdown(false).
    [[nodiscard]] CancellationSource MakeItemSource(const CancellationToken& token) const;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    // Idempotent: the first call decides the mode. Shutdown(true) from one
    // of this pool's own workers is a programming fault (it would join
    // itself).
    void Shutdown(bool drain);

    bool IsShutdown() const noexcept { return shutdown_.load(std::memory_order_acquire); }

    // ========================================================================
    // Introspection
    // ========================================================================

    size_t NumWorkers() const noexcept { return workers_.size(); }

    // 0 means unbounded
    size_t QueueCapacity() const noexcept { return queue_.Capacity(); }

    // Items queued but not started
    size_t PendingTasks() const { return queue_.Size(); }

    // Items currently inside Run()
    size_t ActiveTasks() const noexcept { return active_.load(std::memory_order_acquire); }

    Stats GetStats() const noexcept;

    // true when called from one of this pool's workers
    bool InWorkerThread() const noexcept;

   private:
    void InitWorkers();

    void WorkerLoop(size_t worker_index);

    void RunItem(WorkItem& item, size_t worker_index);

    void JoinWorkers();

    Options options_;
    std::shared_ptr<spdlog::logger> logger_;

    WorkQueue<std::unique_ptr<WorkItem>> queue_;
    std::vector<std::thread> workers_;
    std::mutex join_mutex_;

    // Cancelled by Shutdown(false); parent of every item token
    CancellationSource shutdown_source_;
    std::atomic<bool> shutdown_{false};

    std::atomic<size_t> active_{0};
    std::atomic<size_t> submitted_{0};
    std::atomic<size_t> executed_{0};
    std::atomic<size_t> cancelled_{0};
    std::atomic<size_t> rejected_{0};
};

}  // namespace fanout
