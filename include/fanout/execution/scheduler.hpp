// ============================================================================
// fanout/execution/scheduler.hpp - WorkerPool -> P2300 Scheduler Adapter
// ============================================================================
//
// Wraps a WorkerPool as a P2300 scheduler so sender pipelines can hop onto
// its workers. Only available when stdexec is found (FANOUT_HAS_STDEXEC).
//
// schedule() posts a work item to the pool. The sender completes with:
//   set_value()            on a worker, if no stop was requested
//   set_stopped()          if the receiver's stop token fired first, or the
//                          pool cancelled the item before it ran
//   set_error(error_code)  if the pool refused the item (shut down)
//
// USAGE:
// ------
//   WorkerPool pool(4);
//   auto scheduler = fanout::execution::AsScheduler(pool);
//
//   auto sender = stdexec::schedule(scheduler)
//               | stdexec::then([] { return 42; });
//   auto [value] = stdexec::sync_wait(std::move(sender)).value();
//
// ============================================================================

#pragma once

#include <memory>
#include <system_error>
#include <utility>

#include <stdexec/execution.hpp>

#include "fanout/pool/work_item.hpp"
#include "fanout/pool/worker_pool.hpp"

namespace fanout::execution {

class PoolScheduler;

// ============================================================================
// ScheduleOperation - operation_state for schedule() sender
// ============================================================================
template <typename Receiver>
class ScheduleOperation {
   public:
    ScheduleOperation(WorkerPool* pool, Receiver rcvr) noexcept : pool_(pool), receiver_(std::move(rcvr)) {}

    ScheduleOperation(ScheduleOperation&&) = delete;
    ScheduleOperation& operator=(ScheduleOperation&&) = delete;

    void start() noexcept { pool_->Post(std::make_unique<Item>(this, pool_->MakeItemSource(CancellationToken::None()))); }

   private:
    // Queued on the pool; completes the receiver exactly once
    class Item final : public WorkItem {
       public:
        Item(ScheduleOperation* op, CancellationSource source)
            : op_(op), source_(std::move(source)), token_(source_.GetToken()) {}

        const CancellationToken& Token() const noexcept override { return token_; }

        void Run(size_t /*worker_index*/) override { op_->Complete(); }

        void Cancel(CancelReason /*reason*/) override { stdexec::set_stopped(std::move(op_->receiver_)); }

        void Reject(Error error) override { stdexec::set_error(std::move(op_->receiver_), error); }

       private:
        ScheduleOperation* op_;
        CancellationSource source_;
        CancellationToken token_;
    };

    void Complete() noexcept {
        if constexpr (stdexec::unstoppable_token<stdexec::stop_token_of_t<stdexec::env_of_t<Receiver>>>) {
            stdexec::set_value(std::move(receiver_));
        } else if (stdexec::get_stop_token(stdexec::get_env(receiver_)).stop_requested()) {
            stdexec::set_stopped(std::move(receiver_));
        } else {
            stdexec::set_value(std::move(receiver_));
        }
    }

    WorkerPool* pool_;
    Receiver receiver_;
};

// ============================================================================
// ScheduleSender - sender returned by schedule()
// ============================================================================
class ScheduleSender {
   public:
    using sender_concept = stdexec::sender_t;

    explicit ScheduleSender(WorkerPool* pool) noexcept : pool_(pool) {}

    template <class Receiver>
    auto connect(Receiver rcvr) const noexcept -> ScheduleOperation<Receiver> {
        return ScheduleOperation<Receiver>{pool_, std::move(rcvr)};
    }

    template <class, class...>
    static consteval auto get_completion_signatures() noexcept {
        return stdexec::completion_signatures<stdexec::set_value_t(), stdexec::set_error_t(std::error_code),
                                              stdexec::set_stopped_t()>{};
    }

   private:
    friend class PoolScheduler;
    WorkerPool* pool_;
};

// ============================================================================
// PoolScheduler - P2300 scheduler wrapping a WorkerPool
// ============================================================================
class PoolScheduler {
   public:
    using scheduler_concept = stdexec::scheduler_t;

    explicit PoolScheduler(WorkerPool* pool) noexcept : pool_(pool) {}

    [[nodiscard]] auto schedule() const noexcept -> ScheduleSender { return ScheduleSender{pool_}; }

    friend bool operator==(const PoolScheduler& a, const PoolScheduler& b) noexcept { return a.pool_ == b.pool_; }

   private:
    WorkerPool* pool_;
};

inline PoolScheduler AsScheduler(WorkerPool& pool) noexcept {
    return PoolScheduler{&pool};
}

}  // namespace fanout::execution
