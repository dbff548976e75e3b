// ============================================================================
// WorkerPool Implementation
// ============================================================================

#include "fanout/pool/worker_pool.hpp"

#include <charconv>
#include <cstdlib>
#include <exception>
#include <optional>
#include <string_view>
#include <system_error>

#include "fanout/core/check.hpp"
#include "fanout/core/defer.hpp"
#include "fanout/core/log.hpp"

namespace fanout {

namespace {

// Pool whose worker is running on this thread, if any
thread_local const WorkerPool* tls_current_pool = nullptr;

std::optional<size_t> ReadSizeFromEnv(const char* name) {
    const char* raw = std::getenv(name);
    if (raw == nullptr) {
        return std::nullopt;
    }
    std::string_view text(raw);
    size_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        GetLogger()->warn("ignoring {}='{}': not a non-negative integer", name, text);
        return std::nullopt;
    }
    return value;
}

}  // namespace

// ============================================================================
// Options
// ============================================================================

WorkerPool::Options WorkerPool::Options::FromEnv() {
    Options options;
    if (auto workers = ReadSizeFromEnv("FANOUT_WORKERS")) {
        if (*workers == 0) {
            GetLogger()->warn("ignoring FANOUT_WORKERS=0: a pool needs at least one worker");
        } else {
            options.num_workers = *workers;
        }
    }
    if (auto capacity = ReadSizeFromEnv("FANOUT_QUEUE_CAPACITY")) {
        options.queue_capacity = *capacity;
    }
    return options;
}

// ============================================================================
// Construction / Destruction
// ============================================================================

WorkerPool::WorkerPool() : WorkerPool(Options{}) {}

WorkerPool::WorkerPool(size_t num_workers) : WorkerPool([num_workers] {
        Options options;
        options.num_workers = num_workers;
        return options;
    }()) {}

WorkerPool::WorkerPool(const Options& options)
    : options_(options), logger_(GetLogger()), queue_(options.queue_capacity) {
    FANOUT_CHECK(options_.num_workers >= 1, "a worker pool needs at least one worker");
    InitWorkers();
}

void WorkerPool::InitWorkers() {
    workers_.reserve(options_.num_workers);
    for (size_t i = 0; i < options_.num_workers; ++i) {
        // The index is passed by value: each worker owns its own copy
        workers_.emplace_back([this, i] { WorkerLoop(i); });
    }
    logger_->debug("worker pool started: {} worker(s), queue capacity {}", options_.num_workers,
                   options_.queue_capacity == 0 ? std::string("unbounded")
                                                : std::to_string(options_.queue_capacity));
}

WorkerPool::~WorkerPool() {
    Shutdown(/*drain=*/true);
    JoinWorkers();
}

// ============================================================================
// Submission
// ============================================================================

CancellationSource WorkerPool::MakeItemSource(const CancellationToken& token) const {
    return CancellationSource::Linked({token, shutdown_source_.GetToken()});
}

PushStatus WorkerPool::Post(std::unique_ptr<WorkItem> item) {
    FANOUT_CHECK(item != nullptr, "Post() of a null work item");

    if (IsShutdown()) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        logger_->debug("rejected '{}' (index {}): pool is shut down", item->Key(), item->Index());
        item->Reject(make_error_code(Errc::PoolShutdown));
        return PushStatus::Closed;
    }

    // Copy: the token must stay valid while `item` is moved into the queue
    CancellationToken token = item->Token();
    PushStatus status = queue_.Push(std::move(item), token);
    switch (status) {
        case PushStatus::Ok:
            submitted_.fetch_add(1, std::memory_order_relaxed);
            break;
        case PushStatus::Cancelled:
            cancelled_.fetch_add(1, std::memory_order_relaxed);
            item->Cancel(token.Reason());
            break;
        case PushStatus::Closed:
            rejected_.fetch_add(1, std::memory_order_relaxed);
            logger_->debug("rejected '{}' (index {}): queue closed", item->Key(), item->Index());
            item->Reject(make_error_code(Errc::PoolShutdown));
            break;
    }
    return status;
}

// ============================================================================
// Lifecycle
// ============================================================================

void WorkerPool::Shutdown(bool drain) {
    bool expected = false;
    if (!shutdown_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return;  // The first call decided
    }

    if (drain) {
        FANOUT_CHECK(!InWorkerThread(), "Shutdown(drain=true) from a worker of the same pool");
        logger_->debug("worker pool draining {} queued item(s)", queue_.Size());
        queue_.Close();
        JoinWorkers();
        return;
    }

    // Running bodies observe this through their item tokens
    shutdown_source_.Cancel(CancelReason::Explicit);

    auto abandoned = queue_.CloseAndDrain();
    for (auto& item : abandoned) {
        cancelled_.fetch_add(1, std::memory_order_relaxed);
        item->Cancel(CancelReason::Explicit);
    }
    logger_->debug("worker pool stopped without draining: {} queued item(s) cancelled, {} running",
                   abandoned.size(), ActiveTasks());
}

void WorkerPool::JoinWorkers() {
    std::lock_guard<std::mutex> lock(join_mutex_);
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

// ============================================================================
// Introspection
// ============================================================================

WorkerPool::Stats WorkerPool::GetStats() const noexcept {
    Stats stats;
    stats.submitted = submitted_.load(std::memory_order_relaxed);
    stats.executed = executed_.load(std::memory_order_relaxed);
    stats.cancelled = cancelled_.load(std::memory_order_relaxed);
    stats.rejected = rejected_.load(std::memory_order_relaxed);
    return stats;
}

bool WorkerPool::InWorkerThread() const noexcept {
    return tls_current_pool == this;
}

// ============================================================================
// Worker Thread
// ============================================================================

void WorkerPool::WorkerLoop(size_t worker_index) {
    tls_current_pool = this;
    ApplyWorkerThreadConfig(options_.thread_config, worker_index);

    // Pop() returns nullopt once the queue is closed and empty
    while (auto item = queue_.Pop()) {
        RunItem(**item, worker_index);
    }

    tls_current_pool = nullptr;
}

void WorkerPool::RunItem(WorkItem& item, size_t worker_index) {
    const CancellationToken& token = item.Token();
    if (token.IsCancelled()) {
        // Never start a body once its token has fired
        cancelled_.fetch_add(1, std::memory_order_relaxed);
        item.Cancel(token.Reason());
        return;
    }

    active_.fetch_add(1, std::memory_order_acq_rel);
    Defer done([this] {
        active_.fetch_sub(1, std::memory_order_acq_rel);
        executed_.fetch_add(1, std::memory_order_relaxed);
    });

    // Task::Execute() already isolates the body; this catches failures of
    // the item's own bookkeeping (e.g. allocation while storing the result)
    // so the worker survives and the item still settles.
    try {
        item.Run(worker_index);
    } catch (const std::exception& e) {
        logger_->error("worker {}: work item '{}' (index {}) failed to settle: {}", worker_index, item.Key(),
                       item.Index(), e.what());
        item.Reject(make_error_code(Errc::TaskPanicked));
    } catch (...) {
        logger_->error("worker {}: work item '{}' (index {}) failed to settle: non-standard exception",
                       worker_index, item.Key(), item.Index());
        item.Reject(make_error_code(Errc::TaskPanicked));
    }
}

}  // namespace fanout
