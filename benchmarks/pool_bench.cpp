// ============================================================================
// Worker Pool and Fan-Out Benchmarks
// ============================================================================
//
// Overhead of the pool and the batch coordinator for trivial task bodies:
// what a submission, a cancellation and a result slot cost on top of the
// work itself.
//
// RUN:
//   cd build && ./benchmarks/pool_bench
//
// ============================================================================

#include <benchmark/benchmark.h>

#include <vector>

#include "fanout/core/cancellation.hpp"
#include "fanout/pool/fan_out.hpp"

using namespace fanout;

// ============================================================================
// Cancellation Benchmarks
// ============================================================================

static void BM_CancellationSourceCreate(benchmark::State& state) {
    for (auto _ : state) {
        CancellationSource source;
        benchmark::DoNotOptimize(source);
    }
}
BENCHMARK(BM_CancellationSourceCreate);

static void BM_CancellationTokenCheck(benchmark::State& state) {
    CancellationSource source;
    auto token = source.GetToken();
    for (auto _ : state) {
        benchmark::DoNotOptimize(token.IsCancelled());
    }
}
BENCHMARK(BM_CancellationTokenCheck);

// Cancel propagating down a chain of linked children
static void BM_CancelPropagation(benchmark::State& state) {
    const auto depth = static_cast<size_t>(state.range(0));
    for (auto _ : state) {
        CancellationSource root;
        std::vector<CancellationSource> chain;
        chain.reserve(depth);
        CancellationToken parent = root.GetToken();
        for (size_t i = 0; i < depth; ++i) {
            chain.emplace_back(parent);
            parent = chain.back().GetToken();
        }
        root.Cancel();
        benchmark::DoNotOptimize(parent.IsCancelled());
    }
}
BENCHMARK(BM_CancelPropagation)->Range(1, 64);

// ============================================================================
// Worker Pool Benchmarks
// ============================================================================

// Submit + Get round trip for a single trivial task
static void BM_SubmitAndGet(benchmark::State& state) {
    WorkerPool pool(static_cast<size_t>(state.range(0)));
    for (auto _ : state) {
        auto future = pool.Submit(MakeTask([] { return 1; }));
        benchmark::DoNotOptimize(future.Get());
    }
}
BENCHMARK(BM_SubmitAndGet)->Arg(1)->Arg(4);

// Submit throughput: many in flight, joined at the end
static void BM_SubmitThroughput(benchmark::State& state) {
    WorkerPool pool(4);
    const auto n = static_cast<size_t>(state.range(0));
    for (auto _ : state) {
        std::vector<Future<Result<int>>> futures;
        futures.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            futures.push_back(pool.Submit(MakeTask([] { return 1; })));
        }
        for (auto& f : futures) {
            f.Wait();
        }
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
}
BENCHMARK(BM_SubmitThroughput)->Range(64, 4096);

// ============================================================================
// Fan-Out Benchmarks
// ============================================================================

static void BM_RunBatch(benchmark::State& state) {
    WorkerPool pool(4);
    const auto n = static_cast<size_t>(state.range(0));
    for (auto _ : state) {
        std::vector<Task<int>> tasks;
        tasks.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            tasks.push_back(MakeTask([i] { return static_cast<int>(i); }));
        }
        auto results = RunBatch(pool, std::move(tasks));
        benchmark::DoNotOptimize(results);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
}
BENCHMARK(BM_RunBatch)->Range(8, 4096);

// Batch cancelled before dispatch: cost of settling every item as Cancelled
static void BM_RunBatchPreCancelled(benchmark::State& state) {
    WorkerPool pool(4);
    const auto n = static_cast<size_t>(state.range(0));
    CancellationSource source;
    source.Cancel();
    for (auto _ : state) {
        std::vector<Task<int>> tasks;
        tasks.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            tasks.push_back(MakeTask([] { return 0; }));
        }
        auto results = RunBatch(pool, std::move(tasks), source.GetToken());
        benchmark::DoNotOptimize(results);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
}
BENCHMARK(BM_RunBatchPreCancelled)->Range(8, 4096);
