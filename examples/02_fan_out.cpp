// ============================================================================
// Example 02: Fan-Out / Fan-In
// ============================================================================
//
// Running a batch of keyed tasks across a pool, streaming results as they
// arrive and reading the ordered results and batch report at the end.
//
// RUN:
//   cd build && ./examples/02_fan_out
//
// ============================================================================

#include "fanout/fanout.hpp"

#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace fanout;
using namespace std::chrono_literals;

namespace {

// Stand-in for a request to some backend; "db-3" is down
Result<size_t> Fetch(const TaskContext& ctx) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10 * (4 - ctx.index % 4)));
    if (ctx.key == "db-3") {
        return Failure(Errc::TaskFailed, "connection refused");
    }
    return Success(ctx.key.size() * 100 + ctx.index);
}

}  // namespace

int main() {
    std::cout << "=== fanout Example 02: Fan-Out ===" << std::endl;
    std::cout << std::endl;

    InitLogger({.name = "example", .level = LogLevel::Info});
    WorkerPool pool(4);

    std::vector<Task<size_t>> tasks;
    for (int i = 0; i < 8; ++i) {
        tasks.push_back(MakeTask(Fetch, "db-" + std::to_string(i)));
    }

    // Example 1: Streaming completions, collecting in submission order
    std::cout << "--- Example 1: Ordered Results ---" << std::endl;
    std::mutex print_mutex;
    FanOut<size_t> fan_out(pool);
    fan_out.OnResult([&print_mutex](size_t index, const Result<size_t>& result) {
        std::lock_guard<std::mutex> lock(print_mutex);
        std::cout << "  completed #" << index << ": " << result.ToString() << std::endl;
    });
    auto results = fan_out.Run(std::move(tasks));

    for (size_t i = 0; i < results.size(); ++i) {
        std::cout << "results[" << i << "] = ";
        if (results[i].IsSuccess()) {
            std::cout << results[i].Value() << std::endl;
        } else {
            std::cout << results[i].ToString() << std::endl;
        }
    }
    auto report = fan_out.Report();
    std::cout << "Status: " << ToString(report.status) << " (" << report.succeeded << " ok, " << report.failed
              << " failed)" << std::endl;
    std::cout << std::endl;

    // Example 2: Stop scheduling the rest once one task fails
    std::cout << "--- Example 2: Fail Fast ---" << std::endl;
    std::vector<Task<size_t>> more;
    for (int i = 0; i < 16; ++i) {
        more.push_back(MakeTask(Fetch, "db-" + std::to_string(i % 4)));
    }
    auto fast = RunBatch(pool, std::move(more), CancellationToken::None(), BatchOptions{.fail_fast = true});
    auto summary = Summarize(fast);
    std::cout << "Status: " << ToString(summary.status) << " (" << summary.succeeded << " ok, " << summary.failed
              << " failed, " << summary.cancelled << " cancelled)" << std::endl;
    std::cout << std::endl;

    std::cout << "=== Example Complete ===" << std::endl;
    return 0;
}
