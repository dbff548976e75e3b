// ============================================================================
// Example 03: Batch Timeouts
// ============================================================================
//
// A batch bounded by a deadline: tasks that observe their token stop early,
// queued tasks that never started come back as Cancelled(timeout).
//
// RUN:
//   cd build && ./examples/03_timeout_batch
//
// ============================================================================

#include "fanout/fanout.hpp"

#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

using namespace fanout;
using namespace std::chrono_literals;

int main() {
    std::cout << "=== fanout Example 03: Timeout Batch ===" << std::endl;
    std::cout << std::endl;

    WorkerPool pool(3);

    std::vector<Task<int>> tasks;
    for (int i = 0; i < 10; ++i) {
        tasks.push_back(MakeTask([i](const TaskContext& ctx) -> Result<int> {
            // Cooperative: give up as soon as the batch deadline passes
            if (ctx.token.WaitFor(std::chrono::milliseconds(40 * (i + 1)))) {
                return Cancelled(ctx.token.Reason());
            }
            return Success(i * i);
        }));
    }

    auto start = std::chrono::steady_clock::now();
    auto results = RunBatch(pool, std::move(tasks), 150ms);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    for (size_t i = 0; i < results.size(); ++i) {
        std::cout << "results[" << i << "] = " << results[i].ToString();
        if (results[i].IsSuccess()) {
            std::cout << " -> " << results[i].Value();
        }
        std::cout << std::endl;
    }

    auto report = Summarize(results);
    std::cout << std::endl;
    std::cout << "Status: " << ToString(report.status) << " after " << elapsed.count() << "ms" << std::endl;
    std::cout << "Succeeded: " << report.succeeded << ", cancelled: " << report.cancelled << std::endl;

    // A deadline on a parent token is inherited by the batch
    std::cout << std::endl;
    std::cout << "--- Parent Deadline ---" << std::endl;
    CancellationSource request(50ms);
    std::vector<Task<int>> sleepers;
    for (int i = 0; i < 6; ++i) {
        sleepers.push_back(MakeTask([](const TaskContext& ctx) -> Result<int> {
            if (ctx.token.WaitFor(1s)) {
                return Cancelled(ctx.token.Reason());
            }
            return Success(0);
        }));
    }
    auto inherited = Summarize(RunBatch(pool, std::move(sleepers), request.GetToken()));
    std::cout << "Status: " << ToString(inherited.status) << std::endl;

    std::cout << "=== Example Complete ===" << std::endl;
    return 0;
}
