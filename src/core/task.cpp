// ============================================================================
// fanout/core/task.cpp - Task Implementation (Compiled Parts)
// ============================================================================
//
// Most of Task<T> is header-only. Exception classification lives here so the
// logging dependency stays out of every translation unit that builds tasks.
//
// ============================================================================

#include "fanout/core/task.hpp"

#include <exception>
#include <string>

#include "fanout/core/log.hpp"

namespace fanout::detail {

RecoveredOutcome RecoverCurrentException(const TaskContext& ctx) noexcept {
    std::string what;
    try {
        throw;
    } catch (const OperationCancelled& e) {
        return Cancelled(e.Reason());
    } catch (const std::exception& e) {
        what = e.what();
    } catch (...) {
        what = "non-standard exception";
    }

    // spdlog reports its own formatting/sink errors through its error
    // handler instead of throwing.
    GetLogger()->warn("task '{}' (index {}) threw on worker {}: {}", ctx.key, ctx.index, ctx.worker_index, what);
    return Failure(TaskError{make_error_code(Errc::TaskPanicked), std::move(what), true});
}

}  // namespace fanout::detail
