// ============================================================================
// fanout/core/error.cpp - Error Category Implementation
// ============================================================================

#include "fanout/core/error.hpp"

#include <string>

namespace fanout {

namespace {

class FanoutCategoryImpl : public std::error_category {
   public:
    const char* name() const noexcept override { return "fanout"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::TaskFailed:
                return "Task failed";
            case Errc::TaskPanicked:
                return "Task terminated with an exception";
            case Errc::Cancelled:
                return "Operation cancelled";
            case Errc::DeadlineExceeded:
                return "Deadline exceeded";
            case Errc::PoolShutdown:
                return "Worker pool is shut down";
            case Errc::QueueClosed:
                return "Work queue is closed";
            case Errc::InvalidArgument:
                return "Invalid argument";
            default:
                return "Unknown fanout error";
        }
    }
};

}  // namespace

const std::error_category& FanoutCategory() noexcept {
    static const FanoutCategoryImpl instance;
    return instance;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), FanoutCategory()};
}

}  // namespace fanout
