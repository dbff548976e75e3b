// ============================================================================
// fanout/core/error.hpp - Error Codes for fanout
// ============================================================================
//
// Defines a std::error_code-based error infrastructure for the engine.
// Engine-level failures (pool shut down, task threw, deadline passed) are
// represented as std::error_code values in the "fanout" category and are
// carried as data inside Result<T>, never thrown across the worker boundary.
//
// USAGE:
// ------
//   std::error_code ec = make_error_code(Errc::PoolShutdown);
//   if (ec) { /* handle error */ }
//
// ============================================================================

#pragma once

#include <system_error>

namespace fanout {

enum class Errc {
    TaskFailed = 1,
    TaskPanicked,
    Cancelled,
    DeadlineExceeded,
    PoolShutdown,
    QueueClosed,
    InvalidArgument,
};

const std::error_category& FanoutCategory() noexcept;

std::error_code make_error_code(Errc e) noexcept;

// Convenient alias used throughout the library
using Error = std::error_code;

}  // namespace fanout

// Register with std::error_code
namespace std {
template <>
struct is_error_code_enum<fanout::Errc> : true_type {};
}  // namespace std
