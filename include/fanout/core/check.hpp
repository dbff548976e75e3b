// ============================================================================
// fanout/core/check.hpp - Contract Checks for Programming Faults
// ============================================================================
//
// FANOUT_CHECK(cond, msg) is an always-on assertion for contract violations
// that must never be recovered from: writing the same aggregator slot twice,
// collecting an incomplete batch, reading the value of a non-success Result.
// It is never compiled out.
//
// On failure it prints the condition, the message and the call site to
// stderr, then calls std::abort(). Tests exercise it with EXPECT_DEATH.
//
// Ordinary task failures are NOT checks: they travel as Result<T> data.
//
// ============================================================================

#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>

namespace fanout::detail {

[[noreturn]] inline void CheckFail(const char* cond_str, const char* msg, const std::source_location& loc) {
    std::fprintf(stderr, "FANOUT_CHECK(%s) failed: %s\n  at %s:%u in %s\n", cond_str, msg, loc.file_name(),
                 static_cast<unsigned>(loc.line()), loc.function_name());
    std::fflush(stderr);
    std::abort();
}

}  // namespace fanout::detail

#define FANOUT_CHECK(cond, msg)                                                       \
    do {                                                                              \
        if (!(cond)) [[unlikely]] {                                                   \
            ::fanout::detail::CheckFail(#cond, msg, std::source_location::current()); \
        }                                                                             \
    } while (0)
