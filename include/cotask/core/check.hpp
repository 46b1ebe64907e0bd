// ============================================================================
// cotask/core/check.hpp - Always-On Invariant Checks
// ============================================================================
//
// COTASK_CHECK(cond, msg) guards invariants whose violation is a programming
// error inside the framework (an Async awaited twice, a synchronous run whose
// computation suspended on something external). It stays active in Release.
//
// Recoverable conditions never go through this macro: aborts and failures of
// a running computation are TaskError values (see cotask/core/error.hpp).
//
// ============================================================================

#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>

namespace cotask::detail {

[[noreturn]] inline void CheckFail(const char* cond_str, const char* msg, const std::source_location& loc) {
    std::fprintf(stderr, "COTASK_CHECK(%s) failed: %s\n  in %s (%s:%u)\n", cond_str, msg, loc.function_name(),
                 loc.file_name(), static_cast<unsigned>(loc.line()));
    std::fflush(stderr);
    std::abort();
}

}  // namespace cotask::detail

#define COTASK_CHECK(cond, msg)                                                       \
    do {                                                                              \
        if (!(cond)) [[unlikely]] {                                                   \
            ::cotask::detail::CheckFail(#cond, msg, std::source_location::current()); \
        }                                                                             \
    } while (0)
