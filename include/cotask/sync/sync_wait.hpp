// ============================================================================
// cotask/sync/sync_wait.hpp - Inline Wait for Coroutines
// ============================================================================
//
// SyncWait() runs an Async to completion on the calling thread and returns its
// result. It is the bridge between plain code and coroutines when no host loop
// is involved: without a current executor, Yield and Sleep complete
// immediately, so a cotask computation never actually suspends.
//
// USAGE:
// ------
//   Async<int> Compute() { co_return 42; }
//
//   int main() {
//       ExecutorGuard no_loop(nullptr);
//       int answer = SyncWait(Compute());
//   }
//
// WARNING:
// --------
// If the computation does suspend (it awaited something that an executor or
// another coroutine has to resume), nothing would ever resume it here.
// SyncWait treats that as a programming error and aborts. Use RunBlocking to
// drive a computation on a host loop instead.
//
// ============================================================================

#pragma once

#include "cotask/core/async.hpp"
#include "cotask/core/check.hpp"

#include <optional>
#include <utility>

namespace cotask {

namespace detail {

template <typename T>
Async<void> SyncWaitRunner(Async<T> work, std::optional<T>& out) {
    out.emplace(co_await std::move(work));
}

inline Async<void> SyncWaitRunner(Async<void> work, bool& done) {
    co_await std::move(work);
    done = true;
}

}  // namespace detail

template <typename T>
T SyncWait(Async<T> work) {
    std::optional<T> result;
    auto runner = detail::SyncWaitRunner(std::move(work), result);
    runner.GetHandle().resume();
    COTASK_CHECK(result.has_value(), "SyncWait: computation suspended with nothing to resume it");
    return std::move(*result);
}

inline void SyncWait(Async<void> work) {
    bool done = false;
    auto runner = detail::SyncWaitRunner(std::move(work), done);
    runner.GetHandle().resume();
    COTASK_CHECK(done, "SyncWait: computation suspended with nothing to resume it");
}

}  // namespace cotask
