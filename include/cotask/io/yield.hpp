// ============================================================================
// cotask/io/yield.hpp - Hand Control Back to the Host Loop
// ============================================================================
//
// co_await Yield() reschedules the awaiting coroutine at the back of the
// current executor's ready queue, letting timers, posted callbacks and other
// tasks run first. Without a current executor it completes immediately.
//
// ============================================================================

#pragma once

#include <coroutine>

#include "cotask/io/executor.hpp"

namespace cotask {

struct Yield {
    bool await_ready() const noexcept { return false; }

    bool await_suspend(std::coroutine_handle<> handle) const {
        Executor* executor = GetCurrentExecutor();
        if (!executor) {
            return false;
        }
        executor->Schedule(handle);
        return true;
    }

    void await_resume() const noexcept {}
};

}  // namespace cotask
