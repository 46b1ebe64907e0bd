// ============================================================================
// cotask/io/timer.hpp - Timed Suspension
// ============================================================================
//
// Sleep suspends the awaiting coroutine for a wall-clock duration without
// blocking the host loop. It is the plain form of a delay: it does not look
// at any abort flag. Computations running under a Task should prefer
// ExecutionContext::Delay, which is a cancellation checkpoint as well.
//
// Without a current executor there is nothing to wait on, and Sleep completes
// immediately. That is what synchronous runs (RunSynchronously) rely on.
//
// USAGE:
// ------
//   co_await Sleep(250ms);
//
// ============================================================================

#pragma once

#include <chrono>
#include <coroutine>

#include "cotask/io/executor.hpp"

namespace cotask {

class Sleep {
   public:
    template <typename Rep, typename Period>
    explicit Sleep(std::chrono::duration<Rep, Period> duration)
        : duration_(std::chrono::duration_cast<std::chrono::milliseconds>(duration)) {}

    bool await_ready() const noexcept { return false; }

    bool await_suspend(std::coroutine_handle<> handle) const {
        Executor* executor = GetCurrentExecutor();
        if (!executor) {
            return false;
        }
        executor->ScheduleAfter(duration_, handle);
        return true;
    }

    void await_resume() const noexcept {}

    [[nodiscard]] std::chrono::milliseconds Duration() const noexcept { return duration_; }

   private:
    std::chrono::milliseconds duration_;
};

}  // namespace cotask
