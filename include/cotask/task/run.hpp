// ============================================================================
// cotask/task/run.hpp - Run Driver
// ============================================================================
//
// Run() is the entry point for executing a Task. It builds a fresh progress
// tree rooted at the task's name, runs the computation under a root
// ExecutionContext, and keeps an optional observer informed:
//
//   - once before the computation starts;
//   - at checkpoints, when at least update_interval passed since the previous
//     call;
//   - from a heartbeat timer on the host loop, so the observer keeps getting
//     called while a computation sits in a long Delay.
//
// The observer may call Progress::RequestAbort. Every live node is flagged at
// once and running tasks return Aborted at their next checkpoint. on_abort
// handlers run for each aborted task, innermost first, before the run's
// result is delivered.
//
// THREE WAYS TO DRIVE A RUN:
// --------------------------
//   co_await Run(task, options)            from inside a coroutine
//   RunBlocking(*executor, task, options)  from plain code, on a host loop
//   RunSynchronously(task)                 from plain code, no host loop:
//                                          never suspends, never notifies
//
// USAGE:
// ------
//   RunOptions options;
//   options.update_interval = 100ms;
//   options.observer = [](Progress& p) {
//       fmt::print("{}\n", FormatProgressTree(p.Root()));
//       if (UserPressedCancel()) p.RequestAbort("cancelled by user");
//   };
//   TaskResult<Structure> result = RunBlocking(*executor, load_structure, options);
//
// ============================================================================

#pragma once

#include "cotask/core/abort.hpp"
#include "cotask/core/async.hpp"
#include "cotask/core/check.hpp"
#include "cotask/core/detached_task.hpp"
#include "cotask/core/error.hpp"
#include "cotask/io/executor.hpp"
#include "cotask/sync/sync_wait.hpp"
#include "cotask/task/execution_context.hpp"
#include "cotask/task/run_state.hpp"
#include "cotask/task/task.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace cotask {

namespace detail {

// Calls the observer once, then starts the heartbeat timer on the current
// executor; RunState::Finish cancels it
void BeginObservation(const std::shared_ptr<RunState>& run);

}  // namespace detail

template <typename T>
Async<TaskResult<T>> Run(Task<T> task, RunOptions options = {}) {
    const bool synchronous = GetCurrentExecutor() == nullptr;
    auto run = std::make_shared<detail::RunState>(task.Name(), std::move(options), synchronous);

    AbortCallbackGuard abort_forwarding(run->Options().abort_token, [state = run.get()](const std::string& reason) {
        state->GetProgress().RequestAbort(reason);
    });

    run->Start();
    detail::BeginObservation(run);

    ExecutionContext ctx(*run, run->GetProgress().Root());
    TaskResult<T> result = co_await detail::ExecuteTask(task, ctx);

    run->Finish(result.IsErr() ? &result.Error() : nullptr);
    co_return std::move(result);
}

template <typename T>
Async<TaskResult<T>> Run(Task<T> task, std::function<void(Progress&)> observer,
                         std::chrono::milliseconds update_interval = std::chrono::milliseconds(250)) {
    RunOptions options;
    options.observer = std::move(observer);
    options.update_interval = update_interval;
    return Run(std::move(task), std::move(options));
}

namespace detail {

template <typename T>
Async<void> RunAndStop(Executor& executor, Task<T> task, RunOptions options, std::optional<TaskResult<T>>& out) {
    out.emplace(co_await Run(std::move(task), std::move(options)));
    executor.Stop();
}

}  // namespace detail

// Runs `task` on `executor` and returns once it completed. The executor is
// made current for the duration and stopped when the run is over. The run's
// heartbeat is cancelled when it finishes; timers the caller posted stay
// pending on the executor.
template <typename T>
TaskResult<T> RunBlocking(Executor& executor, Task<T> task, RunOptions options = {}) {
    std::optional<TaskResult<T>> result;
    {
        ExecutorGuard guard(&executor);
        auto root = MakeDetached(detail::RunAndStop(executor, std::move(task), std::move(options), result));
        executor.Schedule(root.Release());
        executor.Run();
    }
    COTASK_CHECK(result.has_value(), "RunBlocking: executor stopped before the run completed");
    return std::move(*result);
}

// Runs `task` to completion on the calling thread without a host loop.
// Nothing suspends, no observer is involved and ShouldUpdate() is always
// false, so the computation pays nothing for cooperative scheduling.
template <typename T>
TaskResult<T> RunSynchronously(Task<T> task) {
    ExecutorGuard no_executor(nullptr);
    return SyncWait(Run(std::move(task)));
}

}  // namespace cotask
