// ============================================================================
// cotask/task/execution_context.hpp - Capabilities of a Running Task
// ============================================================================
//
// Every running task receives exactly one ExecutionContext, bound to its own
// ProgressNode. Through it the computation reports progress, yields to the
// host loop, waits and spawns child tasks.
//
// CHECKPOINTS:
// ------------
// An abort request only flags the progress tree. A task notices it at a
// checkpoint, which returns Aborted(reason) that the computation forwards
// with COTASK_CO_TRY:
//
//   - Update(), when it decides to emit (throttled by the update interval)
//   - Checkpoint(), always
//   - Delay(), before and after waiting
//   - RunChild(), before spawning
//   - every chunk boundary of ChunkedSubtask
//
// A computation with no checkpoint runs to completion whatever is requested.
//
// ============================================================================

#pragma once

#include "cotask/core/async.hpp"
#include "cotask/core/defer.hpp"
#include "cotask/core/error.hpp"
#include "cotask/task/progress.hpp"
#include "cotask/task/progress_update.hpp"
#include "cotask/task/run_state.hpp"
#include "cotask/task/task.hpp"

#include <chrono>
#include <string>
#include <utility>

namespace cotask {

class ExecutionContext {
   public:
    ExecutionContext(detail::RunState& run, ProgressNode& node);

    ExecutionContext(const ExecutionContext&) = delete;
    ExecutionContext& operator=(const ExecutionContext&) = delete;

    [[nodiscard]] ProgressNode& Node() noexcept { return *node_; }
    [[nodiscard]] const ProgressNode& Node() const noexcept { return *node_; }

    // True when the run has no host loop; nothing ever suspends then
    [[nodiscard]] bool IsSynchronous() const noexcept;

    // True when an emitting update is due for this task. Always false for
    // synchronous runs.
    [[nodiscard]] bool ShouldUpdate() const;

    [[nodiscard]] bool IsAbortRequested() const noexcept { return node_->abort_requested; }
    [[nodiscard]] const std::string& AbortReason() const noexcept { return node_->abort_reason; }

    // Applies `update` without emitting or checking for abort
    void SetProgress(const ProgressUpdate& update);

    // Applies `update`. When `always_emit` is set or ShouldUpdate() holds,
    // also emits: notifies a due observer, yields to the host loop and checks
    // for abort. Fails fast with Aborted when the request came earlier.
    [[nodiscard]] Async<TaskResult<void>> Update(ProgressUpdate update, bool always_emit = false);

    // Emits unconditionally
    [[nodiscard]] Async<TaskResult<void>> Checkpoint();

    // Waits `duration` on the host loop; checks for abort before and after
    [[nodiscard]] Async<TaskResult<void>> Delay(std::chrono::milliseconds duration);

    // Runs `child` under a new node appended to this task's node. The node is
    // detached once the child completes, whatever the outcome. The child's
    // Aborted or Failed outcome is returned as is.
    template <typename U>
    [[nodiscard]] Async<TaskResult<U>> RunChild(Task<U> child);

   private:
    [[nodiscard]] TaskResult<void> CheckAbort() const;

    detail::RunState* run_;
    ProgressNode* node_;
    // Epoch start, so the first Update of a task always emits
    Clock::time_point last_updated_{};
};

template <typename U>
Async<TaskResult<U>> ExecutionContext::RunChild(Task<U> child) {
    COTASK_CO_TRY(CheckAbort());

    ProgressNode& child_node = node_->AddChild(child.Name());
    DEFER([this, &child_node] { node_->RemoveChild(&child_node); });

    ExecutionContext child_ctx(*run_, child_node);
    co_return co_await detail::ExecuteTask(child, child_ctx);
}

}  // namespace cotask
