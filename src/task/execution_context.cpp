// ============================================================================
// cotask/task/execution_context.cpp - Capabilities of a Running Task
// ============================================================================

#include "cotask/task/execution_context.hpp"

#include "cotask/io/timer.hpp"
#include "cotask/io/yield.hpp"

namespace cotask {

ExecutionContext::ExecutionContext(detail::RunState& run, ProgressNode& node) : run_(&run), node_(&node) {}

bool ExecutionContext::IsSynchronous() const noexcept {
    return run_->IsSynchronous();
}

bool ExecutionContext::ShouldUpdate() const {
    if (run_->IsSynchronous()) {
        return false;
    }
    return Clock::now() - last_updated_ >= run_->UpdateInterval();
}

void ExecutionContext::SetProgress(const ProgressUpdate& update) {
    node_->Apply(update);
}

TaskResult<void> ExecutionContext::CheckAbort() const {
    if (node_->abort_requested) {
        return Aborted(node_->abort_reason);
    }
    return Ok();
}

Async<TaskResult<void>> ExecutionContext::Update(ProgressUpdate update, bool always_emit) {
    COTASK_CO_TRY(CheckAbort());

    node_->Apply(update);
    if (!always_emit && !ShouldUpdate()) {
        co_return Ok();
    }
    co_return co_await Checkpoint();
}

Async<TaskResult<void>> ExecutionContext::Checkpoint() {
    COTASK_CO_TRY(CheckAbort());

    last_updated_ = Clock::now();
    run_->NotifyObserver(last_updated_);

    co_await Yield();
    co_return CheckAbort();
}

Async<TaskResult<void>> ExecutionContext::Delay(std::chrono::milliseconds duration) {
    COTASK_CO_TRY(CheckAbort());
    co_await Sleep(duration);
    co_return CheckAbort();
}

}  // namespace cotask
