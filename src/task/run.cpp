// ============================================================================
// cotask/task/run.cpp - Run Driver
// ============================================================================

#include "cotask/task/run.hpp"

namespace cotask::detail {

namespace {

// One tick per interval until the run finishes; RunState::Finish cancels the
// pending tick
void ScheduleHeartbeat(const std::shared_ptr<RunState>& run, Executor& executor) {
    auto id = executor.PostAfter(run->HeartbeatPeriod(), [run, &executor] {
        if (run->IsFinished()) {
            return;
        }
        run->NotifyObserver(Clock::now());
        // The observer may have ended the run
        if (!run->IsFinished()) {
            ScheduleHeartbeat(run, executor);
        }
    });
    run->SetHeartbeat(executor, id);
}

}  // namespace

void BeginObservation(const std::shared_ptr<RunState>& run) {
    if (!run->HasObserver()) {
        return;
    }
    run->NotifyObserver(Clock::now(), true);

    // Synchronous runs have no loop to tick on
    Executor* executor = GetCurrentExecutor();
    if (run->IsSynchronous() || executor == nullptr) {
        return;
    }
    ScheduleHeartbeat(run, *executor);
}

}  // namespace cotask::detail
