// ============================================================================
// cotask/task/run_state.hpp - Per-Run Shared State
// ============================================================================
//
// RunOptions is what a caller hands to Run(). RunState is what one run shares
// between its ExecutionContexts, the observer heartbeat and the driver: the
// progress tree, the observer and its throttle.
//
// RunState lives in a shared_ptr owned by the driver. The pending heartbeat
// timer holds a second reference until Finish() cancels it.
//
// ============================================================================

#pragma once

#include "cotask/core/abort.hpp"
#include "cotask/core/error.hpp"
#include "cotask/io/executor.hpp"
#include "cotask/task/progress.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace cotask {

struct RunOptions {
    // Called with the live tree; may call Progress::RequestAbort
    std::function<void(Progress&)> observer;

    // Lower bound between two observer calls, and between two emitting
    // updates of a single task
    std::chrono::milliseconds update_interval{250};

    // Optional external abort trigger
    AbortToken abort_token;
};

namespace detail {

class RunState {
   public:
    RunState(std::string root_task_name, RunOptions options, bool synchronous);

    RunState(const RunState&) = delete;
    RunState& operator=(const RunState&) = delete;

    [[nodiscard]] Progress& GetProgress() noexcept { return progress_; }
    [[nodiscard]] const RunOptions& Options() const noexcept { return options_; }
    [[nodiscard]] bool IsSynchronous() const noexcept { return synchronous_; }
    [[nodiscard]] bool IsFinished() const noexcept { return finished_; }
    [[nodiscard]] bool HasObserver() const noexcept { return static_cast<bool>(options_.observer); }

    [[nodiscard]] Clock::duration UpdateInterval() const noexcept { return options_.update_interval; }

    // Period of the heartbeat timer; never zero
    [[nodiscard]] std::chrono::milliseconds HeartbeatPeriod() const noexcept;

    // Calls the observer if at least one interval passed since the previous
    // call, or unconditionally with `force`. Reentrant calls from inside the
    // observer are ignored.
    void NotifyObserver(Clock::time_point now, bool force = false);

    // Remembers the pending heartbeat timer so Finish() can cancel it
    void SetHeartbeat(Executor& executor, TimerId id) noexcept;

    void Start();

    // Ends the run: stops the heartbeat, detaches any child node left over,
    // and logs the outcome. `error` is null on success.
    void Finish(const TaskError* error);

   private:
    Progress progress_;
    RunOptions options_;
    bool synchronous_;
    bool finished_ = false;
    bool notifying_ = false;
    std::optional<Clock::time_point> last_notified_;
    std::size_t observer_calls_ = 0;
    Executor* heartbeat_executor_ = nullptr;
    TimerId heartbeat_timer_ = 0;
};

}  // namespace detail

}  // namespace cotask
