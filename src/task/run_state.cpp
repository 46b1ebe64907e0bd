// ============================================================================
// cotask/task/run_state.cpp - Per-Run Shared State
// ============================================================================

#include "cotask/task/run_state.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace cotask::detail {

RunState::RunState(std::string root_task_name, RunOptions options, bool synchronous)
    : progress_(std::move(root_task_name)), options_(std::move(options)), synchronous_(synchronous) {}

std::chrono::milliseconds RunState::HeartbeatPeriod() const noexcept {
    return std::max(options_.update_interval, std::chrono::milliseconds(1));
}

void RunState::NotifyObserver(Clock::time_point now, bool force) {
    if (!options_.observer || notifying_ || finished_) {
        return;
    }
    if (!force && last_notified_ && now - *last_notified_ < UpdateInterval()) {
        return;
    }
    last_notified_ = now;
    ++observer_calls_;

    notifying_ = true;
    options_.observer(progress_);
    notifying_ = false;
}

void RunState::SetHeartbeat(Executor& executor, TimerId id) noexcept {
    heartbeat_executor_ = &executor;
    heartbeat_timer_ = id;
}

void RunState::Start() {
    progress_.Root().started_time = Clock::now();
    spdlog::debug("cotask: run '{}' started (interval={}ms, synchronous={})", progress_.Root().task_name,
                  options_.update_interval.count(), synchronous_);
}

void RunState::Finish(const TaskError* error) {
    finished_ = true;
    if (heartbeat_executor_ != nullptr) {
        heartbeat_executor_->CancelTimer(heartbeat_timer_);
        heartbeat_executor_ = nullptr;
    }

    ProgressNode& root = progress_.Root();
    if (!root.children.empty()) {
        spdlog::warn("cotask: run '{}' finished with {} child node(s) still attached", root.task_name,
                     root.children.size());
        root.children.clear();
    }

    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - root.started_time).count();
    if (!error) {
        spdlog::debug("cotask: run '{}' completed in {}ms, observer called {} time(s)", root.task_name, elapsed,
                      observer_calls_);
    } else if (error->IsAborted()) {
        spdlog::info("cotask: run '{}' aborted after {}ms: {}", root.task_name, elapsed, error->reason);
    } else {
        spdlog::warn("cotask: run '{}' failed after {}ms: {}", root.task_name, elapsed, error->Message());
    }
}

}  // namespace cotask::detail
