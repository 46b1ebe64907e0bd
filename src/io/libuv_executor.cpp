// ============================================================================
// cotask/io/libuv_executor.cpp - libuv Host Loop Implementation
// ============================================================================

#include "cotask/io/libuv_executor.hpp"

#include "cotask/core/error.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <utility>

namespace cotask {

// ============================================================================
// Construction / Destruction
// ============================================================================

Result<std::unique_ptr<LibuvExecutor>, std::error_code> LibuvExecutor::Create() {
    auto executor = std::unique_ptr<LibuvExecutor>(new LibuvExecutor());

    int rc = uv_loop_init(&executor->loop_);
    if (rc != 0) {
        spdlog::error("uv_loop_init failed: {}", uv_strerror(rc));
        return Err(make_error_code(Errc::IoError));
    }

    rc = uv_idle_init(&executor->loop_, &executor->idle_);
    if (rc != 0) {
        spdlog::error("uv_idle_init failed: {}", uv_strerror(rc));
        uv_loop_close(&executor->loop_);
        return Err(make_error_code(Errc::IoError));
    }
    // Started only while something is queued, so an empty executor does not
    // keep the loop alive
    executor->idle_.data = executor.get();

    return Ok(std::move(executor));
}

LibuvExecutor::~LibuvExecutor() {
    // Pending timers are dropped, not fired: their callbacks may capture
    // locals that are already gone, and a coroutine waiting on one is owned
    // (and destroyed) by whoever started it.
    if (!timers_.empty()) {
        spdlog::debug("LibuvExecutor destroyed with {} pending timers", timers_.size());
    }
    for (auto& pending : timers_) {
        CloseTimer(pending.second);
    }
    timers_.clear();

    if (idle_active_) {
        uv_idle_stop(&idle_);
        idle_active_ = false;
    }
    uv_close(reinterpret_cast<uv_handle_t*>(&idle_), nullptr);
    while (uv_loop_alive(&loop_) != 0) {
        uv_run(&loop_, UV_RUN_ONCE);
    }

    if (!ready_.empty() || !callbacks_.empty()) {
        spdlog::warn("LibuvExecutor destroyed with {} queued coroutines and {} queued callbacks", ready_.size(),
                     callbacks_.size());
    }
    uv_loop_close(&loop_);
}

// ============================================================================
// Event Loop Control
// ============================================================================

void LibuvExecutor::Run() {
    running_ = true;
    ExecutorGuard guard(this);
    uv_run(&loop_, UV_RUN_DEFAULT);
    running_ = false;
}

void LibuvExecutor::RunOnce() {
    ExecutorGuard guard(this);
    uv_run(&loop_, UV_RUN_NOWAIT);
}

void LibuvExecutor::Stop() {
    uv_stop(&loop_);
    running_ = false;
}

bool LibuvExecutor::IsRunning() const {
    return running_;
}

// ============================================================================
// Scheduling
// ============================================================================

void LibuvExecutor::Schedule(std::coroutine_handle<> handle) {
    ready_.push_back(handle);
    WakeIdle();
}

void LibuvExecutor::ScheduleAfter(std::chrono::milliseconds delay, std::coroutine_handle<> handle) {
    StartTimer(delay, TimerEntry{this, 0, handle, nullptr});
}

void LibuvExecutor::Post(std::function<void()> callback) {
    callbacks_.push_back(std::move(callback));
    WakeIdle();
}

TimerId LibuvExecutor::PostAfter(std::chrono::milliseconds delay, std::function<void()> callback) {
    return StartTimer(delay, TimerEntry{this, 0, nullptr, std::move(callback)});
}

bool LibuvExecutor::CancelTimer(TimerId id) {
    auto it = timers_.find(id);
    if (it == timers_.end()) {
        return false;
    }
    auto* timer = it->second;
    timers_.erase(it);
    CloseTimer(timer);
    return true;
}

// ============================================================================
// Internals
// ============================================================================

void LibuvExecutor::WakeIdle() {
    if (!idle_active_) {
        uv_idle_start(&idle_, OnIdle);
        idle_active_ = true;
    }
}

TimerId LibuvExecutor::StartTimer(std::chrono::milliseconds delay, TimerEntry entry) {
    auto* timer = new uv_timer_t;
    int rc = uv_timer_init(&loop_, timer);
    if (rc != 0) {
        // Without a timer the best we can do is run the work on the next turn
        spdlog::error("uv_timer_init failed: {}; running timed work immediately", uv_strerror(rc));
        delete timer;
        if (entry.handle) {
            Schedule(entry.handle);
        } else if (entry.callback) {
            Post(std::move(entry.callback));
        }
        return 0;
    }

    const TimerId id = next_timer_id_++;
    entry.id = id;
    timer->data = new TimerEntry(std::move(entry));
    timers_.emplace(id, timer);
    auto timeout = delay.count() > 0 ? static_cast<uint64_t>(delay.count()) : 0;
    uv_timer_start(timer, OnTimer, timeout, 0);
    return id;
}

void LibuvExecutor::CloseTimer(uv_timer_t* timer) {
    delete static_cast<TimerEntry*>(timer->data);
    timer->data = nullptr;
    uv_timer_stop(timer);
    uv_close(reinterpret_cast<uv_handle_t*>(timer), OnTimerClosed);
}

void LibuvExecutor::OnTimer(uv_timer_t* timer) {
    auto* entry = static_cast<TimerEntry*>(timer->data);
    timer->data = nullptr;
    uv_close(reinterpret_cast<uv_handle_t*>(timer), OnTimerClosed);

    entry->owner->timers_.erase(entry->id);
    if (entry->handle) {
        entry->handle.resume();
    } else if (entry->callback) {
        entry->callback();
    }
    delete entry;
}

void LibuvExecutor::OnTimerClosed(uv_handle_t* handle) {
    delete reinterpret_cast<uv_timer_t*>(handle);
}

void LibuvExecutor::OnIdle(uv_idle_t* idle) {
    auto* self = static_cast<LibuvExecutor*>(idle->data);
    self->DrainReady();

    if (self->ready_.empty() && self->callbacks_.empty()) {
        uv_idle_stop(idle);
        self->idle_active_ = false;
    }
}

void LibuvExecutor::DrainReady() {
    // Only what was queued before this turn: a coroutine that yields again
    // goes to the back and waits for the next turn.
    std::deque<std::coroutine_handle<>> ready;
    std::deque<std::function<void()>> callbacks;
    std::swap(ready, ready_);
    std::swap(callbacks, callbacks_);

    for (auto handle : ready) {
        if (handle) {
            handle.resume();
        }
    }
    for (auto& callback : callbacks) {
        callback();
    }
}

}  // namespace cotask
