// ============================================================================
// cotask/io/libuv_executor.hpp - libuv Host Loop
// ============================================================================
//
// LibuvExecutor drives cooperative tasks from a libuv loop on the calling
// thread:
//
// - uv_idle_t drains the ready queue. While anything is queued the loop polls
//   with a zero timeout, so timers and I/O still get their turn between two
//   task chunks.
// - one heap-allocated uv_timer_t per ScheduleAfter/PostAfter, closed after
//   it fires or when it is cancelled.
// - the destructor closes the timers still pending without firing them, so a
//   callback never outlives the locals it captured by reference.
//
// The executor is single-threaded: Schedule and friends must be called from
// the loop thread (or before Run()). Run() returns on Stop() or once neither
// queued work nor pending timers remain.
//
// ============================================================================

#pragma once

#include "cotask/core/result.hpp"
#include "cotask/io/executor.hpp"

#include <chrono>
#include <coroutine>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <system_error>
#include <unordered_map>
#include <uv.h>

namespace cotask {

class LibuvExecutor : public Executor {
   public:
    static Result<std::unique_ptr<LibuvExecutor>, std::error_code> Create();

    ~LibuvExecutor() override;

    LibuvExecutor(const LibuvExecutor&) = delete;
    LibuvExecutor& operator=(const LibuvExecutor&) = delete;

    void Run() override;
    void RunOnce() override;
    void Stop() override;
    bool IsRunning() const override;

    void Schedule(std::coroutine_handle<> handle) override;
    void ScheduleAfter(std::chrono::milliseconds delay, std::coroutine_handle<> handle) override;
    void Post(std::function<void()> callback) override;
    TimerId PostAfter(std::chrono::milliseconds delay, std::function<void()> callback) override;
    bool CancelTimer(TimerId id) override;

    // Timers started and neither fired nor cancelled
    [[nodiscard]] std::size_t PendingTimers() const noexcept { return timers_.size(); }

   private:
    LibuvExecutor() = default;

    // What a timer does when it fires: resume a coroutine or call a callback
    struct TimerEntry {
        LibuvExecutor* owner = nullptr;
        TimerId id = 0;
        std::coroutine_handle<> handle;
        std::function<void()> callback;
    };

    static void OnIdle(uv_idle_t* idle);
    static void OnTimer(uv_timer_t* timer);
    static void OnTimerClosed(uv_handle_t* handle);

    TimerId StartTimer(std::chrono::milliseconds delay, TimerEntry entry);
    // Frees the entry without running it and closes the handle
    static void CloseTimer(uv_timer_t* timer);
    void WakeIdle();
    void DrainReady();

    uv_loop_t loop_{};
    uv_idle_t idle_{};
    bool idle_active_ = false;
    bool running_ = false;
    TimerId next_timer_id_ = 1;
    std::unordered_map<TimerId, uv_timer_t*> timers_;

    std::deque<std::coroutine_handle<>> ready_;
    std::deque<std::function<void()>> callbacks_;
};

}  // namespace cotask
