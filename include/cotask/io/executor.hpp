// ============================================================================
// cotask/io/executor.hpp - Host Event Loop Interface
// ============================================================================
//
// The Executor is the host scheduler that cooperative tasks hand control back
// to. Every suspension point in cotask (Yield, Sleep, a chunk boundary in
// ChunkedSubtask, an emitting ExecutionContext::Update) ends up as a Schedule
// or ScheduleAfter call on the executor that is current on this thread.
//
// An executor runs on exactly one thread. Code between two suspension points
// runs to completion without interleaving, which is what makes the progress
// tree safe to share between running tasks and the observer without locks.
//
// USAGE:
// ------
//   auto executor = LibuvExecutor::Create().Value();
//   executor->Schedule(handle);          // resume on the next loop turn
//   executor->ScheduleAfter(50ms, h);    // resume after a delay
//   auto id = executor->PostAfter(2s, [&] { abort_source.RequestAbort("timeout"); });
//   executor->Run();                     // until Stop() or out of work
//   executor->CancelTimer(id);           // the run ended first
//
// Destroying an executor drops what is still pending: timed callbacks are
// destroyed without being called and timed coroutines are never resumed.
//
// ============================================================================

#pragma once

#include <chrono>
#include <coroutine>
#include <cstdint>
#include <functional>

namespace cotask {

// Identifies a callback started with PostAfter; 0 never names a pending timer
using TimerId = std::uint64_t;

class Executor {
   public:
    virtual ~Executor() = default;

    // Run until Stop() is called or nothing is left to do
    virtual void Run() = 0;

    // One non-blocking turn of the loop
    virtual void RunOnce() = 0;

    virtual void Stop() = 0;

    [[nodiscard]] virtual bool IsRunning() const = 0;

    // Resume `handle` on a later turn of the loop. Handles scheduled while the
    // ready queue is being drained run on the following turn, so timers and
    // callbacks get a chance in between.
    virtual void Schedule(std::coroutine_handle<> handle) = 0;

    virtual void ScheduleAfter(std::chrono::milliseconds delay, std::coroutine_handle<> handle) = 0;

    virtual void Post(std::function<void()> callback) = 0;

    virtual TimerId PostAfter(std::chrono::milliseconds delay, std::function<void()> callback) = 0;

    // Destroys the callback of a pending PostAfter without calling it.
    // Returns false when the timer already fired or was cancelled.
    virtual bool CancelTimer(TimerId id) = 0;
};

// Executor current on this thread, or nullptr. Awaitables use it to find the
// host loop; a nullptr current executor means synchronous execution.
[[nodiscard]] Executor* GetCurrentExecutor();

void SetCurrentExecutor(Executor* executor);

class ExecutorGuard {
   public:
    explicit ExecutorGuard(Executor* executor);
    ~ExecutorGuard();

    ExecutorGuard(const ExecutorGuard&) = delete;
    ExecutorGuard& operator=(const ExecutorGuard&) = delete;

   private:
    Executor* previous_;
};

}  // namespace cotask
