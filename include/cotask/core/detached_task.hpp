// ============================================================================
// cotask/core/detached_task.hpp - Self-Destroying Coroutine
// ============================================================================
//
// DetachedTask owns nothing once released: its frame destroys itself at
// final_suspend. RunBlocking uses it for the root coroutine it schedules on
// the host executor, which no caller awaits.
//
// A DetachedTask that is never released destroys its frame in the destructor.
//
// ============================================================================

#pragma once

#include "cotask/core/async.hpp"

#include <coroutine>
#include <cstdlib>
#include <utility>

namespace cotask {

class DetachedTask {
   public:
    struct promise_type {
        DetachedTask get_return_object() noexcept {
            return DetachedTask{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        std::suspend_always initial_suspend() noexcept { return {}; }

        auto final_suspend() noexcept {
            struct SelfDestroy {
                bool await_ready() noexcept { return false; }
                void await_suspend(std::coroutine_handle<promise_type> h) noexcept { h.destroy(); }
                void await_resume() noexcept {}
            };
            return SelfDestroy{};
        }

        void return_void() noexcept {}

        void unhandled_exception() noexcept { std::abort(); }
    };

    using Handle = std::coroutine_handle<promise_type>;

    explicit DetachedTask(Handle h) noexcept : handle_(h) {}

    DetachedTask(DetachedTask&& other) noexcept
        : handle_(std::exchange(other.handle_, nullptr)), started_(other.started_) {}

    DetachedTask& operator=(DetachedTask&&) = delete;
    DetachedTask(const DetachedTask&) = delete;
    DetachedTask& operator=(const DetachedTask&) = delete;

    ~DetachedTask() {
        if (handle_ && !started_) {
            handle_.destroy();
        }
    }

    // Hands the frame to whoever resumes the returned handle (typically an
    // executor ready queue). After this call the DetachedTask no longer owns it.
    [[nodiscard]] Handle Release() noexcept {
        started_ = true;
        return handle_;
    }

   private:
    Handle handle_;
    bool started_ = false;
};

inline DetachedTask MakeDetached(Async<void> work) {
    co_await std::move(work);
}

}  // namespace cotask
