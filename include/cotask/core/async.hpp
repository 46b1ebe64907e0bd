// ============================================================================
// cotask/core/async.hpp - Lazy Coroutine Type
// ============================================================================
//
// Async<T> is the coroutine type every cotask computation is written in. A
// task's body, ExecutionContext::Update, ExecutionContext::RunChild and
// ChunkedSubtask all return Async<...>.
//
// PROPERTIES:
// -----------
// 1. LAZY: nothing runs until the Async is co_awaited (initial_suspend is
//    suspend_always). RunChild relies on this: creating the child's Async does
//    not attach a progress node, awaiting it does.
//
// 2. SINGLE CONSUMER: an Async is move-only and may be awaited once.
//
// 3. SYMMETRIC TRANSFER: on completion the awaiting coroutine is resumed
//    directly from final_suspend, so a parent waiting on a child never goes
//    back through the host event loop.
//
// 4. NO EXCEPTIONS: failures travel as TaskResult values. An exception that
//    escapes a coroutine body terminates the process.
//
// USAGE:
// ------
//   Async<int> Answer() { co_return 42; }
//
//   Async<int> Twice() {
//       int v = co_await Answer();
//       co_return v * 2;
//   }
//
// ============================================================================

#pragma once

#include "cotask/core/check.hpp"
#include "cotask/core/coroutine_compat.hpp"

#include <coroutine>
#include <cstdlib>
#include <optional>
#include <utility>

namespace cotask {

template <typename T>
class Async;

namespace detail {

// Shared part of both promise specializations: the continuation slot and the
// final awaiter that hands control back to it.
class AsyncPromiseBase {
   public:
    std::suspend_always initial_suspend() noexcept { return {}; }

    struct FinalAwaiter {
        bool await_ready() noexcept { return false; }

        template <typename Promise>
        SymmetricTransferResult await_suspend(std::coroutine_handle<Promise> finishing) noexcept {
            auto continuation = finishing.promise().Continuation();
            return SymmetricTransfer(continuation ? continuation : std::noop_coroutine());
        }

        void await_resume() noexcept {}
    };

    FinalAwaiter final_suspend() noexcept { return {}; }

    void unhandled_exception() noexcept { std::abort(); }

    void SetContinuation(std::coroutine_handle<> cont) noexcept {
        COTASK_CHECK(!awaited_, "Async<T> co_awaited twice");
        awaited_ = true;
        continuation_ = cont;
    }

    [[nodiscard]] std::coroutine_handle<> Continuation() const noexcept { return continuation_; }

   private:
    std::coroutine_handle<> continuation_;
    bool awaited_ = false;
};

}  // namespace detail

template <typename T>
class AsyncPromise : public detail::AsyncPromiseBase {
   public:
    Async<T> get_return_object() noexcept;

    template <typename U>
    void return_value(U&& value) {
        result_.emplace(std::forward<U>(value));
    }

    T TakeResult() {
        COTASK_CHECK(result_.has_value(), "Async<T> resumed without a result");
        return std::move(*result_);
    }

   private:
    std::optional<T> result_;
};

template <>
class AsyncPromise<void> : public detail::AsyncPromiseBase {
   public:
    Async<void> get_return_object() noexcept;

    void return_void() noexcept {}

    void TakeResult() noexcept {}
};

// ============================================================================
// Async<T>
// ============================================================================
//
// Owns the coroutine frame; destroying an Async destroys the frame. The
// frame must therefore not be destroyed while the coroutine is suspended
// inside the host loop (a pending Sleep or Yield still holds its handle).
//
template <typename T>
class [[nodiscard("Async must be co_awaited")]] Async {
   public:
    using promise_type = AsyncPromise<T>;
    using Handle = std::coroutine_handle<promise_type>;

    explicit Async(Handle handle) noexcept : handle_(handle) {}

    ~Async() {
        if (handle_) {
            handle_.destroy();
        }
    }

    Async(const Async&) = delete;
    Async& operator=(const Async&) = delete;

    Async(Async&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    Async& operator=(Async&& other) noexcept {
        if (this != &other) {
            if (handle_) {
                handle_.destroy();
            }
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    struct Awaiter {
        Handle handle_;

        bool await_ready() noexcept { return false; }

        SymmetricTransferResult await_suspend(std::coroutine_handle<> awaiting) noexcept {
            handle_.promise().SetContinuation(awaiting);
            return SymmetricTransfer(handle_);
        }

        T await_resume() { return handle_.promise().TakeResult(); }
    };

    [[nodiscard]] Awaiter operator co_await() noexcept { return Awaiter{handle_}; }

    // For drivers that start the coroutine by hand (SyncWait, RunBlocking)
    // instead of awaiting it.
    [[nodiscard]] Handle GetHandle() const noexcept { return handle_; }

    [[nodiscard]] bool IsDone() const noexcept { return handle_ && handle_.done(); }

   private:
    Handle handle_;
};

template <typename T>
Async<T> AsyncPromise<T>::get_return_object() noexcept {
    return Async<T>{Async<T>::Handle::from_promise(*this)};
}

inline Async<void> AsyncPromise<void>::get_return_object() noexcept {
    return Async<void>{Async<void>::Handle::from_promise(*this)};
}

}  // namespace cotask
