// ============================================================================
// cotask/task/task.hpp - Named Computation Descriptor
// ============================================================================
//
// Task<T> says WHAT to run: a name, a computation, and optionally a cleanup
// handler for cancellation. It does not run anything by itself. Run() (the
// driver) or ExecutionContext::RunChild decide WHEN and under which progress
// node the computation runs.
//
// A Task holds no mutable state. Copies are cheap enough to pass by value, and
// running the same Task twice produces two independent runs with their own
// progress nodes.
//
// USAGE:
// ------
//   auto parse = Task<Model>::Create(
//       "parse mmCIF",
//       [&](ExecutionContext& ctx) -> Async<TaskResult<Model>> {
//           COTASK_CO_TRY(co_await ctx.Update("Tokenizing..."));
//           ...
//           co_return Ok(std::move(model));
//       },
//       [&] { builder.Discard(); });
//
// The computation's lambda object is kept inside the Task, so its captures
// stay valid for as long as the computation runs.
//
// ============================================================================

#pragma once

#include "cotask/core/async.hpp"
#include "cotask/core/check.hpp"
#include "cotask/core/error.hpp"

#include <functional>
#include <string>
#include <type_traits>
#include <utility>

namespace cotask {

class ExecutionContext;

template <typename T>
class Task {
   public:
    using ValueType = T;
    using Computation = std::function<Async<TaskResult<T>>(ExecutionContext&)>;
    using AbortHandler = std::function<void()>;

    [[nodiscard]] static Task Create(std::string name, Computation run, AbortHandler on_abort = nullptr) {
        return Task(std::move(name), std::move(run), std::move(on_abort));
    }

    [[nodiscard]] const std::string& Name() const noexcept { return name_; }

    [[nodiscard]] bool HasAbortHandler() const noexcept { return static_cast<bool>(on_abort_); }

    // Starts nothing: the returned Async is lazy
    [[nodiscard]] Async<TaskResult<T>> Invoke(ExecutionContext& ctx) const {
        COTASK_CHECK(static_cast<bool>(run_), "Task has no computation");
        return run_(ctx);
    }

    void NotifyAborted() const {
        if (on_abort_) {
            on_abort_();
        }
    }

   private:
    Task(std::string name, Computation run, AbortHandler on_abort)
        : name_(std::move(name)), run_(std::move(run)), on_abort_(std::move(on_abort)) {}

    std::string name_;
    Computation run_;
    AbortHandler on_abort_;
};

namespace detail {

template <typename A>
struct TaskValueOf;

template <typename T>
struct TaskValueOf<Async<TaskResult<T>>> {
    using type = T;
};

// Runs `task` under `ctx` and fires its abort handler when the computation
// ended with an abort. Children complete (and run their own handlers) before
// their parent's computation returns, so handlers fire innermost first.
//
// Both references must outlive the returned Async; callers await it at once.
template <typename T>
Async<TaskResult<T>> ExecuteTask(const Task<T>& task, ExecutionContext& ctx) {
    TaskResult<T> result = co_await task.Invoke(ctx);
    if (result.IsErr() && result.Error().IsAborted()) {
        task.NotifyAborted();
    }
    co_return std::move(result);
}

}  // namespace detail

// Task<T>::Create with T deduced from the computation's return type
template <typename F>
[[nodiscard]] auto MakeTask(std::string name, F&& run, std::function<void()> on_abort = nullptr) {
    using T = typename detail::TaskValueOf<std::invoke_result_t<std::decay_t<F>&, ExecutionContext&>>::type;
    return Task<T>::Create(std::move(name), std::forward<F>(run), std::move(on_abort));
}

}  // namespace cotask
