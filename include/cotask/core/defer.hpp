// ============================================================================
// cotask/core/defer.hpp - Scope-Exit Actions
// ============================================================================
//
// Defer runs a callable when it goes out of scope. Inside coroutines the scope
// is the coroutine frame, so the action runs when the coroutine finishes
// (whatever the outcome) or when its frame is destroyed.
//
// on_abort handlers only run for cancellation. Cleanup that must happen on
// every outcome belongs in a Defer inside the computation:
//
//   Async<TaskResult<Mesh>> Build(ExecutionContext& ctx) {
//       auto* scratch = AcquireScratch();
//       DEFER([&] { ReleaseScratch(scratch); });
//       ...
//   }
//
// ============================================================================

#pragma once

#include <functional>
#include <utility>

namespace cotask {

class Defer {
   public:
    template <typename F>
    explicit Defer(F&& func) : action_(std::forward<F>(func)) {}

    ~Defer() {
        if (action_) {
            action_();
        }
    }

    Defer(const Defer&) = delete;
    Defer& operator=(const Defer&) = delete;

    Defer(Defer&& other) noexcept : action_(std::exchange(other.action_, nullptr)) {}
    Defer& operator=(Defer&&) = delete;

   private:
    std::function<void()> action_;
};

#define COTASK_DEFER_CONCAT_IMPL(a, b) a##b
#define COTASK_DEFER_CONCAT(a, b) COTASK_DEFER_CONCAT_IMPL(a, b)
// Variadic so a lambda with several captures needs no extra parentheses
#define DEFER(...) ::cotask::Defer COTASK_DEFER_CONCAT(cotask_defer_, __LINE__){__VA_ARGS__}

}  // namespace cotask
