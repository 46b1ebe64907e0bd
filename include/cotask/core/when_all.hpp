// ============================================================================
// cotask/core/when_all.hpp - Run Sibling Computations Together
// ============================================================================
//
// Async values are lazy, so awaiting two RunChild calls one after the other
// runs the children one after the other. WhenAll starts every child first and
// resumes the caller once the last one has finished:
//
//   auto [a, b] = co_await WhenAll(ctx.RunChild(load_a), ctx.RunChild(load_b));
//
// Both children are attached to the parent's progress node at the same time
// and their suspension points interleave on the host loop. Each child runs on
// the calling thread until its first suspension, in argument order.
//
// WhenAll never short-circuits: when one child aborts or fails the others
// still run to their own end, and every outcome is returned to the caller.
//
// ============================================================================

#pragma once

#include "cotask/core/async.hpp"

#include <coroutine>
#include <cstddef>
#include <cstdlib>
#include <optional>
#include <tuple>
#include <utility>
#include <vector>

namespace cotask {

namespace detail {

// Counts outstanding children plus one for the awaiting parent. Whoever
// brings the count to zero resumes the parent; the extra slot covers children
// that finish synchronously before the parent has suspended.
class WhenAllCounter {
   public:
    explicit WhenAllCounter(std::size_t children) noexcept : remaining_(children + 1) {}

    bool TryAwait(std::coroutine_handle<> parent) noexcept {
        parent_ = parent;
        return --remaining_ > 0;
    }

    void Arrive() noexcept {
        if (--remaining_ == 0) {
            parent_.resume();
        }
    }

   private:
    std::size_t remaining_;
    std::coroutine_handle<> parent_{nullptr};
};

template <typename T>
class WhenAllChild {
   public:
    struct promise_type {
        WhenAllCounter* counter = nullptr;
        std::optional<T> result;

        WhenAllChild get_return_object() noexcept {
            return WhenAllChild{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        std::suspend_always initial_suspend() noexcept { return {}; }

        auto final_suspend() noexcept {
            struct Arrive {
                bool await_ready() noexcept { return false; }
                void await_suspend(std::coroutine_handle<promise_type> h) noexcept { h.promise().counter->Arrive(); }
                void await_resume() noexcept {}
            };
            return Arrive{};
        }

        template <typename U>
        void return_value(U&& value) {
            result.emplace(std::forward<U>(value));
        }

        void unhandled_exception() noexcept { std::abort(); }
    };

    using Handle = std::coroutine_handle<promise_type>;

    explicit WhenAllChild(Handle h) noexcept : handle_(h) {}

    WhenAllChild(WhenAllChild&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}
    WhenAllChild& operator=(WhenAllChild&&) = delete;
    WhenAllChild(const WhenAllChild&) = delete;
    WhenAllChild& operator=(const WhenAllChild&) = delete;

    ~WhenAllChild() {
        if (handle_) {
            handle_.destroy();
        }
    }

    void Start(WhenAllCounter& counter) {
        handle_.promise().counter = &counter;
        handle_.resume();
    }

    T TakeResult() { return std::move(*handle_.promise().result); }

   private:
    Handle handle_;
};

template <typename T>
WhenAllChild<T> MakeWhenAllChild(Async<T> work) {
    co_return co_await std::move(work);
}

template <typename... Ts>
class WhenAllTupleAwaitable {
   public:
    explicit WhenAllTupleAwaitable(Async<Ts>... work)
        : children_(MakeWhenAllChild(std::move(work))...), counter_(sizeof...(Ts)) {}

    bool await_ready() noexcept { return sizeof...(Ts) == 0; }

    bool await_suspend(std::coroutine_handle<> parent) {
        std::apply([this](auto&... child) { (child.Start(counter_), ...); }, children_);
        return counter_.TryAwait(parent);
    }

    std::tuple<Ts...> await_resume() {
        return std::apply([](auto&... child) { return std::tuple<Ts...>{child.TakeResult()...}; }, children_);
    }

   private:
    std::tuple<WhenAllChild<Ts>...> children_;
    WhenAllCounter counter_;
};

template <typename T>
class WhenAllVectorAwaitable {
   public:
    explicit WhenAllVectorAwaitable(std::vector<Async<T>> work) : counter_(work.size()) {
        children_.reserve(work.size());
        for (auto& w : work) {
            children_.push_back(MakeWhenAllChild(std::move(w)));
        }
    }

    bool await_ready() noexcept { return children_.empty(); }

    bool await_suspend(std::coroutine_handle<> parent) {
        for (auto& child : children_) {
            child.Start(counter_);
        }
        return counter_.TryAwait(parent);
    }

    std::vector<T> await_resume() {
        std::vector<T> results;
        results.reserve(children_.size());
        for (auto& child : children_) {
            results.push_back(child.TakeResult());
        }
        return results;
    }

   private:
    std::vector<WhenAllChild<T>> children_;
    WhenAllCounter counter_;
};

}  // namespace detail

template <typename... Ts>
[[nodiscard]] Async<std::tuple<Ts...>> WhenAll(Async<Ts>... work) {
    co_return co_await detail::WhenAllTupleAwaitable<Ts...>(std::move(work)...);
}

template <typename T>
[[nodiscard]] Async<std::vector<T>> WhenAll(std::vector<Async<T>> work) {
    co_return co_await detail::WhenAllVectorAwaitable<T>(std::move(work));
}

}  // namespace cotask
