// ============================================================================
// cotask/core/result.hpp - Success-or-Error Value
// ============================================================================
//
// Result<T, E> holds either a success value or an error. cotask reports every
// outcome of a computation through it (see TaskResult<T> in error.hpp), so a
// caller can tell Ok from Aborted from Failed without exceptions.
//
// USAGE:
// ------
//   Result<int, std::string> Parse(std::string_view s) {
//       if (s.empty()) return Err(std::string("empty"));
//       return Ok(static_cast<int>(s.size()));
//   }
//
//   auto r = Parse("abc");
//   if (r) Use(r.Value());
//
// Inside a coroutine returning Async<Result<...>>, COTASK_CO_TRY forwards an
// error to the caller:
//
//   COTASK_CO_TRY(co_await ctx.Update("Parsing..."));
//
// ============================================================================

#pragma once

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace cotask {

template <typename T, typename E>
class Result;

template <typename T>
struct OkTag {
    T value;

    template <typename U>
    explicit OkTag(U&& v) : value(std::forward<U>(v)) {}
};

template <typename E>
struct ErrTag {
    E error;

    template <typename U>
    explicit ErrTag(U&& e) : error(std::forward<U>(e)) {}
};

template <typename T>
OkTag<std::decay_t<T>> Ok(T&& value) {
    return OkTag<std::decay_t<T>>(std::forward<T>(value));
}

template <typename E>
ErrTag<std::decay_t<E>> Err(E&& error) {
    return ErrTag<std::decay_t<E>>(std::forward<E>(error));
}

// Success payload of Result<void, E>
struct Unit {};

inline OkTag<Unit> Ok() {
    return OkTag<Unit>(Unit{});
}

// ============================================================================
// Result<T, E>
// ============================================================================
template <typename T, typename E>
class Result {
   public:
    using ValueType = T;
    using ErrorType = E;

    template <typename U>
    Result(OkTag<U>&& ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}

    template <typename U>
    Result(ErrTag<U>&& err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    [[nodiscard]] bool IsOk() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return data_.index() == 1; }

    explicit operator bool() const noexcept { return IsOk(); }

    // Precondition: IsOk()
    T& Value() & { return std::get<0>(data_); }
    const T& Value() const& { return std::get<0>(data_); }
    T&& Value() && { return std::get<0>(std::move(data_)); }

    // Precondition: IsErr()
    E& Error() & { return std::get<1>(data_); }
    const E& Error() const& { return std::get<1>(data_); }
    E&& Error() && { return std::get<1>(std::move(data_)); }

   private:
    std::variant<T, E> data_;
};

// ============================================================================
// Result<void, E>
// ============================================================================
template <typename E>
class Result<void, E> {
   public:
    using ValueType = void;
    using ErrorType = E;

    Result(OkTag<Unit>&&) : error_(std::nullopt) {}

    template <typename U>
    Result(ErrTag<U>&& err) : error_(std::move(err.error)) {}

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }

    explicit operator bool() const noexcept { return IsOk(); }

    E& Error() & { return *error_; }
    const E& Error() const& { return *error_; }
    E&& Error() && { return std::move(*error_); }

   private:
    std::optional<E> error_;
};

}  // namespace cotask

// Evaluates `expr` (usually a co_await on something returning a Result) and,
// if it holds an error, co_returns that error from the enclosing coroutine.
#define COTASK_CO_TRY(expr)                                                  \
    do {                                                                     \
        auto cotask_try_result_ = (expr);                                    \
        if (cotask_try_result_.IsErr()) {                                    \
            co_return ::cotask::Err(std::move(cotask_try_result_).Error());  \
        }                                                                    \
    } while (0)
