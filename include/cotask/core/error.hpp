// ============================================================================
// cotask/core/error.hpp - Task Outcomes and Error Codes
// ============================================================================
//
// A computation ends in exactly one of three ways:
//
//   Ok(value)          the computation produced its result
//   Aborted(reason)    cooperative cancellation, requested by an observer or
//                      chosen voluntarily by the computation itself
//   Failed(code, msg)  anything else that went wrong
//
// TaskResult<T> = Result<T, TaskError> carries that outcome. Only the Aborted
// kind runs on_abort cleanup handlers; a Failed outcome is handed to the caller
// untouched.
//
// USAGE:
// ------
//   Async<TaskResult<int>> Body(ExecutionContext& ctx) {
//       if (bad_input) co_return Failed(Errc::InvalidArgument, "negative size");
//       if (user_gave_up) co_return Aborted("user cancelled");
//       co_return Ok(42);
//   }
//
// ============================================================================

#pragma once

#include "cotask/core/result.hpp"

#include <string>
#include <system_error>
#include <utility>

namespace cotask {

enum class Errc {
    Aborted = 1,
    Failed,
    InvalidArgument,
    IoError,
};

const std::error_category& CotaskCategory() noexcept;

std::error_code make_error_code(Errc e) noexcept;

// ============================================================================
// TaskError
// ============================================================================
struct TaskError {
    enum class Kind {
        Aborted,
        Failed,
    };

    Kind kind = Kind::Failed;
    // Abort reason, or a human-readable description of the failure
    std::string reason;
    std::error_code code;

    static TaskError Abort(std::string reason);
    static TaskError Failure(std::error_code code, std::string message = {});

    [[nodiscard]] bool IsAborted() const noexcept { return kind == Kind::Aborted; }
    [[nodiscard]] bool IsFailed() const noexcept { return kind == Kind::Failed; }

    // "aborted: <reason>" or "failed: <message> (<category>:<value>)"
    [[nodiscard]] std::string Message() const;

    friend bool operator==(const TaskError& lhs, const TaskError& rhs) {
        return lhs.kind == rhs.kind && lhs.reason == rhs.reason && lhs.code == rhs.code;
    }
};

template <typename T>
using TaskResult = Result<T, TaskError>;

// Error tags that convert into any TaskResult<T>
inline ErrTag<TaskError> Aborted(std::string reason) {
    return ErrTag<TaskError>(TaskError::Abort(std::move(reason)));
}

inline ErrTag<TaskError> Failed(std::error_code code, std::string message = {}) {
    return ErrTag<TaskError>(TaskError::Failure(code, std::move(message)));
}

inline ErrTag<TaskError> Failed(Errc code, std::string message = {}) {
    return Failed(make_error_code(code), std::move(message));
}

}  // namespace cotask

namespace std {
template <>
struct is_error_code_enum<cotask::Errc> : true_type {};
}  // namespace std
