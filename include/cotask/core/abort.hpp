// ============================================================================
// cotask/core/abort.hpp - External Abort Requests
// ============================================================================
//
// AbortSource lets host code that is not an observer (a cancel button, a
// timeout timer) abort a run. The driver subscribes to the token passed in
// RunOptions and forwards the first request to Progress::RequestAbort, which
// stays the single place where the progress tree is flagged.
//
// Single-threaded like the executor: call RequestAbort on the loop thread.
// Another thread should Post() the call to the executor instead.
//
// USAGE:
// ------
//   AbortSource source;
//   RunOptions options;
//   options.abort_token = source.GetToken();
//
//   executor->PostAfter(5s, [&source] { source.RequestAbort("timed out"); });
//   auto result = RunBlocking(*executor, task, options);
//
// ============================================================================

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace cotask {

class AbortState {
   public:
    using Callback = std::function<void(const std::string& reason)>;

    AbortState() = default;

    AbortState(const AbortState&) = delete;
    AbortState& operator=(const AbortState&) = delete;

    [[nodiscard]] bool IsAbortRequested() const noexcept { return requested_; }
    [[nodiscard]] const std::string& Reason() const noexcept { return reason_; }

    // First reason wins; later requests are ignored
    void RequestAbort(std::string reason) {
        if (requested_) {
            return;
        }
        requested_ = true;
        reason_ = std::move(reason);

        auto callbacks = std::move(callbacks_);
        callbacks_.clear();
        for (auto& entry : callbacks) {
            entry.second(reason_);
        }
    }

    // Returns 0 when the request already happened; the callback then ran
    // synchronously.
    std::size_t Register(Callback callback) {
        if (requested_) {
            callback(reason_);
            return 0;
        }
        std::size_t handle = next_handle_++;
        callbacks_.emplace_back(handle, std::move(callback));
        return handle;
    }

    void Unregister(std::size_t handle) {
        if (handle == 0) return;
        for (auto it = callbacks_.begin(); it != callbacks_.end(); ++it) {
            if (it->first == handle) {
                callbacks_.erase(it);
                return;
            }
        }
    }

   private:
    bool requested_ = false;
    std::string reason_;
    std::vector<std::pair<std::size_t, Callback>> callbacks_;
    std::size_t next_handle_ = 1;
};

// Read-only view; a default-constructed token is never aborted
class AbortToken {
   public:
    AbortToken() = default;

    [[nodiscard]] bool IsAbortRequested() const noexcept { return state_ && state_->IsAbortRequested(); }

    [[nodiscard]] std::string Reason() const { return state_ ? state_->Reason() : std::string(); }

    [[nodiscard]] bool IsValid() const noexcept { return state_ != nullptr; }

    std::size_t OnAbort(AbortState::Callback callback) {
        return state_ ? state_->Register(std::move(callback)) : 0;
    }

    void Unregister(std::size_t handle) {
        if (state_) {
            state_->Unregister(handle);
        }
    }

   private:
    friend class AbortSource;

    explicit AbortToken(std::shared_ptr<AbortState> state) : state_(std::move(state)) {}

    std::shared_ptr<AbortState> state_;
};

class AbortSource {
   public:
    AbortSource() : state_(std::make_shared<AbortState>()) {}

    AbortSource(const AbortSource&) = delete;
    AbortSource& operator=(const AbortSource&) = delete;
    AbortSource(AbortSource&&) = default;
    AbortSource& operator=(AbortSource&&) = default;

    [[nodiscard]] AbortToken GetToken() const { return AbortToken(state_); }

    void RequestAbort(std::string reason) {
        if (state_) {
            state_->RequestAbort(std::move(reason));
        }
    }

    [[nodiscard]] bool IsAbortRequested() const noexcept { return state_ && state_->IsAbortRequested(); }

   private:
    std::shared_ptr<AbortState> state_;
};

// Keeps a callback registered for the lifetime of the guard
class AbortCallbackGuard {
   public:
    AbortCallbackGuard(AbortToken token, AbortState::Callback callback)
        : token_(std::move(token)), handle_(token_.OnAbort(std::move(callback))) {}

    ~AbortCallbackGuard() { token_.Unregister(handle_); }

    AbortCallbackGuard(const AbortCallbackGuard&) = delete;
    AbortCallbackGuard& operator=(const AbortCallbackGuard&) = delete;

   private:
    AbortToken token_;
    std::size_t handle_;
};

}  // namespace cotask
