// ============================================================================
// cotask/core/coroutine_compat.hpp - Symmetric Transfer Portability
// ============================================================================
//
// GCC with AddressSanitizer does not emit the tail call that symmetric
// transfer relies on (https://gcc.gnu.org/bugzilla/show_bug.cgi?id=100897).
// Parent/child task chains in cotask hand control back and forth through
// final_suspend on every RunChild, so deep progress trees would grow the
// native stack without bound.
//
// await_suspend implementations return SymmetricTransferResult and wrap the
// target in SymmetricTransfer(). On healthy toolchains that is a plain handle
// return; under GCC+ASan it degrades to an explicit resume().
//
// ============================================================================

#pragma once

#include <coroutine>

namespace cotask {

#if defined(__GNUG__) && !defined(__clang__) && defined(__SANITIZE_ADDRESS__)
#define COTASK_ASAN_SYMMETRIC_TRANSFER_BROKEN 1
#else
#define COTASK_ASAN_SYMMETRIC_TRANSFER_BROKEN 0
#endif

#if COTASK_ASAN_SYMMETRIC_TRANSFER_BROKEN

using SymmetricTransferResult = void;

inline void SymmetricTransfer(std::coroutine_handle<> target) noexcept {
    target.resume();
}

#else

using SymmetricTransferResult = std::coroutine_handle<>;

inline std::coroutine_handle<> SymmetricTransfer(std::coroutine_handle<> target) noexcept {
    return target;
}

#endif

}  // namespace cotask
