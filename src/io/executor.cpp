// ============================================================================
// cotask/io/executor.cpp - Current Executor Tracking
// ============================================================================

#include "cotask/io/executor.hpp"

namespace cotask {

namespace {

thread_local Executor* g_current_executor = nullptr;

}  // namespace

Executor* GetCurrentExecutor() {
    return g_current_executor;
}

void SetCurrentExecutor(Executor* executor) {
    g_current_executor = executor;
}

ExecutorGuard::ExecutorGuard(Executor* executor) : previous_(g_current_executor) {
    g_current_executor = executor;
}

ExecutorGuard::~ExecutorGuard() {
    g_current_executor = previous_;
}

}  // namespace cotask
