// ============================================================================
// cotask/cotask.hpp - Main Include Header
// ============================================================================
//
// This convenience header includes the complete cotask library.
// For smaller builds, include individual headers as needed.
//
// USAGE:
// ------
//   #include <cotask/cotask.hpp>
//   using namespace cotask;
//
// ============================================================================

#pragma once

// Core primitives
#include "cotask/core/abort.hpp"
#include "cotask/core/async.hpp"
#include "cotask/core/check.hpp"
#include "cotask/core/defer.hpp"
#include "cotask/core/detached_task.hpp"
#include "cotask/core/error.hpp"
#include "cotask/core/result.hpp"

// Combinators
#include "cotask/core/when_all.hpp"

// Host loop
#include "cotask/io/executor.hpp"
#include "cotask/io/libuv_executor.hpp"
#include "cotask/io/timer.hpp"
#include "cotask/io/yield.hpp"

// Synchronization
#include "cotask/sync/sync_wait.hpp"

// Tasks
#include "cotask/task/execution_context.hpp"
#include "cotask/task/progress.hpp"
#include "cotask/task/progress_update.hpp"
#include "cotask/task/run.hpp"
#include "cotask/task/run_state.hpp"
#include "cotask/task/scheduler.hpp"
#include "cotask/task/task.hpp"
