// ============================================================================
// cotask/task/scheduler.hpp - Cooperative Scheduling Helpers
// ============================================================================
//
// Utilities for long computations that have to share the host loop:
//
//   Yield()          let the loop run other work, then continue
//   Delay(ctx, d)    wait d, as a cancellation checkpoint
//   ChunkedSubtask   process a large input in chunks, reporting progress and
//                    checking for abort between chunks
//
// ChunkedSubtask:
// ---------------
// `process_chunk(chunk_size, state)` does up to chunk_size units of work and
// returns how many it did. Returning fewer than chunk_size means the input is
// exhausted. `report_progress(ctx, state)` writes the state's progress onto
// the task's node (typically ctx.SetProgress); it runs after every full chunk
// and once more at the end.
//
//   struct Lines { std::size_t position = 0; std::vector<std::string_view> out; };
//
//   auto lines = co_await ChunkedSubtask(ctx, 100'000, Lines{},
//       [&](std::size_t n, Lines& s) { return reader.ReadLines(n, s.out); },
//       [&](ExecutionContext& c, Lines& s) {
//           c.SetProgress({"Reading lines...", double(reader.Position()), double(reader.Size())});
//       });
//   if (lines.IsErr()) co_return Err(std::move(lines).Error());
//
// The chunk size stays fixed for the whole run; 0 is treated as 1. Chunking
// never changes the final state, only how often the loop gets control back.
//
// ============================================================================

#pragma once

#include "cotask/core/async.hpp"
#include "cotask/core/error.hpp"
#include "cotask/io/yield.hpp"
#include "cotask/task/execution_context.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <utility>

namespace cotask {

// ExecutionContext::Delay as a free function
[[nodiscard]] inline Async<TaskResult<void>> Delay(ExecutionContext& ctx, std::chrono::milliseconds duration) {
    return ctx.Delay(duration);
}

template <typename S, typename ProcessChunk, typename ReportProgress>
[[nodiscard]] Async<TaskResult<S>> ChunkedSubtask(ExecutionContext& ctx, std::size_t chunk_size, S state,
                                                  ProcessChunk process_chunk, ReportProgress report_progress) {
    // 0 would never make progress
    const std::size_t size = std::max<std::size_t>(chunk_size, 1);

    for (;;) {
        if (ctx.IsAbortRequested()) {
            co_return Aborted(ctx.AbortReason());
        }

        const std::size_t consumed = process_chunk(size, state);
        if (consumed < size) {
            break;
        }

        report_progress(ctx, state);
        COTASK_CO_TRY(co_await ctx.Checkpoint());
    }

    report_progress(ctx, state);
    co_return Ok(std::move(state));
}

}  // namespace cotask
