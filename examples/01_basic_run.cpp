// ============================================================================
// Example 01: Running a Task
// ============================================================================
//
// This example defines a Task, runs it three ways (blocking on a libuv loop,
// awaited from a coroutine, synchronously without a loop) and shows the
// three outcomes a run can have: a value, an abort, a failure.
//
// RUN:
//   cd build && ./examples/01_basic_run
//
// ============================================================================

#include <chrono>
#include <iostream>
#include <string>

#include <spdlog/cfg/env.h>

#include "cotask/cotask.hpp"

using namespace cotask;
using namespace std::chrono_literals;

// Counts to `n`, reporting progress on the way
Task<int> CountTo(int n) {
    return Task<int>::Create("count to " + std::to_string(n), [n](ExecutionContext& ctx) -> Async<TaskResult<int>> {
        if (n < 0) {
            co_return Failed(Errc::InvalidArgument, "cannot count to a negative number");
        }
        int total = 0;
        for (int i = 1; i <= n; ++i) {
            total += i;
            COTASK_CO_TRY(co_await ctx.Update({"Counting", static_cast<double>(i), static_cast<double>(n)}));
            COTASK_CO_TRY(co_await ctx.Delay(10ms));
        }
        co_return Ok(total);
    });
}

void Print(const char* label, const TaskResult<int>& result) {
    if (result.IsOk()) {
        std::cout << "[" << label << "] value: " << result.Value() << std::endl;
    } else {
        std::cout << "[" << label << "] " << result.Error().Message() << std::endl;
    }
}

int main() {
    // SPDLOG_LEVEL=debug shows the driver's run log
    spdlog::cfg::load_env_levels();

    std::cout << "=== cotask Example 01: Running a Task ===" << std::endl << std::endl;

    auto executor_result = LibuvExecutor::Create();
    if (executor_result.IsErr()) {
        std::cerr << "failed to create the event loop: " << executor_result.Error().message() << std::endl;
        return 1;
    }
    auto& executor = *executor_result.Value();

    // 1. Blocking on the loop, with an observer printing the root's progress
    RunOptions options;
    options.update_interval = 30ms;
    options.observer = [](Progress& p) {
        auto fraction = p.Root().Fraction();
        std::cout << "  " << p.Root().task_name << ": " << p.Root().message;
        if (fraction) {
            std::cout << " (" << static_cast<int>(*fraction * 100) << "%)";
        }
        std::cout << std::endl;
    };
    Print("blocking", RunBlocking(executor, CountTo(10), options));

    // 2. Aborted by the observer once past 50%
    options.observer = [](Progress& p) {
        auto fraction = p.Root().Fraction();
        if (fraction && *fraction > 0.5) {
            p.RequestAbort("user lost patience");
        }
    };
    Print("aborted", RunBlocking(executor, CountTo(10), options));

    // 3. A failure is not an abort: no cleanup handler, error returned as is
    Print("failed", RunBlocking(executor, CountTo(-1)));

    // 4. Awaited from inside another coroutine
    auto outer = [&]() -> Async<void> {
        auto result = co_await Run(CountTo(3));
        Print("awaited", result);
    };
    auto outer_task = outer();
    executor.Schedule(outer_task.GetHandle());
    executor.Run();

    // 5. Without a loop: nothing suspends, Delay returns at once
    auto start = std::chrono::steady_clock::now();
    Print("synchronous", RunSynchronously(CountTo(100)));
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
    std::cout << "  (took " << elapsed.count() << "us)" << std::endl;

    std::cout << "\n=== Done! ===" << std::endl;
    return 0;
}
