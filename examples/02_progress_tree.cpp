// ============================================================================
// Example 02: Progress Tree and Cancellation
// ============================================================================
//
// A root task that does some timed work and then spawns three children that
// run side by side. The observer prints the live progress tree on every tick
// and requests an abort once the run has taken longer than a deadline, which
// cancels the children still running; each of them runs its cleanup handler
// before the root's run returns.
//
// RUN:
//   cd build && ./examples/02_progress_tree [deadline_ms]
//
//   Without an argument the deadline is 1000ms and the run is aborted.
//   Pass 2000 to let it finish.
//
// ============================================================================

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>

#include <spdlog/cfg/env.h>

#include "cotask/cotask.hpp"

using namespace cotask;
using namespace std::chrono_literals;

// A child that waits and reports
Task<int> DelayedValue(std::chrono::milliseconds delay, int value) {
    auto name = "delayed value " + std::to_string(value);
    return Task<int>::Create(
        name,
        [delay, value](ExecutionContext& ctx) -> Async<TaskResult<int>> {
            COTASK_CO_TRY(co_await ctx.Update("Processing delayed... " + std::to_string(value), true));
            COTASK_CO_TRY(co_await ctx.Delay(delay));
            if (ctx.ShouldUpdate()) {
                COTASK_CO_TRY(co_await ctx.Update("hello from delayed..."));
            }
            co_return Ok(value);
        },
        [value] { std::cout << "On abort called " << value << std::endl; });
}

Task<int> TestTree() {
    return Task<int>::Create("test o", [](ExecutionContext& ctx) -> Async<TaskResult<int>> {
        COTASK_CO_TRY(co_await ctx.Delay(250ms));
        if (ctx.ShouldUpdate()) COTASK_CO_TRY(co_await ctx.Update("hi! 1"));
        COTASK_CO_TRY(co_await ctx.Delay(125ms));
        if (ctx.ShouldUpdate()) COTASK_CO_TRY(co_await ctx.Update("hi! 2"));
        COTASK_CO_TRY(co_await ctx.Delay(250ms));
        if (ctx.ShouldUpdate()) COTASK_CO_TRY(co_await ctx.Update("hi! 3"));

        auto [c1, c2, c3] = co_await WhenAll(ctx.RunChild(DelayedValue(250ms, 1)),
                                             ctx.RunChild(DelayedValue(500ms, 2)),
                                             ctx.RunChild(DelayedValue(750ms, 3)));
        COTASK_CO_TRY(c1);
        COTASK_CO_TRY(c2);
        COTASK_CO_TRY(c3);

        if (ctx.ShouldUpdate()) COTASK_CO_TRY(co_await ctx.Update("Almost done..."));
        co_return Ok(c1.Value() + c2.Value() + c3.Value() + 1);
    });
}

int main(int argc, char** argv) {
    spdlog::cfg::load_env_levels();

    const auto deadline = std::chrono::milliseconds(argc > 1 ? std::atoi(argv[1]) : 1000);

    std::cout << "=== cotask Example 02: Progress Tree ===" << std::endl;
    std::cout << "deadline: " << deadline.count() << "ms" << std::endl << std::endl;

    auto executor = LibuvExecutor::Create();
    if (executor.IsErr()) {
        std::cerr << "failed to create the event loop: " << executor.Error().message() << std::endl;
        return 1;
    }

    RunOptions options;
    options.update_interval = 250ms;
    options.observer = [deadline](Progress& p) {
        std::cout << FormatProgressTree(p.Root()) << std::endl;
        if (Clock::now() - p.Root().started_time > deadline) {
            p.RequestAbort("test");
        }
    };

    auto result = RunBlocking(*executor.Value(), TestTree(), options);
    if (result.IsOk()) {
        std::cout << "\nresult: " << result.Value() << std::endl;
        return 0;
    }
    std::cout << "\n" << result.Error().Message() << std::endl;
    return result.Error().IsAborted() ? 0 : 1;
}
