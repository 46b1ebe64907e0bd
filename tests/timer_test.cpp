// ============================================================================
// Sleep / Yield Tests
// ============================================================================

#include "cotask/io/timer.hpp"

#include "cotask/core/async.hpp"
#include "cotask/io/libuv_executor.hpp"
#include "cotask/io/yield.hpp"
#include "cotask/sync/sync_wait.hpp"

#include <chrono>
#include <gtest/gtest.h>

using namespace cotask;
using namespace std::chrono_literals;

// ============================================================================
// On a host loop
// ============================================================================

TEST(TimerTest, SleepReturns) {
    auto executor_ptr = LibuvExecutor::Create().Value();
    auto& executor = *executor_ptr;
    bool completed = false;

    auto task = [&]() -> Async<void> {
        co_await Sleep(20ms);
        completed = true;
    };

    auto t = task();
    executor.Schedule(t.GetHandle());
    executor.Run();

    EXPECT_TRUE(completed);
}

TEST(TimerTest, SleepDuration) {
    auto executor_ptr = LibuvExecutor::Create().Value();
    auto& executor = *executor_ptr;
    long long elapsed_ms = 0;

    auto task = [&]() -> Async<void> {
        auto start = std::chrono::steady_clock::now();
        co_await Sleep(50ms);
        auto elapsed = std::chrono::steady_clock::now() - start;
        elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    };

    auto t = task();
    executor.Schedule(t.GetHandle());
    executor.Run();

    EXPECT_GE(elapsed_ms, 40);  // Allow some jitter
}

TEST(TimerTest, MultipleSleeps) {
    auto executor_ptr = LibuvExecutor::Create().Value();
    auto& executor = *executor_ptr;
    int count = 0;

    auto task = [&]() -> Async<void> {
        co_await Sleep(10ms);
        count++;
        co_await Sleep(10ms);
        count++;
        co_await Sleep(10ms);
        count++;
    };

    auto t = task();
    executor.Schedule(t.GetHandle());
    executor.Run();

    EXPECT_EQ(count, 3);
}

TEST(TimerTest, ConcurrentSleepsOverlap) {
    auto executor_ptr = LibuvExecutor::Create().Value();
    auto& executor = *executor_ptr;

    auto sleeper = [](std::chrono::milliseconds d) -> Async<void> { co_await Sleep(d); };

    auto start = std::chrono::steady_clock::now();
    auto a = sleeper(60ms);
    auto b = sleeper(60ms);
    executor.Schedule(a.GetHandle());
    executor.Schedule(b.GetHandle());
    executor.Run();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(a.IsDone());
    EXPECT_TRUE(b.IsDone());
    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 110);
}

TEST(TimerTest, DurationAccessor) {
    Sleep s(std::chrono::seconds(2));
    EXPECT_EQ(s.Duration(), 2000ms);
}

// ============================================================================
// Without a host loop
// ============================================================================

TEST(TimerTest, SleepWithoutExecutorCompletesInline) {
    ExecutorGuard none(nullptr);

    auto task = []() -> Async<int> {
        co_await Sleep(10s);
        co_await Yield();
        co_return 3;
    };

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(SyncWait(task()), 3);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}
