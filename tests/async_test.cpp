// ============================================================================
// Async<T> Unit Tests
// ============================================================================

#include <gtest/gtest.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "cotask/core/async.hpp"
#include "cotask/io/libuv_executor.hpp"
#include "cotask/io/yield.hpp"
#include "cotask/sync/sync_wait.hpp"

using namespace cotask;

// ============================================================================
// Basic Creation Tests
// ============================================================================

TEST(AsyncTest, SimpleReturnValue) {
    auto task = []() -> Async<int> { co_return 42; };

    EXPECT_EQ(SyncWait(task()), 42);
}

TEST(AsyncTest, VoidAsync) {
    bool executed = false;
    auto task = [&]() -> Async<void> {
        executed = true;
        co_return;
    };

    SyncWait(task());
    EXPECT_TRUE(executed);
}

TEST(AsyncTest, StringReturnValue) {
    auto task = []() -> Async<std::string> { co_return "hello cotask"; };

    EXPECT_EQ(SyncWait(task()), "hello cotask");
}

// ============================================================================
// Chained Coroutines Tests
// ============================================================================

TEST(AsyncTest, ChainedCoroutines) {
    auto first = []() -> Async<int> { co_return 10; };

    auto second = [&]() -> Async<int> {
        int a = co_await first();
        co_return a + 5;
    };

    auto third = [&]() -> Async<int> {
        int b = co_await second();
        co_return b * 2;
    };

    EXPECT_EQ(SyncWait(third()), 30);  // (10 + 5) * 2
}

TEST(AsyncTest, DeepChaining) {
    std::function<Async<int>(int)> chain = [&](int depth) -> Async<int> {
        if (depth == 0) co_return 1;
        int val = co_await chain(depth - 1);
        co_return val + 1;
    };

    EXPECT_EQ(SyncWait(chain(10)), 11);
}

// ============================================================================
// Move Semantics Tests
// ============================================================================

TEST(AsyncTest, MoveOnlyResult) {
    auto task = []() -> Async<std::unique_ptr<int>> { co_return std::make_unique<int>(42); };

    auto result = SyncWait(task());
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(*result, 42);
}

TEST(AsyncTest, MoveAssignmentDestroysOldFrame) {
    bool flag1 = false;
    bool flag2 = false;

    auto make1 = [&]() -> Async<void> {
        flag1 = true;
        co_return;
    };
    auto make2 = [&]() -> Async<void> {
        flag2 = true;
        co_return;
    };

    Async<void> t1 = make1();
    Async<void> t2 = make2();
    t1 = std::move(t2);

    SyncWait(std::move(t1));
    EXPECT_FALSE(flag1);
    EXPECT_TRUE(flag2);
}

// ============================================================================
// Lazy Execution Tests
// ============================================================================

TEST(AsyncTest, LazyExecution) {
    bool started = false;

    auto task = [&]() -> Async<int> {
        started = true;
        co_return 42;
    };

    Async<int> t = task();
    EXPECT_FALSE(started);
    EXPECT_FALSE(t.IsDone());

    EXPECT_EQ(SyncWait(std::move(t)), 42);
    EXPECT_TRUE(started);
}

TEST(AsyncTest, LargeReturnValue) {
    auto task = []() -> Async<std::vector<int>> {
        std::vector<int> v(1000);
        for (int i = 0; i < 1000; ++i) v[i] = i;
        co_return v;
    };

    auto result = SyncWait(task());
    EXPECT_EQ(result.size(), 1000u);
    EXPECT_EQ(result[999], 999);
}

// ============================================================================
// Resumption
// ============================================================================

TEST(AsyncTest, ManySequentialAwaits) {
    auto leaf = [](int i) -> Async<int> { co_return i; };

    auto loop = [&]() -> Async<long long> {
        long long sum = 0;
        for (int i = 0; i < 1000; ++i) {
            sum += co_await leaf(i);
        }
        co_return sum;
    };

    EXPECT_EQ(SyncWait(loop()), 999LL * 1000LL / 2);
}

TEST(AsyncTest, ResumedByExecutorAfterYield) {
    auto executor = LibuvExecutor::Create().Value();
    int value = 0;

    auto inner = []() -> Async<int> {
        co_await Yield();
        co_return 5;
    };
    auto outer = [&]() -> Async<void> {
        value = co_await inner();
        value += co_await inner();
    };

    auto t = outer();
    executor->Schedule(t.GetHandle());
    executor->Run();

    EXPECT_TRUE(t.IsDone());
    EXPECT_EQ(value, 10);
}
