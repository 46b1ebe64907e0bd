// ============================================================================
// WhenAll Tests
// ============================================================================

#include "cotask/core/when_all.hpp"

#include "cotask/core/async.hpp"
#include "cotask/io/libuv_executor.hpp"
#include "cotask/io/timer.hpp"
#include "cotask/io/yield.hpp"
#include "cotask/sync/sync_wait.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <string>
#include <tuple>
#include <vector>

using namespace cotask;
using namespace std::chrono_literals;

// ============================================================================
// Without a host loop
// ============================================================================

TEST(WhenAllTest, TupleOfSynchronousChildren) {
    auto number = []() -> Async<int> { co_return 7; };
    auto text = []() -> Async<std::string> { co_return "seven"; };

    auto run = [&]() -> Async<std::tuple<int, std::string>> { co_return co_await WhenAll(number(), text()); };

    auto [n, s] = SyncWait(run());
    EXPECT_EQ(n, 7);
    EXPECT_EQ(s, "seven");
}

TEST(WhenAllTest, VectorKeepsArgumentOrder) {
    auto square = [](int x) -> Async<int> { co_return x * x; };

    auto run = [&]() -> Async<std::vector<int>> {
        std::vector<Async<int>> work;
        for (int i = 1; i <= 4; ++i) {
            work.push_back(square(i));
        }
        co_return co_await WhenAll(std::move(work));
    };

    EXPECT_EQ(SyncWait(run()), (std::vector<int>{1, 4, 9, 16}));
}

TEST(WhenAllTest, EmptyVector) {
    auto run = []() -> Async<std::vector<int>> { co_return co_await WhenAll(std::vector<Async<int>>{}); };

    EXPECT_TRUE(SyncWait(run()).empty());
}

// ============================================================================
// On a host loop
// ============================================================================

TEST(WhenAllTest, ChildrenInterleave) {
    auto executor = LibuvExecutor::Create().Value();
    std::string trace;

    auto worker = [&](char tag) -> Async<int> {
        for (int i = 0; i < 3; ++i) {
            trace += tag;
            co_await Yield();
        }
        co_return 1;
    };

    int total = 0;
    auto run = [&]() -> Async<void> {
        auto [a, b] = co_await WhenAll(worker('a'), worker('b'));
        total = a + b;
    };

    auto t = run();
    executor->Schedule(t.GetHandle());
    executor->Run();

    EXPECT_TRUE(t.IsDone());
    EXPECT_EQ(trace, "ababab");
    EXPECT_EQ(total, 2);
}

TEST(WhenAllTest, SleepsRunConcurrently) {
    auto executor = LibuvExecutor::Create().Value();

    auto sleeper = [](std::chrono::milliseconds d) -> Async<int> {
        co_await Sleep(d);
        co_return static_cast<int>(d.count());
    };

    std::vector<int> results;
    auto run = [&]() -> Async<void> {
        std::vector<Async<int>> work;
        work.push_back(sleeper(40ms));
        work.push_back(sleeper(60ms));
        work.push_back(sleeper(20ms));
        results = co_await WhenAll(std::move(work));
    };

    auto start = std::chrono::steady_clock::now();
    auto t = run();
    executor->Schedule(t.GetHandle());
    executor->Run();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    EXPECT_EQ(results, (std::vector<int>{40, 60, 20}));
    EXPECT_GE(elapsed.count(), 55);
    EXPECT_LT(elapsed.count(), 110);
}
