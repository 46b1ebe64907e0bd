// ============================================================================
// Scheduler Tests (ChunkedSubtask, Delay)
// ============================================================================

#include "cotask/task/scheduler.hpp"

#include "cotask/io/libuv_executor.hpp"
#include "cotask/sync/sync_wait.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <gtest/gtest.h>
#include <optional>
#include <vector>

using namespace cotask;
using namespace std::chrono_literals;

namespace {

// Sums 0..total-1, `n` numbers per chunk
struct Summation {
    std::size_t total = 0;
    std::size_t position = 0;
    long long sum = 0;
    int reports = 0;
};

std::size_t SumChunk(std::size_t n, Summation& s) {
    std::size_t taken = std::min(n, s.total - s.position);
    for (std::size_t i = 0; i < taken; ++i) {
        s.sum += static_cast<long long>(s.position + i);
    }
    s.position += taken;
    return taken;
}

void ReportSum(ExecutionContext& ctx, Summation& s) {
    ++s.reports;
    ctx.SetProgress({"Summing", static_cast<double>(s.position), static_cast<double>(s.total)});
}

TaskResult<Summation> SumSynchronously(std::size_t total, std::size_t chunk_size) {
    ExecutorGuard none(nullptr);
    detail::RunState run("sum", {}, true);
    ExecutionContext ctx(run, run.GetProgress().Root());
    Summation state;
    state.total = total;
    return SyncWait(ChunkedSubtask(ctx, chunk_size, state, SumChunk, ReportSum));
}

}  // namespace

// ============================================================================
// Chunking
// ============================================================================

TEST(ChunkedSubtaskTest, ChunkSizeDoesNotChangeResult) {
    const long long expected = 1999LL * 2000LL / 2;
    for (std::size_t chunk : {std::size_t{1}, std::size_t{7}, std::size_t{500}, std::size_t{2000},
                              std::size_t{50000}}) {
        auto result = SumSynchronously(2000, chunk);
        ASSERT_TRUE(result.IsOk()) << "chunk " << chunk;
        EXPECT_EQ(result.Value().sum, expected) << "chunk " << chunk;
        EXPECT_EQ(result.Value().position, 2000u) << "chunk " << chunk;
    }
}

TEST(ChunkedSubtaskTest, ReportsAfterEveryFullChunkAndOnceAtEnd) {
    // 10 full chunks, then an empty one that ends the loop
    auto exact = SumSynchronously(1000, 100);
    ASSERT_TRUE(exact.IsOk());
    EXPECT_EQ(exact.Value().reports, 11);

    // 3 full chunks and a short one
    auto uneven = SumSynchronously(350, 100);
    ASSERT_TRUE(uneven.IsOk());
    EXPECT_EQ(uneven.Value().reports, 4);
}

TEST(ChunkedSubtaskTest, ZeroChunkSizeMeansOne) {
    auto result = SumSynchronously(5, 0);
    ASSERT_TRUE(result.IsOk());
    EXPECT_EQ(result.Value().sum, 10);
    EXPECT_EQ(result.Value().reports, 6);
}

TEST(ChunkedSubtaskTest, EmptyInput) {
    auto result = SumSynchronously(0, 100);
    ASSERT_TRUE(result.IsOk());
    EXPECT_EQ(result.Value().sum, 0);
    EXPECT_EQ(result.Value().reports, 1);
}

TEST(ChunkedSubtaskTest, FinalProgressReported) {
    ExecutorGuard none(nullptr);
    detail::RunState run("sum", {}, true);
    ExecutionContext ctx(run, run.GetProgress().Root());
    Summation state;
    state.total = 250;

    auto result = SyncWait(ChunkedSubtask(ctx, 100, state, SumChunk, ReportSum));
    ASSERT_TRUE(result.IsOk());
    EXPECT_EQ(ctx.Node().message, "Summing");
    EXPECT_DOUBLE_EQ(*ctx.Node().Fraction(), 1.0);
}

// ============================================================================
// Abort
// ============================================================================

TEST(ChunkedSubtaskTest, AbortBeforeStartProcessesNothing) {
    ExecutorGuard none(nullptr);
    detail::RunState run("sum", {}, true);
    ExecutionContext ctx(run, run.GetProgress().Root());
    run.GetProgress().RequestAbort("early");

    Summation state;
    state.total = 100;
    int processed_chunks = 0;
    auto result = SyncWait(ChunkedSubtask(
        ctx, 10, state,
        [&](std::size_t n, Summation& s) {
            ++processed_chunks;
            return SumChunk(n, s);
        },
        ReportSum));

    ASSERT_TRUE(result.IsErr());
    EXPECT_EQ(result.Error().reason, "early");
    EXPECT_EQ(processed_chunks, 0);
}

TEST(ChunkedSubtaskTest, AbortStopsAtNextChunkBoundary) {
    auto executor = LibuvExecutor::Create().Value();
    RunOptions options;
    options.update_interval = 0ms;
    // Request abort once half the input has been reported
    options.observer = [](Progress& p) {
        auto fraction = p.Root().Fraction();
        if (fraction && *fraction >= 0.5) {
            p.RequestAbort("half is enough");
        }
    };
    detail::RunState run("sum", std::move(options), false);
    ExecutionContext ctx(run, run.GetProgress().Root());

    Summation state;
    state.total = 1000;
    std::size_t consumed_at_end = 0;

    std::optional<TaskResult<Summation>> result;
    auto driver = [&]() -> Async<void> {
        result.emplace(co_await ChunkedSubtask(
            ctx, 100, state,
            [&](std::size_t n, Summation& s) {
                std::size_t taken = SumChunk(n, s);
                consumed_at_end = s.position;
                return taken;
            },
            ReportSum));
    };

    auto d = driver();
    executor->Schedule(d.GetHandle());
    executor->Run();

    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->IsErr());
    EXPECT_EQ(result->Error().reason, "half is enough");
    EXPECT_GE(consumed_at_end, 500u);
    EXPECT_LE(consumed_at_end, 600u);
}

TEST(ChunkedSubtaskTest, YieldsBetweenChunks) {
    auto executor = LibuvExecutor::Create().Value();
    detail::RunState run("sum", {}, false);
    ExecutionContext ctx(run, run.GetProgress().Root());

    // A callback posted before the run gets a turn between two chunks
    std::vector<std::size_t> positions_seen_by_loop;
    Summation state;
    state.total = 300;
    std::size_t live_position = 0;

    executor->Post([&] { positions_seen_by_loop.push_back(live_position); });

    bool done = false;
    auto driver = [&]() -> Async<void> {
        auto r = co_await ChunkedSubtask(
            ctx, 100, state,
            [&](std::size_t n, Summation& s) {
                std::size_t taken = SumChunk(n, s);
                live_position = s.position;
                return taken;
            },
            ReportSum);
        done = r.IsOk();
    };

    auto d = driver();
    executor->Schedule(d.GetHandle());
    executor->Run();

    EXPECT_TRUE(done);
    ASSERT_EQ(positions_seen_by_loop.size(), 1u);
    EXPECT_GT(positions_seen_by_loop[0], 0u);
    EXPECT_LT(positions_seen_by_loop[0], 300u);
}

// ============================================================================
// Delay
// ============================================================================

TEST(SchedulerTest, FreeDelayForwardsToContext) {
    auto executor = LibuvExecutor::Create().Value();
    detail::RunState run("wait", {}, false);
    ExecutionContext ctx(run, run.GetProgress().Root());

    std::optional<TaskResult<void>> result;
    auto driver = [&]() -> Async<void> { result.emplace(co_await Delay(ctx, 20ms)); };

    auto start = Clock::now();
    auto d = driver();
    executor->Schedule(d.GetHandle());
    executor->Run();

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->IsOk());
    EXPECT_GE(Clock::now() - start, 15ms);
}
