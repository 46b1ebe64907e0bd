// ============================================================================
// Example 03: Chunked Line Reader
// ============================================================================
//
// Splits a large in-memory text into lines with ChunkedSubtask. The reader
// hands control back to the loop after every chunk, so the observer keeps
// printing "Parsing..." with the byte position, and a Ctrl-C style abort
// (here: a timer) stops the read between two chunks.
//
// RUN:
//   cd build && ./examples/03_chunked_lines [line_count] [abort_after_ms]
//
// ============================================================================

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <spdlog/cfg/env.h>

#include "cotask/cotask.hpp"

using namespace cotask;
using namespace std::chrono_literals;

namespace {

// Cursor over a text buffer; a line ends at "\n", "\r" or "\r\n"
struct Tokenizer {
    std::string_view data;
    std::size_t position = 0;
    std::size_t line_number = 1;
    std::size_t token_start = 0;
    std::size_t token_end = 0;

    void EatLine() {
        while (position < data.size()) {
            switch (data[position]) {
                case '\n':
                    token_end = position;
                    ++position;
                    ++line_number;
                    return;
                case '\r':
                    token_end = position;
                    ++position;
                    ++line_number;
                    if (position < data.size() && data[position] == '\n') {
                        ++position;
                    }
                    return;
                default:
                    ++position;
                    break;
            }
        }
        token_end = position;
    }

    void MarkLine() {
        token_start = position;
        EatLine();
    }
};

struct LineTokens {
    Tokenizer tokenizer;
    std::size_t lines_read = 0;
    // [start, end) pairs
    std::vector<std::size_t> indices;
};

Task<LineTokens> ReadLines(std::string_view text, std::size_t count, std::size_t lines_per_chunk = 100'000) {
    return Task<LineTokens>::Create("read lines", [=](ExecutionContext& ctx) -> Async<TaskResult<LineTokens>> {
        LineTokens tokens;
        tokens.tokenizer.data = text;
        tokens.indices.reserve(count * 2);

        co_return co_await ChunkedSubtask(
            ctx, lines_per_chunk, std::move(tokens),
            [count](std::size_t chunk_size, LineTokens& s) {
                const std::size_t to_read = std::min(count - s.lines_read, chunk_size);
                for (std::size_t i = 0; i < to_read; ++i) {
                    s.tokenizer.MarkLine();
                    s.indices.push_back(s.tokenizer.token_start);
                    s.indices.push_back(s.tokenizer.token_end);
                }
                s.lines_read += to_read;
                return to_read;
            },
            [](ExecutionContext& c, LineTokens& s) {
                c.SetProgress({"Parsing...", static_cast<double>(s.tokenizer.position),
                               static_cast<double>(s.tokenizer.data.size())});
            });
    });
}

std::string MakeText(std::size_t lines) {
    std::string text;
    text.reserve(lines * 24);
    for (std::size_t i = 0; i < lines; ++i) {
        text += fmt::format("ATOM {:>7} CA {:8.3f}", i, i * 0.125);
        text += (i % 3 == 0) ? "\r\n" : "\n";
    }
    return text;
}

}  // namespace

int main(int argc, char** argv) {
    spdlog::cfg::load_env_levels();

    const std::size_t line_count = argc > 1 ? std::strtoul(argv[1], nullptr, 10) : 2'000'000;
    const auto abort_after = std::chrono::milliseconds(argc > 2 ? std::atoi(argv[2]) : 0);

    std::cout << "=== cotask Example 03: Chunked Line Reader ===" << std::endl << std::endl;

    const std::string text = MakeText(line_count);
    std::cout << "input: " << line_count << " lines, " << text.size() << " bytes" << std::endl;

    AbortSource stop;
    auto executor = LibuvExecutor::Create();
    if (executor.IsErr()) {
        std::cerr << "failed to create the event loop: " << executor.Error().message() << std::endl;
        return 1;
    }

    TimerId stop_timer = 0;
    if (abort_after.count() > 0) {
        stop_timer = executor.Value()->PostAfter(abort_after, [&] { stop.RequestAbort("stopped by timer"); });
    }

    RunOptions options;
    options.update_interval = 50ms;
    options.abort_token = stop.GetToken();
    options.observer = [](Progress& p) {
        const auto& root = p.Root();
        auto fraction = root.Fraction();
        std::cout << fmt::format("  {}: {} {:.0f}/{:.0f} ({:.1f}%)", root.task_name, root.message,
                                 root.current, root.max, fraction.value_or(0) * 100)
                  << std::endl;
    };

    auto start = Clock::now();
    auto result = RunBlocking(*executor.Value(), ReadLines(text, line_count), options);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    executor.Value()->CancelTimer(stop_timer);

    if (result.IsErr()) {
        std::cout << "\n" << result.Error().Message() << " after " << elapsed.count() << "ms" << std::endl;
        return result.Error().IsAborted() ? 0 : 1;
    }

    const auto& tokens = result.Value();
    std::cout << "\nread " << tokens.lines_read << " lines in " << elapsed.count() << "ms" << std::endl;
    if (tokens.lines_read > 0) {
        std::cout << "last line: \""
                  << text.substr(tokens.indices[tokens.indices.size() - 2],
                                 tokens.indices.back() - tokens.indices[tokens.indices.size() - 2])
                  << "\"" << std::endl;
    }
    return 0;
}
