// ============================================================================
// cotask/task/progress_update.hpp - Partial Progress Update
// ============================================================================

#pragma once

#include <optional>
#include <string>
#include <utility>

namespace cotask {

// The fields a computation wants to change on its progress node. A plain
// string converts to an update of the message alone:
//
//   co_await ctx.Update("Parsing...");
//   co_await ctx.Update({"Parsing...", position, length});
//
struct ProgressUpdate {
    std::optional<std::string> message;
    std::optional<double> current;
    std::optional<double> max;
    std::optional<bool> is_indeterminate;

    ProgressUpdate() = default;

    ProgressUpdate(std::string msg) : message(std::move(msg)) {}  // NOLINT(google-explicit-constructor)
    ProgressUpdate(const char* msg) : message(std::string(msg)) {}  // NOLINT(google-explicit-constructor)

    ProgressUpdate(std::optional<std::string> msg, std::optional<double> cur, std::optional<double> mx,
                   std::optional<bool> indeterminate = std::nullopt)
        : message(std::move(msg)), current(cur), max(mx), is_indeterminate(indeterminate) {}
};

}  // namespace cotask
