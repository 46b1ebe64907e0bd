// ============================================================================
// cotask/task/progress.hpp - Live Progress Tree
// ============================================================================
//
// Every running task owns one ProgressNode. A node's children are the child
// tasks it spawned through ExecutionContext::RunChild that have not finished
// yet; a child's node is removed from its parent when the child completes,
// whatever the outcome. Reading the tree therefore always shows what is
// running right now.
//
// Progress wraps the root node of one run. It is what the observer receives,
// and RequestAbort on it is how a run is cancelled.
//
//   root: "load structure"          Parsing...       [ 3.2MB / 10MB ]
//     |_ "read lines"               Parsing...       [ 1.1M / 4M ]
//     |_ "build bonds"              Computing...
//
// ============================================================================

#pragma once

#include "cotask/task/progress_update.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cotask {

using Clock = std::chrono::steady_clock;

struct ProgressNode {
    std::string task_name;
    std::string message;
    double current = 0;
    double max = 0;
    bool is_indeterminate = true;
    Clock::time_point started_time = Clock::now();

    bool abort_requested = false;
    std::string abort_reason;

    // Spawn order; each child is owned by this node alone
    std::vector<std::unique_ptr<ProgressNode>> children;

    ProgressNode() = default;
    explicit ProgressNode(std::string name) : task_name(std::move(name)) {}

    ProgressNode(const ProgressNode&) = delete;
    ProgressNode& operator=(const ProgressNode&) = delete;

    // current / max in [0, 1], or nullopt when the node has no quantified
    // progress
    [[nodiscard]] std::optional<double> Fraction() const noexcept;

    // Merge the set fields of `update`; unset fields stay as they are
    void Apply(const ProgressUpdate& update);

    // New child appended at the end; inherits this node's abort state
    ProgressNode& AddChild(std::string name);

    // Returns false when `child` is not a direct child of this node
    bool RemoveChild(const ProgressNode* child);

    // This node plus all descendants
    [[nodiscard]] std::size_t CountNodes() const noexcept;
};

class Progress {
   public:
    explicit Progress(std::string root_task_name);

    Progress(const Progress&) = delete;
    Progress& operator=(const Progress&) = delete;

    [[nodiscard]] ProgressNode& Root() noexcept { return root_; }
    [[nodiscard]] const ProgressNode& Root() const noexcept { return root_; }

    // Flags every live node at once, so a running task sees the request at
    // its next checkpoint with a check of its own node only. The first
    // reason wins; later calls do nothing.
    void RequestAbort(const std::string& reason);

    [[nodiscard]] bool IsAbortRequested() const noexcept { return abort_requested_; }
    [[nodiscard]] const std::string& AbortReason() const noexcept { return abort_reason_; }

   private:
    ProgressNode root_;
    bool abort_requested_ = false;
    std::string abort_reason_;
};

// "name: message" per node, children on their own lines prefixed with
// "  |_ " per level of depth
[[nodiscard]] std::string FormatProgressTree(const ProgressNode& root);

}  // namespace cotask
