// ============================================================================
// cotask/task/progress.cpp - Live Progress Tree
// ============================================================================

#include "cotask/task/progress.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

namespace cotask {

namespace {

void MarkAborted(ProgressNode& node, const std::string& reason) {
    if (!node.abort_requested) {
        node.abort_requested = true;
        node.abort_reason = reason;
    }
    for (auto& child : node.children) {
        MarkAborted(*child, reason);
    }
}

void FormatNode(const ProgressNode& node, const std::string& prefix, std::string& out) {
    if (!out.empty()) {
        out += '\n';
    }
    fmt::format_to(std::back_inserter(out), "{}{}: {}", prefix, node.task_name, node.message);

    const std::string child_prefix = prefix + "  |_ ";
    for (const auto& child : node.children) {
        FormatNode(*child, child_prefix, out);
    }
}

}  // namespace

// ============================================================================
// ProgressNode
// ============================================================================

std::optional<double> ProgressNode::Fraction() const noexcept {
    if (is_indeterminate || max <= 0) {
        return std::nullopt;
    }
    return std::clamp(current / max, 0.0, 1.0);
}

void ProgressNode::Apply(const ProgressUpdate& update) {
    if (update.message) {
        message = *update.message;
    }
    if (update.current) {
        current = *update.current;
    }
    if (update.max) {
        max = *update.max;
    }
    if (update.is_indeterminate) {
        is_indeterminate = *update.is_indeterminate;
    } else if (update.current || update.max) {
        is_indeterminate = false;
    }
}

ProgressNode& ProgressNode::AddChild(std::string name) {
    auto child = std::make_unique<ProgressNode>(std::move(name));
    child->abort_requested = abort_requested;
    child->abort_reason = abort_reason;
    children.push_back(std::move(child));
    return *children.back();
}

bool ProgressNode::RemoveChild(const ProgressNode* child) {
    auto it = std::find_if(children.begin(), children.end(),
                           [child](const std::unique_ptr<ProgressNode>& c) { return c.get() == child; });
    if (it == children.end()) {
        return false;
    }
    children.erase(it);
    return true;
}

std::size_t ProgressNode::CountNodes() const noexcept {
    std::size_t count = 1;
    for (const auto& child : children) {
        count += child->CountNodes();
    }
    return count;
}

// ============================================================================
// Progress
// ============================================================================

Progress::Progress(std::string root_task_name) : root_(std::move(root_task_name)) {}

void Progress::RequestAbort(const std::string& reason) {
    if (abort_requested_) {
        return;
    }
    abort_requested_ = true;
    abort_reason_ = reason;
    MarkAborted(root_, reason);
}

std::string FormatProgressTree(const ProgressNode& root) {
    std::string out;
    FormatNode(root, "", out);
    return out;
}

}  // namespace cotask
