/**
 * @file task_tree.cpp
 * @brief TaskTree construction, validation and traversal.
 * @author Dimitris Kafetzis
 *
 * Each node carries at most one parent, enforced in add_edge(). With that
 * invariant a pre-order walk from the root always terminates, and a cycle
 * shows up as nodes the walk never reaches.
 */

#include "workload/task_tree.hpp"

#include <algorithm>
#include <limits>

namespace tree_scheduler {

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

TaskIndex TaskTree::find_or_add(const TaskName& name, SimTime duration) {
    TaskNode candidate{.name = name, .duration = duration, .children = {}, .parent = std::nullopt};
    auto key = candidate.key();

    if (auto it = index_by_key_.find(key); it != index_by_key_.end()) {
        return it->second;
    }

    TaskIndex index = nodes_.size();
    nodes_.push_back(std::move(candidate));
    index_by_key_.emplace(std::move(key), index);
    return index;
}

Result<void> TaskTree::add_edge(TaskIndex parent, TaskIndex child) {
    if (parent >= nodes_.size() || child >= nodes_.size()) {
        return make_error<void>(ErrorKind::MalformedTree, "edge refers to an unknown task");
    }
    if (parent == child) {
        return make_error<void>(ErrorKind::MalformedTree,
                                "task '" + nodes_[child].key() + "' depends on itself");
    }

    auto& child_node = nodes_[child];
    if (child_node.parent) {
        return make_error<void>(ErrorKind::MalformedTree,
                                "task '" + child_node.key() + "' already has parent '"
                                + nodes_[*child_node.parent].key() + "', cannot add parent '"
                                + nodes_[parent].key() + "'");
    }

    child_node.parent = parent;
    nodes_[parent].children.push_back(child);
    return {};
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

std::optional<TaskIndex> TaskTree::find(const TaskKey& key) const {
    auto it = index_by_key_.find(key);
    if (it == index_by_key_.end()) return std::nullopt;
    return it->second;
}

std::vector<TaskIndex> TaskTree::root_candidates() const {
    std::vector<TaskIndex> roots;
    for (TaskIndex i = 0; i < nodes_.size(); ++i) {
        if (!nodes_[i].parent) {
            roots.push_back(i);
        }
    }
    return roots;
}

Result<TaskIndex> TaskTree::validate() const {
    if (nodes_.empty()) {
        return make_error<TaskIndex>(ErrorKind::MalformedTree, "tree has no tasks");
    }

    auto roots = root_candidates();
    if (roots.empty()) {
        return make_error<TaskIndex>(ErrorKind::MalformedTree,
                                     "no root: every task is the child of another (cycle)");
    }
    if (roots.size() > 1) {
        std::string names;
        for (auto index : roots) {
            if (!names.empty()) names += ", ";
            names += nodes_[index].key();
        }
        return make_error<TaskIndex>(ErrorKind::MalformedTree,
                                     "ambiguous root: " + std::to_string(roots.size())
                                     + " candidates (" + names + ")");
    }

    auto root = roots.front();
    auto reachable = preorder(root).size();
    if (reachable != nodes_.size()) {
        return make_error<TaskIndex>(ErrorKind::MalformedTree,
                                     std::to_string(nodes_.size() - reachable)
                                     + " task(s) unreachable from root '"
                                     + nodes_[root].key() + "' (cycle)");
    }

    // The makespan never exceeds the duration sum, so bounding the sum keeps
    // every simulated clock value representable.
    SimTime sum = 0;
    for (const auto& current : nodes_) {
        if (current.duration < 0) {
            return make_error<TaskIndex>(ErrorKind::InvalidConfiguration,
                                         "task '" + current.key() + "' has negative duration");
        }
        if (current.duration > std::numeric_limits<SimTime>::max() - sum) {
            return make_error<TaskIndex>(ErrorKind::InvalidConfiguration,
                                         "total duration overflows at task '"
                                         + current.key() + "'");
        }
        sum += current.duration;
    }

    return root;
}

std::vector<TaskIndex> TaskTree::preorder(TaskIndex from) const {
    std::vector<TaskIndex> order;
    order.reserve(nodes_.size());
    visit_preorder(from, [&](const TaskNode& current, std::size_t /*depth*/) {
        // Recover the index from the node address; nodes_ is contiguous.
        order.push_back(static_cast<TaskIndex>(&current - nodes_.data()));
    });
    return order;
}

// ─────────────────────────────────────────────
// Metrics
// ─────────────────────────────────────────────

TreeStats TaskTree::stats() const {
    TreeStats result;
    result.task_count = nodes_.size();
    for (const auto& current : nodes_) {
        result.duration_sum += current.duration;
        result.max_duration = std::max(result.max_duration, current.duration);
    }
    if (result.task_count > 0) {
        result.mean_duration = static_cast<double>(result.duration_sum)
                               / static_cast<double>(result.task_count);
    }
    return result;
}

SimTime TaskTree::critical_path_cost(TaskIndex from) const {
    // Longest root-to-leaf duration sum; parents precede children in pre-order.
    std::unordered_map<TaskIndex, SimTime> finish;
    SimTime longest = 0;
    for (auto index : preorder(from)) {
        const auto& current = nodes_[index];
        SimTime start = 0;
        if (current.parent && index != from) {
            start = finish[*current.parent];
        }
        finish[index] = start + current.duration;
        longest = std::max(longest, finish[index]);
    }
    return longest;
}

}  // namespace tree_scheduler
