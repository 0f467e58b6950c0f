/**
 * @file task_tree.hpp
 * @brief Rooted out-tree of tasks stored in an index-addressed arena.
 * @author Dimitris Kafetzis
 *
 * Nodes are identified by their "Name_Duration" key and addressed by a
 * stable arena index. Children are owned index lists in insertion order;
 * the parent is a non-owning back-index. Traversals use an explicit stack,
 * so tree depth is bounded only by memory.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>
#include <stack>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tree_scheduler {

/**
 * @brief A single task in the dependency tree.
 */
struct TaskNode {
    TaskName name;
    SimTime duration = 0;
    std::vector<TaskIndex> children;
    std::optional<TaskIndex> parent;

    [[nodiscard]] TaskKey key() const { return name + "_" + std::to_string(duration); }
};

/**
 * @brief Aggregate figures used by the reports.
 */
struct TreeStats {
    std::size_t task_count = 0;
    SimTime duration_sum = 0;
    SimTime max_duration = 0;
    double mean_duration = 0.0;
};

/**
 * @brief Dependency tree of tasks.
 */
class TaskTree {
public:
    TaskTree() = default;

    // ── Construction ──────────────────────────

    /// Return the node for (name, duration), creating it on first sight.
    TaskIndex find_or_add(const TaskName& name, SimTime duration);

    /// Link @p child under @p parent. Fails if the child already has a
    /// parent or the edge is a self-loop.
    Result<void> add_edge(TaskIndex parent, TaskIndex child);

    // ── Queries ───────────────────────────────
    [[nodiscard]] std::size_t task_count() const noexcept { return nodes_.size(); }
    [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }
    [[nodiscard]] const TaskNode& node(TaskIndex index) const { return nodes_.at(index); }
    [[nodiscard]] std::optional<TaskIndex> find(const TaskKey& key) const;

    /// Indices of every node without a parent, in creation order.
    [[nodiscard]] std::vector<TaskIndex> root_candidates() const;

    /// Check the out-tree invariants and return the unique root.
    [[nodiscard]] Result<TaskIndex> validate() const;

    /// Nodes reachable from @p from in pre-order (node, then children in order).
    [[nodiscard]] std::vector<TaskIndex> preorder(TaskIndex from) const;

    /// Read-only walk handing each node and its depth to @p visitor.
    template <TaskVisitor V>
    void visit_preorder(TaskIndex from, V&& visitor) const {
        std::stack<std::pair<TaskIndex, std::size_t>> pending;
        pending.push({from, 0});
        while (!pending.empty()) {
            auto [index, depth] = pending.top();
            pending.pop();
            const auto& current = nodes_.at(index);
            visitor(current, depth);
            for (auto it = current.children.rbegin(); it != current.children.rend(); ++it) {
                pending.push({*it, depth + 1});
            }
        }
    }

    // ── Metrics ───────────────────────────────
    [[nodiscard]] TreeStats stats() const;
    [[nodiscard]] SimTime critical_path_cost(TaskIndex from) const;

private:
    std::vector<TaskNode> nodes_;
    std::unordered_map<TaskKey, TaskIndex> index_by_key_;
};

}  // namespace tree_scheduler
